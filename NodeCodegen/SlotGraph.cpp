// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "SlotGraph.h"
#include "../Core/Exceptions.h"
#include <algorithm>

namespace GraphLanguage 
{
	SlotPartition PartitionSlots(IteratorRange<const Slot*> slots)
	{
		SlotPartition result;
		for (const auto& s:slots)
			(s._direction == SlotDirection::Input ? result._inputs : result._outputs).push_back(&s);
		return result;
	}

	std::vector<Slot> AssembleSlots(IteratorRange<const SlotGroup*> groups)
	{
		std::vector<Slot> result;
		for (const auto& g:groups) {
			if (!g._enabled) continue;
			for (const auto& s:g._slots) {
				auto existing = std::find_if(
					result.begin(), result.end(),
					[&s](const Slot& r) { return r._id == s._id; });
				if (existing != result.end())
					Throw(::Exceptions::BasicLabel("Slot id (%u) is used by more than one enabled slot group", s._id));
				result.push_back(s);
			}
		}
		return result;
	}

	const Slot* Node::FindSlot(SlotId slotId) const
	{
		auto i = std::find_if(_slots.begin(), _slots.end(), [slotId](const Slot& s) { return s._id == slotId; });
		return (i != _slots.end()) ? &*i : nullptr;
	}

	const Slot* Node::FindOutputSlot(SlotId slotId) const
	{
		auto* s = FindSlot(slotId);
		return (s && s->_direction == SlotDirection::Output) ? s : nullptr;
	}

        ///////////////////////////////////////////////////////////////

	SlotGraph::SlotGraph() {}
    SlotGraph::~SlotGraph() {}

    void SlotGraph::Add(Node&& a) { _nodes.emplace_back(std::move(a)); }
    void SlotGraph::Add(Edge&& a) { _edges.emplace_back(std::move(a)); }

    bool SlotGraph::IsDownstream(
        NodeId startNode,
        const NodeId* searchingForNodesStart, const NodeId* searchingForNodesEnd,
		std::vector<NodeId>& visited) const
    {
            //  Starting at 'startNode', follow edges towards their consumers and see if we reach
			//	any of the search nodes. 'visited' stops us walking around cycles forever
        if (std::find(searchingForNodesStart, searchingForNodesEnd, startNode) != searchingForNodesEnd) {
            return true;
        }

		if (std::find(visited.begin(), visited.end(), startNode) != visited.end())
			return false;
		visited.push_back(startNode);

        for (const auto& e:_edges) {
            if (e._producerNodeId == startNode) {
                if (IsDownstream(e._consumerNodeId, searchingForNodesStart, searchingForNodesEnd, visited)) {
                    return true;
                }
            }
        }

        return false;
    }

    bool SlotGraph::HasNode(NodeId nodeId) const
    {
        return std::find_if(_nodes.begin(), _nodes.end(),
            [=](const Node& node) { return node._nodeId == nodeId; }) != _nodes.end();
    }

    const Node* SlotGraph::GetNode(NodeId nodeId) const
    {
        auto res = std::find_if(
            _nodes.cbegin(), _nodes.cend(),
            [=](const Node& n) { return n._nodeId == nodeId; });
        if (res != _nodes.cend()) {
            return &*res;
        }
        return nullptr;
    }

	std::optional<Edge> SlotGraph::GetIncomingEdge(NodeId nodeId, SlotId slotId) const
	{
		auto i = std::find_if(
			_edges.cbegin(), _edges.cend(),
			[nodeId, slotId](const Edge& e) { return e._consumerNodeId == nodeId && e._consumerSlotId == slotId; });
		if (i != _edges.cend())
			return *i;
		return {};
	}

    void SlotGraph::Trim(NodeId previewNode)
    {
        Trim(&previewNode, &previewNode+1);
    }

    void SlotGraph::Trim(const NodeId* trimNodesBegin, const NodeId* trimNodesEnd)
    {
            //
            //      Remove everything that doesn't contribute to the trim nodes.
            //
            //          1.  remove all nodes, unless one of the trim nodes is
            //              downstream of them (or they are a trim node)
            //          2.  remove all edges that refer to nodes
            //              that no longer exist
            //

        _nodes.erase(
            std::remove_if(
                _nodes.begin(), _nodes.end(),
                [=](const Node& node) { 
					std::vector<NodeId> visited;
					return !IsDownstream(node._nodeId, trimNodesBegin, trimNodesEnd, visited); 
				}),
            _nodes.end());

        _edges.erase(
            std::remove_if(
                _edges.begin(), _edges.end(),
                [=](const Edge& edge)
                    { return !HasNode(edge._producerNodeId) || !HasNode(edge._consumerNodeId); }),
            _edges.end());
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

	static void OrderNodes(IteratorRange<NodeId*> range)
	{
		// We need to sort the upstreams in some way that maintains a
		// consistant ordering. The simplest way is just to use node id.
		std::sort(range.begin(), range.end());
	}

    static void SortNodesFunction(
        NodeId                  node,
        std::vector<NodeId>&    presorted,
        std::vector<NodeId>&    sorted,
        std::vector<NodeId>&    marks,
        const SlotGraph&        graph,
		bool&					isAcyclic)
    {
        if (std::find(presorted.begin(), presorted.end(), node) == presorted.end()) {
            return;   // already sorted, or a dangling reference to a node that isn't in the graph
        }
        if (std::find(marks.begin(), marks.end(), node) != marks.end()) {
			isAcyclic = false;
            return;   // hit a cycle
        }

        marks.push_back(node);

		std::vector<NodeId> upstream;
		upstream.reserve(graph.GetEdges().size());
        for (const auto& e:graph.GetEdges())
            if (e._consumerNodeId == node)
				upstream.push_back(e._producerNodeId);

		OrderNodes(MakeIteratorRange(upstream));
		for (const auto& i2:upstream)
			SortNodesFunction(i2, presorted, sorted, marks, graph, isAcyclic);

        sorted.push_back(node);
        presorted.erase(std::find(presorted.begin(), presorted.end(), node));
    }

	std::vector<NodeId> SortNodes(const SlotGraph& graph, bool& isAcyclic)
	{
            /*
                Depth first topological sort:

                    L <- Empty list that will contain the sorted nodes
                    while there are unmarked nodes do
                        select an unmarked node n
                        visit(n)
                    function visit(node n)
                        if n has a temporary mark then stop (not a DAG)
                        if n is not marked (i.e. has not been visited yet) then
                            mark n temporarily
                            for each node m with an edge from m to n do
                                visit(m)
                            mark n permanently
                            add n to tail of L

				Producers are visited before their consumers, so every node comes after
				the nodes that feed it. When a cycle is found we keep going, so the result
				still contains every node.
            */

        std::vector<NodeId> presortedNodes, sortedNodes;
        sortedNodes.reserve(graph.GetNodes().size());

        for (const auto& i:graph.GetNodes())
            presortedNodes.push_back(i._nodeId);

		OrderNodes(MakeIteratorRange(presortedNodes));

        isAcyclic = true;
		while (!presortedNodes.empty()) {
            std::vector<NodeId> temporaryMarks;
            SortNodesFunction(
                presortedNodes[0],
                presortedNodes, sortedNodes,
                temporaryMarks, graph, isAcyclic);
        }

		return sortedNodes;
	}
	
}
