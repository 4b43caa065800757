// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotTypes.h"
#include "FunctionSpec.h"
#include "../Utility/IteratorUtils.h"
#include <string>
#include <vector>
#include <optional>

namespace GraphLanguage 
{
	using NodeId = uint32_t;
	using SlotId = uint32_t;

	static const NodeId NodeId_Invalid = (NodeId)-1;

	enum class SlotDirection { Input, Output };

        ///////////////////////////////////////////////////////////////

	class Slot
	{
	public:
		SlotId			_id = 0;
		SlotDirection	_direction = SlotDirection::Input;
		ValueType		_valueType = ValueType::Vector1;
		std::string		_displayName;
		std::string		_defaultValue;		// comma separated component list, ie "1, 0, 0"
	};

	/// <summary>Slots split by direction, each list in insertion order</summary>
	class SlotPartition
	{
	public:
		std::vector<const Slot*> _inputs;
		std::vector<const Slot*> _outputs;
	};

	SlotPartition PartitionSlots(IteratorRange<const Slot*> slots);

	/// <summary>A set of slots that only exists for some node configurations</summary>
	class SlotGroup
	{
	public:
		bool				_enabled = true;
		std::vector<Slot>	_slots;
	};

	/// <summary>Builds the slot list for a node from its optional slot groups</summary>
	/// Enabled groups are appended in the order given. Throws if two enabled groups
	/// reuse a slot id.
	std::vector<Slot> AssembleSlots(IteratorRange<const SlotGroup*> groups);

        ///////////////////////////////////////////////////////////////

    class Node
    {
    public:
        enum class Type { CustomFunction, Constant };

        NodeId					_nodeId = 0;
        Type					_type = Type::CustomFunction;
		std::string				_name;
		std::vector<Slot>		_slots;
		FunctionSpec			_function;

        Type					GetType() const             { return _type; }
		const std::string&		Name() const				{ return _name; }
		IteratorRange<const Slot*> GetSlots() const			{ return MakeIteratorRange(_slots); }

		const Slot*				FindSlot(SlotId slotId) const;
		const Slot*				FindOutputSlot(SlotId slotId) const;
    };

        ///////////////////////////////////////////////////////////////

	/// <summary>Connects an output slot on one node to an input slot on another</summary>
    class Edge
    {
    public:
        NodeId		_producerNodeId;
        SlotId		_producerSlotId;
		NodeId		_consumerNodeId;
        SlotId		_consumerSlotId;
    };
  
        ///////////////////////////////////////////////////////////////

    class SlotGraph
    {
    public:
        IteratorRange<const Node*>	GetNodes() const	{ return MakeIteratorRange(_nodes); }
        IteratorRange<const Edge*>	GetEdges() const	{ return MakeIteratorRange(_edges); }

        void			Add(Node&&);
        void			Add(Edge&&);

		void			Trim(const NodeId* trimNodesBegin, const NodeId* trimNodesEnd);
        void			Trim(NodeId previewNode);

        const Node*     GetNode(NodeId nodeId) const;

		/// <summary>Finds the edge feeding the given input slot</summary>
		/// When there are multiple, the first one added wins.
		std::optional<Edge> GetIncomingEdge(NodeId nodeId, SlotId slotId) const;

        SlotGraph();
        ~SlotGraph();

    private:
        std::vector<Node>	_nodes;
        std::vector<Edge>	_edges;

        bool        IsDownstream(NodeId startNode, const NodeId* searchingForNodesStart, const NodeId* searchingForNodesEnd, std::vector<NodeId>& visited) const;
        bool        HasNode(NodeId nodeId) const;
    };

		///////////////////////////////////////////////////////////////

	/// <summary>Orders the nodes so that every node comes after the nodes feeding it</summary>
	/// When the graph contains a cycle, "isAcyclic" is cleared and the result is still a
	/// complete (but only partially ordered) list of the nodes.
	std::vector<NodeId> SortNodes(const SlotGraph& graph, bool& isAcyclic);
}
