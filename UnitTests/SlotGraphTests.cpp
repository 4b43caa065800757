// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "UnitTestHelper.h"
#include "../Core/Exceptions.h"
#include <catch2/catch_test_macros.hpp>

namespace UnitTests
{
	static Node MakePassThroughNode(NodeId nodeId)
	{
		return MakeFunctionNode(nodeId, MakeInlineFunction("PassThrough", "Out = In;"), MakeInOutSlots());
	}

	static std::vector<NodeId> NodeIds(const SlotGraph& graph)
	{
		std::vector<NodeId> result;
		for (const auto& n:graph.GetNodes()) result.push_back(n._nodeId);
		return result;
	}

	TEST_CASE( "SlotGraph-SortNodes", "[nodecodegen]" )
	{
		SECTION("Chain")
		{
			SlotGraph graph;
			graph.Add(MakePassThroughNode(3));
			graph.Add(MakePassThroughNode(1));
			graph.Add(MakePassThroughNode(2));
			graph.Add(Edge{1, 1, 2, 0});
			graph.Add(Edge{2, 1, 3, 0});

			bool isAcyclic = false;
			auto sorted = SortNodes(graph, isAcyclic);
			REQUIRE(isAcyclic);
			REQUIRE(sorted == std::vector<NodeId>{1, 2, 3});
		}

		SECTION("Diamond")
		{
			// 4 feeds 2 and 3, which both feed 1
			SlotGraph graph;
			for (NodeId n=1; n<=4; ++n) graph.Add(MakePassThroughNode(n));
			graph.Add(Edge{4, 1, 2, 0});
			graph.Add(Edge{4, 1, 3, 0});
			graph.Add(Edge{2, 1, 1, 0});
			graph.Add(Edge{3, 1, 1, 0});

			bool isAcyclic = false;
			auto sorted = SortNodes(graph, isAcyclic);
			REQUIRE(isAcyclic);
			REQUIRE(sorted == std::vector<NodeId>{4, 2, 3, 1});
		}

		SECTION("Cycle")
		{
			SlotGraph graph;
			for (NodeId n=1; n<=3; ++n) graph.Add(MakePassThroughNode(n));
			graph.Add(Edge{1, 1, 2, 0});
			graph.Add(Edge{2, 1, 1, 0});

			bool isAcyclic = true;
			auto sorted = SortNodes(graph, isAcyclic);
			REQUIRE(!isAcyclic);
			REQUIRE(sorted.size() == 3);
			REQUIRE(sorted.back() == 3);
		}

		SECTION("Edges to missing nodes are ignored")
		{
			SlotGraph graph;
			graph.Add(MakePassThroughNode(1));
			graph.Add(Edge{7, 1, 1, 0});

			bool isAcyclic = false;
			auto sorted = SortNodes(graph, isAcyclic);
			REQUIRE(isAcyclic);
			REQUIRE(sorted == std::vector<NodeId>{1});
		}
	}

	TEST_CASE( "SlotGraph-Trim", "[nodecodegen]" )
	{
		SlotGraph graph;
		for (NodeId n=1; n<=4; ++n) graph.Add(MakePassThroughNode(n));
		graph.Add(Edge{1, 1, 2, 0});
		graph.Add(Edge{2, 1, 3, 0});
		graph.Add(Edge{4, 1, 3, 0});

		SECTION("Keeps only upstream nodes")
		{
			graph.Trim(2);
			REQUIRE(NodeIds(graph) == std::vector<NodeId>{1, 2});
			REQUIRE(graph.GetEdges().size() == 1);
			REQUIRE(graph.GetEdges()[0]._producerNodeId == 1);
			REQUIRE(graph.GetEdges()[0]._consumerNodeId == 2);
		}

		SECTION("Trimming to the final node keeps everything")
		{
			graph.Trim(3);
			REQUIRE(NodeIds(graph) == std::vector<NodeId>{1, 2, 3, 4});
			REQUIRE(graph.GetEdges().size() == 3);
		}

		SECTION("Cycles upstream of the trim node")
		{
			graph.Add(Edge{2, 1, 1, 0});
			graph.Trim(1);
			REQUIRE(NodeIds(graph) == std::vector<NodeId>{1, 2});
			REQUIRE(graph.GetEdges().size() == 2);
		}
	}

	TEST_CASE( "SlotGraph-Lookups", "[nodecodegen]" )
	{
		SlotGraph graph;
		graph.Add(MakePassThroughNode(1));
		graph.Add(MakePassThroughNode(2));
		graph.Add(MakePassThroughNode(3));
		graph.Add(Edge{1, 1, 3, 0});
		graph.Add(Edge{2, 1, 3, 0});

		auto edge = graph.GetIncomingEdge(3, 0);
		REQUIRE(edge.has_value());
		REQUIRE(edge->_producerNodeId == 1);
		REQUIRE(!graph.GetIncomingEdge(3, 1).has_value());
		REQUIRE(!graph.GetIncomingEdge(1, 0).has_value());

		REQUIRE(graph.GetNode(2) != nullptr);
		REQUIRE(graph.GetNode(2)->_nodeId == 2);
		REQUIRE(graph.GetNode(5) == nullptr);

		const auto& node = *graph.GetNode(1);
		REQUIRE(node.FindSlot(0) != nullptr);
		REQUIRE(node.FindOutputSlot(0) == nullptr);
		REQUIRE(node.FindOutputSlot(1) != nullptr);
		REQUIRE(node.FindSlot(9) == nullptr);
	}

	TEST_CASE( "SlotGraph-Slots", "[nodecodegen]" )
	{
		SECTION("Partition keeps insertion order")
		{
			std::vector<Slot> slots {
				MakeOutput(5, ValueType::Vector1, "B"), MakeInput(2, ValueType::Vector2, "A"),
				MakeOutput(1, ValueType::Vector3, "C"), MakeInput(0, ValueType::Vector4, "D")
			};
			auto partition = PartitionSlots(MakeIteratorRange(slots));
			REQUIRE(partition._inputs.size() == 2);
			REQUIRE(partition._inputs[0]->_id == 2);
			REQUIRE(partition._inputs[1]->_id == 0);
			REQUIRE(partition._outputs.size() == 2);
			REQUIRE(partition._outputs[0]->_id == 5);
			REQUIRE(partition._outputs[1]->_id == 1);
		}

		SECTION("Optional slot groups")
		{
			std::vector<SlotGroup> groups(3);
			groups[0]._slots = { MakeInput(0, ValueType::Vector3, "Position") };
			groups[1]._enabled = false;
			groups[1]._slots = { MakeInput(1, ValueType::Vector3, "Normal") };
			groups[2]._slots = { MakeOutput(2, ValueType::Vector4, "Out") };

			auto slots = AssembleSlots(MakeIteratorRange(groups));
			REQUIRE(slots.size() == 2);
			REQUIRE(slots[0]._id == 0);
			REQUIRE(slots[1]._id == 2);

			// a disabled group may reuse ids, an enabled one may not
			groups[1]._slots[0]._id = 2;
			REQUIRE(AssembleSlots(MakeIteratorRange(groups)).size() == 2);
			groups[1]._enabled = true;
			REQUIRE_THROWS_AS(AssembleSlots(MakeIteratorRange(groups)), ::Exceptions::BasicLabel);
		}
	}
}
