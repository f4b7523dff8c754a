// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "flowmodel/FlowGraph.hpp"
#include "flowmodel/FlowOperations.hpp"

#include <QtCore/QRandomGenerator>

using namespace FlowModel;

namespace {

NodeId addNode(FlowGraph::Builder& b, NodeIdAllocator& ids, NodeKind kind, QPointF pos = {})
{
    auto node = createNode(kind, pos, ids);
    EXPECT_TRUE(node.has_value());
    const NodeId id = node->id;
    EXPECT_TRUE(b.insertNode(std::move(*node)));
    return id;
}

} // namespace

TEST(FlowGraphTests, DeleteAgentRemovesBothIncidentEdges)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);
    const NodeId e = addNode(b, ids, NodeKind::End);
    ASSERT_FALSE(b.connect(s, a).isNull());
    ASSERT_FALSE(b.connect(a, e).isNull());
    const FlowGraph g = b.freeze();

    const FlowGraph out = deleteNode(g, a);

    EXPECT_EQ(out.edgeCount(), 0);
    EXPECT_EQ(out.nodeIds(), (QVector<NodeId>{s, e}));
    EXPECT_TRUE(out.isConsistent());
    EXPECT_EQ(g.nodeCount(), 3) << "input graph must stay untouched";
}

TEST(FlowGraphTests, DeleteNodeKeepsUnrelatedEdges)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);
    const NodeId c = addNode(b, ids, NodeKind::Agent);
    const EdgeId sc = b.connect(s, c);
    b.connect(s, a);
    b.connect(a, a);
    b.connect(c, a);
    const FlowGraph g = b.freeze();

    const FlowGraph out = deleteNode(g, a);
    EXPECT_EQ(out.edgeIds(), QVector<EdgeId>{sc});
}

TEST(FlowGraphTests, DeleteNodeMatchesEdgeFilterOnRandomGraphs)
{
    QRandomGenerator rng(1234);

    for (int round = 0; round < 50; ++round) {
        NodeIdAllocator ids;
        FlowGraph::Builder b;
        QVector<NodeId> nodes;
        const int nodeCount = 1 + int(rng.bounded(8));
        for (int i = 0; i < nodeCount; ++i)
            nodes.push_back(addNode(b, ids, i == 0 ? NodeKind::Start : NodeKind::Agent));

        const int edgeCount = int(rng.bounded(16));
        for (int i = 0; i < edgeCount; ++i)
            b.connect(nodes.at(int(rng.bounded(nodeCount))), nodes.at(int(rng.bounded(nodeCount))));
        const FlowGraph g = b.freeze();

        const NodeId victim = nodes.at(int(rng.bounded(nodeCount)));
        const FlowGraph out = deleteNode(g, victim);

        QVector<EdgeId> expected;
        for (const EdgeId& eid : g.edgeIds()) {
            const Edge* e = g.tryEdge(eid);
            if (e->source != victim && e->target != victim)
                expected.push_back(eid);
        }
        EXPECT_EQ(out.edgeIds(), expected) << "round " << round;
        EXPECT_FALSE(out.containsNode(victim));
        EXPECT_EQ(out.nodeCount(), g.nodeCount() - 1);
    }
}

TEST(FlowGraphTests, DeleteUnknownNodeIsIdentity)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    addNode(b, ids, NodeKind::Start);
    const FlowGraph g = b.freeze();

    EXPECT_EQ(deleteNode(g, NodeId(QStringLiteral("42"))), g);
}

TEST(FlowGraphTests, ParallelEdgesGetDistinctIds)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);

    const EdgeId first = b.connect(s, a);
    const EdgeId second = b.connect(s, a);
    const EdgeId third = b.connect(s, a);

    EXPECT_EQ(first.toString(), QStringLiteral("1-2"));
    EXPECT_EQ(second.toString(), QStringLiteral("1-2-2"));
    EXPECT_EQ(third.toString(), QStringLiteral("1-2-3"));

    const FlowGraph g = b.freeze();
    EXPECT_EQ(g.edgesBetween(a, s).size(), 3);
}

TEST(FlowGraphTests, ConnectRefusesUnknownEndpoint)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);

    EXPECT_TRUE(b.connect(s, NodeId(QStringLiteral("99"))).isNull());
    EXPECT_TRUE(b.freeze().edgeIds().isEmpty());
}

TEST(FlowGraphTests, PayloadKindCannotChange)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId a = addNode(b, ids, NodeKind::Agent);

    EXPECT_FALSE(b.setNodePayload(a, NodePayload{makeEndNodeData()}));

    AgentNodeData edited = makeAgentNodeData();
    edited.conversation.prompt = QStringLiteral("Ask for the order number.");
    EXPECT_TRUE(b.setNodePayload(a, NodePayload{edited}));
    EXPECT_EQ(b.freeze().tryNode(a)->kind(), NodeKind::Agent);
}

TEST(FlowGraphTests, AdjacencyIndexFollowsEdges)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);
    const EdgeId sa = b.connect(s, a);
    const EdgeId loop = b.connect(a, a);
    const FlowGraph g = b.freeze();

    EXPECT_EQ(g.outgoingEdges(s), QVector<EdgeId>{sa});
    EXPECT_EQ(g.incomingEdges(a), (QVector<EdgeId>{sa, loop}));
    EXPECT_EQ(g.incidentEdges(a), (QVector<EdgeId>{loop, sa}));
}

TEST(FlowGraphTests, EdgeHighlightsFollowSelectionAndHover)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);
    const NodeId e = addNode(b, ids, NodeKind::End);
    const EdgeId sa = b.connect(s, a);
    const EdgeId ae = b.connect(a, e);

    b.setEdgeSelected(sa, true);
    b.refreshEdgeHighlights(ae);
    const FlowGraph g = b.freeze();

    EXPECT_TRUE(g.tryNode(s)->selectedThroughEdge);
    EXPECT_TRUE(g.tryNode(a)->selectedThroughEdge);
    EXPECT_FALSE(g.tryNode(e)->selectedThroughEdge);

    EXPECT_FALSE(g.tryNode(s)->hoveredThroughEdge);
    EXPECT_TRUE(g.tryNode(a)->hoveredThroughEdge);
    EXPECT_TRUE(g.tryNode(e)->hoveredThroughEdge);
}

TEST(FlowGraphTests, EqualityTracksOrderAndValues)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    const NodeId s = addNode(b, ids, NodeKind::Start);
    const FlowGraph g1 = b.freeze();
    const FlowGraph g2 = FlowGraph::Builder(g1).freeze();
    EXPECT_EQ(g1, g2);

    FlowGraph::Builder moved(g1);
    moved.setNodePosition(s, QPointF(10, 20));
    EXPECT_NE(moved.freeze(), g1);
}

TEST(FlowGraphTests, AllocatorNeverReusesIds)
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    addNode(b, ids, NodeKind::Start);
    const NodeId a = addNode(b, ids, NodeKind::Agent);
    const FlowGraph g = deleteNode(b.freeze(), a);

    NodeIdAllocator reopened;
    reopened.observe(g);
    EXPECT_EQ(reopened.allocate().toString(), QStringLiteral("2"));

    EXPECT_EQ(ids.allocate().toString(), QStringLiteral("3"));
}

TEST(FlowGraphTests, InitialGraphHasSingleStartNode)
{
    NodeIdAllocator ids;
    const FlowGraph g = initialGraph(ids);

    ASSERT_EQ(g.nodeCount(), 1);
    const Node* start = g.tryNode(g.nodeIds().front());
    EXPECT_EQ(start->kind(), NodeKind::Start);
    EXPECT_EQ(start->position, QPointF(200, 200));
}
