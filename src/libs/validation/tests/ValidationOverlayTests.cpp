// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "validation/ValidationOverlay.hpp"

#include <flowmodel/FlowOperations.hpp>

using namespace FlowModel;
using namespace Validation;

namespace {

struct SmallFlow {
    FlowGraph graph;
    NodeId start;
    NodeId agent;
    EdgeId edge;
};

SmallFlow makeFlow()
{
    NodeIdAllocator ids;
    FlowGraph::Builder b;
    auto s = createNode(NodeKind::Start, QPointF(), ids);
    auto a = createNode(NodeKind::Agent, QPointF(), ids);
    SmallFlow f;
    f.start = s->id;
    f.agent = a->id;
    b.insertNode(*s);
    b.insertNode(*a);
    f.edge = b.connect(f.start, f.agent);
    f.graph = b.freeze();
    return f;
}

ValidationError nodeError(const NodeId& id, const char* message)
{
    return ValidationError{ErrorKind::Node, id.toString(), QStringLiteral("prompt"), QString::fromUtf8(message)};
}

} // namespace

TEST(ValidationOverlay, AttachesNodeAndEdgeErrors)
{
    const SmallFlow f = makeFlow();
    const ValidationErrors errors{
        nodeError(f.agent, "Prompt is required"),
        ValidationError{ErrorKind::Edge, f.edge.toString(), QStringLiteral("label"), QStringLiteral("Label is required")},
    };

    const OverlayResult r = applyValidation(f.graph, errors);

    const Node* agent = r.graph.tryNode(f.agent);
    EXPECT_TRUE(agent->validation.invalid);
    EXPECT_EQ(agent->validation.message, QStringLiteral("Prompt is required"));
    EXPECT_TRUE(r.graph.tryNode(f.start)->validation.isClean());

    const Edge* edge = r.graph.tryEdge(f.edge);
    EXPECT_TRUE(edge->validation.invalid);
    EXPECT_EQ(edge->validation.message, QStringLiteral("Label is required"));
    EXPECT_TRUE(r.workflowErrors.isEmpty());
}

TEST(ValidationOverlay, EmptyListClearsEverything)
{
    const SmallFlow f = makeFlow();
    const OverlayResult flagged = applyValidation(f.graph, {
        nodeError(f.start, "Name is required"),
        nodeError(f.agent, "Prompt is required"),
        ValidationError{ErrorKind::Edge, f.edge.toString(), std::nullopt, QStringLiteral("Condition is required")},
    });

    const OverlayResult cleared = applyValidation(flagged.graph, {});
    for (const NodeId& id : cleared.graph.nodeIds())
        EXPECT_TRUE(cleared.graph.tryNode(id)->validation.isClean());
    for (const EdgeId& id : cleared.graph.edgeIds())
        EXPECT_TRUE(cleared.graph.tryEdge(id)->validation.isClean());
    EXPECT_EQ(cleared.graph, f.graph);
}

TEST(ValidationOverlay, StaleErrorsDoNotSurviveNextPass)
{
    const SmallFlow f = makeFlow();
    const OverlayResult first = applyValidation(f.graph, {nodeError(f.start, "Name is required")});
    const OverlayResult second = applyValidation(first.graph, {nodeError(f.agent, "Prompt is required")});

    EXPECT_FALSE(second.graph.tryNode(f.start)->validation.invalid);
    EXPECT_TRUE(second.graph.tryNode(f.agent)->validation.invalid);
}

TEST(ValidationOverlay, JoinsDistinctMessages)
{
    const SmallFlow f = makeFlow();
    const OverlayResult r = applyValidation(f.graph, {
        nodeError(f.agent, "Prompt is required"),
        nodeError(f.agent, "Name is required"),
        nodeError(f.agent, "Prompt is required"),
    });

    EXPECT_EQ(r.graph.tryNode(f.agent)->validation.message, QStringLiteral("Prompt is required, Name is required"));
}

TEST(ValidationOverlay, WorkflowErrorsStayFlat)
{
    const SmallFlow f = makeFlow();
    const ValidationError wf{ErrorKind::Workflow, std::nullopt, std::nullopt, QStringLiteral("Workflow needs an end node")};
    const ValidationError unknown = nodeError(NodeId(QStringLiteral("404")), "Prompt is required");

    const OverlayResult r = applyValidation(f.graph, {wf, unknown});

    ASSERT_EQ(r.workflowErrors.size(), 2);
    EXPECT_EQ(r.workflowErrors.at(0), wf);
    EXPECT_EQ(r.workflowErrors.at(1), unknown);
    EXPECT_EQ(r.graph, f.graph);
}

TEST(ValidationOverlay, UserDataIsUntouched)
{
    const SmallFlow f = makeFlow();
    const OverlayResult r = applyValidation(f.graph, {nodeError(f.agent, "Prompt is required")});

    EXPECT_EQ(r.graph.tryNode(f.agent)->payload, f.graph.tryNode(f.agent)->payload);
    EXPECT_EQ(r.graph.tryNode(f.agent)->position, f.graph.tryNode(f.agent)->position);
    EXPECT_EQ(r.graph.edgeIds(), f.graph.edgeIds());
}
