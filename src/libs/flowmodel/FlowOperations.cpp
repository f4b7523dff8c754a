// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/FlowOperations.hpp"

namespace FlowModel {

std::optional<Node> createNode(NodeKind kind, const QPointF& position, NodeIdAllocator& ids)
{
    std::optional<NodePayload> payload = defaultPayload(kind);
    if (!payload)
        return std::nullopt;

    Node node;
    node.id = ids.allocate();
    node.position = position;
    node.payload = std::move(*payload);
    return node;
}

FlowGraph deleteNode(const FlowGraph& graph, const NodeId& id)
{
    if (!graph.containsNode(id))
        return graph;

    FlowGraph::Builder b(graph);
    b.removeNode(id);
    return b.freeze();
}

FlowGraph initialGraph(NodeIdAllocator& ids)
{
    FlowGraph::Builder b;
    if (auto start = createNode(NodeKind::Start, QPointF(200.0, 200.0), ids))
        b.insertNode(std::move(*start));
    return b.freeze();
}

} // namespace FlowModel
