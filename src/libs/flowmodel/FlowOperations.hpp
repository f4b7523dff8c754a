// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/FlowGraph.hpp"
#include "flowmodel/NodeIdAllocator.hpp"

#include <optional>

namespace FlowModel {

// Fresh node with the kind's default payload. std::nullopt for an unknown kind.
FLOWMODEL_EXPORT std::optional<Node> createNode(NodeKind kind,
                                                const QPointF& position,
                                                NodeIdAllocator& ids);

// The node and every edge with source == id or target == id are removed;
// no other edge is touched. Unknown ids return the graph unchanged.
FLOWMODEL_EXPORT FlowGraph deleteNode(const FlowGraph& graph, const NodeId& id);

// Graph used when a workflow has no saved definition yet.
FLOWMODEL_EXPORT FlowGraph initialGraph(NodeIdAllocator& ids);

} // namespace FlowModel
