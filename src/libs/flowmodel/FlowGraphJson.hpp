// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/FlowGraph.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>

namespace FlowModel {

// Workflow definition wire format: {nodes, edges, viewport}. The validation
// overlay and selection state are editor-local and never serialized.
FLOWMODEL_EXPORT QJsonObject serializeFlowGraph(const FlowGraph& graph);

// Best effort: entries that cannot be read are skipped and reported, edges
// whose endpoints are missing are dropped. `out` always holds a consistent graph.
FLOWMODEL_EXPORT Utils::Result parseFlowGraph(const QJsonObject& json, FlowGraph& out);

FLOWMODEL_EXPORT QJsonObject serializeNodePayload(const NodePayload& payload);
FLOWMODEL_EXPORT Utils::Result parseNodePayload(NodeKind kind, const QJsonObject& json, NodePayload& out);

} // namespace FlowModel
