// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layout/LayoutGlobal.hpp"
#include "layout/LayoutOptions.hpp"

#include "utils/Result.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <QtCore/QHash>
#include <QtCore/QPointF>

namespace Layout {

struct LayoutResult final {
    // New top-left corner per node.
    QHash<FlowModel::NodeId, QPointF> positions;
    QHash<FlowModel::NodeId, int> ranks;
    int rankCount = 0;
};

// Layered layout of the whole graph. Start nodes sit on rank 0 and End nodes
// on the last rank; self-loops and parallel edges do not influence placement.
// Edges are never touched. The same graph and options always produce the
// same result.
//
// A dangling edge is an invariant violation of the input graph: it is logged
// as critical, asserted in debug builds and returned as a failure.
LAYOUT_EXPORT Utils::Result computeLayout(const FlowModel::FlowGraph& graph,
                                          const LayoutOptions& options,
                                          LayoutResult& out);

} // namespace Layout
