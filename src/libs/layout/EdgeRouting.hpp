// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layout/LayoutGlobal.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <QtCore/QHash>
#include <QtCore/QPointF>
#include <QtGui/QPainterPath>

namespace Layout {

enum class EdgePathKind : quint8 {
    Bezier,
    SelfLoopArc
};

inline constexpr QPointF kFirstSlotLabelOffset{100.0, 0.0};
inline constexpr QPointF kOtherSlotLabelOffset{0.0, -50.0};
inline constexpr double kSelfLoopRadius = 60.0;

struct EdgeRoute final {
    EdgePathKind path = EdgePathKind::Bezier;
    // Index among the edges joining the same unordered pair, sorted by id;
    // -1 when the edge has no parallel sibling.
    int slot = -1;
    QPointF labelOffset;

    bool operator==(const EdgeRoute&) const = default;
};

// Rendering hints for one edge. Unknown ids get the default route.
LAYOUT_EXPORT EdgeRoute routeEdge(const FlowModel::FlowGraph& graph, const FlowModel::EdgeId& id);

LAYOUT_EXPORT QHash<FlowModel::EdgeId, EdgeRoute> routeEdges(const FlowModel::FlowGraph& graph);

// Path between two handle points. A self-loop leaves and re-enters through
// an arc beside the node instead of a zero-length curve.
LAYOUT_EXPORT QPainterPath edgePath(const EdgeRoute& route,
                                    const QPointF& source,
                                    const QPointF& target,
                                    double loopRadius = kSelfLoopRadius);

// Path midpoint shifted by the route's label offset.
LAYOUT_EXPORT QPointF labelPosition(const EdgeRoute& route, const QPainterPath& path);

} // namespace Layout
