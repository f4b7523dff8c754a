// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layout/EdgeRouting.hpp"

#include <QtCore/QVector>

#include <algorithm>
#include <cmath>

namespace Layout {

namespace {

EdgeRoute routeWithSiblings(const FlowModel::Edge& edge, QVector<FlowModel::EdgeId> siblings)
{
    EdgeRoute route;
    route.path = edge.isSelfLoop() ? EdgePathKind::SelfLoopArc : EdgePathKind::Bezier;
    if (siblings.size() < 2)
        return route;

    std::sort(siblings.begin(), siblings.end());
    route.slot = static_cast<int>(siblings.indexOf(edge.id));
    route.labelOffset = route.slot == 0 ? kFirstSlotLabelOffset : kOtherSlotLabelOffset;
    return route;
}

} // namespace

EdgeRoute routeEdge(const FlowModel::FlowGraph& graph, const FlowModel::EdgeId& id)
{
    const FlowModel::Edge* edge = graph.tryEdge(id);
    if (!edge)
        return {};
    return routeWithSiblings(*edge, graph.edgesBetween(edge->source, edge->target));
}

QHash<FlowModel::EdgeId, EdgeRoute> routeEdges(const FlowModel::FlowGraph& graph)
{
    QHash<FlowModel::EdgeId, EdgeRoute> routes;
    routes.reserve(graph.edgeCount());
    for (const FlowModel::EdgeId& id : graph.edgeIds())
        routes.insert(id, routeEdge(graph, id));
    return routes;
}

QPainterPath edgePath(const EdgeRoute& route, const QPointF& source, const QPointF& target, double loopRadius)
{
    QPainterPath path(source);
    if (route.path == EdgePathKind::SelfLoopArc) {
        const double r = std::abs(loopRadius);
        path.cubicTo(source + QPointF(r * 2.0, r), target + QPointF(r * 2.0, -r), target);
        return path;
    }

    const double bend = (target.y() - source.y()) / 2.0;
    path.cubicTo(source + QPointF(0.0, bend), target - QPointF(0.0, bend), target);
    return path;
}

QPointF labelPosition(const EdgeRoute& route, const QPainterPath& path)
{
    return path.pointAtPercent(0.5) + route.labelOffset;
}

} // namespace Layout
