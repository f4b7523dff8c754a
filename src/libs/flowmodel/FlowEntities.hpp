// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowId.hpp"
#include "flowmodel/NodeKind.hpp"
#include "flowmodel/NodePayload.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>

namespace FlowModel {

// Server-reported problem attached to a node or edge. An empty message with
// invalid == false is the "clean" state.
struct ValidationState final {
    bool invalid = false;
    QString message;

    bool isClean() const noexcept { return !invalid && message.isEmpty(); }
    bool operator==(const ValidationState&) const = default;
};

struct Node final {
    NodeId id;
    QPointF position;
    NodePayload payload;

    ValidationState validation;

    bool selected = false;
    bool selectedThroughEdge = false;
    bool hoveredThroughEdge = false;

    NodeKind kind() const noexcept { return kindOf(payload); }
    QString name() const { return payloadName(payload); }

    bool operator==(const Node&) const = default;
};

struct EdgeData final {
    QString label;
    // Empty means the transition is always taken (fallback branch).
    QString condition;

    bool operator==(const EdgeData&) const = default;
};

struct Edge final {
    EdgeId id;
    NodeId source;
    NodeId target;
    EdgeData data;

    ValidationState validation;

    bool selected = false;

    bool isSelfLoop() const noexcept { return source == target; }
    bool touches(const NodeId& node) const noexcept { return source == node || target == node; }

    bool operator==(const Edge&) const = default;
};

struct Viewport final {
    double x = 0.0;
    double y = 0.0;
    double zoom = 1.0;

    bool operator==(const Viewport&) const = default;
};

} // namespace FlowModel
