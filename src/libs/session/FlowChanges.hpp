// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <flowmodel/FlowEntities.hpp>

#include <QtCore/QPointF>
#include <QtCore/QSizeF>

#include <optional>

namespace Session {

// Change records as the rendering surface reports them. One batch is applied
// as one command.
struct NodeChange final {
    enum class Type : quint8 {
        Add,
        Remove,
        Position,
        Select,
        Dimensions,
        Replace
    };

    Type type = Type::Select;
    FlowModel::NodeId id;

    std::optional<FlowModel::Node> item;  // Add, Replace
    std::optional<QPointF> position;      // Position; unset on the final drag event
    bool dragging = false;                // Position
    bool selected = false;                // Select
    QSizeF dimensions;                    // Dimensions

    static NodeChange add(FlowModel::Node node)
    {
        NodeChange c;
        c.type = Type::Add;
        c.id = node.id;
        c.item = std::move(node);
        return c;
    }

    static NodeChange remove(FlowModel::NodeId id)
    {
        NodeChange c;
        c.type = Type::Remove;
        c.id = std::move(id);
        return c;
    }

    static NodeChange move(FlowModel::NodeId id, std::optional<QPointF> position, bool dragging)
    {
        NodeChange c;
        c.type = Type::Position;
        c.id = std::move(id);
        c.position = position;
        c.dragging = dragging;
        return c;
    }

    static NodeChange select(FlowModel::NodeId id, bool selected)
    {
        NodeChange c;
        c.type = Type::Select;
        c.id = std::move(id);
        c.selected = selected;
        return c;
    }

    static NodeChange resize(FlowModel::NodeId id, const QSizeF& dimensions)
    {
        NodeChange c;
        c.type = Type::Dimensions;
        c.id = std::move(id);
        c.dimensions = dimensions;
        return c;
    }

    static NodeChange replace(FlowModel::Node node)
    {
        NodeChange c;
        c.type = Type::Replace;
        c.id = node.id;
        c.item = std::move(node);
        return c;
    }
};

struct EdgeChange final {
    enum class Type : quint8 {
        Add,
        Remove,
        Select,
        Replace
    };

    Type type = Type::Select;
    FlowModel::EdgeId id;

    std::optional<FlowModel::Edge> item;  // Add, Replace
    bool selected = false;                // Select

    static EdgeChange add(FlowModel::Edge edge)
    {
        EdgeChange c;
        c.type = Type::Add;
        c.id = edge.id;
        c.item = std::move(edge);
        return c;
    }

    static EdgeChange remove(FlowModel::EdgeId id)
    {
        EdgeChange c;
        c.type = Type::Remove;
        c.id = std::move(id);
        return c;
    }

    static EdgeChange select(FlowModel::EdgeId id, bool selected)
    {
        EdgeChange c;
        c.type = Type::Select;
        c.id = std::move(id);
        c.selected = selected;
        return c;
    }

    static EdgeChange replace(FlowModel::Edge edge)
    {
        EdgeChange c;
        c.type = Type::Replace;
        c.id = edge.id;
        c.item = std::move(edge);
        return c;
    }
};

} // namespace Session
