// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/FlowEntities.hpp"
#include "flowmodel/FlowIndex.hpp"

#include <QtCore/QExplicitlySharedDataPointer>
#include <QtCore/QHash>
#include <QtCore/QSharedData>
#include <QtCore/QVector>

#include <optional>

namespace FlowModel {

// Immutable call-flow graph. Copies are cheap and share storage; every change
// goes through a Builder and produces a new graph.
class FLOWMODEL_EXPORT FlowGraph final {
public:
    FlowGraph();
    FlowGraph(const FlowGraph&) = default;
    FlowGraph& operator=(const FlowGraph&) = default;
    ~FlowGraph();

    // iteration, in insertion order
    const QVector<NodeId>& nodeIds() const noexcept;
    const QVector<EdgeId>& edgeIds() const noexcept;

    // Lookup
    const Node* tryNode(const NodeId& id) const noexcept;
    const Edge* tryEdge(const EdgeId& id) const noexcept;

    bool containsNode(const NodeId& id) const noexcept { return tryNode(id) != nullptr; }
    bool containsEdge(const EdgeId& id) const noexcept { return tryEdge(id) != nullptr; }

    qsizetype nodeCount() const noexcept { return nodeIds().size(); }
    qsizetype edgeCount() const noexcept { return edgeIds().size(); }
    bool isEmpty() const noexcept { return nodeIds().isEmpty(); }

    const Viewport& viewport() const noexcept;
    const FlowIndex& index() const noexcept;

    const QVector<EdgeId>& outgoingEdges(const NodeId& id) const noexcept { return index().outgoing(id); }
    const QVector<EdgeId>& incomingEdges(const NodeId& id) const noexcept { return index().incoming(id); }

    // Edges touching the node, self-loops listed once.
    QVector<EdgeId> incidentEdges(const NodeId& id) const;

    // Edges joining the unordered pair {a, b}, in insertion order.
    QVector<EdgeId> edgesBetween(const NodeId& a, const NodeId& b) const;

    std::optional<NodeId> firstNodeOfKind(NodeKind kind) const;

    // Every edge endpoint resolves to a node.
    bool isConsistent() const noexcept;

    friend bool operator==(const FlowGraph& a, const FlowGraph& b);

    class FLOWMODEL_EXPORT Builder final {
    public:
        Builder() = default;
        explicit Builder(const FlowGraph& graph);

        // Refuses a null or already present id.
        bool insertNode(Node node);
        // Removes the node and every edge that starts or ends at it.
        bool removeNode(const NodeId& id);

        // Refuses unknown endpoints and duplicate ids.
        bool insertEdge(Edge edge);
        // Creates an edge with an id derived from its endpoints; null id on failure.
        EdgeId connect(const NodeId& source, const NodeId& target, EdgeData data = {});
        bool removeEdge(const EdgeId& id);

        bool setNodePosition(const NodeId& id, const QPointF& position);
        bool setNodePayload(const NodeId& id, NodePayload payload);
        bool setNodeSelected(const NodeId& id, bool selected);
        bool setNodeValidation(const NodeId& id, ValidationState state);

        bool setEdgeData(const EdgeId& id, EdgeData data);
        bool setEdgeSelected(const EdgeId& id, bool selected);
        bool setEdgeValidation(const EdgeId& id, ValidationState state);

        // Resets the overlay on every node and edge.
        void clearValidation();

        // Recomputes selectedThroughEdge / hoveredThroughEdge from the selected
        // edges and the given hovered edge (may be null).
        void refreshEdgeHighlights(const EdgeId& hoveredEdge);

        void setViewport(const Viewport& viewport);

        const Node* tryNode(const NodeId& id) const noexcept;
        const Edge* tryEdge(const EdgeId& id) const noexcept;
        const QVector<NodeId>& nodeOrder() const noexcept { return m_nodeOrder; }
        const QVector<EdgeId>& edgeOrder() const noexcept { return m_edgeOrder; }

        // "<source>-<target>", suffixed with -2, -3, ... while taken.
        EdgeId uniqueEdgeId(const NodeId& source, const NodeId& target) const;

        FlowGraph freeze() const;

    private:
        QHash<NodeId, Node> m_nodes;
        QHash<EdgeId, Edge> m_edges;

        QVector<NodeId> m_nodeOrder;
        QVector<EdgeId> m_edgeOrder;

        Viewport m_viewport;
    };

private:
    struct Data final : public QSharedData {
        FlowIndex index;

        QHash<NodeId, Node> nodes;
        QHash<EdgeId, Edge> edges;

        QVector<NodeId> nodeOrder;
        QVector<EdgeId> edgeOrder;

        Viewport viewport;
    };

    explicit FlowGraph(QExplicitlySharedDataPointer<Data> data);

    QExplicitlySharedDataPointer<Data> d;
};

FLOWMODEL_EXPORT bool operator==(const FlowGraph& a, const FlowGraph& b);

} // namespace FlowModel
