// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/FlowGraph.hpp"

#include "utils/Macros.hpp"

#include <QtCore/QSet>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(flowmodellog, "callflow.flowmodel")

namespace FlowModel {

FlowGraph::FlowGraph()
    : d(nullptr) {}

FlowGraph::~FlowGraph() = default;

FlowGraph::FlowGraph(QExplicitlySharedDataPointer<Data> data)
    : d(std::move(data)) {}

const QVector<NodeId>& FlowGraph::nodeIds() const noexcept {
    static const QVector<NodeId> kEmpty{};
    return d ? d->nodeOrder : kEmpty;
}

const QVector<EdgeId>& FlowGraph::edgeIds() const noexcept {
    static const QVector<EdgeId> kEmpty{};
    return d ? d->edgeOrder : kEmpty;
}

const Node* FlowGraph::tryNode(const NodeId& id) const noexcept {
    if (!d) return nullptr;
    const auto it = d->nodes.constFind(id);
    return it == d->nodes.constEnd() ? nullptr : &(*it);
}

const Edge* FlowGraph::tryEdge(const EdgeId& id) const noexcept {
    if (!d) return nullptr;
    const auto it = d->edges.constFind(id);
    return it == d->edges.constEnd() ? nullptr : &(*it);
}

const Viewport& FlowGraph::viewport() const noexcept {
    static const Viewport kDefault{};
    return d ? d->viewport : kDefault;
}

const FlowIndex& FlowGraph::index() const noexcept {
    static const FlowIndex kEmpty{};
    return d ? d->index : kEmpty;
}

QVector<EdgeId> FlowGraph::incidentEdges(const NodeId& id) const
{
    QVector<EdgeId> out = outgoingEdges(id);
    for (const EdgeId& eid : incomingEdges(id)) {
        if (!out.contains(eid))
            out.push_back(eid);
    }
    return out;
}

QVector<EdgeId> FlowGraph::edgesBetween(const NodeId& a, const NodeId& b) const
{
    QVector<EdgeId> out;
    for (const EdgeId& eid : edgeIds()) {
        const Edge* e = tryEdge(eid);
        if (!e)
            continue;
        if ((e->source == a && e->target == b) || (e->source == b && e->target == a))
            out.push_back(eid);
    }
    return out;
}

std::optional<NodeId> FlowGraph::firstNodeOfKind(NodeKind kind) const
{
    for (const NodeId& nid : nodeIds()) {
        const Node* n = tryNode(nid);
        if (n && n->kind() == kind)
            return nid;
    }
    return std::nullopt;
}

bool FlowGraph::isConsistent() const noexcept
{
    if (!d)
        return true;

    for (const EdgeId& eid : d->edgeOrder) {
        const auto it = d->edges.constFind(eid);
        if (it == d->edges.constEnd()) return false;
        if (!d->nodes.contains(it->source)) return false;
        if (!d->nodes.contains(it->target)) return false;
    }
    return true;
}

bool operator==(const FlowGraph& a, const FlowGraph& b)
{
    if (a.d == b.d)
        return true;

    if (a.nodeIds() != b.nodeIds() || a.edgeIds() != b.edgeIds())
        return false;
    if (!(a.viewport() == b.viewport()))
        return false;

    for (const NodeId& nid : a.nodeIds()) {
        const Node* na = a.tryNode(nid);
        const Node* nb = b.tryNode(nid);
        if (!na || !nb || !(*na == *nb))
            return false;
    }

    for (const EdgeId& eid : a.edgeIds()) {
        const Edge* ea = a.tryEdge(eid);
        const Edge* eb = b.tryEdge(eid);
        if (!ea || !eb || !(*ea == *eb))
            return false;
    }

    return true;
}

FlowGraph::Builder::Builder(const FlowGraph& graph)
    : m_viewport(graph.viewport())
{
    for (const NodeId& id : graph.nodeIds()) {
        const Node* n = graph.tryNode(id);
        if (!n) continue;
        m_nodes.insert(id, *n);
        m_nodeOrder.push_back(id);
    }

    for (const EdgeId& id : graph.edgeIds()) {
        const Edge* e = graph.tryEdge(id);
        if (!e) continue;
        m_edges.insert(id, *e);
        m_edgeOrder.push_back(id);
    }
}

bool FlowGraph::Builder::insertNode(Node node)
{
    UTILS_GUARD_RET(!node.id.isNull(), false);

    if (m_nodes.contains(node.id)) {
        qCCritical(flowmodellog).noquote() << "Duplicate node id" << node.id.toString();
        UTILS_ASSERT_MSG(false, "duplicate node id");
        return false;
    }

    const NodeId id = node.id;
    m_nodes.insert(id, std::move(node));
    m_nodeOrder.push_back(id);
    return true;
}

bool FlowGraph::Builder::removeNode(const NodeId& id)
{
    const auto nit = m_nodes.find(id);
    UTILS_GUARD_RET(nit != m_nodes.end(), false);

    QVector<EdgeId> incident;
    for (const EdgeId& eid : m_edgeOrder) {
        const auto eit = m_edges.constFind(eid);
        if (eit != m_edges.constEnd() && eit->touches(id))
            incident.push_back(eid);
    }
    for (const EdgeId& eid : incident)
        removeEdge(eid);

    m_nodes.erase(nit);
    m_nodeOrder.erase(std::remove(m_nodeOrder.begin(), m_nodeOrder.end(), id), m_nodeOrder.end());
    return true;
}

bool FlowGraph::Builder::insertEdge(Edge edge)
{
    UTILS_GUARD_RET(!edge.id.isNull(), false);

    if (!m_nodes.contains(edge.source) || !m_nodes.contains(edge.target)) {
        qCWarning(flowmodellog).noquote()
            << "Refusing edge" << edge.id.toString() << "with unknown endpoint"
            << edge.source.toString() << "->" << edge.target.toString();
        return false;
    }

    if (m_edges.contains(edge.id)) {
        qCCritical(flowmodellog).noquote() << "Duplicate edge id" << edge.id.toString();
        UTILS_ASSERT_MSG(false, "duplicate edge id");
        return false;
    }

    const EdgeId id = edge.id;
    m_edges.insert(id, std::move(edge));
    m_edgeOrder.push_back(id);
    return true;
}

EdgeId FlowGraph::Builder::connect(const NodeId& source, const NodeId& target, EdgeData data)
{
    Edge e;
    e.id = uniqueEdgeId(source, target);
    e.source = source;
    e.target = target;
    e.data = std::move(data);

    const EdgeId id = e.id;
    if (!insertEdge(std::move(e)))
        return EdgeId::null();
    return id;
}

bool FlowGraph::Builder::removeEdge(const EdgeId& id)
{
    if (!m_edges.remove(id))
        return false;
    m_edgeOrder.erase(std::remove(m_edgeOrder.begin(), m_edgeOrder.end(), id), m_edgeOrder.end());
    return true;
}

bool FlowGraph::Builder::setNodePosition(const NodeId& id, const QPointF& position)
{
    auto it = m_nodes.find(id);
    UTILS_GUARD_RET(it != m_nodes.end(), false);
    it->position = position;
    return true;
}

bool FlowGraph::Builder::setNodePayload(const NodeId& id, NodePayload payload)
{
    auto it = m_nodes.find(id);
    UTILS_GUARD_RET(it != m_nodes.end(), false);

    // The kind is fixed for the lifetime of a node.
    if (kindOf(payload) != it->kind()) {
        qCWarning(flowmodellog).noquote()
            << "Refusing payload of kind" << nodeKindToString(kindOf(payload))
            << "for node" << id.toString() << "of kind" << nodeKindToString(it->kind());
        return false;
    }

    it->payload = std::move(payload);
    return true;
}

bool FlowGraph::Builder::setNodeSelected(const NodeId& id, bool selected)
{
    auto it = m_nodes.find(id);
    UTILS_GUARD_RET(it != m_nodes.end(), false);
    it->selected = selected;
    return true;
}

bool FlowGraph::Builder::setNodeValidation(const NodeId& id, ValidationState state)
{
    auto it = m_nodes.find(id);
    UTILS_GUARD_RET(it != m_nodes.end(), false);
    it->validation = std::move(state);
    return true;
}

bool FlowGraph::Builder::setEdgeData(const EdgeId& id, EdgeData data)
{
    auto it = m_edges.find(id);
    UTILS_GUARD_RET(it != m_edges.end(), false);
    it->data = std::move(data);
    return true;
}

bool FlowGraph::Builder::setEdgeSelected(const EdgeId& id, bool selected)
{
    auto it = m_edges.find(id);
    UTILS_GUARD_RET(it != m_edges.end(), false);
    it->selected = selected;
    return true;
}

bool FlowGraph::Builder::setEdgeValidation(const EdgeId& id, ValidationState state)
{
    auto it = m_edges.find(id);
    UTILS_GUARD_RET(it != m_edges.end(), false);
    it->validation = std::move(state);
    return true;
}

void FlowGraph::Builder::clearValidation()
{
    for (auto it = m_nodes.begin(); it != m_nodes.end(); ++it)
        it->validation = ValidationState{};
    for (auto it = m_edges.begin(); it != m_edges.end(); ++it)
        it->validation = ValidationState{};
}

void FlowGraph::Builder::refreshEdgeHighlights(const EdgeId& hoveredEdge)
{
    QSet<NodeId> selectedEnds;
    QSet<NodeId> hoveredEnds;

    for (const Edge& e : std::as_const(m_edges)) {
        if (e.selected) {
            selectedEnds.insert(e.source);
            selectedEnds.insert(e.target);
        }
        if (!hoveredEdge.isNull() && e.id == hoveredEdge) {
            hoveredEnds.insert(e.source);
            hoveredEnds.insert(e.target);
        }
    }

    for (auto it = m_nodes.begin(); it != m_nodes.end(); ++it) {
        it->selectedThroughEdge = selectedEnds.contains(it.key());
        it->hoveredThroughEdge = hoveredEnds.contains(it.key());
    }
}

void FlowGraph::Builder::setViewport(const Viewport& viewport)
{
    m_viewport = viewport;
}

const Node* FlowGraph::Builder::tryNode(const NodeId& id) const noexcept
{
    const auto it = m_nodes.constFind(id);
    return it == m_nodes.constEnd() ? nullptr : &(*it);
}

const Edge* FlowGraph::Builder::tryEdge(const EdgeId& id) const noexcept
{
    const auto it = m_edges.constFind(id);
    return it == m_edges.constEnd() ? nullptr : &(*it);
}

EdgeId FlowGraph::Builder::uniqueEdgeId(const NodeId& source, const NodeId& target) const
{
    const QString base = QStringLiteral("%1-%2").arg(source.toString(), target.toString());
    EdgeId candidate(base);
    for (int suffix = 2; m_edges.contains(candidate); ++suffix)
        candidate = EdgeId(QStringLiteral("%1-%2").arg(base).arg(suffix));
    return candidate;
}

FlowGraph FlowGraph::Builder::freeze() const
{
    QExplicitlySharedDataPointer<Data> data(new Data());
    data->nodes = m_nodes;
    data->edges = m_edges;

    data->nodeOrder = m_nodeOrder;
    data->edgeOrder = m_edgeOrder;

    data->viewport = m_viewport;

    data->index = FlowIndex(data->edgeOrder, data->edges);

    return FlowGraph(std::move(data));
}

} // namespace FlowModel
