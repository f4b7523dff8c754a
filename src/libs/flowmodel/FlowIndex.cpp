// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/FlowIndex.hpp"

namespace FlowModel {

const QVector<EdgeId>& FlowIndex::emptyEdges() noexcept {
    static const QVector<EdgeId> kEmpty{};
    return kEmpty;
}

FlowIndex::FlowIndex(const QVector<EdgeId>& edgeOrder, const QHash<EdgeId, Edge>& edges)
{
    for (const EdgeId& eid : edgeOrder) {
        const auto it = edges.constFind(eid);
        if (it == edges.constEnd())
            continue;

        m_outgoing[it->source].push_back(eid);
        m_incoming[it->target].push_back(eid);
    }
}

const QVector<EdgeId>& FlowIndex::outgoing(const NodeId& node) const noexcept {
    const auto it = m_outgoing.constFind(node);
    return it == m_outgoing.constEnd() ? emptyEdges() : *it;
}

const QVector<EdgeId>& FlowIndex::incoming(const NodeId& node) const noexcept {
    const auto it = m_incoming.constFind(node);
    return it == m_incoming.constEnd() ? emptyEdges() : *it;
}

bool FlowIndex::isEmpty() const noexcept {
    return m_outgoing.isEmpty() && m_incoming.isEmpty();
}

} // namespace FlowModel
