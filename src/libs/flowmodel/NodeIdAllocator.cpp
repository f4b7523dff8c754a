// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/NodeIdAllocator.hpp"

#include "flowmodel/FlowGraph.hpp"

namespace FlowModel {

NodeId NodeIdAllocator::allocate()
{
    return NodeId(QString::number(m_next++));
}

void NodeIdAllocator::observe(const NodeId& id)
{
    bool numeric = false;
    const qint64 value = id.toString().toLongLong(&numeric);
    if (numeric && value >= m_next)
        m_next = value + 1;
}

void NodeIdAllocator::observe(const FlowGraph& graph)
{
    for (const NodeId& id : graph.nodeIds())
        observe(id);
}

} // namespace FlowModel
