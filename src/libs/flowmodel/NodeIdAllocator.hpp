// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/FlowId.hpp"

namespace FlowModel {

class FlowGraph;

// Hands out "1", "2", ... and never goes backwards, so an id freed by a
// delete (or hidden again by undo) is not reissued within the session.
class FLOWMODEL_EXPORT NodeIdAllocator final {
public:
    explicit NodeIdAllocator(qint64 next = 1) : m_next(next < 1 ? 1 : next) {}

    NodeId allocate();

    // Raises the high-water mark above every numeric id in the graph.
    void observe(const FlowGraph& graph);
    void observe(const NodeId& id);

    qint64 peek() const noexcept { return m_next; }

private:
    qint64 m_next = 1;
};

} // namespace FlowModel
