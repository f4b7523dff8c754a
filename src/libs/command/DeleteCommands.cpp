// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "command/DeleteCommands.hpp"
#include "command/CommandError.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <algorithm>

namespace Command {

static CommandResult fail(CommandErrorCode code, const QString& msg)
{
    return CommandResult::failure(CommandError(code, msg));
}

template <typename T>
static void dedup(QVector<T>& v)
{
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

CommandResult DeleteEntitiesCommand::apply(const FlowModel::FlowGraph& input) const
{
    QVector<FlowModel::NodeId> nodes = m_nodes;
    QVector<FlowModel::EdgeId> edges = m_edges;

    dedup(nodes);
    dedup(edges);

    if (nodes.isEmpty() && edges.isEmpty())
        return fail(CommandErrorCode::InvalidArgument, "DeleteEntities: no ids provided.");

    FlowModel::FlowGraph::Builder b(input);

    bool removed = false;

    for (const auto& id : edges)
        removed = b.removeEdge(id) || removed;

    for (const auto& id : nodes)
        removed = b.removeNode(id) || removed;

    if (!removed)
        return fail(CommandErrorCode::MissingEntity, "DeleteEntities: nothing removed.");

    return CommandResult::success(b.freeze());
}

} // namespace Command
