// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "command/BuiltInCommands.hpp"
#include "command/CommandError.hpp"

#include <flowmodel/FlowGraph.hpp>

namespace Command {

using FlowModel::FlowGraph;

static CommandResult fail(CommandErrorCode code, const QString& msg)
{
    return CommandResult::failure(CommandError(code, msg));
}

CommandResult CreateNodeCommand::apply(const FlowGraph& input) const
{
    if (m_node.id.isNull())
        return fail(CommandErrorCode::InvalidArgument, "CreateNode: node id is null.");
    if (input.containsNode(m_node.id))
        return fail(CommandErrorCode::InvariantViolation,
                    QString("CreateNode: id '%1' already in use.").arg(m_node.id.toString()));

    FlowGraph::Builder b(input);
    if (!b.insertNode(m_node))
        return fail(CommandErrorCode::InvariantViolation, "CreateNode: builder refused node.");

    CreatedNode payload{m_node.id};
    return CommandResult::success(b.freeze(), QVariant::fromValue(payload));
}

CommandResult ConnectNodesCommand::apply(const FlowGraph& input) const
{
    if (m_source.isNull() || m_target.isNull())
        return fail(CommandErrorCode::InvalidArgument, "ConnectNodes: source/target is null.");
    if (!input.containsNode(m_source))
        return fail(CommandErrorCode::MissingEntity, "ConnectNodes: source node does not exist.");
    if (!input.containsNode(m_target))
        return fail(CommandErrorCode::MissingEntity, "ConnectNodes: target node does not exist.");

    FlowGraph::Builder b(input);
    const FlowModel::EdgeId id = b.connect(m_source, m_target, m_data);
    if (id.isNull())
        return fail(CommandErrorCode::InvalidConnection, "ConnectNodes: edge was refused.");

    CreatedEdge payload{id};
    return CommandResult::success(b.freeze(), QVariant::fromValue(payload));
}

CommandResult MoveNodesCommand::apply(const FlowGraph& input) const
{
    if (m_moves.isEmpty())
        return fail(CommandErrorCode::InvalidArgument, QString("%1: no positions provided.").arg(m_label));

    FlowGraph::Builder b(input);
    bool moved = false;
    for (const NodeMove& move : m_moves) {
        const FlowModel::Node* n = input.tryNode(move.id);
        if (!n) {
            return fail(CommandErrorCode::MissingEntity,
                        QString("%1: node '%2' does not exist.").arg(m_label, move.id.toString()));
        }
        if (n->position == move.position)
            continue;
        b.setNodePosition(move.id, move.position);
        moved = true;
    }

    if (!moved)
        return CommandResult::unchanged(input);
    return CommandResult::success(b.freeze());
}

CommandResult UpdateNodePayloadCommand::apply(const FlowGraph& input) const
{
    const FlowModel::Node* n = input.tryNode(m_id);
    if (!n)
        return fail(CommandErrorCode::MissingEntity, "UpdateNodePayload: node does not exist.");
    if (n->kind() != FlowModel::kindOf(m_payload))
        return fail(CommandErrorCode::InvalidArgument, "UpdateNodePayload: payload kind differs from node kind.");
    if (n->payload == m_payload)
        return CommandResult::unchanged(input);

    FlowGraph::Builder b(input);
    b.setNodePayload(m_id, m_payload);
    return CommandResult::success(b.freeze());
}

CommandResult UpdateEdgeDataCommand::apply(const FlowGraph& input) const
{
    const FlowModel::Edge* e = input.tryEdge(m_id);
    if (!e)
        return fail(CommandErrorCode::MissingEntity, "UpdateEdgeData: edge does not exist.");
    if (e->data == m_data)
        return CommandResult::unchanged(input);

    FlowGraph::Builder b(input);
    b.setEdgeData(m_id, m_data);
    return CommandResult::success(b.freeze());
}

CommandResult SetSelectionCommand::apply(const FlowGraph& input) const
{
    // Stale ids are expected here: the surface may report selection for an
    // entity that a previous batch already removed.
    FlowGraph::Builder b(input);
    for (const auto& [id, selected] : m_nodes)
        b.setNodeSelected(id, selected);
    for (const auto& [id, selected] : m_edges)
        b.setEdgeSelected(id, selected);
    b.refreshEdgeHighlights(m_hoveredEdge);

    const FlowGraph out = b.freeze();
    if (out == input)
        return CommandResult::unchanged(input);
    return CommandResult::success(out);
}

CommandResult CompositeCommand::apply(const FlowGraph& input) const
{
    if (m_parts.empty())
        return fail(CommandErrorCode::InvalidArgument, QString("%1: empty batch.").arg(m_label));

    FlowGraph current = input;
    bool changed = false;
    for (const auto& part : m_parts) {
        const CommandResult r = part->apply(current);
        if (!r.ok()) {
            return fail(r.error().code(),
                        QString("%1: %2 failed (%3)").arg(m_label, part->name(), r.error().message()));
        }
        if (r.changed()) {
            current = r.graph();
            changed = true;
        }
    }

    if (!changed)
        return CommandResult::unchanged(input);
    return CommandResult::success(current);
}

} // namespace Command
