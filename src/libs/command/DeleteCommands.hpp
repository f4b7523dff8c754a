// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/FlowCommand.hpp"

#include <flowmodel/FlowId.hpp>

#include <QtCore/QVector>

namespace Command {

// Removing a node always removes the edges attached to it, whether or not
// they are listed in `edges`.
class COMMAND_EXPORT DeleteEntitiesCommand final : public FlowCommand {
public:
    DeleteEntitiesCommand(QVector<FlowModel::NodeId> nodes = {},
                          QVector<FlowModel::EdgeId> edges = {})
        : m_nodes(std::move(nodes))
        , m_edges(std::move(edges)) {}

    QString name() const override { return QStringLiteral("DeleteEntities"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    QVector<FlowModel::NodeId> m_nodes;
    QVector<FlowModel::EdgeId> m_edges;
};

} // namespace Command
