// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/FlowCommand.hpp"

#include <flowmodel/FlowEntities.hpp>

#include <QtCore/QPair>
#include <QtCore/QPointF>
#include <QtCore/QVector>

#include <memory>
#include <vector>

namespace Command {

struct CreatedNode {
    FlowModel::NodeId id{};
};

struct CreatedEdge {
    FlowModel::EdgeId id{};
};

struct NodeMove {
    FlowModel::NodeId id;
    QPointF position;
};

// Inserts a node built by FlowModel::createNode(); the id is already assigned.
class COMMAND_EXPORT CreateNodeCommand final : public FlowCommand {
public:
    explicit CreateNodeCommand(FlowModel::Node node) : m_node(std::move(node)) {}

    QString name() const override { return QStringLiteral("CreateNode"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    FlowModel::Node m_node;
};

class COMMAND_EXPORT ConnectNodesCommand final : public FlowCommand {
public:
    ConnectNodesCommand(FlowModel::NodeId source, FlowModel::NodeId target, FlowModel::EdgeData data = {})
        : m_source(std::move(source)), m_target(std::move(target)), m_data(std::move(data)) {}

    QString name() const override { return QStringLiteral("ConnectNodes"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    FlowModel::NodeId m_source;
    FlowModel::NodeId m_target;
    FlowModel::EdgeData m_data;
};

class COMMAND_EXPORT MoveNodesCommand final : public FlowCommand {
public:
    explicit MoveNodesCommand(QVector<NodeMove> moves, QString label = QStringLiteral("MoveNodes"))
        : m_moves(std::move(moves)), m_label(std::move(label)) {}

    QString name() const override { return m_label; }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    QVector<NodeMove> m_moves;
    QString m_label;
};

class COMMAND_EXPORT UpdateNodePayloadCommand final : public FlowCommand {
public:
    UpdateNodePayloadCommand(FlowModel::NodeId id, FlowModel::NodePayload payload)
        : m_id(std::move(id)), m_payload(std::move(payload)) {}

    QString name() const override { return QStringLiteral("UpdateNodePayload"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    FlowModel::NodeId m_id;
    FlowModel::NodePayload m_payload;
};

class COMMAND_EXPORT UpdateEdgeDataCommand final : public FlowCommand {
public:
    UpdateEdgeDataCommand(FlowModel::EdgeId id, FlowModel::EdgeData data)
        : m_id(std::move(id)), m_data(std::move(data)) {}

    QString name() const override { return QStringLiteral("UpdateEdgeData"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    FlowModel::EdgeId m_id;
    FlowModel::EdgeData m_data;
};

// Presentation-only state: selection flags and the hovered edge. Applied
// through HistoryStore::applyTransient(), never recorded.
class COMMAND_EXPORT SetSelectionCommand final : public FlowCommand {
public:
    SetSelectionCommand(QVector<QPair<FlowModel::NodeId, bool>> nodes,
                        QVector<QPair<FlowModel::EdgeId, bool>> edges,
                        FlowModel::EdgeId hoveredEdge = {})
        : m_nodes(std::move(nodes)), m_edges(std::move(edges)), m_hoveredEdge(std::move(hoveredEdge)) {}

    QString name() const override { return QStringLiteral("SetSelection"); }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    QVector<QPair<FlowModel::NodeId, bool>> m_nodes;
    QVector<QPair<FlowModel::EdgeId, bool>> m_edges;
    FlowModel::EdgeId m_hoveredEdge;
};

// Runs its parts in order against the running result, so one editor batch
// becomes one history entry. Fails as a whole if any part fails.
class COMMAND_EXPORT CompositeCommand final : public FlowCommand {
public:
    explicit CompositeCommand(QString label) : m_label(std::move(label)) {}

    void add(std::unique_ptr<FlowCommand> part) { m_parts.push_back(std::move(part)); }
    bool isEmpty() const noexcept { return m_parts.empty(); }
    std::size_t size() const noexcept { return m_parts.size(); }

    QString name() const override { return m_label; }
    CommandResult apply(const FlowModel::FlowGraph& input) const override;

private:
    QString m_label;
    std::vector<std::unique_ptr<FlowCommand>> m_parts;
};

} // namespace Command

Q_DECLARE_METATYPE(Command::CreatedNode)
Q_DECLARE_METATYPE(Command::CreatedEdge)
