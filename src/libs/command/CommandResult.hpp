// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/CommandGlobal.hpp"
#include "command/CommandError.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <QtCore/QMetaType>
#include <QtCore/QVariant>

namespace Command {

class COMMAND_EXPORT CommandResult final {
public:
	CommandResult() = default;

	static CommandResult success(FlowModel::FlowGraph graph, QVariant payload = {})
	{
		CommandResult r;
		r.m_ok = true;
		r.m_graph = std::move(graph);
		r.m_payload = std::move(payload);
		return r;
	}

	// The command succeeded but left the graph as it was; history skips it.
	static CommandResult unchanged(FlowModel::FlowGraph graph)
	{
		CommandResult r = success(std::move(graph));
		r.m_changed = false;
		return r;
	}

	static CommandResult failure(CommandError err)
	{
		CommandResult r;
		r.m_ok = false;
		r.m_error = std::move(err);
		return r;
	}

	bool ok() const noexcept { return m_ok; }
	bool changed() const noexcept { return m_ok && m_changed; }
	const CommandError& error() const noexcept { return m_error; }
	const FlowModel::FlowGraph& graph() const noexcept { return m_graph; }
	const QVariant& payload() const noexcept { return m_payload; }

private:
	bool m_ok{false};
	bool m_changed{true};
	CommandError m_error{CommandError::none()};
	FlowModel::FlowGraph m_graph{};
	QVariant m_payload{};
};

} // namespace Command

Q_DECLARE_METATYPE(Command::CommandResult)
