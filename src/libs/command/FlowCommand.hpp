// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/CommandGlobal.hpp"
#include "command/CommandResult.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <QtCore/QString>

namespace Command {

// How a change participates in history. Cosmetic changes (drag in progress)
// may be folded into the previous entry; structural ones never are.
enum class ChangeClass : quint8 {
	Structural,
	Cosmetic
};

class COMMAND_EXPORT FlowCommand {
public:
	virtual ~FlowCommand() = default;
	virtual QString name() const = 0;
	virtual CommandResult apply(const FlowModel::FlowGraph& input) const = 0;
};

} // namespace Command
