// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/CommandGlobal.hpp"

#include <QtCore/QString>

namespace Command {

enum class CommandErrorCode : quint8 {
	None = 0,
	InvalidArgument,
	MissingEntity,
	InvalidConnection,
	InvariantViolation,
	Unknown
};

class COMMAND_EXPORT CommandError final {
public:
	CommandError() = default;
	CommandError(CommandErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == CommandErrorCode::None; }
	CommandErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	static CommandError none() { return {}; }

	static QString codeName(CommandErrorCode code)
	{
		switch (code) {
			case CommandErrorCode::None: return QStringLiteral("None");
			case CommandErrorCode::InvalidArgument: return QStringLiteral("InvalidArgument");
			case CommandErrorCode::MissingEntity: return QStringLiteral("MissingEntity");
			case CommandErrorCode::InvalidConnection: return QStringLiteral("InvalidConnection");
			case CommandErrorCode::InvariantViolation: return QStringLiteral("InvariantViolation");
			case CommandErrorCode::Unknown: return QStringLiteral("Unknown");
		}
		return QStringLiteral("Unknown");
	}

	// "<Code>: <message>", for logs and status text.
	QString toString() const
	{
		return m_message.isEmpty() ? codeName(m_code)
		                           : QStringLiteral("%1: %2").arg(codeName(m_code), m_message);
	}

private:
	CommandErrorCode m_code{CommandErrorCode::None};
	QString m_message;
};

} // namespace Command
