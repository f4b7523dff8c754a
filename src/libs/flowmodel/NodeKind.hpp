// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"

#include <QtCore/QString>

namespace FlowModel {

// Order matches the alternatives of NodePayload.
enum class NodeKind : quint8 {
	Start = 0,
	Agent,
	End,
	Global,
	Trigger,
	Webhook
};

inline constexpr int kNodeKindCount = 6;

FLOWMODEL_EXPORT QString nodeKindToString(NodeKind kind);
FLOWMODEL_EXPORT bool nodeKindFromString(const QString& text, NodeKind& out);

FLOWMODEL_EXPORT bool isKnownKind(NodeKind kind) noexcept;

// Start, End and Global nodes anchor the flow and are never nudged by layout.
FLOWMODEL_EXPORT bool isTerminalKind(NodeKind kind) noexcept;

} // namespace FlowModel
