// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/FlowEntities.hpp"

#include <QtCore/QHash>
#include <QtCore/QVector>

namespace FlowModel {

class FLOWMODEL_EXPORT FlowIndex final {
public:
	FlowIndex() = default;

	FlowIndex(const QVector<EdgeId>& edgeOrder, const QHash<EdgeId, Edge>& edges);

	const QVector<EdgeId>& outgoing(const NodeId& node) const noexcept;
	const QVector<EdgeId>& incoming(const NodeId& node) const noexcept;

	bool isEmpty() const noexcept;

private:
	QHash<NodeId, QVector<EdgeId>> m_outgoing;
	QHash<NodeId, QVector<EdgeId>> m_incoming;

	static const QVector<EdgeId>& emptyEdges() noexcept;
};

} // namespace FlowModel
