// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "validation/ValidationOverlay.hpp"

#include <QtCore/QHash>
#include <QtCore/QStringList>

Q_LOGGING_CATEGORY(validationlog, "callflow.validation")

namespace Validation {

namespace {

void appendDistinct(QHash<QString, QStringList>& byId, QVector<QString>& order, const QString& id, const QString& message)
{
    auto it = byId.find(id);
    if (it == byId.end()) {
        order.push_back(id);
        it = byId.insert(id, {});
    }
    if (!it->contains(message))
        it->push_back(message);
}

} // namespace

OverlayResult applyValidation(const FlowModel::FlowGraph& graph, const ValidationErrors& errors)
{
    OverlayResult out;

    FlowModel::FlowGraph::Builder b(graph);
    b.clearValidation();

    QHash<QString, QStringList> nodeMessages;
    QHash<QString, QStringList> edgeMessages;
    QVector<QString> nodeOrder;
    QVector<QString> edgeOrder;

    for (const ValidationError& e : errors) {
        switch (e.kind) {
            case ErrorKind::Node:
                if (e.id && graph.containsNode(FlowModel::NodeId(*e.id))) {
                    appendDistinct(nodeMessages, nodeOrder, *e.id, e.message);
                    continue;
                }
                break;
            case ErrorKind::Edge:
                if (e.id && graph.containsEdge(FlowModel::EdgeId(*e.id))) {
                    appendDistinct(edgeMessages, edgeOrder, *e.id, e.message);
                    continue;
                }
                break;
            case ErrorKind::Workflow:
                out.workflowErrors.push_back(e);
                continue;
        }

        qCWarning(validationlog).noquote()
            << "Validation error for unknown" << errorKindToString(e.kind)
            << e.id.value_or(QStringLiteral("<none>")) << "kept at workflow level:" << e.message;
        out.workflowErrors.push_back(e);
    }

    for (const QString& id : nodeOrder)
        b.setNodeValidation(FlowModel::NodeId(id), {true, nodeMessages.value(id).join(kMessageSeparator)});
    for (const QString& id : edgeOrder)
        b.setEdgeValidation(FlowModel::EdgeId(id), {true, edgeMessages.value(id).join(kMessageSeparator)});

    out.graph = b.freeze();
    return out;
}

} // namespace Validation
