// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QMap>
#include <QtCore/QString>

#include <optional>

namespace Session::Api {

using TemplateVariables = QMap<QString, QString>;

struct WorkflowRecord final {
    QString id;
    QString name;
    // {nodes, edges, viewport}; empty when the workflow was never saved with a graph.
    QJsonObject definition;
    TemplateVariables templateVars;
    QJsonObject configurations;
};

// Partial update. Unset fields are left as they are on the server.
struct WorkflowUpdate final {
    std::optional<QString> name;
    std::optional<QJsonObject> definition;
    std::optional<TemplateVariables> templateVars;
    std::optional<QJsonObject> configurations;
};

} // namespace Session::Api
