// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/WorkflowDocumentJson.hpp"

#include <flowmodel/FlowGraphJson.hpp>

#include <QtCore/QJsonValue>

namespace Session {

namespace {

using namespace Qt::StringLiterals;

const QString kIdKey = u"id"_s;
const QString kNameKey = u"name"_s;
const QString kDefinitionKey = u"workflow_definition"_s;
const QString kTemplateVarsKey = u"template_context_variables"_s;
const QString kConfigurationsKey = u"workflow_configurations"_s;

QString readId(const QJsonValue& v)
{
    if (v.isString())
        return v.toString();
    if (v.isDouble())
        return QString::number(v.toInteger());
    return {};
}

} // namespace

QJsonObject defaultWorkflowConfigurations()
{
    QJsonObject vad;
    vad.insert(u"confidence"_s, 0.7);
    vad.insert(u"start_seconds"_s, 0.4);
    vad.insert(u"stop_seconds"_s, 0.8);
    vad.insert(u"minimum_volume"_s, 0.6);

    QJsonObject ambient;
    ambient.insert(u"enabled"_s, false);
    ambient.insert(u"volume"_s, 0.3);

    QJsonObject obj;
    obj.insert(u"vad_configuration"_s, vad);
    obj.insert(u"ambient_noise_configuration"_s, ambient);
    obj.insert(u"max_call_duration"_s, 600);
    obj.insert(u"max_user_idle_timeout"_s, 10);
    return obj;
}

Utils::Result parseWorkflowRecord(const QJsonObject& json, Api::WorkflowRecord& out)
{
    Utils::Result result;
    out = Api::WorkflowRecord{};

    out.id = readId(json.value(kIdKey));
    out.name = json.value(kNameKey).toString();

    const QJsonValue definition = json.value(kDefinitionKey);
    if (definition.isObject())
        out.definition = definition.toObject();
    else if (!definition.isNull() && !definition.isUndefined())
        result.addError(QStringLiteral("%1 must be an object or null.").arg(kDefinitionKey));

    const QJsonValue vars = json.value(kTemplateVarsKey);
    if (vars.isObject()) {
        const QJsonObject obj = vars.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (!it.value().isString()) {
                result.addError(QStringLiteral("%1.%2 must be a string.").arg(kTemplateVarsKey, it.key()));
                continue;
            }
            out.templateVars.insert(it.key(), it.value().toString());
        }
    } else if (!vars.isNull() && !vars.isUndefined()) {
        result.addError(QStringLiteral("%1 must be an object or null.").arg(kTemplateVarsKey));
    }

    const QJsonValue configurations = json.value(kConfigurationsKey);
    if (configurations.isObject()) {
        out.configurations = configurations.toObject();
    } else {
        if (!configurations.isNull() && !configurations.isUndefined())
            result.addError(QStringLiteral("%1 must be an object or null.").arg(kConfigurationsKey));
        out.configurations = defaultWorkflowConfigurations();
    }

    return result;
}

QJsonObject serializeWorkflowUpdate(const Api::WorkflowUpdate& update)
{
    QJsonObject obj;
    if (update.name)
        obj.insert(kNameKey, *update.name);
    obj.insert(kDefinitionKey, update.definition ? QJsonValue(*update.definition) : QJsonValue(QJsonValue::Null));

    if (update.templateVars) {
        QJsonObject vars;
        for (auto it = update.templateVars->cbegin(); it != update.templateVars->cend(); ++it)
            vars.insert(it.key(), it.value());
        obj.insert(kTemplateVarsKey, vars);
    }
    if (update.configurations)
        obj.insert(kConfigurationsKey, *update.configurations);
    return obj;
}

QJsonObject exportWorkflowDocument(const QString& name, const FlowModel::FlowGraph& graph)
{
    QJsonObject obj;
    obj.insert(kNameKey, name);
    obj.insert(kDefinitionKey, FlowModel::serializeFlowGraph(graph));
    return obj;
}

Utils::Result parseWorkflowDocument(const QJsonObject& json, QString& name, FlowModel::FlowGraph& out)
{
    name.clear();
    out = FlowModel::FlowGraph{};

    QJsonObject definition;
    if (json.contains(kDefinitionKey)) {
        const QJsonValue v = json.value(kDefinitionKey);
        if (!v.isObject())
            return Utils::Result::failure(QStringLiteral("%1 must be an object.").arg(kDefinitionKey));
        definition = v.toObject();
        name = json.value(kNameKey).toString();
    } else {
        definition = json;
    }

    QStringList missing;
    if (!definition.value(u"nodes"_s).isArray())
        missing.push_back(u"nodes"_s);
    if (!definition.value(u"edges"_s).isArray())
        missing.push_back(u"edges"_s);
    if (!definition.value(u"viewport"_s).isObject())
        missing.push_back(u"viewport"_s);
    if (!missing.isEmpty()) {
        return Utils::Result::failure(
            QStringLiteral("Workflow definition is missing: %1.").arg(missing.join(u", "_s)));
    }

    return FlowModel::parseFlowGraph(definition, out);
}

} // namespace Session
