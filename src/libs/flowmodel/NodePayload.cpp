// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/NodePayload.hpp"

#include <QtCore/QUuid>

namespace FlowModel {

using namespace Qt::StringLiterals;

namespace {

const QString kGlobalPrompt =
    u"You are a helpful assistant whose mode of interaction with the user is voice. "
    u"So don't use any special characters which can not be pronounced. "
    u"Use short sentences and simple language."_s;

} // namespace

NodeKind kindOf(const NodePayload& payload) noexcept
{
    return static_cast<NodeKind>(payload.index());
}

StartNodeData makeStartNodeData()
{
    StartNodeData data;
    data.conversation.name = u"Start Call"_s;
    data.conversation.allowInterrupt = false;
    return data;
}

AgentNodeData makeAgentNodeData()
{
    AgentNodeData data;
    data.conversation.allowInterrupt = true;
    return data;
}

EndNodeData makeEndNodeData()
{
    EndNodeData data;
    data.conversation.name = u"End Call"_s;
    data.conversation.allowInterrupt = false;
    return data;
}

GlobalNodeData makeGlobalNodeData()
{
    return GlobalNodeData{u"Global Node"_s, kGlobalPrompt};
}

TriggerNodeData makeTriggerNodeData()
{
    return TriggerNodeData{u"API Trigger"_s, QUuid::createUuid().toString(QUuid::WithoutBraces)};
}

WebhookNodeData makeWebhookNodeData()
{
    WebhookNodeData data;
    data.name = u"Webhook"_s;
    return data;
}

std::optional<NodePayload> defaultPayload(NodeKind kind)
{
    switch (kind) {
        case NodeKind::Start: return NodePayload{makeStartNodeData()};
        case NodeKind::Agent: return NodePayload{makeAgentNodeData()};
        case NodeKind::End: return NodePayload{makeEndNodeData()};
        case NodeKind::Global: return NodePayload{makeGlobalNodeData()};
        case NodeKind::Trigger: return NodePayload{makeTriggerNodeData()};
        case NodeKind::Webhook: return NodePayload{makeWebhookNodeData()};
    }

    qCWarning(flowmodellog).noquote()
        << "defaultPayload: unknown node kind" << static_cast<int>(kind);
    return std::nullopt;
}

QString payloadName(const NodePayload& payload)
{
    return std::visit(Internal::Overloaded{
                          [](const StartNodeData& d) { return d.conversation.name; },
                          [](const AgentNodeData& d) { return d.conversation.name; },
                          [](const EndNodeData& d) { return d.conversation.name; },
                          [](const GlobalNodeData& d) { return d.name; },
                          [](const TriggerNodeData& d) { return d.name; },
                          [](const WebhookNodeData& d) { return d.name; },
                      },
                      payload);
}

QString httpMethodToString(HttpMethod method)
{
    switch (method) {
        case HttpMethod::Get: return u"GET"_s;
        case HttpMethod::Post: return u"POST"_s;
        case HttpMethod::Put: return u"PUT"_s;
        case HttpMethod::Patch: return u"PATCH"_s;
        case HttpMethod::Delete: return u"DELETE"_s;
    }
    return u"POST"_s;
}

bool httpMethodFromString(const QString& text, HttpMethod& out)
{
    const QString key = text.trimmed().toUpper();
    if (key == u"GET"_s) {
        out = HttpMethod::Get;
        return true;
    }
    if (key == u"POST"_s) {
        out = HttpMethod::Post;
        return true;
    }
    if (key == u"PUT"_s) {
        out = HttpMethod::Put;
        return true;
    }
    if (key == u"PATCH"_s) {
        out = HttpMethod::Patch;
        return true;
    }
    if (key == u"DELETE"_s) {
        out = HttpMethod::Delete;
        return true;
    }
    return false;
}

QString variableTypeToString(VariableType type)
{
    switch (type) {
        case VariableType::String: return u"string"_s;
        case VariableType::Number: return u"number"_s;
        case VariableType::Boolean: return u"boolean"_s;
    }
    return u"string"_s;
}

bool variableTypeFromString(const QString& text, VariableType& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"string"_s) {
        out = VariableType::String;
        return true;
    }
    if (key == u"number"_s) {
        out = VariableType::Number;
        return true;
    }
    if (key == u"boolean"_s) {
        out = VariableType::Boolean;
        return true;
    }
    return false;
}

} // namespace FlowModel
