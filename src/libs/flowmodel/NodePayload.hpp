// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "flowmodel/FlowModelGlobal.hpp"
#include "flowmodel/NodeKind.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>
#include <variant>

namespace FlowModel {

namespace Internal {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace Internal

enum class VariableType : quint8 {
	String,
	Number,
	Boolean
};

struct ExtractionVariable final {
    QString name;
    VariableType type = VariableType::String;
    QString prompt;

    bool operator==(const ExtractionVariable&) const = default;
};

struct ExtractionConfig final {
    bool enabled = false;
    QString prompt;
    QVector<ExtractionVariable> variables;

    bool operator==(const ExtractionConfig&) const = default;
};

// Fields shared by every node that speaks to the caller.
struct ConversationFields final {
    QString name;
    QString prompt;
    bool isStatic = false;
    bool allowInterrupt = false;
    bool addGlobalPrompt = true;
    ExtractionConfig extraction;

    bool operator==(const ConversationFields&) const = default;
};

struct StartNodeData final {
    ConversationFields conversation;
    bool waitForUserGreeting = false;
    bool detectVoicemail = true;
    bool delayedStart = false;
    std::optional<double> delayedStartDuration;

    bool operator==(const StartNodeData&) const = default;
};

struct AgentNodeData final {
    ConversationFields conversation;
    bool waitForUserResponse = false;
    std::optional<double> waitForUserResponseTimeout;

    bool operator==(const AgentNodeData&) const = default;
};

struct EndNodeData final {
    ConversationFields conversation;

    bool operator==(const EndNodeData&) const = default;
};

struct GlobalNodeData final {
    QString name;
    QString prompt;

    bool operator==(const GlobalNodeData&) const = default;
};

struct TriggerNodeData final {
    QString name;
    QString triggerPath;

    bool operator==(const TriggerNodeData&) const = default;
};

enum class HttpMethod : quint8 {
	Get,
	Post,
	Put,
	Patch,
	Delete
};

struct HttpHeader final {
    QString key;
    QString value;

    bool operator==(const HttpHeader&) const = default;
};

struct WebhookNodeData final {
    QString name;
    bool enabled = true;
    HttpMethod method = HttpMethod::Post;
    QString endpointUrl;
    QString credentialUuid;
    QVector<HttpHeader> customHeaders;
    QJsonObject payloadTemplate;

    bool operator==(const WebhookNodeData&) const = default;
};

// Alternative order must track NodeKind.
using NodePayload = std::variant<StartNodeData,
                                 AgentNodeData,
                                 EndNodeData,
                                 GlobalNodeData,
                                 TriggerNodeData,
                                 WebhookNodeData>;

static_assert(std::variant_size_v<NodePayload> == kNodeKindCount);

FLOWMODEL_EXPORT NodeKind kindOf(const NodePayload& payload) noexcept;

FLOWMODEL_EXPORT StartNodeData makeStartNodeData();
FLOWMODEL_EXPORT AgentNodeData makeAgentNodeData();
FLOWMODEL_EXPORT EndNodeData makeEndNodeData();
FLOWMODEL_EXPORT GlobalNodeData makeGlobalNodeData();
FLOWMODEL_EXPORT TriggerNodeData makeTriggerNodeData();
FLOWMODEL_EXPORT WebhookNodeData makeWebhookNodeData();

// Default payload for a kind; std::nullopt for a value outside the enum.
FLOWMODEL_EXPORT std::optional<NodePayload> defaultPayload(NodeKind kind);

FLOWMODEL_EXPORT QString payloadName(const NodePayload& payload);

FLOWMODEL_EXPORT QString httpMethodToString(HttpMethod method);
FLOWMODEL_EXPORT bool httpMethodFromString(const QString& text, HttpMethod& out);

FLOWMODEL_EXPORT QString variableTypeToString(VariableType type);
FLOWMODEL_EXPORT bool variableTypeFromString(const QString& text, VariableType& out);

} // namespace FlowModel
