// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/FlowGraphJson.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QSet>

namespace FlowModel {

namespace {

using namespace Qt::StringLiterals;

QJsonObject pointObject(const QPointF& point)
{
    QJsonObject obj;
    obj.insert(u"x"_s, point.x());
    obj.insert(u"y"_s, point.y());
    return obj;
}

void writeConversation(const ConversationFields& c, QJsonObject& data)
{
    data.insert(u"name"_s, c.name);
    data.insert(u"prompt"_s, c.prompt);
    data.insert(u"is_static"_s, c.isStatic);
    data.insert(u"allow_interrupt"_s, c.allowInterrupt);
    data.insert(u"add_global_prompt"_s, c.addGlobalPrompt);
    data.insert(u"extraction_enabled"_s, c.extraction.enabled);
    if (!c.extraction.prompt.isEmpty())
        data.insert(u"extraction_prompt"_s, c.extraction.prompt);

    if (!c.extraction.variables.isEmpty()) {
        QJsonArray vars;
        for (const auto& v : c.extraction.variables) {
            QJsonObject var;
            var.insert(u"name"_s, v.name);
            var.insert(u"type"_s, variableTypeToString(v.type));
            if (!v.prompt.isEmpty())
                var.insert(u"prompt"_s, v.prompt);
            vars.append(var);
        }
        data.insert(u"extraction_variables"_s, vars);
    }
}

// Optional fields keep their default when absent; a present value of the
// wrong type is an error.
void readBool(const QJsonObject& obj, const QString& key, bool& field, const QString& where, QStringList& errors)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return;
    if (!v.isBool()) {
        errors.push_back(QStringLiteral("%1.%2 must be a boolean.").arg(where, key));
        return;
    }
    field = v.toBool();
}

void readString(const QJsonObject& obj, const QString& key, QString& field, const QString& where, QStringList& errors)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return;
    if (!v.isString()) {
        errors.push_back(QStringLiteral("%1.%2 must be a string.").arg(where, key));
        return;
    }
    field = v.toString();
}

void readOptionalNumber(const QJsonObject& obj,
                        const QString& key,
                        std::optional<double>& field,
                        const QString& where,
                        QStringList& errors)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return;
    if (!v.isDouble()) {
        errors.push_back(QStringLiteral("%1.%2 must be a number.").arg(where, key));
        return;
    }
    field = v.toDouble();
}

void readConversation(const QJsonObject& data, ConversationFields& c, QStringList& errors)
{
    const QString where = u"data"_s;
    readString(data, u"name"_s, c.name, where, errors);
    readString(data, u"prompt"_s, c.prompt, where, errors);
    readBool(data, u"is_static"_s, c.isStatic, where, errors);
    readBool(data, u"allow_interrupt"_s, c.allowInterrupt, where, errors);
    readBool(data, u"add_global_prompt"_s, c.addGlobalPrompt, where, errors);
    readBool(data, u"extraction_enabled"_s, c.extraction.enabled, where, errors);
    readString(data, u"extraction_prompt"_s, c.extraction.prompt, where, errors);

    const QJsonValue varsValue = data.value(u"extraction_variables"_s);
    if (varsValue.isUndefined() || varsValue.isNull())
        return;
    if (!varsValue.isArray()) {
        errors.push_back(QStringLiteral("data.extraction_variables must be an array."));
        return;
    }

    const QJsonArray vars = varsValue.toArray();
    for (qsizetype i = 0; i < vars.size(); ++i) {
        const QJsonObject var = vars.at(i).toObject();
        ExtractionVariable out;
        out.name = var.value(u"name"_s).toString();
        out.prompt = var.value(u"prompt"_s).toString();
        if (!variableTypeFromString(var.value(u"type"_s).toString(), out.type)) {
            errors.push_back(QStringLiteral("data.extraction_variables[%1].type invalid.").arg(i));
            continue;
        }
        c.extraction.variables.push_back(std::move(out));
    }
}

} // namespace

QJsonObject serializeNodePayload(const NodePayload& payload)
{
    QJsonObject data;
    std::visit(Internal::Overloaded{
                   [&data](const StartNodeData& d) {
                       writeConversation(d.conversation, data);
                       data.insert(u"is_start"_s, true);
                       data.insert(u"wait_for_user_greeting"_s, d.waitForUserGreeting);
                       data.insert(u"detect_voicemail"_s, d.detectVoicemail);
                       data.insert(u"delayed_start"_s, d.delayedStart);
                       if (d.delayedStartDuration)
                           data.insert(u"delayed_start_duration"_s, *d.delayedStartDuration);
                   },
                   [&data](const AgentNodeData& d) {
                       writeConversation(d.conversation, data);
                       data.insert(u"wait_for_user_response"_s, d.waitForUserResponse);
                       if (d.waitForUserResponseTimeout)
                           data.insert(u"wait_for_user_response_timeout"_s, *d.waitForUserResponseTimeout);
                   },
                   [&data](const EndNodeData& d) {
                       writeConversation(d.conversation, data);
                       data.insert(u"is_end"_s, true);
                   },
                   [&data](const GlobalNodeData& d) {
                       data.insert(u"name"_s, d.name);
                       data.insert(u"prompt"_s, d.prompt);
                   },
                   [&data](const TriggerNodeData& d) {
                       data.insert(u"name"_s, d.name);
                       data.insert(u"trigger_path"_s, d.triggerPath);
                   },
                   [&data](const WebhookNodeData& d) {
                       data.insert(u"name"_s, d.name);
                       data.insert(u"enabled"_s, d.enabled);
                       data.insert(u"http_method"_s, httpMethodToString(d.method));
                       data.insert(u"endpoint_url"_s, d.endpointUrl);
                       if (!d.credentialUuid.isEmpty())
                           data.insert(u"credential_uuid"_s, d.credentialUuid);
                       QJsonArray headers;
                       for (const auto& h : d.customHeaders) {
                           QJsonObject header;
                           header.insert(u"key"_s, h.key);
                           header.insert(u"value"_s, h.value);
                           headers.append(header);
                       }
                       data.insert(u"custom_headers"_s, headers);
                       data.insert(u"payload_template"_s, d.payloadTemplate);
                   },
               },
               payload);
    return data;
}

Utils::Result parseNodePayload(NodeKind kind, const QJsonObject& json, NodePayload& out)
{
    QStringList errors;
    const QString where = u"data"_s;

    switch (kind) {
        case NodeKind::Start: {
            StartNodeData d = makeStartNodeData();
            readConversation(json, d.conversation, errors);
            readBool(json, u"wait_for_user_greeting"_s, d.waitForUserGreeting, where, errors);
            readBool(json, u"detect_voicemail"_s, d.detectVoicemail, where, errors);
            readBool(json, u"delayed_start"_s, d.delayedStart, where, errors);
            readOptionalNumber(json, u"delayed_start_duration"_s, d.delayedStartDuration, where, errors);
            out = std::move(d);
            break;
        }
        case NodeKind::Agent: {
            AgentNodeData d = makeAgentNodeData();
            readConversation(json, d.conversation, errors);
            readBool(json, u"wait_for_user_response"_s, d.waitForUserResponse, where, errors);
            readOptionalNumber(json, u"wait_for_user_response_timeout"_s, d.waitForUserResponseTimeout, where, errors);
            out = std::move(d);
            break;
        }
        case NodeKind::End: {
            EndNodeData d = makeEndNodeData();
            readConversation(json, d.conversation, errors);
            out = std::move(d);
            break;
        }
        case NodeKind::Global: {
            GlobalNodeData d = makeGlobalNodeData();
            readString(json, u"name"_s, d.name, where, errors);
            readString(json, u"prompt"_s, d.prompt, where, errors);
            out = std::move(d);
            break;
        }
        case NodeKind::Trigger: {
            TriggerNodeData d = makeTriggerNodeData();
            readString(json, u"name"_s, d.name, where, errors);
            readString(json, u"trigger_path"_s, d.triggerPath, where, errors);
            out = std::move(d);
            break;
        }
        case NodeKind::Webhook: {
            WebhookNodeData d = makeWebhookNodeData();
            readString(json, u"name"_s, d.name, where, errors);
            readBool(json, u"enabled"_s, d.enabled, where, errors);
            readString(json, u"endpoint_url"_s, d.endpointUrl, where, errors);
            readString(json, u"credential_uuid"_s, d.credentialUuid, where, errors);

            const QJsonValue method = json.value(u"http_method"_s);
            if (!method.isUndefined() && !httpMethodFromString(method.toString(), d.method))
                errors.push_back(QStringLiteral("data.http_method invalid: '%1'.").arg(method.toString()));

            const QJsonArray headers = json.value(u"custom_headers"_s).toArray();
            for (const QJsonValue& hv : headers) {
                const QJsonObject h = hv.toObject();
                d.customHeaders.push_back(HttpHeader{h.value(u"key"_s).toString(), h.value(u"value"_s).toString()});
            }

            const QJsonValue tmpl = json.value(u"payload_template"_s);
            if (tmpl.isObject())
                d.payloadTemplate = tmpl.toObject();
            else if (!tmpl.isUndefined() && !tmpl.isNull())
                errors.push_back(QStringLiteral("data.payload_template must be an object."));

            out = std::move(d);
            break;
        }
        default:
            return Utils::Result::failure(QStringLiteral("Unknown node kind %1.").arg(static_cast<int>(kind)));
    }

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

QJsonObject serializeFlowGraph(const FlowGraph& graph)
{
    QJsonObject root;

    QJsonArray nodes;
    for (const NodeId& nid : graph.nodeIds()) {
        const Node* n = graph.tryNode(nid);
        if (!n)
            continue;
        QJsonObject obj;
        obj.insert(u"id"_s, n->id.toString());
        obj.insert(u"type"_s, nodeKindToString(n->kind()));
        obj.insert(u"position"_s, pointObject(n->position));
        obj.insert(u"data"_s, serializeNodePayload(n->payload));
        nodes.append(obj);
    }
    root.insert(u"nodes"_s, nodes);

    QJsonArray edges;
    for (const EdgeId& eid : graph.edgeIds()) {
        const Edge* e = graph.tryEdge(eid);
        if (!e)
            continue;
        QJsonObject obj;
        obj.insert(u"id"_s, e->id.toString());
        obj.insert(u"source"_s, e->source.toString());
        obj.insert(u"target"_s, e->target.toString());
        QJsonObject data;
        data.insert(u"label"_s, e->data.label);
        data.insert(u"condition"_s, e->data.condition);
        obj.insert(u"data"_s, data);
        edges.append(obj);
    }
    root.insert(u"edges"_s, edges);

    QJsonObject viewport;
    viewport.insert(u"x"_s, graph.viewport().x);
    viewport.insert(u"y"_s, graph.viewport().y);
    viewport.insert(u"zoom"_s, graph.viewport().zoom);
    root.insert(u"viewport"_s, viewport);

    return root;
}

Utils::Result parseFlowGraph(const QJsonObject& json, FlowGraph& out)
{
    out = FlowGraph{};
    QStringList errors;
    FlowGraph::Builder b;

    const QJsonValue nodesValue = json.value(u"nodes"_s);
    if (!nodesValue.isUndefined() && !nodesValue.isArray())
        errors.push_back(QStringLiteral("nodes must be an array."));

    const QJsonArray nodes = nodesValue.toArray();
    for (qsizetype i = 0; i < nodes.size(); ++i) {
        const QJsonObject obj = nodes.at(i).toObject();
        const QString id = obj.value(u"id"_s).toString();
        if (id.trimmed().isEmpty()) {
            errors.push_back(QStringLiteral("nodes[%1] missing id.").arg(i));
            continue;
        }

        // The API treats an absent type as an agent node.
        NodeKind kind = NodeKind::Agent;
        const QJsonValue typeValue = obj.value(u"type"_s);
        if (!typeValue.isUndefined() && !nodeKindFromString(typeValue.toString(), kind)) {
            errors.push_back(QStringLiteral("nodes[%1] has unknown type '%2'.").arg(i).arg(typeValue.toString()));
            continue;
        }

        Node node;
        node.id = NodeId(id);

        const QJsonObject pos = obj.value(u"position"_s).toObject();
        if (!pos.value(u"x"_s).isDouble() || !pos.value(u"y"_s).isDouble())
            errors.push_back(QStringLiteral("nodes[%1].position must have numeric x/y.").arg(i));
        node.position = QPointF(pos.value(u"x"_s).toDouble(), pos.value(u"y"_s).toDouble());

        const Utils::Result payloadResult = parseNodePayload(kind, obj.value(u"data"_s).toObject(), node.payload);
        for (const QString& e : payloadResult.errors)
            errors.push_back(QStringLiteral("nodes[%1].%2").arg(i).arg(e));

        if (b.tryNode(node.id)) {
            errors.push_back(QStringLiteral("nodes[%1] duplicates id '%2'.").arg(i).arg(id));
            continue;
        }
        b.insertNode(std::move(node));
    }

    const QJsonValue edgesValue = json.value(u"edges"_s);
    if (!edgesValue.isUndefined() && !edgesValue.isArray())
        errors.push_back(QStringLiteral("edges must be an array."));

    const QJsonArray edges = edgesValue.toArray();
    for (qsizetype i = 0; i < edges.size(); ++i) {
        const QJsonObject obj = edges.at(i).toObject();

        Edge edge;
        edge.source = NodeId(obj.value(u"source"_s).toString());
        edge.target = NodeId(obj.value(u"target"_s).toString());
        if (edge.source.isNull() || edge.target.isNull()) {
            errors.push_back(QStringLiteral("edges[%1] missing source/target.").arg(i));
            continue;
        }
        if (!b.tryNode(edge.source) || !b.tryNode(edge.target)) {
            errors.push_back(QStringLiteral("edges[%1] references unknown node (%2 -> %3).")
                                 .arg(i)
                                 .arg(edge.source.toString(), edge.target.toString()));
            continue;
        }

        const QString id = obj.value(u"id"_s).toString();
        edge.id = id.trimmed().isEmpty() || b.tryEdge(EdgeId(id)) ? b.uniqueEdgeId(edge.source, edge.target)
                                                                 : EdgeId(id);

        const QJsonObject data = obj.value(u"data"_s).toObject();
        edge.data.label = data.value(u"label"_s).toString();
        edge.data.condition = data.value(u"condition"_s).toString();

        b.insertEdge(std::move(edge));
    }

    const QJsonObject viewport = json.value(u"viewport"_s).toObject();
    if (!viewport.isEmpty()) {
        Viewport vp;
        vp.x = viewport.value(u"x"_s).toDouble(0.0);
        vp.y = viewport.value(u"y"_s).toDouble(0.0);
        vp.zoom = viewport.value(u"zoom"_s).toDouble(1.0);
        if (vp.zoom <= 0.0) {
            errors.push_back(QStringLiteral("viewport.zoom must be positive."));
            vp.zoom = 1.0;
        }
        b.setViewport(vp);
    }

    out = b.freeze();

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

} // namespace FlowModel
