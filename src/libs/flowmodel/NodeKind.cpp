// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "flowmodel/NodeKind.hpp"

namespace FlowModel {

using namespace Qt::StringLiterals;

QString nodeKindToString(NodeKind kind)
{
    switch (kind) {
        case NodeKind::Start: return u"startCall"_s;
        case NodeKind::Agent: return u"agentNode"_s;
        case NodeKind::End: return u"endCall"_s;
        case NodeKind::Global: return u"globalNode"_s;
        case NodeKind::Trigger: return u"trigger"_s;
        case NodeKind::Webhook: return u"webhook"_s;
    }
    return {};
}

bool nodeKindFromString(const QString& text, NodeKind& out)
{
    const QString key = text.trimmed();
    if (key == u"startCall"_s) {
        out = NodeKind::Start;
        return true;
    }
    if (key == u"agentNode"_s) {
        out = NodeKind::Agent;
        return true;
    }
    if (key == u"endCall"_s) {
        out = NodeKind::End;
        return true;
    }
    if (key == u"globalNode"_s) {
        out = NodeKind::Global;
        return true;
    }
    if (key == u"trigger"_s) {
        out = NodeKind::Trigger;
        return true;
    }
    if (key == u"webhook"_s) {
        out = NodeKind::Webhook;
        return true;
    }
    return false;
}

bool isKnownKind(NodeKind kind) noexcept
{
    return static_cast<int>(kind) < kNodeKindCount;
}

bool isTerminalKind(NodeKind kind) noexcept
{
    return kind == NodeKind::Start || kind == NodeKind::End || kind == NodeKind::Global;
}

} // namespace FlowModel
