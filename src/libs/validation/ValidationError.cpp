// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "validation/ValidationError.hpp"

namespace Validation {

using namespace Qt::StringLiterals;

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Node: return u"node"_s;
        case ErrorKind::Edge: return u"edge"_s;
        case ErrorKind::Workflow: return u"workflow"_s;
    }
    return u"workflow"_s;
}

bool errorKindFromString(const QString& text, ErrorKind& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"node"_s) {
        out = ErrorKind::Node;
        return true;
    }
    if (key == u"edge"_s) {
        out = ErrorKind::Edge;
        return true;
    }
    if (key == u"workflow"_s) {
        out = ErrorKind::Workflow;
        return true;
    }
    return false;
}

} // namespace Validation
