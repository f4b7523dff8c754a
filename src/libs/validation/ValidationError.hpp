// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "validation/ValidationGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace Validation {

enum class ErrorKind : quint8 {
    Node,
    Edge,
    Workflow
};

struct ValidationError final {
    ErrorKind kind = ErrorKind::Workflow;
    std::optional<QString> id;
    std::optional<QString> field;
    QString message;

    bool operator==(const ValidationError&) const = default;
};

using ValidationErrors = QVector<ValidationError>;

VALIDATION_EXPORT QString errorKindToString(ErrorKind kind);
VALIDATION_EXPORT bool errorKindFromString(const QString& text, ErrorKind& out);

} // namespace Validation
