// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "validation/ValidationGlobal.hpp"
#include "validation/ValidationError.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>

namespace Validation {

struct ValidationReport final {
    bool isValid = true;
    ValidationErrors errors;
};

// Accepts the success body {is_valid, errors} and the error envelope
// {detail: {errors}} the API uses for 4xx responses.
VALIDATION_EXPORT Utils::Result parseValidationReport(const QJsonObject& json, ValidationReport& out);

VALIDATION_EXPORT QJsonObject serializeValidationError(const ValidationError& error);

} // namespace Validation
