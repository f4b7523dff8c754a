// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "validation/ValidationJson.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>

namespace Validation {

namespace {

using namespace Qt::StringLiterals;

std::optional<QString> optionalString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isString() || v.toString().isEmpty())
        return std::nullopt;
    return v.toString();
}

} // namespace

QJsonObject serializeValidationError(const ValidationError& error)
{
    QJsonObject obj;
    obj.insert(u"kind"_s, errorKindToString(error.kind));
    obj.insert(u"id"_s, error.id ? QJsonValue(*error.id) : QJsonValue(QJsonValue::Null));
    obj.insert(u"field"_s, error.field ? QJsonValue(*error.field) : QJsonValue(QJsonValue::Null));
    obj.insert(u"message"_s, error.message);
    return obj;
}

Utils::Result parseValidationReport(const QJsonObject& json, ValidationReport& out)
{
    out = ValidationReport{};
    QStringList errors;

    QJsonValue errorsValue = json.value(u"errors"_s);
    const QJsonValue detail = json.value(u"detail"_s);
    if (errorsValue.isUndefined() && detail.isObject())
        errorsValue = detail.toObject().value(u"errors"_s);

    if (errorsValue.isUndefined() && detail.isString()) {
        // Plain-text failure from the API; surface it as a workflow error.
        out.isValid = false;
        out.errors.push_back(ValidationError{ErrorKind::Workflow, std::nullopt, std::nullopt, detail.toString()});
        return Utils::Result::success();
    }

    if (!errorsValue.isUndefined() && !errorsValue.isNull() && !errorsValue.isArray())
        errors.push_back(QStringLiteral("errors must be an array."));

    const QJsonArray list = errorsValue.toArray();
    for (qsizetype i = 0; i < list.size(); ++i) {
        if (!list.at(i).isObject()) {
            errors.push_back(QStringLiteral("errors[%1] must be an object.").arg(i));
            continue;
        }
        const QJsonObject obj = list.at(i).toObject();

        ValidationError e;
        const QString kindStr = obj.value(u"kind"_s).toString();
        if (!errorKindFromString(kindStr, e.kind)) {
            errors.push_back(QStringLiteral("errors[%1] has unknown kind '%2'.").arg(i).arg(kindStr));
            continue;
        }
        e.id = optionalString(obj, u"id"_s);
        e.field = optionalString(obj, u"field"_s);
        e.message = obj.value(u"message"_s).toString();
        out.errors.push_back(std::move(e));
    }

    const QJsonValue validValue = json.value(u"is_valid"_s);
    if (validValue.isBool())
        out.isValid = validValue.toBool();
    else
        out.isValid = out.errors.isEmpty();

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

} // namespace Validation
