// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/EditorSettings.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QFileInfo>
#include <QtCore/QJsonValue>

namespace Session {

namespace {

using namespace Qt::StringLiterals;

const QString kValidationDebounceKey = u"validationDebounceMs"_s;
const QString kHistoryLimitKey = u"historyLimit"_s;
const QString kLayoutKey = u"layout"_s;

void readInt(const QJsonObject& obj, const QString& key, int minimum, int& value, Utils::Result& result)
{
    if (!obj.contains(key))
        return;
    const QJsonValue v = obj.value(key);
    const int parsed = v.toInt(minimum - 1);
    if (!v.isDouble() || parsed < minimum) {
        result.addError(QStringLiteral("%1 must be an integer >= %2.").arg(key).arg(minimum));
        return;
    }
    value = parsed;
}

} // namespace

Utils::Result parseEditorSettings(const QJsonObject& obj, const EditorSettings& fallback, EditorSettings& out)
{
    Utils::Result result;
    out = fallback;

    readInt(obj, kValidationDebounceKey, 0, out.validationDebounceMs, result);
    readInt(obj, kHistoryLimitKey, 2, out.historyLimit, result);

    if (obj.contains(kLayoutKey)) {
        const QJsonValue layout = obj.value(kLayoutKey);
        if (layout.isObject())
            result.merge(Layout::parseLayoutOptions(layout.toObject(), fallback.layout, out.layout));
        else
            result.addError(QStringLiteral("%1 must be an object.").arg(kLayoutKey));
    }

    return result;
}

QJsonObject editorSettingsToJson(const EditorSettings& settings)
{
    QJsonObject obj;
    obj.insert(kValidationDebounceKey, settings.validationDebounceMs);
    obj.insert(kHistoryLimitKey, settings.historyLimit);
    obj.insert(kLayoutKey, Layout::layoutOptionsToJson(settings.layout));
    return obj;
}

Utils::Result loadEditorSettings(const QString& path, EditorSettings& out)
{
    out = EditorSettings{};
    if (path.isEmpty() || !QFileInfo::exists(path))
        return Utils::Result::success();

    QJsonObject obj;
    const Utils::Result read = Utils::JsonFileUtils::readObject(path, obj);
    if (!read) {
        qCWarning(sessionlog).noquote() << "Editor settings not loaded:" << read.joined();
        return read;
    }

    const Utils::Result parsed = parseEditorSettings(obj, EditorSettings{}, out);
    if (!parsed)
        qCWarning(sessionlog).noquote() << "Editor settings" << path << "partially applied:" << parsed.joined();
    return parsed;
}

} // namespace Session
