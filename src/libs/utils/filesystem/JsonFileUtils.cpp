// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(QStringLiteral("Failed to open file for writing: %1").arg(cleanedPath));

    if (file.write(QJsonDocument(object).toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return Result::failure(QStringLiteral("Failed to commit JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    return Result::success();
}

Result parseObject(const QByteArray& bytes, QJsonObject& out, const QString& origin)
{
    out = QJsonObject{};
    const QString where = origin.isEmpty() ? QStringLiteral("<buffer>") : origin;

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result::failure(QStringLiteral("Failed to parse JSON: %1 (%2 at offset %3)")
                                   .arg(where, parseError.errorString())
                                   .arg(parseError.offset));
    }

    if (!doc.isObject())
        return Result::failure(QStringLiteral("JSON document is not an object: %1").arg(where));

    out = doc.object();
    return Result::success();
}

Result readObject(const QString& path, QJsonObject& out)
{
    out = QJsonObject{};
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON input path is empty."));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result::failure(QStringLiteral("Failed to open JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    return parseObject(file.readAll(), out, cleanedPath);
}

} // namespace Utils::JsonFileUtils
