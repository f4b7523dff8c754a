// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// Reads a file whose top-level value must be a JSON object.
UTILS_EXPORT Result readObject(const QString& path, QJsonObject& out);

// Parses an in-memory buffer with the same rules as readObject().
UTILS_EXPORT Result parseObject(const QByteArray& bytes, QJsonObject& out, const QString& origin = {});

} // namespace Utils::JsonFileUtils
