// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"

#include <layout/LayoutOptions.hpp>
#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Session {

inline constexpr int kDefaultValidationDebounceMs = 100;
inline constexpr int kDefaultHistoryLimit = 50;

struct EditorSettings final {
    int validationDebounceMs = kDefaultValidationDebounceMs;
    int historyLimit = kDefaultHistoryLimit;
    Layout::LayoutOptions layout;

    bool operator==(const EditorSettings&) const = default;
};

// Missing keys keep the fallback's value; malformed ones are reported and skipped.
SESSION_EXPORT Utils::Result parseEditorSettings(const QJsonObject& obj,
                                                 const EditorSettings& fallback,
                                                 EditorSettings& out);

SESSION_EXPORT QJsonObject editorSettingsToJson(const EditorSettings& settings);

// Defaults when the file does not exist. Any other read problem is reported,
// and `out` still holds whatever could be read.
SESSION_EXPORT Utils::Result loadEditorSettings(const QString& path, EditorSettings& out);

} // namespace Session
