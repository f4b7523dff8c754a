// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>

#include <functional>

namespace Session {

class WorkflowEditSession;

enum class EditorAction : quint8 {
    None,
    Undo,
    Redo,
    Save
};

// Mod+Z undoes, Mod+Shift+Z and Mod+Y redo, Mod+S saves. Mod is Control or Meta.
SESSION_EXPORT EditorAction shortcutFor(int key, Qt::KeyboardModifiers modifiers);

// Routes the editor shortcuts of the watched window to a session. Keys pressed
// while a text input has focus are left alone so the input keeps its own undo.
class SESSION_EXPORT EditorShortcutFilter final : public QObject
{
    Q_OBJECT

public:
    using FocusProbe = std::function<bool()>;

    explicit EditorShortcutFilter(WorkflowEditSession* session, QObject* parent = nullptr);

    void setTextFocusProbe(FocusProbe probe);

    // True when the application's focus object accepts text input.
    static bool textInputHasFocus();

signals:
    void actionTriggered(Session::EditorAction action);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QPointer<WorkflowEditSession> m_session;
    FocusProbe m_textFocus;
};

} // namespace Session
