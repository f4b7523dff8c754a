// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/EditorShortcuts.hpp"

#include "session/WorkflowEditSession.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QEvent>
#include <QtGui/QGuiApplication>
#include <QtGui/QInputMethodQueryEvent>
#include <QtGui/QKeyEvent>

namespace Session {

EditorAction shortcutFor(int key, Qt::KeyboardModifiers modifiers)
{
    const bool mod = modifiers.testFlag(Qt::ControlModifier) || modifiers.testFlag(Qt::MetaModifier);
    if (!mod || modifiers.testFlag(Qt::AltModifier))
        return EditorAction::None;

    const bool shift = modifiers.testFlag(Qt::ShiftModifier);
    switch (key) {
        case Qt::Key_Z:
            return shift ? EditorAction::Redo : EditorAction::Undo;
        case Qt::Key_Y:
            return EditorAction::Redo;
        case Qt::Key_S:
            return shift ? EditorAction::None : EditorAction::Save;
        default:
            return EditorAction::None;
    }
}

EditorShortcutFilter::EditorShortcutFilter(WorkflowEditSession* session, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_textFocus(&EditorShortcutFilter::textInputHasFocus)
{
}

void EditorShortcutFilter::setTextFocusProbe(FocusProbe probe)
{
    m_textFocus = probe ? std::move(probe) : FocusProbe(&EditorShortcutFilter::textInputHasFocus);
}

bool EditorShortcutFilter::textInputHasFocus()
{
    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance()))
        return false;

    QObject* focus = QGuiApplication::focusObject();
    if (!focus)
        return false;

    QInputMethodQueryEvent query(Qt::ImEnabled);
    QCoreApplication::sendEvent(focus, &query);
    return query.value(Qt::ImEnabled).toBool();
}

bool EditorShortcutFilter::eventFilter(QObject* watched, QEvent* event)
{
    if (event->type() != QEvent::KeyPress || !m_session)
        return QObject::eventFilter(watched, event);

    const auto* key = static_cast<QKeyEvent*>(event);
    const EditorAction action = shortcutFor(key->key(), key->modifiers());
    if (action == EditorAction::None || m_textFocus())
        return QObject::eventFilter(watched, event);

    switch (action) {
        case EditorAction::Undo:
            m_session->undo();
            break;
        case EditorAction::Redo:
            m_session->redo();
            break;
        case EditorAction::Save:
            if (!m_session->save(true))
                qCDebug(sessionlog) << "Save shortcut ignored";
            break;
        case EditorAction::None:
            break;
    }

    emit actionTriggered(action);
    return true;
}

} // namespace Session
