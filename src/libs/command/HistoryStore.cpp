// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "command/HistoryStore.hpp"

#include <QtCore/QMetaType>

#include <algorithm>

Q_LOGGING_CATEGORY(commandlog, "callflow.command")

namespace Command {

HistoryStore::HistoryStore(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<Command::CommandResult>("Command::CommandResult");
    qRegisterMetaType<FlowModel::FlowGraph>("FlowModel::FlowGraph");

    m_entries.push_back(HistoryEntry{FlowModel::FlowGraph{}, ChangeClass::Structural, true, QStringLiteral("Initial")});
}

void HistoryStore::reset(FlowModel::FlowGraph graph)
{
    const auto beforeCanUndo = canUndo();
    const auto beforeCanRedo = canRedo();

    m_entries.clear();
    m_entries.push_back(HistoryEntry{std::move(graph), ChangeClass::Structural, true, QStringLiteral("Initial")});
    m_present = 0;
    ++m_revision;

    setDirty(false);
    emit graphChanged(this->graph());
    emitUndoRedoIfChanged(beforeCanUndo, beforeCanRedo);
}

CommandResult HistoryStore::apply(const FlowCommand& command, ChangeClass changeClass)
{
    const auto beforeCanUndo = canUndo();
    const auto beforeCanRedo = canRedo();

    const CommandResult r = command.apply(graph());

    emit commandApplied(command.name(), r);

    if (!r.ok()) {
        qCWarning(commandlog).noquote() << command.name() << "rejected:" << r.error().toString();
        return r;
    }
    if (!r.changed())
        return r;

    // Standard linear history: the redo branch is gone once something new lands.
    m_entries.resize(m_present + 1);

    HistoryEntry& top = m_entries[m_present];
    const bool coalesce = changeClass == ChangeClass::Cosmetic
                          && top.changeClass == ChangeClass::Cosmetic
                          && !top.sealed;

    if (coalesce) {
        top.graph = r.graph();
    } else {
        m_entries.push_back(HistoryEntry{r.graph(), changeClass, false, command.name()});
        m_present = m_entries.size() - 1;
        trimToLimit();
    }

    ++m_revision;
    setDirty(true);

    qCDebug(commandlog).noquote() << "applied" << command.name()
                                  << (coalesce ? "(coalesced)" : "") << "entries:" << m_entries.size();

    emit graphChanged(graph());
    emitUndoRedoIfChanged(beforeCanUndo, beforeCanRedo);
    return r;
}

CommandResult HistoryStore::applyTransient(const FlowCommand& command)
{
    const CommandResult r = command.apply(graph());
    if (!r.ok()) {
        qCWarning(commandlog).noquote() << command.name() << "rejected:" << r.error().toString();
        return r;
    }
    if (r.changed())
        replacePresent(r.graph());
    return r;
}

void HistoryStore::replacePresent(FlowModel::FlowGraph graph)
{
    m_entries[m_present].graph = std::move(graph);
    emit graphChanged(this->graph());
}

void HistoryStore::seal()
{
    m_entries[m_present].sealed = true;
}

CommandResult HistoryStore::undo()
{
    if (!canUndo())
        return CommandResult::failure(CommandError(CommandErrorCode::InvalidArgument, "Undo: nothing to undo."));

    const auto beforeCanUndo = canUndo();
    const auto beforeCanRedo = canRedo();

    --m_present;
    m_entries[m_present].sealed = true;
    ++m_revision;
    setDirty(true);

    emit graphChanged(graph());
    emitUndoRedoIfChanged(beforeCanUndo, beforeCanRedo);

    return CommandResult::success(graph());
}

CommandResult HistoryStore::redo()
{
    if (!canRedo())
        return CommandResult::failure(CommandError(CommandErrorCode::InvalidArgument, "Redo: nothing to redo."));

    const auto beforeCanUndo = canUndo();
    const auto beforeCanRedo = canRedo();

    ++m_present;
    m_entries[m_present].sealed = true;
    ++m_revision;
    setDirty(true);

    emit graphChanged(graph());
    emitUndoRedoIfChanged(beforeCanUndo, beforeCanRedo);

    return CommandResult::success(graph());
}

void HistoryStore::setLimit(int limit)
{
    // Present entry plus at least one step back.
    m_limit = std::max(limit, 2);

    const auto beforeCanUndo = canUndo();
    const auto beforeCanRedo = canRedo();
    trimToLimit();
    emitUndoRedoIfChanged(beforeCanUndo, beforeCanRedo);
}

void HistoryStore::markClean()
{
    setDirty(false);
}

void HistoryStore::markDirty()
{
    setDirty(true);
}

void HistoryStore::setDirty(bool dirty)
{
    if (m_dirty == dirty)
        return;
    m_dirty = dirty;
    emit dirtyChanged(m_dirty);
}

void HistoryStore::trimToLimit()
{
    const qsizetype excess = m_entries.size() - m_limit;
    if (excess <= 0)
        return;

    // Drop the oldest past entries; the present and the redo branch stay.
    const qsizetype drop = std::min(excess, m_present);
    if (drop <= 0)
        return;
    m_entries.remove(0, drop);
    m_present -= drop;
}

void HistoryStore::emitUndoRedoIfChanged(bool beforeCanUndo, bool beforeCanRedo)
{
    if (beforeCanUndo != canUndo() || beforeCanRedo != canRedo())
        emit undoRedoStateChanged(canUndo(), canRedo());
}

} // namespace Command
