// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "command/CommandGlobal.hpp"
#include "command/CommandResult.hpp"
#include "command/FlowCommand.hpp"

#include <flowmodel/FlowGraph.hpp>

#include <QtCore/QObject>
#include <QtCore/QVector>

namespace Command {

struct HistoryEntry final {
    FlowModel::FlowGraph graph;
    ChangeClass changeClass = ChangeClass::Structural;
    // A sealed cosmetic entry no longer absorbs later cosmetic changes.
    bool sealed = false;
    QString label;
};

// Sole owner of the editing session's graph. Linear undo/redo over graph
// snapshots; applying after an undo drops the redo branch.
class COMMAND_EXPORT HistoryStore final : public QObject {
	Q_OBJECT

public:
	static constexpr int kDefaultLimit = 50;

	explicit HistoryStore(QObject* parent = nullptr);

	const FlowModel::FlowGraph& graph() const noexcept { return m_entries.at(m_present).graph; }

	// Starts a fresh history whose only entry is `graph`. Clean afterwards.
	void reset(FlowModel::FlowGraph graph);

	CommandResult apply(const FlowCommand& command, ChangeClass changeClass = ChangeClass::Structural);

	// Applies without recording history or touching the dirty flag.
	CommandResult applyTransient(const FlowCommand& command);
	void replacePresent(FlowModel::FlowGraph graph);

	// Closes the current cosmetic run so the next one becomes its own entry.
	void seal();

	bool canUndo() const noexcept { return m_present > 0; }
	bool canRedo() const noexcept { return m_present + 1 < m_entries.size(); }

	CommandResult undo();
	CommandResult redo();

	qsizetype entryCount() const noexcept { return m_entries.size(); }
	qsizetype presentIndex() const noexcept { return m_present; }
	const HistoryEntry& presentEntry() const noexcept { return m_entries.at(m_present); }

	void setLimit(int limit);
	int limit() const noexcept { return m_limit; }

	bool isDirty() const noexcept { return m_dirty; }
	void markClean();
	void markDirty();

	// Bumped by every recorded change, undo and redo; stable across
	// transient updates. Identifies the graph a request was issued against.
	quint64 revision() const noexcept { return m_revision; }

signals:
	void graphChanged(const FlowModel::FlowGraph& graph);
	void commandApplied(const QString& name, const Command::CommandResult& result);
	void undoRedoStateChanged(bool canUndo, bool canRedo);
	void dirtyChanged(bool dirty);

private:
	void setDirty(bool dirty);
	void trimToLimit();
	void emitUndoRedoIfChanged(bool beforeCanUndo, bool beforeCanRedo);

	QVector<HistoryEntry> m_entries;
	qsizetype m_present{0};
	int m_limit{kDefaultLimit};
	bool m_dirty{false};
	quint64 m_revision{0};
};

} // namespace Command
