// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/EditorSettings.hpp"
#include "session/FlowChanges.hpp"
#include "session/api/IWorkflowApi.hpp"
#include "session/api/WorkflowApiTypes.hpp"

#include <command/HistoryStore.hpp>
#include <flowmodel/NodeIdAllocator.hpp>
#include <layout/LayoutOptions.hpp>
#include <utils/Result.hpp>
#include <utils/async/DebouncedInvoker.hpp>
#include <validation/ValidationError.hpp>
#include <validation/ValidationGate.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QPair>
#include <QtCore/QPointer>
#include <QtCore/QVector>

#include <functional>
#include <optional>

namespace Session {

// One open workflow in the editor. Owns the history store and turns surface
// events into commands; schedules validation after structural edits and after
// every save.
class SESSION_EXPORT WorkflowEditSession final : public QObject
{
    Q_OBJECT

public:
    explicit WorkflowEditSession(Api::IWorkflowApi* api,
                                 EditorSettings settings = {},
                                 QObject* parent = nullptr);
    ~WorkflowEditSession() override;

    // Fetches the workflow and opens it; reports through loaded().
    void load(const QString& workflowId);
    void open(const Api::WorkflowRecord& record);
    // Drops pending validation and every outstanding callback.
    void close();

    const QString& workflowId() const noexcept { return m_workflowId; }
    const QString& workflowName() const noexcept { return m_workflowName; }
    const Api::TemplateVariables& templateVariables() const noexcept { return m_templateVars; }
    const QJsonObject& configurations() const noexcept { return m_configurations; }
    const EditorSettings& settings() const noexcept { return m_settings; }

    const FlowModel::FlowGraph& graph() const noexcept { return m_history.graph(); }
    Command::HistoryStore& history() noexcept { return m_history; }
    const Command::HistoryStore& history() const noexcept { return m_history; }

    // Last accepted validation report, and the part of it not attached to a
    // node or edge.
    const Validation::ValidationErrors& validationErrors() const noexcept { return m_errors; }
    const Validation::ValidationErrors& workflowErrors() const noexcept { return m_workflowErrors; }

    bool isDirty() const noexcept { return m_history.isDirty(); }
    bool isSaving() const noexcept { return m_saveInFlight; }
    bool isValidationPending() const noexcept;

    // Surface events
    Command::CommandResult onNodesChange(const QVector<NodeChange>& changes);
    Command::CommandResult onEdgesChange(const QVector<EdgeChange>& changes);
    Command::CommandResult onConnect(const FlowModel::NodeId& source, const FlowModel::NodeId& target);
    void setHoveredEdge(const FlowModel::EdgeId& id);
    void setViewport(const FlowModel::Viewport& viewport);

    // Editor actions
    std::optional<FlowModel::NodeId> addNode(FlowModel::NodeKind kind, const QPointF& position);
    Command::CommandResult deleteNode(const FlowModel::NodeId& id);
    Command::CommandResult updateNodeData(const FlowModel::NodeId& id, FlowModel::NodePayload payload);
    Command::CommandResult updateEdgeData(const FlowModel::EdgeId& id, FlowModel::EdgeData data);
    Utils::Result autoLayout(Layout::Direction direction);

    bool undo();
    bool redo();

    // Starts a save; false when one is already running or no workflow is open.
    // With includeGraph == false only the name is sent.
    bool save(bool includeGraph = true);
    void setWorkflowName(const QString& name);
    bool saveTemplateVariables(const Api::TemplateVariables& variables);
    bool saveConfigurations(const QJsonObject& configurations, const QString& name);

    // Skips the debounce delay.
    void validateNow();

    // A test call needs a saved graph without validation errors.
    bool canStartTestCall() const noexcept;

    QJsonObject exportDocument() const;
    Utils::Result exportToFile(const QString& path) const;

signals:
    void graphChanged(const FlowModel::FlowGraph& graph);
    void dirtyChanged(bool dirty);
    void undoRedoStateChanged(bool canUndo, bool canRedo);
    void loaded(bool ok, const QString& error);
    void saveStarted();
    void saveFinished(bool ok, const QString& error);
    void validationChanged(const Validation::ValidationErrors& workflowErrors);
    void canStartTestCallChanged(bool canStart);

private:
    using SaveApplied = std::function<void()>;

    Command::CommandResult applyRecorded(const Command::FlowCommand& command, Command::ChangeClass changeClass);
    void applySelection(const QVector<QPair<FlowModel::NodeId, bool>>& nodes,
                        const QVector<QPair<FlowModel::EdgeId, bool>>& edges);
    void refreshPresentation();

    bool startSave(Api::WorkflowUpdate update, bool includesGraph, SaveApplied onSuccess);
    void finishSave(const Utils::Result& result, bool includesGraph, quint64 graphRevision,
                    quint64 metaRevision, const SaveApplied& onSuccess);

    void scheduleValidation();
    void runValidation();
    void handleValidation(const Validation::ValidationGate::Ticket& ticket,
                          const Utils::Result& result,
                          const Validation::ValidationReport& report);
    void reprojectValidation();
    void updateTestCallAvailability();

    QPointer<Api::IWorkflowApi> m_api;
    EditorSettings m_settings;

    Command::HistoryStore m_history;
    FlowModel::NodeIdAllocator m_ids;
    FlowModel::EdgeId m_hoveredEdge;

    QString m_workflowId;
    QString m_workflowName;
    Api::TemplateVariables m_templateVars;
    QJsonObject m_configurations;

    // Bumped by open() and close(); callbacks from an older epoch are ignored.
    quint64 m_epoch = 0;

    bool m_saveInFlight = false;
    quint64 m_savedGraphRevision = 0;
    quint64 m_metaRevision = 0;

    Utils::Async::DebouncedInvoker m_validationDebounce;
    Validation::ValidationGate m_validationGate;
    bool m_validationInFlight = false;
    Validation::ValidationErrors m_errors;
    Validation::ValidationErrors m_workflowErrors;

    bool m_canStartTestCall = false;
};

} // namespace Session
