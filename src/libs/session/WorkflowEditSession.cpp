// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/WorkflowEditSession.hpp"

#include "session/WorkflowDocumentJson.hpp"

#include <command/BuiltInCommands.hpp>
#include <command/DeleteCommands.hpp>
#include <flowmodel/FlowGraphJson.hpp>
#include <flowmodel/FlowOperations.hpp>
#include <layout/LayeredLayout.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>
#include <validation/ValidationJson.hpp>
#include <validation/ValidationOverlay.hpp>

#include <QtCore/QJsonArray>
#include <QtCore/QSet>

#include <memory>

Q_LOGGING_CATEGORY(sessionlog, "callflow.session")

namespace Session {

namespace {

using Command::ChangeClass;
using Command::CommandResult;
using FlowModel::EdgeId;
using FlowModel::NodeId;

CommandResult rejected(Command::CommandErrorCode code, const QString& message)
{
    return CommandResult::failure(Command::CommandError(code, message));
}

bool definitionHasNodes(const QJsonObject& definition)
{
    return !definition.value(QStringLiteral("nodes")).toArray().isEmpty();
}

} // namespace

WorkflowEditSession::WorkflowEditSession(Api::IWorkflowApi* api, EditorSettings settings, QObject* parent)
    : QObject(parent)
    , m_api(api)
    , m_settings(std::move(settings))
    , m_history(this)
    , m_validationDebounce(this)
{
    m_history.setLimit(m_settings.historyLimit);

    m_validationDebounce.setDelayMs(m_settings.validationDebounceMs);
    m_validationDebounce.setAction([this]() { runValidation(); });

    connect(&m_history, &Command::HistoryStore::graphChanged, this, &WorkflowEditSession::graphChanged);
    connect(&m_history, &Command::HistoryStore::undoRedoStateChanged,
            this, &WorkflowEditSession::undoRedoStateChanged);
    connect(&m_history, &Command::HistoryStore::dirtyChanged, this, [this](bool dirty) {
        emit dirtyChanged(dirty);
        updateTestCallAvailability();
    });
}

WorkflowEditSession::~WorkflowEditSession()
{
    m_validationDebounce.cancel();
    m_validationGate.invalidate();
}

void WorkflowEditSession::load(const QString& workflowId)
{
    if (!m_api) {
        emit loaded(false, QStringLiteral("No workflow API available."));
        return;
    }

    close();
    const quint64 epoch = m_epoch;
    QPointer<WorkflowEditSession> self(this);
    m_api->getWorkflow(workflowId, [self, epoch, workflowId](const Utils::Result& result,
                                                             const Api::WorkflowRecord& record) {
        if (!self || self->m_epoch != epoch)
            return;
        if (!result) {
            qCWarning(sessionlog).noquote() << "Loading workflow" << workflowId << "failed:" << result.joined();
            emit self->loaded(false, result.joined());
            return;
        }
        Api::WorkflowRecord opened = record;
        if (opened.id.isEmpty())
            opened.id = workflowId;
        self->open(opened);
        emit self->loaded(true, {});
    });
}

void WorkflowEditSession::open(const Api::WorkflowRecord& record)
{
    close();

    m_workflowId = record.id;
    m_workflowName = record.name;
    m_templateVars = record.templateVars;
    m_configurations = record.configurations.isEmpty() ? defaultWorkflowConfigurations() : record.configurations;

    m_ids = FlowModel::NodeIdAllocator();
    FlowModel::FlowGraph graph;
    if (definitionHasNodes(record.definition)) {
        const Utils::Result parsed = FlowModel::parseFlowGraph(record.definition, graph);
        if (!parsed) {
            qCWarning(sessionlog).noquote()
                << "Workflow" << m_workflowId << "opened with problems:" << parsed.joined();
        }
        m_ids.observe(graph);
    } else {
        graph = FlowModel::initialGraph(m_ids);
    }

    m_history.reset(graph);
    m_savedGraphRevision = m_history.revision();

    qCInfo(sessionlog).noquote() << "Opened workflow" << m_workflowId << "with"
                                 << graph.nodeCount() << "nodes and" << graph.edgeCount() << "edges";

    updateTestCallAvailability();
    runValidation();
}

void WorkflowEditSession::close()
{
    ++m_epoch;
    m_validationDebounce.cancel();
    m_validationGate.invalidate();
    m_validationInFlight = false;
    m_saveInFlight = false;
    m_hoveredEdge = {};
    m_metaRevision = 0;
    m_workflowId.clear();

    const bool hadErrors = !m_errors.isEmpty() || !m_workflowErrors.isEmpty();
    m_errors.clear();
    m_workflowErrors.clear();
    if (hadErrors)
        emit validationChanged(m_workflowErrors);
    updateTestCallAvailability();
}

bool WorkflowEditSession::isValidationPending() const noexcept
{
    return m_validationDebounce.isPending() || m_validationInFlight;
}

CommandResult WorkflowEditSession::applyRecorded(const Command::FlowCommand& command, ChangeClass changeClass)
{
    const CommandResult r = m_history.apply(command, changeClass);
    if (!r.changed())
        return r;

    if (!m_hoveredEdge.isNull() && !graph().containsEdge(m_hoveredEdge))
        m_hoveredEdge = {};
    refreshPresentation();

    if (changeClass == ChangeClass::Structural)
        scheduleValidation();
    return r;
}

void WorkflowEditSession::applySelection(const QVector<QPair<NodeId, bool>>& nodes,
                                         const QVector<QPair<EdgeId, bool>>& edges)
{
    const Command::SetSelectionCommand cmd(nodes, edges, m_hoveredEdge);
    const CommandResult r = m_history.applyTransient(cmd);
    if (!r.ok())
        qCWarning(sessionlog).noquote() << "Selection update failed:" << r.error().toString();
}

void WorkflowEditSession::refreshPresentation()
{
    applySelection({}, {});
}

CommandResult WorkflowEditSession::onNodesChange(const QVector<NodeChange>& changes)
{
    QVector<NodeId> removed;
    QSet<NodeId> removedSet;
    for (const NodeChange& c : changes) {
        if (c.type == NodeChange::Type::Remove && !removedSet.contains(c.id)) {
            removed.push_back(c.id);
            removedSet.insert(c.id);
        }
    }

    auto batch = std::make_unique<Command::CompositeCommand>(QStringLiteral("NodesChange"));
    QVector<Command::NodeMove> moves;
    QVector<QPair<NodeId, bool>> selection;
    bool structural = !removed.isEmpty();
    bool dragEnded = false;

    for (const NodeChange& c : changes) {
        switch (c.type) {
            case NodeChange::Type::Add: {
                if (!c.item)
                    return rejected(Command::CommandErrorCode::InvalidArgument, QStringLiteral("NodesChange: add without a node."));
                FlowModel::Node node = *c.item;
                if (node.id.isNull())
                    node.id = m_ids.allocate();
                else
                    m_ids.observe(node.id);
                batch->add(std::make_unique<Command::CreateNodeCommand>(std::move(node)));
                structural = true;
                break;
            }
            case NodeChange::Type::Replace: {
                if (!c.item)
                    return rejected(Command::CommandErrorCode::InvalidArgument, QStringLiteral("NodesChange: replace without a node."));
                batch->add(std::make_unique<Command::UpdateNodePayloadCommand>(c.id, c.item->payload));
                moves.push_back({c.id, c.item->position});
                structural = true;
                break;
            }
            case NodeChange::Type::Position:
                if (removedSet.contains(c.id))
                    break;
                if (c.position)
                    moves.push_back({c.id, *c.position});
                if (!c.dragging)
                    dragEnded = true;
                break;
            case NodeChange::Type::Select:
                selection.push_back({c.id, c.selected});
                break;
            case NodeChange::Type::Dimensions:
            case NodeChange::Type::Remove:
                break;
        }
    }

    if (!moves.isEmpty())
        batch->add(std::make_unique<Command::MoveNodesCommand>(moves));
    if (!removed.isEmpty())
        batch->add(std::make_unique<Command::DeleteEntitiesCommand>(removed));

    CommandResult result = CommandResult::unchanged(graph());
    if (!batch->isEmpty()) {
        const ChangeClass cls = structural ? ChangeClass::Structural : ChangeClass::Cosmetic;
        result = applyRecorded(*batch, cls);
        if (!result.ok())
            return result;
    }

    // The drop closes the drag run even when its last position was already applied.
    if (dragEnded && !structural)
        m_history.seal();

    if (!selection.isEmpty())
        applySelection(selection, {});
    return result;
}

CommandResult WorkflowEditSession::onEdgesChange(const QVector<EdgeChange>& changes)
{
    auto batch = std::make_unique<Command::CompositeCommand>(QStringLiteral("EdgesChange"));
    QVector<EdgeId> removed;
    QVector<QPair<EdgeId, bool>> selection;

    for (const EdgeChange& c : changes) {
        switch (c.type) {
            case EdgeChange::Type::Add:
                if (!c.item)
                    return rejected(Command::CommandErrorCode::InvalidArgument, QStringLiteral("EdgesChange: add without an edge."));
                batch->add(std::make_unique<Command::ConnectNodesCommand>(c.item->source, c.item->target, c.item->data));
                break;
            case EdgeChange::Type::Replace:
                if (!c.item)
                    return rejected(Command::CommandErrorCode::InvalidArgument, QStringLiteral("EdgesChange: replace without an edge."));
                batch->add(std::make_unique<Command::UpdateEdgeDataCommand>(c.id, c.item->data));
                break;
            case EdgeChange::Type::Remove:
                if (!removed.contains(c.id))
                    removed.push_back(c.id);
                break;
            case EdgeChange::Type::Select:
                selection.push_back({c.id, c.selected});
                break;
        }
    }

    if (!removed.isEmpty())
        batch->add(std::make_unique<Command::DeleteEntitiesCommand>(QVector<NodeId>{}, removed));

    CommandResult result = CommandResult::unchanged(graph());
    if (!batch->isEmpty()) {
        result = applyRecorded(*batch, ChangeClass::Structural);
        if (!result.ok())
            return result;
    }

    if (!selection.isEmpty())
        applySelection({}, selection);
    return result;
}

CommandResult WorkflowEditSession::onConnect(const NodeId& source, const NodeId& target)
{
    return applyRecorded(Command::ConnectNodesCommand(source, target), ChangeClass::Structural);
}

void WorkflowEditSession::setHoveredEdge(const EdgeId& id)
{
    if (m_hoveredEdge == id)
        return;
    m_hoveredEdge = id;
    refreshPresentation();
}

void WorkflowEditSession::setViewport(const FlowModel::Viewport& viewport)
{
    if (graph().viewport() == viewport)
        return;
    FlowModel::FlowGraph::Builder b(graph());
    b.setViewport(viewport);
    m_history.replacePresent(b.freeze());
}

std::optional<NodeId> WorkflowEditSession::addNode(FlowModel::NodeKind kind, const QPointF& position)
{
    std::optional<FlowModel::Node> node = FlowModel::createNode(kind, position, m_ids);
    if (!node)
        return std::nullopt;

    const NodeId id = node->id;
    const CommandResult r = applyRecorded(Command::CreateNodeCommand(std::move(*node)), ChangeClass::Structural);
    if (!r.ok())
        return std::nullopt;
    return id;
}

CommandResult WorkflowEditSession::deleteNode(const NodeId& id)
{
    if (!graph().containsNode(id)) {
        return rejected(Command::CommandErrorCode::MissingEntity,
                        QStringLiteral("DeleteNode: node '%1' does not exist.").arg(id.toString()));
    }
    return applyRecorded(Command::DeleteEntitiesCommand(QVector<NodeId>{id}), ChangeClass::Structural);
}

CommandResult WorkflowEditSession::updateNodeData(const NodeId& id, FlowModel::NodePayload payload)
{
    return applyRecorded(Command::UpdateNodePayloadCommand(id, std::move(payload)), ChangeClass::Structural);
}

CommandResult WorkflowEditSession::updateEdgeData(const EdgeId& id, FlowModel::EdgeData data)
{
    return applyRecorded(Command::UpdateEdgeDataCommand(id, std::move(data)), ChangeClass::Structural);
}

Utils::Result WorkflowEditSession::autoLayout(Layout::Direction direction)
{
    Layout::LayoutOptions options = m_settings.layout;
    options.direction = direction;

    Layout::LayoutResult laid;
    const Utils::Result computed = Layout::computeLayout(graph(), options, laid);
    if (!computed)
        return computed;

    QVector<Command::NodeMove> moves;
    moves.reserve(graph().nodeCount());
    for (const NodeId& id : graph().nodeIds())
        moves.push_back({id, laid.positions.value(id)});
    if (moves.isEmpty())
        return Utils::Result::success();

    const CommandResult r = applyRecorded(Command::MoveNodesCommand(moves, QStringLiteral("ApplyLayout")),
                                          ChangeClass::Structural);
    if (!r.ok())
        return Utils::Result::failure(r.error().toString());
    return Utils::Result::success();
}

bool WorkflowEditSession::undo()
{
    if (!m_history.undo().ok())
        return false;
    reprojectValidation();
    refreshPresentation();
    scheduleValidation();
    return true;
}

bool WorkflowEditSession::redo()
{
    if (!m_history.redo().ok())
        return false;
    reprojectValidation();
    refreshPresentation();
    scheduleValidation();
    return true;
}

bool WorkflowEditSession::save(bool includeGraph)
{
    Api::WorkflowUpdate update;
    update.name = m_workflowName;
    if (includeGraph)
        update.definition = FlowModel::serializeFlowGraph(graph());
    return startSave(std::move(update), includeGraph, {});
}

void WorkflowEditSession::setWorkflowName(const QString& name)
{
    if (name == m_workflowName)
        return;
    m_workflowName = name;
    ++m_metaRevision;
    m_history.markDirty();
}

bool WorkflowEditSession::saveTemplateVariables(const Api::TemplateVariables& variables)
{
    Api::WorkflowUpdate update;
    update.name = m_workflowName;
    update.templateVars = variables;
    return startSave(std::move(update), false, [this, variables]() { m_templateVars = variables; });
}

bool WorkflowEditSession::saveConfigurations(const QJsonObject& configurations, const QString& name)
{
    Api::WorkflowUpdate update;
    update.name = name;
    update.configurations = configurations;
    return startSave(std::move(update), false, [this, configurations, name]() {
        m_configurations = configurations;
        m_workflowName = name;
    });
}

bool WorkflowEditSession::startSave(Api::WorkflowUpdate update, bool includesGraph, SaveApplied onSuccess)
{
    if (!m_api || m_workflowId.isEmpty()) {
        qCWarning(sessionlog) << "Save requested without an open workflow";
        return false;
    }
    if (m_saveInFlight) {
        qCInfo(sessionlog).noquote() << "Save of" << m_workflowId << "ignored: previous save still running";
        return false;
    }

    m_saveInFlight = true;
    const quint64 epoch = m_epoch;
    const quint64 graphRevision = m_history.revision();
    const quint64 metaRevision = m_metaRevision;

    emit saveStarted();

    QPointer<WorkflowEditSession> self(this);
    m_api->saveWorkflow(m_workflowId, update,
                        [self, epoch, includesGraph, graphRevision, metaRevision, onSuccess](const Utils::Result& result) {
        if (!self || self->m_epoch != epoch)
            return;
        self->finishSave(result, includesGraph, graphRevision, metaRevision, onSuccess);
    });
    return true;
}

void WorkflowEditSession::finishSave(const Utils::Result& result, bool includesGraph, quint64 graphRevision,
                                     quint64 metaRevision, const SaveApplied& onSuccess)
{
    m_saveInFlight = false;

    if (result) {
        if (onSuccess)
            onSuccess();
        if (includesGraph)
            m_savedGraphRevision = graphRevision;

        // Edits made while the request was out are not part of what got saved.
        const bool unchangedSince = m_history.revision() == m_savedGraphRevision && m_metaRevision == metaRevision;
        if (unchangedSince)
            m_history.markClean();

        qCInfo(sessionlog).noquote() << "Saved workflow" << m_workflowId
                                     << (includesGraph ? "with graph" : "metadata only")
                                     << (unchangedSince ? "" : "(newer edits pending)");
        emit saveFinished(true, {});
    } else {
        qCWarning(sessionlog).noquote() << "Saving workflow" << m_workflowId << "failed:" << result.joined();
        emit saveFinished(false, result.joined());
    }

    validateNow();
}

void WorkflowEditSession::validateNow()
{
    m_validationDebounce.cancel();
    runValidation();
}

void WorkflowEditSession::scheduleValidation()
{
    if (m_workflowId.isEmpty())
        return;
    m_validationDebounce.trigger();
}

void WorkflowEditSession::runValidation()
{
    if (!m_api || m_workflowId.isEmpty())
        return;

    const Validation::ValidationGate::Ticket ticket = m_validationGate.issue(m_history.revision());
    m_validationInFlight = true;

    const quint64 epoch = m_epoch;
    QPointer<WorkflowEditSession> self(this);
    m_api->validateWorkflow(m_workflowId, [self, epoch, ticket](const Utils::Result& result,
                                                                const Validation::ValidationReport& report) {
        if (!self || self->m_epoch != epoch)
            return;
        self->handleValidation(ticket, result, report);
    });
}

void WorkflowEditSession::handleValidation(const Validation::ValidationGate::Ticket& ticket,
                                           const Utils::Result& result,
                                           const Validation::ValidationReport& report)
{
    switch (m_validationGate.check(ticket, m_history.revision())) {
        case Validation::ValidationGate::Verdict::Superseded:
            qCDebug(sessionlog) << "Dropping superseded validation response" << ticket.sequence;
            return;
        case Validation::ValidationGate::Verdict::GraphChanged:
            // The result describes an older graph; ask again for the current one.
            qCInfo(sessionlog) << "Validation response for revision" << ticket.revision
                               << "is stale at revision" << m_history.revision() << ", revalidating";
            m_validationInFlight = false;
            scheduleValidation();
            return;
        case Validation::ValidationGate::Verdict::Accept:
            break;
    }

    m_validationInFlight = false;
    if (!result) {
        qCWarning(sessionlog).noquote() << "Validation of" << m_workflowId << "failed:" << result.joined();
        return;
    }

    m_errors = report.errors;
    reprojectValidation();
}

void WorkflowEditSession::reprojectValidation()
{
    const Validation::OverlayResult overlay = Validation::applyValidation(graph(), m_errors);
    m_history.replacePresent(overlay.graph);

    m_workflowErrors = overlay.workflowErrors;
    emit validationChanged(m_workflowErrors);
    updateTestCallAvailability();
}

bool WorkflowEditSession::canStartTestCall() const noexcept
{
    return !m_workflowId.isEmpty() && !isDirty() && m_errors.isEmpty();
}

void WorkflowEditSession::updateTestCallAvailability()
{
    const bool canStart = canStartTestCall();
    if (canStart == m_canStartTestCall)
        return;
    m_canStartTestCall = canStart;
    emit canStartTestCallChanged(canStart);
}

QJsonObject WorkflowEditSession::exportDocument() const
{
    return exportWorkflowDocument(m_workflowName, graph());
}

Utils::Result WorkflowEditSession::exportToFile(const QString& path) const
{
    const Utils::Result written = Utils::JsonFileUtils::writeObjectAtomic(path, exportDocument());
    if (!written)
        qCWarning(sessionlog).noquote() << "Export to" << path << "failed:" << written.joined();
    return written;
}

} // namespace Session
