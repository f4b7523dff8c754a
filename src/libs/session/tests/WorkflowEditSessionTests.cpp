// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "SessionTestSupport.hpp"

#include "session/WorkflowEditSession.hpp"

#include <flowmodel/FlowGraphJson.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>

#include <memory>

using namespace Session;
using FlowModel::EdgeId;
using FlowModel::NodeId;
using FlowModel::NodeKind;
using SessionTest::FakeWorkflowApi;

namespace {

struct SessionFixture : public ::testing::Test {
    void SetUp() override
    {
        SessionTest::ensureGuiApp();
    }

    // Opens the three node workflow and answers the initial validation.
    void openLinear(WorkflowEditSession& session)
    {
        session.open(SessionTest::linearRecord());
        ASSERT_EQ(api.validations.size(), 1);
        api.completeValidation(0, Utils::Result::success());
    }

    QPointF positionOf(const WorkflowEditSession& session, const QString& id) const
    {
        const FlowModel::Node* node = session.graph().tryNode(NodeId(id));
        return node ? node->position : QPointF(-1, -1);
    }

    FakeWorkflowApi api;
};

} // namespace

TEST_F(SessionFixture, EmptyDefinitionSeedsStartNode)
{
    WorkflowEditSession session(&api);
    Api::WorkflowRecord record;
    record.id = QStringLiteral("wf-empty");
    record.name = QStringLiteral("Blank");
    session.open(record);

    ASSERT_EQ(session.graph().nodeCount(), 1);
    const FlowModel::Node* start = session.graph().tryNode(session.graph().nodeIds().first());
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(FlowModel::kindOf(start->payload), NodeKind::Start);
    EXPECT_EQ(start->position, QPointF(200, 200));
    EXPECT_FALSE(session.isDirty());
    EXPECT_FALSE(session.history().canUndo());

    EXPECT_EQ(api.validatedIds, QStringList{QStringLiteral("wf-empty")});
    EXPECT_TRUE(session.isValidationPending());
}

TEST_F(SessionFixture, MissingConfigurationsFallBackToDefaults)
{
    WorkflowEditSession session(&api);
    session.open(SessionTest::linearRecord());

    EXPECT_TRUE(session.configurations().contains(QStringLiteral("vad_configuration")));
    EXPECT_EQ(session.configurations().value(QStringLiteral("max_call_duration")).toInt(), 600);
}

TEST_F(SessionFixture, NewNodeIdsContinueAfterLoadedIds)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const std::optional<NodeId> id = session.addNode(NodeKind::Agent, QPointF(10, 10));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->toString(), QStringLiteral("4"));
    EXPECT_TRUE(session.isDirty());
    EXPECT_TRUE(session.history().canUndo());
}

TEST_F(SessionFixture, ConnectIsUndoable)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const Command::CommandResult r = session.onConnect(NodeId(QStringLiteral("1")), NodeId(QStringLiteral("3")));
    ASSERT_TRUE(r.ok()) << r.error().toString().toStdString();
    EXPECT_TRUE(session.graph().containsEdge(EdgeId(QStringLiteral("1-3"))));

    ASSERT_TRUE(session.undo());
    EXPECT_FALSE(session.graph().containsEdge(EdgeId(QStringLiteral("1-3"))));

    ASSERT_TRUE(session.redo());
    EXPECT_TRUE(session.graph().containsEdge(EdgeId(QStringLiteral("1-3"))));
}

TEST_F(SessionFixture, RemovingNodeDropsItsEdges)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const Command::CommandResult r = session.onNodesChange({NodeChange::remove(NodeId(QStringLiteral("2")))});
    ASSERT_TRUE(r.ok()) << r.error().toString().toStdString();

    EXPECT_EQ(session.graph().nodeCount(), 2);
    EXPECT_EQ(session.graph().edgeCount(), 0);
    EXPECT_TRUE(session.graph().isConsistent());

    ASSERT_TRUE(session.undo());
    EXPECT_EQ(session.graph().edgeCount(), 2);
}

TEST_F(SessionFixture, PositionChangeForRemovedNodeIsIgnored)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const NodeId agent(QStringLiteral("2"));
    const Command::CommandResult r = session.onNodesChange({
        NodeChange::move(agent, QPointF(50, 50), false),
        NodeChange::remove(agent),
    });
    ASSERT_TRUE(r.ok()) << r.error().toString().toStdString();
    EXPECT_FALSE(session.graph().containsNode(agent));
    EXPECT_EQ(session.history().entryCount(), 2);
}

TEST_F(SessionFixture, DragCollapsesIntoOneUndoStep)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const QPointF before = positionOf(session, QStringLiteral("2"));
    const NodeId agent(QStringLiteral("2"));
    for (int i = 1; i <= 10; ++i)
        session.onNodesChange({NodeChange::move(agent, QPointF(i * 10.0, 150), true)});
    session.onNodesChange({NodeChange::move(agent, QPointF(120, 150), false)});

    EXPECT_EQ(positionOf(session, QStringLiteral("2")), QPointF(120, 150));
    EXPECT_EQ(session.history().entryCount(), 2);
    EXPECT_TRUE(session.isDirty());

    ASSERT_TRUE(session.undo());
    EXPECT_EQ(positionOf(session, QStringLiteral("2")), before);
    EXPECT_FALSE(session.history().canUndo());
}

TEST_F(SessionFixture, SeparateDragsAreSeparateSteps)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const NodeId agent(QStringLiteral("2"));
    session.onNodesChange({NodeChange::move(agent, QPointF(40, 150), true)});
    session.onNodesChange({NodeChange::move(agent, std::nullopt, false)});
    session.onNodesChange({NodeChange::move(agent, QPointF(80, 150), true)});
    session.onNodesChange({NodeChange::move(agent, std::nullopt, false)});

    EXPECT_EQ(session.history().entryCount(), 3);
    ASSERT_TRUE(session.undo());
    EXPECT_EQ(positionOf(session, QStringLiteral("2")), QPointF(40, 150));
}

TEST_F(SessionFixture, DragDoesNotTriggerValidation)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    session.onNodesChange({NodeChange::move(NodeId(QStringLiteral("2")), QPointF(5, 5), false)});
    EXPECT_FALSE(session.isValidationPending());
}

TEST_F(SessionFixture, SelectionIsNotAnEdit)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    QSignalSpy dirty(&session, &WorkflowEditSession::dirtyChanged);
    session.onNodesChange({NodeChange::select(NodeId(QStringLiteral("2")), true)});

    EXPECT_TRUE(session.graph().tryNode(NodeId(QStringLiteral("2")))->selected);
    EXPECT_FALSE(session.isDirty());
    EXPECT_EQ(dirty.count(), 0);
    EXPECT_EQ(session.history().entryCount(), 1);
    EXPECT_FALSE(session.isValidationPending());
}

TEST_F(SessionFixture, SelectedEdgeHighlightsEndpoints)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    session.onEdgesChange({EdgeChange::select(EdgeId(QStringLiteral("1-2")), true)});

    EXPECT_TRUE(session.graph().tryNode(NodeId(QStringLiteral("1")))->selectedThroughEdge);
    EXPECT_TRUE(session.graph().tryNode(NodeId(QStringLiteral("2")))->selectedThroughEdge);
    EXPECT_FALSE(session.graph().tryNode(NodeId(QStringLiteral("3")))->selectedThroughEdge);
    EXPECT_FALSE(session.isDirty());
}

TEST_F(SessionFixture, HoveredEdgeHighlightClearsWhenEdgeIsDeleted)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const EdgeId edge(QStringLiteral("2-3"));
    session.setHoveredEdge(edge);
    EXPECT_TRUE(session.graph().tryNode(NodeId(QStringLiteral("3")))->hoveredThroughEdge);
    EXPECT_FALSE(session.isDirty());

    session.onEdgesChange({EdgeChange::remove(edge)});
    EXPECT_FALSE(session.graph().containsEdge(edge));
    EXPECT_FALSE(session.graph().tryNode(NodeId(QStringLiteral("3")))->hoveredThroughEdge);
}

TEST_F(SessionFixture, DeleteUnknownNodeFails)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const Command::CommandResult r = session.deleteNode(NodeId(QStringLiteral("99")));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error().code(), Command::CommandErrorCode::MissingEntity);
    EXPECT_FALSE(session.isDirty());
}

TEST_F(SessionFixture, UpdateEdgeDataIsStructural)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    FlowModel::EdgeData data;
    data.label = QStringLiteral("transfer");
    data.condition = QStringLiteral("caller asks for a human");
    const Command::CommandResult r = session.updateEdgeData(EdgeId(QStringLiteral("2-3")), data);
    ASSERT_TRUE(r.ok()) << r.error().toString().toStdString();

    EXPECT_EQ(session.graph().tryEdge(EdgeId(QStringLiteral("2-3")))->data.label, QStringLiteral("transfer"));
    EXPECT_TRUE(session.isDirty());
    EXPECT_TRUE(session.isValidationPending());
}

TEST_F(SessionFixture, ViewportChangeIsNotAnEdit)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    FlowModel::Viewport viewport;
    viewport.x = 40;
    viewport.zoom = 0.5;
    session.setViewport(viewport);

    EXPECT_EQ(session.graph().viewport(), viewport);
    EXPECT_FALSE(session.isDirty());
    EXPECT_FALSE(session.history().canUndo());
}

TEST_F(SessionFixture, AutoLayoutIsOneUndoStep)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const QPointF before = positionOf(session, QStringLiteral("3"));
    const Utils::Result r = session.autoLayout(Layout::Direction::TopToBottom);
    ASSERT_TRUE(r.ok) << r.joined().toStdString();

    EXPECT_EQ(session.history().entryCount(), 2);
    EXPECT_EQ(session.history().presentEntry().label, QStringLiteral("ApplyLayout"));
    EXPECT_LT(positionOf(session, QStringLiteral("1")).y(), positionOf(session, QStringLiteral("2")).y());
    EXPECT_LT(positionOf(session, QStringLiteral("2")).y(), positionOf(session, QStringLiteral("3")).y());

    ASSERT_TRUE(session.undo());
    EXPECT_EQ(positionOf(session, QStringLiteral("3")), before);
}

TEST_F(SessionFixture, SaveClearsDirtyAndRevalidates)
{
    WorkflowEditSession session(&api);
    openLinear(session);
    session.addNode(NodeKind::Agent, QPointF(300, 150));
    ASSERT_TRUE(session.isDirty());

    QSignalSpy started(&session, &WorkflowEditSession::saveStarted);
    QSignalSpy finished(&session, &WorkflowEditSession::saveFinished);

    ASSERT_TRUE(session.save());
    ASSERT_EQ(api.saves.size(), 1);
    EXPECT_EQ(started.count(), 1);
    EXPECT_TRUE(session.isSaving());
    EXPECT_EQ(api.saves[0].workflowId, QStringLiteral("wf-1"));
    ASSERT_TRUE(api.saves[0].update.definition.has_value());
    EXPECT_EQ(api.saves[0].update.definition->value(QStringLiteral("nodes")).toArray().size(), 4);
    EXPECT_EQ(api.saves[0].update.name, std::optional<QString>(QStringLiteral("Support line")));

    api.completeSave(0, Utils::Result::success());

    EXPECT_FALSE(session.isDirty());
    EXPECT_FALSE(session.isSaving());
    ASSERT_EQ(finished.count(), 1);
    EXPECT_TRUE(finished.at(0).at(0).toBool());

    // The debounced request is replaced by an immediate one.
    EXPECT_EQ(api.validations.size(), 1);
}

TEST_F(SessionFixture, EditDuringSaveKeepsDirty)
{
    WorkflowEditSession session(&api);
    openLinear(session);
    session.addNode(NodeKind::Agent, QPointF(300, 150));

    ASSERT_TRUE(session.save());
    session.onNodesChange({NodeChange::move(NodeId(QStringLiteral("2")), QPointF(1, 1), false)});
    api.completeSave(0, Utils::Result::success());

    EXPECT_TRUE(session.isDirty());
}

TEST_F(SessionFixture, FailedSaveKeepsDirtyAndStillValidates)
{
    WorkflowEditSession session(&api);
    openLinear(session);
    session.addNode(NodeKind::End, QPointF(300, 300));

    QSignalSpy finished(&session, &WorkflowEditSession::saveFinished);
    ASSERT_TRUE(session.save());
    api.completeSave(0, Utils::Result::failure(QStringLiteral("502 Bad Gateway")));

    EXPECT_TRUE(session.isDirty());
    ASSERT_EQ(finished.count(), 1);
    EXPECT_FALSE(finished.at(0).at(0).toBool());
    EXPECT_EQ(finished.at(0).at(1).toString(), QStringLiteral("502 Bad Gateway"));
    EXPECT_EQ(api.validations.size(), 1);
}

TEST_F(SessionFixture, SecondSaveWhileRunningIsRejected)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    ASSERT_TRUE(session.save());
    EXPECT_FALSE(session.save());
    EXPECT_EQ(api.saves.size(), 1);
}

TEST_F(SessionFixture, SaveWithoutWorkflowIsRejected)
{
    WorkflowEditSession session(&api);
    EXPECT_FALSE(session.save());
    EXPECT_TRUE(api.saves.isEmpty());
}

TEST_F(SessionFixture, RenameSavesNameOnly)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    session.setWorkflowName(QStringLiteral("Billing line"));
    EXPECT_TRUE(session.isDirty());

    ASSERT_TRUE(session.save(false));
    ASSERT_EQ(api.saves.size(), 1);
    EXPECT_FALSE(api.saves[0].update.definition.has_value());
    EXPECT_EQ(api.saves[0].update.name, std::optional<QString>(QStringLiteral("Billing line")));

    api.completeSave(0, Utils::Result::success());
    EXPECT_FALSE(session.isDirty());
}

TEST_F(SessionFixture, TemplateVariablesApplyAfterSuccessfulSave)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    Api::TemplateVariables vars;
    vars.insert(QStringLiteral("company"), QStringLiteral("Acme"));
    ASSERT_TRUE(session.saveTemplateVariables(vars));
    ASSERT_EQ(api.saves.size(), 1);
    EXPECT_FALSE(api.saves[0].update.definition.has_value());
    EXPECT_EQ(api.saves[0].update.templateVars, std::optional<Api::TemplateVariables>(vars));
    EXPECT_TRUE(session.templateVariables().isEmpty());

    api.completeSave(0, Utils::Result::success());
    EXPECT_EQ(session.templateVariables(), vars);
}

TEST_F(SessionFixture, ConfigurationsAreDroppedWhenSaveFails)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const QJsonObject before = session.configurations();
    QJsonObject configs = before;
    configs.insert(QStringLiteral("max_call_duration"), 120);
    ASSERT_TRUE(session.saveConfigurations(configs, QStringLiteral("Short calls")));
    api.completeSave(0, Utils::Result::failure(QStringLiteral("timeout")));

    EXPECT_EQ(session.configurations(), before);
    EXPECT_EQ(session.workflowName(), QStringLiteral("Support line"));
}

TEST_F(SessionFixture, ValidationErrorsAttachToNodes)
{
    WorkflowEditSession session(&api);
    session.open(SessionTest::linearRecord());

    QSignalSpy changed(&session, &WorkflowEditSession::validationChanged);
    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("2"), QStringLiteral("Prompt is required")));

    const FlowModel::Node* agent = session.graph().tryNode(NodeId(QStringLiteral("2")));
    EXPECT_TRUE(agent->validation.invalid);
    EXPECT_EQ(agent->validation.message, QStringLiteral("Prompt is required"));
    EXPECT_EQ(session.validationErrors().size(), 1);
    EXPECT_TRUE(session.workflowErrors().isEmpty());
    EXPECT_EQ(changed.count(), 1);

    // Validation results are not edits.
    EXPECT_FALSE(session.isDirty());
    EXPECT_FALSE(session.history().canUndo());
    EXPECT_FALSE(session.isValidationPending());
}

TEST_F(SessionFixture, ResponseForOlderGraphIsDiscardedAndRetried)
{
    WorkflowEditSession session(&api);
    session.open(SessionTest::linearRecord());
    session.addNode(NodeKind::Agent, QPointF(0, 0));

    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("2"), QStringLiteral("stale")));

    EXPECT_TRUE(session.validationErrors().isEmpty());
    EXPECT_FALSE(session.graph().tryNode(NodeId(QStringLiteral("2")))->validation.invalid);
    EXPECT_TRUE(session.isValidationPending());

    session.validateNow();
    ASSERT_EQ(api.validations.size(), 1);
    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("4"), QStringLiteral("Prompt is required")));
    EXPECT_TRUE(session.graph().tryNode(NodeId(QStringLiteral("4")))->validation.invalid);
}

TEST_F(SessionFixture, SupersededResponseIsDropped)
{
    WorkflowEditSession session(&api);
    session.open(SessionTest::linearRecord());
    session.validateNow();
    ASSERT_EQ(api.validations.size(), 2);

    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("2"), QStringLiteral("old")));
    EXPECT_TRUE(session.validationErrors().isEmpty());
    EXPECT_TRUE(session.isValidationPending());

    api.completeValidation(0, Utils::Result::success());
    EXPECT_TRUE(session.validationErrors().isEmpty());
    EXPECT_FALSE(session.isValidationPending());
}

TEST_F(SessionFixture, DebouncedValidationRunsAfterStructuralEdit)
{
    EditorSettings settings;
    settings.validationDebounceMs = 10;
    WorkflowEditSession session(&api, settings);
    openLinear(session);

    session.addNode(NodeKind::Agent, QPointF(0, 0));
    session.addNode(NodeKind::Agent, QPointF(0, 50));
    EXPECT_TRUE(api.validations.isEmpty());

    EXPECT_TRUE(QTest::qWaitFor([&]() { return !api.validations.isEmpty(); }, 2000));
    EXPECT_EQ(api.validations.size(), 1);
}

TEST_F(SessionFixture, UndoReprojectsErrors)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const std::optional<NodeId> added = session.addNode(NodeKind::Agent, QPointF(0, 0));
    ASSERT_TRUE(added.has_value());
    session.validateNow();
    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(added->toString(), QStringLiteral("Unreachable node")));
    ASSERT_TRUE(session.graph().tryNode(*added)->validation.invalid);
    EXPECT_TRUE(session.workflowErrors().isEmpty());

    ASSERT_TRUE(session.undo());

    // The node is gone, so its error has nowhere to attach.
    EXPECT_FALSE(session.graph().containsNode(*added));
    ASSERT_EQ(session.workflowErrors().size(), 1);
    EXPECT_EQ(session.workflowErrors().first().message, QStringLiteral("Unreachable node"));
    EXPECT_TRUE(session.isValidationPending());
}

TEST_F(SessionFixture, TestCallNeedsSavedGraphWithoutErrors)
{
    WorkflowEditSession session(&api);
    QSignalSpy availability(&session, &WorkflowEditSession::canStartTestCallChanged);
    EXPECT_FALSE(session.canStartTestCall());

    openLinear(session);
    EXPECT_TRUE(session.canStartTestCall());

    session.addNode(NodeKind::Agent, QPointF(0, 0));
    EXPECT_FALSE(session.canStartTestCall());

    ASSERT_TRUE(session.save());
    api.completeSave(0, Utils::Result::success());
    EXPECT_TRUE(session.canStartTestCall());

    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("4"), QStringLiteral("Prompt is required")));
    EXPECT_FALSE(session.canStartTestCall());

    ASSERT_GE(availability.count(), 4);
    EXPECT_FALSE(availability.last().at(0).toBool());
}

TEST_F(SessionFixture, LoadFetchesAndOpens)
{
    WorkflowEditSession session(&api);
    QSignalSpy loaded(&session, &WorkflowEditSession::loaded);

    session.load(QStringLiteral("wf-1"));
    ASSERT_EQ(api.fetches.size(), 1);
    EXPECT_EQ(api.fetches[0].workflowId, QStringLiteral("wf-1"));

    api.completeFetch(0, Utils::Result::success(), SessionTest::linearRecord());

    ASSERT_EQ(loaded.count(), 1);
    EXPECT_TRUE(loaded.at(0).at(0).toBool());
    EXPECT_EQ(session.workflowId(), QStringLiteral("wf-1"));
    EXPECT_EQ(session.graph().nodeCount(), 3);
    EXPECT_EQ(api.validations.size(), 1);
}

TEST_F(SessionFixture, FailedLoadReportsError)
{
    WorkflowEditSession session(&api);
    QSignalSpy loaded(&session, &WorkflowEditSession::loaded);

    session.load(QStringLiteral("missing"));
    api.completeFetch(0, Utils::Result::failure(QStringLiteral("404 Not Found")), {});

    ASSERT_EQ(loaded.count(), 1);
    EXPECT_FALSE(loaded.at(0).at(0).toBool());
    EXPECT_EQ(loaded.at(0).at(1).toString(), QStringLiteral("404 Not Found"));
    EXPECT_TRUE(session.workflowId().isEmpty());
}

TEST_F(SessionFixture, ClosedSessionIgnoresLateResponses)
{
    WorkflowEditSession session(&api);
    session.open(SessionTest::linearRecord());
    ASSERT_TRUE(session.save());
    session.close();

    QSignalSpy finished(&session, &WorkflowEditSession::saveFinished);
    QSignalSpy changed(&session, &WorkflowEditSession::validationChanged);
    api.completeSave(0, Utils::Result::success());
    api.completeValidation(0, Utils::Result::success(),
                           SessionTest::reportWithNodeError(QStringLiteral("2"), QStringLiteral("late")));

    EXPECT_EQ(finished.count(), 0);
    EXPECT_EQ(changed.count(), 0);
    EXPECT_TRUE(session.validationErrors().isEmpty());
    EXPECT_FALSE(session.isValidationPending());
}

TEST_F(SessionFixture, DestroyedSessionIgnoresLateResponses)
{
    auto session = std::make_unique<WorkflowEditSession>(&api);
    session->open(SessionTest::linearRecord());
    ASSERT_TRUE(session->save());
    session.reset();

    api.completeSave(0, Utils::Result::success());
    api.completeValidation(0, Utils::Result::success());
    SUCCEED();
}

TEST_F(SessionFixture, ExportDocumentCarriesNameAndDefinition)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    const QJsonObject doc = session.exportDocument();
    EXPECT_EQ(doc.value(QStringLiteral("name")).toString(), QStringLiteral("Support line"));

    FlowModel::FlowGraph parsed;
    const Utils::Result r = FlowModel::parseFlowGraph(doc.value(QStringLiteral("workflow_definition")).toObject(),
                                                      parsed);
    ASSERT_TRUE(r.ok) << r.joined().toStdString();
    EXPECT_EQ(parsed.nodeCount(), 3);
    EXPECT_EQ(parsed.edgeCount(), 2);
}

TEST_F(SessionFixture, ExportToFileWritesDocument)
{
    WorkflowEditSession session(&api);
    openLinear(session);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("support.json"));

    const Utils::Result r = session.exportToFile(path);
    ASSERT_TRUE(r.ok) << r.joined().toStdString();

    QJsonObject doc;
    ASSERT_TRUE(Utils::JsonFileUtils::readObject(path, doc).ok);
    EXPECT_EQ(doc, session.exportDocument());
}

TEST_F(SessionFixture, ClosedSessionRefusesSave)
{
    WorkflowEditSession session(&api);
    openLinear(session);
    session.close();

    EXPECT_TRUE(session.workflowId().isEmpty());
    EXPECT_FALSE(session.canStartTestCall());
    EXPECT_FALSE(session.save());
    EXPECT_TRUE(api.saves.isEmpty());
}
