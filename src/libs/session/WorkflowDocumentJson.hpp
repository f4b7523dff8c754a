// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/WorkflowApiTypes.hpp"

#include <flowmodel/FlowGraph.hpp>
#include <utils/Result.hpp>

#include <QtCore/QJsonObject>

namespace Session {

// Call settings a workflow starts with: VAD, ambient noise and call limits.
SESSION_EXPORT QJsonObject defaultWorkflowConfigurations();

// Reads a workflow as the API returns it. A missing or null configuration
// block falls back to defaultWorkflowConfigurations().
SESSION_EXPORT Utils::Result parseWorkflowRecord(const QJsonObject& json, Api::WorkflowRecord& out);

// Request body for a partial update. An omitted definition is sent as null,
// which the API reads as "keep the stored graph".
SESSION_EXPORT QJsonObject serializeWorkflowUpdate(const Api::WorkflowUpdate& update);

// {name, workflow_definition: {nodes, edges, viewport}}
SESSION_EXPORT QJsonObject exportWorkflowDocument(const QString& name, const FlowModel::FlowGraph& graph);

// Accepts an exported document or a bare definition. The definition must carry
// nodes, edges and viewport; entries inside it are read best effort.
SESSION_EXPORT Utils::Result parseWorkflowDocument(const QJsonObject& json,
                                                   QString& name,
                                                   FlowModel::FlowGraph& out);

} // namespace Session
