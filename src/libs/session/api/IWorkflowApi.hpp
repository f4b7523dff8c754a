// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/WorkflowApiTypes.hpp"

#include <utils/Result.hpp>
#include <validation/ValidationJson.hpp>

#include <QtCore/QObject>

#include <functional>

namespace Session::Api {

// Persistence backend of the editor. Every call returns immediately and
// reports through its callback from a later event loop iteration, on the
// thread that made the call.
class SESSION_EXPORT IWorkflowApi : public QObject
{
    Q_OBJECT

public:
    using SaveCallback = std::function<void(const Utils::Result&)>;
    using ValidateCallback = std::function<void(const Utils::Result&, const Validation::ValidationReport&)>;
    using FetchCallback = std::function<void(const Utils::Result&, const WorkflowRecord&)>;

    using QObject::QObject;
    ~IWorkflowApi() override = default;

    virtual void saveWorkflow(const QString& workflowId, const WorkflowUpdate& update, SaveCallback done) = 0;
    virtual void validateWorkflow(const QString& workflowId, ValidateCallback done) = 0;
    virtual void getWorkflow(const QString& workflowId, FetchCallback done) = 0;
};

} // namespace Session::Api
