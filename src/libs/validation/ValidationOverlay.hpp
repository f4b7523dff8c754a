// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "validation/ValidationGlobal.hpp"
#include "validation/ValidationError.hpp"

#include <flowmodel/FlowGraph.hpp>

namespace Validation {

inline const QString kMessageSeparator = QStringLiteral(", ");

struct OverlayResult final {
    FlowModel::FlowGraph graph;
    // Errors not attached to a node or edge, for the workflow-level panel.
    ValidationErrors workflowErrors;
};

// Clears the overlay on every node and edge, then attaches `errors`. Several
// distinct messages for one entity are joined with ", ". Node and edge errors
// naming an entity the graph does not have land in workflowErrors.
// Only overlay fields change; user data is never touched.
VALIDATION_EXPORT OverlayResult applyValidation(const FlowModel::FlowGraph& graph, const ValidationErrors& errors);

} // namespace Validation
