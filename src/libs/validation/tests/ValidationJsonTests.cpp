// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "validation/ValidationGate.hpp"
#include "validation/ValidationJson.hpp"

#include <QtCore/QJsonDocument>

using namespace Validation;

namespace {

QJsonObject parseLiteral(const char* text)
{
    return QJsonDocument::fromJson(QByteArray(text)).object();
}

} // namespace

TEST(ValidationJson, ParsesSuccessBody)
{
    ValidationReport report;
    const Utils::Result r = parseValidationReport(parseLiteral(R"({
        "is_valid": false,
        "errors": [
            {"kind": "node", "id": "2", "field": "data.prompt", "message": "Prompt is required"},
            {"kind": "workflow", "id": null, "field": null, "message": "Missing start node"}
        ]
    })"), report);

    ASSERT_TRUE(r.ok) << r.joined().toStdString();
    EXPECT_FALSE(report.isValid);
    ASSERT_EQ(report.errors.size(), 2);
    EXPECT_EQ(report.errors.at(0).kind, ErrorKind::Node);
    EXPECT_EQ(report.errors.at(0).id.value_or(QString()), QStringLiteral("2"));
    EXPECT_FALSE(report.errors.at(1).id.has_value());
}

TEST(ValidationJson, ParsesDetailEnvelope)
{
    ValidationReport report;
    const Utils::Result r = parseValidationReport(parseLiteral(R"({
        "detail": {"errors": [{"kind": "edge", "id": "1-2", "field": "label", "message": "Label is required"}]}
    })"), report);

    ASSERT_TRUE(r.ok);
    EXPECT_FALSE(report.isValid);
    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(report.errors.front().kind, ErrorKind::Edge);
}

TEST(ValidationJson, PlainDetailBecomesWorkflowError)
{
    ValidationReport report;
    ASSERT_TRUE(parseValidationReport(parseLiteral(R"({"detail": "Workflow not found"})"), report).ok);
    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(report.errors.front().kind, ErrorKind::Workflow);
    EXPECT_EQ(report.errors.front().message, QStringLiteral("Workflow not found"));
}

TEST(ValidationJson, UnknownKindIsReported)
{
    ValidationReport report;
    const Utils::Result r = parseValidationReport(parseLiteral(R"({
        "is_valid": false,
        "errors": [{"kind": "port", "id": "x", "message": "?"}]
    })"), report);

    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(report.errors.isEmpty());
}

TEST(ValidationGate, OnlyLatestTicketIsAccepted)
{
    ValidationGate gate;
    const auto first = gate.issue(7);
    const auto second = gate.issue(7);

    EXPECT_EQ(gate.check(first, 7), ValidationGate::Verdict::Superseded);
    EXPECT_EQ(gate.check(second, 7), ValidationGate::Verdict::Accept);
}

TEST(ValidationGate, ChangedGraphRejectsResponse)
{
    ValidationGate gate;
    const auto ticket = gate.issue(3);
    EXPECT_EQ(gate.check(ticket, 4), ValidationGate::Verdict::GraphChanged);
}

TEST(ValidationGate, InvalidateSupersedesOutstandingTickets)
{
    ValidationGate gate;
    const auto ticket = gate.issue(1);
    gate.invalidate();
    EXPECT_EQ(gate.check(ticket, 1), ValidationGate::Verdict::Superseded);
}
