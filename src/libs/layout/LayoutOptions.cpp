// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layout/LayoutOptions.hpp"

#include <QtCore/QJsonValue>

namespace Layout {

namespace {

using namespace Qt::StringLiterals;

const QString kDirectionKey = u"direction"_s;
const QString kNodeWidthKey = u"nodeWidth"_s;
const QString kNodeHeightKey = u"nodeHeight"_s;
const QString kNodeSeparationKey = u"nodeSeparation"_s;
const QString kRankSeparationKey = u"rankSeparation"_s;
const QString kRankToleranceKey = u"rankTolerance"_s;
const QString kZigzagOffsetKey = u"zigzagOffset"_s;
const QString kCrossingSweepsKey = u"crossingSweeps"_s;

void readPositive(const QJsonObject& obj, const QString& key, double& value, Utils::Result& result)
{
    if (!obj.contains(key))
        return;
    const QJsonValue v = obj.value(key);
    if (!v.isDouble() || v.toDouble() <= 0.0) {
        result.addError(QStringLiteral("layout.%1 must be a positive number.").arg(key));
        return;
    }
    value = v.toDouble();
}

void readNonNegative(const QJsonObject& obj, const QString& key, double& value, Utils::Result& result)
{
    if (!obj.contains(key))
        return;
    const QJsonValue v = obj.value(key);
    if (!v.isDouble() || v.toDouble() < 0.0) {
        result.addError(QStringLiteral("layout.%1 must be a non-negative number.").arg(key));
        return;
    }
    value = v.toDouble();
}

} // namespace

QString directionToString(Direction direction)
{
    return direction == Direction::LeftToRight ? u"LR"_s : u"TB"_s;
}

bool directionFromString(const QString& text, Direction& out)
{
    const QString key = text.trimmed().toUpper();
    if (key == u"TB"_s) {
        out = Direction::TopToBottom;
        return true;
    }
    if (key == u"LR"_s) {
        out = Direction::LeftToRight;
        return true;
    }
    return false;
}

Utils::Result parseLayoutOptions(const QJsonObject& obj, const LayoutOptions& fallback, LayoutOptions& out)
{
    Utils::Result result;
    out = fallback;

    if (obj.contains(kDirectionKey)) {
        const QString text = obj.value(kDirectionKey).toString();
        if (!directionFromString(text, out.direction))
            result.addError(QStringLiteral("layout.direction must be \"TB\" or \"LR\", got \"%1\".").arg(text));
    }

    readPositive(obj, kNodeWidthKey, out.nodeWidth, result);
    readPositive(obj, kNodeHeightKey, out.nodeHeight, result);
    readNonNegative(obj, kNodeSeparationKey, out.nodeSeparation, result);
    readNonNegative(obj, kRankSeparationKey, out.rankSeparation, result);
    readPositive(obj, kRankToleranceKey, out.rankTolerance, result);
    readNonNegative(obj, kZigzagOffsetKey, out.zigzagOffset, result);

    if (obj.contains(kCrossingSweepsKey)) {
        const int sweeps = obj.value(kCrossingSweepsKey).toInt(-1);
        if (sweeps < 0)
            result.addError(QStringLiteral("layout.crossingSweeps must be a non-negative integer."));
        else
            out.crossingSweeps = sweeps;
    }

    return result;
}

QJsonObject layoutOptionsToJson(const LayoutOptions& options)
{
    QJsonObject obj;
    obj.insert(kDirectionKey, directionToString(options.direction));
    obj.insert(kNodeWidthKey, options.nodeWidth);
    obj.insert(kNodeHeightKey, options.nodeHeight);
    obj.insert(kNodeSeparationKey, options.nodeSeparation);
    obj.insert(kRankSeparationKey, options.rankSeparation);
    obj.insert(kRankToleranceKey, options.rankTolerance);
    obj.insert(kZigzagOffsetKey, options.zigzagOffset);
    obj.insert(kCrossingSweepsKey, options.crossingSweeps);
    return obj;
}

} // namespace Layout
