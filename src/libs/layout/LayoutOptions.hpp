// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layout/LayoutGlobal.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Layout {

enum class Direction : quint8 {
    TopToBottom,
    LeftToRight
};

LAYOUT_EXPORT QString directionToString(Direction direction);
// Accepts "TB" and "LR", case-insensitive.
LAYOUT_EXPORT bool directionFromString(const QString& text, Direction& out);

inline constexpr double kDefaultNodeWidth = 180.0;
inline constexpr double kDefaultNodeHeight = 60.0;
inline constexpr double kDefaultNodeSeparation = 250.0;
inline constexpr double kDefaultRankSeparation = 250.0;
inline constexpr double kDefaultRankTolerance = 1.0;
inline constexpr double kDefaultZigzagOffset = 150.0;
inline constexpr int kDefaultCrossingSweeps = 4;

struct LayoutOptions final {
    Direction direction = Direction::TopToBottom;

    // Footprint every node is laid out with, whatever its rendered size.
    double nodeWidth = kDefaultNodeWidth;
    double nodeHeight = kDefaultNodeHeight;

    double nodeSeparation = kDefaultNodeSeparation;
    double rankSeparation = kDefaultRankSeparation;

    // Nodes whose rank coordinates round to the same bucket share a row.
    double rankTolerance = kDefaultRankTolerance;
    double zigzagOffset = kDefaultZigzagOffset;

    int crossingSweeps = kDefaultCrossingSweeps;

    bool operator==(const LayoutOptions&) const = default;
};

// Missing keys keep the fallback's value. Malformed values are reported and
// ignored, so `out` is always usable.
LAYOUT_EXPORT Utils::Result parseLayoutOptions(const QJsonObject& obj,
                                               const LayoutOptions& fallback,
                                               LayoutOptions& out);

LAYOUT_EXPORT QJsonObject layoutOptionsToJson(const LayoutOptions& options);

} // namespace Layout
