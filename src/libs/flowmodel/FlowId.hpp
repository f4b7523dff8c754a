// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QHashFunctions>
#include <QtCore/QString>

#include <compare>

namespace FlowModel {

// String identifiers as they travel on the wire. The tag keeps node and edge
// ids from being mixed up at compile time.
template <typename Tag>
class FlowId final {
public:
    using tag_type = Tag;

    FlowId() = default;
    explicit FlowId(QString value) : m_value(std::move(value)) {}

    static FlowId null() { return FlowId(); }

    bool isNull() const noexcept { return m_value.isEmpty(); }
    const QString& toString() const noexcept { return m_value; }

    friend bool operator==(const FlowId& a, const FlowId& b) noexcept {
        return a.m_value == b.m_value;
    }

    friend std::strong_ordering operator<=>(const FlowId& a, const FlowId& b) noexcept {
        const int c = QString::compare(a.m_value, b.m_value, Qt::CaseSensitive);
        if (c < 0) return std::strong_ordering::less;
        if (c > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

private:
    QString m_value;
};

template <typename Tag>
size_t qHash(const FlowId<Tag>& id, size_t seed = 0) noexcept {
    return qHash(id.toString(), seed);
}

struct NodeIdTag final {};
struct EdgeIdTag final {};

using NodeId = FlowId<NodeIdTag>;
using EdgeId = FlowId<EdgeIdTag>;

} // namespace FlowModel
