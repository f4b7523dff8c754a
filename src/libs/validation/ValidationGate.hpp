// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "validation/ValidationGlobal.hpp"

namespace Validation {

// Tags validation requests so a late response is never applied to a graph it
// no longer describes. Only the newest request can be accepted, and only
// while the graph revision it was issued against is still current.
class VALIDATION_EXPORT ValidationGate final {
public:
    struct Ticket {
        quint64 sequence = 0;
        quint64 revision = 0;
    };

    enum class Verdict : quint8 {
        Accept,
        Superseded,
        GraphChanged
    };

    Ticket issue(quint64 graphRevision);
    Verdict check(const Ticket& ticket, quint64 currentRevision) const noexcept;

    // Every outstanding ticket becomes superseded.
    void invalidate() noexcept { ++m_sequence; }

    quint64 latestSequence() const noexcept { return m_sequence; }

private:
    quint64 m_sequence = 0;
};

} // namespace Validation
