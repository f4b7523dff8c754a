// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "validation/ValidationGate.hpp"

namespace Validation {

ValidationGate::Ticket ValidationGate::issue(quint64 graphRevision)
{
    return Ticket{++m_sequence, graphRevision};
}

ValidationGate::Verdict ValidationGate::check(const Ticket& ticket, quint64 currentRevision) const noexcept
{
    if (ticket.sequence != m_sequence)
        return Verdict::Superseded;
    if (ticket.revision != currentRevision)
        return Verdict::GraphChanged;
    return Verdict::Accept;
}

} // namespace Validation
