// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#ifndef UTILS_GUARD_RET
#	define UTILS_GUARD_RET(cond, ret) do { if (!(cond)) return (ret); } while (false)
#endif

// Fatal in debug builds; in release the caller has already logged and bailed.
#ifndef UTILS_ASSERT_MSG
#	define UTILS_ASSERT_MSG(cond, msg) Q_ASSERT_X((cond), Q_FUNC_INFO, (msg))
#endif
