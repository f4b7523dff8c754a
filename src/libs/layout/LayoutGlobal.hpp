// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(CALLFLOW_BUILD_SHARED) && (CALLFLOW_BUILD_SHARED == 1)
#	if defined(LAYOUT_LIBRARY)
#		define LAYOUT_EXPORT Q_DECL_EXPORT
#	else
#		define LAYOUT_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define LAYOUT_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(layoutlog)
