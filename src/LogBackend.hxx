// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_LOG_BACKEND_HXX
#define LILT_LOG_BACKEND_HXX

#include "LogLevel.hxx"

#include <cstdio>

void
SetLogThreshold(LogLevel _threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

void
EnableLogTimestamp() noexcept;

/**
 * Redirect all log messages to the given stream (default is
 * stderr).  The caller retains ownership.
 */
void
SetLogFile(FILE *file) noexcept;

#endif
