// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_LOG_LEVEL_HXX
#define LILT_LOG_LEVEL_HXX

/**
 * Message severity, in ascending order.
 */
enum class LogLevel {
	DEBUG,

	/**
	 * Progress which is only interesting with "log_level info".
	 */
	INFO,

	/**
	 * The default threshold: track changes, detected devices.
	 */
	NOTICE,

	/**
	 * Something went wrong, but playback goes on.
	 */
	WARNING,

	ERROR,
};

#endif
