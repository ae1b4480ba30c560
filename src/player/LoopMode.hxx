// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_LOOP_MODE_HXX
#define LILT_LOOP_MODE_HXX

#include <cstdint>

enum class LoopMode : uint8_t {
	/**
	 * Ignore loop points, play every track to its end.
	 */
	NONE,

	/**
	 * Repeat the region between the loop points of tracks which
	 * have them.
	 */
	POINTS,

	/**
	 * Repeat every track; the region between its loop points if
	 * it has them, else the whole track.
	 */
	TRACK,
};

/**
 * Throws std::invalid_argument on error.
 */
LoopMode
ParseLoopMode(const char *s);

[[gnu::const]]
const char *
ToString(LoopMode mode) noexcept;

#endif
