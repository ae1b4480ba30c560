// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PLAYER_STATE_HXX
#define LILT_PLAYER_STATE_HXX

#include <cstdint>

enum class PlayerState : uint8_t {
	STOP,
	PLAY,
	PAUSE,

	/**
	 * A seek is in progress; the previous state (#PLAY or
	 * #PAUSE) is restored when the decoder has buffered enough
	 * at the new position.
	 */
	SEEK,

	/**
	 * The last queued track has been decoded completely and
	 * the output is playing what is left in the pipe.
	 */
	TRACK_ENDING,
};

[[gnu::const]]
const char *
ToString(PlayerState state) noexcept;

/**
 * Does the output consume frames in this state?
 */
constexpr bool
IsRendering(PlayerState state) noexcept
{
	return state == PlayerState::PLAY ||
		state == PlayerState::TRACK_ENDING;
}

#endif
