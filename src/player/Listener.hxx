// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PLAYER_LISTENER_HXX
#define LILT_PLAYER_LISTENER_HXX

#include "State.hxx"

#include <cstdint>
#include <exception>

/**
 * Receives player events.  All methods are invoked from the decoder
 * thread, without holding any player lock; implementations must not
 * block for long and must not call back into #PlayerControl
 * synchronously.
 */
class PlayerListener {
public:
	virtual void OnPlayerStateChanged(PlayerState state) noexcept = 0;

	/**
	 * The output has begun playing this track.
	 */
	virtual void OnTrackStarted(uint64_t track_id) noexcept = 0;

	/**
	 * The output has played the last frame of this track.
	 */
	virtual void OnTrackEnded(uint64_t track_id) noexcept = 0;

	/**
	 * The track could not be opened or failed fatally while
	 * decoding; the player has moved on to the next track (or
	 * stopped).
	 */
	virtual void OnTrackError(uint64_t track_id,
				  std::exception_ptr error) noexcept = 0;

	/**
	 * The decoder has skipped one or more corrupt frames and
	 * continues.  This is reported once per run of consecutive
	 * corrupt frames.
	 */
	virtual void OnRecoveredDecodeError(uint64_t track_id,
					    std::exception_ptr error) noexcept = 0;

	virtual void OnSeekError(uint64_t track_id,
				 std::exception_ptr error) noexcept = 0;
};

#endif
