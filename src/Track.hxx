// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_TRACK_HXX
#define LILT_TRACK_HXX

#include "Chrono.hxx"
#include "pcm/AudioFormat.hxx"

#include <cstdint>
#include <optional>
#include <string>

/**
 * Everything the engine needs to know about a track to play it.
 * The library hands out copies of this; once passed to the player,
 * it is not modified.
 */
struct TrackDescriptor {
	/**
	 * The library's identifier for this track; it is reported
	 * back in events and in the #PlayerSnapshot.  Zero means "no
	 * track".
	 */
	uint64_t id = 0;

	/**
	 * Absolute path of the audio file.
	 */
	std::string path;

	/**
	 * Start playback at this offset into the file.  All
	 * positions (including the loop points) are relative to
	 * this offset.
	 */
	SongTime start_offset = SongTime::zero();

	/**
	 * The playback duration, or negative if unknown (i.e. play
	 * to the end of the file).
	 */
	SignedSongTime duration = SignedSongTime::Negative();

	/**
	 * The native format as known by the library.  This is only a
	 * hint; the decoder's findings always win.
	 */
	AudioFormat audio_format = AudioFormat::Undefined();

	/**
	 * Optional loop region.  Without #loop_start, the loop
	 * begins at the start of the track.
	 */
	std::optional<FloatDuration> loop_start, loop_end;

	TrackDescriptor() = default;

	explicit TrackDescriptor(uint64_t _id, std::string _path) noexcept
		:id(_id), path(std::move(_path)) {}

	/**
	 * Are the loop points present and valid?
	 */
	[[gnu::pure]]
	bool HasLoop() const noexcept {
		if (!loop_end || loop_end->count() <= 0)
			return false;

		const auto start = loop_start.value_or(FloatDuration::zero());
		return start.count() >= 0 && start < *loop_end;
	}

	FloatDuration GetLoopStart() const noexcept {
		return loop_start.value_or(FloatDuration::zero());
	}
};

#endif
