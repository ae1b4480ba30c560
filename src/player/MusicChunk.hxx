// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_MUSIC_CHUNK_HXX
#define LILT_MUSIC_CHUNK_HXX

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

/**
 * A chunk of music data, one slot in a #MusicPipe.  It contains
 * interleaved floating point samples in the output format.  The
 * struct is trivial, because it lives inside a lock-free
 * #RingBuffer and is filled in place.
 */
struct MusicChunk {
	/**
	 * The number of samples (not frames) per chunk.
	 */
	static constexpr std::size_t SAMPLES = 1024;

	/**
	 * This is the first chunk of a track; the output reports
	 * the track as started when it gets here.
	 */
	static constexpr uint8_t START = 0x1;

	/**
	 * This (empty) chunk marks the end of a track.
	 */
	static constexpr uint8_t END = 0x2;

	uint64_t track_id;

	/**
	 * The output frame index of the first frame in #data,
	 * relative to the start of the track.
	 */
	uint64_t first_frame;

	/**
	 * The flush generation this chunk belongs to; the output
	 * skips chunks of older generations (e.g. after a seek).
	 */
	uint32_t serial;

	uint16_t n_frames;

	uint8_t flags;

	float data[SAMPLES];

	bool IsStart() const noexcept {
		return flags & START;
	}

	bool IsEnd() const noexcept {
		return flags & END;
	}

	std::span<const float> GetData(unsigned channels) const noexcept {
		return {data, std::size_t(n_frames) * channels};
	}
};

static_assert(std::is_trivial_v<MusicChunk>);

/**
 * Compare two flush serial numbers, tolerating wraparound.
 */
constexpr bool
IsOlderSerial(uint32_t a, uint32_t b) noexcept
{
	return int32_t(a - b) < 0;
}

#endif
