// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_TEST_FAKE_DECODER_PLUGIN_HXX
#define LILT_TEST_FAKE_DECODER_PLUGIN_HXX

#include "pcm/AudioFormat.hxx"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

struct DecoderPlugin;

/**
 * A scripted audio file for #fake_decoder_plugin.  Each frame
 * carries its own index, see FakeFrameValue().
 */
struct FakeTrack {
	static constexpr uint64_t NEVER = std::numeric_limits<uint64_t>::max();

	/**
	 * Distinguishes the samples of different tracks.
	 */
	unsigned key = 1;

	AudioFormat format{8000, SampleFormat::FLOAT, 2};

	uint64_t n_frames = 8000;

	bool seekable = true;

	/**
	 * Does the stream announce its duration?
	 */
	bool known_duration = true;

	/**
	 * Throw this many corrupt frame errors in a row when the
	 * stream reaches the given (native) frame.
	 */
	uint64_t corrupt_at = NEVER;
	unsigned corrupt_count = 0;

	/**
	 * Block in Read() for the given time when the stream
	 * reaches this frame, simulating a slow disk.
	 */
	uint64_t stall_at = NEVER;
	std::chrono::milliseconds stall{0};
};

/**
 * The sample value of the given frame; it is exact in 32 bit
 * floating point.
 */
constexpr float
FakeFrameValue(unsigned key, uint64_t frame) noexcept
{
	return float(key * 1000000 + frame) / 16777216.f;
}

/**
 * Reverse FakeFrameValue().
 *
 * @return the frame index, or -1 if the value does not belong to
 * this key
 */
int64_t
FakeFrameIndex(unsigned key, float value) noexcept;

/**
 * Create an empty file with the suffix ".fake" and register the
 * script for it.
 *
 * @return the path of the new file
 */
std::string
AddFakeTrack(const char *name, const FakeTrack &track);

void
ClearFakeTracks() noexcept;

/**
 * How often was the given file opened?
 */
unsigned
GetFakeOpenCount(const std::string &path) noexcept;

extern const DecoderPlugin fake_decoder_plugin;

#endif
