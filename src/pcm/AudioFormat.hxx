// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_AUDIO_FORMAT_HXX
#define LILT_AUDIO_FORMAT_HXX

#include "pcm/SampleFormat.hxx" // IWYU pragma: export

#include <cstdint>
#include <string>

static constexpr unsigned MAX_CHANNELS = 8;

constexpr bool
IsValidSampleRate(uint32_t sample_rate) noexcept
{
	return sample_rate > 0 && sample_rate < (1U << 30);
}

constexpr bool
IsValidChannelCount(unsigned channels) noexcept
{
	return channels >= 1 && channels <= MAX_CHANNELS;
}

/**
 * The shape of a PCM stream.  Samples are interleaved; the channel
 * order is the one of WAVE and FLAC.
 */
struct AudioFormat {
	/**
	 * Frames per second.
	 */
	uint32_t sample_rate;

	SampleFormat format;

	uint8_t channels;

	AudioFormat() noexcept = default;

	constexpr AudioFormat(uint32_t _sample_rate,
			      SampleFormat _format, uint8_t _channels) noexcept
		:sample_rate(_sample_rate),
		 format(_format), channels(_channels) {}

	static constexpr AudioFormat Undefined() noexcept {
		return {0, SampleFormat::UNDEFINED, 0};
	}

	constexpr bool IsValid() const noexcept {
		return IsValidSampleRate(sample_rate) &&
			GetSampleSize(format) > 0 &&
			IsValidChannelCount(channels);
	}

	constexpr bool operator==(const AudioFormat &) const noexcept = default;

	/**
	 * The size of one frame in the source format, in bytes.
	 */
	constexpr unsigned GetFrameSize() const noexcept {
		return GetSampleSize(format) * channels;
	}

	/**
	 * Convert a std::chrono::duration to a number of frames,
	 * rounding down.
	 */
	template<typename D>
	constexpr auto TimeToFrames(D t) const noexcept {
		using Period = typename D::period;
		return t.count() * sample_rate * Period::num / Period::den;
	}
};

/**
 * Format as "rate:format:channels", e.g. "48000:f:2".
 */
[[gnu::pure]]
std::string
ToString(AudioFormat af) noexcept;

#endif
