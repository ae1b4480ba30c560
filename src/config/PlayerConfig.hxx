// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_PLAYER_CONFIG_HXX
#define LILT_CONFIG_PLAYER_CONFIG_HXX

#include "pcm/AudioFormat.hxx"
#include "pcm/Volume.hxx"
#include "player/CrossFade.hxx"
#include "player/LoopMode.hxx"
#include "Chrono.hxx"

#include <algorithm>
#include <chrono>
#include <cstddef>

struct ConfigData;

struct PlayerConfig {
	static constexpr std::chrono::milliseconds DEFAULT_BUFFER_TIME{500};
	static constexpr std::chrono::milliseconds MIN_BUFFER_TIME{50};

	static constexpr std::chrono::milliseconds DEFAULT_DECODE_CHUNK_TIME{20};

	static constexpr unsigned DEFAULT_CORRUPT_FRAME_THRESHOLD = 8;

	static constexpr AudioFormat DEFAULT_AUDIO_FORMAT{48000, SampleFormat::FLOAT, 2};

	static constexpr FloatDuration DEFAULT_MAX_CROSSFADE{10};

	/**
	 * The "audio_output_format" setting.  The sample format is
	 * what the device gets; the engine always works with
	 * floating point samples.
	 */
	AudioFormat audio_format = DEFAULT_AUDIO_FORMAT;

	/**
	 * How much decoded audio the decoder thread keeps ahead of
	 * the output.
	 */
	std::chrono::milliseconds buffer_time = DEFAULT_BUFFER_TIME;

	/**
	 * The amount of audio decoded in one iteration of the
	 * decoder loop.
	 */
	std::chrono::milliseconds decode_chunk_time = DEFAULT_DECODE_CHUNK_TIME;

	CrossFadeSettings cross_fade;

	/**
	 * The longest cross-fade which may be configured at run
	 * time; the pipes are sized for it.
	 */
	FloatDuration max_crossfade = DEFAULT_MAX_CROSSFADE;

	unsigned corrupt_frame_threshold = DEFAULT_CORRUPT_FRAME_THRESHOLD;

	LoopMode loop_mode = LoopMode::POINTS;

	unsigned volume = PCM_VOLUME_1;

	PlayerConfig() = default;

	/**
	 * Throws on error.
	 */
	explicit PlayerConfig(const ConfigData &config);

	std::size_t GetBufferFrames() const noexcept {
		return audio_format.TimeToFrames(buffer_time);
	}

	std::size_t GetDecodeChunkFrames() const noexcept {
		return std::max<std::size_t>(audio_format.TimeToFrames(decode_chunk_time),
					     64);
	}

	/**
	 * The capacity of each pipe: the decode-ahead buffer plus
	 * the tail of the outgoing track during a cross-fade.
	 */
	std::size_t GetPipeFrames() const noexcept {
		return GetBufferFrames() +
			audio_format.TimeToFrames(max_crossfade) +
			2 * GetDecodeChunkFrames();
	}
};

#endif
