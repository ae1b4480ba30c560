// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_CHANNELS_CONVERTER_HXX
#define LILT_PCM_CHANNELS_CONVERTER_HXX

#include "Buffer.hxx"

#include <span>

/**
 * Up- and downmixing of interleaved float frames.  Mono is
 * duplicated, stereo is averaged to mono, stereo goes to the front
 * pair of a surround layout with silent remaining channels, and
 * everything else is averaged over all source channels.
 */
class PcmChannelsConverter {
	unsigned src_channels = 0, dest_channels = 0;

	PcmBuffer buffer;

public:
	/**
	 * Throws std::runtime_error if a channel count is out of
	 * range.
	 */
	void Open(unsigned src_channels, unsigned dest_channels);

	void Close() noexcept;

	/**
	 * @return the converted frames, valid until the next call;
	 * @src itself if the channel counts are equal
	 */
	std::span<const float> Convert(std::span<const float> src);
};

#endif
