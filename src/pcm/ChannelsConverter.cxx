// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "ChannelsConverter.hxx"
#include "AudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <algorithm>
#include <cassert>

static float *
MonoToStereo(float *dest, const float *src, const float *end) noexcept
{
	while (src != end) {
		const auto value = *src++;

		*dest++ = value;
		*dest++ = value;
	}

	return dest;
}

static float *
StereoToMono(float *dest, const float *src, const float *end) noexcept
{
	while (src != end) {
		const auto a = *src++;
		const auto b = *src++;

		*dest++ = (a + b) / 2;
	}

	return dest;
}

/**
 * Downmix N channels to stereo by averaging all channels.
 */
static float *
NToStereo(float *dest, unsigned src_channels,
	  const float *src, const float *end) noexcept
{
	assert((end - src) % src_channels == 0);

	while (src != end) {
		float sum = *src++;
		for (unsigned c = 1; c < src_channels; ++c)
			sum += *src++;

		const float value = sum / float(src_channels);

		*dest++ = value;
		*dest++ = value;
	}

	return dest;
}

/**
 * Convert stereo to N channels (where N > 2).  Left and right map to
 * the first two channels (front left and front right), and the
 * remaining (surround) channels are filled with silence.
 */
static float *
StereoToN(float *dest, unsigned dest_channels,
	  const float *src, const float *end) noexcept
{
	assert(dest_channels > 2);
	assert((end - src) % 2 == 0);

	while (src != end) {
		*dest++ = *src++;
		*dest++ = *src++;

		dest = std::fill_n(dest, dest_channels - 2, 0.f);
	}

	return dest;
}

static float *
NToM(float *dest, unsigned dest_channels, unsigned src_channels,
     const float *src, const float *end) noexcept
{
	assert((end - src) % src_channels == 0);

	while (src != end) {
		float sum = *src++;
		for (unsigned c = 1; c < src_channels; ++c)
			sum += *src++;

		dest = std::fill_n(dest, dest_channels,
				   sum / float(src_channels));
	}

	return dest;
}

void
PcmChannelsConverter::Open(unsigned _src_channels, unsigned _dest_channels)
{
	if (!IsValidChannelCount(_src_channels) ||
	    !IsValidChannelCount(_dest_channels))
		throw FmtRuntimeError("PCM channel conversion from {} to {} is not supported",
				      _src_channels, _dest_channels);

	src_channels = _src_channels;
	dest_channels = _dest_channels;
}

void
PcmChannelsConverter::Close() noexcept
{
	src_channels = dest_channels = 0;
	buffer.Clear();
}

std::span<const float>
PcmChannelsConverter::Convert(std::span<const float> src)
{
	assert(src_channels > 0);
	assert(src.size() % src_channels == 0);

	if (src_channels == dest_channels)
		return src;

	const std::size_t dest_size = src.size() / src_channels * dest_channels;
	auto dest = buffer.Get(dest_size);
	float *d = dest.data();
	const float *s = src.data(), *end = s + src.size();

	if (src_channels == 1 && dest_channels == 2)
		MonoToStereo(d, s, end);
	else if (src_channels == 2 && dest_channels == 1)
		StereoToMono(d, s, end);
	else if (dest_channels == 2)
		NToStereo(d, src_channels, s, end);
	else if (src_channels == 2 && dest_channels > 2)
		StereoToN(d, dest_channels, s, end);
	else
		NToM(d, dest_channels, src_channels, s, end);

	return {dest.data(), dest_size};
}
