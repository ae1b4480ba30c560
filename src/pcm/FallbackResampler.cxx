// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "FallbackResampler.hxx"
#include "AudioFormat.hxx"

#include <algorithm>
#include <cassert>
#include <cmath>

void
FallbackPcmResampler::Open(unsigned _channels,
			   unsigned src_rate, unsigned dest_rate)
{
	assert(_channels > 0 && _channels <= previous.size());
	assert(IsValidSampleRate(src_rate));
	assert(IsValidSampleRate(dest_rate));

	channels = _channels;
	in_rate = src_rate;
	out_rate = dest_rate;

	Reset();
}

void
FallbackPcmResampler::Close() noexcept
{
	buffer.Clear();
}

void
FallbackPcmResampler::Reset() noexcept
{
	consumed = 0;
	emitted = 0;
	flushed = false;
	previous.fill(0);
}

std::span<const float>
FallbackPcmResampler::Resample(std::span<const float> src)
{
	assert(src.size() % channels == 0);
	assert(!flushed);

	const uint64_t n_frames = src.size() / channels;
	if (n_frames == 0)
		return {};

	const uint64_t first = consumed;
	const uint64_t last = first + n_frames - 1;

	/* the number of output frames whose input position is not
	   beyond the last frame of this block */
	const uint64_t total = last * out_rate / in_rate + 1;
	const std::size_t n_out = total - emitted;

	auto dest = buffer.Get(n_out * channels);
	float *out = dest.data();

	for (; emitted < total; ++emitted) {
		const uint64_t num = emitted * in_rate;
		const uint64_t index = num / out_rate;
		const float frac = float(num % out_rate) / float(out_rate);

		/* index may be one frame before this block */
		assert(index + 1 >= first);
		assert(index <= last);

		const float *a = index < first
			? previous.data()
			: &src[(index - first) * channels];
		const float *b = index < last
			? &src[(index + 1 - first) * channels]
			: a;

		for (unsigned c = 0; c < channels; ++c)
			*out++ = a[c] + (b[c] - a[c]) * frac;
	}

	std::copy_n(&src[(n_frames - 1) * channels], channels,
		    previous.begin());
	consumed += n_frames;

	return {dest.data(), n_out * channels};
}

std::span<const float>
FallbackPcmResampler::Flush()
{
	if (flushed)
		return {};

	flushed = true;

	const uint64_t target =
		std::llround(double(consumed) * out_rate / in_rate);
	if (target <= emitted)
		return {};

	/* hold the last frame */
	const std::size_t n_out = target - emitted;
	auto dest = buffer.Get(n_out * channels);
	for (std::size_t i = 0; i < n_out; ++i)
		std::copy_n(previous.begin(), channels,
			    &dest[i * channels]);

	emitted = target;
	return {dest.data(), n_out * channels};
}
