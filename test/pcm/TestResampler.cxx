// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "pcm/FallbackResampler.hxx"
#include "pcm/AudioFormat.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

static std::vector<float>
MakeRamp(std::size_t n_frames, unsigned channels)
{
	std::vector<float> v;
	v.reserve(n_frames * channels);
	for (std::size_t i = 0; i < n_frames; ++i)
		for (unsigned c = 0; c < channels; ++c)
			v.push_back(float(i) / 1000.f + float(c));
	return v;
}

static std::vector<float>
ResampleAll(unsigned in_rate, unsigned out_rate, unsigned channels,
	    const std::vector<float> &src, std::size_t block_frames)
{
	FallbackPcmResampler r;
	r.Open(channels, in_rate, out_rate);

	std::vector<float> result;
	std::size_t pos = 0;
	while (pos < src.size()) {
		const std::size_t n = std::min(block_frames * channels,
					       src.size() - pos);
		const auto dest = r.Resample({src.data() + pos, n});
		result.insert(result.end(), dest.begin(), dest.end());
		pos += n;
	}

	const auto tail = r.Flush();
	result.insert(result.end(), tail.begin(), tail.end());
	r.Close();
	return result;
}

TEST(FallbackResampler, SameRate)
{
	const auto src = MakeRamp(1000, 2);
	const auto dest = ResampleAll(48000, 48000, 2, src, 128);
	EXPECT_EQ(dest, src);
}

TEST(FallbackResampler, Downsample)
{
	const auto src = MakeRamp(1000, 1);
	const auto dest = ResampleAll(96000, 48000, 1, src, 100);
	ASSERT_EQ(dest.size(), 500U);
	for (std::size_t i = 0; i < dest.size(); ++i)
		EXPECT_FLOAT_EQ(dest[i], src[i * 2]);
}

TEST(FallbackResampler, Upsample)
{
	const auto src = MakeRamp(1000, 1);
	const auto dest = ResampleAll(24000, 48000, 1, src, 100);
	ASSERT_EQ(dest.size(), 2000U);

	/* linear interpolation of a ramp is exact */
	for (std::size_t i = 0; i + 2 < dest.size(); ++i)
		EXPECT_NEAR(dest[i], float(i) / 2000.f, 1e-5);
}

TEST(FallbackResampler, FrameCount)
{
	/* one second of 44.1 kHz becomes exactly one second of
	   48 kHz */
	const auto src = MakeRamp(44100, 2);
	const auto dest = ResampleAll(44100, 48000, 2, src, 1024);
	EXPECT_EQ(dest.size(), 48000U * 2);

	const auto odd = MakeRamp(1001, 1);
	const auto dest2 = ResampleAll(44100, 48000, 1, odd, 64);
	EXPECT_EQ(dest2.size(),
		  std::size_t(std::llround(1001. * 48000 / 44100)));
}

/**
 * Converting to another rate and back yields the original frame
 * count (within one frame) and, for a ramp, the original values.
 */
TEST(FallbackResampler, RoundTrip)
{
	for (const std::size_t n : {1001, 12345, 44100}) {
		const auto src = MakeRamp(n, 2);
		const auto there = ResampleAll(44100, 48000, 2, src, 1024);
		const auto back = ResampleAll(48000, 44100, 2, there, 1000);

		ASSERT_EQ(back.size() % 2, 0U);
		const auto frames = back.size() / 2;
		EXPECT_LE(std::max(frames, n) - std::min(frames, n), 1U)
			<< "n=" << n;

		/* the last frames are held, not interpolated */
		const std::size_t checked = std::min(frames, n) - 2;
		for (std::size_t i = 0; i < checked * 2; ++i)
			ASSERT_NEAR(back[i], src[i], 1e-3)
				<< "n=" << n << " sample " << i;
	}
}

/**
 * The output must not depend on how the input is split into
 * blocks.
 */
TEST(FallbackResampler, BlockSplitting)
{
	const auto src = MakeRamp(5000, 2);
	const auto reference = ResampleAll(44100, 48000, 2, src, 5000);

	for (const std::size_t block : {1, 7, 64, 333, 1024}) {
		const auto dest = ResampleAll(44100, 48000, 2, src, block);
		EXPECT_EQ(dest, reference) << "block=" << block;
	}
}

TEST(FallbackResampler, Reset)
{
	const auto src = MakeRamp(300, 1);

	FallbackPcmResampler r;
	r.Open(1, 44100, 48000);

	const auto a = r.Resample(src);
	const std::vector<float> first(a.begin(), a.end());

	r.Reset();
	const auto b = r.Resample(src);
	EXPECT_EQ(std::vector<float>(b.begin(), b.end()), first);
}
