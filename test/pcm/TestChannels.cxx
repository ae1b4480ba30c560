// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "pcm/ChannelsConverter.hxx"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>

TEST(PcmChannelsTest, MonoToStereo)
{
	static constexpr std::array<float, 3> src{0.1f, -0.5f, 1.f};

	PcmChannelsConverter converter;
	converter.Open(1, 2);
	const auto dest = converter.Convert(src);
	ASSERT_EQ(dest.size(), 6U);
	for (std::size_t i = 0; i < src.size(); ++i) {
		EXPECT_FLOAT_EQ(dest[i * 2], src[i]);
		EXPECT_FLOAT_EQ(dest[i * 2 + 1], src[i]);
	}
	converter.Close();
}

TEST(PcmChannelsTest, StereoToMono)
{
	static constexpr std::array<float, 4> src{0.2f, 0.4f, -1.f, 1.f};

	PcmChannelsConverter converter;
	converter.Open(2, 1);
	const auto dest = converter.Convert(src);
	ASSERT_EQ(dest.size(), 2U);
	EXPECT_FLOAT_EQ(dest[0], 0.3f);
	EXPECT_FLOAT_EQ(dest[1], 0.f);
	converter.Close();
}

TEST(PcmChannelsTest, SurroundToStereo)
{
	static constexpr std::array<float, 6> src{
		0.6f, 0.6f, 0.f, 0.f, 0.3f, 0.3f,
	};

	PcmChannelsConverter converter;
	converter.Open(6, 2);
	const auto dest = converter.Convert(src);
	ASSERT_EQ(dest.size(), 2U);
	EXPECT_FLOAT_EQ(dest[0], 0.3f);
	EXPECT_FLOAT_EQ(dest[1], 0.3f);
	converter.Close();
}

TEST(PcmChannelsTest, StereoToSurround)
{
	static constexpr std::array<float, 4> src{0.1f, 0.2f, 0.3f, 0.4f};

	PcmChannelsConverter converter;
	converter.Open(2, 4);
	const auto dest = converter.Convert(src);
	ASSERT_EQ(dest.size(), 8U);
	EXPECT_FLOAT_EQ(dest[0], 0.1f);
	EXPECT_FLOAT_EQ(dest[1], 0.2f);
	EXPECT_FLOAT_EQ(dest[2], 0.f);
	EXPECT_FLOAT_EQ(dest[3], 0.f);
	EXPECT_FLOAT_EQ(dest[4], 0.3f);
	EXPECT_FLOAT_EQ(dest[5], 0.4f);
	EXPECT_FLOAT_EQ(dest[6], 0.f);
	EXPECT_FLOAT_EQ(dest[7], 0.f);
	converter.Close();
}

TEST(PcmChannelsTest, Passthrough)
{
	static constexpr std::array<float, 4> src{0.1f, 0.2f, 0.3f, 0.4f};

	PcmChannelsConverter converter;
	converter.Open(2, 2);
	const auto dest = converter.Convert(src);
	EXPECT_EQ(dest.data(), src.data());
	EXPECT_EQ(dest.size(), src.size());
	converter.Close();
}

TEST(PcmChannelsTest, Invalid)
{
	PcmChannelsConverter converter;
	EXPECT_THROW(converter.Open(0, 2), std::runtime_error);
	EXPECT_THROW(converter.Open(2, 9), std::runtime_error);
}
