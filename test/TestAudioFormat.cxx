// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "pcm/AudioFormat.hxx"
#include "pcm/AudioParser.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

struct AudioFormatStringTest {
	AudioFormat af;
	const char *s;
};

static constexpr AudioFormatStringTest af_string_tests[] = {
	{ AudioFormat(44100, SampleFormat::S8, 1), "44100:8:1" },
	{ AudioFormat(44100, SampleFormat::S16, 2), "44100:16:2" },
	{ AudioFormat(48000, SampleFormat::S24_P32, 6), "48000:24:6" },
	{ AudioFormat(96000, SampleFormat::S32, 2), "96000:32:2" },
	{ AudioFormat(192000, SampleFormat::FLOAT, 2), "192000:f:2" },
};

TEST(AudioFormatTest, ToString)
{
	for (const auto &i : af_string_tests)
		EXPECT_STREQ(i.s, ToString(i.af).c_str());

	EXPECT_EQ(ToString(AudioFormat(44100, SampleFormat::UNDEFINED, 1)),
		  "44100:*:1");
}

TEST(AudioFormatTest, Parse)
{
	for (const auto &i : af_string_tests)
		EXPECT_EQ(i.af, ParseAudioFormat(i.s));
}

TEST(AudioFormatTest, ParseInvalid)
{
	EXPECT_THROW(ParseAudioFormat(""), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("48000"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("48000:f"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("48000:x:2"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("0:f:2"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("48000:f:0"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("48000:f:9"), std::invalid_argument);
	EXPECT_THROW(ParseAudioFormat("*:f:2"), std::invalid_argument);
}

TEST(AudioFormatTest, Frames)
{
	const AudioFormat af(48000, SampleFormat::FLOAT, 2);
	EXPECT_EQ(af.GetFrameSize(), 8U);
	EXPECT_EQ(af.TimeToFrames(std::chrono::milliseconds(500)), 24000U);
	EXPECT_EQ(af.TimeToFrames(std::chrono::seconds(3)), 144000U);

	const AudioFormat s16(44100, SampleFormat::S16, 1);
	EXPECT_EQ(s16.GetFrameSize(), 2U);
	EXPECT_EQ(s16.TimeToFrames(std::chrono::milliseconds(20)), 882U);
}
