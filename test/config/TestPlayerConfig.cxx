// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "TestFiles.hxx"
#include "config/PlayerConfig.hxx"
#include "config/Data.hxx"
#include "config/Block.hxx"
#include "config/Param.hxx"
#include "config/File.hxx"
#include "config/Option.hxx"

#include <gtest/gtest.h>

#include <span>
#include <stdexcept>
#include <system_error>
#include <string_view>

static ConfigData
LoadConfig(std::string_view contents)
{
	const auto path = MakeTestPath("lilt.conf");
	WriteTestFile(path, std::as_bytes(std::span{contents}));

	ConfigData config;
	ReadConfigFile(config, path.c_str());
	return config;
}

TEST(PlayerConfig, Defaults)
{
	const ConfigData empty;
	const PlayerConfig config(empty);

	EXPECT_EQ(config.audio_format, AudioFormat(48000, SampleFormat::FLOAT, 2));
	EXPECT_EQ(config.buffer_time, std::chrono::milliseconds(500));
	EXPECT_EQ(config.decode_chunk_time, std::chrono::milliseconds(20));
	EXPECT_FALSE(config.cross_fade.IsEnabled());
	EXPECT_EQ(config.cross_fade.curve, CrossFadeCurve::EQUAL_POWER);
	EXPECT_EQ(config.max_crossfade, FloatDuration(10));
	EXPECT_EQ(config.corrupt_frame_threshold, 8U);
	EXPECT_EQ(config.loop_mode, LoopMode::POINTS);
	EXPECT_EQ(config.volume, 100U);

	EXPECT_EQ(config.GetBufferFrames(), 24000U);
	EXPECT_EQ(config.GetDecodeChunkFrames(), 960U);
	EXPECT_EQ(config.GetPipeFrames(), 24000U + 480000U + 2 * 960U);
}

TEST(PlayerConfig, File)
{
	const auto data = LoadConfig(R"(
# comment
audio_output_format "44100:16:2"
audio_buffer_time "200"
decode_chunk_time "10"
crossfade "2.5"
crossfade_curve "linear"
max_crossfade "5"
corrupt_frame_threshold "3"
loop_mode "track"
volume "150"

resampler {
	plugin "internal"
}
)");

	const PlayerConfig config(data);
	EXPECT_EQ(config.audio_format, AudioFormat(44100, SampleFormat::S16, 2));
	EXPECT_EQ(config.buffer_time, std::chrono::milliseconds(200));
	EXPECT_EQ(config.decode_chunk_time, std::chrono::milliseconds(10));
	EXPECT_TRUE(config.cross_fade.IsEnabled());
	EXPECT_DOUBLE_EQ(config.cross_fade.duration.count(), 2.5);
	EXPECT_EQ(config.cross_fade.curve, CrossFadeCurve::LINEAR);
	EXPECT_DOUBLE_EQ(config.max_crossfade.count(), 5);
	EXPECT_EQ(config.corrupt_frame_threshold, 3U);
	EXPECT_EQ(config.loop_mode, LoopMode::TRACK);
	EXPECT_EQ(config.volume, 150U);

	const auto *block = data.GetBlock(ConfigBlockOption::RESAMPLER);
	ASSERT_NE(block, nullptr);
	EXPECT_STREQ(block->GetString("plugin"), "internal");

	/* the decode chunk has a lower limit */
	EXPECT_EQ(config.GetDecodeChunkFrames(), 441U);
}

TEST(PlayerConfig, MinimumBufferTime)
{
	const auto data = LoadConfig("audio_buffer_time \"10\"\n");
	const PlayerConfig config(data);
	EXPECT_EQ(config.buffer_time, PlayerConfig::MIN_BUFFER_TIME);
}

TEST(PlayerConfig, Invalid)
{
	EXPECT_THROW(PlayerConfig(LoadConfig("volume \"201\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("crossfade \"11\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("crossfade \"-1\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("crossfade_curve \"cubic\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("loop_mode \"forever\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("audio_output_format \"48000:f\"\n")),
		     std::runtime_error);
	EXPECT_THROW(PlayerConfig(LoadConfig("audio_buffer_time \"0\"\n")),
		     std::runtime_error);
}

TEST(ConfigFile, Errors)
{
	EXPECT_THROW(LoadConfig("no_such_setting \"1\"\n"), std::runtime_error);
	EXPECT_THROW(LoadConfig("resampler {\nplugin \"internal\"\n"),
		     std::runtime_error);
	EXPECT_THROW(LoadConfig("volume\n"), std::runtime_error);

	ConfigData config;
	EXPECT_THROW(ReadConfigFile(config, "/nonexistent/lilt.conf"),
		     std::system_error);
}

TEST(ConfigFile, QuotedValues)
{
	const auto data = LoadConfig(R"(log_file "/tmp/a \"b\"\\c" # trailing
audio_output {
	type "null"
	name "with # hash"
}
)");

	const auto *param = data.GetParam(ConfigOption::LOG_FILE);
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->value, "/tmp/a \"b\"\\c");
	EXPECT_EQ(param->line, 1);

	const auto *block = data.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	ASSERT_NE(block, nullptr);
	EXPECT_EQ(block->line, 2);
	EXPECT_STREQ(block->GetString("name"), "with # hash");
}

TEST(ConfigFile, LastSettingWins)
{
	const auto data = LoadConfig("volume \"10\"\nvolume \"20\"\n");
	EXPECT_EQ(data.GetUnsigned(ConfigOption::VOLUME, 0), 20U);
}

TEST(ConfigFile, DecoderBlocks)
{
	const auto data = LoadConfig(R"(
decoder {
	plugin "wave"
}
decoder {
	plugin "ffmpeg"
	enabled "no"
}
)");

	EXPECT_EQ(data.GetBlocks(ConfigBlockOption::DECODER).size(), 2U);

	const auto *ffmpeg =
		data.FindBlock(ConfigBlockOption::DECODER, "plugin", "ffmpeg");
	ASSERT_NE(ffmpeg, nullptr);
	EXPECT_FALSE(ffmpeg->GetBool("enabled", true));

	EXPECT_EQ(data.FindBlock(ConfigBlockOption::DECODER, "plugin", "mad"),
		  nullptr);
}

TEST(ConfigFile, Duplicates)
{
	/* only "decoder" may be repeated */
	EXPECT_THROW(LoadConfig("resampler {\n}\nresampler {\n}\n"),
		     std::runtime_error);

	EXPECT_THROW(LoadConfig("audio_output {\ntype \"null\"\ntype \"alsa\"\n}\n"),
		     std::runtime_error);
}

TEST(ConfigFile, Syntax)
{
	EXPECT_THROW(LoadConfig("volume 10\n"), std::runtime_error);
	EXPECT_THROW(LoadConfig("volume \"10\n"), std::runtime_error);
	EXPECT_THROW(LoadConfig("volume \"10\" \"20\"\n"), std::runtime_error);
	EXPECT_THROW(LoadConfig("resampler\n"), std::runtime_error);
	EXPECT_THROW(LoadConfig("resampler { plugin \"soxr\" }\n"),
		     std::runtime_error);
}
