// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "TestFiles.hxx"
#include "decoder/Open.hxx"
#include "decoder/Stream.hxx"
#include "decoder/Error.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/plugins/WaveDecoderPlugin.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <array>
#include <system_error>
#include <vector>

#include <errno.h>

static const DecoderPluginList wave_plugins{&wave_decoder_plugin};

static std::vector<float>
MakeStereoRamp(std::size_t n_frames)
{
	std::vector<float> v;
	for (std::size_t i = 0; i < n_frames; ++i) {
		v.push_back(float(i) / 65536.f);
		v.push_back(-float(i) / 65536.f);
	}
	return v;
}

TEST(WaveDecoder, Suffixes)
{
	EXPECT_TRUE(wave_decoder_plugin.SupportsSuffix("wav"));
	EXPECT_TRUE(wave_decoder_plugin.SupportsSuffix("WAV"));
	EXPECT_TRUE(wave_decoder_plugin.SupportsSuffix("wave"));
	EXPECT_FALSE(wave_decoder_plugin.SupportsSuffix("flac"));
}

TEST(WaveDecoder, Float)
{
	const auto path = MakeTestPath("float.wav");
	const auto samples = MakeStereoRamp(8000);
	WriteFloatWaveFile(path, 8000, 2, samples);

	auto stream = DecoderOpenFile(wave_plugins, path.c_str());
	ASSERT_NE(stream, nullptr);
	EXPECT_EQ(stream->GetAudioFormat(),
		  AudioFormat(8000, SampleFormat::FLOAT, 2));
	EXPECT_EQ(stream->GetDuration(), SignedSongTime::FromMS(1000));
	EXPECT_TRUE(stream->IsSeekable());

	std::vector<float> decoded;
	std::array<float, 1000> buffer;
	std::size_t n;
	while ((n = stream->Read(buffer)) > 0)
		decoded.insert(decoded.end(), buffer.begin(),
			       buffer.begin() + n * 2);

	EXPECT_EQ(decoded, samples);
}

TEST(WaveDecoder, S16)
{
	const auto path = MakeTestPath("s16.wav");
	static constexpr std::array<int16_t, 4> samples{
		0, 16384, -32768, -8192,
	};
	WriteS16WaveFile(path, 44100, 1, samples);

	auto stream = DecoderOpenFile(wave_plugins, path.c_str());
	EXPECT_EQ(stream->GetAudioFormat(),
		  AudioFormat(44100, SampleFormat::S16, 1));

	std::array<float, 16> buffer;
	ASSERT_EQ(stream->Read(buffer), 4U);
	EXPECT_FLOAT_EQ(buffer[0], 0.f);
	EXPECT_FLOAT_EQ(buffer[1], 0.5f);
	EXPECT_FLOAT_EQ(buffer[2], -1.f);
	EXPECT_FLOAT_EQ(buffer[3], -0.25f);
	EXPECT_EQ(stream->Read(buffer), 0U);
}

TEST(WaveDecoder, Seek)
{
	const auto path = MakeTestPath("seek.wav");
	const auto samples = MakeStereoRamp(8000);
	WriteFloatWaveFile(path, 8000, 2, samples);

	auto stream = DecoderOpenFile(wave_plugins, path.c_str());

	std::array<float, 20> buffer;
	stream->Seek(4000);
	ASSERT_EQ(stream->Read(buffer), 10U);
	EXPECT_EQ(buffer[0], samples[8000]);
	EXPECT_EQ(buffer[19], samples[8019]);

	/* back to the start */
	stream->Seek(0);
	ASSERT_EQ(stream->Read(buffer), 10U);
	EXPECT_EQ(buffer[0], 0.f);

	/* seeking to the end is allowed, beyond is not */
	stream->Seek(8000);
	EXPECT_EQ(stream->Read(buffer), 0U);

	try {
		stream->Seek(8001);
		FAIL();
	} catch (const SeekError &e) {
		EXPECT_EQ(e.GetCode(), SeekResult::OUT_OF_RANGE);
	}
}

TEST(WaveDecoder, NotFound)
{
	const auto path = MakeTestPath("missing.wav");

	try {
		DecoderOpenFile(wave_plugins, path.c_str());
		FAIL();
	} catch (const OpenError &e) {
		EXPECT_EQ(e.GetCode(), OpenResult::NOT_FOUND);

		const auto *nested =
			FindNested<std::system_error>(std::current_exception());
		ASSERT_NE(nested, nullptr);
		EXPECT_EQ(nested->code().value(), ENOENT);
	}
}

TEST(WaveDecoder, NotWave)
{
	const auto path = MakeTestPath("text.wav");
	static constexpr std::array<std::byte, 16> garbage{};
	WriteTestFile(path, garbage);

	try {
		DecoderOpenFile(wave_plugins, path.c_str());
		FAIL();
	} catch (const OpenError &e) {
		EXPECT_EQ(e.GetCode(), OpenResult::UNSUPPORTED_FORMAT);
	}
}

TEST(WaveDecoder, UnsupportedTag)
{
	/* MPEG layer 3 in a WAVE container */
	const auto path = MakeTestPath("mp3.wav");
	static constexpr std::array<std::byte, 8> data{};
	WriteWaveFile(path, 0x0055, 44100, 2, 16, data);

	try {
		DecoderOpenFile(wave_plugins, path.c_str());
		FAIL();
	} catch (const OpenError &e) {
		EXPECT_EQ(e.GetCode(), OpenResult::UNSUPPORTED_FORMAT);
	}
}

TEST(WaveDecoder, Corrupt)
{
	/* RIFF header without any chunk */
	const auto path = MakeTestPath("truncated.wav");
	static constexpr std::array<std::byte, 12> riff{
		std::byte{'R'}, std::byte{'I'}, std::byte{'F'}, std::byte{'F'},
		std::byte{4}, std::byte{0}, std::byte{0}, std::byte{0},
		std::byte{'W'}, std::byte{'A'}, std::byte{'V'}, std::byte{'E'},
	};
	WriteTestFile(path, riff);

	try {
		DecoderOpenFile(wave_plugins, path.c_str());
		FAIL();
	} catch (const OpenError &e) {
		EXPECT_EQ(e.GetCode(), OpenResult::CORRUPT);
		EXPECT_NE(GetFullMessage(std::current_exception()).find("truncated.wav"),
			  std::string::npos);
	}
}
