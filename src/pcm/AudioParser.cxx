// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "AudioParser.hxx"
#include "AudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/NumberParser.hxx"
#include "util/StringUtil.hxx"

static uint32_t
ParseSampleRate(std::string_view s)
{
	const auto value = ParseInteger<uint32_t>(s);
	if (!value || !IsValidSampleRate(*value))
		throw FmtInvalidArgument("Invalid sample rate: \"{}\"", s);

	return *value;
}

static SampleFormat
ParseSampleFormat(std::string_view s)
{
	for (const auto format : {SampleFormat::S8, SampleFormat::S16,
				  SampleFormat::S24_P32, SampleFormat::S32,
				  SampleFormat::FLOAT})
		if (s == ToString(format))
			return format;

	throw FmtInvalidArgument("Invalid sample format: \"{}\"", s);
}

static uint8_t
ParseChannelCount(std::string_view s)
{
	const auto value = ParseInteger<unsigned>(s);
	if (!value || !IsValidChannelCount(*value))
		throw FmtInvalidArgument("Invalid channel count: \"{}\"", s);

	return uint8_t(*value);
}

AudioFormat
ParseAudioFormat(std::string_view src)
{
	const auto [rate, rest] = Split(src, ':');
	const auto [format, channels] = Split(rest, ':');

	if (rest.empty())
		throw std::invalid_argument("Sample format missing");

	if (channels.empty())
		throw std::invalid_argument("Channel count missing");

	return {
		ParseSampleRate(rate),
		ParseSampleFormat(format),
		ParseChannelCount(channels),
	};
}
