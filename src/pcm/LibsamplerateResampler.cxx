// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "LibsamplerateResampler.hxx"
#include "AudioFormat.hxx"
#include "config/Block.hxx"
#include "config/Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"
#include "Log.hxx"

#include <cassert>
#include <optional>

static constexpr Domain libsamplerate_domain("libsamplerate");

static int converter_type = SRC_SINC_MEDIUM_QUALITY;

/* libsamplerate output is drained in chunks of this many frames */
static constexpr std::size_t FLUSH_FRAMES = 1024;

/**
 * Look up a converter by its number or by its name as reported by
 * src_get_name().
 */
static std::optional<int>
FindConverter(const char *s)
{
	for (int i = 0; src_get_name(i) != nullptr; ++i)
		if (StringIsEqualIgnoreCase(s, src_get_name(i)))
			return i;

	try {
		const int i = ParseUnsigned(s);
		if (src_get_name(i) != nullptr)
			return i;
	} catch (const std::runtime_error &) {
		/* neither a name nor a number */
	}

	return std::nullopt;
}

void
LibsampleratePcmResampler::Configure(const ConfigBlock &block)
{
	const char *type = block.GetString("type");
	if (type == nullptr)
		return;

	const auto found = FindConverter(type);
	if (!found)
		throw FmtRuntimeError("unknown libsamplerate converter '{}' in line {}",
				      type, block.line);

	converter_type = *found;
	FmtDebug(libsamplerate_domain, "converter '{}'",
		 src_get_name(converter_type));
}

void
LibsampleratePcmResampler::Open(unsigned _channels,
				unsigned src_rate, unsigned dest_rate)
{
	assert(state == nullptr);
	assert(IsValidChannelCount(_channels));
	assert(IsValidSampleRate(src_rate));
	assert(IsValidSampleRate(dest_rate));

	int error;
	state = src_new(converter_type, _channels, &error);
	if (state == nullptr)
		throw FmtRuntimeError("src_new() failed: {}",
				      src_strerror(error));

	channels = _channels;
	ratio = double(dest_rate) / double(src_rate);

	FmtDebug(libsamplerate_domain, "{} -> {} Hz", src_rate, dest_rate);
}

void
LibsampleratePcmResampler::Close() noexcept
{
	state = src_delete(state);
}

void
LibsampleratePcmResampler::Reset() noexcept
{
	src_reset(state);
}

std::span<const float>
LibsampleratePcmResampler::Process(std::span<const float> src,
				   std::size_t max_out, bool end_of_input)
{
	auto dest = buffer.Get(max_out * channels);

	SRC_DATA data{};
	data.data_in = src.data();
	data.data_out = dest.data();
	data.input_frames = src.size() / channels;
	data.output_frames = max_out;
	data.end_of_input = end_of_input;
	data.src_ratio = ratio;

	const int error = src_process(state, &data);
	if (error != 0)
		throw FmtRuntimeError("src_process() failed: {}",
				      src_strerror(error));

	return dest.first(std::size_t(data.output_frames_gen) * channels);
}

std::span<const float>
LibsampleratePcmResampler::Resample(std::span<const float> src)
{
	assert(src.size() % channels == 0);

	const std::size_t n_frames = src.size() / channels;
	return Process(src, std::size_t(n_frames * ratio) + 1, false);
}

std::span<const float>
LibsampleratePcmResampler::Flush()
{
	return Process({}, FLUSH_FRAMES, true);
}
