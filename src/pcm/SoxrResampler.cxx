// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "SoxrResampler.hxx"
#include "AudioFormat.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"
#include "Log.hxx"

#include <soxr.h>

#include <algorithm>
#include <cassert>
#include <iterator>

static constexpr Domain soxr_domain("soxr");

namespace {

struct SoxrQuality {
	const char *name;
	unsigned long recipe;
};

constexpr SoxrQuality soxr_qualities[] = {
	{ "very high", SOXR_VHQ },
	{ "high", SOXR_HQ },
	{ "medium", SOXR_MQ },
	{ "low", SOXR_LQ },
	{ "quick", SOXR_QQ },
};

/* soxr output is drained in chunks of this many frames */
constexpr std::size_t FLUSH_FRAMES = 1024;

soxr_quality_spec_t quality_spec = soxr_quality_spec(SOXR_HQ, 0);
soxr_runtime_spec_t runtime_spec = soxr_runtime_spec(1);

} // namespace

void
SoxrPcmResampler::Configure(const ConfigBlock &block)
{
	const char *name = block.GetString("quality", "high");
	const auto q = std::find_if(std::begin(soxr_qualities),
				    std::end(soxr_qualities),
				    [name](const SoxrQuality &i){
					    return StringIsEqual(i.name, name);
				    });
	if (q == std::end(soxr_qualities))
		throw FmtRuntimeError("unknown soxr quality '{}' in line {}",
				      name, block.line);

	quality_spec = soxr_quality_spec(q->recipe, 0);
	runtime_spec = soxr_runtime_spec(block.GetPositive("threads", 1U));

	FmtDebug(soxr_domain, "quality '{}'", q->name);
}

void
SoxrPcmResampler::Open(unsigned _channels,
		       unsigned src_rate, unsigned dest_rate)
{
	assert(soxr == nullptr);
	assert(IsValidChannelCount(_channels));
	assert(IsValidSampleRate(src_rate));
	assert(IsValidSampleRate(dest_rate));

	soxr_error_t error;
	soxr = soxr_create(src_rate, dest_rate, _channels, &error,
			   nullptr, &quality_spec, &runtime_spec);
	if (soxr == nullptr)
		throw FmtRuntimeError("soxr_create() failed: {}", error);

	channels = _channels;
	ratio = double(dest_rate) / double(src_rate);

	FmtDebug(soxr_domain, "engine '{}', {} -> {} Hz",
		 soxr_engine(soxr), src_rate, dest_rate);
}

void
SoxrPcmResampler::Close() noexcept
{
	soxr_delete(soxr);
	soxr = nullptr;
}

void
SoxrPcmResampler::Reset() noexcept
{
	soxr_clear(soxr);
}

std::span<const float>
SoxrPcmResampler::Process(const float *src, std::size_t n_frames,
			  std::size_t max_out)
{
	auto dest = buffer.Get(max_out * channels);

	std::size_t in_frames, out_frames;
	const soxr_error_t error =
		soxr_process(soxr, src, n_frames, &in_frames,
			     dest.data(), max_out, &out_frames);
	if (error != nullptr)
		throw FmtRuntimeError("soxr_process() failed: {}", error);

	return dest.first(out_frames * channels);
}

std::span<const float>
SoxrPcmResampler::Resample(std::span<const float> src)
{
	assert(src.size() % channels == 0);

	const std::size_t n_frames = src.size() / channels;
	return Process(src.data(), n_frames,
		       std::size_t(n_frames * ratio) + 1);
}

std::span<const float>
SoxrPcmResampler::Flush()
{
	/* a null input pointer tells soxr the stream has ended */
	return Process(nullptr, 0, FLUSH_FRAMES);
}
