// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_SAMPLE_FORMAT_HXX
#define LILT_FFMPEG_SAMPLE_FORMAT_HXX

#include "pcm/SampleFormat.hxx"

extern "C" {
#include <libavutil/samplefmt.h>
}

namespace Ffmpeg {

/**
 * Map the FFmpeg sample format (packed or planar) to ours.
 */
[[gnu::const]]
constexpr SampleFormat
FromFfmpegSampleFormat(AVSampleFormat sample_fmt) noexcept
{
	switch (sample_fmt) {
	case AV_SAMPLE_FMT_U8:
	case AV_SAMPLE_FMT_U8P:
		return SampleFormat::S8;

	case AV_SAMPLE_FMT_S16:
	case AV_SAMPLE_FMT_S16P:
		return SampleFormat::S16;

	case AV_SAMPLE_FMT_S32:
	case AV_SAMPLE_FMT_S32P:
		return SampleFormat::S32;

	case AV_SAMPLE_FMT_FLT:
	case AV_SAMPLE_FMT_FLTP:
	case AV_SAMPLE_FMT_DBL:
	case AV_SAMPLE_FMT_DBLP:
		return SampleFormat::FLOAT;

	default:
		return SampleFormat::UNDEFINED;
	}
}

} // namespace Ffmpeg

#endif
