// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_TIME_HXX
#define LILT_FFMPEG_TIME_HXX

#include "Chrono.hxx"

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/mathematics.h>
}

#include <cstdint>

/**
 * Convert a FFmpeg time stamp to a #SignedSongTime; returns a
 * negative value if the time stamp is unknown.
 */
[[gnu::const]]
static inline SignedSongTime
FromFfmpegTimeChecked(int64_t t, AVRational time_base) noexcept
{
	if (t == int64_t(AV_NOPTS_VALUE) || t < 0)
		return SignedSongTime::Negative();

	return SignedSongTime(SignedSongTime::rep(av_rescale_q(t, time_base,
								 {1, 1000})));
}

/**
 * Replace #AV_NOPTS_VALUE with the given fallback.
 */
constexpr int64_t
FfmpegTimestampFallback(int64_t t, int64_t fallback) noexcept
{
	return t != int64_t(AV_NOPTS_VALUE)
		? t
		: fallback;
}

#endif
