// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_INIT_HXX
#define LILT_FFMPEG_INIT_HXX

/**
 * Redirect FFmpeg's log output to ours.
 */
void
FfmpegInit() noexcept;

#endif
