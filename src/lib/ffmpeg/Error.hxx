// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_ERROR_HXX
#define LILT_FFMPEG_ERROR_HXX

#include <stdexcept>

[[gnu::cold]]
std::runtime_error
MakeFfmpegError(int errnum);

[[gnu::cold]]
std::runtime_error
MakeFfmpegError(int errnum, const char *prefix);

#endif
