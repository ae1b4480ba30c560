// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_FFMPEG_HXX
#define LILT_DECODER_FFMPEG_HXX

extern const struct DecoderPlugin ffmpeg_decoder_plugin;

#endif
