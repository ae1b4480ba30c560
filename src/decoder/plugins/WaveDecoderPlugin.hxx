// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_WAVE_HXX
#define LILT_DECODER_WAVE_HXX

extern const struct DecoderPlugin wave_decoder_plugin;

#endif
