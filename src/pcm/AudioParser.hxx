// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

/*
 * Parser functions for audio related objects.
 */

#ifndef LILT_AUDIO_PARSER_HXX
#define LILT_AUDIO_PARSER_HXX

#include <string_view>

struct AudioFormat;

/**
 * Parses a string in the form "SAMPLE_RATE:BITS:CHANNELS" into an
 * #AudioFormat.  BITS is one of "8", "16", "24", "32" or "f".
 *
 * Throws #std::invalid_argument on error.
 */
AudioFormat
ParseAudioFormat(std::string_view src);

#endif
