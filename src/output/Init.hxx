// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_INIT_HXX
#define LILT_OUTPUT_INIT_HXX

#include <memory>

struct ConfigData;
class AudioOutput;

/**
 * Create the output described by the "audio_output" block, or
 * detect one if there is none.  The device is not opened.
 *
 * Throws on error.
 */
std::unique_ptr<AudioOutput>
audio_output_new(const ConfigData &config);

#endif
