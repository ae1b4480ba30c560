// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_CONVERT_HXX
#define LILT_PCM_CONVERT_HXX

#include "SampleFormat.hxx"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * Convert raw samples of the given integer (or float) format to
 * floating point in the range [-1, 1].  The source is in host byte
 * order; 24 bit samples are packed in 32 bit integers.
 *
 * @param n the number of samples
 */
void
pcm_convert_to_float(float *dest, SampleFormat src_format,
		     const void *src, std::size_t n) noexcept;

/**
 * Convert floating point samples to signed 16 bit integers,
 * clipping out-of-range values.
 */
void
pcm_convert_float_to_s16(int16_t *dest, std::span<const float> src) noexcept;

/**
 * Convert floating point samples to signed 32 bit integers,
 * clipping out-of-range values.
 */
void
pcm_convert_float_to_s32(int32_t *dest, std::span<const float> src) noexcept;

#endif
