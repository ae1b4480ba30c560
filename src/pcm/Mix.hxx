// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_MIX_HXX
#define LILT_PCM_MIX_HXX

#include <span>

/**
 * Mixes two interleaved buffers of the same length and format into
 * the first one, with a separate gain for each:
 *
 *   a := clamp(a * a_gain + b * b_gain)
 */
void
pcm_mix(std::span<float> a, std::span<const float> b,
	float a_gain, float b_gain) noexcept;

/**
 * Multiply all samples with a constant gain and clamp.
 */
void
pcm_scale(std::span<float> buffer, float gain) noexcept;

#endif
