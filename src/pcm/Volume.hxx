// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_VOLUME_HXX
#define LILT_PCM_VOLUME_HXX

/**
 * This value means "100% volume".
 */
static constexpr unsigned PCM_VOLUME_1 = 100;

/**
 * The maximum volume; values above #PCM_VOLUME_1 amplify (and will
 * likely clip).
 */
static constexpr unsigned PCM_VOLUME_MAX = 200;

/**
 * Convert a volume percentage to an amplitude factor.  The curve is
 * quadratic, which approximates perceived loudness better than a
 * linear scale.
 */
constexpr float
pcm_volume_to_gain(unsigned volume) noexcept
{
	const float v = float(volume) / float(PCM_VOLUME_1);
	return v * v;
}

#endif
