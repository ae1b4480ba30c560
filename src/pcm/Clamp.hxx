// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_CLAMP_HXX
#define LILT_PCM_CLAMP_HXX

#include <algorithm>

/**
 * Clamp a floating point sample to the valid range [-1, 1].
 */
constexpr float
PcmClamp(float x) noexcept
{
	return std::clamp(x, -1.f, 1.f);
}

#endif
