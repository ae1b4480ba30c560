// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Mix.hxx"
#include "Clamp.hxx"

#include <cassert>

void
pcm_mix(std::span<float> a, std::span<const float> b,
	float a_gain, float b_gain) noexcept
{
	assert(a.size() == b.size());

	for (std::size_t i = 0; i < a.size(); ++i)
		a[i] = PcmClamp(a[i] * a_gain + b[i] * b_gain);
}

void
pcm_scale(std::span<float> buffer, float gain) noexcept
{
	for (auto &i : buffer)
		i = PcmClamp(i * gain);
}
