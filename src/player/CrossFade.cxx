// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "CrossFade.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"

#include <algorithm>
#include <cmath>
#include <numbers>

CrossFadeCurve
ParseCrossFadeCurve(const char *s)
{
	if (StringIsEqual(s, "linear"))
		return CrossFadeCurve::LINEAR;
	else if (StringIsEqual(s, "equal_power"))
		return CrossFadeCurve::EQUAL_POWER;
	else
		throw FmtInvalidArgument("Unrecognized crossfade curve: \"{}\"", s);
}

const char *
ToString(CrossFadeCurve curve) noexcept
{
	switch (curve) {
	case CrossFadeCurve::LINEAR:
		return "linear";

	case CrossFadeCurve::EQUAL_POWER:
		return "equal_power";
	}

	return "unknown";
}

CrossFadeGains
GetCrossFadeGains(CrossFadeCurve curve, float t) noexcept
{
	t = std::clamp(t, 0.f, 1.f);

	switch (curve) {
	case CrossFadeCurve::LINEAR:
		break;

	case CrossFadeCurve::EQUAL_POWER:
		/* the ends are exact, no rounding noise from
		   cos(pi/2) */
		if (t <= 0)
			return {1, 0};
		if (t >= 1)
			return {0, 1};

		return {
			std::cos(t * std::numbers::pi_v<float> / 2),
			std::sin(t * std::numbers::pi_v<float> / 2),
		};
	}

	return {1 - t, t};
}

inline bool
CrossFadeSettings::CanCrossFadeTrack(SignedSongTime total_time) const noexcept
{
	return !total_time.IsNegative() &&
		duration < std::chrono::duration_cast<FloatDuration>(total_time);
}

bool
CrossFadeSettings::CanCrossFade(SignedSongTime current_total_time,
				SignedSongTime next_total_time) const noexcept
{
	return IsEnabled() &&
		CanCrossFadeTrack(current_total_time) &&
		CanCrossFadeTrack(next_total_time);
}

uint64_t
CrossFadeSettings::Calculate(unsigned sample_rate) const noexcept
{
	if (!IsEnabled())
		return 0;

	return std::llround(duration.count() * sample_rate);
}
