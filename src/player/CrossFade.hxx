// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CROSSFADE_HXX
#define LILT_CROSSFADE_HXX

#include "Chrono.hxx"

#include <cstdint>

enum class CrossFadeCurve : uint8_t {
	/**
	 * Constant amplitude sum.
	 */
	LINEAR,

	/**
	 * Constant power sum (sine/cosine quarter waves).
	 */
	EQUAL_POWER,
};

/**
 * Throws std::invalid_argument on error.
 */
CrossFadeCurve
ParseCrossFadeCurve(const char *s);

[[gnu::const]]
const char *
ToString(CrossFadeCurve curve) noexcept;

struct CrossFadeGains {
	float outgoing, incoming;
};

/**
 * Calculate the gains of both tracks.
 *
 * @param t the fade progress between 0 (only the outgoing track)
 * and 1 (only the incoming track)
 */
[[gnu::const]]
CrossFadeGains
GetCrossFadeGains(CrossFadeCurve curve, float t) noexcept;

struct CrossFadeSettings {
	/**
	 * The configured cross fade duration; zero disables cross
	 * fading.
	 */
	FloatDuration duration{0};

	CrossFadeCurve curve = CrossFadeCurve::EQUAL_POWER;

	constexpr bool IsEnabled() const noexcept {
		return duration.count() > 0;
	}

	/**
	 * Determine whether cross-fading the two tracks is possible.
	 *
	 * @param current_total_time the duration of the current track
	 * @param next_total_time the duration of the new track
	 * @return true if cross-fading is possible
	 */
	[[gnu::pure]]
	bool CanCrossFade(SignedSongTime current_total_time,
			  SignedSongTime next_total_time) const noexcept;

	/**
	 * Calculate the length of the fade in frames.
	 */
	[[gnu::pure]]
	uint64_t Calculate(unsigned sample_rate) const noexcept;

private:
	/**
	 * Can the described track be cross-faded?
	 */
	[[gnu::pure]]
	bool CanCrossFadeTrack(SignedSongTime total_time) const noexcept;
};

#endif
