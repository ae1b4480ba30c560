// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CHRONO_HXX
#define LILT_CHRONO_HXX

#include <chrono>
#include <cstdint>
#include <type_traits>

/**
 * Seconds with a fractional part: loop points, seek targets,
 * cross-fade lengths.
 */
using FloatDuration = std::chrono::duration<double>;

/**
 * A millisecond time stamp within a track.  With a signed #Rep,
 * negative values mean "unknown".
 */
template<typename Rep>
class BasicSongTime : public std::chrono::duration<Rep, std::milli> {
	using Base = std::chrono::duration<Rep, std::milli>;

public:
	constexpr BasicSongTime() noexcept = default;

	template<typename T>
	explicit constexpr BasicSongTime(T t) noexcept:Base(t) {}

	/**
	 * Widening an unsigned time to a signed one is implicit.
	 */
	template<typename R>
	requires std::is_signed_v<Rep> && std::is_unsigned_v<R>
	constexpr BasicSongTime(BasicSongTime<R> t) noexcept:Base(t) {}

	static constexpr BasicSongTime zero() noexcept {
		return BasicSongTime(Base::zero());
	}

	static constexpr BasicSongTime Negative() noexcept
		requires std::is_signed_v<Rep> {
		return BasicSongTime(Rep(-1));
	}

	template<typename D>
	static constexpr BasicSongTime Cast(D src) noexcept {
		return BasicSongTime(std::chrono::duration_cast<Base>(src));
	}

	static constexpr BasicSongTime FromS(double s) noexcept {
		return BasicSongTime(Rep(s * 1000));
	}

	static constexpr BasicSongTime FromMS(Rep ms) noexcept {
		return BasicSongTime(ms);
	}

	/**
	 * The play time of the given number of frames, rounded
	 * down.
	 */
	static constexpr BasicSongTime FromFrames(uint64_t frames,
						  unsigned sample_rate) noexcept {
		return BasicSongTime(Rep(frames * 1000 / sample_rate));
	}

	/**
	 * The number of frames played in this time, rounded down.
	 * Must not be called on a negative value.
	 */
	constexpr uint64_t ToFrames(unsigned sample_rate) const noexcept {
		return uint64_t(this->count()) * sample_rate / 1000;
	}

	constexpr bool IsPositive() const noexcept {
		return this->count() > 0;
	}

	constexpr bool IsNegative() const noexcept
		requires std::is_signed_v<Rep> {
		return this->count() < 0;
	}
};

using SongTime = BasicSongTime<uint32_t>;
using SignedSongTime = BasicSongTime<int32_t>;

#endif
