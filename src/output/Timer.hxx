// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_TIMER_HXX
#define LILT_OUTPUT_TIMER_HXX

#include <chrono>
#include <cstddef>
#include <cstdint>

/**
 * Paces an output without a device clock.  It knows the wall-clock
 * time at which the frames submitted so far would have finished
 * playing on a real device.
 */
class Timer {
	using Clock = std::chrono::steady_clock;

	const unsigned sample_rate;

	Clock::time_point start;

	/**
	 * Frames submitted since Start().
	 */
	uint64_t frames = 0;

	bool started = false;

public:
	explicit constexpr Timer(unsigned _sample_rate) noexcept
		:sample_rate(_sample_rate) {}

	bool IsStarted() const noexcept {
		return started;
	}

	void Start() noexcept {
		start = Clock::now();
		frames = 0;
		started = true;
	}

	void Reset() noexcept {
		started = false;
	}

	void Add(std::size_t n_frames) noexcept {
		frames += n_frames;
	}

	/**
	 * How long the caller should sleep before submitting more;
	 * zero if it is late.
	 */
	Clock::duration GetDelay() const noexcept;
};

#endif
