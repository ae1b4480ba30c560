// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Timer.hxx"

#include <cassert>

std::chrono::steady_clock::duration
Timer::GetDelay() const noexcept
{
	assert(started);

	const std::chrono::microseconds played(frames * 1000000 / sample_rate);
	const auto due = start + played;
	const auto now = Clock::now();
	return due > now ? due - now : Clock::duration::zero();
}
