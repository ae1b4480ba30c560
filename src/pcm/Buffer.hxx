// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_BUFFER_HXX
#define LILT_PCM_BUFFER_HXX

#include <cstddef>
#include <memory>
#include <span>

/**
 * A scratch buffer for one conversion step.  It only grows, so a
 * steady stream of equally sized chunks allocates once.
 */
class PcmBuffer {
	/**
	 * Allocations are rounded up to a multiple of this.
	 */
	static constexpr std::size_t GRANULARITY = 2048;

	std::unique_ptr<float[]> data;
	std::size_t capacity = 0;

public:
	void Clear() noexcept {
		data.reset();
		capacity = 0;
	}

	/**
	 * Returns a buffer of exactly @n_samples (uninitialized)
	 * samples.  It becomes invalid with the next call.
	 */
	std::span<float> Get(std::size_t n_samples) {
		if (n_samples > capacity) [[unlikely]] {
			capacity = (n_samples + GRANULARITY - 1) / GRANULARITY * GRANULARITY;
			data = std::make_unique_for_overwrite<float[]>(capacity);
		}

		return {data.get(), n_samples};
	}
};

#endif
