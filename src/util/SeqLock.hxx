// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_SEQ_LOCK_HXX
#define LILT_SEQ_LOCK_HXX

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

/**
 * A sequence lock protecting a small tuple of integers: one thread
 * stores, any number of threads load.  Neither side ever blocks;
 * a reader which races with the writer retries until it sees a
 * consistent tuple.
 *
 * The values are stored in relaxed atomics, so a torn read is
 * detected (by the sequence number), but is never undefined
 * behavior.
 */
template<std::size_t N>
class SeqLock {
	using Values = std::array<uint64_t, N>;

	/**
	 * Odd while the writer is busy.
	 */
	std::atomic_uint32_t sequence{0};

	std::array<std::atomic_uint64_t, N> values{};

public:
	/**
	 * Writer only.
	 */
	void Store(const Values &src) noexcept {
		const auto seq = sequence.load(std::memory_order_relaxed);
		sequence.store(seq + 1, std::memory_order_relaxed);
		std::atomic_thread_fence(std::memory_order_release);

		for (std::size_t i = 0; i < N; ++i)
			values[i].store(src[i], std::memory_order_relaxed);

		sequence.store(seq + 2, std::memory_order_release);
	}

	Values Load() const noexcept {
		Values result;
		uint32_t before, after;

		do {
			before = sequence.load(std::memory_order_acquire);

			for (std::size_t i = 0; i < N; ++i)
				result[i] = values[i].load(std::memory_order_relaxed);

			std::atomic_thread_fence(std::memory_order_acquire);
			after = sequence.load(std::memory_order_relaxed);
		} while ((before & 1) != 0 || before != after);

		return result;
	}
};

#endif
