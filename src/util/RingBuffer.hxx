// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_RING_BUFFER_HXX
#define LILT_RING_BUFFER_HXX

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

/**
 * A bounded single-producer single-consumer queue.  Neither side
 * ever blocks or takes a lock.
 *
 * Both sides count items with totals which only grow: #head (items
 * ever appended) is stored only by the producer, #tail (items ever
 * consumed) only by the consumer.  An item lives in the slot
 * "counter % capacity".  Each side publishes its own counter with
 * "release" and loads the other one with "acquire", so the consumer
 * sees an item only after it has been written completely, and the
 * producer reuses a slot only after the consumer is done with it.
 *
 * The 64 bit counters do not wrap within the lifetime of a process.
 */
template<typename T>
requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
class RingBuffer {
	std::unique_ptr<T[]> slots;
	std::size_t capacity = 0;

	std::atomic_uint64_t head{0}, tail{0};

public:
	/**
	 * Construct an unusable instance; assign a real one before
	 * using it.
	 */
	RingBuffer() noexcept = default;

	explicit RingBuffer(std::size_t _capacity)
		:slots(std::make_unique<T[]>(_capacity)), capacity(_capacity)
	{
		assert(capacity > 0);
	}

	/**
	 * Not thread-safe: both sides must be idle.
	 */
	RingBuffer &operator=(RingBuffer &&src) noexcept {
		slots = std::move(src.slots);
		capacity = std::exchange(src.capacity, 0);
		head.store(src.head.load(std::memory_order_relaxed),
			   std::memory_order_relaxed);
		tail.store(src.tail.load(std::memory_order_relaxed),
			   std::memory_order_relaxed);
		return *this;
	}

	std::size_t GetCapacity() const noexcept {
		return capacity;
	}

	/**
	 * The number of items which may be consumed.  May be called
	 * from any thread.
	 */
	std::size_t ReadAvailable() const noexcept {
		/* load the tail first: the head cannot fall behind a
		   tail loaded earlier */
		const auto t = tail.load(std::memory_order_acquire);
		const auto h = head.load(std::memory_order_acquire);
		return std::size_t(h - t);
	}

	bool IsEmpty() const noexcept {
		return ReadAvailable() == 0;
	}

	/**
	 * The number of free slots.  Producer only.
	 */
	std::size_t WriteAvailable() const noexcept {
		const auto h = head.load(std::memory_order_relaxed);
		const auto t = tail.load(std::memory_order_acquire);
		return capacity - std::size_t(h - t);
	}

	/**
	 * Returns the free slots which can be written contiguously
	 * (i.e. up to the end of the array).  Fill some of them and
	 * commit with Append().  Producer only.
	 */
	std::span<T> Write() noexcept {
		const auto h = head.load(std::memory_order_relaxed);
		const std::size_t i = h % capacity;
		return {&slots[i], std::min(WriteAvailable(), capacity - i)};
	}

	void Append(std::size_t n) noexcept {
		assert(n <= WriteAvailable());

		head.store(head.load(std::memory_order_relaxed) + n,
			   std::memory_order_release);
	}

	/**
	 * Copy as many items as there is room for.
	 *
	 * @return the number of items accepted
	 */
	std::size_t WriteFrom(std::span<const T> src) noexcept {
		const auto h = head.load(std::memory_order_relaxed);
		const std::size_t n = std::min(WriteAvailable(), src.size());

		const std::size_t i = h % capacity;
		const std::size_t first = std::min(n, capacity - i);
		std::copy_n(src.begin(), first, &slots[i]);
		std::copy_n(src.begin() + first, n - first, &slots[0]);

		head.store(h + n, std::memory_order_release);
		return n;
	}

	/**
	 * Returns the items which can be read contiguously.  Commit
	 * with Consume().  Consumer only.
	 */
	std::span<const T> Read() const noexcept {
		const auto t = tail.load(std::memory_order_relaxed);
		const std::size_t i = t % capacity;
		return {&slots[i], std::min(ReadAvailable(), capacity - i)};
	}

	void Consume(std::size_t n) noexcept {
		assert(n <= ReadAvailable());

		tail.store(tail.load(std::memory_order_relaxed) + n,
			   std::memory_order_release);
	}

	/**
	 * Move as many items as are available into the given span.
	 *
	 * @return the number of items moved
	 */
	std::size_t ReadTo(std::span<T> dest) noexcept {
		const auto t = tail.load(std::memory_order_relaxed);
		const std::size_t n = std::min(ReadAvailable(), dest.size());

		const std::size_t i = t % capacity;
		const std::size_t first = std::min(n, capacity - i);
		std::copy_n(&slots[i], first, dest.begin());
		std::copy_n(&slots[0], n - first, dest.begin() + first);

		tail.store(t + n, std::memory_order_release);
		return n;
	}

	/**
	 * Drop everything which has been appended so far.  Consumer
	 * only.
	 */
	void Discard() noexcept {
		tail.store(head.load(std::memory_order_acquire),
			   std::memory_order_release);
	}
};

#endif
