// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_MUSIC_PIPE_HXX
#define LILT_MUSIC_PIPE_HXX

#include "MusicChunk.hxx"
#include "util/RingBuffer.hxx"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * A lock-free queue of #MusicChunk objects between the decoder
 * thread (producer) and the output callback (consumer).  Neither
 * side ever blocks: the producer learns how many frames were
 * accepted and retries later, the consumer gets whatever is
 * available.
 */
class MusicPipe {
	RingBuffer<MusicChunk> chunks;

	const unsigned channels;

	/**
	 * The number of frames which fit into one chunk.
	 */
	const std::size_t chunk_frames;

	/**
	 * Frame counters; #pushed_frames is only written by the
	 * producer, #pulled_frames only by the consumer.
	 */
	std::atomic_uint64_t pushed_frames{0}, pulled_frames{0};

	/**
	 * Consumer only: the number of frames of the front chunk
	 * already returned by Pull().
	 */
	std::size_t read_offset = 0;

	/**
	 * Consumer only: has Pull() returned data from the front
	 * chunk?  The chunk slot is released by the next consumer
	 * call, so the span returned by Pull() stays valid until
	 * then.
	 */
	bool holding = false;

public:
	/**
	 * Where pushed frames come from.
	 */
	struct Origin {
		uint64_t track_id;
		uint32_t serial;

		/**
		 * The frame index of the first pushed frame.
		 */
		uint64_t first_frame;

		/**
		 * #MusicChunk flags for the first chunk.
		 */
		uint8_t flags;
	};

	/**
	 * A run of frames returned by Pull(); it never crosses a
	 * chunk boundary.
	 */
	struct Run {
		uint64_t track_id = 0;
		uint64_t first_frame = 0;
		uint32_t serial = 0;
		std::size_t n_frames = 0;
		std::span<const float> data;

		/**
		 * This is the beginning of a track.
		 */
		bool start = false;

		/**
		 * This is the end-of-track marker; #data is empty.
		 */
		bool end = false;

		/**
		 * Nothing was available?
		 */
		bool IsEmpty() const noexcept {
			return n_frames == 0 && !start && !end;
		}
	};

	/**
	 * Throws std::bad_alloc.
	 *
	 * @param capacity_frames the minimum number of frames this
	 * pipe can hold
	 */
	MusicPipe(std::size_t capacity_frames, unsigned _channels);

	MusicPipe(const MusicPipe &) = delete;
	MusicPipe &operator=(const MusicPipe &) = delete;

	unsigned GetChannels() const noexcept {
		return channels;
	}

	std::size_t GetCapacityFrames() const noexcept {
		return chunks.GetCapacity() * chunk_frames;
	}

	/**
	 * The number of frames pushed, but not yet pulled.  May be
	 * called from any thread; the result is a snapshot.
	 */
	uint64_t GetBufferedFrames() const noexcept {
		const auto pulled = pulled_frames.load(std::memory_order_acquire);
		return pushed_frames.load(std::memory_order_acquire) - pulled;
	}

	/**
	 * Producer only.
	 */
	bool IsFull() const noexcept {
		return chunks.WriteAvailable() == 0;
	}

	/**
	 * Append frames.  Producer only.
	 *
	 * @return the number of frames accepted; less than the
	 * given number if the pipe is (almost) full
	 */
	std::size_t TryPush(const Origin &origin,
			    std::span<const float> data) noexcept;

	/**
	 * Append an end-of-track marker.  Producer only.
	 *
	 * @param origin the first_frame attribute is the total
	 * number of frames of the track
	 * @return false if the pipe is full
	 */
	bool PushEnd(const Origin &origin) noexcept;

	/**
	 * Returns the chunk Pull() will read from next, without
	 * consuming anything, or nullptr if the pipe is empty.
	 * Consumer only.
	 */
	const MusicChunk *Peek() noexcept;

	/**
	 * Take up to #max_frames frames from the front chunk.
	 * Consumer only.
	 *
	 * The returned data remains valid until the next call of
	 * any consumer method.
	 */
	Run Pull(std::size_t max_frames) noexcept;

	/**
	 * Drop the rest of the front chunk.  Consumer only.
	 */
	void Skip() noexcept;

	/**
	 * Drop leading chunks which belong to a flush generation
	 * older than #serial.  Consumer only.
	 */
	void DiscardStale(uint32_t serial) noexcept;

	/**
	 * Drop everything.  Consumer only.
	 */
	void Discard() noexcept;

private:
	void AddPulled(std::size_t n) noexcept {
		pulled_frames.store(pulled_frames.load(std::memory_order_relaxed) + n,
				    std::memory_order_release);
	}
};

#endif
