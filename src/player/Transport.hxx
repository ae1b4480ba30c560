// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PLAYER_TRANSPORT_HXX
#define LILT_PLAYER_TRANSPORT_HXX

#include "State.hxx"
#include "CrossFade.hxx"
#include "Chrono.hxx"
#include "pcm/Volume.hxx"
#include "util/RingBuffer.hxx"
#include "util/SeqLock.hxx"

#include <atomic>
#include <cstdint>

/**
 * A consistent copy of the transport state, see
 * PlayerControl::GetSnapshot().
 */
struct PlayerSnapshot {
	PlayerState state;

	/**
	 * The track the output is currently playing (0 = none).
	 */
	uint64_t track_id;

	/**
	 * The number of frames of #track_id played by the output.
	 */
	uint64_t position;

	/**
	 * #position converted to seconds.
	 */
	FloatDuration elapsed;

	/**
	 * The track which will be played after #track_id (0 = none).
	 */
	uint64_t next_track_id;

	unsigned volume;
	bool mute;

	/**
	 * The number of output periods which were not filled
	 * completely because the decoder was too slow.
	 */
	uint64_t underruns;
};

/**
 * Sent from the output callback to the decoder thread.
 */
struct RenderEvent {
	enum class Type : uint8_t {
		TRACK_STARTED,
		TRACK_ENDED,
	};

	Type type;
	uint64_t track_id;
};

/**
 * The decoder thread asks the output to drop everything older
 * than #serial and to continue with the given track position.
 */
struct FlushRecord {
	uint32_t serial;
	uint64_t track_id;
	uint64_t position;
	unsigned pipe;
};

/**
 * The decoder thread has decoded the outgoing track completely
 * and is decoding the incoming track into another pipe; the output
 * shall fade over when the outgoing track's remaining frames drop
 * to #frames.
 */
struct CrossFadeRecord {
	static constexpr unsigned NO_PIPE = ~0U;

	/**
	 * The flush generation this record belongs to.
	 */
	uint32_t serial;

	/**
	 * The pipe with the incoming track, or #NO_PIPE.
	 */
	unsigned pipe;

	uint64_t frames;
	CrossFadeCurve curve;
};

/**
 * All state shared between the control thread, the decoder thread
 * and the output callback.  Nothing here takes a lock; each
 * attribute has exactly one writer:
 *
 * - decoder thread: state, next track, flush and crossfade records
 * - output callback: clock, underrun counter, active pipe, events
 * - control thread: volume, mute
 */
class Transport {
	const unsigned sample_rate;

	std::atomic<PlayerState> state{PlayerState::STOP};

	std::atomic_uint64_t next_track_id{0};

	/**
	 * The last track has been decoded completely and nothing is
	 * queued; the output running dry is not an underrun.
	 */
	std::atomic_bool decode_finished{false};

	/**
	 * serial, track_id, position, pipe
	 */
	SeqLock<4> flush;

	/**
	 * serial, pipe, frames, curve
	 */
	SeqLock<4> crossfade;

	/**
	 * track_id, position
	 */
	SeqLock<2> clock;

	std::atomic_uint64_t underruns{0};

	std::atomic_uint active_pipe{0};

	std::atomic_uint volume{PCM_VOLUME_1};
	std::atomic_bool mute{false};

	RingBuffer<RenderEvent> events;

public:
	static constexpr std::size_t MAX_EVENTS = 64;

	explicit Transport(unsigned _sample_rate)
		:sample_rate(_sample_rate), events(MAX_EVENTS) {
		StoreCrossFade({0, CrossFadeRecord::NO_PIPE, 0, CrossFadeCurve::LINEAR});
	}

	Transport(const Transport &) = delete;
	Transport &operator=(const Transport &) = delete;

	unsigned GetSampleRate() const noexcept {
		return sample_rate;
	}

	PlayerSnapshot GetSnapshot() const noexcept;

	PlayerState GetState() const noexcept {
		return state.load(std::memory_order_acquire);
	}

	/**
	 * Decoder thread only.
	 */
	void SetState(PlayerState _state) noexcept {
		state.store(_state, std::memory_order_release);
	}

	/**
	 * Decoder thread only.
	 */
	void SetNextTrack(uint64_t id) noexcept {
		next_track_id.store(id, std::memory_order_relaxed);
	}

	/**
	 * Decoder thread only.
	 */
	void SetDecodeFinished(bool value) noexcept {
		decode_finished.store(value, std::memory_order_release);
	}

	bool IsDecodeFinished() const noexcept {
		return decode_finished.load(std::memory_order_acquire);
	}

	/**
	 * Decoder thread only.
	 */
	void StoreFlush(const FlushRecord &r) noexcept {
		flush.Store({r.serial, r.track_id, r.position, r.pipe});
	}

	FlushRecord LoadFlush() const noexcept {
		const auto v = flush.Load();
		return {uint32_t(v[0]), v[1], v[2], unsigned(v[3])};
	}

	/**
	 * Decoder thread only.
	 */
	void StoreCrossFade(const CrossFadeRecord &r) noexcept {
		crossfade.Store({r.serial, r.pipe, r.frames, uint64_t(r.curve)});
	}

	CrossFadeRecord LoadCrossFade() const noexcept {
		const auto v = crossfade.Load();
		return {uint32_t(v[0]), unsigned(v[1]), v[2], CrossFadeCurve(v[3])};
	}

	/**
	 * Output callback only.
	 */
	void StoreClock(uint64_t track_id, uint64_t position) noexcept {
		clock.Store({track_id, position});
	}

	/**
	 * Returns the track id and position published by the
	 * output callback.
	 */
	std::array<uint64_t, 2> LoadClock() const noexcept {
		return clock.Load();
	}

	/**
	 * Output callback only.
	 */
	void AddUnderrun() noexcept {
		underruns.fetch_add(1, std::memory_order_relaxed);
	}

	uint64_t GetUnderruns() const noexcept {
		return underruns.load(std::memory_order_relaxed);
	}

	/**
	 * Output callback only.
	 */
	void SetActivePipe(unsigned pipe) noexcept {
		active_pipe.store(pipe, std::memory_order_release);
	}

	unsigned GetActivePipe() const noexcept {
		return active_pipe.load(std::memory_order_acquire);
	}

	/**
	 * Control thread only.
	 */
	void SetVolume(unsigned _volume) noexcept {
		volume.store(_volume, std::memory_order_relaxed);
	}

	unsigned GetVolume() const noexcept {
		return volume.load(std::memory_order_relaxed);
	}

	/**
	 * Control thread only.
	 */
	void SetMute(bool _mute) noexcept {
		mute.store(_mute, std::memory_order_relaxed);
	}

	bool IsMuted() const noexcept {
		return mute.load(std::memory_order_relaxed);
	}

	/**
	 * The amplitude factor the output applies.
	 */
	float GetGain() const noexcept {
		return IsMuted() ? 0.f : pcm_volume_to_gain(GetVolume());
	}

	/**
	 * Output callback only.  The event is dropped if the
	 * decoder thread has fallen behind by #MAX_EVENTS.
	 */
	bool PushEvent(RenderEvent event) noexcept {
		return events.WriteFrom({&event, 1}) == 1;
	}

	/**
	 * Decoder thread only.
	 */
	bool PopEvent(RenderEvent &event) noexcept {
		return events.ReadTo({&event, 1}) == 1;
	}
};

#endif
