// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PLAYER_RENDERER_HXX
#define LILT_PLAYER_RENDERER_HXX

#include "MusicPipe.hxx"
#include "Transport.hxx"
#include "CrossFade.hxx"
#include "output/RenderCallback.hxx"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * The output callback: moves frames from the #MusicPipe objects to
 * the device buffer, runs cross-fades, applies the volume and
 * publishes the playback clock.
 *
 * Render() runs in the output's realtime thread.  All memory is
 * allocated by the constructor; Render() takes no lock and never
 * waits for the decoder thread.
 */
class Renderer final : public RenderCallback {
	Transport &transport;

	std::array<MusicPipe, 2> &pipes;

	const unsigned channels;

	/**
	 * Holds the incoming track's frames during a cross-fade.
	 */
	std::vector<float> scratch;

	/**
	 * The flush generation of the most recent #FlushRecord.
	 */
	uint32_t serial = 0;

	/**
	 * Index of the pipe which contains the current track.
	 */
	unsigned active = 0;

	/**
	 * The clock: the current track and the number of its frames
	 * played.
	 */
	uint64_t track_id = 0, position = 0;

	/**
	 * Has the end-of-track marker of the current track been
	 * consumed, with nothing after it yet?
	 */
	bool drained = true;

	struct CrossFade {
		bool active = false;

		unsigned pipe;

		CrossFadeCurve curve;

		/**
		 * The length of the fade; this is the number of
		 * frames which were left of the outgoing track when
		 * it began.
		 */
		uint64_t frames;

		uint64_t done;

		/**
		 * The clock of the incoming track.
		 */
		uint64_t track_id, position;

		/**
		 * Did the incoming track end during the fade?
		 */
		bool ended;
	} fade;

public:
	/**
	 * Render() processes at most this many frames in one step.
	 */
	static constexpr std::size_t BLOCK_FRAMES = 1024;

	Renderer(Transport &_transport,
		 std::array<MusicPipe, 2> &_pipes,
		 unsigned _channels);

	/* virtual methods from class RenderCallback */
	void Render(std::span<float> dest) noexcept override;

private:
	void ApplyFlush(const FlushRecord &flush) noexcept;

	/**
	 * Pull from the pipe, skipping chunks of older flush
	 * generations.  Chunks of a newer generation are treated as
	 * "not yet available"; they will be played after the next
	 * Render() call has loaded the new #FlushRecord.
	 */
	MusicPipe::Run PullCurrent(MusicPipe &pipe,
				   std::size_t max_frames) noexcept;

	/**
	 * @return false if nothing was available
	 */
	bool PlayActive(std::span<float> dest, std::size_t &done) noexcept;

	/**
	 * @return false if nothing was available
	 */
	bool PlayCrossFade(std::span<float> dest, std::size_t &done) noexcept;

	/**
	 * Begin a cross-fade if the decoder thread has armed one and
	 * the outgoing track is short enough.
	 */
	void CheckCrossFade() noexcept;

	void FinishCrossFade(uint64_t outgoing_id) noexcept;

	void PushEvent(RenderEvent::Type type, uint64_t id) noexcept;
};

#endif
