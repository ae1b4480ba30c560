// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Renderer.hxx"
#include "Transport.hxx"
#include "pcm/Clamp.hxx"
#include "pcm/Mix.hxx"

#include <algorithm>
#include <cassert>

Renderer::Renderer(Transport &_transport,
		   std::array<MusicPipe, 2> &_pipes,
		   unsigned _channels)
	:transport(_transport), pipes(_pipes), channels(_channels),
	 scratch(BLOCK_FRAMES * _channels)
{
	assert(pipes[0].GetChannels() == channels);
	assert(pipes[1].GetChannels() == channels);
}

inline void
Renderer::PushEvent(RenderEvent::Type type, uint64_t id) noexcept
{
	/* if the queue is full, the decoder thread is stuck and
	   will not miss this event anyway */
	transport.PushEvent({type, id});
}

void
Renderer::ApplyFlush(const FlushRecord &flush) noexcept
{
	serial = flush.serial;
	active = flush.pipe;
	transport.SetActivePipe(active);

	track_id = flush.track_id;
	position = flush.position;
	drained = track_id == 0;
	fade.active = false;
}

MusicPipe::Run
Renderer::PullCurrent(MusicPipe &pipe, std::size_t max_frames) noexcept
{
	while (true) {
		const MusicChunk *chunk = pipe.Peek();
		if (chunk == nullptr)
			return {};

		if (IsOlderSerial(chunk->serial, serial)) {
			pipe.Skip();
			continue;
		}

		if (chunk->serial != serial)
			return {};

		return pipe.Pull(max_frames);
	}
}

void
Renderer::CheckCrossFade() noexcept
{
	const auto record = transport.LoadCrossFade();
	if (record.pipe == CrossFadeRecord::NO_PIPE ||
	    record.serial != serial || record.pipe == active)
		return;

	/* the decoder thread arms the cross-fade only after the
	   outgoing track's end marker has been pushed, so the
	   active pipe contains nothing but the rest of it */
	const uint64_t remaining = pipes[active].GetBufferedFrames();
	if (remaining > record.frames)
		return;

	fade.active = true;
	fade.pipe = record.pipe;
	fade.curve = record.curve;
	fade.frames = remaining;
	fade.done = 0;
	fade.track_id = 0;
	fade.position = 0;
	fade.ended = false;
}

void
Renderer::FinishCrossFade(uint64_t outgoing_id) noexcept
{
	PushEvent(RenderEvent::Type::TRACK_ENDED, outgoing_id);

	fade.active = false;
	active = fade.pipe;
	transport.SetActivePipe(active);

	if (fade.track_id != 0) {
		PushEvent(RenderEvent::Type::TRACK_STARTED, fade.track_id);
		track_id = fade.track_id;
		position = fade.position;
		drained = false;

		if (fade.ended) {
			PushEvent(RenderEvent::Type::TRACK_ENDED, fade.track_id);
			drained = true;
		}
	} else {
		/* nothing of the incoming track has been played yet;
		   its start marker is still in the pipe */
		position = 0;
		drained = true;
	}
}

bool
Renderer::PlayActive(std::span<float> dest, std::size_t &done) noexcept
{
	CheckCrossFade();
	if (fade.active)
		return true;

	const std::size_t frames = dest.size() / channels;
	const auto run = PullCurrent(pipes[active], frames - done);
	if (run.IsEmpty())
		return false;

	if (run.start) {
		PushEvent(RenderEvent::Type::TRACK_STARTED, run.track_id);
		drained = false;
	}

	track_id = run.track_id;

	if (run.end) {
		PushEvent(RenderEvent::Type::TRACK_ENDED, run.track_id);
		position = run.first_frame;
		drained = true;
		return true;
	}

	std::copy(run.data.begin(), run.data.end(),
		  dest.begin() + done * channels);
	done += run.n_frames;
	position = run.first_frame + run.n_frames;
	drained = false;
	return true;
}

bool
Renderer::PlayCrossFade(std::span<float> dest, std::size_t &done) noexcept
{
	const std::size_t frames = dest.size() / channels;
	const auto run = PullCurrent(pipes[active],
				     std::min(frames - done, BLOCK_FRAMES));
	if (run.IsEmpty())
		return false;

	if (run.end) {
		FinishCrossFade(run.track_id);
		return true;
	}

	const std::size_t n = run.n_frames;
	const std::span<float> out = dest.subspan(done * channels,
						  n * channels);
	std::copy(run.data.begin(), run.data.end(), out.begin());

	/* collect the same number of frames from the incoming
	   track; if it is late, it contributes silence */
	const std::span<float> in{scratch.data(), n * channels};
	std::size_t in_frames = 0;
	while (in_frames < n && !fade.ended) {
		const auto in_run = PullCurrent(pipes[fade.pipe], n - in_frames);
		if (in_run.IsEmpty())
			break;

		if (in_run.start)
			fade.track_id = in_run.track_id;

		if (in_run.end) {
			fade.position = in_run.first_frame;
			fade.ended = true;
			break;
		}

		std::copy(in_run.data.begin(), in_run.data.end(),
			  in.begin() + in_frames * channels);
		in_frames += in_run.n_frames;
		fade.track_id = in_run.track_id;
		fade.position = in_run.first_frame + in_run.n_frames;
	}

	std::fill(in.begin() + in_frames * channels, in.end(), 0.f);

	for (std::size_t i = 0; i < n; ++i) {
		const float t = fade.frames > 0
			? float(fade.done + i) / float(fade.frames)
			: 1.f;
		const auto gains = GetCrossFadeGains(fade.curve, t);

		for (unsigned c = 0; c < channels; ++c) {
			float &sample = out[i * channels + c];
			sample = PcmClamp(sample * gains.outgoing +
					  in[i * channels + c] * gains.incoming);
		}
	}

	fade.done += n;
	track_id = run.track_id;
	position = run.first_frame + n;
	done += n;
	return true;
}

void
Renderer::Render(std::span<float> dest) noexcept
{
	assert(dest.size() % channels == 0);

	const auto flush = transport.LoadFlush();
	if (flush.serial != serial)
		ApplyFlush(flush);

	for (auto &pipe : pipes)
		pipe.DiscardStale(serial);

	const std::size_t frames = dest.size() / channels;
	std::size_t done = 0;

	const PlayerState state = transport.GetState();
	if (IsRendering(state)) {
		while (done < frames &&
		       (fade.active
			? PlayCrossFade(dest, done)
			: PlayActive(dest, done))) {}

		/* running dry after the last track is not an
		   underrun */
		if (done < frames &&
		    (!drained || (state == PlayerState::PLAY &&
				  !transport.IsDecodeFinished())))
			transport.AddUnderrun();
	}

	const auto played = dest.first(done * channels);
	std::fill(dest.begin() + played.size(), dest.end(), 0.f);

	const float gain = transport.GetGain();
	if (gain != 1.f)
		pcm_scale(played, gain);

	transport.StoreClock(track_id, position);
}
