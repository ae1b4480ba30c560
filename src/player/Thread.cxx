// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

/* \file
 *
 * The decoder thread: it carries out the commands of
 * #PlayerControl, keeps the #MusicPipe objects filled ahead of the
 * output and arranges the transitions between tracks (gapless,
 * cross-fade and loops).
 *
 * It never waits for the output callback; it polls the events and
 * the pipe fill levels, and sleeps at most #POLL_INTERVAL when
 * there is nothing to do.
 */

#include "Control.hxx"
#include "Listener.hxx"
#include "decoder/Bridge.hxx"
#include "decoder/Error.hxx"
#include "thread/Name.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "Log.hxx"

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <vector>

static constexpr Domain player_domain("player");

static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

/**
 * Do at most this many decode steps before checking for commands.
 */
static constexpr unsigned MAX_STEPS = 8;

class Player {
	PlayerControl &pc;

	Transport &transport;

	std::array<MusicPipe, 2> &pipes;

	const unsigned sample_rate;
	const unsigned channels;

	/**
	 * Keep this many frames in the pipe ahead of the output.
	 */
	const std::size_t buffer_frames;

	/**
	 * Decode this many frames per step.
	 */
	const std::size_t chunk_frames;

	std::unique_ptr<DecoderBridge> bridge;

	/**
	 * The track being decoded; its id is 0 if there is none.
	 */
	TrackDescriptor track;

	/**
	 * The track before #track whose tail is still in a pipe,
	 * i.e. the output may still be playing it.
	 */
	std::optional<TrackDescriptor> previous;

	/**
	 * The pipe #track is being decoded into.
	 */
	unsigned pipe_index = 0;

	/**
	 * The current flush generation.
	 */
	uint32_t serial = 0;

	/**
	 * Frames which did not fit into the pipe.
	 */
	std::vector<float> pending;
	uint64_t pending_frame = 0;

	/**
	 * Frames pushed since the last flush.
	 */
	uint64_t pushed_since_flush = 0;

	/**
	 * Frames decoded since the last loop rewind; an empty loop
	 * region ends the track instead of spinning.
	 */
	uint64_t frames_since_rewind = 0;

	/**
	 * The first frame pushed for #track gets the
	 * #MusicChunk::START flag.
	 */
	bool start_pending = false;

	/**
	 * #track has ended, but its end marker did not fit into the
	 * pipe yet.
	 */
	bool end_pending = false;

	/**
	 * #track has been decoded completely and its end marker has
	 * been pushed.
	 */
	bool decoded = false;

	/**
	 * A cross-fade into #pipe_index has been armed, and the
	 * output has not switched to it yet.
	 */
	bool crossfading = false;

	/**
	 * Is #track being looped?
	 */
	bool looping = false;

	uint64_t loop_start_frame = 0;

	PlayerState state = PlayerState::STOP;

	bool paused = false;

	/**
	 * The last track has been decoded and nothing is queued.
	 */
	bool ending = false;

	/**
	 * The output has started playing #track.  Only then does an
	 * #ending player report TRACK_ENDING.
	 */
	bool track_audible = false;

	/**
	 * Copies of the #PlayerControl settings, updated by
	 * SyncSettings().
	 */
	CrossFadeSettings cross_fade;
	LoopMode loop_mode;
	bool has_next = false;

public:
	explicit Player(PlayerControl &_pc)
		:pc(_pc), transport(pc.transport), pipes(pc.pipes),
		 sample_rate(pc.config.audio_format.sample_rate),
		 channels(pc.config.audio_format.channels),
		 buffer_frames(pc.config.GetBufferFrames()),
		 chunk_frames(pc.config.GetDecodeChunkFrames()),
		 bridge(NewBridge()),
		 cross_fade(pc.cross_fade),
		 loop_mode(pc.loop_mode) {}

	/**
	 * The main loop of the decoder thread.
	 *
	 * Caller must lock the mutex.
	 */
	void Run(std::unique_lock<Mutex> &lock) noexcept;

private:
	std::unique_ptr<DecoderBridge> NewBridge() const {
		return std::make_unique<DecoderBridge>(pc.decoder_plugins,
						       pc.config.audio_format,
						       pc.config.corrupt_frame_threshold);
	}

	/**
	 * Carry out the pending command.
	 *
	 * Caller must lock the mutex.
	 *
	 * @return false if the thread shall exit
	 */
	bool ProcessCommand(std::unique_lock<Mutex> &lock) noexcept;

	/**
	 * Copy settings from #PlayerControl and publish our status.
	 *
	 * Caller must lock the mutex.
	 */
	void SyncSettings() noexcept;

	/**
	 * Do some decoding.
	 *
	 * @return true if something was done
	 */
	bool Work() noexcept;

	/**
	 * Hand the events of the output callback to the listener.
	 */
	void DispatchEvents() noexcept;

	PlayerState GetRunningState() const noexcept {
		if (paused)
			return PlayerState::PAUSE;
		else if (ending && track_audible)
			return PlayerState::TRACK_ENDING;
		else
			return PlayerState::PLAY;
	}

	void Publish(PlayerState new_state) noexcept;

	void Publish() noexcept {
		Publish(GetRunningState());
	}

	/**
	 * Leave the SEEK state after prebuffering: PLAY (or PAUSE)
	 * first, even if the track has been decoded completely
	 * already.
	 */
	void SetEnding(bool value) noexcept {
		ending = value;
		transport.SetDecodeFinished(value);
	}

	void PublishResumed() noexcept {
		Publish(paused ? PlayerState::PAUSE : PlayerState::PLAY);
		Publish();
	}

	/**
	 * Tell the output to drop everything and continue with the
	 * given track position in pipe #pipe_index.
	 */
	void Flush(uint64_t track_id, uint64_t position) noexcept;

	/**
	 * Forget everything about the decoding of #track.
	 */
	void ResetDecoder() noexcept;

	/**
	 * Set up the loop of #track according to #loop_mode.
	 */
	void ApplyLoop() noexcept;

	/**
	 * Decode until #buffer_frames frames are in the pipe (or the
	 * pipe is full, or there is nothing left to decode).
	 */
	void Prebuffer() noexcept;

	/**
	 * Decode one batch and push it.
	 *
	 * @return false if nothing could be done
	 */
	bool DecodeStep() noexcept;

	/**
	 * @return the number of frames accepted by the pipe
	 */
	std::size_t Push(uint64_t first_frame,
			 std::span<const float> data) noexcept;

	/**
	 * Push what is left in #pending.
	 *
	 * @return true if #pending is empty now
	 */
	bool PushPending() noexcept;

	/**
	 * Push the end marker of #track.
	 *
	 * @return false if the pipe is full
	 */
	bool PushEnd() noexcept;

	/**
	 * The decoder has reached the end of #track (or of its loop
	 * region).
	 */
	void OnEndOfStream() noexcept;

	/**
	 * Continue with the first queued track, gapless or with a
	 * cross-fade.
	 */
	void StartNext() noexcept;

	/**
	 * Open the given track (or the first of the queue which
	 * opens), flush and prebuffer.  Stops if no track can be
	 * opened.
	 */
	void StartTrack(TrackDescriptor &&t) noexcept;

	void StopPlayback() noexcept;

	/**
	 * Throws on error.
	 */
	void SeekPlaying(FloatDuration t);

	void OnTrackError(uint64_t track_id, std::exception_ptr error) noexcept;

	/**
	 * The number of frames the decoder keeps in the pipe.  When
	 * a cross-fade is coming up, the outgoing track's tail must
	 * be in the pipe completely before the fade begins.
	 */
	uint64_t GetTarget() const noexcept {
		uint64_t target = buffer_frames;
		if (has_next && cross_fade.IsEnabled())
			target += cross_fade.Calculate(sample_rate);
		return target;
	}
};

void
Player::Publish(PlayerState new_state) noexcept
{
	if (new_state == state)
		return;

	state = new_state;
	transport.SetState(state);

	FmtDebug(player_domain, "state {}", ToString(state));
	pc.listener.OnPlayerStateChanged(state);
}

void
Player::Flush(uint64_t track_id, uint64_t position) noexcept
{
	++serial;
	crossfading = false;
	pushed_since_flush = 0;
	transport.StoreFlush({serial, track_id, position, pipe_index});
}

void
Player::ResetDecoder() noexcept
{
	pending.clear();
	frames_since_rewind = 0;
	start_pending = false;
	end_pending = false;
	decoded = false;
	crossfading = false;
}

void
Player::ApplyLoop() noexcept
{
	looping = false;
	loop_start_frame = 0;

	if (!bridge->IsOpen())
		return;

	switch (loop_mode) {
	case LoopMode::NONE:
		break;

	case LoopMode::POINTS:
		looping = track.HasLoop();
		break;

	case LoopMode::TRACK:
		looping = true;
		break;
	}

	if (looping && track.HasLoop()) {
		loop_start_frame = std::floor(track.GetLoopStart().count() * sample_rate);
		bridge->SetEndFrame(std::floor(track.loop_end->count() * sample_rate));
	} else
		bridge->ClearEndFrame();
}

std::size_t
Player::Push(uint64_t first_frame, std::span<const float> data) noexcept
{
	const MusicPipe::Origin origin{
		track.id, serial, first_frame,
		start_pending ? MusicChunk::START : uint8_t(0),
	};

	const std::size_t n = pipes[pipe_index].TryPush(origin, data);
	if (n > 0)
		start_pending = false;

	pushed_since_flush += n;
	return n;
}

bool
Player::PushPending() noexcept
{
	if (pending.empty())
		return true;

	const std::size_t n = Push(pending_frame, pending);
	pending.erase(pending.begin(), pending.begin() + n * channels);
	pending_frame += n;
	return pending.empty();
}

bool
Player::PushEnd() noexcept
{
	const MusicPipe::Origin origin{
		track.id, serial, bridge->GetPosition(),
		start_pending ? MusicChunk::START : uint8_t(0),
	};

	if (!pipes[pipe_index].PushEnd(origin))
		return false;

	FmtDebug(player_domain, "decoded track {} completely", track.id);

	start_pending = false;
	end_pending = false;
	decoded = true;
	StartNext();
	return true;
}

bool
Player::DecodeStep() noexcept
{
	if (!PushPending())
		return false;

	if (end_pending)
		return PushEnd();

	if (decoded || !bridge->IsOpen())
		return false;

	/* frames pushed before the last flush are still in the pipe
	   until the output drops them; they don't count */
	const uint64_t buffered = std::min(pipes[pipe_index].GetBufferedFrames(),
					   pushed_since_flush);
	if (buffered >= GetTarget())
		return false;

	PcmBatch batch;
	try {
		batch = bridge->Read(chunk_frames);
	} catch (...) {
		OnTrackError(track.id, std::current_exception());
		end_pending = true;
		return true;
	}

	if (auto error = bridge->TakeRecoveredError()) {
		Log(LogLevel::WARNING, error, "Skipped corrupt data");
		pc.LockAddError(track.id, error);
		pc.listener.OnRecoveredDecodeError(track.id, error);
	}

	if (batch.IsEnd()) {
		OnEndOfStream();
		return true;
	}

	frames_since_rewind += batch.data.size() / channels;

	const std::size_t n = Push(batch.first_frame, batch.data);
	if (n * channels < batch.data.size()) {
		pending.assign(batch.data.begin() + n * channels,
			       batch.data.end());
		pending_frame = batch.first_frame + n;
	}

	return true;
}

void
Player::OnEndOfStream() noexcept
{
	if (looping) {
		if (frames_since_rewind > 0) {
			try {
				bridge->Rewind(loop_start_frame);
				frames_since_rewind = 0;
				return;
			} catch (...) {
				OnTrackError(track.id, std::current_exception());
			}
		} else
			FmtWarning(player_domain,
				   "Loop region of track {} is empty", track.id);
	}

	end_pending = true;
	PushEnd();
}

void
Player::StartNext() noexcept
{
	while (true) {
		auto next = pc.LockPopQueue();
		if (!next) {
			SetEnding(true);
			if (state != PlayerState::SEEK)
				Publish();
			return;
		}

		const auto old_duration = bridge->GetDuration();

		try {
			bridge->Open(*next);
		} catch (...) {
			OnTrackError(next->id, std::current_exception());
			continue;
		}

		FmtDebug(player_domain, "continuing with track {}", next->id);

		previous = std::move(track);
		track = std::move(*next);
		track_audible = false;
		ResetDecoder();
		start_pending = true;
		ApplyLoop();

		const unsigned other = 1 - pipe_index;
		if (cross_fade.CanCrossFade(old_duration, bridge->GetDuration()) &&
		    transport.GetActivePipe() == pipe_index &&
		    pipes[other].GetBufferedFrames() == 0) {
			pipe_index = other;
			crossfading = true;
			transport.StoreCrossFade({
					serial, pipe_index,
					cross_fade.Calculate(sample_rate),
					cross_fade.curve,
				});
		}

		SetEnding(false);
		if (state != PlayerState::SEEK)
			Publish();
		return;
	}
}

void
Player::StartTrack(TrackDescriptor &&t) noexcept
{
	while (true) {
		try {
			bridge->Open(t);
			break;
		} catch (...) {
			OnTrackError(t.id, std::current_exception());
		}

		auto next = pc.LockPopQueue();
		if (!next) {
			StopPlayback();
			return;
		}

		t = std::move(*next);
	}

	FmtDebug(player_domain, "playing track {} \"{}\"", t.id, t.path);

	track = std::move(t);
	track_audible = false;
	previous.reset();
	ResetDecoder();
	start_pending = true;
	SetEnding(false);
	ApplyLoop();

	pipe_index = 0;
	Flush(track.id, 0);

	Publish(PlayerState::SEEK);
	Prebuffer();
	PublishResumed();
}

void
Player::StopPlayback() noexcept
{
	bridge->Close();
	track = {};
	previous.reset();
	ResetDecoder();
	ApplyLoop();
	paused = false;
	SetEnding(false);
	track_audible = false;

	pc.LockClearQueue();

	pipe_index = 0;
	Flush(0, 0);
	Publish(PlayerState::STOP);
}

void
Player::SeekPlaying(FloatDuration t)
{
	if (state == PlayerState::STOP || track.id == 0)
		throw SeekError::Unseekable();

	if (t.count() < 0)
		throw SeekError::OutOfRange();

	const uint64_t frame = std::llround(t.count() * sample_rate);

	const uint64_t playing_id = transport.LoadClock()[0];
	if (previous && playing_id == previous->id && playing_id != track.id) {
		/* the output is still playing the previous track;
		   go back to it, and queue the current one again */
		auto b = NewBridge();
		b->Open(*previous);
		b->Seek(frame);

		bridge = std::move(b);
		pc.LockPushFrontQueue(std::move(track));
		track = std::move(*previous);
		previous.reset();
	} else {
		if (!bridge->IsOpen())
			bridge->Open(track);

		bridge->Seek(frame);
	}

	FmtDebug(player_domain, "seeked track {} to {}s", track.id, t.count());

	ResetDecoder();
	SetEnding(false);
	ApplyLoop();

	/* the output continues with this track at the new position */
	track_audible = true;

	pipe_index = 0;
	Flush(track.id, frame);

	Publish(PlayerState::SEEK);
	Prebuffer();
	PublishResumed();
}

void
Player::Prebuffer() noexcept
{
	while (pushed_since_flush < buffer_frames && !pipes[pipe_index].IsFull() &&
	       DecodeStep()) {}
}

void
Player::OnTrackError(uint64_t track_id, std::exception_ptr error) noexcept
{
	FmtError(player_domain, "Track {} failed: {}",
		 track_id, GetFullMessage(error));

	pc.LockAddError(track_id, error);
	pc.listener.OnTrackError(track_id, std::move(error));
}

void
Player::DispatchEvents() noexcept
{
	RenderEvent event;
	while (transport.PopEvent(event)) {
		switch (event.type) {
		case RenderEvent::Type::TRACK_STARTED:
			FmtDebug(player_domain, "track {} started", event.track_id);

			if (previous && event.track_id == track.id)
				/* the output has passed the border */
				previous.reset();

			pc.listener.OnTrackStarted(event.track_id);

			if (event.track_id == track.id && state != PlayerState::STOP) {
				track_audible = true;
				Publish();
			}
			break;

		case RenderEvent::Type::TRACK_ENDED:
			FmtDebug(player_domain, "track {} ended", event.track_id);

			pc.listener.OnTrackEnded(event.track_id);

			if (ending && decoded && state != PlayerState::STOP &&
			    event.track_id == track.id)
				/* the output has played everything */
				StopPlayback();
			break;
		}
	}
}

bool
Player::Work() noexcept
{
	if (crossfading && transport.GetActivePipe() == pipe_index)
		crossfading = false;

	if (state == PlayerState::STOP || paused)
		return false;

	bool busy = false;
	for (unsigned i = 0; i < MAX_STEPS && DecodeStep(); ++i)
		busy = true;

	return busy;
}

void
Player::SyncSettings() noexcept
{
	cross_fade = pc.cross_fade;

	if (loop_mode != pc.loop_mode) {
		loop_mode = pc.loop_mode;
		ApplyLoop();
	}

	has_next = !pc.queue.empty();
	transport.SetNextTrack(has_next ? pc.queue.front().id : 0);

	pc.total_time = bridge->IsOpen()
		? bridge->GetDuration()
		: SignedSongTime::Negative();
	pc.input_format = bridge->IsOpen()
		? bridge->GetInputFormat()
		: AudioFormat::Undefined();
	pc.corrupt_frames = bridge->IsOpen()
		? bridge->GetCorruptFrames()
		: 0;
}

bool
Player::ProcessCommand(std::unique_lock<Mutex> &lock) noexcept
{
	switch (pc.command) {
	case PlayerCommand::NONE:
		return true;

	case PlayerCommand::EXIT:
		bridge->Close();
		pipe_index = 0;
		Flush(0, 0);
		state = PlayerState::STOP;
		transport.SetState(state);
		pc.CommandFinished();
		return false;

	case PlayerCommand::PLAY:
		{
			auto t = std::move(*pc.play_track);
			pc.play_track.reset();

			const ScopeUnlock unlock(pc.mutex);
			paused = false;
			StartTrack(std::move(t));
		}
		break;

	case PlayerCommand::STOP:
		{
			const ScopeUnlock unlock(pc.mutex);
			StopPlayback();
		}
		break;

	case PlayerCommand::PAUSE:
		if (state != PlayerState::STOP) {
			paused = pc.pause_flag;

			const ScopeUnlock unlock(pc.mutex);
			Publish();
		}
		break;

	case PlayerCommand::SEEK:
		{
			const auto t = pc.seek_time;
			std::exception_ptr error;

			{
				const ScopeUnlock unlock(pc.mutex);

				try {
					SeekPlaying(t);
				} catch (...) {
					error = std::current_exception();

					FmtWarning(player_domain, "Seek failed: {}",
						   GetFullMessage(error));
					pc.LockAddError(track.id, error);
					pc.listener.OnSeekError(track.id, error);
				}
			}

			pc.seek_error = std::move(error);
		}
		break;

	case PlayerCommand::QUEUE:
		has_next = !pc.queue.empty();

		if (ending && decoded && !end_pending &&
		    state != PlayerState::STOP) {
			/* the last track has been decoded already;
			   continue gapless */
			const ScopeUnlock unlock(pc.mutex);
			StartNext();
		}
		break;

	case PlayerCommand::SKIP:
		{
			const ScopeUnlock unlock(pc.mutex);

			if (auto next = pc.LockPopQueue())
				StartTrack(std::move(*next));
			else
				StopPlayback();
		}
		break;
	}

	SyncSettings();
	pc.CommandFinished();
	return true;
}

inline void
Player::Run(std::unique_lock<Mutex> &lock) noexcept
{
	while (true) {
		if (!ProcessCommand(lock))
			return;

		SyncSettings();

		bool busy;

		{
			const ScopeUnlock unlock(pc.mutex);
			DispatchEvents();
			busy = Work();
		}

		if (!busy && pc.command == PlayerCommand::NONE)
			pc.cond.wait_for(lock, POLL_INTERVAL);
	}
}

void
PlayerControl::RunThread() noexcept
{
	SetThreadName("decoder");

	std::unique_lock<Mutex> lock(mutex);

	try {
		Player player(*this);
		player.Run(lock);
	} catch (...) {
		/* constructing the Player failed (out of memory);
		   keep serving commands so nobody waits forever */
		const auto error = std::current_exception();
		Log(LogLevel::ERROR, error, "Decoder thread failed");

		while (true) {
			if (command == PlayerCommand::EXIT) {
				CommandFinished();
				return;
			} else if (command != PlayerCommand::NONE) {
				if (command == PlayerCommand::SEEK)
					seek_error = error;
				CommandFinished();
			}

			cond.wait(lock);
		}
	}
}
