// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Control.hxx"
#include "decoder/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "pcm/Volume.hxx"
#include "util/BindMethod.hxx"

#include <algorithm>
#include <utility>

PlayerControl::PlayerControl(PlayerListener &_listener,
			     const DecoderPluginList &_decoder_plugins,
			     const PlayerConfig &_config)
	:listener(_listener),
	 decoder_plugins(_decoder_plugins),
	 config(_config),
	 transport(config.audio_format.sample_rate),
	 pipes{{
		 {config.GetPipeFrames(), config.audio_format.channels},
		 {config.GetPipeFrames(), config.audio_format.channels},
	 }},
	 renderer(transport, pipes, config.audio_format.channels),
	 thread(BIND_THIS_METHOD(RunThread)),
	 cross_fade(config.cross_fade),
	 loop_mode(config.loop_mode)
{
	transport.SetVolume(config.volume);
}

PlayerControl::~PlayerControl() noexcept
{
	Kill();
}

void
PlayerControl::StartThread()
{
	if (!thread.IsDefined())
		thread.Start();
}

void
PlayerControl::Kill() noexcept
{
	if (!thread.IsDefined())
		return;

	LockSynchronousCommand(PlayerCommand::EXIT);
	thread.Join();
}

void
PlayerControl::Play(TrackDescriptor track)
{
	StartThread();

	std::unique_lock<Mutex> lock(mutex);
	WaitCommandLocked(lock);
	play_track = std::move(track);
	SynchronousCommand(lock, PlayerCommand::PLAY);
}

void
PlayerControl::Enqueue(TrackDescriptor track)
{
	StartThread();

	std::unique_lock<Mutex> lock(mutex);
	queue.push_back(std::move(track));
	SynchronousCommand(lock, PlayerCommand::QUEUE);
}

void
PlayerControl::SetPause(bool _pause_flag) noexcept
{
	if (!thread.IsDefined())
		return;

	std::unique_lock<Mutex> lock(mutex);
	WaitCommandLocked(lock);
	pause_flag = _pause_flag;
	SynchronousCommand(lock, PlayerCommand::PAUSE);
}

void
PlayerControl::Stop() noexcept
{
	if (!thread.IsDefined())
		return;

	LockSynchronousCommand(PlayerCommand::STOP);
}

void
PlayerControl::Skip() noexcept
{
	if (!thread.IsDefined())
		return;

	LockSynchronousCommand(PlayerCommand::SKIP);
}

void
PlayerControl::Seek(FloatDuration t)
{
	if (!thread.IsDefined())
		throw SeekError::Unseekable();

	std::unique_lock<Mutex> lock(mutex);
	WaitCommandLocked(lock);
	seek_time = t;
	seek_error = {};
	SynchronousCommand(lock, PlayerCommand::SEEK);

	if (seek_error)
		std::rethrow_exception(std::exchange(seek_error, {}));
}

void
PlayerControl::SetVolume(unsigned volume)
{
	if (volume > PCM_VOLUME_MAX)
		throw FmtInvalidArgument("Volume {} is out of range (0..{})",
					 volume, PCM_VOLUME_MAX);

	transport.SetVolume(volume);
}

void
PlayerControl::SetCrossFade(FloatDuration duration)
{
	if (duration.count() < 0 || duration > config.max_crossfade)
		throw FmtInvalidArgument("Cross-fade {}s is out of range (0..{}s)",
					 duration.count(),
					 config.max_crossfade.count());

	const std::scoped_lock<Mutex> protect(mutex);
	cross_fade.duration = duration;
}

void
PlayerControl::SetCrossFadeCurve(CrossFadeCurve curve) noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	cross_fade.curve = curve;
}

void
PlayerControl::SetLoopMode(LoopMode mode) noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	loop_mode = mode;
	Signal();
}

PlayerStatus
PlayerControl::GetStatus() const noexcept
{
	const auto snapshot = transport.GetSnapshot();

	PlayerStatus status;
	status.state = snapshot.state;
	status.track_id = snapshot.track_id;
	status.elapsed_time = SongTime::Cast(snapshot.elapsed);
	status.output_format = config.audio_format;
	status.underruns = snapshot.underruns;

	const std::scoped_lock<Mutex> protect(mutex);
	status.total_time = total_time;
	status.input_format = input_format;
	status.corrupt_frames = corrupt_frames;
	status.error_generation = error_generation;
	status.error_track_id = last_error_track_id;
	status.error = last_error;
	return status;
}

std::exception_ptr
PlayerControl::GetTrackError(uint64_t track_id) const noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	const auto i = errors.find(track_id);
	return i != errors.end()
		? i->second
		: std::exception_ptr{};
}

void
PlayerControl::ClearErrors() noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	errors.clear();
	error_order.clear();
	last_error_track_id = 0;
	last_error = {};
}

void
PlayerControl::LockAddError(uint64_t track_id,
			    std::exception_ptr error) noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);

	if (auto [i, inserted] = errors.try_emplace(track_id, error); !inserted) {
		i->second = error;
		error_order.erase(std::find(error_order.begin(),
					    error_order.end(), track_id));
	}

	error_order.push_back(track_id);

	if (error_order.size() > MAX_ERRORS) {
		errors.erase(error_order.front());
		error_order.pop_front();
	}

	last_error_track_id = track_id;
	last_error = std::move(error);
	++error_generation;
}

std::optional<TrackDescriptor>
PlayerControl::LockPopQueue() noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	if (queue.empty())
		return std::nullopt;

	std::optional<TrackDescriptor> result{std::move(queue.front())};
	queue.pop_front();

	transport.SetNextTrack(queue.empty() ? 0 : queue.front().id);
	return result;
}

void
PlayerControl::LockPushFrontQueue(TrackDescriptor &&track) noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	transport.SetNextTrack(track.id);
	queue.push_front(std::move(track));
}

void
PlayerControl::LockClearQueue() noexcept
{
	const std::scoped_lock<Mutex> protect(mutex);
	queue.clear();
	transport.SetNextTrack(0);
}
