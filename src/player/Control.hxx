// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PLAYER_CONTROL_HXX
#define LILT_PLAYER_CONTROL_HXX

#include "State.hxx"
#include "Transport.hxx"
#include "MusicPipe.hxx"
#include "Renderer.hxx"
#include "CrossFade.hxx"
#include "LoopMode.hxx"
#include "Track.hxx"
#include "config/PlayerConfig.hxx"
#include "decoder/DecoderList.hxx"
#include "pcm/AudioFormat.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"
#include "thread/Thread.hxx"
#include "Chrono.hxx"

#include <array>
#include <cassert>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <optional>

class PlayerListener;
class RenderCallback;

enum class PlayerCommand : uint8_t {
	NONE,
	EXIT,

	/**
	 * Flush everything and start playing
	 * PlayerControl::play_track.
	 */
	PLAY,

	STOP,

	/**
	 * Apply PlayerControl::pause_flag.
	 */
	PAUSE,

	/**
	 * Seek the track the output is playing to
	 * PlayerControl::seek_time.  The result is stored in
	 * PlayerControl::seek_error.
	 */
	SEEK,

	/** PlayerControl::queue has been updated */
	QUEUE,

	/**
	 * Abandon the current track and continue with the first
	 * queued one.
	 */
	SKIP,
};

struct PlayerStatus {
	PlayerState state;

	/**
	 * The track the output is playing.
	 */
	uint64_t track_id;

	SongTime elapsed_time;

	/**
	 * The following attributes describe the track being decoded,
	 * which may already be the successor of #track_id.
	 */
	SignedSongTime total_time;
	AudioFormat input_format;
	unsigned corrupt_frames;

	AudioFormat output_format;

	uint64_t underruns;

	/**
	 * Incremented for each error added to the registry; a client
	 * compares it with the value it has seen before to find out
	 * whether there is news.
	 */
	unsigned error_generation;

	/**
	 * The most recent error and the track it belongs to.
	 */
	uint64_t error_track_id;
	std::exception_ptr error;
};

/**
 * The command surface of the playback engine.  It owns the decoder
 * thread, the two pipes and the #Renderer, which the output device
 * calls.
 *
 * Commands are handed to the decoder thread through a mailbox
 * protected by #mutex; all of them are synchronous, i.e. they return
 * after the decoder thread has carried them out.  The output
 * callback never touches the mailbox.
 */
class PlayerControl final {
	friend class Player;

	PlayerListener &listener;

	const DecoderPluginList &decoder_plugins;

	const PlayerConfig config;

	Transport transport;

	/**
	 * Two pipes: during a cross-fade, the incoming track is
	 * decoded into the one the output is not playing from.
	 */
	std::array<MusicPipe, 2> pipes;

	Renderer renderer;

	/**
	 * The handle of the decoder thread.
	 */
	Thread thread;

	/**
	 * This lock protects the mailbox (#command and its
	 * parameters), the queue, the settings and the status.
	 */
	mutable Mutex mutex;

	/**
	 * Trigger this object after you have modified #command.
	 */
	Cond cond;

	/**
	 * This object gets signalled when the decoder thread has
	 * finished the #command.  It wakes up the client that waits.
	 */
	Cond client_cond;

	PlayerCommand command = PlayerCommand::NONE;

	std::optional<TrackDescriptor> play_track;

	/**
	 * The tracks which will be played after the current one, in
	 * this order.
	 */
	std::deque<TrackDescriptor> queue;

	FloatDuration seek_time;

	std::exception_ptr seek_error;

	bool pause_flag = false;

	CrossFadeSettings cross_fade;

	LoopMode loop_mode;

	/**
	 * Status of the track being decoded, updated by the decoder
	 * thread.
	 */
	SignedSongTime total_time = SignedSongTime::Negative();
	AudioFormat input_format = AudioFormat::Undefined();
	unsigned corrupt_frames = 0;

	/**
	 * The last error of each track.
	 */
	std::map<uint64_t, std::exception_ptr> errors;

	/**
	 * The keys of #errors, least recently reported first.
	 */
	std::deque<uint64_t> error_order;

	unsigned error_generation = 0;
	uint64_t last_error_track_id = 0;
	std::exception_ptr last_error;

public:
	/**
	 * The registry forgets the oldest entries beyond this size.
	 */
	static constexpr std::size_t MAX_ERRORS = 256;

	/**
	 * Throws std::bad_alloc.
	 */
	PlayerControl(PlayerListener &_listener,
		      const DecoderPluginList &_decoder_plugins,
		      const PlayerConfig &_config);

	~PlayerControl() noexcept;

	PlayerControl(const PlayerControl &) = delete;
	PlayerControl &operator=(const PlayerControl &) = delete;

	const PlayerConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * The format the #RenderCallback produces.
	 */
	AudioFormat GetOutputFormat() const noexcept {
		return config.audio_format;
	}

	/**
	 * The callback to be passed to the output device.
	 */
	RenderCallback &GetRenderCallback() noexcept {
		return renderer;
	}

	/**
	 * Stop the decoder thread.  This is called by the
	 * destructor, but may be called earlier.
	 */
	void Kill() noexcept;

	/**
	 * Abandon whatever is playing and play this track.  If it
	 * cannot be opened, the listener is notified and the player
	 * continues with the queue.
	 *
	 * Throws if the decoder thread cannot be started.
	 */
	void Play(TrackDescriptor track);

	/**
	 * Append a track to the queue; it will follow the current
	 * one without a gap (or with a cross-fade).
	 *
	 * Throws if the decoder thread cannot be started.
	 */
	void Enqueue(TrackDescriptor track);

	void Pause() noexcept {
		SetPause(true);
	}

	void Resume() noexcept {
		SetPause(false);
	}

	void SetPause(bool pause_flag) noexcept;

	/**
	 * Stop playback and clear the queue.
	 */
	void Stop() noexcept;

	/**
	 * Continue with the next queued track, or stop if there is
	 * none.
	 */
	void Skip() noexcept;

	/**
	 * Seek within the track the output is playing.
	 *
	 * Throws #SeekError (or another exception if the track
	 * could not be accessed); the position is unchanged then.
	 *
	 * @param t the position relative to the start of the track
	 */
	void Seek(FloatDuration t);

	/**
	 * Throws std::invalid_argument if the value is out of range.
	 *
	 * @param volume the volume in percent (0..200)
	 */
	void SetVolume(unsigned volume);

	void SetMute(bool mute) noexcept {
		transport.SetMute(mute);
	}

	/**
	 * Throws std::invalid_argument if the duration exceeds the
	 * configured maximum.
	 */
	void SetCrossFade(FloatDuration duration);

	void SetCrossFadeCurve(CrossFadeCurve curve) noexcept;

	CrossFadeSettings GetCrossFade() const noexcept {
		const std::scoped_lock<Mutex> protect(mutex);
		return cross_fade;
	}

	void SetLoopMode(LoopMode mode) noexcept;

	LoopMode GetLoopMode() const noexcept {
		const std::scoped_lock<Mutex> protect(mutex);
		return loop_mode;
	}

	PlayerStatus GetStatus() const noexcept;

	/**
	 * Lock-free; may be called from any thread at any rate.
	 */
	PlayerSnapshot GetSnapshot() const noexcept {
		return transport.GetSnapshot();
	}

	/**
	 * Returns the last error recorded for the given track, or
	 * nullptr.
	 */
	std::exception_ptr GetTrackError(uint64_t track_id) const noexcept;

	void ClearErrors() noexcept;

private:
	/**
	 * Start the decoder thread unless it is already running.
	 *
	 * Throws on error.
	 */
	void StartThread();

	/**
	 * Signals the object.  The object should be locked prior to
	 * calling this function.
	 */
	void Signal() noexcept {
		cond.notify_one();
	}

	/**
	 * Wake up the client waiting for command completion.
	 *
	 * Caller must lock the object.
	 */
	void ClientSignal() noexcept {
		assert(thread.IsInside());

		client_cond.notify_all();
	}

	/**
	 * The client calls this method to wait for command
	 * completion.
	 *
	 * Caller must lock the object.
	 */
	void ClientWait(std::unique_lock<Mutex> &lock) noexcept {
		assert(!thread.IsInside());

		client_cond.wait(lock);
	}

	/**
	 * A command has been finished.  This method clears the
	 * command and signals the client.
	 *
	 * To be called from the decoder thread.  Caller must lock
	 * the object.
	 */
	void CommandFinished() noexcept {
		assert(command != PlayerCommand::NONE);

		command = PlayerCommand::NONE;
		ClientSignal();
	}

	/**
	 * Wait for the command to be finished by the decoder thread.
	 *
	 * Caller must lock the object.
	 */
	void WaitCommandLocked(std::unique_lock<Mutex> &lock) noexcept {
		while (command != PlayerCommand::NONE)
			ClientWait(lock);
	}

	/**
	 * Send a command to the decoder thread and synchronously
	 * wait for it to finish.
	 *
	 * Caller must lock the object.
	 */
	void SynchronousCommand(std::unique_lock<Mutex> &lock,
				PlayerCommand cmd) noexcept {
		/* another client may be waiting for its command */
		WaitCommandLocked(lock);

		command = cmd;
		Signal();
		WaitCommandLocked(lock);
	}

	void LockSynchronousCommand(PlayerCommand cmd) noexcept {
		std::unique_lock<Mutex> lock(mutex);
		SynchronousCommand(lock, cmd);
	}

	/**
	 * Remove the first queued track.  Called by the decoder
	 * thread.  Locks the object.
	 */
	std::optional<TrackDescriptor> LockPopQueue() noexcept;

	/**
	 * Put a track back to the front of the queue.  Called by
	 * the decoder thread.  Locks the object.
	 */
	void LockPushFrontQueue(TrackDescriptor &&track) noexcept;

	void LockClearQueue() noexcept;

	/**
	 * Record an error in the registry.  Locks the object.
	 */
	void LockAddError(uint64_t track_id, std::exception_ptr error) noexcept;

	void RunThread() noexcept;
};

#endif
