// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "CommandLine.hxx"
#include "Engine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "Track.hxx"
#include "config/Data.hxx"
#include "player/Control.hxx"
#include "player/Listener.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "util/ScopeExit.hxx"

#include <cstdlib>

static constexpr Domain main_domain("main");

/**
 * Logs the player's events and waits for the end of playback.
 */
class MainListener final : public PlayerListener {
	Mutex mutex;
	Cond cond;

	bool started = false, stopped = false;

public:
	void WaitStopped() noexcept {
		std::unique_lock<Mutex> lock(mutex);
		cond.wait(lock, [this]{ return stopped; });
	}

	/* virtual methods from class PlayerListener */
	void OnPlayerStateChanged(PlayerState state) noexcept override {
		FmtDebug(main_domain, "Player state: {}", ToString(state));

		const std::scoped_lock<Mutex> protect(mutex);
		if (state != PlayerState::STOP)
			started = true;
		else if (started) {
			stopped = true;
			cond.notify_one();
		}
	}

	void OnTrackStarted(uint64_t track_id) noexcept override {
		FmtNotice(main_domain, "Playing track {}", track_id);
	}

	void OnTrackEnded(uint64_t track_id) noexcept override {
		FmtInfo(main_domain, "Track {} ended", track_id);
	}

	void OnTrackError(uint64_t track_id,
			  std::exception_ptr error) noexcept override {
		FmtError(main_domain, "Skipping track {}: {}",
			 track_id, GetFullMessage(error));
	}

	void OnRecoveredDecodeError(uint64_t track_id,
				    std::exception_ptr error) noexcept override {
		FmtWarning(main_domain, "Track {}: {}",
			   track_id, GetFullMessage(error));
	}

	void OnSeekError(uint64_t track_id,
			 std::exception_ptr error) noexcept override {
		FmtWarning(main_domain, "Track {}: {}",
			   track_id, GetFullMessage(error));
	}
};

static void
MainConfigured(const CommandLineOptions &options, const ConfigData &config)
{
	log_init(config, options.verbose);

	MainListener listener;
	Engine engine(config, listener);
	auto &player = engine.GetPlayer();

	/* all plugins have read their settings by now */
	config.WarnUnused();

	/* queue the successors first, so the player can skip to
	   them if the first one fails */
	for (std::size_t i = 1; i < options.files.size(); ++i)
		player.Enqueue(TrackDescriptor(i + 1, options.files[i]));

	player.Play(TrackDescriptor(1, options.files.front()));

	if (player.GetStatus().state != PlayerState::STOP)
		listener.WaitStopped();

	const auto status = player.GetStatus();
	if (status.underruns > 0)
		FmtInfo(main_domain, "{} buffer underruns", status.underruns);
}

static inline void
MainOrThrow(int argc, char *argv[])
{
	CommandLineOptions options;
	ConfigData raw_config;

	ParseCommandLine(argc, argv, options, raw_config);

	MainConfigured(options, raw_config);
}

int
main(int argc, char *argv[]) noexcept
try {
	AtScopeExit() { log_deinit(); };

	MainOrThrow(argc, argv);
	return EXIT_SUCCESS;
} catch (...) {
	Log(LogLevel::ERROR, std::current_exception());
	return EXIT_FAILURE;
}
