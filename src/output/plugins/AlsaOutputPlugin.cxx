// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "AlsaOutputPlugin.hxx"
#include "../OutputPlugin.hxx"
#include "../Interface.hxx"
#include "../RenderCallback.hxx"
#include "pcm/AudioFormat.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "thread/Name.hxx"
#include "thread/Thread.hxx"
#include "thread/Util.hxx"
#include "util/BindMethod.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <alsa/asoundlib.h>
#include <fmt/format.h>

#include <atomic>
#include <string>
#include <vector>

static constexpr Domain alsa_output_domain("alsa_output");

static constexpr const char *DEFAULT_DEVICE = "default";

/**
 * The default buffer time in microseconds.
 */
static constexpr unsigned DEFAULT_BUFFER_TIME = 100000;

static constexpr unsigned DEFAULT_PERIOD_TIME = 20000;

template<typename... Args>
static auto
MakeAlsaError(int err, const char *format_str, Args&&... args)
{
	return FmtRuntimeError("{}: {}",
			       fmt::format(fmt::runtime(format_str), args...),
			       snd_strerror(-err));
}

class AlsaOutput final : AudioOutput {
	/**
	 * The configured name of the ALSA device.
	 */
	const std::string device;

	const unsigned buffer_time, period_time;

	snd_pcm_t *pcm = nullptr;

	RenderCallback *callback;

	/**
	 * The number of frames written by one snd_pcm_writei() call.
	 */
	snd_pcm_uframes_t period_frames;

	unsigned channels;

	std::vector<float> buffer;

	Thread thread;

	std::atomic_bool quit;

public:
	explicit AlsaOutput(const ConfigBlock &block)
		:device(block.GetString("device", DEFAULT_DEVICE)),
		 buffer_time(block.GetPositive("buffer_time",
						    DEFAULT_BUFFER_TIME)),
		 period_time(block.GetPositive("period_time",
						    DEFAULT_PERIOD_TIME)),
		 thread(BIND_THIS_METHOD(Run)) {}

	static std::unique_ptr<AudioOutput> Create(const ConfigBlock &block) {
		return std::unique_ptr<AudioOutput>(new AlsaOutput(block));
	}

	static bool ProbeDefaultDevice() noexcept;

private:
	void Open(AudioFormat &audio_format,
		  RenderCallback &_callback) override;
	void Close() noexcept override;

	/**
	 * Configure the hardware parameters.  The device plays
	 * interleaved float at exactly the given rate and channel
	 * count, or this method fails.
	 *
	 * Throws on error.
	 */
	void SetupHw(AudioFormat audio_format);

	/**
	 * Recover from an xrun or a suspend.
	 *
	 * @return 0 on success, a negative error code otherwise
	 */
	int Recover(int err) noexcept;

	void Run() noexcept;
};

bool
AlsaOutput::ProbeDefaultDevice() noexcept
{
	snd_pcm_t *pcm;
	const int err = snd_pcm_open(&pcm, DEFAULT_DEVICE,
				     SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
	if (err < 0) {
		FmtInfo(alsa_output_domain, "Cannot open \"{}\": {}",
			DEFAULT_DEVICE, snd_strerror(err));
		return false;
	}

	snd_pcm_close(pcm);
	return true;
}

inline void
AlsaOutput::SetupHw(const AudioFormat audio_format)
{
	snd_pcm_hw_params_t *hwparams;
	snd_pcm_hw_params_alloca(&hwparams);

	int err = snd_pcm_hw_params_any(pcm, hwparams);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params_any() failed");

	err = snd_pcm_hw_params_set_access(pcm, hwparams,
					   SND_PCM_ACCESS_RW_INTERLEAVED);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params_set_access() failed");

	err = snd_pcm_hw_params_set_format(pcm, hwparams, SND_PCM_FORMAT_FLOAT);
	if (err < 0)
		throw MakeAlsaError(err, "Failed to configure float samples on {}",
				    device);

	err = snd_pcm_hw_params_set_channels(pcm, hwparams,
					     audio_format.channels);
	if (err < 0)
		throw MakeAlsaError(err, "Failed to configure {} channels on {}",
				    unsigned(audio_format.channels), device);

	err = snd_pcm_hw_params_set_rate(pcm, hwparams,
					 audio_format.sample_rate, 0);
	if (err < 0)
		throw MakeAlsaError(err, "Failed to configure sample rate {} on {}",
				    audio_format.sample_rate, device);

	unsigned b = buffer_time;
	err = snd_pcm_hw_params_set_buffer_time_near(pcm, hwparams, &b, nullptr);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params_set_buffer_time_near() failed");

	unsigned p = period_time;
	err = snd_pcm_hw_params_set_period_time_near(pcm, hwparams, &p, nullptr);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params_set_period_time_near() failed");

	err = snd_pcm_hw_params(pcm, hwparams);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params() failed");

	err = snd_pcm_hw_params_get_period_size(hwparams, &period_frames,
						nullptr);
	if (err < 0)
		throw MakeAlsaError(err, "snd_pcm_hw_params_get_period_size() failed");

	FmtDebug(alsa_output_domain, "buffer_time={} period_time={} period_frames={}",
		 b, p, period_frames);
}

void
AlsaOutput::Open(AudioFormat &audio_format, RenderCallback &_callback)
{
	int err = snd_pcm_open(&pcm, device.c_str(),
			       SND_PCM_STREAM_PLAYBACK, 0);
	if (err < 0)
		throw MakeAlsaError(err, "Failed to open ALSA device \"{}\"",
				    device);

	FmtDebug(alsa_output_domain, "opened {} type={}",
		 snd_pcm_name(pcm), snd_pcm_type_name(snd_pcm_type(pcm)));

	try {
		SetupHw(audio_format);

		channels = audio_format.channels;
		buffer.resize(std::size_t(period_frames) * channels);
		callback = &_callback;
		quit.store(false, std::memory_order_relaxed);

		thread.Start();
	} catch (...) {
		snd_pcm_close(pcm);
		pcm = nullptr;
		throw;
	}
}

void
AlsaOutput::Close() noexcept
{
	quit.store(true, std::memory_order_relaxed);
	thread.Join();

	snd_pcm_drop(pcm);
	snd_pcm_close(pcm);
	pcm = nullptr;
}

inline int
AlsaOutput::Recover(int err) noexcept
{
	switch (err) {
	case -EPIPE:
		FmtDebug(alsa_output_domain,
			 "Underrun on ALSA device \"{}\"", device);
		break;

	case -ESTRPIPE:
		FmtDebug(alsa_output_domain,
			 "ALSA device \"{}\" was suspended", device);
		break;
	}

	switch (snd_pcm_state(pcm)) {
	case SND_PCM_STATE_SUSPENDED:
		err = snd_pcm_resume(pcm);
		if (err == -EAGAIN)
			return 0;
		[[fallthrough]];
	case SND_PCM_STATE_OPEN:
	case SND_PCM_STATE_SETUP:
	case SND_PCM_STATE_XRUN:
		err = snd_pcm_prepare(pcm);
		break;

	case SND_PCM_STATE_PAUSED:
		err = snd_pcm_pause(pcm, /* disable */ 0);
		break;

	case SND_PCM_STATE_DISCONNECTED:
		break;

	case SND_PCM_STATE_PREPARED:
	case SND_PCM_STATE_RUNNING:
	case SND_PCM_STATE_DRAINING:
		err = 0;
		break;

	default:
		break;
	}

	return err;
}

void
AlsaOutput::Run() noexcept
{
	SetThreadName("output");

	try {
		SetThreadRealtime();
	} catch (...) {
		Log(LogLevel::ERROR, std::current_exception(),
		    "Failed to switch the output thread to realtime priority");
	}

	while (!quit.load(std::memory_order_relaxed)) {
		callback->Render(buffer);

		const float *p = buffer.data();
		snd_pcm_uframes_t remaining = period_frames;
		while (remaining > 0 && !quit.load(std::memory_order_relaxed)) {
			const snd_pcm_sframes_t n = snd_pcm_writei(pcm, p, remaining);
			if (n >= 0) {
				p += std::size_t(n) * channels;
				remaining -= n;
				continue;
			}

			if (Recover(n) < 0) {
				FmtError(alsa_output_domain,
					 "Writing to ALSA device \"{}\" failed: {}",
					 device, snd_strerror(-int(n)));
				return;
			}
		}
	}
}

constexpr AudioOutputPlugin alsa_output_plugin = {
	.name = "alsa",
	.create = AlsaOutput::Create,
	.probe = AlsaOutput::ProbeDefaultDevice,
};
