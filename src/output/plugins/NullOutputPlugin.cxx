// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "NullOutputPlugin.hxx"
#include "../OutputPlugin.hxx"
#include "../Interface.hxx"
#include "../RenderCallback.hxx"
#include "../Timer.hxx"
#include "pcm/AudioFormat.hxx"
#include "config/Block.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"
#include "thread/Name.hxx"
#include "thread/Thread.hxx"
#include "util/BindMethod.hxx"

#include <memory>
#include <optional>
#include <vector>

/**
 * An output which discards everything.  With "sync", it calls the
 * #RenderCallback at the pace of a real device, otherwise as fast as
 * possible.
 */
class NullOutput final : AudioOutput {
	const bool sync;

	/**
	 * The number of frames rendered per period.
	 */
	const unsigned period_frames;

	Thread thread;

	Mutex mutex;
	Cond cond;

	bool quit;

	RenderCallback *callback;

	std::optional<Timer> timer;

	std::vector<float> buffer;

public:
	explicit NullOutput(const ConfigBlock &block)
		:sync(block.GetBool("sync", true)),
		 period_frames(block.GetPositive("period_frames", 1024U)),
		 thread(BIND_THIS_METHOD(Run)) {}

	static std::unique_ptr<AudioOutput> Create(const ConfigBlock &block) {
		return std::unique_ptr<AudioOutput>(new NullOutput(block));
	}

private:
	void Open(AudioFormat &audio_format,
		  RenderCallback &_callback) override;
	void Close() noexcept override;

	void Run() noexcept;
};

void
NullOutput::Open(AudioFormat &audio_format, RenderCallback &_callback)
{
	callback = &_callback;
	quit = false;
	buffer.resize(std::size_t(period_frames) * audio_format.channels);

	if (sync)
		timer.emplace(audio_format.sample_rate);
	else
		timer.reset();

	thread.Start();
}

void
NullOutput::Close() noexcept
{
	{
		const std::scoped_lock<Mutex> protect(mutex);
		quit = true;
		cond.notify_one();
	}

	thread.Join();
}

void
NullOutput::Run() noexcept
{
	SetThreadName("output");

	std::unique_lock<Mutex> lock(mutex);

	while (!quit) {
		if (timer) {
			if (!timer->IsStarted())
				timer->Start();
			else if (const auto delay = timer->GetDelay();
				 delay > delay.zero()) {
				cond.wait_for(lock, delay);
				continue;
			}
		}

		{
			const ScopeUnlock unlock(mutex);
			callback->Render(buffer);
		}

		if (timer)
			timer->Add(period_frames);
	}

	if (timer)
		timer->Reset();
}

constexpr AudioOutputPlugin null_output_plugin = {
	.name = "null",
	.create = NullOutput::Create,
};
