// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_AUDIO_OUTPUT_INTERFACE_HXX
#define LILT_AUDIO_OUTPUT_INTERFACE_HXX

struct AudioFormat;
class RenderCallback;

/**
 * An audio device.  While it is open, it runs its own thread which
 * pulls audio from the #RenderCallback at the pace of the device.
 */
class AudioOutput {
public:
	AudioOutput() noexcept = default;
	virtual ~AudioOutput() noexcept = default;

	AudioOutput(const AudioOutput &) = delete;
	AudioOutput &operator=(const AudioOutput &) = delete;

	/**
	 * Open the device and start calling the #RenderCallback.
	 *
	 * Throws on error.
	 *
	 * @param audio_format the audio format the callback
	 * produces; the plugin may only modify it if the device
	 * does not support it, and the caller must refuse the
	 * modification if it cannot follow
	 */
	virtual void Open(AudioFormat &audio_format,
			  RenderCallback &callback) = 0;

	/**
	 * Stop calling the #RenderCallback and close the device.
	 * After this method returns, the callback is not invoked
	 * anymore.
	 */
	virtual void Close() noexcept = 0;
};

#endif
