// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_SESSION_HXX
#define LILT_OUTPUT_SESSION_HXX

#include "Interface.hxx"
#include "pcm/AudioFormat.hxx"

#include <memory>

/**
 * Keeps an #AudioOutput open for the lifetime of this object.
 */
class AudioOutputSession {
	std::unique_ptr<AudioOutput> output;

	AudioFormat audio_format;

public:
	/**
	 * Open the device.
	 *
	 * Throws on error, e.g. if the device cannot play
	 * #_audio_format.
	 */
	AudioOutputSession(std::unique_ptr<AudioOutput> _output,
			   AudioFormat _audio_format,
			   RenderCallback &callback);

	~AudioOutputSession() noexcept {
		output->Close();
	}

	AudioOutputSession(const AudioOutputSession &) = delete;
	AudioOutputSession &operator=(const AudioOutputSession &) = delete;

	AudioFormat GetAudioFormat() const noexcept {
		return audio_format;
	}
};

#endif
