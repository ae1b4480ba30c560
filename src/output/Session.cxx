// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Session.hxx"
#include "Domain.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include <utility>

AudioOutputSession::AudioOutputSession(std::unique_ptr<AudioOutput> _output,
				       const AudioFormat _audio_format,
				       RenderCallback &callback)
	:output(std::move(_output)), audio_format(_audio_format)
{
	AudioFormat device_format = audio_format;
	output->Open(device_format, callback);

	if (device_format != audio_format) {
		/* the renderer cannot convert */
		output->Close();
		throw FmtRuntimeError("Audio device does not support {}",
				      ToString(audio_format));
	}

	FmtInfo(output_domain, "Opened audio output with {}",
		ToString(audio_format));
}
