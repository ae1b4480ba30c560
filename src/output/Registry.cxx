// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "config.h"
#include "Registry.hxx"
#include "OutputPlugin.hxx"
#include "plugins/AlsaOutputPlugin.hxx"
#include "plugins/NullOutputPlugin.hxx"
#include "util/StringUtil.hxx"

#include <algorithm>
#include <iterator>

static constinit const AudioOutputPlugin *const audio_output_plugins[] = {
#ifdef ENABLE_ALSA
	&alsa_output_plugin,
#endif
	&null_output_plugin,
};

std::span<const AudioOutputPlugin *const>
GetAllAudioOutputPlugins() noexcept
{
	return audio_output_plugins;
}

const AudioOutputPlugin *
GetAudioOutputPluginByName(const char *name) noexcept
{
	const auto i = std::find_if(std::begin(audio_output_plugins),
				    std::end(audio_output_plugins),
				    [name](const AudioOutputPlugin *p){
					    return StringIsEqual(p->name, name);
				    });
	return i != std::end(audio_output_plugins) ? *i : nullptr;
}
