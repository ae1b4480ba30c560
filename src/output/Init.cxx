// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Init.hxx"
#include "Interface.hxx"
#include "OutputPlugin.hxx"
#include "Registry.hxx"
#include "Domain.hxx"
#include "config/Data.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include <stdexcept>

static const AudioOutputPlugin &
audio_output_detect()
{
	FmtInfo(output_domain, "Attempt to detect audio output device");

	for (const AudioOutputPlugin *plugin : GetAllAudioOutputPlugins()) {
		FmtDebug(output_domain, "Probing the {} plugin",
			 plugin->name);
		if (plugin->CanAutoDetect())
			return *plugin;
	}

	throw std::runtime_error("Unable to detect an audio device");
}

static const AudioOutputPlugin &
audio_output_plugin_of(const ConfigBlock &block)
{
	const char *name = block.GetString("type");
	if (name == nullptr)
		throw std::runtime_error("Missing \"type\" configuration");

	const auto *plugin = GetAudioOutputPluginByName(name);
	if (plugin == nullptr)
		throw FmtRuntimeError("No such audio output plugin: {}",
				      name);

	return *plugin;
}

std::unique_ptr<AudioOutput>
audio_output_new(const ConfigData &config)
{
	const ConfigBlock empty;

	const auto *block = config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	if (block == nullptr) {
		const auto &plugin = audio_output_detect();
		FmtNotice(output_domain,
			  "Successfully detected a {} audio device",
			  plugin.name);
		return plugin.create(empty);
	}

	block->SetUsed();

	try {
		const auto &plugin = audio_output_plugin_of(*block);
		return plugin.create(*block);
	} catch (...) {
		block->ThrowWithNested();
	}
}
