// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "config.h"
#include "DecoderList.hxx"
#include "DecoderPlugin.hxx"
#include "Domain.hxx"
#include "config/Data.hxx"
#include "config/Block.hxx"
#include "plugins/WaveDecoderPlugin.hxx"
#include "plugins/FfmpegDecoderPlugin.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include <exception>

static constinit const DecoderPlugin *const decoder_plugins[] = {
	&wave_decoder_plugin,
#ifdef ENABLE_FFMPEG
	&ffmpeg_decoder_plugin,
#endif
};

std::span<const DecoderPlugin *const>
GetAllDecoderPlugins() noexcept
{
	return decoder_plugins;
}

/**
 * @return false if the plugin is disabled or unavailable
 */
static bool
InitDecoderPlugin(const DecoderPlugin &plugin, const ConfigData &config)
{
	static const ConfigBlock empty;

	const ConfigBlock *block =
		config.FindBlock(ConfigBlockOption::DECODER, "plugin",
				 plugin.name);
	if (block == nullptr)
		block = &empty;
	else {
		block->SetUsed();
		if (!block->GetBool("enabled", true))
			return false;
	}

	try {
		if (plugin.Init(*block))
			return true;
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Failed to initialize decoder plugin '{}'",
						       plugin.name));
	}

	FmtInfo(decoder_domain, "Decoder plugin '{}' is unavailable",
		plugin.name);
	return false;
}

ScopeDecoderPluginsInit::ScopeDecoderPluginsInit(const ConfigData &config)
{
	try {
		for (const DecoderPlugin *plugin : decoder_plugins)
			if (InitDecoderPlugin(*plugin, config))
				enabled.push_back(plugin);
	} catch (...) {
		for (const DecoderPlugin *plugin : enabled)
			plugin->Finish();
		throw;
	}
}

ScopeDecoderPluginsInit::~ScopeDecoderPluginsInit() noexcept
{
	for (const DecoderPlugin *plugin : enabled)
		plugin->Finish();
}
