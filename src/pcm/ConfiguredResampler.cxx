// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "ConfiguredResampler.hxx"
#include "FallbackResampler.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"
#include "config.h"

#ifdef ENABLE_LIBSAMPLERATE
#include "LibsamplerateResampler.hxx"
#endif

#ifdef ENABLE_SOXR
#include "SoxrResampler.hxx"
#endif

#include <algorithm>
#include <iterator>

namespace {

struct ResamplerPlugin {
	const char *name;

	/**
	 * Apply global settings from the "resampler" block; may be
	 * nullptr.
	 */
	void (*configure)(const ConfigBlock &block);

	std::unique_ptr<PcmResampler> (*create)();
};

template<typename T>
std::unique_ptr<PcmResampler>
CreateResampler()
{
	return std::make_unique<T>();
}

/* in order of preference; the first one is the default */
constexpr ResamplerPlugin resampler_plugins[] = {
#ifdef ENABLE_SOXR
	{ "soxr", SoxrPcmResampler::Configure,
	  CreateResampler<SoxrPcmResampler> },
#endif
#ifdef ENABLE_LIBSAMPLERATE
	{ "libsamplerate", LibsampleratePcmResampler::Configure,
	  CreateResampler<LibsampleratePcmResampler> },
#endif
	{ "internal", nullptr, CreateResampler<FallbackPcmResampler> },
};

const ResamplerPlugin *selected_plugin = &resampler_plugins[0];

const ResamplerPlugin &
FindResamplerPlugin(const ConfigBlock &block)
{
	const char *name = block.GetString("plugin");
	if (name == nullptr)
		throw FmtRuntimeError("'plugin' missing in line {}",
				      block.line);

	const auto i = std::find_if(std::begin(resampler_plugins),
				    std::end(resampler_plugins),
				    [name](const ResamplerPlugin &p){
					    return StringIsEqual(p.name, name);
				    });
	if (i == std::end(resampler_plugins))
		throw FmtRuntimeError("No such resampler plugin: {}", name);

	return *i;
}

} // namespace

void
pcm_resampler_global_init(const ConfigData &config)
{
	const auto *block = config.GetBlock(ConfigBlockOption::RESAMPLER);
	if (block == nullptr) {
		selected_plugin = &resampler_plugins[0];
		if (selected_plugin->configure != nullptr)
			selected_plugin->configure(ConfigBlock{});
		return;
	}

	block->SetUsed();

	const auto &plugin = FindResamplerPlugin(*block);
	if (plugin.configure != nullptr)
		plugin.configure(*block);

	selected_plugin = &plugin;
}

std::unique_ptr<PcmResampler>
pcm_resampler_create()
{
	return selected_plugin->create();
}

const char *
pcm_resampler_name() noexcept
{
	return selected_plugin->name;
}

void
pcm_resampler_list(void (*f)(const char *name))
{
	for (const auto &i : resampler_plugins)
		f(i.name);
}
