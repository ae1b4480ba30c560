// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Engine.hxx"
#include "player/Control.hxx"
#include "output/Init.hxx"
#include "output/Interface.hxx"
#include "output/Session.hxx"
#include "pcm/ConfiguredResampler.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain engine_domain("engine");

Engine::Engine(const ConfigData &config, PlayerListener &listener)
	:decoder_plugins_init(config),
	 decoder_plugins(decoder_plugins_init.GetPlugins()),
	 player_config(config)
{
	pcm_resampler_global_init(config);
	FmtDebug(engine_domain, "Using the {} resampler",
		 pcm_resampler_name());

	player = std::make_unique<PlayerControl>(listener, decoder_plugins,
						 player_config);

	output = std::make_unique<AudioOutputSession>(audio_output_new(config),
						      player->GetOutputFormat(),
						      player->GetRenderCallback());
}

Engine::~Engine() noexcept
{
	output.reset();
	player->Kill();
}
