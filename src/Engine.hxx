// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_ENGINE_HXX
#define LILT_ENGINE_HXX

#include "decoder/DecoderList.hxx"
#include "config/PlayerConfig.hxx"

#include <memory>

struct ConfigData;
class PlayerListener;
class PlayerControl;
class AudioOutputSession;

/**
 * The playback engine: decoder plugins, the player and the output
 * device.  The constructor starts everything, the destructor stops
 * everything.
 */
class Engine final {
	const ScopeDecoderPluginsInit decoder_plugins_init;

	const DecoderPluginList decoder_plugins;

	const PlayerConfig player_config;

	std::unique_ptr<PlayerControl> player;

	/**
	 * Declared after #player: the device must be closed before
	 * the #Renderer it calls goes away.
	 */
	std::unique_ptr<AudioOutputSession> output;

public:
	/**
	 * Throws on error.
	 */
	Engine(const ConfigData &config, PlayerListener &listener);
	~Engine() noexcept;

	Engine(const Engine &) = delete;
	Engine &operator=(const Engine &) = delete;

	PlayerControl &GetPlayer() noexcept {
		return *player;
	}
};

#endif
