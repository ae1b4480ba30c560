// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_LIST_HXX
#define LILT_DECODER_LIST_HXX

#include <span>
#include <vector>

struct ConfigData;
struct DecoderPlugin;

/**
 * The decoder plugins the engine probes, in priority order.
 */
using DecoderPluginList = std::vector<const DecoderPlugin *>;

/**
 * All decoder plugins compiled into this binary.
 */
[[gnu::const]]
std::span<const DecoderPlugin *const>
GetAllDecoderPlugins() noexcept;

/**
 * Initializes the decoder plugins which are not disabled in the
 * configuration, and finishes them in the destructor.
 */
class ScopeDecoderPluginsInit {
	DecoderPluginList enabled;

public:
	/**
	 * Throws on error.
	 */
	explicit ScopeDecoderPluginsInit(const ConfigData &config);
	~ScopeDecoderPluginsInit() noexcept;

	ScopeDecoderPluginsInit(const ScopeDecoderPluginsInit &) = delete;
	ScopeDecoderPluginsInit &operator=(const ScopeDecoderPluginsInit &) = delete;

	/**
	 * The plugins which were initialized successfully.
	 */
	const DecoderPluginList &GetPlugins() const noexcept {
		return enabled;
	}
};

#endif
