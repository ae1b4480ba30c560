// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_PLUGIN_HXX
#define LILT_DECODER_PLUGIN_HXX

#include "Stream.hxx"

#include <memory>
#include <span>
#include <string_view>

struct ConfigBlock;

/**
 * A decoder implementation.  Plugins are probed in the order of
 * #decoder_plugins.
 */
struct DecoderPlugin {
	const char *name;

	/**
	 * Open a local file.
	 *
	 * Throws #OpenError (or std::system_error) if the file was
	 * recognized but cannot be decoded.
	 *
	 * @return nullptr if the file is not recognized
	 */
	std::unique_ptr<DecoderStream> (*open_file)(const char *path);

	/**
	 * Global initialization; may be nullptr.  Returns false if
	 * the plugin is not usable on this machine.
	 */
	bool (*init)(const ConfigBlock &block) = nullptr;

	/**
	 * Global cleanup after a successful init(); may be nullptr.
	 */
	void (*finish)() noexcept = nullptr;

	/**
	 * File name suffixes (without the dot) this plugin
	 * announces.
	 */
	std::span<const char *const> suffixes;

	bool Init(const ConfigBlock &block) const {
		return init == nullptr || init(block);
	}

	void Finish() const noexcept {
		if (finish != nullptr)
			finish();
	}

	std::unique_ptr<DecoderStream> OpenFile(const char *path) const {
		return open_file(path);
	}

	/**
	 * Case-insensitive check against #suffixes.
	 */
	[[gnu::pure]]
	bool SupportsSuffix(std::string_view suffix) const noexcept;
};

#endif
