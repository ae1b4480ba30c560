// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_PLUGIN_HXX
#define LILT_OUTPUT_PLUGIN_HXX

#include <memory>

struct ConfigBlock;
class AudioOutput;

/**
 * A kind of audio device.
 */
struct AudioOutputPlugin {
	const char *name;

	/**
	 * Create an output from its configuration block (empty if
	 * the output was auto-detected).  The device is not opened
	 * yet.
	 *
	 * Throws on error.
	 */
	std::unique_ptr<AudioOutput> (*create)(const ConfigBlock &block);

	/**
	 * Check whether the default device of this kind is usable;
	 * nullptr if the plugin never qualifies for
	 * auto-detection.
	 */
	bool (*probe)() noexcept = nullptr;

	bool CanAutoDetect() const noexcept {
		return probe != nullptr && probe();
	}
};

#endif
