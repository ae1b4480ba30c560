// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_REGISTRY_HXX
#define LILT_OUTPUT_REGISTRY_HXX

#include <span>

struct AudioOutputPlugin;

/**
 * All output plugins compiled into this binary.  Auto-detection
 * picks the first one whose probe succeeds.
 */
[[gnu::const]]
std::span<const AudioOutputPlugin *const>
GetAllAudioOutputPlugins() noexcept;

[[gnu::pure]]
const AudioOutputPlugin *
GetAudioOutputPluginByName(const char *name) noexcept;

#endif
