// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIGURED_RESAMPLER_HXX
#define LILT_CONFIGURED_RESAMPLER_HXX

#include <memory>

struct ConfigData;
class PcmResampler;

/**
 * Select the resampler plugin from the "resampler" block.  Without
 * such a block, the best one compiled in is used.
 *
 * Throws on error.
 */
void
pcm_resampler_global_init(const ConfigData &config);

/**
 * Create a #PcmResampler instance from the implementation class
 * configured in the configuration file.
 */
std::unique_ptr<PcmResampler>
pcm_resampler_create();

/**
 * The name of the selected resampler plugin.
 */
[[gnu::pure]]
const char *
pcm_resampler_name() noexcept;

/**
 * Invoke the function for the name of each resampler plugin that
 * was compiled in, the default one first.
 */
void
pcm_resampler_list(void (*f)(const char *name));

#endif
