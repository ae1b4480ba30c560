// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_OPTION_HXX
#define LILT_CONFIG_OPTION_HXX

#include <string_view>

/**
 * The top-level "name value" settings.
 */
enum class ConfigOption {
	LOG_FILE,
	LOG_LEVEL,
	AUDIO_OUTPUT_FORMAT,
	AUDIO_BUFFER_TIME,
	DECODE_CHUNK_TIME,
	CROSSFADE,
	CROSSFADE_CURVE,
	MAX_CROSSFADE,
	CORRUPT_FRAME_THRESHOLD,
	LOOP_MODE,
	VOLUME,
	MAX
};

/**
 * The "name { ... }" blocks.
 */
enum class ConfigBlockOption {
	AUDIO_OUTPUT,
	DECODER,
	RESAMPLER,
	MAX
};

/**
 * @return #ConfigOption::MAX if there is no such setting
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(std::string_view name) noexcept;

/**
 * @return #ConfigBlockOption::MAX if there is no such block
 */
[[gnu::pure]]
ConfigBlockOption
ParseConfigBlockOptionName(std::string_view name) noexcept;

/**
 * May the block appear more than once?  There is one "decoder"
 * block per plugin.
 */
constexpr bool
IsRepeatable(ConfigBlockOption option) noexcept
{
	return option == ConfigBlockOption::DECODER;
}

#endif
