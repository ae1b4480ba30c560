// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Option.hxx"

#include <algorithm>
#include <array>

static constexpr std::array<const char *, std::size_t(ConfigOption::MAX)> option_names{
	"log_file",
	"log_level",
	"audio_output_format",
	"audio_buffer_time",
	"decode_chunk_time",
	"crossfade",
	"crossfade_curve",
	"max_crossfade",
	"corrupt_frame_threshold",
	"loop_mode",
	"volume",
};

static constexpr std::array<const char *, std::size_t(ConfigBlockOption::MAX)> block_names{
	"audio_output",
	"decoder",
	"resampler",
};

static_assert(option_names.back() != nullptr && block_names.back() != nullptr,
	      "Missing option names");

/**
 * @return the index of @name, or the array size if not found
 */
template<std::size_t N>
[[gnu::pure]]
static std::size_t
FindName(const std::array<const char *, N> &names,
	 std::string_view name) noexcept
{
	const auto i = std::find_if(names.begin(), names.end(),
				    [name](const char *n){ return name == n; });
	return std::size_t(i - names.begin());
}

ConfigOption
ParseConfigOptionName(std::string_view name) noexcept
{
	return ConfigOption(FindName(option_names, name));
}

ConfigBlockOption
ParseConfigBlockOptionName(std::string_view name) noexcept
{
	return ConfigBlockOption(FindName(block_names, name));
}
