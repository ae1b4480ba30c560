// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_NUMBER_PARSER_HXX
#define LILT_NUMBER_PARSER_HXX

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>

/**
 * Parse an integer; the whole string must be consumed.
 *
 * @return the value or std::nullopt on error
 */
template<std::integral T>
[[gnu::pure]]
std::optional<T>
ParseInteger(std::string_view src, int base=10) noexcept
{
	const char *const last = src.data() + src.size();

	T value;
	auto [ptr, ec] = std::from_chars(src.data(), last, value, base);
	if (ptr == last && ec == std::errc{})
		return value;
	else
		return std::nullopt;
}

/**
 * Parse a floating point number; the whole string must be consumed.
 */
template<std::floating_point T>
[[gnu::pure]]
std::optional<T>
ParseFloat(std::string_view src) noexcept
{
	const char *const last = src.data() + src.size();

	T value;
	auto [ptr, ec] = std::from_chars(src.data(), last, value);
	if (ptr == last && ec == std::errc{})
		return value;
	else
		return std::nullopt;
}

#endif
