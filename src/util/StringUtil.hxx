// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_UTIL_STRING_UTIL_HXX
#define LILT_UTIL_STRING_UTIL_HXX

#include <algorithm>
#include <string_view>
#include <utility>

#include <string.h>

/**
 * Control characters and the space count as whitespace; this is
 * good enough for configuration files and log messages.
 */
constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

/**
 * Locale-independent tolower() for ASCII.
 */
constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch + ('a' - 'A'))
		: ch;
}

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

[[gnu::pure]]
static inline bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return std::ranges::equal(a, b, [](char x, char y){
		return ToLowerASCII(x) == ToLowerASCII(y);
	});
}

[[gnu::pure]]
static inline std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.front()))
		s.remove_prefix(1);
	return s;
}

[[gnu::pure]]
static inline std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);
	return s;
}

[[gnu::pure]]
static inline std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}

/**
 * Split at the first occurrence of @ch.  Without one, the second
 * half is empty.
 */
[[gnu::pure]]
static inline std::pair<std::string_view, std::string_view>
Split(std::string_view s, char ch) noexcept
{
	const auto i = s.find(ch);
	if (i == s.npos)
		return {s, {}};

	return {s.substr(0, i), s.substr(i + 1)};
}

#endif
