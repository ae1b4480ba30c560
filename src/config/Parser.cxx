// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/NumberParser.hxx"
#include "util/StringUtil.hxx"

#include <climits>
#include <cmath>
#include <string_view>
#include <stdexcept>

using std::string_view_literals::operator""sv;

bool
ParseBool(const char *s)
{
	if (StringIsEqualIgnoreCase(s, "yes"sv) ||
	    StringIsEqualIgnoreCase(s, "true"sv) ||
	    StringIsEqual(s, "1"))
		return true;

	if (StringIsEqualIgnoreCase(s, "no"sv) ||
	    StringIsEqualIgnoreCase(s, "false"sv) ||
	    StringIsEqual(s, "0"))
		return false;

	throw FmtRuntimeError("Not a boolean: \"{}\"", s);
}

unsigned
ParseUnsigned(const char *s)
{
	const auto value = ParseInteger<long long>(s);
	if (!value)
		throw FmtRuntimeError("Not a number: \"{}\"", s);

	if (*value < 0)
		throw std::runtime_error("Value must not be negative");

	if (*value > UINT_MAX)
		throw std::runtime_error("Value is too large");

	return unsigned(*value);
}

unsigned
ParsePositive(const char *s)
{
	const unsigned value = ParseUnsigned(s);
	if (value == 0)
		throw std::runtime_error("Value must be positive");

	return value;
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	std::string_view src{s};

	double unit = 1;
	if (src.ends_with("ms"sv)) {
		src.remove_suffix(2);
		unit = 0.001;
	} else if (src.ends_with('s')) {
		src.remove_suffix(1);
	}

	const auto value = ParseFloat<double>(src);
	if (!value || !std::isfinite(*value))
		throw FmtRuntimeError("Not a duration: \"{}\"", s);

	if (*value < 0)
		throw std::runtime_error("Duration must not be negative");

	return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(*value * unit));
}
