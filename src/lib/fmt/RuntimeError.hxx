// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FMT_RUNTIME_ERROR_HXX
#define LILT_FMT_RUNTIME_ERROR_HXX

#include <fmt/core.h>

#include <stdexcept> // IWYU pragma: export

/**
 * Construct (but don't throw) an exception of type @E whose
 * message is formatted with libfmt.
 */
template<typename E, typename S, typename... Args>
[[nodiscard]]
E
FmtException(const S &format_str, Args&&... args) noexcept
{
	return E{fmt::vformat(format_str, fmt::make_format_args(args...))};
}

template<typename S, typename... Args>
[[nodiscard]]
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args) noexcept
{
	return FmtException<std::runtime_error>(format_str, args...);
}

template<typename S, typename... Args>
[[nodiscard]]
std::invalid_argument
FmtInvalidArgument(const S &format_str, Args&&... args) noexcept
{
	return FmtException<std::invalid_argument>(format_str, args...);
}

#endif
