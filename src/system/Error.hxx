// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_SYSTEM_ERROR_HXX
#define LILT_SYSTEM_ERROR_HXX

#include <fmt/core.h>

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * Wrap an errno value in a std::system_error.  On POSIX, the
 * system_category() maps errno values to std::errc.
 */
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, std::system_category()),
				 msg);
}

/**
 * Like MakeErrno(int, const char *), but use the current errno.
 */
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

/**
 * Wrap the current errno with a formatted message.
 */
template<typename... Args>
static inline std::system_error
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	/* formatting may clobber errno */
	const int code = errno;
	const auto msg = fmt::format(format_str, std::forward<Args>(args)...);
	return MakeErrno(code, msg.c_str());
}

#endif
