// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_LOG_HXX
#define LILT_LOG_HXX

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <exception>
#include <string_view>

class Domain;

/**
 * Emit one message.  Messages below the threshold set with
 * SetLogThreshold() are dropped.
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

/**
 * Log the message of an exception and all exceptions nested in it,
 * optionally after a prefix.
 */
void
Log(LogLevel level, const std::exception_ptr &ep,
    const char *msg=nullptr) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

/**
 * LogFmt() with a fixed level; the instances below are called like
 * functions: FmtDebug(domain, "opened {}", path).
 */
template<LogLevel level>
struct LevelLogger {
	template<typename S, typename... Args>
	void operator()(const Domain &domain,
			const S &format_str, Args&&... args) const noexcept {
		LogVFmt(level, domain, format_str,
			fmt::make_format_args(args...));
	}
};

inline constexpr LevelLogger<LogLevel::DEBUG> FmtDebug;
inline constexpr LevelLogger<LogLevel::INFO> FmtInfo;
inline constexpr LevelLogger<LogLevel::NOTICE> FmtNotice;
inline constexpr LevelLogger<LogLevel::WARNING> FmtWarning;
inline constexpr LevelLogger<LogLevel::ERROR> FmtError;

#endif
