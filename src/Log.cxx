// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Log.hxx"
#include "LogBackend.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <iterator>

static constexpr Domain exception_domain("exception");

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	/* don't bother formatting what would be dropped anyway */
	if (level < GetLogThreshold())
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const std::exception_ptr &ep, const char *msg) noexcept
{
	if (msg == nullptr)
		Log(level, exception_domain, GetFullMessage(ep));
	else
		LogFmt(level, exception_domain, "{}: {}",
		       msg, GetFullMessage(ep));
}
