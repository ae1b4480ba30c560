// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "thread/Mutex.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <ctime>
#include <iterator>

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

/**
 * Serializes writes from the player, decoder and output threads.
 */
static Mutex log_mutex;

static bool log_timestamp;

static FILE *log_file;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold.store(_threshold, std::memory_order_relaxed);
}

LogLevel
GetLogThreshold() noexcept
{
	return log_threshold.load(std::memory_order_relaxed);
}

void
EnableLogTimestamp() noexcept
{
	log_timestamp = true;
}

void
SetLogFile(FILE *file) noexcept
{
	const std::scoped_lock<Mutex> protect(log_mutex);
	log_file = file;
}

static constexpr const char *
LevelPrefix(LogLevel level) noexcept
{
	switch (level) {
	case LogLevel::WARNING:
		return "warning: ";

	case LogLevel::ERROR:
		return "error: ";

	default:
		return "";
	}
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < GetLogThreshold())
		return;

	fmt::memory_buffer line;
	auto out = std::back_inserter(line);

	if (log_timestamp) {
		const time_t t = time(nullptr);
		struct tm tm;
		if (localtime_r(&t, &tm) != nullptr)
			out = fmt::format_to(out, "{:%FT%T} ", tm);
	}

	fmt::format_to(out, "{}: {}{}\n", domain.GetName(),
		       LevelPrefix(level), StripRight(msg));

	const std::scoped_lock<Mutex> protect(log_mutex);
	FILE *file = log_file != nullptr ? log_file : stderr;
	fwrite(line.data(), 1, line.size(), file);
	fflush(file);
}
