// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Init.hxx"
#include "Domain.hxx"
#include "Log.hxx"
#include "util/StringUtil.hxx"

extern "C" {
#include <libavutil/log.h>
}

#include <cstdarg>
#include <cstdio>

[[gnu::const]]
static LogLevel
FfmpegImportLogLevel(int level) noexcept
{
	if (level <= AV_LOG_FATAL)
		return LogLevel::ERROR;

	if (level <= AV_LOG_WARNING)
		return LogLevel::WARNING;

	if (level <= AV_LOG_INFO)
		return LogLevel::INFO;

	return LogLevel::DEBUG;
}

static void
FfmpegLogCallback(void *ptr, int level, const char *fmt, std::va_list vl)
{
	const AVClass *cls = nullptr;

	if (ptr != nullptr)
		cls = *(const AVClass *const*)ptr;

	if (cls == nullptr)
		return;

	char msg[1024];
	std::vsnprintf(msg, sizeof(msg), fmt, vl);
	LogFmt(FfmpegImportLogLevel(level), ffmpeg_domain,
	       "{}: {}", cls->item_name(ptr), StripRight(std::string_view{msg}));
}

void
FfmpegInit() noexcept
{
	av_log_set_callback(FfmpegLogCallback);
}
