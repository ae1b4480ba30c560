// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"
#include "system/Error.hxx"

#include <stdio.h>

static FILE *out_file;

static constexpr struct {
	const char *name;
	LogLevel level;
} log_level_names[] = {
	{"error", LogLevel::ERROR},
	{"warning", LogLevel::WARNING},
	{"notice", LogLevel::NOTICE},
	{"default", LogLevel::NOTICE},
	{"info", LogLevel::INFO},
	{"verbose", LogLevel::DEBUG},
	{"debug", LogLevel::DEBUG},
};

static LogLevel
ParseLogLevel(const char *value)
{
	for (const auto &i : log_level_names)
		if (StringIsEqual(value, i.name))
			return i.level;

	throw FmtRuntimeError("Unknown log level \"{}\"", value);
}

void
log_early_init(bool verbose) noexcept
{
	/* force stderr to be line-buffered */
	setvbuf(stderr, nullptr, _IOLBF, 0);

	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
}

static void
log_init_file(const ConfigParam &param)
{
	out_file = fopen(param.value.c_str(), "a");
	if (out_file == nullptr)
		throw FmtErrno("failed to open log file \"{}\" (config line {})",
			       param.value, param.line);

	setvbuf(out_file, nullptr, _IOLBF, 0);
	SetLogFile(out_file);
	EnableLogTimestamp();
}

void
log_init(const ConfigData &config, bool verbose)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (const auto *param = config.GetParam(ConfigOption::LOG_FILE))
		log_init_file(*param);
}

void
log_deinit() noexcept
{
	if (out_file != nullptr) {
		SetLogFile(nullptr);
		fclose(out_file);
		out_file = nullptr;
	}
}
