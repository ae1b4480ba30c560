// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "config.h"
#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "config/File.hxx"
#include "decoder/DecoderList.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "output/Registry.hxx"
#include "output/OutputPlugin.hxx"
#include "pcm/ConfiguredResampler.hxx"
#include "util/Domain.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

enum Option {
	OPTION_CONFIG,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{.long_option = "config", .short_option = 'c', .has_value = true,
	 .description = "read settings from this file"},
	{.long_option = "verbose", .short_option = 'v',
	 .description = "verbose logging"},
	{.long_option = "version", .short_option = 'V',
	 .description = "print version number"},
	{.long_option = "help", .short_option = 'h',
	 .description = "show help options"},
	/* hidden alias for --help */
	{.short_option = '?'},
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void
PrintVersion()
{
	fmt::print("lilt {}\n"
		   "This is free software; see the source for copying conditions.  There is NO\n"
		   "warranty; not even MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.\n"
		   "\n"
		   "Decoder plugins:\n",
		   PACKAGE_VERSION);

	for (const DecoderPlugin *plugin : GetAllDecoderPlugins())
		fmt::print(" [{}] {}\n", plugin->name,
			   fmt::join(plugin->suffixes, " "));

	fmt::print("\nResamplers:\n");
	pcm_resampler_list([](const char *name){ fmt::print(" {}", name); });

	fmt::print("\n\nOutput plugins:\n");
	for (const AudioOutputPlugin *plugin : GetAllAudioOutputPlugins())
		fmt::print(" {}", plugin->name);
	fmt::print("\n");

	std::exit(EXIT_SUCCESS);
}

[[noreturn]]
static void
PrintHelp()
{
	fmt::print("Usage:\n"
		   "  lilt [OPTION...] FILE...\n"
		   "\n"
		   "Play audio files gapless (or with a cross-fade).\n"
		   "\n"
		   "Options:\n");

	for (const auto &i : option_defs) {
		if (i.description == nullptr)
			continue;

		const std::string names = i.short_option != 0
			? fmt::format("-{}, --{}", i.short_option, i.long_option)
			: fmt::format("--{}", i.long_option);
		fmt::print("  {:<18}{}\n", names, i.description);
	}

	std::exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	const char *config_file = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_VERSION:
			PrintVersion();

		case OPTION_HELP:
		case OPTION_HELP2:
			PrintHelp();
		}
	}

	/* initialize the logging library, so the configuration file
	   parser can use it already */
	log_early_init(options.verbose);

	for (const char *i : parser.GetRemaining())
		options.files.emplace_back(i);

	if (options.files.empty())
		throw std::runtime_error("No files to play");

	if (config_file != nullptr) {
		FmtDebug(cmdline_domain, "Loading {}", config_file);
		ReadConfigFile(config, config_file);
	} else
		FmtDebug(cmdline_domain, "No config file, using defaults");
}
