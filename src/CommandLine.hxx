// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_COMMAND_LINE_HXX
#define LILT_COMMAND_LINE_HXX

#include <string>
#include <vector>

struct ConfigData;

struct CommandLineOptions {
	bool verbose = false;

	/**
	 * The files to be played, in this order.
	 */
	std::vector<std::string> files;
};

/**
 * Parse the command line and load the configuration file.  Exits
 * the process after --help and --version.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);

#endif
