// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_FILE_HXX
#define LILT_CONFIG_FILE_HXX

struct ConfigData;

/**
 * Load a configuration file into #ConfigData.
 *
 * Throws on error; the exception is nested in one naming the file
 * and the line.
 */
void
ReadConfigFile(ConfigData &data, const char *path);

#endif
