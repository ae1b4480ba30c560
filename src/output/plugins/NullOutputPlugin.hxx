// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_NULL_OUTPUT_PLUGIN_HXX
#define LILT_NULL_OUTPUT_PLUGIN_HXX

extern const struct AudioOutputPlugin null_output_plugin;

#endif
