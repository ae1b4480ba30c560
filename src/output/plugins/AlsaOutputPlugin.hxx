// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_ALSA_OUTPUT_PLUGIN_HXX
#define LILT_ALSA_OUTPUT_PLUGIN_HXX

extern const struct AudioOutputPlugin alsa_output_plugin;

#endif
