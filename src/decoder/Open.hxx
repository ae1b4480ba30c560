// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_OPEN_HXX
#define LILT_DECODER_OPEN_HXX

#include "DecoderList.hxx"

#include <memory>

class DecoderStream;

/**
 * Probe the given plugins and open the file with the first one which
 * recognizes it.  Plugins announcing the file name suffix are tried
 * first.
 *
 * Throws #OpenError.
 */
std::unique_ptr<DecoderStream>
DecoderOpenFile(const DecoderPluginList &plugins, const char *path);

#endif
