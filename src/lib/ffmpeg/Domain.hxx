// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_DOMAIN_HXX
#define LILT_FFMPEG_DOMAIN_HXX

extern const class Domain ffmpeg_domain;

#endif
