// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_DOMAIN_HXX
#define LILT_CONFIG_DOMAIN_HXX

extern const class Domain config_domain;

#endif
