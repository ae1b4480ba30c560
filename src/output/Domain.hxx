// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_DOMAIN_HXX
#define LILT_OUTPUT_DOMAIN_HXX

class Domain;

extern const Domain output_domain;

#endif
