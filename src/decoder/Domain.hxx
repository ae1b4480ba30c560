// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_DOMAIN_HXX
#define LILT_DECODER_DOMAIN_HXX

class Domain;

extern const Domain decoder_domain;

#endif
