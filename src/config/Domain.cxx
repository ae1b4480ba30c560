// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Domain.hxx"
#include "util/Domain.hxx"

const Domain config_domain("config");
