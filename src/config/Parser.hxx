// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_PARSER_HXX
#define LILT_CONFIG_PARSER_HXX

#include <chrono>

/*
 * Parsers for setting values.  They all throw std::runtime_error
 * on malformed input.
 */

/**
 * Accepts "yes"/"no", "true"/"false" and "1"/"0".
 */
bool
ParseBool(const char *s);

unsigned
ParseUnsigned(const char *s);

/**
 * Like ParseUnsigned(), but rejects zero.
 */
unsigned
ParsePositive(const char *s);

/**
 * Parse a non-negative, possibly fractional duration.  Without a
 * unit the value is in seconds; "s" and "ms" suffixes are accepted.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);

#endif
