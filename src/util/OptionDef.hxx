// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_UTIL_OPTIONDEF_HXX
#define LILT_UTIL_OPTIONDEF_HXX

/**
 * One command line option.  Options without a description are
 * accepted but not listed by --help.
 */
struct OptionDef {
	const char *long_option = nullptr;
	char short_option = 0;
	bool has_value = false;
	const char *description = nullptr;
};

#endif
