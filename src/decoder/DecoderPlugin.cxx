// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "DecoderPlugin.hxx"
#include "util/StringUtil.hxx"

#include <algorithm>

bool
DecoderPlugin::SupportsSuffix(std::string_view suffix) const noexcept
{
	return std::any_of(suffixes.begin(), suffixes.end(),
			   [suffix](const char *i){
				   return StringIsEqualIgnoreCase(i, suffix);
			   });
}
