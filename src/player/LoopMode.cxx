// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "LoopMode.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"

LoopMode
ParseLoopMode(const char *s)
{
	if (StringIsEqual(s, "none"))
		return LoopMode::NONE;
	else if (StringIsEqual(s, "points"))
		return LoopMode::POINTS;
	else if (StringIsEqual(s, "track"))
		return LoopMode::TRACK;
	else
		throw FmtInvalidArgument("Unrecognized loop mode: \"{}\"", s);
}

const char *
ToString(LoopMode mode) noexcept
{
	switch (mode) {
	case LoopMode::NONE:
		return "none";

	case LoopMode::POINTS:
		return "points";

	case LoopMode::TRACK:
		return "track";
	}

	return "unknown";
}
