// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "State.hxx"

const char *
ToString(PlayerState state) noexcept
{
	switch (state) {
	case PlayerState::STOP:
		return "stop";

	case PlayerState::PLAY:
		return "play";

	case PlayerState::PAUSE:
		return "pause";

	case PlayerState::SEEK:
		return "seek";

	case PlayerState::TRACK_ENDING:
		return "track_ending";
	}

	return "unknown";
}
