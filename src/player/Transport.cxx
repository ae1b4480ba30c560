// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Transport.hxx"

PlayerSnapshot
Transport::GetSnapshot() const noexcept
{
	PlayerSnapshot s;
	s.state = GetState();

	const auto [track_id, position] = LoadClock();
	s.track_id = track_id;
	s.position = position;
	s.elapsed = FloatDuration(double(position) / sample_rate);

	s.next_track_id = next_track_id.load(std::memory_order_relaxed);
	s.volume = GetVolume();
	s.mute = IsMuted();
	s.underruns = GetUnderruns();
	return s;
}
