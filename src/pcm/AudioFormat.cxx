// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "AudioFormat.hxx"

#include <fmt/format.h>

std::string
ToString(AudioFormat af) noexcept
{
	return fmt::format("{}:{}:{}", af.sample_rate, ToString(af.format),
			   unsigned(af.channels));
}
