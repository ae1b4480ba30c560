// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Reader.hxx"

#include <stdexcept>

void
Reader::ReadFull(std::span<std::byte> dest)
{
	while (!dest.empty()) {
		const std::size_t nbytes = Read(dest);
		if (nbytes == 0)
			throw std::runtime_error{"Unexpected end of file"};

		dest = dest.subspan(nbytes);
	}
}
