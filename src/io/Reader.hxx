// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_IO_READER_HXX
#define LILT_IO_READER_HXX

#include <cstddef>
#include <span>

/**
 * A byte stream which is consumed sequentially.
 */
class Reader {
public:
	virtual ~Reader() noexcept = default;

	/**
	 * Copy the next bytes of the stream to @dest.  May return
	 * less than requested even before the end.
	 *
	 * @return the number of bytes copied, 0 at the end of the
	 * stream
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

	/**
	 * Fill all of @dest.  Throws if the stream ends first.
	 */
	void ReadFull(std::span<std::byte> dest);
};

#endif
