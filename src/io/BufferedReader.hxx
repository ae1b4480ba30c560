// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_BUFFERED_READER_HXX
#define LILT_BUFFERED_READER_HXX

#include <cstddef>
#include <vector>

class Reader;

/**
 * Reads text lines from a #Reader through an internal buffer which
 * grows up to #MAX_SIZE.
 */
class BufferedReader {
	static constexpr std::size_t MAX_SIZE = 512 * 1024;

	Reader &reader;

	std::vector<char> buffer;

	/**
	 * The range [head, tail) holds data which has not been
	 * consumed yet.
	 */
	std::size_t head = 0, tail = 0;

	bool eof = false;

	unsigned line_number = 0;

public:
	explicit BufferedReader(Reader &_reader)
		:reader(_reader), buffer(16384) {}

	/**
	 * Read the next line, without the line terminator.  The
	 * returned pointer is valid until the next call.
	 *
	 * Throws std::runtime_error on error or if a line is longer
	 * than #MAX_SIZE.
	 *
	 * @return nullptr at the end of the stream
	 */
	char *ReadLine();

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * Read more data from the #Reader.
	 *
	 * @return false on end of stream
	 */
	bool Fill();
};

#endif
