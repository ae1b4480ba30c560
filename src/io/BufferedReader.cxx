// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm>
#include <span>
#include <stdexcept>

#include <string.h>

bool
BufferedReader::Fill()
{
	if (eof)
		return false;

	if (head > 0) {
		/* move the pending data to the start of the buffer */
		std::copy(buffer.data() + head, buffer.data() + tail,
			  buffer.data());
		tail -= head;
		head = 0;
	}

	/* keep one byte for the null terminator */
	if (tail + 1 >= buffer.size()) {
		if (buffer.size() >= MAX_SIZE)
			throw std::runtime_error("Line is too long");

		buffer.resize(buffer.size() * 2);
	}

	std::size_t nbytes = reader.Read(std::as_writable_bytes(std::span{buffer.data() + tail,
									  buffer.size() - tail - 1}));
	if (nbytes == 0) {
		eof = true;
		return false;
	}

	tail += nbytes;
	return true;
}

char *
BufferedReader::ReadLine()
{
	while (true) {
		char *start = buffer.data() + head;
		char *newline = (char *)memchr(start, '\n', tail - head);
		if (newline != nullptr) {
			head = newline + 1 - buffer.data();
			if (newline > start && newline[-1] == '\r')
				--newline;
			*newline = 0;
			++line_number;
			return start;
		}

		if (!Fill())
			break;
	}

	if (head == tail)
		return nullptr;

	/* terminate the last line */
	char *line = buffer.data() + head;
	buffer[tail] = 0;
	head = tail;
	++line_number;
	return line;
}
