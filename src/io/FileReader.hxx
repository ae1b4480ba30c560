// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_IO_FILE_READER_HXX
#define LILT_IO_FILE_READER_HXX

#include "Reader.hxx"

#include <cstdint>
#include <utility>

/**
 * A #Reader for a local file.  It owns the file descriptor.
 *
 * All methods throw std::system_error on error.
 */
class FileReader final : public Reader {
	int fd;

public:
	explicit FileReader(const char *path);

	FileReader(FileReader &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~FileReader() noexcept override;

	FileReader &operator=(FileReader &&) = delete;

	uint64_t GetSize() const;

	uint64_t GetPosition() const;

	/**
	 * Move to an absolute position.
	 */
	void Seek(uint64_t offset);

	/**
	 * Move relative to the current position.
	 */
	void Skip(int64_t delta);

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};

#endif
