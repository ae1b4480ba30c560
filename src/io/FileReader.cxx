// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "FileReader.hxx"
#include "system/Error.hxx"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

FileReader::FileReader(const char *path)
	:fd(open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC))
{
	if (fd < 0)
		throw FmtErrno("Failed to open \"{}\"", path);
}

FileReader::~FileReader() noexcept
{
	if (fd >= 0)
		close(fd);
}

uint64_t
FileReader::GetSize() const
{
	struct stat st;
	if (fstat(fd, &st) < 0)
		throw MakeErrno("Failed to stat file");

	return uint64_t(st.st_size);
}

uint64_t
FileReader::GetPosition() const
{
	const off_t position = lseek(fd, 0, SEEK_CUR);
	if (position < 0)
		throw MakeErrno("Failed to get file position");

	return uint64_t(position);
}

void
FileReader::Seek(uint64_t offset)
{
	if (lseek(fd, off_t(offset), SEEK_SET) < 0)
		throw MakeErrno("Failed to seek");
}

void
FileReader::Skip(int64_t delta)
{
	if (lseek(fd, off_t(delta), SEEK_CUR) < 0)
		throw MakeErrno("Failed to seek");
}

std::size_t
FileReader::Read(std::span<std::byte> dest)
{
	const ssize_t nbytes = read(fd, dest.data(), dest.size());
	if (nbytes < 0)
		throw MakeErrno("Failed to read from file");

	return std::size_t(nbytes);
}
