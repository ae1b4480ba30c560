// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Error.hxx"

#include <fmt/format.h>

OpenError
OpenError::NotFound(const char *path)
{
	return OpenError(OpenResult::NOT_FOUND,
			 fmt::format("No such file: \"{}\"", path));
}

OpenError
OpenError::UnsupportedFormat(const char *path)
{
	return OpenError(OpenResult::UNSUPPORTED_FORMAT,
			 fmt::format("Unsupported format: \"{}\"", path));
}

OpenError
OpenError::Corrupt(const char *path, const char *detail)
{
	return OpenError(OpenResult::CORRUPT,
			 fmt::format("Corrupt file \"{}\": {}", path, detail));
}
