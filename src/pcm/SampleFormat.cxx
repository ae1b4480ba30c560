// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "SampleFormat.hxx"

const char *
ToString(SampleFormat format) noexcept
{
	switch (format) {
	case SampleFormat::S8:
		return "8";

	case SampleFormat::S16:
		return "16";

	case SampleFormat::S24_P32:
		return "24";

	case SampleFormat::S32:
		return "32";

	case SampleFormat::FLOAT:
		return "f";

	case SampleFormat::UNDEFINED:
		break;
	}

	return "*";
}
