// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_SAMPLE_FORMAT_HXX
#define LILT_PCM_SAMPLE_FORMAT_HXX

#include <cstdint>

/**
 * How a source or a device stores one sample.  The engine itself
 * always mixes in #FLOAT.
 */
enum class SampleFormat : uint8_t {
	UNDEFINED = 0,

	S8,
	S16,

	/**
	 * 24 bit signed integer, sign-extended to 32 bit.
	 */
	S24_P32,

	S32,

	/**
	 * Native float, nominal range -1 to +1.
	 */
	FLOAT,
};

/**
 * @return the size in bytes, 0 for #SampleFormat::UNDEFINED
 */
constexpr unsigned
GetSampleSize(SampleFormat format) noexcept
{
	switch (format) {
	case SampleFormat::UNDEFINED:
		break;

	case SampleFormat::S8:
		return 1;

	case SampleFormat::S16:
		return 2;

	case SampleFormat::S24_P32:
	case SampleFormat::S32:
	case SampleFormat::FLOAT:
		return 4;
	}

	return 0;
}

/**
 * The name used in "audio_output_format": "8", "16", "24", "32"
 * or "f".  #SampleFormat::UNDEFINED is "*".
 */
[[gnu::const]] [[gnu::returns_nonnull]]
const char *
ToString(SampleFormat format) noexcept;

#endif
