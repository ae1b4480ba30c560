// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_ERROR_HXX
#define LILT_DECODER_ERROR_HXX

#include <stdexcept>
#include <string>

enum class OpenResult {
	/**
	 * The file does not exist or cannot be read.
	 */
	NOT_FOUND,

	/**
	 * No decoder plugin understands this file.
	 */
	UNSUPPORTED_FORMAT,

	/**
	 * A decoder plugin recognized the file, but its headers are
	 * malformed.
	 */
	CORRUPT,
};

enum class DecodeResult {
	IO_FAILURE,

	/**
	 * A single unit (packet, frame, block) could not be decoded.
	 * The stream may continue with the next one.
	 */
	CORRUPT_FRAME,
};

enum class SeekResult {
	UNSEEKABLE,
	OUT_OF_RANGE,
};

/**
 * Opening a track has failed.  This is fatal for the track.
 */
class OpenError : public std::runtime_error {
	OpenResult code;

public:
	OpenError(OpenResult _code, const std::string &msg)
		:std::runtime_error(msg), code(_code) {}

	OpenResult GetCode() const noexcept {
		return code;
	}

	static OpenError NotFound(const char *path);
	static OpenError UnsupportedFormat(const char *path);
	static OpenError Corrupt(const char *path, const char *detail);
};

/**
 * An error while reading from an open #DecoderStream.
 */
class DecodeError : public std::runtime_error {
	DecodeResult code;

public:
	DecodeError(DecodeResult _code, const std::string &msg)
		:std::runtime_error(msg), code(_code) {}

	DecodeResult GetCode() const noexcept {
		return code;
	}

	bool IsCorruptFrame() const noexcept {
		return code == DecodeResult::CORRUPT_FRAME;
	}

	static DecodeError IoFailure(const char *detail) {
		return DecodeError(DecodeResult::IO_FAILURE, detail);
	}

	static DecodeError CorruptFrame(const char *detail) {
		return DecodeError(DecodeResult::CORRUPT_FRAME, detail);
	}
};

class SeekError : public std::runtime_error {
	SeekResult code;

public:
	SeekError(SeekResult _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	SeekResult GetCode() const noexcept {
		return code;
	}

	static SeekError Unseekable() {
		return SeekError(SeekResult::UNSEEKABLE, "Not seekable");
	}

	static SeekError OutOfRange() {
		return SeekError(SeekResult::OUT_OF_RANGE,
				 "Seek position out of range");
	}
};

#endif
