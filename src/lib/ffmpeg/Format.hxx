// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_FORMAT_HXX
#define LILT_FFMPEG_FORMAT_HXX

#include "Error.hxx"

extern "C" {
#include <libavformat/avformat.h>
}

#include <utility>

namespace Ffmpeg {

/**
 * An owning wrapper for an input #AVFormatContext.
 */
class FormatContext {
	AVFormatContext *format_context = nullptr;

public:
	FormatContext() noexcept = default;

	/**
	 * Open an input file.
	 *
	 * Throws on error; the error code is available through
	 * #open_error.
	 */
	FormatContext(const char *url, AVDictionary **options) {
		int err = avformat_open_input(&format_context, url,
					      nullptr, options);
		if (err < 0)
			throw OpenInputError(err);
	}

	FormatContext(FormatContext &&src) noexcept
		:format_context(std::exchange(src.format_context, nullptr)) {}

	~FormatContext() noexcept {
		if (format_context != nullptr)
			avformat_close_input(&format_context);
	}

	FormatContext &operator=(FormatContext &&src) noexcept {
		using std::swap;
		swap(format_context, src.format_context);
		return *this;
	}

	AVFormatContext &operator*() noexcept {
		return *format_context;
	}

	AVFormatContext *operator->() noexcept {
		return format_context;
	}

	const AVFormatContext *operator->() const noexcept {
		return format_context;
	}

	/**
	 * Throws on error.
	 */
	void FindStreamInfo() {
		int err = avformat_find_stream_info(format_context, nullptr);
		if (err < 0)
			throw MakeFfmpegError(err, "avformat_find_stream_info() failed");
	}

	/**
	 * Thrown by the constructor; carries the FFmpeg error code.
	 */
	class OpenInputError : public std::runtime_error {
		int code;

	public:
		explicit OpenInputError(int _code)
			:std::runtime_error(MakeFfmpegError(_code,
							    "avformat_open_input() failed")),
			 code(_code) {}

		int GetCode() const noexcept {
			return code;
		}
	};
};

} // namespace Ffmpeg

#endif
