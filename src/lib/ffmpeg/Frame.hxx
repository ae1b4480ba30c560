// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_FFMPEG_FRAME_HXX
#define LILT_FFMPEG_FRAME_HXX

extern "C" {
#include <libavutil/frame.h>
}

#include <new>
#include <utility>

namespace Ffmpeg {

class Frame {
	AVFrame *frame;

public:
	Frame():frame(av_frame_alloc()) {
		if (frame == nullptr)
			throw std::bad_alloc();
	}

	~Frame() noexcept {
		av_frame_free(&frame);
	}

	Frame(const Frame &) = delete;
	Frame &operator=(const Frame &) = delete;

	AVFrame &operator*() noexcept {
		return *frame;
	}

	AVFrame *operator->() noexcept {
		return frame;
	}

	const AVFrame *operator->() const noexcept {
		return frame;
	}

	AVFrame *get() noexcept {
		return frame;
	}

	void Unref() noexcept {
		av_frame_unref(frame);
	}
};

} // namespace Ffmpeg

#endif
