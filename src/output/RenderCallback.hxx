// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_OUTPUT_RENDER_CALLBACK_HXX
#define LILT_OUTPUT_RENDER_CALLBACK_HXX

#include <span>

/**
 * The source of the audio an #AudioOutput plays.
 */
class RenderCallback {
public:
	/**
	 * Fill the buffer with interleaved floating point frames in
	 * the format negotiated by AudioOutput::Open().  This is
	 * called from the output's realtime thread; it must not
	 * block, allocate or throw, and it always fills the whole
	 * buffer (with silence if nothing else is available).
	 */
	virtual void Render(std::span<float> dest) noexcept = 0;
};

#endif
