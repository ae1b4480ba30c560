// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_RESAMPLER_HXX
#define LILT_PCM_RESAMPLER_HXX

#include <span>

/**
 * Sample rate conversion of interleaved float samples.  The filter
 * state carries over from one Resample() call to the next, so a
 * stream may be split into blocks arbitrarily.
 */
class PcmResampler {
public:
	virtual ~PcmResampler() noexcept = default;

	/**
	 * Prepare for Resample().
	 *
	 * Throws std::runtime_error on error.
	 */
	virtual void Open(unsigned channels,
			  unsigned src_rate, unsigned dest_rate) = 0;

	/**
	 * Release what Open() has allocated.  Open() may be called
	 * again afterwards.
	 */
	virtual void Close() noexcept = 0;

	/**
	 * Forget the history and all pending data, as after Open().
	 * Called on seek.
	 */
	virtual void Reset() noexcept = 0;

	/**
	 * Convert whole frames.  The returned span is valid until
	 * the next call.
	 *
	 * Throws std::runtime_error on error.
	 */
	virtual std::span<const float> Resample(std::span<const float> src) = 0;

	/**
	 * Drain the filter at the end of the stream.  Call until it
	 * returns an empty span.
	 */
	virtual std::span<const float> Flush() {
		return {};
	}
};

#endif
