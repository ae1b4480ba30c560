// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_FALLBACK_RESAMPLER_HXX
#define LILT_PCM_FALLBACK_RESAMPLER_HXX

#include "Resampler.hxx"
#include "Buffer.hxx"

#include <array>
#include <cstdint>

/**
 * A linear interpolation resampler that is used when no external
 * library was found (or when the user explicitly asks for it).
 *
 * Output frame k is taken at the exact input position k *
 * in_rate / out_rate, computed with integer arithmetic, so the
 * result does not depend on how the input is split into blocks.
 * Resample() emits every output frame whose input position lies
 * within the input seen so far; Flush() completes the stream to
 * round(N * R) frames for N input frames.
 */
class FallbackPcmResampler final : public PcmResampler {
	unsigned channels;
	unsigned in_rate, out_rate;

	/**
	 * Total number of input frames passed to Resample().
	 */
	uint64_t consumed;

	/**
	 * Total number of output frames generated.
	 */
	uint64_t emitted;

	bool flushed;

	/**
	 * The last frame of the previous block; needed to
	 * interpolate between blocks.
	 */
	std::array<float, 8> previous;

	PcmBuffer buffer;

public:
	void Open(unsigned channels,
		  unsigned src_rate, unsigned dest_rate) override;
	void Close() noexcept override;
	void Reset() noexcept override;
	std::span<const float> Resample(std::span<const float> src) override;
	std::span<const float> Flush() override;
};

#endif
