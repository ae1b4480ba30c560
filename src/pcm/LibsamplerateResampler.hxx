// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_LIBSAMPLERATE_RESAMPLER_HXX
#define LILT_PCM_LIBSAMPLERATE_RESAMPLER_HXX

#include "Resampler.hxx"
#include "Buffer.hxx"

#include <samplerate.h>

struct ConfigBlock;

/**
 * Resampling with libsamplerate (Secret Rabbit Code).
 */
class LibsampleratePcmResampler final : public PcmResampler {
	SRC_STATE *state = nullptr;

	unsigned channels;
	double ratio;

	PcmBuffer buffer;

public:
	/**
	 * Apply the "type" setting (a converter name or number) to
	 * all instances created later.
	 *
	 * Throws on error.
	 */
	static void Configure(const ConfigBlock &block);

	void Open(unsigned channels,
		  unsigned src_rate, unsigned dest_rate) override;
	void Close() noexcept override;
	void Reset() noexcept override;
	std::span<const float> Resample(std::span<const float> src) override;
	std::span<const float> Flush() override;

private:
	std::span<const float> Process(std::span<const float> src,
				       std::size_t max_out,
				       bool end_of_input);
};

#endif
