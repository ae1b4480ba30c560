// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_PCM_SOXR_RESAMPLER_HXX
#define LILT_PCM_SOXR_RESAMPLER_HXX

#include "Resampler.hxx"
#include "Buffer.hxx"

struct ConfigBlock;
struct soxr;

/**
 * Band-limited resampling with libsoxr.
 */
class SoxrPcmResampler final : public PcmResampler {
	struct soxr *soxr = nullptr;

	unsigned channels;

	/**
	 * Output frames per input frame.
	 */
	double ratio;

	PcmBuffer buffer;

public:
	/**
	 * Apply the "quality" and "threads" settings to all
	 * instances created later.
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
	std::span<const float> Process(const float *src, std::size_t n_frames,
				       std::size_t max_out);
};

#endif
