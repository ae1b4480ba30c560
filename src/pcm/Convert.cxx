// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Convert.hxx"
#include "Clamp.hxx"

#include <algorithm>
#include <cmath>

/**
 * Convert signed integers with the given number of significant bits
 * to float.
 */
template<typename T, unsigned BITS>
static void
IntegerToFloat(float *dest, const T *src, std::size_t n) noexcept
{
	static constexpr float factor = 1.f / float(1u << (BITS - 1));

	std::transform(src, src + n, dest, [](T x){
		return float(x) * factor;
	});
}

void
pcm_convert_to_float(float *dest, SampleFormat src_format,
		     const void *src, std::size_t n) noexcept
{
	switch (src_format) {
	case SampleFormat::UNDEFINED:
		break;

	case SampleFormat::S8:
		IntegerToFloat<int8_t, 8>(dest, (const int8_t *)src, n);
		return;

	case SampleFormat::S16:
		IntegerToFloat<int16_t, 16>(dest, (const int16_t *)src, n);
		return;

	case SampleFormat::S24_P32:
		IntegerToFloat<int32_t, 24>(dest, (const int32_t *)src, n);
		return;

	case SampleFormat::S32:
		IntegerToFloat<int32_t, 32>(dest, (const int32_t *)src, n);
		return;

	case SampleFormat::FLOAT:
		std::copy_n((const float *)src, n, dest);
		return;
	}

	std::fill_n(dest, n, 0.f);
}

void
pcm_convert_float_to_s16(int16_t *dest, std::span<const float> src) noexcept
{
	std::transform(src.begin(), src.end(), dest, [](float x){
		return int16_t(std::lrint(PcmClamp(x) * 32767.f));
	});
}

void
pcm_convert_float_to_s32(int32_t *dest, std::span<const float> src) noexcept
{
	std::transform(src.begin(), src.end(), dest, [](float x){
		/* double precision: float cannot represent
		   2147483647 exactly */
		return int32_t(std::lrint(double(PcmClamp(x)) * 2147483647.));
	});
}
