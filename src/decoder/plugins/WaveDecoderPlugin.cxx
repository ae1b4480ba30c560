// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

/* \file
 *
 * A decoder for uncompressed RIFF/WAVE files.  It supports integer
 * PCM with 8, 16, 24 and 32 bits and IEEE floating point with 32 and
 * 64 bits, all little-endian.
 */

#include "WaveDecoderPlugin.hxx"
#include "../DecoderPlugin.hxx"
#include "../Stream.hxx"
#include "../Error.hxx"
#include "io/FileReader.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <system_error>
#include <vector>

static constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
static constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
static constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xfffe;

static constexpr uint16_t
LoadLE16(const std::byte *p) noexcept
{
	return uint16_t(p[0]) | (uint16_t(p[1]) << 8);
}

static constexpr uint32_t
LoadLE32(const std::byte *p) noexcept
{
	return uint32_t(p[0]) | (uint32_t(p[1]) << 8) |
		(uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

static constexpr bool
IsChunkId(const std::byte *p, const char *id) noexcept
{
	return char(p[0]) == id[0] && char(p[1]) == id[1] &&
		char(p[2]) == id[2] && char(p[3]) == id[3];
}

struct WaveFormat {
	uint16_t tag;
	uint16_t channels;
	uint32_t sample_rate;
	uint16_t block_align;
	uint16_t bits;
};

class WaveDecoderStream final : public DecoderStream {
	FileReader reader;

	const WaveFormat format;
	const AudioFormat audio_format;

	/**
	 * The file offset of the first PCM frame.
	 */
	const uint64_t data_offset;

	const uint64_t total_frames;

	uint64_t position = 0;

	std::vector<std::byte> raw;

public:
	WaveDecoderStream(FileReader &&_reader, const WaveFormat &_format,
			  AudioFormat _audio_format,
			  uint64_t _data_offset, uint64_t _total_frames)
		:reader(std::move(_reader)), format(_format),
		 audio_format(_audio_format),
		 data_offset(_data_offset), total_frames(_total_frames) {}

	/* virtual methods from class DecoderStream */
	AudioFormat GetAudioFormat() const noexcept override {
		return audio_format;
	}

	SignedSongTime GetDuration() const noexcept override {
		return SignedSongTime::FromFrames(total_frames,
							   audio_format.sample_rate);
	}

	bool IsSeekable() const noexcept override {
		return true;
	}

	std::size_t Read(std::span<float> dest) override;
	void Seek(uint64_t frame) override;

private:
	void Convert(float *dest, const std::byte *src,
		     std::size_t n_samples) const noexcept;
};

void
WaveDecoderStream::Convert(float *dest, const std::byte *src,
			   std::size_t n_samples) const noexcept
{
	const unsigned sample_size = format.bits / 8;

	for (std::size_t i = 0; i < n_samples; ++i, src += sample_size) {
		if (format.tag == WAVE_FORMAT_IEEE_FLOAT) {
			if (format.bits == 32) {
				const uint32_t bits = LoadLE32(src);
				float f;
				std::memcpy(&f, &bits, sizeof(f));
				dest[i] = f;
			} else {
				const uint64_t bits = uint64_t(LoadLE32(src)) |
					(uint64_t(LoadLE32(src + 4)) << 32);
				double d;
				std::memcpy(&d, &bits, sizeof(d));
				dest[i] = float(d);
			}

			continue;
		}

		switch (format.bits) {
		case 8:
			/* 8 bit WAVE samples are unsigned */
			dest[i] = float(int(src[0]) - 128) / 128.f;
			break;

		case 16:
			dest[i] = float(int16_t(LoadLE16(src))) / 32768.f;
			break;

		case 24: {
			int32_t value = int32_t(src[0]) |
				(int32_t(src[1]) << 8) |
				(int32_t(src[2]) << 16);
			if (value & 0x800000)
				value -= 0x1000000;
			dest[i] = float(value) / 8388608.f;
			break;
		}

		case 32:
			dest[i] = float(double(int32_t(LoadLE32(src))) / 2147483648.);
			break;
		}
	}
}

std::size_t
WaveDecoderStream::Read(std::span<float> dest)
{
	std::size_t n_frames = std::min<uint64_t>(dest.size() / format.channels,
						  total_frames - position);
	if (n_frames == 0)
		return 0;

	const std::size_t n_bytes = n_frames * format.block_align;
	if (raw.size() < n_bytes)
		raw.resize(n_bytes);

	std::size_t nbytes;
	try {
		nbytes = reader.Read({raw.data(), n_bytes});
	} catch (const std::system_error &) {
		std::throw_with_nested(DecodeError::IoFailure("Failed to read WAVE data"));
	}

	/* drop an incomplete trailing frame */
	n_frames = nbytes / format.block_align;
	if (n_frames == 0) {
		/* the file is shorter than the "data" chunk claims */
		position = total_frames;
		return 0;
	}

	/* convert frame by frame; this skips the padding of a
	   block_align larger than channels*sample_size */
	for (std::size_t f = 0; f < n_frames; ++f)
		Convert(dest.data() + f * format.channels,
			raw.data() + f * format.block_align,
			format.channels);

	position += n_frames;
	return n_frames;
}

void
WaveDecoderStream::Seek(uint64_t frame)
{
	if (frame > total_frames)
		throw SeekError::OutOfRange();

	try {
		reader.Seek(data_offset + frame * format.block_align);
	} catch (const std::system_error &) {
		std::throw_with_nested(DecodeError::IoFailure("Failed to seek WAVE file"));
	}

	position = frame;
}

static SampleFormat
ToSampleFormat(const WaveFormat &f) noexcept
{
	if (f.tag == WAVE_FORMAT_IEEE_FLOAT)
		return f.bits == 32 || f.bits == 64
			? SampleFormat::FLOAT
			: SampleFormat::UNDEFINED;

	switch (f.bits) {
	case 8:
		return SampleFormat::S8;

	case 16:
		return SampleFormat::S16;

	case 24:
		return SampleFormat::S24_P32;

	case 32:
		return SampleFormat::S32;
	}

	return SampleFormat::UNDEFINED;
}

static WaveFormat
ParseFormatChunk(const char *path, std::span<const std::byte> chunk)
{
	if (chunk.size() < 16)
		throw OpenError::Corrupt(path, "\"fmt \" chunk is too short");

	WaveFormat f;
	f.tag = LoadLE16(chunk.data());
	f.channels = LoadLE16(chunk.data() + 2);
	f.sample_rate = LoadLE32(chunk.data() + 4);
	f.block_align = LoadLE16(chunk.data() + 12);
	f.bits = LoadLE16(chunk.data() + 14);

	if (f.tag == WAVE_FORMAT_EXTENSIBLE) {
		/* the first two bytes of the SubFormat GUID are the
		   actual format tag */
		if (chunk.size() < 26)
			throw OpenError::Corrupt(path, "\"fmt \" chunk is too short");

		f.tag = LoadLE16(chunk.data() + 24);
	}

	if (f.tag != WAVE_FORMAT_PCM && f.tag != WAVE_FORMAT_IEEE_FLOAT)
		throw OpenError(OpenResult::UNSUPPORTED_FORMAT,
				fmt::format("Unsupported WAVE format tag 0x{:04x} in \"{}\"",
					    f.tag, path));

	if (f.channels == 0 || f.sample_rate == 0 ||
	    f.bits == 0 || f.bits % 8 != 0 ||
	    f.block_align < f.channels * (f.bits / 8))
		throw OpenError::Corrupt(path, "invalid \"fmt \" chunk");

	return f;
}

static std::unique_ptr<DecoderStream>
wave_open_file(const char *path)
{
	FileReader reader(path);

	std::array<std::byte, 12> riff;
	if (reader.Read(riff) != riff.size() ||
	    !IsChunkId(riff.data(), "RIFF") ||
	    !IsChunkId(riff.data() + 8, "WAVE"))
		/* not a WAVE file */
		return nullptr;

	const uint64_t file_size = reader.GetSize();

	bool have_format = false;
	WaveFormat format{};

	while (true) {
		std::array<std::byte, 8> header;
		if (reader.Read(header) != header.size())
			throw OpenError::Corrupt(path, "no \"data\" chunk");

		const uint32_t size = LoadLE32(header.data() + 4);

		if (IsChunkId(header.data(), "fmt ")) {
			if (size > 1024)
				throw OpenError::Corrupt(path, "\"fmt \" chunk is too large");

			std::array<std::byte, 1024> buffer;
			reader.ReadFull({buffer.data(), size});
			format = ParseFormatChunk(path, {buffer.data(), size});
			have_format = true;

			if (size % 2 != 0)
				reader.Skip(1);
		} else if (IsChunkId(header.data(), "data")) {
			if (!have_format)
				throw OpenError::Corrupt(path, "\"data\" chunk before \"fmt \" chunk");

			const uint64_t data_offset = reader.GetPosition();

			/* streaming writers leave the size 0 or
			   0xffffffff; clip at the end of the file */
			uint64_t data_size = size;
			if (data_size == 0 || data_size == 0xffffffff ||
			    data_offset + data_size > file_size)
				data_size = file_size - data_offset;

			const auto sample_format = ToSampleFormat(format);
			const AudioFormat audio_format(format.sample_rate,
						       sample_format,
						       format.channels);
			if (!audio_format.IsValid())
				throw OpenError(OpenResult::UNSUPPORTED_FORMAT,
						fmt::format("Unsupported WAVE audio format {}:{}:{} in \"{}\"",
							    format.sample_rate,
							    format.bits,
							    format.channels,
							    path));

			return std::make_unique<WaveDecoderStream>(std::move(reader),
								   format,
								   audio_format,
								   data_offset,
								   data_size / format.block_align);
		} else {
			reader.Skip(size + (size % 2));
		}
	}
}

static const char *const wave_suffixes[] = {
	"wav", "wave",
};

constexpr DecoderPlugin wave_decoder_plugin = {
	.name = "wave",
	.open_file = wave_open_file,
	.suffixes = wave_suffixes,
};
