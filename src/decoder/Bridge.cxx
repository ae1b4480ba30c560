// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Bridge.hxx"
#include "Open.hxx"
#include "Stream.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "Track.hxx"
#include "pcm/Resampler.hxx"
#include "pcm/ConfiguredResampler.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <cassert>

DecoderBridge::DecoderBridge(const DecoderPluginList &_plugins,
			     AudioFormat _out_format,
			     unsigned _corrupt_frame_threshold) noexcept
	:plugins(_plugins), out_format(_out_format),
	 corrupt_frame_threshold(_corrupt_frame_threshold)
{
}

DecoderBridge::~DecoderBridge() noexcept
{
	Close();
}

void
DecoderBridge::OpenStream()
{
	stream = DecoderOpenFile(plugins, path.c_str());
	in_format = stream->GetAudioFormat();

	try {
		channels_converter.Open(in_format.channels,
					out_format.channels);

		if (in_format.sample_rate != out_format.sample_rate) {
			resampler = pcm_resampler_create();
			resampler->Open(out_format.channels,
					in_format.sample_rate,
					out_format.sample_rate);
		}
	} catch (...) {
		channels_converter.Close();
		resampler.reset();
		stream.reset();
		std::throw_with_nested(OpenError(OpenResult::UNSUPPORTED_FORMAT,
						 fmt::format("Cannot convert {} to {}",
							     ToString(in_format),
							     ToString(out_format))));
	}

	input_eof = false;
	consecutive_corrupt = 0;
}

void
DecoderBridge::Open(const TrackDescriptor &track)
{
	Close();

	path = track.path;
	start_offset = track.start_offset;
	corrupt_frames = 0;
	recovered_error = {};

	OpenStream();

	FmtDebug(decoder_domain, "opened \"{}\" ({})",
		 path, ToString(in_format));

	if (track.duration.IsPositive())
		duration = track.duration;
	else if (const auto d = stream->GetDuration(); !d.IsNegative())
		duration = d > SignedSongTime(start_offset)
			? SignedSongTime(d - start_offset)
			: SignedSongTime::zero();
	else
		duration = SignedSongTime::Negative();

	position = 0;
	ClearEndFrame();

	if (start_offset.IsPositive()) {
		const uint64_t native = start_offset.ToFrames(in_format.sample_rate);
		if (stream->IsSeekable()) {
			try {
				stream->Seek(native);
			} catch (...) {
				Close();
				std::throw_with_nested(OpenError::Corrupt(track.path.c_str(),
									  "cannot seek to the start offset"));
			}
		} else
			SkipNative(native);
	}
}

void
DecoderBridge::Close() noexcept
{
	if (resampler != nullptr) {
		resampler->Close();
		resampler.reset();
	}

	if (stream != nullptr) {
		channels_converter.Close();
		stream.reset();
	}
}

uint64_t
DecoderBridge::GetDurationFrames() const noexcept
{
	return duration.IsNegative()
		? UNLIMITED
		: duration.ToFrames(out_format.sample_rate);
}

bool
DecoderBridge::IsSeekable() const noexcept
{
	return stream != nullptr && stream->IsSeekable();
}

uint64_t
DecoderBridge::ToNativeFrame(uint64_t frame) const noexcept
{
	return start_offset.ToFrames(in_format.sample_rate) +
		frame * in_format.sample_rate / out_format.sample_rate;
}

std::size_t
DecoderBridge::ReadStream(std::span<float> dest)
{
	while (true) {
		try {
			const std::size_t n = stream->Read(dest);
			consecutive_corrupt = 0;
			return n;
		} catch (const DecodeError &e) {
			if (!e.IsCorruptFrame())
				throw;

			++corrupt_frames;
			if (++consecutive_corrupt > corrupt_frame_threshold)
				std::throw_with_nested(DecodeError(DecodeResult::CORRUPT_FRAME,
								   fmt::format("Too many corrupt frames in \"{}\"",
									       path)));

			if (consecutive_corrupt == 1)
				recovered_error = std::current_exception();

			FmtDebug(decoder_domain,
				 "skipped corrupt frame in \"{}\": {}",
				 path, e.what());
		}
	}
}

void
DecoderBridge::SkipNative(uint64_t n_frames)
{
	const unsigned channels = in_format.channels;

	while (n_frames > 0) {
		const std::size_t chunk = std::min<uint64_t>(n_frames, 4096);
		auto dest = decode_buffer.Get(chunk * channels);
		const std::size_t n = ReadStream(dest);
		if (n == 0) {
			input_eof = true;
			break;
		}

		n_frames -= n;
	}
}

void
DecoderBridge::ResetFilters() noexcept
{
	if (resampler != nullptr)
		resampler->Reset();

	input_eof = false;
	consecutive_corrupt = 0;
}

PcmBatch
DecoderBridge::Submit(std::span<const float> data) noexcept
{
	const unsigned channels = out_format.channels;
	std::size_t n_frames = data.size() / channels;

	if (position + n_frames > end_frame)
		n_frames = end_frame - position;

	const PcmBatch batch{position, data.first(n_frames * channels)};
	position += n_frames;
	return batch;
}

PcmBatch
DecoderBridge::Read(std::size_t max_frames)
{
	assert(stream != nullptr);
	assert(max_frames > 0);

	while (position < end_frame) {
		if (input_eof) {
			/* return what remains in the resampler's
			   buffer */
			if (resampler != nullptr) {
				const auto data = resampler->Flush();
				if (!data.empty())
					return Submit(data);
			}

			break;
		}

		auto dest = decode_buffer.Get(max_frames * in_format.channels);
		const std::size_t n = ReadStream(dest);
		if (n == 0) {
			input_eof = true;
			continue;
		}

		std::span<const float> data = dest.first(n * in_format.channels);
		data = channels_converter.Convert(data);
		if (resampler != nullptr)
			data = resampler->Resample(data);

		if (!data.empty())
			return Submit(data);
	}

	return {position, {}};
}

void
DecoderBridge::Seek(uint64_t frame)
{
	assert(stream != nullptr);

	if (!stream->IsSeekable())
		throw SeekError::Unseekable();

	if (frame > GetDurationFrames())
		throw SeekError::OutOfRange();

	stream->Seek(ToNativeFrame(frame));

	ResetFilters();
	position = frame;
}

void
DecoderBridge::Rewind(uint64_t frame)
{
	assert(stream != nullptr);

	if (stream->IsSeekable()) {
		Seek(frame);
		return;
	}

	FmtDebug(decoder_domain, "reopening unseekable \"{}\"", path);

	if (resampler != nullptr) {
		resampler->Close();
		resampler.reset();
	}

	channels_converter.Close();
	stream.reset();

	OpenStream();
	SkipNative(ToNativeFrame(frame));
	position = frame;
}
