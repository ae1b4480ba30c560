// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "FfmpegDecoderPlugin.hxx"
#include "lib/ffmpeg/Domain.hxx"
#include "lib/ffmpeg/Error.hxx"
#include "lib/ffmpeg/Init.hxx"
#include "lib/ffmpeg/Frame.hxx"
#include "lib/ffmpeg/Format.hxx"
#include "lib/ffmpeg/Codec.hxx"
#include "lib/ffmpeg/SampleFormat.hxx"
#include "lib/ffmpeg/Time.hxx"
#include "../DecoderPlugin.hxx"
#include "../Stream.hxx"
#include "../Error.hxx"
#include "config/Block.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/frame.h>
}

#include <fmt/format.h>

#include <algorithm>
#include <new>
#include <vector>

/**
 * Muxer options to be passed to avformat_open_input().
 */
static AVDictionary *avformat_options = nullptr;

static bool
ffmpeg_init(const ConfigBlock &block)
{
	FfmpegInit();

	static constexpr const char *option_names[] = {
		"probesize",
		"analyzeduration",
	};

	for (const char *name : option_names) {
		const char *value = block.GetString(name);
		if (value != nullptr)
			av_dict_set(&avformat_options, name, value, 0);
	}

	return true;
}

static void
ffmpeg_finish() noexcept
{
	av_dict_free(&avformat_options);
}

[[gnu::pure]]
static int
ffmpeg_find_audio_stream(const AVFormatContext &format_context) noexcept
{
	for (unsigned i = 0; i < format_context.nb_streams; ++i)
		if (format_context.streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO)
			return i;

	return -1;
}

/**
 * Accessor for AVStream::start_time that replaces AV_NOPTS_VALUE with
 * zero.
 */
static constexpr int64_t
start_time_fallback(const AVStream &stream) noexcept
{
	return FfmpegTimestampFallback(stream.start_time, 0);
}

static constexpr float
ToFloat(uint8_t v) noexcept
{
	return float(int(v) - 128) / 128.f;
}

static constexpr float
ToFloat(int16_t v) noexcept
{
	return float(v) / 32768.f;
}

static constexpr float
ToFloat(int32_t v) noexcept
{
	return float(double(v) / 2147483648.);
}

static constexpr float
ToFloat(float v) noexcept
{
	return v;
}

static constexpr float
ToFloat(double v) noexcept
{
	return float(v);
}

/**
 * Convert the samples of an #AVFrame (packed or planar) to
 * interleaved floating point.
 */
template<typename T>
static void
CopyFrame(float *dest, const AVFrame &frame, unsigned channels,
	  bool planar) noexcept
{
	const std::size_t n_frames = frame.nb_samples;

	if (planar) {
		for (unsigned c = 0; c < channels; ++c) {
			const T *src = (const T *)frame.extended_data[c];
			for (std::size_t i = 0; i < n_frames; ++i)
				dest[i * channels + c] = ToFloat(src[i]);
		}
	} else {
		const T *src = (const T *)frame.extended_data[0];
		for (std::size_t i = 0; i < n_frames * channels; ++i)
			dest[i] = ToFloat(src[i]);
	}
}

class FfmpegDecoderStream final : public DecoderStream {
	Ffmpeg::FormatContext format_context;
	Ffmpeg::CodecContext codec_context;
	Ffmpeg::Frame frame;

	AVStream &av_stream;
	const int audio_stream;

	const AudioFormat audio_format;
	const SignedSongTime duration;
	const bool seekable;

	/**
	 * Decoded samples which did not fit into the caller's
	 * buffer.
	 */
	std::vector<float> pending;
	std::size_t pending_position = 0, pending_size = 0;

	/**
	 * Skip all data before this PCM frame number; this is used
	 * after seeking to skip data until the exact desired frame
	 * has been reached.
	 */
	uint64_t min_frame = 0;

	/**
	 * Has av_read_frame() reported the end of the file?  Then the
	 * codec has been put into draining mode.
	 */
	bool input_eof = false;

	/**
	 * Has the codec been drained completely?
	 */
	bool eof = false;

public:
	FfmpegDecoderStream(Ffmpeg::FormatContext &&_format_context,
			    Ffmpeg::CodecContext &&_codec_context,
			    int _audio_stream, AudioFormat _audio_format,
			    SignedSongTime _duration) noexcept
		:format_context(std::move(_format_context)),
		 codec_context(std::move(_codec_context)),
		 av_stream(*format_context->streams[_audio_stream]),
		 audio_stream(_audio_stream),
		 audio_format(_audio_format),
		 duration(_duration),
		 seekable(format_context->pb != nullptr &&
			  (format_context->pb->seekable & AVIO_SEEKABLE_NORMAL) != 0 &&
			  (format_context->ctx_flags & AVFMTCTX_UNSEEKABLE) == 0) {}

	/* virtual methods from class DecoderStream */
	AudioFormat GetAudioFormat() const noexcept override {
		return audio_format;
	}

	SignedSongTime GetDuration() const noexcept override {
		return duration;
	}

	bool IsSeekable() const noexcept override {
		return seekable;
	}

	std::size_t Read(std::span<float> dest) override;
	void Seek(uint64_t frame) override;

private:
	/**
	 * Feed the next packet of the audio stream into the codec.
	 *
	 * Throws #DecodeError.
	 */
	void SendPacket();

	/**
	 * Store the decoded #frame in #pending.
	 */
	void SubmitFrame();
};

void
FfmpegDecoderStream::SendPacket()
{
	AVPacket *packet = av_packet_alloc();
	if (packet == nullptr)
		throw std::bad_alloc();

	AtScopeExit(&packet) {
		av_packet_free(&packet);
	};

	while (true) {
		int err = av_read_frame(&*format_context, packet);
		if (err == AVERROR_EOF) {
			/* enter draining mode */
			input_eof = true;
			avcodec_send_packet(&*codec_context, nullptr);
			return;
		}

		if (err < 0) {
			try {
				throw MakeFfmpegError(err, "av_read_frame() failed");
			} catch (...) {
				std::throw_with_nested(DecodeError::IoFailure("Failed to read from file"));
			}
		}

		if (packet->size > 0 && packet->stream_index == audio_stream)
			break;

		av_packet_unref(packet);
	}

	int err = avcodec_send_packet(&*codec_context, packet);
	if (err == 0 || err == AVERROR_EOF)
		return;

	if (err == AVERROR_INVALIDDATA) {
		/* this packet is lost; the codec continues with the
		   next one */
		throw DecodeError::CorruptFrame("Malformed packet");
	}

	try {
		throw MakeFfmpegError(err, "avcodec_send_packet() failed");
	} catch (...) {
		std::throw_with_nested(DecodeError::IoFailure("Failed to decode packet"));
	}
}

void
FfmpegDecoderStream::SubmitFrame()
{
	const unsigned channels = audio_format.channels;
	std::size_t n_frames = frame->nb_samples;

	const auto sample_fmt = AVSampleFormat(frame->format);
	const bool planar = av_sample_fmt_is_planar(sample_fmt);

	if (pending.size() < n_frames * channels)
		pending.resize(n_frames * channels);

	switch (sample_fmt) {
	case AV_SAMPLE_FMT_U8:
	case AV_SAMPLE_FMT_U8P:
		CopyFrame<uint8_t>(pending.data(), *frame, channels, planar);
		break;

	case AV_SAMPLE_FMT_S16:
	case AV_SAMPLE_FMT_S16P:
		CopyFrame<int16_t>(pending.data(), *frame, channels, planar);
		break;

	case AV_SAMPLE_FMT_S32:
	case AV_SAMPLE_FMT_S32P:
		CopyFrame<int32_t>(pending.data(), *frame, channels, planar);
		break;

	case AV_SAMPLE_FMT_FLT:
	case AV_SAMPLE_FMT_FLTP:
		CopyFrame<float>(pending.data(), *frame, channels, planar);
		break;

	case AV_SAMPLE_FMT_DBL:
	case AV_SAMPLE_FMT_DBLP:
		CopyFrame<double>(pending.data(), *frame, channels, planar);
		break;

	default:
		throw DecodeError::CorruptFrame("Unsupported sample format in frame");
	}

	pending_position = 0;
	pending_size = n_frames * channels;

	if (min_frame > 0) {
		const int64_t pts = frame->best_effort_timestamp;
		if (pts != int64_t(AV_NOPTS_VALUE) && pts >= 0) {
			const uint64_t position =
				av_rescale_q(pts - start_time_fallback(av_stream),
					     av_stream.time_base,
					     {1, int(audio_format.sample_rate)});
			if (position + n_frames <= min_frame) {
				/* entirely before the seek target */
				pending_size = 0;
				return;
			}

			if (position < min_frame)
				pending_position = (min_frame - position) * channels;
		}

		min_frame = 0;
	}
}

std::size_t
FfmpegDecoderStream::Read(std::span<float> dest)
{
	const unsigned channels = audio_format.channels;

	while (pending_position >= pending_size) {
		if (eof)
			return 0;

		int err = avcodec_receive_frame(&*codec_context, frame.get());
		if (err == 0) {
			AtScopeExit(this) { frame.Unref(); };
			SubmitFrame();
			continue;
		}

		if (err == AVERROR_EOF) {
			eof = true;
			return 0;
		}

		if (err == AVERROR(EAGAIN)) {
			if (input_eof) {
				eof = true;
				return 0;
			}

			SendPacket();
			continue;
		}

		if (err == AVERROR_INVALIDDATA)
			throw DecodeError::CorruptFrame("Malformed frame");

		try {
			throw MakeFfmpegError(err, "avcodec_receive_frame() failed");
		} catch (...) {
			std::throw_with_nested(DecodeError::IoFailure("Failed to decode frame"));
		}
	}

	const std::size_t n = std::min(dest.size() / channels,
				       (pending_size - pending_position) / channels);
	std::copy_n(pending.data() + pending_position, n * channels,
		    dest.begin());
	pending_position += n * channels;
	return n;
}

void
FfmpegDecoderStream::Seek(uint64_t target)
{
	if (!seekable)
		throw SeekError::Unseekable();

	if (!duration.IsNegative() &&
	    target > duration.ToFrames(audio_format.sample_rate))
		throw SeekError::OutOfRange();

	const int64_t where =
		av_rescale_q(target, {1, int(audio_format.sample_rate)},
			     av_stream.time_base) +
		start_time_fallback(av_stream);

	/* AVSEEK_FLAG_BACKWARD asks FFmpeg to seek to the packet
	   boundary before the seek time stamp, not after */
	int err = av_seek_frame(&*format_context, audio_stream, where,
				AVSEEK_FLAG_ANY|AVSEEK_FLAG_BACKWARD);
	if (err < 0) {
		try {
			throw MakeFfmpegError(err, "av_seek_frame() failed");
		} catch (...) {
			std::throw_with_nested(DecodeError::IoFailure("Failed to seek"));
		}
	}

	codec_context.FlushBuffers();
	pending_position = pending_size = 0;
	input_eof = eof = false;
	min_frame = target;
}

static std::unique_ptr<DecoderStream>
ffmpeg_open_file(const char *path)
{
	AVDictionary *options = nullptr;
	AtScopeExit(&options) { av_dict_free(&options); };
	av_dict_copy(&options, avformat_options, 0);

	Ffmpeg::FormatContext format_context;
	try {
		format_context = Ffmpeg::FormatContext(path, &options);
	} catch (const Ffmpeg::FormatContext::OpenInputError &e) {
		if (e.GetCode() == AVERROR_INVALIDDATA)
			/* no demuxer recognizes this file */
			return nullptr;

		throw;
	}

	const auto *input_format = format_context->iformat;
	FmtDebug(ffmpeg_domain, "detected input format '{}'",
		 input_format->name);

	try {
		format_context.FindStreamInfo();
	} catch (...) {
		std::throw_with_nested(OpenError::Corrupt(path, "no stream info"));
	}

	const int audio_stream = ffmpeg_find_audio_stream(*format_context);
	if (audio_stream < 0)
		throw OpenError(OpenResult::UNSUPPORTED_FORMAT,
				fmt::format("No audio stream inside \"{}\"",
					    path));

	const AVStream &av_stream = *format_context->streams[audio_stream];
	const auto &codec_params = *av_stream.codecpar;

	const AVCodec *codec = avcodec_find_decoder(codec_params.codec_id);
	if (codec == nullptr)
		throw OpenError(OpenResult::UNSUPPORTED_FORMAT,
				fmt::format("Unsupported audio codec in \"{}\"",
					    path));

	FmtDebug(ffmpeg_domain, "codec '{}'", codec->name);

	Ffmpeg::CodecContext codec_context(*codec);
	codec_context.FillFromParameters(codec_params);
	codec_context.Open(*codec, nullptr);

	const auto sample_format =
		Ffmpeg::FromFfmpegSampleFormat(codec_context->sample_fmt);
	const AudioFormat audio_format(codec_context->sample_rate,
				       sample_format,
				       codec_context->ch_layout.nb_channels);
	if (!audio_format.IsValid())
		throw OpenError(OpenResult::UNSUPPORTED_FORMAT,
				fmt::format("Unsupported audio format {} in \"{}\"",
					    ToString(audio_format), path));

	const SignedSongTime duration =
		av_stream.duration != int64_t(AV_NOPTS_VALUE)
		? FromFfmpegTimeChecked(av_stream.duration, av_stream.time_base)
		: FromFfmpegTimeChecked(format_context->duration, AV_TIME_BASE_Q);

	return std::make_unique<FfmpegDecoderStream>(std::move(format_context),
						     std::move(codec_context),
						     audio_stream, audio_format,
						     duration);
}

static const char *const ffmpeg_suffixes[] = {
	"aac", "aif", "aiff", "alac", "ape", "flac", "m4a", "mka",
	"mp2", "mp3", "mp4", "mpc", "oga", "ogg", "opus", "spx",
	"tta", "wma", "wv",
};

constexpr DecoderPlugin ffmpeg_decoder_plugin = {
	.name = "ffmpeg",
	.open_file = ffmpeg_open_file,
	.init = ffmpeg_init,
	.finish = ffmpeg_finish,
	.suffixes = ffmpeg_suffixes,
};
