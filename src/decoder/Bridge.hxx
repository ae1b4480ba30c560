// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_BRIDGE_HXX
#define LILT_DECODER_BRIDGE_HXX

#include "DecoderList.hxx"
#include "pcm/AudioFormat.hxx"
#include "pcm/Buffer.hxx"
#include "pcm/ChannelsConverter.hxx"
#include "Chrono.hxx"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <utility>

struct TrackDescriptor;
class DecoderStream;
class PcmResampler;

/**
 * A run of decoded frames in the engine's output format.
 */
struct PcmBatch {
	/**
	 * The index of the first frame, counted at the output sample
	 * rate from the start of the track.
	 */
	uint64_t first_frame;

	/**
	 * Interleaved samples; the span is invalidated by the next
	 * DecoderBridge call.  It is empty at the end of the track.
	 */
	std::span<const float> data;

	bool IsEnd() const noexcept {
		return data.empty();
	}
};

/**
 * Glue between a #DecoderStream and the decoder thread: opens the
 * track, converts the decoded PCM to the output format and keeps
 * track of the position.  It recovers from corrupt frames until
 * too many of them occur in a row.
 */
class DecoderBridge {
	const DecoderPluginList &plugins;

	/**
	 * The format of the output device; the "format" attribute is
	 * ignored, we always produce floating point samples.
	 */
	const AudioFormat out_format;

	/**
	 * Fail the track after this many consecutive corrupt frames.
	 */
	const unsigned corrupt_frame_threshold;

	std::string path;

	std::unique_ptr<DecoderStream> stream;

	/**
	 * The native format of #stream.
	 */
	AudioFormat in_format;

	SongTime start_offset;
	SignedSongTime duration;

	PcmChannelsConverter channels_converter;

	/**
	 * nullptr if #in_format has the output sample rate.
	 */
	std::unique_ptr<PcmResampler> resampler;

	PcmBuffer decode_buffer;

	/**
	 * The output frame number of the next frame returned by
	 * Read().
	 */
	uint64_t position;

	/**
	 * Read() cuts the track at this output frame.
	 */
	uint64_t end_frame;

	/**
	 * Has the #DecoderStream reported its end?
	 */
	bool input_eof;

	unsigned consecutive_corrupt;

	/**
	 * The number of corrupt frames skipped in this track.
	 */
	unsigned corrupt_frames;

	/**
	 * The first error of the most recent run of corrupt frames,
	 * to be picked up by TakeRecoveredError().
	 */
	std::exception_ptr recovered_error;

public:
	static constexpr uint64_t UNLIMITED = std::numeric_limits<uint64_t>::max();

	DecoderBridge(const DecoderPluginList &_plugins,
		      AudioFormat _out_format,
		      unsigned _corrupt_frame_threshold) noexcept;
	~DecoderBridge() noexcept;

	DecoderBridge(const DecoderBridge &) = delete;
	DecoderBridge &operator=(const DecoderBridge &) = delete;

	/**
	 * Open the track and seek to its start offset.
	 *
	 * Throws #OpenError.
	 */
	void Open(const TrackDescriptor &track);

	void Close() noexcept;

	bool IsOpen() const noexcept {
		return stream != nullptr;
	}

	AudioFormat GetInputFormat() const noexcept {
		return in_format;
	}

	AudioFormat GetOutputFormat() const noexcept {
		return out_format;
	}

	/**
	 * The duration of the track (after subtracting the start
	 * offset), or negative if unknown.
	 */
	SignedSongTime GetDuration() const noexcept {
		return duration;
	}

	/**
	 * The duration in output frames, or #UNLIMITED if unknown.
	 */
	[[gnu::pure]]
	uint64_t GetDurationFrames() const noexcept;

	[[gnu::pure]]
	bool IsSeekable() const noexcept;

	uint64_t GetPosition() const noexcept {
		return position;
	}

	/**
	 * Cut the track at the given output frame; Read() reports
	 * the end of the track there.  This is used for loop points.
	 */
	void SetEndFrame(uint64_t frame) noexcept {
		end_frame = std::min(frame, GetDurationFrames());
	}

	void ClearEndFrame() noexcept {
		end_frame = GetDurationFrames();
	}

	uint64_t GetEndFrame() const noexcept {
		return end_frame;
	}

	/**
	 * Decode the next batch.  It contains approximately
	 * #max_frames frames (the resampler may change that number).
	 *
	 * Throws #DecodeError on fatal errors.
	 */
	PcmBatch Read(std::size_t max_frames);

	/**
	 * Seek to the given output frame.
	 *
	 * Throws #SeekError if the stream does not allow this; the
	 * position is unchanged then.  Throws #DecodeError on I/O
	 * errors.
	 */
	void Seek(uint64_t frame);

	/**
	 * Like Seek(), but if the stream is not seekable, reopen the
	 * file and skip to the given frame.  This is used for loops.
	 */
	void Rewind(uint64_t frame);

	/**
	 * Return (and clear) the error of a corrupt frame which was
	 * skipped.  Only the first frame of a run of corrupt frames
	 * is reported.
	 */
	std::exception_ptr TakeRecoveredError() noexcept {
		return std::exchange(recovered_error, std::exception_ptr{});
	}

	unsigned GetCorruptFrames() const noexcept {
		return corrupt_frames;
	}

private:
	/**
	 * Open #stream and set up the conversion.
	 */
	void OpenStream();

	/**
	 * Convert an output frame number to a native frame number
	 * relative to the start of the file.
	 */
	[[gnu::pure]]
	uint64_t ToNativeFrame(uint64_t frame) const noexcept;

	/**
	 * Read from #stream, handling corrupt frames.
	 *
	 * @return the number of frames, 0 at the end of the stream
	 */
	std::size_t ReadStream(std::span<float> dest);

	/**
	 * Decode and discard the given number of native frames.
	 */
	void SkipNative(uint64_t n_frames);

	void ResetFilters() noexcept;

	PcmBatch Submit(std::span<const float> data) noexcept;
};

#endif
