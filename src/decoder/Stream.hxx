// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_DECODER_STREAM_HXX
#define LILT_DECODER_STREAM_HXX

#include "pcm/AudioFormat.hxx"
#include "Chrono.hxx"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * An open audio file which produces PCM frames in its native sample
 * rate and channel layout.  Instances are created by
 * DecoderPlugin::open_file and used only by the decoder thread.
 */
class DecoderStream {
public:
	virtual ~DecoderStream() noexcept = default;

	/**
	 * The native format of the file.  The "format" attribute
	 * describes how samples are stored in the file; Read()
	 * always returns floating point samples.
	 */
	virtual AudioFormat GetAudioFormat() const noexcept = 0;

	/**
	 * @return the duration of the file, or a negative value if
	 * unknown
	 */
	virtual SignedSongTime GetDuration() const noexcept = 0;

	virtual bool IsSeekable() const noexcept = 0;

	/**
	 * Decode frames into the given buffer.  Its size must be a
	 * multiple of the channel count.
	 *
	 * Throws #DecodeError.  After a DecodeResult::CORRUPT_FRAME
	 * error, the stream has skipped the malformed unit and
	 * Read() may be called again.
	 *
	 * @return the number of frames (not samples) written, 0 at
	 * the end of the stream
	 */
	virtual std::size_t Read(std::span<float> dest) = 0;

	/**
	 * Seek to the given frame (at the native sample rate).
	 *
	 * Throws #SeekError or #DecodeError.
	 */
	virtual void Seek(uint64_t frame) = 0;
};

#endif
