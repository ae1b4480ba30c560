// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "MusicPipe.hxx"

#include <algorithm>
#include <cassert>

MusicPipe::MusicPipe(std::size_t capacity_frames, unsigned _channels)
	:channels(_channels),
	 chunk_frames(MusicChunk::SAMPLES / _channels)
{
	assert(channels > 0);
	assert(chunk_frames > 0);

	chunks = RingBuffer<MusicChunk>((capacity_frames + chunk_frames - 1) / chunk_frames);
}

std::size_t
MusicPipe::TryPush(const Origin &origin, std::span<const float> data) noexcept
{
	assert(data.size() % channels == 0);

	uint8_t flags = origin.flags & MusicChunk::START;
	std::size_t pushed = 0;

	while (!data.empty()) {
		const auto w = chunks.Write();
		if (w.empty())
			break;

		const std::size_t n = std::min(data.size() / channels,
					       chunk_frames);

		MusicChunk &chunk = w.front();
		chunk.track_id = origin.track_id;
		chunk.first_frame = origin.first_frame + pushed;
		chunk.serial = origin.serial;
		chunk.n_frames = n;
		chunk.flags = flags;
		std::copy_n(data.begin(), n * channels, chunk.data);

		/* the counter goes first so GetBufferedFrames() never
		   underflows */
		pushed_frames.store(pushed_frames.load(std::memory_order_relaxed) + n,
				    std::memory_order_release);
		chunks.Append(1);

		data = data.subspan(n * channels);
		pushed += n;
		flags = 0;
	}

	return pushed;
}

bool
MusicPipe::PushEnd(const Origin &origin) noexcept
{
	const auto w = chunks.Write();
	if (w.empty())
		return false;

	MusicChunk &chunk = w.front();
	chunk.track_id = origin.track_id;
	chunk.first_frame = origin.first_frame;
	chunk.serial = origin.serial;
	chunk.n_frames = 0;
	chunk.flags = (origin.flags & MusicChunk::START) | MusicChunk::END;
	chunks.Append(1);
	return true;
}

const MusicChunk *
MusicPipe::Peek() noexcept
{
	if (holding) {
		const MusicChunk &front = chunks.Read().front();
		if (read_offset < front.n_frames)
			return &front;

		chunks.Consume(1);
		holding = false;
		read_offset = 0;
	}

	const auto r = chunks.Read();
	return r.empty() ? nullptr : &r.front();
}

MusicPipe::Run
MusicPipe::Pull(std::size_t max_frames) noexcept
{
	const MusicChunk *chunk = Peek();
	if (chunk == nullptr)
		return {};

	const std::size_t n = std::min<std::size_t>(max_frames,
						    chunk->n_frames - read_offset);

	Run run;
	run.track_id = chunk->track_id;
	run.first_frame = chunk->first_frame + read_offset;
	run.serial = chunk->serial;
	run.n_frames = n;
	run.data = chunk->GetData(channels).subspan(read_offset * channels,
						     n * channels);
	run.start = chunk->IsStart() && read_offset == 0;
	run.end = chunk->IsEnd();

	read_offset += n;
	holding = true;
	AddPulled(n);
	return run;
}

void
MusicPipe::Skip() noexcept
{
	const MusicChunk *chunk = Peek();
	if (chunk == nullptr)
		return;

	AddPulled(chunk->n_frames - read_offset);
	chunks.Consume(1);
	holding = false;
	read_offset = 0;
}

void
MusicPipe::DiscardStale(uint32_t serial) noexcept
{
	const MusicChunk *chunk;
	while ((chunk = Peek()) != nullptr &&
	       IsOlderSerial(chunk->serial, serial))
		Skip();
}

void
MusicPipe::Discard() noexcept
{
	while (Peek() != nullptr)
		Skip();
}
