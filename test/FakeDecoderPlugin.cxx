// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "FakeDecoderPlugin.hxx"
#include "TestFiles.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/Stream.hxx"
#include "decoder/Error.hxx"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <thread>

/* the decoder thread opens files while the test registers them */
static std::mutex fake_mutex;

struct FakeEntry {
	FakeTrack track;
	unsigned open_count = 0;
};

static std::map<std::string, FakeEntry, std::less<>> fake_tracks;

int64_t
FakeFrameIndex(unsigned key, float value) noexcept
{
	const int64_t raw = std::llround(double(value) * 16777216.);
	const int64_t base = int64_t(key) * 1000000;
	if (raw < base || raw >= base + 1000000)
		return -1;

	return raw - base;
}

std::string
AddFakeTrack(const char *name, const FakeTrack &track)
{
	std::string path = MakeTestPath(name);
	path += ".fake";
	WriteTestFile(path, {});

	const std::scoped_lock protect(fake_mutex);
	fake_tracks[path] = {track, 0};
	return path;
}

void
ClearFakeTracks() noexcept
{
	const std::scoped_lock protect(fake_mutex);
	fake_tracks.clear();
}

unsigned
GetFakeOpenCount(const std::string &path) noexcept
{
	const std::scoped_lock protect(fake_mutex);
	const auto i = fake_tracks.find(path);
	return i != fake_tracks.end()
		? i->second.open_count
		: 0;
}

class FakeDecoderStream final : public DecoderStream {
	const FakeTrack track;

	uint64_t position = 0;

	unsigned corrupt_left;

	bool stalled = false;

public:
	explicit FakeDecoderStream(const FakeTrack &_track) noexcept
		:track(_track), corrupt_left(track.corrupt_count) {}

	AudioFormat GetAudioFormat() const noexcept override {
		return track.format;
	}

	SignedSongTime GetDuration() const noexcept override {
		if (!track.known_duration)
			return SignedSongTime::Negative();

		return SignedSongTime::FromFrames(track.n_frames,
							   track.format.sample_rate);
	}

	bool IsSeekable() const noexcept override {
		return track.seekable;
	}

	std::size_t Read(std::span<float> dest) override {
		if (corrupt_left > 0 && position >= track.corrupt_at) {
			--corrupt_left;
			throw DecodeError::CorruptFrame("Scripted corruption");
		}

		if (!stalled && position >= track.stall_at) {
			stalled = true;
			std::this_thread::sleep_for(track.stall);
		}

		const unsigned channels = track.format.channels;
		uint64_t n = std::min<uint64_t>(dest.size() / channels,
						track.n_frames - position);

		/* stop right before the scripted events so they
		   happen at the exact frame */
		if (corrupt_left > 0 && position < track.corrupt_at)
			n = std::min(n, track.corrupt_at - position);
		if (!stalled && position < track.stall_at)
			n = std::min(n, track.stall_at - position);

		for (uint64_t i = 0; i < n; ++i)
			std::fill_n(dest.begin() + i * channels, channels,
				    FakeFrameValue(track.key, position + i));

		position += n;
		return n;
	}

	void Seek(uint64_t frame) override {
		if (!track.seekable)
			throw SeekError::Unseekable();

		if (frame > track.n_frames)
			throw SeekError::OutOfRange();

		position = frame;
	}
};

static std::unique_ptr<DecoderStream>
fake_open_file(const char *path)
{
	const std::scoped_lock protect(fake_mutex);
	const auto i = fake_tracks.find(std::string_view{path});
	if (i == fake_tracks.end())
		return nullptr;

	++i->second.open_count;
	return std::make_unique<FakeDecoderStream>(i->second.track);
}

static const char *const fake_suffixes[] = {
	"fake",
};

constexpr DecoderPlugin fake_decoder_plugin = {
	.name = "fake",
	.open_file = fake_open_file,
	.suffixes = fake_suffixes,
};
