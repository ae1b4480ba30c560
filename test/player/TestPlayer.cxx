// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "FakeDecoderPlugin.hxx"
#include "TestFiles.hxx"
#include "RecordingListener.hxx"
#include "RenderDriver.hxx"
#include "player/Control.hxx"
#include "decoder/Error.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/plugins/WaveDecoderPlugin.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <span>
#include <stdexcept>
#include <vector>

using Event = RecordingListener::Event;

static constexpr unsigned RATE = 8000;
static constexpr std::size_t BLOCK = RenderDriver::DEFAULT_BLOCK_FRAMES;

static PlayerConfig
MakeConfig()
{
	PlayerConfig config;
	config.audio_format = AudioFormat(RATE, SampleFormat::FLOAT, 2);
	return config;
}

static FakeTrack
MakeFakeTrack(unsigned key, double seconds)
{
	FakeTrack t;
	t.key = key;
	t.n_frames = std::llround(seconds * RATE);
	return t;
}

/**
 * Remove the silence (before the start, after the end and from
 * underruns).
 */
static std::vector<float>
NonSilent(std::span<const float> src)
{
	std::vector<float> result;
	for (const float i : src)
		if (i != 0)
			result.push_back(i);
	return result;
}

static testing::AssertionResult
IsFrameSequence(std::span<const float> v, unsigned key, int64_t first)
{
	for (std::size_t i = 0; i < v.size(); ++i) {
		const auto index = FakeFrameIndex(key, v[i]);
		if (index != first + int64_t(i))
			return testing::AssertionFailure()
				<< "sample " << i << " is frame " << index
				<< " of track " << key
				<< ", expected " << first + int64_t(i);
	}

	return testing::AssertionSuccess();
}

template<typename E>
static const E *
FindError(std::exception_ptr ep) noexcept
{
	return ep ? FindNested<E>(ep) : nullptr;
}

class PlayerTest : public ::testing::Test {
protected:
	const DecoderPluginList plugins{
		&fake_decoder_plugin,
		&wave_decoder_plugin,
	};

	RecordingListener listener;

	std::unique_ptr<PlayerControl> pc;
	std::unique_ptr<RenderDriver> driver;

	PlayerTest() {
		Restart(MakeConfig());
	}

	~PlayerTest() override {
		driver.reset();
		pc.reset();
		ClearFakeTracks();
	}

	void Restart(const PlayerConfig &config) {
		driver.reset();
		pc.reset();
		pc = std::make_unique<PlayerControl>(listener, plugins, config);
		driver = std::make_unique<RenderDriver>(*pc);
	}

	static TrackDescriptor MakeTrack(uint64_t id, const FakeTrack &t) {
		return TrackDescriptor(id, AddFakeTrack("track", t));
	}

	std::vector<PlayerState> GetStates() const {
		std::vector<PlayerState> result;
		for (const auto &i : listener.GetEvents())
			if (i.type == Event::Type::STATE)
				result.push_back(i.state);
		return result;
	}
};

TEST_F(PlayerTest, Idle)
{
	const auto s = pc->GetSnapshot();
	EXPECT_EQ(s.state, PlayerState::STOP);
	EXPECT_EQ(s.track_id, 0U);
	EXPECT_EQ(s.position, 0U);
	EXPECT_EQ(s.underruns, 0U);

	/* rendering while stopped produces silence, and no
	   underruns */
	driver->Step(10);
	EXPECT_TRUE(NonSilent(driver->GetOutput()).empty());
	EXPECT_EQ(pc->GetSnapshot().underruns, 0U);

	/* commands without a decoder thread */
	pc->Pause();
	pc->Stop();
	pc->Skip();
	EXPECT_THROW(pc->Seek(FloatDuration(1)), SeekError);
}

TEST_F(PlayerTest, PlayToEnd)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 1)));

	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	const auto status = pc->GetStatus();
	EXPECT_EQ(status.total_time, SignedSongTime::FromMS(1000));
	EXPECT_EQ(status.input_format, AudioFormat(RATE, SampleFormat::FLOAT, 2));
	EXPECT_EQ(status.output_format, pc->GetOutputFormat());

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));

	/* the clock moves forward only */
	uint64_t last = 0;
	for (const auto &s : driver->GetSnapshots()) {
		if (s.track_id != 1)
			continue;

		EXPECT_GE(s.position, last);
		EXPECT_LE(s.position, 8000U);
		EXPECT_NEAR(s.elapsed.count(), double(s.position) / RATE, 1e-9);
		last = s.position;
	}
	EXPECT_EQ(last, 8000U);

	EXPECT_EQ(listener.GetTrackLog(), "S1 E1");
	EXPECT_EQ(GetStates(),
		  (std::vector<PlayerState>{
			  PlayerState::SEEK,
			  PlayerState::PLAY,
			  PlayerState::TRACK_ENDING,
			  PlayerState::STOP,
		  }));

	const auto s = driver->Render();
	EXPECT_EQ(s.track_id, 0U);
	EXPECT_EQ(s.position, 0U);
}

/**
 * A track which is decoded completely while prebuffering still
 * goes through PLAY.
 */
TEST_F(PlayerTest, ShortTrack)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 0.25)));
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 2000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));

	/* the padding after the last frame is not an underrun */
	EXPECT_EQ(pc->GetSnapshot().underruns, 0U);

	EXPECT_EQ(listener.GetTrackLog(), "S1 E1");
	EXPECT_EQ(GetStates(),
		  (std::vector<PlayerState>{
			  PlayerState::SEEK,
			  PlayerState::PLAY,
			  PlayerState::TRACK_ENDING,
			  PlayerState::STOP,
		  }));
}

TEST_F(PlayerTest, Gapless)
{
	const auto a = MakeTrack(1, MakeFakeTrack(1, 0.5));
	const auto b = MakeTrack(2, MakeFakeTrack(2, 0.5));

	pc->Enqueue(b);
	pc->Play(a);
	EXPECT_EQ(pc->GetSnapshot().next_track_id, 2U);

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	ASSERT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.first(4000), 1, 0));
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.subspan(4000), 2, 0));

	if (pc->GetSnapshot().underruns == 0) {
		/* no silence between the two tracks */
		const auto &output = driver->GetOutput();
		const auto first = std::find(output.begin(), output.end(),
					     frames.front());
		ASSERT_NE(first, output.end());
		EXPECT_TRUE(std::equal(frames.begin(), frames.end(), first));
	}

	EXPECT_EQ(listener.GetTrackLog(), "S1 E1 S2 E2");
}

TEST_F(PlayerTest, GaplessWave)
{
	std::vector<float> samples;
	for (uint64_t i = 0; i < 3000; ++i) {
		samples.push_back(FakeFrameValue(3, i));
		samples.push_back(FakeFrameValue(3, i));
	}

	const auto path = MakeTestPath("gapless.wav");
	WriteFloatWaveFile(path, RATE, 2, samples);

	/* a track which is enqueued after the first one has been
	   decoded completely */
	pc->Play(TrackDescriptor(1, path));
	driver->Step(2);
	pc->Enqueue(TrackDescriptor(2, path));

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	ASSERT_EQ(frames.size(), 6000U);
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.first(3000), 3, 0));
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.subspan(3000), 3, 0));
	EXPECT_EQ(listener.GetTrackLog(), "S1 E1 S2 E2");
}

TEST_F(PlayerTest, CrossFade)
{
	pc->SetCrossFade(FloatDuration(0.5));
	pc->SetCrossFadeCurve(CrossFadeCurve::LINEAR);
	EXPECT_DOUBLE_EQ(pc->GetCrossFade().duration.count(), 0.5);

	pc->Enqueue(MakeTrack(2, MakeFakeTrack(2, 2)));
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 2)));

	ASSERT_TRUE(driver->RunUntilStopped());

	/* the fade begins when at most 0.5s of the first track are
	   left; it overlaps the two tracks by that amount */
	const auto frames = NonSilent(driver->GetOutput());
	ASSERT_GT(frames.size(), 32000U - 4000U - 1);
	ASSERT_LT(frames.size(), 32000U - 4000U + BLOCK);

	const std::size_t fade = 32000 - frames.size();
	const std::size_t fade_start = 16000 - fade;

	EXPECT_TRUE(IsFrameSequence(std::span{frames}.first(fade_start), 1, 0));
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.subspan(fade_start + fade),
				    2, fade));

	/* halfway through, both tracks are at half gain */
	const std::size_t mid = fade / 2;
	const float expected = 0.5f * FakeFrameValue(1, fade_start + mid) +
		0.5f * FakeFrameValue(2, mid);
	EXPECT_NEAR(frames[fade_start + mid], expected, 1e-3);

	EXPECT_EQ(listener.GetTrackLog(), "S1 E1 S2 E2");
}

TEST_F(PlayerTest, CrossFadeShortTrack)
{
	/* tracks shorter than the cross-fade are played gapless */
	pc->SetCrossFade(FloatDuration(1));

	pc->Enqueue(MakeTrack(2, MakeFakeTrack(2, 0.5)));
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 0.5)));

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	ASSERT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.first(4000), 1, 0));
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.subspan(4000), 2, 0));
}

TEST_F(PlayerTest, CrossFadeSettings)
{
	EXPECT_THROW(pc->SetCrossFade(FloatDuration(11)), std::invalid_argument);
	EXPECT_THROW(pc->SetCrossFade(FloatDuration(-1)), std::invalid_argument);
	EXPECT_FALSE(pc->GetCrossFade().IsEnabled());

	pc->SetCrossFade(FloatDuration(10));
	EXPECT_TRUE(pc->GetCrossFade().IsEnabled());

	pc->SetCrossFade(FloatDuration(0));
	EXPECT_FALSE(pc->GetCrossFade().IsEnabled());
}

/**
 * Verify that the frames follow a loop: 0..loop_end-1, then
 * repeatedly loop_start..loop_end-1.
 *
 * @return the number of loop iterations
 */
static unsigned
CheckLoop(std::span<const float> frames, unsigned key,
	  int64_t loop_start, int64_t loop_end)
{
	unsigned wraps = 0;
	int64_t expected = 0;
	for (std::size_t i = 0; i < frames.size(); ++i) {
		if (expected == loop_end) {
			expected = loop_start;
			++wraps;
		}

		const auto index = FakeFrameIndex(key, frames[i]);
		if (index != expected) {
			ADD_FAILURE() << "sample " << i << " is frame " << index
				      << ", expected " << expected;
			break;
		}

		++expected;
	}

	return wraps;
}

TEST_F(PlayerTest, LoopPoints)
{
	auto track = MakeTrack(1, MakeFakeTrack(1, 3));
	track.loop_start = FloatDuration(1);
	track.loop_end = FloatDuration(2);
	pc->Play(track);

	unsigned wraps = 0;
	uint64_t last = 0;
	ASSERT_TRUE(driver->RunUntil([&](const PlayerSnapshot &s){
		if (s.track_id != 1)
			return false;

		if (s.position < last) {
			/* back to the loop start */
			EXPECT_GE(last, 16000U - BLOCK);
			EXPECT_LE(last, 16000U);
			EXPECT_GE(s.position, 8000U);
			EXPECT_LE(s.position, 8000U + BLOCK);
			++wraps;
		}

		last = s.position;
		return wraps >= 3;
	}));

	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);
	EXPECT_EQ(listener.GetTrackLog(), "S1");

	pc->Stop();

	EXPECT_GE(CheckLoop(NonSilent(driver->GetOutput()), 1, 8000, 16000), 3U);
}

TEST_F(PlayerTest, LoopTrack)
{
	pc->SetLoopMode(LoopMode::TRACK);
	EXPECT_EQ(pc->GetLoopMode(), LoopMode::TRACK);

	pc->Play(MakeTrack(1, MakeFakeTrack(1, 0.5)));

	unsigned wraps = 0;
	uint64_t last = 0;
	ASSERT_TRUE(driver->RunUntil([&](const PlayerSnapshot &s){
		if (s.track_id == 1) {
			if (s.position < last)
				++wraps;
			last = s.position;
		}

		return wraps >= 2;
	}));

	pc->Stop();

	EXPECT_GE(CheckLoop(NonSilent(driver->GetOutput()), 1, 0, 4000), 2U);
	EXPECT_EQ(listener.Count(Event::Type::ENDED), 0U);
}

TEST_F(PlayerTest, LoopDisabled)
{
	pc->SetLoopMode(LoopMode::NONE);

	auto track = MakeTrack(1, MakeFakeTrack(1, 1));
	track.loop_start = FloatDuration(0.25);
	track.loop_end = FloatDuration(0.5);
	pc->Play(track);

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));
}

TEST_F(PlayerTest, LoopUnseekable)
{
	auto t = MakeFakeTrack(1, 1.5);
	t.seekable = false;

	auto track = MakeTrack(1, t);
	track.loop_start = FloatDuration(0.5);
	track.loop_end = FloatDuration(1);
	pc->Play(track);

	unsigned wraps = 0;
	uint64_t last = 0;
	ASSERT_TRUE(driver->RunUntil([&](const PlayerSnapshot &s){
		if (s.track_id == 1) {
			if (s.position < last)
				++wraps;
			last = s.position;
		}

		return wraps >= 2;
	}));

	pc->Stop();

	EXPECT_GE(CheckLoop(NonSilent(driver->GetOutput()), 1, 4000, 8000), 2U);
	EXPECT_GE(GetFakeOpenCount(track.path), 3U);
}

TEST_F(PlayerTest, Seek)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 3)));
	driver->Step(10);

	pc->Seek(FloatDuration(2));
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	driver->Clear();
	const auto s = driver->Render();
	EXPECT_EQ(s.track_id, 1U);
	EXPECT_EQ(s.position, 16000U + BLOCK);
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()), 16000);

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 16000));

	EXPECT_EQ(listener.Count(Event::Type::SEEK_ERROR), 0U);
}

TEST_F(PlayerTest, SeekBackwards)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 2)));
	driver->Step(50);

	pc->Seek(FloatDuration(0.25));

	driver->Clear();
	driver->Render();
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()), 2000);
}

TEST_F(PlayerTest, SeekErrors)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 3)));
	driver->Step(5);

	const auto before = pc->GetSnapshot().position;

	try {
		pc->Seek(FloatDuration(5));
		FAIL();
	} catch (const SeekError &e) {
		EXPECT_EQ(e.GetCode(), SeekResult::OUT_OF_RANGE);
	}

	try {
		pc->Seek(FloatDuration(-1));
		FAIL();
	} catch (const SeekError &e) {
		EXPECT_EQ(e.GetCode(), SeekResult::OUT_OF_RANGE);
	}

	EXPECT_EQ(listener.GetTracks(Event::Type::SEEK_ERROR),
		  (std::vector<uint64_t>{1, 1}));
	EXPECT_NE(pc->GetTrackError(1), nullptr);

	/* playback continues where it was */
	driver->Clear();
	driver->Render();
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()), int64_t(before));

	/* no seeking after stop */
	pc->Stop();
	try {
		pc->Seek(FloatDuration(1));
		FAIL();
	} catch (const SeekError &e) {
		EXPECT_EQ(e.GetCode(), SeekResult::UNSEEKABLE);
	}
}

TEST_F(PlayerTest, SeekUnseekable)
{
	auto t = MakeFakeTrack(1, 2);
	t.seekable = false;
	pc->Play(MakeTrack(1, t));
	driver->Step(5);

	try {
		pc->Seek(FloatDuration(1));
		FAIL();
	} catch (const SeekError &e) {
		EXPECT_EQ(e.GetCode(), SeekResult::UNSEEKABLE);
	}

	const auto *e = FindError<SeekError>(listener.GetLastError(Event::Type::SEEK_ERROR));
	ASSERT_NE(e, nullptr);
	EXPECT_EQ(e->GetCode(), SeekResult::UNSEEKABLE);

	ASSERT_TRUE(driver->RunUntilStopped());
	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 16000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));
}

TEST_F(PlayerTest, Underrun)
{
	auto t = MakeFakeTrack(1, 2);
	t.stall_at = 6000;
	t.stall = std::chrono::milliseconds(400);
	pc->Play(MakeTrack(1, t));

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto s = pc->GetSnapshot();
	EXPECT_GT(s.underruns, 0U);
	EXPECT_EQ(pc->GetStatus().underruns, s.underruns);

	/* nothing was lost, only delayed */
	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 16000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));

	/* the clock stands still while the pipe is empty */
	const auto &snapshots = driver->GetSnapshots();
	bool stalled = false;
	for (std::size_t i = 1; i < snapshots.size(); ++i)
		if (snapshots[i].state == PlayerState::PLAY &&
		    snapshots[i - 1].state == PlayerState::PLAY &&
		    snapshots[i].position == snapshots[i - 1].position &&
		    snapshots[i].position == 6000)
			stalled = true;
	EXPECT_TRUE(stalled);
}

TEST_F(PlayerTest, Pause)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 2)));
	driver->Step(10);

	pc->Pause();
	const auto paused = pc->GetSnapshot();
	EXPECT_EQ(paused.state, PlayerState::PAUSE);

	driver->Clear();
	driver->Step(30);
	EXPECT_TRUE(NonSilent(driver->GetOutput()).empty());

	const auto s = pc->GetSnapshot();
	EXPECT_EQ(s.position, paused.position);
	EXPECT_EQ(s.underruns, paused.underruns);

	pc->Resume();
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	driver->Clear();
	driver->Render();
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()),
		  int64_t(paused.position));
}

TEST_F(PlayerTest, SeekWhilePaused)
{
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 3)));
	driver->Step(10);

	pc->Pause();
	pc->Seek(FloatDuration(1));
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PAUSE);
	EXPECT_EQ(listener.Count(Event::Type::SEEK_ERROR), 0U);

	driver->Clear();
	driver->Step(10);
	EXPECT_TRUE(NonSilent(driver->GetOutput()).empty());

	pc->Resume();
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	driver->Clear();
	driver->Render();
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()), 8000);

	ASSERT_TRUE(driver->RunUntilStopped());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 16000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 8000));
}

TEST_F(PlayerTest, Stop)
{
	pc->Enqueue(MakeTrack(2, MakeFakeTrack(2, 1)));
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 1)));
	driver->Step(5);

	pc->Stop();

	auto s = pc->GetSnapshot();
	EXPECT_EQ(s.state, PlayerState::STOP);
	EXPECT_EQ(s.next_track_id, 0U);

	driver->Clear();
	s = driver->Render();
	EXPECT_EQ(s.track_id, 0U);
	EXPECT_EQ(s.position, 0U);

	const auto underruns = s.underruns;
	driver->Step(20);
	EXPECT_TRUE(NonSilent(driver->GetOutput()).empty());
	EXPECT_EQ(pc->GetSnapshot().underruns, underruns);

	/* the queue is gone */
	EXPECT_EQ(listener.GetTrackLog(), "S1");

	/* and the player still works */
	pc->Play(MakeTrack(3, MakeFakeTrack(3, 0.25)));
	ASSERT_TRUE(driver->RunUntilStopped());
	EXPECT_EQ(listener.GetTrackLog(), "S1 S3 E3");
}

TEST_F(PlayerTest, Skip)
{
	pc->Enqueue(MakeTrack(2, MakeFakeTrack(2, 1)));
	pc->Play(MakeTrack(1, MakeFakeTrack(1, 1)));
	driver->Step(5);

	pc->Skip();

	driver->Clear();
	const auto s = driver->Render();
	EXPECT_EQ(s.track_id, 2U);
	EXPECT_EQ(FakeFrameIndex(2, driver->GetOutput().front()), 0);

	/* nothing left */
	pc->Skip();
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::STOP);
}

TEST_F(PlayerTest, Volume)
{
	EXPECT_EQ(pc->GetSnapshot().volume, 100U);

	pc->Play(MakeTrack(1, MakeFakeTrack(1, 2)));
	driver->Step(5);

	pc->SetVolume(50);
	EXPECT_EQ(pc->GetSnapshot().volume, 50U);

	const auto position = pc->GetSnapshot().position;
	driver->Clear();
	driver->Render();
	EXPECT_FLOAT_EQ(driver->GetOutput().front(),
			FakeFrameValue(1, position) * 0.25f);

	pc->SetMute(true);
	EXPECT_TRUE(pc->GetSnapshot().mute);

	driver->Clear();
	const auto s = driver->Render();
	EXPECT_TRUE(NonSilent(driver->GetOutput()).empty());
	EXPECT_EQ(s.position, position + 2 * BLOCK);

	pc->SetMute(false);
	pc->SetVolume(100);
	driver->Clear();
	driver->Render();
	EXPECT_EQ(FakeFrameIndex(1, driver->GetOutput().front()),
		  int64_t(position + 2 * BLOCK));

	EXPECT_THROW(pc->SetVolume(201), std::invalid_argument);
	EXPECT_EQ(pc->GetSnapshot().volume, 100U);
	pc->SetVolume(200);
}

TEST_F(PlayerTest, OpenErrors)
{
	const auto bogus = MakeTestPath("bogus.bogus");
	static constexpr std::array<std::byte, 4> garbage{};
	WriteTestFile(bogus, garbage);

	pc->Enqueue(TrackDescriptor(2, MakeTestPath("missing.fake")));
	pc->Enqueue(MakeTrack(3, MakeFakeTrack(3, 0.25)));
	pc->Play(TrackDescriptor(1, bogus));

	/* the first track which can be opened is played */
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::PLAY);

	ASSERT_TRUE(driver->RunUntilStopped());
	EXPECT_EQ(listener.GetTrackLog(), "X1 X2 S3 E3");

	const auto *e1 = FindError<OpenError>(pc->GetTrackError(1));
	ASSERT_NE(e1, nullptr);
	EXPECT_EQ(e1->GetCode(), OpenResult::UNSUPPORTED_FORMAT);

	const auto *e2 = FindError<OpenError>(pc->GetTrackError(2));
	ASSERT_NE(e2, nullptr);
	EXPECT_EQ(e2->GetCode(), OpenResult::NOT_FOUND);

	EXPECT_EQ(pc->GetTrackError(3), nullptr);

	const auto status = pc->GetStatus();
	EXPECT_EQ(status.error_generation, 2U);
	EXPECT_EQ(status.error_track_id, 2U);

	pc->ClearErrors();
	EXPECT_EQ(pc->GetTrackError(1), nullptr);
	EXPECT_EQ(pc->GetStatus().error, nullptr);
}

/**
 * The registry forgets the least recently reported errors, no
 * matter what their track ids are.
 */
TEST_F(PlayerTest, ErrorRegistryLimit)
{
	const auto missing = MakeTestPath("missing.fake");

	for (uint64_t id = 1000; id < 1000 + PlayerControl::MAX_ERRORS; ++id)
		pc->Enqueue(TrackDescriptor(id, missing));
	pc->Enqueue(TrackDescriptor(5, missing));

	pc->Play(TrackDescriptor(2000, missing));
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::STOP);

	const auto status = pc->GetStatus();
	EXPECT_EQ(status.error_generation, PlayerControl::MAX_ERRORS + 2);
	EXPECT_EQ(status.error_track_id, 5U);

	EXPECT_NE(pc->GetTrackError(5), nullptr);
	EXPECT_NE(pc->GetTrackError(1001), nullptr);
	EXPECT_NE(pc->GetTrackError(1000 + PlayerControl::MAX_ERRORS - 1), nullptr);
	EXPECT_EQ(pc->GetTrackError(2000), nullptr);
	EXPECT_EQ(pc->GetTrackError(1000), nullptr);
}

TEST_F(PlayerTest, NothingPlayable)
{
	pc->Play(TrackDescriptor(1, MakeTestPath("missing.fake")));
	EXPECT_EQ(pc->GetSnapshot().state, PlayerState::STOP);
	EXPECT_EQ(listener.GetTracks(Event::Type::ERROR),
		  (std::vector<uint64_t>{1}));
}

TEST_F(PlayerTest, RecoveredDecodeError)
{
	auto t = MakeFakeTrack(1, 1);
	t.corrupt_at = 6000;
	t.corrupt_count = 3;
	pc->Play(MakeTrack(1, t));

	ASSERT_TRUE(driver->RunUntilStopped());

	EXPECT_EQ(listener.GetTracks(Event::Type::RECOVERED),
		  (std::vector<uint64_t>{1}));
	EXPECT_EQ(listener.Count(Event::Type::ERROR), 0U);

	const auto *e = FindError<DecodeError>(listener.GetLastError(Event::Type::RECOVERED));
	ASSERT_NE(e, nullptr);
	EXPECT_TRUE(e->IsCorruptFrame());

	const auto frames = NonSilent(driver->GetOutput());
	EXPECT_EQ(frames.size(), 8000U);
	EXPECT_TRUE(IsFrameSequence(frames, 1, 0));
	EXPECT_EQ(listener.GetTrackLog(), "S1 E1");
}

TEST_F(PlayerTest, TooManyCorruptFrames)
{
	auto t = MakeFakeTrack(1, 1);
	t.corrupt_at = 6000;
	t.corrupt_count = 20;

	pc->Enqueue(MakeTrack(2, MakeFakeTrack(2, 0.5)));
	pc->Play(MakeTrack(1, t));

	ASSERT_TRUE(driver->RunUntilStopped());

	EXPECT_EQ(listener.GetTracks(Event::Type::ERROR),
		  (std::vector<uint64_t>{1}));
	EXPECT_EQ(listener.GetTracks(Event::Type::STARTED),
		  (std::vector<uint64_t>{1, 2}));
	EXPECT_EQ(listener.GetTracks(Event::Type::ENDED),
		  (std::vector<uint64_t>{1, 2}));

	const auto *e = FindError<DecodeError>(pc->GetTrackError(1));
	ASSERT_NE(e, nullptr);
	EXPECT_TRUE(e->IsCorruptFrame());

	/* the broken track is cut where the damage begins */
	const auto frames = NonSilent(driver->GetOutput());
	ASSERT_EQ(frames.size(), 10000U);
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.first(6000), 1, 0));
	EXPECT_TRUE(IsFrameSequence(std::span{frames}.subspan(6000), 2, 0));
}

TEST_F(PlayerTest, ConfiguredDefaults)
{
	auto config = MakeConfig();
	config.volume = 0;
	config.loop_mode = LoopMode::NONE;
	config.cross_fade.duration = FloatDuration(2);
	Restart(config);

	EXPECT_EQ(pc->GetSnapshot().volume, 0U);
	EXPECT_EQ(pc->GetLoopMode(), LoopMode::NONE);
	EXPECT_DOUBLE_EQ(pc->GetCrossFade().duration.count(), 2);
	EXPECT_EQ(pc->GetConfig().GetBufferFrames(), 4000U);
}
