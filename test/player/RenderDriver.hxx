// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_TEST_RENDER_DRIVER_HXX
#define LILT_TEST_RENDER_DRIVER_HXX

#include "player/Control.hxx"
#include "output/RenderCallback.hxx"

#include <chrono>
#include <thread>
#include <vector>

/**
 * Plays the role of the output device: calls the render callback
 * from the test thread, a little faster than real time, and keeps
 * everything it got.
 */
class RenderDriver {
	PlayerControl &pc;
	const unsigned channels;

	std::vector<float> block;

	/**
	 * All rendered frames (the first channel only).
	 */
	std::vector<float> output;

	/**
	 * The snapshot after each Step().
	 */
	std::vector<PlayerSnapshot> snapshots;

public:
	static constexpr std::size_t DEFAULT_BLOCK_FRAMES = 160;

	explicit RenderDriver(PlayerControl &_pc,
			      std::size_t block_frames=DEFAULT_BLOCK_FRAMES)
		:pc(_pc), channels(pc.GetOutputFormat().channels),
		 block(block_frames * channels) {}

	const std::vector<float> &GetOutput() const noexcept {
		return output;
	}

	const std::vector<PlayerSnapshot> &GetSnapshots() const noexcept {
		return snapshots;
	}

	void Clear() noexcept {
		output.clear();
		snapshots.clear();
	}

	/**
	 * Render one block without waiting.
	 */
	PlayerSnapshot Render() {
		pc.GetRenderCallback().Render(block);

		for (std::size_t i = 0; i < block.size(); i += channels)
			output.push_back(block[i]);

		const auto snapshot = pc.GetSnapshot();
		snapshots.push_back(snapshot);
		return snapshot;
	}

	/**
	 * Render one block and give the decoder thread some time.
	 */
	PlayerSnapshot Step() {
		const auto snapshot = Render();
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
		return snapshot;
	}

	void Step(unsigned n) {
		for (unsigned i = 0; i < n; ++i)
			Step();
	}

	/**
	 * Render until the predicate is true.
	 *
	 * @return false on timeout
	 */
	template<typename P>
	bool RunUntil(P &&predicate,
		      std::chrono::steady_clock::duration timeout=std::chrono::seconds(20)) {
		const auto deadline = std::chrono::steady_clock::now() + timeout;
		while (std::chrono::steady_clock::now() < deadline)
			if (predicate(Step()))
				return true;
		return false;
	}

	bool RunUntilStopped() {
		return RunUntil([](const PlayerSnapshot &s){
			return s.state == PlayerState::STOP;
		});
	}
};

#endif
