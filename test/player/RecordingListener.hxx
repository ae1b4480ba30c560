// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_TEST_RECORDING_LISTENER_HXX
#define LILT_TEST_RECORDING_LISTENER_HXX

#include "player/Listener.hxx"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

/**
 * A #PlayerListener which records all events, for inspection by
 * the test thread.
 */
class RecordingListener final : public PlayerListener {
public:
	struct Event {
		enum class Type {
			STATE,
			STARTED,
			ENDED,
			ERROR,
			RECOVERED,
			SEEK_ERROR,
		} type;

		PlayerState state;
		uint64_t track_id;
		std::exception_ptr error;
	};

private:
	mutable std::mutex mutex;
	std::vector<Event> events;

public:
	std::vector<Event> GetEvents() const {
		const std::scoped_lock protect(mutex);
		return events;
	}

	/**
	 * Returns the track ids of all events of the given type.
	 */
	std::vector<uint64_t> GetTracks(Event::Type type) const {
		const std::scoped_lock protect(mutex);
		std::vector<uint64_t> result;
		for (const auto &i : events)
			if (i.type == type)
				result.push_back(i.track_id);
		return result;
	}

	/**
	 * Returns a compact description of the track events, e.g.
	 * "S1 E1 S2 E2".
	 */
	std::string GetTrackLog() const {
		const std::scoped_lock protect(mutex);
		std::string result;
		for (const auto &i : events) {
			char prefix;
			switch (i.type) {
			case Event::Type::STARTED:
				prefix = 'S';
				break;

			case Event::Type::ENDED:
				prefix = 'E';
				break;

			case Event::Type::ERROR:
				prefix = 'X';
				break;

			default:
				continue;
			}

			if (!result.empty())
				result.push_back(' ');
			result.push_back(prefix);
			result += std::to_string(i.track_id);
		}

		return result;
	}

	std::exception_ptr GetLastError(Event::Type type) const {
		const std::scoped_lock protect(mutex);
		for (auto i = events.rbegin(); i != events.rend(); ++i)
			if (i->type == type)
				return i->error;
		return {};
	}

	std::size_t Count(Event::Type type) const {
		const std::scoped_lock protect(mutex);
		return std::count_if(events.begin(), events.end(),
				     [type](const Event &e){
					     return e.type == type;
				     });
	}

	/* virtual methods from class PlayerListener */
	void OnPlayerStateChanged(PlayerState state) noexcept override {
		Add({Event::Type::STATE, state, 0, {}});
	}

	void OnTrackStarted(uint64_t track_id) noexcept override {
		Add({Event::Type::STARTED, {}, track_id, {}});
	}

	void OnTrackEnded(uint64_t track_id) noexcept override {
		Add({Event::Type::ENDED, {}, track_id, {}});
	}

	void OnTrackError(uint64_t track_id,
			  std::exception_ptr error) noexcept override {
		Add({Event::Type::ERROR, {}, track_id, std::move(error)});
	}

	void OnRecoveredDecodeError(uint64_t track_id,
				    std::exception_ptr error) noexcept override {
		Add({Event::Type::RECOVERED, {}, track_id, std::move(error)});
	}

	void OnSeekError(uint64_t track_id,
			 std::exception_ptr error) noexcept override {
		Add({Event::Type::SEEK_ERROR, {}, track_id, std::move(error)});
	}

private:
	void Add(Event &&event) noexcept {
		const std::scoped_lock protect(mutex);
		events.push_back(std::move(event));
	}
};

#endif
