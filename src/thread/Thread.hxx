// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_THREAD_HXX
#define LILT_THREAD_HXX

#include "util/BindMethod.hxx"

#include <cassert>

#include <pthread.h>

/**
 * A joinable POSIX thread running a bound method.  Join() must be
 * called before the object is destroyed.
 */
class Thread {
	const BoundMethod f;

	pthread_t handle{};
	bool defined = false;

#ifndef NDEBUG
	/**
	 * Assigned by the new thread itself; #handle may still be
	 * unset when it starts running.
	 */
	pthread_t inside_handle{};
#endif

public:
	explicit Thread(BoundMethod _f) noexcept:f(_f) {}

	Thread(const Thread &) = delete;
	Thread &operator=(const Thread &) = delete;

	~Thread() noexcept {
		assert(!defined);
	}

	bool IsDefined() const noexcept {
		return defined;
	}

#ifndef NDEBUG
	[[gnu::pure]]
	bool IsInside() const noexcept {
		return pthread_equal(pthread_self(), inside_handle);
	}
#endif

	/**
	 * Throws std::system_error on error.
	 */
	void Start();

	void Join() noexcept;

private:
	static void *Run(void *ctx) noexcept;
};

#endif
