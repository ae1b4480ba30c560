// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_THREAD_MUTEX_HXX
#define LILT_THREAD_MUTEX_HXX

#include <mutex>

using Mutex = std::mutex;

/**
 * The reverse of std::scoped_lock: releases a locked #Mutex for its
 * own lifetime, e.g. around a blocking call.
 */
class ScopeUnlock {
	Mutex &mutex;

public:
	explicit ScopeUnlock(Mutex &_mutex) noexcept
		:mutex(_mutex)
	{
		mutex.unlock();
	}

	~ScopeUnlock() noexcept {
		mutex.lock();
	}

	ScopeUnlock(const ScopeUnlock &) = delete;
	ScopeUnlock &operator=(const ScopeUnlock &) = delete;
};

#endif
