// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_THREAD_NAME_HXX
#define LILT_THREAD_NAME_HXX

#include <pthread.h>

/**
 * Name the current thread for debuggers and "top -H".  Linux
 * truncates the name to 15 characters.
 */
static inline void
SetThreadName(const char *name) noexcept
{
	pthread_setname_np(pthread_self(), name);
}

#endif
