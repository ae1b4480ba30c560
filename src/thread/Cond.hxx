// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_THREAD_COND_HXX
#define LILT_THREAD_COND_HXX

#include <condition_variable>

/**
 * Always used together with a #Mutex.
 */
using Cond = std::condition_variable;

#endif
