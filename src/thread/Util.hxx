// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_THREAD_UTIL_HXX
#define LILT_THREAD_UTIL_HXX

/**
 * Switch the current thread to the SCHED_FIFO policy, so that
 * rendering is not delayed by ordinary processes.  This usually
 * requires CAP_SYS_NICE or an "rtprio" limit.
 *
 * Throws std::system_error on error.
 */
void
SetThreadRealtime();

#endif
