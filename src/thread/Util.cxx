// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Util.hxx"
#include "system/Error.hxx"

#include <pthread.h>
#include <sched.h>

static constexpr int REALTIME_PRIORITY = 40;

void
SetThreadRealtime()
{
	sched_param param{};
	param.sched_priority = REALTIME_PRIORITY;

	const int e = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
	if (e != 0)
		throw MakeErrno(e, "Failed to enable realtime scheduling");
}
