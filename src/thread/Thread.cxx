// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Thread.hxx"
#include "system/Error.hxx"

void
Thread::Start()
{
	assert(!defined);

	const int e = pthread_create(&handle, nullptr, Run, this);
	if (e != 0)
		throw MakeErrno(e, "Failed to create thread");

	defined = true;
}

void
Thread::Join() noexcept
{
	assert(defined);
	assert(!IsInside());

	pthread_join(handle, nullptr);
	defined = false;
}

void *
Thread::Run(void *ctx) noexcept
{
	auto &thread = *static_cast<Thread *>(ctx);

#ifndef NDEBUG
	thread.inside_handle = pthread_self();
#endif

	thread.f();
	return nullptr;
}
