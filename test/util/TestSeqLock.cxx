// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "util/SeqLock.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

TEST(SeqLock, Basic)
{
	SeqLock<2> s;

	EXPECT_EQ(s.Load()[0], 0U);
	EXPECT_EQ(s.Load()[1], 0U);

	s.Store({42, 7});
	EXPECT_EQ(s.Load()[0], 42U);
	EXPECT_EQ(s.Load()[1], 7U);
}

/**
 * The writer always stores two equal values; a reader must never
 * see a mix of two stores.
 */
TEST(SeqLock, NoTornReads)
{
	SeqLock<3> s;
	std::atomic_bool done{false};

	std::thread writer([&]{
		for (uint64_t i = 1; i <= 200000; ++i)
			s.Store({i, i, i * 2});
		done = true;
	});

	uint64_t last = 0;
	while (!done) {
		const auto v = s.Load();
		ASSERT_EQ(v[0], v[1]);
		ASSERT_EQ(v[2], v[0] * 2);
		ASSERT_GE(v[0], last);
		last = v[0];
	}

	writer.join();
	EXPECT_EQ(s.Load()[0], 200000U);
}
