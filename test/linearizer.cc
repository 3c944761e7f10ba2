// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <gtest/gtest.h>
#include <devsync/devsync.h>

using namespace devsync;

namespace
{
	using linearizer = ctx::linearizer<std::string>;
}

TEST(linearizer, acquire_and_release)
{
	linearizer l;
	{
		const auto lock
		{
			l.acquire("@a:remote.test")
		};

		EXPECT_TRUE(bool(lock));
		EXPECT_EQ(lock.id(), "@a:remote.test");
		EXPECT_TRUE(l.locked("@a:remote.test"));
		EXPECT_EQ(l.size(), 1UL);
		EXPECT_EQ(l.waiting("@a:remote.test"), 0UL);
	}

	EXPECT_FALSE(l.locked("@a:remote.test"));
	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, unlock_is_idempotent)
{
	linearizer l;
	auto lock
	{
		l.acquire("k")
	};

	lock.unlock();
	EXPECT_FALSE(bool(lock));
	EXPECT_FALSE(l.locked("k"));
	lock.unlock();
	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, moved_lock_keeps_the_slot)
{
	linearizer l;
	linearizer::lock outer;
	{
		auto inner
		{
			l.acquire("k")
		};

		outer = std::move(inner);
		EXPECT_FALSE(bool(inner));
	}

	EXPECT_TRUE(l.locked("k"));
	outer.unlock();
	EXPECT_FALSE(l.locked("k"));
}

TEST(linearizer, released_when_unwinding)
{
	linearizer l;
	const auto fail_while_holding{[&l]
	{
		const auto lock
		{
			l.acquire("k")
		};

		throw std::runtime_error("failed while holding");
	}};

	EXPECT_THROW(fail_while_holding(), std::runtime_error);
	EXPECT_FALSE(l.locked("k"));
	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, same_key_runs_in_arrival_order)
{
	static const size_t waiters {8};

	linearizer l;
	std::mutex mutex;
	std::vector<size_t> order;
	std::vector<std::thread> threads;

	auto first
	{
		l.acquire("k")
	};

	for(size_t i(0); i < waiters; ++i)
	{
		threads.emplace_back([&l, &mutex, &order, i]
		{
			const auto lock
			{
				l.acquire("k")
			};

			const std::lock_guard<std::mutex> lg{mutex};
			order.emplace_back(i);
		});

		// The next thread starts only once this one is queued so the arrival
		// order is known.
		while(l.waiting("k") < i + 1)
			std::this_thread::yield();
	}

	first.unlock();
	for(auto &thread : threads)
		thread.join();

	ASSERT_EQ(order.size(), waiters);
	for(size_t i(0); i < waiters; ++i)
		EXPECT_EQ(order[i], i);

	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, same_key_never_overlaps)
{
	linearizer l;
	std::atomic<int> inside {0};
	std::atomic<int> overlaps {0};
	std::vector<std::thread> threads;
	for(size_t i(0); i < 8; ++i)
		threads.emplace_back([&]
		{
			for(size_t j(0); j < 100; ++j)
			{
				const auto lock
				{
					l.acquire("k")
				};

				if(inside.fetch_add(1) != 0)
					++overlaps;

				std::this_thread::yield();
				inside.fetch_sub(1);
			}
		});

	for(auto &thread : threads)
		thread.join();

	EXPECT_EQ(overlaps.load(), 0);
	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, distinct_keys_are_independent)
{
	linearizer l;
	const auto a
	{
		l.acquire("@a:remote.test")
	};

	std::atomic<bool> acquired {false};
	std::thread other([&l, &acquired]
	{
		const auto b
		{
			l.acquire("@b:remote.test")
		};

		acquired = true;
	});

	other.join();
	EXPECT_TRUE(acquired);
	EXPECT_TRUE(l.locked("@a:remote.test"));
	EXPECT_FALSE(l.locked("@b:remote.test"));
}

TEST(linearizer, reserved_in_line_before_waiting)
{
	linearizer l;
	auto first(l.reserve("k"));
	auto second(l.reserve("k"));
	auto third(l.reserve("k"));
	EXPECT_TRUE(first.pending());
	EXPECT_FALSE(bool(first));
	EXPECT_EQ(l.waiting("k"), 2UL);

	std::mutex mutex;
	std::vector<int> order;
	const auto take{[&mutex, &order](linearizer::lock &lock, const int &n)
	{
		lock.wait();
		const std::lock_guard<std::mutex> lg{mutex};
		order.emplace_back(n);
		lock.unlock();
	}};

	// The later tickets start waiting first; they are still served in the
	// order they were reserved.
	std::thread t3(take, std::ref(third), 3);
	std::thread t2(take, std::ref(second), 2);
	std::this_thread::sleep_for(milliseconds(20));
	EXPECT_TRUE(order.empty());

	first.wait();
	EXPECT_TRUE(bool(first));
	first.unlock();
	t2.join();
	t3.join();

	EXPECT_EQ(order, (std::vector<int>{2, 3}));
	EXPECT_EQ(l.size(), 0UL);
}

TEST(linearizer, abandoned_reservation_passes_its_turn)
{
	linearizer l;
	auto held(l.acquire("k"));
	std::optional<linearizer::lock> abandoned{l.reserve("k")};
	auto next(l.reserve("k"));

	std::thread dropper([&abandoned]
	{
		abandoned.reset();
	});

	held.unlock();
	dropper.join();
	next.wait();
	EXPECT_TRUE(bool(next));
	next.unlock();
	EXPECT_EQ(l.size(), 0UL);
}
