// Copyright 2022-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Thread pool tests.
 */

#include <util/u_worker.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>

using namespace std::chrono_literals;


using namespace lp::auxiliary::util;

static std::vector<TaskCollection::Functor>
counting_tasks(std::atomic<int> *hits, size_t count)
{
	std::vector<TaskCollection::Functor> funcs;
	for (size_t i = 0; i < count; i++) {
		funcs.push_back([hits, i] { hits[i]++; });
	}
	return funcs;
}

TEST_CASE("TaskCollection")
{
	SharedThreadPool pool{2, 3, "Test"};
	SharedThreadGroup first{pool};
	SharedThreadGroup second{pool};

	std::atomic<int> a[4] = {};
	std::atomic<int> b[4] = {};

	TaskCollection tasks_a{first, counting_tasks(a, 4)};

	SECTION("Every task runs exactly once")
	{
		tasks_a.waitAll();
		for (auto &hit : a) {
			CHECK(hit.load() == 1);
		}

		// Waiting again is a no-op.
		tasks_a.waitAll();
		CHECK(a[0].load() == 1);
	}

	SECTION("Groups on one pool wait independently")
	{
		{
			TaskCollection tasks_b{second,
			                       {
			                           [&] {
				                           std::this_thread::sleep_for(50ms);
				                           b[0]++;
			                           },
			                           [&] {
				                           std::this_thread::sleep_for(50ms);
				                           b[1]++;
			                           },
			                       }};
		}

		// The destructor waited for the second group only.
		CHECK(b[0].load() == 1);
		CHECK(b[1].load() == 1);
		CHECK(b[2].load() == 0);

		tasks_a.waitAll();
		for (auto &hit : a) {
			CHECK(hit.load() == 1);
		}
	}
}

TEST_CASE("TaskCollection on a pool without threads")
{
	// All the work happens in waitAll on this thread.
	SharedThreadPool pool{0, 0, "Empty"};
	SharedThreadGroup group{pool};

	std::atomic<int> hits[TaskCollection::kSize] = {};
	TaskCollection tasks{group, counting_tasks(hits, TaskCollection::kSize)};
	tasks.waitAll();

	for (auto &hit : hits) {
		CHECK(hit.load() == 1);
	}
}

TEST_CASE("TaskCollection reuse of a group")
{
	SharedThreadPool pool{1, 1, "Small"};
	SharedThreadGroup group{pool};

	std::atomic<int> hits[TaskCollection::kSize] = {};
	for (int round = 0; round < 4; round++) {
		TaskCollection tasks{group, counting_tasks(hits, TaskCollection::kSize)};
	}

	for (auto &hit : hits) {
		CHECK(hit.load() == 4);
	}
}

TEST_CASE("TaskCollection refuses too many tasks")
{
	SharedThreadPool pool{1, 1, "Small"};
	SharedThreadGroup group{pool};

	std::atomic<int> hits[TaskCollection::kSize + 1] = {};
	CHECK_THROWS_AS(TaskCollection(group, counting_tasks(hits, TaskCollection::kSize + 1)), std::invalid_argument);

	for (auto &hit : hits) {
		CHECK(hit.load() == 0);
	}
}
