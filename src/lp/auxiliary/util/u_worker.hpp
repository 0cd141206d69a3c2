// Copyright 2022-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  C++ owners for the worker pool, groups and one shot task batches.
 *
 * @ingroup aux_util
 */

#pragma once

#include "util/u_worker.h"

#include <new>
#include <vector>
#include <stdexcept>
#include <functional>


namespace lp::auxiliary::util {

class TaskCollection;
class SharedThreadGroup;

/*!
 * Counted reference to a @ref u_worker_thread_pool, copies share the pool.
 *
 * @ingroup aux_util
 */
class SharedThreadPool
{
public:
	/*!
	 * @copydoc u_worker_thread_pool_create
	 *
	 * @throws std::bad_alloc if the pool or its threads could not be created.
	 */
	SharedThreadPool(uint32_t starting_worker_count, uint32_t thread_count, const char *prefix)
	    : mPool(u_worker_thread_pool_create(starting_worker_count, thread_count, prefix))
	{
		if (mPool == nullptr) {
			throw std::bad_alloc();
		}
	}

	SharedThreadPool(SharedThreadPool const &other)
	{
		u_worker_thread_pool_reference(&mPool, other.mPool);
	}

	~SharedThreadPool()
	{
		u_worker_thread_pool_reference(&mPool, nullptr);
	}

	SharedThreadPool() = delete;
	SharedThreadPool(SharedThreadPool &&) = delete;
	SharedThreadPool &
	operator=(SharedThreadPool const &) = delete;
	SharedThreadPool &
	operator=(SharedThreadPool &&) = delete;


private:
	friend SharedThreadGroup;

	u_worker_thread_pool *mPool = nullptr;
};

/*!
 * A @ref u_worker_group on a shared pool, each render makes its own so that
 * waiting only covers that render's bands.
 *
 * @ingroup aux_util
 */
class SharedThreadGroup
{
public:
	/*!
	 * @throws std::bad_alloc if the group could not be created.
	 */
	explicit SharedThreadGroup(SharedThreadPool const &pool) : mGroup(u_worker_group_create(pool.mPool))
	{
		if (mGroup == nullptr) {
			throw std::bad_alloc();
		}
	}

	~SharedThreadGroup()
	{
		u_worker_group_reference(&mGroup, nullptr);
	}

	SharedThreadGroup() = delete;
	SharedThreadGroup(SharedThreadGroup const &) = delete;
	SharedThreadGroup(SharedThreadGroup &&) = delete;
	SharedThreadGroup &
	operator=(SharedThreadGroup const &) = delete;
	SharedThreadGroup &
	operator=(SharedThreadGroup &&) = delete;


private:
	friend TaskCollection;

	u_worker_group *mGroup = nullptr;
};

/*!
 * Pushes up to @ref kSize functors onto a group when constructed and waits
 * for all of them in @ref waitAll or the destructor, whichever comes first.
 * The functors are copied in, so they outlive the caller's vector.
 *
 * @ingroup aux_util
 */
class TaskCollection
{
public:
	typedef std::function<void()> Functor;

	static constexpr size_t kSize = 16;

	/*!
	 * @throws std::invalid_argument if given more than @ref kSize functors.
	 */
	TaskCollection(SharedThreadGroup const &group, std::vector<Functor> const &funcs)
	{
		if (funcs.size() > kSize) {
			throw std::invalid_argument("TaskCollection: too many functors");
		}

		u_worker_group_reference(&mGroup, group.mGroup);

		for (size_t i = 0; i < funcs.size(); i++) {
			mFunctors[i] = funcs[i];
			u_worker_group_push(mGroup, &cCallback, &mFunctors[i]);
		}
	}

	~TaskCollection()
	{
		waitAll();
	}

	//! Returns once every functor has run, the caller helps run them.
	void
	waitAll()
	{
		if (mGroup == nullptr) {
			return;
		}
		u_worker_group_wait_all(mGroup);
		u_worker_group_reference(&mGroup, nullptr);
	}

	TaskCollection(TaskCollection const &) = delete;
	TaskCollection(TaskCollection &&) = delete;
	TaskCollection &
	operator=(TaskCollection const &) = delete;
	TaskCollection &
	operator=(TaskCollection &&) = delete;


private:
	static void
	cCallback(void *data_ptr);

	Functor mFunctors[kSize] = {};
	u_worker_group *mGroup = nullptr;
};

} // namespace lp::auxiliary::util
