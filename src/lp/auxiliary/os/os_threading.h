// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Thin pthread wrappers used by the worker pool and the render thread.
 *
 * @ingroup aux_os
 */

#pragma once

#include "lp/lp_compiler.h"
#include "lp/lp_config_os.h"

#include <pthread.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * @addtogroup aux_os
 * @{
 */

/*
 *
 * Mutex and condition variable.
 *
 */

struct os_mutex
{
	pthread_mutex_t mutex;
};

static inline int
os_mutex_init(struct os_mutex *om)
{
	return pthread_mutex_init(&om->mutex, NULL);
}

static inline void
os_mutex_lock(struct os_mutex *om)
{
	pthread_mutex_lock(&om->mutex);
}

static inline void
os_mutex_unlock(struct os_mutex *om)
{
	pthread_mutex_unlock(&om->mutex);
}

static inline void
os_mutex_destroy(struct os_mutex *om)
{
	pthread_mutex_destroy(&om->mutex);
}

struct os_cond
{
	pthread_cond_t cond;
};

static inline int
os_cond_init(struct os_cond *oc)
{
	return pthread_cond_init(&oc->cond, NULL);
}

static inline void
os_cond_signal(struct os_cond *oc)
{
	pthread_cond_signal(&oc->cond);
}

static inline void
os_cond_broadcast(struct os_cond *oc)
{
	pthread_cond_broadcast(&oc->cond);
}

/*!
 * Wait on @p oc with @p om locked, spurious wakeups happen so always wait in
 * a loop over the real condition.
 */
static inline void
os_cond_wait(struct os_cond *oc, struct os_mutex *om)
{
	pthread_cond_wait(&oc->cond, &om->mutex);
}

static inline void
os_cond_destroy(struct os_cond *oc)
{
	pthread_cond_destroy(&oc->cond);
}


/*
 *
 * Thread.
 *
 */

struct os_thread
{
	pthread_t thread;
};

typedef void *(*os_run_func_t)(void *);

static inline int
os_thread_start(struct os_thread *ost, os_run_func_t func, void *ptr)
{
	return pthread_create(&ost->thread, NULL, func, ptr);
}

static inline void
os_thread_join(struct os_thread *ost)
{
	pthread_join(ost->thread, NULL);
}

//! Best effort, names are cut to 15 characters on Linux.
static inline void
os_thread_name(struct os_thread *ost, const char *name)
{
#ifdef LP_OS_LINUX
	pthread_setname_np(ost->thread, name);
#else
	(void)ost;
	(void)name;
#endif
}


/*
 *
 * Thread helper.
 *
 */

/*!
 * One thread plus the lock and condition that drive its loop. The thread
 * function runs while @ref os_thread_helper_is_running_locked is true and
 * sleeps in @ref os_thread_helper_wait_locked when it has nothing to do.
 *
 * Used by the render scheduler.
 */
struct os_thread_helper
{
	struct os_thread thread;
	struct os_mutex mutex;
	struct os_cond cond;

	bool running;
};

static inline int
os_thread_helper_init(struct os_thread_helper *oth)
{
	oth->running = false;

	int ret = os_mutex_init(&oth->mutex);
	if (ret != 0) {
		return ret;
	}

	ret = os_cond_init(&oth->cond);
	if (ret != 0) {
		os_mutex_destroy(&oth->mutex);
		return ret;
	}

	return 0;
}

/*!
 * Start the thread, fails if it is already running.
 */
static inline int
os_thread_helper_start(struct os_thread_helper *oth, os_run_func_t func, void *ptr)
{
	os_mutex_lock(&oth->mutex);

	if (oth->running) {
		os_mutex_unlock(&oth->mutex);
		return -1;
	}

	int ret = os_thread_start(&oth->thread, func, ptr);
	if (ret == 0) {
		oth->running = true;
	}

	os_mutex_unlock(&oth->mutex);

	return ret;
}

/*!
 * Ask the thread to stop, join it and free the lock and condition. Call
 * unlocked, works on a helper whose thread never started.
 */
static inline void
os_thread_helper_destroy(struct os_thread_helper *oth)
{
	os_mutex_lock(&oth->mutex);
	bool was_running = oth->running;
	oth->running = false;
	os_cond_broadcast(&oth->cond);
	os_mutex_unlock(&oth->mutex);

	if (was_running) {
		os_thread_join(&oth->thread);
	}

	os_cond_destroy(&oth->cond);
	os_mutex_destroy(&oth->mutex);
}

static inline void
os_thread_helper_lock(struct os_thread_helper *oth)
{
	os_mutex_lock(&oth->mutex);
}

static inline void
os_thread_helper_unlock(struct os_thread_helper *oth)
{
	os_mutex_unlock(&oth->mutex);
}

//! Must be called locked.
static inline bool
os_thread_helper_is_running_locked(struct os_thread_helper *oth)
{
	return oth->running;
}

//! Must be called locked, and in a loop.
static inline void
os_thread_helper_wait_locked(struct os_thread_helper *oth)
{
	os_cond_wait(&oth->cond, &oth->mutex);
}

//! Must be called locked.
static inline void
os_thread_helper_broadcast_locked(struct os_thread_helper *oth)
{
	os_cond_broadcast(&oth->cond);
}

static inline void
os_thread_helper_name(struct os_thread_helper *oth, const char *name)
{
	os_thread_name(&oth->thread, name);
}

/*!
 * @}
 */


#ifdef __cplusplus
} // extern "C"
#endif
