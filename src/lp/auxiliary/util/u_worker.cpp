// Copyright 2022-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Worker and threading pool, with the C++ wrapper callback.
 *
 * @ingroup aux_util
 */

#include "os/os_threading.h"

#include "util/u_misc.h"
#include "util/u_logging.h"
#include "util/u_worker.h"
#include "util/u_worker.hpp"

#include <stdio.h>
#include <assert.h>


#define MAX_TASK_COUNT (64)
#define MAX_THREAD_COUNT (16)

struct group;
struct pool;

struct task
{
	//! Group this task was submitted from.
	struct group *g;

	//! Function.
	u_worker_group_func_t func;

	//! Function data.
	void *data;
};

struct thread
{
	//! Pool this thread belongs to.
	struct pool *p;

	//! Native thread.
	struct os_thread thread;

	//! Thread name.
	char name[64];
};

struct pool
{
	struct u_worker_thread_pool base;

	//! Big contenious mutex.
	struct os_mutex mutex;

	//! Signalled when tasks are pushed or a slot is freed.
	struct os_cond available_cond;

	//! Array of tasks, kept in submission order.
	struct task tasks[MAX_TASK_COUNT];

	//! Number of tasks in array.
	size_t tasks_in_array_count;

	//! Number of threads allowed to work at the same time, grows when threads wait on a group.
	uint32_t worker_limit;

	//! Number of threads currently running a task.
	uint32_t working_count;

	//! Total number of threads.
	uint32_t thread_count;

	//! The threads.
	struct thread threads[MAX_THREAD_COUNT];

	//! Is the pool up and running?
	bool running;
};

struct group
{
	//! Base struct has to come first.
	struct u_worker_group base;

	//! Pointer to poll of threads.
	struct u_worker_thread_pool *uwtp;

	//! Number of tasks that are pending or being worked on in this group.
	size_t released_count;

	//! Signalled when released_count reaches zero.
	struct os_cond waiting_cond;
};


/*
 *
 * Helper functions.
 *
 */

static inline struct group *
group(struct u_worker_group *uwg)
{
	return (struct group *)uwg;
}

static inline struct pool *
pool(struct u_worker_thread_pool *uwtp)
{
	return (struct pool *)uwtp;
}

static bool
locked_pool_push_task(struct pool *p, struct group *g, u_worker_group_func_t func, void *data)
{
	if (p->tasks_in_array_count >= MAX_TASK_COUNT) {
		return false;
	}

	size_t i = p->tasks_in_array_count++;
	p->tasks[i].g = g;
	p->tasks[i].func = func;
	p->tasks[i].data = data;

	return true;
}

/*!
 * Takes the oldest task, from any group if @p only_g is NULL.
 */
static bool
locked_pool_pop_task(struct pool *p, struct group *only_g, struct task *out_task)
{
	for (size_t i = 0; i < p->tasks_in_array_count; i++) {
		if (only_g != NULL && p->tasks[i].g != only_g) {
			continue;
		}

		*out_task = p->tasks[i];

		// Keep submission order.
		for (size_t k = i + 1; k < p->tasks_in_array_count; k++) {
			p->tasks[k - 1] = p->tasks[k];
		}
		p->tasks_in_array_count--;
		U_ZERO(&p->tasks[p->tasks_in_array_count]);

		return true;
	}

	return false;
}

static void
locked_group_task_done(struct group *g)
{
	assert(g->released_count > 0);
	g->released_count--;

	if (g->released_count == 0) {
		os_cond_broadcast(&g->waiting_cond);
	}
}

static void *
run_func(void *ptr)
{
	struct thread *t = (struct thread *)ptr;
	struct pool *p = t->p;

	os_mutex_lock(&p->mutex);

	while (p->running) {
		struct task task = {};

		if (p->working_count >= p->worker_limit || !locked_pool_pop_task(p, NULL, &task)) {
			os_cond_wait(&p->available_cond, &p->mutex);
			continue;
		}

		p->working_count++;
		os_mutex_unlock(&p->mutex);

		task.func(task.data);

		os_mutex_lock(&p->mutex);
		p->working_count--;

		locked_group_task_done(task.g);

		// A slot is free again, let another thread pick up the next task.
		if (p->tasks_in_array_count > 0) {
			os_cond_signal(&p->available_cond);
		}
	}

	os_mutex_unlock(&p->mutex);

	return NULL;
}


/*
 *
 * 'Exported' thread pool functions.
 *
 */

extern "C" struct u_worker_thread_pool *
u_worker_thread_pool_create(uint32_t starting_worker_count, uint32_t thread_count, const char *prefix)
{
	if (thread_count > MAX_THREAD_COUNT) {
		U_LOG_W("Clamping thread count %u to %u", thread_count, MAX_THREAD_COUNT);
		thread_count = MAX_THREAD_COUNT;
	}

	if (starting_worker_count > thread_count) {
		starting_worker_count = thread_count;
	}

	struct pool *p = U_TYPED_CALLOC(struct pool);
	if (p == NULL) {
		return NULL;
	}

	p->base.reference.count = 1;
	p->worker_limit = starting_worker_count;
	p->thread_count = thread_count;
	p->running = true;

	int ret = os_mutex_init(&p->mutex);
	if (ret != 0) {
		goto err_alloc;
	}

	ret = os_cond_init(&p->available_cond);
	if (ret != 0) {
		goto err_mutex;
	}

	for (uint32_t i = 0; i < thread_count; i++) {
		struct thread *t = &p->threads[i];
		t->p = p;
		snprintf(t->name, sizeof(t->name), "%s: Worker", prefix != NULL ? prefix : "Pool");

		ret = os_thread_start(&t->thread, run_func, t);
		if (ret != 0) {
			U_LOG_E("Failed to start worker thread %u: %i", i, ret);
			p->thread_count = i;
			u_worker_thread_pool_destroy(&p->base);
			return NULL;
		}

		os_thread_name(&t->thread, t->name);
	}

	return &p->base;

err_mutex:
	os_mutex_destroy(&p->mutex);
err_alloc:
	free(p);

	return NULL;
}

extern "C" void
u_worker_thread_pool_destroy(struct u_worker_thread_pool *uwtp)
{
	struct pool *p = pool(uwtp);

	os_mutex_lock(&p->mutex);

	p->running = false;
	os_cond_broadcast(&p->available_cond);

	os_mutex_unlock(&p->mutex);

	// Wait for all threads.
	for (uint32_t i = 0; i < p->thread_count; i++) {
		os_thread_join(&p->threads[i].thread);
	}

	assert(p->tasks_in_array_count == 0);

	os_cond_destroy(&p->available_cond);
	os_mutex_destroy(&p->mutex);

	free(p);
}


/*
 *
 * 'Exported' group functions.
 *
 */

extern "C" struct u_worker_group *
u_worker_group_create(struct u_worker_thread_pool *uwtp)
{
	struct group *g = U_TYPED_CALLOC(struct group);
	if (g == NULL) {
		return NULL;
	}

	if (os_cond_init(&g->waiting_cond) != 0) {
		free(g);
		return NULL;
	}

	g->base.reference.count = 1;
	u_worker_thread_pool_reference(&g->uwtp, uwtp);

	return &g->base;
}

extern "C" void
u_worker_group_push(struct u_worker_group *uwg, u_worker_group_func_t f, void *data)
{
	struct group *g = group(uwg);
	struct pool *p = pool(g->uwtp);

	os_mutex_lock(&p->mutex);

	if (!locked_pool_push_task(p, g, f, data)) {
		os_mutex_unlock(&p->mutex);

		// The queue is full, do the work here instead.
		f(data);
		return;
	}

	g->released_count++;
	os_cond_signal(&p->available_cond);

	os_mutex_unlock(&p->mutex);
}

extern "C" void
u_worker_group_wait_all(struct u_worker_group *uwg)
{
	struct group *g = group(uwg);
	struct pool *p = pool(g->uwtp);

	os_mutex_lock(&p->mutex);

	while (g->released_count > 0) {
		struct task task = {};

		// Run our own tasks on this thread while they are still queued.
		if (locked_pool_pop_task(p, g, &task)) {
			os_mutex_unlock(&p->mutex);

			task.func(task.data);

			os_mutex_lock(&p->mutex);
			locked_group_task_done(g);
			continue;
		}

		// Only tasks already being worked on remain, donate our slot while sleeping.
		bool donated = p->worker_limit < p->thread_count;
		if (donated) {
			p->worker_limit++;
			os_cond_broadcast(&p->available_cond);
		}

		os_cond_wait(&g->waiting_cond, &p->mutex);

		if (donated) {
			p->worker_limit--;
		}
	}

	os_mutex_unlock(&p->mutex);
}

extern "C" void
u_worker_group_destroy(struct u_worker_group *uwg)
{
	struct group *g = group(uwg);
	assert(g->base.reference.count == 0);

	u_worker_group_wait_all(uwg);

	os_cond_destroy(&g->waiting_cond);
	u_worker_thread_pool_reference(&g->uwtp, NULL);

	free(g);
}


/*
 *
 * C++ wrapper.
 *
 */

void
lp::auxiliary::util::TaskCollection::cCallback(void *data_ptr)
{
	auto &f = *static_cast<Functor *>(data_ptr);
	f();
	f = nullptr;
}
