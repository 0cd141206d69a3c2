// Copyright 2022-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Fixed size thread pool with task groups.
 *
 * Tasks are pushed onto a group, the group shares the threads of its pool
 * with other groups. A thread waiting on a group runs that group's queued
 * tasks itself, and lends its slot to the pool while only running tasks
 * remain, so a pool with zero threads still makes progress.
 *
 * @ingroup aux_util
 */

#pragma once

#include "lp/lp_defines.h"


#ifdef __cplusplus
extern "C" {
#endif


struct u_worker_thread_pool
{
	struct lp_reference reference;
};

struct u_worker_group
{
	struct lp_reference reference;
};

typedef void (*u_worker_group_func_t)(void *);

/*!
 * @param starting_worker_count Threads allowed to run tasks at once before
 *                              any waiter lends its slot.
 * @param thread_count          Threads created, at most 16, may be zero.
 * @param prefix                Used to name the threads.
 *
 * @return NULL if allocation or thread creation failed.
 */
struct u_worker_thread_pool *
u_worker_thread_pool_create(uint32_t starting_worker_count, uint32_t thread_count, const char *prefix);

//! Only called by @ref u_worker_thread_pool_reference.
void
u_worker_thread_pool_destroy(struct u_worker_thread_pool *uwtp);

//! Holds a reference to @p uwtp, NULL on allocation failure.
struct u_worker_group *
u_worker_group_create(struct u_worker_thread_pool *uwtp);

//! Runs @p f on the calling thread when the pool queue is full.
void
u_worker_group_push(struct u_worker_group *uwg, u_worker_group_func_t f, void *data);

void
u_worker_group_wait_all(struct u_worker_group *uwg);

//! Only called by @ref u_worker_group_reference, waits for pending tasks.
void
u_worker_group_destroy(struct u_worker_group *uwg);


static inline void
u_worker_thread_pool_reference(struct u_worker_thread_pool **dst, struct u_worker_thread_pool *src)
{
	struct u_worker_thread_pool *old = *dst;
	if (old == src) {
		return;
	}
	if (src != NULL) {
		lp_reference_inc(&src->reference);
	}
	*dst = src;
	if (old != NULL && lp_reference_dec(&old->reference)) {
		u_worker_thread_pool_destroy(old);
	}
}

static inline void
u_worker_group_reference(struct u_worker_group **dst, struct u_worker_group *src)
{
	struct u_worker_group *old = *dst;
	if (old == src) {
		return;
	}
	if (src != NULL) {
		lp_reference_inc(&src->reference);
	}
	*dst = src;
	if (old != NULL && lp_reference_dec(&old->reference)) {
		u_worker_group_destroy(old);
	}
}


#ifdef __cplusplus
}
#endif
