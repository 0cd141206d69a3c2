// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Single flight background render scheduler.
 * @ingroup projection
 */

#pragma once

#include "os/os_threading.h"

#include "projection/prj_rasterizer.hpp"

#include <functional>


namespace lp::projection {

/*!
 * Runs at most one render at a time on its own thread, requests that arrive
 * while a render is in flight are dropped rather than queued.
 *
 * The latest completed canvas is kept and can be picked up at any time.
 */
class RenderScheduler
{
public:
	/*!
	 * Called on the render thread after every attempted render, @p frame is
	 * only borrowed and is null on failure. The render counts as in flight
	 * until the callback returns. A std::exception thrown from the callback
	 * is logged and does not stop the render thread.
	 */
	using CompletionCallback = std::function<void(lp_result_t ret, lp_frame *frame)>;

	/*!
	 * @throws std::runtime_error if the render thread could not be started.
	 */
	explicit RenderScheduler(const lp::auxiliary::util::SharedThreadPool &pool);

	//! Waits for the in flight render, pending requests are dropped.
	~RenderScheduler();

	/*!
	 * Submit a render of @p source, which gets referenced.
	 *
	 * @return false, and nothing is referenced, if a render is in flight.
	 */
	bool
	trySubmit(lp_frame *source, const Parameters &params, const lp_size &canvas_size);

	bool
	isBusy();

	/*!
	 * Reference the latest completed canvas into @p out_frame.
	 *
	 * @return The generation of that canvas, zero if nothing has completed.
	 */
	uint64_t
	latestFrame(lp_frame **out_frame);

	//! Block until no render is in flight.
	void
	waitIdle();

	void
	setCompletionCallback(CompletionCallback callback);

	// Owns a thread and frame references.
	RenderScheduler(RenderScheduler const &) = delete;
	RenderScheduler(RenderScheduler &&) = delete;
	RenderScheduler &
	operator=(RenderScheduler const &) = delete;
	RenderScheduler &
	operator=(RenderScheduler &&) = delete;


private:
	static void *
	runThread(void *ptr);

	void
	run();

	lp_result_t
	renderOne(lp_frame *source, const Parameters &params, const lp_size &canvas_size, lp_frame **out_frame);


private:
	os_thread_helper oth_;

	Rasterizer rasterizer_;

	//! Protected by the helper lock.
	bool busy_ = false;
	bool has_request_ = false;
	lp_frame *request_source_ = nullptr;
	Parameters request_params_;
	lp_size request_canvas_size_ = {};

	lp_frame *latest_ = nullptr;
	uint64_t generation_ = 0;

	CompletionCallback callback_;
};

} // namespace lp::projection
