// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Single flight background render scheduler.
 * @ingroup projection
 */

#include "projection/prj_config.hpp"
#include "projection/prj_scheduler.hpp"

#include <new>
#include <stdexcept>


namespace lp::projection {

RenderScheduler::RenderScheduler(const lp::auxiliary::util::SharedThreadPool &pool) : rasterizer_(pool)
{
	if (os_thread_helper_init(&oth_) != 0) {
		throw std::runtime_error("RenderScheduler: failed to init thread helper");
	}

	if (os_thread_helper_start(&oth_, &RenderScheduler::runThread, this) != 0) {
		os_thread_helper_destroy(&oth_);
		throw std::runtime_error("RenderScheduler: failed to start render thread");
	}

	os_thread_helper_name(&oth_, "LP: Render");
}

RenderScheduler::~RenderScheduler()
{
	os_thread_helper_destroy(&oth_);

	lp_frame_reference(&request_source_, nullptr);
	lp_frame_reference(&latest_, nullptr);
}

bool
RenderScheduler::trySubmit(lp_frame *source, const Parameters &params, const lp_size &canvas_size)
{
	os_thread_helper_lock(&oth_);

	if (busy_ || !os_thread_helper_is_running_locked(&oth_)) {
		os_thread_helper_unlock(&oth_);
		PRJ_TRACE("Render in flight, dropping request");
		return false;
	}

	busy_ = true;
	has_request_ = true;
	lp_frame_reference(&request_source_, source);
	request_params_ = params;
	request_canvas_size_ = canvas_size;

	os_thread_helper_broadcast_locked(&oth_);
	os_thread_helper_unlock(&oth_);

	return true;
}

bool
RenderScheduler::isBusy()
{
	os_thread_helper_lock(&oth_);
	bool busy = busy_;
	os_thread_helper_unlock(&oth_);

	return busy;
}

uint64_t
RenderScheduler::latestFrame(lp_frame **out_frame)
{
	os_thread_helper_lock(&oth_);
	lp_frame_reference(out_frame, latest_);
	uint64_t generation = generation_;
	os_thread_helper_unlock(&oth_);

	return generation;
}

void
RenderScheduler::waitIdle()
{
	os_thread_helper_lock(&oth_);
	while (busy_) {
		os_thread_helper_wait_locked(&oth_);
	}
	os_thread_helper_unlock(&oth_);
}

void
RenderScheduler::setCompletionCallback(CompletionCallback callback)
{
	os_thread_helper_lock(&oth_);
	callback_ = std::move(callback);
	os_thread_helper_unlock(&oth_);
}

void *
RenderScheduler::runThread(void *ptr)
{
	static_cast<RenderScheduler *>(ptr)->run();
	return nullptr;
}

lp_result_t
RenderScheduler::renderOne(lp_frame *source, const Parameters &params, const lp_size &canvas_size, lp_frame **out_frame)
{
	lp_result_t ret = Rasterizer::check(source, params, canvas_size);
	if (ret != LP_SUCCESS) {
		return ret;
	}

	try {
		rasterizer_.renderToNewFrame(*source, params, canvas_size, out_frame);
	} catch (const std::bad_alloc &) {
		return LP_ERROR_ALLOCATION;
	} catch (const std::domain_error &e) {
		PRJ_ERROR("%s", e.what());
		return LP_ERROR_DEGENERATE_RADIUS;
	} catch (const std::invalid_argument &e) {
		PRJ_ERROR("%s", e.what());
		return LP_ERROR_INVALID_PARAMETERS;
	}

	return LP_SUCCESS;
}

void
RenderScheduler::run()
{
	os_thread_helper_lock(&oth_);

	while (os_thread_helper_is_running_locked(&oth_)) {
		if (!has_request_) {
			os_thread_helper_wait_locked(&oth_);
			continue;
		}

		// Take over the request reference.
		lp_frame *source = request_source_;
		request_source_ = nullptr;
		Parameters params = request_params_;
		lp_size canvas_size = request_canvas_size_;
		has_request_ = false;

		os_thread_helper_unlock(&oth_);

		lp_frame *canvas = nullptr;
		lp_result_t ret = renderOne(source, params, canvas_size, &canvas);
		lp_frame_reference(&source, nullptr);

		os_thread_helper_lock(&oth_);
		if (ret == LP_SUCCESS) {
			canvas->generation = ++generation_;
			lp_frame_reference(&latest_, canvas);
			PRJ_DEBUG("Completed canvas generation %llu", static_cast<unsigned long long>(generation_));
		} else {
			PRJ_ERROR("Render failed: %s", lp_result_str(ret));
		}
		CompletionCallback callback = callback_;
		os_thread_helper_unlock(&oth_);

		if (callback) {
			try {
				callback(ret, canvas);
			} catch (const std::exception &e) {
				PRJ_ERROR("Completion callback threw: %s", e.what());
			}
		}
		lp_frame_reference(&canvas, nullptr);

		os_thread_helper_lock(&oth_);
		busy_ = false;
		os_thread_helper_broadcast_locked(&oth_);
	}

	// Requests that never started are dropped.
	if (has_request_) {
		lp_frame_reference(&request_source_, nullptr);
		has_request_ = false;
	}
	busy_ = false;
	os_thread_helper_broadcast_locked(&oth_);

	os_thread_helper_unlock(&oth_);
}

} // namespace lp::projection
