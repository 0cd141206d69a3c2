// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Single flight render scheduler tests.
 */

#include "projection/prj_sampler.hpp"
#include "projection/prj_scheduler.hpp"

#include "frame_utils.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <future>
#include <stdexcept>


using lp::auxiliary::util::SharedThreadPool;
using lp::projection::Parameters;
using lp::projection::RenderScheduler;


TEST_CASE("RenderScheduler")
{
	SharedThreadPool pool{2, 2, "Test"};
	RenderScheduler scheduler{pool};

	const lp_colour_rgb_u8 blue = {0, 0, 255};
	FrameRef source{make_solid_frame(LP_FORMAT_R8G8B8, 16, 8, blue)};
	const Parameters params = Parameters::defaults();
	const lp_size size = {10, 10};

	CHECK_FALSE(scheduler.isBusy());

	{
		FrameRef none;
		CHECK(scheduler.latestFrame(&none.frame) == 0);
		CHECK(none.frame == nullptr);
	}

	SECTION("Drops requests while one is in flight")
	{
		std::promise<void> release;
		std::shared_future<void> released = release.get_future().share();
		std::atomic<int> calls{0};
		std::atomic<int> failures{0};

		scheduler.setCompletionCallback([&](lp_result_t ret, lp_frame *frame) {
			calls++;
			if (ret != LP_SUCCESS || frame == nullptr) {
				failures++;
			}
			released.wait();
		});

		REQUIRE(scheduler.trySubmit(source.frame, params, size));
		CHECK(scheduler.isBusy());
		CHECK_FALSE(scheduler.trySubmit(source.frame, params, size));
		CHECK_FALSE(scheduler.trySubmit(source.frame, params, size));

		release.set_value();
		scheduler.waitIdle();

		CHECK_FALSE(scheduler.isBusy());
		CHECK(calls.load() == 1);

		// Accepted again once the previous render completed.
		REQUIRE(scheduler.trySubmit(source.frame, params, size));
		scheduler.waitIdle();
		CHECK(calls.load() == 2);
		CHECK(failures.load() == 0);

		FrameRef latest;
		CHECK(scheduler.latestFrame(&latest.frame) == 2);
		REQUIRE(latest.frame != nullptr);
		CHECK(latest->generation == 2);
		CHECK(latest->width == 10);
		CHECK(lp::projection::read_pixel(*latest, 5, 5) == blue);
	}

	SECTION("Source is kept alive by the request")
	{
		std::promise<void> release;
		std::shared_future<void> released = release.get_future().share();
		scheduler.setCompletionCallback([&](lp_result_t, lp_frame *) { released.wait(); });

		lp_frame *temporary = make_solid_frame(LP_FORMAT_L8, 4, 4, blue);
		REQUIRE(scheduler.trySubmit(temporary, params, size));
		lp_frame_reference(&temporary, nullptr);

		release.set_value();
		scheduler.waitIdle();

		FrameRef latest;
		CHECK(scheduler.latestFrame(&latest.frame) == 1);
		REQUIRE(latest.frame != nullptr);
	}

	SECTION("Failures are reported and keep the latest frame")
	{
		std::atomic<int> last_result{LP_SUCCESS};
		scheduler.setCompletionCallback([&](lp_result_t ret, lp_frame *) { last_result = ret; });

		REQUIRE(scheduler.trySubmit(source.frame, params, size));
		scheduler.waitIdle();
		CHECK(last_result.load() == LP_SUCCESS);

		Parameters bad = params;
		bad.scale = 0.f;
		REQUIRE(scheduler.trySubmit(source.frame, bad, size));
		scheduler.waitIdle();
		CHECK(last_result.load() == LP_ERROR_DEGENERATE_RADIUS);

		REQUIRE(scheduler.trySubmit(source.frame, params, {0, 10}));
		scheduler.waitIdle();
		CHECK(last_result.load() == LP_ERROR_INVALID_DIMENSIONS);

		FrameRef latest;
		CHECK(scheduler.latestFrame(&latest.frame) == 1);
		CHECK(latest->width == 10);
	}

	SECTION("A throwing callback does not stop the render thread")
	{
		std::atomic<int> calls{0};
		scheduler.setCompletionCallback([&](lp_result_t, lp_frame *) {
			calls++;
			throw std::runtime_error("window closed");
		});

		REQUIRE(scheduler.trySubmit(source.frame, params, size));
		scheduler.waitIdle();
		CHECK_FALSE(scheduler.isBusy());
		CHECK(calls.load() == 1);

		REQUIRE(scheduler.trySubmit(source.frame, params, size));
		scheduler.waitIdle();
		CHECK(calls.load() == 2);

		FrameRef latest;
		CHECK(scheduler.latestFrame(&latest.frame) == 2);
		CHECK(source->reference.count == 1);
	}
}

TEST_CASE("RenderScheduler destruction waits for the render")
{
	SharedThreadPool pool{1, 1, "Test"};
	FrameRef source{make_gradient_frame(LP_FORMAT_R8G8B8, 64, 32)};
	std::atomic<int> calls{0};

	{
		RenderScheduler scheduler{pool};
		scheduler.setCompletionCallback([&](lp_result_t, lp_frame *) { calls++; });
		REQUIRE(scheduler.trySubmit(source.frame, Parameters::defaults(), {64, 64}));
		scheduler.waitIdle();
	}

	CHECK(calls.load() == 1);
	CHECK(source->reference.count == 1);
}
