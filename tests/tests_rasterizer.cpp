// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Resampling rasterizer tests.
 */

#include "projection/prj_sampler.hpp"
#include "projection/prj_rasterizer.hpp"

#include "frame_utils.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <stdexcept>


using lp::auxiliary::util::SharedThreadPool;
using lp::projection::Parameters;
using lp::projection::ProjectionModel;
using lp::projection::Rasterizer;


static bool
frames_equal(const lp_frame &a, const lp_frame &b)
{
	if (a.width != b.width || a.height != b.height || a.format != b.format) {
		return false;
	}
	for (uint32_t y = 0; y < a.height; y++) {
		if (memcmp(a.data + y * a.stride, b.data + y * b.stride, a.width * 3) != 0) {
			return false;
		}
	}
	return true;
}

TEST_CASE("Rasterizer solid source")
{
	SharedThreadPool pool{2, 2, "Test"};
	Rasterizer rasterizer{pool};

	const lp_colour_rgb_u8 red = {255, 0, 0};
	FrameRef source{make_solid_frame(LP_FORMAT_R8G8B8, 4, 4, red)};

	Parameters params = Parameters::fromEulerAngles({0.5f, 0.5f}, {0.f, 0.f, 0.f}, 100.f);

	FrameRef canvas;
	rasterizer.renderToNewFrame(*source, params, {4, 4}, &canvas.frame);

	REQUIRE(canvas.frame != nullptr);
	CHECK(canvas->format == LP_FORMAT_R8G8B8);
	CHECK(canvas->width == 4);
	CHECK(canvas->height == 4);
	CHECK(canvas->reference.count == 1);

	for (uint32_t y = 0; y < 4; y++) {
		for (uint32_t x = 0; x < 4; x++) {
			CHECK(lp::projection::read_pixel(*canvas, x, y) == red);
		}
	}
}

TEST_CASE("Rasterizer matches per pixel projection")
{
	SharedThreadPool pool{2, 2, "Test"};
	Rasterizer rasterizer{pool};

	FrameRef source{make_gradient_frame(LP_FORMAT_R8G8B8, 32, 16)};
	Parameters params = Parameters::defaults();
	ProjectionModel model{{32, 16}, {24, 20}, params};

	FrameRef canvas;
	rasterizer.renderToNewFrame(*source, params, {24, 20}, &canvas.frame);

	for (uint32_t y = 0; y < 20; y++) {
		for (uint32_t x = 0; x < 24; x++) {
			Eigen::Vector2f p = model.project({float(x), float(y)});
			CHECK(lp::projection::read_pixel(*canvas, x, y) ==
			      lp::projection::sample_bilinear(*source, p.x(), p.y()));
		}
	}
}

TEST_CASE("Rasterizer output does not depend on the bands")
{
	FrameRef source{make_gradient_frame(LP_FORMAT_R8G8B8A8, 37, 19)};
	Parameters params = Parameters::fromEulerAngles({0.1f, 0.3f}, {0.4f, 1.2f, 2.0f}, 0.8f);
	const lp_size size = {41, 33};

	SharedThreadPool single{0, 0, "Empty"};
	FrameRef reference;
	Rasterizer(single, 1).renderToNewFrame(*source, params, size, &reference.frame);

	SECTION("Zero worker pool, many bands")
	{
		FrameRef canvas;
		Rasterizer(single, 16).renderToNewFrame(*source, params, size, &canvas.frame);
		CHECK(frames_equal(*reference, *canvas));
	}

	SECTION("Threaded pool")
	{
		SharedThreadPool pool{4, 4, "Test"};
		for (size_t bands : {2, 3, 7, 16, 64}) {
			FrameRef canvas;
			Rasterizer rasterizer{pool, bands};
			CHECK(rasterizer.bandCount() <= lp::auxiliary::util::TaskCollection::kSize);
			rasterizer.renderToNewFrame(*source, params, size, &canvas.frame);
			CHECK(frames_equal(*reference, *canvas));
		}
	}

	SECTION("Fewer rows than bands")
	{
		FrameRef tall;
		FrameRef tall_reference;
		Rasterizer(single, 1).renderToNewFrame(*source, params, {50, 3}, &tall_reference.frame);
		Rasterizer(single, 16).renderToNewFrame(*source, params, {50, 3}, &tall.frame);
		CHECK(frames_equal(*tall_reference, *tall));
	}
}

TEST_CASE("Rasterizer validation")
{
	SharedThreadPool pool{1, 1, "Test"};
	Rasterizer rasterizer{pool};
	FrameRef source{make_gradient_frame(LP_FORMAT_R8G8B8, 8, 8)};
	ProjectionModel model{{8, 8}, {8, 8}, Parameters::defaults()};

	SECTION("Canvas must be R8G8B8")
	{
		FrameRef canvas;
		REQUIRE(u_frame_create_one_off(LP_FORMAT_R8G8B8A8, 8, 8, &canvas.frame) == LP_SUCCESS);
		CHECK_THROWS_AS(rasterizer.render(*source, model, *canvas), std::invalid_argument);
	}

	SECTION("Canvas must match the model")
	{
		FrameRef canvas;
		REQUIRE(u_frame_create_one_off(LP_FORMAT_R8G8B8, 9, 8, &canvas.frame) == LP_SUCCESS);
		CHECK_THROWS_AS(rasterizer.render(*source, model, *canvas), std::invalid_argument);
	}

	SECTION("Source must match the model")
	{
		FrameRef canvas;
		FrameRef other{make_gradient_frame(LP_FORMAT_R8G8B8, 4, 8)};
		REQUIRE(u_frame_create_one_off(LP_FORMAT_R8G8B8, 8, 8, &canvas.frame) == LP_SUCCESS);
		CHECK_THROWS_AS(rasterizer.render(*other, model, *canvas), std::invalid_argument);
	}

	SECTION("Check reports result codes")
	{
		Parameters params = Parameters::defaults();
		CHECK(Rasterizer::check(source.frame, params, {8, 8}) == LP_SUCCESS);
		CHECK(Rasterizer::check(nullptr, params, {8, 8}) == LP_ERROR_INVALID_DIMENSIONS);
		CHECK(Rasterizer::check(source.frame, params, {0, 8}) == LP_ERROR_INVALID_DIMENSIONS);

		params.scale = -2.f;
		CHECK(Rasterizer::check(source.frame, params, {8, 8}) == LP_ERROR_DEGENERATE_RADIUS);
		FrameRef canvas;
		CHECK_THROWS_AS(rasterizer.renderToNewFrame(*source, params, {8, 8}, &canvas.frame), std::domain_error);
		CHECK(canvas.frame == nullptr);
	}
}
