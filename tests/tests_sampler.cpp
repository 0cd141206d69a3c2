// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Bilinear sampler tests.
 */

#include "projection/prj_sampler.hpp"

#include "frame_utils.hpp"

#include <catch2/catch.hpp>

#include <limits>


using lp::projection::read_pixel;
using lp::projection::sample_bilinear;


TEST_CASE("sample_bilinear integer coordinates")
{
	FrameRef frame{make_gradient_frame(LP_FORMAT_R8G8B8, 8, 6)};

	for (uint32_t y = 0; y < 6; y++) {
		for (uint32_t x = 0; x < 8; x++) {
			CHECK(sample_bilinear(*frame, float(x), float(y)) == read_pixel(*frame, x, y));
		}
	}
}

TEST_CASE("sample_bilinear edges")
{
	FrameRef frame{make_gradient_frame(LP_FORMAT_R8G8B8, 5, 4)};

	SECTION("Beyond the edges clamps to the edge pixel")
	{
		CHECK(sample_bilinear(*frame, -5.f, 2.f) == read_pixel(*frame, 0, 2));
		CHECK(sample_bilinear(*frame, 5.f + 5.f, 2.f) == read_pixel(*frame, 4, 2));
		CHECK(sample_bilinear(*frame, 1.f, -0.25f) == read_pixel(*frame, 1, 0));
		CHECK(sample_bilinear(*frame, 3.f, 1000.f) == read_pixel(*frame, 3, 3));
		CHECK(sample_bilinear(*frame, -1e30f, 1e30f) == read_pixel(*frame, 0, 3));
	}

	SECTION("Last column and row")
	{
		CHECK(sample_bilinear(*frame, 4.f, 3.f) == read_pixel(*frame, 4, 3));
		CHECK(sample_bilinear(*frame, 4.f, 1.f) == read_pixel(*frame, 4, 1));
		CHECK(sample_bilinear(*frame, 2.f, 3.f) == read_pixel(*frame, 2, 3));
	}

	SECTION("NaN clamps to zero")
	{
		const float nan = std::numeric_limits<float>::quiet_NaN();
		CHECK(sample_bilinear(*frame, nan, nan) == read_pixel(*frame, 0, 0));
		CHECK(sample_bilinear(*frame, 3.f, nan) == read_pixel(*frame, 3, 0));
	}
}

TEST_CASE("sample_bilinear blending")
{
	FrameRef frame{make_frame(LP_FORMAT_R8G8B8, 2, 2, [](uint32_t x, uint32_t y) {
		return lp_colour_rgb_u8{uint8_t(x * 100), uint8_t(y * 200), 10};
	})};

	SECTION("Half way horizontally")
	{
		lp_colour_rgb_u8 c = sample_bilinear(*frame, 0.5f, 0.f);
		CHECK(c.r == 50);
		CHECK(c.g == 0);
		CHECK(c.b == 10);
	}

	SECTION("Quarter way vertically")
	{
		lp_colour_rgb_u8 c = sample_bilinear(*frame, 0.f, 0.25f);
		CHECK(c.r == 0);
		CHECK(c.g == 50);
	}

	SECTION("Values are truncated")
	{
		// 100 / 3 is 33.3 and is truncated to 33.
		lp_colour_rgb_u8 c = sample_bilinear(*frame, 1.f / 3.f, 0.f);
		CHECK(c.r == 33);
	}
}

TEST_CASE("sample_bilinear solid frame stays solid")
{
	const lp_colour_rgb_u8 red = {255, 0, 0};
	const lp_colour_rgb_u8 mixed = {255, 1, 254};

	FrameRef red_frame{make_solid_frame(LP_FORMAT_R8G8B8, 4, 4, red)};
	FrameRef mixed_frame{make_solid_frame(LP_FORMAT_R8G8B8, 7, 5, mixed)};

	// Includes the coordinates the rasterizer hit on a 4x4 canvas.
	CHECK(sample_bilinear(*red_frame, 3.f, 0.063648f) == red);
	CHECK(sample_bilinear(*red_frame, 0.063648f, 2.9f) == red);

	for (int j = 0; j <= 64; j++) {
		for (int i = 0; i <= 64; i++) {
			const float fx = 3.f * float(i) / 64.f + 0.001f * float(j % 7);
			const float fy = 3.f * float(j) / 64.f + 0.0007f * float(i % 5);
			CHECK(sample_bilinear(*red_frame, fx, fy) == red);
			CHECK(sample_bilinear(*mixed_frame, fx * 2.f, fy * 1.3f) == mixed);
		}
	}
}

TEST_CASE("read_pixel formats")
{
	const lp_colour_rgb_u8 colour = {12, 34, 56};

	SECTION("R8G8B8A8 ignores alpha")
	{
		FrameRef frame{make_solid_frame(LP_FORMAT_R8G8B8A8, 3, 3, colour)};
		CHECK(read_pixel(*frame, 2, 1) == colour);
		CHECK(sample_bilinear(*frame, 1.5f, 0.5f) == colour);
	}

	SECTION("R8G8B8X8 ignores padding")
	{
		FrameRef frame{make_solid_frame(LP_FORMAT_R8G8B8X8, 3, 3, colour)};
		CHECK(read_pixel(*frame, 0, 2) == colour);
	}

	SECTION("L8 is grey")
	{
		FrameRef frame{make_solid_frame(LP_FORMAT_L8, 3, 3, colour)};
		lp_colour_rgb_u8 c = read_pixel(*frame, 1, 1);
		CHECK(c.r == 12);
		CHECK(c.g == 12);
		CHECK(c.b == 12);
	}
}
