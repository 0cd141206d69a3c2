// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Frame and format helper tests.
 */

#include "frame_utils.hpp"

#include <catch2/catch.hpp>


TEST_CASE("u_format")
{
	CHECK(u_format_block_size(LP_FORMAT_R8G8B8) == 3);
	CHECK(u_format_block_size(LP_FORMAT_R8G8B8A8) == 4);
	CHECK(u_format_block_size(LP_FORMAT_R8G8B8X8) == 4);
	CHECK(u_format_block_size(LP_FORMAT_L8) == 1);

	CHECK(u_format_is_rgb_readable(LP_FORMAT_L8));
	CHECK_FALSE(u_format_is_rgb_readable((enum lp_format)99));
}

TEST_CASE("u_frame_create_one_off")
{
	SECTION("Zeroed and referenced once")
	{
		FrameRef frame;
		REQUIRE(u_frame_create_one_off(LP_FORMAT_R8G8B8, 5, 3, &frame.frame) == LP_SUCCESS);
		CHECK(frame->reference.count == 1);
		CHECK(frame->stride >= 15);
		CHECK(frame->size >= frame->stride * 3);
		for (uint32_t y = 0; y < 3; y++) {
			for (uint32_t x = 0; x < 15; x++) {
				CHECK(frame->data[y * frame->stride + x] == 0);
			}
		}
	}

	SECTION("Zero dimensions are refused")
	{
		lp_frame *frame = nullptr;
		CHECK(u_frame_create_one_off(LP_FORMAT_R8G8B8, 0, 3, &frame) == LP_ERROR_INVALID_DIMENSIONS);
		CHECK(u_frame_create_one_off(LP_FORMAT_L8, 3, 0, &frame) == LP_ERROR_INVALID_DIMENSIONS);
		CHECK(frame == nullptr);
	}
}

TEST_CASE("lp_frame_reference")
{
	lp_frame *frame = make_solid_frame(LP_FORMAT_L8, 2, 2, {1, 1, 1});
	lp_frame *other = nullptr;

	lp_frame_reference(&other, frame);
	CHECK(frame->reference.count == 2);

	lp_frame_reference(&other, nullptr);
	CHECK(frame->reference.count == 1);
	CHECK(other == nullptr);

	lp_frame_reference(&frame, nullptr);
	CHECK(frame == nullptr);
}
