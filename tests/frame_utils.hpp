// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Helpers for building test frames.
 */

#pragma once

#include "util/u_frame.h"
#include "util/u_format.h"

#include <functional>
#include <stdexcept>


/*!
 * Owns one frame reference for the duration of a test.
 */
struct FrameRef
{
	lp_frame *frame = nullptr;

	FrameRef() = default;

	explicit FrameRef(lp_frame *f) : frame(f) {}

	~FrameRef()
	{
		lp_frame_reference(&frame, nullptr);
	}

	lp_frame *
	operator->() const
	{
		return frame;
	}

	lp_frame &
	operator*() const
	{
		return *frame;
	}

	FrameRef(FrameRef const &) = delete;
	FrameRef &
	operator=(FrameRef const &) = delete;
};

static inline uint8_t *
pixel_ptr(lp_frame &frame, uint32_t x, uint32_t y)
{
	return frame.data + y * frame.stride + x * u_format_block_size(frame.format);
}

/*!
 * Create a frame and fill every pixel through @p fill.
 */
static inline lp_frame *
make_frame(enum lp_format format,
           uint32_t w,
           uint32_t h,
           const std::function<lp_colour_rgb_u8(uint32_t, uint32_t)> &fill)
{
	lp_frame *frame = nullptr;
	if (u_frame_create_one_off(format, w, h, &frame) != LP_SUCCESS) {
		throw std::runtime_error("Failed to create test frame");
	}

	for (uint32_t y = 0; y < h; y++) {
		for (uint32_t x = 0; x < w; x++) {
			lp_colour_rgb_u8 c = fill(x, y);
			uint8_t *p = pixel_ptr(*frame, x, y);
			if (format == LP_FORMAT_L8) {
				p[0] = c.r;
				continue;
			}
			p[0] = c.r;
			p[1] = c.g;
			p[2] = c.b;
			if (format == LP_FORMAT_R8G8B8A8 || format == LP_FORMAT_R8G8B8X8) {
				p[3] = 0x7f;
			}
		}
	}

	return frame;
}

static inline lp_frame *
make_solid_frame(enum lp_format format, uint32_t w, uint32_t h, lp_colour_rgb_u8 c)
{
	return make_frame(format, w, h, [c](uint32_t, uint32_t) { return c; });
}

//! Every pixel gets a distinct colour.
static inline lp_frame *
make_gradient_frame(enum lp_format format, uint32_t w, uint32_t h)
{
	return make_frame(format, w, h, [](uint32_t x, uint32_t y) {
		return lp_colour_rgb_u8{uint8_t(x * 7), uint8_t(y * 11), uint8_t(x * 3 + y * 5)};
	});
}

static inline bool
operator==(const lp_colour_rgb_u8 &a, const lp_colour_rgb_u8 &b)
{
	return a.r == b.r && a.g == b.g && a.b == b.b;
}
