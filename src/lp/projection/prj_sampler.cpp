// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Edge clamped bilinear sampling of frames.
 * @ingroup projection
 */

#include "projection/prj_sampler.hpp"

#include <cmath>
#include <algorithm>


namespace lp::projection {

namespace {

	struct Tap
	{
		uint32_t i1;
		uint32_t i2;
		float w1;
		float w2;
	};

	/*!
	 * Clamp @p v into [0, count - 1], pick the two neighbouring indices and
	 * their weights. Both indices are equal on the last pixel.
	 */
	Tap
	make_tap(float v, uint32_t count)
	{
		const float max = static_cast<float>(count - 1);

		// fmax returns the other argument for NaN.
		float c = std::fmax(v, 0.0f);
		c = std::fmin(c, max);

		Tap tap;
		tap.i1 = std::min(static_cast<uint32_t>(c), count - 1);
		tap.i2 = std::min(tap.i1 + 1, count - 1);
		tap.w1 = static_cast<float>(tap.i2) - c;
		tap.w2 = c - static_cast<float>(tap.i1);

		return tap;
	}

	/*!
	 * Blend one channel, truncating towards zero. Written as a step from
	 * @p a so that equal channels come back unchanged.
	 */
	uint8_t
	lerp_u8(uint8_t a, uint8_t b, float t)
	{
		const float v = static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t;
		return static_cast<uint8_t>(std::clamp(v, 0.0f, 255.0f));
	}

	lp_colour_rgb_u8
	interpolate(const lp_colour_rgb_u8 &q1, float w1, const lp_colour_rgb_u8 &q2, float w2)
	{
		const float sum = w1 + w2;
		if (sum == 0.0f) {
			return q1;
		}

		const float t = w2 / sum;

		lp_colour_rgb_u8 ret;
		ret.r = lerp_u8(q1.r, q2.r, t);
		ret.g = lerp_u8(q1.g, q2.g, t);
		ret.b = lerp_u8(q1.b, q2.b, t);

		return ret;
	}

} // namespace

lp_colour_rgb_u8
read_pixel(const lp_frame &frame, uint32_t x, uint32_t y)
{
	const uint8_t *row = frame.data + static_cast<size_t>(y) * frame.stride;

	switch (frame.format) {
	case LP_FORMAT_R8G8B8X8:
	case LP_FORMAT_R8G8B8A8: {
		const uint8_t *p = row + static_cast<size_t>(x) * 4;
		return {p[0], p[1], p[2]};
	}
	case LP_FORMAT_R8G8B8: {
		const uint8_t *p = row + static_cast<size_t>(x) * 3;
		return {p[0], p[1], p[2]};
	}
	case LP_FORMAT_L8: {
		const uint8_t l = row[x];
		return {l, l, l};
	}
	default: return {0, 0, 0};
	}
}

lp_colour_rgb_u8
sample_bilinear(const lp_frame &frame, float x, float y)
{
	const Tap tx = make_tap(x, frame.width);
	const Tap ty = make_tap(y, frame.height);

	const lp_colour_rgb_u8 q11 = read_pixel(frame, tx.i1, ty.i1);
	const lp_colour_rgb_u8 q21 = read_pixel(frame, tx.i2, ty.i1);
	const lp_colour_rgb_u8 q12 = read_pixel(frame, tx.i1, ty.i2);
	const lp_colour_rgb_u8 q22 = read_pixel(frame, tx.i2, ty.i2);

	// Horizontal first, truncating after every step.
	const lp_colour_rgb_u8 top = interpolate(q11, tx.w1, q21, tx.w2);
	const lp_colour_rgb_u8 bottom = interpolate(q12, tx.w1, q22, tx.w2);

	return interpolate(top, ty.w1, bottom, ty.w2);
}

} // namespace lp::projection
