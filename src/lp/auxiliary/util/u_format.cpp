// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Format helpers.
 * @ingroup aux_util
 */

#include "util/u_format.h"

#include <assert.h>


extern "C" const char *
u_format_str(enum lp_format f)
{
	switch (f) {
	case LP_FORMAT_R8G8B8X8: return "LP_FORMAT_R8G8B8X8";
	case LP_FORMAT_R8G8B8A8: return "LP_FORMAT_R8G8B8A8";
	case LP_FORMAT_R8G8B8: return "LP_FORMAT_R8G8B8";
	case LP_FORMAT_L8: return "LP_FORMAT_L8";
	default: assert(!"unsupported format"); return "";
	}
}

extern "C" size_t
u_format_block_size(enum lp_format f)
{
	switch (f) {
	case LP_FORMAT_R8G8B8X8:
	case LP_FORMAT_R8G8B8A8: return 4;
	case LP_FORMAT_R8G8B8: return 3;
	case LP_FORMAT_L8: return 1;
	default: assert(!"unsupported format"); return 0;
	}
}

extern "C" bool
u_format_is_rgb_readable(enum lp_format f)
{
	switch (f) {
	case LP_FORMAT_R8G8B8X8:
	case LP_FORMAT_R8G8B8A8:
	case LP_FORMAT_R8G8B8:
	case LP_FORMAT_L8: return true;
	default: return false;
	}
}

extern "C" void
u_format_size_for_dimensions(enum lp_format f, uint32_t width, uint32_t height, size_t *out_stride, size_t *out_size)
{
	size_t stride = u_format_block_size(f) * width;
	size_t size = stride * height;

	*out_stride = stride;
	*out_size = size;
}
