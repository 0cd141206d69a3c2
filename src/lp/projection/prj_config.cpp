// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Environment backed configuration and logging for the projection module.
 * @ingroup projection
 */

#include "util/u_debug.h"

#include "projection/prj_config.hpp"

#include <thread>
#include <algorithm>


DEBUG_GET_ONCE_LOG_OPTION(prj_log, "PRJ_LOG", U_LOGGING_WARN)
DEBUG_GET_ONCE_NUM_OPTION(prj_threads, "PRJ_THREADS", 0)
DEBUG_GET_ONCE_NUM_OPTION(prj_canvas_size, "PRJ_CANVAS_SIZE", lp::projection::kDefaultCanvasSize)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_offset_x, "PRJ_OFFSET_X", lp::projection::kDefaultOffsetX)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_offset_y, "PRJ_OFFSET_Y", lp::projection::kDefaultOffsetY)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_rotation_x, "PRJ_ROTATION_X", lp::projection::kDefaultRotationX)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_rotation_y, "PRJ_ROTATION_Y", lp::projection::kDefaultRotationY)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_rotation_z, "PRJ_ROTATION_Z", lp::projection::kDefaultRotationZ)
DEBUG_GET_ONCE_FLOAT_OPTION(prj_scale, "PRJ_SCALE", lp::projection::kDefaultScale)

#define MAX_THREAD_COUNT 16


namespace lp::projection {

enum u_logging_level
getLogLevel()
{
	return debug_get_log_option_prj_log();
}

uint32_t
getThreadCount()
{
	long count = debug_get_num_option_prj_threads();
	if (count <= 0) {
		count = static_cast<long>(std::thread::hardware_concurrency());
	}

	return static_cast<uint32_t>(std::clamp(count, 1L, static_cast<long>(MAX_THREAD_COUNT)));
}

lp_size
getDefaultCanvasSize()
{
	long size = debug_get_num_option_prj_canvas_size();
	if (size <= 0) {
		PRJ_WARN("Ignoring PRJ_CANVAS_SIZE=%ld, using %u", size, kDefaultCanvasSize);
		size = kDefaultCanvasSize;
	}

	return {static_cast<uint32_t>(size), static_cast<uint32_t>(size)};
}

lp_projection_params
getEnvParameters()
{
	lp_projection_params params = {};
	params.offset.x = debug_get_float_option_prj_offset_x();
	params.offset.y = debug_get_float_option_prj_offset_y();
	params.rotation.x = debug_get_float_option_prj_rotation_x();
	params.rotation.y = debug_get_float_option_prj_rotation_y();
	params.rotation.z = debug_get_float_option_prj_rotation_z();
	params.scale = debug_get_float_option_prj_scale();

	return params;
}

} // namespace lp::projection
