// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Environment backed configuration and logging for the projection module.
 * @ingroup projection
 */

#pragma once

#include "util/u_logging.h"

#include "projection/prj_params.hpp"


namespace lp::projection {

//! Module log level, `PRJ_LOG`, warn by default.
enum u_logging_level
getLogLevel();

//! Worker thread count, `PRJ_THREADS`, the hardware concurrency when unset.
uint32_t
getThreadCount();

//! Square canvas size, `PRJ_CANVAS_SIZE`.
lp_size
getDefaultCanvasSize();

//! Defaults overridden by the `PRJ_OFFSET_*`, `PRJ_ROTATION_*` and `PRJ_SCALE` options.
lp_projection_params
getEnvParameters();

} // namespace lp::projection


/*!
 * @name Logging macros
 * Logging macros conditional on the module log level.
 * @{
 */
#define PRJ_TRACE(...) U_LOG_IFL_T(lp::projection::getLogLevel(), __VA_ARGS__)
#define PRJ_DEBUG(...) U_LOG_IFL_D(lp::projection::getLogLevel(), __VA_ARGS__)
#define PRJ_INFO(...) U_LOG_IFL_I(lp::projection::getLogLevel(), __VA_ARGS__)
#define PRJ_WARN(...) U_LOG_IFL_W(lp::projection::getLogLevel(), __VA_ARGS__)
#define PRJ_ERROR(...) U_LOG_IFL_E(lp::projection::getLogLevel(), __VA_ARGS__)
/*!
 * @}
 */
