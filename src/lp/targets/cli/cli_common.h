// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Common file for the CLI program.
 */

#pragma once

#include "projection/prj_interface.h"

#include <stdbool.h>


#ifdef __cplusplus
extern "C" {
#endif


//! Largest accepted canvas width or height.
#define CLI_MAX_CANVAS_SIDE 16384u

int
cli_cmd_render(int argc, const char **argv);

/*!
 * Parse the options after `render <input> <output>`, values that are not
 * given keep what @p params and @p size already hold. Problems are printed.
 */
bool
cli_parse_render_args(int argc, const char **argv, struct lp_projection_params *params, struct lp_size *size);


#ifdef __cplusplus
}
#endif
