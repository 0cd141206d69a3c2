// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  @ref lp_frame helpers.
 * @ingroup aux_util
 */

#pragma once

#include "lp/lp_frame.h"

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * Creates a single non-pooled frame, when the reference reaches zero it is
 * freed. The pixel data is zeroed.
 *
 * Returns @ref LP_ERROR_INVALID_DIMENSIONS for a zero width or height and
 * @ref LP_ERROR_ALLOCATION if the memory could not be allocated.
 */
lp_result_t
u_frame_create_one_off(enum lp_format f, uint32_t width, uint32_t height, struct lp_frame **out_frame);


#ifdef __cplusplus
}
#endif
