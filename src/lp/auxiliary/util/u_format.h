// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Format helpers.
 * @ingroup aux_util
 */

#pragma once

#include "lp/lp_defines.h"

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * Return string for this format.
 *
 * @ingroup aux_util
 */
const char *
u_format_str(enum lp_format f);

/*!
 * Returns the size of one pixel in bytes for the given format.
 *
 * @ingroup aux_util
 */
size_t
u_format_block_size(enum lp_format f);

/*!
 * Can pixels of this format be read as a RGB triple.
 *
 * @ingroup aux_util
 */
bool
u_format_is_rgb_readable(enum lp_format f);

/*!
 * Calculate stride and size for the format and given width and height.
 *
 * @ingroup aux_util
 */
void
u_format_size_for_dimensions(enum lp_format f, uint32_t width, uint32_t height, size_t *out_stride, size_t *out_size);


#ifdef __cplusplus
}
#endif
