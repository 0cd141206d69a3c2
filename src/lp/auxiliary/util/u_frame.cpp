// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  @ref lp_frame helpers.
 * @ingroup aux_util
 */

#include "util/u_misc.h"
#include "util/u_frame.h"
#include "util/u_format.h"
#include "util/u_logging.h"

#include <assert.h>


static void
free_one_off(struct lp_frame *lf)
{
	assert(lf->reference.count == 0);
	free(lf->data);
	free(lf);
}

extern "C" lp_result_t
u_frame_create_one_off(enum lp_format f, uint32_t width, uint32_t height, struct lp_frame **out_frame)
{
	assert(out_frame != NULL);

	if (width == 0 || height == 0) {
		U_LOG_E("Invalid frame size %ux%u", width, height);
		return LP_ERROR_INVALID_DIMENSIONS;
	}

	struct lp_frame *lf = U_TYPED_CALLOC(struct lp_frame);
	if (lf == NULL) {
		return LP_ERROR_ALLOCATION;
	}

	lf->format = f;
	lf->width = width;
	lf->height = height;
	lf->destroy = free_one_off;

	u_format_size_for_dimensions(lf->format, lf->width, lf->height, &lf->stride, &lf->size);

	lf->data = U_TYPED_ARRAY_CALLOC(uint8_t, lf->size);
	if (lf->data == NULL) {
		U_LOG_E("Could not allocate %zu bytes for a %ux%u %s frame", lf->size, width, height, u_format_str(f));
		free(lf);
		return LP_ERROR_ALLOCATION;
	}

	// Already has a ref count of one.
	lf->reference.count = 1;

	lp_frame_reference(out_frame, NULL);
	*out_frame = lf;

	return LP_SUCCESS;
}
