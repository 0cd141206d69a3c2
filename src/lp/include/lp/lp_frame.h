// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Reference counted image, used for sources and rendered canvases.
 * @ingroup lp_iface
 */

#pragma once

#include "lp/lp_defines.h"

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * Rows are @ref stride bytes apart and may be padded. @ref destroy is called
 * with the last reference, @ref owner is free for whoever allocated it.
 *
 * @ingroup lp_iface
 */
struct lp_frame
{
	struct lp_reference reference;
	void (*destroy)(struct lp_frame *);
	void *owner;

	uint32_t width;
	uint32_t height;
	size_t stride;
	size_t size;
	uint8_t *data;

	enum lp_format format;

	//! Set by the render scheduler, counts completed canvases from one.
	uint64_t generation;
};

/*!
 * Point @p dst at @p src, taking a reference on @p src and dropping the one
 * @p dst held. Either may be NULL.
 *
 * @relates lp_frame
 */
static inline void
lp_frame_reference(struct lp_frame **dst, struct lp_frame *src)
{
	struct lp_frame *old = *dst;
	if (old == src) {
		return;
	}
	if (src != NULL) {
		lp_reference_inc(&src->reference);
	}
	*dst = src;
	if (old != NULL && lp_reference_dec(&old->reference)) {
		old->destroy(old);
	}
}


#ifdef __cplusplus
}
#endif
