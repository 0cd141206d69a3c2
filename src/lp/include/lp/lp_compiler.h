// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Header holding common defines.
 * @ingroup lp_iface
 */

#pragma once


/*
 * C99 is not a high bar to reach.
 */
#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>


/*
 * Printf helper attribute.
 */
#if defined(__GNUC__)
#define LP_PRINTF_FORMAT(fmt, list) __attribute__((format(printf, fmt, list)))
#else
#define LP_PRINTF_FORMAT(fmt, list)
#endif


typedef volatile int32_t lp_atomic_s32_t;

static inline int32_t
lp_atomic_s32_inc_return(lp_atomic_s32_t *p)
{
#if defined(__GNUC__)
	return __sync_add_and_fetch(p, 1);
#else
#error "compiler not supported"
#endif
}

static inline int32_t
lp_atomic_s32_dec_return(lp_atomic_s32_t *p)
{
#if defined(__GNUC__)
	return __sync_sub_and_fetch(p, 1);
#else
#error "compiler not supported"
#endif
}
