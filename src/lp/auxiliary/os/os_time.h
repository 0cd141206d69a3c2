// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Monotonic clock used to time renders.
 *
 * @ingroup aux_os
 */

#pragma once

#include "lp/lp_config_os.h"
#include "lp/lp_compiler.h"

#include <time.h>

#ifdef __cplusplus
extern "C" {
#endif


//! Number of nanoseconds in a millisecond.
#define U_TIME_1MS_IN_NS (1000 * 1000)

/*!
 * Monotonic clock in nanoseconds, zero if the clock could not be read.
 */
static inline uint64_t
os_monotonic_get_ns(void)
{
	struct timespec ts;
	if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
		return 0;
	}

	return (uint64_t)ts.tv_sec * 1000000000u + (uint64_t)ts.tv_nsec;
}

//! For printing durations.
static inline double
os_ns_to_ms_f64(uint64_t ns)
{
	return (double)ns / (double)U_TIME_1MS_IN_NS;
}


#ifdef __cplusplus
}
#endif
