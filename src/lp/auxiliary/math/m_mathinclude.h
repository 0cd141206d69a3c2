// Copyright 2020-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Wrapper header for <math.h> to ensure pi-related math constants are
 * defined.
 *
 * Use this instead of directly including <math.h> in headers and when
 * you need M_PI and its friends.
 *
 * @ingroup aux_math
 */

#pragma once

#ifdef __cplusplus
#include <cmath>
#endif

#include <math.h>


#ifndef M_PI
#define M_PI (3.14159265358979323846)
#endif

#ifndef M_1_PI
#define M_1_PI (1. / M_PI)
#endif
