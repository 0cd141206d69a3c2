// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Typed allocation helpers.
 * @ingroup aux_util
 */

#pragma once

#include <stdlib.h>
#include <string.h>


//! Zeroed allocation of one @p TYPE, NULL on failure.
#define U_TYPED_CALLOC(TYPE) ((TYPE *)calloc(1, sizeof(TYPE)))

//! Zeroed allocation of @p COUNT elements, NULL on failure.
#define U_TYPED_ARRAY_CALLOC(TYPE, COUNT) ((TYPE *)calloc((COUNT), sizeof(TYPE)))

#define U_ZERO(PTR) memset((PTR), 0, sizeof(*(PTR)))
