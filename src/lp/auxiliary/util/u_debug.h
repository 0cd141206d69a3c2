// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Environment variable options.
 *
 * Every getter falls back to its default when the variable is unset or does
 * not parse. Set `LP_PRINT_OPTIONS=1` to print each option as it is read.
 *
 * @ingroup aux_util
 */

#pragma once

#include "lp/lp_compiler.h"

#include "util/u_logging.h"

#ifdef __cplusplus
extern "C" {
#endif


//! "1", "y", "yes", "on" and "true" in any case, everything else is false.
bool
debug_string_to_bool(const char *string);

//! Any base strtol accepts, trailing garbage gives @p _default.
long
debug_string_to_num(const char *string, long _default);

float
debug_string_to_float(const char *string, float _default);

//! Level names or their first letter, "trace" or "t" and so on.
enum u_logging_level
debug_string_to_log_level(const char *string, enum u_logging_level _default);

bool
debug_get_bool_option(const char *name, bool _default);

long
debug_get_num_option(const char *name, long _default);

float
debug_get_float_option(const char *name, float _default);

enum u_logging_level
debug_get_log_option(const char *name, enum u_logging_level _default);


/*!
 * Defines `static TYPE debug_get_KIND_option_SUFFIX(void)` that reads the
 * variable on the first call and returns the same value afterwards.
 */
#define DEBUG_GET_ONCE_OPTION(TYPE, KIND, suffix, name, _default)                                                      \
	static TYPE debug_get_##KIND##_option_##suffix(void)                                                           \
	{                                                                                                              \
		static bool gotten = false;                                                                            \
		static TYPE stored;                                                                                    \
		if (!gotten) {                                                                                         \
			stored = debug_get_##KIND##_option(name, _default);                                            \
			gotten = true;                                                                                 \
		}                                                                                                      \
		return stored;                                                                                         \
	}

#define DEBUG_GET_ONCE_BOOL_OPTION(suffix, name, _default) DEBUG_GET_ONCE_OPTION(bool, bool, suffix, name, _default)
#define DEBUG_GET_ONCE_NUM_OPTION(suffix, name, _default) DEBUG_GET_ONCE_OPTION(long, num, suffix, name, _default)
#define DEBUG_GET_ONCE_FLOAT_OPTION(suffix, name, _default) DEBUG_GET_ONCE_OPTION(float, float, suffix, name, _default)
#define DEBUG_GET_ONCE_LOG_OPTION(suffix, name, _default)                                                              \
	DEBUG_GET_ONCE_OPTION(enum u_logging_level, log, suffix, name, _default)


#ifdef __cplusplus
}
#endif
