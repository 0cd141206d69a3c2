// Copyright 2020-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Leveled logging to stderr or a caller provided sink.
 *
 * The global level comes from `LP_LOG`, modules with their own level wrap the
 * `U_LOG_IFL_*` macros, see `PRJ_DEBUG` and friends.
 *
 * @ingroup aux_log
 */

#pragma once

#include "lp/lp_compiler.h"

#include <stdarg.h>


#ifdef __cplusplus
extern "C" {
#endif


/*!
 * @defgroup aux_log Logging functions
 * @ingroup aux_util
 * @{
 */

enum u_logging_level
{
	U_LOGGING_TRACE,
	U_LOGGING_DEBUG,
	U_LOGGING_INFO,
	U_LOGGING_WARN,
	U_LOGGING_ERROR,
	//! No prefix, only used for printing options.
	U_LOGGING_RAW,
};

/*!
 * Receives every message instead of stderr once set, @p args is only valid
 * during the call.
 */
typedef void (*u_log_sink_func_t)(const char *file,
                                  int line,
                                  const char *func,
                                  enum u_logging_level level,
                                  const char *format,
                                  va_list args,
                                  void *data);

void
u_log(const char *file, int line, const char *func, enum u_logging_level level, const char *format, ...)
    LP_PRINTF_FORMAT(5, 6);

//! Level set by `LP_LOG`, read once, defaults to warn.
enum u_logging_level
u_log_get_global_level(void);

//! Pass NULL to go back to printing on stderr.
void
u_log_set_sink(u_log_sink_func_t func, void *data);

//! Fixed width upper case name, " INFO", "ERROR" and so on.
const char *
u_logging_level_str(enum u_logging_level level);


#define U_LOG(level, ...)                                                                                              \
	do {                                                                                                           \
		u_log(__FILE__, __LINE__, __func__, level, __VA_ARGS__);                                               \
	} while (false)

#define U_LOG_RAW(...) U_LOG(U_LOGGING_RAW, __VA_ARGS__)

//! Log at @p level when @p cond_level lets it through.
#define U_LOG_IFL(level, cond_level, ...)                                                                              \
	do {                                                                                                           \
		if (cond_level <= level) {                                                                             \
			u_log(__FILE__, __LINE__, __func__, level, __VA_ARGS__);                                       \
		}                                                                                                      \
	} while (false)

#define U_LOG_IFL_T(cond_level, ...) U_LOG_IFL(U_LOGGING_TRACE, cond_level, __VA_ARGS__)
#define U_LOG_IFL_D(cond_level, ...) U_LOG_IFL(U_LOGGING_DEBUG, cond_level, __VA_ARGS__)
#define U_LOG_IFL_I(cond_level, ...) U_LOG_IFL(U_LOGGING_INFO, cond_level, __VA_ARGS__)
#define U_LOG_IFL_W(cond_level, ...) U_LOG_IFL(U_LOGGING_WARN, cond_level, __VA_ARGS__)
#define U_LOG_IFL_E(cond_level, ...) U_LOG_IFL(U_LOGGING_ERROR, cond_level, __VA_ARGS__)

// Against the global level.
#define U_LOG_T(...) U_LOG_IFL_T(u_log_get_global_level(), __VA_ARGS__)
#define U_LOG_D(...) U_LOG_IFL_D(u_log_get_global_level(), __VA_ARGS__)
#define U_LOG_I(...) U_LOG_IFL_I(u_log_get_global_level(), __VA_ARGS__)
#define U_LOG_W(...) U_LOG_IFL_W(u_log_get_global_level(), __VA_ARGS__)
#define U_LOG_E(...) U_LOG_IFL_E(u_log_get_global_level(), __VA_ARGS__)

/*!
 * @}
 */


#ifdef __cplusplus
}
#endif
