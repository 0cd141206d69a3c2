// Copyright 2020-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Logging functions.
 * @ingroup aux_log
 */

#include "util/u_logging.h"
#include "util/u_debug.h"

#include <stdio.h>
#include <string.h>
#include <unistd.h>


DEBUG_GET_ONCE_LOG_OPTION(global_log, "LP_LOG", U_LOGGING_WARN)
DEBUG_GET_ONCE_BOOL_OPTION(no_colors, "LP_LOG_NO_COLORS", false)

static u_log_sink_func_t g_log_sink_func;
static void *g_log_sink_data;


/*
 *
 * Helpers.
 *
 */

static const char *
level_colour(enum u_logging_level level)
{
	switch (level) {
	case U_LOGGING_TRACE: return "\033[2m";
	case U_LOGGING_DEBUG: return "\033[36m";
	case U_LOGGING_INFO: return "\033[32m";
	case U_LOGGING_WARN: return "\033[33m";
	case U_LOGGING_ERROR: return "\033[1;31m";
	default: return "";
	}
}

static bool
use_colours(void)
{
	static bool checked = false;
	static bool colours = false;
	if (!checked) {
		checked = true;
		colours = !debug_get_bool_option_no_colors() && isatty(STDERR_FILENO);
	}
	return colours;
}

static void
print_prefix(const char *func, enum u_logging_level level)
{
	if (level == U_LOGGING_RAW) {
		return;
	}

	if (use_colours()) {
		fprintf(stderr, "%s%s\033[0m [%s] ", level_colour(level), u_logging_level_str(level), func);
	} else {
		fprintf(stderr, "%s [%s] ", u_logging_level_str(level), func);
	}
}

static void
do_print(const char *file, int line, const char *func, enum u_logging_level level, const char *format, va_list args)
{
	(void)file;
	(void)line;

	print_prefix(func, level);
	vfprintf(stderr, format, args);
	fprintf(stderr, "\n");
}


/*
 *
 * 'Exported' functions.
 *
 */

extern "C" enum u_logging_level
u_log_get_global_level(void)
{
	return debug_get_log_option_global_log();
}

extern "C" const char *
u_logging_level_str(enum u_logging_level level)
{
	switch (level) {
	case U_LOGGING_TRACE: return "TRACE";
	case U_LOGGING_DEBUG: return "DEBUG";
	case U_LOGGING_INFO: return " INFO";
	case U_LOGGING_WARN: return " WARN";
	case U_LOGGING_ERROR: return "ERROR";
	case U_LOGGING_RAW: return "  RAW";
	default: return "?????";
	}
}

extern "C" void
u_log_set_sink(u_log_sink_func_t func, void *data)
{
	g_log_sink_func = func;
	g_log_sink_data = data;
}

extern "C" void
u_log(const char *file, int line, const char *func, enum u_logging_level level, const char *format, ...)
{
	va_list args;

	if (g_log_sink_func != NULL) {
		va_start(args, format);
		g_log_sink_func(file, line, func, level, format, args, g_log_sink_data);
		va_end(args);
		return;
	}

	va_start(args, format);
	do_print(file, line, func, level, format, args);
	va_end(args);
}
