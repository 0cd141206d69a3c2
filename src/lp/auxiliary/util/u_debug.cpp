// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Small debug helpers.
 * @ingroup aux_util
 *
 * Debug get option helpers heavily inspired from mesa ones.
 */

#include "util/u_debug.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>


/*
 *
 * Helpers.
 *
 */

static bool
print_options(void)
{
	// Can not use the DEBUG_GET_ONCE macros here, they would recurse.
	static bool gotten = false;
	static bool stored = false;
	if (!gotten) {
		gotten = true;
		stored = debug_string_to_bool(getenv("LP_PRINT_OPTIONS"));
	}
	return stored;
}

static const char *
os_getenv(const char *name)
{
	return getenv(name);
}

#define DEBUG_PRINT(name, value, def)                                                                                  \
	do {                                                                                                           \
		if (print_options()) {                                                                                 \
			U_LOG_RAW("%s=%s (%s)", name, value, def);                                                     \
		}                                                                                                      \
	} while (false)


/*
 *
 * 'Exported' conversion functions.
 *
 */

extern "C" bool
debug_string_to_bool(const char *string)
{
	if (string == NULL) {
		return false;
	}
	if (strcasecmp(string, "false") == 0 || strcasecmp(string, "off") == 0 || strcasecmp(string, "no") == 0 ||
	    strcmp(string, "n") == 0 || strcmp(string, "0") == 0) {
		return false;
	}
	if (strcasecmp(string, "true") == 0 || strcasecmp(string, "on") == 0 || strcasecmp(string, "yes") == 0 ||
	    strcmp(string, "y") == 0 || strcmp(string, "1") == 0) {
		return true;
	}
	return false;
}

extern "C" long
debug_string_to_num(const char *string, long _default)
{
	if (string == NULL || string[0] == '\0') {
		return _default;
	}

	char *endptr = NULL;
	long ret = strtol(string, &endptr, 0);

	// Restore the default value when no digits were found.
	if (endptr == string || *endptr != '\0') {
		return _default;
	}

	return ret;
}

extern "C" float
debug_string_to_float(const char *string, float _default)
{
	if (string == NULL || string[0] == '\0') {
		return _default;
	}

	char *endptr = NULL;
	float ret = strtof(string, &endptr);

	// Restore the default value when no digits were found.
	if (endptr == string || *endptr != '\0') {
		return _default;
	}

	return ret;
}

extern "C" enum u_logging_level
debug_string_to_log_level(const char *string, enum u_logging_level _default)
{
	if (string == NULL) {
		return _default;
	}
	if (strcasecmp(string, "trace") == 0 || strcasecmp(string, "t") == 0) {
		return U_LOGGING_TRACE;
	}
	if (strcasecmp(string, "debug") == 0 || strcasecmp(string, "d") == 0) {
		return U_LOGGING_DEBUG;
	}
	if (strcasecmp(string, "info") == 0 || strcasecmp(string, "i") == 0) {
		return U_LOGGING_INFO;
	}
	if (strcasecmp(string, "warn") == 0 || strcasecmp(string, "w") == 0) {
		return U_LOGGING_WARN;
	}
	if (strcasecmp(string, "error") == 0 || strcasecmp(string, "e") == 0) {
		return U_LOGGING_ERROR;
	}
	return _default;
}


/*
 *
 * 'Exported' get functions.
 *
 */

extern "C" bool
debug_get_bool_option(const char *name, bool _default)
{
	const char *raw = os_getenv(name);
	bool ret = raw == NULL ? _default : debug_string_to_bool(raw);

	DEBUG_PRINT(name, raw != NULL ? raw : "(nil)", _default ? "true" : "false");

	return ret;
}

extern "C" long
debug_get_num_option(const char *name, long _default)
{
	const char *raw = os_getenv(name);
	long ret = debug_string_to_num(raw, _default);

	if (print_options()) {
		U_LOG_RAW("%s=%s (%ld)", name, raw != NULL ? raw : "(nil)", _default);
	}

	return ret;
}

extern "C" float
debug_get_float_option(const char *name, float _default)
{
	const char *raw = os_getenv(name);
	float ret = debug_string_to_float(raw, _default);

	if (print_options()) {
		U_LOG_RAW("%s=%s (%f)", name, raw != NULL ? raw : "(nil)", (double)_default);
	}

	return ret;
}

extern "C" enum u_logging_level
debug_get_log_option(const char *name, enum u_logging_level _default)
{
	const char *raw = os_getenv(name);
	enum u_logging_level ret = debug_string_to_log_level(raw, _default);

	DEBUG_PRINT(name, raw != NULL ? raw : "(nil)", u_logging_level_str(_default));

	return ret;
}
