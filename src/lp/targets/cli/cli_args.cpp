// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Option parsing for the render command.
 */

#include "cli_common.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>


#define P(...) fprintf(stderr, __VA_ARGS__)


static bool
parse_floats(int argc, const char **argv, int &i, float *out, int count)
{
	if (i + count >= argc) {
		P("Option '%s' needs %i values\n", argv[i], count);
		return false;
	}

	for (int k = 0; k < count; k++) {
		const char *str = argv[i + 1 + k];
		char *end = nullptr;
		out[k] = strtof(str, &end);
		if (end == str || *end != '\0') {
			P("Option '%s' got invalid value '%s'\n", argv[i], str);
			return false;
		}
	}

	i += count;
	return true;
}

static bool
parse_dimensions(int argc, const char **argv, int &i, uint32_t *out, int count)
{
	if (i + count >= argc) {
		P("Option '%s' needs %i values\n", argv[i], count);
		return false;
	}

	for (int k = 0; k < count; k++) {
		const char *str = argv[i + 1 + k];

		// strtoul silently negates a leading minus.
		if (str[0] < '0' || str[0] > '9') {
			P("Option '%s' got invalid value '%s'\n", argv[i], str);
			return false;
		}

		char *end = nullptr;
		errno = 0;
		unsigned long v = strtoul(str, &end, 10);
		if (*end != '\0') {
			P("Option '%s' got invalid value '%s'\n", argv[i], str);
			return false;
		}
		if (errno == ERANGE || v < 1 || v > CLI_MAX_CANVAS_SIDE) {
			P("Option '%s' value '%s' is not in [1, %u]\n", argv[i], str, CLI_MAX_CANVAS_SIDE);
			return false;
		}

		out[k] = (uint32_t)v;
	}

	i += count;
	return true;
}

bool
cli_parse_render_args(int argc, const char **argv, struct lp_projection_params *params, struct lp_size *size)
{
	for (int i = 4; i < argc; i++) {
		float values[3] = {};

		if (strcmp(argv[i], "--offset") == 0) {
			if (!parse_floats(argc, argv, i, values, 2)) {
				return false;
			}
			params->offset = {values[0], values[1]};
		} else if (strcmp(argv[i], "--rotation") == 0) {
			if (!parse_floats(argc, argv, i, values, 3)) {
				return false;
			}
			params->rotation = {values[0], values[1], values[2]};
		} else if (strcmp(argv[i], "--scale") == 0) {
			if (!parse_floats(argc, argv, i, values, 1)) {
				return false;
			}
			params->scale = values[0];
		} else if (strcmp(argv[i], "--size") == 0) {
			uint32_t dims[2] = {};
			if (!parse_dimensions(argc, argv, i, dims, 2)) {
				return false;
			}
			*size = {dims[0], dims[1]};
		} else {
			P("Unknown option '%s'\n", argv[i]);
			return false;
		}
	}

	return true;
}
