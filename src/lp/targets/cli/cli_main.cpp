// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Tool to render little planet images from equirectangular panoramas.
 */

#include "cli_common.h"

#include <stdio.h>
#include <string.h>


#define P(...) fprintf(stderr, __VA_ARGS__)

static int
cli_print_help(int argc, const char **argv)
{
	if (argc >= 2) {
		P("Little planet renderer - %s\n\n", argv[0]);
	} else {
		P("Little planet renderer\n\n");
	}

	P("Usage %s command [options]\n", argv[0]);
	P("\n");
	P("Commands:\n");
	P("  render    - Render <input> into the PNG <output>, options:\n");
	P("              --offset X Y      fractional canvas shift, 0.5 0.5 is none\n");
	P("              --rotation X Y Z  Euler angles in radians\n");
	P("              --scale S         sphere radius scale\n");
	P("              --size W H        canvas size in pixels\n");
	P("  help      - Print this help.\n");

	return 1;
}

int
main(int argc, const char **argv)
{
	if (argc <= 1) {
		return cli_print_help(argc, argv);
	}

	if (strcmp(argv[1], "render") == 0) {
		return cli_cmd_render(argc, argv);
	}

	return cli_print_help(argc, argv);
}
