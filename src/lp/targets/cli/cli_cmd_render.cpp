// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Render an image file into a little planet PNG.
 */

#include "util/u_logging.h"

#include "projection/prj_interface.h"

#include "cli_common.h"
#include "cli_frame_mat.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <stdio.h>

#include <string>
#include <exception>


#define P(...) fprintf(stderr, __VA_ARGS__)

using lp::targets::cli::FrameMat;


static int
render(const char *input, const char *output, const struct lp_projection_params &params, struct lp_size size)
{
	cv::Mat bgr = cv::imread(input, cv::IMREAD_COLOR);
	if (bgr.empty()) {
		P("Could not read image '%s'\n", input);
		return 1;
	}

	cv::Mat rgb;
	cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

	struct lp_frame *src = NULL;
	FrameMat::wrapR8G8B8(rgb, &src);

	struct lp_frame *canvas = NULL;
	lp_result_t ret = lp_projection_render(src, &params, size, &canvas);
	lp_frame_reference(&src, NULL);

	if (ret != LP_SUCCESS) {
		P("Render failed: %s\n", lp_result_str(ret));
		return 1;
	}

	// Wrap the canvas without copying, then swap back to BGR for OpenCV.
	cv::Mat canvas_rgb((int)canvas->height, (int)canvas->width, CV_8UC3, canvas->data, canvas->stride);
	cv::Mat canvas_bgr;
	cv::cvtColor(canvas_rgb, canvas_bgr, cv::COLOR_RGB2BGR);
	lp_frame_reference(&canvas, NULL);

	if (!cv::imwrite(output, canvas_bgr)) {
		P("Could not write image '%s'\n", output);
		return 1;
	}

	U_LOG_I("Wrote %ux%u image to '%s'", size.w, size.h, output);

	return 0;
}

int
cli_cmd_render(int argc, const char **argv)
{
	if (argc < 4) {
		P("Usage: %s render <input> <output.png> [options]\n", argv[0]);
		return 1;
	}

	struct lp_projection_params params;
	lp_projection_params_from_env(&params);
	struct lp_size size = lp_projection_default_canvas_size();

	if (!cli_parse_render_args(argc, argv, &params, &size)) {
		return 1;
	}

	try {
		return render(argv[2], argv[3], params, size);
	} catch (const cv::Exception &e) {
		P("OpenCV error: %s\n", e.what());
		return 1;
	} catch (const std::exception &e) {
		P("Error: %s\n", e.what());
		return 1;
	}
}
