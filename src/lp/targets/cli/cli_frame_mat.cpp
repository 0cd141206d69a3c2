// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Simple @ref lp_frame wrapper around a cv::Mat.
 */

#include "cli_frame_mat.hpp"

#include <stdexcept>


namespace lp::targets::cli {

extern "C" void
frame_mat_destroy(struct lp_frame *lf)
{
	FrameMat *fm = (FrameMat *)lf->owner;
	delete fm;
}

void
FrameMat::fillInFields(cv::Mat mat, lp_format format)
{
	uint32_t width = (uint32_t)mat.cols;
	uint32_t height = (uint32_t)mat.rows;
	size_t stride = mat.step[0];

	this->matrix = mat;

	// Main wrapping of cv::Mat by frame.
	lp_frame &f = this->frame;
	f.reference.count = 1;
	f.destroy = frame_mat_destroy;
	f.owner = this;
	f.data = mat.ptr<uint8_t>();
	f.format = format;
	f.width = width;
	f.height = height;
	f.stride = stride;
	f.size = stride * height;
}

void
FrameMat::wrapR8G8B8(const cv::Mat &mat, lp_frame **fm_out)
{
	if (mat.type() != CV_8UC3) {
		throw std::invalid_argument("FrameMat: expected a CV_8UC3 matrix");
	}

	FrameMat *fm = new FrameMat();
	fm->fillInFields(mat, LP_FORMAT_R8G8B8);

	// Unreference any old frames.
	lp_frame_reference(fm_out, NULL);

	// Already has a ref count of one.
	*fm_out = &fm->frame;
}

} // namespace lp::targets::cli
