// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Simple @ref lp_frame wrapper around a cv::Mat.
 */

#pragma once

#include "lp/lp_frame.h"

#include <opencv2/core.hpp>


namespace lp::targets::cli {

class FrameMat
{
public:
	// Exposed to the C api.
	struct lp_frame frame = {};

	// The cv::Mat that holds the data.
	cv::Mat matrix = cv::Mat();


	/*!
	 * Only public due to C needed to destroy it.
	 */
	~FrameMat() = default;

	/*!
	 * Wraps the given cv::Mat assuming it's a 24bit RGB format matrix. If
	 * @p fm_out is not `nullptr` it will have its reference count decremented.
	 */
	static void
	wrapR8G8B8(const cv::Mat &mat, lp_frame **fm_out);


private:
	FrameMat() = default;

	void
	fillInFields(cv::Mat mat, lp_format format);
};

} // namespace lp::targets::cli
