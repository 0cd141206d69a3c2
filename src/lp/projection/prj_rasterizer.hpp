// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Parallel resampling rasterizer.
 * @ingroup projection
 */

#pragma once

#include "lp/lp_frame.h"
#include "lp/lp_results.h"

#include "util/u_worker.hpp"

#include "projection/prj_model.hpp"


namespace lp::projection {

/*!
 * Fills a canvas by projecting every pixel into a source frame and sampling
 * it, rows are split into bands that run on a worker pool.
 *
 * The calling thread joins in on the work, so a pool without threads still
 * renders.
 */
class Rasterizer
{
public:
	/*!
	 * @param pool       Pool the bands run on.
	 * @param band_count Upper bound of bands per render, clamped to [1, @ref TaskCollection::kSize].
	 */
	explicit Rasterizer(const lp::auxiliary::util::SharedThreadPool &pool,
	                    size_t band_count = lp::auxiliary::util::TaskCollection::kSize);

	/*!
	 * Check that @p source can be sampled and that a canvas of @p canvas_size
	 * can be rendered from it with @p params.
	 */
	static lp_result_t
	check(const lp_frame *source, const Parameters &params, const lp_size &canvas_size) noexcept;

	/*!
	 * Render every pixel of @p canvas, which must be R8G8B8 and the size of
	 * the model's canvas.
	 *
	 * @throws std::invalid_argument if the frames do not match the model.
	 */
	void
	render(const lp_frame &source, const ProjectionModel &model, lp_frame &canvas) const;

	/*!
	 * Allocate a new canvas and render into it.
	 *
	 * @param[out] out_frame Receives the new canvas, with a reference count of one.
	 *
	 * @throws std::invalid_argument, std::domain_error, std::bad_alloc.
	 */
	void
	renderToNewFrame(const lp_frame &source,
	                 const Parameters &params,
	                 const lp_size &canvas_size,
	                 lp_frame **out_frame) const;

	/*!
	 * Render the rows [@p row_begin, @p row_end) on the calling thread.
	 */
	static void
	renderRows(const lp_frame &source,
	           const ProjectionModel &model,
	           lp_frame &canvas,
	           uint32_t row_begin,
	           uint32_t row_end);

	size_t
	bandCount() const
	{
		return band_count_;
	}


private:
	lp::auxiliary::util::SharedThreadPool pool_;
	size_t band_count_;
};

} // namespace lp::projection
