// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Parallel resampling rasterizer.
 * @ingroup projection
 */

#include "os/os_time.h"
#include "util/u_frame.h"
#include "util/u_format.h"

#include "projection/prj_config.hpp"
#include "projection/prj_sampler.hpp"
#include "projection/prj_rasterizer.hpp"

#include <algorithm>
#include <vector>
#include <stdexcept>


namespace lp::projection {

using lp::auxiliary::util::SharedThreadGroup;
using lp::auxiliary::util::SharedThreadPool;
using lp::auxiliary::util::TaskCollection;


static lp_result_t
check_source(const lp_frame *source)
{
	if (source == nullptr || source->width == 0 || source->height == 0 || source->data == nullptr) {
		return LP_ERROR_INVALID_DIMENSIONS;
	}

	if (!u_format_is_rgb_readable(source->format)) {
		return LP_ERROR_UNSUPPORTED_FORMAT;
	}

	return LP_SUCCESS;
}

Rasterizer::Rasterizer(const SharedThreadPool &pool, size_t band_count)
    : pool_(pool), band_count_(std::clamp<size_t>(band_count, 1, TaskCollection::kSize))
{}

lp_result_t
Rasterizer::check(const lp_frame *source, const Parameters &params, const lp_size &canvas_size) noexcept
{
	lp_result_t ret = check_source(source);
	if (ret != LP_SUCCESS) {
		return ret;
	}

	return ProjectionModel::check({source->width, source->height}, canvas_size, params);
}

void
Rasterizer::renderRows(
    const lp_frame &source, const ProjectionModel &model, lp_frame &canvas, uint32_t row_begin, uint32_t row_end)
{
	for (uint32_t y = row_begin; y < row_end; y++) {
		uint8_t *row = canvas.data + static_cast<size_t>(y) * canvas.stride;

		for (uint32_t x = 0; x < canvas.width; x++) {
			const Eigen::Vector2f image = model.project({static_cast<float>(x), static_cast<float>(y)});
			const lp_colour_rgb_u8 c = sample_bilinear(source, image.x(), image.y());

			uint8_t *p = row + static_cast<size_t>(x) * 3;
			p[0] = c.r;
			p[1] = c.g;
			p[2] = c.b;
		}
	}
}

void
Rasterizer::render(const lp_frame &source, const ProjectionModel &model, lp_frame &canvas) const
{
	throwOnError(check_source(&source), "Rasterizer source");

	if (source.width != model.imageSize().w || source.height != model.imageSize().h) {
		throw std::invalid_argument("Rasterizer: source does not match the model image size");
	}
	if (canvas.format != LP_FORMAT_R8G8B8 || canvas.data == nullptr) {
		throw std::invalid_argument("Rasterizer: canvas must be an allocated R8G8B8 frame");
	}
	if (canvas.width != model.canvasSize().w || canvas.height != model.canvasSize().h) {
		throw std::invalid_argument("Rasterizer: canvas does not match the model canvas size");
	}

	const uint64_t start_ns = os_monotonic_get_ns();

	const uint32_t height = canvas.height;
	const uint32_t bands = static_cast<uint32_t>(std::min<size_t>(band_count_, height));
	const uint32_t rows_per_band = (height + bands - 1) / bands;

	std::vector<TaskCollection::Functor> funcs;
	funcs.reserve(bands);
	for (uint32_t begin = 0; begin < height; begin += rows_per_band) {
		const uint32_t end = std::min(begin + rows_per_band, height);
		funcs.push_back([&source, &model, &canvas, begin, end] { //
			renderRows(source, model, canvas, begin, end);
		});
	}

	{
		SharedThreadGroup group{pool_};
		TaskCollection tasks{group, funcs};
		tasks.waitAll();
	}

	PRJ_DEBUG("Rendered %ux%u canvas from %ux%u %s in %.2fms over %u bands", canvas.width, canvas.height,
	          source.width, source.height, u_format_str(source.format),
	          os_ns_to_ms_f64(os_monotonic_get_ns() - start_ns), static_cast<uint32_t>(funcs.size()));
}

void
Rasterizer::renderToNewFrame(const lp_frame &source,
                             const Parameters &params,
                             const lp_size &canvas_size,
                             lp_frame **out_frame) const
{
	const ProjectionModel model{{source.width, source.height}, canvas_size, params};

	lp_frame *canvas = nullptr;
	throwOnError(u_frame_create_one_off(LP_FORMAT_R8G8B8, canvas_size.w, canvas_size.h, &canvas),
	             "Rasterizer canvas");

	try {
		render(source, model, *canvas);
	} catch (...) {
		lp_frame_reference(&canvas, nullptr);
		throw;
	}

	*out_frame = canvas;
}

} // namespace lp::projection
