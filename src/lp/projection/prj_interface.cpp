// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Wrap the projection renderer for C.
 * @ingroup projection
 */

#include "math/m_api.h"
#include "math/m_eigen_interop.hpp"

#include "projection/prj_config.hpp"
#include "projection/prj_interface.h"
#include "projection/prj_rasterizer.hpp"

#include <new>
#include <stdexcept>


using lp::auxiliary::math::map_vec2;
using lp::auxiliary::util::SharedThreadPool;
using lp::projection::Parameters;
using lp::projection::ProjectionModel;
using lp::projection::Rasterizer;

#define DEFAULT_CATCH()                                                                                                \
	catch (std::bad_alloc const &)                                                                                 \
	{                                                                                                              \
		PRJ_ERROR("Out of memory");                                                                            \
		return LP_ERROR_ALLOCATION;                                                                            \
	}                                                                                                              \
	catch (std::domain_error const &e)                                                                             \
	{                                                                                                              \
		PRJ_ERROR("Caught exception: %s", e.what());                                                           \
		return LP_ERROR_DEGENERATE_RADIUS;                                                                     \
	}                                                                                                              \
	catch (std::exception const &e)                                                                                \
	{                                                                                                              \
		PRJ_ERROR("Caught exception: %s", e.what());                                                           \
		return LP_ERROR_INVALID_PARAMETERS;                                                                    \
	}


static SharedThreadPool &
get_pool()
{
	static SharedThreadPool pool{lp::projection::getThreadCount(), lp::projection::getThreadCount(), "Projection"};
	return pool;
}

void
lp_projection_params_default(struct lp_projection_params *out_params)
{
	out_params->offset = {lp::projection::kDefaultOffsetX, lp::projection::kDefaultOffsetY};
	out_params->rotation = {lp::projection::kDefaultRotationX, lp::projection::kDefaultRotationY,
	                        lp::projection::kDefaultRotationZ};
	out_params->scale = lp::projection::kDefaultScale;
}

void
lp_projection_params_from_env(struct lp_projection_params *out_params)
{
	*out_params = lp::projection::getEnvParameters();
}

struct lp_size
lp_projection_default_canvas_size(void)
{
	return lp::projection::getDefaultCanvasSize();
}

lp_result_t
lp_projection_render(struct lp_frame *src,
                     const struct lp_projection_params *params,
                     struct lp_size canvas_size,
                     struct lp_frame **out_frame)
{
	if (params == nullptr || out_frame == nullptr) {
		return LP_ERROR_INVALID_PARAMETERS;
	}
	if (!math_vec3_validate(&params->rotation)) {
		PRJ_WARN("Rotation angles are not finite");
		return LP_ERROR_INVALID_PARAMETERS;
	}

	try {
		Parameters p = Parameters::fromC(*params);

		lp_result_t ret = Rasterizer::check(src, p, canvas_size);
		if (ret != LP_SUCCESS) {
			PRJ_WARN("Refusing to render: %s", lp_result_str(ret));
			return ret;
		}

		Rasterizer rasterizer{get_pool()};

		lp_frame *canvas = nullptr;
		rasterizer.renderToNewFrame(*src, p, canvas_size, &canvas);

		lp_frame_reference(out_frame, canvas);
		lp_frame_reference(&canvas, nullptr);

		return LP_SUCCESS;
	}
	DEFAULT_CATCH()
}

lp_result_t
lp_projection_project_point(struct lp_size image_size,
                            struct lp_size canvas_size,
                            const struct lp_projection_params *params,
                            struct lp_vec2 canvas_point,
                            struct lp_vec2 *out_image_point)
{
	if (params == nullptr || out_image_point == nullptr) {
		return LP_ERROR_INVALID_PARAMETERS;
	}
	if (!math_vec3_validate(&params->rotation)) {
		PRJ_WARN("Rotation angles are not finite");
		return LP_ERROR_INVALID_PARAMETERS;
	}

	try {
		Parameters p = Parameters::fromC(*params);

		lp_result_t ret = ProjectionModel::check(image_size, canvas_size, p);
		if (ret != LP_SUCCESS) {
			return ret;
		}

		ProjectionModel model{image_size, canvas_size, p};
		map_vec2(*out_image_point) = model.project(map_vec2(canvas_point));

		return LP_SUCCESS;
	}
	DEFAULT_CATCH()
}

const char *
lp_result_str(lp_result_t ret)
{
	switch (ret) {
	case LP_SUCCESS: return "LP_SUCCESS";
	case LP_ERROR_INVALID_DIMENSIONS: return "LP_ERROR_INVALID_DIMENSIONS";
	case LP_ERROR_DEGENERATE_RADIUS: return "LP_ERROR_DEGENERATE_RADIUS";
	case LP_ERROR_INVALID_PARAMETERS: return "LP_ERROR_INVALID_PARAMETERS";
	case LP_ERROR_UNSUPPORTED_FORMAT: return "LP_ERROR_UNSUPPORTED_FORMAT";
	case LP_ERROR_ALLOCATION: return "LP_ERROR_ALLOCATION";
	}
	return "LP_ERROR_UNKNOWN";
}
