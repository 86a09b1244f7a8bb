/*
The MIT License (MIT)

Copyright (c) 2015-2024 Ivan Gagis <igagis@gmail.com>

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.

*/

/* ================ LICENSE END ================ */

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <utki/span.hpp>

#include "config.hpp"

namespace svgpdf {

/**
 * @brief Device RGB color.
 */
struct color {
	/**
	 * @brief Red, green and blue components in range [0, 1].
	 */
	r4::vector3<real> rgb{0, 0, 0};

	/**
	 * @brief Alpha carried by the color token itself, e.g. 'transparent'.
	 */
	real alpha = 1;
};

enum class fill_rule {
	nonzero,
	evenodd
};

enum class line_cap {
	butt,
	round,
	square
};

enum class line_join {
	miter,
	round,
	bevel
};

struct line_style {
	real width = 1;
	line_cap cap = line_cap::butt;
	line_join join = line_join::miter;
	real miter_limit = 4;

	// empty means solid line
	std::vector<real> dash_array;
	real dash_offset = 0;
};

/**
 * @brief Path painting operation.
 */
enum class paint_op {
	none,
	fill,
	stroke,
	fill_stroke
};

struct gradient_stop {
	real offset = 0;
	svgpdf::color color;
	real opacity = 1;
};

enum class gradient_kind {
	linear,
	radial
};

/**
 * @brief Shading description.
 * Coordinates are given in the unit square which is mapped to user space by the placement matrix.
 */
struct shading_spec {
	gradient_kind kind = gradient_kind::linear;

	/**
	 * @brief Shading coordinates.
	 * For linear gradient: {x1, y1, x2, y2, unused}.
	 * For radial gradient: {cx, cy, fx, fy, r}.
	 */
	std::array<real, 5> coords{0, 0, 1, 0, 0};

	/**
	 * @brief Matrix mapping the unit square to current user space.
	 */
	matrix placement{
		{1, 0, 0},
		{0, 1, 0}
	};

	/**
	 * @brief Stops sorted by offset.
	 */
	std::vector<gradient_stop> stops;
};

/**
 * @brief Path construction operator emitter.
 * All methods return operator text to be appended to a content stream.
 * Every returned fragment ends with a line break.
 * Coordinates are in current user space.
 */
class path_builder
{
public:
	path_builder() = default;

	path_builder(const path_builder&) = delete;
	path_builder& operator=(const path_builder&) = delete;

	path_builder(path_builder&&) = delete;
	path_builder& operator=(path_builder&&) = delete;

	virtual ~path_builder() = default;

	virtual std::string move_to(const r4::vector2<real>& p) = 0;

	virtual std::string line_to(const r4::vector2<real>& p) = 0;

	virtual std::string curve_to(
		const r4::vector2<real>& cp1, //
		const r4::vector2<real>& cp2,
		const r4::vector2<real>& ep
	) = 0;

	virtual std::string close_path() = 0;

	virtual std::string rectangle(const r4::rectangle<real>& rect) = 0;

	/**
	 * @brief Elliptical arc.
	 * The arc starts at the current point which is expected to be the arc's start point.
	 * @param center - center of the ellipse.
	 * @param radius - radii of the ellipse.
	 * @param x_axis_rotation - rotation of the ellipse in radians.
	 * @param start_angle - start angle in radians.
	 * @param sweep_angle - sweep angle in radians, positive sweep goes from x-axis towards y-axis.
	 */
	virtual std::string arc(
		const r4::vector2<real>& center, //
		const r4::vector2<real>& radius,
		real x_axis_rotation,
		real start_angle,
		real sweep_angle
	) = 0;

	/**
	 * @brief Closed ellipse as a separate subpath.
	 */
	virtual std::string ellipse(const r4::vector2<real>& center, const r4::vector2<real>& radius) = 0;

	virtual std::string polygon(utki::span<const r4::vector2<real>> points, bool close) = 0;
};

/**
 * @brief Content stream operator emitter.
 * Adds state, painting and clipping operators to path construction.
 */
class graphics : public path_builder
{
public:
	/**
	 * @brief Save graphics state.
	 */
	virtual std::string save() = 0;

	/**
	 * @brief Restore graphics state.
	 */
	virtual std::string restore() = 0;

	/**
	 * @brief Concatenate matrix to current transformation matrix.
	 */
	virtual std::string transform(const matrix& m) = 0;

	virtual std::string paint(paint_op op, fill_rule rule) = 0;

	/**
	 * @brief Intersect clipping region with current path and end the path.
	 */
	virtual std::string clip(fill_rule rule) = 0;

	virtual std::string set_fill_color(const color& c) = 0;

	virtual std::string set_stroke_color(const color& c) = 0;

	virtual std::string set_line_style(const line_style& style) = 0;

	/**
	 * @brief Set opacity and blend mode.
	 * @param id - object id for the graphics state resource.
	 * @param fill_alpha - non-stroking alpha.
	 * @param stroke_alpha - stroking alpha.
	 * @param blend_mode - PDF blend mode name.
	 */
	virtual std::string set_alpha(unsigned id, real fill_alpha, real stroke_alpha, std::string_view blend_mode) = 0;

	/**
	 * @brief Paint shading over current clipping region.
	 * @param id - object id for the shading resource.
	 * @param spec - shading description.
	 */
	virtual std::string shading(unsigned id, const shading_spec& spec) = 0;
};

} // namespace svgpdf
