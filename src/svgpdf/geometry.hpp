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
#include <optional>
#include <string_view>
#include <vector>

#include <svgdom/length.hpp>

#include "config.hpp"

namespace svgpdf {

matrix make_matrix(real a, real b, real c, real d, real e, real f) noexcept;

matrix identity_matrix() noexcept;

matrix translation_matrix(const r4::vector2<real>& t) noexcept;

matrix scale_matrix(const r4::vector2<real>& s) noexcept;

/**
 * @brief Get matrix coefficients in PDF order.
 * @param m - matrix.
 * @return array of {a, b, c, d, e, f}.
 */
std::array<real, 6> to_coefficients(const matrix& m) noexcept;

/**
 * @brief Matrix product.
 * Applied to a point the right operand acts first: (l * r) * p = l * (r * p).
 * @param l - left operand.
 * @param r - right operand.
 * @return product matrix.
 */
matrix multiply(const matrix& l, const matrix& r) noexcept;

r4::vector2<real> apply(const matrix& m, const r4::vector2<real>& p) noexcept;

/**
 * @brief Invert affine matrix.
 * @param m - matrix to invert.
 * @return inverted matrix or nothing if the matrix is singular.
 */
std::optional<matrix> invert(const matrix& m) noexcept;

bool is_identity(const matrix& m) noexcept;

/**
 * @brief Convert matrix to PDF page space.
 * The argument maps to top-down page coordinates, the result maps to PDF
 * bottom-up coordinates of a page with given height.
 * @param m - matrix mapping to top-down page coordinates.
 * @param page_height - height of the page.
 * @return F * m, where F = [1, 0, 0, -1, 0, page_height].
 */
matrix flip(const matrix& m, real page_height) noexcept;

/**
 * @brief Signed angle between two vectors.
 * @return angle in radians from u to v, in range [-pi, pi].
 */
real vectors_angle(const r4::vector2<real>& u, const r4::vector2<real>& v) noexcept;

/**
 * @brief Cubic bezier segment, starts at the end point of the previous segment.
 */
struct bezier_segment {
	r4::vector2<real> cp1;
	r4::vector2<real> cp2;
	r4::vector2<real> end;
};

/**
 * @brief Control point distance of cubic bezier approximating unit circle arc.
 * The curve matches the arc at its middle point and has the arc's tangents at the ends.
 * @param sweep_angle - sweep angle of the arc in radians, 90 degrees at most.
 * @return distance of control points from the end points along the tangents.
 */
real arc_bezier_param(real sweep_angle) noexcept;

/**
 * @brief Approximate elliptical arc with cubic bezier segments.
 * Each segment spans 90 degrees at most.
 * @param center - center of the ellipse.
 * @param radius - radii of the ellipse.
 * @param x_axis_rotation - rotation of the ellipse in radians.
 * @param start_angle - start angle in radians.
 * @param sweep_angle - sweep angle in radians.
 * @return bezier segments starting at the arc's start point.
 */
std::vector<bezier_segment> arc_to_beziers(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	real start_angle,
	real sweep_angle
);

/**
 * @brief Approximate full ellipse with four cubic bezier segments.
 * The segments start at point center + {radius.x(), 0}.
 */
std::array<bezier_segment, 4> ellipse_to_beziers(const r4::vector2<real>& center, const r4::vector2<real>& radius);

bounding_box make_empty_bounding_box() noexcept;

bool is_empty(const bounding_box& bb) noexcept;

void unite(bounding_box& bb, const r4::vector2<real>& p) noexcept;

void unite(bounding_box& bb, const bounding_box& other) noexcept;

bounding_box transform(const matrix& m, const bounding_box& bb) noexcept;

r4::rectangle<real> to_rectangle(const bounding_box& bb) noexcept;

/**
 * @brief Parse a length with optional unit suffix.
 * @param str - string to parse.
 * @return parsed length or nothing if the string is not a length.
 */
std::optional<svgdom::length> parse_length(std::string_view str);

/**
 * @brief Context for converting lengths to user units.
 */
struct length_context {
	real dpi = 96;

	// em size in user units
	real font_size = 16;

	// 100% corresponds to this value
	real percent_reference = 0;
};

/**
 * @brief Convert length to user units (SVG px).
 * @param l - length to convert.
 * @param ctx - conversion context.
 * @return length in user units.
 */
real to_user_units(const svgdom::length& l, const length_context& ctx) noexcept;

/**
 * @brief Parse length and convert it to user units.
 * @param str - string to parse.
 * @param ctx - conversion context.
 * @param default_value - value to return if the string is not a length.
 * @return length in user units.
 */
real parse_user_units(std::string_view str, const length_context& ctx, real default_value = 0);

} // namespace svgpdf
