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

#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "geometry.hpp"
#include "graphics.hpp"

namespace svgpdf {

/**
 * @brief Elliptical arc in center parameterization.
 */
struct arc_parameters {
	r4::vector2<real> center;
	r4::vector2<real> radius;

	// radians
	real x_axis_rotation;
	real start_angle;
	real sweep_angle;
};

/**
 * @brief Convert SVG arc from endpoint to center parameterization.
 * Radii which are too small to connect the endpoints are scaled up.
 * @param start - start point of the arc.
 * @param radius - requested radii of the ellipse.
 * @param x_axis_rotation - rotation of the ellipse in degrees.
 * @param large_arc - large arc flag.
 * @param sweep - sweep flag.
 * @param end - end point of the arc.
 * @return arc parameters or nothing if the arc degenerates to a straight line or a point.
 */
std::optional<arc_parameters> endpoint_to_center(
	const r4::vector2<real>& start,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	bool large_arc,
	bool sweep,
	const r4::vector2<real>& end
);

/**
 * @brief Tight bounding box of an elliptical arc.
 */
bounding_box arc_bounding_box(const arc_parameters& arc);

struct path_result {
	std::string operators;

	// empty if the path has no geometry
	bounding_box bbox = make_empty_bounding_box();

	r4::vector2<real> current_point{0, 0};
};

/**
 * @brief Interpreter of SVG path data.
 * Emits path construction operators, painting is left to the caller.
 */
class path_interpreter
{
	path_builder& gfx;
	real min_length;

public:
	path_interpreter(path_builder& gfx, real min_length) :
		gfx(gfx),
		min_length(min_length)
	{}

	path_result interpret(std::string_view path_data) const;
};

} // namespace svgpdf
