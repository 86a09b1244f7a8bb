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

#include "transformed_graphics.hxx"

#include <array>
#include <vector>

#include <utki/span.hpp>

#include "geometry.hpp"

using namespace svgpdf;

std::string transformed_graphics::move_to(const r4::vector2<real>& p)
{
	return this->target.move_to(apply(this->m, p));
}

std::string transformed_graphics::line_to(const r4::vector2<real>& p)
{
	return this->target.line_to(apply(this->m, p));
}

std::string transformed_graphics::curve_to(
	const r4::vector2<real>& cp1,
	const r4::vector2<real>& cp2,
	const r4::vector2<real>& ep
)
{
	return this->target.curve_to(apply(this->m, cp1), apply(this->m, cp2), apply(this->m, ep));
}

std::string transformed_graphics::close_path()
{
	return this->target.close_path();
}

std::string transformed_graphics::rectangle(const r4::rectangle<real>& rect)
{
	std::array<r4::vector2<real>, 4> points = {
		rect.p,
		rect.p + r4::vector2<real>{rect.d.x(), 0},
		rect.p + rect.d,
		rect.p + r4::vector2<real>{0, rect.d.y()}
	};
	return this->polygon(utki::make_span(points), true);
}

std::string transformed_graphics::arc(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	real start_angle,
	real sweep_angle
)
{
	// affine transformation of a bezier curve is the curve of transformed control points
	std::string ret;
	for (const auto& b : arc_to_beziers(center, radius, x_axis_rotation, start_angle, sweep_angle)) {
		ret.append(this->curve_to(b.cp1, b.cp2, b.end));
	}
	return ret;
}

std::string transformed_graphics::ellipse(const r4::vector2<real>& center, const r4::vector2<real>& radius)
{
	std::string ret = this->move_to(center + r4::vector2<real>{radius.x(), 0});
	for (const auto& b : ellipse_to_beziers(center, radius)) {
		ret.append(this->curve_to(b.cp1, b.cp2, b.end));
	}
	ret.append(this->close_path());
	return ret;
}

std::string transformed_graphics::polygon(utki::span<const r4::vector2<real>> points, bool close)
{
	std::vector<r4::vector2<real>> transformed;
	transformed.reserve(points.size());
	for (const auto& p : points) {
		transformed.push_back(apply(this->m, p));
	}
	return this->target.polygon(utki::make_span(transformed), close);
}
