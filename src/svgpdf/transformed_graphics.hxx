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

#include "config.hpp"
#include "graphics.hpp"

namespace svgpdf {

/**
 * @brief Path builder which transforms geometry before passing it on.
 * Allows several differently transformed shapes to form a single path.
 */
class transformed_graphics : public path_builder
{
	path_builder& target;
	matrix m;

public:
	transformed_graphics(path_builder& target, const matrix& m) :
		target(target),
		m(m)
	{}

	std::string move_to(const r4::vector2<real>& p) override;
	std::string line_to(const r4::vector2<real>& p) override;
	std::string curve_to(
		const r4::vector2<real>& cp1, //
		const r4::vector2<real>& cp2,
		const r4::vector2<real>& ep
	) override;
	std::string close_path() override;
	std::string rectangle(const r4::rectangle<real>& rect) override;
	std::string arc(
		const r4::vector2<real>& center, //
		const r4::vector2<real>& radius,
		real x_axis_rotation,
		real start_angle,
		real sweep_angle
	) override;
	std::string ellipse(const r4::vector2<real>& center, const r4::vector2<real>& radius) override;
	std::string polygon(utki::span<const r4::vector2<real>> points, bool close) override;
};

} // namespace svgpdf
