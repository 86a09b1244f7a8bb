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
#include <string_view>

#include "config.hpp"

namespace svgpdf {

enum class alignment {
	min,
	mid,
	max
};

/**
 * @brief Parsed preserveAspectRatio attribute.
 */
struct aspect_ratio {
	// 'none' scales axes independently
	bool preserve = true;

	alignment align_x = alignment::mid;
	alignment align_y = alignment::mid;

	// 'slice' covers the whole viewport, 'meet' fits into it
	bool slice = false;
};

/**
 * @brief Parse preserveAspectRatio attribute value.
 * Empty or malformed values give the default 'xMidYMid meet'.
 */
aspect_ratio parse_aspect_ratio(std::string_view str);

/**
 * @brief Parse viewBox attribute value.
 * @return view box or nothing if the value is malformed or has non-positive dimensions.
 */
std::optional<r4::rectangle<real>> parse_view_box(std::string_view str);

/**
 * @brief Viewport fitting result.
 */
struct viewport_fit {
	r4::vector2<real> scale;
	r4::vector2<real> offset;

	/**
	 * @brief Matrix mapping view box coordinates to viewport coordinates.
	 */
	matrix to_matrix(const r4::rectangle<real>& view_box) const noexcept;
};

/**
 * @brief Fit view box into viewport.
 * @param viewport - viewport dimensions.
 * @param view_box - view box, its dimensions must be positive.
 * @param ar - aspect ratio preservation policy.
 * @return scale and offset of the view box content.
 */
viewport_fit fit_viewport(const r4::vector2<real>& viewport, const r4::rectangle<real>& view_box, const aspect_ratio& ar);

} // namespace svgpdf
