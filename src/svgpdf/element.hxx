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

#include "attributes.hxx"
#include "config.hpp"
#include "geometry.hpp"
#include "graphics.hpp"

namespace svgpdf {

/**
 * @brief Kinds of elements recognized by the dispatcher.
 */
enum class element_kind {
	svg,
	g,
	defs,
	clip_path,
	linear_gradient,
	radial_gradient,
	stop,
	use,
	path,
	rect,
	circle,
	ellipse,
	line,
	polyline,
	polygon,
	image,
	text,
	tspan,

	// no action for the element itself, its children are visited
	unknown
};

/**
 * @brief Get element kind by element name.
 * @param name - element name without namespace prefix.
 */
element_kind to_element_kind(std::string_view name) noexcept;

bool is_shape(element_kind kind) noexcept;

/**
 * @brief Check if element uses its x and y attributes as its position.
 * For other elements x and y act as translation.
 */
bool uses_position(element_kind kind) noexcept;

struct shape_geometry {
	std::string operators;
	bounding_box bbox = make_empty_bounding_box();
};

/**
 * @brief Context for resolving shape lengths.
 */
struct shape_context {
	length_context lengths;

	// reference for percentage lengths
	r4::vector2<real> viewport;

	real min_length;

	length_context horizontal() const noexcept;
	length_context vertical() const noexcept;
	length_context diagonal() const noexcept;
};

/**
 * @brief Build path of a shape element.
 * @param kind - shape kind.
 * @param attrs - shape attributes.
 * @param gfx - builder to emit path construction operators with.
 * @param ctx - length context.
 * @return path of the shape or nothing if the shape has no geometry, e.g. zero size rectangle.
 */
std::optional<shape_geometry> make_shape_geometry(
	element_kind kind,
	const attribute_list& attrs,
	path_builder& gfx,
	const shape_context& ctx
);

} // namespace svgpdf
