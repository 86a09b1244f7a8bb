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
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "attributes.hxx"
#include "collaborators.hpp"
#include "config.hpp"
#include "graphics.hpp"
#include "style.hxx"

namespace svgpdf {

enum class gradient_units {
	object_bounding_box,
	user_space_on_use
};

/**
 * @brief Interpretation of gradient coordinates.
 */
enum class coordinate_mode {
	// values in percent of the bounding box
	percentage,

	// lengths in user space or bounding box fractions, depending on units
	measure,

	// radial gradient only, bounding box fractions
	ratio
};

struct gradient_def {
	std::string id;

	gradient_kind kind = gradient_kind::linear;

	gradient_units units = gradient_units::object_bounding_box;
	bool units_specified = false;

	coordinate_mode mode = coordinate_mode::percentage;

	/**
	 * @brief Raw coordinates.
	 * For linear gradient: {x1, y1, x2, y2, unused}.
	 * For radial gradient: {cx, cy, fx, fy, r}.
	 * Percentages are stored without division by 100.
	 */
	std::array<real, 5> coords{};

	std::vector<gradient_stop> stops;

	std::optional<matrix> transform;

	// id of referenced gradient
	std::string href;
};

/**
 * @brief Parse gradient element attributes.
 * @param kind - kind of gradient element.
 * @param attrs - attributes of the element.
 * @param ctx - length conversion context.
 * @return gradient definition without stops.
 */
gradient_def parse_gradient(gradient_kind kind, const attribute_list& attrs, const length_context& ctx);

/**
 * @brief Parse stop element.
 * @param attrs - attributes of the stop element.
 * @param parent - style of the gradient element.
 * @param colors - color resolver.
 * @param ctx - length conversion context.
 * @return gradient stop.
 */
gradient_stop parse_stop(
	const attribute_list& attrs,
	const style& parent,
	const color_resolver& colors,
	const length_context& ctx
);

/**
 * @brief Table of gradient definitions of a document.
 */
class gradient_table
{
	std::map<std::string, gradient_def, std::less<>> gradients;

	// id of the most recently added gradient, stops are added to it
	std::string last_id;

public:
	void add(gradient_def g);

	/**
	 * @brief Add stop to the most recently added gradient.
	 */
	void add_stop(const gradient_stop& s);

	const gradient_def* find(std::string_view id) const noexcept;

	/**
	 * @brief Get gradient with inherited properties resolved.
	 * Referenced gradient supplies stops if the gradient has none, gradient units if not specified
	 * and transformation if not specified.
	 * @param id - gradient id.
	 * @return resolved gradient or nothing if there is no such gradient.
	 */
	std::optional<gradient_def> resolve(std::string_view id) const;

	/**
	 * @brief Resolve gradient into a shading for painting an element.
	 * @param id - gradient id.
	 * @param bbox - bounding box of the painted element in user space.
	 * @return shading or nothing if the gradient is unknown, has no stops or the bounding box is degenerate.
	 */
	std::optional<shading_spec> make_shading(std::string_view id, const r4::rectangle<real>& bbox) const;
};

} // namespace svgpdf
