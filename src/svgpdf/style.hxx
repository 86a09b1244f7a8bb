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

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <svgdom/elements/styleable.hpp>

#include "attributes.hxx"
#include "collaborators.hpp"
#include "config.hpp"
#include "geometry.hpp"
#include "graphics.hpp"

namespace svgpdf {

using style_property = svgdom::style_property;

/**
 * @brief Get initial value of a property.
 * @return initial value or empty string if the property has no meaningful initial value.
 */
std::string_view get_initial_value(style_property p) noexcept;

/**
 * @brief Parse inline style declarations.
 * @param str - declarations, e.g. "fill: red; stroke: blue".
 * @return list of name-value pairs in declaration order.
 */
std::vector<std::pair<std::string, std::string>> parse_style_declarations(std::string_view str);

/**
 * @brief Convert CSS blend mode name to PDF blend mode name.
 * @param css_name - blend mode in CSS notation, case insensitive.
 * @return PDF name, 'Normal' for unknown modes.
 */
std::string_view to_pdf_blend_mode(std::string_view css_name) noexcept;

/**
 * @brief Resolved paint of fill or stroke.
 */
struct paint {
	enum class type {
		none,
		color,
		gradient
	};

	type kind = type::none;

	svgpdf::color color;

	// for gradient paint
	std::string gradient_id;

	// color to use if the gradient does not exist
	std::optional<svgpdf::color> fallback;
};

/**
 * @brief Computed style of an element.
 */
class style
{
	std::map<style_property, std::string> values;

	// CSS name of mix-blend-mode, it is inherited
	std::string blend_mode = "normal";

	// computed font size in user units
	real font_size_px;

	// font size of 'medium' keyword
	real medium_font_size;

	// declarations of properties which are not known
	std::map<std::string, std::string, std::less<>> extra;

public:
	/**
	 * @brief Create root style with default property values.
	 * @param font_size - font size of 'medium' keyword, in user units.
	 */
	explicit style(real font_size = 16);

	/**
	 * @brief Compute style of a child element.
	 * Inherited properties are taken from this style, others are reset to defaults.
	 * Presentation attribute takes precedence over inline style declaration of the same property.
	 * @param attrs - attributes of the child element.
	 * @param ctx - length conversion context, font size is ignored.
	 * @return computed style of the child element.
	 */
	style derive(const attribute_list& attrs, const length_context& ctx) const;

	/**
	 * @brief Get property value.
	 * @return property value or empty string if the property is not set.
	 */
	const std::string& get(style_property p) const noexcept;

	void set(style_property p, std::string value)
	{
		this->values[p] = std::move(value);
	}

	/**
	 * @brief Get declaration of a property which is not known.
	 * @return value or nullptr.
	 */
	const std::string* get_extra(std::string_view name) const noexcept;

	real get_font_size() const noexcept
	{
		return this->font_size_px;
	}

	length_context make_length_context(real dpi, real percent_reference = 0) const noexcept
	{
		return length_context{dpi, this->font_size_px, percent_reference};
	}

	/**
	 * @brief Get numeric property, percentages are converted to fractions.
	 * @return parsed value or default value if property is not a number.
	 */
	real get_number(style_property p, real default_value) const;

	/**
	 * @brief Get opacity property clamped to [0, 1].
	 */
	real get_opacity(style_property p) const;

	/**
	 * @brief Resolve fill or stroke paint.
	 * 'currentColor' is resolved to the 'color' property.
	 */
	svgpdf::paint get_paint(style_property p, const color_resolver& colors) const;

	/**
	 * @brief Resolve color property, e.g. stop-color.
	 * @return color or nothing if the value is 'none' or not a color.
	 */
	std::optional<svgpdf::color> get_color(style_property p, const color_resolver& colors) const;

	fill_rule get_fill_rule(style_property p) const noexcept;

	line_style get_line_style(const length_context& ctx) const;

	/**
	 * @brief Check if element is hidden by visibility property.
	 */
	bool is_invisible() const noexcept;

	/**
	 * @brief Check if element is not displayed.
	 */
	bool is_not_displayed() const noexcept;

	/**
	 * @brief Get PDF name of the blend mode.
	 */
	std::string_view get_blend_mode() const noexcept;

	text_direction get_direction() const noexcept;
};

} // namespace svgpdf
