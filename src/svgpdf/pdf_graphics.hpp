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

#include <string>
#include <vector>

#include "collaborators.hpp"
#include "graphics.hpp"

namespace svgpdf {

/**
 * @brief Format number for PDF content stream.
 * Six digits after decimal point at most, trailing zeros are removed.
 */
std::string format_number(real value);

/**
 * @brief Graphics state parameters resource.
 */
struct ext_gstate_resource {
	unsigned id;
	real fill_alpha;
	real stroke_alpha;

	// PDF blend mode name
	std::string blend_mode;
};

struct shading_resource {
	unsigned id;
	shading_spec spec;
};

/**
 * @brief Get PDF dictionary of the graphics state parameters.
 */
std::string to_dictionary(const ext_gstate_resource& gs);

/**
 * @brief Get PDF dictionary of the shading.
 * The color function is an exponential interpolation function for two stops
 * and a stitching function of those for more stops.
 */
std::string to_dictionary(const shading_resource& sh);

/**
 * @brief Graphics emitting PDF content stream operators.
 */
class pdf_graphics : public graphics
{
	std::vector<ext_gstate_resource> ext_gstates;
	std::vector<shading_resource> shadings;

public:
	std::string save() override;
	std::string restore() override;
	std::string transform(const matrix& m) override;
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
	std::string paint(paint_op op, fill_rule rule) override;
	std::string clip(fill_rule rule) override;
	std::string set_fill_color(const color& c) override;
	std::string set_stroke_color(const color& c) override;
	std::string set_line_style(const line_style& style) override;
	std::string set_alpha(unsigned id, real fill_alpha, real stroke_alpha, std::string_view blend_mode) override;
	std::string shading(unsigned id, const shading_spec& spec) override;

	const std::vector<ext_gstate_resource>& get_ext_gstates() const noexcept
	{
		return this->ext_gstates;
	}

	const std::vector<shading_resource>& get_shadings() const noexcept
	{
		return this->shadings;
	}
};

/**
 * @brief Image XObject resource.
 */
struct image_resource {
	unsigned id;
	r4::vector2<uint32_t> dims;
	size_t num_channels;

	std::string mime;

	// encoded image
	std::vector<uint8_t> data;
};

/**
 * @brief Image embedder placing images as PDF image XObjects.
 * PNG and JPEG images are decoded to find out their dimensions.
 */
class pdf_image_embedder : public image_embedder
{
	std::vector<image_resource> images;

public:
	std::string embed(
		unsigned id, //
		utki::span<const uint8_t> data,
		std::string_view mime,
		const r4::rectangle<real>& box
	) override;

	const std::vector<image_resource>& get_images() const noexcept
	{
		return this->images;
	}
};

} // namespace svgpdf
