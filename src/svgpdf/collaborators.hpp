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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utki/span.hpp>

#include "config.hpp"
#include "graphics.hpp"

namespace svgpdf {

/**
 * @brief Resolver of color tokens.
 */
class color_resolver
{
public:
	virtual ~color_resolver() = default;

	/**
	 * @brief Resolve color token to device color.
	 * @param token - color token, e.g. 'red', '#ff0000', 'rgb(255, 0, 0)'.
	 * @return resolved color or nothing if the token is 'none' or is not a color.
	 */
	virtual std::optional<color> resolve(std::string_view token) const = 0;
};

enum class text_direction {
	ltr,
	rtl
};

/**
 * @brief Run of text to lay out.
 */
struct text_request {
	std::string text;

	/**
	 * @brief Start point of the text run's baseline in user space.
	 * For right-to-left text this is the left end of the run.
	 */
	r4::vector2<real> position{0, 0};

	text_direction direction = text_direction::ltr;

	std::string font_family;

	// in user units
	real font_size = 16;

	std::string font_weight;
	std::string font_style;

	// no fill if not set
	std::optional<color> fill;

	// no stroke if not set
	std::optional<color> stroke;
	real stroke_width = 0;
};

/**
 * @brief Text layout engine.
 */
class text_layout
{
public:
	virtual ~text_layout() = default;

	/**
	 * @brief Measure advance of the text run.
	 * @param request - text run.
	 * @return advance in user units.
	 */
	virtual real advance(const text_request& request) const = 0;

	/**
	 * @brief Lay out the text run.
	 * @param request - text run.
	 * @return content stream operators.
	 */
	virtual std::string layout(const text_request& request) = 0;
};

/**
 * @brief Raster image embedder.
 */
class image_embedder
{
public:
	virtual ~image_embedder() = default;

	/**
	 * @brief Embed raster image.
	 * @param id - object id for the image resource.
	 * @param data - encoded image.
	 * @param mime - MIME type of the image, empty if unknown.
	 * @param box - rectangle in user space to place the image to.
	 * @return content stream operators.
	 */
	virtual std::string embed(
		unsigned id, //
		utki::span<const uint8_t> data,
		std::string_view mime,
		const r4::rectangle<real>& box
	) = 0;
};

/**
 * @brief Loader of referenced resources.
 */
class byte_loader
{
public:
	virtual ~byte_loader() = default;

	/**
	 * @brief Load bytes.
	 * @param source - file path or data URI.
	 * @param base_dir - directory to resolve relative paths against, can be empty.
	 * @return loaded bytes.
	 * @throw svgpdf::invalid_input if the source cannot be loaded.
	 */
	virtual std::vector<uint8_t> load(std::string_view source, std::string_view base_dir) const = 0;
};

/**
 * @brief External collaborators of the converter.
 */
struct collaborators {
	std::shared_ptr<svgpdf::graphics> graphics;
	std::shared_ptr<svgpdf::color_resolver> colors;
	std::shared_ptr<svgpdf::text_layout> text;
	std::shared_ptr<svgpdf::image_embedder> images;
	std::shared_ptr<svgpdf::byte_loader> loader;
};

/**
 * @brief Create default collaborators.
 * Default graphics emits PDF content stream operators and keeps the registry of created resources.
 */
collaborators make_default_collaborators();

} // namespace svgpdf
