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
#include <string>
#include <string_view>
#include <vector>

#include "collaborators.hpp"
#include "config.hpp"

namespace svgpdf {

/**
 * @brief SVG conversion parameters.
 */
struct parameters {
	/**
	 * @brief Dots per inch to use for unit conversion.
	 * One user unit (px) is 72 / dpi PDF points.
	 */
	real dpi = 96;

	/**
	 * @brief Minimal length in user units.
	 * Path coordinates below this value are treated as zero.
	 */
	real min_length = real(0.01);

	/**
	 * @brief Maximal depth of nested 'use' element expansion.
	 */
	unsigned max_use_depth = 16;

	/**
	 * @brief Maximal depth of SVG documents embedded with 'image' element.
	 */
	unsigned max_nesting_depth = 8;

	/**
	 * @brief Font size of 'medium' keyword, in points.
	 */
	real default_font_size = 12;

	/**
	 * @brief Clip content of 'svg' elements to their viewports.
	 */
	bool clip_to_viewport = true;
};

/**
 * @brief Output of a converted document.
 */
struct document_record {
	/**
	 * @brief Content stream operators.
	 */
	std::string buffer;

	/**
	 * @brief Handles of embedded SVG documents, in definition order.
	 */
	std::vector<unsigned> children;
};

/**
 * @brief SVG to PDF content stream converter.
 */
class converter
{
	svgpdf::parameters params;
	svgpdf::collaborators collabs;

	// shared by all conversions, handles and resource ids are taken from it
	unsigned object_id = 0;

	std::map<unsigned, document_record> documents;

public:
	/**
	 * @brief Constructor.
	 * @param params - conversion parameters.
	 * @param collabs - external collaborators.
	 */
	converter(
		const svgpdf::parameters& params = svgpdf::parameters(),
		svgpdf::collaborators collabs = make_default_collaborators()
	);

	/**
	 * @brief Convert SVG document.
	 * Coordinates are in PDF points, measured from the top-left corner of the page.
	 * @param source - SVG markup, '@' followed by SVG markup, data URI or file path.
	 * @param x - left edge of the image on the page.
	 * @param y - top edge of the image on the page.
	 * @param width - width of the image, 0 to derive it from the document.
	 * @param height - height of the image, 0 to derive it from the document.
	 * @param page_height - height of the page.
	 * @return handle of the converted document.
	 * @throw svgpdf::invalid_input - if the source has no usable content.
	 * @throw svgpdf::invalid_geometry - if the resolved width or height is not positive.
	 * @throw svgpdf::malformed_document - if the document is not well-formed.
	 */
	unsigned convert(std::string_view source, real x, real y, real width, real height, real page_height);

	/**
	 * @brief Get content stream of a converted document.
	 * @param handle - handle returned by convert().
	 * @return operators of the document followed by operators of all embedded documents.
	 * @throw svgpdf::unknown_handle - if the handle was not returned by convert().
	 */
	std::string render(unsigned handle) const;

	const svgpdf::parameters& get_parameters() const noexcept
	{
		return this->params;
	}

	const svgpdf::collaborators& get_collaborators() const noexcept
	{
		return this->collabs;
	}
};

} // namespace svgpdf
