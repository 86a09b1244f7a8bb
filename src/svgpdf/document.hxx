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
#include <vector>

#include "attributes.hxx"
#include "collaborators.hpp"
#include "config.hpp"
#include "convert.hpp"
#include "element.hxx"
#include "graphics.hpp"
#include "viewport.hxx"

namespace svgpdf {

/**
 * @brief State shared by a top-level conversion and the documents it embeds.
 */
struct conversion_context {
	const svgpdf::parameters& params;
	const svgpdf::collaborators& collabs;

	// handles and resource ids are taken from this counter
	unsigned& object_id;

	real page_height;

	// documents produced by the conversion, merged into the converter on success
	std::map<unsigned, document_record> documents;

	// keys of the sources being converted, outermost first
	std::vector<std::string> open_sources;

	unsigned next_id() noexcept
	{
		return ++this->object_id;
	}
};

/**
 * @brief Where to put a converted document.
 */
struct placement_request {
	// maps the image box to top-down page space
	matrix outer;

	// size of the image box, zero components are derived from the document
	r4::vector2<real> size{0, 0};

	// box units per document user unit when the size is derived
	real unit_scale = 1;

	// fit document into the box preserving aspect ratio, stretch if not set
	std::optional<aspect_ratio> fit;
};

/**
 * @brief SVG source ready for parsing.
 */
struct source_document {
	std::string markup;

	// directory to resolve relative references against
	std::string base_dir;

	// identifies the source for cycle detection
	std::string key;
};

/**
 * @brief Load SVG source.
 * Source starting with '<' after leading whitespace is markup,
 * source starting with '@' is markup after the marker,
 * anything else is a data URI or a file path passed to the loader.
 * @param source - the source.
 * @param loader - loader for data URIs and files.
 * @param base_dir - directory to resolve relative paths against.
 * @return loaded source.
 * @throw svgpdf::invalid_input - if the source has no content.
 */
source_document load_source(std::string_view source, const byte_loader& loader, std::string_view base_dir);

/**
 * @brief Convert SVG document and register the result in the context.
 * @param ctx - conversion context.
 * @param src - SVG source.
 * @param placement - where to put the document.
 * @return handle of the document record.
 */
unsigned convert_document(conversion_context& ctx, const source_document& src, const placement_request& placement);

/**
 * @brief Element event recorded inside 'defs' for replay by 'use'.
 */
struct stored_event {
	enum class type {
		start,
		end,
		content
	};

	type kind;
	std::string name;
	attribute_list attrs;
	std::string text;
};

/**
 * @brief Element subtrees defined inside 'defs', keyed by id.
 */
class definitions_table
{
	std::map<std::string, std::vector<stored_event>, std::less<>> entries;

	// ids of definitions whose elements are open
	std::vector<std::string> open;

public:
	/**
	 * @brief Targets of a recorded element.
	 */
	struct capture {
		std::vector<std::string> ids;

		// the element started its own definition
		bool opened = false;
	};

	/**
	 * @brief Record element start.
	 * Element with id starts a new definition, it is also recorded to all enclosing definitions.
	 * @return definitions the element was recorded to.
	 */
	capture record_start(std::string_view name, const attribute_list& attrs);

	void record_content(const capture& c, std::string_view text);

	void record_end(const capture& c, std::string_view name);

	/**
	 * @brief Find definition.
	 * @return recorded events or nullptr if there is no such definition.
	 */
	const std::vector<stored_event>* find(std::string_view id) const noexcept;
};

/**
 * @brief Shape of a clip path.
 */
struct clip_shape {
	element_kind kind;
	attribute_list attrs;

	// maps shape coordinates to the user space of the clipped element
	matrix m;

	fill_rule rule;
};

struct clip_set {
	std::vector<clip_shape> shapes;
};

} // namespace svgpdf
