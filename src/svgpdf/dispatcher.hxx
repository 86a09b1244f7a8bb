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
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <mikroxml/mikroxml.hpp>

#include "attributes.hxx"
#include "config.hpp"
#include "document.hxx"
#include "element.hxx"
#include "gradient.hxx"
#include "style.hxx"

namespace svgpdf {

/**
 * @brief Converts element events of one document into content stream operators.
 */
class element_dispatcher
{
	conversion_context& ctx;
	document_record& doc;
	const placement_request& placement;
	const std::string base_dir;

	graphics& gfx;

	struct frame {
		svgpdf::style style;

		// maps element user space to root user space
		matrix ctm;

		// reference for percentage lengths
		r4::vector2<real> viewport;

		// product of opacities of the element and its ancestors
		real group_alpha = 1;

		// the element or one of its ancestors has 'display: none'
		bool not_displayed = false;
	};

	std::vector<frame> frames;

	struct open_element {
		element_kind kind;
		std::string name;

		bool frame_pushed = false;

		// number of graphics states to restore
		unsigned saves = 0;

		bool defs = false;
		bool clip_path = false;
		bool clip_matrix_pushed = false;

		bool captured = false;
		definitions_table::capture capture;

		// text or tspan element
		bool text_run = false;
		std::string text;
	};

	std::vector<open_element> open_elements;

	bool root_seen = false;

	// maps root user space to top-down page space
	matrix root_matrix = identity_matrix();

	unsigned defs_depth = 0;

	gradient_table gradients;
	definitions_table definitions;

	std::map<std::string, clip_set, std::less<>> clip_sets;

	// id of the clip path being captured, empty if none
	std::string active_clip;
	std::vector<matrix> clip_matrices;

	// style of the clip path being captured
	svgpdf::style clip_style;

	unsigned anonymous_clips = 0;

	// ids of definitions being expanded by 'use'
	std::set<std::string, std::less<>> expanding;

	struct {
		// current text position in user space
		r4::vector2<real> point{0, 0};

		// no text was output since the start of the 'text' element
		bool at_start = true;
	} text_state;

	length_context make_length_context(real percent_reference = 0) const;
	shape_context make_shape_context() const;

	void emit(const std::string& ops);

	void start_root(const attribute_list& attrs, open_element& rec);
	void open_scope(const attribute_list& attrs, open_element& rec);
	void apply_clip_path(std::string_view id);
	void apply_old_style_clip(const r4::rectangle<real>& box);

	void start_nested_svg(const attribute_list& attrs, open_element& rec);
	void paint_shape(const attribute_list& attrs, open_element& rec);
	void start_text(const attribute_list& attrs, open_element& rec);
	void flush_text(open_element& rec);
	void start_image(const attribute_list& attrs);
	void embed_svg(std::string_view href, const r4::rectangle<real>& box, const aspect_ratio& ar);
	void expand_use(const attribute_list& attrs);

	void capture_clip_element(const attribute_list& attrs, open_element& rec);

	open_element* find_text_element();

public:
	/**
	 * @param ctx - conversion context.
	 * @param doc - record to write operators to.
	 * @param placement - where to put the document.
	 * @param base_dir - directory to resolve relative references against.
	 */
	element_dispatcher(
		conversion_context& ctx,
		document_record& doc,
		const placement_request& placement,
		std::string base_dir
	);

	element_dispatcher(const element_dispatcher&) = delete;
	element_dispatcher& operator=(const element_dispatcher&) = delete;

	element_dispatcher(element_dispatcher&&) = delete;
	element_dispatcher& operator=(element_dispatcher&&) = delete;

	~element_dispatcher() = default;

	/**
	 * @brief Handle element start.
	 * @param name - element name, namespace prefix is ignored.
	 * @param attrs - element attributes.
	 * @throw svgpdf::invalid_geometry - if the root element has non-positive size.
	 * @throw svgpdf::invalid_input - if the root element is not 'svg'.
	 */
	void start(std::string_view name, const attribute_list& attrs);

	/**
	 * @brief Handle end of the innermost open element.
	 */
	void end();

	/**
	 * @brief Handle character data.
	 */
	void content(std::string_view text);

	bool is_root_seen() const noexcept
	{
		return this->root_seen;
	}
};

/**
 * @brief Feeds XML markup to the dispatcher.
 * Checks that element tags match and translates tokenizer errors to svgpdf::malformed_document.
 */
class sax_adapter : public mikroxml::parser
{
	element_dispatcher& dispatcher;

	// names of open elements
	std::vector<std::string> tags;

	std::string element_name;
	attribute_list attrs;

	// the root element was closed
	bool root_closed = false;

	unsigned line = 1;

	void check_root();

public:
	sax_adapter(element_dispatcher& dispatcher) :
		dispatcher(dispatcher)
	{}

	void on_element_start(utki::span<const char> name) override;
	void on_element_end(utki::span<const char> name) override;
	void on_attribute_parsed(utki::span<const char> name, utki::span<const char> value) override;
	void on_attributes_end(bool is_empty_element) override;
	void on_content_parsed(utki::span<const char> str) override;

	/**
	 * @brief Parse the whole document.
	 * @param markup - document markup.
	 * @throw svgpdf::malformed_document - if the markup is not well-formed.
	 */
	void parse(std::string_view markup);
};

} // namespace svgpdf
