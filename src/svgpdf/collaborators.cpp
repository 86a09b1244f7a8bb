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

#include "collaborators.hpp"

#include <variant>

#include <papki/fs_file.hpp>
#include <svgdom/dom.hpp>
#include <utki/debug.hpp>

#include "errors.hpp"
#include "pdf_graphics.hpp"
#include "util.hxx"

using namespace svgpdf;

namespace {
class svgdom_color_resolver : public color_resolver
{
public:
	std::optional<color> resolve(std::string_view token) const override
	{
		auto t = trim(token);
		if (t.empty() || t == "none") {
			return {};
		}

		if (to_lower(t) == "transparent") {
			return color{{0, 0, 0}, 0};
		}

		auto v = svgdom::parse_paint(t);
		if (std::holds_alternative<std::monostate>(v) || svgdom::is_none(v)
			|| std::holds_alternative<std::string>(v))
		{
			return {};
		}

		return color{svgdom::get_rgb(v).to<real>(), 1};
	}
};

// number of code points in UTF-8 string
size_t count_characters(std::string_view s)
{
	size_t ret = 0;
	for (auto c : s) {
		if ((uint8_t(c) & 0xc0) != 0x80) {
			++ret;
		}
	}
	return ret;
}

std::string reverse_characters(std::string_view s)
{
	std::string ret;
	ret.reserve(s.size());
	auto end = s.end();
	while (end != s.begin()) {
		auto begin = end - 1;
		while (begin != s.begin() && (uint8_t(*begin) & 0xc0) == 0x80) {
			--begin;
		}
		ret.append(begin, end);
		end = begin;
	}
	return ret;
}

std::string escape_pdf_string(std::string_view s)
{
	std::string ret;
	for (auto c : s) {
		switch (c) {
			case '\\':
			case '(':
			case ')':
				ret.push_back('\\');
				ret.push_back(c);
				break;
			case '\r':
				ret.append("\\r");
				break;
			case '\n':
				ret.append("\\n");
				break;
			default:
				ret.push_back(c);
				break;
		}
	}
	return ret;
}

class simple_text_layout : public text_layout
{
	// average glyph advance in em
	constexpr static const real glyph_advance = real(0.5);

public:
	real advance(const text_request& request) const override
	{
		return real(count_characters(request.text)) * request.font_size * glyph_advance;
	}

	std::string layout(const text_request& request) override
	{
		// text rendering mode: 0 - fill, 1 - stroke, 2 - fill and stroke, 3 - invisible
		unsigned mode = 3;
		if (request.fill.has_value() && request.stroke.has_value()) {
			mode = 2;
		} else if (request.fill.has_value()) {
			mode = 0;
		} else if (request.stroke.has_value()) {
			mode = 1;
		}

		pdf_graphics g;

		std::string ret = "BT\n";
		if (request.fill.has_value()) {
			ret.append(g.set_fill_color(request.fill.value()));
		}
		if (request.stroke.has_value()) {
			ret.append(g.set_stroke_color(request.stroke.value()));
			ret.append(format_number(request.stroke_width)).append(" w\n");
		}

		auto text = request.direction == text_direction::rtl ? reverse_characters(request.text) : request.text;

		// negative vertical scale compensates for y-down user space
		ret.append(std::to_string(mode)).append(" Tr\n");
		ret.append("/F1 ").append(format_number(request.font_size)).append(" Tf\n");
		ret.append("1 0 0 -1 ")
			.append(format_number(request.position.x()))
			.append(" ")
			.append(format_number(request.position.y()))
			.append(" Tm\n");
		ret.append("(").append(escape_pdf_string(text)).append(") Tj\n");
		ret.append("ET\n");

		return ret;
	}
};

class file_byte_loader : public byte_loader
{
public:
	std::vector<uint8_t> load(std::string_view source, std::string_view base_dir) const override
	{
		auto s = trim(source);

		if (s.empty()) {
			throw invalid_input("empty resource reference");
		}

		// URI scheme is case insensitive
		if (to_lower(s.substr(0, 5)) == "data:") {
			auto comma = s.find(',');
			if (comma == std::string_view::npos) {
				throw invalid_input("malformed data URI");
			}

			auto header = to_lower(s.substr(0, comma));
			auto payload = s.substr(comma + 1);

			std::vector<uint8_t> ret;
			if (ends_with(header, ";base64")) {
				ret = decode_base64(payload);
			} else {
				ret.assign(payload.begin(), payload.end());
			}

			if (ret.empty()) {
				throw invalid_input("data URI has no content");
			}
			return ret;
		}

		auto path = resolve_path(s, base_dir);

		std::vector<uint8_t> ret;
		try {
			ret = papki::fs_file(path).load();
		} catch (std::exception& e) {
			throw invalid_input("could not read '" + path + "': " + e.what());
		}

		if (ret.empty()) {
			throw invalid_input("file '" + path + "' is empty");
		}
		return ret;
	}
};
} // namespace

collaborators svgpdf::make_default_collaborators()
{
	return collaborators{
		std::make_shared<pdf_graphics>(),
		std::make_shared<svgdom_color_resolver>(),
		std::make_shared<simple_text_layout>(),
		std::make_shared<pdf_image_embedder>(),
		std::make_shared<file_byte_loader>()
	};
}
