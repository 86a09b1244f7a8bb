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

#include "document.hxx"

#include <functional>

#include "errors.hpp"
#include "util.hxx"

using namespace svgpdf;

source_document svgpdf::load_source(std::string_view source, const byte_loader& loader, std::string_view base_dir)
{
	source_document ret;
	ret.base_dir = std::string(base_dir);

	auto s = trim(source);

	if (starts_with(s, "<") || starts_with(s, "@")) {
		if (s.front() == '@') {
			s.remove_prefix(1);
		}
		ret.markup = std::string(s);
		ret.key = "markup:" + std::to_string(std::hash<std::string_view>()(s));
	} else if (s.empty()) {
		throw invalid_input("empty source");
	} else {
		auto bytes = loader.load(s, base_dir);
		ret.markup.assign(bytes.begin(), bytes.end());

		if (starts_with(to_lower(s.substr(0, 5)), "data:")) {
			ret.key = std::string(s);
		} else {
			ret.key = resolve_path(s, base_dir);
			ret.base_dir = get_dir(ret.key);
		}
	}

	if (trim(ret.markup).empty()) {
		throw invalid_input("source has no content");
	}

	return ret;
}

definitions_table::capture definitions_table::record_start(std::string_view name, const attribute_list& attrs)
{
	capture ret;
	ret.ids = this->open;

	auto id = attrs.get_or("id", "");
	if (!id.empty()) {
		// redefinition replaces the previous one
		this->entries[std::string(id)].clear();
		ret.ids.emplace_back(id);
		ret.opened = true;
		this->open.emplace_back(id);
	}

	for (const auto& i : ret.ids) {
		this->entries[i].push_back(stored_event{stored_event::type::start, std::string(name), attrs, {}});
	}

	return ret;
}

void definitions_table::record_content(const capture& c, std::string_view text)
{
	for (const auto& id : c.ids) {
		this->entries[id].push_back(stored_event{stored_event::type::content, {}, {}, std::string(text)});
	}
}

void definitions_table::record_end(const capture& c, std::string_view name)
{
	for (const auto& id : c.ids) {
		this->entries[id].push_back(stored_event{stored_event::type::end, std::string(name), {}, {}});
	}
	if (c.opened) {
		this->open.pop_back();
	}
}

const std::vector<stored_event>* definitions_table::find(std::string_view id) const noexcept
{
	auto i = this->entries.find(id);
	if (i == this->entries.end()) {
		return nullptr;
	}
	return &i->second;
}
