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

#include "convert.hpp"

#include <stdexcept>

#include <utki/debug.hpp>
#include <utki/util.hpp>

#include "dispatcher.hxx"
#include "document.hxx"
#include "errors.hpp"
#include "geometry.hpp"

using namespace svgpdf;

namespace {
void erase_document(std::map<unsigned, document_record>& documents, unsigned handle)
{
	auto i = documents.find(handle);
	if (i == documents.end()) {
		return;
	}
	auto children = std::move(i->second.children);
	documents.erase(i);
	for (auto c : children) {
		erase_document(documents, c);
	}
}

void render_document(
	const std::map<unsigned, document_record>& documents,
	unsigned handle,
	std::string& out
)
{
	auto i = documents.find(handle);
	ASSERT(i != documents.end())
	out.append(i->second.buffer);
	for (auto c : i->second.children) {
		render_document(documents, c, out);
	}
}
} // namespace

unsigned svgpdf::convert_document(conversion_context& ctx, const source_document& src, const placement_request& placement)
{
	auto handle = ctx.next_id();
	auto& doc = ctx.documents[handle];

	utki::scope_exit document_scope_exit([&ctx, handle]() {
		erase_document(ctx.documents, handle);
	});

	ctx.open_sources.push_back(src.key);
	utki::scope_exit sources_scope_exit([&ctx]() {
		ctx.open_sources.pop_back();
	});

	element_dispatcher dispatcher(ctx, doc, placement, src.base_dir);
	sax_adapter parser(dispatcher);
	parser.parse(src.markup);

	document_scope_exit.release();

	return handle;
}

converter::converter(const svgpdf::parameters& params, svgpdf::collaborators collabs) :
	params(params),
	collabs(std::move(collabs))
{
	const auto& c = this->collabs;
	if (!c.graphics || !c.colors || !c.text || !c.images || !c.loader) {
		throw std::invalid_argument("converter: all collaborators must be set");
	}
	if (!(this->params.dpi > 0)) {
		throw std::invalid_argument("converter: dpi must be positive");
	}
}

unsigned converter::convert(std::string_view source, real x, real y, real width, real height, real page_height)
{
	auto src = load_source(source, *this->collabs.loader, {});

	conversion_context ctx{this->params, this->collabs, this->object_id, page_height, {}, {}};

	placement_request placement{
		translation_matrix({x, y}),
		{width, height},
		// user units to points
		72 / this->params.dpi,
		{}
	};

	auto handle = convert_document(ctx, src, placement);

	LOG([&](auto& o) {
		o << "svgpdf: converted document " << handle << ", " << ctx.documents.size() << " record(s)" << std::endl;
	})

	this->documents.merge(ctx.documents);

	return handle;
}

std::string converter::render(unsigned handle) const
{
	if (this->documents.find(handle) == this->documents.end()) {
		throw unknown_handle(handle);
	}

	std::string ret;
	render_document(this->documents, handle, ret);
	return ret;
}
