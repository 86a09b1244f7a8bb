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

#include "dispatcher.hxx"

#include <algorithm>
#include <array>
#include <optional>
#include <sstream>

#include <utki/debug.hpp>
#include <utki/util.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "pdf_graphics.hpp"
#include "transform.hxx"
#include "transformed_graphics.hxx"
#include "util.hxx"
#include "viewport.hxx"

using namespace svgpdf;

namespace {
std::string_view get_href(const attribute_list& attrs)
{
	if (auto v = attrs.get("href")) {
		return *v;
	}
	return attrs.get_or("xlink:href", "");
}

bool is_svg_reference(std::string_view href)
{
	auto h = to_lower(trim(href));
	if (starts_with(h, "data:")) {
		return starts_with(h, "data:image/svg+xml");
	}
	return ends_with(h, ".svg");
}

std::string get_mime_type(std::string_view href)
{
	auto h = to_lower(trim(href));
	if (starts_with(h, "data:")) {
		auto end = h.find_first_of(";,");
		if (end == std::string::npos) {
			return {};
		}
		return h.substr(5, end - 5);
	}
	if (ends_with(h, ".png")) {
		return "image/png";
	}
	if (ends_with(h, ".jpg") || ends_with(h, ".jpeg")) {
		return "image/jpeg";
	}
	return {};
}

std::optional<real> get_first_length(const attribute_list& attrs, std::string_view name, const length_context& ctx)
{
	auto v = attrs.get(name);
	if (!v) {
		return {};
	}
	auto list = split_list(*v);
	if (list.empty()) {
		return {};
	}
	return parse_user_units(list.front(), ctx);
}

// transformation of the element, for elements which do not use x and y themselves these act as translation
matrix get_element_matrix(const attribute_list& attrs, element_kind kind, const shape_context& ctx)
{
	auto ret = parse_transform(attrs.get_or("transform", ""));
	if (uses_position(kind)) {
		return ret;
	}

	auto x = attrs.get("x");
	auto y = attrs.get("y");
	if (!x && !y) {
		return ret;
	}

	return multiply(
		ret,
		translation_matrix({
			x ? parse_user_units(*x, ctx.horizontal()) : 0, //
			y ? parse_user_units(*y, ctx.vertical()) : 0
		})
	);
}

std::string collapse_whitespace(std::string_view str, bool trim_leading)
{
	std::string ret;
	bool space = trim_leading;
	for (char c : str) {
		if (is_space(c)) {
			if (!space) {
				ret.push_back(' ');
				space = true;
			}
			continue;
		}
		ret.push_back(c);
		space = false;
	}
	return ret;
}

bool is_container(element_kind kind) noexcept
{
	switch (kind) {
		case element_kind::svg:
		case element_kind::g:
		case element_kind::image:
		case element_kind::text:
		case element_kind::tspan:
			return true;
		default:
			return false;
	}
}

const std::array<std::string_view, 9> use_own_attributes =
	{"id", "href", "xlink:href", "x", "y", "width", "height", "transform", "style"};
} // namespace

element_dispatcher::element_dispatcher(
	conversion_context& ctx,
	document_record& doc,
	const placement_request& placement,
	std::string base_dir
) :
	ctx(ctx),
	doc(doc),
	placement(placement),
	base_dir(std::move(base_dir)),
	gfx(*ctx.collabs.graphics)
{}

length_context element_dispatcher::make_length_context(real percent_reference) const
{
	ASSERT(!this->frames.empty())
	return this->frames.back().style.make_length_context(this->ctx.params.dpi, percent_reference);
}

shape_context element_dispatcher::make_shape_context() const
{
	ASSERT(!this->frames.empty())
	return shape_context{this->make_length_context(), this->frames.back().viewport, this->ctx.params.min_length};
}

void element_dispatcher::emit(const std::string& ops)
{
	this->doc.buffer.append(ops);
}

void element_dispatcher::start(std::string_view name, const attribute_list& attrs)
{
	open_element rec;
	rec.name = std::string(remove_namespace(name));
	rec.kind = to_element_kind(rec.name);

	if (!this->root_seen) {
		if (rec.kind != element_kind::svg) {
			throw invalid_input("root element is not 'svg': " + rec.name);
		}
		this->start_root(attrs, rec);
		this->open_elements.push_back(std::move(rec));
		return;
	}

	if (!this->active_clip.empty()) {
		if (rec.kind == element_kind::use) {
			this->open_elements.push_back(std::move(rec));
			this->expand_use(attrs);
			return;
		}
		this->capture_clip_element(attrs, rec);
		this->open_elements.push_back(std::move(rec));
		return;
	}

	switch (rec.kind) {
		case element_kind::linear_gradient:
		case element_kind::radial_gradient:
			this->gradients.add(parse_gradient(
				rec.kind == element_kind::linear_gradient ? gradient_kind::linear : gradient_kind::radial,
				attrs,
				this->make_length_context()
			));
			this->open_elements.push_back(std::move(rec));
			return;
		case element_kind::stop:
			this->gradients.add_stop(
				parse_stop(attrs, this->frames.back().style, *this->ctx.collabs.colors, this->make_length_context())
			);
			this->open_elements.push_back(std::move(rec));
			return;
		case element_kind::clip_path:
			{
				auto id = attrs.get_or("id", "");
				if (id.empty()) {
					// cannot be referenced, captured only to skip its content
					this->active_clip = "#" + std::to_string(++this->anonymous_clips);
				} else {
					this->active_clip = std::string(id);
				}
				this->clip_sets[this->active_clip] = clip_set();
				this->clip_style = this->frames.back().style.derive(attrs, this->make_length_context());
				this->clip_matrices = {parse_transform(attrs.get_or("transform", ""))};
				rec.clip_path = true;
			}
			this->open_elements.push_back(std::move(rec));
			return;
		case element_kind::defs:
			++this->defs_depth;
			rec.defs = true;
			this->open_elements.push_back(std::move(rec));
			return;
		default:
			break;
	}

	if (this->defs_depth != 0) {
		rec.capture = this->definitions.record_start(rec.name, attrs);
		rec.captured = true;
		this->open_elements.push_back(std::move(rec));
		return;
	}

	switch (rec.kind) {
		case element_kind::svg:
			this->start_nested_svg(attrs, rec);
			break;
		case element_kind::g:
			this->open_scope(attrs, rec);
			break;
		case element_kind::use:
			this->open_elements.push_back(std::move(rec));
			this->expand_use(attrs);
			return;
		case element_kind::path:
		case element_kind::rect:
		case element_kind::circle:
		case element_kind::ellipse:
		case element_kind::line:
		case element_kind::polyline:
		case element_kind::polygon:
			this->open_scope(attrs, rec);
			this->paint_shape(attrs, rec);
			break;
		case element_kind::image:
			this->open_scope(attrs, rec);
			this->start_image(attrs);
			break;
		case element_kind::text:
		case element_kind::tspan:
			this->start_text(attrs, rec);
			break;
		default:
			// unknown elements pass through, their children are visited
			break;
	}
	this->open_elements.push_back(std::move(rec));
}

void element_dispatcher::end()
{
	ASSERT(!this->open_elements.empty())
	auto rec = std::move(this->open_elements.back());
	this->open_elements.pop_back();

	if (rec.captured) {
		this->definitions.record_end(rec.capture, rec.name);
	}
	if (rec.clip_matrix_pushed) {
		this->clip_matrices.pop_back();
	}
	if (rec.clip_path) {
		this->active_clip.clear();
		this->clip_matrices.clear();
	}
	if (rec.defs) {
		--this->defs_depth;
	}
	if (rec.text_run) {
		this->flush_text(rec);
	}
	for (; rec.saves != 0; --rec.saves) {
		this->emit(this->gfx.restore());
	}
	if (rec.frame_pushed) {
		this->frames.pop_back();
	}
}

void element_dispatcher::content(std::string_view text)
{
	if (this->open_elements.empty()) {
		return;
	}

	auto& top = this->open_elements.back();
	if (top.captured) {
		this->definitions.record_content(top.capture, text);
		return;
	}

	if (auto t = this->find_text_element()) {
		t->text.append(text);
	}
}

element_dispatcher::open_element* element_dispatcher::find_text_element()
{
	for (auto i = this->open_elements.rbegin(); i != this->open_elements.rend(); ++i) {
		if (i->text_run) {
			return &*i;
		}
		if (i->kind != element_kind::unknown) {
			return nullptr;
		}
	}
	return nullptr;
}

void element_dispatcher::start_root(const attribute_list& attrs, open_element& rec)
{
	this->root_seen = true;

	const auto& params = this->ctx.params;

	svgpdf::style root_style(params.default_font_size * params.dpi / 72);
	length_context lengths{params.dpi, root_style.get_font_size(), 0};
	auto st = root_style.derive(attrs, lengths);
	lengths.font_size = st.get_font_size();

	auto view_box = parse_view_box(attrs.get_or("viewBox", ""));

	// percentages refer to the page, use view box size instead
	auto get_intrinsic = [&](std::string_view name, real view_box_dim) -> real {
		if (auto v = attrs.get(name)) {
			auto l = parse_length(*v);
			if (l && l->unit != svgdom::length_unit::percent) {
				return to_user_units(*l, lengths);
			}
		}
		if (view_box) {
			return view_box_dim;
		}
		return 100;
	};

	r4::vector2<real> intrinsic{
		get_intrinsic("width", view_box ? view_box->d.x() : 0),
		get_intrinsic("height", view_box ? view_box->d.y() : 0)
	};

	if (intrinsic.x() <= 0 || intrinsic.y() <= 0) {
		throw invalid_geometry("document width or height is not positive");
	}

	auto size = this->placement.size;
	if (size.x() < 0 || size.y() < 0) {
		throw invalid_geometry("requested width or height is negative");
	}
	if (size.x() == 0 && size.y() == 0) {
		size = intrinsic * this->placement.unit_scale;
	} else if (size.x() == 0) {
		size.x() = size.y() * intrinsic.x() / intrinsic.y();
	} else if (size.y() == 0) {
		size.y() = size.x() * intrinsic.y() / intrinsic.x();
	}

	if (!(size.x() > 0 && size.y() > 0)) {
		throw invalid_geometry("resolved width or height is not positive");
	}

	r4::rectangle<real> intrinsic_rect{{0, 0}, intrinsic};

	matrix scale_m = this->placement.fit
		? fit_viewport(size, intrinsic_rect, this->placement.fit.value()).to_matrix(intrinsic_rect)
		: scale_matrix(size.comp_div(intrinsic));

	auto viewport_m = multiply(this->placement.outer, scale_m);

	this->emit(this->gfx.save());
	++rec.saves;
	this->emit(this->gfx.transform(flip(viewport_m, this->ctx.page_height)));

	if (params.clip_to_viewport) {
		this->emit(this->gfx.rectangle(intrinsic_rect));
		this->emit(this->gfx.clip(fill_rule::nonzero));
	}

	auto viewport = intrinsic;
	auto view_box_m = identity_matrix();
	if (view_box) {
		view_box_m = fit_viewport(intrinsic, view_box.value(), parse_aspect_ratio(attrs.get_or("preserveAspectRatio", "")))
						 .to_matrix(view_box.value());
		viewport = view_box->d;
		if (!is_identity(view_box_m)) {
			this->emit(this->gfx.transform(view_box_m));
		}
	}
	this->root_matrix = multiply(viewport_m, view_box_m);

	auto t = parse_transform(attrs.get_or("transform", ""));
	if (!is_identity(t)) {
		this->emit(this->gfx.transform(t));
	}

	real alpha = st.get_opacity(style_property::opacity);
	auto blend = st.get_blend_mode();
	bool not_displayed = st.is_not_displayed();

	this->frames.push_back(frame{std::move(st), t, viewport, alpha, not_displayed});
	rec.frame_pushed = true;

	if (alpha < 1 || blend != "Normal") {
		this->emit(this->gfx.set_alpha(this->ctx.next_id(), alpha, alpha, blend));
	}
}

void element_dispatcher::open_scope(const attribute_list& attrs, open_element& rec)
{
	auto e = get_element_matrix(attrs, rec.kind, this->make_shape_context());

	const auto& parent = this->frames.back();

	auto st = parent.style.derive(attrs, this->make_length_context());

	real opacity = st.get_opacity(style_property::opacity);
	auto blend = st.get_blend_mode();
	bool blend_changed = blend != parent.style.get_blend_mode();

	frame f{
		std::move(st),
		multiply(parent.ctm, e),
		parent.viewport,
		parent.group_alpha * opacity,
		parent.not_displayed
	};
	f.not_displayed = f.not_displayed || f.style.is_not_displayed();

	this->emit(this->gfx.save());
	++rec.saves;
	if (!is_identity(e)) {
		this->emit(this->gfx.transform(e));
	}

	// invalidates 'parent'
	this->frames.push_back(std::move(f));
	rec.frame_pushed = true;

	auto clip_path_id = get_local_id_from_iri(this->frames.back().style.get(style_property::clip_path));
	if (!clip_path_id.empty()) {
		this->apply_clip_path(clip_path_id);
	}

	if (is_container(rec.kind) && (opacity < 1 || blend_changed)) {
		real alpha = this->frames.back().group_alpha;
		this->emit(this->gfx.set_alpha(this->ctx.next_id(), alpha, alpha, blend));
	}
}

void element_dispatcher::apply_clip_path(std::string_view id)
{
	auto i = this->clip_sets.find(id);
	if (i == this->clip_sets.end()) {
		LOG([&](auto& o) {
			o << "svgpdf: clip path '" << id << "' not found, element is not clipped" << std::endl;
		})
		return;
	}

	auto sctx = this->make_shape_context();

	std::string path;
	std::optional<fill_rule> rule;
	for (const auto& s : i->second.shapes) {
		if (!invert(s.m).has_value()) {
			LOG([&](auto& o) {
				o << "svgpdf: clip path '" << id << "' has a shape with singular matrix, shape skipped" << std::endl;
			})
			continue;
		}

		transformed_graphics tg(this->gfx, s.m);
		auto geometry = make_shape_geometry(s.kind, s.attrs, tg, sctx);
		if (!geometry) {
			continue;
		}
		path.append(geometry->operators);
		if (!rule) {
			rule = s.rule;
		}
	}

	if (path.empty()) {
		// empty clip path clips everything
		path = this->gfx.rectangle({{0, 0}, {0, 0}});
	}

	this->emit(path);
	this->emit(this->gfx.clip(rule.value_or(fill_rule::nonzero)));
}

void element_dispatcher::apply_old_style_clip(const r4::rectangle<real>& box)
{
	auto v = trim(this->frames.back().style.get(style_property::clip));
	if (!starts_with(v, "rect(") || !ends_with(v, ")")) {
		return;
	}
	v = v.substr(5, v.size() - 6);

	std::array<real, 4> offsets{}; // top, right, bottom, left
	auto lengths = this->make_length_context();
	size_t n = 0;
	for (auto token : split_list(v)) {
		if (n == offsets.size()) {
			return;
		}
		offsets[n] = token == "auto" ? 0 : parse_user_units(token, lengths);
		++n;
	}
	if (n != offsets.size()) {
		return;
	}

	r4::rectangle<real> rect{
		{box.p.x() + offsets[3], box.p.y() + offsets[0]},
		{box.d.x() - offsets[3] - offsets[1], box.d.y() - offsets[0] - offsets[2]}
	};
	rect.d.x() = std::max(real(0), rect.d.x());
	rect.d.y() = std::max(real(0), rect.d.y());

	this->emit(this->gfx.rectangle(rect));
	this->emit(this->gfx.clip(fill_rule::nonzero));
}

void element_dispatcher::capture_clip_element(const attribute_list& attrs, open_element& rec)
{
	auto sctx = this->make_shape_context();

	auto m = multiply(this->clip_matrices.back(), get_element_matrix(attrs, rec.kind, sctx));
	this->clip_matrices.push_back(m);
	rec.clip_matrix_pushed = true;

	if (!is_shape(rec.kind)) {
		return;
	}

	auto st = this->clip_style.derive(attrs, sctx.lengths);
	if (st.is_not_displayed() || st.is_invisible()) {
		return;
	}

	this->clip_sets[this->active_clip].shapes.push_back(
		clip_shape{rec.kind, attrs, m, st.get_fill_rule(style_property::clip_rule)}
	);
}

void element_dispatcher::start_nested_svg(const attribute_list& attrs, open_element& rec)
{
	this->open_scope(attrs, rec);

	auto sctx = this->make_shape_context();

	r4::rectangle<real> box{
		{parse_user_units(attrs.get_or("x", ""), sctx.horizontal()),
		 parse_user_units(attrs.get_or("y", ""), sctx.vertical())},
		{parse_user_units(attrs.get_or("width", "100%"), sctx.horizontal()),
		 parse_user_units(attrs.get_or("height", "100%"), sctx.vertical())}
	};

	auto& f = this->frames.back();

	if (box.d.x() <= 0 || box.d.y() <= 0) {
		// zero size viewport disables rendering
		f.not_displayed = true;
		return;
	}

	if (box.p.x() != 0 || box.p.y() != 0) {
		auto t = translation_matrix(box.p);
		this->emit(this->gfx.transform(t));
		f.ctm = multiply(f.ctm, t);
	}

	r4::rectangle<real> viewport_rect{{0, 0}, box.d};

	if (this->ctx.params.clip_to_viewport) {
		this->emit(this->gfx.rectangle(viewport_rect));
		this->emit(this->gfx.clip(fill_rule::nonzero));
	}
	this->apply_old_style_clip(viewport_rect);

	auto view_box = parse_view_box(attrs.get_or("viewBox", ""));
	if (!view_box) {
		f.viewport = box.d;
		return;
	}

	auto m = fit_viewport(box.d, view_box.value(), parse_aspect_ratio(attrs.get_or("preserveAspectRatio", "")))
				 .to_matrix(view_box.value());
	if (!is_identity(m)) {
		this->emit(this->gfx.transform(m));
	}
	f.ctm = multiply(f.ctm, m);
	f.viewport = view_box->d;
}

void element_dispatcher::paint_shape(const attribute_list& attrs, open_element& rec)
{
	auto sctx = this->make_shape_context();

	auto geometry = make_shape_geometry(rec.kind, attrs, this->gfx, sctx);

	const auto& f = this->frames.back();
	if (!geometry || f.not_displayed || f.style.is_invisible()) {
		return;
	}

	const auto& st = f.style;
	const auto& colors = *this->ctx.collabs.colors;

	auto fill = st.get_paint(style_property::fill, colors);
	auto stroke = st.get_paint(style_property::stroke, colors);

	// line has no interior
	if (rec.kind == element_kind::line) {
		fill.kind = paint::type::none;
	}

	std::optional<shading_spec> fill_shading;
	if (fill.kind == paint::type::gradient) {
		if (!is_empty(geometry->bbox)) {
			fill_shading = this->gradients.make_shading(fill.gradient_id, to_rectangle(geometry->bbox));
		}
		if (!fill_shading) {
			if (fill.fallback) {
				fill.kind = paint::type::color;
				fill.color = fill.fallback.value();
			} else {
				fill.kind = paint::type::none;
			}
		}
	}

	if (stroke.kind == paint::type::gradient) {
		// shadings cannot be stroked, use fallback or the first stop color
		auto g = this->gradients.resolve(stroke.gradient_id);
		if (stroke.fallback) {
			stroke.kind = paint::type::color;
			stroke.color = stroke.fallback.value();
		} else if (g && !g->stops.empty()) {
			stroke.kind = paint::type::color;
			stroke.color = g->stops.front().color;
		} else {
			LOG([&](auto& o) {
				o << "svgpdf: stroke gradient '" << stroke.gradient_id << "' not found, no stroke" << std::endl;
			})
			stroke.kind = paint::type::none;
		}
	}

	real fill_alpha = 1;
	if (fill.kind != paint::type::none) {
		fill_alpha = st.get_opacity(style_property::fill_opacity);
		if (fill.kind == paint::type::color) {
			fill_alpha *= fill.color.alpha;
		}
	}

	real stroke_alpha = 1;
	if (stroke.kind != paint::type::none) {
		stroke_alpha = st.get_opacity(style_property::stroke_opacity) * stroke.color.alpha;
	}

	auto blend = st.get_blend_mode();
	if (f.group_alpha < 1 || fill_alpha < 1 || stroke_alpha < 1 || blend != "Normal") {
		this->emit(this->gfx.set_alpha(
			this->ctx.next_id(), //
			f.group_alpha * fill_alpha,
			f.group_alpha * stroke_alpha,
			blend
		));
	}

	auto rule = st.get_fill_rule(style_property::fill_rule);

	if (fill_shading) {
		this->emit(this->gfx.save());
		this->emit(geometry->operators);
		this->emit(this->gfx.clip(rule));
		this->emit(this->gfx.transform(fill_shading->placement));
		this->emit(this->gfx.shading(this->ctx.next_id(), fill_shading.value()));
		this->emit(this->gfx.restore());
	}

	auto line = st.get_line_style(sctx.diagonal());

	bool do_fill = fill.kind == paint::type::color;
	bool do_stroke = stroke.kind == paint::type::color && line.width > 0;

	if (!do_fill && !do_stroke) {
		return;
	}

	if (do_fill) {
		this->emit(this->gfx.set_fill_color(fill.color));
	}
	if (do_stroke) {
		this->emit(this->gfx.set_line_style(line));
		this->emit(this->gfx.set_stroke_color(stroke.color));
	}

	paint_op op = paint_op::fill_stroke;
	if (!do_stroke) {
		op = paint_op::fill;
	} else if (!do_fill) {
		op = paint_op::stroke;
	}

	this->emit(geometry->operators);
	this->emit(this->gfx.paint(op, rule));
}

void element_dispatcher::start_text(const attribute_list& attrs, open_element& rec)
{
	if (rec.kind == element_kind::tspan) {
		// text before the tspan is laid out with the style of the parent
		if (auto parent = this->find_text_element()) {
			this->flush_text(*parent);
		}
	}

	this->open_scope(attrs, rec);
	rec.text_run = true;

	auto sctx = this->make_shape_context();

	auto& point = this->text_state.point;

	if (rec.kind == element_kind::text) {
		point = {0, 0};
		this->text_state.at_start = true;
	}

	if (auto x = get_first_length(attrs, "x", sctx.horizontal())) {
		point.x() = x.value();
	}
	if (auto y = get_first_length(attrs, "y", sctx.vertical())) {
		point.y() = y.value();
	}

	point.x() += get_first_length(attrs, "dx", sctx.horizontal()).value_or(0);
	point.y() += get_first_length(attrs, "dy", sctx.vertical()).value_or(0);
}

void element_dispatcher::flush_text(open_element& rec)
{
	auto run = collapse_whitespace(rec.text, this->text_state.at_start);
	rec.text.clear();
	if (run.empty()) {
		return;
	}

	const auto& f = this->frames.back();
	const auto& st = f.style;
	const auto& colors = *this->ctx.collabs.colors;

	text_request req;
	req.text = std::move(run);
	req.direction = st.get_direction();
	req.font_family = std::string(trim(st.get(style_property::font_family)));
	req.font_size = st.get_font_size();
	req.font_weight = std::string(trim(st.get(style_property::font_weight)));
	req.font_style = std::string(trim(st.get(style_property::font_style)));

	auto fill = st.get_paint(style_property::fill, colors);
	if (fill.kind == paint::type::color) {
		req.fill = fill.color;
	} else if (fill.kind == paint::type::gradient) {
		req.fill = fill.fallback;
	}

	auto stroke = st.get_paint(style_property::stroke, colors);
	if (stroke.kind == paint::type::color) {
		req.stroke = stroke.color;
	} else if (stroke.kind == paint::type::gradient) {
		req.stroke = stroke.fallback;
	}
	req.stroke_width = st.get_line_style(this->make_shape_context().diagonal()).width;

	auto& layout = *this->ctx.collabs.text;

	real advance = layout.advance(req);

	auto& point = this->text_state.point;
	bool rtl = req.direction == text_direction::rtl;

	real left = point.x();
	auto anchor = trim(st.get(style_property::text_anchor));
	if (anchor == "middle") {
		left -= advance / 2;
	} else if ((anchor == "end") != rtl) {
		left -= advance;
	}
	req.position = {left, point.y()};

	if (!f.not_displayed && !st.is_invisible()) {
		real fill_alpha = st.get_opacity(style_property::fill_opacity) * (req.fill ? req.fill->alpha : 1);
		real stroke_alpha = st.get_opacity(style_property::stroke_opacity) * (req.stroke ? req.stroke->alpha : 1);
		if (fill_alpha < 1 || stroke_alpha < 1) {
			this->emit(this->gfx.save());
			this->emit(this->gfx.set_alpha(
				this->ctx.next_id(), //
				f.group_alpha * fill_alpha,
				f.group_alpha * stroke_alpha,
				st.get_blend_mode()
			));
			this->emit(layout.layout(req));
			this->emit(this->gfx.restore());
		} else {
			this->emit(layout.layout(req));
		}
	}

	point.x() = rtl ? left : left + advance;
	this->text_state.at_start = false;
}

void element_dispatcher::start_image(const attribute_list& attrs)
{
	auto sctx = this->make_shape_context();

	r4::rectangle<real> box{
		{parse_user_units(attrs.get_or("x", ""), sctx.horizontal()),
		 parse_user_units(attrs.get_or("y", ""), sctx.vertical())},
		{parse_user_units(attrs.get_or("width", ""), sctx.horizontal()),
		 parse_user_units(attrs.get_or("height", ""), sctx.vertical())}
	};

	const auto& f = this->frames.back();
	if (f.not_displayed || f.style.is_invisible()) {
		return;
	}

	auto href = trim(get_href(attrs));
	if (href.empty()) {
		return;
	}

	if (box.d.x() <= 0 || box.d.y() <= 0) {
		LOG([&](auto& o) {
			o << "svgpdf: image has no size, not rendered" << std::endl;
		})
		return;
	}

	this->apply_old_style_clip(box);

	if (is_svg_reference(href)) {
		this->embed_svg(href, box, parse_aspect_ratio(attrs.get_or("preserveAspectRatio", "")));
		return;
	}

	std::vector<uint8_t> data;
	try {
		data = this->ctx.collabs.loader->load(href, this->base_dir);
	} catch (invalid_input& e) {
		LOG([&](auto& o) {
			o << "svgpdf: image not loaded: " << e.what() << std::endl;
		})
		return;
	}

	this->emit(this->ctx.collabs.images->embed(
		this->ctx.next_id(), //
		utki::span<const uint8_t>(data.data(), data.size()),
		get_mime_type(href),
		box
	));
}

void element_dispatcher::embed_svg(std::string_view href, const r4::rectangle<real>& box, const aspect_ratio& ar)
{
	if (this->ctx.open_sources.size() > this->ctx.params.max_nesting_depth) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image is too deep, not rendered" << std::endl;
		})
		return;
	}

	source_document src;
	try {
		src = load_source(href, *this->ctx.collabs.loader, this->base_dir);
	} catch (invalid_input& e) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image not loaded: " << e.what() << std::endl;
		})
		return;
	}

	const auto& open = this->ctx.open_sources;
	if (std::find(open.begin(), open.end(), src.key) != open.end()) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image refers to its ancestor, not rendered" << std::endl;
		})
		return;
	}

	placement_request p{
		multiply(this->root_matrix, multiply(this->frames.back().ctm, translation_matrix(box.p))),
		box.d,
		1,
		ar
	};

	try {
		auto handle = convert_document(this->ctx, src, p);
		this->doc.children.push_back(handle);
	} catch (invalid_input& e) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image skipped: " << e.what() << std::endl;
		})
	} catch (invalid_geometry& e) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image skipped: " << e.what() << std::endl;
		})
	} catch (malformed_document& e) {
		LOG([&](auto& o) {
			o << "svgpdf: nested SVG image skipped: " << e.what() << std::endl;
		})
	}
}

void element_dispatcher::expand_use(const attribute_list& attrs)
{
	auto id = get_local_id_from_iri(get_href(attrs));

	auto events = this->definitions.find(id);
	if (!events || events->empty()) {
		LOG([&](auto& o) {
			o << "svgpdf: use target '" << id << "' not found, nothing rendered" << std::endl;
		})
		return;
	}

	if (this->expanding.count(id) != 0) {
		LOG([&](auto& o) {
			o << "svgpdf: use target '" << id << "' refers to itself, skipped" << std::endl;
		})
		return;
	}
	if (this->expanding.size() >= this->ctx.params.max_use_depth) {
		LOG([&](auto& o) {
			o << "svgpdf: use expansion of '" << id << "' is too deep, skipped" << std::endl;
		})
		return;
	}

	// replay of nested defs can redefine the entry
	auto replay = *events;

	this->expanding.insert(id);
	utki::scope_exit expanding_scope_exit([this, &id]() {
		this->expanding.erase(id);
	});

	auto sctx = this->make_shape_context();
	real x = parse_user_units(attrs.get_or("x", ""), sctx.horizontal());
	real y = parse_user_units(attrs.get_or("y", ""), sctx.vertical());

	for (auto i = replay.begin(); i != replay.end(); ++i) {
		switch (i->kind) {
			case stored_event::type::start:
				if (i != replay.begin()) {
					this->start(i->name, i->attrs);
					break;
				}
				{
					auto merged = i->attrs;
					merged.erase("id");

					std::string transform(attrs.get_or("transform", ""));

					auto kind = to_element_kind(i->name);
					if (uses_position(kind)) {
						if (x != 0) {
							merged.set("x", format_number(x + parse_user_units(i->attrs.get_or("x", ""), sctx.horizontal())));
						}
						if (y != 0) {
							merged.set("y", format_number(y + parse_user_units(i->attrs.get_or("y", ""), sctx.vertical())));
						}
					} else if (x != 0 || y != 0) {
						transform.append(" translate(" + format_number(x) + " " + format_number(y) + ")");
					}

					transform.append(" ");
					transform.append(i->attrs.get_or("transform", ""));
					merged.set("transform", std::string(trim(transform)));

					if (auto s = attrs.get("style")) {
						merged.set("style", std::string(i->attrs.get_or("style", "")) + ";" + *s);
					}

					// presentation attributes of use are inherited by the definition
					for (const auto& a : attrs) {
						if (std::find(use_own_attributes.begin(), use_own_attributes.end(), a.first)
							!= use_own_attributes.end())
						{
							continue;
						}
						if (!merged.get(a.first)) {
							merged.set(a.first, a.second);
						}
					}

					this->start(i->name, merged);
				}
				break;
			case stored_event::type::end:
				this->end();
				break;
			case stored_event::type::content:
				this->content(i->text);
				break;
		}
	}
}

void sax_adapter::check_root()
{
	if (this->root_closed) {
		throw malformed_document(this->line, "content after the root element");
	}
}

void sax_adapter::on_element_start(utki::span<const char> name)
{
	this->check_root();
	this->element_name = std::string(name.data(), name.size());
	this->attrs = attribute_list();
}

void sax_adapter::on_attribute_parsed(utki::span<const char> name, utki::span<const char> value)
{
	std::string_view n(name.data(), name.size());
	if (!starts_with(n, "xlink:")) {
		n = remove_namespace(n);
	}
	this->attrs.set(n, std::string(value.data(), value.size()));
}

void sax_adapter::on_attributes_end(bool)
{
	// empty element is closed by on_element_end() with empty name
	this->tags.push_back(this->element_name);
	this->dispatcher.start(this->element_name, this->attrs);
}

void sax_adapter::on_element_end(utki::span<const char> name)
{
	if (this->tags.empty()) {
		throw malformed_document(this->line, "unexpected closing tag");
	}

	std::string_view n(name.data(), name.size());
	if (!n.empty() && n != this->tags.back()) {
		std::stringstream ss;
		ss << "closing tag '" << n << "' does not match opening tag '" << this->tags.back() << "'";
		throw malformed_document(this->line, ss.str());
	}

	this->tags.pop_back();
	this->dispatcher.end();

	if (this->tags.empty()) {
		this->root_closed = true;
	}
}

void sax_adapter::on_content_parsed(utki::span<const char> str)
{
	std::string_view text(str.data(), str.size());
	if (this->tags.empty()) {
		if (!trim(text).empty()) {
			throw malformed_document(this->line, "text outside of the root element");
		}
		return;
	}
	this->dispatcher.content(text);
}

void sax_adapter::parse(std::string_view markup)
{
	try {
		// feed line by line to know the line of an error
		size_t pos = 0;
		while (pos != markup.size()) {
			auto nl = markup.find('\n', pos);
			auto end = nl == std::string_view::npos ? markup.size() : nl + 1;
			this->feed(utki::make_span(markup.data() + pos, end - pos));
			pos = end;
			if (nl != std::string_view::npos) {
				++this->line;
			}
		}
	} catch (mikroxml::malformed_xml& e) {
		throw malformed_document(this->line, e.what());
	}

	if (!this->tags.empty()) {
		throw malformed_document(this->line, "element '" + this->tags.back() + "' is not closed");
	}
	if (!this->root_closed) {
		throw malformed_document(this->line, "no root element");
	}
}
