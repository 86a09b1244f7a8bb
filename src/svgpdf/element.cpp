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

#include "element.hxx"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

#include <utki/debug.hpp>
#include <utki/math.hpp>
#include <utki/span.hpp>

#include "path.hxx"
#include "util.hxx"

using namespace svgpdf;

namespace {
const std::array<std::pair<std::string_view, element_kind>, 18> element_names = {
	{
     {"svg", element_kind::svg},
     {"g", element_kind::g},
     {"defs", element_kind::defs},
     {"clipPath", element_kind::clip_path},
     {"linearGradient", element_kind::linear_gradient},
     {"radialGradient", element_kind::radial_gradient},
     {"stop", element_kind::stop},
     {"use", element_kind::use},
     {"path", element_kind::path},
     {"rect", element_kind::rect},
     {"circle", element_kind::circle},
     {"ellipse", element_kind::ellipse},
     {"line", element_kind::line},
     {"polyline", element_kind::polyline},
     {"polygon", element_kind::polygon},
     {"image", element_kind::image},
     {"text", element_kind::text},
     {"tspan", element_kind::tspan},
	 }
};

std::string rounded_rectangle(path_builder& gfx, const r4::rectangle<real>& rect, const r4::vector2<real>& corner_radius)
{
	const auto& p = rect.p;
	const auto& d = rect.d;
	real rx = corner_radius.x();
	real ry = corner_radius.y();

	// corners are quarter turns
	const real k = arc_bezier_param(utki::pi<real>() / 2);

	std::string ret = gfx.move_to(p + r4::vector2<real>{rx, 0});

	ret.append(gfx.line_to(p + r4::vector2<real>{d.x() - rx, 0}));
	ret.append(gfx.curve_to(
		p + r4::vector2<real>{d.x() - rx + k * rx, 0},
		p + r4::vector2<real>{d.x(), ry * (1 - k)},
		p + r4::vector2<real>{d.x(), ry}
	));

	ret.append(gfx.line_to(p + d - r4::vector2<real>{0, ry}));
	ret.append(gfx.curve_to(
		p + d - r4::vector2<real>{0, ry * (1 - k)},
		p + d - r4::vector2<real>{rx * (1 - k), 0},
		p + d - r4::vector2<real>{rx, 0}
	));

	ret.append(gfx.line_to(p + r4::vector2<real>{rx, d.y()}));
	ret.append(gfx.curve_to(
		p + r4::vector2<real>{rx * (1 - k), d.y()},
		p + r4::vector2<real>{0, d.y() - ry * (1 - k)},
		p + r4::vector2<real>{0, d.y() - ry}
	));

	ret.append(gfx.line_to(p + r4::vector2<real>{0, ry}));
	ret.append(gfx.curve_to(
		p + r4::vector2<real>{0, ry * (1 - k)},
		p + r4::vector2<real>{rx * (1 - k), 0},
		p + r4::vector2<real>{rx, 0}
	));

	ret.append(gfx.close_path());

	return ret;
}

real get_length(const attribute_list& attrs, std::string_view name, const length_context& ctx, real default_value = 0)
{
	auto v = attrs.get(name);
	if (!v) {
		return default_value;
	}
	return parse_user_units(*v, ctx, default_value);
}

std::optional<shape_geometry> make_rect(const attribute_list& attrs, path_builder& gfx, const shape_context& ctx)
{
	r4::rectangle<real> rect{
		{get_length(attrs, "x", ctx.horizontal()), get_length(attrs, "y", ctx.vertical())},
		{get_length(attrs, "width", ctx.horizontal()), get_length(attrs, "height", ctx.vertical())}
	};

	if (rect.d.x() <= 0 || rect.d.y() <= 0) {
		return {};
	}

	auto rx_attr = attrs.get("rx");
	auto ry_attr = attrs.get("ry");

	real rx = std::max(real(0), get_length(attrs, "rx", ctx.horizontal()));
	real ry = std::max(real(0), get_length(attrs, "ry", ctx.vertical()));

	// one radius defaults to the other
	if (rx_attr && !ry_attr) {
		ry = rx;
	} else if (!rx_attr && ry_attr) {
		rx = ry;
	}

	rx = std::min(rx, rect.d.x() / 2);
	ry = std::min(ry, rect.d.y() / 2);

	shape_geometry ret;
	if (rx > 0 && ry > 0) {
		ret.operators = rounded_rectangle(gfx, rect, {rx, ry});
	} else {
		ret.operators = gfx.rectangle(rect);
	}

	unite(ret.bbox, rect.p);
	unite(ret.bbox, rect.p + rect.d);

	return ret;
}

std::optional<shape_geometry> make_ellipse(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius,
	path_builder& gfx
)
{
	if (radius.x() <= 0 || radius.y() <= 0) {
		return {};
	}

	shape_geometry ret;
	ret.operators = gfx.ellipse(center, radius);
	unite(ret.bbox, center - radius);
	unite(ret.bbox, center + radius);
	return ret;
}

std::optional<shape_geometry> make_poly(const attribute_list& attrs, path_builder& gfx, bool close)
{
	auto numbers = parse_numbers(attrs.get_or("points", ""));

	std::vector<r4::vector2<real>> points;
	for (size_t i = 0; i + 1 < numbers.size(); i += 2) {
		points.push_back({numbers[i], numbers[i + 1]});
	}

	if (points.size() < 2) {
		return {};
	}

	shape_geometry ret;
	ret.operators = gfx.polygon(utki::make_span(points), close);
	for (const auto& p : points) {
		unite(ret.bbox, p);
	}
	return ret;
}
} // namespace

length_context shape_context::horizontal() const noexcept
{
	auto ret = this->lengths;
	ret.percent_reference = this->viewport.x();
	return ret;
}

length_context shape_context::vertical() const noexcept
{
	auto ret = this->lengths;
	ret.percent_reference = this->viewport.y();
	return ret;
}

length_context shape_context::diagonal() const noexcept
{
	auto ret = this->lengths;
	ret.percent_reference = std::sqrt((utki::pow2(this->viewport.x()) + utki::pow2(this->viewport.y())) / 2);
	return ret;
}

element_kind svgpdf::to_element_kind(std::string_view name) noexcept
{
	auto i = std::find_if(element_names.begin(), element_names.end(), [&name](const auto& e) {
		return e.first == name;
	});
	if (i == element_names.end()) {
		return element_kind::unknown;
	}
	return i->second;
}

bool svgpdf::is_shape(element_kind kind) noexcept
{
	switch (kind) {
		case element_kind::path:
		case element_kind::rect:
		case element_kind::circle:
		case element_kind::ellipse:
		case element_kind::line:
		case element_kind::polyline:
		case element_kind::polygon:
			return true;
		default:
			return false;
	}
}

bool svgpdf::uses_position(element_kind kind) noexcept
{
	switch (kind) {
		case element_kind::svg:
		case element_kind::use:
		case element_kind::rect:
		case element_kind::image:
		case element_kind::text:
		case element_kind::tspan:
			return true;
		default:
			return false;
	}
}

std::optional<shape_geometry> svgpdf::make_shape_geometry(
	element_kind kind,
	const attribute_list& attrs,
	path_builder& gfx,
	const shape_context& ctx
)
{
	switch (kind) {
		case element_kind::path:
			{
				auto res = path_interpreter(gfx, ctx.min_length).interpret(attrs.get_or("d", ""));
				if (res.operators.empty()) {
					return {};
				}
				return shape_geometry{std::move(res.operators), res.bbox};
			}
		case element_kind::rect:
			return make_rect(attrs, gfx, ctx);
		case element_kind::circle:
			{
				real r = get_length(attrs, "r", ctx.diagonal());
				return make_ellipse(
					{get_length(attrs, "cx", ctx.horizontal()), get_length(attrs, "cy", ctx.vertical())},
					{r, r},
					gfx
				);
			}
		case element_kind::ellipse:
			{
				auto rx_attr = attrs.get("rx");
				auto ry_attr = attrs.get("ry");
				real rx = get_length(attrs, "rx", ctx.horizontal());
				real ry = get_length(attrs, "ry", ctx.vertical());
				if (rx_attr && !ry_attr) {
					ry = rx;
				} else if (!rx_attr && ry_attr) {
					rx = ry;
				}
				return make_ellipse(
					{get_length(attrs, "cx", ctx.horizontal()), get_length(attrs, "cy", ctx.vertical())},
					{rx, ry},
					gfx
				);
			}
		case element_kind::line:
			{
				r4::vector2<real> p1{get_length(attrs, "x1", ctx.horizontal()), get_length(attrs, "y1", ctx.vertical())};
				r4::vector2<real> p2{get_length(attrs, "x2", ctx.horizontal()), get_length(attrs, "y2", ctx.vertical())};
				shape_geometry ret;
				ret.operators = gfx.move_to(p1) + gfx.line_to(p2);
				unite(ret.bbox, p1);
				unite(ret.bbox, p2);
				return ret;
			}
		case element_kind::polyline:
			return make_poly(attrs, gfx, false);
		case element_kind::polygon:
			return make_poly(attrs, gfx, true);
		default:
			ASSERT(!is_shape(kind))
			return {};
	}
}
