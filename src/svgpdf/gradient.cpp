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

#include "gradient.hxx"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

#include <utki/debug.hpp>

#include "geometry.hpp"
#include "transform.hxx"
#include "util.hxx"

using namespace svgpdf;

namespace {
const std::array<std::string_view, 4> linear_coord_names = {"x1", "y1", "x2", "y2"};
const std::array<std::string_view, 5> radial_coord_names = {"cx", "cy", "fx", "fy", "r"};

// linear gradient endpoints of a degenerate gradient, the last stop color fills the area
const r4::vector2<real> degenerate_start = {1, 0};
const r4::vector2<real> degenerate_end = {real(0.999), 0};

real parse_coord(std::string_view value, coordinate_mode mode, const length_context& ctx)
{
	if (mode == coordinate_mode::percentage) {
		return parse_number(value, 0);
	}
	return parse_user_units(value, ctx, 0);
}

bool is_percent_value(const std::string* v)
{
	return v && ends_with(trim(*v), "%");
}

r4::vector2<real> to_fraction(const r4::vector2<real>& p, const r4::rectangle<real>& bbox)
{
	return (p - bbox.p).comp_div(bbox.d);
}
} // namespace

gradient_def svgpdf::parse_gradient(gradient_kind kind, const attribute_list& attrs, const length_context& ctx)
{
	gradient_def g;
	g.kind = kind;
	g.id = attrs.get_or("id", "");

	if (auto units = attrs.get("gradientUnits")) {
		if (*units == "userSpaceOnUse") {
			g.units = gradient_units::user_space_on_use;
			g.units_specified = true;
		} else if (*units == "objectBoundingBox") {
			g.units_specified = true;
		}
	}

	if (auto t = attrs.get("gradientTransform")) {
		g.transform = parse_transform(*t);
	}

	if (auto href = attrs.get("xlink:href")) {
		g.href = get_local_id_from_iri(*href);
	} else if (auto href = attrs.get("href")) {
		g.href = get_local_id_from_iri(*href);
	}

	if (kind == gradient_kind::linear) {
		bool any_specified = false;
		bool any_percent = false;
		for (auto n : linear_coord_names) {
			auto v = attrs.get(n);
			any_specified = any_specified || v;
			any_percent = any_percent || is_percent_value(v);
		}

		g.mode = (!any_specified || any_percent) ? coordinate_mode::percentage : coordinate_mode::measure;

		std::array<real, 4> defaults = {0, 0, 100, 0};
		if (g.mode == coordinate_mode::measure) {
			defaults[2] = g.units == gradient_units::object_bounding_box ? real(1) : ctx.percent_reference;
		}

		for (size_t i = 0; i != linear_coord_names.size(); ++i) {
			auto v = attrs.get(linear_coord_names[i]);
			g.coords[i] = v ? parse_coord(*v, g.mode, ctx) : defaults[i];
		}
	} else {
		auto cx = attrs.get("cx");
		auto cy = attrs.get("cy");
		auto r = attrs.get("r");

		bool any_percent = false;
		for (auto n : radial_coord_names) {
			any_percent = any_percent || is_percent_value(attrs.get(n));
		}

		if (!cx || !cy || any_percent) {
			g.mode = coordinate_mode::percentage;
		} else if (r && parse_length(*r).has_value() && parse_number(*r, 0) <= 1) {
			g.mode = coordinate_mode::ratio;
		} else {
			g.mode = coordinate_mode::measure;
		}

		real full = g.mode == coordinate_mode::percentage ? real(100) : real(1);

		g.coords[0] = cx ? parse_coord(*cx, g.mode, ctx) : full / 2;
		g.coords[1] = cy ? parse_coord(*cy, g.mode, ctx) : full / 2;

		// focal point defaults to the center
		auto fx = attrs.get("fx");
		auto fy = attrs.get("fy");
		g.coords[2] = fx ? parse_coord(*fx, g.mode, ctx) : g.coords[0];
		g.coords[3] = fy ? parse_coord(*fy, g.mode, ctx) : g.coords[1];

		g.coords[4] = r ? parse_coord(*r, g.mode, ctx) : full / 2;
	}

	return g;
}

gradient_stop svgpdf::parse_stop(
	const attribute_list& attrs,
	const style& parent,
	const color_resolver& colors,
	const length_context& ctx
)
{
	gradient_stop ret;

	auto offset = trim(attrs.get_or("offset", "0"));
	real o = parse_number(offset, 0);
	if (ends_with(offset, "%") || o > 1) {
		o /= 100;
	}
	ret.offset = std::clamp(o, real(0), real(1));

	auto s = parent.derive(attrs, ctx);

	auto c = s.get_color(style_property::stop_color, colors);
	if (c.has_value()) {
		ret.color = c.value();
	}

	ret.opacity = s.get_opacity(style_property::stop_opacity) * ret.color.alpha;

	return ret;
}

void gradient_table::add(gradient_def g)
{
	this->last_id = g.id;
	this->gradients[g.id] = std::move(g);
}

void gradient_table::add_stop(const gradient_stop& s)
{
	auto i = this->gradients.find(this->last_id);
	if (i == this->gradients.end()) {
		LOG([&](auto& o) {
			o << "svgpdf: stop outside of gradient ignored" << std::endl;
		})
		return;
	}
	i->second.stops.push_back(s);
}

const gradient_def* gradient_table::find(std::string_view id) const noexcept
{
	auto i = this->gradients.find(id);
	if (i == this->gradients.end()) {
		return nullptr;
	}
	return &i->second;
}

std::optional<gradient_def> gradient_table::resolve(std::string_view id) const
{
	auto g = this->find(id);
	if (!g) {
		return {};
	}

	gradient_def ret = *g;

	std::set<std::string_view> visited = {id};

	for (auto ref = this->find(g->href); ref; ref = this->find(ref->href)) {
		if (!visited.insert(ref->id).second) {
			LOG([&](auto& o) {
				o << "svgpdf: gradient reference cycle at '" << ref->id << "'" << std::endl;
			})
			break;
		}

		if (ret.stops.empty()) {
			ret.stops = ref->stops;
		}
		if (!ret.units_specified && ref->units_specified) {
			ret.units = ref->units;
			ret.units_specified = true;
		}
		if (!ret.transform.has_value()) {
			ret.transform = ref->transform;
		}
	}

	std::stable_sort(ret.stops.begin(), ret.stops.end(), [](const auto& a, const auto& b) {
		return a.offset < b.offset;
	});

	return ret;
}

std::optional<shading_spec> gradient_table::make_shading(std::string_view id, const r4::rectangle<real>& bbox) const
{
	auto g = this->resolve(id);
	if (!g.has_value()) {
		LOG([&](auto& o) {
			o << "svgpdf: gradient '" << id << "' not found" << std::endl;
		})
		return {};
	}

	if (g->stops.empty()) {
		// paint falls back as if the gradient did not exist
		LOG([&](auto& o) {
			o << "svgpdf: gradient '" << id << "' has no stops" << std::endl;
		})
		return {};
	}

	if (bbox.d.x() <= 0 || bbox.d.y() <= 0) {
		LOG([&](auto& o) {
			o << "svgpdf: gradient '" << id << "' applied to element with empty bounding box" << std::endl;
		})
		return {};
	}

	const auto& c = g->coords;

	// gradient vector and, for radial gradient, focal point
	std::array<r4::vector2<real>, 2> points = {
		{{c[0], c[1]}, {c[2], c[3]}}
	};
	real radius = c[4];

	if (g->mode == coordinate_mode::percentage) {
		for (auto& p : points) {
			p = {std::clamp(p.x() / 100, real(0), real(1)), std::clamp(p.y() / 100, real(0), real(1))};
		}
		radius = std::clamp(radius / 100, real(0), real(1));
	}

	if (g->transform.has_value()) {
		const auto& m = g->transform.value();
		for (auto& p : points) {
			p = apply(m, p);
		}
		auto k = to_coefficients(m);
		radius *= std::sqrt(std::abs(k[0] * k[3] - k[1] * k[2]));
	}

	if (g->mode == coordinate_mode::measure && g->units == gradient_units::user_space_on_use) {
		for (auto& p : points) {
			p = to_fraction(p, bbox);
		}
		radius /= bbox.d.x();
	}

	shading_spec ret;
	ret.kind = g->kind;

	if (g->kind == gradient_kind::linear) {
		if (std::abs(points[0].x() - points[1].x()) < std::numeric_limits<real>::epsilon()
			&& std::abs(points[0].y() - points[1].y()) < std::numeric_limits<real>::epsilon())
		{
			points[0] = degenerate_start;
			points[1] = degenerate_end;
		}
		ret.coords = {points[0].x(), points[0].y(), points[1].x(), points[1].y(), 0};
	} else {
		ret.coords = {points[0].x(), points[0].y(), points[1].x(), points[1].y(), radius};
	}

	ret.placement = make_matrix(bbox.d.x(), 0, 0, bbox.d.y(), bbox.p.x(), bbox.p.y());
	ret.stops = std::move(g->stops);

	return ret;
}
