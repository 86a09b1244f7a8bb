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

#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ratio>

#include <utki/debug.hpp>
#include <utki/math.hpp>

#include "util.hxx"

using namespace svgpdf;

matrix svgpdf::make_matrix(real a, real b, real c, real d, real e, real f) noexcept
{
	return matrix{
		{a, c, e},
		{b, d, f}
	};
}

matrix svgpdf::identity_matrix() noexcept
{
	return make_matrix(1, 0, 0, 1, 0, 0);
}

matrix svgpdf::translation_matrix(const r4::vector2<real>& t) noexcept
{
	return make_matrix(1, 0, 0, 1, t.x(), t.y());
}

matrix svgpdf::scale_matrix(const r4::vector2<real>& s) noexcept
{
	return make_matrix(s.x(), 0, 0, s.y(), 0, 0);
}

std::array<real, 6> svgpdf::to_coefficients(const matrix& m) noexcept
{
	return {m[0][0], m[1][0], m[0][1], m[1][1], m[0][2], m[1][2]};
}

matrix svgpdf::multiply(const matrix& l, const matrix& r) noexcept
{
	auto a = to_coefficients(l);
	auto b = to_coefficients(r);

	return make_matrix(
		a[0] * b[0] + a[2] * b[1],
		a[1] * b[0] + a[3] * b[1],
		a[0] * b[2] + a[2] * b[3],
		a[1] * b[2] + a[3] * b[3],
		a[0] * b[4] + a[2] * b[5] + a[4],
		a[1] * b[4] + a[3] * b[5] + a[5]
	);
}

r4::vector2<real> svgpdf::apply(const matrix& m, const r4::vector2<real>& p) noexcept
{
	return {
		m[0][0] * p.x() + m[0][1] * p.y() + m[0][2],
		m[1][0] * p.x() + m[1][1] * p.y() + m[1][2]
	};
}

std::optional<matrix> svgpdf::invert(const matrix& m) noexcept
{
	auto c = to_coefficients(m);

	real det = c[0] * c[3] - c[1] * c[2];

	using std::abs;
	if (abs(det) < std::numeric_limits<real>::epsilon()) {
		return {};
	}

	return make_matrix(
		c[3] / det,
		-c[1] / det,
		-c[2] / det,
		c[0] / det,
		(c[2] * c[5] - c[3] * c[4]) / det,
		(c[1] * c[4] - c[0] * c[5]) / det
	);
}

bool svgpdf::is_identity(const matrix& m) noexcept
{
	return to_coefficients(m) == to_coefficients(identity_matrix());
}

matrix svgpdf::flip(const matrix& m, real page_height) noexcept
{
	return multiply(make_matrix(1, 0, 0, -1, 0, page_height), m);
}

real svgpdf::vectors_angle(const r4::vector2<real>& u, const r4::vector2<real>& v) noexcept
{
	using std::atan2;
	return atan2(u.x() * v.y() - u.y() * v.x(), u.x() * v.x() + u.y() * v.y());
}

real svgpdf::arc_bezier_param(real sweep_angle) noexcept
{
	return real(4) / real(3) * std::tan(sweep_angle / 4);
}

std::vector<bezier_segment> svgpdf::arc_to_beziers(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	real start_angle,
	real sweep_angle
)
{
	using std::abs;
	using std::cos;
	using std::sin;

	// tolerance keeps exact quarter turns in one segment
	const real tolerance = real(1e-9);
	auto num_segments = std::max(1, int(std::ceil(abs(sweep_angle) / (utki::pi<real>() / 2) - tolerance)));
	real delta = sweep_angle / real(num_segments);

	real k = arc_bezier_param(delta);

	auto ellipse_matrix = multiply(
		translation_matrix(center),
		multiply(
			make_matrix(cos(x_axis_rotation), sin(x_axis_rotation), -sin(x_axis_rotation), cos(x_axis_rotation), 0, 0),
			scale_matrix(radius)
		)
	);

	std::vector<bezier_segment> ret;
	ret.reserve(size_t(num_segments));

	real a1 = start_angle;
	for (int i = 0; i != num_segments; ++i) {
		real a2 = a1 + delta;

		r4::vector2<real> p0{cos(a1), sin(a1)};
		r4::vector2<real> p3{cos(a2), sin(a2)};

		ret.push_back(bezier_segment{
			apply(ellipse_matrix, p0 + r4::vector2<real>{-p0.y(), p0.x()} * k),
			apply(ellipse_matrix, p3 - r4::vector2<real>{-p3.y(), p3.x()} * k),
			apply(ellipse_matrix, p3)
		});

		a1 = a2;
	}

	return ret;
}

std::array<bezier_segment, 4> svgpdf::ellipse_to_beziers(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius
)
{
	real rx = radius.x();
	real ry = radius.y();

	const real k = arc_bezier_param(utki::pi<real>() / 2);

	return {
		{{center + r4::vector2<real>{rx, k * ry},
		  center + r4::vector2<real>{k * rx, ry},
		  center + r4::vector2<real>{0, ry}},
		 {center + r4::vector2<real>{-k * rx, ry},
		  center + r4::vector2<real>{-rx, k * ry},
		  center + r4::vector2<real>{-rx, 0}},
		 {center + r4::vector2<real>{-rx, -k * ry},
		  center + r4::vector2<real>{-k * rx, -ry},
		  center + r4::vector2<real>{0, -ry}},
		 {center + r4::vector2<real>{k * rx, -ry},
		  center + r4::vector2<real>{rx, -k * ry},
		  center + r4::vector2<real>{rx, 0}}}
	};
}

bounding_box svgpdf::make_empty_bounding_box() noexcept
{
	bounding_box bb;
	bb.set_empty_bounding_box();
	return bb;
}

bool svgpdf::is_empty(const bounding_box& bb) noexcept
{
	return bb.p1.x() > bb.p2.x() || bb.p1.y() > bb.p2.y();
}

void svgpdf::unite(bounding_box& bb, const r4::vector2<real>& p) noexcept
{
	using std::min;
	using std::max;

	bb.p1.x() = min(bb.p1.x(), p.x());
	bb.p1.y() = min(bb.p1.y(), p.y());
	bb.p2.x() = max(bb.p2.x(), p.x());
	bb.p2.y() = max(bb.p2.y(), p.y());
}

void svgpdf::unite(bounding_box& bb, const bounding_box& other) noexcept
{
	if (is_empty(other)) {
		return;
	}
	unite(bb, other.p1);
	unite(bb, other.p2);
}

bounding_box svgpdf::transform(const matrix& m, const bounding_box& bb) noexcept
{
	auto ret = make_empty_bounding_box();
	if (is_empty(bb)) {
		return ret;
	}

	std::array<r4::vector2<real>, 4> vertices = {
		{bb.p1, bb.p2, {bb.p1.x(), bb.p2.y()}, {bb.p2.x(), bb.p1.y()}}
	};

	for (const auto& v : vertices) {
		unite(ret, apply(m, v));
	}
	return ret;
}

r4::rectangle<real> svgpdf::to_rectangle(const bounding_box& bb) noexcept
{
	if (is_empty(bb)) {
		return {{0, 0}, {0, 0}};
	}
	return {bb.p1, bb.p2 - bb.p1};
}

std::optional<svgdom::length> svgpdf::parse_length(std::string_view str)
{
	str = trim(str);
	if (str.empty()) {
		return {};
	}

	// svgdom accepts leading garbage as zero, numbers are required here
	auto c = str.front();
	if (!is_digit(c) && c != '-' && c != '+' && c != '.') {
		return {};
	}

	auto l = svgdom::length::parse(str);
	if (!l.is_valid()) {
		return {};
	}
	return l;
}

real svgpdf::to_user_units(const svgdom::length& l, const length_context& ctx) noexcept
{
	switch (l.unit) {
		case svgdom::length_unit::percent:
			return ctx.percent_reference * real(l.value) / real(std::centi::den);
		case svgdom::length_unit::em:
			return ctx.font_size * real(l.value);
		case svgdom::length_unit::ex:
			return ctx.font_size * real(l.value) / 2;
		case svgdom::length_unit::number:
		case svgdom::length_unit::px:
			return real(l.value);
		default:
			return real(l.to_px(ctx.dpi));
	}
}

real svgpdf::parse_user_units(std::string_view str, const length_context& ctx, real default_value)
{
	auto l = parse_length(str);
	if (!l) {
		return default_value;
	}
	return to_user_units(*l, ctx);
}
