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

#include "viewport.hxx"

#include <algorithm>
#include <stdexcept>

#include <svgdom/elements/aspect_ratioed.hpp>
#include <svgdom/elements/view_boxed.hpp>

#include <utki/debug.hpp>

#include "geometry.hpp"
#include "util.hxx"

using namespace svgpdf;

namespace {
real align_offset(alignment a, real leftover) noexcept
{
	switch (a) {
		case alignment::min:
			return 0;
		case alignment::mid:
			return leftover / 2;
		case alignment::max:
			return leftover;
	}
	return 0;
}
} // namespace

aspect_ratio svgpdf::parse_aspect_ratio(std::string_view str)
{
	if (trim(str).empty()) {
		return aspect_ratio();
	}

	svgdom::aspect_ratioed ar;
	try {
		ar.parse(str);
	} catch (std::invalid_argument& e) {
		LOG([&](auto& o) {
			o << "svgpdf: malformed preserveAspectRatio ignored: " << str << ", " << e.what() << std::endl;
		})
		return aspect_ratio();
	}

	aspect_ratio ret;
	ret.slice = ar.preserve_aspect_ratio.slice;

	using preservation = svgdom::aspect_ratioed::aspect_ratio_preservation;

	switch (ar.preserve_aspect_ratio.preserve) {
		case preservation::none:
			ret.preserve = false;
			break;
		case preservation::x_min_y_min:
			ret.align_x = alignment::min;
			ret.align_y = alignment::min;
			break;
		case preservation::x_mid_y_min:
			ret.align_x = alignment::mid;
			ret.align_y = alignment::min;
			break;
		case preservation::x_max_y_min:
			ret.align_x = alignment::max;
			ret.align_y = alignment::min;
			break;
		case preservation::x_min_y_mid:
			ret.align_x = alignment::min;
			ret.align_y = alignment::mid;
			break;
		default:
		case preservation::x_mid_y_mid:
			ret.align_x = alignment::mid;
			ret.align_y = alignment::mid;
			break;
		case preservation::x_max_y_mid:
			ret.align_x = alignment::max;
			ret.align_y = alignment::mid;
			break;
		case preservation::x_min_y_max:
			ret.align_x = alignment::min;
			ret.align_y = alignment::max;
			break;
		case preservation::x_mid_y_max:
			ret.align_x = alignment::mid;
			ret.align_y = alignment::max;
			break;
		case preservation::x_max_y_max:
			ret.align_x = alignment::max;
			ret.align_y = alignment::max;
			break;
	}

	return ret;
}

std::optional<r4::rectangle<real>> svgpdf::parse_view_box(std::string_view str)
{
	if (trim(str).empty()) {
		return {};
	}

	svgdom::view_boxed vb;
	try {
		vb.view_box = svgdom::view_boxed::parse(str);
	} catch (std::invalid_argument& e) {
		LOG([&](auto& o) {
			o << "svgpdf: malformed viewBox ignored: " << str << ", " << e.what() << std::endl;
		})
		return {};
	}

	if (!vb.is_view_box_specified() || vb.view_box[2] <= 0 || vb.view_box[3] <= 0) {
		return {};
	}
	return r4::rectangle<real>{
		{real(vb.view_box[0]), real(vb.view_box[1])},
		{real(vb.view_box[2]), real(vb.view_box[3])}
	};
}

matrix viewport_fit::to_matrix(const r4::rectangle<real>& view_box) const noexcept
{
	return multiply(
		translation_matrix(this->offset),
		multiply(scale_matrix(this->scale), translation_matrix(-view_box.p))
	);
}

viewport_fit svgpdf::fit_viewport(
	const r4::vector2<real>& viewport,
	const r4::rectangle<real>& view_box,
	const aspect_ratio& ar
)
{
	ASSERT(view_box.d.is_positive())

	viewport_fit ret;

	r4::vector2<real> scale = viewport.comp_div(view_box.d);

	if (!ar.preserve) {
		ret.scale = scale;
		ret.offset = {0, 0};
		return ret;
	}

	using std::max;
	using std::min;

	real s = ar.slice ? max(scale.x(), scale.y()) : min(scale.x(), scale.y());
	ret.scale = {s, s};

	auto leftover = viewport - view_box.d * s;

	ret.offset = {align_offset(ar.align_x, leftover.x()), align_offset(ar.align_y, leftover.y())};

	return ret;
}
