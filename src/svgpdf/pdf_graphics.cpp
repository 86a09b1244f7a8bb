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

#include "pdf_graphics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include <papki/vector_file.hpp>
#include <rasterimage/image_variant.hpp>
#include <utki/debug.hpp>

#include "geometry.hpp"
#include "util.hxx"

using namespace svgpdf;

namespace {
std::string format_point(const r4::vector2<real>& p)
{
	return format_number(p.x()) + " " + format_number(p.y());
}

std::string format_rgb(const color& c)
{
	return format_number(c.rgb.x()) + " " + format_number(c.rgb.y()) + " " + format_number(c.rgb.z());
}

std::string format_function(const gradient_stop& s0, const gradient_stop& s1)
{
	std::stringstream ss;
	ss << "<< /FunctionType 2 /Domain [0 1] /C0 [" << format_rgb(s0.color) << "] /C1 [" << format_rgb(s1.color)
	   << "] /N 1 >>";
	return ss.str();
}
} // namespace

std::string svgpdf::format_number(real value)
{
	// PDF requires '.' as decimal separator regardless of global locale
	std::ostringstream ss;
	ss.imbue(std::locale::classic());
	ss << std::fixed << std::setprecision(6) << double(value);

	std::string ret = ss.str();

	auto dot = ret.find('.');
	if (dot != std::string::npos) {
		auto last = ret.find_last_not_of('0');
		ret.erase(last == dot ? dot : last + 1);
	}

	if (ret == "-0") {
		return "0";
	}
	return ret;
}

std::string svgpdf::to_dictionary(const ext_gstate_resource& gs)
{
	std::stringstream ss;
	ss << "<< /Type /ExtGState /ca " << format_number(gs.fill_alpha) << " /CA " << format_number(gs.stroke_alpha);
	if (!gs.blend_mode.empty() && gs.blend_mode != "Normal") {
		ss << " /BM /" << gs.blend_mode;
	}
	ss << " >>";
	return ss.str();
}

std::string svgpdf::to_dictionary(const shading_resource& sh)
{
	const auto& spec = sh.spec;

	std::stringstream ss;

	ss << "<< /ShadingType " << (spec.kind == gradient_kind::linear ? 2 : 3) << " /ColorSpace /DeviceRGB /Coords [";
	const auto& c = spec.coords;
	if (spec.kind == gradient_kind::linear) {
		ss << format_number(c[0]) << " " << format_number(c[1]) << " " << format_number(c[2]) << " "
		   << format_number(c[3]);
	} else {
		// focal circle of zero radius, then the end circle
		ss << format_number(c[2]) << " " << format_number(c[3]) << " 0 " << format_number(c[0]) << " "
		   << format_number(c[1]) << " " << format_number(c[4]);
	}
	ss << "] /Function ";

	std::vector<gradient_stop> stops = spec.stops;
	if (stops.empty()) {
		stops.push_back(gradient_stop{});
	}

	// stretch the stops over the whole domain
	if (stops.front().offset > 0) {
		auto s = stops.front();
		s.offset = 0;
		stops.insert(stops.begin(), s);
	}
	if (stops.back().offset < 1 || stops.size() == 1) {
		auto s = stops.back();
		s.offset = 1;
		stops.push_back(s);
	}

	if (stops.size() == 2) {
		ss << format_function(stops[0], stops[1]);
	} else {
		std::stringstream functions;
		std::stringstream bounds;
		std::stringstream encode;
		for (size_t i = 0; i + 1 != stops.size(); ++i) {
			if (i != 0) {
				functions << " ";
				bounds << (i == 1 ? "" : " ") << format_number(stops[i].offset);
				encode << " ";
			}
			functions << format_function(stops[i], stops[i + 1]);
			encode << "0 1";
		}
		ss << "<< /FunctionType 3 /Domain [0 1] /Functions [" << functions.str() << "] /Bounds [" << bounds.str()
		   << "] /Encode [" << encode.str() << "] >>";
	}

	ss << " /Extend [true true] >>";
	return ss.str();
}

std::string pdf_graphics::save()
{
	return "q\n";
}

std::string pdf_graphics::restore()
{
	return "Q\n";
}

std::string pdf_graphics::transform(const matrix& m)
{
	std::stringstream ss;
	for (auto c : to_coefficients(m)) {
		ss << format_number(c) << " ";
	}
	ss << "cm\n";
	return ss.str();
}

std::string pdf_graphics::move_to(const r4::vector2<real>& p)
{
	return format_point(p) + " m\n";
}

std::string pdf_graphics::line_to(const r4::vector2<real>& p)
{
	return format_point(p) + " l\n";
}

std::string pdf_graphics::curve_to(
	const r4::vector2<real>& cp1,
	const r4::vector2<real>& cp2,
	const r4::vector2<real>& ep
)
{
	return format_point(cp1) + " " + format_point(cp2) + " " + format_point(ep) + " c\n";
}

std::string pdf_graphics::close_path()
{
	return "h\n";
}

std::string pdf_graphics::rectangle(const r4::rectangle<real>& rect)
{
	return format_point(rect.p) + " " + format_point(rect.d) + " re\n";
}

std::string pdf_graphics::arc(
	const r4::vector2<real>& center,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	real start_angle,
	real sweep_angle
)
{
	std::string ret;
	for (const auto& b : arc_to_beziers(center, radius, x_axis_rotation, start_angle, sweep_angle)) {
		ret.append(this->curve_to(b.cp1, b.cp2, b.end));
	}
	return ret;
}

std::string pdf_graphics::ellipse(const r4::vector2<real>& center, const r4::vector2<real>& radius)
{
	std::string ret = this->move_to(center + r4::vector2<real>{radius.x(), 0});
	for (const auto& b : ellipse_to_beziers(center, radius)) {
		ret.append(this->curve_to(b.cp1, b.cp2, b.end));
	}
	ret.append(this->close_path());
	return ret;
}

std::string pdf_graphics::polygon(utki::span<const r4::vector2<real>> points, bool close)
{
	std::string ret;

	bool first = true;
	for (const auto& p : points) {
		if (first) {
			ret.append(this->move_to(p));
			first = false;
		} else {
			ret.append(this->line_to(p));
		}
	}

	if (close && !points.empty()) {
		ret.append(this->close_path());
	}

	return ret;
}

std::string pdf_graphics::paint(paint_op op, fill_rule rule)
{
	bool even_odd = rule == fill_rule::evenodd;

	switch (op) {
		case paint_op::fill:
			return even_odd ? "f*\n" : "f\n";
		case paint_op::stroke:
			return "S\n";
		case paint_op::fill_stroke:
			return even_odd ? "B*\n" : "B\n";
		case paint_op::none:
			break;
	}
	return "n\n";
}

std::string pdf_graphics::clip(fill_rule rule)
{
	return rule == fill_rule::evenodd ? "W* n\n" : "W n\n";
}

std::string pdf_graphics::set_fill_color(const color& c)
{
	return format_rgb(c) + " rg\n";
}

std::string pdf_graphics::set_stroke_color(const color& c)
{
	return format_rgb(c) + " RG\n";
}

std::string pdf_graphics::set_line_style(const line_style& style)
{
	std::stringstream ss;

	ss << format_number(style.width) << " w ";

	switch (style.cap) {
		case line_cap::butt:
			ss << "0";
			break;
		case line_cap::round:
			ss << "1";
			break;
		case line_cap::square:
			ss << "2";
			break;
	}
	ss << " J ";

	switch (style.join) {
		case line_join::miter:
			ss << "0";
			break;
		case line_join::round:
			ss << "1";
			break;
		case line_join::bevel:
			ss << "2";
			break;
	}
	ss << " j " << format_number(style.miter_limit) << " M [";

	bool first = true;
	for (auto d : style.dash_array) {
		if (!first) {
			ss << " ";
		}
		first = false;
		ss << format_number(d);
	}
	ss << "] " << format_number(style.dash_offset) << " d\n";

	return ss.str();
}

std::string pdf_graphics::set_alpha(unsigned id, real fill_alpha, real stroke_alpha, std::string_view blend_mode)
{
	this->ext_gstates.push_back(ext_gstate_resource{id, fill_alpha, stroke_alpha, std::string(blend_mode)});

	return "/GS" + std::to_string(id) + " gs\n";
}

std::string pdf_graphics::shading(unsigned id, const shading_spec& spec)
{
	this->shadings.push_back(shading_resource{id, spec});

	return "/Sh" + std::to_string(id) + " sh\n";
}

std::string pdf_image_embedder::embed(
	unsigned id,
	utki::span<const uint8_t> data,
	std::string_view mime,
	const r4::rectangle<real>& box
)
{
	image_resource res;
	res.id = id;
	res.mime = mime;
	res.data.assign(data.begin(), data.end());

	try {
		papki::vector_file fi(std::vector<uint8_t>(data.begin(), data.end()));

		auto im = [&]() {
			if (mime == "image/jpeg" || mime == "image/jpg") {
				return rasterimage::read_jpeg(fi);
			}
			return rasterimage::read_png(fi);
		}();

		res.dims = im.dims();
		res.num_channels = im.num_channels();
	} catch (std::exception& e) {
		LOG([&](auto& o) {
			o << "svgpdf: could not decode image: " << e.what() << std::endl;
		})
		return {};
	}

	this->images.push_back(std::move(res));

	// image space is y-up, user space is y-down
	std::stringstream ss;
	ss << "q\n"
	   << format_number(box.d.x()) << " 0 0 " << format_number(-box.d.y()) << " " << format_number(box.p.x()) << " "
	   << format_number(box.p.y() + box.d.y()) << " cm\n"
	   << "/Im" << id << " Do\n"
	   << "Q\n";
	return ss.str();
}
