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

#include "style.hxx"

#include <algorithm>
#include <array>

#include <utki/debug.hpp>

#include "util.hxx"

using namespace svgpdf;

namespace {
// initial values of the properties which have one
const std::array<std::pair<style_property, std::string_view>, 59> initial_values = {
	{
     {style_property::alignment_baseline, "auto"},
     {style_property::baseline_shift, "baseline"},
     {style_property::clip, "auto"},
     {style_property::clip_path, "none"},
     {style_property::clip_rule, "nonzero"},
     {style_property::color, "black"},
     {style_property::color_interpolation, "sRGB"},
     {style_property::color_interpolation_filters, "linearRGB"},
     {style_property::color_profile, "auto"},
     {style_property::color_rendering, "auto"},
     {style_property::cursor, "auto"},
     {style_property::direction, "ltr"},
     {style_property::display, "inline"},
     {style_property::dominant_baseline, "auto"},
     {style_property::enable_background, "accumulate"},
     {style_property::fill, "black"},
     {style_property::fill_opacity, "1"},
     {style_property::fill_rule, "nonzero"},
     {style_property::filter, "none"},
     {style_property::flood_color, "black"},
     {style_property::flood_opacity, "1"},
     {style_property::font_family, "helvetica"},
     {style_property::font_size, "medium"},
     {style_property::font_size_adjust, "none"},
     {style_property::font_stretch, "normal"},
     {style_property::font_style, "normal"},
     {style_property::font_variant, "normal"},
     {style_property::font_weight, "normal"},
     {style_property::glyph_orientation_horizontal, "0deg"},
     {style_property::glyph_orientation_vertical, "auto"},
     {style_property::image_rendering, "auto"},
     {style_property::kerning, "auto"},
     {style_property::letter_spacing, "normal"},
     {style_property::lighting_color, "white"},
     {style_property::marker_end, "none"},
     {style_property::marker_mid, "none"},
     {style_property::marker_start, "none"},
     {style_property::mask, "none"},
     {style_property::opacity, "1"},
     {style_property::overflow, "auto"},
     {style_property::pointer_events, "visiblePainted"},
     {style_property::shape_rendering, "auto"},
     {style_property::stop_color, "black"},
     {style_property::stop_opacity, "1"},
     {style_property::stroke, "none"},
     {style_property::stroke_dasharray, "none"},
     {style_property::stroke_dashoffset, "0"},
     {style_property::stroke_linecap, "butt"},
     {style_property::stroke_linejoin, "miter"},
     {style_property::stroke_miterlimit, "4"},
     {style_property::stroke_opacity, "1"},
     {style_property::stroke_width, "1"},
     {style_property::text_anchor, "start"},
     {style_property::text_decoration, "none"},
     {style_property::text_rendering, "auto"},
     {style_property::unicode_bidi, "normal"},
     {style_property::visibility, "visible"},
     {style_property::word_spacing, "normal"},
     {style_property::writing_mode, "lr-tb"},
	 }
};

const std::array<std::pair<std::string_view, std::string_view>, 16> blend_modes = {
	{
     {"normal", "Normal"},
     {"multiply", "Multiply"},
     {"screen", "Screen"},
     {"overlay", "Overlay"},
     {"darken", "Darken"},
     {"lighten", "Lighten"},
     {"color-dodge", "ColorDodge"},
     {"color-burn", "ColorBurn"},
     {"hard-light", "HardLight"},
     {"soft-light", "SoftLight"},
     {"difference", "Difference"},
     {"exclusion", "Exclusion"},
     {"hue", "Hue"},
     {"saturation", "Saturation"},
     {"color", "Color"},
     {"luminosity", "Luminosity"},
	 }
};

// font size keywords relative to 'medium'
const std::array<std::pair<std::string_view, real>, 7> font_size_keywords = {
	{
     {"xx-small", real(3) / real(5)},
     {"x-small", real(3) / real(4)},
     {"small", real(8) / real(9)},
     {"medium", real(1)},
     {"large", real(6) / real(5)},
     {"x-large", real(3) / real(2)},
     {"xx-large", real(2)},
	 }
};

const real font_size_step = real(1.2);

struct font_shorthand {
	std::string style;
	std::string weight;
	std::string size;
	std::string family;
};

bool is_font_weight(std::string_view v)
{
	return v == "bold" || v == "bolder" || v == "lighter"
		|| (v.size() == 3 && is_digit(v[0]) && v[1] == '0' && v[2] == '0');
}

// font: [style] [variant] [weight] size[/line-height] family
font_shorthand parse_font_shorthand(std::string_view str)
{
	font_shorthand ret;

	str = trim(str);
	while (!str.empty()) {
		auto end = std::find_if(str.begin(), str.end(), is_space);
		std::string_view token(str.data(), size_t(end - str.begin()));

		if (token == "italic" || token == "oblique") {
			ret.style = token;
		} else if (is_font_weight(token)) {
			ret.weight = token;
		} else if (token == "normal" || token == "small-caps") {
			// variant is not used
		} else {
			auto slash = token.find('/');
			ret.size = token.substr(0, slash);
			str.remove_prefix(token.size());
			ret.family = trim(str);
			break;
		}

		str.remove_prefix(token.size());
		str = trim(str);
	}

	return ret;
}

std::string_view strip_important(std::string_view v)
{
	const std::string_view important = "!important";
	if (ends_with(v, important)) {
		v.remove_suffix(important.size());
	}
	return trim(v);
}
} // namespace

std::string_view svgpdf::get_initial_value(style_property p) noexcept
{
	auto i = std::find_if(initial_values.begin(), initial_values.end(), [p](const auto& v) {
		return v.first == p;
	});
	if (i == initial_values.end()) {
		return {};
	}
	return i->second;
}

std::vector<std::pair<std::string, std::string>> svgpdf::parse_style_declarations(std::string_view str)
{
	std::vector<std::pair<std::string, std::string>> ret;

	while (!str.empty()) {
		auto semicolon = str.find(';');
		auto decl = str.substr(0, semicolon);
		str.remove_prefix(semicolon == std::string_view::npos ? str.size() : semicolon + 1);

		auto colon = decl.find(':');
		if (colon == std::string_view::npos) {
			continue;
		}

		auto name = trim(decl.substr(0, colon));
		auto value = strip_important(trim(decl.substr(colon + 1)));
		if (name.empty()) {
			continue;
		}

		ret.emplace_back(to_lower(name), std::string(value));
	}

	return ret;
}

std::string_view svgpdf::to_pdf_blend_mode(std::string_view css_name) noexcept
{
	auto name = trim(css_name);
	for (const auto& m : blend_modes) {
		if (m.first.size() != name.size()) {
			continue;
		}
		if (std::equal(m.first.begin(), m.first.end(), name.begin(), [](char a, char b) {
				return a == (b >= 'A' && b <= 'Z' ? char(b - 'A' + 'a') : b);
			}))
		{
			return m.second;
		}
	}
	return "Normal";
}

style::style(real font_size) :
	font_size_px(font_size),
	medium_font_size(font_size)
{
	for (const auto& v : initial_values) {
		this->values[v.first] = v.second;
	}
}

const std::string& style::get(style_property p) const noexcept
{
	static const std::string empty;

	auto i = this->values.find(p);
	if (i == this->values.end()) {
		return empty;
	}
	return i->second;
}

style style::derive(const attribute_list& attrs, const length_context& ctx) const
{
	style ret(*this);
	ret.extra.clear();

	for (auto i = ret.values.begin(); i != ret.values.end();) {
		if (svgdom::styleable::is_inherited(i->first)) {
			++i;
			continue;
		}
		auto initial = get_initial_value(i->first);
		if (initial.empty()) {
			i = ret.values.erase(i);
		} else {
			i->second = initial;
			++i;
		}
	}

	const std::string blend_mode_name = "mix-blend-mode";

	const std::string* blend_decl = nullptr;
	std::map<style_property, const std::string*> declared;

	auto decls = parse_style_declarations(attrs.get_or("style", ""));
	for (const auto& d : decls) {
		if (d.first == blend_mode_name) {
			blend_decl = &d.second;
			continue;
		}
		auto p = svgdom::styleable::string_to_property(d.first);
		if (p == style_property::unknown) {
			ret.extra[d.first] = d.second;
			continue;
		}
		// later declaration overrides earlier one
		declared[p] = &d.second;
	}

	std::map<style_property, const std::string*> presentation;
	for (const auto& a : attrs) {
		if (a.first == blend_mode_name) {
			continue;
		}
		auto p = svgdom::styleable::string_to_property(a.first);
		if (p != style_property::unknown) {
			presentation[p] = &a.second;
		}
	}

	// resolves presentation attribute and style declaration of one property,
	// 'inherit' gives the parent's value
	auto resolve = [this](style_property p, const std::string* attr, const std::string* decl) {
		if (attr && trim(*attr) != "inherit") {
			return std::string(strip_important(trim(*attr)));
		}
		if (decl && *decl != "inherit") {
			return *decl;
		}
		return this->get(p);
	};

	std::map<style_property, std::string> explicit_values;

	for (const auto& a : presentation) {
		auto d = declared.find(a.first);
		explicit_values[a.first] = resolve(a.first, a.second, d == declared.end() ? nullptr : d->second);
	}
	for (const auto& d : declared) {
		if (presentation.find(d.first) == presentation.end()) {
			explicit_values[d.first] = resolve(d.first, nullptr, d.second);
		}
	}

	if (const auto* attr = attrs.get(blend_mode_name); attr && trim(*attr) != "inherit") {
		ret.blend_mode = strip_important(trim(*attr));
	} else if (blend_decl && *blend_decl != "inherit") {
		ret.blend_mode = *blend_decl;
	}

	// 'font' shorthand gives values to longhands which are not set explicitly
	if (auto font = explicit_values.find(style_property::font); font != explicit_values.end()) {
		auto f = parse_font_shorthand(font->second);
		auto expand = [&explicit_values](style_property p, std::string v) {
			if (!v.empty()) {
				explicit_values.emplace(p, std::move(v));
			}
		};
		expand(style_property::font_style, std::move(f.style));
		expand(style_property::font_weight, std::move(f.weight));
		expand(style_property::font_size, std::move(f.size));
		expand(style_property::font_family, std::move(f.family));
	}

	bool font_size_set = explicit_values.find(style_property::font_size) != explicit_values.end();

	for (auto& v : explicit_values) {
		ret.values[v.first] = std::move(v.second);
	}

	// 'color: currentColor' means the inherited color
	if (to_lower(trim(ret.get(style_property::color))) == "currentcolor") {
		ret.set(style_property::color, this->get(style_property::color));
	}

	if (font_size_set) {
		const auto& v = ret.get(style_property::font_size);

		auto keyword = std::find_if(font_size_keywords.begin(), font_size_keywords.end(), [&v](const auto& k) {
			return k.first == v;
		});

		if (keyword != font_size_keywords.end()) {
			ret.font_size_px = this->medium_font_size * keyword->second;
		} else if (v == "larger") {
			ret.font_size_px = this->font_size_px * font_size_step;
		} else if (v == "smaller") {
			ret.font_size_px = this->font_size_px / font_size_step;
		} else if (auto l = parse_length(v); l.has_value()) {
			// relative units refer to the parent's font size
			length_context fctx = ctx;
			fctx.font_size = this->font_size_px;
			fctx.percent_reference = this->font_size_px;
			ret.font_size_px = to_user_units(l.value(), fctx);
		}
	}

	return ret;
}

const std::string* style::get_extra(std::string_view name) const noexcept
{
	auto i = this->extra.find(name);
	if (i == this->extra.end()) {
		return nullptr;
	}
	return &i->second;
}

real style::get_number(style_property p, real default_value) const
{
	auto l = parse_length(this->get(p));
	if (!l.has_value()) {
		return default_value;
	}
	if (l->is_percent()) {
		return percent_to_fraction(l.value());
	}
	return real(l->value);
}

real style::get_opacity(style_property p) const
{
	return std::clamp(this->get_number(p, 1), real(0), real(1));
}

std::optional<color> style::get_color(style_property p, const color_resolver& colors) const
{
	auto v = trim(this->get(p));

	if (to_lower(v) == "currentcolor") {
		if (p == style_property::color) {
			// root element, use initial value
			return colors.resolve(get_initial_value(p));
		}
		return this->get_color(style_property::color, colors);
	}

	return colors.resolve(v);
}

paint style::get_paint(style_property p, const color_resolver& colors) const
{
	paint ret;

	auto v = trim(this->get(p));

	if (v.empty() || v == "none") {
		return ret;
	}

	if (starts_with(v, "url(")) {
		auto close = v.find(')');
		if (close == std::string_view::npos) {
			return ret;
		}
		ret.kind = paint::type::gradient;
		ret.gradient_id = get_local_id_from_iri(v.substr(0, close + 1));

		auto fallback = trim(v.substr(close + 1));
		if (!fallback.empty() && fallback != "none") {
			if (to_lower(fallback) == "currentcolor") {
				ret.fallback = this->get_color(style_property::color, colors);
			} else {
				ret.fallback = colors.resolve(fallback);
			}
		}
		return ret;
	}

	auto c = this->get_color(p, colors);
	if (!c.has_value()) {
		LOG([&](auto& o) {
			o << "svgpdf: unknown paint '" << v << "', no paint used" << std::endl;
		})
		return ret;
	}

	ret.kind = paint::type::color;
	ret.color = c.value();
	return ret;
}

fill_rule style::get_fill_rule(style_property p) const noexcept
{
	if (trim(this->get(p)) == "evenodd") {
		return fill_rule::evenodd;
	}
	return fill_rule::nonzero;
}

line_style style::get_line_style(const length_context& ctx) const
{
	line_style ret;

	ret.width = std::max(real(0), parse_user_units(this->get(style_property::stroke_width), ctx, 1));

	auto cap = trim(this->get(style_property::stroke_linecap));
	if (cap == "round") {
		ret.cap = line_cap::round;
	} else if (cap == "square") {
		ret.cap = line_cap::square;
	}

	auto join = trim(this->get(style_property::stroke_linejoin));
	if (join == "round") {
		ret.join = line_join::round;
	} else if (join == "bevel") {
		ret.join = line_join::bevel;
	}

	ret.miter_limit = std::max(real(1), parse_number(this->get(style_property::stroke_miterlimit), 4));

	auto dasharray = trim(this->get(style_property::stroke_dasharray));
	if (dasharray != "none") {
		real sum = 0;
		bool valid = true;
		for (auto item : split_list(dasharray)) {
			auto l = parse_length(item);
			if (!l.has_value()) {
				valid = false;
				break;
			}
			auto d = to_user_units(l.value(), ctx);
			if (d < 0) {
				valid = false;
				break;
			}
			sum += d;
			ret.dash_array.push_back(d);
		}

		if (!valid || sum <= 0) {
			// invalid dash array renders as a solid line
			ret.dash_array.clear();
		} else if (ret.dash_array.size() % 2 != 0) {
			auto copy = ret.dash_array;
			ret.dash_array.insert(ret.dash_array.end(), copy.begin(), copy.end());
		}

		if (!ret.dash_array.empty()) {
			ret.dash_offset = parse_user_units(this->get(style_property::stroke_dashoffset), ctx, 0);
		}
	}

	return ret;
}

bool style::is_invisible() const noexcept
{
	auto v = trim(this->get(style_property::visibility));
	return v == "hidden" || v == "collapse";
}

bool style::is_not_displayed() const noexcept
{
	return trim(this->get(style_property::display)) == "none";
}

std::string_view style::get_blend_mode() const noexcept
{
	return to_pdf_blend_mode(this->blend_mode);
}

text_direction style::get_direction() const noexcept
{
	if (trim(this->get(style_property::direction)) == "rtl") {
		return text_direction::rtl;
	}
	return text_direction::ltr;
}
