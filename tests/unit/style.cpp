#include <tst/set.hpp>
#include <tst/check.hpp>

#include <initializer_list>

#include "../../src/svgpdf/style.hxx"

namespace{
svgpdf::attribute_list make_attrs(std::initializer_list<std::pair<std::string_view, std::string>> list){
	svgpdf::attribute_list ret;
	for(const auto& a : list){
		ret.set(a.first, a.second);
	}
	return ret;
}

const svgpdf::length_context lengths;
}

namespace{
const tst::set set("style", [](tst::suite& suite){
	suite.add(
		"parse_style_declarations",
		[](){
			auto decls = svgpdf::parse_style_declarations(" Fill : red ; stroke:blue !important;; bogus ");
			tst::check_eq(decls.size(), size_t(2), SL);
			tst::check_eq(decls[0].first, std::string("fill"), SL);
			tst::check_eq(decls[0].second, std::string("red"), SL);
			tst::check_eq(decls[1].first, std::string("stroke"), SL);
			tst::check_eq(decls[1].second, std::string("blue"), SL);
		}
	);

	suite.add(
		"presentation_attribute_wins_over_style",
		[](){
			svgpdf::style root;
			auto st = root.derive(make_attrs({{"fill", "red"}, {"style", "fill: blue; stroke: green"}}), lengths);
			tst::check_eq(st.get(svgpdf::style_property::fill), std::string("red"), SL);
			tst::check_eq(st.get(svgpdf::style_property::stroke), std::string("green"), SL);
		}
	);

	suite.add(
		"inherited_and_non_inherited_properties",
		[](){
			svgpdf::style root;
			auto parent = root.derive(make_attrs({{"fill", "red"}, {"opacity", "0.5"}}), lengths);
			auto child = parent.derive(svgpdf::attribute_list(), lengths);

			tst::check_eq(child.get(svgpdf::style_property::fill), std::string("red"), SL);
			tst::check_eq(child.get_opacity(svgpdf::style_property::opacity), svgpdf::real(1), SL);
			tst::check_eq(parent.get_opacity(svgpdf::style_property::opacity), svgpdf::real(0.5), SL);
		}
	);

	suite.add(
		"explicit_inherit",
		[](){
			svgpdf::style root;
			auto parent = root.derive(make_attrs({{"clip-rule", "evenodd"}}), lengths);
			auto child = parent.derive(make_attrs({{"clip-rule", "inherit"}}), lengths);
			tst::check(child.get_fill_rule(svgpdf::style_property::clip_rule) == svgpdf::fill_rule::evenodd, SL);

			auto other = parent.derive(svgpdf::attribute_list(), lengths);
			tst::check(other.get_fill_rule(svgpdf::style_property::clip_rule) == svgpdf::fill_rule::evenodd, SL);
		}
	);

	suite.add(
		"font_size",
		[](){
			svgpdf::style root(16);
			tst::check_eq(root.get_font_size(), svgpdf::real(16), SL);

			auto em = root.derive(make_attrs({{"font-size", "2em"}}), lengths);
			tst::check_eq(em.get_font_size(), svgpdf::real(32), SL);

			auto percent = em.derive(make_attrs({{"style", "font-size: 50%"}}), lengths);
			tst::check_eq(percent.get_font_size(), svgpdf::real(16), SL);

			auto keyword = em.derive(make_attrs({{"font-size", "xx-large"}}), lengths);
			tst::check_eq(keyword.get_font_size(), svgpdf::real(32), SL);

			auto inherited = em.derive(svgpdf::attribute_list(), lengths);
			tst::check_eq(inherited.get_font_size(), svgpdf::real(32), SL);
		}
	);

	suite.add(
		"font_shorthand",
		[](){
			svgpdf::style root(16);
			auto st = root.derive(make_attrs({{"style", "font: italic bold 20px Arial"}}), lengths);
			tst::check_eq(st.get(svgpdf::style_property::font_style), std::string("italic"), SL);
			tst::check_eq(st.get(svgpdf::style_property::font_weight), std::string("bold"), SL);
			tst::check_eq(st.get(svgpdf::style_property::font_family), std::string("Arial"), SL);
			tst::check_eq(st.get_font_size(), svgpdf::real(20), SL);
		}
	);

	suite.add(
		"paint",
		[](){
			auto collabs = svgpdf::make_default_collaborators();
			const auto& colors = *collabs.colors;

			svgpdf::style root;
			auto st = root.derive(
				make_attrs({{"color", "#00ff00"}, {"fill", "currentColor"}, {"stroke", "url(#grad) red"}}),
				lengths
			);

			auto fill = st.get_paint(svgpdf::style_property::fill, colors);
			tst::check(fill.kind == svgpdf::paint::type::color, SL);
			tst::check_eq(fill.color.rgb.y(), svgpdf::real(1), SL);
			tst::check_eq(fill.color.rgb.x(), svgpdf::real(0), SL);

			auto stroke = st.get_paint(svgpdf::style_property::stroke, colors);
			tst::check(stroke.kind == svgpdf::paint::type::gradient, SL);
			tst::check_eq(stroke.gradient_id, std::string("grad"), SL);
			tst::check(stroke.fallback.has_value(), SL);
			tst::check_eq(stroke.fallback->rgb.x(), svgpdf::real(1), SL);

			auto none = root.derive(make_attrs({{"fill", "none"}}), lengths);
			tst::check(none.get_paint(svgpdf::style_property::fill, colors).kind == svgpdf::paint::type::none, SL);
		}
	);

	suite.add(
		"line_style",
		[](){
			svgpdf::style root;
			auto st = root.derive(
				make_attrs({
					{"stroke-width", "3"},
					{"stroke-linecap", "round"},
					{"stroke-linejoin", "bevel"},
					{"stroke-dasharray", "5, 2, 1"},
					{"stroke-dashoffset", "4"}
				}),
				lengths
			);

			auto ls = st.get_line_style(lengths);
			tst::check_eq(ls.width, svgpdf::real(3), SL);
			tst::check(ls.cap == svgpdf::line_cap::round, SL);
			tst::check(ls.join == svgpdf::line_join::bevel, SL);

			// odd count is repeated
			tst::check_eq(ls.dash_array.size(), size_t(6), SL);
			tst::check_eq(ls.dash_offset, svgpdf::real(4), SL);

			auto zero = root.derive(make_attrs({{"stroke-dasharray", "0 0"}}), lengths);
			tst::check(zero.get_line_style(lengths).dash_array.empty(), SL);

			auto negative = root.derive(make_attrs({{"stroke-dasharray", "5 -1"}}), lengths);
			tst::check(negative.get_line_style(lengths).dash_array.empty(), SL);
		}
	);

	suite.add(
		"blend_mode",
		[](){
			tst::check_eq(svgpdf::to_pdf_blend_mode("multiply"), std::string_view("Multiply"), SL);
			tst::check_eq(svgpdf::to_pdf_blend_mode("Color-Dodge"), std::string_view("ColorDodge"), SL);
			tst::check_eq(svgpdf::to_pdf_blend_mode("bogus"), std::string_view("Normal"), SL);

			svgpdf::style root;
			auto parent = root.derive(make_attrs({{"style", "mix-blend-mode: screen"}}), lengths);
			auto child = parent.derive(svgpdf::attribute_list(), lengths);
			tst::check_eq(child.get_blend_mode(), std::string_view("Screen"), SL);
		}
	);

	suite.add(
		"visibility_and_display",
		[](){
			svgpdf::style root;
			auto hidden = root.derive(make_attrs({{"visibility", "hidden"}}), lengths);
			tst::check(hidden.is_invisible(), SL);
			tst::check(hidden.derive(svgpdf::attribute_list(), lengths).is_invisible(), SL);

			auto visible_child = hidden.derive(make_attrs({{"visibility", "visible"}}), lengths);
			tst::check(!visible_child.is_invisible(), SL);

			auto none = root.derive(make_attrs({{"display", "none"}}), lengths);
			tst::check(none.is_not_displayed(), SL);
		}
	);

	suite.add(
		"unknown_declarations_are_kept",
		[](){
			svgpdf::style root;
			auto st = root.derive(make_attrs({{"style", "-inkscape-font-specification: Sans"}}), lengths);
			auto v = st.get_extra("-inkscape-font-specification");
			tst::check(v != nullptr, SL);
			tst::check_eq(*v, std::string("Sans"), SL);
		}
	);
	suite.add(
		"non_inherited_property_resets_to_initial_value",
		[](){
			tst::check_eq(svgpdf::get_initial_value(svgpdf::style_property::stop_color), std::string_view("black"), SL);

			svgpdf::style root;
			auto parent = root.derive(make_attrs({{"x", "10"}, {"stop-color", "red"}, {"style", "stop-opacity: 0.5"}}), lengths);
			tst::check_eq(parent.get(svgpdf::style_property::stop_color), std::string("red"), SL);
			tst::check_eq(parent.get_opacity(svgpdf::style_property::stop_opacity), svgpdf::real(0.5), SL);

			auto child = parent.derive(svgpdf::attribute_list(), lengths);
			tst::check_eq(child.get(svgpdf::style_property::stop_color), std::string("black"), SL);
			tst::check_eq(child.get_opacity(svgpdf::style_property::stop_opacity), svgpdf::real(1), SL);
		}
	);
});
}
