#include <tst/set.hpp>
#include <tst/check.hpp>

#include <memory>

#include "../../src/svgpdf/convert.hpp"
#include "../../src/svgpdf/errors.hpp"
#include "../../src/svgpdf/pdf_graphics.hpp"

namespace{
std::string render(svgpdf::converter& conv, std::string_view svg){
	return conv.render(conv.convert(svg, 0, 0, 0, 0, 800));
}

bool contains(const std::string& str, std::string_view what){
	return str.find(what) != std::string::npos;
}
}

namespace{
const tst::set set("convert", [](tst::suite& suite){
	suite.add(
		"root_is_placed_with_flipped_y_axis",
		[](){
			svgpdf::converter conv;
			auto ops = conv.render(conv.convert(R"(<svg width="200" height="100"/>)", 10, 20, 0, 0, 800));
			tst::check_eq(ops, std::string("q\n0.75 0 0 -0.75 10 780 cm\n0 0 200 100 re\nW n\nQ\n"), SL);
		}
	);

	suite.add(
		"missing_requested_dimension_keeps_aspect_ratio",
		[](){
			svgpdf::converter conv;
			auto ops = conv.render(conv.convert(R"(<svg width="200" height="100"/>)", 0, 0, 100, 0, 800));
			tst::check(contains(ops, "0.5 0 0 -0.5 0 800 cm\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"view_box_is_fitted_into_viewport",
		[](){
			svgpdf::converter conv;
			auto ops = render(conv, R"(<svg width="100" height="100" viewBox="0 0 50 50"/>)");
			tst::check(contains(ops, "0 0 100 100 re\nW n\n2 0 0 2 0 0 cm\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"rect_is_filled_black_by_default",
		[](){
			svgpdf::converter conv;
			auto ops = render(conv, R"(<svg width="100" height="100"><rect x="5" y="5" width="10" height="10"/></svg>)");
			tst::check(contains(ops, "0 0 0 rg\n5 5 10 10 re\nf\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"evenodd_fill_rule",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><path d="M0 0 L10 0 L10 10 Z" fill="red" fill-rule="evenodd"/></svg>)"
			);
			tst::check(contains(ops, "1 0 0 rg\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "h\nf*\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"line_is_stroked_only",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><line x1="0" y1="0" x2="10" y2="0" stroke="blue" stroke-width="2"/></svg>)"
			);
			tst::check(contains(ops, "2 w "), SL) << "ops = " << ops;
			tst::check(contains(ops, "0 0 1 RG\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "0 0 m\n10 0 l\nS\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, " rg\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"group_transform_is_emitted_in_own_scope",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><g transform="translate(5 6)"><rect width="1" height="1"/></g></svg>)"
			);
			tst::check(contains(ops, "q\n1 0 0 1 5 6 cm\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"use_copies_referenced_element",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="200" height="100">)"
				R"(<defs><rect id="r" x="5" y="5" width="10" height="10"/></defs>)"
				R"(<use xlink:href="#r" x="100"/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "105 5 10 10 re\nf\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, "\n5 5 10 10 re\n"), SL) << "definition must not be painted, ops = " << ops;
		}
	);

	suite.add(
		"recursive_use_terminates",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<defs><g id="a"><rect width="1" height="1"/><use xlink:href="#a"/></g></defs>)"
				R"(<use xlink:href="#a"/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "0 0 1 1 re\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"clip_path_is_applied_before_painting",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<clipPath id="c"><path d="M0 0 L50 50 L0 50 Z"/></clipPath>)"
				R"(<rect width="100" height="100" fill="red" clip-path="url(#c)"/>)"
				R"(</svg>)"
			);
			auto clip_pos = ops.find("50 50 l\n");
			auto clip_op_pos = ops.find("W n\n", clip_pos);
			auto fill_pos = ops.find("1 0 0 rg\n");
			tst::check(clip_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(clip_op_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(fill_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(clip_op_pos < fill_pos, SL) << "ops = " << ops;
		}
	);

	suite.add(
		"display_none_is_not_painted",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><g display="none"><rect width="9" height="9"/></g></svg>)"
			);
			tst::check(!contains(ops, "0 0 9 9 re\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"unknown_elements_are_passed_through",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><foo><rect width="7" height="7"/></foo><metadata>bla</metadata></svg>)"
			);
			tst::check(contains(ops, "0 0 7 7 re\nf\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"opacity_sets_graphics_state",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><rect width="10" height="10" fill="red" fill-opacity="0.5"/></svg>)"
			);
			tst::check(contains(ops, " gs\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "/GS"), SL) << "ops = " << ops;

			auto gfx = std::dynamic_pointer_cast<svgpdf::pdf_graphics>(conv.get_collaborators().graphics);
			tst::check(gfx != nullptr, SL);
			tst::check_eq(gfx->get_ext_gstates().size(), size_t(1), SL);
			tst::check_eq(gfx->get_ext_gstates().front().fill_alpha, svgpdf::real(0.5), SL);
		}
	);

	suite.add(
		"linear_gradient_fill_is_shading",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<defs><linearGradient id="g">)"
				R"(<stop offset="0" stop-color="red"/><stop offset="1" stop-color="blue"/>)"
				R"(</linearGradient></defs>)"
				R"(<rect width="100" height="100" fill="url(#g)"/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "W n\n100 0 0 100 0 0 cm\n/Sh"), SL) << "ops = " << ops;
			tst::check(contains(ops, " sh\nQ\n"), SL) << "ops = " << ops;

			auto gfx = std::dynamic_pointer_cast<svgpdf::pdf_graphics>(conv.get_collaborators().graphics);
			tst::check(gfx != nullptr, SL);
			tst::check_eq(gfx->get_shadings().size(), size_t(1), SL);
			tst::check_eq(gfx->get_shadings().front().spec.stops.size(), size_t(2), SL);
		}
	);

	suite.add(
		"missing_gradient_uses_fallback_color",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><rect width="10" height="10" fill="url(#nothing) lime"/></svg>)"
			);
			tst::check(contains(ops, "0 1 0 rg\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, " sh\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"gradient_without_stops_uses_fallback_color",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<defs><linearGradient id="g"/></defs>)"
				R"(<rect width="10" height="10" fill="url(#g) lime"/>)"
				R"(<rect width="20" height="20" fill="url(#g)"/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "0 1 0 rg\n0 0 10 10 re\nf\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, " sh\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, "0 0 20 20 re\nf\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"gradient_inside_clip_path_is_not_registered",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<clipPath id="c">)"
				R"(<linearGradient id="g"><stop offset="0" stop-color="red"/><stop offset="1" stop-color="blue"/></linearGradient>)"
				R"(<rect width="50" height="50"/>)"
				R"(</clipPath>)"
				R"(<rect width="100" height="100" fill="url(#g) lime" clip-path="url(#c)"/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "0 1 0 rg\n"), SL) << "ops = " << ops;
			tst::check(!contains(ops, " sh\n"), SL) << "ops = " << ops;

			auto gfx = std::dynamic_pointer_cast<svgpdf::pdf_graphics>(conv.get_collaborators().graphics);
			tst::check(gfx != nullptr, SL);
			tst::check(gfx->get_shadings().empty(), SL);
		}
	);

	suite.add(
		"clip_path_inside_defs",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<defs><clipPath id="c"><rect width="30" height="30"/></clipPath></defs>)"
				R"(<rect width="100" height="100" fill="red" clip-path="url(#c)"/>)"
				R"(</svg>)"
			);
			auto clip_pos = ops.find("0 0 m\n30 0 l\n30 30 l\n0 30 l\nh\nW n\n");
			auto fill_pos = ops.find("1 0 0 rg\n");
			tst::check(clip_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(fill_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(clip_pos < fill_pos, SL) << "ops = " << ops;

			// clip path content is not painted
			tst::check(!contains(ops, "0 0 30 30 re\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"nested_svg_has_own_viewport",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<svg x="10" y="20" width="50" height="40" viewBox="0 0 10 10" preserveAspectRatio="xMaxYMid meet">)"
				R"(<rect width="1" height="1"/>)"
				R"(</svg>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "1 0 0 1 10 20 cm\n0 0 50 40 re\nW n\n4 0 0 4 10 0 cm\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "0 0 1 1 re\nf\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"use_position_on_group_is_translation",
		[](){
			svgpdf::converter conv;
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<defs>)"
				R"(<g id="grp"><rect width="5" height="5"/></g>)"
				R"(<circle id="dot" cx="5" cy="5" r="5"/>)"
				R"(</defs>)"
				R"(<use xlink:href="#grp" x="10" y="20"/>)"
				R"(<use xlink:href="#dot" x="30"/>)"
				R"(</svg>)"
			);
			auto group_pos = ops.find("1 0 0 1 10 20 cm\n");
			tst::check(group_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(ops.find("0 0 5 5 re\nf\n", group_pos) != std::string::npos, SL) << "ops = " << ops;

			auto dot_pos = ops.find("1 0 0 1 30 0 cm\n");
			tst::check(dot_pos != std::string::npos, SL) << "ops = " << ops;
			tst::check(ops.find("10 5 m\n", dot_pos) != std::string::npos, SL) << "ops = " << ops;
		}
	);

	suite.add(
		"right_to_left_text_anchor",
		[](){
			svgpdf::converter conv;
			// default font size is 16px, two glyphs advance by 16
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<text x="50" y="20" direction="rtl">Hi</text>)"
				R"(<text x="50" y="40" direction="rtl" text-anchor="end">Hi</text>)"
				R"(</svg>)"
			);
			// start of right-to-left text is its right edge
			tst::check(contains(ops, "1 0 0 -1 34 20 Tm\n(iH) Tj\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "1 0 0 -1 50 40 Tm\n(iH) Tj\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"data_uri_scheme_is_case_insensitive",
		[](){
			auto collabs = svgpdf::make_default_collaborators();
			auto bytes = collabs.loader->load("DATA:text/plain;BASE64,aGk=", "");
			tst::check_eq(bytes.size(), size_t(2), SL);
			tst::check_eq(bytes[0], uint8_t('h'), SL);
			tst::check_eq(bytes[1], uint8_t('i'), SL);
		}
	);

	suite.add(
		"text_is_laid_out",
		[](){
			svgpdf::converter conv;
			auto ops = render(conv, R"(<svg width="100" height="100"><text x="10" y="20">Hello</text></svg>)");
			tst::check(contains(ops, "BT\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "1 0 0 -1 10 20 Tm\n(Hello) Tj\nET\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"text_anchor_middle",
		[](){
			svgpdf::converter conv;
			// default font size is 16px, two glyphs advance by 16
			auto ops = render(
				conv,
				R"(<svg width="100" height="100"><text x="10" y="20" text-anchor="middle">Hi</text></svg>)"
			);
			tst::check(contains(ops, "1 0 0 -1 2 20 Tm\n(Hi) Tj\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"tspan_continues_text_position",
		[](){
			svgpdf::converter conv;
			auto ops = render(conv, R"(<svg width="100" height="100"><text x="0" y="10">ab<tspan>cd</tspan></text></svg>)");
			tst::check(contains(ops, "1 0 0 -1 0 10 Tm\n(ab) Tj\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "1 0 0 -1 16 10 Tm\n(cd) Tj\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"nested_svg_image_is_child_document",
		[](){
			svgpdf::converter conv;
			// <svg width="10" height="10"><rect width="3" height="3"/></svg>
			auto ops = render(
				conv,
				R"(<svg width="100" height="100">)"
				R"(<image width="20" height="20" xlink:href="data:image/svg+xml;base64,)"
				R"(PHN2ZyB3aWR0aD0iMTAiIGhlaWdodD0iMTAiPjxyZWN0IHdpZHRoPSIzIiBoZWlnaHQ9IjMiLz48L3N2Zz4="/>)"
				R"(</svg>)"
			);
			tst::check(contains(ops, "1.5 0 0 -1.5 0 800 cm\n"), SL) << "ops = " << ops;
			tst::check(contains(ops, "0 0 3 3 re\nf\n"), SL) << "ops = " << ops;
		}
	);

	suite.add(
		"conversions_have_distinct_handles",
		[](){
			svgpdf::converter conv;
			auto h1 = conv.convert(R"(<svg width="10" height="10"/>)", 0, 0, 0, 0, 100);
			auto h2 = conv.convert(R"(<svg width="20" height="10"/>)", 0, 0, 0, 0, 100);
			tst::check_ne(h1, h2, SL);
			tst::check(contains(conv.render(h1), "0 0 10 10 re\n"), SL);
			tst::check(contains(conv.render(h2), "0 0 20 10 re\n"), SL);
		}
	);

	suite.add(
		"unknown_handle_throws",
		[](){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.render(12345);
			}catch(svgpdf::unknown_handle& e){
				thrown = true;
				tst::check_eq(e.handle, 12345u, SL);
			}
			tst::check(thrown, SL);
		}
	);

	suite.add<std::string>(
		"invalid_input_throws",
		{
			"",
			"   ",
			"@",
			"<html></html>"
		},
		[](const auto& p){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.convert(p, 0, 0, 0, 0, 800);
			}catch(svgpdf::invalid_input&){
				thrown = true;
			}
			tst::check(thrown, SL) << "input = '" << p << "'";
		}
	);

	suite.add(
		"non_positive_size_throws",
		[](){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.convert(R"(<svg width="0" height="10"/>)", 0, 0, 0, 0, 800);
			}catch(svgpdf::invalid_geometry&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"negative_requested_size_throws",
		[](){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.convert(R"(<svg width="10" height="10"/>)", 0, 0, -5, 0, 800);
			}catch(svgpdf::invalid_geometry&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"mismatched_tag_reports_line",
		[](){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.convert("<svg>\n<g>\n</svg>", 0, 0, 0, 0, 800);
			}catch(svgpdf::malformed_document& e){
				thrown = true;
				tst::check_eq(e.line, 3u, SL);
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"unclosed_element_throws",
		[](){
			svgpdf::converter conv;
			bool thrown = false;
			try{
				conv.convert("<svg>\n<g>", 0, 0, 0, 0, 800);
			}catch(svgpdf::malformed_document&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"constructor_rejects_bad_parameters",
		[](){
			svgpdf::parameters params;
			params.dpi = 0;
			bool thrown = false;
			try{
				svgpdf::converter conv(params);
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);

			auto collabs = svgpdf::make_default_collaborators();
			collabs.text.reset();
			thrown = false;
			try{
				svgpdf::converter conv(svgpdf::parameters(), collabs);
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);
});
}
