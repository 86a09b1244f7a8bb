#include <tst/set.hpp>
#include <tst/check.hpp>

#include "../../src/svgpdf/geometry.hpp"
#include "../../src/svgpdf/viewport.hxx"

namespace{
const tst::set set("viewport", [](tst::suite& suite){
	suite.add(
		"meet_scales_uniformly",
		[](){
			auto ar = svgpdf::parse_aspect_ratio("xMidYMid meet");
			auto fit = svgpdf::fit_viewport({100, 50}, {{0, 0}, {200, 100}}, ar);
			tst::check_eq(fit.scale.x(), svgpdf::real(0.5), SL);
			tst::check_eq(fit.scale.y(), svgpdf::real(0.5), SL);
			tst::check_eq(fit.offset.x(), svgpdf::real(0), SL);
			tst::check_eq(fit.offset.y(), svgpdf::real(0), SL);
		}
	);

	suite.add(
		"slice_max_alignment",
		[](){
			auto ar = svgpdf::parse_aspect_ratio("xMaxYMax slice");
			tst::check(ar.slice, SL);

			auto fit = svgpdf::fit_viewport({100, 100}, {{0, 0}, {200, 50}}, ar);
			tst::check_eq(fit.scale.x(), svgpdf::real(2), SL);
			tst::check_eq(fit.scale.y(), svgpdf::real(2), SL);

			// content is 400 wide, overflows to the left
			tst::check_eq(fit.offset.x(), svgpdf::real(-300), SL);
			tst::check_eq(fit.offset.y(), svgpdf::real(0), SL);
		}
	);

	suite.add(
		"mid_alignment_centers_content",
		[](){
			auto fit = svgpdf::fit_viewport({100, 100}, {{0, 0}, {50, 25}}, svgpdf::aspect_ratio());
			tst::check_eq(fit.scale.x(), svgpdf::real(2), SL);
			tst::check_eq(fit.offset.x(), svgpdf::real(0), SL);
			tst::check_eq(fit.offset.y(), svgpdf::real(25), SL);
		}
	);

	suite.add(
		"none_stretches",
		[](){
			auto ar = svgpdf::parse_aspect_ratio("none");
			tst::check(!ar.preserve, SL);

			auto fit = svgpdf::fit_viewport({100, 50}, {{0, 0}, {10, 10}}, ar);
			tst::check_eq(fit.scale.x(), svgpdf::real(10), SL);
			tst::check_eq(fit.scale.y(), svgpdf::real(5), SL);
		}
	);

	suite.add(
		"aspect_ratio_alignment_and_slice",
		[](){
			auto ar = svgpdf::parse_aspect_ratio("xMinYMax slice");
			tst::check(ar.preserve, SL);
			tst::check(ar.slice, SL);
			tst::check(ar.align_x == svgpdf::alignment::min, SL);
			tst::check(ar.align_y == svgpdf::alignment::max, SL);

			auto def = svgpdf::parse_aspect_ratio("");
			tst::check(def.preserve, SL);
			tst::check(!def.slice, SL);
			tst::check(def.align_x == svgpdf::alignment::mid, SL);
			tst::check(def.align_y == svgpdf::alignment::mid, SL);
		}
	);

	suite.add(
		"view_box_to_matrix_includes_origin",
		[](){
			r4::rectangle<svgpdf::real> vb{{10, 20}, {50, 50}};
			auto fit = svgpdf::fit_viewport({100, 100}, vb, svgpdf::aspect_ratio());
			auto p = svgpdf::apply(fit.to_matrix(vb), {10, 20});
			tst::check_eq(p.x(), svgpdf::real(0), SL);
			tst::check_eq(p.y(), svgpdf::real(0), SL);
		}
	);

	suite.add(
		"parse_view_box",
		[](){
			auto vb = svgpdf::parse_view_box("0, 0 200 100");
			tst::check(vb.has_value(), SL);
			tst::check_eq(vb->d.x(), svgpdf::real(200), SL);
			tst::check_eq(vb->d.y(), svgpdf::real(100), SL);

			tst::check(!svgpdf::parse_view_box("0 0 0 100").has_value(), SL);
			tst::check(!svgpdf::parse_view_box("").has_value(), SL);
		}
	);
});
}
