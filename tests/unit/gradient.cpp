#include <tst/set.hpp>
#include <tst/check.hpp>

#include <cmath>
#include <initializer_list>

#include "../../src/svgpdf/gradient.hxx"

namespace{
svgpdf::attribute_list make_attrs(std::initializer_list<std::pair<std::string_view, std::string>> list){
	svgpdf::attribute_list ret;
	for(const auto& a : list){
		ret.set(a.first, a.second);
	}
	return ret;
}

bool is_near(svgpdf::real a, svgpdf::real b){
	return std::abs(a - b) < 1e-9;
}

const svgpdf::length_context lengths;

svgpdf::gradient_stop make_stop(svgpdf::real offset){
	svgpdf::gradient_stop s;
	s.offset = offset;
	return s;
}

const r4::rectangle<svgpdf::real> box_100{{0, 0}, {100, 100}};
}

namespace{
const tst::set set("gradient", [](tst::suite& suite){
	suite.add(
		"linear_defaults_span_bounding_box",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::linear, make_attrs({{"id", "g"}}), lengths));
			table.add_stop(make_stop(0));
			table.add_stop(make_stop(1));

			auto sh = table.make_shading("g", box_100);
			tst::check(sh.has_value(), SL);
			tst::check(sh->kind == svgpdf::gradient_kind::linear, SL);
			tst::check_eq(sh->coords[0], svgpdf::real(0), SL);
			tst::check_eq(sh->coords[2], svgpdf::real(1), SL);
			tst::check_eq(sh->coords[3], svgpdf::real(0), SL);
			tst::check_eq(sh->stops.size(), size_t(2), SL);

			auto p = svgpdf::to_coefficients(sh->placement);
			tst::check_eq(p[0], svgpdf::real(100), SL);
			tst::check_eq(p[3], svgpdf::real(100), SL);
			tst::check_eq(p[4], svgpdf::real(0), SL);
		}
	);

	suite.add(
		"object_bounding_box_fractions_unchanged",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "g"}, {"gradientUnits", "objectBoundingBox"}, {"x1", "0"}, {"y1", "0"}, {"x2", "1"}, {"y2", "1"}}),
				lengths
			));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("g", box_100);
			tst::check(sh.has_value(), SL);
			tst::check_eq(sh->coords[0], svgpdf::real(0), SL);
			tst::check_eq(sh->coords[1], svgpdf::real(0), SL);
			tst::check_eq(sh->coords[2], svgpdf::real(1), SL);
			tst::check_eq(sh->coords[3], svgpdf::real(1), SL);
		}
	);

	suite.add(
		"percentages",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "g"}, {"x1", "25%"}, {"x2", "150%"}}),
				lengths
			));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("g", box_100);
			tst::check(sh.has_value(), SL);
			tst::check_eq(sh->coords[0], svgpdf::real(0.25), SL);

			// clamped
			tst::check_eq(sh->coords[2], svgpdf::real(1), SL);
		}
	);

	suite.add(
		"user_space_on_use_is_normalized_to_bounding_box",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "g"}, {"gradientUnits", "userSpaceOnUse"}, {"x1", "10"}, {"x2", "60"}}),
				lengths
			));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("g", {{10, 0}, {100, 50}});
			tst::check(sh.has_value(), SL);
			tst::check(is_near(sh->coords[0], 0), SL) << "x1 = " << sh->coords[0];
			tst::check(is_near(sh->coords[2], 0.5), SL) << "x2 = " << sh->coords[2];

			auto p = svgpdf::to_coefficients(sh->placement);
			tst::check_eq(p[0], svgpdf::real(100), SL);
			tst::check_eq(p[3], svgpdf::real(50), SL);
			tst::check_eq(p[4], svgpdf::real(10), SL);
		}
	);

	suite.add(
		"degenerate_linear_gradient",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "g"}, {"x1", "0.5"}, {"x2", "0.5"}}),
				lengths
			));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("g", box_100);
			tst::check(sh.has_value(), SL);
			tst::check(sh->coords[0] != sh->coords[2], SL);
			tst::check(sh->coords[0] > sh->coords[2], SL) << "last stop color must dominate";
		}
	);

	suite.add(
		"gradient_transform",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "g"}, {"gradientTransform", "translate(0.5)"}}),
				lengths
			));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("g", box_100);
			tst::check(sh.has_value(), SL);
			tst::check(is_near(sh->coords[0], 0.5), SL);
			tst::check(is_near(sh->coords[2], 1.5), SL);
		}
	);

	suite.add(
		"radial_defaults",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::radial, make_attrs({{"id", "r"}}), lengths));
			table.add_stop(make_stop(0));

			auto sh = table.make_shading("r", box_100);
			tst::check(sh.has_value(), SL);
			tst::check(sh->kind == svgpdf::gradient_kind::radial, SL);
			tst::check_eq(sh->coords[0], svgpdf::real(0.5), SL);
			tst::check_eq(sh->coords[1], svgpdf::real(0.5), SL);
			tst::check_eq(sh->coords[2], svgpdf::real(0.5), SL);
			tst::check_eq(sh->coords[3], svgpdf::real(0.5), SL);
			tst::check_eq(sh->coords[4], svgpdf::real(0.5), SL);
		}
	);

	suite.add(
		"radial_ratio",
		[](){
			auto g = svgpdf::parse_gradient(
				svgpdf::gradient_kind::radial,
				make_attrs({{"id", "r"}, {"cx", "0.3"}, {"cy", "0.4"}, {"r", "0.2"}, {"fx", "0.35"}}),
				lengths
			);
			tst::check(g.mode == svgpdf::coordinate_mode::ratio, SL);

			svgpdf::gradient_table table;
			table.add(g);
			table.add_stop(make_stop(0));
			auto sh = table.make_shading("r", box_100);
			tst::check(sh.has_value(), SL);
			tst::check(is_near(sh->coords[0], 0.3), SL);
			tst::check(is_near(sh->coords[2], 0.35), SL);

			// focal y defaults to center y
			tst::check(is_near(sh->coords[3], 0.4), SL);
			tst::check(is_near(sh->coords[4], 0.2), SL);
		}
	);

	suite.add(
		"href_supplies_stops_and_units",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::linear,
				make_attrs({{"id", "base"}, {"gradientUnits", "userSpaceOnUse"}}),
				lengths
			));
			table.add_stop(make_stop(1));
			table.add_stop(make_stop(0));

			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::radial,
				make_attrs({{"id", "derived"}, {"xlink:href", "#base"}}),
				lengths
			));

			auto g = table.resolve("derived");
			tst::check(g.has_value(), SL);
			tst::check(g->kind == svgpdf::gradient_kind::radial, SL);
			tst::check(g->units == svgpdf::gradient_units::user_space_on_use, SL);
			tst::check_eq(g->stops.size(), size_t(2), SL);

			// sorted by offset
			tst::check_eq(g->stops[0].offset, svgpdf::real(0), SL);
			tst::check_eq(g->stops[1].offset, svgpdf::real(1), SL);
		}
	);

	suite.add(
		"href_cycle_terminates",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::linear, make_attrs({{"id", "a"}, {"href", "#b"}}), lengths));
			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::linear, make_attrs({{"id", "b"}, {"href", "#a"}}), lengths));

			auto g = table.resolve("a");
			tst::check(g.has_value(), SL);
			tst::check(g->stops.empty(), SL);
		}
	);

	suite.add(
		"unknown_gradient_and_empty_box",
		[](){
			svgpdf::gradient_table table;
			tst::check(!table.make_shading("nope", box_100).has_value(), SL);

			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::linear, make_attrs({{"id", "g"}}), lengths));
			table.add_stop(make_stop(0));
			tst::check(!table.make_shading("g", {{0, 0}, {100, 0}}).has_value(), SL);
		}
	);

	suite.add(
		"gradient_without_stops_gives_no_shading",
		[](){
			svgpdf::gradient_table table;
			table.add(svgpdf::parse_gradient(svgpdf::gradient_kind::linear, make_attrs({{"id", "empty"}}), lengths));
			tst::check(!table.make_shading("empty", box_100).has_value(), SL);

			// referenced gradient has no stops either
			table.add(svgpdf::parse_gradient(
				svgpdf::gradient_kind::radial,
				make_attrs({{"id", "derived"}, {"href", "#empty"}}),
				lengths
			));
			tst::check(!table.make_shading("derived", box_100).has_value(), SL);
		}
	);

	suite.add(
		"stop_offsets_and_opacity",
		[](){
			auto collabs = svgpdf::make_default_collaborators();
			svgpdf::style parent;

			auto s = svgpdf::parse_stop(
				make_attrs({{"offset", "50%"}, {"stop-color", "red"}, {"stop-opacity", "0.5"}}),
				parent,
				*collabs.colors,
				lengths
			);
			tst::check_eq(s.offset, svgpdf::real(0.5), SL);
			tst::check_eq(s.color.rgb.x(), svgpdf::real(1), SL);
			tst::check_eq(s.opacity, svgpdf::real(0.5), SL);

			auto clamped = svgpdf::parse_stop(make_attrs({{"offset", "-1"}}), parent, *collabs.colors, lengths);
			tst::check_eq(clamped.offset, svgpdf::real(0), SL);

			auto styled = svgpdf::parse_stop(
				make_attrs({{"offset", "1"}, {"style", "stop-color: #0000ff"}}),
				parent,
				*collabs.colors,
				lengths
			);
			tst::check_eq(styled.offset, svgpdf::real(1), SL);
			tst::check_eq(styled.color.rgb.z(), svgpdf::real(1), SL);
		}
	);
});
}
