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

#include "path.hxx"

#include <array>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <vector>

#include <utki/debug.hpp>
#include <utki/math.hpp>

using namespace svgpdf;

namespace {
// sign, digits and optional fractional part, exponents are not recognized
const std::regex number_regex(R"([+-]?(?:\d+(?:\.\d*)?|\.\d+))");

bool is_command(char c) noexcept
{
	switch (c) {
		case 'M':
		case 'm':
		case 'L':
		case 'l':
		case 'H':
		case 'h':
		case 'V':
		case 'v':
		case 'C':
		case 'c':
		case 'S':
		case 's':
		case 'Q':
		case 'q':
		case 'T':
		case 't':
		case 'A':
		case 'a':
		case 'Z':
		case 'z':
			return true;
		default:
			return false;
	}
}

// number of parameters in one group of a command
size_t group_size(char command) noexcept
{
	switch (command) {
		case 'M':
		case 'L':
		case 'T':
			return 2;
		case 'H':
		case 'V':
			return 1;
		case 'C':
			return 6;
		case 'S':
		case 'Q':
			return 4;
		case 'A':
			return 7;
		default:
			return 0;
	}
}

char to_upper(char c) noexcept
{
	if (c >= 'a' && c <= 'z') {
		return char(c - 'a' + 'A');
	}
	return c;
}

// normalize angle to [0, 2pi)
real normalize_angle(real a) noexcept
{
	a = std::fmod(a, 2 * utki::pi<real>());
	if (a < 0) {
		a += 2 * utki::pi<real>();
	}
	return a;
}

r4::vector2<real> arc_point(const arc_parameters& arc, real t) noexcept
{
	using std::cos;
	using std::sin;

	auto cos_phi = cos(arc.x_axis_rotation);
	auto sin_phi = sin(arc.x_axis_rotation);

	real x = arc.radius.x() * cos(t);
	real y = arc.radius.y() * sin(t);

	return {
		arc.center.x() + x * cos_phi - y * sin_phi, //
		arc.center.y() + x * sin_phi + y * cos_phi
	};
}

enum class control_family {
	none,
	cubic,
	quadratic
};

class path_state
{
	path_builder& gfx;
	real min_length;

public:
	path_result result;

	r4::vector2<real> subpath_start{0, 0};

	// control point of previous group, reflected by smooth curves
	r4::vector2<real> last_control{0, 0};
	control_family last_family = control_family::none;

	path_state(path_builder& gfx, real min_length) :
		gfx(gfx),
		min_length(min_length)
	{}

	r4::vector2<real>& cur() noexcept
	{
		return this->result.current_point;
	}

	void add_to_box(const r4::vector2<real>& p)
	{
		unite(this->result.bbox, p);
	}

	void move_to(const r4::vector2<real>& p)
	{
		this->result.operators.append(this->gfx.move_to(p));
		this->cur() = p;
		this->subpath_start = p;
		this->add_to_box(p);
	}

	void line_to(const r4::vector2<real>& p)
	{
		auto d = p - this->cur();
		if (std::abs(d.x()) < this->min_length && std::abs(d.y()) < this->min_length) {
			return;
		}
		this->result.operators.append(this->gfx.line_to(p));
		this->cur() = p;
		this->add_to_box(p);
	}

	void curve_to(const r4::vector2<real>& cp1, const r4::vector2<real>& cp2, const r4::vector2<real>& p)
	{
		this->result.operators.append(this->gfx.curve_to(cp1, cp2, p));
		this->cur() = p;
		this->add_to_box(cp1);
		this->add_to_box(cp2);
		this->add_to_box(p);
	}

	// quadratic curve elevated to cubic
	void quadratic_to(const r4::vector2<real>& q, const r4::vector2<real>& p)
	{
		auto p0 = this->cur();
		this->curve_to((p0 + q * real(2)) / real(3), (p + q * real(2)) / real(3), p);
	}

	void arc_to(
		const r4::vector2<real>& radius,
		real x_axis_rotation,
		bool large_arc,
		bool sweep,
		const r4::vector2<real>& p
	)
	{
		auto d = p - this->cur();
		if (std::abs(d.x()) < this->min_length && std::abs(d.y()) < this->min_length) {
			// endpoints coincide, the arc is omitted
			this->cur() = p;
			return;
		}

		if (std::abs(radius.x()) < this->min_length || std::abs(radius.y()) < this->min_length) {
			// zero radius, only the current point moves
			this->cur() = p;
			return;
		}

		auto arc = endpoint_to_center(this->cur(), radius, x_axis_rotation, large_arc, sweep, p);
		if (!arc.has_value()) {
			this->cur() = p;
			return;
		}

		this->result.operators.append(this->gfx.arc(
			arc->center, //
			arc->radius,
			arc->x_axis_rotation,
			arc->start_angle,
			arc->sweep_angle
		));
		unite(this->result.bbox, arc_bounding_box(*arc));
		this->add_to_box(p);
		this->cur() = p;
	}

	void close()
	{
		this->result.operators.append(this->gfx.close_path());
		this->cur() = this->subpath_start;
	}

	r4::vector2<real> reflected_control(control_family family) const noexcept
	{
		if (this->last_family != family) {
			return this->result.current_point;
		}
		return this->result.current_point * real(2) - this->last_control;
	}
};

} // namespace

std::optional<arc_parameters> svgpdf::endpoint_to_center(
	const r4::vector2<real>& start,
	const r4::vector2<real>& radius,
	real x_axis_rotation,
	bool large_arc,
	bool sweep,
	const r4::vector2<real>& end
)
{
	using std::abs;
	using std::cos;
	using std::max;
	using std::sin;
	using std::sqrt;

	real rx = abs(radius.x());
	real ry = abs(radius.y());

	if (rx <= 0 || ry <= 0 || (start.x() == end.x() && start.y() == end.y())) {
		return {};
	}

	real phi = utki::deg_to_rad(x_axis_rotation);
	real cos_phi = cos(phi);
	real sin_phi = sin(phi);

	// half of the chord in the ellipse's rotated frame
	auto half = (start - end) / real(2);
	real x1 = cos_phi * half.x() + sin_phi * half.y();
	real y1 = -sin_phi * half.x() + cos_phi * half.y();

	// scale up radii if the endpoints cannot be connected
	real lambda = utki::pow2(x1) / utki::pow2(rx) + utki::pow2(y1) / utki::pow2(ry);
	if (lambda > 1) {
		real k = sqrt(lambda);
		rx *= k;
		ry *= k;
	}

	real rx2 = utki::pow2(rx);
	real ry2 = utki::pow2(ry);

	real den = rx2 * utki::pow2(y1) + ry2 * utki::pow2(x1);
	real num = rx2 * ry2 - den;

	real root = den > 0 ? sqrt(max(real(0), num / den)) : real(0);
	if (large_arc == sweep) {
		root = -root;
	}

	real cx1 = root * rx * y1 / ry;
	real cy1 = -root * ry * x1 / rx;

	auto mid = (start + end) / real(2);

	arc_parameters ret;
	ret.center = {
		cos_phi * cx1 - sin_phi * cy1 + mid.x(), //
		sin_phi * cx1 + cos_phi * cy1 + mid.y()
	};
	ret.radius = {rx, ry};
	ret.x_axis_rotation = phi;

	r4::vector2<real> u{(x1 - cx1) / rx, (y1 - cy1) / ry};
	r4::vector2<real> v{(-x1 - cx1) / rx, (-y1 - cy1) / ry};

	ret.start_angle = vectors_angle({1, 0}, u);
	ret.sweep_angle = vectors_angle(u, v);

	if (!sweep && ret.sweep_angle > 0) {
		ret.sweep_angle -= 2 * utki::pi<real>();
	} else if (sweep && ret.sweep_angle < 0) {
		ret.sweep_angle += 2 * utki::pi<real>();
	}

	return ret;
}

bounding_box svgpdf::arc_bounding_box(const arc_parameters& arc)
{
	using std::atan2;
	using std::cos;
	using std::sin;

	auto ret = make_empty_bounding_box();

	unite(ret, arc_point(arc, arc.start_angle));
	unite(ret, arc_point(arc, arc.start_angle + arc.sweep_angle));

	auto cos_phi = cos(arc.x_axis_rotation);
	auto sin_phi = sin(arc.x_axis_rotation);

	// parameters where x or y of the ellipse reach their extremes
	real tx = atan2(-arc.radius.y() * sin_phi, arc.radius.x() * cos_phi);
	real ty = atan2(arc.radius.y() * cos_phi, arc.radius.x() * sin_phi);

	std::array<real, 4> extremes = {tx, tx + utki::pi<real>(), ty, ty + utki::pi<real>()};

	for (auto t : extremes) {
		real offset = arc.sweep_angle >= 0 ? normalize_angle(t - arc.start_angle)
										   : normalize_angle(arc.start_angle - t);
		if (offset <= std::abs(arc.sweep_angle)) {
			unite(ret, arc_point(arc, t));
		}
	}

	return ret;
}

path_result path_interpreter::interpret(std::string_view path_data) const
{
	path_state state(this->gfx, this->min_length);

	auto i = path_data.begin();
	while (i != path_data.end() && !is_command(*i)) {
		++i;
	}

	while (i != path_data.end()) {
		char command = *i;
		++i;

		auto params_begin = i;
		while (i != path_data.end() && !is_command(*i)) {
			++i;
		}

		std::vector<real> params;
		for (std::cregex_iterator n(params_begin, i, number_regex), end; n != end; ++n) {
			real v = std::strtod(n->str().c_str(), nullptr);
			if (std::abs(v) < this->min_length) {
				v = 0;
			}
			params.push_back(v);
		}

		bool relative = command != to_upper(command);
		command = to_upper(command);

		if (command == 'Z') {
			state.close();
			state.last_family = control_family::none;
			continue;
		}

		auto num_params = group_size(command);
		ASSERT(num_params != 0)

		for (size_t g = 0; g + num_params <= params.size(); g += num_params) {
			const real* p = &params[g];

			// relative coordinates are offset by current point at start of each group
			r4::vector2<real> offset = relative ? state.cur() : r4::vector2<real>{0, 0};

			auto family = control_family::none;

			switch (command) {
				case 'M':
					if (g == 0) {
						state.move_to(offset + r4::vector2<real>{p[0], p[1]});
					} else {
						// subsequent pairs are implicit line-to commands
						state.line_to(offset + r4::vector2<real>{p[0], p[1]});
					}
					break;
				case 'L':
					state.line_to(offset + r4::vector2<real>{p[0], p[1]});
					break;
				case 'H':
					state.line_to({offset.x() + p[0], state.cur().y()});
					break;
				case 'V':
					state.line_to({state.cur().x(), offset.y() + p[0]});
					break;
				case 'C':
					{
						r4::vector2<real> cp2 = offset + r4::vector2<real>{p[2], p[3]};
						state.curve_to(offset + r4::vector2<real>{p[0], p[1]}, cp2, offset + r4::vector2<real>{p[4], p[5]});
						state.last_control = cp2;
						family = control_family::cubic;
					}
					break;
				case 'S':
					{
						auto cp1 = state.reflected_control(control_family::cubic);
						r4::vector2<real> cp2 = offset + r4::vector2<real>{p[0], p[1]};
						state.curve_to(cp1, cp2, offset + r4::vector2<real>{p[2], p[3]});
						state.last_control = cp2;
						family = control_family::cubic;
					}
					break;
				case 'Q':
					{
						r4::vector2<real> q = offset + r4::vector2<real>{p[0], p[1]};
						state.quadratic_to(q, offset + r4::vector2<real>{p[2], p[3]});
						state.last_control = q;
						family = control_family::quadratic;
					}
					break;
				case 'T':
					{
						auto q = state.reflected_control(control_family::quadratic);
						state.quadratic_to(q, offset + r4::vector2<real>{p[0], p[1]});
						state.last_control = q;
						family = control_family::quadratic;
					}
					break;
				case 'A':
					state.arc_to(
						{p[0], p[1]}, //
						p[2],
						p[3] != 0,
						p[4] != 0,
						offset + r4::vector2<real>{p[5], p[6]}
					);
					break;
				default:
					ASSERT(false)
					break;
			}

			state.last_family = family;
		}
	}

	return std::move(state.result);
}
