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

#include "transform.hxx"

#include <cmath>
#include <stdexcept>

#include <svgdom/elements/transformable.hpp>
#include <utki/debug.hpp>
#include <utki/math.hpp>

#include "geometry.hpp"
#include "util.hxx"

using namespace svgpdf;

namespace {
matrix to_matrix(const svgdom::transformable::transformation& t)
{
	using std::cos;
	using std::sin;
	using std::tan;

	switch (t.type_) {
		case svgdom::transformable::transformation::type::translate:
			return translation_matrix({real(t.x), real(t.y)});
		case svgdom::transformable::transformation::type::matrix:
			return make_matrix(real(t.a), real(t.b), real(t.c), real(t.d), real(t.e), real(t.f));
		case svgdom::transformable::transformation::type::scale:
			return scale_matrix({real(t.x), real(t.y)});
		case svgdom::transformable::transformation::type::rotate:
			{
				real a = utki::deg_to_rad(real(t.angle));
				real c = cos(a);
				real s = sin(a);
				real cx = real(t.x);
				real cy = real(t.y);
				// rotation about pivot point
				return make_matrix(c, s, -s, c, cx * (1 - c) + cy * s, cy * (1 - c) - cx * s);
			}
		case svgdom::transformable::transformation::type::skewx:
			return make_matrix(1, 0, tan(utki::deg_to_rad(real(t.angle))), 1, 0, 0);
		case svgdom::transformable::transformation::type::skewy:
			return make_matrix(1, tan(utki::deg_to_rad(real(t.angle))), 0, 1, 0, 0);
		default:
			ASSERT(false)
			break;
	}
	return identity_matrix();
}
} // namespace

matrix svgpdf::parse_transform(std::string_view str)
{
	auto ret = identity_matrix();

	// each function is parsed on its own, so a malformed one does not discard the others
	while (true) {
		// functions may be separated by a comma
		str = trim(str);
		if (!str.empty() && str.front() == ',') {
			str.remove_prefix(1);
			str = trim(str);
		}
		if (str.empty()) {
			break;
		}

		auto close = str.find(')');
		auto function = str.substr(0, close == std::string_view::npos ? str.size() : close + 1);
		str.remove_prefix(function.size());

		decltype(svgdom::transformable::transformations) transformations;
		try {
			transformations = svgdom::transformable::parse(function);
		} catch (std::invalid_argument& e) {
			LOG([&](auto& o) {
				o << "svgpdf: malformed transformation ignored: " << function << ", " << e.what() << std::endl;
			})
			continue;
		}

		if (transformations.size() != 1) {
			LOG([&](auto& o) {
				o << "svgpdf: malformed transformation ignored: " << function << std::endl;
			})
			continue;
		}

		ret = multiply(ret, to_matrix(transformations.front()));
	}

	return ret;
}
