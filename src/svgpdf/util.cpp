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

#include "util.hxx"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <ratio>

#include <svgdom/dom.hpp>

using namespace svgpdf;

std::string_view svgpdf::trim(std::string_view s) noexcept
{
	while (!s.empty() && is_space(s.front())) {
		s.remove_prefix(1);
	}
	while (!s.empty() && is_space(s.back())) {
		s.remove_suffix(1);
	}
	return s;
}

std::string svgpdf::to_lower(std::string_view s)
{
	std::string ret(s);
	std::transform(ret.begin(), ret.end(), ret.begin(), [](char c) {
		if (c >= 'A' && c <= 'Z') {
			return char(c - 'A' + 'a');
		}
		return c;
	});
	return ret;
}

bool svgpdf::starts_with(std::string_view s, std::string_view prefix) noexcept
{
	return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool svgpdf::ends_with(std::string_view s, std::string_view suffix) noexcept
{
	return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::vector<std::string_view> svgpdf::split_list(std::string_view s)
{
	std::vector<std::string_view> ret;

	size_t start = 0;
	for (size_t i = 0; i <= s.size(); ++i) {
		if (i == s.size() || is_space(s[i]) || s[i] == ',') {
			if (i != start) {
				ret.push_back(s.substr(start, i - start));
			}
			start = i + 1;
		}
	}
	return ret;
}

namespace {
// returns number of characters consumed, 0 if there is no number
size_t scan_number(std::string_view s, real& out)
{
	// strtod needs null-terminated string
	std::string str(s.substr(0, std::min(s.size(), size_t(64))));

	const char* begin = str.c_str();
	char* end = nullptr;

	out = real(std::strtod(begin, &end));

	// strtod also accepts "inf" and "nan", those are not numbers here
	if (end == begin || !(is_digit(*begin) || *begin == '-' || *begin == '+' || *begin == '.')) {
		return 0;
	}
	return size_t(end - begin);
}
} // namespace

std::vector<real> svgpdf::parse_numbers(std::string_view s)
{
	std::vector<real> ret;

	for (auto item : split_list(s)) {
		// items like "1-2" hold several numbers
		while (!item.empty()) {
			real n = 0;
			auto len = scan_number(item, n);
			if (len == 0) {
				return ret;
			}
			ret.push_back(n);
			item.remove_prefix(len);
		}
	}
	return ret;
}

real svgpdf::parse_number(std::string_view s, real default_value)
{
	s = trim(s);
	real n = 0;
	if (scan_number(s, n) == 0) {
		return default_value;
	}
	return n;
}

std::string svgpdf::get_local_id_from_iri(std::string_view iri)
{
	iri = trim(iri);

	if (starts_with(iri, "url(")) {
		return svgdom::get_local_id_from_iri(std::string(iri));
	}

	svgdom::referencing ref;
	ref.iri = std::string(iri);
	return ref.get_local_id_from_iri();
}

std::string_view svgpdf::remove_namespace(std::string_view name) noexcept
{
	auto colon = name.rfind(':');
	if (colon == std::string_view::npos) {
		return name;
	}
	return name.substr(colon + 1);
}

std::vector<uint8_t> svgpdf::decode_base64(std::string_view s)
{
	const auto invalid = uint8_t(0xff);

	std::array<uint8_t, 0x100> table{};
	table.fill(invalid);
	{
		const std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
		for (size_t i = 0; i != alphabet.size(); ++i) {
			table[uint8_t(alphabet[i])] = uint8_t(i);
		}
		// URL-safe alphabet
		table[uint8_t('-')] = 62;
		table[uint8_t('_')] = 63;
	}

	std::vector<uint8_t> ret;
	ret.reserve(s.size() * 3 / 4);

	uint32_t acc = 0;
	unsigned num_bits = 0;
	for (auto c : s) {
		if (c == '=') {
			break;
		}
		auto v = table[uint8_t(c)];
		if (v == invalid) {
			// whitespace and line breaks are allowed inside the payload
			continue;
		}
		acc = (acc << 6) | v;
		num_bits += 6;
		if (num_bits >= 8) {
			num_bits -= 8;
			ret.push_back(uint8_t((acc >> num_bits) & 0xff));
		}
	}
	return ret;
}

real svgpdf::percent_to_fraction(const svgdom::length& l)
{
	if (l.is_percent()) {
		return real(l.value) / real(std::centi::den);
	}
	if (l.unit == svgdom::length_unit::number) {
		return real(l.value);
	}
	return 0;
}

std::string svgpdf::resolve_path(std::string_view reference, std::string_view base_dir)
{
	const std::string_view file_scheme = "file://";

	auto s = trim(reference);
	if (starts_with(s, file_scheme)) {
		s.remove_prefix(file_scheme.size());
	}

	if (base_dir.empty() || starts_with(s, "/")) {
		return std::string(s);
	}

	std::string ret(base_dir);
	if (!ends_with(base_dir, "/")) {
		ret.push_back('/');
	}
	ret.append(s);
	return ret;
}

std::string svgpdf::get_dir(std::string_view path)
{
	auto slash = path.find_last_of('/');
	if (slash == std::string_view::npos) {
		return {};
	}
	return std::string(path.substr(0, slash + 1));
}
