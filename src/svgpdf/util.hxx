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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <svgdom/length.hpp>

#include "config.hpp"

namespace svgpdf {

inline bool is_space(char c) noexcept
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_digit(char c) noexcept
{
	return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view s) noexcept;

std::string to_lower(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix) noexcept;

bool ends_with(std::string_view s, std::string_view suffix) noexcept;

/**
 * @brief Split list of values separated by whitespace and/or commas.
 * Empty items are skipped.
 */
std::vector<std::string_view> split_list(std::string_view s);

/**
 * @brief Parse all numbers from a list separated by whitespace and/or commas.
 * Parsing stops at the first item which is not a number.
 */
std::vector<real> parse_numbers(std::string_view s);

/**
 * @brief Parse leading number of the string.
 * @return parsed number or the default value if string does not start with a number.
 */
real parse_number(std::string_view s, real default_value = 0);

/**
 * @brief Extract element id from IRI reference.
 * Both "url(#id)" and "#id" forms are accepted.
 * @return id or empty string if the reference is not local.
 */
std::string get_local_id_from_iri(std::string_view iri);

/**
 * @brief Remove namespace prefix from element name.
 */
std::string_view remove_namespace(std::string_view name) noexcept;

std::vector<uint8_t> decode_base64(std::string_view s);

/**
 * @brief Convert percentage or plain number length to fraction.
 * @return fraction, 0 for lengths in other units.
 */
real percent_to_fraction(const svgdom::length& l);

/**
 * @brief Resolve file reference.
 * @param reference - file path, optionally with 'file://' scheme.
 * @param base_dir - directory to resolve relative paths against, can be empty.
 * @return file path.
 */
std::string resolve_path(std::string_view reference, std::string_view base_dir);

/**
 * @brief Get directory part of the file path.
 * @return directory with trailing slash or empty string if the path has no directory part.
 */
std::string get_dir(std::string_view path);

} // namespace svgpdf
