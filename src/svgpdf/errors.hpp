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

#include <stdexcept>
#include <string>

namespace svgpdf {

/**
 * @brief Source has no usable content.
 * Thrown when the source is empty, cannot be read or cannot be decoded.
 */
class invalid_input : public std::invalid_argument
{
public:
	invalid_input(const std::string& message) :
		std::invalid_argument(message)
	{}
};

/**
 * @brief Resolved image size is not positive.
 */
class invalid_geometry : public std::invalid_argument
{
public:
	invalid_geometry(const std::string& message) :
		std::invalid_argument(message)
	{}
};

/**
 * @brief Document is not well-formed XML.
 * The conversion is aborted as a whole.
 */
class malformed_document : public std::runtime_error
{
public:
	/**
	 * @brief Line number where the error was detected, 1-based.
	 */
	const unsigned line;

	malformed_document(unsigned line, const std::string& message) :
		std::runtime_error("malformed document at line " + std::to_string(line) + ": " + message),
		line(line)
	{}
};

/**
 * @brief Handle was never returned by converter::convert().
 */
class unknown_handle : public std::out_of_range
{
public:
	const unsigned handle;

	unknown_handle(unsigned handle) :
		std::out_of_range("unknown handle: " + std::to_string(handle)),
		handle(handle)
	{}
};

} // namespace svgpdf
