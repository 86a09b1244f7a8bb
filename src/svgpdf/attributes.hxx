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

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace svgpdf {

/**
 * @brief Attributes of an element in document order.
 */
class attribute_list
{
	std::vector<std::pair<std::string, std::string>> list;

public:
	using const_iterator = decltype(list)::const_iterator;

	/**
	 * @brief Get attribute value.
	 * @param name - attribute name.
	 * @return pointer to the attribute value or nullptr if there is no such attribute.
	 */
	const std::string* get(std::string_view name) const noexcept;

	std::string_view get_or(std::string_view name, std::string_view default_value) const noexcept
	{
		auto v = this->get(name);
		if (!v) {
			return default_value;
		}
		return *v;
	}

	/**
	 * @brief Set attribute value.
	 * Existing attribute is overwritten, otherwise a new one is appended.
	 */
	void set(std::string_view name, std::string value);

	void erase(std::string_view name);

	bool empty() const noexcept
	{
		return this->list.empty();
	}

	const_iterator begin() const noexcept
	{
		return this->list.begin();
	}

	const_iterator end() const noexcept
	{
		return this->list.end();
	}
};

} // namespace svgpdf
