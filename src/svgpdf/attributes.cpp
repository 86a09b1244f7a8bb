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

#include "attributes.hxx"

#include <algorithm>

using namespace svgpdf;

const std::string* attribute_list::get(std::string_view name) const noexcept
{
	auto i = std::find_if(this->list.begin(), this->list.end(), [&name](const auto& a) {
		return a.first == name;
	});
	if (i == this->list.end()) {
		return nullptr;
	}
	return &i->second;
}

void attribute_list::set(std::string_view name, std::string value)
{
	auto i = std::find_if(this->list.begin(), this->list.end(), [&name](const auto& a) {
		return a.first == name;
	});
	if (i == this->list.end()) {
		this->list.emplace_back(std::string(name), std::move(value));
		return;
	}
	i->second = std::move(value);
}

void attribute_list::erase(std::string_view name)
{
	this->list.erase(
		std::remove_if(
			this->list.begin(),
			this->list.end(),
			[&name](const auto& a) {
				return a.first == name;
			}
		),
		this->list.end()
	);
}
