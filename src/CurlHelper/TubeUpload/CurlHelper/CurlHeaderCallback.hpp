/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload CurlHelper Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace TubeUpload::CurlHelper {

struct CaseInsensitiveLess {
	bool operator()(const std::string &lhs, const std::string &rhs) const noexcept
	{
		return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
						    [](unsigned char a, unsigned char b) {
							    return std::tolower(a) < std::tolower(b);
						    });
	}
};

/// Response headers of the last response only; curl also reports headers of interim responses,
/// so a status line clears what was collected before it.
class CurlResponseHeaders {
public:
	void clear() noexcept { headers_.clear(); }

	void addLine(std::string_view line)
	{
		while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
			line.remove_suffix(1);
		}
		if (line.empty()) {
			return;
		}
		if (line.starts_with("HTTP/")) {
			headers_.clear();
			return;
		}

		const std::size_t colon = line.find(':');
		if (colon == std::string_view::npos) {
			return;
		}

		std::string_view value = line.substr(colon + 1);
		while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
			value.remove_prefix(1);
		}
		while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
			value.remove_suffix(1);
		}
		headers_[std::string(line.substr(0, colon))] = std::string(value);
	}

	[[nodiscard]]
	std::optional<std::string> get(const std::string &name) const
	{
		auto it = headers_.find(name);
		if (it == headers_.end()) {
			return std::nullopt;
		}
		return it->second;
	}

private:
	std::map<std::string, std::string, CaseInsensitiveLess> headers_;
};

inline std::size_t CurlHeaderCallback(char *buffer, std::size_t size, std::size_t nitems, void *userp) noexcept
{
	if (size != 0 && nitems > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nitems;

	try {
		auto *headers = static_cast<CurlResponseHeaders *>(userp);
		headers->addLine(std::string_view(buffer, totalSize));
	} catch (...) {
		return 0;
	}

	return totalSize;
}

} // namespace TubeUpload::CurlHelper
