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

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace TubeUpload::CurlHelper {

class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url(), &curl_url_cleanup)
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept = default;

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;
	CurlUrlHandle(CurlUrlHandle &&) noexcept = default;
	CurlUrlHandle &operator=(CurlUrlHandle &&) noexcept = default;

	void setUrl(const std::string &url)
	{
		CURLUcode uc = curl_url_set(handle_.get(), CURLUPART_URL, url.c_str(), 0);
		if (uc != CURLUE_OK) {
			throw std::invalid_argument("URLParseError(CurlUrlHandle):" + url);
		}
	}

	void appendQuery(const std::string &query)
	{
		CURLUcode uc = curl_url_set(handle_.get(), CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("QueryAppendError(CurlUrlHandle):" + query);
		}
	}

	/// Returns the raw (still percent-encoded) query, or nullopt when the URL has none.
	[[nodiscard]]
	std::optional<std::string> query() const
	{
		char *queryStr = nullptr;
		CURLUcode uc = curl_url_get(handle_.get(), CURLUPART_QUERY, &queryStr, 0);
		if (uc == CURLUE_NO_QUERY) {
			return std::nullopt;
		}
		if (uc != CURLUE_OK || !queryStr) {
			throw std::runtime_error("GetQueryError(CurlUrlHandle)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(queryStr, curl_free);
		return std::string(queryStr);
	}

	[[nodiscard]]
	std::string toString() const
	{
		char *urlStr = nullptr;
		CURLUcode uc = curl_url_get(handle_.get(), CURLUPART_URL, &urlStr, 0);
		if (uc != CURLUE_OK || !urlStr) {
			throw std::runtime_error("GetUrlError(CurlUrlHandle)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(urlStr, curl_free);
		return std::string(urlStr);
	}

private:
	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle_;
};

} // namespace TubeUpload::CurlHelper
