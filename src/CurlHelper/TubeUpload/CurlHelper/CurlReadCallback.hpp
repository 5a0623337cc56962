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

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <limits>
#include <span>

#include <curl/curl.h>

namespace TubeUpload::CurlHelper {

/// Upload body backed by memory the caller keeps alive for the whole transfer.
struct CurlSpanReader {
	std::span<const char> data;
	std::size_t position = 0;

	explicit CurlSpanReader(std::span<const char> bytes) noexcept : data(bytes) {}

	[[nodiscard]]
	std::size_t remaining() const noexcept
	{
		return data.size() - position;
	}
};

inline std::size_t CurlSpanReadCallback(char *buffer, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_READFUNC_ABORT;
	}

	auto *reader = static_cast<CurlSpanReader *>(userp);
	if (!reader) {
		return CURL_READFUNC_ABORT;
	}

	const std::size_t capacity = size * nmemb;
	const std::size_t n = capacity < reader->remaining() ? capacity : reader->remaining();
	if (n > 0) {
		std::memcpy(buffer, reader->data.data() + reader->position, n);
		reader->position += n;
	}
	return n;
}

/// Rewinds the reader when curl has to resend the body, e.g. after a redirect.
inline int CurlSpanSeekCallback(void *userp, curl_off_t offset, int origin) noexcept
{
	auto *reader = static_cast<CurlSpanReader *>(userp);
	if (!reader || origin != SEEK_SET || offset < 0 || static_cast<std::size_t>(offset) > reader->data.size()) {
		return CURL_SEEKFUNC_CANTSEEK;
	}
	reader->position = static_cast<std::size_t>(offset);
	return CURL_SEEKFUNC_OK;
}

} // namespace TubeUpload::CurlHelper
