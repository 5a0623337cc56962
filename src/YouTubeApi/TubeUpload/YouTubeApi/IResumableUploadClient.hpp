/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload YouTubeApi Library
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

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "YouTubeTypes.hpp"

namespace TubeUpload::YouTubeApi {

/// One HTTP exchange with the resumable upload endpoint, stripped to what the session needs.
struct ResumableUploadResponse {
	long status = 0;
	/// Bytes the server holds, from a `Range: bytes=0-N` header (N + 1). nullopt when the header is absent.
	std::optional<std::uint64_t> committedSize;
	std::string location;
	std::string body;
	std::optional<std::chrono::seconds> retryAfter;
};

/// Parses a `Range` header value of the form `bytes=0-N`. Returns N + 1.
std::optional<std::uint64_t> parseCommittedSize(std::string_view rangeHeader);

/// Parses a delta-seconds `Retry-After` header value. HTTP dates are not supported.
std::optional<std::chrono::seconds> parseRetryAfter(std::string_view value);

/// Transport for the resumable upload protocol. Implementations return every HTTP response,
/// whatever its status, and raise Retry::TransientNetworkError when no response was received.
class IResumableUploadClient {
public:
	virtual ~IResumableUploadClient() = default;

	virtual ResumableUploadResponse initiate(std::string_view accessToken, const YouTubeVideoMetadata &metadata,
						 std::uint64_t totalSize, std::string_view contentType) = 0;

	virtual ResumableUploadResponse uploadChunk(std::string_view accessToken, const std::string &sessionUri,
						    std::uint64_t offset, std::span<const char> data,
						    std::uint64_t totalSize) = 0;

	virtual ResumableUploadResponse queryStatus(std::string_view accessToken, const std::string &sessionUri,
						    std::uint64_t totalSize) = 0;
};

} // namespace TubeUpload::YouTubeApi
