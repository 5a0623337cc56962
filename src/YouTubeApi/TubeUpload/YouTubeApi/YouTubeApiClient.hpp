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
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <TubeUpload/CurlHelper/CurlHandle.hpp>
#include <TubeUpload/Logger/ILogger.hpp>

#include "IResumableUploadClient.hpp"
#include "IYouTubeVideoEditor.hpp"
#include "YouTubeTypes.hpp"

namespace TubeUpload::YouTubeApi {

struct YouTubeApiClientOptions {
	std::string videosUploadEndpoint = "https://www.googleapis.com/upload/youtube/v3/videos";
	std::string thumbnailsSetEndpoint = "https://www.googleapis.com/upload/youtube/v3/thumbnails/set";
	std::string playlistItemsEndpoint = "https://www.googleapis.com/youtube/v3/playlistItems";
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds requestTimeout{60};
	std::chrono::seconds chunkTimeout{300};
};

class YouTubeApiClient : public IResumableUploadClient, public IYouTubeVideoEditor {
public:
	YouTubeApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl, std::shared_ptr<const Logger::ILogger> logger,
			 YouTubeApiClientOptions options = {});

	~YouTubeApiClient() noexcept override;

	YouTubeApiClient(const YouTubeApiClient &) = delete;
	YouTubeApiClient &operator=(const YouTubeApiClient &) = delete;
	YouTubeApiClient(YouTubeApiClient &&) = delete;
	YouTubeApiClient &operator=(YouTubeApiClient &&) = delete;

	ResumableUploadResponse initiate(std::string_view accessToken, const YouTubeVideoMetadata &metadata,
					 std::uint64_t totalSize, std::string_view contentType) override;

	ResumableUploadResponse uploadChunk(std::string_view accessToken, const std::string &sessionUri,
					    std::uint64_t offset, std::span<const char> data,
					    std::uint64_t totalSize) override;

	ResumableUploadResponse queryStatus(std::string_view accessToken, const std::string &sessionUri,
					    std::uint64_t totalSize) override;

	void setThumbnail(std::string_view accessToken, std::string videoId,
			  const std::filesystem::path &thumbnailPath) override;

	YouTubePlaylistItem insertPlaylistItem(std::string_view accessToken, std::string playlistId,
					       std::string videoId) override;

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const YouTubeApiClientOptions options_;
};

} // namespace TubeUpload::YouTubeApi
