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

#include "YouTubeApiClient.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUpload/CurlHelper/CurlHeaderCallback.hpp>
#include <TubeUpload/CurlHelper/CurlReadCallback.hpp>
#include <TubeUpload/CurlHelper/CurlSlistHandle.hpp>
#include <TubeUpload/CurlHelper/CurlUrlHandle.hpp>
#include <TubeUpload/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUpload/CurlHelper/CurlWriteCallback.hpp>
#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::YouTubeApi {

std::optional<std::uint64_t> parseCommittedSize(std::string_view rangeHeader)
{
	constexpr std::string_view prefix = "bytes=";
	if (!rangeHeader.starts_with(prefix)) {
		return std::nullopt;
	}
	rangeHeader.remove_prefix(prefix.size());

	const std::size_t dash = rangeHeader.find('-');
	if (dash == std::string_view::npos) {
		return std::nullopt;
	}

	std::uint64_t first = 0;
	std::uint64_t last = 0;
	const std::string_view firstStr = rangeHeader.substr(0, dash);
	const std::string_view lastStr = rangeHeader.substr(dash + 1);
	const auto r1 = std::from_chars(firstStr.data(), firstStr.data() + firstStr.size(), first);
	const auto r2 = std::from_chars(lastStr.data(), lastStr.data() + lastStr.size(), last);
	if (r1.ec != std::errc{} || r1.ptr != firstStr.data() + firstStr.size() || r2.ec != std::errc{} ||
	    r2.ptr != lastStr.data() + lastStr.size() || first != 0) {
		return std::nullopt;
	}
	return last + 1;
}

std::optional<std::chrono::seconds> parseRetryAfter(std::string_view value)
{
	long long seconds = 0;
	const auto r = std::from_chars(value.data(), value.data() + value.size(), seconds);
	if (r.ec != std::errc{} || r.ptr != value.data() + value.size() || seconds < 0) {
		return std::nullopt;
	}
	return std::chrono::seconds(seconds);
}

namespace {

enum class HttpMethod { Post, Put };

struct HttpRequest {
	HttpMethod method = HttpMethod::Post;
	std::string url;
	curl_slist *headers = nullptr;
	std::span<const char> body;
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds timeout{60};
};

ResumableUploadResponse perform(CurlHelper::CurlHandle &curlHandle, const HttpRequest &request,
				const Logger::ILogger &logger, const char *operation)
{
	curlHandle.reset();
	CURL *curl = curlHandle.getRaw();

	ResumableUploadResponse response;
	CurlHelper::CurlResponseHeaders responseHeaders;
	CurlHelper::CurlSpanReader reader(request.body);

	curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request.headers);

	if (request.method == HttpMethod::Post) {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
	} else {
		curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
		curl_easy_setopt(curl, CURLOPT_READFUNCTION, CurlHelper::CurlSpanReadCallback);
		curl_easy_setopt(curl, CURLOPT_READDATA, &reader);
		curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, CurlHelper::CurlSpanSeekCallback);
		curl_easy_setopt(curl, CURLOPT_SEEKDATA, &reader);
		curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
	}

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connectTimeout.count()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	const CURLcode res = curl_easy_perform(curl);

	if (res != CURLE_OK) {
		logger.error("CurlPerformError", {{"operation", operation}, {"error", curl_easy_strerror(res)}});
		throw Retry::TransientNetworkError(
			fmt::format("CurlPerformError(YouTubeApiClient::{}):{}", operation, curl_easy_strerror(res)));
	}

	response.status = curlHandle.responseCode();
	response.location = responseHeaders.get("Location").value_or("");
	if (auto range = responseHeaders.get("Range")) {
		response.committedSize = parseCommittedSize(*range);
	}
	if (auto retryAfter = responseHeaders.get("Retry-After")) {
		response.retryAfter = parseRetryAfter(*retryAfter);
	}

	logger.debug("YouTubeApiResponse", {{"operation", operation}, {"status", std::to_string(response.status)}});
	return response;
}

std::string bearerHeader(std::string_view accessToken)
{
	if (accessToken.empty()) {
		throw std::invalid_argument("AccessTokenIsEmptyError(YouTubeApiClient)");
	}
	return fmt::format("Authorization: Bearer {}", accessToken);
}

std::string describeApiError(const std::string &body)
{
	const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
	if (!j.is_discarded() && j.is_object() && j.contains("error")) {
		return j["error"].dump();
	}
	return body.substr(0, 512);
}

char toLowerAscii(char c)
{
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string getLowercaseExtension(const std::filesystem::path &p)
{
	std::string ext = p.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(), toLowerAscii);
	return ext;
}

} // anonymous namespace

YouTubeApiClient::YouTubeApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl,
				   std::shared_ptr<const Logger::ILogger> logger, YouTubeApiClientOptions options)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(YouTubeApiClient)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(YouTubeApiClient)")),
	  options_(std::move(options))
{
}

YouTubeApiClient::~YouTubeApiClient() noexcept = default;

ResumableUploadResponse YouTubeApiClient::initiate(std::string_view accessToken,
						   const YouTubeVideoMetadata &metadata, std::uint64_t totalSize,
						   std::string_view contentType)
{
	CurlHelper::CurlUrlSearchParams params(curl_->getRaw());
	params.append("uploadType", "resumable");
	params.append("part", metadata.partList());

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(options_.videosUploadEndpoint);
	urlHandle.appendQuery(params.toString());

	const nlohmann::json jBody = metadata;
	const std::string body = jBody.dump();

	CurlHelper::CurlSlistHandle headers;
	headers.append(bearerHeader(accessToken));
	headers.append("Content-Type: application/json; charset=UTF-8");
	headers.append(fmt::format("X-Upload-Content-Length: {}", totalSize));
	headers.append(fmt::format("X-Upload-Content-Type: {}", contentType));

	HttpRequest request;
	request.method = HttpMethod::Post;
	request.url = urlHandle.toString();
	request.headers = headers.getRaw();
	request.body = std::span<const char>(body.data(), body.size());
	request.connectTimeout = options_.connectTimeout;
	request.timeout = options_.requestTimeout;

	logger_->info("ResumableSessionInitiating", {{"size", std::to_string(totalSize)}, {"part", metadata.partList()}});
	return perform(*curl_, request, *logger_, "initiate");
}

ResumableUploadResponse YouTubeApiClient::uploadChunk(std::string_view accessToken, const std::string &sessionUri,
						      std::uint64_t offset, std::span<const char> data,
						      std::uint64_t totalSize)
{
	if (sessionUri.empty()) {
		throw std::invalid_argument("SessionUriIsEmptyError(YouTubeApiClient::uploadChunk)");
	}
	if (data.empty()) {
		throw std::invalid_argument("ChunkIsEmptyError(YouTubeApiClient::uploadChunk)");
	}

	const std::uint64_t last = offset + data.size() - 1;

	CurlHelper::CurlSlistHandle headers;
	headers.append(bearerHeader(accessToken));
	headers.append("Content-Type: application/octet-stream");
	headers.append(fmt::format("Content-Range: bytes {}-{}/{}", offset, last, totalSize));
	headers.append("Expect:");

	HttpRequest request;
	request.method = HttpMethod::Put;
	request.url = sessionUri;
	request.headers = headers.getRaw();
	request.body = data;
	request.connectTimeout = options_.connectTimeout;
	request.timeout = options_.chunkTimeout;

	return perform(*curl_, request, *logger_, "uploadChunk");
}

ResumableUploadResponse YouTubeApiClient::queryStatus(std::string_view accessToken, const std::string &sessionUri,
						      std::uint64_t totalSize)
{
	if (sessionUri.empty()) {
		throw std::invalid_argument("SessionUriIsEmptyError(YouTubeApiClient::queryStatus)");
	}

	CurlHelper::CurlSlistHandle headers;
	headers.append(bearerHeader(accessToken));
	headers.append(fmt::format("Content-Range: bytes */{}", totalSize));

	HttpRequest request;
	request.method = HttpMethod::Put;
	request.url = sessionUri;
	request.headers = headers.getRaw();
	request.connectTimeout = options_.connectTimeout;
	request.timeout = options_.requestTimeout;

	return perform(*curl_, request, *logger_, "queryStatus");
}

void YouTubeApiClient::setThumbnail(std::string_view accessToken, std::string videoId,
				    const std::filesystem::path &thumbnailPath)
{
	constexpr std::uintmax_t kMaxThumbnailBytes = 2 * 1024 * 1024;

	if (videoId.empty()) {
		logger_->error("VideoIdIsEmptyError");
		throw std::invalid_argument("VideoIdIsEmptyError(YouTubeApiClient::setThumbnail)");
	}
	if (thumbnailPath.empty()) {
		logger_->error("ThumbnailPathIsEmptyError");
		throw std::invalid_argument("ThumbnailPathIsEmptyError(YouTubeApiClient::setThumbnail)");
	}

	std::error_code ec;
	if (!std::filesystem::is_regular_file(thumbnailPath, ec)) {
		logger_->error("ThumbnailNotRegularFileError", {{"path", thumbnailPath.string()}});
		throw std::invalid_argument("ThumbnailNotRegularFileError(YouTubeApiClient::setThumbnail)");
	}

	const std::uintmax_t size = std::filesystem::file_size(thumbnailPath, ec);
	if (ec) {
		throw Retry::LocalIOError("ThumbnailStatError(YouTubeApiClient::setThumbnail):" + ec.message());
	}
	if (size > kMaxThumbnailBytes) {
		logger_->error("ThumbnailFileSizeExceedsLimitError", {{"path", thumbnailPath.string()},
								      {"size", std::to_string(size)},
								      {"maxSize", std::to_string(kMaxThumbnailBytes)}});
		throw std::invalid_argument("ThumbnailFileSizeExceedsLimitError(YouTubeApiClient::setThumbnail)");
	}

	std::vector<char> image(static_cast<std::size_t>(size));
	{
		std::ifstream ifs(thumbnailPath, std::ios::binary);
		if (!ifs.is_open() || !ifs.read(image.data(), static_cast<std::streamsize>(image.size()))) {
			logger_->error("ThumbnailFileReadError", {{"path", thumbnailPath.string()}});
			throw Retry::LocalIOError("ThumbnailFileReadError(YouTubeApiClient::setThumbnail)");
		}
	}

	CurlHelper::CurlUrlSearchParams params(curl_->getRaw());
	params.append("videoId", std::move(videoId));

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(options_.thumbnailsSetEndpoint);
	urlHandle.appendQuery(params.toString());

	CurlHelper::CurlSlistHandle headers;
	headers.append(bearerHeader(accessToken));

	const std::string ext = getLowercaseExtension(thumbnailPath);
	if (ext == ".png") {
		headers.append("Content-Type: image/png");
	} else if (ext == ".jpg" || ext == ".jpeg") {
		headers.append("Content-Type: image/jpeg");
	} else {
		headers.append("Content-Type: application/octet-stream");
	}

	HttpRequest request;
	request.method = HttpMethod::Post;
	request.url = urlHandle.toString();
	request.headers = headers.getRaw();
	request.body = std::span<const char>(image.data(), image.size());
	request.connectTimeout = options_.connectTimeout;
	request.timeout = options_.requestTimeout;

	const ResumableUploadResponse response = perform(*curl_, request, *logger_, "setThumbnail");
	if (response.status < 200 || response.status >= 300) {
		logger_->error("YouTubeApiError", {{"operation", "setThumbnail"},
						   {"status", std::to_string(response.status)},
						   {"error", describeApiError(response.body)}});
		throw std::runtime_error(fmt::format("APIError(YouTubeApiClient::setThumbnail):{}", response.status));
	}
	logger_->info("ThumbnailSet", {{"path", thumbnailPath.string()}});
}

YouTubePlaylistItem YouTubeApiClient::insertPlaylistItem(std::string_view accessToken, std::string playlistId,
							 std::string videoId)
{
	if (playlistId.empty()) {
		throw std::invalid_argument("PlaylistIdIsEmptyError(YouTubeApiClient::insertPlaylistItem)");
	}
	if (videoId.empty()) {
		throw std::invalid_argument("VideoIdIsEmptyError(YouTubeApiClient::insertPlaylistItem)");
	}

	CurlHelper::CurlUrlSearchParams params(curl_->getRaw());
	params.append("part", "snippet");

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(options_.playlistItemsEndpoint);
	urlHandle.appendQuery(params.toString());

	const nlohmann::json jBody{
		{"snippet",
		 {{"playlistId", playlistId}, {"resourceId", {{"kind", "youtube#video"}, {"videoId", videoId}}}}}};
	const std::string body = jBody.dump();

	CurlHelper::CurlSlistHandle headers;
	headers.append(bearerHeader(accessToken));
	headers.append("Content-Type: application/json; charset=UTF-8");

	HttpRequest request;
	request.method = HttpMethod::Post;
	request.url = urlHandle.toString();
	request.headers = headers.getRaw();
	request.body = std::span<const char>(body.data(), body.size());
	request.connectTimeout = options_.connectTimeout;
	request.timeout = options_.requestTimeout;

	const ResumableUploadResponse response = perform(*curl_, request, *logger_, "insertPlaylistItem");
	if (response.status < 200 || response.status >= 300) {
		logger_->error("YouTubeApiError", {{"operation", "insertPlaylistItem"},
						   {"status", std::to_string(response.status)},
						   {"error", describeApiError(response.body)}});
		throw std::runtime_error(
			fmt::format("APIError(YouTubeApiClient::insertPlaylistItem):{}", response.status));
	}

	const nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
	if (j.is_discarded()) {
		throw std::runtime_error("InvalidResponseError(YouTubeApiClient::insertPlaylistItem)");
	}
	auto item = j.get<YouTubePlaylistItem>();
	logger_->info("PlaylistItemInserted", {{"playlistId", item.playlistId}, {"videoId", item.videoId}});
	return item;
}

} // namespace TubeUpload::YouTubeApi
