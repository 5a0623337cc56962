/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Transfer Library
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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <TubeUpload/GoogleAuth/IAccessTokenSource.hpp>
#include <TubeUpload/Logger/ILogger.hpp>
#include <TubeUpload/Retry/RetryController.hpp>
#include <TubeUpload/Retry/RetryPolicy.hpp>
#include <TubeUpload/YouTubeApi/IResumableUploadClient.hpp>
#include <TubeUpload/YouTubeApi/YouTubeTypes.hpp>

#include "ChunkPlanner.hpp"
#include "SourceFile.hpp"

namespace TubeUpload::Transfer {

enum class SessionState { Uninitiated, SessionOpen, Uploading, Completed, Failed };

[[nodiscard]]
std::string_view sessionStateName(SessionState state) noexcept;

struct ResumableUploadSessionOptions {
	std::uint64_t chunkSize = ChunkPlanner::kDefaultChunkSize;
	Retry::RetryPolicy retryPolicy;
};

/**
 * One resumable upload of one file.
 *
 * run() opens the session, then sends chunks strictly in order. The resume offset always comes
 * from the server: a 308 moves the cursor to the reported Range, and after a network error or
 * a 5xx the session asks the server for its offset before sending again. The source file is
 * released when run() returns or throws.
 */
class ResumableUploadSession {
public:
	ResumableUploadSession(std::shared_ptr<YouTubeApi::IResumableUploadClient> client,
			       std::shared_ptr<GoogleAuth::IAccessTokenSource> tokens,
			       std::shared_ptr<const Logger::ILogger> logger, const std::filesystem::path &videoPath,
			       YouTubeApi::YouTubeVideoMetadata metadata, ResumableUploadSessionOptions options = {},
			       Retry::Sleeper sleeper = {}, Retry::RandomSource random = {});

	~ResumableUploadSession() noexcept;

	ResumableUploadSession(const ResumableUploadSession &) = delete;
	ResumableUploadSession &operator=(const ResumableUploadSession &) = delete;
	ResumableUploadSession(ResumableUploadSession &&) = delete;
	ResumableUploadSession &operator=(ResumableUploadSession &&) = delete;

	/// Uploads the whole file and returns the created video. Runs at most once.
	YouTubeApi::YouTubeVideo run();

	[[nodiscard]]
	SessionState state() const noexcept
	{
		return state_;
	}

	[[nodiscard]]
	const std::string &sessionUri() const noexcept
	{
		return sessionUri_;
	}

	[[nodiscard]]
	std::uint64_t bytesAcknowledged() const noexcept
	{
		return bytesAcknowledged_;
	}

	[[nodiscard]]
	std::uint64_t totalSize() const noexcept
	{
		return totalSize_;
	}

	[[nodiscard]]
	std::uint64_t chunkSize() const noexcept
	{
		return chunkSize_;
	}

	/// Failed attempts since the server last confirmed progress.
	[[nodiscard]]
	int attemptCount() const noexcept
	{
		return chunkRetry_.attempts();
	}

private:
	void initiate();

	YouTubeApi::YouTubeVideo uploadChunks();

	YouTubeApi::YouTubeVideo complete(const YouTubeApi::ResumableUploadResponse &response);

	void acknowledge(ChunkPlanner &planner, std::uint64_t committed);

	/// Sleeps before the next attempt, or throws once `controller` gives up.
	void backoffOrThrow(Retry::RetryController &controller, Retry::ErrorKind kind, std::optional<long> httpStatus,
			    std::optional<std::chrono::seconds> retryAfter, const std::string &cause);

	[[noreturn]]
	void reject(const char *where, const YouTubeApi::ResumableUploadResponse &response);

	[[nodiscard]]
	Retry::TransferErrorContext context(std::optional<long> httpStatus, int attempts) const noexcept;

	const std::shared_ptr<YouTubeApi::IResumableUploadClient> client_;
	const std::shared_ptr<GoogleAuth::IAccessTokenSource> tokens_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const YouTubeApi::YouTubeVideoMetadata metadata_;
	const ResumableUploadSessionOptions options_;
	const Retry::Sleeper sleeper_;
	const Retry::RandomSource random_;

	std::unique_ptr<SourceFile> source_;
	const std::uint64_t totalSize_;
	const std::uint64_t chunkSize_;

	Retry::RetryController chunkRetry_;
	SessionState state_ = SessionState::Uninitiated;
	std::string sessionUri_;
	std::string accessToken_;
	std::uint64_t bytesAcknowledged_ = 0;
};

} // namespace TubeUpload::Transfer
