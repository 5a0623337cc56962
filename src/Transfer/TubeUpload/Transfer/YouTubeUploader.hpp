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

#include <filesystem>
#include <memory>
#include <optional>

#include <TubeUpload/GoogleAuth/GoogleAuthManager.hpp>
#include <TubeUpload/Logger/ILogger.hpp>
#include <TubeUpload/Retry/RetryController.hpp>
#include <TubeUpload/YouTubeApi/IResumableUploadClient.hpp>
#include <TubeUpload/YouTubeApi/IYouTubeVideoEditor.hpp>
#include <TubeUpload/YouTubeApi/YouTubeTypes.hpp>

#include "ResumableUploadSession.hpp"
#include "UploadReport.hpp"

namespace TubeUpload::Transfer {

struct YouTubeUploaderOptions {
	bool allowInteractive = true;
	bool authorizeOnly = false;
	ResumableUploadSessionOptions session;
};

/// Authorizes, uploads one file and applies the thumbnail and playlist steps. Failures are
/// reported through UploadReport; only invalid arguments escape as exceptions.
class YouTubeUploader {
public:
	YouTubeUploader(std::shared_ptr<GoogleAuth::GoogleAuthManager> authManager,
			std::shared_ptr<YouTubeApi::IResumableUploadClient> uploadClient,
			std::shared_ptr<YouTubeApi::IYouTubeVideoEditor> videoEditor,
			std::shared_ptr<const Logger::ILogger> logger, YouTubeUploaderOptions options = {},
			Retry::Sleeper sleeper = {}, Retry::RandomSource random = {});

	YouTubeUploader(const YouTubeUploader &) = delete;
	YouTubeUploader &operator=(const YouTubeUploader &) = delete;
	YouTubeUploader(YouTubeUploader &&) = delete;
	YouTubeUploader &operator=(YouTubeUploader &&) = delete;

	/// `videoPath` may be empty only in authorize-only mode.
	UploadReport upload(const std::optional<std::filesystem::path> &videoPath,
			    const YouTubeApi::YouTubeVideoMetadata &metadata);

private:
	void applyPostUploadSteps(const std::string &videoId, const YouTubeApi::YouTubeVideoMetadata &metadata,
				  UploadReport &report);

	const std::shared_ptr<GoogleAuth::GoogleAuthManager> authManager_;
	const std::shared_ptr<YouTubeApi::IResumableUploadClient> uploadClient_;
	const std::shared_ptr<YouTubeApi::IYouTubeVideoEditor> videoEditor_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const YouTubeUploaderOptions options_;
	const Retry::Sleeper sleeper_;
	const Retry::RandomSource random_;
};

} // namespace TubeUpload::Transfer
