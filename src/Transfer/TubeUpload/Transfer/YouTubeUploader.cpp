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

#include "YouTubeUploader.hpp"

#include <stdexcept>
#include <utility>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::Transfer {

namespace {

void fillFromError(UploadReport &report, const Retry::TransferError &e, UploadStatus status)
{
	report.status = status;
	report.message = e.what();
	report.attempts = e.attempts();
	report.httpStatus = e.httpStatus();
}

} // anonymous namespace

YouTubeUploader::YouTubeUploader(std::shared_ptr<GoogleAuth::GoogleAuthManager> authManager,
				 std::shared_ptr<YouTubeApi::IResumableUploadClient> uploadClient,
				 std::shared_ptr<YouTubeApi::IYouTubeVideoEditor> videoEditor,
				 std::shared_ptr<const Logger::ILogger> logger, YouTubeUploaderOptions options,
				 Retry::Sleeper sleeper, Retry::RandomSource random)
	: authManager_(authManager ? std::move(authManager)
				   : throw std::invalid_argument("AuthManagerIsNullError(YouTubeUploader)")),
	  uploadClient_(uploadClient ? std::move(uploadClient)
				     : throw std::invalid_argument("UploadClientIsNullError(YouTubeUploader)")),
	  videoEditor_(std::move(videoEditor)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(YouTubeUploader)")),
	  options_(std::move(options)),
	  sleeper_(std::move(sleeper)),
	  random_(std::move(random))
{
}

UploadReport YouTubeUploader::upload(const std::optional<std::filesystem::path> &videoPath,
				     const YouTubeApi::YouTubeVideoMetadata &metadata)
{
	UploadReport report;

	if (!options_.authorizeOnly) {
		if (!videoPath || videoPath->empty()) {
			throw std::invalid_argument("VideoPathIsEmptyError(YouTubeUploader)");
		}
		metadata.validate();
	}

	try {
		authManager_->authorize(options_.allowInteractive);
	} catch (const Retry::TransferError &e) {
		const UploadStatus status = e.kind() == Retry::ErrorKind::LocalIO ? UploadStatus::LocalIOFailed
										  : UploadStatus::AuthorizationFailed;
		fillFromError(report, e, status);
		logger_->error("AuthorizationFailed", {{"exception", e.what()}});
		return report;
	}

	if (options_.authorizeOnly) {
		report.message = "Authorized";
		logger_->info("AuthorizeOnlyCompleted");
		return report;
	}

	std::unique_ptr<ResumableUploadSession> session;
	try {
		session = std::make_unique<ResumableUploadSession>(uploadClient_, authManager_, logger_, *videoPath,
								   metadata, options_.session, sleeper_, random_);
		report.totalSize = session->totalSize();

		const YouTubeApi::YouTubeVideo video = session->run();
		report.videoId = video.id;
		report.bytesAcknowledged = session->bytesAcknowledged();
		report.message = "Upload completed";
	} catch (const Retry::TransferError &e) {
		fillFromError(report, e, uploadStatusFor(e.kind()));
		if (session) {
			report.bytesAcknowledged = session->bytesAcknowledged();
		}
		return report;
	}

	applyPostUploadSteps(*report.videoId, metadata, report);
	return report;
}

void YouTubeUploader::applyPostUploadSteps(const std::string &videoId,
					   const YouTubeApi::YouTubeVideoMetadata &metadata, UploadReport &report)
{
	if (!metadata.thumbnailPath && !metadata.playlistId) {
		return;
	}
	if (!videoEditor_) {
		logger_->warn("VideoEditorUnavailable");
		return;
	}

	if (metadata.thumbnailPath) {
		try {
			videoEditor_->setThumbnail(authManager_->getAccessToken(), videoId, *metadata.thumbnailPath);
			report.thumbnailSet = true;
		} catch (const std::exception &e) {
			logger_->logException(e, "ThumbnailUploadFailed");
		}
	}

	if (metadata.playlistId) {
		try {
			videoEditor_->insertPlaylistItem(authManager_->getAccessToken(), *metadata.playlistId, videoId);
			report.addedToPlaylist = true;
		} catch (const std::exception &e) {
			logger_->logException(e, "PlaylistInsertFailed");
		}
	}
}

} // namespace TubeUpload::Transfer
