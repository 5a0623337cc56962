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

#include "ResumableUploadSession.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::Transfer {

namespace {

bool isCompletion(long status) noexcept
{
	return status == 200 || status == 201;
}

constexpr long kResumeIncomplete = 308;

std::string summarizeBody(const std::string &body)
{
	const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
	if (!j.is_discarded() && j.is_object()) {
		if (auto it = j.find("error"); it != j.end()) {
			if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
				return (*it)["message"].get<std::string>();
			}
			return it->dump();
		}
	}
	return body.substr(0, 256);
}

} // anonymous namespace

std::string_view sessionStateName(SessionState state) noexcept
{
	switch (state) {
	case SessionState::Uninitiated:
		return "Uninitiated";
	case SessionState::SessionOpen:
		return "SessionOpen";
	case SessionState::Uploading:
		return "Uploading";
	case SessionState::Completed:
		return "Completed";
	case SessionState::Failed:
		return "Failed";
	}
	return "Unknown";
}

ResumableUploadSession::ResumableUploadSession(std::shared_ptr<YouTubeApi::IResumableUploadClient> client,
					       std::shared_ptr<GoogleAuth::IAccessTokenSource> tokens,
					       std::shared_ptr<const Logger::ILogger> logger,
					       const std::filesystem::path &videoPath,
					       YouTubeApi::YouTubeVideoMetadata metadata,
					       ResumableUploadSessionOptions options, Retry::Sleeper sleeper,
					       Retry::RandomSource random)
	: client_(client ? std::move(client) : throw std::invalid_argument("ClientIsNullError(ResumableUploadSession)")),
	  tokens_(tokens ? std::move(tokens) : throw std::invalid_argument("TokensIsNullError(ResumableUploadSession)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(ResumableUploadSession)")),
	  metadata_(std::move(metadata)),
	  options_(std::move(options)),
	  sleeper_(sleeper ? std::move(sleeper) : Retry::makeThreadSleeper()),
	  random_(std::move(random)),
	  source_(std::make_unique<SourceFile>(videoPath)),
	  totalSize_(source_->size()),
	  chunkSize_(options_.chunkSize > 0 ? options_.chunkSize
					    : throw std::invalid_argument("ChunkSizeIsZeroError(ResumableUploadSession)")),
	  chunkRetry_(Retry::OperationKind::ChunkUpload, options_.retryPolicy, logger_, random_)
{
}

ResumableUploadSession::~ResumableUploadSession() noexcept = default;

YouTubeApi::YouTubeVideo ResumableUploadSession::run()
{
	if (state_ != SessionState::Uninitiated) {
		throw std::logic_error("SessionAlreadyRunError(ResumableUploadSession)");
	}

	try {
		if (totalSize_ == 0) {
			throw Retry::ClientRejectedError(
				fmt::format("EmptyFileError(ResumableUploadSession):{}", source_->path().string()));
		}

		logger_->info("UploadStarting", {{"path", source_->path().string()},
						 {"size", std::to_string(totalSize_)},
						 {"chunkSize", std::to_string(chunkSize_)}});

		initiate();
		YouTubeApi::YouTubeVideo video = uploadChunks();
		source_.reset();
		return video;
	} catch (const Retry::TransferError &e) {
		const SessionState failedIn = state_;
		state_ = SessionState::Failed;
		source_.reset();
		logger_->error("UploadFailed", {{"error", Retry::errorKindName(e.kind())},
						{"state", sessionStateName(failedIn)},
						{"bytesAcknowledged", std::to_string(bytesAcknowledged_)},
						{"exception", e.what()}});
		throw;
	} catch (...) {
		state_ = SessionState::Failed;
		source_.reset();
		throw;
	}
}

void ResumableUploadSession::initiate()
{
	Retry::RetryController controller(Retry::OperationKind::SessionInitiation, options_.retryPolicy, logger_,
					  random_);
	const std::string contentType = source_->contentType();
	accessToken_ = tokens_->getAccessToken();
	bool refreshedAfterRejection = false;

	for (;;) {
		YouTubeApi::ResumableUploadResponse response;
		try {
			response = client_->initiate(accessToken_, metadata_, totalSize_, contentType);
		} catch (const Retry::TransientNetworkError &e) {
			backoffOrThrow(controller, Retry::ErrorKind::TransientNetwork, std::nullopt, std::nullopt,
				       e.what());
			continue;
		}

		if (response.status >= 200 && response.status < 300) {
			if (response.location.empty()) {
				throw Retry::ClientRejectedError("MissingSessionUriError(ResumableUploadSession)",
								 context(response.status, controller.attempts()));
			}
			sessionUri_ = response.location;
			state_ = SessionState::SessionOpen;
			logger_->info("ResumableSessionOpened");
			return;
		}

		switch (Retry::classifyHttpStatus(response.status)) {
		case Retry::ErrorKind::AuthExpired:
			if (refreshedAfterRejection) {
				throw Retry::AuthExpiredError("InitiationUnauthorizedError(ResumableUploadSession)",
							      context(response.status, controller.attempts()));
			}
			refreshedAfterRejection = true;
			accessToken_ = tokens_->refreshAfterRejection(accessToken_);
			break;
		case Retry::ErrorKind::TransientNetwork:
			backoffOrThrow(controller, Retry::ErrorKind::TransientNetwork, response.status,
				       response.retryAfter, summarizeBody(response.body));
			break;
		default:
			reject("initiate", response);
		}
	}
}

YouTubeApi::YouTubeVideo ResumableUploadSession::uploadChunks()
{
	ChunkPlanner planner(totalSize_, chunkSize_);
	std::vector<char> buffer;
	bool queryBeforeSend = false;
	state_ = SessionState::Uploading;

	for (;;) {
		if (queryBeforeSend) {
			queryBeforeSend = false;
			accessToken_ = tokens_->getAccessToken();

			YouTubeApi::ResumableUploadResponse status;
			try {
				status = client_->queryStatus(accessToken_, sessionUri_, totalSize_);
			} catch (const Retry::TransientNetworkError &e) {
				backoffOrThrow(chunkRetry_, Retry::ErrorKind::TransientNetwork, std::nullopt, std::nullopt,
					       e.what());
				queryBeforeSend = true;
				continue;
			}

			if (isCompletion(status.status)) {
				return complete(status);
			}
			if (status.status == kResumeIncomplete) {
				acknowledge(planner, status.committedSize.value_or(0));
			} else {
				const Retry::ErrorKind kind = Retry::classifyHttpStatus(status.status);
				if (kind == Retry::ErrorKind::AuthExpired) {
					backoffOrThrow(chunkRetry_, kind, status.status, std::nullopt, "status query");
					accessToken_ = tokens_->refreshAfterRejection(accessToken_);
					queryBeforeSend = true;
					continue;
				}
				if (kind == Retry::ErrorKind::TransientNetwork) {
					backoffOrThrow(chunkRetry_, kind, status.status, status.retryAfter,
						       summarizeBody(status.body));
					queryBeforeSend = true;
					continue;
				}
				reject("queryStatus", status);
			}
		}

		const std::optional<ChunkRange> range = planner.nextRange();
		if (!range) {
			// Every byte is acknowledged but the final response was lost.
			backoffOrThrow(chunkRetry_, Retry::ErrorKind::TransientNetwork, std::nullopt, std::nullopt,
				       "missing final response");
			queryBeforeSend = true;
			continue;
		}

		buffer.resize(static_cast<std::size_t>(range->length));
		source_->readRange(range->offset, buffer);

		accessToken_ = tokens_->getAccessToken();
		logger_->debug("ChunkSending", {{"offset", std::to_string(range->offset)},
						{"length", std::to_string(range->length)}});

		YouTubeApi::ResumableUploadResponse response;
		try {
			response = client_->uploadChunk(accessToken_, sessionUri_, range->offset, buffer, totalSize_);
		} catch (const Retry::TransientNetworkError &e) {
			backoffOrThrow(chunkRetry_, Retry::ErrorKind::TransientNetwork, std::nullopt, std::nullopt,
				       e.what());
			queryBeforeSend = true;
			continue;
		}

		if (isCompletion(response.status)) {
			return complete(response);
		}

		if (response.status == kResumeIncomplete) {
			const std::uint64_t committed = response.committedSize.value_or(0);
			if (committed <= planner.currentOffset()) {
				backoffOrThrow(chunkRetry_, Retry::ErrorKind::TransientNetwork, response.status,
					       response.retryAfter, "no progress");
				continue;
			}
			acknowledge(planner, committed);
			continue;
		}

		const Retry::ErrorKind kind = Retry::classifyHttpStatus(response.status);
		switch (kind) {
		case Retry::ErrorKind::AuthExpired:
			backoffOrThrow(chunkRetry_, kind, response.status, std::nullopt, "unauthorized");
			accessToken_ = tokens_->refreshAfterRejection(accessToken_);
			break;
		case Retry::ErrorKind::TransientNetwork:
			backoffOrThrow(chunkRetry_, kind, response.status, response.retryAfter,
				       summarizeBody(response.body));
			queryBeforeSend = response.status >= 500;
			break;
		default:
			reject("uploadChunk", response);
		}
	}
}

YouTubeApi::YouTubeVideo ResumableUploadSession::complete(const YouTubeApi::ResumableUploadResponse &response)
{
	const nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw Retry::ClientRejectedError("UnexpectedResponseError(ResumableUploadSession):not a JSON object",
						 context(response.status, chunkRetry_.attempts()));
	}

	YouTubeApi::YouTubeVideo video;
	try {
		video = j.get<YouTubeApi::YouTubeVideo>();
	} catch (const nlohmann::json::exception &e) {
		throw Retry::ClientRejectedError(
			fmt::format("UnexpectedResponseError(ResumableUploadSession):{}", e.what()),
			context(response.status, chunkRetry_.attempts()));
	}

	if (video.id.empty()) {
		throw Retry::ClientRejectedError("UnexpectedResponseError(ResumableUploadSession):missing id",
						 context(response.status, chunkRetry_.attempts()));
	}

	bytesAcknowledged_ = totalSize_;
	state_ = SessionState::Completed;
	logger_->info("UploadCompleted", {{"videoId", video.id}, {"size", std::to_string(totalSize_)}});
	return video;
}

void ResumableUploadSession::acknowledge(ChunkPlanner &planner, std::uint64_t committed)
{
	if (committed > totalSize_) {
		throw Retry::ClientRejectedError(
			fmt::format("CommittedBeyondTotalError(ResumableUploadSession):{}", committed),
			context(kResumeIncomplete, chunkRetry_.attempts()));
	}

	if (planner.advance(committed)) {
		bytesAcknowledged_ = planner.currentOffset();
		chunkRetry_.onProgress();
		logger_->info("ChunkAcknowledged", {{"bytesAcknowledged", std::to_string(bytesAcknowledged_)},
						    {"total", std::to_string(totalSize_)}});
	} else if (committed < planner.currentOffset()) {
		logger_->warn("ServerOffsetBehindCursor", {{"reported", std::to_string(committed)},
							   {"cursor", std::to_string(planner.currentOffset())}});
	}
}

void ResumableUploadSession::backoffOrThrow(Retry::RetryController &controller, Retry::ErrorKind kind,
					    std::optional<long> httpStatus,
					    std::optional<std::chrono::seconds> retryAfter, const std::string &cause)
{
	const Retry::RetryDecision decision = controller.onFailure(kind, retryAfter);
	if (decision.shouldRetry) {
		if (decision.delay.count() > 0) {
			sleeper_(decision.delay);
		}
		return;
	}

	if (kind == Retry::ErrorKind::AuthExpired) {
		throw Retry::AuthExpiredError(fmt::format("AuthRetryExhaustedError(ResumableUploadSession):{}", cause),
					      context(httpStatus, controller.authRetries()));
	}
	throw Retry::RetryExhaustedError(fmt::format("RetryBudgetExhaustedError(ResumableUploadSession):{}", cause),
					 context(httpStatus, controller.attempts()));
}

void ResumableUploadSession::reject(const char *where, const YouTubeApi::ResumableUploadResponse &response)
{
	throw Retry::ClientRejectedError(fmt::format("RequestRejectedError(ResumableUploadSession::{}):{} {}", where,
						     response.status, summarizeBody(response.body)),
					 context(response.status, chunkRetry_.attempts()));
}

Retry::TransferErrorContext ResumableUploadSession::context(std::optional<long> httpStatus,
							    int attempts) const noexcept
{
	return Retry::TransferErrorContext{httpStatus, attempts, bytesAcknowledged_};
}

} // namespace TubeUpload::Transfer
