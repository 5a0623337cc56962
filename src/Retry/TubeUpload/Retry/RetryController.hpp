/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Retry Library
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
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <TubeUpload/Logger/ILogger.hpp>

#include "RetryPolicy.hpp"
#include "TransferErrors.hpp"

namespace TubeUpload::Retry {

enum class OperationKind { TokenRefresh, SessionInitiation, ChunkUpload };

[[nodiscard]]
std::string_view operationKindName(OperationKind kind) noexcept;

struct RetryAttemptRecord {
	OperationKind operation;
	int attemptNumber = 0;
	ErrorKind lastErrorClass = ErrorKind::TransientNetwork;
	std::chrono::milliseconds nextDelay{0};
};

struct RetryDecision {
	bool shouldRetry = false;
	std::chrono::milliseconds delay{0};
	RetryAttemptRecord record;
};

/// Returns a uniformly distributed value in [0, 1).
using RandomSource = std::function<double()>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]]
Sleeper makeThreadSleeper();

/**
 * Decides whether a failed operation is attempted again and how long to wait first.
 *
 * TransientNetwork failures are retried with capped exponential backoff until more than
 * maxRetries have been seen since the last onProgress(). AuthExpired failures are retried
 * immediately, up to maxAuthRetries. Every other kind gives up at once. The controller never
 * sleeps; callers wait through a Sleeper.
 */
class RetryController {
public:
	RetryController(OperationKind operation, RetryPolicy policy, std::shared_ptr<const Logger::ILogger> logger,
			RandomSource random = {});

	[[nodiscard]]
	RetryDecision onFailure(ErrorKind kind, std::optional<std::chrono::seconds> retryAfter = std::nullopt);

	void onProgress() noexcept;

	[[nodiscard]]
	std::chrono::milliseconds backoffDelay(int attempt,
					       std::optional<std::chrono::seconds> retryAfter = std::nullopt) const;

	[[nodiscard]]
	int attempts() const noexcept
	{
		return attempts_;
	}

	[[nodiscard]]
	int authRetries() const noexcept
	{
		return authRetries_;
	}

	[[nodiscard]]
	const RetryPolicy &policy() const noexcept
	{
		return policy_;
	}

private:
	const OperationKind operation_;
	const RetryPolicy policy_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	RandomSource random_;

	int attempts_ = 0;
	int authRetries_ = 0;
};

} // namespace TubeUpload::Retry
