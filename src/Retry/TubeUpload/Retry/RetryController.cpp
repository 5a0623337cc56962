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

#include "RetryController.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace TubeUpload::Retry {

std::string_view operationKindName(OperationKind kind) noexcept
{
	switch (kind) {
	case OperationKind::TokenRefresh:
		return "TokenRefresh";
	case OperationKind::SessionInitiation:
		return "SessionInitiation";
	case OperationKind::ChunkUpload:
		return "ChunkUpload";
	}
	return "Unknown";
}

Sleeper makeThreadSleeper()
{
	return [](std::chrono::milliseconds delay) {
		std::this_thread::sleep_for(delay);
	};
}

namespace {

RandomSource makeDefaultRandomSource()
{
	auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
	return [engine]() {
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		return dist(*engine);
	};
}

} // anonymous namespace

RetryController::RetryController(OperationKind operation, RetryPolicy policy,
				 std::shared_ptr<const Logger::ILogger> logger, RandomSource random)
	: operation_(operation),
	  policy_(policy),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(RetryController)")),
	  random_(random ? std::move(random) : makeDefaultRandomSource())
{
	if (policy_.maxRetries < 0 || policy_.maxAuthRetries < 0) {
		throw std::invalid_argument("NegativeRetryBudgetError(RetryController)");
	}
	if (policy_.multiplier < 1.0 || policy_.baseDelay.count() < 0 || policy_.maxDelay < policy_.baseDelay) {
		throw std::invalid_argument("InvalidBackoffError(RetryController)");
	}
}

RetryDecision RetryController::onFailure(ErrorKind kind, std::optional<std::chrono::seconds> retryAfter)
{
	RetryDecision decision;
	decision.record.operation = operation_;
	decision.record.lastErrorClass = kind;

	switch (kind) {
	case ErrorKind::TransientNetwork:
		attempts_++;
		decision.record.attemptNumber = attempts_;
		if (attempts_ > policy_.maxRetries) {
			break;
		}
		decision.shouldRetry = true;
		decision.delay = backoffDelay(attempts_, retryAfter);
		break;
	case ErrorKind::AuthExpired:
		authRetries_++;
		decision.record.attemptNumber = authRetries_;
		decision.shouldRetry = authRetries_ <= policy_.maxAuthRetries;
		break;
	default:
		decision.record.attemptNumber = attempts_ + 1;
		break;
	}

	decision.record.nextDelay = decision.delay;

	const std::string attemptStr = std::to_string(decision.record.attemptNumber);
	if (decision.shouldRetry) {
		const std::string delayStr = fmt::format("{}ms", decision.delay.count());
		logger_->warn("RetryScheduled", {{"operation", operationKindName(operation_)},
						 {"error", errorKindName(kind)},
						 {"attempt", attemptStr},
						 {"delay", delayStr}});
	} else {
		logger_->error("RetryGivenUp", {{"operation", operationKindName(operation_)},
					       {"error", errorKindName(kind)},
					       {"attempt", attemptStr}});
	}

	return decision;
}

void RetryController::onProgress() noexcept
{
	attempts_ = 0;
	authRetries_ = 0;
}

std::chrono::milliseconds RetryController::backoffDelay(int attempt,
							 std::optional<std::chrono::seconds> retryAfter) const
{
	const double maxMs = static_cast<double>(policy_.maxDelay.count());
	const double exponent = static_cast<double>(std::max(attempt, 1) - 1);
	double delayMs = std::min(maxMs, static_cast<double>(policy_.baseDelay.count()) *
						 std::pow(policy_.multiplier, exponent));

	if (policy_.jitter) {
		// uniform in (0, delay]
		const double u = std::clamp(random_(), 0.0, 1.0);
		delayMs = std::max(1.0, delayMs * (1.0 - u));
	}

	if (retryAfter) {
		const double retryAfterMs = static_cast<double>(std::chrono::milliseconds(*retryAfter).count());
		delayMs = std::max(delayMs, retryAfterMs);
	}

	delayMs = std::min(delayMs, maxMs);
	return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delayMs));
}

} // namespace TubeUpload::Retry
