/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Retry Tests
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

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include <TubeUpload/Logger/NullLogger.hpp>
#include <TubeUpload/Retry/RetryController.hpp>

using namespace TubeUpload;
using namespace std::chrono_literals;

namespace {

Retry::RetryPolicy noJitterPolicy()
{
	Retry::RetryPolicy policy;
	policy.jitter = false;
	return policy;
}

} // anonymous namespace

TEST(RetryControllerTest, BackoffDoublesUntilCap)
{
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, noJitterPolicy(),
					  Logger::NullLogger::instance());

	EXPECT_EQ(controller.backoffDelay(1), 1000ms);
	EXPECT_EQ(controller.backoffDelay(2), 2000ms);
	EXPECT_EQ(controller.backoffDelay(3), 4000ms);
	EXPECT_EQ(controller.backoffDelay(7), 64000ms);
	EXPECT_EQ(controller.backoffDelay(10), 64000ms);
}

TEST(RetryControllerTest, JitterStaysWithinBounds)
{
	double draw = 0.0;
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, Retry::RetryPolicy{},
					  Logger::NullLogger::instance(), [&draw] { return draw; });

	for (int attempt = 1; attempt <= 10; attempt++) {
		for (double u : {0.0, 0.25, 0.5, 0.999, 1.0}) {
			draw = u;
			const auto delay = controller.backoffDelay(attempt);
			EXPECT_GE(delay, 1ms);
			EXPECT_LE(delay, 64000ms);
		}
	}

	draw = 0.5;
	EXPECT_EQ(controller.backoffDelay(3), 2000ms);
}

TEST(RetryControllerTest, RetryAfterRaisesDelayButNotAboveCap)
{
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, noJitterPolicy(),
					  Logger::NullLogger::instance());

	EXPECT_EQ(controller.backoffDelay(1, 30s), 30000ms);
	EXPECT_EQ(controller.backoffDelay(5, 3s), 16000ms);
	EXPECT_EQ(controller.backoffDelay(1, 3600s), 64000ms);
}

TEST(RetryControllerTest, TransientFailuresExhaustAfterMaxRetries)
{
	Retry::RetryPolicy policy = noJitterPolicy();
	policy.maxRetries = 3;
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, policy, Logger::NullLogger::instance());

	for (int i = 1; i <= 3; i++) {
		const auto decision = controller.onFailure(Retry::ErrorKind::TransientNetwork);
		EXPECT_TRUE(decision.shouldRetry);
		EXPECT_EQ(decision.record.attemptNumber, i);
		EXPECT_EQ(decision.record.operation, Retry::OperationKind::ChunkUpload);
	}

	const auto last = controller.onFailure(Retry::ErrorKind::TransientNetwork);
	EXPECT_FALSE(last.shouldRetry);
	EXPECT_EQ(controller.attempts(), 4);
}

TEST(RetryControllerTest, ProgressResetsTheBudget)
{
	Retry::RetryPolicy policy = noJitterPolicy();
	policy.maxRetries = 1;
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, policy, Logger::NullLogger::instance());

	EXPECT_TRUE(controller.onFailure(Retry::ErrorKind::TransientNetwork).shouldRetry);
	controller.onProgress();
	const auto decision = controller.onFailure(Retry::ErrorKind::TransientNetwork);
	EXPECT_TRUE(decision.shouldRetry);
	EXPECT_EQ(decision.delay, 1000ms);
}

TEST(RetryControllerTest, AuthFailuresHaveTheirOwnCeiling)
{
	Retry::RetryPolicy policy = noJitterPolicy();
	policy.maxAuthRetries = 2;
	Retry::RetryController controller(Retry::OperationKind::ChunkUpload, policy, Logger::NullLogger::instance());

	EXPECT_TRUE(controller.onFailure(Retry::ErrorKind::AuthExpired).shouldRetry);
	EXPECT_TRUE(controller.onFailure(Retry::ErrorKind::AuthExpired).shouldRetry);
	EXPECT_FALSE(controller.onFailure(Retry::ErrorKind::AuthExpired).shouldRetry);
	EXPECT_EQ(controller.attempts(), 0);
	EXPECT_EQ(controller.authRetries(), 3);
}

TEST(RetryControllerTest, PermanentErrorsAreNeverRetried)
{
	Retry::RetryController controller(Retry::OperationKind::SessionInitiation, noJitterPolicy(),
					  Logger::NullLogger::instance());

	EXPECT_FALSE(controller.onFailure(Retry::ErrorKind::ClientRejected).shouldRetry);
	EXPECT_FALSE(controller.onFailure(Retry::ErrorKind::AuthInvalid).shouldRetry);
	EXPECT_FALSE(controller.onFailure(Retry::ErrorKind::LocalIO).shouldRetry);
}

TEST(RetryControllerTest, TokenRefreshPolicyAllowsThreeAttempts)
{
	Retry::RetryController controller(Retry::OperationKind::TokenRefresh, Retry::RetryPolicy::tokenRefresh(),
					  Logger::NullLogger::instance());

	EXPECT_TRUE(controller.onFailure(Retry::ErrorKind::TransientNetwork).shouldRetry);
	EXPECT_TRUE(controller.onFailure(Retry::ErrorKind::TransientNetwork).shouldRetry);
	EXPECT_FALSE(controller.onFailure(Retry::ErrorKind::TransientNetwork).shouldRetry);
}

TEST(RetryControllerTest, RejectsInvalidPolicy)
{
	Retry::RetryPolicy negative;
	negative.maxRetries = -1;
	EXPECT_THROW(Retry::RetryController(Retry::OperationKind::ChunkUpload, negative, Logger::NullLogger::instance()),
		     std::invalid_argument);

	Retry::RetryPolicy shrinking;
	shrinking.multiplier = 0.5;
	EXPECT_THROW(Retry::RetryController(Retry::OperationKind::ChunkUpload, shrinking,
					    Logger::NullLogger::instance()),
		     std::invalid_argument);

	EXPECT_THROW(Retry::RetryController(Retry::OperationKind::ChunkUpload, Retry::RetryPolicy{}, nullptr),
		     std::invalid_argument);
}
