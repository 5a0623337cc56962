/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload GoogleAuth Tests
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
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <TubeUpload/GoogleAuth/GoogleAuthManager.hpp>
#include <TubeUpload/GoogleAuth/GoogleTokenStorage.hpp>
#include <TubeUpload/Logger/NullLogger.hpp>
#include <TubeUpload/Retry/TransferErrors.hpp>
#include <TubeUpload/TestSupport/FakeOAuth2Client.hpp>
#include <TubeUpload/TestSupport/RecordingSleeper.hpp>
#include <TubeUpload/TestSupport/TemporaryDirectory.hpp>

using namespace TubeUpload;
using namespace std::chrono_literals;

namespace {

std::int64_t unixNow()
{
	return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
		.count();
}

GoogleAuth::GoogleTokenState storedState(std::int64_t expiresIn, std::int64_t refreshedAgo = 0)
{
	GoogleAuth::GoogleTokenState state;
	state.access_token = "stored-access-token";
	state.refresh_token = "stored-refresh-token";
	state.expires_at = unixNow() + expiresIn;
	state.refreshed_at = unixNow() - refreshedAgo;
	return state;
}

GoogleAuth::GoogleAuthResponse throwTransient()
{
	throw Retry::TransientNetworkError("TransientNetworkError(FakeOAuth2Client):503", {503L});
}

GoogleAuth::GoogleAuthResponse throwInvalidGrant()
{
	throw Retry::AuthInvalidError("AuthInvalidError(FakeOAuth2Client):invalid_grant", {400L});
}

} // anonymous namespace

class GoogleAuthManagerTest : public ::testing::Test {
protected:
	std::shared_ptr<GoogleAuth::GoogleAuthManager> makeManager(GoogleAuth::GoogleAuthManagerOptions options = {},
								   bool withInteractive = true)
	{
		return std::make_shared<GoogleAuth::GoogleAuthManager>(
			client, storage, withInteractive ? interactive : nullptr, manual, Logger::NullLogger::instance(),
			options, sleeper.sleeper(), TestSupport::fixedRandom());
	}

	TestSupport::TemporaryDirectory dir;
	std::shared_ptr<TestSupport::FakeOAuth2Client> client = std::make_shared<TestSupport::FakeOAuth2Client>();
	std::shared_ptr<GoogleAuth::GoogleTokenStorage> storage =
		std::make_shared<GoogleAuth::GoogleTokenStorage>(dir.path() / "oauth2.json", Logger::NullLogger::instance());
	std::shared_ptr<TestSupport::FakeAuthorizationCodeProvider> interactive =
		std::make_shared<TestSupport::FakeAuthorizationCodeProvider>("browser-code",
									     "http://localhost:8080/callback");
	std::shared_ptr<TestSupport::FakeAuthorizationCodeProvider> manual =
		std::make_shared<TestSupport::FakeAuthorizationCodeProvider>("pasted-code");
	TestSupport::RecordingSleeper sleeper;
};

TEST_F(GoogleAuthManagerTest, ReusesUsableStoredGrant)
{
	storage->save(storedState(3600));
	auto manager = makeManager();

	const auto state = manager->authorize(false);

	EXPECT_EQ(state.access_token, "stored-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 0);
	EXPECT_EQ(manager->getAccessToken(), "stored-access-token");
}

TEST_F(GoogleAuthManagerTest, RefreshesExpiredGrantAndPersistsIt)
{
	storage->save(storedState(-60));
	auto manager = makeManager();

	const auto state = manager->authorize(false);

	EXPECT_EQ(state.access_token, "refreshed-access-token");
	EXPECT_EQ(state.refresh_token, "stored-refresh-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);
	ASSERT_EQ(client->refreshTokensSeen.size(), 1u);
	EXPECT_EQ(client->refreshTokensSeen[0], "stored-refresh-token");
	EXPECT_EQ(storage->load()->access_token, "refreshed-access-token");
}

TEST_F(GoogleAuthManagerTest, RefreshesTokenInsideExpiryMargin)
{
	storage->save(storedState(120));
	auto manager = makeManager();

	EXPECT_EQ(manager->getAccessToken(), "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);
}

TEST_F(GoogleAuthManagerTest, ConcurrentCallersShareOneRefresh)
{
	storage->save(storedState(-60));
	client->refreshLatency = 100ms;
	auto manager = makeManager();

	constexpr int kThreads = 8;
	std::vector<std::string> tokens(kThreads);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; i++) {
		threads.emplace_back([&, i] { tokens[i] = manager->getAccessToken(); });
	}
	for (auto &thread : threads) {
		thread.join();
	}

	EXPECT_EQ(client->refreshCalls.load(), 1);
	for (const auto &token : tokens) {
		EXPECT_EQ(token, "refreshed-access-token");
	}
}

TEST_F(GoogleAuthManagerTest, ConcurrentRejectionsShareOneRefresh)
{
	storage->save(storedState(3600));
	client->refreshLatency = 100ms;
	auto manager = makeManager();

	constexpr int kThreads = 4;
	std::vector<std::string> tokens(kThreads);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; i++) {
		threads.emplace_back([&, i] { tokens[i] = manager->refreshAfterRejection("stored-access-token"); });
	}
	for (auto &thread : threads) {
		thread.join();
	}

	EXPECT_EQ(client->refreshCalls.load(), 1);
	for (const auto &token : tokens) {
		EXPECT_EQ(token, "refreshed-access-token");
	}
}

TEST_F(GoogleAuthManagerTest, StaleRejectionDoesNotRefreshAgain)
{
	storage->save(storedState(3600));
	auto manager = makeManager();

	EXPECT_EQ(manager->refreshAfterRejection("stored-access-token"), "refreshed-access-token");
	EXPECT_EQ(manager->refreshAfterRejection("stored-access-token"), "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);
}

TEST_F(GoogleAuthManagerTest, HeadlessInvalidGrantFailsWithoutPrompting)
{
	storage->save(storedState(-60));
	client->refreshSteps.push_back(throwInvalidGrant);
	auto manager = makeManager();

	EXPECT_THROW(manager->authorize(false), Retry::AuthInvalidError);
	EXPECT_EQ(interactive->calls, 0);
	EXPECT_EQ(manual->calls, 0);
	EXPECT_TRUE(client->exchangedCodes.empty());
}

TEST_F(GoogleAuthManagerTest, InvalidGrantFallsBackToInteractiveAuthorization)
{
	storage->save(storedState(-60));
	client->refreshSteps.push_back(throwInvalidGrant);
	auto manager = makeManager();

	const auto state = manager->authorize(true);

	EXPECT_EQ(state.access_token, "exchanged-access-token");
	EXPECT_EQ(state.refresh_token, "exchanged-refresh-token");
	EXPECT_EQ(interactive->calls, 1);
	EXPECT_EQ(manual->calls, 0);
	ASSERT_EQ(client->exchangedCodes.size(), 1u);
	EXPECT_EQ(client->exchangedCodes[0], "browser-code");
	EXPECT_EQ(client->lastRedirectUri, "http://localhost:8080/callback");
	EXPECT_EQ(storage->load()->refresh_token, "exchanged-refresh-token");
}

TEST_F(GoogleAuthManagerTest, UnavailableBrowserFallsBackToConsole)
{
	interactive->behaviour = []() -> std::optional<std::string> {
		throw std::runtime_error("ListenError(FakeAuthorizationCodeProvider)");
	};
	auto manager = makeManager();

	const auto state = manager->authorize(true);

	EXPECT_EQ(state.access_token, "exchanged-access-token");
	EXPECT_EQ(manual->calls, 1);
	ASSERT_EQ(client->exchangedCodes.size(), 1u);
	EXPECT_EQ(client->exchangedCodes[0], "pasted-code");
	EXPECT_EQ(client->lastRedirectUri, "http://localhost");
}

TEST_F(GoogleAuthManagerTest, NoLocalAuthUsesConsoleOnly)
{
	auto manager = makeManager({}, false);

	manager->authorize(true);

	EXPECT_EQ(interactive->calls, 0);
	EXPECT_EQ(manual->calls, 1);
}

TEST_F(GoogleAuthManagerTest, CancelledAuthorizationIsAnError)
{
	manual = std::make_shared<TestSupport::FakeAuthorizationCodeProvider>(std::nullopt);
	auto manager = makeManager({}, false);

	EXPECT_THROW(manager->authorize(true), Retry::AuthError);
	EXPECT_FALSE(storage->load().has_value());
}

TEST_F(GoogleAuthManagerTest, RejectedCodeIsAnAuthorizationError)
{
	client->exchangeSteps.push_back(throwInvalidGrant);
	auto manager = makeManager({}, false);

	try {
		manager->authorize(true);
		FAIL() << "authorize() must throw";
	} catch (const Retry::TransferError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::Authorization);
	}
}

TEST_F(GoogleAuthManagerTest, TransientRefreshFailureIsRetried)
{
	storage->save(storedState(-60));
	client->refreshSteps.push_back(throwTransient);
	auto manager = makeManager();

	EXPECT_EQ(manager->getAccessToken(), "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 2);
	EXPECT_EQ(sleeper.delays().size(), 1u);
}

TEST_F(GoogleAuthManagerTest, RefreshGivesUpAfterThreeAttempts)
{
	storage->save(storedState(-60));
	for (int i = 0; i < 5; i++) {
		client->refreshSteps.push_back(throwTransient);
	}
	auto manager = makeManager();

	EXPECT_THROW(manager->authorize(false), Retry::RetryExhaustedError);
	EXPECT_EQ(client->refreshCalls.load(), 3);
	EXPECT_EQ(sleeper.delays().size(), 2u);
}

TEST_F(GoogleAuthManagerTest, FailedRefreshIsReportedToEveryWaiter)
{
	storage->save(storedState(-60));
	client->refreshLatency = 50ms;
	constexpr int kThreads = 4;
	for (int i = 0; i < kThreads; i++) {
		client->refreshSteps.push_back(throwInvalidGrant);
	}
	GoogleAuth::GoogleAuthManagerOptions options;
	options.allowInteractive = false;
	auto manager = makeManager(options);

	std::vector<int> failures(kThreads, 0);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; i++) {
		threads.emplace_back([&, i] {
			try {
				manager->getAccessToken();
			} catch (const Retry::AuthInvalidError &) {
				failures[i] = 1;
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	for (int failed : failures) {
		EXPECT_EQ(failed, 1);
	}
}

TEST_F(GoogleAuthManagerTest, RejectedRefreshDuringTransferReauthorizes)
{
	storage->save(storedState(3600));
	client->refreshSteps.push_back(throwInvalidGrant);
	auto manager = makeManager();

	EXPECT_EQ(manager->refreshAfterRejection("stored-access-token"), "exchanged-access-token");

	EXPECT_EQ(interactive->calls, 1);
	EXPECT_EQ(manual->calls, 0);
	EXPECT_EQ(client->exchangedCodes, (std::vector<std::string>{"browser-code"}));
	ASSERT_TRUE(storage->load().has_value());
	EXPECT_EQ(storage->load()->refresh_token, "exchanged-refresh-token");
	EXPECT_EQ(manager->getAccessToken(), "exchanged-access-token");
}

TEST_F(GoogleAuthManagerTest, ExhaustedRefreshDuringTransferReauthorizes)
{
	storage->save(storedState(-60));
	for (int i = 0; i < 3; i++) {
		client->refreshSteps.push_back(throwTransient);
	}
	auto manager = makeManager({}, false);

	EXPECT_EQ(manager->getAccessToken(), "exchanged-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 3);
	EXPECT_EQ(manual->calls, 1);
}

TEST_F(GoogleAuthManagerTest, HeadlessRejectedRefreshDuringTransferFails)
{
	storage->save(storedState(3600));
	client->refreshSteps.push_back(throwInvalidGrant);
	GoogleAuth::GoogleAuthManagerOptions options;
	options.allowInteractive = false;
	auto manager = makeManager(options);

	EXPECT_THROW(manager->refreshAfterRejection("stored-access-token"), Retry::AuthInvalidError);
	EXPECT_EQ(interactive->calls, 0);
	EXPECT_EQ(manual->calls, 0);
	EXPECT_TRUE(storage->load().has_value());
}

TEST_F(GoogleAuthManagerTest, ConcurrentCallersShareOneReauthorization)
{
	storage->save(storedState(-60));
	client->refreshLatency = 50ms;
	client->refreshSteps.push_back(throwInvalidGrant);
	auto manager = makeManager();

	constexpr int kThreads = 4;
	std::vector<std::string> tokens(kThreads);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; i++) {
		threads.emplace_back([&, i] { tokens[i] = manager->getAccessToken(); });
	}
	for (auto &thread : threads) {
		thread.join();
	}

	for (const auto &token : tokens) {
		EXPECT_EQ(token, "exchanged-access-token");
	}
	EXPECT_EQ(client->refreshCalls.load(), 1);
	EXPECT_EQ(interactive->calls, 1);
	EXPECT_EQ(client->exchangedCodes.size(), 1u);
}

TEST_F(GoogleAuthManagerTest, ForceRefreshRefreshesUsableGrantOnce)
{
	storage->save(storedState(3600));
	GoogleAuth::GoogleAuthManagerOptions options;
	options.forceRefresh = true;
	auto manager = makeManager(options);

	EXPECT_EQ(manager->authorize(false).access_token, "refreshed-access-token");
	EXPECT_EQ(manager->authorize(false).access_token, "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);
}

TEST_F(GoogleAuthManagerTest, OldGrantIsRefreshedOnSchedule)
{
	storage->save(storedState(3600, 3 * 24 * 3600));
	GoogleAuth::GoogleAuthManagerOptions options;
	options.forcedRefreshInterval = 2 * 24h;
	auto manager = makeManager(options);

	EXPECT_EQ(manager->authorize(false).access_token, "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);

	EXPECT_EQ(manager->getAccessToken(), "refreshed-access-token");
	EXPECT_EQ(client->refreshCalls.load(), 1);
}

TEST_F(GoogleAuthManagerTest, RefreshWithoutGrantIsInvalid)
{
	auto manager = makeManager();
	EXPECT_THROW(manager->refresh(true), Retry::AuthInvalidError);
}
