/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload GoogleAuth Library
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
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <TubeUpload/Logger/ILogger.hpp>
#include <TubeUpload/Retry/RetryController.hpp>
#include <TubeUpload/Retry/RetryPolicy.hpp>

#include "GoogleTokenState.hpp"
#include "GoogleTokenStorage.hpp"
#include "IAccessTokenSource.hpp"
#include "IAuthorizationCodeProvider.hpp"
#include "IGoogleOAuth2Client.hpp"

namespace TubeUpload::GoogleAuth {

struct GoogleAuthManagerOptions {
	Retry::RetryPolicy refreshRetryPolicy = Retry::RetryPolicy::tokenRefresh();
	/// Refresh whenever the grant was last refreshed this long ago, regardless of expiry.
	std::optional<std::chrono::seconds> forcedRefreshInterval;
	/// Refresh once on the next authorize() even if the token is still usable.
	bool forceRefresh = false;
	/// Lets getAccessToken() and refreshAfterRejection() run the authorization-code flow when the
	/// refresh token is rejected or the refresh budget runs out.
	bool allowInteractive = true;
};

/**
 * Owns the grant for the lifetime of the process.
 *
 * All token endpoint traffic for refreshes is single-flight: while one thread refreshes, other
 * callers block on the condition variable and then share its result or its exception. The grant
 * is written to storage before it becomes visible to other callers.
 *
 * When a refresh requested through IAccessTokenSource fails terminally and interactive mode is
 * allowed, the stored grant is discarded and the authorization-code flow runs once, so callers
 * holding an open upload session get a fresh token instead of an error.
 */
class GoogleAuthManager : public IAccessTokenSource {
public:
	/// `interactiveProvider` may be null, in which case only `manualProvider` is used.
	GoogleAuthManager(std::shared_ptr<IGoogleOAuth2Client> client, std::shared_ptr<GoogleTokenStorage> storage,
			  std::shared_ptr<IAuthorizationCodeProvider> interactiveProvider,
			  std::shared_ptr<IAuthorizationCodeProvider> manualProvider,
			  std::shared_ptr<const Logger::ILogger> logger, GoogleAuthManagerOptions options = {},
			  Retry::Sleeper sleeper = {}, Retry::RandomSource random = {});

	~GoogleAuthManager() override;

	GoogleAuthManager(const GoogleAuthManager &) = delete;
	GoogleAuthManager &operator=(const GoogleAuthManager &) = delete;
	GoogleAuthManager(GoogleAuthManager &&) = delete;
	GoogleAuthManager &operator=(GoogleAuthManager &&) = delete;

	/// Returns a usable grant, refreshing or running the authorization-code flow as needed.
	GoogleTokenState authorize(bool allowInteractive);

	/// Exchanges the refresh token. Without `force` a usable grant is returned unchanged.
	GoogleTokenState refresh(bool force);

	std::string getAccessToken() override;

	std::string refreshAfterRejection(std::string_view rejectedToken) override;

private:
	void ensureLoadedLocked();

	[[nodiscard]]
	bool isRefreshDueLocked(std::chrono::system_clock::time_point now) const;

	GoogleTokenState singleFlightRefresh(std::unique_lock<std::mutex> &lock, bool force,
					     std::optional<std::string> rejectedToken);

	GoogleAuthResponse refreshWithRetry(const std::string &refreshToken);

	std::string refreshOrReauthorize(std::unique_lock<std::mutex> &lock, std::optional<std::string> rejectedToken);

	/// Runs the authorization-code flow unless another caller already did so after
	/// `reauthorizationsSeen`, in which case that caller's result is shared.
	GoogleTokenState reauthorizeLocked(std::unique_lock<std::mutex> &lock, std::uint64_t reauthorizationsSeen);

	GoogleTokenState runAuthorizationCodeFlow(bool allowInteractive);

	const std::shared_ptr<IGoogleOAuth2Client> client_;
	const std::shared_ptr<GoogleTokenStorage> storage_;
	const std::shared_ptr<IAuthorizationCodeProvider> interactiveProvider_;
	const std::shared_ptr<IAuthorizationCodeProvider> manualProvider_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const GoogleAuthManagerOptions options_;
	const Retry::Sleeper sleeper_;
	const Retry::RandomSource random_;

	mutable std::mutex mutex_;
	std::condition_variable refreshed_;
	bool loaded_ = false;
	bool forceRefreshPending_;
	std::optional<GoogleTokenState> state_;

	bool refreshInFlight_ = false;
	std::uint64_t refreshGeneration_ = 0;
	std::exception_ptr lastRefreshError_;

	bool reauthorizationInFlight_ = false;
	std::uint64_t reauthorizationGeneration_ = 0;
};

} // namespace TubeUpload::GoogleAuth
