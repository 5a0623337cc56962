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

#include "GoogleAuthManager.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::GoogleAuth {

GoogleAuthManager::GoogleAuthManager(std::shared_ptr<IGoogleOAuth2Client> client,
				     std::shared_ptr<GoogleTokenStorage> storage,
				     std::shared_ptr<IAuthorizationCodeProvider> interactiveProvider,
				     std::shared_ptr<IAuthorizationCodeProvider> manualProvider,
				     std::shared_ptr<const Logger::ILogger> logger, GoogleAuthManagerOptions options,
				     Retry::Sleeper sleeper, Retry::RandomSource random)
	: client_(client ? std::move(client) : throw std::invalid_argument("ClientIsNullError(GoogleAuthManager)")),
	  storage_(storage ? std::move(storage) : throw std::invalid_argument("StorageIsNullError(GoogleAuthManager)")),
	  interactiveProvider_(std::move(interactiveProvider)),
	  manualProvider_(manualProvider ? std::move(manualProvider)
					 : throw std::invalid_argument("ManualProviderIsNullError(GoogleAuthManager)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleAuthManager)")),
	  options_(std::move(options)),
	  sleeper_(sleeper ? std::move(sleeper) : Retry::makeThreadSleeper()),
	  random_(std::move(random)),
	  forceRefreshPending_(options_.forceRefresh)
{
}

GoogleAuthManager::~GoogleAuthManager() = default;

GoogleTokenState GoogleAuthManager::authorize(bool allowInteractive)
{
	{
		std::unique_lock<std::mutex> lock(mutex_);
		ensureLoadedLocked();

		if (state_ && state_->isAuthorized()) {
			const bool forced = forceRefreshPending_ || isRefreshDueLocked(std::chrono::system_clock::now());
			if (!forced && state_->isUsable()) {
				logger_->info("GoogleAuthorizationReused");
				return *state_;
			}

			try {
				return singleFlightRefresh(lock, forced, std::nullopt);
			} catch (const Retry::AuthInvalidError &e) {
				if (!allowInteractive) {
					throw;
				}
				logger_->warn("RefreshTokenRejected", {{"exception", e.what()}});
			} catch (const Retry::RetryExhaustedError &e) {
				if (!allowInteractive) {
					throw;
				}
				logger_->warn("RefreshRetryExhausted", {{"exception", e.what()}});
			}

			state_.reset();
			lock.unlock();
			storage_->clear();
		} else if (state_) {
			if (state_->isUsable()) {
				logger_->warn("GoogleAuthorizationWithoutRefreshToken");
				return *state_;
			}
		}
	}

	return runAuthorizationCodeFlow(allowInteractive);
}

GoogleTokenState GoogleAuthManager::refresh(bool force)
{
	std::unique_lock<std::mutex> lock(mutex_);
	ensureLoadedLocked();
	return singleFlightRefresh(lock, force, std::nullopt);
}

std::string GoogleAuthManager::getAccessToken()
{
	std::unique_lock<std::mutex> lock(mutex_);
	ensureLoadedLocked();

	if (state_ && state_->isUsable() && !isRefreshDueLocked(std::chrono::system_clock::now())) {
		return state_->access_token;
	}
	return refreshOrReauthorize(lock, std::nullopt);
}

std::string GoogleAuthManager::refreshAfterRejection(std::string_view rejectedToken)
{
	std::unique_lock<std::mutex> lock(mutex_);
	ensureLoadedLocked();
	logger_->warn("AccessTokenRejected");
	return refreshOrReauthorize(lock, std::string(rejectedToken));
}

std::string GoogleAuthManager::refreshOrReauthorize(std::unique_lock<std::mutex> &lock,
						    std::optional<std::string> rejectedToken)
{
	const std::uint64_t reauthorizationsSeen = reauthorizationGeneration_;
	try {
		return singleFlightRefresh(lock, false, std::move(rejectedToken)).access_token;
	} catch (const Retry::AuthInvalidError &e) {
		if (!options_.allowInteractive) {
			throw;
		}
		logger_->warn("RefreshTokenRejected", {{"exception", e.what()}});
	} catch (const Retry::RetryExhaustedError &e) {
		if (!options_.allowInteractive) {
			throw;
		}
		logger_->warn("RefreshRetryExhausted", {{"exception", e.what()}});
	}

	if (!lock.owns_lock()) {
		lock.lock();
	}
	return reauthorizeLocked(lock, reauthorizationsSeen).access_token;
}

GoogleTokenState GoogleAuthManager::reauthorizeLocked(std::unique_lock<std::mutex> &lock,
						      std::uint64_t reauthorizationsSeen)
{
	if (reauthorizationInFlight_ || reauthorizationGeneration_ != reauthorizationsSeen) {
		logger_->debug("ReauthorizationJoined");
		refreshed_.wait(lock, [this] { return !reauthorizationInFlight_; });
		if (!state_ || !state_->isUsable()) {
			throw Retry::AuthError("ReauthorizationFailedError(GoogleAuthManager)");
		}
		return *state_;
	}

	reauthorizationInFlight_ = true;
	state_.reset();
	lock.unlock();

	try {
		storage_->clear();
		GoogleTokenState next = runAuthorizationCodeFlow(true);

		lock.lock();
		reauthorizationInFlight_ = false;
		reauthorizationGeneration_++;
		refreshed_.notify_all();
		return next;
	} catch (...) {
		if (!lock.owns_lock()) {
			lock.lock();
		}
		reauthorizationInFlight_ = false;
		reauthorizationGeneration_++;
		refreshed_.notify_all();
		throw;
	}
}

void GoogleAuthManager::ensureLoadedLocked()
{
	if (!loaded_) {
		state_ = storage_->load();
		loaded_ = true;
	}
}

bool GoogleAuthManager::isRefreshDueLocked(std::chrono::system_clock::time_point now) const
{
	if (!state_ || !options_.forcedRefreshInterval.has_value()) {
		return false;
	}
	return state_->isOlderThan(*options_.forcedRefreshInterval, now);
}

GoogleTokenState GoogleAuthManager::singleFlightRefresh(std::unique_lock<std::mutex> &lock, bool force,
							std::optional<std::string> rejectedToken)
{
	if (refreshInFlight_) {
		const std::uint64_t observed = refreshGeneration_;
		logger_->debug("TokenRefreshJoined");
		refreshed_.wait(lock, [this, observed] { return refreshGeneration_ != observed; });
		if (lastRefreshError_) {
			std::rethrow_exception(lastRefreshError_);
		}
		return *state_;
	}

	if (!state_ || !state_->isAuthorized()) {
		throw Retry::AuthInvalidError("NoRefreshTokenError(GoogleAuthManager)");
	}

	const bool rejected = rejectedToken.has_value() && *rejectedToken == state_->access_token;
	const bool needed = force || rejected || !state_->isUsable() ||
			    isRefreshDueLocked(std::chrono::system_clock::now());
	if (!needed) {
		return *state_;
	}

	refreshInFlight_ = true;
	const GoogleTokenState current = *state_;
	lock.unlock();

	try {
		const GoogleAuthResponse response = refreshWithRetry(current.refresh_token);
		GoogleTokenState next = current.withUpdatedAuthResponse(response);
		storage_->save(next);

		lock.lock();
		state_ = next;
		forceRefreshPending_ = false;
		refreshInFlight_ = false;
		lastRefreshError_ = nullptr;
		refreshGeneration_++;
		refreshed_.notify_all();

		logger_->info("TokenRefreshCompleted", {{"expires_at", std::to_string(next.expires_at.value_or(0))}});
		return next;
	} catch (...) {
		if (!lock.owns_lock()) {
			lock.lock();
		}
		refreshInFlight_ = false;
		lastRefreshError_ = std::current_exception();
		refreshGeneration_++;
		refreshed_.notify_all();
		throw;
	}
}

GoogleAuthResponse GoogleAuthManager::refreshWithRetry(const std::string &refreshToken)
{
	Retry::RetryController controller(Retry::OperationKind::TokenRefresh, options_.refreshRetryPolicy, logger_,
					  random_);

	for (;;) {
		try {
			return client_->refreshAccessToken(refreshToken);
		} catch (const Retry::TransientNetworkError &e) {
			const Retry::RetryDecision decision = controller.onFailure(Retry::ErrorKind::TransientNetwork);
			if (!decision.shouldRetry) {
				throw Retry::RetryExhaustedError(
					fmt::format("RefreshRetryExhaustedError(GoogleAuthManager):{}", e.what()),
					{e.httpStatus(), controller.attempts(), 0});
			}
			sleeper_(decision.delay);
		}
	}
}

GoogleTokenState GoogleAuthManager::runAuthorizationCodeFlow(bool allowInteractive)
{
	std::optional<std::string> code;
	std::string redirectUri;
	bool received = false;

	if (allowInteractive && interactiveProvider_) {
		try {
			redirectUri = interactiveProvider_->redirectUri();
			code = interactiveProvider_->receiveCode(client_->getAuthorizationUrl(redirectUri));
			received = true;
		} catch (const Retry::TransferError &) {
			throw;
		} catch (const std::exception &e) {
			logger_->warn("InteractiveAuthorizationUnavailable", {{"exception", e.what()}});
		}
	}

	if (!received) {
		redirectUri = manualProvider_->redirectUri();
		code = manualProvider_->receiveCode(client_->getAuthorizationUrl(redirectUri));
	}

	if (!code || code->empty()) {
		throw Retry::AuthError("AuthorizationCancelledError(GoogleAuthManager)");
	}

	GoogleAuthResponse response;
	try {
		response = client_->exchangeCode(*code, redirectUri);
	} catch (const Retry::AuthInvalidError &e) {
		throw Retry::AuthError(fmt::format("AuthorizationCodeRejectedError(GoogleAuthManager):{}", e.what()),
				       e.context());
	} catch (const Retry::TransientNetworkError &e) {
		throw Retry::AuthError(fmt::format("AuthorizationCodeExchangeError(GoogleAuthManager):{}", e.what()),
				       e.context());
	}

	GoogleTokenState next = GoogleTokenState{}.withUpdatedAuthResponse(response);
	if (!next.isAuthorized()) {
		logger_->warn("AuthorizationWithoutRefreshToken");
	}
	storage_->save(next);

	std::lock_guard<std::mutex> lock(mutex_);
	state_ = next;
	loaded_ = true;
	forceRefreshPending_ = false;
	logger_->info("GoogleAuthorizationCompleted");
	return next;
}

} // namespace TubeUpload::GoogleAuth
