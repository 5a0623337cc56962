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

#include "GoogleOAuth2Client.hpp"

#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUpload/CurlHelper/CurlUrlHandle.hpp>
#include <TubeUpload/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUpload/CurlHelper/CurlWriteCallback.hpp>
#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::GoogleAuth {

GoogleOAuth2Client::GoogleOAuth2Client(GoogleOAuth2ClientCredentials clientCredentials, std::string scopes,
				       std::shared_ptr<const Logger::ILogger> logger, GoogleOAuth2ClientOptions options)
	: clientCredentials_(std::move(clientCredentials)),
	  scopes_(std::move(scopes)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleOAuth2Client)")),
	  options_(std::move(options))
{
}

GoogleOAuth2Client::~GoogleOAuth2Client() = default;

std::string GoogleOAuth2Client::getAuthorizationUrl(const std::string &redirectUri) const
{
	CurlHelper::CurlUrlSearchParams params(curl_.getRaw());
	params.append("client_id", clientCredentials_.client_id);
	params.append("redirect_uri", redirectUri);
	params.append("response_type", "code");
	params.append("scope", scopes_);
	params.append("access_type", "offline");
	params.append("prompt", "consent");

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(options_.authorizationEndpoint);
	urlHandle.appendQuery(params.toString());
	return urlHandle.toString();
}

GoogleAuthResponse GoogleOAuth2Client::exchangeCode(const std::string &code, const std::string &redirectUri)
{
	CurlHelper::CurlUrlSearchParams params(curl_.getRaw());
	params.append("client_id", clientCredentials_.client_id);
	params.append("client_secret", clientCredentials_.client_secret);
	params.append("code", code);
	params.append("grant_type", "authorization_code");
	params.append("redirect_uri", redirectUri);

	logger_->info("GoogleOAuth2CodeExchanging");
	auto response = postTokenRequest(params.toString(), options_.requestTimeout, "exchangeCode");
	logger_->info("GoogleOAuth2CodeExchanged");
	return response;
}

GoogleAuthResponse GoogleOAuth2Client::refreshAccessToken(const std::string &refreshToken)
{
	CurlHelper::CurlUrlSearchParams params(curl_.getRaw());
	params.append("client_id", clientCredentials_.client_id);
	params.append("client_secret", clientCredentials_.client_secret);
	params.append("refresh_token", refreshToken);
	params.append("grant_type", "refresh_token");

	logger_->info("GoogleOAuth2TokenRefreshing");
	auto response = postTokenRequest(params.toString(), options_.refreshTimeout, "refreshAccessToken");
	logger_->info("GoogleOAuth2TokenRefreshed");
	return response;
}

GoogleAuthResponse GoogleOAuth2Client::postTokenRequest(const std::string &postData, std::chrono::seconds timeout,
							const char *operation)
{
	CURL *curl = curl_.getRaw();
	curl_.reset();

	std::vector<char> readBuffer;
	curl_easy_setopt(curl, CURLOPT_URL, options_.tokenEndpoint.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlCharVectorWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connectTimeout.count()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	const CURLcode res = curl_easy_perform(curl);

	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"operation", operation}, {"error", curl_easy_strerror(res)}});
		throw Retry::TransientNetworkError(
			fmt::format("CurlPerformError({}):{}", operation, curl_easy_strerror(res)));
	}

	const long status = curl_.responseCode();
	const nlohmann::json j = nlohmann::json::parse(readBuffer.begin(), readBuffer.end(), nullptr, false);

	if (status >= 200 && status < 300 && !j.is_discarded() && !j.contains("error")) {
		try {
			return j.get<GoogleAuthResponse>();
		} catch (const nlohmann::json::exception &e) {
			throw Retry::AuthError(fmt::format("InvalidTokenResponseError({}):{}", operation, e.what()),
					       {status, 0, 0});
		}
	}

	if (Retry::classifyHttpStatus(status) == Retry::ErrorKind::TransientNetwork) {
		logger_->warn("TokenEndpointUnavailable", {{"operation", operation}, {"status", std::to_string(status)}});
		throw Retry::TransientNetworkError(fmt::format("TokenEndpointUnavailableError({}):{}", operation, status),
						   {status, 0, 0});
	}

	std::string error = "unknown_error";
	std::string description;
	if (!j.is_discarded() && j.is_object()) {
		if (auto it = j.find("error"); it != j.end() && it->is_string()) {
			error = it->get<std::string>();
		}
		if (auto it = j.find("error_description"); it != j.end() && it->is_string()) {
			description = it->get<std::string>();
		}
	}

	logger_->error("TokenEndpointRejected", {{"operation", operation},
						 {"status", std::to_string(status)},
						 {"error", error},
						 {"description", description}});

	if (error == "invalid_grant") {
		throw Retry::AuthInvalidError(fmt::format("InvalidGrantError({}):{}", operation, description),
					      {status, 0, 0});
	}
	throw Retry::AuthError(fmt::format("TokenRequestRejectedError({}):{}", operation, error), {status, 0, 0});
}

} // namespace TubeUpload::GoogleAuth
