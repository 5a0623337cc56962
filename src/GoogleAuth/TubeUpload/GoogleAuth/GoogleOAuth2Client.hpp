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
#include <memory>
#include <string>

#include <TubeUpload/CurlHelper/CurlHandle.hpp>
#include <TubeUpload/Logger/ILogger.hpp>

#include "GoogleOAuth2ClientCredentials.hpp"
#include "IGoogleOAuth2Client.hpp"

namespace TubeUpload::GoogleAuth {

inline constexpr const char *kYouTubeScopes =
	"https://www.googleapis.com/auth/youtube.upload https://www.googleapis.com/auth/youtube";

struct GoogleOAuth2ClientOptions {
	std::string authorizationEndpoint = "https://accounts.google.com/o/oauth2/v2/auth";
	std::string tokenEndpoint = "https://oauth2.googleapis.com/token";
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds requestTimeout{60};
	std::chrono::seconds refreshTimeout{60};
};

class GoogleOAuth2Client : public IGoogleOAuth2Client {
public:
	GoogleOAuth2Client(GoogleOAuth2ClientCredentials clientCredentials, std::string scopes,
			   std::shared_ptr<const Logger::ILogger> logger, GoogleOAuth2ClientOptions options = {});

	~GoogleOAuth2Client() override;

	GoogleOAuth2Client(const GoogleOAuth2Client &) = delete;
	GoogleOAuth2Client &operator=(const GoogleOAuth2Client &) = delete;
	GoogleOAuth2Client(GoogleOAuth2Client &&) = delete;
	GoogleOAuth2Client &operator=(GoogleOAuth2Client &&) = delete;

	[[nodiscard]]
	std::string getAuthorizationUrl(const std::string &redirectUri) const override;

	GoogleAuthResponse exchangeCode(const std::string &code, const std::string &redirectUri) override;

	GoogleAuthResponse refreshAccessToken(const std::string &refreshToken) override;

private:
	GoogleAuthResponse postTokenRequest(const std::string &postData, std::chrono::seconds timeout,
					    const char *operation);

	CurlHelper::CurlHandle curl_;
	const GoogleOAuth2ClientCredentials clientCredentials_;
	const std::string scopes_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const GoogleOAuth2ClientOptions options_;
};

} // namespace TubeUpload::GoogleAuth
