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

#include <string>

#include "GoogleAuthResponse.hpp"

namespace TubeUpload::GoogleAuth {

/// The token endpoint as seen by GoogleAuthManager.
///
/// Implementations raise Retry::TransientNetworkError for network failures, 429 and 5xx,
/// Retry::AuthInvalidError for `invalid_grant`, and Retry::AuthError for any other rejection.
class IGoogleOAuth2Client {
public:
	virtual ~IGoogleOAuth2Client() = default;

	[[nodiscard]]
	virtual std::string getAuthorizationUrl(const std::string &redirectUri) const = 0;

	virtual GoogleAuthResponse exchangeCode(const std::string &code, const std::string &redirectUri) = 0;

	virtual GoogleAuthResponse refreshAccessToken(const std::string &refreshToken) = 0;
};

} // namespace TubeUpload::GoogleAuth
