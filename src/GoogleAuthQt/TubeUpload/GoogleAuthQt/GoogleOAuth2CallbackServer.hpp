/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload GoogleAuthQt Library
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
#include <optional>
#include <string>

#include <QByteArray>
#include <QTcpServer>

#include <TubeUpload/GoogleAuth/IAuthorizationCodeProvider.hpp>
#include <TubeUpload/Logger/ILogger.hpp>

namespace TubeUpload::GoogleAuthQt {

struct GoogleOAuth2CallbackServerOptions {
	std::chrono::seconds timeout{300};
	std::string browserCommand = "xdg-open";
};

struct GoogleOAuth2CallbackRequest {
	std::optional<std::string> code;
	std::optional<std::string> error;
};

/**
 * Interactive flow: listens on an ephemeral localhost port, opens the authorization URL in the
 * desktop browser and runs a local event loop until the browser is redirected back.
 * A QCoreApplication must exist on the calling thread.
 */
class GoogleOAuth2CallbackServer : public GoogleAuth::IAuthorizationCodeProvider {
public:
	GoogleOAuth2CallbackServer(std::shared_ptr<const Logger::ILogger> logger,
				   GoogleOAuth2CallbackServerOptions options = {});

	~GoogleOAuth2CallbackServer() noexcept override;

	GoogleOAuth2CallbackServer(const GoogleOAuth2CallbackServer &) = delete;
	GoogleOAuth2CallbackServer &operator=(const GoogleOAuth2CallbackServer &) = delete;
	GoogleOAuth2CallbackServer(GoogleOAuth2CallbackServer &&) = delete;
	GoogleOAuth2CallbackServer &operator=(GoogleOAuth2CallbackServer &&) = delete;

	std::string redirectUri() override;

	std::optional<std::string> receiveCode(const std::string &authorizationUrl) override;

	/// Parses the request head of a browser redirect. nullopt when the head is incomplete or not a GET.
	[[nodiscard]]
	static std::optional<GoogleOAuth2CallbackRequest> parseRequest(const QByteArray &data);

private:
	void listen();

	const std::shared_ptr<const Logger::ILogger> logger_;
	const GoogleOAuth2CallbackServerOptions options_;
	std::unique_ptr<QTcpServer> server_;
};

} // namespace TubeUpload::GoogleAuthQt
