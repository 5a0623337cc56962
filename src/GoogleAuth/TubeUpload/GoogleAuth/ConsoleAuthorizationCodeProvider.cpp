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

#include "ConsoleAuthorizationCodeProvider.hpp"

#include <stdexcept>
#include <string>

#include <TubeUpload/CurlHelper/CurlHandle.hpp>
#include <TubeUpload/CurlHelper/CurlUrlHandle.hpp>
#include <TubeUpload/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::GoogleAuth {

namespace {

std::string trim(const std::string &s)
{
	const auto first = s.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

} // anonymous namespace

ConsoleAuthorizationCodeProvider::ConsoleAuthorizationCodeProvider(std::istream &in, std::ostream &out,
								   std::shared_ptr<const Logger::ILogger> logger)
	: in_(in),
	  out_(out),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(ConsoleAuthorizationCodeProvider)"))
{
}

std::string ConsoleAuthorizationCodeProvider::redirectUri()
{
	return "http://localhost";
}

std::optional<std::string> ConsoleAuthorizationCodeProvider::receiveCode(const std::string &authorizationUrl)
{
	out_ << "Go to the following link in your browser:\n\n    " << authorizationUrl << "\n\n"
	     << "After approving access, paste the authorization code or the full URL of the page you were "
		"redirected to.\n"
	     << "Enter verification code: " << std::flush;

	std::string line;
	if (!std::getline(in_, line)) {
		logger_->warn("AuthorizationInputClosed");
		return std::nullopt;
	}

	auto code = parseUserInput(line);
	if (!code) {
		logger_->warn("AuthorizationCancelled");
	}
	return code;
}

std::optional<std::string> ConsoleAuthorizationCodeProvider::parseUserInput(const std::string &input)
{
	const std::string value = trim(input);
	if (value.empty()) {
		return std::nullopt;
	}

	const bool looksLikeUrl = value.find("://") != std::string::npos;
	const bool looksLikeQuery = value.find("code=") != std::string::npos || value.find("error=") != std::string::npos;
	if (!looksLikeUrl && !looksLikeQuery) {
		return value;
	}

	std::string query;
	if (looksLikeUrl) {
		CurlHelper::CurlUrlHandle url;
		try {
			url.setUrl(value);
		} catch (const std::invalid_argument &e) {
			throw Retry::AuthError(
				std::string("MalformedRedirectUrlError(ConsoleAuthorizationCodeProvider):") + e.what());
		}
		query = url.query().value_or("");
	} else {
		query = value.front() == '?' ? value.substr(1) : value;
	}

	CurlHelper::CurlHandle curl;
	CurlHelper::CurlUrlSearchParams params(curl.getRaw());
	params.parse(query);

	if (auto error = params.get("error")) {
		throw Retry::AuthError("AuthorizationDeniedError(ConsoleAuthorizationCodeProvider):" + *error);
	}

	auto code = params.get("code");
	if (!code || code->empty()) {
		return std::nullopt;
	}
	return code;
}

} // namespace TubeUpload::GoogleAuth
