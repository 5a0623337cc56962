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

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <TubeUpload/Logger/ILogger.hpp>

#include "IAuthorizationCodeProvider.hpp"

namespace TubeUpload::GoogleAuth {

/// Headless flow: prints the authorization URL and reads back either the bare code or the
/// whole redirect URL the browser ended up on.
class ConsoleAuthorizationCodeProvider : public IAuthorizationCodeProvider {
public:
	ConsoleAuthorizationCodeProvider(std::istream &in, std::ostream &out,
					 std::shared_ptr<const Logger::ILogger> logger);

	std::string redirectUri() override;

	std::optional<std::string> receiveCode(const std::string &authorizationUrl) override;

	/// Extracts the code from user input. Returns nullopt for empty input.
	/// Raises Retry::AuthError when the pasted redirect carries an `error` parameter.
	[[nodiscard]]
	static std::optional<std::string> parseUserInput(const std::string &input);

private:
	std::istream &in_;
	std::ostream &out_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace TubeUpload::GoogleAuth
