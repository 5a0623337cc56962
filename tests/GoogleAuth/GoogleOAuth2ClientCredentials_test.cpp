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

#include <stdexcept>

#include <TubeUpload/GoogleAuth/GoogleOAuth2ClientCredentials.hpp>
#include <TubeUpload/TestSupport/TemporaryDirectory.hpp>

using namespace TubeUpload;

TEST(GoogleOAuth2ClientCredentialsTest, ReadsInstalledSection)
{
	TestSupport::TemporaryDirectory dir;
	const auto path = dir.writeFile("client_secrets.json", R"({
		"installed": {
			"client_id": "id.apps.googleusercontent.com",
			"client_secret": "secret",
			"redirect_uris": ["http://localhost"]
		}
	})");

	const auto credentials = GoogleAuth::loadClientSecretsFile(path);
	EXPECT_EQ(credentials.client_id, "id.apps.googleusercontent.com");
	EXPECT_EQ(credentials.client_secret, "secret");
}

TEST(GoogleOAuth2ClientCredentialsTest, ReadsWebSection)
{
	TestSupport::TemporaryDirectory dir;
	const auto path = dir.writeFile("client_secrets.json",
					R"({"web": {"client_id": "web-id", "client_secret": "web-secret"}})");

	EXPECT_EQ(GoogleAuth::loadClientSecretsFile(path).client_id, "web-id");
}

TEST(GoogleOAuth2ClientCredentialsTest, MissingFileIsNotFound)
{
	TestSupport::TemporaryDirectory dir;
	EXPECT_THROW(GoogleAuth::loadClientSecretsFile(dir.path() / "absent.json"), std::runtime_error);
}

TEST(GoogleOAuth2ClientCredentialsTest, MalformedFileIsInvalid)
{
	TestSupport::TemporaryDirectory dir;
	EXPECT_THROW(GoogleAuth::loadClientSecretsFile(dir.writeFile("a.json", "not json")), std::invalid_argument);
	EXPECT_THROW(GoogleAuth::loadClientSecretsFile(dir.writeFile("b.json", R"({"installed": {"client_id": "x"}})")),
		     std::invalid_argument);
	EXPECT_THROW(GoogleAuth::loadClientSecretsFile(
			     dir.writeFile("c.json", R"({"installed": {"client_id": "", "client_secret": "s"}})")),
		     std::invalid_argument);
}
