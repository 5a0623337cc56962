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

#include <sstream>

#include <curl/curl.h>

#include <TubeUpload/GoogleAuth/ConsoleAuthorizationCodeProvider.hpp>
#include <TubeUpload/Logger/NullLogger.hpp>
#include <TubeUpload/Retry/TransferErrors.hpp>

using namespace TubeUpload;
using GoogleAuth::ConsoleAuthorizationCodeProvider;

class ConsoleAuthorizationCodeProviderTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(ConsoleAuthorizationCodeProviderTest, RawCodeIsReturnedTrimmed)
{
	EXPECT_EQ(ConsoleAuthorizationCodeProvider::parseUserInput("  4/0AbCdEf  \n"), "4/0AbCdEf");
}

TEST_F(ConsoleAuthorizationCodeProviderTest, BlankInputCancels)
{
	EXPECT_FALSE(ConsoleAuthorizationCodeProvider::parseUserInput("").has_value());
	EXPECT_FALSE(ConsoleAuthorizationCodeProvider::parseUserInput("   \t").has_value());
}

TEST_F(ConsoleAuthorizationCodeProviderTest, CodeIsExtractedFromRedirectUrl)
{
	EXPECT_EQ(ConsoleAuthorizationCodeProvider::parseUserInput(
			  "http://localhost/?state=xyz&code=4%2F0AbC&scope=youtube"),
		  "4/0AbC");
}

TEST_F(ConsoleAuthorizationCodeProviderTest, CodeIsExtractedFromQueryString)
{
	EXPECT_EQ(ConsoleAuthorizationCodeProvider::parseUserInput("?code=abc123"), "abc123");
	EXPECT_EQ(ConsoleAuthorizationCodeProvider::parseUserInput("code=abc123&scope=x"), "abc123");
}

TEST_F(ConsoleAuthorizationCodeProviderTest, ErrorParameterIsDenial)
{
	EXPECT_THROW(ConsoleAuthorizationCodeProvider::parseUserInput("http://localhost/?error=access_denied"),
		     Retry::AuthError);
}

TEST_F(ConsoleAuthorizationCodeProviderTest, MalformedRedirectUrlIsAuthorizationFailure)
{
	EXPECT_THROW(ConsoleAuthorizationCodeProvider::parseUserInput("http://[bad?code=x"), Retry::AuthError);
}

TEST_F(ConsoleAuthorizationCodeProviderTest, ReceiveCodePromptsAndReadsOneLine)
{
	std::istringstream in("the-code\nignored\n");
	std::ostringstream out;
	ConsoleAuthorizationCodeProvider provider(in, out, Logger::NullLogger::instance());

	EXPECT_EQ(provider.redirectUri(), "http://localhost");
	EXPECT_EQ(provider.receiveCode("https://accounts.example/auth"), "the-code");
	EXPECT_NE(out.str().find("https://accounts.example/auth"), std::string::npos);
}

TEST_F(ConsoleAuthorizationCodeProviderTest, ClosedInputCancels)
{
	std::istringstream in;
	std::ostringstream out;
	ConsoleAuthorizationCodeProvider provider(in, out, Logger::NullLogger::instance());

	EXPECT_FALSE(provider.receiveCode("https://accounts.example/auth").has_value());
}
