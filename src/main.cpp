/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload tube-upload
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

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>

#include <QCoreApplication>

#include <TubeUpload/App/CommandLine.hpp>
#include <TubeUpload/App/UploaderConfig.hpp>
#include <TubeUpload/CurlHelper/CurlHandle.hpp>
#include <TubeUpload/GoogleAuth/ConsoleAuthorizationCodeProvider.hpp>
#include <TubeUpload/GoogleAuth/GoogleAuthManager.hpp>
#include <TubeUpload/GoogleAuth/GoogleOAuth2Client.hpp>
#include <TubeUpload/GoogleAuth/GoogleOAuth2ClientCredentials.hpp>
#include <TubeUpload/GoogleAuth/GoogleTokenStorage.hpp>
#include <TubeUpload/GoogleAuthQt/GoogleOAuth2CallbackServer.hpp>
#include <TubeUpload/Logger/PrintLogger.hpp>
#include <TubeUpload/Transfer/ChunkPlanner.hpp>
#include <TubeUpload/Transfer/YouTubeUploader.hpp>
#include <TubeUpload/YouTubeApi/YouTubeApiClient.hpp>

using namespace TubeUpload;

namespace {

struct CurlGlobalGuard {
	CurlGlobalGuard()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("InitError(CurlGlobalGuard)");
		}
	}
	~CurlGlobalGuard() noexcept { curl_global_cleanup(); }

	CurlGlobalGuard(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard(CurlGlobalGuard &&) = delete;
	CurlGlobalGuard &operator=(CurlGlobalGuard &&) = delete;
};

constexpr const char *kMissingClientSecretsMessage = R"(WARNING: Please configure OAuth 2.0

To make this program run you will need to populate the client secrets file
found at:

   {}

with information from the Google API Console
https://console.cloud.google.com/

For more information about the client secrets file format, please visit:
https://developers.google.com/api-client-library/python/guide/aaa_client_secrets
)";

int run(int argc, char *argv[])
{
	App::CommandLineOptions options;
	try {
		options = App::parseCommandLine(argc, argv);
	} catch (const std::invalid_argument &e) {
		std::cerr << e.what() << "\n\n" << App::usageText(argv[0]);
		return 1;
	}

	if (options.showHelp) {
		std::cout << App::usageText(argv[0]);
		return 0;
	}

	auto logger = std::make_shared<Logger::PrintLogger>(options.verbose ? Logger::LogLevel::Debug
									    : Logger::LogLevel::Info);

	const App::UploaderConfig config = App::UploaderConfig::load(options.configFile, *logger);

	GoogleAuth::GoogleOAuth2ClientCredentials credentials;
	try {
		credentials = GoogleAuth::loadClientSecretsFile(config.clientSecretsFile);
	} catch (const std::runtime_error &e) {
		logger->logException(e, "ClientSecretsLoadFailed");
		std::cerr << fmt::format(fmt::runtime(kMissingClientSecretsMessage),
					 std::filesystem::absolute(config.clientSecretsFile).string());
		return 1;
	}

	GoogleAuth::GoogleOAuth2ClientOptions clientOptions;
	clientOptions.refreshTimeout = config.refreshTimeout;
	auto oauth2Client = std::make_shared<GoogleAuth::GoogleOAuth2Client>(credentials, GoogleAuth::kYouTubeScopes,
									     logger, clientOptions);
	auto tokenStorage = std::make_shared<GoogleAuth::GoogleTokenStorage>(config.oauth2StorageFile, logger);

	std::shared_ptr<GoogleAuth::IAuthorizationCodeProvider> interactiveProvider;
	if (!options.noLocalAuth && !options.headless) {
		interactiveProvider = std::make_shared<GoogleAuthQt::GoogleOAuth2CallbackServer>(logger);
	}
	auto manualProvider = std::make_shared<GoogleAuth::ConsoleAuthorizationCodeProvider>(std::cin, std::cerr, logger);

	GoogleAuth::GoogleAuthManagerOptions authOptions;
	authOptions.refreshRetryPolicy.maxRetries = config.refreshMaxRetries;
	if (config.forceTokenRefreshDays) {
		authOptions.forcedRefreshInterval =
			std::chrono::duration_cast<std::chrono::seconds>(std::chrono::hours(24) * *config.forceTokenRefreshDays);
	}
	authOptions.forceRefresh = options.forceRefresh;
	authOptions.allowInteractive = !options.headless;

	auto authManager = std::make_shared<GoogleAuth::GoogleAuthManager>(oauth2Client, tokenStorage,
									   interactiveProvider, manualProvider,
									   logger, authOptions);

	auto apiClient = std::make_shared<YouTubeApi::YouTubeApiClient>(std::make_shared<CurlHelper::CurlHandle>(),
									logger);

	Transfer::YouTubeUploaderOptions uploaderOptions;
	uploaderOptions.allowInteractive = !options.headless;
	uploaderOptions.authorizeOnly = options.noUpload;
	uploaderOptions.session.chunkSize = Transfer::ChunkPlanner::normalizeChunkSize(config.chunkSize);
	uploaderOptions.session.retryPolicy.maxRetries = config.maxRetries;

	Transfer::YouTubeUploader uploader(authManager, apiClient, apiClient, logger, uploaderOptions);

	const Transfer::UploadReport report = uploader.upload(options.videoFile, options.metadata);

	if (report.succeeded()) {
		if (report.videoId) {
			std::cout << fmt::format("Video id '{}' was successfully uploaded.\n", *report.videoId);
		} else {
			std::cout << "Authorization succeeded.\n";
		}
	} else {
		std::cerr << fmt::format("Upload failed ({}): {}\n", Transfer::uploadStatusName(report.status),
					 report.message);
	}

	return Transfer::exitCodeFor(report.status);
}

} // anonymous namespace

int main(int argc, char *argv[])
{
	try {
		CurlGlobalGuard curlGlobalGuard;
		QCoreApplication app(argc, argv);
		return run(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << e.what() << '\n';
		return 1;
	}
}
