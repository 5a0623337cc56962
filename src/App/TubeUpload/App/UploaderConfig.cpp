/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload App
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

#include "UploaderConfig.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace TubeUpload::App {

namespace {

std::filesystem::path resolvePath(const std::filesystem::path &baseDirectory, const std::string &value)
{
	std::filesystem::path p(value);
	if (p.is_relative() && !baseDirectory.empty()) {
		return baseDirectory / p;
	}
	return p;
}

template<typename T> T getChecked(const nlohmann::json &j, const char *key)
{
	try {
		return j.at(key).get<T>();
	} catch (const nlohmann::json::exception &e) {
		throw std::invalid_argument(std::string("ConfigValueError(UploaderConfig):") + key + ":" + e.what());
	}
}

} // anonymous namespace

UploaderConfig UploaderConfig::load(const std::filesystem::path &path, const Logger::ILogger &logger)
{
	std::ifstream file(path);
	if (!file.is_open()) {
		logger.info("ConfigFileNotFound", {{"path", path.string()}});
		return fromJson(nlohmann::json::object(), path.parent_path(), logger);
	}

	const nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw std::invalid_argument("ConfigParseError(UploaderConfig):" + path.string());
	}

	logger.info("ConfigFileLoaded", {{"path", path.string()}});
	return fromJson(j, path.parent_path(), logger);
}

UploaderConfig UploaderConfig::fromJson(const nlohmann::json &j, const std::filesystem::path &baseDirectory,
					const Logger::ILogger &logger)
{
	UploaderConfig config;
	config.clientSecretsFile = resolvePath(baseDirectory, config.clientSecretsFile.string());
	config.oauth2StorageFile = resolvePath(baseDirectory, config.oauth2StorageFile.string());

	if (j.contains("client_secrets_file")) {
		config.clientSecretsFile = resolvePath(baseDirectory, getChecked<std::string>(j, "client_secrets_file"));
		logger.info("ConfigLoaded", {{"client_secrets_file", config.clientSecretsFile.string()}});
	}

	if (j.contains("oauth2_storage_file")) {
		config.oauth2StorageFile = resolvePath(baseDirectory, getChecked<std::string>(j, "oauth2_storage_file"));
		logger.info("ConfigLoaded", {{"oauth2_storage_file", config.oauth2StorageFile.string()}});
	}

	if (j.contains("force_token_refresh_days") && !j.at("force_token_refresh_days").is_null()) {
		const int days = getChecked<int>(j, "force_token_refresh_days");
		if (days < 0) {
			throw std::invalid_argument("NegativeForceTokenRefreshDaysError(UploaderConfig)");
		}
		config.forceTokenRefreshDays = days;
		logger.info("ConfigLoaded", {{"force_token_refresh_days", std::to_string(days)}});
	}

	if (j.contains("max_retries")) {
		config.maxRetries = getChecked<int>(j, "max_retries");
		if (config.maxRetries < 0) {
			throw std::invalid_argument("NegativeMaxRetriesError(UploaderConfig)");
		}
		logger.info("ConfigLoaded", {{"max_retries", std::to_string(config.maxRetries)}});
	}

	if (j.contains("chunk_size")) {
		config.chunkSize = getChecked<std::uint64_t>(j, "chunk_size");
		logger.info("ConfigLoaded", {{"chunk_size", std::to_string(config.chunkSize)}});
	}

	if (j.contains("refresh_timeout_seconds")) {
		const int seconds = getChecked<int>(j, "refresh_timeout_seconds");
		if (seconds <= 0) {
			throw std::invalid_argument("NonPositiveRefreshTimeoutError(UploaderConfig)");
		}
		config.refreshTimeout = std::chrono::seconds(seconds);
		logger.info("ConfigLoaded", {{"refresh_timeout_seconds", std::to_string(seconds)}});
	}

	if (j.contains("refresh_max_retries")) {
		config.refreshMaxRetries = getChecked<int>(j, "refresh_max_retries");
		if (config.refreshMaxRetries < 0) {
			throw std::invalid_argument("NegativeRefreshMaxRetriesError(UploaderConfig)");
		}
		logger.info("ConfigLoaded", {{"refresh_max_retries", std::to_string(config.refreshMaxRetries)}});
	}

	return config;
}

} // namespace TubeUpload::App
