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

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include <TubeUpload/Logger/ILogger.hpp>

namespace TubeUpload::App {

struct UploaderConfig {
	std::filesystem::path clientSecretsFile = "client_secrets.json";
	std::filesystem::path oauth2StorageFile = "oauth2.json";
	std::optional<int> forceTokenRefreshDays;
	int maxRetries = 10;
	std::uint64_t chunkSize = 8 * 1024 * 1024;
	std::chrono::seconds refreshTimeout{60};
	int refreshMaxRetries = 2;

	/// Reads a JSON config file. A missing file yields the defaults; relative paths inside the
	/// file are resolved against the file's directory. Throws std::invalid_argument on bad content.
	static UploaderConfig load(const std::filesystem::path &path, const Logger::ILogger &logger);

	static UploaderConfig fromJson(const nlohmann::json &j, const std::filesystem::path &baseDirectory,
				       const Logger::ILogger &logger);
};

} // namespace TubeUpload::App
