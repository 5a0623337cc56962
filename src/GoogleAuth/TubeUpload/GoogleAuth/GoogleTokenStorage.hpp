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

#include <filesystem>
#include <memory>
#include <optional>

#include <TubeUpload/Logger/ILogger.hpp>

#include "GoogleTokenState.hpp"

namespace TubeUpload::GoogleAuth {

/**
 * Persists the grant as JSON at a fixed path.
 *
 * load() treats a missing or corrupt file as "not authorized yet" and raises LocalIOError only
 * when an existing file cannot be read. save() replaces the file atomically through a sibling
 * `.tmp` file readable by the owner only.
 */
class GoogleTokenStorage {
public:
	GoogleTokenStorage(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger);

	virtual ~GoogleTokenStorage() noexcept = default;

	GoogleTokenStorage(const GoogleTokenStorage &) = delete;
	GoogleTokenStorage &operator=(const GoogleTokenStorage &) = delete;
	GoogleTokenStorage(GoogleTokenStorage &&) = delete;
	GoogleTokenStorage &operator=(GoogleTokenStorage &&) = delete;

	virtual std::optional<GoogleTokenState> load();
	virtual void save(const GoogleTokenState &tokenState);
	virtual void clear();

	[[nodiscard]]
	const std::filesystem::path &path() const noexcept
	{
		return path_;
	}

private:
	const std::filesystem::path path_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace TubeUpload::GoogleAuth
