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

#include "GoogleTokenStorage.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace fs = std::filesystem;

namespace TubeUpload::GoogleAuth {

GoogleTokenStorage::GoogleTokenStorage(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger)
	: path_(path.empty() ? throw std::invalid_argument("PathIsEmptyError(GoogleTokenStorage)") : std::move(path)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleTokenStorage)"))
{
}

std::optional<GoogleTokenState> GoogleTokenStorage::load()
{
	std::error_code ec;
	if (!fs::exists(path_, ec)) {
		if (ec) {
			throw Retry::LocalIOError("StatError(GoogleTokenStorage::load):" + ec.message());
		}
		logger_->info("TokenStorageNotFound", {{"path", path_.string()}});
		return std::nullopt;
	}

	std::ifstream file(path_);
	if (!file.is_open()) {
		throw Retry::LocalIOError("OpenError(GoogleTokenStorage::load):" + path_.string());
	}

	const nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
	if (file.bad()) {
		throw Retry::LocalIOError("ReadError(GoogleTokenStorage::load):" + path_.string());
	}

	if (j.is_discarded()) {
		logger_->warn("TokenStorageCorrupt", {{"path", path_.string()}, {"exception", "ParseError"}});
	} else {
		try {
			auto state = j.get<GoogleTokenState>();
			logger_->info("TokenStorageLoaded", {{"path", path_.string()}});
			return state;
		} catch (const nlohmann::json::exception &e) {
			logger_->warn("TokenStorageCorrupt", {{"path", path_.string()}, {"exception", e.what()}});
		}
	}

	file.close();
	if (!fs::remove(path_, ec) && ec) {
		logger_->warn("TokenStorageDiscardFailed", {{"path", path_.string()}, {"error", ec.message()}});
	}
	return std::nullopt;
}

void GoogleTokenStorage::save(const GoogleTokenState &tokenState)
{
	std::error_code ec;
	if (auto parentDirectory = path_.parent_path(); !parentDirectory.empty()) {
		fs::create_directories(parentDirectory, ec);
		if (ec) {
			throw Retry::LocalIOError("CreateDirectoryError(GoogleTokenStorage::save):" + ec.message());
		}
	}

	fs::path tmpPath = path_;
	tmpPath += ".tmp";

	{
		std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
		if (!file.is_open()) {
			throw Retry::LocalIOError("OpenError(GoogleTokenStorage::save):" + tmpPath.string());
		}

		fs::permissions(tmpPath, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
		if (ec) {
			throw Retry::LocalIOError("PermissionError(GoogleTokenStorage::save):" + ec.message());
		}

		const nlohmann::json j = tokenState;
		file << j.dump(2);
		file.flush();
		if (!file) {
			throw Retry::LocalIOError("WriteError(GoogleTokenStorage::save):" + tmpPath.string());
		}
	}

	fs::rename(tmpPath, path_, ec);
	if (ec) {
		std::error_code removeEc;
		fs::remove(tmpPath, removeEc);
		throw Retry::LocalIOError("RenameError(GoogleTokenStorage::save):" + ec.message());
	}

	logger_->debug("TokenStorageSaved", {{"path", path_.string()}});
}

void GoogleTokenStorage::clear()
{
	std::error_code ec;
	fs::remove(path_, ec);
	if (ec) {
		throw Retry::LocalIOError("RemoveError(GoogleTokenStorage::clear):" + ec.message());
	}
	logger_->info("TokenStorageCleared", {{"path", path_.string()}});
}

} // namespace TubeUpload::GoogleAuth
