/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Transfer Library
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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::Transfer {

enum class UploadStatus {
	Succeeded,
	AuthorizationFailed,
	RetryBudgetExhausted,
	ServerRejected,
	LocalIOFailed,
};

[[nodiscard]]
std::string_view uploadStatusName(UploadStatus status) noexcept;

[[nodiscard]]
int exitCodeFor(UploadStatus status) noexcept;

[[nodiscard]]
UploadStatus uploadStatusFor(Retry::ErrorKind kind) noexcept;

struct UploadReport {
	UploadStatus status = UploadStatus::Succeeded;
	std::optional<std::string> videoId;
	std::string message;
	std::uint64_t bytesAcknowledged = 0;
	std::uint64_t totalSize = 0;
	int attempts = 0;
	std::optional<long> httpStatus;
	bool thumbnailSet = false;
	bool addedToPlaylist = false;

	[[nodiscard]]
	bool succeeded() const noexcept
	{
		return status == UploadStatus::Succeeded;
	}
};

} // namespace TubeUpload::Transfer
