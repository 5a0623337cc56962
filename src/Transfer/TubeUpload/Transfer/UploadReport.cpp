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

#include "UploadReport.hpp"

namespace TubeUpload::Transfer {

std::string_view uploadStatusName(UploadStatus status) noexcept
{
	switch (status) {
	case UploadStatus::Succeeded:
		return "Succeeded";
	case UploadStatus::AuthorizationFailed:
		return "AuthorizationFailed";
	case UploadStatus::RetryBudgetExhausted:
		return "RetryBudgetExhausted";
	case UploadStatus::ServerRejected:
		return "ServerRejected";
	case UploadStatus::LocalIOFailed:
		return "LocalIOFailed";
	}
	return "Unknown";
}

int exitCodeFor(UploadStatus status) noexcept
{
	switch (status) {
	case UploadStatus::Succeeded:
		return 0;
	case UploadStatus::AuthorizationFailed:
		return 2;
	case UploadStatus::RetryBudgetExhausted:
		return 3;
	case UploadStatus::ServerRejected:
		return 4;
	case UploadStatus::LocalIOFailed:
		return 5;
	}
	return 1;
}

UploadStatus uploadStatusFor(Retry::ErrorKind kind) noexcept
{
	switch (kind) {
	case Retry::ErrorKind::AuthExpired:
	case Retry::ErrorKind::AuthInvalid:
	case Retry::ErrorKind::Authorization:
		return UploadStatus::AuthorizationFailed;
	case Retry::ErrorKind::ClientRejected:
		return UploadStatus::ServerRejected;
	case Retry::ErrorKind::LocalIO:
		return UploadStatus::LocalIOFailed;
	case Retry::ErrorKind::TransientNetwork:
	case Retry::ErrorKind::RetryExhausted:
		return UploadStatus::RetryBudgetExhausted;
	}
	return UploadStatus::RetryBudgetExhausted;
}

} // namespace TubeUpload::Transfer
