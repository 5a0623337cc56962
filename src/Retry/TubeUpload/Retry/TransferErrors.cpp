/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Retry Library
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

#include "TransferErrors.hpp"

namespace TubeUpload::Retry {

std::string_view errorKindName(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::TransientNetwork:
		return "TransientNetwork";
	case ErrorKind::AuthExpired:
		return "AuthExpired";
	case ErrorKind::AuthInvalid:
		return "AuthInvalid";
	case ErrorKind::ClientRejected:
		return "ClientRejected";
	case ErrorKind::LocalIO:
		return "LocalIO";
	case ErrorKind::Authorization:
		return "Authorization";
	case ErrorKind::RetryExhausted:
		return "RetryExhausted";
	}
	return "Unknown";
}

ErrorKind classifyHttpStatus(long status) noexcept
{
	if (status == 401) {
		return ErrorKind::AuthExpired;
	}
	if (status == 408 || status == 429 || (status >= 500 && status < 600)) {
		return ErrorKind::TransientNetwork;
	}
	return ErrorKind::ClientRejected;
}

} // namespace TubeUpload::Retry
