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

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace TubeUpload::Retry {

enum class ErrorKind {
	TransientNetwork,
	AuthExpired,
	AuthInvalid,
	ClientRejected,
	LocalIO,
	Authorization,
	RetryExhausted,
};

[[nodiscard]]
std::string_view errorKindName(ErrorKind kind) noexcept;

/// Maps a non-success HTTP status to the failure class the retry logic acts on.
/// 401 is AuthExpired; 408, 429 and 5xx are TransientNetwork; any other status is ClientRejected.
[[nodiscard]]
ErrorKind classifyHttpStatus(long status) noexcept;

struct TransferErrorContext {
	std::optional<long> httpStatus;
	int attempts = 0;
	std::uint64_t offset = 0;
};

class TransferError : public std::runtime_error {
public:
	TransferError(ErrorKind kind, const std::string &message, TransferErrorContext context = {})
		: std::runtime_error(message),
		  kind_(kind),
		  context_(std::move(context))
	{
	}

	[[nodiscard]]
	ErrorKind kind() const noexcept
	{
		return kind_;
	}

	[[nodiscard]]
	const TransferErrorContext &context() const noexcept
	{
		return context_;
	}

	[[nodiscard]]
	std::optional<long> httpStatus() const noexcept
	{
		return context_.httpStatus;
	}

	[[nodiscard]]
	int attempts() const noexcept
	{
		return context_.attempts;
	}

	[[nodiscard]]
	std::uint64_t offset() const noexcept
	{
		return context_.offset;
	}

private:
	ErrorKind kind_;
	TransferErrorContext context_;
};

class TransientNetworkError : public TransferError {
public:
	explicit TransientNetworkError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::TransientNetwork, message, std::move(context))
	{
	}
};

class AuthExpiredError : public TransferError {
public:
	explicit AuthExpiredError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::AuthExpired, message, std::move(context))
	{
	}
};

class AuthInvalidError : public TransferError {
public:
	explicit AuthInvalidError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::AuthInvalid, message, std::move(context))
	{
	}
};

class ClientRejectedError : public TransferError {
public:
	explicit ClientRejectedError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::ClientRejected, message, std::move(context))
	{
	}
};

class LocalIOError : public TransferError {
public:
	explicit LocalIOError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::LocalIO, message, std::move(context))
	{
	}
};

class AuthError : public TransferError {
public:
	explicit AuthError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::Authorization, message, std::move(context))
	{
	}
};

class RetryExhaustedError : public TransferError {
public:
	explicit RetryExhaustedError(const std::string &message, TransferErrorContext context = {})
		: TransferError(ErrorKind::RetryExhausted, message, std::move(context))
	{
	}
};

} // namespace TubeUpload::Retry
