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

#include <chrono>

namespace TubeUpload::Retry {

struct RetryPolicy {
	/// Transient failures tolerated before giving up; the count restarts on confirmed progress.
	int maxRetries = 10;
	/// 401 responses answered with a token refresh, counted separately from maxRetries.
	int maxAuthRetries = 3;
	std::chrono::milliseconds baseDelay{1000};
	double multiplier = 2.0;
	std::chrono::milliseconds maxDelay{64000};
	bool jitter = true;

	/// Three attempts in total for a token refresh.
	static RetryPolicy tokenRefresh() noexcept
	{
		RetryPolicy policy;
		policy.maxRetries = 2;
		policy.maxAuthRetries = 0;
		return policy;
	}
};

} // namespace TubeUpload::Retry
