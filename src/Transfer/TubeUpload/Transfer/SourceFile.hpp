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
#include <filesystem>
#include <fstream>
#include <span>
#include <string>

namespace TubeUpload::Transfer {

/// Read-only, seekable view of the video being uploaded. The file stays open for the
/// lifetime of the object so that any range can be re-read on retry.
class SourceFile {
public:
	explicit SourceFile(std::filesystem::path path);

	~SourceFile() noexcept = default;

	SourceFile(const SourceFile &) = delete;
	SourceFile &operator=(const SourceFile &) = delete;
	SourceFile(SourceFile &&) = delete;
	SourceFile &operator=(SourceFile &&) = delete;

	[[nodiscard]]
	std::uint64_t size() const noexcept
	{
		return size_;
	}

	[[nodiscard]]
	const std::filesystem::path &path() const noexcept
	{
		return path_;
	}

	/// Fills `out` with the bytes at [offset, offset + out.size()). Raises LocalIOError on a short read.
	void readRange(std::uint64_t offset, std::span<char> out);

	/// MIME type announced to the server, derived from the file extension.
	[[nodiscard]]
	std::string contentType() const;

private:
	const std::filesystem::path path_;
	std::ifstream stream_;
	std::uint64_t size_ = 0;
};

} // namespace TubeUpload::Transfer
