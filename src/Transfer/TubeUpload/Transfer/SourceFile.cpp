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

#include "SourceFile.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::Transfer {

SourceFile::SourceFile(std::filesystem::path path) : path_(std::move(path))
{
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path_, ec)) {
		throw Retry::LocalIOError(fmt::format("NotRegularFileError(SourceFile):{}", path_.string()));
	}

	size_ = std::filesystem::file_size(path_, ec);
	if (ec) {
		throw Retry::LocalIOError(fmt::format("StatError(SourceFile):{}:{}", path_.string(), ec.message()));
	}

	stream_.open(path_, std::ios::in | std::ios::binary);
	if (!stream_.is_open()) {
		throw Retry::LocalIOError(fmt::format("OpenError(SourceFile):{}", path_.string()));
	}
}

void SourceFile::readRange(std::uint64_t offset, std::span<char> out)
{
	if (offset > size_ || out.size() > size_ - offset) {
		throw Retry::LocalIOError(fmt::format("RangeOutOfFileError(SourceFile):{}+{}", offset, out.size()),
					  {std::nullopt, 0, offset});
	}

	stream_.clear();
	stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
	stream_.read(out.data(), static_cast<std::streamsize>(out.size()));
	if (!stream_ || static_cast<std::size_t>(stream_.gcount()) != out.size()) {
		throw Retry::LocalIOError(fmt::format("ShortReadError(SourceFile):{}+{}", offset, out.size()),
					  {std::nullopt, 0, offset});
	}
}

std::string SourceFile::contentType() const
{
	static const std::map<std::string, std::string> kTypes{
		{".3gp", "video/3gpp"},	  {".avi", "video/x-msvideo"},	{".flv", "video/x-flv"},
		{".m4v", "video/x-m4v"},  {".mkv", "video/x-matroska"}, {".mov", "video/quicktime"},
		{".mp4", "video/mp4"},	  {".mpeg", "video/mpeg"},	{".mpg", "video/mpeg"},
		{".webm", "video/webm"},  {".wmv", "video/x-ms-wmv"},
	};

	std::string ext = path_.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
		       [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

	auto it = kTypes.find(ext);
	return it != kTypes.end() ? it->second : "application/octet-stream";
}

} // namespace TubeUpload::Transfer
