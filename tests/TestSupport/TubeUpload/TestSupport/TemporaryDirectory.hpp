/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload TestSupport
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
#include <random>
#include <string>
#include <system_error>

namespace TubeUpload::TestSupport {

/// A scratch directory under the system temp directory, removed on destruction.
class TemporaryDirectory {
public:
	TemporaryDirectory()
	{
		std::random_device rd;
		std::mt19937 gen(rd());
		std::uniform_int_distribution<> dist(0, 999999);
		path_ = std::filesystem::temp_directory_path() / ("tube-upload-test-" + std::to_string(dist(gen)));
		std::filesystem::create_directories(path_);
	}

	~TemporaryDirectory()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;
	TemporaryDirectory(TemporaryDirectory &&) = delete;
	TemporaryDirectory &operator=(TemporaryDirectory &&) = delete;

	const std::filesystem::path &path() const noexcept { return path_; }

	std::filesystem::path writeFile(const std::string &name, const std::string &content) const
	{
		const std::filesystem::path p = path_ / name;
		std::ofstream out(p, std::ios::binary);
		out << content;
		return p;
	}

	/// A file of `size` bytes that occupies no disk blocks.
	std::filesystem::path makeSparseFile(const std::string &name, std::uintmax_t size) const
	{
		const std::filesystem::path p = path_ / name;
		{
			std::ofstream out(p, std::ios::binary);
		}
		std::filesystem::resize_file(p, size);
		return p;
	}

private:
	std::filesystem::path path_;
};

} // namespace TubeUpload::TestSupport
