/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Transfer Tests
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

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

#include <TubeUpload/Retry/TransferErrors.hpp>
#include <TubeUpload/TestSupport/TemporaryDirectory.hpp>
#include <TubeUpload/Transfer/SourceFile.hpp>

using namespace TubeUpload;

TEST(SourceFileTest, ReadsRequestedRange)
{
	TestSupport::TemporaryDirectory dir;
	Transfer::SourceFile file(dir.writeFile("clip.mp4", "0123456789"));

	EXPECT_EQ(file.size(), 10u);

	std::array<char, 4> buffer{};
	file.readRange(3, buffer);
	EXPECT_EQ(std::string(buffer.data(), buffer.size()), "3456");

	file.readRange(6, buffer);
	EXPECT_EQ(std::string(buffer.data(), buffer.size()), "6789");
}

TEST(SourceFileTest, RangeBeyondEndIsLocalIOError)
{
	TestSupport::TemporaryDirectory dir;
	Transfer::SourceFile file(dir.writeFile("clip.mp4", "0123456789"));

	std::array<char, 4> buffer{};
	EXPECT_THROW(file.readRange(7, buffer), Retry::LocalIOError);
	EXPECT_THROW(file.readRange(11, std::span<char>(buffer.data(), 0)), Retry::LocalIOError);
}

TEST(SourceFileTest, MissingFileIsLocalIOError)
{
	TestSupport::TemporaryDirectory dir;
	EXPECT_THROW(Transfer::SourceFile(dir.path() / "absent.mp4"), Retry::LocalIOError);
	EXPECT_THROW(Transfer::SourceFile(dir.path()), Retry::LocalIOError);
}

TEST(SourceFileTest, ContentTypeFollowsExtension)
{
	TestSupport::TemporaryDirectory dir;
	EXPECT_EQ(Transfer::SourceFile(dir.writeFile("a.mp4", "x")).contentType(), "video/mp4");
	EXPECT_EQ(Transfer::SourceFile(dir.writeFile("b.MOV", "x")).contentType(), "video/quicktime");
	EXPECT_EQ(Transfer::SourceFile(dir.writeFile("c.webm", "x")).contentType(), "video/webm");
	EXPECT_EQ(Transfer::SourceFile(dir.writeFile("d.bin", "x")).contentType(), "application/octet-stream");
}
