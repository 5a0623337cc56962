/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload App
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

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <TubeUpload/YouTubeApi/YouTubeTypes.hpp>

namespace TubeUpload::App {

struct CommandLineOptions {
	std::optional<std::filesystem::path> videoFile;
	YouTubeApi::YouTubeVideoMetadata metadata;
	std::filesystem::path configFile = "config.json";
	bool noLocalAuth = false;
	/// Refresh failures are terminal instead of falling back to the authorization-code flow.
	bool headless = false;
	bool noUpload = false;
	bool forceRefresh = false;
	bool verbose = false;
	bool showHelp = false;
};

/// Parses argv with getopt_long. Throws std::invalid_argument on unknown options, bad values,
/// or a missing --videofile outside --no-upload mode.
CommandLineOptions parseCommandLine(int argc, char *argv[]);

std::string usageText(std::string_view program);

} // namespace TubeUpload::App
