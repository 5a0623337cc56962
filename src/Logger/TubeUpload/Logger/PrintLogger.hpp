/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Logger Library
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
#include <cstdio>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "ILogger.hpp"

namespace TubeUpload::Logger {

/// Writes one logfmt line per event to a stdio stream (stderr by default).
/// stdout stays free for prompts that the user has to read.
class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info, std::FILE *stream = stderr) noexcept
		: minLevel_(minLevel),
		  stream_(stream)
	{
	}

	~PrintLogger() override = default;

	static std::shared_ptr<PrintLogger> instance()
	{
		static std::shared_ptr<PrintLogger> instance = std::make_shared<PrintLogger>();
		return instance;
	}

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level < minLevel_) {
			return;
		}

		try {
			std::string line = fmt::format("time={:%Y-%m-%dT%H:%M:%S}\tlevel={}\tname={}\tlocation={}:{}",
						       std::chrono::floor<std::chrono::seconds>(
							       std::chrono::system_clock::now()),
						       levelName(level), name, fileName(loc.file_name()), loc.line());
			for (const auto &field : context) {
				fmt::format_to(std::back_inserter(line), "\t{}={}", field.key, field.value);
			}
			line.push_back('\n');

			std::scoped_lock lock(mutex_);
			std::fputs(line.c_str(), stream_);
			std::fflush(stream_);
		} catch (const std::exception &e) {
			std::fprintf(stream_, "level=ERROR\tname=LogFormatFailed\tevent=%.*s\texception=%s\n",
				     static_cast<int>(name.size()), name.data(), e.what());
		}
	}

private:
	static std::string_view levelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "DEBUG";
		case LogLevel::Info:
			return "INFO";
		case LogLevel::Warn:
			return "WARN";
		case LogLevel::Error:
			return "ERROR";
		default:
			return "UNKNOWN";
		}
	}

	static std::string_view fileName(std::string_view path) noexcept
	{
		auto pos = path.find_last_of("/\\");
		return pos == std::string_view::npos ? path : path.substr(pos + 1);
	}

	const LogLevel minLevel_;
	std::FILE *const stream_;
	mutable std::mutex mutex_;
};

} // namespace TubeUpload::Logger
