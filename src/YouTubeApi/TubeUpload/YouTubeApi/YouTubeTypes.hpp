/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload YouTubeApi Library
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
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace TubeUpload::YouTubeApi {

struct YouTubeVideoTargeting {
	std::optional<std::string> ageGroup;
	std::vector<std::string> genders;
	std::vector<std::string> countries;
};

/// Everything the uploader sends about a video. Only `validate()`d values reach the server.
struct YouTubeVideoMetadata {
	std::string title = "Test Title";
	std::string description = "Test Description";
	std::string categoryId = "22";
	std::vector<std::string> tags;
	std::optional<std::string> defaultLanguage = "en";
	std::optional<std::string> defaultAudioLanguage;
	std::optional<double> latitude;
	std::optional<double> longitude;

	std::string privacyStatus = "public";
	std::string license = "youtube";
	bool publicStatsViewable = false;
	bool selfDeclaredMadeForKids = false;
	std::optional<std::string> publishAt;
	std::optional<YouTubeVideoTargeting> targeting;

	std::optional<std::string> playlistId;
	std::optional<std::filesystem::path> thumbnailPath;

	/// Throws std::invalid_argument naming the first offending field.
	void validate() const;

	/// Value of the `part` query parameter matching the body produced by to_json.
	[[nodiscard]]
	std::string partList() const;

	[[nodiscard]]
	bool hasRecordingLocation() const noexcept
	{
		return latitude.has_value() && longitude.has_value();
	}
};

/// Splits a comma-separated list, trimming blanks and dropping empty items.
std::vector<std::string> splitCommaSeparated(std::string_view list);

void to_json(nlohmann::json &j, const YouTubeVideoMetadata &p);

/// The parts of a `youtube#video` resource the uploader reports.
struct YouTubeVideo {
	std::string kind;
	std::string id;
	std::optional<std::string> title;
	std::optional<std::string> uploadStatus;
	std::optional<std::string> privacyStatus;
};

void from_json(const nlohmann::json &j, YouTubeVideo &p);

struct YouTubePlaylistItem {
	std::string id;
	std::string playlistId;
	std::string videoId;
};

void from_json(const nlohmann::json &j, YouTubePlaylistItem &p);

} // namespace TubeUpload::YouTubeApi
