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

#include "YouTubeTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace TubeUpload::YouTubeApi {

namespace {

constexpr std::size_t kMaxTitleCharacters = 100;
constexpr std::size_t kMaxDescriptionBytes = 5000;

std::size_t countUtf8CodePoints(std::string_view s) noexcept
{
	return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
		return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
	}));
}

bool containsAngleBrackets(std::string_view s) noexcept
{
	return s.find_first_of("<>") != std::string_view::npos;
}

std::string_view trimView(std::string_view s) noexcept
{
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
		s.remove_prefix(1);
	}
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
		s.remove_suffix(1);
	}
	return s;
}

} // anonymous namespace

void YouTubeVideoMetadata::validate() const
{
	if (trimView(title).empty()) {
		throw std::invalid_argument("TitleIsEmptyError(YouTubeVideoMetadata)");
	}
	if (countUtf8CodePoints(title) > kMaxTitleCharacters) {
		throw std::invalid_argument("TitleTooLongError(YouTubeVideoMetadata)");
	}
	if (containsAngleBrackets(title)) {
		throw std::invalid_argument("TitleInvalidCharacterError(YouTubeVideoMetadata)");
	}
	if (description.size() > kMaxDescriptionBytes) {
		throw std::invalid_argument("DescriptionTooLongError(YouTubeVideoMetadata)");
	}
	if (containsAngleBrackets(description)) {
		throw std::invalid_argument("DescriptionInvalidCharacterError(YouTubeVideoMetadata)");
	}
	if (categoryId.empty() ||
	    !std::all_of(categoryId.begin(), categoryId.end(), [](char c) { return c >= '0' && c <= '9'; })) {
		throw std::invalid_argument("CategoryIdInvalidError(YouTubeVideoMetadata):" + categoryId);
	}

	if (latitude.has_value() != longitude.has_value()) {
		throw std::invalid_argument("LocationIncompleteError(YouTubeVideoMetadata)");
	}
	if (latitude && (*latitude < -90.0 || *latitude > 90.0)) {
		throw std::invalid_argument("LatitudeOutOfRangeError(YouTubeVideoMetadata)");
	}
	if (longitude && (*longitude < -180.0 || *longitude > 180.0)) {
		throw std::invalid_argument("LongitudeOutOfRangeError(YouTubeVideoMetadata)");
	}

	if (privacyStatus != "public" && privacyStatus != "private" && privacyStatus != "unlisted") {
		throw std::invalid_argument("PrivacyStatusInvalidError(YouTubeVideoMetadata):" + privacyStatus);
	}
	if (license != "youtube" && license != "creativeCommon") {
		throw std::invalid_argument("LicenseInvalidError(YouTubeVideoMetadata):" + license);
	}

	if (publishAt) {
		static const std::regex iso8601(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)");
		if (!std::regex_match(*publishAt, iso8601)) {
			throw std::invalid_argument("PublishAtInvalidError(YouTubeVideoMetadata):" + *publishAt);
		}
		if (privacyStatus != "private") {
			throw std::invalid_argument("PublishAtRequiresPrivateError(YouTubeVideoMetadata)");
		}
	}

	if (targeting) {
		for (const auto &country : targeting->countries) {
			if (country.size() != 2 || !std::all_of(country.begin(), country.end(), [](char c) {
				    return std::isalpha(static_cast<unsigned char>(c));
			    })) {
				throw std::invalid_argument("CountryCodeInvalidError(YouTubeVideoMetadata):" + country);
			}
		}
	}

	if (playlistId && playlistId->empty()) {
		throw std::invalid_argument("PlaylistIdIsEmptyError(YouTubeVideoMetadata)");
	}
	if (thumbnailPath && thumbnailPath->empty()) {
		throw std::invalid_argument("ThumbnailPathIsEmptyError(YouTubeVideoMetadata)");
	}
}

std::string YouTubeVideoMetadata::partList() const
{
	return hasRecordingLocation() ? "snippet,status,recordingDetails" : "snippet,status";
}

std::vector<std::string> splitCommaSeparated(std::string_view list)
{
	std::vector<std::string> items;
	while (!list.empty()) {
		const std::size_t comma = list.find(',');
		const std::string_view item = trimView(list.substr(0, comma));
		if (!item.empty()) {
			items.emplace_back(item);
		}
		if (comma == std::string_view::npos) {
			break;
		}
		list.remove_prefix(comma + 1);
	}
	return items;
}

void to_json(nlohmann::json &j, const YouTubeVideoMetadata &p)
{
	nlohmann::json snippet{
		{"title", p.title},
		{"description", p.description},
		{"categoryId", p.categoryId},
	};
	if (!p.tags.empty())
		snippet["tags"] = p.tags;
	if (p.defaultLanguage)
		snippet["defaultLanguage"] = *p.defaultLanguage;
	if (p.defaultAudioLanguage)
		snippet["defaultAudioLanguage"] = *p.defaultAudioLanguage;

	nlohmann::json status{
		{"privacyStatus", p.privacyStatus},
		{"license", p.license},
		{"publicStatsViewable", p.publicStatsViewable},
		{"selfDeclaredMadeForKids", p.selfDeclaredMadeForKids},
	};
	if (p.publishAt)
		status["publishAt"] = *p.publishAt;

	if (p.targeting) {
		nlohmann::json targeting = nlohmann::json::object();
		if (p.targeting->ageGroup)
			targeting["ageGroup"] = *p.targeting->ageGroup;
		if (!p.targeting->genders.empty())
			targeting["genders"] = p.targeting->genders;
		if (!p.targeting->countries.empty())
			targeting["countries"] = p.targeting->countries;
		status["targeting"] = std::move(targeting);
	}

	j = nlohmann::json{{"snippet", std::move(snippet)}, {"status", std::move(status)}};

	if (p.hasRecordingLocation()) {
		j["recordingDetails"] = {{"location", {{"latitude", *p.latitude}, {"longitude", *p.longitude}}}};
	}
}

void from_json(const nlohmann::json &j, YouTubeVideo &p)
{
	p.kind = j.value("kind", "");
	j.at("id").get_to(p.id);

	p.title.reset();
	if (auto it = j.find("snippet"); it != j.end() && it->contains("title")) {
		p.title = it->at("title").get<std::string>();
	}

	p.uploadStatus.reset();
	p.privacyStatus.reset();
	if (auto it = j.find("status"); it != j.end() && it->is_object()) {
		if (it->contains("uploadStatus"))
			p.uploadStatus = it->at("uploadStatus").get<std::string>();
		if (it->contains("privacyStatus"))
			p.privacyStatus = it->at("privacyStatus").get<std::string>();
	}
}

void from_json(const nlohmann::json &j, YouTubePlaylistItem &p)
{
	j.at("id").get_to(p.id);
	const auto &snippet = j.at("snippet");
	snippet.at("playlistId").get_to(p.playlistId);
	snippet.at("resourceId").at("videoId").get_to(p.videoId);
}

} // namespace TubeUpload::YouTubeApi
