/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload YouTubeApi Tests
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

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <TubeUpload/YouTubeApi/YouTubeTypes.hpp>

using namespace TubeUpload::YouTubeApi;

TEST(YouTubeVideoMetadataTest, DefaultsAreValid)
{
	const YouTubeVideoMetadata metadata;
	EXPECT_NO_THROW(metadata.validate());
	EXPECT_EQ(metadata.title, "Test Title");
	EXPECT_EQ(metadata.categoryId, "22");
	EXPECT_EQ(metadata.privacyStatus, "public");
	EXPECT_EQ(metadata.partList(), "snippet,status");
}

TEST(YouTubeVideoMetadataTest, TitleLimitsCountCharactersNotBytes)
{
	YouTubeVideoMetadata metadata;
	metadata.title = std::string(100, 'a');
	EXPECT_NO_THROW(metadata.validate());

	metadata.title.clear();
	for (int i = 0; i < 100; i++) {
		metadata.title += "\xE3\x81\x82";
	}
	EXPECT_NO_THROW(metadata.validate());

	metadata.title += "a";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);

	metadata.title = "   ";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);

	metadata.title = "a <b> title";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, DescriptionLimitIsInBytes)
{
	YouTubeVideoMetadata metadata;
	metadata.description = std::string(5000, 'd');
	EXPECT_NO_THROW(metadata.validate());
	metadata.description += "d";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, RejectsInvalidEnumeratedValues)
{
	YouTubeVideoMetadata badPrivacy;
	badPrivacy.privacyStatus = "secret";
	EXPECT_THROW(badPrivacy.validate(), std::invalid_argument);

	YouTubeVideoMetadata badLicense;
	badLicense.license = "gpl";
	EXPECT_THROW(badLicense.validate(), std::invalid_argument);

	YouTubeVideoMetadata badCategory;
	badCategory.categoryId = "music";
	EXPECT_THROW(badCategory.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, LocationNeedsBothCoordinatesInRange)
{
	YouTubeVideoMetadata metadata;
	metadata.latitude = 35.68;
	EXPECT_THROW(metadata.validate(), std::invalid_argument);

	metadata.longitude = 139.76;
	EXPECT_NO_THROW(metadata.validate());
	EXPECT_EQ(metadata.partList(), "snippet,status,recordingDetails");

	metadata.latitude = 91.0;
	EXPECT_THROW(metadata.validate(), std::invalid_argument);

	metadata.latitude = 0.0;
	metadata.longitude = -181.0;
	EXPECT_THROW(metadata.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, PublishAtRequiresPrivateAndIso8601)
{
	YouTubeVideoMetadata metadata;
	metadata.publishAt = "2026-11-01T09:00:00Z";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);

	metadata.privacyStatus = "private";
	EXPECT_NO_THROW(metadata.validate());

	metadata.publishAt = "2026-11-01T09:00:00.000+09:00";
	EXPECT_NO_THROW(metadata.validate());

	metadata.publishAt = "next tuesday";
	EXPECT_THROW(metadata.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, TargetingCountriesAreTwoLetterCodes)
{
	YouTubeVideoMetadata metadata;
	metadata.targeting = YouTubeVideoTargeting{"age18_24", {"female"}, {"JP", "US"}};
	EXPECT_NO_THROW(metadata.validate());

	metadata.targeting->countries.push_back("USA");
	EXPECT_THROW(metadata.validate(), std::invalid_argument);
}

TEST(YouTubeVideoMetadataTest, JsonCarriesSnippetStatusAndRecordingDetails)
{
	YouTubeVideoMetadata metadata;
	metadata.title = "Sunset";
	metadata.tags = {"sea", "sky"};
	metadata.defaultAudioLanguage = "ja";
	metadata.latitude = 35.0;
	metadata.longitude = 139.0;
	metadata.selfDeclaredMadeForKids = true;
	metadata.targeting = YouTubeVideoTargeting{std::nullopt, {}, {"JP"}};

	const nlohmann::json j = metadata;

	EXPECT_EQ(j["snippet"]["title"], "Sunset");
	EXPECT_EQ(j["snippet"]["tags"], nlohmann::json::array({"sea", "sky"}));
	EXPECT_EQ(j["snippet"]["defaultLanguage"], "en");
	EXPECT_EQ(j["snippet"]["defaultAudioLanguage"], "ja");
	EXPECT_EQ(j["status"]["privacyStatus"], "public");
	EXPECT_EQ(j["status"]["license"], "youtube");
	EXPECT_EQ(j["status"]["selfDeclaredMadeForKids"], true);
	EXPECT_EQ(j["status"]["targeting"]["countries"], nlohmann::json::array({"JP"}));
	EXPECT_FALSE(j["status"]["targeting"].contains("ageGroup"));
	EXPECT_EQ(j["recordingDetails"]["location"]["latitude"], 35.0);
	EXPECT_FALSE(j["snippet"].contains("recordingDetails"));
}

TEST(YouTubeVideoMetadataTest, JsonOmitsUnsetOptionalFields)
{
	YouTubeVideoMetadata metadata;
	metadata.defaultLanguage.reset();

	const nlohmann::json j = metadata;

	EXPECT_FALSE(j["snippet"].contains("tags"));
	EXPECT_FALSE(j["snippet"].contains("defaultLanguage"));
	EXPECT_FALSE(j["status"].contains("publishAt"));
	EXPECT_FALSE(j["status"].contains("targeting"));
	EXPECT_FALSE(j.contains("recordingDetails"));
}

TEST(SplitCommaSeparatedTest, TrimsAndDropsEmptyItems)
{
	EXPECT_EQ(splitCommaSeparated(" a, b ,,c ,"), (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_TRUE(splitCommaSeparated("").empty());
	EXPECT_TRUE(splitCommaSeparated(" , ").empty());
}

TEST(YouTubeVideoTest, ParsesUploadResponse)
{
	const auto video = nlohmann::json::parse(R"({
		"kind": "youtube#video",
		"id": "abc123",
		"snippet": {"title": "Sunset"},
		"status": {"uploadStatus": "uploaded", "privacyStatus": "private"}
	})")
				   .get<YouTubeVideo>();

	EXPECT_EQ(video.id, "abc123");
	EXPECT_EQ(video.title, "Sunset");
	EXPECT_EQ(video.uploadStatus, "uploaded");
	EXPECT_EQ(video.privacyStatus, "private");
}

TEST(YouTubePlaylistItemTest, ParsesInsertResponse)
{
	const auto item = nlohmann::json::parse(R"({
		"id": "item-1",
		"snippet": {"playlistId": "PL1", "resourceId": {"kind": "youtube#video", "videoId": "abc123"}}
	})")
				  .get<YouTubePlaylistItem>();

	EXPECT_EQ(item.id, "item-1");
	EXPECT_EQ(item.playlistId, "PL1");
	EXPECT_EQ(item.videoId, "abc123");
}
