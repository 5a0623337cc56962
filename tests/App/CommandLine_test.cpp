/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload App Tests
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

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include <TubeUpload/App/CommandLine.hpp>

using namespace TubeUpload;

namespace {

class Argv {
public:
	Argv(std::initializer_list<std::string> args) : storage_{"tube-upload"}
	{
		storage_.insert(storage_.end(), args.begin(), args.end());
		for (auto &arg : storage_) {
			pointers_.push_back(arg.data());
		}
		pointers_.push_back(nullptr);
	}

	int argc() const { return static_cast<int>(storage_.size()); }

	char **argv() { return pointers_.data(); }

private:
	std::vector<std::string> storage_;
	std::vector<char *> pointers_;
};

App::CommandLineOptions parse(std::initializer_list<std::string> args)
{
	Argv argv(args);
	return App::parseCommandLine(argv.argc(), argv.argv());
}

} // anonymous namespace

TEST(CommandLineTest, DefaultsWithOnlyVideoFile)
{
	const auto options = parse({"--videofile=clip.mp4"});

	ASSERT_TRUE(options.videoFile.has_value());
	EXPECT_EQ(*options.videoFile, "clip.mp4");
	EXPECT_EQ(options.metadata.title, "Test Title");
	EXPECT_EQ(options.metadata.description, "Test Description");
	EXPECT_EQ(options.metadata.categoryId, "22");
	EXPECT_EQ(options.metadata.privacyStatus, "public");
	EXPECT_EQ(options.configFile, "config.json");
	EXPECT_FALSE(options.noLocalAuth);
	EXPECT_FALSE(options.headless);
	EXPECT_FALSE(options.noUpload);
	EXPECT_FALSE(options.forceRefresh);
	EXPECT_FALSE(options.showHelp);
}

TEST(CommandLineTest, MapsVideoOptionsToMetadata)
{
	const auto options = parse({"--videofile", "clip.mp4", "--title=Morning run", "--description=Along the river",
				    "--category=17", "--keywords=running, river,,morning", "--privacyStatus=private",
				    "--latitude=35.6812", "--longitude=139.7671", "--language=ja",
				    "--defaultAudioLanguage=ja", "--playlistId=PL42", "--thumbnail=thumb.jpg",
				    "--license=creativeCommon", "--publishAt=2026-11-01T09:00:00Z",
				    "--publicStatsViewable", "--madeForKids"});
	const auto &m = options.metadata;

	EXPECT_EQ(m.title, "Morning run");
	EXPECT_EQ(m.description, "Along the river");
	EXPECT_EQ(m.categoryId, "17");
	EXPECT_EQ(m.tags, (std::vector<std::string>{"running", "river", "morning"}));
	EXPECT_EQ(m.privacyStatus, "private");
	ASSERT_TRUE(m.hasRecordingLocation());
	EXPECT_DOUBLE_EQ(*m.latitude, 35.6812);
	EXPECT_DOUBLE_EQ(*m.longitude, 139.7671);
	EXPECT_EQ(m.defaultLanguage, "ja");
	EXPECT_EQ(m.defaultAudioLanguage, "ja");
	EXPECT_EQ(m.playlistId, "PL42");
	ASSERT_TRUE(m.thumbnailPath.has_value());
	EXPECT_EQ(*m.thumbnailPath, "thumb.jpg");
	EXPECT_EQ(m.license, "creativeCommon");
	EXPECT_EQ(m.publishAt, "2026-11-01T09:00:00Z");
	EXPECT_TRUE(m.publicStatsViewable);
	EXPECT_TRUE(m.selfDeclaredMadeForKids);
	EXPECT_FALSE(m.targeting.has_value());
	EXPECT_NO_THROW(m.validate());
}

TEST(CommandLineTest, TargetingOptionsFillTargeting)
{
	const auto options = parse({"--videofile=clip.mp4", "--ageGroup=age18_24", "--gender=female", "--geo=JP, US"});

	ASSERT_TRUE(options.metadata.targeting.has_value());
	EXPECT_EQ(options.metadata.targeting->ageGroup, "age18_24");
	EXPECT_EQ(options.metadata.targeting->genders, (std::vector<std::string>{"female"}));
	EXPECT_EQ(options.metadata.targeting->countries, (std::vector<std::string>{"JP", "US"}));
}

TEST(CommandLineTest, AuthenticationFlags)
{
	const auto options =
		parse({"--no-upload", "--nolocalauth", "--force-refresh", "--verbose", "--config=/etc/tube/config.json"});

	EXPECT_FALSE(options.videoFile.has_value());
	EXPECT_TRUE(options.noUpload);
	EXPECT_TRUE(options.noLocalAuth);
	EXPECT_TRUE(options.forceRefresh);
	EXPECT_TRUE(options.verbose);
	EXPECT_EQ(options.configFile, "/etc/tube/config.json");
}

TEST(CommandLineTest, HeadlessFlagSelectsNonInteractiveMode)
{
	const auto options = parse({"--videofile=clip.mp4", "--headless"});

	EXPECT_TRUE(options.headless);
	EXPECT_FALSE(options.noLocalAuth);
	EXPECT_NE(App::usageText("tube-upload").find("--headless"), std::string::npos);
}

TEST(CommandLineTest, VideoFileIsRequiredForUpload)
{
	EXPECT_THROW(parse({"--title=No file"}), std::invalid_argument);
}

TEST(CommandLineTest, RejectsMalformedCoordinate)
{
	EXPECT_THROW(parse({"--videofile=clip.mp4", "--latitude=north"}), std::invalid_argument);
	EXPECT_THROW(parse({"--videofile=clip.mp4", "--longitude=12abc"}), std::invalid_argument);
}

TEST(CommandLineTest, RejectsUnknownOption)
{
	try {
		parse({"--videofile=clip.mp4", "--bogus"});
		FAIL() << "expected std::invalid_argument";
	} catch (const std::invalid_argument &e) {
		EXPECT_NE(std::string(e.what()).find("UnknownOptionError"), std::string::npos);
	}
}

TEST(CommandLineTest, RejectsMissingArgument)
{
	try {
		parse({"--videofile=clip.mp4", "--title"});
		FAIL() << "expected std::invalid_argument";
	} catch (const std::invalid_argument &e) {
		EXPECT_NE(std::string(e.what()).find("MissingArgumentError"), std::string::npos);
	}
}

TEST(CommandLineTest, RejectsPositionalArgument)
{
	EXPECT_THROW(parse({"--videofile=clip.mp4", "stray"}), std::invalid_argument);
}

TEST(CommandLineTest, HelpShortCircuitsValidation)
{
	EXPECT_TRUE(parse({"--help"}).showHelp);
	EXPECT_TRUE(parse({"-h", "--bogus"}).showHelp);
}

TEST(CommandLineTest, UsageMentionsProgramAndOptions)
{
	const std::string usage = App::usageText("tube-upload");

	EXPECT_NE(usage.find("Usage: tube-upload"), std::string::npos);
	EXPECT_NE(usage.find("--videofile"), std::string::npos);
	EXPECT_NE(usage.find("--nolocalauth"), std::string::npos);
}
