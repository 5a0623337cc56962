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

#include "CommandLine.hpp"

#include <getopt.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace TubeUpload::App {

namespace {

enum OptionId : int {
	kVideoFile = 256,
	kTitle,
	kDescription,
	kCategory,
	kKeywords,
	kPrivacyStatus,
	kLatitude,
	kLongitude,
	kLanguage,
	kDefaultAudioLanguage,
	kPlaylistId,
	kThumbnail,
	kLicense,
	kPublishAt,
	kPublicStatsViewable,
	kMadeForKids,
	kAgeGroup,
	kGender,
	kGeo,
	kNoLocalAuth,
	kHeadless,
	kNoUpload,
	kForceRefresh,
	kConfig,
	kVerbose,
	kHelp,
};

const option kLongOptions[] = {
	{"videofile", required_argument, nullptr, kVideoFile},
	{"title", required_argument, nullptr, kTitle},
	{"description", required_argument, nullptr, kDescription},
	{"category", required_argument, nullptr, kCategory},
	{"keywords", required_argument, nullptr, kKeywords},
	{"privacyStatus", required_argument, nullptr, kPrivacyStatus},
	{"latitude", required_argument, nullptr, kLatitude},
	{"longitude", required_argument, nullptr, kLongitude},
	{"language", required_argument, nullptr, kLanguage},
	{"defaultAudioLanguage", required_argument, nullptr, kDefaultAudioLanguage},
	{"playlistId", required_argument, nullptr, kPlaylistId},
	{"thumbnail", required_argument, nullptr, kThumbnail},
	{"license", required_argument, nullptr, kLicense},
	{"publishAt", required_argument, nullptr, kPublishAt},
	{"publicStatsViewable", no_argument, nullptr, kPublicStatsViewable},
	{"madeForKids", no_argument, nullptr, kMadeForKids},
	{"ageGroup", required_argument, nullptr, kAgeGroup},
	{"gender", required_argument, nullptr, kGender},
	{"geo", required_argument, nullptr, kGeo},
	{"nolocalauth", no_argument, nullptr, kNoLocalAuth},
	{"headless", no_argument, nullptr, kHeadless},
	{"no-upload", no_argument, nullptr, kNoUpload},
	{"force-refresh", no_argument, nullptr, kForceRefresh},
	{"config", required_argument, nullptr, kConfig},
	{"verbose", no_argument, nullptr, kVerbose},
	{"help", no_argument, nullptr, kHelp},
	{nullptr, 0, nullptr, 0},
};

double parseCoordinate(const char *name, const char *value)
{
	errno = 0;
	char *end = nullptr;
	const double parsed = std::strtod(value, &end);
	if (errno != 0 || end == value || *end != '\0' || !std::isfinite(parsed)) {
		throw std::invalid_argument(fmt::format("InvalidNumberError(parseCommandLine):--{}={}", name, value));
	}
	return parsed;
}

YouTubeApi::YouTubeVideoTargeting &targetingOf(YouTubeApi::YouTubeVideoMetadata &metadata)
{
	if (!metadata.targeting) {
		metadata.targeting.emplace();
	}
	return *metadata.targeting;
}

} // anonymous namespace

CommandLineOptions parseCommandLine(int argc, char *argv[])
{
	CommandLineOptions options;
	auto &metadata = options.metadata;

	optind = 0;
	opterr = 0;

	int c;
	while ((c = getopt_long(argc, argv, ":h", kLongOptions, nullptr)) != -1) {
		switch (c) {
		case kVideoFile:
			options.videoFile = std::filesystem::path(optarg);
			break;
		case kTitle:
			metadata.title = optarg;
			break;
		case kDescription:
			metadata.description = optarg;
			break;
		case kCategory:
			metadata.categoryId = optarg;
			break;
		case kKeywords:
			metadata.tags = YouTubeApi::splitCommaSeparated(optarg);
			break;
		case kPrivacyStatus:
			metadata.privacyStatus = optarg;
			break;
		case kLatitude:
			metadata.latitude = parseCoordinate("latitude", optarg);
			break;
		case kLongitude:
			metadata.longitude = parseCoordinate("longitude", optarg);
			break;
		case kLanguage:
			metadata.defaultLanguage = std::string(optarg);
			break;
		case kDefaultAudioLanguage:
			metadata.defaultAudioLanguage = std::string(optarg);
			break;
		case kPlaylistId:
			metadata.playlistId = std::string(optarg);
			break;
		case kThumbnail:
			metadata.thumbnailPath = std::filesystem::path(optarg);
			break;
		case kLicense:
			metadata.license = optarg;
			break;
		case kPublishAt:
			metadata.publishAt = std::string(optarg);
			break;
		case kPublicStatsViewable:
			metadata.publicStatsViewable = true;
			break;
		case kMadeForKids:
			metadata.selfDeclaredMadeForKids = true;
			break;
		case kAgeGroup:
			targetingOf(metadata).ageGroup = std::string(optarg);
			break;
		case kGender:
			targetingOf(metadata).genders = {std::string(optarg)};
			break;
		case kGeo:
			targetingOf(metadata).countries = YouTubeApi::splitCommaSeparated(optarg);
			break;
		case kNoLocalAuth:
			options.noLocalAuth = true;
			break;
		case kHeadless:
			options.headless = true;
			break;
		case kNoUpload:
			options.noUpload = true;
			break;
		case kForceRefresh:
			options.forceRefresh = true;
			break;
		case kConfig:
			options.configFile = std::filesystem::path(optarg);
			break;
		case kVerbose:
			options.verbose = true;
			break;
		case 'h':
		case kHelp:
			options.showHelp = true;
			return options;
		case ':':
			throw std::invalid_argument(
				fmt::format("MissingArgumentError(parseCommandLine):{}", argv[optind - 1]));
		default:
			throw std::invalid_argument(
				fmt::format("UnknownOptionError(parseCommandLine):{}", argv[optind - 1]));
		}
	}

	if (optind < argc) {
		throw std::invalid_argument(fmt::format("UnexpectedArgumentError(parseCommandLine):{}", argv[optind]));
	}

	if (!options.noUpload && !options.videoFile) {
		throw std::invalid_argument("VideoFileRequiredError(parseCommandLine)");
	}

	return options;
}

std::string usageText(std::string_view program)
{
	return fmt::format(R"(Usage: {} --videofile=FILE [options]

Upload a video to YouTube with the resumable upload protocol.

Video options:
  --videofile=FILE              video file to upload
  --title=TEXT                  video title (default: "Test Title")
  --description=TEXT            video description (default: "Test Description")
  --category=ID                 numeric video category (default: 22)
  --keywords=LIST               comma-separated keywords
  --privacyStatus=STATUS        public, private or unlisted (default: public)
  --latitude=DEG                latitude of the recording location
  --longitude=DEG               longitude of the recording location
  --language=CODE               default language (default: en)
  --defaultAudioLanguage=CODE   default audio language
  --playlistId=ID               add the video to this playlist
  --thumbnail=FILE              custom thumbnail (PNG or JPEG, at most 2 MiB)
  --license=LICENSE             youtube or creativeCommon (default: youtube)
  --publishAt=TIME              ISO 8601 publish time (requires private)
  --publicStatsViewable         make statistics public
  --madeForKids                 declare the video as made for kids
  --ageGroup=GROUP              age group targeting, e.g. age18_24
  --gender=GENDER               gender targeting, male or female
  --geo=LIST                    comma-separated ISO 3166-1 country codes

Authentication and debugging options:
  --nolocalauth                 do not start a local browser callback; paste the code instead
  --headless                    fail instead of re-authorizing when the stored grant is rejected
  --no-upload                   only authorize, do not upload
  --force-refresh               refresh the access token even if it is still valid
  --config=FILE                 configuration file (default: config.json)
  --verbose                     log debug messages
  -h, --help                    show this help
)",
			   program);
}

} // namespace TubeUpload::App
