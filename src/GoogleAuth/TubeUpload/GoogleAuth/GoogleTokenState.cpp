/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload GoogleAuth Library
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

#include "GoogleTokenState.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace TubeUpload::GoogleAuth {

namespace {

std::int64_t toUnixSeconds(std::chrono::system_clock::time_point tp)
{
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::set<std::string> splitScopes(const std::string &scope)
{
	std::set<std::string> result;
	std::istringstream iss(scope);
	std::string item;
	while (iss >> item) {
		result.insert(item);
	}
	return result;
}

} // anonymous namespace

std::chrono::system_clock::time_point GoogleTokenState::expirationTimePoint() const
{
	if (expires_at.has_value()) {
		return std::chrono::system_clock::time_point(std::chrono::seconds(expires_at.value()));
	} else {
		return {};
	}
}

bool GoogleTokenState::isAuthorized() const noexcept
{
	return !refresh_token.empty();
}

bool GoogleTokenState::isUsable(std::chrono::system_clock::time_point now) const
{
	if (access_token.empty() || !expires_at.has_value()) {
		return false;
	}

	return (now + kExpiryMargin) < expirationTimePoint();
}

bool GoogleTokenState::isOlderThan(std::chrono::seconds maxAge, std::chrono::system_clock::time_point now) const
{
	if (!refreshed_at.has_value()) {
		return true;
	}

	const auto refreshedAt = std::chrono::system_clock::time_point(std::chrono::seconds(refreshed_at.value()));
	return now - refreshedAt >= maxAge;
}

GoogleTokenState GoogleTokenState::withUpdatedAuthResponse(const GoogleAuthResponse &response,
							   std::chrono::system_clock::time_point now) const
{
	GoogleTokenState next = *this;
	next.access_token = response.access_token;
	next.refreshed_at = toUnixSeconds(now);

	if (response.expires_in.has_value()) {
		next.expires_at = toUnixSeconds(now) + response.expires_in.value();
	} else {
		next.expires_at = std::nullopt;
	}

	if (response.scope.has_value()) {
		next.scopes = splitScopes(response.scope.value());
	}

	if (response.refresh_token.has_value() && !response.refresh_token->empty()) {
		next.refresh_token = response.refresh_token.value();
	}

	return next;
}

void from_json(const nlohmann::json &j, GoogleTokenState &p)
{
	j.at("ver").get_to(p.ver);
	j.at("access_token").get_to(p.access_token);
	j.at("refresh_token").get_to(p.refresh_token);

	if (auto it = j.find("scopes"); it != j.end() && !it->is_null()) {
		it->get_to(p.scopes);
	} else {
		p.scopes.clear();
	}

	if (auto it = j.find("expires_at"); it != j.end() && !it->is_null()) {
		it->get_to(p.expires_at.emplace());
	} else {
		p.expires_at = std::nullopt;
	}

	if (auto it = j.find("refreshed_at"); it != j.end() && !it->is_null()) {
		it->get_to(p.refreshed_at.emplace());
	} else {
		p.refreshed_at = std::nullopt;
	}
}

void to_json(nlohmann::json &j, const GoogleTokenState &p)
{
	j = nlohmann::json{
		{"ver", p.ver},
		{"access_token", p.access_token},
		{"refresh_token", p.refresh_token},
		{"scopes", p.scopes},
	};

	if (p.expires_at.has_value())
		j["expires_at"] = *p.expires_at;

	if (p.refreshed_at.has_value())
		j["refreshed_at"] = *p.refreshed_at;
}

} // namespace TubeUpload::GoogleAuth
