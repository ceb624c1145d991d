/*
* Copyright (c) 2016 Jesse Nicholson.
*
* This file is part of Filter Check.
*
* Filter Check is free software: you can redistribute it and/or
* modify it under the terms of the GNU General Public License as published
* by the Free Software Foundation, either version 3 of the License, or (at
* your option) any later version.
*
* Filter Check is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
* Public License for more details.
*
* You should have received a copy of the GNU General Public License along
* with Filter Check. If not, see <http://www.gnu.org/licenses/>.
*/

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <filtercheck/filtering/abp/AbpFilterEngine.hpp>

#ifndef FILTERCHECK_TEST_RESOURCE_DIR
	#define FILTERCHECK_TEST_RESOURCE_DIR "./resources"
#endif

using filtercheck::filtering::MatchResult;
using filtercheck::filtering::abp::AbpFilterEngine;

TEST_CASE("Loading counts comments as loaded and unsupported rules as failed", "[engine]")
{
	AbpFilterEngine engine;

	std::string list(
		u8"[Adblock Plus 2.0]\n"
		u8"! Title: test list\n"
		u8"\n"
		u8"||ads.example.com^\n"
		u8"example.com##.sidebar-ad\n"
		u8"/banner\\d+/\n"
		u8"||tracker.example^$bogus-option\n"
		u8"@@||ads.example.com/allowed/\r\n"
		);

	auto result = engine.LoadAbpFormattedListFromString(list);

	REQUIRE(result.first == 5);
	REQUIRE(result.second == 3);
	REQUIRE(engine.GetFilterCount() == 2);
}

TEST_CASE("Rejected rules are reported on the info channel", "[engine]")
{
	std::vector<std::string> infos;

	AbpFilterEngine engine(
		[&infos](const char* message, const size_t length) { infos.emplace_back(message, length); }
		);

	engine.LoadAbpFormattedListFromString(u8"||ads.example^$popup\n||ads.example^\n");

	REQUIRE(infos.size() == 1);
	REQUIRE_THAT(infos[0], Catch::Matchers::Contains(u8"||ads.example^$popup"));
}

TEST_CASE("Blocking, exception and important rules combine", "[engine]")
{
	AbpFilterEngine engine;

	engine.LoadAbpFormattedListFromString(
		u8"||ads.example.com^\n"
		u8"@@||ads.example.com/allowed/\n"
		u8"||tracker.example^$important\n"
		u8"@@||tracker.example^\n"
		);

	const std::string context(u8"https://news.example.org/");

	SECTION("A plain blocking match")
	{
		auto result = engine.Check(u8"https://ads.example.com/banner.png", context, u8"image", true);

		REQUIRE(result.matched);
		REQUIRE_FALSE(result.important);
		REQUIRE(result.filter.is_initialized());
		REQUIRE(*result.filter == u8"||ads.example.com^");
		REQUIRE_FALSE(result.exception.is_initialized());
	}

	SECTION("An exception cancels the block but both rules are reported")
	{
		auto result = engine.Check(u8"https://ads.example.com/allowed/banner.png", context, u8"image", true);

		REQUIRE_FALSE(result.matched);
		REQUIRE(result.filter.is_initialized());
		REQUIRE(*result.filter == u8"||ads.example.com^");
		REQUIRE(result.exception.is_initialized());
		REQUIRE(*result.exception == u8"@@||ads.example.com/allowed/");
	}

	SECTION("An important rule wins over exceptions")
	{
		auto result = engine.Check(u8"https://tracker.example/pixel.gif", context, u8"image", true);

		REQUIRE(result.matched);
		REQUIRE(result.important);
		REQUIRE(*result.filter == u8"||tracker.example^$important");
		REQUIRE_FALSE(result.exception.is_initialized());
	}

	SECTION("No match at all")
	{
		auto result = engine.Check(u8"https://cdn.example.net/app.js", context, u8"script", true);

		REQUIRE_FALSE(result.matched);
		REQUIRE_FALSE(result.important);
		REQUIRE_FALSE(result.filter.is_initialized());
		REQUIRE_FALSE(result.exception.is_initialized());
	}
}

TEST_CASE("Third-party status is decided by base domain", "[engine]")
{
	AbpFilterEngine engine;

	engine.LoadAbpFormattedListFromString(
		u8"||widgets.example^$third-party\n"
		u8"first-only/$~third-party\n"
		);

	REQUIRE(engine.Check(u8"https://widgets.example/w.js", u8"https://blog.example.org/", u8"script", true).matched);
	REQUIRE_FALSE(engine.Check(u8"https://widgets.example/w.js", u8"https://www.widgets.example/", u8"script", true).matched);

	REQUIRE(engine.Check(u8"https://static.shop.co.uk/first-only/x.js", u8"https://www.shop.co.uk/", u8"script", true).matched);
	REQUIRE_FALSE(engine.Check(u8"https://static.other.co.uk/first-only/x.js", u8"https://www.shop.co.uk/", u8"script", true).matched);

	// Without third-party information, rules bound to a party never apply.
	REQUIRE_FALSE(engine.Check(u8"https://widgets.example/w.js", u8"https://blog.example.org/", u8"script", false).matched);
}

TEST_CASE("Request types are matched against content type options", "[engine]")
{
	AbpFilterEngine engine;

	engine.LoadAbpFormattedListFromString(
		u8"||video.example/embed/$subdocument\n"
		u8"/api/track$xmlhttprequest\n"
		u8"/send$ping\n"
		u8"||site.example/odd/$other\n"
		);

	const std::string context(u8"https://site.example/");

	REQUIRE(engine.Check(u8"https://video.example/embed/1", context, u8"sub_frame", true).matched);
	REQUIRE_FALSE(engine.Check(u8"https://video.example/embed/1", context, u8"document", true).matched);
	REQUIRE(engine.Check(u8"https://site.example/api/track", context, u8"xhr", true).matched);
	REQUIRE(engine.Check(u8"https://site.example/send", context, u8"beacon", true).matched);
	REQUIRE(engine.Check(u8"https://site.example/odd/x.xsl", context, u8"xslt", true).matched);
	REQUIRE(engine.Check(u8"https://site.example/odd/x.json", context, u8"web_manifest", true).matched);
}

TEST_CASE("Requests the engine cannot make sense of throw", "[engine]")
{
	AbpFilterEngine engine;

	engine.LoadAbpFormattedListFromString(u8"||ads.example^\n");

	REQUIRE_THROWS_AS(engine.Check(u8"https://ads.example/", u8"https://site.example/", u8"CSS stylesheet", true), std::runtime_error);
	REQUIRE_THROWS_AS(engine.Check(u8"https://ads.example/", u8"https://site.example/", u8"bogus", true), std::runtime_error);
	REQUIRE_THROWS_AS(engine.Check(u8"ads.example/banner", u8"https://site.example/", u8"image", true), std::runtime_error);
	REQUIRE_THROWS_AS(engine.Check(u8"https://ads.example/", u8"not a url", u8"image", true), std::runtime_error);
}

TEST_CASE("Unreadable list files are errors", "[engine]")
{
	std::vector<std::string> errors;

	AbpFilterEngine engine(
		nullptr,
		nullptr,
		[&errors](const char* message, const size_t length) { errors.emplace_back(message, length); }
		);

	REQUIRE_THROWS_AS(engine.LoadAbpFormattedListFromFile(u8"/nonexistent/filtercheck/list.txt"), std::runtime_error);
	REQUIRE(errors.size() == 1);
}

TEST_CASE("The bundled lists load and block well known ad servers", "[engine][resources]")
{
	std::vector<std::string> warnings;

	AbpFilterEngine engine(
		nullptr,
		[&warnings](const char* message, const size_t length) { warnings.emplace_back(message, length); }
		);

	auto easylist = engine.LoadAbpFormattedListFromFile(std::string(FILTERCHECK_TEST_RESOURCE_DIR) + u8"/easylist.txt");
	auto easyprivacy = engine.LoadAbpFormattedListFromFile(std::string(FILTERCHECK_TEST_RESOURCE_DIR) + u8"/easyprivacy.txt");

	REQUIRE(easylist.first > 0);
	REQUIRE(easyprivacy.first > 0);
	REQUIRE(engine.GetFilterCount() > 0);

	// Both lists carry element hiding or regex rules, which are not supported.
	REQUIRE(warnings.size() == 2);

	REQUIRE(engine.Check(u8"https://ad.doubleclick.net/ddm/ad.js", u8"https://news.example.com/", u8"script", true).matched);
	REQUIRE(engine.Check(u8"https://www.google-analytics.com/collect", u8"https://news.example.com/", u8"xhr", true).matched);
	REQUIRE_FALSE(engine.Check(u8"https://news.example.com/story.html", u8"https://news.example.com/", u8"document", true).matched);
}

TEST_CASE("The bundled lists say they are excerpts", "[engine][resources]")
{
	for (const auto& listName : { u8"easylist.txt", u8"easyprivacy.txt" })
	{
		std::ifstream listFile(std::string(FILTERCHECK_TEST_RESOURCE_DIR) + u8"/" + listName);
		REQUIRE(listFile.is_open());

		std::string header;
		std::string line;
		for (int i = 0; i < 5 && std::getline(listFile, line); ++i)
		{
			header.append(line).append(u8"\n");
		}

		INFO(listName);
		REQUIRE_THAT(header, Catch::Matchers::Contains(u8"excerpt bundled with Filter Check"));
		REQUIRE_THAT(header, Catch::Matchers::Contains(u8"not the full list"));
	}
}
