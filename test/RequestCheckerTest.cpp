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

#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <filtercheck/request/RequestChecker.hpp>
#include "FakeFilterEngine.hpp"

using filtercheck::request::RequestChecker;
using filtercheck::request::RequestDescription;
using filtercheck::test::FakeFilterEngine;

TEST_CASE("Requests reach the engine with normalized types and third-party checks on", "[checker]")
{
	FakeFilterEngine engine;
	RequestChecker checker(engine);

	RequestDescription request{ u8"https://ads.example/x.js", u8"https://site.example/", u8"XMLHttpRequest" };

	auto result = checker.CheckRequest(request);

	REQUIRE(result.is_initialized());
	REQUIRE(result->matched);
	REQUIRE(engine.GetQueries().size() == 1);
	REQUIRE(engine.GetQueries()[0].url == request.url);
	REQUIRE(engine.GetQueries()[0].context == request.context);
	REQUIRE(engine.GetQueries()[0].requestType == u8"xhr");
	REQUIRE(engine.GetQueries()[0].considerThirdParty);
}

TEST_CASE("Engine errors become an empty result and two error messages", "[checker]")
{
	std::vector<std::string> errors;

	FakeFilterEngine engine;
	RequestChecker checker(
		engine,
		nullptr,
		nullptr,
		[&errors](const char* message, const size_t length) { errors.emplace_back(message, length); }
		);

	RequestDescription request{ u8"https://explode.example/", u8"https://site.example/", u8"Image" };

	auto result = checker.CheckRequest(request);

	REQUIRE_FALSE(result.is_initialized());
	REQUIRE(errors.size() == 2);
	REQUIRE(errors[0] == u8"Error checking request: url:https://explode.example/, context:https://site.example/, type:image");
	REQUIRE_THAT(errors[1], Catch::Matchers::StartsWith(u8"filter engine error: "));

	// A failed request doesn't poison the next one.
	RequestDescription next{ u8"https://cdn.example/app.js", u8"https://site.example/", u8"script" };

	auto nextResult = checker.CheckRequest(next);

	REQUIRE(nextResult.is_initialized());
	REQUIRE_FALSE(nextResult->matched);
}

TEST_CASE("Requests read with keys that are not strings never reach the engine", "[checker]")
{
	std::vector<std::string> errors;

	FakeFilterEngine engine;
	RequestChecker checker(
		engine,
		nullptr,
		nullptr,
		[&errors](const char* message, const size_t length) { errors.emplace_back(message, length); }
		);

	RequestDescription request;
	request.url = u8"null";
	request.context = u8"https://site.example/";
	request.type = u8"image";
	request.nonStringKeys.push_back(u8"url");

	auto result = checker.CheckRequest(request);

	REQUIRE_FALSE(result.is_initialized());
	REQUIRE(engine.GetQueries().empty());
	REQUIRE(errors.size() == 2);
	REQUIRE(errors[0] == u8"Error checking request: url:null, context:https://site.example/, type:image");
	REQUIRE(errors[1] == u8"filter engine error: Request description key \"url\" is not a string.");
}
