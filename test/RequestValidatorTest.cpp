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

#include <catch2/catch.hpp>
#include <filtercheck/request/RequestErrors.hpp>
#include <filtercheck/request/RequestValidator.hpp>

using filtercheck::options::ProgramWideOptions;
using filtercheck::request::ConfigurationError;
using filtercheck::request::RequestMode;
using filtercheck::request::RequestValidator;

TEST_CASE("All three request arguments select single request mode", "[validator]")
{
	ProgramWideOptions programOptions;
	programOptions.SetUrl(u8"https://ads.example/banner.png");
	programOptions.SetContext(u8"https://site.example/");
	programOptions.SetType(u8"image");

	REQUIRE(RequestValidator::Validate(programOptions) == RequestMode::SingleRequest);

	SECTION("Even when a requests path is also given")
	{
		programOptions.SetRequestsPath(u8"-");

		REQUIRE(RequestValidator::Validate(programOptions) == RequestMode::SingleRequest);
	}

	SECTION("Chromium types are accepted too")
	{
		programOptions.SetType(u8"CSS stylesheet");

		REQUIRE(RequestValidator::Validate(programOptions) == RequestMode::SingleRequest);
	}
}

TEST_CASE("A requests path alone selects batch mode", "[validator]")
{
	ProgramWideOptions programOptions;
	programOptions.SetRequestsPath(u8"requests.ndjson");

	REQUIRE(RequestValidator::Validate(programOptions) == RequestMode::Batch);
}

TEST_CASE("Partial request arguments are rejected", "[validator]")
{
	ProgramWideOptions programOptions;
	programOptions.SetUrl(u8"https://ads.example/banner.png");
	programOptions.SetType(u8"image");
	programOptions.SetRequestsPath(u8"-");

	REQUIRE_THROWS_WITH(
		RequestValidator::Validate(programOptions),
		u8"--url, --context, and --type must be either all provided, or none of them provided."
		);
}

TEST_CASE("Partial request arguments are rejected before the missing requests path", "[validator]")
{
	ProgramWideOptions programOptions;
	programOptions.SetContext(u8"https://site.example/");

	REQUIRE_THROWS_WITH(
		RequestValidator::Validate(programOptions),
		u8"--url, --context, and --type must be either all provided, or none of them provided."
		);
}

TEST_CASE("No request source at all is rejected", "[validator]")
{
	ProgramWideOptions programOptions;

	REQUIRE_THROWS_AS(RequestValidator::Validate(programOptions), ConfigurationError);
	REQUIRE_THROWS_WITH(RequestValidator::Validate(programOptions), Catch::Matchers::StartsWith(u8"Must use either --requests"));
}

TEST_CASE("Single request arguments must be well formed", "[validator]")
{
	ProgramWideOptions programOptions;
	programOptions.SetUrl(u8"https://ads.example/banner.png");
	programOptions.SetContext(u8"https://site.example/");
	programOptions.SetType(u8"image");

	SECTION("Relative URL")
	{
		programOptions.SetUrl(u8"/banner.png");

		REQUIRE_THROWS_WITH(RequestValidator::Validate(programOptions), u8"argument --url: invalid URL value: '/banner.png'");
	}

	SECTION("Relative context")
	{
		programOptions.SetContext(u8"site.example");

		REQUIRE_THROWS_WITH(RequestValidator::Validate(programOptions), u8"argument --context: invalid URL value: 'site.example'");
	}

	SECTION("Unknown type")
	{
		programOptions.SetType(u8"subdocument");

		REQUIRE_THROWS_AS(RequestValidator::Validate(programOptions), ConfigurationError);
		REQUIRE_THROWS_WITH(RequestValidator::Validate(programOptions), Catch::Matchers::StartsWith(u8"argument --type: invalid choice: 'subdocument'"));
	}
}
