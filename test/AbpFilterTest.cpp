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

#include <stdexcept>
#include <string>
#include <catch2/catch.hpp>
#include <filtercheck/filtering/abp/AbpFilterParser.hpp>
#include <filtercheck/util/url/UrlUtil.hpp>

using namespace filtercheck::filtering::abp;

namespace
{

	/// <summary>
	/// Holds the strings an AbpRequest points into.
	/// </summary>
	struct TestRequest
	{
		std::string url;
		std::string context;
		AbpRequest request;

		TestRequest(const std::string& requestUrl, const std::string& requestContext, const AbpFilterOption requestType) :
			url(requestUrl),
			context(requestContext)
		{
			boost::string_ref host;
			boost::string_ref sourceHost;

			REQUIRE(filtercheck::util::url::TryExtractHost(url, host));
			REQUIRE(filtercheck::util::url::TryExtractHost(context, sourceHost));

			request.url = url;
			request.urlLowercase = url;
			request.hostOffset = static_cast<size_t>(host.data() - url.data());
			request.hostLength = host.size();
			request.sourceHost = sourceHost;
			request.settings.set(requestType, true);
		}
	};

	bool Matches(const std::string& rule, const std::string& url, const AbpFilterOption requestType = image, const std::string& context = u8"https://site.example/")
	{
		AbpFilterParser parser;
		auto filter = parser.Parse(rule);
		TestRequest test(url, context, requestType);
		return filter->IsMatch(test.request);
	}

}

TEST_CASE("Domain anchored rules are split into parts", "[abp][parser]")
{
	AbpFilterParser parser;

	auto filter = parser.Parse(u8"||ads.example.com^");
	const auto& parts = filter->GetFilterParts();

	REQUIRE(parts.size() == 2);
	REQUIRE(std::get<0>(parts[0]) == u8"ads.example.com");
	REQUIRE(std::get<1>(parts[0]) == AbpFilter::RulePartType::AnchoredAddress);
	REQUIRE(std::get<1>(parts[1]) == AbpFilter::RulePartType::Separator);
	REQUIRE_FALSE(filter->IsException());
	REQUIRE(filter->GetPattern() == u8"||ads.example.com^");
}

TEST_CASE("Options and domains are parsed", "[abp][parser]")
{
	AbpFilterParser parser;

	auto filter = parser.Parse(u8"@@||cdn.example.com^$Script,~third-party,domain=example.com|~shop.example.com");

	REQUIRE(filter->IsException());
	REQUIRE(filter->GetFilterSettings()[script]);
	REQUIRE(filter->GetFilterSettings()[notthird_party]);
	REQUIRE_FALSE(filter->GetFilterSettings()[third_party]);

	REQUIRE(filter->GetInclusionDomains().size() == 1);
	REQUIRE(filter->GetInclusionDomains()[0] == u8"example.com");
	REQUIRE(filter->GetExceptionDomains().size() == 1);
	REQUIRE(filter->GetExceptionDomains()[0] == u8"shop.example.com");
}

TEST_CASE("Consecutive wildcards collapse", "[abp][parser]")
{
	AbpFilterParser parser;

	auto filter = parser.Parse(u8"**banner**");

	REQUIRE(filter->GetFilterParts().size() == 3);
}

TEST_CASE("Malformed rules are rejected", "[abp][parser]")
{
	AbpFilterParser parser;

	REQUIRE_THROWS_AS(parser.Parse(u8""), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"banner$"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"banner$popup"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"banner$script,,image"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"@@banner$important"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"ban|ner"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"||"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"||^ads"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"ads$domain="), std::runtime_error);
	REQUIRE_THROWS_AS(parser.Parse(u8"ads$domain=a.com||b.com"), std::runtime_error);
}

TEST_CASE("Domain anchors match the host and its subdomains only", "[abp][match]")
{
	REQUIRE(Matches(u8"||ads.example.com^", u8"https://ads.example.com/banner.png"));
	REQUIRE(Matches(u8"||ads.example.com^", u8"https://cdn.ads.example.com/banner.png"));
	REQUIRE(Matches(u8"||ads.example.com^", u8"https://ads.example.com"));
	REQUIRE_FALSE(Matches(u8"||ads.example.com^", u8"https://badads.example.com/banner.png"));
	REQUIRE_FALSE(Matches(u8"||ads.example.com^", u8"https://ads.example.community/banner.png"));
	REQUIRE_FALSE(Matches(u8"||ads.example.com^", u8"https://other.org/?r=ads.example.com"));
}

TEST_CASE("Address anchors pin the start and end of the URL", "[abp][match]")
{
	REQUIRE(Matches(u8"|http://baddomain.example/", u8"http://baddomain.example/banner.gif"));
	REQUIRE_FALSE(Matches(u8"|http://baddomain.example/", u8"https://good.example/?u=http://baddomain.example/"));

	REQUIRE(Matches(u8"swf|", u8"http://example.com/annoyingflash.swf"));
	REQUIRE_FALSE(Matches(u8"swf|", u8"http://example.com/swf/index.html"));
	REQUIRE(Matches(u8".swf|", u8"http://example.com/swf/flash.swf"));
}

TEST_CASE("Wildcards and separators match as in filter lists", "[abp][match]")
{
	REQUIRE(Matches(u8"/banner/*/img^", u8"http://example.com/banner/foo/img?x=1"));
	REQUIRE(Matches(u8"/banner/*/img^", u8"http://example.com/banner/foo/bar/img"));
	REQUIRE_FALSE(Matches(u8"/banner/*/img^", u8"http://example.com/banner/foo/imgx"));
	REQUIRE_FALSE(Matches(u8"/banner/*/img^", u8"http://example.com/banner/img"));

	REQUIRE(Matches(u8"^ad^", u8"http://example.com/ad/x"));
	REQUIRE_FALSE(Matches(u8"^ad^", u8"http://example.com/add/x"));
	REQUIRE_FALSE(Matches(u8"^ad^", u8"http://example.com/a-ad-x"));

	REQUIRE(Matches(u8"&ad_type=", u8"http://example.com/x?a=1&ad_type=banner"));
}

TEST_CASE("Content type options restrict matching", "[abp][match]")
{
	REQUIRE(Matches(u8"/ads/$script", u8"http://example.com/ads/x.js", script));
	REQUIRE_FALSE(Matches(u8"/ads/$script", u8"http://example.com/ads/x.png", image));
	REQUIRE(Matches(u8"/ads/$script,image", u8"http://example.com/ads/x.png", image));

	REQUIRE(Matches(u8"/ads/$~script", u8"http://example.com/ads/x.png", image));
	REQUIRE_FALSE(Matches(u8"/ads/$~script", u8"http://example.com/ads/x.js", script));

	REQUIRE(Matches(u8"/ads/", u8"http://example.com/ads/", document));
}

TEST_CASE("Domain option restricts the pages a rule applies on", "[abp][match]")
{
	const std::string rule(u8"/ads/$domain=example.com|~shop.example.com");
	const std::string url(u8"http://cdn.net/ads/x.png");

	REQUIRE(Matches(rule, url, image, u8"https://example.com/"));
	REQUIRE(Matches(rule, url, image, u8"https://www.example.com/page"));
	REQUIRE_FALSE(Matches(rule, url, image, u8"https://shop.example.com/"));
	REQUIRE_FALSE(Matches(rule, url, image, u8"https://example.org/"));
	REQUIRE_FALSE(Matches(rule, url, image, u8"https://notexample.com/"));
}

TEST_CASE("Match case compares against the URL as given", "[abp][match]")
{
	AbpFilterParser parser;

	auto caseSensitive = parser.Parse(u8"/BannerAd.$match-case");
	auto caseInsensitive = parser.Parse(u8"/BannerAd.");

	std::string url(u8"http://example.com/BannerAd.png");
	std::string lowercase(u8"http://example.com/bannerad.png");
	std::string context(u8"https://site.example/");

	TestRequest mixedCase(url, context, image);
	mixedCase.request.urlLowercase = lowercase;

	TestRequest lowerCase(lowercase, context, image);

	REQUIRE(caseSensitive->IsMatch(mixedCase.request));
	REQUIRE_FALSE(caseSensitive->IsMatch(lowerCase.request));
	REQUIRE(caseInsensitive->IsMatch(mixedCase.request));
	REQUIRE(caseInsensitive->IsMatch(lowerCase.request));
}

TEST_CASE("Rules made only of options match every URL", "[abp][match]")
{
	REQUIRE(Matches(u8"$websocket,domain=example.com", u8"wss://socket.example.net/feed", websocket, u8"https://example.com/"));
	REQUIRE_FALSE(Matches(u8"$websocket,domain=example.com", u8"wss://socket.example.net/feed", websocket, u8"https://example.org/"));
	REQUIRE_FALSE(Matches(u8"$websocket,domain=example.com", u8"https://socket.example.net/feed", script, u8"https://example.com/"));
}
