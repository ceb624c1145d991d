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

#include "RequestTypeNormalizer.hpp"
#include <algorithm>

namespace filtercheck
{
	namespace request
	{

		const std::array<boost::string_ref, 19> RequestTypeNormalizer::FilterListRequestTypes
		{
			{
				u8"beacon",
				u8"csp_report",
				u8"document",
				u8"font",
				u8"image",
				u8"media",
				u8"object",
				u8"ping",
				u8"script",
				u8"stylesheet",
				u8"sub_frame",
				u8"websocket",
				u8"xhr",
				u8"other",
				u8"speculative",
				u8"web_manifest",
				u8"xbl",
				u8"xml_dtd",
				u8"xslt"
			}
		};

		const std::unordered_map<boost::string_ref, boost::string_ref, util::string::StringRefHash> RequestTypeNormalizer::ChromiumRequestTypeMapping
		{
			{ u8"Attribution resource", u8"other" },
			{ u8"Audio", u8"media" },
			{ u8"CSS resource", u8"stylesheet" },
			{ u8"CSS stylesheet", u8"stylesheet" },
			{ u8"Dictionary", u8"other" },
			{ u8"Document", u8"document" },
			{ u8"Fetch", u8"xhr" },
			{ u8"Font", u8"font" },
			{ u8"Icon", u8"other" },
			{ u8"Image", u8"image" },
			{ u8"Internal resource", u8"other" },
			{ u8"Link element resource", u8"other" },
			{ u8"Link prefetch resource", u8"speculative" },
			{ u8"Manifest", u8"web_manifest" },
			{ u8"Mock", u8"other" },
			{ u8"Other resource", u8"other" },
			{ u8"Processing instruction", u8"other" },
			{ u8"Script", u8"script" },
			{ u8"SpeculationRule", u8"speculative" },
			{ u8"SVG document", u8"media" },
			{ u8"SVG Use element resource", u8"media" },
			{ u8"Text track", u8"other" },
			{ u8"Track", u8"other" },
			{ u8"User Agent CSS resource", u8"stylesheet" },
			{ u8"Video", u8"media" },
			{ u8"XML resource", u8"document" },
			{ u8"XMLHttpRequest", u8"xhr" },
			{ u8"XSL stylesheet", u8"xslt" }
		};

		std::string RequestTypeNormalizer::Normalize(const std::string& requestType)
		{
			const auto mapping = ChromiumRequestTypeMapping.find(requestType);

			if (mapping == ChromiumRequestTypeMapping.end())
			{
				return requestType;
			}

			return mapping->second.to_string();
		}

		bool RequestTypeNormalizer::IsKnownRequestType(const std::string& requestType)
		{
			if (ChromiumRequestTypeMapping.find(requestType) != ChromiumRequestTypeMapping.end())
			{
				return true;
			}

			return std::find(FilterListRequestTypes.begin(), FilterListRequestTypes.end(), boost::string_ref(requestType)) != FilterListRequestTypes.end();
		}

		std::vector<std::string> RequestTypeNormalizer::GetRequestTypeOptions()
		{
			std::vector<std::string> ret;
			ret.reserve(FilterListRequestTypes.size() + ChromiumRequestTypeMapping.size());

			for (const auto& requestType : FilterListRequestTypes)
			{
				ret.push_back(requestType.to_string());
			}

			for (const auto& mapping : ChromiumRequestTypeMapping)
			{
				ret.push_back(mapping.first.to_string());
			}

			std::sort(ret.begin(), ret.end());

			return ret;
		}

	} /* namespace request */
} /* namespace filtercheck */
