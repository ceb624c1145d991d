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

#include "UrlUtil.hpp"
#include <array>
#include <cctype>
#include "../string/StringRefUtil.hpp"

namespace filtercheck
{
	namespace util
	{
		namespace url
		{

			namespace
			{

				// Second level labels under which registries hand out third level names, for
				// two letter country code TLDs. "example.co.uk" is a site of its own.
				const std::array<boost::string_ref, 10> CommonSecondLevelRegistries
				{
					{ u8"ac", u8"co", u8"com", u8"edu", u8"go", u8"gov", u8"ne", u8"net", u8"or", u8"org" }
				};

				bool IsSchemeChar(const char c)
				{
					return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
				}

				bool IsIpAddress(boost::string_ref host)
				{
					if (host.find(':') != boost::string_ref::npos)
					{
						// Only IPv6 literals carry a colon once the port is gone.
						return true;
					}

					for (auto c : host)
					{
						if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.')
						{
							return false;
						}
					}

					return true;
				}

			}

			bool TryExtractHost(boost::string_ref url, boost::string_ref& host)
			{
				if (url.size() == 0 || !std::isalpha(static_cast<unsigned char>(url[0])))
				{
					return false;
				}

				auto schemeEnd = url.find(u8"://");

				if (schemeEnd == boost::string_ref::npos)
				{
					return false;
				}

				for (size_t i = 1; i < schemeEnd; ++i)
				{
					if (!IsSchemeChar(url[i]))
					{
						return false;
					}
				}

				auto authority = url.substr(schemeEnd + 3);

				auto authorityEnd = authority.find_first_of(u8"/?#");

				if (authorityEnd != boost::string_ref::npos)
				{
					authority = authority.substr(0, authorityEnd);
				}

				auto userInfoEnd = authority.rfind('@');

				if (userInfoEnd != boost::string_ref::npos)
				{
					authority = authority.substr(userInfoEnd + 1);
				}

				if (authority.size() > 0 && authority[0] == '[')
				{
					auto closingBracket = authority.find(']');

					if (closingBracket == boost::string_ref::npos || closingBracket == 1)
					{
						return false;
					}

					host = authority.substr(1, closingBracket - 1);
					return true;
				}

				auto portStart = authority.find(':');

				if (portStart != boost::string_ref::npos)
				{
					authority = authority.substr(0, portStart);
				}

				if (authority.size() == 0)
				{
					return false;
				}

				host = authority;
				return true;
			}

			bool IsAbsoluteUrl(boost::string_ref url)
			{
				boost::string_ref host;
				return TryExtractHost(url, host);
			}

			std::string GetBaseDomain(boost::string_ref host)
			{
				// A fully qualified name may end in a dot, which doesn't make it a different site.
				if (host.size() > 1 && host.ends_with(u8"."))
				{
					host.remove_suffix(1);
				}

				if (IsIpAddress(host))
				{
					return host.to_string();
				}

				auto labels = string::Split(host, '.');

				if (labels.size() <= 2)
				{
					return host.to_string();
				}

				size_t keep = 2;

				const auto& tld = labels[labels.size() - 1];
				const auto& secondLevel = labels[labels.size() - 2];

				if (tld.size() == 2)
				{
					for (const auto& registry : CommonSecondLevelRegistries)
					{
						if (string::Equal(secondLevel, registry))
						{
							keep = 3;
							break;
						}
					}
				}

				if (labels.size() <= keep)
				{
					return host.to_string();
				}

				// Every label is a slice of host, so the base domain starts where the first kept
				// label starts.
				auto first = labels[labels.size() - keep];
				auto offset = static_cast<size_t>(first.data() - host.data());

				return host.substr(offset).to_string();
			}

		} /* namespace url */
	} /* namespace util */
} /* namespace filtercheck */
