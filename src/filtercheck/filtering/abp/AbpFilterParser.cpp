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

#include "AbpFilterParser.hpp"
#include <stdexcept>
#include <boost/algorithm/string/case_conv.hpp>

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			const std::unordered_map<boost::string_ref, AbpFilterOption, util::string::StringRefHash> AbpFilterParser::ValidFilterOptions
			{
				{ u8"script", script },
				{ u8"~script", notscript },
				{ u8"image", image },
				{ u8"~image", notimage },
				{ u8"stylesheet", stylesheet },
				{ u8"~stylesheet", notstylesheet },
				{ u8"css", stylesheet },
				{ u8"~css", notstylesheet },
				{ u8"object", object },
				{ u8"~object", notobject },
				{ u8"object-subrequest", object },
				{ u8"~object-subrequest", notobject },
				{ u8"xmlhttprequest", xmlhttprequest },
				{ u8"~xmlhttprequest", notxmlhttprequest },
				{ u8"xhr", xmlhttprequest },
				{ u8"~xhr", notxmlhttprequest },
				{ u8"subdocument", subdocument },
				{ u8"~subdocument", notsubdocument },
				{ u8"frame", subdocument },
				{ u8"~frame", notsubdocument },
				{ u8"document", document },
				{ u8"~document", notdocument },
				{ u8"doc", document },
				{ u8"~doc", notdocument },
				{ u8"media", media },
				{ u8"~media", notmedia },
				{ u8"font", font },
				{ u8"~font", notfont },
				{ u8"websocket", websocket },
				{ u8"~websocket", notwebsocket },
				{ u8"ping", ping },
				{ u8"~ping", notping },
				{ u8"beacon", ping },
				{ u8"~beacon", notping },
				{ u8"other", other },
				{ u8"~other", notother },
				{ u8"third-party", third_party },
				{ u8"~third-party", notthird_party },
				{ u8"3p", third_party },
				{ u8"~3p", notthird_party },
				{ u8"first-party", notthird_party },
				{ u8"~first-party", third_party },
				{ u8"1p", notthird_party },
				{ u8"~1p", third_party },
				{ u8"important", important },
				{ u8"match-case", match_case }
			};

			namespace
			{
				const boost::string_ref DomainsOption(u8"domain=");
			}

			AbpFilterParser::AbpFilterParser()
			{

			}

			AbpFilterParser::~AbpFilterParser()
			{

			}

			AbpFilterParser::SharedFilter AbpFilterParser::Parse(const std::string& filterString) const
			{
				if (filterString.size() == 0)
				{
					throw std::runtime_error(u8"In AbpFilterParser::Parse(const std::string&) - Expected filter string, got empty string.");
				}

				// The filter parts are string_refs into strings owned by the filter itself, so
				// both copies of the rule must be in place before any parsing happens, and must
				// never be modified afterwards.
				SharedFilter filter = std::make_shared<AbpFilter>();

				filter->m_originalRuleString = filterString;
				filter->m_normalizedRuleString = boost::algorithm::to_lower_copy(filterString);

				boost::string_ref normalizedRef(filter->m_normalizedRuleString);
				boost::string_ref optionsRef;

				// First lets split the options and the pattern into two different string_refs.
				auto lastOptionCharPos = normalizedRef.find_last_of('$');

				if (lastOptionCharPos != boost::string_ref::npos)
				{
					optionsRef = normalizedRef.substr(lastOptionCharPos + 1);
					normalizedRef = normalizedRef.substr(0, lastOptionCharPos);

					if (optionsRef.size() == 0)
					{
						throw std::runtime_error(u8"In AbpFilterParser::Parse(const std::string&) - Options separator '$' is not followed by any option.");
					}
				}

				size_t patternStart = 0;

				if (normalizedRef.starts_with(u8"@@"))
				{
					filter->m_isException = true;
					patternStart = 2;
				}

				filter->m_settings = ParseSettings(optionsRef);
				filter->m_inclusionDomains = ParseDomains(optionsRef, false);
				filter->m_exceptionDomains = ParseDomains(optionsRef, true);

				if (filter->m_isException && filter->m_settings[AbpFilterOption::important])
				{
					throw std::runtime_error(u8"In AbpFilterParser::Parse(const std::string&) - The $important option is meaningless on an exception rule.");
				}

				// Lowercasing keeps every character in place, so the pattern sits at the same
				// offsets in both copies of the rule.
				boost::string_ref patternRef = filter->m_settings[AbpFilterOption::match_case] ?
					boost::string_ref(filter->m_originalRuleString) :
					boost::string_ref(filter->m_normalizedRuleString);

				patternRef = patternRef.substr(patternStart, normalizedRef.size() - patternStart);

				if (patternRef.size() == 0)
				{
					if (optionsRef.size() == 0)
					{
						throw std::runtime_error(u8"In AbpFilterParser::Parse(const std::string&) - Filter has neither a pattern nor any options.");
					}

					// A rule made only of options, such as "$script,domain=example.com", applies
					// to every URL.
					filter->m_filterParts.emplace_back(boost::string_ref(u8"*"), AbpFilter::RulePartType::Wildcard);
					return filter;
				}

				bool isFirstPart = true;

				while (patternRef.size() > 0)
				{
					auto part = ParseFilterPart(patternRef, isFirstPart);
					isFirstPart = false;

					// Consecutive wildcards mean nothing more than a single one.
					if (std::get<1>(part) == AbpFilter::RulePartType::Wildcard &&
						filter->m_filterParts.size() > 0 &&
						std::get<1>(filter->m_filterParts.back()) == AbpFilter::RulePartType::Wildcard)
					{
						continue;
					}

					filter->m_filterParts.emplace_back(part);
				}

				return filter;
			}

			AbpFilterParser::FilterPart AbpFilterParser::ParseFilterPart(boost::string_ref& filterStr, const bool isFirstPart) const
			{
				auto max = filterStr.size();

				boost::string_ref::size_type collected = 0;

				// Returns the literal collected so far, leaving the special character that ended
				// it for the next call.
				auto TakeCollected = [&filterStr, &collected]()
				{
					auto ss = filterStr.substr(0, collected);
					filterStr = filterStr.substr(collected);
					return std::make_tuple(ss, AbpFilter::RulePartType::StringLiteral);
				};

				for (size_t cpos = 0; cpos < max; ++cpos)
				{
					switch (filterStr[cpos])
					{
						// Separator
						case '^':
						{
							if (collected > 0)
							{
								return TakeCollected();
							}

							filterStr = filterStr.substr(1);
							return std::make_tuple(boost::string_ref(u8"^"), AbpFilter::RulePartType::Separator);
						}
						break;

						case '*':
						{
							if (collected > 0)
							{
								return TakeCollected();
							}

							filterStr = filterStr.substr(1);
							return std::make_tuple(boost::string_ref(u8"*"), AbpFilter::RulePartType::Wildcard);
						}
						break;

						case '|':
						{
							if (collected > 0)
							{
								return TakeCollected();
							}

							// For anchors, one of three scenarios must hold. Two pipes at the
							// very start of the pattern anchor a domain, and must be followed
							// by a string literal. A single pipe at the very start anchors the
							// start of the address, and also needs a string literal. A single
							// pipe at the very end anchors the end of the address. A pipe
							// anywhere else is an error.

							if (isFirstPart && max > 1)
							{
								bool isDomainAnchor = (filterStr[1] == '|');

								filterStr = filterStr.substr(isDomainAnchor ? 2 : 1);

								if (filterStr.size() == 0)
								{
									throw std::runtime_error(u8"In AbpFilterParser::ParseFilterPart(boost::string_ref&, const bool) const - Anchor is not followed by anything.");
								}

								auto next = ParseFilterPart(filterStr, false);

								if (std::get<1>(next) != AbpFilter::RulePartType::StringLiteral)
								{
									// Means we didn't get our expected string literal.
									throw std::runtime_error(u8"In AbpFilterParser::ParseFilterPart(boost::string_ref&, const bool) const - Anchor followed immediately by special characters.");
								}

								return std::make_tuple(
									std::get<0>(next),
									isDomainAnchor ? AbpFilter::RulePartType::AnchoredAddress : AbpFilter::RulePartType::AddressMatch
									);
							}

							if (!isFirstPart && max == 1)
							{
								filterStr = boost::string_ref();
								return std::make_tuple(boost::string_ref(), AbpFilter::RulePartType::EndOfAddressMatch);
							}

							throw std::runtime_error(u8"In AbpFilterParser::ParseFilterPart(boost::string_ref&, const bool) const - Anchor is neither at the start nor at the end of the filtering string.");
						}
						break;

						default:
						{
							++collected;
						}
						break;
					}
				}

				// Rule might have been entirely a string literal match.
				if (collected > 0)
				{
					return TakeCollected();
				}

				throw std::runtime_error(u8"In AbpFilterParser::ParseFilterPart(boost::string_ref&, const bool) const - Failed to parse anything. Empty string or out of bounds.");
			}

			AbpFilterSettings AbpFilterParser::ParseSettings(boost::string_ref optionsString) const
			{
				AbpFilterSettings ret;

				if (optionsString.size() > 0 && optionsString[0] == '$')
				{
					optionsString = optionsString.substr(1);
				}

				// While > 0 because ParseSingleOption is guaranteed to consume till EOF.
				while (optionsString.size() > 0)
				{
					auto part = ParseSingleOption(optionsString);

					if (part.size() == 0)
					{
						throw std::runtime_error(u8"In AbpFilterParser::ParseSettings(boost::string_ref) const - Empty entry in filter options.");
					}

					if (part.starts_with(DomainsOption))
					{
						continue;
					}

					const auto optionEnumResult = ValidFilterOptions.find(part);

					if (optionEnumResult == ValidFilterOptions.end())
					{
						std::string errMessage(u8"In AbpFilterParser::ParseSettings(boost::string_ref) const - Unsupported filter option: ");
						errMessage.append(part.data(), part.size());
						throw std::runtime_error(errMessage);
					}

					ret.set(optionEnumResult->second, true);
				}

				return ret;
			}

			std::vector<boost::string_ref> AbpFilterParser::ParseDomains(boost::string_ref optionsString, const bool exceptions) const
			{
				std::vector<boost::string_ref> ret;

				if (optionsString.size() > 0 && optionsString[0] == '$')
				{
					optionsString = optionsString.substr(1);
				}

				boost::string_ref domainsPart;
				bool found = false;

				while (optionsString.size() > 0)
				{
					auto part = ParseSingleOption(optionsString);

					if (part.starts_with(DomainsOption))
					{
						domainsPart = part.substr(DomainsOption.size());
						found = true;
						break;
					}
				}

				if (!found)
				{
					return ret;
				}

				if (domainsPart.size() == 0)
				{
					throw std::runtime_error(u8"In AbpFilterParser::ParseDomains(boost::string_ref, const bool) const - The domain option has no domains.");
				}

				// Multiple domains in the option are split with a single pipe char.
				for (auto domain : util::string::Split(domainsPart, '|'))
				{
					if (domain.size() == 0 || (domain.size() == 1 && domain[0] == '~'))
					{
						throw std::runtime_error(u8"In AbpFilterParser::ParseDomains(boost::string_ref, const bool) const - Incorrectly formatted domain option entry. Zero length.");
					}

					// Only insert what the caller is asking for.
					bool isExceptionDomain = (domain[0] == '~');

					if (exceptions != isExceptionDomain)
					{
						continue;
					}

					if (isExceptionDomain)
					{
						domain = domain.substr(1);
					}

					ret.push_back(domain);
				}

				return ret;
			}

			boost::string_ref AbpFilterParser::ParseSingleOption(boost::string_ref& optionsString) const
			{
				if (optionsString.size() == 0)
				{
					return optionsString;
				}

				auto commaPos = optionsString.find(',');

				if (commaPos != boost::string_ref::npos)
				{
					auto ret = optionsString.substr(0, commaPos);
					optionsString = optionsString.substr(commaPos + 1);

					return ret;
				}

				auto ret = optionsString;
				optionsString = boost::string_ref();

				return ret;
			}

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
