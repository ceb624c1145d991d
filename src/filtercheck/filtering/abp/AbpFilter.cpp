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

#include "AbpFilter.hpp"
#include <cctype>
#include "../../util/string/StringRefUtil.hpp"

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			namespace
			{

				bool IsSeparatorChar(const char c)
				{
					if (std::isalnum(static_cast<unsigned char>(c)))
					{
						return false;
					}

					return c != '_' && c != '-' && c != '.' && c != '%';
				}

			}

			AbpFilter::AbpFilter()
			{

			}

			AbpFilter::~AbpFilter()
			{
			}

			bool AbpFilter::IsMatch(const AbpRequest& request) const
			{
				if (!SettingsApply(request.settings))
				{
					return false;
				}

				if (!DomainsApply(request.sourceHost))
				{
					return false;
				}

				if (m_filterParts.size() == 0)
				{
					return false;
				}

				auto data = m_settings[AbpFilterOption::match_case] ? request.url : request.urlLowercase;

				return MatchParts(request, data, 0, 0);
			}

			const std::string& AbpFilter::GetPattern() const
			{
				return m_originalRuleString;
			}

			AbpFilterSettings AbpFilter::GetFilterSettings() const
			{
				return m_settings;
			}

			bool AbpFilter::IsException() const
			{
				return m_isException;
			}

			bool AbpFilter::IsImportant() const
			{
				return m_settings[AbpFilterOption::important];
			}

			const std::vector<boost::string_ref>& AbpFilter::GetExceptionDomains() const
			{
				return m_exceptionDomains;
			}

			const std::vector<boost::string_ref>& AbpFilter::GetInclusionDomains() const
			{
				return m_inclusionDomains;
			}

			const std::vector<AbpFilter::FilterPart>& AbpFilter::GetFilterParts() const
			{
				return m_filterParts;
			}

			bool AbpFilter::SettingsApply(const AbpFilterSettings requestSettings) const
			{
				// A rule bound to one party can only apply when the request is known to be of
				// that party.
				if (m_settings[AbpFilterOption::third_party] && !requestSettings[AbpFilterOption::third_party])
				{
					return false;
				}

				if (m_settings[AbpFilterOption::notthird_party] && !requestSettings[AbpFilterOption::notthird_party])
				{
					return false;
				}

				bool ruleHasTypes = false;
				bool requestTypeIncluded = false;

				for (const auto contentType : AbpContentTypes)
				{
					const bool requestIsType = requestSettings[contentType];

					if (requestIsType && m_settings[NegationOf(contentType)])
					{
						return false;
					}

					if (m_settings[contentType])
					{
						ruleHasTypes = true;

						if (requestIsType)
						{
							requestTypeIncluded = true;
						}
					}
				}

				if (ruleHasTypes && !requestTypeIncluded)
				{
					return false;
				}

				return true;
			}

			bool AbpFilter::DomainsApply(boost::string_ref sourceHost) const
			{
				for (const auto& domain : m_exceptionDomains)
				{
					if (util::string::IsHostUnderDomain(sourceHost, domain))
					{
						return false;
					}
				}

				if (m_inclusionDomains.size() == 0)
				{
					return true;
				}

				for (const auto& domain : m_inclusionDomains)
				{
					if (util::string::IsHostUnderDomain(sourceHost, domain))
					{
						return true;
					}
				}

				return false;
			}

			bool AbpFilter::MatchParts(const AbpRequest& request, boost::string_ref data, const size_t partIndex, const size_t position) const
			{
				if (partIndex >= m_filterParts.size())
				{
					// All parts were found successfully so, we matched.
					return true;
				}

				auto part = std::get<0>(m_filterParts[partIndex]);
				auto partType = std::get<1>(m_filterParts[partIndex]);

				bool floating = (partIndex == 0 || std::get<1>(m_filterParts[partIndex - 1]) == RulePartType::Wildcard);

				switch (partType)
				{
					case RulePartType::AnchoredAddress:
					{
						auto hostStart = request.hostOffset;
						auto hostEnd = request.hostOffset + request.hostLength;

						if (hostEnd > data.size())
						{
							return false;
						}

						for (auto start = hostStart; start < hostEnd; ++start)
						{
							// Must either be the whole host or start right after a dot.
							if (start != hostStart && data[start - 1] != '.')
							{
								continue;
							}

							if (data.substr(start).starts_with(part) && MatchParts(request, data, partIndex + 1, start + part.size()))
							{
								return true;
							}
						}

						return false;
					}
					break;

					// Must be an exact match to the start of the request string.
					case RulePartType::AddressMatch:
					{
						if (position == 0 && data.starts_with(part))
						{
							return MatchParts(request, data, partIndex + 1, part.size());
						}

						return false;
					}
					break;

					case RulePartType::Wildcard:
					{
						return MatchParts(request, data, partIndex + 1, position);
					}
					break;

					case RulePartType::StringLiteral:
					{
						if (!floating)
						{
							return data.substr(position).starts_with(part) && MatchParts(request, data, partIndex + 1, position + part.size());
						}

						auto searchFrom = position;

						while (searchFrom <= data.size())
						{
							auto found = data.substr(searchFrom).find(part);

							if (found == boost::string_ref::npos)
							{
								return false;
							}

							auto literalPosition = searchFrom + found;

							if (MatchParts(request, data, partIndex + 1, literalPosition + part.size()))
							{
								return true;
							}

							searchFrom = literalPosition + 1;
						}

						return false;
					}
					break;

					case RulePartType::Separator:
					{
						if (!floating)
						{
							if (position == data.size())
							{
								return MatchParts(request, data, partIndex + 1, position);
							}

							return IsSeparatorChar(data[position]) && MatchParts(request, data, partIndex + 1, position + 1);
						}

						for (auto candidate = position; candidate <= data.size(); ++candidate)
						{
							if (candidate == data.size())
							{
								return MatchParts(request, data, partIndex + 1, candidate);
							}

							if (IsSeparatorChar(data[candidate]) && MatchParts(request, data, partIndex + 1, candidate + 1))
							{
								return true;
							}
						}

						return false;
					}
					break;

					// Indicates that we must be at the end of the request string.
					case RulePartType::EndOfAddressMatch:
					{
						if (part.size() > data.size())
						{
							return false;
						}

						auto start = data.size() - part.size();

						if (start < position || (!floating && start != position))
						{
							return false;
						}

						return data.ends_with(part);
					}
					break;
				}

				return false;
			}

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
