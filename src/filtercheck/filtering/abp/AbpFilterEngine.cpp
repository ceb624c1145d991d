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

#include "AbpFilterEngine.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "../../util/url/UrlUtil.hpp"

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			const std::unordered_map<boost::string_ref, AbpFilterOption, util::string::StringRefHash> AbpFilterEngine::RequestTypes
			{
				{ u8"beacon", ping },
				{ u8"csp_report", other },
				{ u8"document", document },
				{ u8"font", font },
				{ u8"image", image },
				{ u8"media", media },
				{ u8"object", object },
				{ u8"ping", ping },
				{ u8"script", script },
				{ u8"stylesheet", stylesheet },
				{ u8"sub_frame", subdocument },
				{ u8"websocket", websocket },
				{ u8"xhr", xmlhttprequest },
				{ u8"other", other },
				{ u8"speculative", other },
				{ u8"web_manifest", other },
				{ u8"xbl", other },
				{ u8"xml_dtd", other },
				{ u8"xslt", other }
			};

			AbpFilterEngine::AbpFilterEngine(
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarn,
				util::cb::MessageFunction onError
				) :
				BaseFilterEngine(
					onInfo,
					onWarn,
					onError
					)
			{

			}

			AbpFilterEngine::~AbpFilterEngine()
			{

			}

			std::pair<uint32_t, uint32_t> AbpFilterEngine::LoadAbpFormattedListFromFile(const std::string& listFilePath)
			{
				std::ifstream in(listFilePath, std::ios::binary | std::ios::in);

				if (in.fail() || in.is_open() == false)
				{
					std::string errMessage(u8"In AbpFilterEngine::LoadAbpFormattedListFromFile(const std::string&) - Unable to read supplied filter list file: " + listFilePath);
					ReportError(errMessage);
					throw std::runtime_error(errMessage);
				}

				std::string listContents;
				in.seekg(0, std::ios::end);

				auto fsize = in.tellg();

				if (fsize < 0 || static_cast<unsigned long long>(fsize) > static_cast<unsigned long long>(std::numeric_limits<size_t>::max()))
				{
					std::string errMessage(u8"In AbpFilterEngine::LoadAbpFormattedListFromFile(const std::string&) - When loading file, ifstream::tellg() returned either less than zero or a number greater than this program can correctly handle: " + listFilePath);
					ReportError(errMessage);
					throw std::runtime_error(errMessage);
				}

				listContents.resize(static_cast<size_t>(fsize));
				in.seekg(0, std::ios::beg);
				in.read(&listContents[0], listContents.size());
				in.close();

				auto result = LoadAbpFormattedListFromString(listContents);

				std::string loadedMessage(u8"Loaded " + std::to_string(result.first) + u8" lines from " + listFilePath);
				ReportInfo(loadedMessage);

				if (result.second > 0)
				{
					std::string failedMessage(std::to_string(result.second) + u8" rules in " + listFilePath + u8" are unsupported or malformed and were ignored.");
					ReportWarning(failedMessage);
				}

				return result;
			}

			std::pair<uint32_t, uint32_t> AbpFilterEngine::LoadAbpFormattedListFromString(const std::string& list)
			{
				uint32_t succeeded = 0;
				uint32_t failed = 0;

				std::istringstream f(list);
				std::string line;
				while (std::getline(f, line))
				{
					if (!ProcessAbpFormattedRule(line))
					{
						// We don't want to throw the whole list out if there is some issue
						// with a single filtering rule. Subscribers to the info events get the
						// details of each failure.
						++failed;
						continue;
					}

					++succeeded;
				}

				return { succeeded, failed };
			}

			MatchResult AbpFilterEngine::Check(
				const std::string& url,
				const std::string& context,
				const std::string& requestType,
				const bool considerThirdParty
				) const
			{
				const auto requestTypeResult = RequestTypes.find(requestType);

				if (requestTypeResult == RequestTypes.end())
				{
					throw std::runtime_error(u8"In AbpFilterEngine::Check(...) const - Unknown request type: " + requestType);
				}

				std::string urlLowercase = boost::algorithm::to_lower_copy(url);
				std::string contextLowercase = boost::algorithm::to_lower_copy(context);

				boost::string_ref host;
				boost::string_ref sourceHost;

				if (!util::url::TryExtractHost(urlLowercase, host))
				{
					throw std::runtime_error(u8"In AbpFilterEngine::Check(...) const - Request URL is not an absolute URL with a host: " + url);
				}

				if (!util::url::TryExtractHost(contextLowercase, sourceHost))
				{
					throw std::runtime_error(u8"In AbpFilterEngine::Check(...) const - Request context is not an absolute URL with a host: " + context);
				}

				AbpRequest request;
				request.url = url;
				request.urlLowercase = urlLowercase;
				request.hostOffset = static_cast<size_t>(host.data() - urlLowercase.data());
				request.hostLength = host.size();
				request.sourceHost = sourceHost;
				request.settings.set(requestTypeResult->second, true);

				if (considerThirdParty)
				{
					bool isThirdParty = util::url::GetBaseDomain(host) != util::url::GetBaseDomain(sourceHost);
					request.settings.set(isThirdParty ? AbpFilterOption::third_party : AbpFilterOption::notthird_party, true);
				}

				MatchResult result;

				auto importantMatch = FindMatch(m_importantFilters, request);

				if (importantMatch != nullptr)
				{
					result.matched = true;
					result.important = true;
					result.filter = importantMatch->GetPattern();
					return result;
				}

				auto blockingMatch = FindMatch(m_blockingFilters, request);

				if (blockingMatch == nullptr)
				{
					return result;
				}

				result.filter = blockingMatch->GetPattern();

				auto exceptionMatch = FindMatch(m_exceptionFilters, request);

				if (exceptionMatch != nullptr)
				{
					result.exception = exceptionMatch->GetPattern();
					return result;
				}

				result.matched = true;
				return result;
			}

			size_t AbpFilterEngine::GetFilterCount() const
			{
				return m_importantFilters.size() + m_blockingFilters.size() + m_exceptionFilters.size();
			}

			bool AbpFilterEngine::ProcessAbpFormattedRule(const std::string& rule)
			{
				std::string extractedRule = boost::trim_copy(rule);

				// Can't do much with an empty line, but this isn't an error.
				if (extractedRule.size() == 0)
				{
					return true;
				}

				// This is a comment line or a list header.
				if (extractedRule[0] == '!' || extractedRule[0] == '[')
				{
					return true;
				}

				// Element hiding rules, in all their flavours. Never network filters.
				if (extractedRule.find(u8"##") != std::string::npos ||
					extractedRule.find(u8"#@#") != std::string::npos ||
					extractedRule.find(u8"#?#") != std::string::npos ||
					extractedRule.find(u8"#$#") != std::string::npos)
				{
					return false;
				}

				if (extractedRule.size() > 1 && extractedRule[0] == '/' && extractedRule.find('/', 1) != std::string::npos)
				{
					// A rule that starts with a slash and contains another is a regex rule, or
					// so close to one that matching it literally would be wrong.
					auto optionsPos = extractedRule.find_last_of('$');
					auto pattern = extractedRule.substr(0, optionsPos);

					if (pattern.size() > 1 && pattern[pattern.size() - 1] == '/')
					{
						return false;
					}
				}

				try
				{
					auto filter = m_filterParser.Parse(extractedRule);

					if (filter->IsException())
					{
						m_exceptionFilters.push_back(filter);
					}
					else if (filter->IsImportant())
					{
						m_importantFilters.push_back(filter);
					}
					else
					{
						m_blockingFilters.push_back(filter);
					}

					return true;
				}
				catch (std::runtime_error& pErr)
				{
					std::string errMessage(u8"In AbpFilterEngine::ProcessAbpFormattedRule(const std::string&) - Rule '");
					errMessage.append(extractedRule).append(u8"' was ignored: ").append(pErr.what());
					ReportInfo(errMessage);
					return false;
				}
			}

			const AbpFilter* AbpFilterEngine::FindMatch(const std::vector<SharedFilter>& filters, const AbpRequest& request) const
			{
				for (const auto& filter : filters)
				{
					if (filter->IsMatch(request))
					{
						return filter.get();
					}
				}

				return nullptr;
			}

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
