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

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../BaseFilterEngine.hpp"
#include "AbpFilter.hpp"
#include "AbpFilterParser.hpp"

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			/// <summary>
			/// The AbpFilterEngine compiles Adblock Plus formatted filter lists into network
			/// filters, and answers whether a given request would be blocked by them.
			///
			/// Element hiding (cosmetic) rules and regular expression rules are not supported.
			/// They are counted as failed rules when lists are loaded, along with any network
			/// rule the parser rejects.
			/// </summary>
			class AbpFilterEngine : public BaseFilterEngine
			{

			private:

				using SharedFilter = std::shared_ptr<AbpFilter>;

				/// <summary>
				/// Maps every request type of the lowercase filter list vocabulary onto the
				/// content type option it is matched as.
				/// </summary>
				static const std::unordered_map<boost::string_ref, AbpFilterOption, util::string::StringRefHash> RequestTypes;

			public:

				/// <summary>
				/// Constructs an AbpFilterEngine with no rules loaded.
				/// </summary>
				/// <param name="onInfo">
				/// Optional callback where informational messages about internal function can be
				/// sent, including the reason each individual rule was rejected.
				/// </param>
				/// <param name="onWarn">
				/// Optional callback where warning messages about internal function can be sent.
				/// </param>
				/// <param name="onError">
				/// Optional callback where error messages about internal function can be sent.
				/// </param>
				AbpFilterEngine(
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarn = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Default destructor.
				/// </summary>
				~AbpFilterEngine();

				/// <summary>
				/// Loads the Adblock Plus formatted list at the given path. Throws
				/// std::runtime_error if the file cannot be read.
				/// </summary>
				/// <param name="listFilePath">
				/// The path to the list file.
				/// </param>
				/// <returns>
				/// A pair where the first value is the total number of rules successfully
				/// loaded (comments and blank lines included), and the second value is the
				/// total number of rules that could not be loaded.
				/// </returns>
				std::pair<uint32_t, uint32_t> LoadAbpFormattedListFromFile(const std::string& listFilePath);

				/// <summary>
				/// Loads rules from a string holding an Adblock Plus formatted list, one rule
				/// per line.
				/// </summary>
				/// <param name="list">
				/// The list contents.
				/// </param>
				/// <returns>
				/// A pair where the first value is the total number of rules successfully
				/// loaded, and the second value is the total number of rules that could not be
				/// loaded.
				/// </returns>
				std::pair<uint32_t, uint32_t> LoadAbpFormattedListFromString(const std::string& list);

				/// <summary>
				/// An $important blocking filter wins outright. Otherwise the first blocking
				/// filter that matches is reported, and cancelled by the first exception filter
				/// that also matches.
				/// </summary>
				MatchResult Check(
					const std::string& url,
					const std::string& context,
					const std::string& requestType,
					const bool considerThirdParty
					) const override;

				/// <summary>
				/// Gets the number of network filters currently loaded, exceptions included.
				/// </summary>
				size_t GetFilterCount() const;

			private:

				/// <summary>
				/// Parser used for compiling network filters.
				/// </summary>
				AbpFilterParser m_filterParser;

				/// <summary>
				/// Blocking filters carrying the $important option.
				/// </summary>
				std::vector<SharedFilter> m_importantFilters;

				/// <summary>
				/// All other blocking filters.
				/// </summary>
				std::vector<SharedFilter> m_blockingFilters;

				/// <summary>
				/// Exception (whitelisting) filters.
				/// </summary>
				std::vector<SharedFilter> m_exceptionFilters;

				/// <summary>
				/// Attempts to process a single line of an Adblock Plus formatted list.
				/// </summary>
				/// <param name="rule">
				/// The raw line.
				/// </param>
				/// <returns>
				/// True if the line was a loaded filter, a comment or blank. False if the rule
				/// was unsupported or failed to parse.
				/// </returns>
				bool ProcessAbpFormattedRule(const std::string& rule);

				/// <summary>
				/// Returns the first filter of the collection matching the request, or nullptr.
				/// </summary>
				const AbpFilter* FindMatch(const std::vector<SharedFilter>& filters, const AbpRequest& request) const;

			};

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
