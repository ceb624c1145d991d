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

#include "AbpFilter.hpp"
#include <unordered_map>
#include <memory>
#include "../../util/string/StringRefUtil.hpp"

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			/// <summary>
			/// The AbpFilterParser class serves the purpose of accurately and rapidly parsing
			/// supplied strings into "compiled" Adblock Plus network filter objects, which are
			/// used for matching requests by URL, source host, content type and party.
			/// </summary>
			class AbpFilterParser
			{

			private:

				/// <summary>
				/// Contains all valid filter options that map directly onto a single
				/// setting bit, aliases included. Used when parsing string options to quickly
				/// retrieve the correct corresponding AbpFilterOption value.
				/// </summary>
				static const std::unordered_map<boost::string_ref, AbpFilterOption, util::string::StringRefHash> ValidFilterOptions;

			public:

				using SharedFilter = std::shared_ptr<AbpFilter>;

				/// <summary>
				/// Constructs a new AbpFilterParser object instance. Parse failures are thrown,
				/// never reported, so the parser needs no callbacks.
				/// </summary>
				AbpFilterParser();

				/// <summary>
				/// Default empty destructor.
				/// </summary>
				~AbpFilterParser();

				/// <summary>
				/// Attempts to parse the supplied network filter string and "compile" it into an
				/// AbpFilter object. The parser will throw std::runtime_error with a detailed
				/// description of any encountered issue in the event that the supplied filter
				/// string contains errors, or uses options this engine does not support. A rule
				/// with an unsupported option is rejected rather than loaded without it, since
				/// dropping the option would widen what the rule matches.
				/// </summary>
				/// <param name="filterString">
				/// The raw filtering string to parse. Must not be a comment or a cosmetic rule.
				/// </param>
				/// <returns>
				/// A "compiled" and shared Adblock Plus Filter object.
				/// </returns>
				SharedFilter Parse(const std::string& filterString) const;

			private:

				using FilterPart = AbpFilter::FilterPart;

				/// <summary>
				/// Attempt to extract the next unique filtering block from the front of the
				/// supplied filter string, consuming it. A "unique filtering block" is a section
				/// of a filter string that is unique in its operation during the filter matching
				/// function: string literals, anchors, wildcards and separators.
				/// </summary>
				/// <param name="filterStr">
				/// The remaining pattern. Whatever is returned is consumed from it.
				/// </param>
				/// <param name="isFirstPart">
				/// Whether filterStr still begins at the start of the pattern. Opening anchors
				/// are only legal there.
				/// </param>
				/// <returns>
				/// The extracted block string data and an enumeration which identifies the type
				/// of block parsed.
				/// </returns>
				FilterPart ParseFilterPart(boost::string_ref& filterStr, const bool isFirstPart) const;

				/// <summary>
				/// Parses the options section of a filter into a collection of bits. The
				/// $domain option is skipped here, as it is collected separately through
				/// ParseDomains.
				/// </summary>
				/// <param name="optionsString">
				/// The options section of a filter string, with or without its leading '$'.
				/// </param>
				/// <returns>
				/// The parsed settings. All bits are false when there are no options.
				/// </returns>
				AbpFilterSettings ParseSettings(boost::string_ref optionsString) const;

				/// <summary>
				/// Extracts all domains from the $domain option of the supplied options that the
				/// filter should, or should not, apply to, depending on the exceptions parameter.
				/// Exception domains are written with a leading '~' in the rule, which is
				/// removed from the returned values.
				///
				/// An empty collection of inclusion domains means the rule is globally
				/// applicable.
				/// </summary>
				/// <param name="optionsString">
				/// The options section of a filter string.
				/// </param>
				/// <param name="exceptions">
				/// Indicate whether we should be extracting only exception domains, or only
				/// inclusion domains.
				/// </param>
				std::vector<boost::string_ref> ParseDomains(boost::string_ref optionsString, const bool exceptions) const;

				/// <summary>
				/// Extracts the next comma separated string part from the front of the supplied
				/// string. Argument is pass by reference, as the the method consumes the part
				/// it returns.
				/// </summary>
				boost::string_ref ParseSingleOption(boost::string_ref& optionsString) const;
			};

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
