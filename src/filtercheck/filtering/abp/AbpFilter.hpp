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

#include <vector>
#include <string>
#include <tuple>
#include <boost/utility/string_ref.hpp>
#include "AbpFilterOptions.hpp"

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			/// <summary>
			/// Everything an AbpFilter needs to know about a single request in order to decide
			/// whether it matches. All string_refs point into buffers owned by the caller, which
			/// must outlive the matching call.
			/// </summary>
			struct AbpRequest
			{
				/// <summary>
				/// The request URL exactly as supplied.
				/// </summary>
				boost::string_ref url;

				/// <summary>
				/// The request URL in lowercase. Same length as url.
				/// </summary>
				boost::string_ref urlLowercase;

				/// <summary>
				/// Offset and length of the request host inside either form of the URL.
				/// </summary>
				size_t hostOffset = 0;
				size_t hostLength = 0;

				/// <summary>
				/// The lowercase host of the page or frame that initiated the request.
				/// </summary>
				boost::string_ref sourceHost;

				/// <summary>
				/// The content type and party of the request.
				/// </summary>
				AbpFilterSettings settings;
			};

			/// <summary>
			/// The AbpFilter object serves the purpose of denying or permitting a request based
			/// on its URL, the host of the page that made it, its content type, and whether it
			/// is a third-party request.
			/// </summary>
			class AbpFilter
			{

				/// <summary>
				/// Allow the parser that constructs this object to be a friend. We all need
				/// friends.
				/// </summary>
				friend class AbpFilterParser;

			public:

				/// <summary>
				/// Simple named keys for determing the type of a rule part.
				/// </summary>
				enum RulePartType
				{

					/// <summary>
					/// An anchored domain string must be present within the host portion of
					/// the request, either at the very start of the host, or right after one of
					/// its dots. So, ||example.com can match http://example.com,
					/// http://www.example.com, http://sub.example.com, but not
					/// http://badexample.com. The string may run past the end of the host,
					/// as in ||example.com/ads.
					/// </summary>
					AnchoredAddress = 0,

					/// <summary>
					/// Match any number of characters, including none.
					/// </summary>
					Wildcard = 1,

					/// <summary>
					/// Matches a single separator character, which is anything but a letter,
					/// a digit, or one of "_-.%". Also matches the end of the address.
					/// </summary>
					Separator = 2,

					/// <summary>
					/// An exact string match.
					/// </summary>
					StringLiteral = 3,

					/// <summary>
					/// The text following an opening pipe must match the request from its
					/// very first character.
					/// </summary>
					AddressMatch = 4,

					/// <summary>
					/// End of address match applies whenever a single pipe is placed in a
					/// filter beyond position 0. The text preceeding the ending pipe must
					/// match the very end of the request.
					/// </summary>
					EndOfAddressMatch = 5
				};

				using FilterPart = std::tuple<boost::string_ref, RulePartType>;

				/// <summary>
				/// Constructs a new, empty AbpFilter object. Only meaningful once the parser has
				/// populated it.
				/// </summary>
				AbpFilter();

				/// <summary>
				/// Parts refer into the rule strings owned by this object, so the object can
				/// never be copied or moved.
				/// </summary>
				AbpFilter(const AbpFilter&) = delete;
				AbpFilter(AbpFilter&&) = delete;
				AbpFilter& operator=(const AbpFilter&) = delete;

				/// <summary>
				/// Default virtual destructor.
				/// </summary>
				virtual ~AbpFilter();

				/// <summary>
				/// Determine if the supplied request is found to match this filtering rule.
				/// Checks the request settings and source host against the rule options
				/// first, and only then walks the rule parts against the URL.
				/// </summary>
				/// <param name="request">
				/// The request to attempt matching against.
				/// </param>
				/// <returns>True if the filter was a match, false if not.</returns>
				virtual bool IsMatch(const AbpRequest& request) const;

				/// <summary>
				/// The original formatting of ABP filters is lost during parsing. This function
				/// provides read-only access to the retained, original filter string, options
				/// and exception prefix included. This is what gets reported as the rule
				/// responsible for a match.
				/// </summary>
				/// <returns>
				/// The original, unmodified filter string.
				/// </returns>
				virtual const std::string& GetPattern() const;

				/// <summary>
				/// This function provides read-only access to the configured settings for a
				/// filter rule.
				/// </summary>
				AbpFilterSettings GetFilterSettings() const;

				/// <summary>
				/// Indicates whether or not a positive match from this AbpFilter object
				/// indicates that the request should be allowed.
				/// </summary>
				bool IsException() const;

				/// <summary>
				/// Indicates whether this blocking filter carries the $important option, which
				/// makes it win over any exception filter.
				/// </summary>
				bool IsImportant() const;

				const std::vector<boost::string_ref>& GetExceptionDomains() const;

				const std::vector<boost::string_ref>& GetInclusionDomains() const;

				const std::vector<FilterPart>& GetFilterParts() const;

			protected:

				/// <summary>
				/// Components of the filtering rule.
				/// </summary>
				std::vector<FilterPart> m_filterParts;

				/// <summary>
				/// Source domains on which this rule must not apply.
				/// </summary>
				std::vector<boost::string_ref> m_exceptionDomains;

				/// <summary>
				/// Source domains this rule is restricted to. Empty means everywhere.
				/// </summary>
				std::vector<boost::string_ref> m_inclusionDomains;

				/// <summary>
				/// The rule options, as a collection of bits keyed by AbpFilterOption.
				/// </summary>
				AbpFilterSettings m_settings;

				/// <summary>
				/// A copy of the original rule string, kept for reporting. Never modified after
				/// parsing.
				/// </summary>
				std::string m_originalRuleString;

				/// <summary>
				/// A lowercase copy of the original rule string. Domains always refer into this
				/// string, and so do the filter parts unless the rule is $match-case.
				/// </summary>
				std::string m_normalizedRuleString;

				/// <summary>
				/// Indicates whether or not the constructed AbpFilter object's matching
				/// mechnism is intended to indicate that the request in question is to be
				/// whitelisted upon a successful match or not.
				/// </summary>
				bool m_isException = false;

				/// <summary>
				/// Method for determining if the traits of a request are compatible with the
				/// settings of this rule. A match is necessary for a rule to be applied.
				/// </summary>
				/// <param name="requestSettings">
				/// The extracted settings (based on the traits) of the request.
				/// </param>
				/// <returns>
				/// True if the rule filtering settings are applicable to the request, false
				/// otherwise.
				/// </returns>
				bool SettingsApply(const AbpFilterSettings requestSettings) const;

				/// <summary>
				/// Checks the $domain option against the host of the page that made the request.
				/// </summary>
				bool DomainsApply(boost::string_ref sourceHost) const;

			private:

				/// <summary>
				/// Attempts to match the filter parts from partIndex onwards against the URL,
				/// starting at position. Backtracks over every candidate position whenever a
				/// part is allowed to float, which happens for the first part and for any part
				/// that follows a wildcard.
				/// </summary>
				bool MatchParts(const AbpRequest& request, boost::string_ref data, const size_t partIndex, const size_t position) const;

			};

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
