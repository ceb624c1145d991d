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

#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace filtercheck
{
	namespace options
	{

		/// <summary>
		/// The ProgramWideOptions class holds everything the user asked for on the command
		/// line, for the lifetime of the program. Request arguments that were not given are
		/// left empty rather than defaulted, because the mere presence of each of them
		/// decides how the program is invoked.
		/// </summary>
		class ProgramWideOptions
		{

		public:

			/// <summary>
			/// Default constructor. No request arguments, no rule files, not verbose.
			/// </summary>
			ProgramWideOptions();

			/// <summary>
			/// Default destructor.
			/// </summary>
			~ProgramWideOptions();

			const boost::optional<std::string>& GetUrl() const;

			void SetUrl(const std::string& url);

			const boost::optional<std::string>& GetContext() const;

			void SetContext(const std::string& context);

			const boost::optional<std::string>& GetType() const;

			void SetType(const std::string& type);

			/// <summary>
			/// Gets the path requests should be read from, where "-" means standard input.
			/// </summary>
			const boost::optional<std::string>& GetRequestsPath() const;

			void SetRequestsPath(const std::string& requestsPath);

			/// <summary>
			/// Gets the rule files to load. When the user did not pass --rules, these are the
			/// bundled lists.
			/// </summary>
			/// <returns>
			/// The paths of the rule files to load.
			/// </returns>
			std::vector<std::string> GetRuleFilePaths() const;

			void SetRuleFilePaths(const std::vector<std::string>& ruleFilePaths);

			/// <summary>
			/// Check if results should be printed in full rather than as a bare verdict.
			/// </summary>
			bool GetIsVerbose() const;

			void SetIsVerbose(const bool value);

			/// <summary>
			/// Gets the paths of the bundled lists, an old copy of EasyList and EasyPrivacy.
			/// They live in the directory named by the FILTERCHECK_RESOURCE_DIR environment
			/// variable if set, or else in the resource directory chosen at build time.
			/// </summary>
			static std::vector<std::string> GetDefaultRuleFilePaths();

		private:

			boost::optional<std::string> m_url;

			boost::optional<std::string> m_context;

			boost::optional<std::string> m_type;

			boost::optional<std::string> m_requestsPath;

			/// <summary>
			/// Rule files given by the user. Unset means use the bundled lists, while an
			/// empty collection means the user explicitly asked for no rules at all.
			/// </summary>
			boost::optional<std::vector<std::string>> m_ruleFilePaths;

			bool m_verbose = false;

		};

	} /* namespace options */
} /* namespace filtercheck */
