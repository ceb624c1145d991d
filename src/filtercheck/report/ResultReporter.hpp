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

#include <ostream>
#include <string>
#include <boost/optional.hpp>
#include "../filtering/MatchResult.hpp"

namespace filtercheck
{
	namespace report
	{

		/// <summary>
		/// The ResultReporter prints one line per checked request, and remembers whether any
		/// request could not be checked at all.
		/// </summary>
		class ResultReporter
		{

		public:

			/// <summary>
			/// Constructs a ResultReporter writing to the supplied stream, which must outlive
			/// it.
			/// </summary>
			/// <param name="output">
			/// Where results are printed.
			/// </param>
			/// <param name="verbose">
			/// When true, each result is printed as a JSON object holding everything the
			/// engine reported. Otherwise only "true" or "false" is printed.
			/// </param>
			ResultReporter(std::ostream& output, const bool verbose);

			/// <summary>
			/// No copy no move no thx.
			/// </summary>
			ResultReporter(const ResultReporter&) = delete;
			ResultReporter(ResultReporter&&) = delete;
			ResultReporter& operator=(const ResultReporter&) = delete;

			~ResultReporter();

			/// <summary>
			/// Reports the result of a single request. An empty result marks an error and
			/// prints nothing.
			/// </summary>
			void Report(const boost::optional<filtering::MatchResult>& result);

			/// <summary>
			/// Indicates whether any reported result was an error.
			/// </summary>
			bool GetAnyErrors() const;

			/// <summary>
			/// Serializes a result as a single line JSON object. Absent rule texts are
			/// written as null, and bytes that are not valid UTF-8 are written as U+FFFD.
			/// </summary>
			static std::string ToJson(const filtering::MatchResult& result);

		private:

			std::ostream& m_output;

			bool m_verbose;

			bool m_anyErrors = false;

		};

	} /* namespace report */
} /* namespace filtercheck */
