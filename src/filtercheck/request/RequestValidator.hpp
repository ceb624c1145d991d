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

#include "../options/ProgramWideOptions.hpp"

namespace filtercheck
{
	namespace request
	{

		/// <summary>
		/// How requests reach the program.
		/// </summary>
		enum class RequestMode
		{
			/// <summary>
			/// One request, described by --url, --context and --type.
			/// </summary>
			SingleRequest,

			/// <summary>
			/// Lines of JSON request descriptions, read from --requests.
			/// </summary>
			Batch
		};

		/// <summary>
		/// The RequestValidator decides, from the parsed command line, whether the program
		/// checks a single request or a stream of them, and rejects invocations that are
		/// neither.
		/// </summary>
		class RequestValidator
		{

		public:

			/// <summary>
			/// Determines the request mode. The --url, --context and --type arguments must
			/// be either all provided, or none of them. When all are provided, the request
			/// they describe is checked and --requests is ignored. When none are provided,
			/// --requests is required.
			///
			/// In single request mode, --url and --context must also be absolute URLs and
			/// --type must be a known request type of either vocabulary.
			///
			/// Throws ConfigurationError when any of these conditions does not hold.
			/// </summary>
			/// <param name="programOptions">
			/// The parsed command line.
			/// </param>
			/// <returns>
			/// The request mode.
			/// </returns>
			static RequestMode Validate(const options::ProgramWideOptions& programOptions);

		};

	} /* namespace request */
} /* namespace filtercheck */
