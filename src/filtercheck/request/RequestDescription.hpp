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

namespace filtercheck
{
	namespace request
	{

		/// <summary>
		/// A single request to check. Built from the command line, or from one line of the
		/// requests input, and discarded once its result has been reported.
		/// </summary>
		struct RequestDescription
		{
			/// <summary>
			/// The full URL of the requested resource.
			/// </summary>
			std::string url;

			/// <summary>
			/// The full URL of the page or frame the request was made from.
			/// </summary>
			std::string context;

			/// <summary>
			/// The request type, in either the filter list or the Chromium vocabulary.
			/// </summary>
			std::string type;

			/// <summary>
			/// The required keys whose value in the requests input was not a string. Such a
			/// value is held above in its JSON text form. A request with any entry here is
			/// reported as an error and never reaches the filter engine.
			/// </summary>
			std::vector<std::string> nonStringKeys;
		};

	} /* namespace request */
} /* namespace filtercheck */
