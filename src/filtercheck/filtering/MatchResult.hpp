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
#include <boost/optional.hpp>

namespace filtercheck
{
	namespace filtering
	{

		/// <summary>
		/// The verdict of a filter engine for a single request.
		/// </summary>
		struct MatchResult
		{
			/// <summary>
			/// True if the request would be blocked.
			/// </summary>
			bool matched = false;

			/// <summary>
			/// True if the blocking rule carried $important, meaning no exception rule was
			/// consulted.
			/// </summary>
			bool important = false;

			/// <summary>
			/// The original text of the blocking rule that matched, if any. Present even when an
			/// exception rule cancelled the block.
			/// </summary>
			boost::optional<std::string> filter;

			/// <summary>
			/// The original text of the exception rule that cancelled the block, if any.
			/// </summary>
			boost::optional<std::string> exception;
		};

	} /* namespace filtering */
} /* namespace filtercheck */
