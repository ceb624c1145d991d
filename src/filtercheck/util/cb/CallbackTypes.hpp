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

#include <cstddef>
#include <functional>

namespace filtercheck
{
	namespace util
	{
		namespace cb
		{

			/// <summary>
			/// Every component that deals with external input (rule lists, request streams, the
			/// command line) handles its own errors, but reports what happened through callbacks
			/// of this signature so that the hosting program decides where the text goes.
			/// </summary>
			using MessageFunction = std::function<void(const char* message, const size_t messageLength)>;

		} /* namespace cb */
	} /* namespace util */
} /* namespace filtercheck */
