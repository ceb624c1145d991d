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

#include <stdexcept>
#include <string>

namespace filtercheck
{
	namespace request
	{

		/// <summary>
		/// Thrown when the command line is contradictory or insufficient. Always fatal, and
		/// always raised before any request is checked.
		/// </summary>
		class ConfigurationError : public std::runtime_error
		{

		public:

			explicit ConfigurationError(const std::string& message) : std::runtime_error(message)
			{

			}

		};

		/// <summary>
		/// Thrown when a line of the requests input is not valid JSON. Fatal for the whole run.
		/// </summary>
		class MalformedInputError : public std::runtime_error
		{

		public:

			explicit MalformedInputError(const std::string& message) : std::runtime_error(message)
			{

			}

		};

		/// <summary>
		/// Thrown when a line of the requests input lacks one of the url, context or type
		/// keys. Fatal for the whole run.
		/// </summary>
		class MissingFieldError : public std::runtime_error
		{

		public:

			explicit MissingFieldError(const std::string& message) : std::runtime_error(message)
			{

			}

		};

	} /* namespace request */
} /* namespace filtercheck */
