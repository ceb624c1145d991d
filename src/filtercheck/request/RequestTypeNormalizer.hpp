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

#include <array>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/utility/string_ref.hpp>
#include "../util/string/StringRefUtil.hpp"

namespace filtercheck
{
	namespace request
	{

		/// <summary>
		/// Request types come in two vocabularies. Filter list projects (Adblock Plus,
		/// uBlock Origin, AdGuard etc.) use lowercase names such as "xhr" or "stylesheet".
		/// Chromium uses the capitalized names produced by Blink's
		/// Resource::ResourceTypeToString and Resource::InitiatorTypeNameToString, such as
		/// "XMLHttpRequest" or "CSS stylesheet".
		///
		/// The RequestTypeNormalizer brings either onto the filter list vocabulary, which is
		/// the one filter engines understand.
		/// </summary>
		class RequestTypeNormalizer
		{

		public:

			/// <summary>
			/// Normalizes the supplied request type. Chromium types are mapped onto their
			/// filter list equivalent. Anything else, filter list types included, is returned
			/// unchanged. Never fails: unknown types are left for the filter engine to judge.
			/// </summary>
			/// <param name="requestType">
			/// The request type to normalize.
			/// </param>
			/// <returns>
			/// The request type in the filter list vocabulary.
			/// </returns>
			static std::string Normalize(const std::string& requestType);

			/// <summary>
			/// Checks whether the supplied request type belongs to either vocabulary.
			/// </summary>
			static bool IsKnownRequestType(const std::string& requestType);

			/// <summary>
			/// Gets every request type of both vocabularies, sorted.
			/// </summary>
			static std::vector<std::string> GetRequestTypeOptions();

		private:

			/// <summary>
			/// Types defined by filter list projects. See for example
			/// https://github.com/gorhill/uBlock/wiki/Static-filter-syntax
			/// </summary>
			static const std::array<boost::string_ref, 19> FilterListRequestTypes;

			/// <summary>
			/// Chromium types, mapped onto filter list types. The OTHER catch all of Blink is
			/// spread over the initiator types it stands for.
			/// </summary>
			static const std::unordered_map<boost::string_ref, boost::string_ref, util::string::StringRefHash> ChromiumRequestTypeMapping;

		};

	} /* namespace request */
} /* namespace filtercheck */
