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
#include <bitset>
#include <cstdint>

namespace filtercheck
{
	namespace filtering
	{
		namespace abp
		{

			/// <summary>
			/// Each ABP Filter can specify many details about just what type of requests a
			/// filter ought to apply to. By configuring these options, it's possible to develop
			/// filters that will return a match against images, but not against scripts, or
			/// against third-party stylesheets, etc. This enum serves as a convenient key system
			/// for checking and setting options on the AbpFilterSettings object, a fixed-size
			/// bitset where any of these options, by the corresponding enum key, can be
			/// manipulated.
			///
			/// Every content type is immediately followed by its negation, so the negated key
			/// of any content type is always its own key plus one.
			///
			/// The same bitset is used to describe a request being checked. A request only ever
			/// sets one content type key, plus either third_party or notthird_party.
			/// </summary>
			enum AbpFilterOption
				: size_t
			{
				script = 0,
				notscript = 1,
				image = 2,
				notimage = 3,
				stylesheet = 4,
				notstylesheet = 5,
				object = 6,
				notobject = 7,
				xmlhttprequest = 8,
				notxmlhttprequest = 9,
				subdocument = 10,
				notsubdocument = 11,
				document = 12,
				notdocument = 13,
				media = 14,
				notmedia = 15,
				font = 16,
				notfont = 17,
				websocket = 18,
				notwebsocket = 19,
				ping = 20,
				notping = 21,
				other = 22,
				notother = 23,
				third_party = 24,
				notthird_party = 25,
				important = 26,
				match_case = 27
			};

			typedef std::bitset<28> AbpFilterSettings;

			/// <summary>
			/// All positive content type keys, in enum order.
			/// </summary>
			const std::array<AbpFilterOption, 12> AbpContentTypes
			{
				{
					script, image, stylesheet, object, xmlhttprequest, subdocument,
					document, media, font, websocket, ping, other
				}
			};

			inline AbpFilterOption NegationOf(const AbpFilterOption contentType)
			{
				return static_cast<AbpFilterOption>(static_cast<size_t>(contentType) + 1);
			}

		} /* namespace abp */
	} /* namespace filtering */
} /* namespace filtercheck */
