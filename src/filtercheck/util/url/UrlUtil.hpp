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
#include <boost/utility/string_ref.hpp>

namespace filtercheck
{
	namespace util
	{
		namespace url
		{

			/// <summary>
			/// Attempts to pull the host portion out of an absolute URL. The URL must carry a
			/// scheme followed by "://" and a non-empty authority. Any user info and port are
			/// stripped, and the brackets around IPv6 literals are removed.
			/// </summary>
			/// <param name="url">
			/// The absolute URL to examine.
			/// </param>
			/// <param name="host">
			/// Receives the host on success. Refers into the supplied url, so it must not
			/// outlive it. Untouched on failure.
			/// </param>
			/// <returns>
			/// True if the URL was absolute and had a host, false otherwise.
			/// </returns>
			bool TryExtractHost(boost::string_ref url, boost::string_ref& host);

			/// <summary>
			/// Checks if the supplied string is an absolute URL with a host.
			/// </summary>
			bool IsAbsoluteUrl(boost::string_ref url);

			/// <summary>
			/// Computes the registrable ("base") domain of a host, used to decide whether two
			/// hosts belong to the same site. This is an approximation of the public suffix
			/// list: the last two labels, or the last three when the host sits under a
			/// common two-level registry such as "co.uk" or "com.au". IP addresses and
			/// single-label hosts are returned as is.
			/// </summary>
			/// <param name="host">
			/// A lowercase host name, as returned by TryExtractHost.
			/// </param>
			/// <returns>
			/// The base domain.
			/// </returns>
			std::string GetBaseDomain(boost::string_ref host);

		} /* namespace url */
	} /* namespace util */
} /* namespace filtercheck */
