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

#include <cstring>
#include <vector>
#include <boost/utility/string_ref.hpp>
#include <boost/functional/hash.hpp>

namespace filtercheck
{
	namespace util
	{
		namespace string
		{

			/// <summary>
			/// Compares the two string_ref objects for exact, case-sensitive equality.
			/// </summary>
			/// <param name="lhs">
			/// First string to compare against the second.
			/// </param>
			/// <param name="rhs">
			/// Second string to compare against the first.
			/// </param>
			/// <returns>
			/// True if both strings match exactly, false otherwise.
			/// </returns>
			inline bool Equal(boost::string_ref lhs, boost::string_ref rhs)
			{
				auto lhssize = lhs.size();

				if (lhssize != rhs.size())
				{
					return false;
				}

				if (lhssize == 0)
				{
					return true;
				}

				return std::memcmp(lhs.data(), rhs.data(), lhssize) == 0;
			}

			/// <summary>
			/// Splits the supplied string_ref by the supplied character delimiter. Empty
			/// pieces between consecutive delimiters are kept as empty string_refs, so
			/// callers can decide whether an empty piece is an error.
			/// </summary>
			/// <param name="what">
			/// The string_ref to split.
			/// </param>
			/// <param name="delim">
			/// The delimiter.
			/// </param>
			/// <returns>
			/// Every piece of the supplied string, in order. An empty input produces an
			/// empty collection.
			/// </returns>
			inline std::vector<boost::string_ref> Split(boost::string_ref what, const char delim)
			{
				std::vector<boost::string_ref> ret;

				if (what.size() == 0)
				{
					return ret;
				}

				auto i = what.find(delim);
				while (i != boost::string_ref::npos)
				{
					ret.push_back(what.substr(0, i));
					what = what.substr(i + 1);
					i = what.find(delim);
				}

				ret.push_back(what);

				return ret;
			}

			/// <summary>
			/// Checks whether the supplied host is either exactly the supplied domain, or a
			/// subdomain of it. So "ads.example.com" and "example.com" both fall under
			/// "example.com", but "badexample.com" does not.
			/// </summary>
			inline bool IsHostUnderDomain(boost::string_ref host, boost::string_ref domain)
			{
				if (domain.size() == 0 || host.size() < domain.size())
				{
					return false;
				}

				if (!host.ends_with(domain))
				{
					return false;
				}

				if (host.size() == domain.size())
				{
					return true;
				}

				return host[host.size() - domain.size() - 1] == '.';
			}

			/// <summary>
			/// Hash implementation for string_ref.
			/// </summary>
			struct StringRefHash
			{
				size_t operator()(const boost::string_ref strRef) const
				{
					return boost::hash_range(strRef.begin(), strRef.end());
				}
			};

		} /* namespace string */
	} /* namespace util */
} /* namespace filtercheck */
