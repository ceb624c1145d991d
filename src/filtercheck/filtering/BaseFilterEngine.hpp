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
#include "MatchResult.hpp"
#include "../util/cb/EventReporter.hpp"

namespace filtercheck
{
	namespace filtering
	{

		/// <summary>
		/// The BaseFilterEngine class is the seam between the command line program and
		/// whatever compiles filter rules and answers match queries. Everything outside of
		/// the filtering namespace only ever talks to this interface.
		///
		/// An engine is loaded once, before the first query, and is read-only afterwards, so
		/// queries need no synchronization.
		/// </summary>
		class BaseFilterEngine : public util::cb::EventReporter
		{

		public:

			/// <summary>
			/// Default destructor.
			/// </summary>
			virtual ~BaseFilterEngine();

			/// <summary>
			/// No copy no move no thx.
			/// </summary>
			BaseFilterEngine(const BaseFilterEngine&) = delete;
			BaseFilterEngine(BaseFilterEngine&&) = delete;
			BaseFilterEngine& operator=(const BaseFilterEngine&) = delete;

			/// <summary>
			/// Determines whether the described request would be blocked by the loaded rules.
			/// This method should be expected to throw std::runtime_error when the engine
			/// cannot make sense of the request, such as a malformed URL or a request type it
			/// does not know. The ::what() member will contain details of the error.
			/// </summary>
			/// <param name="url">
			/// The full URL of the requested resource.
			/// </param>
			/// <param name="context">
			/// The full URL of the page or frame that made the request.
			/// </param>
			/// <param name="requestType">
			/// The request type, in the lowercase filter list vocabulary.
			/// </param>
			/// <param name="considerThirdParty">
			/// Whether the engine should work out if the request is third-party, and apply
			/// rules bound to one party accordingly.
			/// </param>
			/// <returns>
			/// The verdict for the request.
			/// </returns>
			virtual MatchResult Check(
				const std::string& url,
				const std::string& context,
				const std::string& requestType,
				const bool considerThirdParty
				) const = 0;

		protected:

			BaseFilterEngine(
				util::cb::MessageFunction onInfo = nullptr,
				util::cb::MessageFunction onWarning = nullptr,
				util::cb::MessageFunction onError = nullptr
				);

		};

	} /* namespace filtering */
} /* namespace filtercheck */
