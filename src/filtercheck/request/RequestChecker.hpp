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
#include "RequestDescription.hpp"
#include "../filtering/BaseFilterEngine.hpp"
#include "../util/cb/EventReporter.hpp"

namespace filtercheck
{
	namespace request
	{

		/// <summary>
		/// The RequestChecker hands requests over to a filter engine. It normalizes the
		/// request type first, and always asks the engine to take third-party status into
		/// account.
		///
		/// Errors raised by the engine are not fatal. They are reported through the error
		/// callback along with the request that caused them, and the request simply has no
		/// result. A request read with a key that is not a string fails the same way,
		/// without the engine being asked.
		/// </summary>
		class RequestChecker : public util::cb::EventReporter
		{

		public:

			/// <summary>
			/// Constructs a RequestChecker over the supplied engine, which must outlive it.
			/// </summary>
			RequestChecker(
				const filtering::BaseFilterEngine& engine,
				util::cb::MessageFunction onInfo = nullptr,
				util::cb::MessageFunction onWarning = nullptr,
				util::cb::MessageFunction onError = nullptr
				);

			~RequestChecker();

			/// <summary>
			/// Checks a single request.
			/// </summary>
			/// <param name="request">
			/// The request to check. Its type may be of either vocabulary.
			/// </param>
			/// <returns>
			/// The engine verdict, or nothing if the request could not be checked.
			/// </returns>
			boost::optional<filtering::MatchResult> CheckRequest(const RequestDescription& request) const;

		private:

			const filtering::BaseFilterEngine& m_engine;

			void ReportCheckFailure(const RequestDescription& request, const std::string& normalizedType, const std::string& reason) const;

		};

	} /* namespace request */
} /* namespace filtercheck */
