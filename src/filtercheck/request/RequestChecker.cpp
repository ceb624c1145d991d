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

#include "RequestChecker.hpp"
#include <exception>
#include <string>
#include "RequestTypeNormalizer.hpp"

namespace filtercheck
{
	namespace request
	{

		RequestChecker::RequestChecker(
			const filtering::BaseFilterEngine& engine,
			util::cb::MessageFunction onInfo,
			util::cb::MessageFunction onWarning,
			util::cb::MessageFunction onError
			) :
			util::cb::EventReporter(
				onInfo,
				onWarning,
				onError
				),
			m_engine(engine)
		{

		}

		RequestChecker::~RequestChecker()
		{

		}

		boost::optional<filtering::MatchResult> RequestChecker::CheckRequest(const RequestDescription& request) const
		{
			const auto normalizedType = RequestTypeNormalizer::Normalize(request.type);

			if (request.nonStringKeys.size() > 0)
			{
				std::string keyMessage(u8"Request description key \"");
				keyMessage.append(request.nonStringKeys.front()).append(u8"\" is not a string.");
				ReportCheckFailure(request, normalizedType, keyMessage);
				return boost::none;
			}

			try
			{
				return m_engine.Check(request.url, request.context, normalizedType, true);
			}
			catch (std::exception& e)
			{
				ReportCheckFailure(request, normalizedType, e.what());
			}

			return boost::none;
		}

		void RequestChecker::ReportCheckFailure(const RequestDescription& request, const std::string& normalizedType, const std::string& reason) const
		{
			std::string errMessage(u8"Error checking request: url:");
			errMessage.append(request.url).append(u8", context:").append(request.context).append(u8", type:").append(normalizedType);
			ReportError(errMessage);

			std::string engineMessage(u8"filter engine error: ");
			engineMessage.append(reason);
			ReportError(engineMessage);
		}

	} /* namespace request */
} /* namespace filtercheck */
