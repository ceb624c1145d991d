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

#include "RequestValidator.hpp"
#include <boost/algorithm/string/join.hpp>
#include "RequestErrors.hpp"
#include "RequestTypeNormalizer.hpp"
#include "../util/url/UrlUtil.hpp"

namespace filtercheck
{
	namespace request
	{

		RequestMode RequestValidator::Validate(const options::ProgramWideOptions& programOptions)
		{
			const auto& url = programOptions.GetUrl();
			const auto& context = programOptions.GetContext();
			const auto& type = programOptions.GetType();

			const bool receivedAnyRequestArgs = (url || context || type);
			const bool receivedAllRequestArgs = (url && context && type);

			if (receivedAnyRequestArgs)
			{
				if (!receivedAllRequestArgs)
				{
					throw ConfigurationError(u8"--url, --context, and --type must be either all provided, or none of them provided.");
				}

				if (!util::url::IsAbsoluteUrl(*url))
				{
					throw ConfigurationError(u8"argument --url: invalid URL value: '" + *url + u8"'");
				}

				if (!util::url::IsAbsoluteUrl(*context))
				{
					throw ConfigurationError(u8"argument --context: invalid URL value: '" + *context + u8"'");
				}

				if (!RequestTypeNormalizer::IsKnownRequestType(*type))
				{
					throw ConfigurationError(
						u8"argument --type: invalid choice: '" + *type + u8"' (choose from " +
						boost::algorithm::join(RequestTypeNormalizer::GetRequestTypeOptions(), u8", ") + u8")"
						);
				}

				return RequestMode::SingleRequest;
			}

			if (!programOptions.GetRequestsPath())
			{
				throw ConfigurationError(u8"Must use either --requests to describe where to read request information from, or the --url, --context, and --type arguments to describe the request.");
			}

			return RequestMode::Batch;
		}

	} /* namespace request */
} /* namespace filtercheck */
