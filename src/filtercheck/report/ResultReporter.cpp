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

#include "ResultReporter.hpp"
#include <nlohmann/json.hpp>

namespace filtercheck
{
	namespace report
	{

		using json = nlohmann::json;

		ResultReporter::ResultReporter(std::ostream& output, const bool verbose) :
			m_output(output),
			m_verbose(verbose)
		{

		}

		ResultReporter::~ResultReporter()
		{

		}

		void ResultReporter::Report(const boost::optional<filtering::MatchResult>& result)
		{
			if (!result)
			{
				m_anyErrors = true;
				return;
			}

			if (m_verbose)
			{
				m_output << ToJson(*result) << std::endl;
				return;
			}

			m_output << (result->matched ? u8"true" : u8"false") << std::endl;
		}

		bool ResultReporter::GetAnyErrors() const
		{
			return m_anyErrors;
		}

		std::string ResultReporter::ToJson(const filtering::MatchResult& result)
		{
			json document;

			document[u8"matched"] = result.matched;
			document[u8"important"] = result.important;
			document[u8"filter"] = result.filter ? json(*result.filter) : json(nullptr);
			document[u8"exception"] = result.exception ? json(*result.exception) : json(nullptr);

			// Rule files are not guaranteed to be UTF-8. Invalid bytes are replaced so a single
			// rule can never stop a batch.
			return document.dump(-1, ' ', false, json::error_handler_t::replace);
		}

	} /* namespace report */
} /* namespace filtercheck */
