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

#include "BatchRequestReader.hpp"
#include <string>
#include <vector>
#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>
#include "../request/RequestErrors.hpp"

namespace filtercheck
{
	namespace batch
	{

		using json = nlohmann::json;

		namespace
		{

			/// <summary>
			/// Copies a required key into the supplied field. A value that is present but
			/// is not a string is kept in its JSON text form and its key is recorded, so
			/// that the request fails on its own rather than ending the batch.
			/// </summary>
			void ReadRequiredKey(const json& document, const char* key, const std::string& line, std::string& field, std::vector<std::string>& nonStringKeys)
			{
				auto member = document.find(key);

				if (member == document.end())
				{
					throw request::MissingFieldError(
						u8"Request description does not include all three required keys, \"url\", \"type\", \"context\".\n" + line
						);
				}

				if (!member->is_string())
				{
					field = member->dump(-1, ' ', false, json::error_handler_t::replace);
					nonStringKeys.push_back(key);
					return;
				}

				field = member->get_ref<const std::string&>();
			}

		}

		BatchRequestReader::BatchRequestReader(
			std::istream& input,
			util::cb::MessageFunction onInfo,
			util::cb::MessageFunction onWarning,
			util::cb::MessageFunction onError
			) :
			util::cb::EventReporter(
				onInfo,
				onWarning,
				onError
				),
			m_input(input)
		{

		}

		BatchRequestReader::~BatchRequestReader()
		{

		}

		bool BatchRequestReader::ReadNext(request::RequestDescription& request)
		{
			std::string line;

			while (std::getline(m_input, line))
			{
				++m_linesRead;

				if (boost::algorithm::trim_copy(line).size() == 0)
				{
					continue;
				}

				// Input written on Windows keeps a carriage return at the end of each line.
				if (line[line.size() - 1] == '\r')
				{
					line.pop_back();
				}

				json document;

				try
				{
					document = json::parse(line);
				}
				catch (json::parse_error& e)
				{
					ReportInfo(u8"In BatchRequestReader::ReadNext(request::RequestDescription&) - Line " + std::to_string(m_linesRead) + u8": " + e.what());
					throw request::MalformedInputError(u8"Invalid JSON in requests input: " + line);
				}

				if (!document.is_object())
				{
					throw request::MissingFieldError(
						u8"Request description does not include all three required keys, \"url\", \"type\", \"context\".\n" + line
						);
				}

				request.nonStringKeys.clear();

				ReadRequiredKey(document, u8"url", line, request.url, request.nonStringKeys);
				ReadRequiredKey(document, u8"context", line, request.context, request.nonStringKeys);
				ReadRequiredKey(document, u8"type", line, request.type, request.nonStringKeys);

				return true;
			}

			return false;
		}

		uint32_t BatchRequestReader::GetLinesRead() const
		{
			return m_linesRead;
		}

	} /* namespace batch */
} /* namespace filtercheck */
