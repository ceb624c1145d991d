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

#include <cstdint>
#include <istream>
#include "../request/RequestDescription.hpp"
#include "../util/cb/EventReporter.hpp"

namespace filtercheck
{
	namespace batch
	{

		/// <summary>
		/// The BatchRequestReader reads request descriptions from a stream of newline
		/// delimited JSON documents, one request per line, in order. Each document must be an
		/// object with "url", "context" and "type" members. Any other member is ignored.
		/// Blank lines are skipped.
		///
		/// A line that is not JSON, is not an object, or lacks one of the three keys ends the
		/// whole batch: the reader throws, and nothing after that line is ever read. A key
		/// that is present but is not a string (null included) does not. The request is
		/// returned with that key listed in RequestDescription::nonStringKeys, and fails
		/// when it is checked.
		/// </summary>
		class BatchRequestReader : public util::cb::EventReporter
		{

		public:

			/// <summary>
			/// Constructs a reader over the supplied stream, which must outlive it.
			/// </summary>
			BatchRequestReader(
				std::istream& input,
				util::cb::MessageFunction onInfo = nullptr,
				util::cb::MessageFunction onWarning = nullptr,
				util::cb::MessageFunction onError = nullptr
				);

			/// <summary>
			/// No copy no move no thx.
			/// </summary>
			BatchRequestReader(const BatchRequestReader&) = delete;
			BatchRequestReader(BatchRequestReader&&) = delete;
			BatchRequestReader& operator=(const BatchRequestReader&) = delete;

			~BatchRequestReader();

			/// <summary>
			/// Reads the next request off the stream. Throws request::MalformedInputError
			/// when the line is not valid JSON, and request::MissingFieldError when it is
			/// not an object holding all three keys.
			/// </summary>
			/// <param name="request">
			/// Receives the request read.
			/// </param>
			/// <returns>
			/// True if a request was read, false at the end of the stream.
			/// </returns>
			bool ReadNext(request::RequestDescription& request);

			/// <summary>
			/// Gets the number of lines consumed so far, blank ones included.
			/// </summary>
			uint32_t GetLinesRead() const;

		private:

			std::istream& m_input;

			uint32_t m_linesRead = 0;

		};

	} /* namespace batch */
} /* namespace filtercheck */
