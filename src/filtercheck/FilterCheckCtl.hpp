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

#include <istream>
#include <ostream>
#include "options/ProgramWideOptions.hpp"
#include "request/RequestValidator.hpp"
#include "util/cb/EventReporter.hpp"

namespace filtercheck
{

	namespace filtering
	{

		class BaseFilterEngine;

	} /* namespace filtering */

	/// <summary>
	/// The FilterCheckCtl class drives one invocation of the program. It decides how
	/// requests arrive, loads the rule files, checks every request and prints the results.
	///
	/// Errors that end the invocation (bad arguments, unreadable files, malformed batch
	/// input) are thrown out of Run. Errors the engine raises while checking an individual
	/// request are reported through the error callback, and only change the exit code.
	/// </summary>
	class FilterCheckCtl : public util::cb::EventReporter
	{

	public:

		/// <summary>
		/// Constructs a FilterCheckCtl. The streams must outlive it.
		/// </summary>
		/// <param name="programOptions">
		/// The parsed command line.
		/// </param>
		/// <param name="output">
		/// Where results are printed.
		/// </param>
		/// <param name="input">
		/// The stream read when requests are to be read from "-".
		/// </param>
		/// <param name="onInfo">
		/// Callback for general information about non-critical events.
		/// </param>
		/// <param name="onWarning">
		/// Callback for warnings about potentially critical events.
		/// </param>
		/// <param name="onError">
		/// Callback for error information about critical events that were handled.
		/// </param>
		FilterCheckCtl(
			const options::ProgramWideOptions& programOptions,
			std::ostream& output,
			std::istream& input,
			util::cb::MessageFunction onInfo = nullptr,
			util::cb::MessageFunction onWarning = nullptr,
			util::cb::MessageFunction onError = nullptr
			);

		/// <summary>
		/// No copy no move no thx.
		/// </summary>
		FilterCheckCtl(const FilterCheckCtl&) = delete;
		FilterCheckCtl(FilterCheckCtl&&) = delete;
		FilterCheckCtl& operator=(const FilterCheckCtl&) = delete;

		~FilterCheckCtl();

		/// <summary>
		/// Validates the arguments, loads the configured rule files into a new engine and
		/// checks every request against it. Nothing is loaded if the arguments are invalid.
		/// </summary>
		/// <returns>
		/// The process exit code. Zero when every request was checked, one when any
		/// request could not be.
		/// </returns>
		int Run();

		/// <summary>
		/// Validates the arguments and checks every request against the supplied,
		/// already loaded engine.
		/// </summary>
		/// <returns>
		/// The process exit code. Zero when every request was checked, one when any
		/// request could not be.
		/// </returns>
		int Run(const filtering::BaseFilterEngine& engine);

	private:

		const options::ProgramWideOptions& m_programOptions;

		std::ostream& m_output;

		std::istream& m_input;

		int RunChecks(const filtering::BaseFilterEngine& engine, const request::RequestMode mode);

		int CheckSingleRequest(const filtering::BaseFilterEngine& engine);

		int CheckBatch(const filtering::BaseFilterEngine& engine, std::istream& requests);

	};

} /* namespace filtercheck */
