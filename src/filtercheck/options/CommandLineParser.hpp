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
#include <boost/program_options/options_description.hpp>
#include "ProgramWideOptions.hpp"

namespace filtercheck
{
	namespace options
	{

		/// <summary>
		/// What the program should do once the command line has been parsed.
		/// </summary>
		enum class CommandLineAction
		{
			Run,
			ShowHelp,
			ShowVersion
		};

		/// <summary>
		/// The CommandLineParser turns the program arguments into a ProgramWideOptions
		/// object. It only checks that the arguments are well formed. Whether they make sense
		/// together is for the RequestValidator to decide.
		/// </summary>
		class CommandLineParser
		{

		public:

			CommandLineParser();

			/// <summary>
			/// No copy no move no thx.
			/// </summary>
			CommandLineParser(const CommandLineParser&) = delete;
			CommandLineParser(CommandLineParser&&) = delete;
			CommandLineParser& operator=(const CommandLineParser&) = delete;

			~CommandLineParser();

			/// <summary>
			/// Parses the supplied arguments. Throws request::ConfigurationError on unknown
			/// options, missing option values or repeated options.
			/// </summary>
			/// <param name="argc">
			/// The argument count, program name included.
			/// </param>
			/// <param name="argv">
			/// The arguments, program name included.
			/// </param>
			/// <param name="programOptions">
			/// Receives the parsed options. Left untouched unless the action is Run.
			/// </param>
			/// <returns>
			/// The action the user asked for. Help and version take precedence over
			/// everything else.
			/// </returns>
			CommandLineAction Parse(int argc, const char* const argv[], ProgramWideOptions& programOptions) const;

			/// <summary>
			/// Gets the full usage text, as printed for --help.
			/// </summary>
			std::string GetUsage() const;

			/// <summary>
			/// Gets the program version, as printed for --version.
			/// </summary>
			static std::string GetVersion();

		private:

			boost::program_options::options_description m_description;

		};

	} /* namespace options */
} /* namespace filtercheck */
