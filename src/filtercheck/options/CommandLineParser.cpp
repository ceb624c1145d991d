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

#include "CommandLineParser.hpp"
#include <sstream>
#include <vector>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include "../request/RequestErrors.hpp"

#ifndef FILTERCHECK_VERSION
	#define FILTERCHECK_VERSION "0.0.0"
#endif

namespace filtercheck
{
	namespace options
	{

		namespace po = boost::program_options;

		CommandLineParser::CommandLineParser() : m_description(u8"Options")
		{
			m_description.add_options()
				(u8"help,h", u8"Show this help message and exit.")
				(u8"version,v", u8"Show the program's version number and exit.")
				(u8"requests", po::value<std::string>()->value_name(u8"PATH"),
					u8"Path to a file of requests to check filter list rules against. This input "
					u8"should be lines of JSON documents, one document per line. This JSON text "
					u8"must have the following keys: \"url\", \"context\", and \"type\", which "
					u8"correspond to the --url, --context, and --type arguments. Use \"-\" to read "
					u8"from stdin.")
				(u8"url", po::value<std::string>()->value_name(u8"URL"),
					u8"The full URL to check against the provided filter lists.")
				(u8"context", po::value<std::string>()->value_name(u8"URL"),
					u8"The security context the request occurred in, as a full URL.")
				(u8"type", po::value<std::string>()->value_name(u8"TYPE"),
					u8"The type of the request, using either i. the types defined by filter list "
					u8"projects (which are all in lowercase, e.g., \"xhr\" or \"stylesheet\"), or "
					u8"ii. the types defined in the Chromium source (which start with an uppercase "
					u8"character, e.g., \"XMLHttpRequest\" or \"CSS stylesheet\").")
				(u8"rules", po::value<std::vector<std::string>>()->multitoken()->zero_tokens()->value_name(u8"PATH"),
					u8"One or more paths to files of filter list rules to check the request "
					u8"against. By default uses bundled old-and-outdated versions of easylist and "
					u8"easyprivacy.")
				(u8"verbose", po::bool_switch(),
					u8"Print information about what rule(s) the request matched.");
		}

		CommandLineParser::~CommandLineParser()
		{

		}

		CommandLineAction CommandLineParser::Parse(int argc, const char* const argv[], ProgramWideOptions& programOptions) const
		{
			po::variables_map vm;

			try
			{
				po::store(po::command_line_parser(argc, argv).options(m_description).run(), vm);
				po::notify(vm);
			}
			catch (po::error& e)
			{
				throw request::ConfigurationError(e.what());
			}

			if (vm.count(u8"help"))
			{
				return CommandLineAction::ShowHelp;
			}

			if (vm.count(u8"version"))
			{
				return CommandLineAction::ShowVersion;
			}

			if (vm.count(u8"url"))
			{
				programOptions.SetUrl(vm[u8"url"].as<std::string>());
			}

			if (vm.count(u8"context"))
			{
				programOptions.SetContext(vm[u8"context"].as<std::string>());
			}

			if (vm.count(u8"type"))
			{
				programOptions.SetType(vm[u8"type"].as<std::string>());
			}

			if (vm.count(u8"requests"))
			{
				programOptions.SetRequestsPath(vm[u8"requests"].as<std::string>());
			}

			if (vm.count(u8"rules"))
			{
				programOptions.SetRuleFilePaths(vm[u8"rules"].as<std::vector<std::string>>());
			}

			programOptions.SetIsVerbose(vm[u8"verbose"].as<bool>());

			return CommandLineAction::Run;
		}

		std::string CommandLineParser::GetUsage() const
		{
			std::ostringstream usage;

			usage << u8"Usage: filtercheck [--url URL --context URL --type TYPE | --requests PATH] [--rules [PATH ...]] [--verbose]" << std::endl;
			usage << std::endl;
			usage << u8"Check whether a URL would be blocked by given filter list rules" << std::endl;
			usage << std::endl;
			usage << m_description;

			return usage.str();
		}

		std::string CommandLineParser::GetVersion()
		{
			return FILTERCHECK_VERSION;
		}

	} /* namespace options */
} /* namespace filtercheck */
