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

#include <exception>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "FilterCheckCtl.hpp"
#include "options/CommandLineParser.hpp"
#include "options/ProgramWideOptions.hpp"

int main(int argc, char* argv[])
{
	// Results own stdout. Everything else goes to stderr.
	auto logger = spdlog::stderr_color_mt(u8"filtercheck");
	logger->set_pattern(u8"[%^%l%$] %v");
	logger->set_level(spdlog::level::warn);

	filtercheck::options::ProgramWideOptions programOptions;
	filtercheck::options::CommandLineParser parser;

	try
	{
		switch (parser.Parse(argc, argv, programOptions))
		{
			case filtercheck::options::CommandLineAction::ShowHelp:
			{
				std::cout << parser.GetUsage() << std::endl;
				return 0;
			}

			case filtercheck::options::CommandLineAction::ShowVersion:
			{
				std::cout << filtercheck::options::CommandLineParser::GetVersion() << std::endl;
				return 0;
			}

			case filtercheck::options::CommandLineAction::Run:
			break;
		}
	}
	catch (std::exception& e)
	{
		logger->error(u8"{}", e.what());
		std::cerr << parser.GetUsage() << std::endl;
		return 1;
	}

	if (programOptions.GetIsVerbose())
	{
		logger->set_level(spdlog::level::debug);
	}

	auto onInfo = [logger](const char* message, const size_t messageLength)
	{
		logger->debug(u8"{}", std::string(message, messageLength));
	};

	auto onWarning = [logger](const char* message, const size_t messageLength)
	{
		logger->warn(u8"{}", std::string(message, messageLength));
	};

	auto onError = [logger](const char* message, const size_t messageLength)
	{
		logger->error(u8"{}", std::string(message, messageLength));
	};

	try
	{
		filtercheck::FilterCheckCtl ctl(programOptions, std::cout, std::cin, onInfo, onWarning, onError);
		return ctl.Run();
	}
	catch (std::exception& e)
	{
		logger->error(u8"{}", e.what());
	}

	return 1;
}
