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

#include "ProgramWideOptions.hpp"
#include <cstdlib>

#ifndef FILTERCHECK_RESOURCE_DIR
	#define FILTERCHECK_RESOURCE_DIR "./resources"
#endif

namespace filtercheck
{
	namespace options
	{

		ProgramWideOptions::ProgramWideOptions()
		{

		}

		ProgramWideOptions::~ProgramWideOptions()
		{

		}

		const boost::optional<std::string>& ProgramWideOptions::GetUrl() const
		{
			return m_url;
		}

		void ProgramWideOptions::SetUrl(const std::string& url)
		{
			m_url = url;
		}

		const boost::optional<std::string>& ProgramWideOptions::GetContext() const
		{
			return m_context;
		}

		void ProgramWideOptions::SetContext(const std::string& context)
		{
			m_context = context;
		}

		const boost::optional<std::string>& ProgramWideOptions::GetType() const
		{
			return m_type;
		}

		void ProgramWideOptions::SetType(const std::string& type)
		{
			m_type = type;
		}

		const boost::optional<std::string>& ProgramWideOptions::GetRequestsPath() const
		{
			return m_requestsPath;
		}

		void ProgramWideOptions::SetRequestsPath(const std::string& requestsPath)
		{
			m_requestsPath = requestsPath;
		}

		std::vector<std::string> ProgramWideOptions::GetRuleFilePaths() const
		{
			if (!m_ruleFilePaths)
			{
				return GetDefaultRuleFilePaths();
			}

			return *m_ruleFilePaths;
		}

		void ProgramWideOptions::SetRuleFilePaths(const std::vector<std::string>& ruleFilePaths)
		{
			m_ruleFilePaths = ruleFilePaths;
		}

		bool ProgramWideOptions::GetIsVerbose() const
		{
			return m_verbose;
		}

		void ProgramWideOptions::SetIsVerbose(const bool value)
		{
			m_verbose = value;
		}

		std::vector<std::string> ProgramWideOptions::GetDefaultRuleFilePaths()
		{
			std::string resourceDir(FILTERCHECK_RESOURCE_DIR);

			const char* resourceDirOverride = std::getenv("FILTERCHECK_RESOURCE_DIR");

			if (resourceDirOverride != nullptr && resourceDirOverride[0] != '\0')
			{
				resourceDir = resourceDirOverride;
			}

			if (resourceDir.size() > 0 && resourceDir[resourceDir.size() - 1] != '/')
			{
				resourceDir.push_back('/');
			}

			return { resourceDir + u8"easylist.txt", resourceDir + u8"easyprivacy.txt" };
		}

	} /* namespace options */
} /* namespace filtercheck */
