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

#include "FilterCheckCtl.hpp"
#include <fstream>
#include <string>
#include "batch/BatchRequestReader.hpp"
#include "filtering/abp/AbpFilterEngine.hpp"
#include "report/ResultReporter.hpp"
#include "request/RequestChecker.hpp"
#include "request/RequestErrors.hpp"

namespace filtercheck
{

	FilterCheckCtl::FilterCheckCtl(
		const options::ProgramWideOptions& programOptions,
		std::ostream& output,
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
		m_programOptions(programOptions),
		m_output(output),
		m_input(input)
	{

	}

	FilterCheckCtl::~FilterCheckCtl()
	{

	}

	int FilterCheckCtl::Run()
	{
		// Bad arguments must be rejected before paying for rule compilation.
		const auto mode = request::RequestValidator::Validate(m_programOptions);

		filtering::abp::AbpFilterEngine engine(m_onInfo, m_onWarning, m_onError);

		for (const auto& ruleFilePath : m_programOptions.GetRuleFilePaths())
		{
			engine.LoadAbpFormattedListFromFile(ruleFilePath);
		}

		ReportInfo(u8"Compiled " + std::to_string(engine.GetFilterCount()) + u8" network filters.");

		return RunChecks(engine, mode);
	}

	int FilterCheckCtl::Run(const filtering::BaseFilterEngine& engine)
	{
		const auto mode = request::RequestValidator::Validate(m_programOptions);

		return RunChecks(engine, mode);
	}

	int FilterCheckCtl::RunChecks(const filtering::BaseFilterEngine& engine, const request::RequestMode mode)
	{
		if (mode == request::RequestMode::SingleRequest)
		{
			return CheckSingleRequest(engine);
		}

		const auto& requestsPath = *m_programOptions.GetRequestsPath();

		if (requestsPath == u8"-")
		{
			return CheckBatch(engine, m_input);
		}

		std::ifstream requestsFile(requestsPath);

		if (!requestsFile.is_open())
		{
			throw request::ConfigurationError(u8"argument --requests: can't open '" + requestsPath + u8"'");
		}

		return CheckBatch(engine, requestsFile);
	}

	int FilterCheckCtl::CheckSingleRequest(const filtering::BaseFilterEngine& engine)
	{
		request::RequestChecker checker(engine, m_onInfo, m_onWarning, m_onError);
		report::ResultReporter reporter(m_output, m_programOptions.GetIsVerbose());

		request::RequestDescription description;
		description.url = *m_programOptions.GetUrl();
		description.context = *m_programOptions.GetContext();
		description.type = *m_programOptions.GetType();

		reporter.Report(checker.CheckRequest(description));

		return reporter.GetAnyErrors() ? 1 : 0;
	}

	int FilterCheckCtl::CheckBatch(const filtering::BaseFilterEngine& engine, std::istream& requests)
	{
		batch::BatchRequestReader reader(requests, m_onInfo, m_onWarning, m_onError);
		request::RequestChecker checker(engine, m_onInfo, m_onWarning, m_onError);
		report::ResultReporter reporter(m_output, m_programOptions.GetIsVerbose());

		request::RequestDescription description;
		uint32_t checked = 0;

		while (reader.ReadNext(description))
		{
			reporter.Report(checker.CheckRequest(description));
			++checked;
		}

		ReportInfo(u8"Checked " + std::to_string(checked) + u8" requests.");

		return reporter.GetAnyErrors() ? 1 : 0;
	}

} /* namespace filtercheck */
