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

#include <boost/utility/string_ref.hpp>
#include "CallbackTypes.hpp"

namespace filtercheck
{
	namespace util
	{
		namespace cb
		{

			/// <summary>
			/// The EventReporter class is a base for any class that needs to deliver
			/// informational, warning and error messages to whoever hosts it. Nothing here
			/// writes anywhere by itself. If a callback is not supplied, messages of that
			/// level are simply dropped.
			///
			/// The reporting methods are virtual so that a derived class may
			/// decorate messages, while keeping this basic class basic.
			/// </summary>
			class EventReporter
			{

			public:

				/// <summary>
				/// Constructs members with the given arguments. Nothing special here.
				/// </summary>
				/// <param name="onInfo">
				/// Callback for general information about non-critical events.
				/// </param>
				/// <param name="onWarning">
				/// Callback for warnings about potentially critical events.
				/// </param>
				/// <param name="onError">
				/// Callback for error information about critical events that were handled.
				/// </param>
				EventReporter(
					MessageFunction onInfo = nullptr,
					MessageFunction onWarning = nullptr,
					MessageFunction onError = nullptr
					) :
					m_onInfo(onInfo),
					m_onWarning(onWarning),
					m_onError(onError)
				{

				}

				/// <summary>
				/// Default destructor.
				/// </summary>
				virtual ~EventReporter()
				{

				}

				/// <summary>
				/// If the info callback member is valid, invokes it with the informational
				/// message data as arguments.
				/// </summary>
				/// <param name="infoMessage">
				/// An informational string about a non-critical event.
				/// </param>
				virtual void ReportInfo(const boost::string_ref infoMessage) const
				{
					if (m_onInfo && infoMessage.data())
					{
						m_onInfo(infoMessage.data(), infoMessage.size());
					}
				}

				/// <summary>
				/// If the warning callback member is valid, invokes it with the warning message
				/// data as arguments.
				/// </summary>
				/// <param name="warningMessage">
				/// An informational string about potentially critical event.
				/// </param>
				virtual void ReportWarning(const boost::string_ref warningMessage) const
				{
					if (m_onWarning && warningMessage.data())
					{
						m_onWarning(warningMessage.data(), warningMessage.size());
					}
				}

				/// <summary>
				/// If the error callback member is valid, invokes it with the error message
				/// data as arguments.
				/// </summary>
				/// <param name="errorMessage">
				/// An informational string about a critical event.
				/// </param>
				virtual void ReportError(const boost::string_ref errorMessage) const
				{
					if (m_onError && errorMessage.data())
					{
						m_onError(errorMessage.data(), errorMessage.size());
					}
				}

			protected:

				/// <summary>
				/// Callback for general information about non-critical events.
				/// </summary>
				MessageFunction m_onInfo;

				/// <summary>
				/// Callback for warnings about potentially critical events.
				/// </summary>
				MessageFunction m_onWarning;

				/// <summary>
				/// Callback for error information about critical events that were handled.
				/// </summary>
				MessageFunction m_onError;

			};

		} /* namespace cb */
	} /* namespace util */
} /* namespace filtercheck */
