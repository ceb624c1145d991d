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

#include "BaseFilterEngine.hpp"

namespace filtercheck
{
	namespace filtering
	{

		BaseFilterEngine::BaseFilterEngine(
			util::cb::MessageFunction onInfo,
			util::cb::MessageFunction onWarning,
			util::cb::MessageFunction onError
			) : EventReporter(
				onInfo,
				onWarning,
				onError
				)
		{

		}

		BaseFilterEngine::~BaseFilterEngine()
		{

		}

	} /* namespace filtering */
} /* namespace filtercheck */
