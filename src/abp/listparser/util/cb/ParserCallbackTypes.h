/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstddef>
#include <functional>

namespace abp
{
	namespace listparser
	{
		namespace util
		{
			namespace cb
			{

				/// <summary>
				/// The parser never decides on its own whether a malformed line should abort the
				/// loading of a list, be skipped or be logged. It does however report what it
				/// encounters, so that the consumer can make that decision with some insight.
				/// Various callbacks are used for errors, warnings, and general information.
				/// 
				/// When constructing a new parser or list reader, these callbacks should be
				/// provided to the construction mechanism. Any of them may be null.
				/// </summary>
				using MessageFunction = std::function<void(const char* message, const size_t messageLength)>;

			} /* namespace cb */
		} /* namespace util */
	} /* namespace listparser */
} /* namespace abp */
