/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstdint>

namespace abp
{
	namespace listparser
	{
		namespace options
		{

			/// <summary>
			/// Enum used to define the switches that alter how filter list lines are parsed.
			/// These keys are meant to be used with the ParserOptions object.
			/// 
			/// When making additions to this enum, values must not be explicitly assigned and
			/// NUMBER_OF_ENTRIES must always be the final entry.
			/// </summary>
			enum class ParsingOption : uint32_t
			{
				/// <summary>
				/// When enabled, a filter option that is not in the option catalog fails the
				/// line with an UnknownOption error. When disabled, the option is dropped from
				/// the parsed filter and a warning is reported. Enabled by default.
				/// </summary>
				StrictOptionParsing,

				/// <summary>
				/// When enabled, the list reader accepts a "[Adblock Plus x.y]" version header
				/// only on the first line of a list, and fails header lines found anywhere
				/// else. Disabled by default, in which case header recognition is purely
				/// textual.
				/// </summary>
				HeaderOnlyOnFirstLine,

				NUMBER_OF_ENTRIES
			};

		} /* namespace options */
	} /* namespace listparser */
} /* namespace abp */
