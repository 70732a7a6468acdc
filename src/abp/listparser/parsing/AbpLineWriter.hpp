/*
* Copyright (c) 2016 Jesse Nicholson.
*
* This file is part of Abp List Parser.
*
* Abp List Parser is free software: you can redistribute it and/or
* modify it under the terms of the GNU General Public License as published
* by the Free Software Foundation, either version 3 of the License, or (at
* your option) any later version.
*
* In addition, as a special exception, the copyright holders give
* permission to link the code of portions of this program with the OpenSSL
* library.
*
* You must obey the GNU General Public License in all respects for all of
* the code used other than OpenSSL. If you modify file(s) with this
* exception, you may extend this exception to your version of the file(s),
* but you are not obligated to do so. If you do not wish to do so, delete
* this exception statement from your version. If you delete this exception
* statement from all source files in the program, then also delete it
* here.
*
* Abp List Parser is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
* Public License for more details.
*
* You should have received a copy of the GNU General Public License along
* with Abp List Parser. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <string>
#include "AbpLine.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// The AbpLineWriter renders parsed lines back into canonical filter list syntax.
			/// The rendered form is built from the parsed fields only, never from the retained
			/// raw text, so insignificant formatting of the original line (such as whitespace
			/// around a metadata colon, or the spelling of an option name) is normalized.
			/// Parsing the rendered form yields the same fields again.
			/// </summary>
			class AbpLineWriter
			{

			public:

				AbpLineWriter() = delete;

				/// <summary>
				/// Renders any kind of line.
				/// </summary>
				static std::string Write(const Line& line);

				/// <summary>
				/// Renders a filter, either as a URL filter with its "$" option block, or as an
				/// element hiding filter with its domains.
				/// </summary>
				static std::string Write(const AbpFilter& filter);

				/// <summary>
				/// Renders a single option as it appears within a "$" option block.
				/// </summary>
				static std::string Write(const FilterOption& option);

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
