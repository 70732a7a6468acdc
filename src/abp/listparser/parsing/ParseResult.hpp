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

#include <cstdint>
#include <boost/optional.hpp>
#include "AbpLine.hpp"
#include "ParseError.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// The outcome of parsing a single line of a list: either the classified line, or
			/// the error the line failed with. Results are produced by the AbpFilterListReader,
			/// which keeps going after a failed line, so an error is just another element of
			/// the sequence.
			/// </summary>
			class ParseResult
			{

			public:

				ParseResult(const uint32_t lineNumber, Line line);

				ParseResult(const uint32_t lineNumber, ParseError error);

				/// <summary>
				/// The 1-based position of the line within its list.
				/// </summary>
				uint32_t GetLineNumber() const;

				/// <summary>
				/// Indicates whether or not the line failed to parse.
				/// </summary>
				bool IsError() const;

				/// <summary>
				/// Gets the classified line. If the line failed to parse, the held ParseError is
				/// thrown instead, so that callers who only care about successfully parsed lines
				/// may treat failures exactly as they would a failed AbpLineParser::Parse call.
				/// </summary>
				const Line& GetLine() const;

				/// <summary>
				/// Gets the error the line failed with. Throws std::runtime_error if the line
				/// was parsed successfully.
				/// </summary>
				const ParseError& GetError() const;

			private:

				uint32_t m_lineNumber;

				boost::optional<Line> m_line;

				boost::optional<ParseError> m_error;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
