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

#include <stdexcept>
#include <string>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// Identifies which recognized construct a failed line was malformed as.
			/// </summary>
			enum class ParseErrorKind
			{
				/// <summary>
				/// A "%...%" line whose keyword is not a known instruction, or which names no
				/// target.
				/// </summary>
				MalformedInstruction,

				/// <summary>
				/// A bracketed line that resembles, but does not match, the exact
				/// "[Adblock Plus version]" list header.
				/// </summary>
				MalformedHeader,

				/// <summary>
				/// A filter option token that is not in the option catalog.
				/// </summary>
				UnknownOption,

				/// <summary>
				/// A known filter option used with the wrong shape, such as a value on a flag
				/// option, or negation of a valued option.
				/// </summary>
				InvalidOption,

				/// <summary>
				/// The line bytes are not valid UTF-8.
				/// </summary>
				DecodingError
			};

			const char* ToString(const ParseErrorKind kind);

			/// <summary>
			/// The ParseError is thrown when a single filter list line looks like a recognized
			/// construct but is malformed. It carries the offending line verbatim, so that
			/// whoever catches it can report precisely what failed without having to keep the
			/// input around. The ::what() member contains the reason combined with the line.
			/// </summary>
			class ParseError : public std::runtime_error
			{

			public:

				/// <summary>
				/// Constructs a new ParseError.
				/// </summary>
				/// <param name="kind">
				/// The kind of construct the line failed as.
				/// </param>
				/// <param name="line">
				/// The offending line, exactly as it was supplied to the parser.
				/// </param>
				/// <param name="reason">
				/// A human readable description of what is wrong with the line.
				/// </param>
				ParseError(const ParseErrorKind kind, const std::string& line, const std::string& reason);

				ParseErrorKind GetKind() const;

				const std::string& GetLine() const;

				const std::string& GetReason() const;

			private:

				ParseErrorKind m_kind;

				std::string m_line;

				std::string m_reason;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
