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

#include "ParseError.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				std::string BuildMessage(const ParseErrorKind kind, const std::string& line, const std::string& reason)
				{
					std::string message(ToString(kind));
					message.append(u8": ").append(reason);
					message.append(u8" Offending line: \"").append(line).append(u8"\"");
					return message;
				}

			} /* anonymous namespace */

			const char* ToString(const ParseErrorKind kind)
			{
				switch (kind)
				{
					case ParseErrorKind::MalformedInstruction:
						return u8"MalformedInstruction";

					case ParseErrorKind::MalformedHeader:
						return u8"MalformedHeader";

					case ParseErrorKind::UnknownOption:
						return u8"UnknownOption";

					case ParseErrorKind::InvalidOption:
						return u8"InvalidOption";

					case ParseErrorKind::DecodingError:
						return u8"DecodingError";
				}

				return u8"Unknown";
			}

			ParseError::ParseError(const ParseErrorKind kind, const std::string& line, const std::string& reason) 
				: std::runtime_error(BuildMessage(kind, line, reason)),
				m_kind(kind),
				m_line(line),
				m_reason(reason)
			{

			}

			ParseErrorKind ParseError::GetKind() const
			{
				return m_kind;
			}

			const std::string& ParseError::GetLine() const
			{
				return m_line;
			}

			const std::string& ParseError::GetReason() const
			{
				return m_reason;
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
