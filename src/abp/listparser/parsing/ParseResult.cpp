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

#include "ParseResult.hpp"
#include <stdexcept>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			ParseResult::ParseResult(const uint32_t lineNumber, Line line) 
				: m_lineNumber(lineNumber), m_line(std::move(line))
			{

			}

			ParseResult::ParseResult(const uint32_t lineNumber, ParseError error) 
				: m_lineNumber(lineNumber), m_error(std::move(error))
			{

			}

			uint32_t ParseResult::GetLineNumber() const
			{
				return m_lineNumber;
			}

			bool ParseResult::IsError() const
			{
				return m_error.is_initialized();
			}

			const Line& ParseResult::GetLine() const
			{
				if (m_error)
				{
					throw *m_error;
				}

				return *m_line;
			}

			const ParseError& ParseResult::GetError() const
			{
				if (!m_error)
				{
					throw std::runtime_error(u8"In ParseResult::GetError() const - Line was parsed successfully, there is no error.");
				}

				return *m_error;
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
