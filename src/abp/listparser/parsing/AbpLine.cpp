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

#include "AbpLine.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				class LineTypeVisitor : public boost::static_visitor<LineType>
				{

				public:

					LineType operator()(const EmptyLine&) const
					{
						return LineType::EmptyLine;
					}

					LineType operator()(const Comment&) const
					{
						return LineType::Comment;
					}

					LineType operator()(const Metadata&) const
					{
						return LineType::Metadata;
					}

					LineType operator()(const Instruction&) const
					{
						return LineType::Instruction;
					}

					LineType operator()(const Header&) const
					{
						return LineType::Header;
					}

					LineType operator()(const AbpFilter&) const
					{
						return LineType::Filter;
					}

				};

				class RawTextVisitor : public boost::static_visitor<const std::string&>
				{

				public:

					const std::string& operator()(const AbpLineBase& line) const
					{
						return line.GetRawText();
					}

					const std::string& operator()(const AbpFilter& filter) const
					{
						return filter.GetRawText();
					}

				};

			} /* anonymous namespace */

			const char* ToString(const InstructionType type)
			{
				switch (type)
				{
					case InstructionType::include:
						return u8"include";
				}

				return u8"unknown";
			}

			const char* ToString(const LineType type)
			{
				switch (type)
				{
					case LineType::EmptyLine:
						return u8"emptyline";

					case LineType::Comment:
						return u8"comment";

					case LineType::Metadata:
						return u8"metadata";

					case LineType::Instruction:
						return u8"instruction";

					case LineType::Header:
						return u8"header";

					case LineType::Filter:
						return u8"filter";
				}

				return u8"unknown";
			}

			AbpLineBase::AbpLineBase(std::string rawText) : m_rawText(std::move(rawText))
			{

			}

			const std::string& AbpLineBase::GetRawText() const
			{
				return m_rawText;
			}

			EmptyLine::EmptyLine(std::string rawText) : AbpLineBase(std::move(rawText))
			{

			}

			bool EmptyLine::operator==(const EmptyLine& other) const
			{
				return m_rawText == other.m_rawText;
			}

			Comment::Comment(std::string rawText, std::string text) 
				: AbpLineBase(std::move(rawText)), m_text(std::move(text))
			{

			}

			const std::string& Comment::GetText() const
			{
				return m_text;
			}

			bool Comment::operator==(const Comment& other) const
			{
				return m_rawText == other.m_rawText && m_text == other.m_text;
			}

			Metadata::Metadata(std::string rawText, std::string key, std::string value) 
				: AbpLineBase(std::move(rawText)), m_key(std::move(key)), m_value(std::move(value))
			{

			}

			const std::string& Metadata::GetKey() const
			{
				return m_key;
			}

			const std::string& Metadata::GetValue() const
			{
				return m_value;
			}

			bool Metadata::operator==(const Metadata& other) const
			{
				return m_rawText == other.m_rawText && m_key == other.m_key && m_value == other.m_value;
			}

			Instruction::Instruction(std::string rawText, const InstructionType type, std::string target) 
				: AbpLineBase(std::move(rawText)), m_type(type), m_target(std::move(target))
			{

			}

			InstructionType Instruction::GetType() const
			{
				return m_type;
			}

			const std::string& Instruction::GetTarget() const
			{
				return m_target;
			}

			bool Instruction::operator==(const Instruction& other) const
			{
				return m_rawText == other.m_rawText && m_type == other.m_type && m_target == other.m_target;
			}

			Header::Header(std::string rawText, std::string version) 
				: AbpLineBase(std::move(rawText)), m_version(std::move(version))
			{

			}

			const std::string& Header::GetVersion() const
			{
				return m_version;
			}

			bool Header::operator==(const Header& other) const
			{
				return m_rawText == other.m_rawText && m_version == other.m_version;
			}

			LineType GetLineType(const Line& line)
			{
				return boost::apply_visitor(LineTypeVisitor(), line);
			}

			const std::string& GetRawText(const Line& line)
			{
				return boost::apply_visitor(RawTextVisitor(), line);
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
