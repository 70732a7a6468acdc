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
#include <boost/variant.hpp>
#include "AbpFilter.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// Preprocessor-like directives that can appear in a list between "%" characters.
			/// 
			/// When making additions to this enum, the AbpSyntaxCatalog must be given a
			/// matching keyword.
			/// </summary>
			enum class InstructionType
			{
				include
			};

			/// <summary>
			/// Names the alternative held by a Line.
			/// </summary>
			enum class LineType
			{
				EmptyLine,
				Comment,
				Metadata,
				Instruction,
				Header,
				Filter
			};

			const char* ToString(const InstructionType type);

			const char* ToString(const LineType type);

			/// <summary>
			/// Common base for the non-filter line kinds. Holds the original line text.
			/// </summary>
			class AbpLineBase
			{

			public:

				/// <summary>
				/// The original line, exactly as it was supplied to the parser.
				/// </summary>
				const std::string& GetRawText() const;

			protected:

				explicit AbpLineBase(std::string rawText);

				std::string m_rawText;

			};

			/// <summary>
			/// A line that is empty or consists entirely of whitespace.
			/// </summary>
			class EmptyLine : public AbpLineBase
			{

			public:

				explicit EmptyLine(std::string rawText);

				bool operator==(const EmptyLine& other) const;

			};

			/// <summary>
			/// A "!" line that isn't metadata.
			/// </summary>
			class Comment : public AbpLineBase
			{

			public:

				Comment(std::string rawText, std::string text);

				/// <summary>
				/// The comment body, following the "!" and a single optional space.
				/// </summary>
				const std::string& GetText() const;

				bool operator==(const Comment& other) const;

			private:

				std::string m_text;

			};

			/// <summary>
			/// A "! Key: value" line where the key is one of the recognized metadata keys.
			/// </summary>
			class Metadata : public AbpLineBase
			{

			public:

				Metadata(std::string rawText, std::string key, std::string value);

				const std::string& GetKey() const;

				/// <summary>
				/// The metadata value with surrounding whitespace removed.
				/// </summary>
				const std::string& GetValue() const;

				bool operator==(const Metadata& other) const;

			private:

				std::string m_key;

				std::string m_value;

			};

			/// <summary>
			/// A "%keyword target%" line.
			/// </summary>
			class Instruction : public AbpLineBase
			{

			public:

				Instruction(std::string rawText, const InstructionType type, std::string target);

				InstructionType GetType() const;

				/// <summary>
				/// The instruction argument. For "%include url%", the url of the list to
				/// include.
				/// </summary>
				const std::string& GetTarget() const;

				bool operator==(const Instruction& other) const;

			private:

				InstructionType m_type;

				std::string m_target;

			};

			/// <summary>
			/// The "[Adblock Plus x.y]" line that opens a list.
			/// </summary>
			class Header : public AbpLineBase
			{

			public:

				Header(std::string rawText, std::string version);

				/// <summary>
				/// The bracketed text, such as "Adblock Plus 2.0".
				/// </summary>
				const std::string& GetVersion() const;

				bool operator==(const Header& other) const;

			private:

				std::string m_version;

			};

			/// <summary>
			/// The result of classifying a single list line. Exactly one alternative is held,
			/// and each alternative has its own fixed set of fields. Inspect a Line either
			/// with boost::get / boost::apply_visitor, or with GetLineType.
			/// </summary>
			using Line = boost::variant<EmptyLine, Comment, Metadata, Instruction, Header, AbpFilter>;

			/// <summary>
			/// Gets the kind of line held.
			/// </summary>
			LineType GetLineType(const Line& line);

			/// <summary>
			/// Gets the original text of any kind of line.
			/// </summary>
			const std::string& GetRawText(const Line& line);

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
