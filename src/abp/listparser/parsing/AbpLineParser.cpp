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

#include "AbpLineParser.hpp"
#include "AbpSyntaxCatalog.hpp"
#include "../../util/string/StringRefUtil.hpp"
#include "../../util/encoding/Utf8Util.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				const boost::string_ref HeaderPrefix(u8"[Adblock Plus ");

			} /* anonymous namespace */

			AbpLineParser::AbpLineParser(
				const options::ParserOptions* parserOptions,
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				) : EventReporter(
					onInfo,
					onWarning,
					onError
					),
				m_filterParser(parserOptions, onInfo, onWarning, onError)
			{

			}

			AbpLineParser::~AbpLineParser()
			{

			}

			void AbpLineParser::SetOnInfo(util::cb::MessageFunction onInfo)
			{
				EventReporter::SetOnInfo(onInfo);
				m_filterParser.SetOnInfo(onInfo);
			}

			void AbpLineParser::SetOnWarning(util::cb::MessageFunction onWarning)
			{
				EventReporter::SetOnWarning(onWarning);
				m_filterParser.SetOnWarning(onWarning);
			}

			void AbpLineParser::SetOnError(util::cb::MessageFunction onError)
			{
				EventReporter::SetOnError(onError);
				m_filterParser.SetOnError(onError);
			}

			Line AbpLineParser::Parse(const uint8_t* bytes, const size_t length) const
			{
				if (bytes == nullptr || length == 0)
				{
					return Parse(std::string());
				}

				return Parse(std::string(reinterpret_cast<const char*>(bytes), length));
			}

			Line AbpLineParser::Parse(const std::string& line) const
			{
				auto invalidPos = util::encoding::FindInvalidUtf8(line);

				if (invalidPos != boost::string_ref::npos)
				{
					std::string reason(u8"In AbpLineParser::Parse(const std::string&) const - Line is not valid UTF-8. First invalid byte at offset ");
					reason.append(std::to_string(invalidPos)).append(u8".");
					throw ParseError(ParseErrorKind::DecodingError, line, reason);
				}

				// Whitespace surrounding the line never carries meaning. It is only kept in
				// the raw text of the result.
				auto trimmed = util::string::Trim(line);

				if (trimmed.size() == 0)
				{
					return EmptyLine(line);
				}

				if (trimmed.front() == '!')
				{
					return ParseComment(trimmed, line);
				}

				if (trimmed.size() >= 2 && trimmed.front() == '%' && trimmed.back() == '%')
				{
					return ParseInstruction(trimmed, line);
				}

				if (trimmed.front() == '[' && trimmed.back() == ']')
				{
					return ParseHeader(trimmed, line);
				}

				return m_filterParser.Parse(trimmed, line);
			}

			Line AbpLineParser::ParseComment(boost::string_ref trimmed, const std::string& line) const
			{
				auto body = trimmed.substr(1);

				if (body.starts_with(' '))
				{
					body.remove_prefix(1);
				}

				// Metadata is a comment of the form "! Key : value", where the key must be
				// one of the recognized metadata keys. Everything else is a plain comment.
				auto colonPos = body.find(':');

				if (colonPos != boost::string_ref::npos)
				{
					auto key = util::string::Trim(body.substr(0, colonPos));

					if (AbpSyntaxCatalog::IsMetadataKey(key))
					{
						auto value = util::string::Trim(body.substr(colonPos + 1));
						return Metadata(line, key.to_string(), value.to_string());
					}
				}

				return Comment(line, body.to_string());
			}

			Line AbpLineParser::ParseInstruction(boost::string_ref trimmed, const std::string& line) const
			{
				auto inner = trimmed.substr(1, trimmed.size() - 2);

				size_t wordLength = 0;

				while (wordLength < inner.size() && !util::string::IsWhitespace(inner[wordLength]))
				{
					++wordLength;
				}

				auto keyword = inner.substr(0, wordLength);
				auto target = util::string::Trim(inner.substr(wordLength));

				InstructionType type = InstructionType::include;

				if (!AbpSyntaxCatalog::FindInstruction(keyword, type))
				{
					std::string reason(u8"In AbpLineParser::ParseInstruction(boost::string_ref, const std::string&) const - Unrecognized instruction keyword: ");
					reason.append(keyword.to_string());
					throw ParseError(ParseErrorKind::MalformedInstruction, line, reason);
				}

				if (target.size() == 0)
				{
					std::string reason(u8"In AbpLineParser::ParseInstruction(boost::string_ref, const std::string&) const - Instruction is missing its target: ");
					reason.append(keyword.to_string());
					throw ParseError(ParseErrorKind::MalformedInstruction, line, reason);
				}

				return Instruction(line, type, target.to_string());
			}

			Line AbpLineParser::ParseHeader(boost::string_ref trimmed, const std::string& line) const
			{
				// Only the exact "[Adblock Plus <version>]" form is a header. Anything else
				// in brackets is an error rather than a filter.
				if (!trimmed.starts_with(HeaderPrefix) ||
					util::string::Trim(trimmed.substr(HeaderPrefix.size(), trimmed.size() - HeaderPrefix.size() - 1)).size() == 0)
				{
					throw ParseError(
						ParseErrorKind::MalformedHeader, 
						line, 
						u8"In AbpLineParser::ParseHeader(boost::string_ref, const std::string&) const - Bracketed line is not a valid \"[Adblock Plus <version>]\" header."
						);
				}

				return Header(line, trimmed.substr(1, trimmed.size() - 2).to_string());
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
