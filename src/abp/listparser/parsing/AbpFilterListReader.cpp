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

#include "AbpFilterListReader.hpp"
#include <memory>
#include <stdexcept>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			AbpFilterListReader::AbpFilterListReader(
				const options::ParserOptions* parserOptions,
				LineSource source,
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				) : EventReporter(
					onInfo,
					onWarning,
					onError
					),
				m_parserOptions(parserOptions),
				m_lineParser(parserOptions, onInfo, onWarning, onError),
				m_source(std::move(source))
			{
				if (!m_source)
				{
					throw std::runtime_error(u8"In AbpFilterListReader::AbpFilterListReader(const options::ParserOptions*, LineSource, ...) - Line source must not be empty.");
				}
			}

			AbpFilterListReader::~AbpFilterListReader()
			{

			}

			void AbpFilterListReader::SetOnInfo(util::cb::MessageFunction onInfo)
			{
				EventReporter::SetOnInfo(onInfo);
				m_lineParser.SetOnInfo(onInfo);
			}

			void AbpFilterListReader::SetOnWarning(util::cb::MessageFunction onWarning)
			{
				EventReporter::SetOnWarning(onWarning);
				m_lineParser.SetOnWarning(onWarning);
			}

			void AbpFilterListReader::SetOnError(util::cb::MessageFunction onError)
			{
				EventReporter::SetOnError(onError);
				m_lineParser.SetOnError(onError);
			}

			AbpFilterListReader::LineSource AbpFilterListReader::FromLines(std::vector<std::string> lines)
			{
				// std::function must be copyable, so the lines are shared between copies
				// of the source rather than moved into the lambda.
				auto sharedLines = std::make_shared<std::vector<std::string>>(std::move(lines));
				auto next = std::make_shared<size_t>(0);

				return [sharedLines, next](std::string& line)
				{
					if (*next >= sharedLines->size())
					{
						return false;
					}

					line = (*sharedLines)[(*next)++];
					return true;
				};
			}

			AbpFilterListReader::LineSource AbpFilterListReader::FromStream(std::istream& stream)
			{
				std::istream* in = &stream;

				return [in](std::string& line)
				{
					if (!std::getline(*in, line))
					{
						return false;
					}

					if (line.size() > 0 && line.back() == '\r')
					{
						line.pop_back();
					}

					return true;
				};
			}

			bool AbpFilterListReader::HasNext()
			{
				if (m_hasPending)
				{
					return true;
				}

				if (m_exhausted)
				{
					return false;
				}

				if (m_source(m_pending))
				{
					m_hasPending = true;
					return true;
				}

				m_exhausted = true;

				std::string infoMessage(u8"In AbpFilterListReader::HasNext() - Finished reading list. Lines: ");
				infoMessage.append(std::to_string(m_lineCount));
				infoMessage.append(u8", failed: ").append(std::to_string(m_failedCount)).append(u8".");
				ReportInfo(infoMessage);

				return false;
			}

			ParseResult AbpFilterListReader::Next()
			{
				if (!HasNext())
				{
					throw std::runtime_error(u8"In AbpFilterListReader::Next() - No lines remain in the list.");
				}

				m_hasPending = false;
				++m_lineCount;

				auto result = ParseLine(m_pending, m_lineCount);

				if (result.IsError())
				{
					++m_failedCount;

					std::string errMessage(u8"In AbpFilterListReader::Next() - Failed to parse line ");
					errMessage.append(std::to_string(m_lineCount)).append(u8": ");
					errMessage.append(result.GetError().what());
					ReportError(errMessage);
				}

				return result;
			}

			std::vector<ParseResult> AbpFilterListReader::ParseAll()
			{
				std::vector<ParseResult> ret;

				while (HasNext())
				{
					ret.push_back(Next());
				}

				return ret;
			}

			uint32_t AbpFilterListReader::GetLineCount() const
			{
				return m_lineCount;
			}

			uint32_t AbpFilterListReader::GetFailedCount() const
			{
				return m_failedCount;
			}

			ParseResult AbpFilterListReader::ParseLine(const std::string& line, const uint32_t lineNumber)
			{
				try
				{
					auto parsed = m_lineParser.Parse(line);

					if (lineNumber > 1 &&
						GetLineType(parsed) == LineType::Header &&
						m_parserOptions->GetIsOptionEnabled(options::ParsingOption::HeaderOnlyOnFirstLine))
					{
						return ParseResult(
							lineNumber,
							ParseError(
								ParseErrorKind::MalformedHeader,
								line,
								u8"In AbpFilterListReader::ParseLine(const std::string&, const uint32_t) - List header is only permitted on the first line."
								)
							);
					}

					return ParseResult(lineNumber, std::move(parsed));
				}
				catch (ParseError& e)
				{
					return ParseResult(lineNumber, e);
				}
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
