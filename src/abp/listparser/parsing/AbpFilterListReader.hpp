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
#include <functional>
#include <istream>
#include <string>
#include <vector>
#include "AbpLineParser.hpp"
#include "ParseResult.hpp"
#include "../options/ParserOptions.hpp"
#include "../util/cb/EventReporter.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// The AbpFilterListReader turns an ordered source of raw lines into a lazy
			/// sequence of ParseResult objects, one per line, in order. A line is only read
			/// from the source and parsed when it is pulled with Next().
			/// 
			/// We don't want to throw a whole list out if there is some issue with a single
			/// line, so a line that fails to parse yields an error result at its position,
			/// and pulling continues with the following lines. It is up to the caller to
			/// decide whether to abort, skip or log on a failure. Each failure is also
			/// reported through the error callback.
			/// 
			/// A reader consumes its source and cannot be restarted. It is not thread safe.
			/// </summary>
			class AbpFilterListReader : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// Supplies lines to the reader. Each call should store the next line, without
				/// its line terminator, into the argument and return true, or return false
				/// once no lines remain.
				/// </summary>
				using LineSource = std::function<bool(std::string& line)>;

				/// <summary>
				/// Constructs a new AbpFilterListReader object instance.
				/// </summary>
				/// <param name="parserOptions">
				/// The options governing parsing. Must not be null, and must outlive the reader.
				/// </param>
				/// <param name="source">
				/// The source of raw lines.
				/// </param>
				AbpFilterListReader(
					const options::ParserOptions* parserOptions,
					LineSource source,
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				AbpFilterListReader(const AbpFilterListReader&) = delete;
				AbpFilterListReader& operator=(const AbpFilterListReader&) = delete;

				/// <summary>
				/// Default empty destructor.
				/// </summary>
				~AbpFilterListReader();

				/// <summary>
				/// Sets the callback for general information. The callback is also handed to
				/// the line parser this object owns.
				/// </summary>
				virtual void SetOnInfo(util::cb::MessageFunction onInfo);

				/// <summary>
				/// Sets the callback for warnings, including the line parser.
				/// </summary>
				virtual void SetOnWarning(util::cb::MessageFunction onWarning);

				/// <summary>
				/// Sets the callback for errors, including the line parser.
				/// </summary>
				virtual void SetOnError(util::cb::MessageFunction onError);

				/// <summary>
				/// Creates a line source that yields the supplied lines in order.
				/// </summary>
				static LineSource FromLines(std::vector<std::string> lines);

				/// <summary>
				/// Creates a line source that splits the supplied stream on newlines. A
				/// carriage return preceding the newline is removed. The stream must outlive
				/// the source.
				/// </summary>
				static LineSource FromStream(std::istream& stream);

				/// <summary>
				/// Checks if another line remains to be pulled. Reads ahead a single raw line
				/// from the source, but doesn't parse it.
				/// </summary>
				bool HasNext();

				/// <summary>
				/// Pulls and parses the next line. Throws std::runtime_error if no lines remain.
				/// </summary>
				/// <returns>
				/// The classified line, or the error the line failed with.
				/// </returns>
				ParseResult Next();

				/// <summary>
				/// Pulls and parses every remaining line.
				/// </summary>
				std::vector<ParseResult> ParseAll();

				/// <summary>
				/// Gets the number of lines pulled so far.
				/// </summary>
				uint32_t GetLineCount() const;

				/// <summary>
				/// Gets the number of lines pulled so far that failed to parse.
				/// </summary>
				uint32_t GetFailedCount() const;

			private:

				/// <summary>
				/// Parses a single line, converting a failure into an error result.
				/// </summary>
				ParseResult ParseLine(const std::string& line, const uint32_t lineNumber);

				const options::ParserOptions* m_parserOptions;

				AbpLineParser m_lineParser;

				LineSource m_source;

				/// <summary>
				/// The line read ahead by HasNext(), waiting to be pulled.
				/// </summary>
				std::string m_pending;

				bool m_hasPending = false;

				bool m_exhausted = false;

				uint32_t m_lineCount = 0;

				uint32_t m_failedCount = 0;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
