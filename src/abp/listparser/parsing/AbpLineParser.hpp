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

#include <cstddef>
#include <cstdint>
#include <string>
#include <boost/utility/string_ref.hpp>
#include "AbpLine.hpp"
#include "AbpFilterParser.hpp"
#include "ParseError.hpp"
#include "../options/ParserOptions.hpp"
#include "../util/cb/EventReporter.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// The AbpLineParser classifies a single line of an Adblock Plus formatted filter
			/// list and decomposes it into the fields of its kind. Lines are classified in a
			/// fixed order, and the first matching kind wins:
			/// 
			/// empty or whitespace only lines, "!" comments and metadata, "%...%"
			/// instructions, "[...]" list headers, and finally filter rules, which are handed
			/// to the AbpFilterParser.
			/// 
			/// A line that looks like one of the special kinds but is malformed is reported
			/// with a ParseError, rather than being silently treated as a filter. The parser
			/// holds no mutable state, so a single instance may be used from any number of
			/// threads at once.
			/// </summary>
			class AbpLineParser : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// Constructs a new AbpLineParser object instance.
				/// </summary>
				/// <param name="parserOptions">
				/// The options governing parsing. Must not be null, and must outlive the parser.
				/// </param>
				AbpLineParser(
					const options::ParserOptions* parserOptions,
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Default empty destructor.
				/// </summary>
				~AbpLineParser();

				/// <summary>
				/// Sets the callback for general information. The callback is also handed to
				/// the filter parser this object owns.
				/// </summary>
				virtual void SetOnInfo(util::cb::MessageFunction onInfo);

				/// <summary>
				/// Sets the callback for warnings, including the filter parser.
				/// </summary>
				virtual void SetOnWarning(util::cb::MessageFunction onWarning);

				/// <summary>
				/// Sets the callback for errors, including the filter parser.
				/// </summary>
				virtual void SetOnError(util::cb::MessageFunction onError);

				/// <summary>
				/// Classifies the supplied line. The line must be UTF-8 encoded. The returned
				/// line always retains the supplied text verbatim, whitespace included.
				/// </summary>
				/// <param name="line">
				/// A single line of a filter list, without its line terminator.
				/// </param>
				/// <returns>
				/// The classified line.
				/// </returns>
				/// <exception cref="ParseError">
				/// Thrown when the line is not valid UTF-8, or is a malformed instruction,
				/// header or filter option list.
				/// </exception>
				Line Parse(const std::string& line) const;

				/// <summary>
				/// Decodes the supplied bytes as UTF-8 and classifies the result. No fallback
				/// encoding is attempted, bytes that are not valid UTF-8 fail with a
				/// DecodingError.
				/// </summary>
				Line Parse(const uint8_t* bytes, const size_t length) const;

			private:

				Line ParseComment(boost::string_ref trimmed, const std::string& line) const;

				Line ParseInstruction(boost::string_ref trimmed, const std::string& line) const;

				Line ParseHeader(boost::string_ref trimmed, const std::string& line) const;

				/// <summary>
				/// Delegate for everything that isn't a special line.
				/// </summary>
				AbpFilterParser m_filterParser;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
