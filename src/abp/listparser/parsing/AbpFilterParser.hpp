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
#include <boost/utility/string_ref.hpp>
#include "AbpFilter.hpp"
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
			/// The AbpFilterParser class serves the purpose of accurately and rapidly parsing
			/// supplied filter rule strings into AbpFilter objects, decomposing the rule into its
			/// selector, its action and its options. Any text that isn't a more specific kind of
			/// filter is a legal URL pattern, so selector classification never fails. The only
			/// failures come from the option list of URL filters.
			/// 
			/// The parser holds no mutable state, so a single instance may be used to parse
			/// lines on any number of threads at once.
			/// </summary>
			class AbpFilterParser : public util::cb::EventReporter
			{

			public:

				/// <summary>
				/// Constructs a new AbpFilterParser object instance.
				/// </summary>
				/// <param name="parserOptions">
				/// The options governing parsing. Must not be null, and must outlive the parser.
				/// </param>
				AbpFilterParser(
					const options::ParserOptions* parserOptions,
					util::cb::MessageFunction onInfo = nullptr,
					util::cb::MessageFunction onWarning = nullptr,
					util::cb::MessageFunction onError = nullptr
					);

				/// <summary>
				/// Default empty destructor.
				/// </summary>
				~AbpFilterParser();

				/// <summary>
				/// Parses the supplied filter rule string into an AbpFilter. The supplied string
				/// is used both as the rule to parse and as the retained original text.
				/// </summary>
				/// <param name="filterString">
				/// The raw filter rule to parse.
				/// </param>
				/// <returns>
				/// The parsed filter.
				/// </returns>
				AbpFilter Parse(const std::string& filterString) const;

				/// <summary>
				/// Parses the supplied filter rule into an AbpFilter. This overload exists for the
				/// line parser, which has already trimmed the line, but must retain the line
				/// exactly as supplied.
				/// 
				/// The parser will throw a ParseError when the option list of a URL filter holds
				/// an option that isn't in the catalog (unless strict option parsing is
				/// disabled), or a known option written with the wrong value shape.
				/// </summary>
				/// <param name="rule">
				/// The trimmed filter rule to parse.
				/// </param>
				/// <param name="rawLine">
				/// The line the rule came from, retained verbatim in the returned filter and in
				/// any thrown ParseError.
				/// </param>
				/// <returns>
				/// The parsed filter.
				/// </returns>
				AbpFilter Parse(boost::string_ref rule, const std::string& rawLine) const;

				/// <summary>
				/// Finds the position of the "$" that begins the trailing option block of a URL
				/// filter. A "$" begins the option block only if everything following it is a
				/// syntactically well formed, comma separated list of options. Otherwise it is
				/// literal pattern text. When more than one "$" qualifies, the last one wins.
				/// </summary>
				/// <param name="rule">
				/// The URL filter, with any exception marker already removed.
				/// </param>
				/// <returns>
				/// The position of the option block "$", or boost::string_ref::npos if the rule
				/// has no option block.
				/// </returns>
				static boost::string_ref::size_type FindOptionBlock(boost::string_ref rule);

			private:

				/// <summary>
				/// Describes where an element hiding marker sits within a rule.
				/// </summary>
				struct HidingMarker
				{
					boost::string_ref::size_type position;
					boost::string_ref::size_type length;
					SelectorType type;
					bool isException;
				};

				/// <summary>
				/// Searches the supplied rule for the first valid element hiding marker ("##",
				/// "#@#" or "#?#"). A marker is only valid when the domains preceding it contain
				/// none of the characters that can only appear in URL patterns, and a non-empty
				/// selector follows it.
				/// </summary>
				/// <returns>
				/// True if a valid marker was found, in which case marker is populated.
				/// </returns>
				static bool FindHidingMarker(boost::string_ref rule, HidingMarker& marker);

				/// <summary>
				/// Checks that the supplied text is one or more comma separated option tokens,
				/// each of the form "~?name(=value)?".
				/// </summary>
				static bool IsWellFormedOptionList(boost::string_ref optionsString);

				/// <summary>
				/// Parses the option block of a URL filter, everything after the option "$",
				/// into filter options in source order.
				/// </summary>
				FilterOptions ParseOptions(boost::string_ref optionsString, const std::string& rawLine) const;

				/// <summary>
				/// Splits a list of domains on the supplied separator into a DomainList. Domains
				/// prefixed with "~" are marked as excluded. Empty entries are skipped.
				/// </summary>
				static DomainList ParseDomains(boost::string_ref domainsString, const char separator);

				/// <summary>
				/// Extracts the next comma separated string part from the front of the supplied
				/// string. Argument is pass by reference, as the method consumes the part it
				/// returns.
				/// </summary>
				static boost::string_ref ParseSingleOption(boost::string_ref& optionsString);

				/// <summary>
				/// The options governing parsing.
				/// </summary>
				const options::ParserOptions* m_parserOptions;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
