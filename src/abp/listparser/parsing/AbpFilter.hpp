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
#include "AbpFilterOptions.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// Simple named keys for determining the kind of matching expression a filter
			/// carries.
			/// </summary>
			enum class SelectorType
			{
				/// <summary>
				/// An ABP URL pattern, such as "||example.com^". Anchors, wildcards and
				/// separators are kept literally, they are interpreted by the matching engine
				/// rather than the parser.
				/// </summary>
				UrlPattern,

				/// <summary>
				/// A regular expression matched against URLs, written between slashes.
				/// </summary>
				UrlRegexp,

				/// <summary>
				/// A CSS selector used for element hiding.
				/// </summary>
				Css,

				/// <summary>
				/// An extended CSS selector (element hiding emulation), introduced by "#?#".
				/// </summary>
				ExtendedCss
			};

			/// <summary>
			/// What a filter does to whatever its selector matches.
			/// </summary>
			enum class FilterAction
			{
				Block,
				Allow,
				Hide,
				Show
			};

			const char* ToString(const SelectorType type);

			const char* ToString(const FilterAction action);

			/// <summary>
			/// The matching expression of a filter, with every delimiter and marker used to
			/// detect its type stripped.
			/// </summary>
			struct Selector
			{
				SelectorType type;

				std::string value;

				bool operator==(const Selector& other) const;

				bool operator!=(const Selector& other) const;
			};

			/// <summary>
			/// The AbpFilter object is the parsed form of a single filter rule line, either a
			/// URL filter (blocking or allowing requests) or an element hiding filter (hiding
			/// or showing page elements). The object is immutable once constructed.
			/// </summary>
			class AbpFilter
			{

			public:

				/// <summary>
				/// Constructs a new AbpFilter object.
				/// </summary>
				/// <param name="rawText">
				/// The line the filter was parsed from, exactly as supplied.
				/// </param>
				/// <param name="selector">
				/// The matching expression.
				/// </param>
				/// <param name="action">
				/// The action taken on a match.
				/// </param>
				/// <param name="options">
				/// The filter options in source order. For element hiding filters, this holds
				/// at most a single domain option built from the domains preceding the hiding
				/// marker.
				/// </param>
				AbpFilter(std::string rawText, Selector selector, const FilterAction action, FilterOptions options);

				/// <summary>
				/// The original formatting of ABP filters is lost during parsing. This
				/// function provides read-only access to the retained, original filter line.
				/// </summary>
				/// <returns>
				/// The original, unmodified filter line.
				/// </returns>
				const std::string& GetRawText() const;

				const Selector& GetSelector() const;

				FilterAction GetAction() const;

				const FilterOptions& GetOptions() const;

				/// <summary>
				/// Indicates if the filter is an element hiding filter rather than a URL
				/// filter.
				/// </summary>
				bool IsElementHiding() const;

				/// <summary>
				/// Indicates whether or not a positive match from this filter should be
				/// interpreted as overriding blocking or hiding filters.
				/// </summary>
				bool IsException() const;

				bool operator==(const AbpFilter& other) const;

			private:

				std::string m_rawText;

				Selector m_selector;

				FilterAction m_action;

				FilterOptions m_options;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
