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
#include <string>
#include <utility>
#include <vector>
#include <boost/variant.hpp>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// Each ABP URL filter can specify many details about just what type of requests
			/// and content a filter ought to apply to, through options following the "$" at
			/// the end of the rule. This enum names every option the parser recognizes. The
			/// textual name of each option, and the shape of the value it carries, are
			/// defined in the AbpSyntaxCatalog.
			/// 
			/// When making additions to this enum, values must not be explicitly assigned,
			/// NUMBER_OF_ENTRIES must always be the final entry, and the catalog must be
			/// given a matching entry.
			/// </summary>
			enum class AbpFilterOption : size_t
			{
				document,
				elemhide,
				font,
				genericblock,
				generichide,
				image,
				match_case,
				media,
				object,
				object_subrequest,
				other,
				ping,
				popup,
				script,
				stylesheet,
				subdocument,
				third_party,
				webrtc,
				websocket,
				xmlhttprequest,
				collapse,
				domain,
				sitekey,
				csp,
				rewrite,
				NUMBER_OF_ENTRIES
			};

			/// <summary>
			/// The kind of value an option carries.
			/// </summary>
			enum class OptionValueShape
			{
				/// <summary>
				/// A simple, negatable flag such as "script" or "~third-party". Carries a bool.
				/// </summary>
				Flag,

				/// <summary>
				/// A "|" separated list of domains, each optionally excluded with "~". Carries
				/// a DomainList.
				/// </summary>
				DomainList,

				/// <summary>
				/// A "|" separated list of site keys. Carries a SitekeyList.
				/// </summary>
				SitekeyList,

				/// <summary>
				/// A single, opaque string value. Carries a std::string.
				/// </summary>
				Text
			};

			/// <summary>
			/// An ordered list of domains, each paired with whether the domain is included
			/// (true) or excluded (false, written with a leading "~").
			/// </summary>
			using DomainList = std::vector<std::pair<std::string, bool>>;

			/// <summary>
			/// An ordered list of site keys.
			/// </summary>
			using SitekeyList = std::vector<std::string>;

			/// <summary>
			/// The value of a single parsed option. Which alternative is held is dictated by
			/// the OptionValueShape of the option kind. Note that a string literal given
			/// directly to this variant selects the bool alternative, so text values must
			/// always be supplied as std::string.
			/// </summary>
			using OptionValue = boost::variant<bool, DomainList, SitekeyList, std::string>;

			const char* ToString(const AbpFilterOption option);

			/// <summary>
			/// A single option of a parsed filter, pairing the option kind with its value.
			/// 
			/// Instances can only be created through the static Make* functions, each of which
			/// only accepts the value type that the catalog declares for the option kind, so
			/// that a kind can never end up paired with a value of the wrong shape.
			/// </summary>
			class FilterOption
			{

			public:

				/// <summary>
				/// Creates a flag option.
				/// </summary>
				/// <param name="option">
				/// The option kind. Must have the Flag shape, otherwise std::runtime_error is
				/// thrown.
				/// </param>
				/// <param name="enabled">
				/// False if the option was negated with "~", true otherwise.
				/// </param>
				static FilterOption MakeFlag(const AbpFilterOption option, const bool enabled);

				/// <summary>
				/// Creates a "domain=" option.
				/// </summary>
				static FilterOption MakeDomains(DomainList domains);

				/// <summary>
				/// Creates a "sitekey=" option.
				/// </summary>
				static FilterOption MakeSitekeys(SitekeyList sitekeys);

				/// <summary>
				/// Creates an option carrying an opaque string value, such as "csp=" or
				/// "rewrite=".
				/// </summary>
				/// <param name="option">
				/// The option kind. Must have the Text shape, otherwise std::runtime_error is
				/// thrown.
				/// </param>
				/// <param name="value">
				/// The option value. May be empty for options that don't require a value.
				/// </param>
				static FilterOption MakeText(const AbpFilterOption option, std::string value);

				AbpFilterOption GetOption() const;

				const OptionValue& GetValue() const;

				bool operator==(const FilterOption& other) const;

				bool operator!=(const FilterOption& other) const;

			private:

				FilterOption(const AbpFilterOption option, OptionValue value);

				AbpFilterOption m_option;

				OptionValue m_value;

			};

			/// <summary>
			/// The options of a filter, in the order they were written.
			/// </summary>
			using FilterOptions = std::vector<FilterOption>;

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
