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

#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <boost/utility/string_ref.hpp>
#include "../../util/string/StringRefUtil.hpp"
#include "AbpFilterOptions.hpp"
#include "AbpLine.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			/// <summary>
			/// Describes a single recognized filter option.
			/// </summary>
			struct FilterOptionDefinition
			{
				/// <summary>
				/// The name the option is written as in a filter, without any "~" or "=".
				/// </summary>
				boost::string_ref name;

				AbpFilterOption option;

				OptionValueShape shape;

				/// <summary>
				/// Whether a value must follow the name. Only meaningful for non-flag shapes,
				/// since flags never accept a value.
				/// </summary>
				bool requiresValue;
			};

			/// <summary>
			/// The AbpSyntaxCatalog holds every fixed vocabulary of the filter list grammar in
			/// one place: the recognized metadata keys, instruction keywords and filter
			/// options. Everything that decides whether a word is "known" to the parser goes
			/// through here, so extending the grammar's vocabulary means extending the tables
			/// in this class and nothing else.
			/// 
			/// All tables are immutable after static initialization, so every member is safe
			/// to use from any number of threads.
			/// </summary>
			class AbpSyntaxCatalog
			{

			public:

				AbpSyntaxCatalog() = delete;

				/// <summary>
				/// Checks if the supplied key is a recognized metadata key, such as "Title" or
				/// "Homepage". Comparison is case sensitive.
				/// </summary>
				static bool IsMetadataKey(boost::string_ref key);

				/// <summary>
				/// Gets all recognized metadata keys.
				/// </summary>
				static const std::vector<boost::string_ref>& GetMetadataKeys();

				/// <summary>
				/// Looks up an instruction keyword, such as "include".
				/// </summary>
				/// <param name="keyword">
				/// The word following the opening "%" of an instruction line.
				/// </param>
				/// <param name="type">
				/// Receives the instruction type when the keyword is recognized.
				/// </param>
				/// <returns>
				/// True if the keyword is recognized, false otherwise.
				/// </returns>
				static bool FindInstruction(boost::string_ref keyword, InstructionType& type);

				/// <summary>
				/// Gets the keyword an instruction type is written as.
				/// </summary>
				static boost::string_ref GetInstructionKeyword(const InstructionType type);

				/// <summary>
				/// Looks up a filter option by the name it is written as. Option names are
				/// matched case-insensitively.
				/// </summary>
				/// <param name="name">
				/// The option name, without any leading "~" or trailing "=value".
				/// </param>
				/// <returns>
				/// The definition of the option, or nullptr if the name is not recognized.
				/// </returns>
				static const FilterOptionDefinition* FindFilterOption(boost::string_ref name);

				/// <summary>
				/// Gets the definition of a filter option kind. Throws std::runtime_error if the
				/// kind has no catalog entry.
				/// </summary>
				static const FilterOptionDefinition& GetFilterOptionDefinition(const AbpFilterOption option);

				/// <summary>
				/// Gets all filter option definitions, in AbpFilterOption order.
				/// </summary>
				static const std::vector<FilterOptionDefinition>& GetFilterOptionDefinitions();

			private:

				static const std::vector<boost::string_ref> MetadataKeys;

				static const std::unordered_set<boost::string_ref, util::string::StringRefHash> MetadataKeySet;

				static const std::unordered_map<boost::string_ref, InstructionType, util::string::StringRefHash> Instructions;

				static const std::vector<FilterOptionDefinition> FilterOptions;

				/// <summary>
				/// Contains all valid filter options keyed by name. Used when parsing string
				/// options to quickly retrieve the correct corresponding definition.
				/// </summary>
				static const std::unordered_map<boost::string_ref, const FilterOptionDefinition*, util::string::StringRefICaseHash, util::string::StringRefIEquals> FilterOptionsByName;

			};

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
