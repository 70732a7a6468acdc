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

#include "AbpSyntaxCatalog.hpp"
#include <stdexcept>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				template<typename Map>
				Map IndexByName(const std::vector<FilterOptionDefinition>& definitions)
				{
					Map ret;

					for (const auto& definition : definitions)
					{
						ret.emplace(definition.name, &definition);
					}

					return ret;
				}

			} /* anonymous namespace */

			const std::vector<boost::string_ref> AbpSyntaxCatalog::MetadataKeys
			{
				u8"Homepage",
				u8"Title",
				u8"Expires",
				u8"Checksum",
				u8"Redirect",
				u8"Version"
			};

			const std::unordered_set<boost::string_ref, util::string::StringRefHash> AbpSyntaxCatalog::MetadataKeySet(
				AbpSyntaxCatalog::MetadataKeys.begin(),
				AbpSyntaxCatalog::MetadataKeys.end()
				);

			const std::unordered_map<boost::string_ref, InstructionType, util::string::StringRefHash> AbpSyntaxCatalog::Instructions
			{
				{ u8"include", InstructionType::include }
			};

			// Must stay in AbpFilterOption order.
			const std::vector<FilterOptionDefinition> AbpSyntaxCatalog::FilterOptions
			{
				{ u8"document", AbpFilterOption::document, OptionValueShape::Flag, false },
				{ u8"elemhide", AbpFilterOption::elemhide, OptionValueShape::Flag, false },
				{ u8"font", AbpFilterOption::font, OptionValueShape::Flag, false },
				{ u8"genericblock", AbpFilterOption::genericblock, OptionValueShape::Flag, false },
				{ u8"generichide", AbpFilterOption::generichide, OptionValueShape::Flag, false },
				{ u8"image", AbpFilterOption::image, OptionValueShape::Flag, false },
				{ u8"match-case", AbpFilterOption::match_case, OptionValueShape::Flag, false },
				{ u8"media", AbpFilterOption::media, OptionValueShape::Flag, false },
				{ u8"object", AbpFilterOption::object, OptionValueShape::Flag, false },
				{ u8"object-subrequest", AbpFilterOption::object_subrequest, OptionValueShape::Flag, false },
				{ u8"other", AbpFilterOption::other, OptionValueShape::Flag, false },
				{ u8"ping", AbpFilterOption::ping, OptionValueShape::Flag, false },
				{ u8"popup", AbpFilterOption::popup, OptionValueShape::Flag, false },
				{ u8"script", AbpFilterOption::script, OptionValueShape::Flag, false },
				{ u8"stylesheet", AbpFilterOption::stylesheet, OptionValueShape::Flag, false },
				{ u8"subdocument", AbpFilterOption::subdocument, OptionValueShape::Flag, false },
				{ u8"third-party", AbpFilterOption::third_party, OptionValueShape::Flag, false },
				{ u8"webrtc", AbpFilterOption::webrtc, OptionValueShape::Flag, false },
				{ u8"websocket", AbpFilterOption::websocket, OptionValueShape::Flag, false },
				{ u8"xmlhttprequest", AbpFilterOption::xmlhttprequest, OptionValueShape::Flag, false },
				{ u8"collapse", AbpFilterOption::collapse, OptionValueShape::Flag, false },
				{ u8"domain", AbpFilterOption::domain, OptionValueShape::DomainList, true },
				{ u8"sitekey", AbpFilterOption::sitekey, OptionValueShape::SitekeyList, true },
				// Exception rules may disable every CSP of a page with a bare "csp".
				{ u8"csp", AbpFilterOption::csp, OptionValueShape::Text, false },
				{ u8"rewrite", AbpFilterOption::rewrite, OptionValueShape::Text, true }
			};

			const std::unordered_map<boost::string_ref, const FilterOptionDefinition*, util::string::StringRefICaseHash, util::string::StringRefIEquals> AbpSyntaxCatalog::FilterOptionsByName = 
				IndexByName<std::unordered_map<boost::string_ref, const FilterOptionDefinition*, util::string::StringRefICaseHash, util::string::StringRefIEquals>>(AbpSyntaxCatalog::FilterOptions);

			bool AbpSyntaxCatalog::IsMetadataKey(boost::string_ref key)
			{
				return MetadataKeySet.find(key) != MetadataKeySet.end();
			}

			const std::vector<boost::string_ref>& AbpSyntaxCatalog::GetMetadataKeys()
			{
				return MetadataKeys;
			}

			bool AbpSyntaxCatalog::FindInstruction(boost::string_ref keyword, InstructionType& type)
			{
				const auto result = Instructions.find(keyword);

				if (result == Instructions.end())
				{
					return false;
				}

				type = result->second;
				return true;
			}

			boost::string_ref AbpSyntaxCatalog::GetInstructionKeyword(const InstructionType type)
			{
				for (const auto& entry : Instructions)
				{
					if (entry.second == type)
					{
						return entry.first;
					}
				}

				throw std::runtime_error(u8"In AbpSyntaxCatalog::GetInstructionKeyword(const InstructionType) - Instruction type has no catalog entry.");
			}

			const FilterOptionDefinition* AbpSyntaxCatalog::FindFilterOption(boost::string_ref name)
			{
				const auto result = FilterOptionsByName.find(name);

				if (result == FilterOptionsByName.end())
				{
					return nullptr;
				}

				return result->second;
			}

			const FilterOptionDefinition& AbpSyntaxCatalog::GetFilterOptionDefinition(const AbpFilterOption option)
			{
				const auto index = static_cast<size_t>(option);

				if (index < FilterOptions.size() && FilterOptions[index].option == option)
				{
					return FilterOptions[index];
				}

				throw std::runtime_error(u8"In AbpSyntaxCatalog::GetFilterOptionDefinition(const AbpFilterOption) - Filter option has no catalog entry.");
			}

			const std::vector<FilterOptionDefinition>& AbpSyntaxCatalog::GetFilterOptionDefinitions()
			{
				return FilterOptions;
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
