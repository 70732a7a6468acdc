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

#include "AbpFilterOptions.hpp"
#include "AbpSyntaxCatalog.hpp"
#include <stdexcept>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			const char* ToString(const AbpFilterOption option)
			{
				return AbpSyntaxCatalog::GetFilterOptionDefinition(option).name.data();
			}

			FilterOption::FilterOption(const AbpFilterOption option, OptionValue value) 
				: m_option(option), m_value(std::move(value))
			{

			}

			FilterOption FilterOption::MakeFlag(const AbpFilterOption option, const bool enabled)
			{
				if (AbpSyntaxCatalog::GetFilterOptionDefinition(option).shape != OptionValueShape::Flag)
				{
					throw std::runtime_error(u8"In FilterOption::MakeFlag(const AbpFilterOption, const bool) - Supplied option is not a flag option.");
				}

				return FilterOption(option, OptionValue(enabled));
			}

			FilterOption FilterOption::MakeDomains(DomainList domains)
			{
				return FilterOption(AbpFilterOption::domain, OptionValue(std::move(domains)));
			}

			FilterOption FilterOption::MakeSitekeys(SitekeyList sitekeys)
			{
				return FilterOption(AbpFilterOption::sitekey, OptionValue(std::move(sitekeys)));
			}

			FilterOption FilterOption::MakeText(const AbpFilterOption option, std::string value)
			{
				if (AbpSyntaxCatalog::GetFilterOptionDefinition(option).shape != OptionValueShape::Text)
				{
					throw std::runtime_error(u8"In FilterOption::MakeText(const AbpFilterOption, std::string) - Supplied option does not carry a text value.");
				}

				return FilterOption(option, OptionValue(std::move(value)));
			}

			AbpFilterOption FilterOption::GetOption() const
			{
				return m_option;
			}

			const OptionValue& FilterOption::GetValue() const
			{
				return m_value;
			}

			bool FilterOption::operator==(const FilterOption& other) const
			{
				return m_option == other.m_option && m_value == other.m_value;
			}

			bool FilterOption::operator!=(const FilterOption& other) const
			{
				return !(*this == other);
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
