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

#include "AbpFilter.hpp"

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			const char* ToString(const SelectorType type)
			{
				switch (type)
				{
					case SelectorType::UrlPattern:
						return u8"url-pattern";

					case SelectorType::UrlRegexp:
						return u8"url-regexp";

					case SelectorType::Css:
						return u8"css";

					case SelectorType::ExtendedCss:
						return u8"extended-css";
				}

				return u8"unknown";
			}

			const char* ToString(const FilterAction action)
			{
				switch (action)
				{
					case FilterAction::Block:
						return u8"block";

					case FilterAction::Allow:
						return u8"allow";

					case FilterAction::Hide:
						return u8"hide";

					case FilterAction::Show:
						return u8"show";
				}

				return u8"unknown";
			}

			bool Selector::operator==(const Selector& other) const
			{
				return type == other.type && value == other.value;
			}

			bool Selector::operator!=(const Selector& other) const
			{
				return !(*this == other);
			}

			AbpFilter::AbpFilter(std::string rawText, Selector selector, const FilterAction action, FilterOptions options) 
				: m_rawText(std::move(rawText)),
				m_selector(std::move(selector)),
				m_action(action),
				m_options(std::move(options))
			{

			}

			const std::string& AbpFilter::GetRawText() const
			{
				return m_rawText;
			}

			const Selector& AbpFilter::GetSelector() const
			{
				return m_selector;
			}

			FilterAction AbpFilter::GetAction() const
			{
				return m_action;
			}

			const FilterOptions& AbpFilter::GetOptions() const
			{
				return m_options;
			}

			bool AbpFilter::IsElementHiding() const
			{
				return m_selector.type == SelectorType::Css || m_selector.type == SelectorType::ExtendedCss;
			}

			bool AbpFilter::IsException() const
			{
				return m_action == FilterAction::Allow || m_action == FilterAction::Show;
			}

			bool AbpFilter::operator==(const AbpFilter& other) const
			{
				return m_rawText == other.m_rawText &&
					m_selector == other.m_selector &&
					m_action == other.m_action &&
					m_options == other.m_options;
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
