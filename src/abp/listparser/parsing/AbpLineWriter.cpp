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

#include "AbpLineWriter.hpp"
#include "AbpSyntaxCatalog.hpp"
#include <vector>
#include <boost/algorithm/string/join.hpp>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				std::string JoinDomains(const DomainList& domains, const char* separator)
				{
					std::vector<std::string> parts;
					parts.reserve(domains.size());

					for (const auto& domain : domains)
					{
						parts.push_back(domain.second ? domain.first : u8"~" + domain.first);
					}

					return boost::algorithm::join(parts, separator);
				}

				class OptionValueWriter : public boost::static_visitor<std::string>
				{

				public:

					explicit OptionValueWriter(boost::string_ref name) : m_name(name)
					{

					}

					std::string operator()(const bool enabled) const
					{
						std::string ret(enabled ? u8"" : u8"~");
						return ret.append(m_name.begin(), m_name.end());
					}

					std::string operator()(const DomainList& domains) const
					{
						return m_name.to_string() + u8"=" + JoinDomains(domains, u8"|");
					}

					std::string operator()(const SitekeyList& sitekeys) const
					{
						return m_name.to_string() + u8"=" + boost::algorithm::join(sitekeys, u8"|");
					}

					std::string operator()(const std::string& value) const
					{
						if (value.size() == 0)
						{
							return m_name.to_string();
						}

						return m_name.to_string() + u8"=" + value;
					}

				private:

					boost::string_ref m_name;

				};

				class LineWriterVisitor : public boost::static_visitor<std::string>
				{

				public:

					std::string operator()(const EmptyLine&) const
					{
						return std::string();
					}

					std::string operator()(const Comment& comment) const
					{
						if (comment.GetText().size() == 0)
						{
							return u8"!";
						}

						return u8"! " + comment.GetText();
					}

					std::string operator()(const Metadata& metadata) const
					{
						return u8"! " + metadata.GetKey() + u8": " + metadata.GetValue();
					}

					std::string operator()(const Instruction& instruction) const
					{
						auto keyword = AbpSyntaxCatalog::GetInstructionKeyword(instruction.GetType());
						return u8"%" + keyword.to_string() + u8" " + instruction.GetTarget() + u8"%";
					}

					std::string operator()(const Header& header) const
					{
						return u8"[" + header.GetVersion() + u8"]";
					}

					std::string operator()(const AbpFilter& filter) const
					{
						return AbpLineWriter::Write(filter);
					}

				};

			} /* anonymous namespace */

			std::string AbpLineWriter::Write(const Line& line)
			{
				return boost::apply_visitor(LineWriterVisitor(), line);
			}

			std::string AbpLineWriter::Write(const AbpFilter& filter)
			{
				const auto& selector = filter.GetSelector();
				std::string ret;

				if (filter.IsElementHiding())
				{
					for (const auto& option : filter.GetOptions())
					{
						if (option.GetOption() == AbpFilterOption::domain)
						{
							ret.append(JoinDomains(boost::get<DomainList>(option.GetValue()), u8","));
						}
					}

					const bool show = filter.GetAction() == FilterAction::Show;

					if (selector.type == SelectorType::ExtendedCss)
					{
						// There is no dedicated exception marker for extended CSS, the
						// exception is expressed with a leading "@@".
						if (show)
						{
							ret.insert(0, u8"@@");
						}

						ret.append(u8"#?#");
					}
					else
					{
						ret.append(show ? u8"#@#" : u8"##");
					}

					return ret.append(selector.value);
				}

				if (filter.GetAction() == FilterAction::Allow)
				{
					ret.append(u8"@@");
				}

				if (selector.type == SelectorType::UrlRegexp)
				{
					ret.append(u8"/").append(selector.value).append(u8"/");
				}
				else
				{
					ret.append(selector.value);
				}

				const auto& options = filter.GetOptions();

				if (options.size() > 0)
				{
					std::vector<std::string> parts;
					parts.reserve(options.size());

					for (const auto& option : options)
					{
						parts.push_back(Write(option));
					}

					ret.append(u8"$").append(boost::algorithm::join(parts, u8","));
				}

				return ret;
			}

			std::string AbpLineWriter::Write(const FilterOption& option)
			{
				const auto name = AbpSyntaxCatalog::GetFilterOptionDefinition(option.GetOption()).name;
				return boost::apply_visitor(OptionValueWriter(name), option.GetValue());
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
