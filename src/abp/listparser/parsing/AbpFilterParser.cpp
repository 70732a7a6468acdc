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

#include "AbpFilterParser.hpp"
#include "AbpSyntaxCatalog.hpp"
#include "../../util/string/StringRefUtil.hpp"
#include <cctype>
#include <stdexcept>

namespace abp
{
	namespace listparser
	{
		namespace parsing
		{

			namespace
			{

				/// <summary>
				/// Characters that may appear in an option name.
				/// </summary>
				inline bool IsOptionNameChar(const char c)
				{
					return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
				}

			} /* anonymous namespace */

			AbpFilterParser::AbpFilterParser(
				const options::ParserOptions* parserOptions,
				util::cb::MessageFunction onInfo,
				util::cb::MessageFunction onWarning,
				util::cb::MessageFunction onError
				) : EventReporter(
					onInfo,
					onWarning,
					onError
					),
				m_parserOptions(parserOptions)
			{
				if (m_parserOptions == nullptr)
				{
					throw std::runtime_error(u8"In AbpFilterParser::AbpFilterParser(const options::ParserOptions*, ...) - ParserOptions pointer must not be null.");
				}
			}

			AbpFilterParser::~AbpFilterParser()
			{

			}

			AbpFilter AbpFilterParser::Parse(const std::string& filterString) const
			{
				return Parse(boost::string_ref(filterString), filterString);
			}

			AbpFilter AbpFilterParser::Parse(boost::string_ref rule, const std::string& rawLine) const
			{
				bool isException = false;

				if (rule.starts_with(u8"@@"))
				{
					isException = true;
					rule.remove_prefix(2);
				}

				HidingMarker marker;

				if (FindHidingMarker(rule, marker))
				{
					// Element hiding filter. Everything after the marker is the selector,
					// taken verbatim. Hiding filters have no "$" option block, so the
					// only option such a filter can carry is the domain list before the
					// marker.
					auto domains = rule.substr(0, marker.position);
					auto selector = rule.substr(marker.position + marker.length);

					FilterOptions filterOptions;

					auto domainList = ParseDomains(domains, ',');

					if (domainList.size() > 0)
					{
						filterOptions.push_back(FilterOption::MakeDomains(std::move(domainList)));
					}

					const auto action = (isException || marker.isException) ? FilterAction::Show : FilterAction::Hide;

					return AbpFilter(rawLine, Selector{ marker.type, selector.to_string() }, action, std::move(filterOptions));
				}

				// This is a URL filter.
				FilterOptions filterOptions;

				auto optionsPos = FindOptionBlock(rule);

				if (optionsPos != boost::string_ref::npos)
				{
					filterOptions = ParseOptions(rule.substr(optionsPos + 1), rawLine);
					rule = rule.substr(0, optionsPos);
				}

				Selector selector{ SelectorType::UrlPattern, std::string() };

				if (rule.size() >= 2 && rule.front() == '/' && rule.back() == '/')
				{
					selector.type = SelectorType::UrlRegexp;
					selector.value = rule.substr(1, rule.size() - 2).to_string();
				}
				else
				{
					selector.value = rule.to_string();
				}

				const auto action = isException ? FilterAction::Allow : FilterAction::Block;

				return AbpFilter(rawLine, std::move(selector), action, std::move(filterOptions));
			}

			boost::string_ref::size_type AbpFilterParser::FindOptionBlock(boost::string_ref rule)
			{
				// Work from the last "$" backwards. Every candidate is a prefix of the
				// original rule, so positions found in the shrinking candidate are valid
				// positions in the rule too.
				auto candidate = rule;
				auto pos = candidate.rfind('$');

				while (pos != boost::string_ref::npos)
				{
					if (IsWellFormedOptionList(rule.substr(pos + 1)))
					{
						return pos;
					}

					candidate = candidate.substr(0, pos);
					pos = candidate.rfind('$');
				}

				return boost::string_ref::npos;
			}

			bool AbpFilterParser::FindHidingMarker(boost::string_ref rule, HidingMarker& marker)
			{
				auto pos = rule.find('#');

				while (pos != boost::string_ref::npos)
				{
					// These characters only ever show up in URL patterns. Once one of them
					// precedes the candidate marker, no later "#" can make this a hiding
					// filter either.
					if (rule.substr(0, pos).find_first_of(u8"/*|@\"!") != boost::string_ref::npos)
					{
						return false;
					}

					auto rest = rule.substr(pos);

					boost::string_ref::size_type length = 0;
					SelectorType type = SelectorType::Css;
					bool isException = false;

					if (rest.starts_with(u8"##"))
					{
						length = 2;
					}
					else if (rest.starts_with(u8"#@#"))
					{
						length = 3;
						isException = true;
					}
					else if (rest.starts_with(u8"#?#"))
					{
						length = 3;
						type = SelectorType::ExtendedCss;
					}

					if (length > 0 && rest.size() > length)
					{
						marker.position = pos;
						marker.length = length;
						marker.type = type;
						marker.isException = isException;
						return true;
					}

					pos = util::string::Find(rule, '#', pos + 1);
				}

				return false;
			}

			bool AbpFilterParser::IsWellFormedOptionList(boost::string_ref optionsString)
			{
				if (optionsString.size() == 0)
				{
					return false;
				}

				for (auto token : util::string::Split(optionsString, ','))
				{
					token = util::string::Trim(token);

					if (token.starts_with('~'))
					{
						token.remove_prefix(1);
					}

					size_t nameLength = 0;

					while (nameLength < token.size() && IsOptionNameChar(token[nameLength]))
					{
						++nameLength;
					}

					if (nameLength == 0)
					{
						return false;
					}

					auto rest = token.substr(nameLength);

					if (rest.size() == 0)
					{
						continue;
					}

					// Anything after the name must be "=" followed by a non-empty value.
					// Values may contain whitespace, as csp policies do.
					if (rest.front() != '=' || rest.size() == 1)
					{
						return false;
					}
				}

				return true;
			}

			FilterOptions AbpFilterParser::ParseOptions(boost::string_ref optionsString, const std::string& rawLine) const
			{
				FilterOptions ret;

				const bool strict = m_parserOptions->GetIsOptionEnabled(options::ParsingOption::StrictOptionParsing);

				// While > 0 because ParseSingleOption is guaranteed to consume till EOF.
				while (optionsString.size() > 0)
				{
					auto part = util::string::Trim(ParseSingleOption(optionsString));

					bool negated = false;

					if (part.starts_with('~'))
					{
						negated = true;
						part.remove_prefix(1);
					}

					auto name = part;
					boost::string_ref value;
					bool hasValue = false;

					auto equalsPos = part.find('=');

					if (equalsPos != boost::string_ref::npos)
					{
						name = part.substr(0, equalsPos);
						value = part.substr(equalsPos + 1);
						hasValue = true;
					}

					const auto definition = AbpSyntaxCatalog::FindFilterOption(name);

					if (definition == nullptr)
					{
						std::string reason(u8"In AbpFilterParser::ParseOptions(boost::string_ref, const std::string&) const - Unknown filter option: ");
						reason.append(name.to_string());

						if (strict)
						{
							throw ParseError(ParseErrorKind::UnknownOption, rawLine, reason);
						}

						reason.append(u8". Dropping the option from filter: ").append(rawLine);
						ReportWarning(reason);
						continue;
					}

					if (definition->shape == OptionValueShape::Flag)
					{
						if (hasValue)
						{
							std::string reason(u8"In AbpFilterParser::ParseOptions(boost::string_ref, const std::string&) const - Filter option does not accept a value: ");
							reason.append(name.to_string());
							throw ParseError(ParseErrorKind::InvalidOption, rawLine, reason);
						}

						ret.push_back(FilterOption::MakeFlag(definition->option, !negated));
						continue;
					}

					if (negated)
					{
						std::string reason(u8"In AbpFilterParser::ParseOptions(boost::string_ref, const std::string&) const - Filter option cannot be negated: ");
						reason.append(name.to_string());
						throw ParseError(ParseErrorKind::InvalidOption, rawLine, reason);
					}

					if (!hasValue && definition->requiresValue)
					{
						std::string reason(u8"In AbpFilterParser::ParseOptions(boost::string_ref, const std::string&) const - Filter option requires a value: ");
						reason.append(name.to_string());
						throw ParseError(ParseErrorKind::InvalidOption, rawLine, reason);
					}

					switch (definition->shape)
					{
						case OptionValueShape::DomainList:
						{
							ret.push_back(FilterOption::MakeDomains(ParseDomains(value, '|')));
						}
						break;

						case OptionValueShape::SitekeyList:
						{
							SitekeyList sitekeys;

							for (auto sitekey : util::string::Split(value, '|'))
							{
								if (sitekey.size() > 0)
								{
									sitekeys.push_back(sitekey.to_string());
								}
							}

							ret.push_back(FilterOption::MakeSitekeys(std::move(sitekeys)));
						}
						break;

						case OptionValueShape::Text:
						{
							ret.push_back(FilterOption::MakeText(definition->option, value.to_string()));
						}
						break;

						case OptionValueShape::Flag:
						break;
					}
				}

				return ret;
			}

			DomainList AbpFilterParser::ParseDomains(boost::string_ref domainsString, const char separator)
			{
				DomainList ret;

				for (auto domain : util::string::Split(domainsString, separator))
				{
					domain = util::string::Trim(domain);

					bool included = true;

					// Remove the exception indicator character if applicable.
					if (domain.starts_with('~'))
					{
						included = false;
						domain.remove_prefix(1);
					}

					if (domain.size() == 0)
					{
						continue;
					}

					ret.emplace_back(domain.to_string(), included);
				}

				return ret;
			}

			boost::string_ref AbpFilterParser::ParseSingleOption(boost::string_ref& optionsString)
			{
				if (optionsString.size() == 0)
				{
					return optionsString;
				}

				auto commaPos = optionsString.find(',');

				if (commaPos != boost::string_ref::npos)
				{
					auto ret = optionsString.substr(0, commaPos);
					optionsString = optionsString.substr(commaPos + 1);

					return ret;
				}

				auto ret = optionsString;
				optionsString = boost::string_ref();

				return ret;
			}

		} /* namespace parsing */
	} /* namespace listparser */
} /* namespace abp */
