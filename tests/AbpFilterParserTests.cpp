#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "abp/listparser/parsing/AbpFilterParser.hpp"

using namespace abp::listparser;
using namespace abp::listparser::parsing;

namespace
{

	struct FilterCase
	{
		std::string text;
		SelectorType selectorType;
		std::string selectorValue;
		FilterAction action;
		FilterOptions options;
	};

	class AbpFilterParserTest : public ::testing::Test
	{
	protected:
		options::ParserOptions m_options;
		AbpFilterParser m_parser{ &m_options };
	};

	class AbpFilterParserCaseTest : public ::testing::TestWithParam<FilterCase>
	{
	protected:
		options::ParserOptions m_options;
		AbpFilterParser m_parser{ &m_options };
	};

	TEST_P(AbpFilterParserCaseTest, ParsesSelectorActionAndOptions)
	{
		const auto& expected = GetParam();

		const auto filter = m_parser.Parse(expected.text);

		EXPECT_EQ(filter.GetRawText(), expected.text);
		EXPECT_EQ(filter.GetSelector().type, expected.selectorType);
		EXPECT_EQ(filter.GetSelector().value, expected.selectorValue);
		EXPECT_EQ(filter.GetAction(), expected.action);
		EXPECT_TRUE(filter.GetOptions() == expected.options);
	}

	INSTANTIATE_TEST_SUITE_P(
		Filters,
		AbpFilterParserCaseTest,
		::testing::Values(
			FilterCase{ u8"*asdf*d**dd*", SelectorType::UrlPattern, u8"*asdf*d**dd*", FilterAction::Block, {} },
			FilterCase{ u8"@@|*asd|f*d**dd*|", SelectorType::UrlPattern, u8"|*asd|f*d**dd*|", FilterAction::Allow, {} },
			FilterCase{ u8"/ddd|f?a[s]d/", SelectorType::UrlRegexp, u8"ddd|f?a[s]d", FilterAction::Block, {} },
			FilterCase{ u8"@@/ddd|f?a[s]d/", SelectorType::UrlRegexp, u8"ddd|f?a[s]d", FilterAction::Allow, {} },
			FilterCase{
				u8"bla$match-case,~script,domain=foo.com|~bar.com,sitekey=foo",
				SelectorType::UrlPattern, u8"bla", FilterAction::Block,
				{
					FilterOption::MakeFlag(AbpFilterOption::match_case, true),
					FilterOption::MakeFlag(AbpFilterOption::script, false),
					FilterOption::MakeDomains({ { u8"foo.com", true }, { u8"bar.com", false } }),
					FilterOption::MakeSitekeys({ u8"foo" })
				}
			},
			FilterCase{
				u8"@@http://bla$~script,~other,sitekey=foo|bar",
				SelectorType::UrlPattern, u8"http://bla", FilterAction::Allow,
				{
					FilterOption::MakeFlag(AbpFilterOption::script, false),
					FilterOption::MakeFlag(AbpFilterOption::other, false),
					FilterOption::MakeSitekeys({ u8"foo", u8"bar" })
				}
			},
			FilterCase{ u8"##ddd", SelectorType::Css, u8"ddd", FilterAction::Hide, {} },
			FilterCase{ u8"#@#body > div:first-child", SelectorType::Css, u8"body > div:first-child", FilterAction::Show, {} },
			FilterCase{
				u8"foo,~bar##ddd",
				SelectorType::Css, u8"ddd", FilterAction::Hide,
				{ FilterOption::MakeDomains({ { u8"foo", true }, { u8"bar", false } }) }
			},
			FilterCase{
				u8"foo,~bar#?#:-abp-properties(abc)",
				SelectorType::ExtendedCss, u8":-abp-properties(abc)", FilterAction::Hide,
				{ FilterOption::MakeDomains({ { u8"foo", true }, { u8"bar", false } }) }
			},
			FilterCase{
				u8"foo.com#?#aaa :-abp-properties(abc) bbb",
				SelectorType::ExtendedCss, u8"aaa :-abp-properties(abc) bbb", FilterAction::Hide,
				{ FilterOption::MakeDomains({ { u8"foo.com", true } }) }
			},
			FilterCase{
				u8"#?#:-abp-properties(|background-image: url(data:*))",
				SelectorType::ExtendedCss, u8":-abp-properties(|background-image: url(data:*))", FilterAction::Hide, {}
			},
			FilterCase{ u8"@@##ddd", SelectorType::Css, u8"ddd", FilterAction::Show, {} },
			FilterCase{
				u8"@@foo.com#?#x",
				SelectorType::ExtendedCss, u8"x", FilterAction::Show,
				{ FilterOption::MakeDomains({ { u8"foo.com", true } }) }
			},
			FilterCase{ u8"###ad", SelectorType::Css, u8"#ad", FilterAction::Hide, {} },
			FilterCase{ u8"##div[title$=\"x\"]", SelectorType::Css, u8"div[title$=\"x\"]", FilterAction::Hide, {} },
			// Separator with nothing after it is not a hiding filter.
			FilterCase{ u8"foo##", SelectorType::UrlPattern, u8"foo##", FilterAction::Block, {} },
			FilterCase{ u8"example.com/path##x", SelectorType::UrlPattern, u8"example.com/path##x", FilterAction::Block, {} },
			// A "$" only starts an option block when a well formed option list follows it.
			FilterCase{ u8"foo$bar baz", SelectorType::UrlPattern, u8"foo$bar baz", FilterAction::Block, {} },
			FilterCase{ u8"price$", SelectorType::UrlPattern, u8"price$", FilterAction::Block, {} },
			FilterCase{
				u8"a$b$script",
				SelectorType::UrlPattern, u8"a$b", FilterAction::Block,
				{ FilterOption::MakeFlag(AbpFilterOption::script, true) }
			},
			FilterCase{
				u8"foo$domain=a$b.com",
				SelectorType::UrlPattern, u8"foo", FilterAction::Block,
				{ FilterOption::MakeDomains({ { u8"a$b.com", true } }) }
			},
			FilterCase{ u8"/", SelectorType::UrlPattern, u8"/", FilterAction::Block, {} },
			FilterCase{ u8"//", SelectorType::UrlRegexp, u8"", FilterAction::Block, {} }
			)
		);

	TEST_F(AbpFilterParserTest, OptionNamesAreCaseInsensitive)
	{
		const auto filter = m_parser.Parse(u8"foo$SCRIPT,~Third-Party");

		const FilterOptions expected
		{
			FilterOption::MakeFlag(AbpFilterOption::script, true),
			FilterOption::MakeFlag(AbpFilterOption::third_party, false)
		};

		EXPECT_TRUE(filter.GetOptions() == expected);
	}

	TEST_F(AbpFilterParserTest, TextOptionsKeepTheirValue)
	{
		const auto csp = m_parser.Parse(u8"||example.com^$csp=script-src 'self' https://cdn.example.com");
		EXPECT_EQ(csp.GetSelector().value, u8"||example.com^");
		ASSERT_EQ(csp.GetOptions().size(), 1u);
		EXPECT_TRUE(csp.GetOptions()[0] == FilterOption::MakeText(AbpFilterOption::csp, u8"script-src 'self' https://cdn.example.com"));

		const auto cspNoSpace = m_parser.Parse(u8"||example.com^$csp=default-src");
		ASSERT_EQ(cspNoSpace.GetOptions().size(), 1u);
		EXPECT_TRUE(cspNoSpace.GetOptions()[0] == FilterOption::MakeText(AbpFilterOption::csp, u8"default-src"));

		const auto bareCsp = m_parser.Parse(u8"@@||example.com^$csp");
		ASSERT_EQ(bareCsp.GetOptions().size(), 1u);
		EXPECT_TRUE(bareCsp.GetOptions()[0] == FilterOption::MakeText(AbpFilterOption::csp, u8""));

		const auto rewrite = m_parser.Parse(u8"||example.com/ad.js$script,rewrite=abp-resource:blank-js");
		ASSERT_EQ(rewrite.GetOptions().size(), 2u);
		EXPECT_TRUE(rewrite.GetOptions()[1] == FilterOption::MakeText(AbpFilterOption::rewrite, u8"abp-resource:blank-js"));
	}

	TEST_F(AbpFilterParserTest, CspWithSpacesKeepsNeighbouringOptions)
	{
		const auto filter = m_parser.Parse(u8"||example.com^$third-party,csp=img-src 'none'");

		EXPECT_EQ(filter.GetSelector().type, SelectorType::UrlPattern);
		EXPECT_EQ(filter.GetSelector().value, u8"||example.com^");
		EXPECT_EQ(filter.GetAction(), FilterAction::Block);

		const FilterOptions expected
		{
			FilterOption::MakeFlag(AbpFilterOption::third_party, true),
			FilterOption::MakeText(AbpFilterOption::csp, u8"img-src 'none'")
		};

		EXPECT_TRUE(filter.GetOptions() == expected);
	}

	TEST_F(AbpFilterParserTest, UnknownOptionWithSpacedValueIsReported)
	{
		try
		{
			m_parser.Parse(u8"||example.com^$bogus=a b");
			FAIL() << "Expected ParseError";
		}
		catch (const ParseError& e)
		{
			EXPECT_EQ(e.GetKind(), ParseErrorKind::UnknownOption);
		}
	}

	TEST_F(AbpFilterParserTest, SeparatorOnlyDomainPrefixGivesNoOptions)
	{
		for (const std::string text : { u8",##x", u8"~##x", u8", ~ ,#@#x" })
		{
			const auto filter = m_parser.Parse(text);

			EXPECT_TRUE(filter.IsElementHiding()) << text;
			EXPECT_TRUE(filter.GetOptions().empty()) << text;
		}
	}

	TEST_F(AbpFilterParserTest, EmptyListEntriesAreSkipped)
	{
		const auto filter = m_parser.Parse(u8"foo$domain=a.com||~b.com,sitekey=|k|");

		const FilterOptions expected
		{
			FilterOption::MakeDomains({ { u8"a.com", true }, { u8"b.com", false } }),
			FilterOption::MakeSitekeys({ u8"k" })
		};

		EXPECT_TRUE(filter.GetOptions() == expected);

		const auto hiding = m_parser.Parse(u8"a,,b##x");
		ASSERT_EQ(hiding.GetOptions().size(), 1u);
		EXPECT_TRUE(hiding.GetOptions()[0] == FilterOption::MakeDomains({ { u8"a", true }, { u8"b", true } }));
	}

	TEST_F(AbpFilterParserTest, UnknownOptionIsAnErrorWhenStrict)
	{
		try
		{
			m_parser.Parse(u8"foo$bar");
			FAIL() << "Expected ParseError";
		}
		catch (const ParseError& e)
		{
			EXPECT_EQ(e.GetKind(), ParseErrorKind::UnknownOption);
			EXPECT_EQ(e.GetLine(), u8"foo$bar");
		}
	}

	TEST_F(AbpFilterParserTest, UnknownOptionIsDroppedWithWarningWhenLenient)
	{
		m_options.SetIsOptionEnabled(options::ParsingOption::StrictOptionParsing, false);

		size_t warnings = 0;
		std::string lastWarning;

		AbpFilterParser lenient(
			&m_options,
			nullptr,
			[&warnings, &lastWarning](const char* msg, const size_t msgLen)
			{
				++warnings;
				lastWarning.assign(msg, msgLen);
			}
		);

		const auto filter = lenient.Parse(u8"foo$bar,script");

		EXPECT_EQ(filter.GetSelector().value, u8"foo");
		ASSERT_EQ(filter.GetOptions().size(), 1u);
		EXPECT_TRUE(filter.GetOptions()[0] == FilterOption::MakeFlag(AbpFilterOption::script, true));
		EXPECT_EQ(warnings, 1u);
		EXPECT_NE(lastWarning.find(u8"bar"), std::string::npos);
	}

	TEST_F(AbpFilterParserTest, MisusedOptionsAreInvalid)
	{
		const std::vector<std::string> invalid
		{
			u8"foo$script=1",
			u8"foo$~domain=a.com",
			u8"foo$domain",
			u8"foo$sitekey",
			u8"foo$rewrite"
		};

		for (const auto& text : invalid)
		{
			try
			{
				m_parser.Parse(text);
				ADD_FAILURE() << "Expected ParseError for " << text;
			}
			catch (const ParseError& e)
			{
				EXPECT_EQ(e.GetKind(), ParseErrorKind::InvalidOption) << text;
			}
		}
	}

	TEST_F(AbpFilterParserTest, ClassifiesExceptionsAndHiding)
	{
		const auto block = m_parser.Parse(u8"||ads.example.com^");
		EXPECT_FALSE(block.IsException());
		EXPECT_FALSE(block.IsElementHiding());

		const auto allow = m_parser.Parse(u8"@@||ads.example.com^");
		EXPECT_TRUE(allow.IsException());
		EXPECT_FALSE(allow.IsElementHiding());

		const auto show = m_parser.Parse(u8"example.com#@#.ad");
		EXPECT_TRUE(show.IsException());
		EXPECT_TRUE(show.IsElementHiding());
	}

	TEST_F(AbpFilterParserTest, FindOptionBlockLocatesLastWellFormedDollar)
	{
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"a$b$script"), 3u);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"foo$domain=a$b.com"), 3u);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"foo$bar baz"), boost::string_ref::npos);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"price$"), boost::string_ref::npos);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"$script"), 0u);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"nodollar"), boost::string_ref::npos);
		EXPECT_EQ(AbpFilterParser::FindOptionBlock(u8"x$csp=a b,script"), 1u);
	}

	TEST_F(AbpFilterParserTest, NullOptionsAreRejected)
	{
		EXPECT_THROW(AbpFilterParser(nullptr), std::runtime_error);
	}

} /* anonymous namespace */
