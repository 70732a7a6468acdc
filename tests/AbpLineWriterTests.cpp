#include <string>
#include <gtest/gtest.h>
#include "abp/listparser/parsing/AbpLineParser.hpp"
#include "abp/listparser/parsing/AbpLineWriter.hpp"

using namespace abp::listparser;
using namespace abp::listparser::parsing;

namespace
{

	class AbpLineWriterTest : public ::testing::Test
	{
	protected:

		std::string Rewrite(const std::string& text)
		{
			return AbpLineWriter::Write(m_parser.Parse(text));
		}

		options::ParserOptions m_options;
		AbpLineParser m_parser{ &m_options };
	};

	TEST_F(AbpLineWriterTest, WritesNonFilterLinesCanonically)
	{
		EXPECT_EQ(Rewrite(u8"   "), u8"");
		EXPECT_EQ(Rewrite(u8"!Block foo"), u8"! Block foo");
		EXPECT_EQ(Rewrite(u8"!"), u8"!");
		EXPECT_EQ(Rewrite(u8"! Homepage  :  http://aaa.com/b"), u8"! Homepage: http://aaa.com/b");
		EXPECT_EQ(Rewrite(u8"%include   foo.txt%"), u8"%include foo.txt%");
		EXPECT_EQ(Rewrite(u8"  [Adblock Plus 1.1]"), u8"[Adblock Plus 1.1]");
	}

	TEST_F(AbpLineWriterTest, WritesUrlFilters)
	{
		EXPECT_EQ(Rewrite(u8"||example.com^"), u8"||example.com^");
		EXPECT_EQ(Rewrite(u8"@@/ddd|f?a[s]d/"), u8"@@/ddd|f?a[s]d/");
		EXPECT_EQ(
			Rewrite(u8"@@|ads.$SCRIPT, ~third-party,domain=a.com|~b.com,sitekey=k1|k2,csp"),
			u8"@@|ads.$script,~third-party,domain=a.com|~b.com,sitekey=k1|k2,csp"
			);
		EXPECT_EQ(Rewrite(u8"a$b$rewrite=abp-resource:blank-js"), u8"a$b$rewrite=abp-resource:blank-js");
	}

	TEST_F(AbpLineWriterTest, WritesHidingFilters)
	{
		EXPECT_EQ(Rewrite(u8"##ddd"), u8"##ddd");
		EXPECT_EQ(Rewrite(u8"foo, ~bar#@#body > div"), u8"foo,~bar#@#body > div");
		EXPECT_EQ(Rewrite(u8"foo,~bar#?#:-abp-properties(abc)"), u8"foo,~bar#?#:-abp-properties(abc)");
		EXPECT_EQ(Rewrite(u8"@@foo.com#?#x"), u8"@@foo.com#?#x");
		EXPECT_EQ(Rewrite(u8"@@##ddd"), u8"#@#ddd");
	}

	TEST_F(AbpLineWriterTest, WrittenFiltersParseBackToTheSameFilter)
	{
		const std::string text(u8"bla$match-case,~script,domain=foo.com|~bar.com,sitekey=foo");

		const auto original = boost::get<AbpFilter>(m_parser.Parse(text));
		const auto reparsed = boost::get<AbpFilter>(m_parser.Parse(AbpLineWriter::Write(original)));

		EXPECT_TRUE(reparsed.GetSelector() == original.GetSelector());
		EXPECT_EQ(reparsed.GetAction(), original.GetAction());
		EXPECT_TRUE(reparsed.GetOptions() == original.GetOptions());
	}

	TEST_F(AbpLineWriterTest, WritesSingleOptions)
	{
		EXPECT_EQ(AbpLineWriter::Write(FilterOption::MakeFlag(AbpFilterOption::object_subrequest, true)), u8"object-subrequest");
		EXPECT_EQ(AbpLineWriter::Write(FilterOption::MakeFlag(AbpFilterOption::third_party, false)), u8"~third-party");
		EXPECT_EQ(AbpLineWriter::Write(FilterOption::MakeDomains({ { u8"a.com", false } })), u8"domain=~a.com");
		EXPECT_EQ(AbpLineWriter::Write(FilterOption::MakeText(AbpFilterOption::csp, u8"img-src")), u8"csp=img-src");
	}

} /* anonymous namespace */
