#include <cstdint>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "abp/listparser/parsing/AbpLineParser.hpp"

using namespace abp::listparser;
using namespace abp::listparser::parsing;

namespace
{

	class AbpLineParserTest : public ::testing::Test
	{
	protected:

		ParseErrorKind ExpectParseError(const std::string& line)
		{
			try
			{
				m_parser.Parse(line);
			}
			catch (const ParseError& e)
			{
				EXPECT_EQ(e.GetLine(), line);
				return e.GetKind();
			}

			ADD_FAILURE() << "Expected ParseError for: " << line;
			return ParseErrorKind::DecodingError;
		}

		options::ParserOptions m_options;
		AbpLineParser m_parser{ &m_options };
	};

	TEST_F(AbpLineParserTest, WhitespaceOnlyIsEmptyLine)
	{
		for (const std::string text : { u8"", u8" ", u8"    ", u8"\t \t" })
		{
			const auto line = m_parser.Parse(text);

			EXPECT_EQ(GetLineType(line), LineType::EmptyLine);
			EXPECT_EQ(GetRawText(line), text);
		}
	}

	TEST_F(AbpLineParserTest, ParsesComment)
	{
		const auto line = m_parser.Parse(u8"! Block foo");

		ASSERT_EQ(GetLineType(line), LineType::Comment);
		EXPECT_EQ(boost::get<Comment>(line).GetText(), u8"Block foo");
		EXPECT_EQ(GetRawText(line), u8"! Block foo");

		EXPECT_EQ(boost::get<Comment>(m_parser.Parse(u8"!no space")).GetText(), u8"no space");
		EXPECT_EQ(boost::get<Comment>(m_parser.Parse(u8"!  two")).GetText(), u8" two");
		EXPECT_EQ(boost::get<Comment>(m_parser.Parse(u8"!")).GetText(), u8"");
	}

	TEST_F(AbpLineParserTest, ParsesMetadata)
	{
		const auto line = m_parser.Parse(u8"! Homepage  :  http://aaa.com/b");

		ASSERT_EQ(GetLineType(line), LineType::Metadata);
		EXPECT_EQ(boost::get<Metadata>(line).GetKey(), u8"Homepage");
		EXPECT_EQ(boost::get<Metadata>(line).GetValue(), u8"http://aaa.com/b");
		EXPECT_EQ(GetRawText(line), u8"! Homepage  :  http://aaa.com/b");

		const auto version = m_parser.Parse(u8"!Version:1234");
		ASSERT_EQ(GetLineType(version), LineType::Metadata);
		EXPECT_EQ(boost::get<Metadata>(version).GetKey(), u8"Version");
		EXPECT_EQ(boost::get<Metadata>(version).GetValue(), u8"1234");
	}

	TEST_F(AbpLineParserTest, UnknownMetadataKeyIsComment)
	{
		const auto wrong = m_parser.Parse(u8"! WrongHeader: something");
		ASSERT_EQ(GetLineType(wrong), LineType::Comment);
		EXPECT_EQ(boost::get<Comment>(wrong).GetText(), u8"WrongHeader: something");

		EXPECT_EQ(GetLineType(m_parser.Parse(u8"! title: lowercase")), LineType::Comment);
	}

	TEST_F(AbpLineParserTest, ParsesInstruction)
	{
		const auto line = m_parser.Parse(u8"%include foo:bar/baz.txt%");

		ASSERT_EQ(GetLineType(line), LineType::Instruction);
		EXPECT_EQ(boost::get<Instruction>(line).GetType(), InstructionType::include);
		EXPECT_EQ(boost::get<Instruction>(line).GetTarget(), u8"foo:bar/baz.txt");
		EXPECT_EQ(GetRawText(line), u8"%include foo:bar/baz.txt%");

		const auto padded = m_parser.Parse(u8"  %include  list.txt %\t");
		ASSERT_EQ(GetLineType(padded), LineType::Instruction);
		EXPECT_EQ(boost::get<Instruction>(padded).GetTarget(), u8"list.txt");
		EXPECT_EQ(GetRawText(padded), u8"  %include  list.txt %\t");
	}

	TEST_F(AbpLineParserTest, BadInstructionIsMalformed)
	{
		EXPECT_EQ(ExpectParseError(u8"%foo bar%"), ParseErrorKind::MalformedInstruction);
		EXPECT_EQ(ExpectParseError(u8"%include%"), ParseErrorKind::MalformedInstruction);
		EXPECT_EQ(ExpectParseError(u8"%include   %"), ParseErrorKind::MalformedInstruction);
		EXPECT_EQ(ExpectParseError(u8"%%"), ParseErrorKind::MalformedInstruction);
	}

	TEST_F(AbpLineParserTest, ReplacedWarningCallbackReachesFilterParser)
	{
		m_options.SetIsOptionEnabled(options::ParsingOption::StrictOptionParsing, false);

		size_t warnings = 0;

		m_parser.SetOnWarning(
			[&warnings](const char*, const size_t)
			{
				++warnings;
			}
		);

		m_parser.Parse(u8"foo$bogus");

		EXPECT_EQ(warnings, 1u);
	}

	TEST_F(AbpLineParserTest, LonePercentIsFilter)
	{
		const auto line = m_parser.Parse(u8"%");

		ASSERT_EQ(GetLineType(line), LineType::Filter);
		EXPECT_EQ(boost::get<AbpFilter>(line).GetSelector().value, u8"%");
	}

	TEST_F(AbpLineParserTest, ParsesHeader)
	{
		const auto line = m_parser.Parse(u8"[Adblock Plus 1.1]");

		ASSERT_EQ(GetLineType(line), LineType::Header);
		EXPECT_EQ(boost::get<Header>(line).GetVersion(), u8"Adblock Plus 1.1");

		const auto padded = m_parser.Parse(u8"[Adblock Plus 2.0]  ");
		ASSERT_EQ(GetLineType(padded), LineType::Header);
		EXPECT_EQ(boost::get<Header>(padded).GetVersion(), u8"Adblock Plus 2.0");
		EXPECT_EQ(GetRawText(padded), u8"[Adblock Plus 2.0]  ");
	}

	TEST_F(AbpLineParserTest, BadHeaderIsMalformed)
	{
		EXPECT_EQ(ExpectParseError(u8"[Adblock 1.1]"), ParseErrorKind::MalformedHeader);
		EXPECT_EQ(ExpectParseError(u8"[Adblock Plus ]"), ParseErrorKind::MalformedHeader);
		EXPECT_EQ(ExpectParseError(u8"[Adblock Plus]"), ParseErrorKind::MalformedHeader);
		EXPECT_EQ(ExpectParseError(u8"[foo]"), ParseErrorKind::MalformedHeader);
	}

	TEST_F(AbpLineParserTest, FilterKeepsUntrimmedRawText)
	{
		const auto line = m_parser.Parse(u8"  ||example.com^  ");

		ASSERT_EQ(GetLineType(line), LineType::Filter);
		EXPECT_EQ(boost::get<AbpFilter>(line).GetSelector().value, u8"||example.com^");
		EXPECT_EQ(GetRawText(line), u8"  ||example.com^  ");
	}

	TEST_F(AbpLineParserTest, FilterOptionErrorsPropagate)
	{
		EXPECT_EQ(ExpectParseError(u8"foo$bar"), ParseErrorKind::UnknownOption);
		EXPECT_EQ(ExpectParseError(u8"foo$script=1"), ParseErrorKind::InvalidOption);
	}

	TEST_F(AbpLineParserTest, ParsesBytes)
	{
		const std::vector<uint8_t> bytes{ '!', ' ', 0xC3, 0xBC };

		const auto line = m_parser.Parse(bytes.data(), bytes.size());

		ASSERT_EQ(GetLineType(line), LineType::Comment);
		EXPECT_EQ(boost::get<Comment>(line).GetText(), u8"ü");
		EXPECT_EQ(GetRawText(line), u8"! ü");

		EXPECT_EQ(GetLineType(m_parser.Parse(nullptr, 0)), LineType::EmptyLine);
	}

	TEST_F(AbpLineParserTest, InvalidUtf8IsDecodingError)
	{
		EXPECT_EQ(ExpectParseError("! \xFF"), ParseErrorKind::DecodingError);
		EXPECT_EQ(ExpectParseError("||ab\xC3"), ParseErrorKind::DecodingError);

		const std::vector<uint8_t> bytes{ 0xC0, 0xAF };
		EXPECT_THROW(m_parser.Parse(bytes.data(), bytes.size()), ParseError);
	}

	TEST_F(AbpLineParserTest, ErrorMessageNamesKindAndLine)
	{
		try
		{
			m_parser.Parse(u8"%foo bar%");
			FAIL() << "Expected ParseError";
		}
		catch (const ParseError& e)
		{
			const std::string what(e.what());

			EXPECT_NE(what.find(ToString(ParseErrorKind::MalformedInstruction)), std::string::npos);
			EXPECT_NE(what.find(u8"%foo bar%"), std::string::npos);
			EXPECT_FALSE(e.GetReason().empty());
		}
	}

	TEST_F(AbpLineParserTest, LineTypeNames)
	{
		EXPECT_STREQ(ToString(LineType::EmptyLine), u8"emptyline");
		EXPECT_STREQ(ToString(LineType::Filter), u8"filter");
		EXPECT_STREQ(ToString(SelectorType::ExtendedCss), u8"extended-css");
		EXPECT_STREQ(ToString(FilterAction::Show), u8"show");
	}

} /* anonymous namespace */
