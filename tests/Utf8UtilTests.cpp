#include <gtest/gtest.h>
#include "abp/util/encoding/Utf8Util.hpp"

using namespace abp::listparser::util::encoding;

namespace
{

	TEST(Utf8UtilTest, AcceptsWellFormedSequences)
	{
		EXPECT_TRUE(IsValidUtf8(""));
		EXPECT_TRUE(IsValidUtf8("||example.com^$script"));
		EXPECT_TRUE(IsValidUtf8("\xC3\xBC"));
		EXPECT_TRUE(IsValidUtf8("\xE2\x82\xAC"));
		EXPECT_TRUE(IsValidUtf8("\xF0\x9F\x98\x80"));
		EXPECT_TRUE(IsValidUtf8("\xF4\x8F\xBF\xBF"));
	}

	TEST(Utf8UtilTest, RejectsMalformedSequences)
	{
		// Overlong encoding of "/".
		EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));
		// UTF-16 surrogate half.
		EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));
		// Beyond U+10FFFF.
		EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));
		// Truncated.
		EXPECT_FALSE(IsValidUtf8("\xE2\x82"));
		// Stray continuation byte.
		EXPECT_FALSE(IsValidUtf8("\x80"));
		EXPECT_FALSE(IsValidUtf8("\xFF"));
	}

	TEST(Utf8UtilTest, ReportsOffsetOfFirstInvalidByte)
	{
		EXPECT_EQ(FindInvalidUtf8("ab\xFF" "cd"), 2u);
		EXPECT_EQ(FindInvalidUtf8("\xC3\xBC" "x\xE2\x82"), 3u);
		EXPECT_EQ(FindInvalidUtf8("fine"), boost::string_ref::npos);
	}

} /* anonymous namespace */
