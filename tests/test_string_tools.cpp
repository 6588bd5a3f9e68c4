// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/string_tools.h>
#include "../FtpBridge/Source/log_file.h"

using namespace zen;


class StringToolsTest : public ::testing::Test
{
};


TEST_F(StringToolsTest, CaseConversion)
{
    EXPECT_EQ(asciiToLowerCpy("FTP_Bridge.XLSX"), "ftp_bridge.xlsx");
    EXPECT_EQ(asciiToUpperCpy("token_powerbi"), "TOKEN_POWERBI");
    EXPECT_EQ(asciiToLowerCpy("ÄÖ"), "ÄÖ"); //non-ASCII untouched
    EXPECT_TRUE(equalAsciiNoCase("Bearer", "bEARER"));
    EXPECT_FALSE(equalAsciiNoCase("Bearer", "Bearer "));
    EXPECT_TRUE(endsWithAsciiNoCase("report.XLSX", ".xlsx"));
}


TEST_F(StringToolsTest, SearchAndSplit)
{
    EXPECT_EQ(afterFirst ("a=b=c", "=", IfNotFoundReturn::none), "b=c");
    EXPECT_EQ(beforeFirst("a=b=c", "=", IfNotFoundReturn::none), "a");
    EXPECT_EQ(afterLast  ("/r/q3.xlsx", "/", IfNotFoundReturn::all), "q3.xlsx");
    EXPECT_EQ(beforeLast ("/r/q3.xlsx", "/", IfNotFoundReturn::all), "/r");
    EXPECT_EQ(afterFirst ("abc", "=", IfNotFoundReturn::none), "");
    EXPECT_EQ(beforeFirst("abc", "=", IfNotFoundReturn::all), "abc");

    EXPECT_EQ(splitCpy("a,,b,", ',', SplitOnEmpty::skip),  (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitCpy("a,,b,", ',', SplitOnEmpty::allow), (std::vector<std::string>{"a", "", "b", ""}));

    EXPECT_EQ(trimCpy(" \t value \r\n"), "value");
    EXPECT_EQ(replaceCpy("a\nb\nc", "\n", " "), "a b c");
}


TEST_F(StringToolsTest, NumberConversion)
{
    EXPECT_EQ(numberTo(8192), "8192");
    EXPECT_EQ(numberTo(uint64_t(1) << 40), "1099511627776");

    EXPECT_EQ(tryStringTo<int>(" 8080 "), 8080);
    EXPECT_EQ(tryStringTo<int>("+21"), 21);
    EXPECT_FALSE(tryStringTo<int>("21x"));
    EXPECT_FALSE(tryStringTo<int>(""));
    EXPECT_FALSE(tryStringTo<int>("99999999999")); //overflow
    EXPECT_FALSE(tryStringTo<uint64_t>("-1"));
}


TEST_F(StringToolsTest, Hex)
{
    EXPECT_EQ(hexify(0xd0), std::make_pair('D', '0'));
    EXPECT_EQ(hexify(0xbe, false), std::make_pair('b', 'e'));
    EXPECT_EQ(unhexify('4', '0'), '@');
}


TEST_F(StringToolsTest, TokenMasking)
{
    EXPECT_EQ(fbr::maskToken("0123456789abcdef0123456789abcdef"), "01234567***");
    EXPECT_EQ(fbr::maskToken("abc"), "abc***");
}
