// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/http.h>

using namespace zen;


class HttpParserTest : public ::testing::Test
{
};


TEST_F(HttpParserTest, RequestHead)
{
    const HttpRequest req = parseHttpRequestHead("GET /download?host=ftp.example.com&path=%2Freports%2Fq3.xlsx HTTP/1.1\r\n"
                                                 "Host: localhost:8000\r\n"
                                                 "authorization: Bearer abc\r\n"
                                                 "Accept: text/csv\r\n"
                                                 "Accept: application/json\r\n");
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/download");
    EXPECT_EQ(req.query, "host=ftp.example.com&path=%2Freports%2Fq3.xlsx");
    EXPECT_EQ(req.version, "HTTP/1.1");

    ASSERT_TRUE(req.headers.contains("Authorization")); //case-insensitive
    EXPECT_EQ(req.headers.at("AUTHORIZATION"), "Bearer abc");
    EXPECT_EQ(req.headers.at("Accept"), "text/csv, application/json");
}


TEST_F(HttpParserTest, PathIsDecoded)
{
    const HttpRequest req = parseHttpRequestHead("HEAD /admin%2Frevalidate HTTP/1.0\r\n");
    EXPECT_EQ(req.method, "HEAD");
    EXPECT_EQ(req.path, "/admin/revalidate");
    EXPECT_TRUE(req.query.empty());
}


TEST_F(HttpParserTest, MalformedRequests)
{
    EXPECT_THROW(parseHttpRequestHead(""), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET /\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET / HTTP/2.0\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET http://example.com/ HTTP/1.1\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("G(T / HTTP/1.1\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET / HTTP/1.1\r\nNoColonHere\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET / HTTP/1.1\r\nHost: a\r\n folded\r\n"), SysError);
    EXPECT_THROW(parseHttpRequestHead("GET / HTTP/1.1\r\n" + std::string(HTTP_REQUEST_HEAD_MAX, 'x')), SysError);
}


TEST_F(HttpParserTest, QueryDecoding)
{
    const std::vector<std::pair<std::string, std::string>> params = xWwwFormUrlDecode("user=j%C3%B6rg&password=a+b%26c&path=/x.csv&flag&=empty");

    ASSERT_EQ(params.size(), 5u);
    EXPECT_EQ(params[0], (std::pair<std::string, std::string>("user", "jörg")));
    EXPECT_EQ(params[1], (std::pair<std::string, std::string>("password", "a b&c")));
    EXPECT_EQ(params[2], (std::pair<std::string, std::string>("path", "/x.csv")));
    EXPECT_EQ(params[3], (std::pair<std::string, std::string>("flag", "")));
    EXPECT_EQ(params[4], (std::pair<std::string, std::string>("", "empty")));
}


TEST_F(HttpParserTest, QueryEncodingRoundTrip)
{
    const std::vector<std::pair<std::string, std::string>> params{{"path", "/Q3 report & more.xlsx"}, {"user", "ä~"}};
    EXPECT_EQ(xWwwFormUrlDecode(xWwwFormUrlEncode(params)), params);
}


TEST_F(HttpParserTest, ResponseHead)
{
    const std::string head = formatHttpResponseHead(404, {{"Content-Length", "0"}});
    EXPECT_EQ(head, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(getHttpReasonPhrase(413), "Content Too Large");
}
