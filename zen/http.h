// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HTTP_H_879083425703425702
#define HTTP_H_879083425703425702

#include <map>
#include "sys_error.h"


namespace zen
{
//server side of HTTP/1.1: just enough for a request/response service without keep-alive
using HttpHeaders = std::map<std::string, std::string, LessAsciiNoCase>; //field names are case-insensitive

struct HttpRequest
{
    std::string method;  //"GET", "HEAD", ...
    std::string path;    //decoded target path without query, e.g. "/download"
    std::string query;   //raw query string after '?'
    std::string version; //"HTTP/1.1"
    HttpHeaders headers;
};

const size_t HTTP_REQUEST_HEAD_MAX = 16 * 1024;

//input: everything up to and excluding the blank line "\r\n\r\n"
HttpRequest parseHttpRequestHead(std::string_view head); //throw SysError

std::string formatHttpResponseHead(int httpStatus, const HttpHeaders& headers);

std::string getHttpReasonPhrase(int httpStatus); //"Not Found"

std::string xWwwFormUrlEncode(const std::vector<std::pair<std::string, std::string>>& paramPairs);
std::vector<std::pair<std::string, std::string>> xWwwFormUrlDecode(std::string_view str);

std::string urlDecodePath(std::string_view str); //"%2F" decoding without "+" => space
}

#endif //HTTP_H_879083425703425702
