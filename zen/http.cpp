// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "http.h"
#include <algorithm>

using namespace zen;


namespace
{
//encode for "application/x-www-form-urlencoded"
std::string urlencode(std::string_view str)
{
    std::string output;
    for (const char c : str) //follow PHP spec: https://github.com/php/php-src/blob/e99d5d39239c611e1e7304e79e88545c4e71a073/ext/standard/url.c#L455
        if (c == ' ')
            output += '+';
        else if (isDigit(c) || isAsciiAlpha(c) ||
                 c == '-' || c == '.' || c == '_') //note: "~" is encoded by PHP!
            output += c;
        else
        {
            const auto [high, low] = hexify(c);
            output += '%';
            output += high;
            output += low;
        }
    return output;
}


std::string urldecode(std::string_view str, bool plusIsSpace)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c == '+' && plusIsSpace)
            output += ' ';
        else if (c == '%' && str.size() - i >= 3 &&
                 isHexDigit(str[i + 1]) &&
                 isHexDigit(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += c;
    }
    return output;
}


bool isHttpTokenChar(char c) //RFC 9110 "tchar"
{
    return isDigit(c) || isAsciiAlpha(c) || contains("!#$%&'*+-.^_`|~", c);
}
}


std::string zen::xWwwFormUrlEncode(const std::vector<std::pair<std::string, std::string>>& paramPairs)
{
    std::string output;
    for (const auto& [name, value] : paramPairs)
        output += urlencode(name) + '=' + urlencode(value) + '&';
    if (!output.empty())
        output.pop_back();
    return output;
}


std::vector<std::pair<std::string, std::string>> zen::xWwwFormUrlDecode(std::string_view str)
{
    std::vector<std::pair<std::string, std::string>> output;

    split(str, '&', [&](std::string_view nvPair)
    {
        if (!nvPair.empty())
            output.emplace_back(urldecode(beforeFirst(nvPair, "=", IfNotFoundReturn::all), true),
                                urldecode(afterFirst (nvPair, "=", IfNotFoundReturn::none), true));
    });
    return output;
}


std::string zen::urlDecodePath(std::string_view str)
{
    return urldecode(str, false);
}


HttpRequest zen::parseHttpRequestHead(std::string_view head) //throw SysError
{
    if (head.size() > HTTP_REQUEST_HEAD_MAX)
        throw SysError("HTTP request header too large.");

    std::vector<std::string_view> lines;
    split(head, '\n', [&](std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
    });
    //tolerate leading empty lines: RFC 9112, 2.2
    while (!lines.empty() && lines.front().empty())
        lines.erase(lines.begin());

    if (lines.empty())
        throw SysError("Empty HTTP request.");

    //request-line = method SP request-target SP HTTP-version
    const std::vector<std::string> requestLine = splitCpy(lines[0], ' ', SplitOnEmpty::skip);
    if (requestLine.size() != 3)
        throw SysError("Malformed HTTP request line: " + std::string(lines[0]));

    HttpRequest req;
    req.method  = requestLine[0];
    req.version = requestLine[2];

    if (req.method.empty() || !std::all_of(req.method.begin(), req.method.end(), isHttpTokenChar))
        throw SysError("Malformed HTTP method: " + req.method);

    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0")
        throw SysError("Unsupported HTTP version: " + req.version);

    const std::string& target = requestLine[1];
    if (!startsWith(target, "/"))
        throw SysError("Unsupported HTTP request target: " + target);

    req.path  = urlDecodePath(beforeFirst(target, "?", IfNotFoundReturn::all));
    req.query =               afterFirst (target, "?", IfNotFoundReturn::none);

    for (auto it = lines.begin() + 1; it != lines.end(); ++it)
    {
        const std::string_view line = *it;
        if (line.empty())
            continue;

        if (isWhiteSpace(line.front())) //obsolete line folding
            throw SysError("Unsupported HTTP header line folding.");

        const size_t colonPos = line.find(':');
        if (colonPos == std::string_view::npos || colonPos == 0)
            throw SysError("Malformed HTTP header: " + std::string(line));

        const std::string_view name = line.substr(0, colonPos);
        if (!std::all_of(name.begin(), name.end(), isHttpTokenChar))
            throw SysError("Malformed HTTP header name: " + std::string(name));

        std::string value = trimCpy(line.substr(colonPos + 1));

        auto [itHeader, inserted] = req.headers.emplace(name, value);
        if (!inserted) //RFC 9110, 5.3: combine repeated fields
            itHeader->second += ", " + value;
    }
    return req;
}


std::string zen::formatHttpResponseHead(int httpStatus, const HttpHeaders& headers)
{
    std::string output = "HTTP/1.1 " + numberTo(httpStatus) + ' ' + getHttpReasonPhrase(httpStatus) + "\r\n";
    for (const auto& [name, value] : headers)
        output += name + ": " + value + "\r\n";
    output += "\r\n";
    return output;
}


std::string zen::getHttpReasonPhrase(int sc)
{
    switch (sc)
    {
        //*INDENT-OFF*
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Content Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
        //*INDENT-ON*
    }
}

