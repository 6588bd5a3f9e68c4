// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <charconv>
#include <compare>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


//UTF-8 std::string helpers: the bridge has no use for wide strings
namespace zen
{
inline bool isWhiteSpace(char c) { return c == ' ' || ('\t' <= c && c <= '\r'); } //std::isspace() minus the locale and int insanity
inline bool isLineBreak (char c) { return c == '\r' || c == '\n'; }
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; }
inline bool isHexDigit  (char c) { return isDigit(c) || ('A' <= c && c <= 'F') || ('a' <= c && c <= 'f'); }
inline bool isAsciiChar (char c) { return static_cast<unsigned char>(c) < 128; }
inline bool isAsciiAlpha(char c) { return ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z'); }
inline bool isControlChar(char c) { return static_cast<unsigned char>(c) < 32 || c == 127; }

inline char asciiToLower(char c) { return ('A' <= c && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }
inline char asciiToUpper(char c) { return ('a' <= c && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

[[nodiscard]] std::string asciiToLowerCpy(std::string_view str);
[[nodiscard]] std::string asciiToUpperCpy(std::string_view str);

constexpr size_t strLength(const char* str) { return std::char_traits<char>::length(str); }

inline bool contains  (std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }
inline bool contains  (std::string_view str, char c)                { return str.find(c)    != std::string_view::npos; }
inline bool startsWith(std::string_view str, std::string_view prefix) { return str.starts_with(prefix); }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.ends_with(postfix); }

bool equalAsciiNoCase   (std::string_view lhs, std::string_view rhs);
bool endsWithAsciiNoCase(std::string_view str, std::string_view postfix);

//STL container predicate for std::map/std::set with case-insensitive keys (A-Z only!)
struct LessAsciiNoCase
{
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

enum class IfNotFoundReturn
{
    all,
    none
};
[[nodiscard]] std::string afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
[[nodiscard]] std::string beforeLast (std::string_view str, std::string_view term, IfNotFoundReturn infr);
[[nodiscard]] std::string afterFirst (std::string_view str, std::string_view term, IfNotFoundReturn infr);
[[nodiscard]] std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Function> void split(std::string_view str, char delimiter, Function onStringPart);
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

[[nodiscard]] std::string trimCpy(std::string_view str);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

//number <-> string via std::to_chars/std::from_chars: no locale, no allocation surprises
template <class Num> std::string numberTo(Num number);
template <class Num> std::optional<Num> tryStringTo(std::string_view str); //none on junk or overflow; surrounding whitespace allowed

std::pair<char, char> hexify  (unsigned char c, bool upperCase = true);
char                  unhexify(char high, char low);







//---------------------- implementation ----------------------
inline
std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    for (char& c : output)
        c = asciiToLower(c);
    return output;
}


inline
std::string asciiToUpperCpy(std::string_view str)
{
    std::string output(str);
    for (char& c : output)
        c = asciiToUpper(c);
    return output;
}


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
        return false;

    for (size_t i = 0; i < lhs.size(); ++i)
        if (asciiToLower(lhs[i]) != asciiToLower(rhs[i]))
            return false;
    return true;
}


inline
bool endsWithAsciiNoCase(std::string_view str, std::string_view postfix)
{
    return str.size() >= postfix.size() &&
           equalAsciiNoCase(str.substr(str.size() - postfix.size()), postfix);
}


inline
bool LessAsciiNoCase::operator()(std::string_view lhs, std::string_view rhs) const
{
    const size_t len = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < len; ++i)
    {
        const char cl = asciiToLower(lhs[i]);
        const char cr = asciiToLower(rhs[i]);
        if (cl != cr)
            return static_cast<unsigned char>(cl) < static_cast<unsigned char>(cr);
    }
    return lhs.size() < rhs.size();
}


inline
std::string afterLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(pos + term.size()));
}


inline
std::string beforeLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(0, pos));
}


inline
std::string afterFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(pos + term.size()));
}


inline
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(0, pos));
}


template <class Function> inline
void split(std::string_view str, char delimiter, Function onStringPart)
{
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        if (pos == std::string_view::npos)
        {
            onStringPart(str);
            return;
        }
        onStringPart(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
}


inline
std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    split(str, delimiter, [&](std::string_view block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);
    });
    return output;
}


inline
std::string trimCpy(std::string_view str)
{
    while (!str.empty() && isWhiteSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && isWhiteSpace(str.back()))
        str.remove_suffix(1);
    return std::string(str);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    if (oldTerm.empty())
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class Num> inline
std::string numberTo(Num number)
{
    static_assert(std::is_arithmetic_v<Num> && !std::is_same_v<Num, bool>);

    char buffer[64];
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());
    return std::string(buffer, rv.ptr);
}


template <class Num> inline
std::optional<Num> tryStringTo(std::string_view str)
{
    static_assert(std::is_arithmetic_v<Num> && !std::is_same_v<Num, bool>);

    while (!str.empty() && isWhiteSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && isWhiteSpace(str.back()))
        str.remove_suffix(1);

    if (!str.empty() && str.front() == '+') //from_chars() doesn't accept a plus sign
        str.remove_prefix(1);

    if (str.empty())
        return std::nullopt;

    Num number{};
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), number);
    if (rv.ec != std::errc() || rv.ptr != str.data() + str.size())
        return std::nullopt;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num&& num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);
        return static_cast<char>((upperCase ? 'A' : 'a') + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') return hex - '0';
        if ('A' <= hex && hex <= 'F') return hex - 'A' + 10;
        if ('a' <= hex && hex <= 'f') return hex - 'a' + 10;
        assert(false);
        return 0;
    };
    return static_cast<char>(16 * unhexifyDigit(high) + unhexifyDigit(low));
}
}

#endif //STRING_TOOLS_H_213458973046
