// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef JSON_H_0187348321748321758934215734
#define JSON_H_0187348321748321758934215734

#include <algorithm>
#include <cstdint>
#include <map>
#include "string_tools.h"


namespace zen
{
//Spec: https://tools.ietf.org/html/rfc8259
struct JsonValue
{
    enum class Type
    {
        null,    //
        boolean, //primitive types
        number,  //
        string,  //
        array,
        object,
    };

    /**/     JsonValue() {}
    explicit JsonValue(Type t)          : type(t) {}
    explicit JsonValue(bool b)          : type(Type::boolean), primVal(b ? "true" : "false") {}
    explicit JsonValue(int num)         : type(Type::number),  primVal(numberTo(num)) {}
    explicit JsonValue(int64_t num)     : type(Type::number),  primVal(numberTo(num)) {}
    explicit JsonValue(uint64_t num)    : type(Type::number),  primVal(numberTo(num)) {}
    explicit JsonValue(std::string str) : type(Type::string),  primVal(std::move(str)) {} //unifying assignment
    explicit JsonValue(const char* str) : type(Type::string),  primVal(str) {}
    explicit JsonValue(const void*) = delete; //catch usage errors e.g. const int* -> JsonValue(bool)
    explicit JsonValue(std::vector<JsonValue> initList) : type(Type::array), arrayVal(std::move(initList)) {}

    Type type = Type::null;
    std::string                      primVal; //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //sorted => deterministic output
};


std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak = "\n",
                          const std::string& indent    = "    "); //noexcept


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError


//helper functions for JsonValue access:
inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type != JsonValue::Type::object)
        return nullptr;

    auto it = jvalue.objectVal.find(name);
    if (it == jvalue.objectVal.end())
        return nullptr;

    return &it->second;
}


inline
std::optional<std::string> getPrimitiveFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type != JsonValue::Type::object &&
            childValue->type != JsonValue::Type::array &&
            childValue->type != JsonValue::Type::null)
            return childValue->primVal;
    return std::nullopt;
}





//---------------------- implementation ----------------------
namespace json_impl
{
inline
std::string jsonEscape(const std::string& str)
{
    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '\\': output += "\\\\"; break; //
            case  '"': output += "\\\""; break; //escaping mandatory

            case '\b': output += "\\b"; break; //
            case '\f': output += "\\f"; break; //
            case '\n': output += "\\n"; break; //prefer compact escaping
            case '\r': output += "\\r"; break; //
            case '\t': output += "\\t"; break; //

            default:
                if (static_cast<unsigned char>(c) < 32)
                {
                    const auto [high, low] = hexify(c);
                    output += "\\u00";
                    output += high;
                    output += low;
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}


inline
void appendUtf8(std::string& output, uint32_t cp)
{
    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>(0xc0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>(0xe0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        output += static_cast<char>(0xf0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


inline
std::string jsonUnescape(std::string_view str)
{
    std::string output;
    uint32_t highSurrogate = 0;

    auto flushSurrogate = [&]
    {
        if (highSurrogate != 0)
            appendUtf8(output, 0xfffd); //unpaired => replacement char
        highSurrogate = 0;
    };
    auto writeOut = [&](char c)
    {
        flushSurrogate();
        output += c;
    };

    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c != '\\')
        {
            writeOut(c);
            continue;
        }

        if (++i == str.size()) //unexpected end!
        {
            writeOut(c);
            break;
        }

        const char c2 = str[i];
        switch (c2)
        {
            //*INDENT-OFF*
            case '\\':
            case '"':
            case '/': writeOut(c2);   break;
            case 'b': writeOut('\b'); break;
            case 'f': writeOut('\f'); break;
            case 'n': writeOut('\n'); break;
            case 'r': writeOut('\r'); break;
            case 't': writeOut('\t'); break;
            //*INDENT-ON*
            default:
                if (c2 == 'u' &&
                    str.size() - i >= 5 &&
                    isHexDigit(str[i + 1]) &&
                    isHexDigit(str[i + 2]) &&
                    isHexDigit(str[i + 3]) &&
                    isHexDigit(str[i + 4]))
                {
                    const uint32_t unit = static_cast<unsigned char>(unhexify(str[i + 1], str[i + 2])) * 256 +
                                          static_cast<unsigned char>(unhexify(str[i + 3], str[i + 4]));
                    i += 4;

                    if (0xd800 <= unit && unit < 0xdc00)
                    {
                        flushSurrogate();
                        highSurrogate = unit;
                    }
                    else if (0xdc00 <= unit && unit < 0xe000)
                    {
                        if (highSurrogate != 0)
                            appendUtf8(output, 0x10000 + ((highSurrogate - 0xd800) << 10) + (unit - 0xdc00));
                        else
                            appendUtf8(output, 0xfffd);
                        highSurrogate = 0;
                    }
                    else
                    {
                        flushSurrogate();
                        appendUtf8(output, unit);
                    }
                }
                else //unknown escape sequence!
                {
                    writeOut(c);
                    writeOut(c2);
                }
                break;
        }
    }
    flushSurrogate();
    return output;
}


inline
void serialize(const JsonValue& jval, std::string& stream,
               const std::string& lineBreak,
               const std::string& indent,
               size_t indentLevel)
{
    //the caller is repsonsible for line breaks and indentation of *first* line
    auto writeIndent = [&](size_t level)
    {
        for (size_t i = 0; i < level; ++i)
            stream += indent;
    };

    switch (jval.type)
    {
        case JsonValue::Type::null:
            stream += "null";
            break;

        case JsonValue::Type::boolean:
        case JsonValue::Type::number:
            stream += jval.primVal;
            break;

        case JsonValue::Type::string:
            stream += '"' + jsonEscape(jval.primVal) + '"';
            break;

        case JsonValue::Type::object:
            stream += '{';
            if (!jval.objectVal.empty())
            {
                for (auto it = jval.objectVal.begin(); it != jval.objectVal.end(); ++it)
                {
                    const auto& [childName, childValue] = *it;

                    if (it != jval.objectVal.begin())
                        stream += ',';

                    stream += lineBreak;
                    writeIndent(indentLevel + 1);

                    stream += '"' + jsonEscape(childName) + "\":";
                    if (!indent.empty())
                        stream += ' ';

                    serialize(childValue, stream, lineBreak, indent, indentLevel + 1);
                }
                stream += lineBreak;
                writeIndent(indentLevel);
            }
            stream += '}';
            break;

        case JsonValue::Type::array:
            stream += '[';
            for (auto it = jval.arrayVal.begin(); it != jval.arrayVal.end(); ++it)
            {
                if (it != jval.arrayVal.begin())
                    stream += indent.empty() ? "," : ", ";
                serialize(*it, stream, lineBreak, indent, indentLevel + 1); //arrays stay on one line: short lists of names
            }
            stream += ']';
            break;
    }
}
}


inline
std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak,
                          const std::string& indent) //noexcept
{
    std::string output;
    json_impl::serialize(jval, output, lineBreak, indent, 0);
    output += lineBreak;
    return output;
}


namespace json_impl
{
enum class TokenType
{
    eof,
    curlyOpen,
    curlyClose,
    squareOpen,
    squareClose,
    colon,
    comma,
    string,  //
    number,  //primitive types
    boolean, //
    null,    //
};

struct Token
{
    Token(TokenType t) : type(t) {}

    TokenType type;
    std::string primVal; //for primitive types
};

class Scanner
{
public:
    explicit Scanner(const std::string& stream) : stream_(stream)
    {
        if (zen::startsWith(stream_, "\xEF\xBB\xBF")) //UTF-8 BOM
            pos_ += 3;
    }

    Token getNextToken() //throw JsonParsingError
    {
        while (pos_ < stream_.size() && isJsonWhiteSpace(stream_[pos_]))
            ++pos_;

        if (pos_ == stream_.size())
            return TokenType::eof;

        switch (stream_[pos_])
        {
            //*INDENT-OFF*
            case '{': ++pos_; return TokenType::curlyOpen;
            case '}': ++pos_; return TokenType::curlyClose;
            case '[': ++pos_; return TokenType::squareOpen;
            case ']': ++pos_; return TokenType::squareClose;
            case ':': ++pos_; return TokenType::colon;
            case ',': ++pos_; return TokenType::comma;
            //*INDENT-ON*
        }

        if (consumeLiteral("null"))
            return TokenType::null;

        for (const char* literal : {"true", "false"})
            if (consumeLiteral(literal))
            {
                Token tk(TokenType::boolean);
                tk.primVal = literal;
                return tk;
            }

        if (stream_[pos_] == '"')
        {
            for (size_t i = ++pos_; i < stream_.size(); ++i)
                if (stream_[i] == '"')
                {
                    Token tk(TokenType::string);
                    tk.primVal = jsonUnescape(std::string_view(stream_).substr(pos_, i - pos_));
                    pos_ = i + 1;
                    return tk;
                }
                else if (stream_[i] == '\\') //skip next char
                    ++i;

            throw JsonParsingError(posRow(), posCol());
        }

        //expect a number:
        size_t numEnd = pos_;
        while (numEnd < stream_.size() && isJsonNumDigit(stream_[numEnd]))
            ++numEnd;
        if (numEnd == pos_)
            throw JsonParsingError(posRow(), posCol());

        Token tk(TokenType::number);
        tk.primVal = stream_.substr(pos_, numEnd - pos_);
        pos_ = numEnd;
        return tk;
    }

    size_t posRow() const //current row beginning with 0
    {
        const size_t crSum = std::count(stream_.begin(), stream_.begin() + pos_, '\r'); //carriage returns
        const size_t nlSum = std::count(stream_.begin(), stream_.begin() + pos_, '\n'); //new lines
        return std::max(crSum, nlSum); //be compatible with Linux/Mac/Win
    }

    size_t posCol() const //current col beginning with 0
    {
        for (size_t i = pos_; i > 0; --i)
            if (isLineBreak(stream_[i - 1]))
                return pos_ - i;
        return pos_;
    }

private:
    Scanner           (const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    static bool isJsonWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    static bool isJsonNumDigit  (char c) { return ('0' <= c && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e'|| c == 'E'; }

    bool consumeLiteral(std::string_view literal)
    {
        if (!zen::startsWith(std::string_view(stream_).substr(pos_), literal))
            return false;
        pos_ += literal.size();
        return true;
    }

    const std::string stream_;
    size_t pos_ = 0;
};


class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) :
        scn_(stream),
        tk_(scn_.getNextToken()) {} //throw JsonParsingError

    JsonValue parse() //throw JsonParsingError
    {
        JsonValue jval = parseValue(); //throw JsonParsingError
        expectToken(TokenType::eof);   //
        return jval;
    }

private:
    JsonParser           (const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    JsonValue parseValue() //throw JsonParsingError
    {
        switch (tk_.type)
        {
            case TokenType::curlyOpen:
            {
                nextToken(); //throw JsonParsingError
                JsonValue jval(JsonValue::Type::object);

                if (tk_.type != TokenType::curlyClose)
                    for (;;)
                    {
                        expectToken(TokenType::string); //throw JsonParsingError
                        std::string name = tk_.primVal;
                        nextToken(); //throw JsonParsingError

                        consumeToken(TokenType::colon); //throw JsonParsingError

                        JsonValue value = parseValue(); //throw JsonParsingError
                        jval.objectVal.insert_or_assign(std::move(name), std::move(value)); //duplicate keys: last one wins

                        if (tk_.type != TokenType::comma)
                            break;
                        nextToken(); //throw JsonParsingError
                    }

                consumeToken(TokenType::curlyClose); //throw JsonParsingError
                return jval;
            }
            case TokenType::squareOpen:
            {
                nextToken(); //throw JsonParsingError
                JsonValue jval(JsonValue::Type::array);

                if (tk_.type != TokenType::squareClose)
                    for (;;)
                    {
                        jval.arrayVal.push_back(parseValue()); //throw JsonParsingError

                        if (tk_.type != TokenType::comma)
                            break;
                        nextToken(); //throw JsonParsingError
                    }

                consumeToken(TokenType::squareClose); //throw JsonParsingError
                return jval;
            }
            case TokenType::string:
            case TokenType::number:
            case TokenType::boolean:
            {
                JsonValue jval(tk_.type == TokenType::string ? JsonValue::Type::string :
                               tk_.type == TokenType::number ? JsonValue::Type::number : JsonValue::Type::boolean);
                jval.primVal = tk_.primVal;
                nextToken(); //throw JsonParsingError
                return jval;
            }
            case TokenType::null:
                nextToken(); //throw JsonParsingError
                return JsonValue();

            default: //unexpected token
                throw JsonParsingError(scn_.posRow(), scn_.posCol());
        }
    }

    void nextToken() { tk_ = scn_.getNextToken(); } //throw JsonParsingError

    void expectToken(TokenType t) //throw JsonParsingError
    {
        if (tk_.type != t)
            throw JsonParsingError(scn_.posRow(), scn_.posCol());
    }

    void consumeToken(TokenType t) //throw JsonParsingError
    {
        expectToken(t); //throw JsonParsingError
        nextToken();    //
    }

    Scanner scn_;
    Token tk_;
};
}

inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parse(); //throw JsonParsingError
}
}

#endif //JSON_H_0187348321748321758934215734
