// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <type_traits>


//useful non-member functions for UTF-8/ASCII std::string
namespace zen
{
bool isWhiteSpace(char c);
bool isLineBreak (char c);
bool isDigit     (char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
bool isHexDigit  (char c);
char asciiToLower(char c);
char asciiToUpper(char c);

[[nodiscard]] std::string getLowerCaseAscii(std::string_view str);

bool contains  (std::string_view str, std::string_view term);
bool startsWith(std::string_view str, std::string_view prefix);
bool startsWith(std::string_view str, char prefix);
bool endsWith  (std::string_view str, std::string_view postfix);
bool endsWith  (std::string_view str, char postfix);

bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix);
bool equalAsciiNoCase     (std::string_view lhs, std::string_view rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
[[nodiscard]] std::string_view afterLast  (std::string_view str, char term, IfNotFoundReturn infr);
[[nodiscard]] std::string_view beforeLast (std::string_view str, char term, IfNotFoundReturn infr);
[[nodiscard]] std::string_view afterFirst (std::string_view str, char term, IfNotFoundReturn infr);
[[nodiscard]] std::string_view beforeFirst(std::string_view str, char term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Function> void split(std::string_view str, char delimiter, Function onStringPart);
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
[[nodiscard]] std::string_view trimCpy(std::string_view str, TrimSide side = TrimSide::both);
template <class Function> [[nodiscard]] std::string_view trimCpy(std::string_view str, TrimSide side, Function trimThisChar);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm);

//conversion between numbers and strings
template <class S, class Num> S numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //returns 0 on error

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);
[[nodiscard]] std::string formatAsHexString(std::string_view blob); //bytes -> uppercase hex string
char unhexify(char high, char low);








//---------------------- implementation ----------------------
inline
bool isWhiteSpace(char c)
{
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == ' ' || ('\t' <= c && c <= '\r');
}


inline bool isLineBreak(char c) { return c == '\r' || c == '\n'; }

inline bool isDigit(char c) { return '0' <= c && c <= '9'; }


inline
bool isHexDigit(char c)
{
    return ('0' <= c && c <= '9') ||
           ('A' <= c && c <= 'F') ||
           ('a' <= c && c <= 'f');
}


inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }
inline char asciiToUpper(char c) { return 'a' <= c && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c; }


inline
std::string getLowerCaseAscii(std::string_view str)
{
    std::string output(str);
    std::transform(output.begin(), output.end(), output.begin(), [](char c) { return asciiToLower(c); });
    return output;
}


inline bool contains(std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }

inline bool startsWith(std::string_view str, std::string_view prefix) { return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix; }
inline bool startsWith(std::string_view str, char prefix) { return !str.empty() && str.front() == prefix; }

inline bool endsWith(std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }
inline bool endsWith(std::string_view str, char postfix) { return !str.empty() && str.back() == postfix; }


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
}


inline
std::string_view afterLast(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + 1);
}


inline
std::string_view beforeLast(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(0, pos);
}


inline
std::string_view afterFirst(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + 1);
}


inline
std::string_view beforeFirst(std::string_view str, char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(0, pos);
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


template <class Function> inline
std::string_view trimCpy(std::string_view str, TrimSide side, Function trimThisChar)
{
    if (side == TrimSide::left || side == TrimSide::both)
        while (!str.empty() && trimThisChar(str.front()))
            str.remove_prefix(1);

    if (side == TrimSide::right || side == TrimSide::both)
        while (!str.empty() && trimThisChar(str.back()))
            str.remove_suffix(1);
    return str;
}


inline
std::string_view trimCpy(std::string_view str, TrimSide side)
{
    return trimCpy(str, side, [](char c) { return isWhiteSpace(c); });
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    if constexpr (std::is_floating_point_v<Num>)
        return std::to_string(number);
    else
    {
        char buffer[64] = {};
        const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
        assert(rv.ec == std::errc());
        return std::string(buffer, rv.ptr);
    }
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    str = trimCpy(str);
    if (startsWith(str, '+'))
        str.remove_prefix(1);

    Num number = 0;
    if constexpr (std::is_floating_point_v<Num>)
    {
        //std::from_chars for double is not available on every libstdc++ we target
        try { number = static_cast<Num>(std::stod(std::string(str))); }
        catch (const std::exception&) { return 0; }
    }
    else if (std::from_chars(str.data(), str.data() + str.size(), number).ec != std::errc())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);

        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
std::string formatAsHexString(std::string_view blob)
{
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto [high, low] = hexify(static_cast<unsigned char>(c));
        output += high;
        output += low;
    }
    return output;
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') //no locale-dependent checks
            return hex - '0';
        else if ('A' <= hex && hex <= 'F')
            return (hex - 'A') + 10;
        else if ('a' <= hex && hex <= 'f')
            return (hex - 'a') + 10;
        assert(false);
        return 0;
    };
    return static_cast<char>(16 * unhexifyDigit(high) + unhexifyDigit(low));
}
}

#endif //STRING_TOOLS_H_213458973046
