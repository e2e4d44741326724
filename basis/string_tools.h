// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstdio>  //snprintf
#include <cstdint>
#include <cstdlib> //strtod
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


//string helpers for std::string only: byte-wise, no locale, no Unicode normalization
namespace basis
{
inline bool isWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; }
inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool startsWith(std::string_view str, std::string_view prefix) { return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0; }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0; }
inline bool contains  (std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);
std::string asciiToLowerCpy(std::string_view str);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string beforeLast (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

[[nodiscard]] std::string trimCpy(std::string_view str);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

template <class S, class Num> S numberTo(const Num& number);
template <class Num> bool tryStringTo(std::string_view str, Num& number); //strict: all characters must be consumed

std::string formatAsHexString(std::string_view blob); //bytes -> (human-readable) hex string

template <class Num> std::string printNumber(const char* format, const Num& number); //format a single number using std::snprintf()








//---------------------- implementation ----------------------
inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char c1, char c2) { return asciiToLower(c1) == asciiToLower(c2); });
}


inline
std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    std::transform(output.begin(), output.end(), output.begin(), [](char c) { return asciiToLower(c); });
    return output;
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
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? std::string(str) : std::string();

    return std::string(str.substr(0, pos));
}


inline
std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        const std::string_view part = str.substr(0, pos);

        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);

        if (pos == std::string_view::npos)
            return output;
        str.remove_prefix(pos + 1);
    }
}


inline
std::string trimCpy(std::string_view str)
{
    auto first = std::find_if_not(str.begin(), str.end(), [](char c) { return isWhiteSpace(c); });
    auto last  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(first), [](char c) { return isWhiteSpace(c); }).base();
    return std::string(first, last);
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


template <class S, class Num> inline
S numberTo(const Num& number)
{
    if constexpr (std::is_same_v<Num, bool>)
        return number ? "1" : "0";
    else if constexpr (std::is_floating_point_v<Num>)
        return printNumber("%g", static_cast<double>(number));
    else if constexpr (std::is_enum_v<Num>)
        return numberTo<S>(static_cast<std::underlying_type_t<Num>>(number));
    else
    {
        char buffer[32] = {};
        const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
        assert(rv.ec == std::errc());
        return S(buffer, rv.ptr);
    }
}


template <class Num> inline
bool tryStringTo(std::string_view str, Num& number)
{
    const std::string tmp = trimCpy(str);
    if (tmp.empty())
        return false;

    const char* first = tmp.data();
    const char* last  = tmp.data() + tmp.size();
    if (*first == '+') //std::from_chars doesn't accept leading "+"
        ++first;

    if constexpr (std::is_same_v<Num, bool>)
    {
        if (equalAsciiNoCase(tmp, "true") || tmp == "1") { number = true;  return true; }
        if (equalAsciiNoCase(tmp, "false") || tmp == "0") { number = false; return true; }
        return false;
    }
    else if constexpr (std::is_floating_point_v<Num>)
    {
        char* end = nullptr;
        const double val = std::strtod(first, &end);
        if (end != last)
            return false;
        number = static_cast<Num>(val);
        return true;
    }
    else
    {
        const std::from_chars_result rv = std::from_chars(first, last, number);
        return rv.ec == std::errc() && rv.ptr == last;
    }
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char digits[] = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto b = static_cast<unsigned char>(c);
        output += digits[b >> 4];
        output += digits[b & 0xf];
    }
    return output;
}


template <class Num> inline
std::string printNumber(const char* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[128] = {}; //zero-initialize
    const int charsWritten = std::snprintf(buffer, sizeof(buffer), format, number);
    if (charsWritten < 0 || charsWritten >= static_cast<int>(sizeof(buffer)))
        return std::string();
    return std::string(buffer, charsWritten);
}
}

#endif //STRING_TOOLS_H_213458973046
