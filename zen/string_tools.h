// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <cstdio>  //snprintf
#include <cwchar>  //swprintf
#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include "utf.h"


//useful non-member functions for std::string and std::wstring (and their views)
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on parse errors

template <class S, class T, class Num> S printNumber(const T& format, const Num& number); //format a single number using std::snprintf()










//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isLineBreak(Char c)
{
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c)
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


namespace impl
{
inline std::string_view  asView(std::string_view  str) { return str; }
inline std::wstring_view asView(std::wstring_view str) { return str; }
inline std::string_view  asView(const char&    ch) { return {&ch, 1}; }
inline std::wstring_view asView(const wchar_t& ch) { return {&ch, 1}; }
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::asView(str).find(impl::asView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return impl::asView(str).starts_with(impl::asView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return impl::asView(str).ends_with(impl::asView(postfix));
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::asView(str);
    const auto termView = impl::asView(term);
    assert(!termView.empty());

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView = impl::asView(str);
    assert(!impl::asView(term).empty());

    const size_t pos = strView.rfind(impl::asView(term));
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::asView(str);
    const auto termView = impl::asView(term);
    assert(!termView.empty());

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView = impl::asView(str);
    assert(!impl::asView(term).empty());

    const size_t pos = strView.find(impl::asView(term));
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    const auto strView = impl::asView(str);
    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = strView.find(delimiter, blockStart);
        if (blockEnd == strView.npos)
        {
            onStringPart(strView.substr(blockStart));
            return;
        }
        onStringPart(strView.substr(blockStart, blockEnd - blockStart));
        blockStart = blockEnd + 1;
    }
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    const auto strView = impl::asView(str);

    size_t first = 0;
    size_t last  = strView.size();

    if (side == TrimSide::left || side == TrimSide::both)
        while (first != last && isWhiteSpace(strView[first]))
            ++first;

    if (side == TrimSide::right || side == TrimSide::both)
        while (last != first && isWhiteSpace(strView[last - 1]))
            --last;

    return S(strView.substr(first, last - first));
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    str = trimCpy(str, side);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::asView(oldTerm);
    const auto newView = impl::asView(newTerm);
    assert(!oldView.empty());
    if (oldView.empty())
        return;

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);

    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());
    const std::string_view numStr(buffer, rv.ptr - buffer);

    return utfTo<S>(numStr);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);

    const std::string numStr = trimCpy(utfTo<std::string>(str));
    const char* first = numStr.data();
    if (!numStr.empty() && numStr[0] == '+') //from_chars() does not accept explicit plus sign
        ++first;

    Num number = 0;
    if (std::from_chars(first, numStr.data() + numStr.size(), number).ec != std::errc())
        return 0;
    return number;
}


namespace impl
{
template <class Num> inline
int saferPrintf(char* buffer, size_t bufferSize, const char* format, const Num& number)
{
    return std::snprintf(buffer, bufferSize, format, number);
}

template <class Num> inline
int saferPrintf(wchar_t* buffer, size_t bufferSize, const wchar_t* format, const Num& number)
{
    return std::swprintf(buffer, bufferSize, format, number);
}
}


template <class S, class T, class Num> inline
S printNumber(const T& format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    using CharType = typename S::value_type;

    const int bufferSize = 64;
    CharType buffer[bufferSize] = {};
    const int charsWritten = impl::saferPrintf(buffer, bufferSize, format, number);

    return 0 < charsWritten && charsWritten < bufferSize ? S(buffer, charsWritten) : S();
}
}

#endif //STRING_TOOLS_H_213458973046
