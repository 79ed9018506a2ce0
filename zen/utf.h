// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <string>
#include <string_view>
#include <type_traits>


namespace zen
{
//convert between UTF-8 (std::string, Zstring) and wide character strings (std::wstring: UTF-32 on Linux)
//invalid input sequences are replaced by U+FFFD
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

size_t unicodeLength(std::string_view utf8); //number of code points








//----------------------- implementation ----------------------------------
namespace impl
{
constexpr char32_t REPLACEMENT_CHAR = U'\xfffd';

inline std::string_view  asStringView(std::string_view  str) { return str; }
inline std::wstring_view asStringView(std::wstring_view str) { return str; }


inline
void codePointToUtf8(char32_t cp, std::string& out)
{
    if (cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff)) //no surrogates in UTF-8!
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


template <class Function>
void decodeUtf8(std::string_view str, Function onCodePoint)
{
    for (auto it = str.begin(); it != str.end();)
    {
        const auto ch = static_cast<unsigned char>(*it++);

        size_t trailCount = 0;
        char32_t cp = 0;
        if (ch < 0x80)
        {
            onCodePoint(ch);
            continue;
        }
        else if ((ch & 0xe0) == 0xc0) { trailCount = 1; cp = ch & 0x1f; }
        else if ((ch & 0xf0) == 0xe0) { trailCount = 2; cp = ch & 0x0f; }
        else if ((ch & 0xf8) == 0xf0) { trailCount = 3; cp = ch & 0x07; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }

        bool valid = true;
        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) & 0xc0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }
        onCodePoint(valid && cp <= 0x10ffff ? cp : REPLACEMENT_CHAR);
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    static_assert(sizeof(wchar_t) == sizeof(char32_t));
    std::wstring output;
    output.reserve(str.size());
    decodeUtf8(str, [&](char32_t cp) { output += static_cast<wchar_t>(cp); });
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t ch : str)
        codePointToUtf8(static_cast<char32_t>(ch), output);
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto strView = impl::asStringView(str);
    using SourceChar = typename decltype(strView)::value_type;
    using TargetChar = typename TargetString::value_type;

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(strView.begin(), strView.end());
    else if constexpr (std::is_same_v<SourceChar, char>)
        return TargetString(impl::utf8ToWide(strView));
    else
        return TargetString(impl::wideToUtf8(strView));
}


inline
size_t unicodeLength(std::string_view utf8)
{
    size_t len = 0;
    impl::decodeUtf8(utf8, [&](char32_t) { ++len; });
    return len;
}
}

#endif //UTF_H_01832479146991573473545
