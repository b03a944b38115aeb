// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef UTF_H_0418730645912873645
#define UTF_H_0418730645912873645

#include "string_tools.h"


namespace ferry
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf8(std::string_view str);








//----------------------- implementation ----------------------------------
namespace impl
{
static_assert(sizeof(wchar_t) == 4);

const char32_t REPLACEMENT_CHAR = 0xfffd;


inline
void encodeUtf8(char32_t cp, std::string& output)
{
    if (cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

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


//returns REPLACEMENT_CHAR for malformed sequences and advances by at least one byte
inline
char32_t decodeUtf8(std::string_view str, size_t& pos)
{
    const unsigned char lead = static_cast<unsigned char>(str[pos++]);
    if (lead < 0x80)
        return lead;

    size_t trailCount = 0;
    char32_t cp = 0;
    char32_t minValue = 0;
    if ((lead & 0xe0) == 0xc0)
    {
        trailCount = 1;
        cp = lead & 0x1f;
        minValue = 0x80;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
        trailCount = 2;
        cp = lead & 0x0f;
        minValue = 0x800;
    }
    else if ((lead & 0xf8) == 0xf0)
    {
        trailCount = 3;
        cp = lead & 0x07;
        minValue = 0x10000;
    }
    else
        return REPLACEMENT_CHAR;

    for (size_t i = 0; i < trailCount; ++i)
    {
        if (pos >= str.size())
            return REPLACEMENT_CHAR;

        const unsigned char trail = static_cast<unsigned char>(str[pos]);
        if ((trail & 0xc0) != 0x80)
            return REPLACEMENT_CHAR; //don't consume: may be the start of the next sequence
        cp = (cp << 6) | (trail & 0x3f);
        ++pos;
    }

    if (cp < minValue || cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff)) //overlong, out of range, surrogate
        return REPLACEMENT_CHAR;
    return cp;
}
}


inline
bool isValidUtf8(std::string_view str)
{
    for (size_t pos = 0; pos < str.size();)
    {
        const size_t posBefore = pos;
        if (impl::decodeUtf8(str, pos) == impl::REPLACEMENT_CHAR &&
            str.substr(posBefore, 3) != "\xef\xbf\xbd") //U+FFFD spelled out is fine
            return false;
    }
    return true;
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = GetCharTypeT<SourceString>;
    using TargetChar = GetCharTypeT<TargetString>;
    const auto strView = makeStringView(str);

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(strView);
    else if constexpr (std::is_same_v<SourceChar, char>)
    {
        std::wstring output;
        output.reserve(strView.size());
        for (size_t pos = 0; pos < strView.size();)
            output += static_cast<wchar_t>(impl::decodeUtf8(strView, pos));
        return output;
    }
    else
    {
        std::string output;
        output.reserve(strView.size());
        for (const wchar_t ch : strView)
            impl::encodeUtf8(static_cast<char32_t>(ch), output);
        return output;
    }
}
}

#endif //UTF_H_0418730645912873645
