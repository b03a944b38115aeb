// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRING_TOOLS_H_7720459183366021847
#define STRING_TOOLS_H_7720459183366021847

#include <cassert>
#include <charconv>
#include <cstdio>
#include <cwchar>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>


//non-member helpers for std::string and std::wstring (plus views, literals and single chars)
namespace ferry
{
inline std::string_view  makeStringView(const std::string&  str) { return str; }
inline std::wstring_view makeStringView(const std::wstring& str) { return str; }
inline std::string_view  makeStringView(std::string_view    str) { return str; }
inline std::wstring_view makeStringView(std::wstring_view   str) { return str; }
inline std::string_view  makeStringView(const char*    str) { return str; }
inline std::wstring_view makeStringView(const wchar_t* str) { return str; }
inline std::string_view  makeStringView(const char&    ch) { return {&ch, 1}; }
inline std::wstring_view makeStringView(const wchar_t& ch) { return {&ch, 1}; }

template <class S>
using GetCharTypeT = typename decltype(makeStringView(std::declval<const S&>()))::value_type;

template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains        (const S& str, const T& term);
template <class S, class T> bool startsWith      (const S& str, const T& prefix);
template <class S, class T> bool endsWith        (const S& str, const T& postfix);
template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);
template <class S>                void trim(S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //lenient: parses leading digits, returns 0 on garbage

template <class S, class T, class Num> S printNumber(const T& format, const Num& number); //std::snprintf() for a single number









//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    assert(c != 0);
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isDigit(Char c)
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return makeStringView(str).find(makeStringView(term)) != std::basic_string_view<GetCharTypeT<S>>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return makeStringView(str).starts_with(makeStringView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return makeStringView(str).ends_with(makeStringView(postfix));
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsView = makeStringView(lhs);
    const auto rhsView = makeStringView(rhs);
    if (lhsView.size() != rhsView.size())
        return false;

    for (size_t i = 0; i < lhsView.size(); ++i)
        if (asciiToLower(lhsView[i]) != asciiToLower(rhsView[i]))
            return false;
    return true;
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strView    = makeStringView(str);
    const auto prefixView = makeStringView(prefix);
    return strView.size() >= prefixView.size() && equalAsciiNoCase(strView.substr(0, prefixView.size()), prefixView);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = makeStringView(str);
    const auto termView = makeStringView(term);
    assert(!termView.empty());

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = makeStringView(str);
    const auto termView = makeStringView(term);
    assert(!termView.empty());

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = makeStringView(str);
    const auto termView = makeStringView(term);
    assert(!termView.empty());

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = makeStringView(str);
    const auto termView = makeStringView(term);
    assert(!termView.empty());

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    const auto strView = makeStringView(str);

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


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&](auto part)
    {
        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);
    });
    return output;
}


template <class S> inline
S trimCpy(const S& str)
{
    auto view = makeStringView(str);

    while (!view.empty() && isWhiteSpace(view.front()))
        view.remove_prefix(1);
    while (!view.empty() && isWhiteSpace(view.back()))
        view.remove_suffix(1);

    return S(view);
}


template <class S> inline
void trim(S& str)
{
    str = trimCpy(str);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = makeStringView(oldTerm);
    const auto newView = makeStringView(newTerm);
    assert(!oldView.empty());

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
    using CharType = GetCharTypeT<S>;

    if constexpr (std::is_same_v<CharType, char>)
        return std::to_string(number);
    else
        return std::to_wstring(number);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    const auto view = makeStringView(str);

    std::string digits; //<charconv> is char-only
    size_t pos = 0;
    while (pos < view.size() && isWhiteSpace(view[pos]))
        ++pos;
    if (pos < view.size() && view[pos] == static_cast<GetCharTypeT<S>>('-'))
    {
        digits += '-';
        ++pos;
    }
    for (; pos < view.size() && isDigit(view[pos]); ++pos)
        digits += static_cast<char>(view[pos]);

    Num number = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), number);
    return number;
}


template <class S, class T, class Num> inline
S printNumber(const T& format, const Num& number)
{
    using CharType = GetCharTypeT<S>;
    static_assert(std::is_same_v<CharType, GetCharTypeT<T>>);

    CharType buf[128] = {};
    int charsWritten = 0;
    if constexpr (std::is_same_v<CharType, char>)
        charsWritten = std::snprintf(buf, std::size(buf), makeStringView(format).data(), number);
    else
        charsWritten = std::swprintf(buf, std::size(buf), makeStringView(format).data(), number);

    return charsWritten > 0 ? S(buf, charsWritten) : S();
}
}

#endif //STRING_TOOLS_H_7720459183366021847
