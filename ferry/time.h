// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TIME_H_6102947753180446932
#define TIME_H_6102947753180446932

#include <algorithm>
#include <ctime>
#include <iterator>
#include "string_tools.h"


namespace ferry
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //returns TimeComp() on error
TimeComp getUtcTime();
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc);

TimeComp getLocalTime(time_t utc); //returns TimeComp() on error
TimeComp getLocalTime();
std::pair<time_t, bool /*success*/> localToTimeT(const TimeComp& tc);

/* formatTime("%Y-%m-%d", tc) -> "2011-10-29"
   formatTime(formatIsoTimeTag) -> "17:55:34"                  */
std::string formatTime(const char* format, const TimeComp& tc = getLocalTime()); //std::strftime() format, returns empty string on error

const char* const formatIsoDateTag     = "%Y-%m-%d";
const char* const formatIsoTimeTag     = "%H:%M:%S";
const char* const formatIsoDateTimeTag = "%Y-%m-%d %H:%M:%S";

//parseTime("%Y-%m-%d %H:%M:%S", "2001-08-23 14:55:02"); supports %Y %m %b %d %H %M %S, returns TimeComp() on error
TimeComp parseTime(std::string_view format, std::string_view str);











//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    return
    {
        .tm_sec   = tc.second,
        .tm_min   = tc.minute,
        .tm_hour  = tc.hour,
        .tm_mday  = tc.day,
        .tm_mon   = tc.month - 1,
        .tm_year  = tc.year - 1900,
        .tm_isdst = -1, //unknown
    };
}


inline
TimeComp toFerryTimeComponents(const std::tm& ctc)
{
    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}


template <class T> inline
T intDivFloor(T numerator, T denominator)
{
    const T quotient = numerator / denominator;
    return (numerator % denominator != 0 && ((numerator < 0) != (denominator < 0))) ? quotient - 1 : quotient;
}

//keep clib calls within [1970, 2370) to dodge 32-bit and time_t(-1) quirks
constexpr long long daysPer400Years = 100 * (4 * 365 + 1) - 3;
constexpr long long secsPer400Years = 3600LL * 24 * daysPer400Years;
}


inline
TimeComp getUtcTime(time_t utc)
{
    const long long cycles400 = impl::intDivFloor<long long>(utc, impl::secsPer400Years);
    utc -= impl::secsPer400Years * cycles400;

    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    ctc.tm_year += static_cast<int>(400 * cycles400);
    return impl::toFerryTimeComponents(ctc);
}


inline
TimeComp getUtcTime()
{
    const time_t utc = std::time(nullptr);
    if (utc == -1)
        return TimeComp();
    return getUtcTime(utc);
}


inline
TimeComp getLocalTime(time_t utc)
{
    const long long cycles400 = impl::intDivFloor<long long>(utc, impl::secsPer400Years);
    utc -= impl::secsPer400Years * cycles400;

    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    ctc.tm_year += static_cast<int>(400 * cycles400);
    return impl::toFerryTimeComponents(ctc);
}


inline
TimeComp getLocalTime()
{
    const time_t utc = std::time(nullptr);
    if (utc == -1)
        return TimeComp();
    return getLocalTime(utc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0;

    const int cycles400 = impl::intDivFloor(ctc.tm_year + 1900 - 1970, 400);
    ctc.tm_year -= 400 * cycles400;

    const time_t utc = ::timegm(&ctc);
    if (utc == -1)
        return {};

    return {utc + impl::secsPer400Years * cycles400, true};
}


inline
std::pair<time_t, bool /*success*/> localToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);

    const int cycles400 = impl::intDivFloor(ctc.tm_year + 1900 - 1971 /*stay > 0 after time zone adaption*/, 400);
    ctc.tm_year -= 400 * cycles400;

    const time_t locTime = std::mktime(&ctc);
    if (locTime == -1)
        return {};

    return {locTime + impl::secsPer400Years * cycles400, true};
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return std::string();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //std::strftime() needs tm_wday, tm_yday

    std::string buf(256, '\0');
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    auto itStr = str.begin();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(str.end() - itStr) < digitCount ||
            !std::all_of(itStr, itStr + digitCount, isDigit<char>))
            return false;

        result = stringTo<int>(std::string_view(&*itStr, digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = format.begin(); itFmt != format.end(); ++itFmt)
    {
        const char fmt = *itFmt;

        if (fmt == '%')
        {
            if (++itFmt == format.end())
                return TimeComp();

            bool ok = true;
            switch (*itFmt)
            {
                case 'Y':
                    ok = extractNumber(output.year, 4);
                    break;
                case 'm':
                    ok = extractNumber(output.month, 2);
                    break;
                case 'd':
                    ok = extractNumber(output.day, 2);
                    break;
                case 'H':
                    ok = extractNumber(output.hour, 2);
                    break;
                case 'M':
                    ok = extractNumber(output.minute, 2);
                    break;
                case 'S':
                    ok = extractNumber(output.second, 2);
                    break;
                case 'b': //abbreviated month name: Jan-Dec
                {
                    if (str.end() - itStr < 3)
                        return TimeComp();

                    const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
                    const std::string_view monthName(&*itStr, 3);
                    auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* month) { return equalAsciiNoCase(monthName, month); });
                    if (itMonth == std::end(months))
                        return TimeComp();

                    output.month = 1 + static_cast<int>(itMonth - std::begin(months));
                    itStr += 3;
                }
                break;
                default:
                    return TimeComp();
            }
            if (!ok)
                return TimeComp();
        }
        else if (isWhiteSpace(fmt)) //single whitespace in format => skip 0..n whitespace chars
        {
            while (itStr != str.end() && isWhiteSpace(*itStr))
                ++itStr;
        }
        else
        {
            if (itStr == str.end() || *itStr != fmt)
                return TimeComp();
            ++itStr;
        }
    }

    if (itStr != str.end())
        return TimeComp();

    return output;
}
}

#endif //TIME_H_6102947753180446932
