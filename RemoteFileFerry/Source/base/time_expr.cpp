// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "time_expr.h"
#include <ferry/time.h>

using namespace ferry;
using namespace rff;


namespace
{
constexpr int64_t SECONDS_YEAR1_TO_1970 = 62135596800;


enum class TimeGranularity
{
    second,
    minute,
    hour,
    day,
};


int64_t getUnitSeconds(TimeGranularity unit)
{
    switch (unit)
    {
        case TimeGranularity::second:
            return 1;
        case TimeGranularity::minute:
            return 60;
        case TimeGranularity::hour:
            return 3600;
        case TimeGranularity::day:
            return 24 * 3600;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


time_t truncateTime(time_t utcTime, TimeGranularity unit, std::string_view expression) //throw InvalidTimeExpression
{
    TimeComp tc = getUtcTime(utcTime); //returns TimeComp() on error
    if (tc == TimeComp())
        throw InvalidTimeExpression(replaceCpy(_("Cannot resolve time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression))),
                                    _("Time is out of range:") + L' ' + numberTo<std::wstring>(utcTime));
    switch (unit)
    {
        case TimeGranularity::day:
            tc.hour = 0;
            [[fallthrough]];
        case TimeGranularity::hour:
            tc.minute = 0;
            [[fallthrough]];
        case TimeGranularity::minute:
            tc.second = 0;
            [[fallthrough]];
        case TimeGranularity::second:
            break;
    }

    const auto [truncTime, timeValid] = utcToTimeT(tc);
    if (!timeValid)
        throw InvalidTimeExpression(replaceCpy(_("Cannot resolve time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression))),
                                    _("Time is out of range:") + L' ' + numberTo<std::wstring>(utcTime));
    return truncTime;
}


time_t parseAbsoluteTime(std::string_view expression) //throw InvalidTimeExpression
{
    const std::wstring errorMsg = replaceCpy(_("Invalid time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression)));

    if (expression.size() != 19 || expression[10] != ' ')
        throw InvalidTimeExpression(errorMsg, _("Expected format:") + L" YYYY-MM-DD HH:MM:SS");

    const TimeComp tc = parseTime("%Y-%m-%d %H:%M:%S", expression); //returns TimeComp() on error
    if (tc == TimeComp())
        throw InvalidTimeExpression(errorMsg, _("Expected format:") + L" YYYY-MM-DD HH:MM:SS");

    const auto [utcTime, timeValid] = utcToTimeT(tc);
    //timegm() silently normalizes: 2023-02-30 => 2023-03-02
    if (!timeValid || getUtcTime(utcTime) != tc)
        throw InvalidTimeExpression(errorMsg, _("Date or time is out of range."));

    return utcTime;
}


int64_t parseUnitCount(std::string_view countStr, std::string_view expression) //throw InvalidTimeExpression
{
    if (countStr.empty() ||
        !std::all_of(countStr.begin(), countStr.end(), isDigit<char>) ||
        countStr.size() > 12) //leaves headroom for * 86400 in int64_t
        throw InvalidTimeExpression(replaceCpy(_("Invalid time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression))),
                                    _("Expected a non-negative number:") + L' ' + fmtPath(utfTo<std::wstring>(countStr)));

    return stringTo<int64_t>(countStr);
}
}


time_t rff::resolveTimeExpression(std::string_view expression, time_t now) //throw InvalidTimeExpression
{
    expression = trimCpy(expression);

    if (expression == "current_day")
        return truncateTime(now, TimeGranularity::day, expression); //throw InvalidTimeExpression
    if (expression == "current_hour")
        return truncateTime(now, TimeGranularity::hour, expression); //throw InvalidTimeExpression
    if (expression == "current_minute")
        return truncateTime(now, TimeGranularity::minute, expression); //throw InvalidTimeExpression
    if (expression == "current_time")
        return truncateTime(now, TimeGranularity::second, expression); //throw InvalidTimeExpression

    for (const auto& [prefix, unit] :
         {
             std::pair<std::string_view, TimeGranularity>{"days_before_",    TimeGranularity::day},
             std::pair<std::string_view, TimeGranularity>{"hours_before_",   TimeGranularity::hour},
             std::pair<std::string_view, TimeGranularity>{"minutes_before_", TimeGranularity::minute},
         })
        if (startsWith(expression, prefix))
        {
            const int64_t count = parseUnitCount(expression.substr(prefix.size()), expression); //throw InvalidTimeExpression
            const int64_t offset = count * getUnitSeconds(unit);

            if (offset > static_cast<int64_t>(now) + SECONDS_YEAR1_TO_1970) //nothing before 0001-01-01
                throw InvalidTimeExpression(replaceCpy(_("Cannot resolve time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression))),
                                            _("Time is out of range."));

            return truncateTime(now - offset, unit, expression); //throw InvalidTimeExpression
        }

    if (!expression.empty() && isDigit(expression[0]))
        return parseAbsoluteTime(expression); //throw InvalidTimeExpression

    throw InvalidTimeExpression(replaceCpy(_("Invalid time expression %x."), L"%x", fmtPath(utfTo<std::wstring>(expression))),
                                _("Expected:") + L" YYYY-MM-DD HH:MM:SS, current_day, current_hour, current_minute, current_time, "
                                L"days_before_<n>, hours_before_<n>, minutes_before_<n>");
}
