// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TIME_EXPR_H_8461203957713084216
#define TIME_EXPR_H_8461203957713084216

#include <ctime>
#include <ferry/file_error.h>


namespace rff
{
DEFINE_NEW_FILE_ERROR(InvalidTimeExpression)

/* Time expressions, resolved against a reference time "now":

    "YYYY-MM-DD HH:MM:SS"   absolute
    "current_day"           now, truncated to start of day
    "current_hour"          now, truncated to start of hour
    "current_minute"        now, truncated to start of minute
    "current_time"          now
    "days_before_<n>"       now - n days,    truncated to start of day
    "hours_before_<n>"      now - n hours,   truncated to start of hour
    "minutes_before_<n>"    now - n minutes, truncated to start of minute

   - calendar fields are UTC: same clock as the (unconverted) server time stamps
   - keywords are case-sensitive, surrounding blanks are ignored               */
time_t resolveTimeExpression(std::string_view expression, time_t now); //throw InvalidTimeExpression
}

#endif //TIME_EXPR_H_8461203957713084216
