// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../base/time_expr.h"
#include "test_status_handler.h"

using namespace ferry;
using namespace rff;


namespace
{
const time_t now = makeUtcTime(2023, 1, 2, 15, 30, 45);
}


TEST(TimeExpression, CurrentKeywordsTruncate)
{
    EXPECT_EQ(resolveTimeExpression("current_day",    now), makeUtcTime(2023, 1, 2,  0,  0,  0));
    EXPECT_EQ(resolveTimeExpression("current_hour",   now), makeUtcTime(2023, 1, 2, 15,  0,  0));
    EXPECT_EQ(resolveTimeExpression("current_minute", now), makeUtcTime(2023, 1, 2, 15, 30,  0));
    EXPECT_EQ(resolveTimeExpression("current_time",   now), now);
}


TEST(TimeExpression, RelativeOffsetsTruncateToUnit)
{
    EXPECT_EQ(resolveTimeExpression("days_before_1",     now), makeUtcTime(2023, 1,  1,  0, 0, 0));
    EXPECT_EQ(resolveTimeExpression("days_before_2",     now), makeUtcTime(2022, 12, 31, 0, 0, 0));
    EXPECT_EQ(resolveTimeExpression("hours_before_2",    now), makeUtcTime(2023, 1,  2, 13, 0, 0));
    EXPECT_EQ(resolveTimeExpression("minutes_before_90", now), makeUtcTime(2023, 1,  2, 14, 0, 0));

    EXPECT_EQ(resolveTimeExpression("days_before_0",    now), resolveTimeExpression("current_day",    now));
    EXPECT_EQ(resolveTimeExpression("hours_before_0",   now), resolveTimeExpression("current_hour",   now));
    EXPECT_EQ(resolveTimeExpression("minutes_before_0", now), resolveTimeExpression("current_minute", now));
}


TEST(TimeExpression, DaysBeforeOneEqualsCurrentDayOfPreviousDay)
{
    //sweep reference times over several days, hitting many times of day
    for (time_t ref = makeUtcTime(2024, 2, 27, 0, 0, 0); ref < makeUtcTime(2024, 3, 3, 0, 0, 0); ref += 3607)
        EXPECT_EQ(resolveTimeExpression("days_before_1", ref),
                  resolveTimeExpression("current_day", ref - 24 * 3600)) << "reference: " << ref;
}


TEST(TimeExpression, AbsoluteLiteral)
{
    EXPECT_EQ(resolveTimeExpression("2023-03-04 05:06:07", now), makeUtcTime(2023, 3, 4, 5, 6, 7));
    EXPECT_EQ(resolveTimeExpression("2024-02-29 23:59:59", now), makeUtcTime(2024, 2, 29, 23, 59, 59)); //leap day

    //independent of "now"
    EXPECT_EQ(resolveTimeExpression("2023-03-04 05:06:07", 0), makeUtcTime(2023, 3, 4, 5, 6, 7));
}


TEST(TimeExpression, SurroundingBlanksIgnored)
{
    EXPECT_EQ(resolveTimeExpression("  current_day\t", now), makeUtcTime(2023, 1, 2, 0, 0, 0));
    EXPECT_EQ(resolveTimeExpression(" 2023-03-04 05:06:07 ", now), makeUtcTime(2023, 3, 4, 5, 6, 7));
}


TEST(TimeExpression, MalformedTokensRejected)
{
    for (const char* token :
         {
             "",
             "   ",
             "yesterday",
             "Current_Day",        //case-sensitive
             "days_before_",       //missing n
             "days_before_x",      //non-numeric
             "days_before_-1",     //negative
             "hours_before_1.5",
             "minutes_before_ 3",
             "weeks_before_1",
             "2023-01-02",         //date only
             "2023-1-02 00:00:00",
             "2023-13-01 00:00:00", //month 13
             "2023-02-30 00:00:00", //no Feb 30th
             "2023-02-29 00:00:00", //no leap year
             "2023-01-01 24:00:00",
             "2023-01-01 00:60:00",
             "2023-01-01T00:00:00",
         })
        EXPECT_THROW(resolveTimeExpression(token, now), InvalidTimeExpression) << "token: \"" << token << '"';
}


TEST(TimeExpression, OverflowRejected)
{
    EXPECT_THROW(resolveTimeExpression("days_before_999999999999", now), InvalidTimeExpression);
    EXPECT_THROW(resolveTimeExpression("minutes_before_99999999999999999999", now), InvalidTimeExpression);
}


TEST(TimeExpression, ErrorMessageNamesToken)
{
    try
    {
        resolveTimeExpression("days_before_abc", now);
        FAIL() << "exception expected";
    }
    catch (const InvalidTimeExpression& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"days_before_abc"));
    }
}
