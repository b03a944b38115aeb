// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../base/file_filter.h"
#include "test_status_handler.h"

using namespace ferry;
using namespace rff;


namespace
{
const time_t now = makeUtcTime(2023, 1, 2, 15, 30, 45);


std::vector<FileEntry> makeEntries(const std::vector<std::pair<std::string, time_t>>& items)
{
    std::vector<FileEntry> output;
    for (const auto& [name, modTime] : items)
        output.push_back({name, "/src/" + name, 10, modTime});
    return output;
}


std::vector<std::string> getNames(const std::vector<FileEntry>& entries)
{
    std::vector<std::string> names;
    for (const FileEntry& entry : entries)
        names.push_back(entry.name);
    return names;
}
}


TEST(FileFilter, AllIsIdentity)
{
    const std::vector<FileEntry> entries = makeEntries({{"b.txt", 1}, {"a.csv", 2}, {".hidden", 3}});

    const FileFilter filter(FilterAll(), now);
    EXPECT_EQ(filter.select(entries), entries);
    EXPECT_TRUE(filter.select({}).empty());
}


TEST(FileFilter, WildcardMatchIsAnchored)
{
    EXPECT_TRUE (matchesWildcardPattern("report.csv", "*.csv"));
    EXPECT_TRUE (matchesWildcardPattern("report.csv", "report*"));
    EXPECT_TRUE (matchesWildcardPattern("report.csv", "r*t.c?v"));
    EXPECT_TRUE (matchesWildcardPattern("report.csv", "*"));
    EXPECT_TRUE (matchesWildcardPattern("report.csv", "report.csv"));
    EXPECT_TRUE (matchesWildcardPattern("a",          "?"));
    EXPECT_TRUE (matchesWildcardPattern("abc",        "*?"));
    EXPECT_TRUE (matchesWildcardPattern("aXbXc",      "*X*c"));
    EXPECT_TRUE (matchesWildcardPattern("",           "*"));

    EXPECT_FALSE(matchesWildcardPattern("report.csv",     "*.cs"));   //anchored at end
    EXPECT_FALSE(matchesWildcardPattern("old_report.csv", "report*")); //anchored at start
    EXPECT_FALSE(matchesWildcardPattern("report.csv.bak", "*.csv"));
    EXPECT_FALSE(matchesWildcardPattern("",               "?"));
    EXPECT_FALSE(matchesWildcardPattern("ab",             "?"));
    EXPECT_FALSE(matchesWildcardPattern("Report.csv",     "report*")); //case-sensitive
}


TEST(FileFilter, PatternSelectsMatchingNamesInOrder)
{
    const std::vector<FileEntry> entries = makeEntries({{"z.csv", 1}, {"a.txt", 2}, {"m.csv", 3}, {"csv", 4}, {"b.csv.tmp", 5}});

    const FileFilter filter(FilterPattern{"*.csv"}, now);
    EXPECT_EQ(getNames(filter.select(entries)), std::vector<std::string>({"z.csv", "m.csv"}));

    //exactly the subset passing the anchored glob, original order
    std::vector<FileEntry> expected;
    for (const FileEntry& entry : entries)
        if (matchesWildcardPattern(entry.name, "*.csv"))
            expected.push_back(entry);
    EXPECT_EQ(filter.select(entries), expected);
}


TEST(FileFilter, PatternMatchesNameNotPath)
{
    const std::vector<FileEntry> entries{{"data.txt", "/src/reports/data.txt", 1, 0}};

    EXPECT_TRUE (FileFilter(FilterPattern{"data*"},    now).passFilter(entries[0]));
    EXPECT_FALSE(FileFilter(FilterPattern{"*reports*"}, now).passFilter(entries[0]));
}


TEST(FileFilter, ExtensionIsCaseInsensitive)
{
    const std::vector<FileEntry> entries = makeEntries({{"a.TXT", 1}, {"b.csv", 2}, {"c.Txt", 3}, {"d.txt.gz", 4}, {"e", 5}, {".txt", 6}, {"f.", 7}});

    const FileFilter filter(FilterExtension{{"txt"}}, now);
    EXPECT_EQ(getNames(filter.select(entries)), std::vector<std::string>({"a.TXT", "c.Txt"}));

    const FileFilter filter2(FilterExtension{{".CSV", " gz "}}, now); //leading dot and blanks are fine
    EXPECT_EQ(getNames(filter2.select(entries)), std::vector<std::string>({"b.csv", "d.txt.gz"}));
}


TEST(FileFilter, ExtensionOfName)
{
    EXPECT_EQ(getFileExtension("a.txt"),     "txt");
    EXPECT_EQ(getFileExtension("a.tar.gz"),  "gz");
    EXPECT_EQ(getFileExtension("a."),        "");
    EXPECT_EQ(getFileExtension("a"),         std::nullopt);
    EXPECT_EQ(getFileExtension(".profile"),  std::nullopt);
    EXPECT_EQ(getFileExtension(".a.txt"),    "txt");
}


TEST(FileFilter, ModTimeSingleTokenMeansAtOrAfter)
{
    const time_t t = makeUtcTime(2023, 1, 2, 0, 0, 0);
    const std::vector<FileEntry> entries = makeEntries({{"old", t - 1}, {"edge", t}, {"new", t + 1}});

    const FileFilter filter(FilterModTime{{"current_day"}}, now);
    EXPECT_EQ(filter.getTimeFrom(), t);
    EXPECT_EQ(getNames(filter.select(entries)), std::vector<std::string>({"edge", "new"}));
}


TEST(FileFilter, ModTimeWindowIsClosedAndOrderIndependent)
{
    const time_t t1 = makeUtcTime(2023, 1, 1, 0, 0, 0);
    const time_t t2 = makeUtcTime(2023, 1, 2, 0, 0, 0);

    const std::vector<FileEntry> entries = makeEntries({{"before", t1 - 1}, {"start", t1}, {"mid", t1 + 3600}, {"end", t2}, {"after", t2 + 1}});

    const FileFilter forward (FilterModTime{{"2023-01-01 00:00:00", "2023-01-02 00:00:00"}}, now);
    const FileFilter backward(FilterModTime{{"2023-01-02 00:00:00", "2023-01-01 00:00:00"}}, now);

    EXPECT_EQ(getNames(forward.select(entries)), std::vector<std::string>({"start", "mid", "end"}));
    EXPECT_EQ(forward.select(entries), backward.select(entries));
    EXPECT_EQ(backward.getTimeFrom(), t1);
    EXPECT_EQ(backward.getTimeTo(),   t2);

    //relative tokens, swapped
    const FileFilter relForward (FilterModTime{{"days_before_1", "current_day"}}, now);
    const FileFilter relBackward(FilterModTime{{"current_day", "days_before_1"}}, now);
    EXPECT_EQ(relForward.select(entries), relBackward.select(entries));
    EXPECT_EQ(getNames(relForward.select(entries)), std::vector<std::string>({"start", "mid", "end"}));
}


TEST(FileFilter, TokensResolvedOnceAtConstruction)
{
    const FileFilter filter(FilterModTime{{"current_minute"}}, now);
    const FileEntry entry{"a", "/src/a", 1, makeUtcTime(2023, 1, 2, 15, 30, 0)};

    EXPECT_TRUE(filter.passFilter(entry));
    EXPECT_EQ(filter.getTimeFrom(), makeUtcTime(2023, 1, 2, 15, 30, 0)); //same for every file of the run
    EXPECT_TRUE(filter.passFilter(entry));
}


TEST(FileFilter, InvalidCriteriaFailAtConstruction)
{
    EXPECT_THROW(FileFilter(FilterPattern{""},    now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterPattern{"  "},  now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterExtension{{}}, now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterExtension{{"txt", ""}},  now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterExtension{{"."}},        now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterModTime{{}},             now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterModTime{{"a", "b", "c"}}, now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterModTime{{"days_before_"}}, now), InvalidFilterCriteria);
    EXPECT_THROW(FileFilter(FilterModTime{{"current_day", "tomorrow"}}, now), InvalidFilterCriteria);
}


TEST(FileFilter, InvalidTimeTokenDetailsAreKept)
{
    try
    {
        FileFilter filter(FilterModTime{{"hours_before_x"}}, now);
        FAIL() << "exception expected";
    }
    catch (const InvalidFilterCriteria& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"hours_before_x"));
    }
}
