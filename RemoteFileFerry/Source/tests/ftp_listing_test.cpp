// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <cctype>
#include <gtest/gtest.h>
#include <ferry/sys_error.h>
#include "../afs/ftp_listing.h"
#include "test_status_handler.h"

using namespace ferry;
using namespace rff;


namespace
{
const time_t utcNow = makeUtcTime(2023, 1, 2, 15, 30, 0);

const DecodeServerName decodeAsIs = [](std::string_view serverName) { return std::string(serverName); };
}


TEST(FtpListing, SplitResponse)
{
    const std::string buf = "line1\r\nline2\n\nline3";
    const std::vector<std::string_view> lines = splitFtpResponse(buf);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "line1");
    EXPECT_EQ(lines[1], "line2");
    EXPECT_EQ(lines[2], "line3");
}


TEST(FtpListing, LastStatusCode)
{
    EXPECT_EQ(getLastFtpStatusCode("220-Welcome\r\n220 Ready\r\n"), 220);
    EXPECT_EQ(getLastFtpStatusCode("331 Password required\r\n230 Logged in\r\n"), 230);
    EXPECT_EQ(getLastFtpStatusCode("no status here"), 0);
    EXPECT_EQ(getLastFtpStatusCode(""), 0);

    EXPECT_EQ(formatFtpStatus(550), L"FTP status 550: File unavailable, e.g. file not found, no access.");
    EXPECT_EQ(formatFtpStatus(299), L"FTP status 299.");
}


TEST(FtpListing, FeatResponse)
{
    const FtpFeatures features = parseFeatResponse("211-Features:\r\n"
                                                   " MDTM\r\n"
                                                   " MLST type*;size*;modify*;\r\n"
                                                   " UTF8\r\n"
                                                   " CLNT\r\n"
                                                   "211 End\r\n");
    EXPECT_TRUE(features.mlsd);
    EXPECT_TRUE(features.utf8);
    EXPECT_TRUE(features.clnt);

    const FtpFeatures bare = parseFeatResponse("211-Features:\r\n SIZE\r\n211 End\r\n");
    EXPECT_FALSE(bare.mlsd);
    EXPECT_FALSE(bare.utf8);
    EXPECT_FALSE(bare.clnt);
}


TEST(FtpListing, Mlsd)
{
    const std::vector<FtpItem> items = parseMlsdListing(
                                           "type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .\r\n"
                                           "type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; ..\r\n"
                                           "type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt\r\n"
                                           "Type=DIR;sizd=4096;modify=20170117144634; folder\r\n"
                                           "type=OS.unix=slink:/target;modify=20170117144634; link\r\n"
                                           "type=file;size=1024;modify=20170113063314.123; name with spaces.csv\r\n", decodeAsIs);
    ASSERT_EQ(items.size(), 4u);

    EXPECT_EQ(items[0].type, FtpItem::Type::file);
    EXPECT_EQ(items[0].itemName, "readme.txt");
    EXPECT_EQ(items[0].fileSize, 4u);
    EXPECT_EQ(items[0].modTime, makeUtcTime(2017, 1, 13, 6, 33, 14));

    EXPECT_EQ(items[1].type, FtpItem::Type::folder);
    EXPECT_EQ(items[1].itemName, "folder");

    EXPECT_EQ(items[2].type, FtpItem::Type::symlink);

    EXPECT_EQ(items[3].itemName, "name with spaces.csv");
    EXPECT_EQ(items[3].modTime, makeUtcTime(2017, 1, 13, 6, 33, 14));
}


TEST(FtpListing, MlsdMalformed)
{
    EXPECT_THROW(parseMlsdListing("type=file;size=4;modify=20170113063314;\r\n", decodeAsIs), SysError);     //no name
    EXPECT_THROW(parseMlsdListing("type=file;modify=20170113063314; a.txt\r\n", decodeAsIs), SysError);      //no size
    EXPECT_THROW(parseMlsdListing("type=file;size=4;modify=2017011306; a.txt\r\n", decodeAsIs), SysError);   //bad time
}


TEST(FtpListing, Unix)
{
    const std::vector<FtpItem> items = parseUnixListing(
                                           "total 4953\r\n"
                                           "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
                                           "-rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user\r\n"
                                           "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
                                           "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n"
                                           "-rw-r--r-- 1 root root      10 Jan  2 10:00 today.txt\r\n", utcNow, decodeAsIs);
    ASSERT_EQ(items.size(), 5u);

    EXPECT_EQ(items[0].type, FtpItem::Type::folder);
    EXPECT_EQ(items[0].itemName, "version");
    EXPECT_EQ(items[0].modTime, makeUtcTime(2022, 1, 10, 11, 58, 0)); //in the future => last year

    EXPECT_EQ(items[1].type, FtpItem::Type::file);
    EXPECT_EQ(items[1].itemName, "Unit Test.vcxproj.user");
    EXPECT_EQ(items[1].fileSize, 1084u);
    EXPECT_EQ(items[1].modTime, makeUtcTime(2022, 9, 2, 1, 17, 0));

    EXPECT_EQ(items[2].itemName, "win32.manifest");
    EXPECT_EQ(items[2].fileSize, 2217u);
    EXPECT_EQ(items[2].modTime, makeUtcTime(2016, 2, 28, 0, 0, 0));

    EXPECT_EQ(items[3].type, FtpItem::Type::symlink);
    EXPECT_EQ(items[3].itemName, "Projects");

    EXPECT_EQ(items[4].itemName, "today.txt");
    EXPECT_EQ(items[4].modTime, makeUtcTime(2023, 1, 2, 10, 0, 0));
}


TEST(FtpListing, UnixWithoutGroup)
{
    const std::vector<FtpItem> items = parseUnixListing(
                                           "dr-xr-xr-x   2 root                  512 Apr  8  1994 etc\r\n"
                                           "-r--r--r--   1 root                 2048 Apr  8  1994 data.bin\r\n", utcNow, decodeAsIs);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].type, FtpItem::Type::folder);
    EXPECT_EQ(items[0].itemName, "etc");
    EXPECT_EQ(items[1].itemName, "data.bin");
    EXPECT_EQ(items[1].fileSize, 2048u);
}


TEST(FtpListing, UnixMalformed)
{
    EXPECT_THROW(parseUnixListing("-rw-r--r-- 1 root root 10 Foo  2 10:00 a.txt\r\n", utcNow, decodeAsIs), SysError);
    EXPECT_THROW(parseUnixListing("-rw-r--r-- 1 root root 10 Jan 32 10:00 a.txt\r\n", utcNow, decodeAsIs), SysError);
    EXPECT_THROW(parseUnixListing("-rw-r--r-- 1 root root 10 Jan  2 10:00\r\n",       utcNow, decodeAsIs), SysError);
}


TEST(FtpListing, Dos)
{
    const std::vector<FtpItem> items = parseDosListing(
                                           "10-27-15  03:46AM       <DIR>          pub\r\n"
                                           "04-08-14  03:09PM               11,399 readme.txt\r\n"
                                           "06-20-2017  12:50PM              1875499 zstring.obj\r\n"
                                           "01-01-99  12:10AM                   42 old.log\r\n", utcNow, decodeAsIs);
    ASSERT_EQ(items.size(), 4u);

    EXPECT_EQ(items[0].type, FtpItem::Type::folder);
    EXPECT_EQ(items[0].itemName, "pub");
    EXPECT_EQ(items[0].modTime, makeUtcTime(2015, 10, 27, 3, 46, 0));

    EXPECT_EQ(items[1].itemName, "readme.txt");
    EXPECT_EQ(items[1].fileSize, 11399u);
    EXPECT_EQ(items[1].modTime, makeUtcTime(2014, 4, 8, 15, 9, 0));

    EXPECT_EQ(items[2].fileSize, 1875499u);
    EXPECT_EQ(items[2].modTime, makeUtcTime(2017, 6, 20, 12, 50, 0));

    EXPECT_EQ(items[3].modTime, makeUtcTime(1999, 1, 1, 0, 10, 0));
}


TEST(FtpListing, ListFormatDetection)
{
    const std::vector<FtpItem> dos  = parseListListing("04-08-14  03:09PM                   11 a.txt\r\n", utcNow, decodeAsIs);
    const std::vector<FtpItem> unix = parseListListing("-rw-r--r-- 1 root root 11 Apr  8  2014 a.txt\r\n", utcNow, decodeAsIs);

    ASSERT_EQ(dos .size(), 1u);
    ASSERT_EQ(unix.size(), 1u);
    EXPECT_EQ(dos[0].itemName, unix[0].itemName);
    EXPECT_EQ(dos[0].fileSize, unix[0].fileSize);

    EXPECT_TRUE(parseListListing("", utcNow, decodeAsIs).empty());
}


TEST(FtpListing, FileEntriesOnlyRegularFiles)
{
    const std::vector<FtpItem> items =
    {
        {FtpItem::Type::file,    "a.txt", 5, 100},
        {FtpItem::Type::folder,  "sub",   0, 100},
        {FtpItem::Type::symlink, "link",  0, 100},
        {FtpItem::Type::file,    "b.txt", 7, 200},
    };
    const std::vector<FileEntry> entries = toFileEntries("/data/", items);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], (FileEntry{"a.txt", "/data/a.txt", 5, 100}));
    EXPECT_EQ(entries[1], (FileEntry{"b.txt", "/data/b.txt", 7, 200}));
}


TEST(FtpListing, NameDecoding)
{
    const DecodeServerName upper = [](std::string_view serverName)
    {
        std::string name(serverName);
        for (char& c : name)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return name;
    };
    const std::vector<FtpItem> items = parseMlsdListing("type=file;size=1;modify=20170113063314; abc.txt\r\n", upper);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].itemName, "ABC.TXT");
}
