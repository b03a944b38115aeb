// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_LISTING_H_6630914478205513976
#define FTP_LISTING_H_6630914478205513976

#include <functional>
#include "abstract.h"


namespace rff
{
struct FtpItem
{
    enum class Type
    {
        file,
        folder,
        symlink,
    };
    Type type = Type::file;
    std::string itemName; //UTF-8
    uint64_t fileSize = 0;
    time_t modTime = 0;
};

//server encoding -> UTF-8
using DecodeServerName = std::function<std::string(std::string_view serverName)>; //throw SysError


std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::wstring formatFtpStatus(int sc);

//get *last* FTP status code of a (multi-line) response; 0 if none
int getLastFtpStatusCode(const std::string& response);


struct FtpFeatures
{
    bool mlsd = false;
    bool utf8 = false;
    bool clnt = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);


//"." and ".." are skipped; LIST times are assumed to be UTC (same as FileZilla)
std::vector<FtpItem> parseMlsdListing(const std::string& buf,                    const DecodeServerName& decodeName); //throw SysError
std::vector<FtpItem> parseUnixListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError; "ls -l"
std::vector<FtpItem> parseDosListing (const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError; "dir"
std::vector<FtpItem> parseListListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError; Unix or DOS

//regular files only
std::vector<FileEntry> toFileEntries(const std::string& dirPath, const std::vector<FtpItem>& items);
}

#endif //FTP_LISTING_H_6630914478205513976
