// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOG_FILE_H_3827461095522819304
#define LOG_FILE_H_3827461095522819304

#include <ferry/error_log.h>
#include <ferry/file_error.h>
#include "transfer_report.h"


namespace rff
{
//"RemoteFileFerry 2023-01-02 153000.123 [Error].log"
std::string generateLogFileName(const std::chrono::system_clock::time_point& runStartTime, RunResult finalStatus); //throw FileError

std::string generateLogText(const TransferReport& report, const ferry::ErrorLog& log);

//returns full log file path
std::string saveLogFile(const TransferReport& report, const ferry::ErrorLog& log, const std::string& logFolderPath); //throw FileError
}

#endif //LOG_FILE_H_3827461095522819304
