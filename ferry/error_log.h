// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ERROR_LOG_H_1906638254177302918
#define ERROR_LOG_H_1906638254177302918

#include <algorithm>
#include <vector>
#include "time.h"
#include "i18n.h"
#include "utf.h"


namespace ferry
{
enum class LogLevel
{
    info,
    warning,
    error,
};

struct LogEntry
{
    time_t   time = 0;
    LogLevel level = LogLevel::error;
    std::string message; //UTF-8
};

//in order of arrival: the run log and the log file show the same sequence
using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, LogLevel level, time_t time = std::time(nullptr))
{
    log.push_back({time, level, utfTo<std::string>(msg)});
}


inline
int countEntries(const ErrorLog& log, LogLevel level)
{
    return static_cast<int>(std::count_if(log.begin(), log.end(), [level](const LogEntry& entry) { return entry.level == level; }));
}


//"[14:55:02]  Error:  first line
//                     continuation line"
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::wstring label = [&]
    {
        switch (entry.level)
        {
            case LogLevel::info:
                return _("Info");
            case LogLevel::warning:
                return _("Warning");
            case LogLevel::error:
                break;
        }
        return _("Error");
    }();

    std::string output = '[' + formatTime(formatIsoTimeTag, getLocalTime(entry.time)) + "]  " + utfTo<std::string>(label) + ":  ";
    const std::string indent(utfTo<std::wstring>(output).size(), ' '); //code points, not bytes

    //blank lines collapse: one entry stays one block
    bool lineStart = false;
    for (const char c : trimCpy(entry.message))
        if (c == '\n')
            lineStart = true;
        else
        {
            if (lineStart)
            {
                output += '\n' + indent;
                lineStart = false;
            }
            output += c;
        }

    output += '\n';
    return output;
}
}

#endif //ERROR_LOG_H_1906638254177302918
