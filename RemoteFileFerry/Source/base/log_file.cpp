// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "log_file.h"
#include <ferry/file_io.h>

using namespace ferry;
using namespace rff;


namespace
{
std::wstring formatTotalTime(const std::chrono::milliseconds& totalTime)
{
    const int64_t totalSec = std::chrono::duration_cast<std::chrono::seconds>(totalTime).count();

    return printNumber<std::wstring>(L"%02d", static_cast<int>(totalSec / 3600)) + L':' +
           printNumber<std::wstring>(L"%02d", static_cast<int>(totalSec / 60 % 60)) + L':' +
           printNumber<std::wstring>(L"%02d", static_cast<int>(totalSec % 60));
}


std::wstring generateLogHeader(const TransferReport& report, const ErrorLog& log)
{
    //assemble summary box
    std::vector<std::wstring> summary;

    const std::wstring tabSpace(4, L' '); //4, the one true space count for tabs

    summary.push_back(utfTo<std::wstring>(formatTime(formatIsoDateTimeTag, getLocalTime(std::chrono::system_clock::to_time_t(report.startTime)))) +
                      L"  RemoteFileFerry [" + utfTo<std::wstring>(report.runId) + L']');
    summary.push_back(L"");
    const RunClassification rc = ReportAggregator::classify(report);
    if (rc == RunClassification::cancelled)
        summary.push_back(tabSpace + getFinalStatusLabel(getRunResult(report)));
    else
        summary.push_back(tabSpace + getFinalStatusLabel(getRunResult(report)) + L" - " + getClassificationLabel(rc));

    if (const int errorCount   = countEntries(log, LogLevel::error);   errorCount   > 0) summary.push_back(tabSpace + _("Errors:")   + L' ' + numberTo<std::wstring>(errorCount));
    if (const int warningCount = countEntries(log, LogLevel::warning); warningCount > 0) summary.push_back(tabSpace + _("Warnings:") + L' ' + numberTo<std::wstring>(warningCount));

    uint64_t bytesTransferred = 0;
    for (const TransferOutcome& outcome : report.outcomes)
        bytesTransferred += outcome.fileSize;

    summary.push_back(tabSpace + _("Files transferred:") + L' ' + numberTo<std::wstring>(report.succeeded) + L" / " + numberTo<std::wstring>(report.found) +
                      L" (" + numberTo<std::wstring>(bytesTransferred) + L' ' + _("bytes") + L')'); //show always, even if 0!
    if (report.failed > 0)
        summary.push_back(tabSpace + _("Files failed:") + L' ' + numberTo<std::wstring>(report.failed));

    summary.push_back(tabSpace + _("Total time:") + L' ' + formatTotalTime(report.totalTime));

    size_t sepLineLen = 0;
    for (const std::wstring& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::wstring output(sepLineLen + 1, L'_');
    output += L'\n';

    for (const std::wstring& str : summary) { output += L'|'; output += str; output += L'\n'; }

    output += L'|';
    output.append(sepLineLen, L'_');
    output += L'\n';

    return output;
}
}


std::string rff::generateLogFileName(const std::chrono::system_clock::time_point& runStartTime, RunResult finalStatus) //throw FileError
{
    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(runStartTime));
    if (tc == TimeComp())
        throw FileError(L"Failed to determine current time: " + numberTo<std::wstring>(runStartTime.time_since_epoch().count()));

    const auto timeMs = std::chrono::duration_cast<std::chrono::milliseconds>(runStartTime.time_since_epoch()).count() % 1000;

    std::string logFileName = "RemoteFileFerry " + formatTime("%Y-%m-%d %H%M%S", tc) +
                              '.' + printNumber<std::string>("%03d", static_cast<int>(timeMs)); //[ms] should yield a fairly unique name

    const std::wstring failStatus = [&]
    {
        switch (finalStatus)
        {
            case RunResult::finishedSuccess:
                break;
            case RunResult::finishedWarning:
                return _("Warning");
            case RunResult::finishedError:
                return _("Error");
            case RunResult::aborted:
                return _("Stopped");
        }
        return std::wstring();
    }();

    if (!failStatus.empty())
        logFileName += " [" + utfTo<std::string>(failStatus) + ']';
    return logFileName + ".log";
}


std::string rff::generateLogText(const TransferReport& report, const ErrorLog& log)
{
    std::string output = utfTo<std::string>(generateLogHeader(report, log));
    output += '\n';

    for (const LogEntry& entry : log)
    {
        output += formatMessage(entry);
        output += '\n';
    }
    return output;
}


std::string rff::saveLogFile(const TransferReport& report, const ErrorLog& log, const std::string& logFolderPath) //throw FileError
{
    createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

    const std::string logFilePath = appendPath(logFolderPath, generateLogFileName(report.startTime, getRunResult(report))); //throw FileError

    setFileContent(logFilePath, generateLogText(report, log)); //throw FileError
    return logFilePath;
}
