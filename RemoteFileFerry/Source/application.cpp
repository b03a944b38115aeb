// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <atomic>
#include <csignal>
#include <iostream>
#include "afs/concrete.h"
#include "afs/init_curl_libssh2.h"
#include "base/log_file.h"
#include "base/transfer.h"

using namespace ferry;
using namespace rff;


namespace
{
const std::wstring TAB_SPACE(4, L' ');

std::atomic<bool> ctrlCPressed{false}; //lock-free => async-signal-safe


extern "C" void onTerminationRequest(int /*signal*/)
{
    ctrlCPressed = true;
}


class ConsoleStatusHandler : public StatusHandler
{
public:
    void forceUiUpdateNoThrow() override
    {
        if (ctrlCPressed && !abortIsRequested())
            userRequestAbort(); //=> AbortProcess at the next file boundary
    }

protected:
    void onNewLogEntry(const LogEntry& entry) override
    {
        (entry.level == LogLevel::info ? std::cout : std::cerr) << formatMessage(entry) << std::flush;
    }
};


void showSyntaxHelp()
{
    std::cout << utfTo<std::string>(_("Syntax:") + L"\n\n" +
                                    L"RemoteFileFerry <" + _("source") + L"> <" + _("destination") + L">\n" +
                                    TAB_SPACE + L"[-Filter all | -Pattern GLOB | -Ext EXT[,EXT...] | -ModTime TIME [TIME]]\n" +
                                    TAB_SPACE + L"[-Collision skip|overwrite|rename]\n" +
                                    TAB_SPACE + L"[-Archive " + _("directory") + L"]\n" +
                                    TAB_SPACE + L"[-Retry N] [-RetryDelay " + _("seconds") + L"] [-Threshold N]\n" +
                                    TAB_SPACE + L"[-LogFolder " + _("directory") + L"]\n\n" +

                                    _("source") + L", " + _("destination") + L'\n' +
                                    TAB_SPACE + L"ftp://[user[:password]@]host[:port]/dir[|ssl][|active][|timeout=N][|encoding=gbk][|pass64=BASE64]\n" +
                                    TAB_SPACE + L"ftps://user@host[:port]/dir[|pass64=BASE64]\n" +
                                    TAB_SPACE + L"sftp://user@host[:port]/dir[|keyfile=PATH][|keypass64=BASE64][|timeout=N]\n\n" +

                                    L"-ModTime TIME\n" +
                                    TAB_SPACE + L"\"YYYY-MM-DD HH:MM:SS\", current_day, current_hour, current_minute, current_time,\n" +
                                    TAB_SPACE + L"days_before_N, hours_before_N, minutes_before_N\n" +
                                    TAB_SPACE + _("One time: files modified at or after it. Two times: files modified between them.") + L"\n\n" +

                                    L"-Archive " + _("directory") + L'\n' +
                                    TAB_SPACE + _("Move transferred source files into this folder on the source server.") + L'\n');
}


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


int parseNonNegativeNumber(const std::string& option, const std::string& value) //throw FileError
{
    if (value.empty() || value.size() > 9 || !std::all_of(value.begin(), value.end(), isDigit<char>))
        throw FileError(replaceCpy(_("Invalid value for %x:"), L"%x", utfTo<std::wstring>(option)) + L' ' + fmtPath(utfTo<std::wstring>(value)),
                        _("Expected a non-negative number."));
    return stringTo<int>(value);
}


//std::nullopt: help requested
std::optional<TransferJobConfig> parseCommandLine(const std::vector<std::string>& commandArgs) //throw FileError
{
    const char* optionFilter     = "-filter";
    const char* optionPattern    = "-pattern";
    const char* optionExt        = "-ext";
    const char* optionModTime    = "-modtime";
    const char* optionCollision  = "-collision";
    const char* optionArchive    = "-archive";
    const char* optionRetry      = "-retry";
    const char* optionRetryDelay = "-retrydelay";
    const char* optionThreshold  = "-threshold";
    const char* optionLogFolder  = "-logfolder";

    auto isHelpRequest = [](const std::string& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
        if (it == arg.begin()) return false; //require at least one prefix character

        const std::string argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == "?";
    };

    auto isCommandLineOption = [&](const std::string& arg)
    {
        for (const char* option : {optionFilter, optionPattern, optionExt, optionModTime, optionCollision, optionArchive,
                                   optionRetry, optionRetryDelay, optionThreshold, optionLogFolder})
            if (equalAsciiNoCase(arg, option))
                return true;
        return isHelpRequest(arg);
    };

    TransferJobConfig job;
    std::vector<std::string> serverPhrases;
    std::optional<std::string> archiveDir;
    bool haveFilter = false;

    auto setFilter = [&](const std::string& option, const FilterCriteria& filter) //throw FileError
    {
        if (haveFilter)
            throw FileError(replaceCpy(_("Only one filter may be set. Unexpected option %x."), L"%x", utfTo<std::wstring>(option)));
        job.filter = filter;
        haveFilter = true;
    };

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
    {
        const std::string& arg = *it;

        auto getOptionValue = [&]() -> const std::string& //throw FileError
        {
            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw FileError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(arg)));
            return *it;
        };

        if (isHelpRequest(arg))
            return std::nullopt;
        else if (equalAsciiNoCase(arg, optionFilter))
        {
            const std::string& value = getOptionValue(); //throw FileError
            if (!equalAsciiNoCase(value, "all"))
                throw FileError(replaceCpy(_("Invalid value for %x:"), L"%x", utfTo<std::wstring>(arg)) + L' ' + fmtPath(utfTo<std::wstring>(value)),
                                _("Expected:") + L" all");
            setFilter(arg, FilterAll()); //throw FileError
        }
        else if (equalAsciiNoCase(arg, optionPattern))
            setFilter(arg, FilterPattern{getOptionValue()}); //throw FileError
        else if (equalAsciiNoCase(arg, optionExt))
            setFilter(arg, FilterExtension{splitCpy(getOptionValue(), ',', SplitOnEmpty::allow)}); //throw FileError
        else if (equalAsciiNoCase(arg, optionModTime))
        {
            FilterModTime filter;
            filter.timeTokens.push_back(getOptionValue()); //throw FileError

            //optional second time: anything but an option or a server path
            if (auto itNext = it + 1;
                itNext != commandArgs.end() && !isCommandLineOption(*itNext) && !contains(*itNext, "://"))
                filter.timeTokens.push_back(*++it);

            setFilter(arg, filter); //throw FileError
        }
        else if (equalAsciiNoCase(arg, optionCollision))
        {
            const std::string& value = getOptionValue(); //throw FileError
            const std::optional<CollisionPolicy> policy = parseCollisionPolicy(value);
            if (!policy)
                throw FileError(replaceCpy(_("Invalid value for %x:"), L"%x", utfTo<std::wstring>(arg)) + L' ' + fmtPath(utfTo<std::wstring>(value)),
                                _("Expected:") + L" skip, overwrite, rename");
            job.collisionPolicy = *policy;
        }
        else if (equalAsciiNoCase(arg, optionArchive))
            archiveDir = getOptionValue(); //throw FileError
        else if (equalAsciiNoCase(arg, optionRetry))
            job.maxRetries = parseNonNegativeNumber(arg, getOptionValue()); //throw FileError
        else if (equalAsciiNoCase(arg, optionRetryDelay))
            job.retryDelay = std::chrono::seconds(parseNonNegativeNumber(arg, getOptionValue())); //throw FileError
        else if (equalAsciiNoCase(arg, optionThreshold))
            job.failureThreshold = parseNonNegativeNumber(arg, getOptionValue()); //throw FileError
        else if (equalAsciiNoCase(arg, optionLogFolder))
            job.logFolderPath = getOptionValue(); //throw FileError
        else if (startsWith(arg, '-'))
            throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", utfTo<std::wstring>(arg)));
        else
            serverPhrases.push_back(arg);
    }

    if (serverPhrases.size() != 2)
        throw FileError(_("A source and a destination server path are expected."),
                        replaceCpy(_("Found: %x"), L"%x", numberTo<std::wstring>(serverPhrases.size())));

    job.source      = parseServerPathPhrase(serverPhrases[0]); //throw FileError
    job.destination = parseServerPathPhrase(serverPhrases[1]); //

    if (archiveDir)
    {
        job.source.backupDir = sanitizeRemotePath(*archiveDir);
        job.source.archiveEnabled = true;
    }
    return job;
}
}


int main(int argc, char* argv[])
{
    const std::vector<std::string> commandArgs(argv + std::min(argc, 1), argv + argc);

    RffReturnCode rc = RFF_RC_SUCCESS;
    try
    {
        const std::optional<TransferJobConfig> job = parseCommandLine(commandArgs); //throw FileError
        if (!job)
        {
            showSyntaxHelp();
            return RFF_RC_SUCCESS;
        }

        const CurlLibssh2Initializer curlInit;

        std::signal(SIGINT,  onTerminationRequest);
        std::signal(SIGTERM, onTerminationRequest);

        std::string runId;
        try
        {
            runId = generateRunId(); //throw SysError
        }
        catch (const SysError& e) { throw FileError(_("Cannot generate a run ID."), e.toString()); }

        ConsoleStatusHandler statusHandler;

        const TransferReport report = runTransfer(*job, runId, statusHandler); //throw InvalidFilterCriteria

        const std::wstring subjectPrefix = getSubjectPrefix(ReportAggregator::classify(report));
        std::cout << '\n' << utfTo<std::string>((subjectPrefix.empty() ? L"" : subjectPrefix + L"\n\n") + formatReportSummary(report)) << std::flush;

        raiseReturnCode(rc, mapToReturnCode(getRunResult(report)));

        if (!job->logFolderPath.empty())
            try
            {
                const std::string logFilePath = saveLogFile(report, statusHandler.getErrorLog(), job->logFolderPath); //throw FileError
                std::cout << utfTo<std::string>(_("Log file:") + L' ' + fmtPath(utfTo<std::wstring>(logFilePath))) << '\n';
            }
            catch (const FileError& e)
            {
                notifyAppError(e.toString());
                raiseReturnCode(rc, RFF_RC_WARNING);
            }
    }
    catch (const FileError& e) //bad command line, invalid filter
    {
        notifyAppError(e.toString());
        raiseReturnCode(rc, RFF_RC_ERROR);
    }
    catch (const std::exception& e)
    {
        notifyAppError(utfTo<std::wstring>(e.what()));
        raiseReturnCode(rc, RFF_RC_EXCEPTION);
    }

    //errors that could not be propagated: e.g. failed cleanup in destructors
    for (const LogEntry& entry : fetchExtraLog())
        std::cerr << formatMessage(entry);

    return rc;
}
