// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transfer.h"
#include <ferry/open_ssl.h>
#include "archive.h"
#include "collision.h"
#include "file_filter.h"

using namespace ferry;
using namespace rff;


namespace
{
class TransferRun
{
public:
    TransferRun(const TransferJobConfig& job, const std::string& runId, ProcessCallback& callback, const TransferEnvironment& env) :
        job_(job),
        runIdFmt_(L'[' + utfTo<std::wstring>(runId) + L"] "),
        callback_(callback),
        env_(env),
        aggregator_(runId, job.failureThreshold, std::chrono::system_clock::now()),
        resolver_(env.getCurrentTime) {}

    TransferReport run(const FileFilter& filter)
    {
        const auto startTime = std::chrono::steady_clock::now();
        try
        {
            runPhases(filter); //throw AbortProcess
        }
        catch (AbortProcess&)
        {
            aggregator_.recordCancelled();
            logMessage(_("Stopped"), ProcessCallback::MsgType::warning);
        }

        if (!aggregator_.getReport().connectionFailed)
            aggregator_.setPhase(RunPhase::finalizing);
        TransferReport report = aggregator_.finalize(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime));

        logMessage(replaceCpy(replaceCpy(replaceCpy(_("Run finished: %x transferred, %y failed, %z found."),
                                                    L"%x", numberTo<std::wstring>(report.succeeded)),
                                         L"%y", numberTo<std::wstring>(report.failed)),
                              L"%z", numberTo<std::wstring>(report.found)),
                   report.connectionFailed || report.failed > 0 ? ProcessCallback::MsgType::error : ProcessCallback::MsgType::info);
        return report;
    }

private:
    TransferRun           (const TransferRun&) = delete;
    TransferRun& operator=(const TransferRun&) = delete;

    void runPhases(const FileFilter& filter); //throw AbortProcess

    bool connectSide(ServerConnection& conn, RunPhase phase); //throw AbortProcess
    std::optional<std::vector<FileEntry>> listSourceFolder(ServerConnection& sourceConn); //throw AbortProcess

    //returns false if the run must stop
    bool processFile(const FileEntry& entry, ServerConnection& sourceConn, ServerConnection& targetConn); //throw AbortProcess

    void waitBeforeRetry(); //throw AbortProcess

    void logMessage(const std::wstring& msg, ProcessCallback::MsgType type) { callback_.logMessage(runIdFmt_ + msg, type); }

    const TransferJobConfig& job_;
    const std::wstring runIdFmt_;
    ProcessCallback& callback_;
    const TransferEnvironment& env_;

    ReportAggregator aggregator_;
    CollisionResolver resolver_;
};


void TransferRun::runPhases(const FileFilter& filter) //throw AbortProcess
{
    logMessage(replaceCpy(replaceCpy(_("Transferring from %x to %y."),
                                     L"%x", fmtPath(generateDisplayPath(job_.source, job_.source.directory))),
                          L"%y", fmtPath(generateDisplayPath(job_.destination, job_.destination.directory))), ProcessCallback::MsgType::info);

    //-------------------------------------------------------------------------------------
    const std::unique_ptr<ServerConnection> sourceConn = env_.createConnection(job_.source);
    FERRY_ON_SCOPE_EXIT(sourceConn->close());

    if (!connectSide(*sourceConn, RunPhase::connectingSource)) //throw AbortProcess
        return;

    const std::unique_ptr<ServerConnection> targetConn = env_.createConnection(job_.destination);
    FERRY_ON_SCOPE_EXIT(targetConn->close());

    if (!connectSide(*targetConn, RunPhase::connectingDestination)) //throw AbortProcess
        return;

    //-------------------------------------------------------------------------------------
    aggregator_.setPhase(RunPhase::listing);

    const std::optional<std::vector<FileEntry>> entries = listSourceFolder(*sourceConn); //throw AbortProcess
    if (!entries)
        return;

    const std::vector<FileEntry> selected = filter.select(*entries);
    aggregator_.setFound(static_cast<int>(selected.size()));

    logMessage(replaceCpy(replaceCpy(_("Found %x files, %y selected by filter."),
                                     L"%x", numberTo<std::wstring>(entries->size())),
                          L"%y", numberTo<std::wstring>(selected.size())), ProcessCallback::MsgType::info);

    //-------------------------------------------------------------------------------------
    aggregator_.setPhase(RunPhase::perFileLoop);

    for (const FileEntry& entry : selected)
    {
        callback_.requestUiUpdate(true /*force*/); //throw AbortProcess; honor cancellation between files

        if (!processFile(entry, *sourceConn, *targetConn)) //throw AbortProcess
            return;
    }
}


bool TransferRun::connectSide(ServerConnection& conn, RunPhase phase) //throw AbortProcess
{
    aggregator_.setPhase(phase);

    const std::wstring displayPath = conn.getDisplayPath(conn.getConfig().directory);
    callback_.updateStatus(replaceCpy(_("Connecting to %x..."), L"%x", fmtPath(displayPath))); //throw AbortProcess
    try
    {
        conn.connect(); //throw ConnectionError
        logMessage(replaceCpy(_("Connected to %x."), L"%x", fmtPath(displayPath)), ProcessCallback::MsgType::info);
        return true;
    }
    catch (const ConnectionError& e)
    {
        aggregator_.recordConnectionFailure(e.toString());
        logMessage(e.toString(), ProcessCallback::MsgType::error);
        return false;
    }
}


std::optional<std::vector<FileEntry>> TransferRun::listSourceFolder(ServerConnection& sourceConn) //throw AbortProcess
{
    const std::string& dirPath = job_.source.directory;
    callback_.updateStatus(replaceCpy(_("Reading folder %x..."), L"%x", fmtPath(sourceConn.getDisplayPath(dirPath)))); //throw AbortProcess

    for (int attempt = 0;; ++attempt)
    {
        try
        {
            return sourceConn.list(dirPath); //throw RemoteIOError, ConnectionError
        }
        catch (const ConnectionError& e)
        {
            aggregator_.recordConnectionFailure(e.toString());
            logMessage(e.toString(), ProcessCallback::MsgType::error);
            return std::nullopt;
        }
        catch (const RemoteIOError& e)
        {
            //no listing, no files: treat like a failed connection
            if (attempt >= job_.maxRetries)
            {
                aggregator_.recordConnectionFailure(e.toString());
                logMessage(e.toString(), ProcessCallback::MsgType::error);
                return std::nullopt;
            }
            logMessage(e.toString() + L"\n\n" + replaceCpy(replaceCpy(_("Retrying... (attempt %x of %y)"),
                                                                      L"%x", numberTo<std::wstring>(attempt + 2)),
                                                           L"%y", numberTo<std::wstring>(job_.maxRetries + 1)), ProcessCallback::MsgType::warning);
        }
        waitBeforeRetry(); //throw AbortProcess
    }
}


bool TransferRun::processFile(const FileEntry& entry, ServerConnection& sourceConn, ServerConnection& targetConn) //throw AbortProcess
{
    const std::string targetPath = appendRemotePath(job_.destination.directory, entry.name);

    TransferOutcome outcome;
    outcome.fileName   = entry.name;
    outcome.sourcePath = entry.path;

    for (int attempt = 0;; ++attempt)
    {
        try
        {
            const EffectiveAction action = resolver_.resolve(targetConn, targetPath, job_.collisionPolicy); //throw RemoteIOError, ConnectionError, FileError

            if (action.type == EffectiveAction::Type::skip)
            {
                outcome.kind = TransferOutcome::Kind::skipped;
                logMessage(replaceCpy(_("Skipped %x: the target already exists."), L"%x", fmtPath(targetConn.getDisplayPath(targetPath))), ProcessCallback::MsgType::info);
                break;
            }

            const std::wstring statusMsg = replaceCpy(_("Transferring file %x..."), L"%x", fmtPath(sourceConn.getDisplayPath(entry.path)));
            callback_.updateStatus(statusMsg); //throw AbortProcess

            int64_t bytesReported = 0;
            FERRY_ON_SCOPE_FAIL(callback_.updateDataProcessed(0, -bytesReported)); //undo progress of a failed attempt

            std::function<void()> onDeleteTargetFile; //overwrite: old file stays until the new one is complete
            if (action.replacesExisting)
                onDeleteTargetFile = [&] { targetConn.removeFile(action.targetPath); /*throw RemoteIOError, ConnectionError*/ };

            const FileCopyResult result = copyFileTransactional(sourceConn, entry.path, targetConn, action.targetPath, onDeleteTargetFile, [&](int64_t bytesDelta) //throw RemoteIOError, ConnectionError, AbortProcess
            {
                bytesReported += bytesDelta;
                callback_.updateDataProcessed(0, bytesDelta);
                callback_.requestUiUpdate(); //throw AbortProcess
            });
            callback_.updateDataProcessed(1, 0);

            outcome.kind = action.renamed ? TransferOutcome::Kind::renamedAndTransferred : TransferOutcome::Kind::transferred;
            outcome.targetPath = action.targetPath;
            outcome.fileSize   = result.fileSize;

            logMessage(replaceCpy(replaceCpy(_("Transferred %x to %y."),
                                             L"%x", fmtPath(sourceConn.getDisplayPath(entry.path))),
                                  L"%y", fmtPath(targetConn.getDisplayPath(action.targetPath))), ProcessCallback::MsgType::info);
            break;
        }
        catch (const ConnectionError& e)
        {
            outcome.kind   = TransferOutcome::Kind::failed;
            outcome.reason = e.toString();
            aggregator_.recordOutcome(outcome);

            aggregator_.recordConnectionFailure(e.toString());
            logMessage(e.toString(), ProcessCallback::MsgType::error);
            return false;
        }
        catch (const FileError& e) //RemoteIOError, no free target name
        {
            if (attempt >= job_.maxRetries)
            {
                outcome.kind   = TransferOutcome::Kind::failed;
                outcome.reason = e.toString();
                logMessage(e.toString(), ProcessCallback::MsgType::error);
                break;
            }
            logMessage(e.toString() + L"\n\n" + replaceCpy(replaceCpy(_("Retrying... (attempt %x of %y)"),
                                                                      L"%x", numberTo<std::wstring>(attempt + 2)),
                                                           L"%y", numberTo<std::wstring>(job_.maxRetries + 1)), ProcessCallback::MsgType::warning);
        }
        waitBeforeRetry(); //throw AbortProcess
    }

    //best-effort bookkeeping: never turns a transfer into a failure
    if (outcome.kind == TransferOutcome::Kind::transferred ||
        outcome.kind == TransferOutcome::Kind::renamedAndTransferred)
        try
        {
            const ArchiveResult ar = archiveFile(sourceConn, entry.path, //throw ArchiveError, ConnectionError, AbortProcess
                                                 job_.source.backupDir, isArchivingActive(job_.source),
                                                 getItemName(outcome.targetPath),
                                                 [&](int64_t /*bytesDelta*/) { callback_.requestUiUpdate(); /*throw AbortProcess*/ });
            if (ar != ArchiveResult::disabled)
            {
                outcome.archive = TransferOutcome::ArchiveStatus::archived;
                logMessage(replaceCpy(replaceCpy(_("Archived %x to %y."),
                                                 L"%x", fmtPath(sourceConn.getDisplayPath(entry.path))),
                                      L"%y", fmtPath(sourceConn.getDisplayPath(appendRemotePath(job_.source.backupDir, getItemName(outcome.targetPath))))),
                           ProcessCallback::MsgType::info);
            }
        }
        catch (const ArchiveError& e)
        {
            outcome.archive = TransferOutcome::ArchiveStatus::archiveFailed;
            outcome.archiveReason = e.toString();
            logMessage(e.toString(), ProcessCallback::MsgType::warning);
        }
        catch (const ConnectionError& e) //the file is on the destination already: report it, then end the run
        {
            outcome.archive = TransferOutcome::ArchiveStatus::archiveFailed;
            outcome.archiveReason = e.toString();
            aggregator_.recordOutcome(outcome);

            aggregator_.recordConnectionFailure(e.toString());
            logMessage(e.toString(), ProcessCallback::MsgType::error);
            return false;
        }
        catch (AbortProcess&)
        {
            outcome.archive = TransferOutcome::ArchiveStatus::archiveFailed;
            outcome.archiveReason = _("Stopped");
            aggregator_.recordOutcome(outcome);
            throw;
        }

    aggregator_.recordOutcome(outcome);
    return true;
}


void TransferRun::waitBeforeRetry() //throw AbortProcess
{
    callback_.requestUiUpdate(true /*force*/); //throw AbortProcess

    if (job_.retryDelay > std::chrono::seconds(0) && env_.delayBeforeRetry)
        env_.delayBeforeRetry(_("Waiting before retry"), job_.retryDelay, [&](const std::wstring& msg) { callback_.updateStatus(msg); /*throw AbortProcess*/ });

    callback_.requestUiUpdate(true /*force*/); //throw AbortProcess
}
}


TransferReport rff::runTransfer(const TransferJobConfig& job, //throw InvalidFilterCriteria
                                const std::string& runId,
                                ProcessCallback& callback,
                                const TransferEnvironment& env)
{
    if (job.maxRetries < 0 || !env.createConnection || !env.getCurrentTime)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    //validate and resolve time window once per run, before any network I/O
    const FileFilter filter(job.filter, env.getCurrentTime()); //throw InvalidFilterCriteria

    TransferRun run(job, runId, callback, env);
    return run.run(filter);
}


std::string rff::generateRunId() //throw SysError
{
    return formatAsHexString(generateRandomBytes(6)); //throw SysError
}
