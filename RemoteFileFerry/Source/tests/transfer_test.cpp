// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <algorithm>
#include <thread>
#include <gtest/gtest.h>
#include "../base/transfer.h"
#include "../base/file_filter.h"
#include "../base/collision.h"
#include "memory_connection.h"
#include "test_status_handler.h"

using namespace ferry;
using namespace rff;


namespace
{
const time_t now = makeUtcTime(2023, 1, 2, 15, 30, 0);


class TransferTest : public testing::Test
{
protected:
    TransferTest()
    {
        job_.source.host = "src";
        job_.source.directory = "/out";
        job_.destination.host = "dst";
        job_.destination.directory = "/in";
        job_.retryDelay = std::chrono::seconds(1);

        env_.createConnection = [this](const ServerConfig& cfg) -> std::unique_ptr<ServerConnection>
        {
            const bool isSource = cfg.host == "src";
            auto conn = std::make_unique<MemoryConnection>(cfg, isSource ? sourceStorage_ : targetStorage_, isSource ? sourceCalls_ : targetCalls_);
            conn->faults = isSource ? sourceFaults_ : targetFaults_;
            return conn;
        };
        env_.getCurrentTime = [] { return now; };
        env_.delayBeforeRetry = [this](const std::wstring& /*operationName*/, std::chrono::seconds delay, const std::function<void(const std::wstring& msg)>& /*notifyStatus*/)
        {
            delays_.push_back(delay);
        };
    }

    TransferReport run()
    {
        return runTransfer(job_, "0123456789ab", handler_, env_);
    }

    size_t countCalls(const std::vector<std::string>& calls, const std::string& call) const
    {
        return std::count(calls.begin(), calls.end(), call);
    }

    size_t countWrites() const
    {
        return std::count_if(targetCalls_->begin(), targetCalls_->end(), [](const std::string& call) { return startsWith(call, "openWrite "); });
    }

    const TransferOutcome* findOutcome(const TransferReport& report, const std::string& fileName) const
    {
        for (const TransferOutcome& outcome : report.outcomes)
            if (outcome.fileName == fileName)
                return &outcome;
        return nullptr;
    }

    TransferJobConfig job_;
    TransferEnvironment env_;
    TestStatusHandler handler_;

    const std::shared_ptr<MemoryStorage> sourceStorage_ = std::make_shared<MemoryStorage>();
    const std::shared_ptr<MemoryStorage> targetStorage_ = std::make_shared<MemoryStorage>();
    const std::shared_ptr<std::vector<std::string>> sourceCalls_ = std::make_shared<std::vector<std::string>>();
    const std::shared_ptr<std::vector<std::string>> targetCalls_ = std::make_shared<std::vector<std::string>>();
    MemoryFaults sourceFaults_;
    MemoryFaults targetFaults_;
    std::vector<std::chrono::seconds> delays_;
};
}


TEST_F(TransferTest, ExtensionFilterWithArchiving)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now - 60};
    sourceStorage_->files["/out/b.csv"] = {"bravo", now - 60};
    job_.filter = FilterExtension{{"txt"}};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";

    const TransferReport report = run();

    EXPECT_EQ(report.found, 1);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.failed, 0);
    EXPECT_FALSE(report.connectionFailed);
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.endPhase, RunPhase::done);
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::fullSuccess);

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].kind, TransferOutcome::Kind::transferred);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::archived);

    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "alpha");
    EXPECT_TRUE (sourceStorage_->files.contains("/archive/a.txt"));
    EXPECT_FALSE(sourceStorage_->files.contains("/out/a.txt"));
    EXPECT_TRUE (sourceStorage_->files.contains("/out/b.csv"));
    EXPECT_FALSE(targetStorage_->files.contains("/in/b.csv"));
}


TEST_F(TransferTest, OverwriteReplacesContent)
{
    sourceStorage_->files["/out/a.txt"] = {"new content", now};
    targetStorage_->files["/in/a.txt"]  = {"stale content which is longer", now - 3600};
    job_.collisionPolicy = CollisionPolicy::overwrite;

    const TransferReport report = run();

    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, sourceStorage_->files["/out/a.txt"].content);
    EXPECT_EQ(targetStorage_->files.size(), 1u);
}


TEST_F(TransferTest, FailedOverwriteKeepsOldFile)
{
    sourceStorage_->files["/out/a.txt"] = {"new content", now};
    targetStorage_->files["/in/a.txt"]  = {"previous good content", now - 3600};
    job_.collisionPolicy = CollisionPolicy::overwrite;
    job_.maxRetries = 1;
    targetFaults_.failWriteFolder = "/in/";

    const TransferReport report = run();

    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.succeeded, 0);
    ASSERT_TRUE(targetStorage_->files.contains("/in/a.txt"));
    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "previous good content");
    EXPECT_EQ(targetStorage_->files.size(), 1u); //no temp file left behind
    EXPECT_EQ(countCalls(*targetCalls_, "remove /in/a.txt"), 0u);
}


TEST_F(TransferTest, OverwriteUploadsBesideTargetFirst)
{
    sourceStorage_->files["/out/a.txt"] = {"new content", now};
    targetStorage_->files["/in/a.txt"]  = {"old", now - 3600};
    job_.collisionPolicy = CollisionPolicy::overwrite;

    const TransferReport report = run();

    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(countCalls(*targetCalls_, "openWrite /in/a.txt"), 0u);

    auto itWrite  = std::find_if(targetCalls_->begin(), targetCalls_->end(), [](const std::string& call) { return startsWith(call, "openWrite /in/a-"); });
    auto itRemove = std::find(targetCalls_->begin(), targetCalls_->end(), "remove /in/a.txt");
    auto itRename = std::find_if(targetCalls_->begin(), targetCalls_->end(), [](const std::string& call) { return startsWith(call, "rename /in/a-") && endsWith(call, ".rff_tmp /in/a.txt"); });
    ASSERT_NE(itWrite,  targetCalls_->end());
    ASSERT_NE(itRemove, targetCalls_->end());
    ASSERT_NE(itRename, targetCalls_->end());
    EXPECT_LT(itWrite, itRemove);
    EXPECT_LT(itRemove, itRename);
}


TEST_F(TransferTest, SkipPolicyIsIdempotent)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    job_.collisionPolicy = CollisionPolicy::skip;

    const TransferReport report1 = run();
    EXPECT_EQ(report1.succeeded, 2);
    EXPECT_EQ(countWrites(), 2u);

    targetCalls_->clear();
    const TransferReport report2 = run();

    EXPECT_EQ(countWrites(), 0u);
    EXPECT_EQ(report2.found, 2);
    EXPECT_EQ(report2.succeeded, 0);
    EXPECT_EQ(report2.failed, 0);
    ASSERT_EQ(report2.outcomes.size(), 2u);
    for (const TransferOutcome& outcome : report2.outcomes)
        EXPECT_EQ(outcome.kind, TransferOutcome::Kind::skipped);
    EXPECT_EQ(ReportAggregator::classify(report2), RunClassification::fullSuccess);
}


TEST_F(TransferTest, RenamePolicyWritesTimeStampedName)
{
    sourceStorage_->files["/out/report.csv"] = {"fresh", now};
    targetStorage_->files["/in/report.csv"]  = {"existing", now};
    job_.collisionPolicy = CollisionPolicy::rename;

    const TransferReport report = run();

    ASSERT_EQ(report.outcomes.size(), 1u);
    const TransferOutcome& outcome = report.outcomes[0];
    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::renamedAndTransferred);
    EXPECT_NE(outcome.targetPath, "/in/report.csv");
    EXPECT_EQ(outcome.targetPath, "/in/report_" + formatRenameTimeStamp(now) + ".csv");

    EXPECT_EQ(targetStorage_->files["/in/report.csv"].content, "existing");
    EXPECT_EQ(targetStorage_->files[outcome.targetPath].content, "fresh");
    EXPECT_EQ(report.succeeded, 1);
}


TEST_F(TransferTest, RenamedUploadArchivedUnderRenamedName)
{
    sourceStorage_->files["/out/report.csv"] = {"fresh", now};
    targetStorage_->files["/in/report.csv"]  = {"existing", now};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";

    const TransferReport report = run();

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_TRUE(sourceStorage_->files.contains("/archive/" + getItemName(report.outcomes[0].targetPath)));
}


TEST_F(TransferTest, RetryBoundThenContinue)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    sourceStorage_->files["/out/c.txt"] = {"charlie", now};
    sourceFaults_.failOpenRead["/out/b.txt"] = -1;
    job_.maxRetries = 3;

    const TransferReport report = run();

    EXPECT_EQ(countCalls(*sourceCalls_, "openRead /out/b.txt"), 4u); //max_retries + 1
    EXPECT_EQ(delays_.size(), 3u);
    for (const std::chrono::seconds& delay : delays_)
        EXPECT_EQ(delay, std::chrono::seconds(1));

    EXPECT_EQ(report.found, 3);
    EXPECT_EQ(report.succeeded, 2);
    EXPECT_EQ(report.failed, 1);

    const TransferOutcome* outcomeB = findOutcome(report, "b.txt");
    ASSERT_TRUE(outcomeB);
    EXPECT_EQ(outcomeB->kind, TransferOutcome::Kind::failed);
    EXPECT_TRUE(contains(outcomeB->reason, L"Injected failure."));

    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "alpha");
    EXPECT_EQ(targetStorage_->files["/in/c.txt"].content, "charlie");
    EXPECT_FALSE(targetStorage_->files.contains("/in/b.txt"));

    //listing order preserved
    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.outcomes[0].fileName, "a.txt");
    EXPECT_EQ(report.outcomes[1].fileName, "b.txt");
    EXPECT_EQ(report.outcomes[2].fileName, "c.txt");
}


TEST_F(TransferTest, TransientErrorRecovers)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    targetFaults_.failOpenWrite["/in/a.txt"] = 2;

    const TransferReport report = run();

    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.failed, 0);
    EXPECT_EQ(countCalls(*sourceCalls_, "openRead /out/a.txt"), 3u);
    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "alpha");
}


TEST_F(TransferTest, ZeroRetriesMeansSingleAttempt)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceFaults_.failOpenRead["/out/a.txt"] = -1;
    job_.maxRetries = 0;

    const TransferReport report = run();

    EXPECT_EQ(countCalls(*sourceCalls_, "openRead /out/a.txt"), 1u);
    EXPECT_TRUE(delays_.empty());
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::totalFailure);
}


TEST_F(TransferTest, DestinationFailsAfterListing)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    targetFaults_.connectionLost = true; //connect() succeeds, every later call fails

    const TransferReport report = run();

    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(report.endPhase, RunPhase::connectionFailed);
    EXPECT_FALSE(report.connectionErrorMsg.empty());
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::connectionError);
    EXPECT_EQ(report.succeeded, 0);

    for (const TransferOutcome& outcome : report.outcomes)
        EXPECT_NE(outcome.kind, TransferOutcome::Kind::transferred);

    EXPECT_LE(report.outcomes.size(), 1u); //remaining files are not processed
    EXPECT_EQ(countCalls(*sourceCalls_, "list /out"), 1u);
    EXPECT_TRUE(delays_.empty()); //connection errors are not retried
}


TEST_F(TransferTest, SourceConnectFailure)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceFaults_.failConnect = true;

    const TransferReport report = run();

    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(report.endPhase, RunPhase::connectionFailed);
    EXPECT_EQ(report.found, 0);
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_TRUE(targetCalls_->empty()); //destination never contacted

    //close() is safe after a failed connect()
    EXPECT_EQ(countCalls(*sourceCalls_, "close"), 1u);
}


TEST_F(TransferTest, DestinationConnectFailure)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    targetFaults_.failConnect = true;

    const TransferReport report = run();

    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(countCalls(*sourceCalls_, "list /out"), 0u);
    EXPECT_EQ(countCalls(*sourceCalls_, "close"), 1u);
    EXPECT_EQ(countCalls(*targetCalls_, "close"), 1u);
}


TEST_F(TransferTest, ListingFailureIsRetriedThenFatal)
{
    sourceFaults_.failList = true;
    job_.maxRetries = 2;

    const TransferReport report = run();

    EXPECT_EQ(countCalls(*sourceCalls_, "list /out"), 3u);
    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(report.found, 0);
}


TEST_F(TransferTest, InvalidFilterFailsBeforeAnyConnection)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    job_.filter = FilterPattern{""};

    EXPECT_THROW(run(), InvalidFilterCriteria);
    EXPECT_TRUE(sourceCalls_->empty());
    EXPECT_TRUE(targetCalls_->empty());

    job_.filter = FilterModTime{{"days_before_yesterday"}};
    EXPECT_THROW(run(), InvalidFilterCriteria);
    EXPECT_TRUE(sourceCalls_->empty());
}


TEST_F(TransferTest, ModTimeFilterResolvedAgainstRunClock)
{
    sourceStorage_->files["/out/old.txt"]   = {"old",   makeUtcTime(2023, 1, 1, 23, 59, 59)};
    sourceStorage_->files["/out/today.txt"] = {"today", makeUtcTime(2023, 1, 2,  0,  0,  0)};
    job_.filter = FilterModTime{{"current_day"}};

    const TransferReport report = run();

    EXPECT_EQ(report.found, 1);
    EXPECT_TRUE (targetStorage_->files.contains("/in/today.txt"));
    EXPECT_FALSE(targetStorage_->files.contains("/in/old.txt"));
}


TEST_F(TransferTest, CancelBeforeFirstFile)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    handler_.userRequestAbort();

    const TransferReport report = run();

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(countWrites(), 0u);
    EXPECT_TRUE(targetStorage_->files.empty());
    EXPECT_EQ(getRunResult(report), RunResult::aborted);
}


TEST_F(TransferTest, CancelAtFileBoundary)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    sourceStorage_->files["/out/c.txt"] = {"charlie", now};

    handler_.onUiUpdate = [](TestStatusHandler& handler)
    {
        if (handler.getStatsCurrent().items >= 1) //first file completed
            handler.userRequestAbort();
    };

    const TransferReport report = run();

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.connectionFailed);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(targetStorage_->files.size(), 1u);
    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "alpha");
    EXPECT_EQ(countCalls(*sourceCalls_, "close"), 1u);
    EXPECT_EQ(countCalls(*targetCalls_, "close"), 1u);
}


TEST_F(TransferTest, CancelDuringRetryWait)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceFaults_.failOpenRead["/out/a.txt"] = -1;
    env_.delayBeforeRetry = [this](const std::wstring& /*operationName*/, std::chrono::seconds /*delay*/, const std::function<void(const std::wstring& msg)>& /*notifyStatus*/)
    {
        handler_.userRequestAbort();
    };

    const TransferReport report = run();

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(countCalls(*sourceCalls_, "openRead /out/a.txt"), 1u);
}


TEST_F(TransferTest, ArchiveFailureDoesNotFailTransfer)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";
    sourceFaults_.renameUnsupported = true;
    sourceFaults_.failOpenWrite["/archive/a.txt"] = -1;

    const TransferReport report = run();

    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.failed, 0);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].kind, TransferOutcome::Kind::transferred);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::archiveFailed);
    EXPECT_FALSE(report.outcomes[0].archiveReason.empty());
    EXPECT_TRUE(sourceStorage_->files.contains("/out/a.txt"));
    EXPECT_EQ(getRunResult(report), RunResult::finishedWarning);
}


TEST_F(TransferTest, ArchiveFallbackWithoutNativeMove)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";
    sourceFaults_.renameUnsupported = true;

    const TransferReport report = run();

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::archived);
    EXPECT_EQ(sourceStorage_->files["/archive/a.txt"].content, "alpha");
    EXPECT_FALSE(sourceStorage_->files.contains("/out/a.txt"));
}


TEST_F(TransferTest, ArchiveEnabledWithoutFolderIsInactive)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    job_.source.archiveEnabled = true; //no backup folder

    const TransferReport report = run();

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::notApplicable);
    EXPECT_TRUE(sourceStorage_->files.contains("/out/a.txt"));
}


TEST_F(TransferTest, ConnectionLostWhileArchiving)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo", now};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";
    sourceFaults_.onRename = [](const std::string& /*pathFrom*/, const std::string& /*pathTo*/)
    {
        throw ConnectionError(L"Unable to connect to \"mem://src/\".", L"Connection reset by peer.");
    };

    const TransferReport report = run();

    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(report.endPhase, RunPhase::connectionFailed);
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::connectionError);
    EXPECT_EQ(getRunResult(report), RunResult::finishedError);

    //the upload happened: it stays in the report
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.outcomes[0].fileName, "a.txt");
    EXPECT_EQ(report.outcomes[0].kind, TransferOutcome::Kind::transferred);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::archiveFailed);
    EXPECT_TRUE(contains(report.outcomes[0].archiveReason, L"Connection reset by peer."));

    EXPECT_TRUE (targetStorage_->files.contains("/in/a.txt"));
    EXPECT_FALSE(targetStorage_->files.contains("/in/b.txt")); //remaining files are not processed
    EXPECT_TRUE(delays_.empty());
}


TEST_F(TransferTest, CancelDuringArchiveCopy)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    job_.source.archiveEnabled = true;
    job_.source.backupDir = "/archive";
    sourceFaults_.onRename = [this](const std::string& pathFrom, const std::string& pathTo)
    {
        handler_.userRequestAbort();
        std::this_thread::sleep_for(UI_UPDATE_INTERVAL * 2); //next progress update of the fallback copy is due
        throw ErrorMoveUnsupported(utfTo<std::wstring>("Cannot move " + pathFrom + " to " + pathTo), L"Operation not supported.");
    };

    const TransferReport report = run();

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(getRunResult(report), RunResult::aborted);

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.outcomes[0].kind, TransferOutcome::Kind::transferred);
    EXPECT_EQ(report.outcomes[0].archive, TransferOutcome::ArchiveStatus::archiveFailed);
    EXPECT_EQ(report.outcomes[0].archiveReason, L"Stopped");

    EXPECT_EQ(targetStorage_->files["/in/a.txt"].content, "alpha");
    EXPECT_TRUE (sourceStorage_->files.contains("/out/a.txt"));
    EXPECT_FALSE(sourceStorage_->files.contains("/archive/a.txt"));
}


TEST_F(TransferTest, LogLinesCarryRunId)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};

    const TransferReport report = run();

    EXPECT_EQ(report.runId, "0123456789ab");
    ASSERT_FALSE(handler_.getErrorLog().empty());
    for (const LogEntry& entry : handler_.getErrorLog())
        EXPECT_TRUE(startsWith(entry.message, "[0123456789ab] ")) << entry.message;
}


TEST_F(TransferTest, ProgressIsReported)
{
    sourceStorage_->files["/out/a.txt"] = {"alpha", now};
    sourceStorage_->files["/out/b.txt"] = {"bravo!", now};

    run();

    EXPECT_EQ(handler_.getStatsCurrent().items, 2);
    EXPECT_EQ(handler_.getStatsCurrent().bytes, 11);
}


TEST(TransferRunId, TwelveHexDigits)
{
    const std::string runId = generateRunId();
    EXPECT_EQ(runId.size(), 12u);
    EXPECT_TRUE(std::all_of(runId.begin(), runId.end(), [](char c) { return isDigit(c) || ('a' <= c && c <= 'f'); }));
    EXPECT_NE(runId, generateRunId());
}


TEST(CopyFileAsStream, PartialTargetRemovedOnError)
{
    const auto storage = std::make_shared<MemoryStorage>();
    const auto callLog = std::make_shared<std::vector<std::string>>();
    storage->files["/out/big.bin"] = {std::string(100, 'x'), now};

    MemoryConnection conn(ServerConfig(), storage, callLog);
    conn.connect();

    struct CopyInterrupted {};
    int64_t bytesSeen = 0;
    EXPECT_THROW(copyFileAsStream(conn, "/out/big.bin", conn, "/in/big.bin", [&](int64_t bytesDelta)
    {
        bytesSeen += bytesDelta;
        if (bytesSeen > 20)
            throw CopyInterrupted();
    }), CopyInterrupted);

    EXPECT_FALSE(storage->files.contains("/in/big.bin"));
    EXPECT_TRUE (storage->files.contains("/out/big.bin"));
}
