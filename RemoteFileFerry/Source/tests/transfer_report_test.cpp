// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <ferry/string_tools.h>
#include "../base/transfer_report.h"
#include "../base/log_file.h"

using namespace ferry;
using namespace rff;


namespace
{
TransferOutcome makeOutcome(const std::string& fileName, TransferOutcome::Kind kind)
{
    TransferOutcome outcome;
    outcome.fileName   = fileName;
    outcome.sourcePath = "/out/" + fileName;
    outcome.kind       = kind;
    if (kind == TransferOutcome::Kind::transferred)
        outcome.targetPath = "/in/" + fileName;
    if (kind == TransferOutcome::Kind::failed)
        outcome.reason = L"Cannot open file.\n\nInjected failure.";
    return outcome;
}


TransferReport makeReport(int found, int succeeded, int failed, int threshold)
{
    ReportAggregator aggregator("abc123", threshold, std::chrono::system_clock::now());
    aggregator.setFound(found);
    for (int i = 0; i < succeeded; ++i)
        aggregator.recordOutcome(makeOutcome("ok" + numberTo<std::string>(i) + ".txt", TransferOutcome::Kind::transferred));
    for (int i = 0; i < failed; ++i)
        aggregator.recordOutcome(makeOutcome("bad" + numberTo<std::string>(i) + ".txt", TransferOutcome::Kind::failed));
    for (int i = succeeded + failed; i < found; ++i)
        aggregator.recordOutcome(makeOutcome("skip" + numberTo<std::string>(i) + ".txt", TransferOutcome::Kind::skipped));
    return aggregator.finalize(std::chrono::milliseconds(3723000));
}
}


TEST(ReportAggregator, CountsAndPhases)
{
    ReportAggregator aggregator("run1", 3, std::chrono::system_clock::now());
    EXPECT_EQ(aggregator.getReport().endPhase, RunPhase::init);

    aggregator.setPhase(RunPhase::perFileLoop);
    aggregator.setFound(3);
    aggregator.recordOutcome(makeOutcome("a", TransferOutcome::Kind::transferred));
    aggregator.recordOutcome(makeOutcome("b", TransferOutcome::Kind::renamedAndTransferred));
    aggregator.recordOutcome(makeOutcome("c", TransferOutcome::Kind::skipped));

    const TransferReport& report = aggregator.getReport();
    EXPECT_EQ(report.endPhase, RunPhase::perFileLoop);
    EXPECT_EQ(report.found, 3);
    EXPECT_EQ(report.succeeded, 2);
    EXPECT_EQ(report.failed, 0);
    EXPECT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.runId, "run1");
    EXPECT_EQ(report.failureThreshold, 3);
}


TEST(ReportAggregator, FinalizeFreezes)
{
    ReportAggregator aggregator("run1", 3, std::chrono::system_clock::now());
    aggregator.setFound(1);
    const TransferReport report = aggregator.finalize(std::chrono::milliseconds(1500));

    EXPECT_EQ(report.endPhase, RunPhase::done);
    EXPECT_EQ(report.totalTime, std::chrono::milliseconds(1500));

    EXPECT_THROW(aggregator.recordOutcome(makeOutcome("a", TransferOutcome::Kind::transferred)), std::logic_error);
    EXPECT_THROW(aggregator.setFound(2), std::logic_error);
    EXPECT_THROW(aggregator.recordCancelled(), std::logic_error);
    EXPECT_THROW(aggregator.finalize(std::chrono::milliseconds(0)), std::logic_error);
    EXPECT_EQ(aggregator.getReport().found, 1);
}


TEST(ReportAggregator, ConnectionFailureSurvivesFinalize)
{
    ReportAggregator aggregator("run1", 3, std::chrono::system_clock::now());
    aggregator.setPhase(RunPhase::connectingDestination);
    aggregator.recordConnectionFailure(L"Unable to connect.");
    const TransferReport report = aggregator.finalize(std::chrono::milliseconds(0));

    EXPECT_TRUE(report.connectionFailed);
    EXPECT_EQ(report.connectionErrorMsg, L"Unable to connect.");
    EXPECT_EQ(report.endPhase, RunPhase::connectionFailed);
}


TEST(ReportAggregator, Classification)
{
    EXPECT_EQ(ReportAggregator::classify(makeReport(0, 0, 0, 3)), RunClassification::fullSuccess);
    EXPECT_EQ(ReportAggregator::classify(makeReport(5, 5, 0, 3)), RunClassification::fullSuccess);
    EXPECT_EQ(ReportAggregator::classify(makeReport(5, 2, 0, 3)), RunClassification::fullSuccess); //skipped are no failures
    EXPECT_EQ(ReportAggregator::classify(makeReport(5, 4, 1, 3)), RunClassification::partialSuccess);
    EXPECT_EQ(ReportAggregator::classify(makeReport(2, 0, 2, 3)), RunClassification::totalFailure);
    EXPECT_EQ(ReportAggregator::classify(makeReport(10, 7, 3, 3)), RunClassification::failureThresholdExceeded);
    EXPECT_EQ(ReportAggregator::classify(makeReport(3, 0, 3, 3)), RunClassification::failureThresholdExceeded); //threshold checked first
    EXPECT_EQ(ReportAggregator::classify(makeReport(5, 5, 0, 0)), RunClassification::fullSuccess);

    TransferReport report = makeReport(5, 0, 5, 3);
    report.cancelled = true;
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::cancelled); //incomplete counts don't count

    report.connectionFailed = true;
    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::connectionError); //dominates all
}


TEST(ReportAggregator, CancelledRunIsNoSuccess)
{
    ReportAggregator aggregator("run2", 3, std::chrono::system_clock::now());
    aggregator.recordCancelled(); //before the first file
    const TransferReport report = aggregator.finalize(std::chrono::milliseconds(0));

    EXPECT_EQ(ReportAggregator::classify(report), RunClassification::cancelled);
    EXPECT_EQ(getSubjectPrefix(ReportAggregator::classify(report)), L"[Stopped]");
    EXPECT_EQ(getRunResult(report), RunResult::aborted);

    const std::wstring summary = formatReportSummary(report);
    EXPECT_TRUE(startsWith(summary, L"Stopped\n"));
    EXPECT_FALSE(contains(summary, L"Full success"));
}


TEST(ReportAggregator, SubjectPrefix)
{
    EXPECT_EQ(getSubjectPrefix(RunClassification::fullSuccess), L"");
    EXPECT_EQ(getSubjectPrefix(RunClassification::partialSuccess), L"[Partial success]");
    EXPECT_EQ(getSubjectPrefix(RunClassification::totalFailure), L"[Failed] All files failed");
    EXPECT_EQ(getSubjectPrefix(RunClassification::failureThresholdExceeded), L"[Warning] Too many failed files");
    EXPECT_EQ(getSubjectPrefix(RunClassification::connectionError), L"[Error]");
    EXPECT_EQ(getSubjectPrefix(RunClassification::cancelled), L"[Stopped]");
}


TEST(ReportAggregator, RunResultAndReturnCode)
{
    EXPECT_EQ(getRunResult(makeReport(5, 5, 0, 3)), RunResult::finishedSuccess);
    EXPECT_EQ(getRunResult(makeReport(5, 4, 1, 3)), RunResult::finishedWarning);
    EXPECT_EQ(getRunResult(makeReport(2, 0, 2, 3)), RunResult::finishedError);

    TransferReport report = makeReport(2, 2, 0, 3);
    report.outcomes[0].archive = TransferOutcome::ArchiveStatus::archiveFailed;
    EXPECT_EQ(getRunResult(report), RunResult::finishedWarning);

    report.cancelled = true;
    EXPECT_EQ(getRunResult(report), RunResult::aborted);

    EXPECT_EQ(mapToReturnCode(RunResult::finishedSuccess), RFF_RC_SUCCESS);
    EXPECT_EQ(mapToReturnCode(RunResult::finishedWarning), RFF_RC_WARNING);
    EXPECT_EQ(mapToReturnCode(RunResult::finishedError),   RFF_RC_ERROR);
    EXPECT_EQ(mapToReturnCode(RunResult::aborted),         RFF_RC_ABORTED);

    RffReturnCode rc = RFF_RC_SUCCESS;
    raiseReturnCode(rc, RFF_RC_ERROR);
    raiseReturnCode(rc, RFF_RC_WARNING);
    EXPECT_EQ(rc, RFF_RC_ERROR);
}


TEST(ReportAggregator, SummaryText)
{
    ReportAggregator aggregator("feedbeef0001", 3, std::chrono::system_clock::now());
    aggregator.setFound(4);
    aggregator.recordOutcome(makeOutcome("a.txt", TransferOutcome::Kind::transferred));

    TransferOutcome renamed = makeOutcome("b.txt", TransferOutcome::Kind::renamedAndTransferred);
    renamed.targetPath = "/in/b_20230102-153000.txt";
    aggregator.recordOutcome(renamed);

    aggregator.recordOutcome(makeOutcome("c.txt", TransferOutcome::Kind::skipped));
    aggregator.recordOutcome(makeOutcome("d.txt", TransferOutcome::Kind::failed));
    const TransferReport report = aggregator.finalize(std::chrono::milliseconds(0));

    const std::wstring summary = formatReportSummary(report);

    EXPECT_TRUE(startsWith(summary, L"Partial success"));
    EXPECT_TRUE(contains(summary, L"Files found: 4\n"));
    EXPECT_TRUE(contains(summary, L"Files transferred: 2\n"));
    EXPECT_TRUE(contains(summary, L"Files skipped: 1\n"));
    EXPECT_TRUE(contains(summary, L"Files failed: 1\n"));
    EXPECT_TRUE(contains(summary, L"b.txt -> b_20230102-153000.txt"));
    EXPECT_TRUE(contains(summary, L"d.txt: Cannot open file.  Injected failure."));
    EXPECT_TRUE(contains(summary, L"Run ID: feedbeef0001"));
    EXPECT_FALSE(contains(summary, L"Connection error:"));
    EXPECT_FALSE(contains(summary, L"Archiving failed:"));
}


TEST(ReportAggregator, SummaryConnectionError)
{
    ReportAggregator aggregator("run1", 3, std::chrono::system_clock::now());
    aggregator.recordConnectionFailure(L"Unable to connect to \"ftp://host\".");
    aggregator.recordCancelled();
    const std::wstring summary = formatReportSummary(aggregator.finalize(std::chrono::milliseconds(0)));

    EXPECT_TRUE(startsWith(summary, L"Connection error (Stopped)"));
    EXPECT_TRUE(contains(summary, L"Connection error:\n    Unable to connect to \"ftp://host\"."));
}


TEST(LogFile, FileName)
{
    const auto startTime = std::chrono::system_clock::from_time_t(1672673400) + std::chrono::milliseconds(42);

    const std::string nameOk = generateLogFileName(startTime, RunResult::finishedSuccess);
    EXPECT_TRUE(startsWith(nameOk, "RemoteFileFerry "));
    EXPECT_TRUE(endsWith(nameOk, ".042.log"));

    EXPECT_TRUE(endsWith(generateLogFileName(startTime, RunResult::finishedWarning), ".042 [Warning].log"));
    EXPECT_TRUE(endsWith(generateLogFileName(startTime, RunResult::finishedError),   ".042 [Error].log"));
    EXPECT_TRUE(endsWith(generateLogFileName(startTime, RunResult::aborted),         ".042 [Stopped].log"));
}


TEST(LogFile, Text)
{
    const TransferReport report = makeReport(3, 2, 1, 3);

    ErrorLog log;
    logMsg(log, L"[abc123] Connected.", LogLevel::info);
    logMsg(log, L"[abc123] Retrying.", LogLevel::warning);
    logMsg(log, L"[abc123] Cannot open file.", LogLevel::error);

    const std::string text = generateLogText(report, log);

    EXPECT_TRUE(contains(text, "RemoteFileFerry [abc123]"));
    EXPECT_TRUE(contains(text, "Completed with warnings - Partial success"));
    EXPECT_TRUE(contains(text, "Errors: 1"));
    EXPECT_TRUE(contains(text, "Warnings: 1"));
    EXPECT_TRUE(contains(text, "Files transferred: 2 / 3"));
    EXPECT_TRUE(contains(text, "Files failed: 1"));
    EXPECT_TRUE(contains(text, "Total time: 01:02:03"));
    EXPECT_TRUE(contains(text, "[abc123] Connected."));
    EXPECT_TRUE(contains(text, "[abc123] Cannot open file."));
}


TEST(LogFile, EntryFormatting)
{
    ErrorLog log;
    logMsg(log, L"[abc123] Cannot move file.\n\n\nOperation not supported.", LogLevel::warning);
    logMsg(log, L"[abc123] Connected.", LogLevel::info);
    logMsg(log, L"[abc123] Retrying.", LogLevel::warning);

    EXPECT_EQ(countEntries(log, LogLevel::warning), 2);
    EXPECT_EQ(countEntries(log, LogLevel::info), 1);
    EXPECT_EQ(countEntries(log, LogLevel::error), 0);

    const std::string line = formatMessage(log[0]);
    const std::string prefix = beforeFirst(line, "[abc123]", IfNotFoundReturn::none);
    ASSERT_TRUE(endsWith(prefix, "]  Warning:  "));
    EXPECT_EQ(afterFirst(line, prefix, IfNotFoundReturn::none), "[abc123] Cannot move file.\n" + std::string(prefix.size(), ' ') + "Operation not supported.\n");
}
