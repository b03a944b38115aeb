// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSFER_REPORT_H_9021837465502918376
#define TRANSFER_REPORT_H_9021837465502918376

#include <chrono>
#include <string>
#include <vector>
#include "return_codes.h"


namespace rff
{
struct TransferOutcome //immutable once recorded
{
    enum class Kind
    {
        transferred,
        renamedAndTransferred,
        skipped,
        failed,
    };
    enum class ArchiveStatus
    {
        notApplicable, //archiving disabled, or nothing was transferred
        archived,
        archiveFailed, //transfer still counts as succeeded!
    };

    std::string fileName;   //source item name
    std::string sourcePath;
    Kind kind = Kind::failed;
    std::string targetPath; //transferred only: final destination path
    std::wstring reason;    //failed only: error message of the last attempt
    uint64_t fileSize = 0;  //bytes transferred

    ArchiveStatus archive = ArchiveStatus::notApplicable;
    std::wstring archiveReason; //archiveFailed only
};


enum class RunPhase
{
    init,
    connectingSource,
    connectingDestination,
    listing,
    perFileLoop,
    finalizing,
    done,
    connectionFailed,
};


struct TransferReport //the only artifact handed to the notifier: keep shape stable!
{
    std::string runId;
    std::vector<TransferOutcome> outcomes; //listing order
    int found     = 0; //selected by filter
    int succeeded = 0;
    int failed    = 0; //skipped: neither succeeded nor failed
    bool connectionFailed = false;
    std::wstring connectionErrorMsg;
    bool cancelled = false;
    int failureThreshold = 0;
    RunPhase endPhase = RunPhase::init;
    std::chrono::system_clock::time_point startTime;
    std::chrono::milliseconds totalTime{};
};


enum class RunClassification
{
    fullSuccess,
    partialSuccess,
    totalFailure,
    failureThresholdExceeded,
    connectionError,
    cancelled, //stopped by the user: counts are incomplete
};


//collects per-file outcomes during the run; frozen by finalize()
class ReportAggregator
{
public:
    ReportAggregator(const std::string& runId, int failureThreshold, const std::chrono::system_clock::time_point& startTime);

    void setPhase(RunPhase phase);
    void setFound(int found);
    void recordOutcome(const TransferOutcome& outcome);
    void recordConnectionFailure(const std::wstring& errorMsg);
    void recordCancelled();

    const TransferReport& getReport() const { return report_; }

    //end of run: no more changes
    TransferReport finalize(const std::chrono::milliseconds& totalTime);

    static RunClassification classify(const TransferReport& report);

private:
    ReportAggregator           (const ReportAggregator&) = delete;
    ReportAggregator& operator=(const ReportAggregator&) = delete;

    void checkNotFrozen() const;

    TransferReport report_;
    bool frozen_ = false;
};


std::wstring getClassificationLabel(RunClassification rc);
std::wstring getSubjectPrefix(RunClassification rc); //empty for full success
RunResult getRunResult(const TransferReport& report);

//plain-text report body for the notifier and the console
std::wstring formatReportSummary(const TransferReport& report);
}

#endif //TRANSFER_REPORT_H_9021837465502918376
