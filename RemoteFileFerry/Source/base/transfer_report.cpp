// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transfer_report.h"
#include <ferry/string_tools.h>
#include <ferry/utf.h>

using namespace ferry;
using namespace rff;


ReportAggregator::ReportAggregator(const std::string& runId, int failureThreshold, const std::chrono::system_clock::time_point& startTime)
{
    report_.runId = runId;
    report_.failureThreshold = failureThreshold;
    report_.startTime = startTime;
}


void ReportAggregator::checkNotFrozen() const
{
    if (frozen_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void ReportAggregator::setPhase(RunPhase phase)
{
    checkNotFrozen();
    report_.endPhase = phase;
}


void ReportAggregator::setFound(int found)
{
    checkNotFrozen();
    report_.found = found;
}


void ReportAggregator::recordOutcome(const TransferOutcome& outcome)
{
    checkNotFrozen();
    report_.outcomes.push_back(outcome);

    switch (outcome.kind)
    {
        case TransferOutcome::Kind::transferred:
        case TransferOutcome::Kind::renamedAndTransferred:
            ++report_.succeeded;
            break;
        case TransferOutcome::Kind::skipped:
            break;
        case TransferOutcome::Kind::failed:
            ++report_.failed;
            break;
    }
}


void ReportAggregator::recordConnectionFailure(const std::wstring& errorMsg)
{
    checkNotFrozen();
    report_.connectionFailed = true;
    report_.connectionErrorMsg = errorMsg;
    report_.endPhase = RunPhase::connectionFailed;
}


void ReportAggregator::recordCancelled()
{
    checkNotFrozen();
    report_.cancelled = true;
}


TransferReport ReportAggregator::finalize(const std::chrono::milliseconds& totalTime)
{
    checkNotFrozen();
    report_.totalTime = totalTime;
    if (report_.endPhase != RunPhase::connectionFailed)
        report_.endPhase = RunPhase::done;

    frozen_ = true;
    return report_;
}


RunClassification ReportAggregator::classify(const TransferReport& report)
{
    if (report.connectionFailed)
        return RunClassification::connectionError;

    if (report.cancelled)
        return RunClassification::cancelled;

    if (report.failed >= report.failureThreshold && report.failed > 0)
        return RunClassification::failureThresholdExceeded;

    if (report.failed > 0)
    {
        if (report.failed == report.found)
            return RunClassification::totalFailure;
        return RunClassification::partialSuccess;
    }
    return RunClassification::fullSuccess;
}


std::wstring rff::getClassificationLabel(RunClassification rc)
{
    switch (rc)
    {
        case RunClassification::fullSuccess:
            return _("Full success");
        case RunClassification::partialSuccess:
            return _("Partial success");
        case RunClassification::totalFailure:
            return _("All files failed");
        case RunClassification::failureThresholdExceeded:
            return _("Too many failed files");
        case RunClassification::connectionError:
            return _("Connection error");
        case RunClassification::cancelled:
            return _("Stopped");
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::wstring rff::getSubjectPrefix(RunClassification rc)
{
    switch (rc)
    {
        case RunClassification::fullSuccess:
            return std::wstring();
        case RunClassification::partialSuccess:
            return L'[' + _("Partial success") + L']';
        case RunClassification::totalFailure:
            return L'[' + _("Failed") + L"] " + _("All files failed");
        case RunClassification::failureThresholdExceeded:
            return L'[' + _("Warning") + L"] " + _("Too many failed files");
        case RunClassification::connectionError:
            return L'[' + _("Error") + L']';
        case RunClassification::cancelled:
            return L'[' + _("Stopped") + L']';
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


RunResult rff::getRunResult(const TransferReport& report)
{
    if (report.cancelled)
        return RunResult::aborted;

    switch (ReportAggregator::classify(report))
    {
        case RunClassification::fullSuccess:
            for (const TransferOutcome& outcome : report.outcomes)
                if (outcome.archive == TransferOutcome::ArchiveStatus::archiveFailed)
                    return RunResult::finishedWarning;
            return RunResult::finishedSuccess;

        case RunClassification::partialSuccess:
            return RunResult::finishedWarning;

        case RunClassification::totalFailure:
        case RunClassification::failureThresholdExceeded:
        case RunClassification::connectionError:
            return RunResult::finishedError;

        case RunClassification::cancelled:
            return RunResult::aborted;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::wstring rff::formatReportSummary(const TransferReport& report)
{
    const std::wstring tabSpace(4, L' ');

    int skipped = 0;
    for (const TransferOutcome& outcome : report.outcomes)
        if (outcome.kind == TransferOutcome::Kind::skipped)
            ++skipped;

    const RunClassification rc = ReportAggregator::classify(report);

    std::wstring output = getClassificationLabel(rc);
    if (report.cancelled && rc != RunClassification::cancelled)
        output += L" (" + _("Stopped") + L')';
    output += L"\n\n";

    output += _("Files found:")       + L' ' + numberTo<std::wstring>(report.found) + L'\n';
    output += _("Files transferred:") + L' ' + numberTo<std::wstring>(report.succeeded) + L'\n';
    output += _("Files skipped:")     + L' ' + numberTo<std::wstring>(skipped) + L'\n';
    output += _("Files failed:")      + L' ' + numberTo<std::wstring>(report.failed) + L'\n';

    auto appendSection = [&](const std::wstring& title, const std::vector<std::wstring>& lines)
    {
        if (!lines.empty())
        {
            output += L'\n' + title + L'\n';
            for (const std::wstring& line : lines)
                output += tabSpace + line + L'\n';
        }
    };

    std::vector<std::wstring> renamedLines;
    std::vector<std::wstring> failedLines;
    std::vector<std::wstring> archiveLines;

    for (const TransferOutcome& outcome : report.outcomes)
    {
        if (outcome.kind == TransferOutcome::Kind::renamedAndTransferred)
            renamedLines.push_back(utfTo<std::wstring>(outcome.fileName) + L" -> " + utfTo<std::wstring>(afterLast(outcome.targetPath, '/', IfNotFoundReturn::all)));

        if (outcome.kind == TransferOutcome::Kind::failed)
            failedLines.push_back(utfTo<std::wstring>(outcome.fileName) + L": " + replaceCpy(outcome.reason, L'\n', L' '));

        if (outcome.archive == TransferOutcome::ArchiveStatus::archiveFailed)
            archiveLines.push_back(utfTo<std::wstring>(outcome.fileName) + L": " + replaceCpy(outcome.archiveReason, L'\n', L' '));
    }

    appendSection(_("Renamed files (target already existed):"), renamedLines);
    appendSection(_("Failed files:"), failedLines);
    appendSection(_("Archiving failed:"), archiveLines);

    if (report.connectionFailed)
        appendSection(_("Connection error:"), {replaceCpy(report.connectionErrorMsg, L'\n', L' ')});

    output += L'\n' + _("Run ID:") + L' ' + utfTo<std::wstring>(report.runId) + L'\n';
    return output;
}
