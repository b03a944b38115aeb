// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSFER_H_4718290365519203847
#define TRANSFER_H_4718290365519203847

#include <functional>
#include "structures.h"
#include "status_handler.h"
#include "transfer_report.h"
#include "../afs/concrete.h"


namespace rff
{
//collaborators of a run: replaceable for testing
struct TransferEnvironment
{
    std::function<std::unique_ptr<ServerConnection>(const ServerConfig& cfg)> createConnection = createServerConnection;

    std::function<time_t()> getCurrentTime = [] { return std::time(nullptr); }; //"now" for time expressions and rename time stamps

    std::function<void(const std::wstring& operationName, std::chrono::seconds delay,
                       const std::function<void(const std::wstring& msg)>& notifyStatus /*throw X*/)> delayBeforeRetry = delayAndCountDown; //throw X
};


/*  one transfer run: Init -> ConnectingSource -> ConnectingDestination -> Listing -> PerFileLoop -> Finalizing -> Done
                                                                                          \-> ConnectionFailed

    - bad filter settings fail *before* any connection is opened
    - per-file errors are retried, then recorded: they never abort the run
    - connection errors abort the run: TransferReport::connectionFailed
    - AbortProcess thrown by the callback: run stops at the next file boundary => TransferReport::cancelled    */
TransferReport runTransfer(const TransferJobConfig& job, //throw InvalidFilterCriteria
                           const std::string& runId,
                           ProcessCallback& callback,
                           const TransferEnvironment& env = {});

std::string generateRunId(); //throw SysError; 12 hex digits
}

#endif //TRANSFER_H_4718290365519203847
