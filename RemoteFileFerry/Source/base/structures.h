// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRUCTURES_H_3390127745816209534
#define STRUCTURES_H_3390127745816209534

#include <variant>
#include <vector>
#include <chrono>
#include "../afs/abstract.h"


namespace rff
{
//-------------------------- file selection --------------------------
struct FilterAll
{
    bool operator==(const FilterAll&) const = default;
};

struct FilterPattern
{
    std::string pattern; //glob: '*' and '?', matched against the file name only

    bool operator==(const FilterPattern&) const = default;
};

struct FilterExtension
{
    std::vector<std::string> extensions; //with or without leading '.', case-insensitive

    bool operator==(const FilterExtension&) const = default;
};

struct FilterModTime
{
    std::vector<std::string> timeTokens; //one: "at or after", two: closed window, order-independent

    bool operator==(const FilterModTime&) const = default;
};

using FilterCriteria = std::variant<FilterAll,
      FilterPattern,
      FilterExtension,
      FilterModTime>;

std::wstring getFilterLabel(const FilterCriteria& filter);

//-------------------------- destination name clashes --------------------------
enum class CollisionPolicy
{
    skip,
    overwrite,
    rename,
};

std::wstring getCollisionPolicyLabel(CollisionPolicy policy);
std::optional<CollisionPolicy> parseCollisionPolicy(std::string_view name); //"skip", "overwrite", "rename"

//-------------------------- one transfer job --------------------------
const int DEFAULT_MAX_RETRIES = 3;
constexpr std::chrono::seconds DEFAULT_RETRY_DELAY(5);
const int DEFAULT_FAILURE_THRESHOLD = 3;


struct TransferJobConfig
{
    ServerConfig source; //incl. archive settings
    ServerConfig destination;

    FilterCriteria filter = FilterAll();
    CollisionPolicy collisionPolicy = CollisionPolicy::rename;

    int maxRetries = DEFAULT_MAX_RETRIES;
    std::chrono::seconds retryDelay = DEFAULT_RETRY_DELAY;

    int failureThreshold = DEFAULT_FAILURE_THRESHOLD; //for the notifier only

    std::string logFolderPath; //empty: don't write log file

    bool operator==(const TransferJobConfig&) const = default;
};

//the backup switch: archive only if enabled *and* a backup folder is set
bool isArchivingActive(const ServerConfig& sourceCfg);
}

#endif //STRUCTURES_H_3390127745816209534
