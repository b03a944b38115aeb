// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef COLLISION_H_1847302956618420937
#define COLLISION_H_1847302956618420937

#include <functional>
#include <set>
#include "structures.h"


namespace rff
{
struct EffectiveAction
{
    enum class Type
    {
        proceed,
        skip,
    };
    Type type = Type::proceed;
    std::string targetPath; //proceed only: final destination path
    bool renamed = false;   //targetPath differs from the requested path
    bool replacesExisting = false; //overwrite: targetPath exists and must survive a failed upload

    bool operator==(const EffectiveAction&) const = default;
};


//one instance per run: renamed paths already handed out are never handed out twice
class CollisionResolver
{
public:
    explicit CollisionResolver(const std::function<time_t()>& getCurrentTime = [] { return std::time(nullptr); }) :
        getCurrentTime_(getCurrentTime) {}

    EffectiveAction resolve(ServerConnection& destConn, const std::string& targetPath, CollisionPolicy policy); //throw RemoteIOError, ConnectionError, FileError

private:
    CollisionResolver           (const CollisionResolver&) = delete;
    CollisionResolver& operator=(const CollisionResolver&) = delete;

    const std::function<time_t()> getCurrentTime_;
    std::set<std::string> reservedPaths_;
};


//"report.csv" => "report_20230102-153000.csv"; "report" => "report_20230102-153000"
std::string generateRenamedItemName(const std::string& itemName, const std::string& timeStamp, int index /*0: no suffix*/);
std::string formatRenameTimeStamp(time_t utcTime); //local time: YYYYmmdd-HHMMSS
}

#endif //COLLISION_H_1847302956618420937
