// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "collision.h"
#include <ferry/time.h>

using namespace ferry;
using namespace rff;


namespace
{
const int MAX_RENAME_ATTEMPTS = 1000;
}


std::string rff::formatRenameTimeStamp(time_t utcTime)
{
    const TimeComp tc = getLocalTime(utcTime); //returns TimeComp() on error
    if (tc == TimeComp())
        return std::string();

    return formatTime("%Y%m%d-%H%M%S", tc); //returns empty string on error
}


std::string rff::generateRenamedItemName(const std::string& itemName, const std::string& timeStamp, int index)
{
    //".profile" and "file" have no extension: append
    const size_t dotPos = itemName.rfind('.');
    const bool haveExtension = dotPos != std::string::npos && dotPos != 0;

    const std::string baseName  = haveExtension ? itemName.substr(0, dotPos) : itemName;
    const std::string extension = haveExtension ? itemName.substr(dotPos) : std::string(); //including '.'

    std::string renamedName = baseName + '_' + timeStamp;
    if (index > 0)
        renamedName += '_' + numberTo<std::string>(index);
    return renamedName + extension;
}


EffectiveAction CollisionResolver::resolve(ServerConnection& destConn, const std::string& targetPath, CollisionPolicy policy) //throw RemoteIOError, ConnectionError, FileError
{
    //a path renamed to earlier during this run counts as existing, even if the upload failed
    if (!reservedPaths_.contains(targetPath) &&
        !destConn.exists(targetPath)) //throw RemoteIOError, ConnectionError
        return {.type = EffectiveAction::Type::proceed, .targetPath = targetPath};

    switch (policy)
    {
        case CollisionPolicy::skip:
            return {.type = EffectiveAction::Type::skip};

        case CollisionPolicy::overwrite:
            return {.type = EffectiveAction::Type::proceed, .targetPath = targetPath, .replacesExisting = true};

        case CollisionPolicy::rename:
        {
            const time_t now = getCurrentTime_();
            const std::string timeStamp = formatRenameTimeStamp(now);
            if (timeStamp.size() != 15) //YYYYmmdd-HHMMSS
                throw FileError(replaceCpy(_("Cannot find a free name for %x."), L"%x", fmtPath(destConn.getDisplayPath(targetPath))),
                                _("Failed to generate time stamp:") + L' ' + numberTo<std::wstring>(now));

            const std::optional<std::string> parentPath = getParentPath(targetPath);
            if (!parentPath)
                throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
            const std::string itemName = getItemName(targetPath);

            for (int i = 0; i < MAX_RENAME_ATTEMPTS; ++i)
            {
                const std::string renamedPath = appendRemotePath(*parentPath, generateRenamedItemName(itemName, timeStamp, i));

                if (!reservedPaths_.contains(renamedPath) &&
                    !destConn.exists(renamedPath)) //throw RemoteIOError, ConnectionError
                {
                    reservedPaths_.insert(renamedPath);
                    return {.type = EffectiveAction::Type::proceed, .targetPath = renamedPath, .renamed = true};
                }
            }
            throw FileError(replaceCpy(_("Cannot find a free name for %x."), L"%x", fmtPath(destConn.getDisplayPath(targetPath))),
                            replaceCpy(_("All %x candidate names are in use."), L"%x", numberTo<std::wstring>(MAX_RENAME_ATTEMPTS)));
        }
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
