// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ARCHIVE_H_2093746158830271946
#define ARCHIVE_H_2093746158830271946

#include "structures.h"


namespace rff
{
DEFINE_NEW_FILE_ERROR(ArchiveError)

enum class ArchiveResult
{
    disabled, //nothing to do
    moved,    //server-side rename
    copied,   //copy + verify + delete: server without native move support
};

/*  move a transferred source file into the backup folder on the same server:
    - first choice: server-side rename
    - fallback:     copy, verify copy (SHA-256), *then* delete source => source stays in place unless the copy is verified

    archivedName: the item name as written to the destination (may have been renamed)
    ConnectionError passes through unwrapped                                                   */
ArchiveResult archiveFile(ServerConnection& sourceConn, const std::string& sourcePath, //throw ArchiveError, ConnectionError, X
                          const std::string& backupDir, bool enabled,
                          const std::string& archivedName,
                          const ferry::IoCallback& notifyUnbufferedIO /*throw X*/);
}

#endif //ARCHIVE_H_2093746158830271946
