// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "archive.h"
#include <ferry/open_ssl.h>

using namespace ferry;
using namespace rff;


namespace
{
std::string readStreamDigest(ServerConnection& conn, const std::string& filePath, const IoCallback& notifyUnbufferedIO) //throw RemoteIOError, ConnectionError, SysError, X
{
    std::unique_ptr<InputStream> streamIn = conn.openRead(filePath); //throw RemoteIOError, ConnectionError

    Sha256Hasher hasher; //throw SysError
    std::vector<std::byte> buf(streamIn->getBlockSize());
    for (;;)
    {
        const size_t bytesRead = streamIn->tryRead(buf.data(), buf.size(), notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, X
        if (bytesRead == 0) //end of file
            break;
        hasher.update(buf.data(), bytesRead); //throw SysError
    }
    return hasher.finalize(); //throw SysError
}


//copy within the same server while hashing the bytes read from the source
std::string copyAndHash(ServerConnection& conn, const std::string& sourcePath, const std::string& targetPath, const IoCallback& notifyUnbufferedIO) //throw RemoteIOError, ConnectionError, SysError, X
{
    std::unique_ptr<InputStream>  streamIn  = conn.openRead (sourcePath); //throw RemoteIOError, ConnectionError
    std::unique_ptr<OutputStream> streamOut = conn.openWrite(targetPath); //throw RemoteIOError, ConnectionError

    Sha256Hasher hasher; //throw SysError

    unbufferedStreamCopy([&](void* buffer, size_t bytesToRead)
    {
        const size_t bytesRead = streamIn->tryRead(buffer, bytesToRead, notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, X
        hasher.update(buffer, bytesRead); //throw SysError
        return bytesRead;
    },
    streamIn->getBlockSize(),

    [&](const void* buffer, size_t bytesToWrite)
    {
        return streamOut->tryWrite(buffer, bytesToWrite, nullptr); //throw RemoteIOError, ConnectionError
    },
    streamOut->getBlockSize()); //throw RemoteIOError, ConnectionError, SysError, X

    streamOut->finalize(nullptr); //throw RemoteIOError, ConnectionError

    return hasher.finalize(); //throw SysError
}
}


ArchiveResult rff::archiveFile(ServerConnection& sourceConn, const std::string& sourcePath, //throw ArchiveError, ConnectionError, X
                               const std::string& backupDir, bool enabled,
                               const std::string& archivedName,
                               const IoCallback& notifyUnbufferedIO /*throw X*/)
{
    if (!enabled)
        return ArchiveResult::disabled;

    if (trimCpy(backupDir).empty() || archivedName.empty())
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const std::string backupPath = appendRemotePath(backupDir, archivedName);

    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                        L"%x", L'\n' + fmtPath(sourceConn.getDisplayPath(sourcePath))),
                                             L"%y", L'\n' + fmtPath(sourceConn.getDisplayPath(backupPath)));
    try
    {
        try
        {
            sourceConn.rename(sourcePath, backupPath); //throw RemoteIOError, ErrorMoveUnsupported, ConnectionError
            return ArchiveResult::moved;
        }
        catch (ErrorMoveUnsupported&) {}

        //server without native move: read, verify, *then* delete
        std::string digestSource;
        try
        {
            digestSource = copyAndHash(sourceConn, sourcePath, backupPath, notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, SysError, X
        }
        catch (const SysError& e) { throw RemoteIOError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(sourceConn.getDisplayPath(backupPath))), e.toString()); }
        //~OutputStream() removed the partial copy on failure before finalize()

        //after finalize(): remove a copy we can't vouch for
        FERRY_ON_SCOPE_FAIL(try { sourceConn.removeFile(backupPath); }
        catch (const FileError& e) { logExtraError(e.toString()); });

        std::string digestBackup;
        try
        {
            digestBackup = readStreamDigest(sourceConn, backupPath, notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, SysError, X
        }
        catch (const SysError& e) { throw RemoteIOError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(sourceConn.getDisplayPath(backupPath))), e.toString()); }

        if (digestSource != digestBackup)
            throw RemoteIOError(replaceCpy(replaceCpy(_("Data verification error: %x and %y have different content."),
                                                      L"%x", L'\n' + fmtPath(sourceConn.getDisplayPath(sourcePath))),
                                           L"%y", L'\n' + fmtPath(sourceConn.getDisplayPath(backupPath))),
                                L"SHA-256: " + utfTo<std::wstring>(formatAsHexString(digestSource)) + L" != " + utfTo<std::wstring>(formatAsHexString(digestBackup)));

        sourceConn.removeFile(sourcePath); //throw RemoteIOError, ConnectionError
        return ArchiveResult::copied;
    }
    catch (const ConnectionError&) { throw; } //not an archive problem: the whole run is affected
    catch (const FileError& e) { throw ArchiveError(errorMsg, e.toString()); }
}
