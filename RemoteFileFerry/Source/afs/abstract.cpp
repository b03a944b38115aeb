// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "abstract.h"
#include "ftp_common.h"
#include <ferry/open_ssl.h>

using namespace ferry;
using namespace rff;


int rff::getEffectivePort(const ServerConfig& cfg)
{
    if (cfg.portCfg > 0)
        return cfg.portCfg;

    switch (cfg.protocol)
    {
        case Protocol::ftp:
        case Protocol::ftpsExplicit:
            return DEFAULT_PORT_FTP;
        case Protocol::ftpsImplicit:
            return DEFAULT_PORT_FTPS_IMPLICIT;
        case Protocol::sftp:
            return DEFAULT_PORT_SFTP;
    }
    assert(false);
    return DEFAULT_PORT_FTP;
}


std::string rff::getProtocolPrefix(Protocol protocol)
{
    switch (protocol)
    {
        case Protocol::ftp:
        case Protocol::ftpsExplicit: //"ftp://...|ssl"
            return "ftp";
        case Protocol::ftpsImplicit:
            return "ftps";
        case Protocol::sftp:
            return "sftp";
    }
    assert(false);
    return "ftp";
}


std::string rff::getItemName(const std::string& itemPath)
{
    return afterLast(itemPath, '/', IfNotFoundReturn::all);
}


std::optional<std::string> rff::getParentPath(const std::string& itemPath)
{
    const std::string path = sanitizeRemotePath(itemPath);
    if (path == "/")
        return {};

    const std::string parentPath = beforeLast(path, '/', IfNotFoundReturn::none);
    return parentPath.empty() ? "/" : parentPath;
}


std::string rff::appendRemotePath(const std::string& dirPath, const std::string& itemName)
{
    const std::string path = sanitizeRemotePath(dirPath);
    return path == "/" ? '/' + itemName : path + '/' + itemName;
}


std::string rff::sanitizeRemotePath(std::string path)
{
    trim(path);
    replace(path, '\\', '/');

    std::string output = "/";
    split(path, '/', [&](std::string_view comp)
    {
        if (!comp.empty() && comp != ".")
        {
            if (!endsWith(output, '/'))
                output += '/';
            output += comp;
        }
    });
    return output;
}


std::wstring rff::generateDisplayPath(const ServerConfig& cfg, const std::string& itemPath)
{
    std::string displayPath = getProtocolPrefix(cfg.protocol) + "://";

    if (!cfg.username.empty()) //show username!
        displayPath += encodeFtpUsername(cfg.username) + '@';

    displayPath += cfg.host + ':' + numberTo<std::string>(getEffectivePort(cfg));
    displayPath += sanitizeRemotePath(itemPath);

    return utfTo<std::wstring>(displayPath);
}


FileCopyResult rff::copyFileAsStream(ServerConnection& sourceConn, const std::string& sourcePath, //throw RemoteIOError, ConnectionError, X
                                     ServerConnection& targetConn, const std::string& targetPath,
                                     const IoCallback& notifyUnbufferedIO /*throw X*/)
{
    int64_t totalBytesNotified = 0;
    IOCallbackDivider notifyIoDiv(notifyUnbufferedIO, totalBytesNotified);

    int64_t totalBytesRead    = 0;
    int64_t totalBytesWritten = 0;
    IoCallback /*[!] not auto!*/ notifyUnbufferedRead  = [&](int64_t bytesDelta) { totalBytesRead    += bytesDelta; notifyIoDiv(bytesDelta); };
    IoCallback                   notifyUnbufferedWrite = [&](int64_t bytesDelta) { totalBytesWritten += bytesDelta; notifyIoDiv(bytesDelta); };
    //--------------------------------------------------------------------------------------------------------

    std::unique_ptr<InputStream> streamIn = sourceConn.openRead(sourcePath); //throw RemoteIOError, ConnectionError

    //already existing: overwrite
    std::unique_ptr<OutputStream> streamOut = targetConn.openWrite(targetPath); //throw RemoteIOError, ConnectionError

    unbufferedStreamCopy([&](void* buffer, size_t bytesToRead)
    {
        return streamIn->tryRead(buffer, bytesToRead, notifyUnbufferedRead); //throw RemoteIOError, ConnectionError, X
    },
    streamIn->getBlockSize(),

    [&](const void* buffer, size_t bytesToWrite)
    {
        return streamOut->tryWrite(buffer, bytesToWrite, notifyUnbufferedWrite); //throw RemoteIOError, ConnectionError, X
    },
    streamOut->getBlockSize()); //throw RemoteIOError, ConnectionError, X

    streamOut->finalize(notifyUnbufferedWrite); //throw RemoteIOError, ConnectionError, X

    FERRY_ON_SCOPE_FAIL(try { targetConn.removeFile(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); }); //after finalize(): not guarded by ~OutputStream() anymore!

    //catch I/O bugs + read/write conflicts:
    if (totalBytesWritten != totalBytesRead)
        throw RemoteIOError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetConn.getDisplayPath(targetPath))),
                            _("Unexpected size of data stream:") + L' ' + numberTo<std::wstring>(totalBytesWritten) + L'\n' +
                            _("Expected:") + L' ' + numberTo<std::wstring>(totalBytesRead));

    return {.fileSize = static_cast<uint64_t>(totalBytesRead)};
}


FileCopyResult rff::copyFileTransactional(ServerConnection& sourceConn, const std::string& sourcePath, //throw RemoteIOError, ConnectionError, X
                                          ServerConnection& targetConn, const std::string& targetPath,
                                          const std::function<void()>& onDeleteTargetFile /*throw X*/,
                                          const IoCallback& notifyUnbufferedIO /*throw X*/)
{
    if (!onDeleteTargetFile)
        return copyFileAsStream(sourceConn, sourcePath, targetConn, targetPath, notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, X

    const std::optional<std::string> parentPath = getParentPath(targetPath);
    if (!parentPath)
        throw RemoteIOError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetConn.getDisplayPath(targetPath))), L"Path is server root.");

    //- (hopefully) unique name: don't clash with a remnant temp file of an earlier run
    //- no '~': some FTP servers *silently* replace it with '_'
    std::string shortGuid;
    try
    {
        shortGuid = formatAsHexString(generateRandomBytes(2)); //throw SysError
    }
    catch (const SysError& e) { throw RemoteIOError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetConn.getDisplayPath(targetPath))), e.toString()); }

    const std::string targetPathTmp = appendRemotePath(*parentPath, beforeLast(getItemName(targetPath), '.', IfNotFoundReturn::all) + '-' +
                                                       shortGuid + std::string(TEMP_FILE_ENDING));

    const FileCopyResult result = copyFileAsStream(sourceConn, sourcePath, targetConn, targetPathTmp, notifyUnbufferedIO); //throw RemoteIOError, ConnectionError, X

    //not needed before copyFileAsStream() which cleans up after itself
    FERRY_ON_SCOPE_FAIL(try { targetConn.removeFile(targetPathTmp); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //source fully read and upload complete => only now give up the old target
    onDeleteTargetFile(); //throw X

    //target gone: RNTO/SSH_FXP_RENAME need not overwrite
    targetConn.rename(targetPathTmp, targetPath); //throw RemoteIOError, ErrorMoveUnsupported, ConnectionError

    return result;
}
