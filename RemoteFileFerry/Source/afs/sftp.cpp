// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sftp.h"
#include <array>
#include <ferry/file_io.h>
#include <ferry/socket.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!
#include "ftp_common.h"

using namespace ferry;
using namespace rff;


/*
SFTP specification version 3 (implemented by libssh2): https://filezilla-project.org/specs/draft-ietf-secsh-filexfer-02.txt

libssh2: prefer OpenSSL over WinCNG backend:

WinCNG supports the following ciphers:
    rijndael-cbc@lysator.liu.se
    aes256-cbc
    aes192-cbc
    aes128-cbc
    arcfour128
    arcfour
    3des-cbc

OpenSSL supports the same ciphers like WinCNG plus the following:
    aes256-ctr
    aes192-ctr
    aes128-ctr
    cast128-cbc
    blowfish-cbc                                                                 */

namespace
{
constexpr std::string_view sftpPrefix = "sftp:";

//permissions for new files: rw- r-- r-- [0644] => server may also apply umask
const long SFTP_DEFAULT_PERMISSION_FILE = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                          LIBSSH2_SFTP_S_IRGRP |
                                          LIBSSH2_SFTP_S_IROTH;

//attention: if operation fails due to time out, e.g. file copy, the cleanup code may hang, too => total delay = 2 x time out interval

const size_t SFTP_OPTIMAL_BLOCK_SIZE_READ  = 8 * MAX_SFTP_READ_SIZE;     //https://github.com/libssh2/libssh2/issues/90
const size_t SFTP_OPTIMAL_BLOCK_SIZE_WRITE = 8 * MAX_SFTP_OUTGOING_SIZE; //need large buffer to mitigate libssh2 stupidly waiting on "acks": https://www.libssh2.org/libssh2_sftp_write.html
static_assert(MAX_SFTP_READ_SIZE == 30000 && MAX_SFTP_OUTGOING_SIZE == 30000, "reevaluate optimal block sizes if these constants change!");


//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public SysError
{
    SysErrorSftpProtocol(const std::wstring& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};

//SSH transport is gone: socket closed or reset, channel closed
DEFINE_NEW_SYS_ERROR(SysErrorConnection)


bool isConnectionFailure(int sshStatusCode)
{
    switch (sshStatusCode)
    {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
            return true;
        default:
            return false;
    }
}


class SshSession
{
public:
    explicit SshSession(const ServerConfig& cfg) : //throw SysError
        cfg_(cfg)
    {
        FERRY_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        if (trimCpy(cfg_.host).empty())
            throw SysError(_("Server name must not be empty."));

        socket_.emplace(cfg_.host, numberTo<std::string>(getEffectivePort(cfg_)), cfg_.timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);

        //every blocking libssh2 call from here on is bounded by the timeout: => LIBSSH2_ERROR_TIMEOUT
        ::libssh2_session_set_timeout(sshSession_, cfg_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        //host key is not evaluated: libssh2_hostkey_hash(sshSession_, LIBSSH2_HOSTKEY_HASH_SHA256)

        const char* authList = ::libssh2_userauth_list(sshSession_, cfg_.username);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            //else: SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }
        else
        {
            bool supportAuthPassword = false;
            bool supportAuthKeyfile  = false;
            split(std::string_view(authList), ',', [&](std::string_view authMethod)
            {
                authMethod = trimCpy(authMethod);
                if (authMethod == "password")
                    supportAuthPassword = true;
                else if (authMethod == "publickey")
                    supportAuthKeyfile = true;
            });

            if (cfg_.privateKeyFilePath.empty())
            {
                if (!supportAuthPassword)
                    throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"username/password\"") +
                                   L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(authList));

                if (::libssh2_userauth_password(sshSession_, cfg_.username, cfg_.password) != 0)
                    throw SysError(formatLastSshError("libssh2_userauth_password"));
            }
            else
            {
                if (!supportAuthKeyfile)
                    throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"key file\"") +
                                   L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(authList));

                std::string pkStream;
                try
                {
                    pkStream = getFileContent(cfg_.privateKeyFilePath); //throw FileError
                    trim(pkStream);
                }
                catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), L"\n\n", L"\n")); } //errors should be further enriched by context info => SysError

                if (::libssh2_userauth_publickey_frommemory(sshSession_, cfg_.username, pkStream, cfg_.keyPassphrase) != 0)
                {
                    //"Unable to extract public key from private key" isn't exactly *helpful* => detect public keys given by mistake:
                    const std::string_view firstLine = beforeFirst(std::string_view(pkStream), '\n', IfNotFoundReturn::all);
                    if (contains(firstLine, "PUBLIC KEY") ||
                        startsWith(pkStream, "ssh-") || //ssh-rsa, ssh-dss, ssh-ed25519
                        startsWith(pkStream, "ecdsa-"))
                        throw SysError(_("Authentication failed.") + L' ' +
                                       replaceCpy<std::wstring>(L"%x is not an OpenSSH private key file.", L"%x", fmtPath(cfg_.privateKeyFilePath)));

                    throw SysError(formatLastSshError("libssh2_userauth_publickey_frommemory"));
                }
            }
        }

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(formatLastSshError("libssh2_sftp_init"));
    }

    ~SshSession() { cleanup(); }

    struct Details
    {
        LIBSSH2_SESSION* sshSession;
        LIBSSH2_SFTP*   sftpChannel;
    };

    //a timed-out or broken session must not be used any longer
    bool isHealthy() const { return !possiblyCorrupted_; }

    void executeBlocking(const char* functionName, const std::function<int(const Details& sd)>& sftpCommand /*noexcept!*/) //throw SysError, SysErrorConnection, SysErrorSftpProtocol
    {
        int rc = sftpCommand({sshSession_, sftpChannel_}); //noexcept

        if (rc < 0 && ::libssh2_session_last_errno(sshSession_) != rc) //when libssh2 fails to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        if (rc >= LIBSSH2_ERROR_NONE)
            return;

        //libssh2 source: LIBSSH2_ERROR_SFTP_PROTOCOL *without* setting LIBSSH2_SFTP::last_errno indicates a corrupted connection!
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
            throw SysErrorSftpProtocol(formatLastSshError(functionName), ::libssh2_sftp_last_error(sftpChannel_)); //[!] NOT an SSH error => the SSH session is just fine!

        possiblyCorrupted_ = true;

        if (isConnectionFailure(rc))
            throw SysErrorConnection(formatLastSshError(functionName));
        throw SysError(formatLastSshError(functionName)); //e.g. LIBSSH2_ERROR_TIMEOUT
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void cleanup() //attention: may block heavily after error!
    {
        if (sftpChannel_)
            if (const int rc = ::libssh2_sftp_shutdown(sftpChannel_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_sftp_shutdown", formatSshStatusCode(rc), L""));

        if (sshSession_)
        {
            if (!possiblyCorrupted_) //else: avoid further stress on the broken SSH session and take French leave
                if (const int rc = ::libssh2_session_disconnect(sshSession_, "RemoteFileFerry says \"bye\"!"); //= server notification only! no local cleanup apparently
                    rc != LIBSSH2_ERROR_NONE)
                    logExtraError(formatSystemError("libssh2_session_disconnect", formatSshStatusCode(rc), L""));

            if (const int rc = ::libssh2_session_free(sshSession_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_session_free", formatSshStatusCode(rc), L""));
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(lastErrorMsg));

        //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
        //But if it's not, we have a broken connection, and lastErrorMsg contains meaningful details!
        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_ && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
        {
            if (errorMsg == L"SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel_)), errorMsg);
        }

        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const ServerConfig cfg_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
    bool possiblyCorrupted_ = false;
};


template <class Function> inline
void runSftpCommand(SshSession& session, const char* functionName, const std::wstring& errorMsg, Function sftpCommand /*noexcept!*/) //throw RemoteIOError, ConnectionError
{
    try
    {
        session.executeBlocking(functionName, sftpCommand); //throw SysError, SysErrorConnection, SysErrorSftpProtocol
    }
    catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
    catch (const SysError&           e) { throw RemoteIOError  (errorMsg, e.toString()); }
}

//===========================================================================================================================

struct InputStreamSftp : public InputStream
{
    InputStreamSftp(const std::shared_ptr<SshSession>& session, const std::string& filePath, const std::wstring& displayPath) : //throw RemoteIOError, ConnectionError
        displayPath_(displayPath),
        session_(session)
    {
        runSftpCommand(*session_, "libssh2_sftp_open", replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
                       [&](const SshSession::Details& sd) //noexcept!
        {
            fileHandle_ = ::libssh2_sftp_open(sd.sftpChannel, filePath, LIBSSH2_FXF_READ, 0);
            if (!fileHandle_)
                return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
            return LIBSSH2_ERROR_NONE;
        });
    }

    ~InputStreamSftp()
    {
        try
        {
            runSftpCommand(*session_, "libssh2_sftp_close", replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_close(fileHandle_); }); //noexcept!
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
    }

    size_t getBlockSize() override { return SFTP_OPTIMAL_BLOCK_SIZE_READ; } //non-zero block size is a contract!

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X
    {
        //libssh2_sftp_read has same semantics as Posix read:
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        ssize_t bytesRead = 0;
        runSftpCommand(*session_, "libssh2_sftp_read", replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
                       [&](const SshSession::Details& sd) //noexcept!
        {
            bytesRead = ::libssh2_sftp_read(fileHandle_, static_cast<char*>(buffer), bytesToRead);
            return static_cast<int>(bytesRead);
        });

        if (static_cast<size_t>(bytesRead) > bytesToRead) //better safe than sorry (user should never see this)
            throw RemoteIOError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(displayPath_)), formatSystemError("libssh2_sftp_read", L"", L"Buffer overflow."));

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        return bytesRead; //"zero indicates end of file"
    }

private:
    const std::wstring displayPath_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
    const std::shared_ptr<SshSession> session_;
};

//===========================================================================================================================

struct OutputStreamSftp : public OutputStream
{
    OutputStreamSftp(const std::shared_ptr<SshSession>& session, const std::string& filePath, const std::wstring& displayPath) : //throw RemoteIOError, ConnectionError
        filePath_(filePath),
        displayPath_(displayPath),
        session_(session)
    {
        //already existing: overwrite
        runSftpCommand(*session_, "libssh2_sftp_open", replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
                       [&](const SshSession::Details& sd) //noexcept!
        {
            fileHandle_ = ::libssh2_sftp_open(sd.sftpChannel, filePath_,
                                              LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                              SFTP_DEFAULT_PERMISSION_FILE);
            if (!fileHandle_)
                return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
            return LIBSSH2_ERROR_NONE;
        });
    }

    ~OutputStreamSftp()
    {
        if (fileHandle_) //=> cleanup non-finalized output file
        {
            if (!closeFailed_) //otherwise there's no much point in calling libssh2_sftp_close() a second time => let it leak!?
                try { close(); /*throw RemoteIOError, ConnectionError*/ }
                catch (const FileError& e) { logExtraError(e.toString()); }

            if (session_->isHealthy())
                try
                {
                    runSftpCommand(*session_, "libssh2_sftp_unlink", replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
                    [&](const SshSession::Details& sd) { return ::libssh2_sftp_unlink(sd.sftpChannel, filePath_); }); //noexcept!
                }
                catch (const FileError& e) { logExtraError(e.toString()); }
            else
                logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(displayPath_)) + L"\n\n" + _("Connection lost."));
        }
    }

    size_t getBlockSize() override { return SFTP_OPTIMAL_BLOCK_SIZE_WRITE; }

    size_t tryWrite(const void* buffer, size_t bytesToWrite, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X; may return short! CONTRACT: bytesToWrite > 0
    {
        if (bytesToWrite == 0 || !fileHandle_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        ssize_t bytesWritten = 0;
        runSftpCommand(*session_, "libssh2_sftp_write", replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
                       [&](const SshSession::Details& sd) //noexcept!
        {
            bytesWritten = ::libssh2_sftp_write(fileHandle_, static_cast<const char*>(buffer), bytesToWrite);
            return static_cast<int>(bytesWritten);
        });

        if (static_cast<size_t>(bytesWritten) > bytesToWrite) //better safe than sorry
            throw RemoteIOError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(displayPath_)), formatSystemError("libssh2_sftp_write", L"", L"Buffer overflow."));

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesWritten); //throw X!
        return bytesWritten;
    }

    void finalize(const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X
    {
        close(); //throw RemoteIOError, ConnectionError
        //output finalized => no more exceptions from here on!
    }

private:
    void close() //throw RemoteIOError, ConnectionError
    {
        if (!fileHandle_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
        try
        {
            runSftpCommand(*session_, "libssh2_sftp_close", replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(displayPath_)), //throw RemoteIOError, ConnectionError
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_close(fileHandle_); }); //noexcept!

            fileHandle_ = nullptr;
        }
        catch (FileError&)
        {
            closeFailed_ = true;
            throw;
        }
    }

    const std::string filePath_;
    const std::wstring displayPath_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
    bool closeFailed_ = false;
    const std::shared_ptr<SshSession> session_;
};

//===========================================================================================================================

class SftpConnection : public ServerConnection
{
public:
    explicit SftpConnection(const ServerConfig& cfg) : ServerConnection(cfg) {}

    void connect() override //throw ConnectionError
    {
        if (!session_)
            session_ = createSession(); //throw ConnectionError
    }

    void close() override { session_.reset(); } //open streams keep the SSH session alive until done

    bool isConnected() const override { return static_cast<bool>(session_); }

    std::vector<FileEntry> list(const std::string& dirPath) override //throw RemoteIOError, ConnectionError
    {
        const std::string folderPath = sanitizeRemotePath(dirPath);
        SshSession& session = getSession(); //throw ConnectionError

        LIBSSH2_SFTP_HANDLE* dirHandle = nullptr;
        runSftpCommand(session, "libssh2_sftp_opendir", replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(getDisplayPath(folderPath))), //throw RemoteIOError, ConnectionError
                       [&](const SshSession::Details& sd) //noexcept!
        {
            dirHandle = ::libssh2_sftp_opendir(sd.sftpChannel, folderPath);
            if (!dirHandle)
                return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
            return LIBSSH2_ERROR_NONE;
        });

        const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(folderPath)));

        FERRY_ON_SCOPE_EXIT(try
        {
            runSftpCommand(session, "libssh2_sftp_closedir", errorMsg, //throw RemoteIOError, ConnectionError
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_closedir(dirHandle); }); //noexcept!
        }
        catch (const FileError& e) { logExtraError(e.toString()); });

        std::vector<FileEntry> output;
        for (;;)
        {
            std::array<char, 1024> buf; //libssh2 sample code uses 512; in practice NAME_MAX(255)+1 should suffice
            LIBSSH2_SFTP_ATTRIBUTES attribs = {};
            int rc = 0;
            runSftpCommand(session, "libssh2_sftp_readdir", errorMsg, //throw RemoteIOError, ConnectionError
            [&](const SshSession::Details& sd) { return rc = ::libssh2_sftp_readdir(dirHandle, buf.data(), buf.size(), &attribs); }); //noexcept!

            if (rc == 0) //no more items
                return output;

            const std::string itemName(buf.data(), rc);

            if (itemName == "." || itemName == "..") //check needed for SFTP, too!
                continue;

            const std::string itemPath = appendRemotePath(folderPath, itemName);

            if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0) //server probably does not support these attributes => fail at folder level
                throw RemoteIOError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath))), L"File attributes not available.");

            if (LIBSSH2_SFTP_S_ISLNK(attribs.permissions) ||
                LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
                continue; //regular files only

            //a file or named pipe, ect: LIBSSH2_SFTP_S_ISREG, LIBSSH2_SFTP_S_ISCHR, LIBSSH2_SFTP_S_ISBLK, LIBSSH2_SFTP_S_ISFIFO, LIBSSH2_SFTP_S_ISSOCK
            if ((attribs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) == 0)
                throw RemoteIOError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath))), L"Modification time not supported.");
            if ((attribs.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0)
                throw RemoteIOError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath))), L"File size not supported.");

            output.push_back({itemName, itemPath, attribs.filesize, static_cast<time_t>(attribs.mtime)});
        }
    }

    std::unique_ptr<InputStream> openRead(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        getSession(); //throw ConnectionError
        const std::string itemPath = sanitizeRemotePath(filePath);
        return std::make_unique<InputStreamSftp>(session_, itemPath, getDisplayPath(itemPath)); //throw RemoteIOError, ConnectionError
    }

    std::unique_ptr<OutputStream> openWrite(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        getSession(); //throw ConnectionError
        const std::string itemPath = sanitizeRemotePath(filePath);
        return std::make_unique<OutputStreamSftp>(session_, itemPath, getDisplayPath(itemPath)); //throw RemoteIOError, ConnectionError
    }

    bool exists(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        const std::string itemPath = sanitizeRemotePath(filePath);
        const std::wstring errorMsg = replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath)));

        SshSession& session = getSession(); //throw ConnectionError
        try
        {
            LIBSSH2_SFTP_ATTRIBUTES attribs = {};
            session.executeBlocking("libssh2_sftp_stat", //throw SysError, SysErrorConnection, SysErrorSftpProtocol
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_stat(sd.sftpChannel, itemPath, &attribs); }); //noexcept!
            return true;
        }
        catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
        catch (const SysErrorSftpProtocol& e)
        {
            if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE ||
                e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_PATH)
                return false;
            throw RemoteIOError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw RemoteIOError(errorMsg, e.toString()); }
    }

    //already existing: fail (OpenSSH)
    void rename(const std::string& pathFrom, const std::string& pathTo) override //throw RemoteIOError, ErrorMoveUnsupported, ConnectionError
    {
        const std::string sftpPathOld = sanitizeRemotePath(pathFrom);
        const std::string sftpPathNew = sanitizeRemotePath(pathTo);

        const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                            L"%x", L'\n' + fmtPath(getDisplayPath(sftpPathOld))),
                                                 L"%y", L'\n' + fmtPath(getDisplayPath(sftpPathNew)));
        SshSession& session = getSession(); //throw ConnectionError
        try
        {
            session.executeBlocking("libssh2_sftp_rename", //throw SysError, SysErrorConnection, SysErrorSftpProtocol
                                    [&](const SshSession::Details& sd) //noexcept!
            {
                /* LIBSSH2_SFTP_RENAME_OVERWRITE: "No overwriting rename in [SFTP] v3/v4" https://www.greenend.org.uk/rjk/sftp/sftpversions.html
                   "... the most widespread SFTP server implementation, the OpenSSH, will fail the SSH_FXP_RENAME request if the target file already exists" */
                return ::libssh2_sftp_rename(sd.sftpChannel, sftpPathOld, sftpPathNew, LIBSSH2_SFTP_RENAME_ATOMIC);
            });
        }
        catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
        catch (const SysErrorSftpProtocol& e)
        {
            if (e.sftpErrorCode == LIBSSH2_FX_OP_UNSUPPORTED)
                throw ErrorMoveUnsupported(errorMsg, e.toString());
            throw RemoteIOError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw RemoteIOError(errorMsg, e.toString()); } //libssh2_sftp_rename_ex reports generic LIBSSH2_FX_FAILURE if target is already existing!
    }

    void removeFile(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        const std::string itemPath = sanitizeRemotePath(filePath);

        runSftpCommand(getSession(), "libssh2_sftp_unlink", replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(itemPath))), //throw RemoteIOError, ConnectionError
        [&](const SshSession::Details& sd) { return ::libssh2_sftp_unlink(sd.sftpChannel, itemPath); }); //noexcept!
    }

    std::wstring getDisplayPath(const std::string& itemPath) const override { return generateDisplayPath(getConfig(), itemPath); }

private:
    std::shared_ptr<SshSession> createSession() const //throw ConnectionError
    {
        try
        {
            return std::make_shared<SshSession>(getConfig()); //throw SysError
        }
        catch (const SysError& e) //*any* failure while connecting is fatal
        {
            throw ConnectionError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayPath("/"))), e.toString());
        }
    }

    //replace a session that timed out or lost its transport; failure to reconnect is a connection error
    SshSession& getSession() //throw ConnectionError
    {
        if (!session_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! SFTP connection not established.");

        if (!session_->isHealthy())
            session_ = createSession(); //throw ConnectionError
        return *session_;
    }

    std::shared_ptr<SshSession> session_;
};
}


bool rff::acceptsPathPhraseSftp(const std::string& pathPhrase) //noexcept
{
    return startsWithAsciiNoCase(trimCpy(pathPhrase), sftpPrefix); //check for explicit SFTP path
}


ServerConfig rff::parsePathPhraseSftp(const std::string& pathPhrase) //throw FileError
{
    const std::wstring errorMsg = _("Invalid SFTP server path.");

    std::string_view phrase = pathPhrase;
    phrase = trimCpy(phrase);

    if (!startsWithAsciiNoCase(phrase, sftpPrefix))
        throw FileError(errorMsg, replaceCpy<std::wstring>(L"Expected prefix: %x", L"%x", L"sftp://"));
    phrase.remove_prefix(sftpPrefix.size());

    while (startsWith(phrase, '/') || startsWith(phrase, '\\'))
        phrase.remove_prefix(1);

    const std::string_view fullPathOpt = beforeFirst(phrase, '|', IfNotFoundReturn::all);
    const std::string_view options     =  afterFirst(phrase, '|', IfNotFoundReturn::none);

    const std::string_view credentials = beforeLast(fullPathOpt, '@', IfNotFoundReturn::none);
    const std::string_view fullPath    =  afterLast(fullPathOpt, '@', IfNotFoundReturn::all);

    ServerConfig cfg;
    cfg.protocol = Protocol::sftp;
    cfg.username = decodeFtpUsername(std::string(beforeFirst(credentials, ':', IfNotFoundReturn::all))); //support standard FTP syntax, even though
    cfg.password = decodeFtpUsername(std::string( afterFirst(credentials, ':', IfNotFoundReturn::none))); //concatenateSftpPathPhrase() uses "pass64" instead

    auto it = std::find_if(fullPath.begin(), fullPath.end(), [](char c) { return c == '/' || c == '\\'; });
    const std::string_view serverPort = fullPath.substr(0, it - fullPath.begin());
    cfg.directory = sanitizeRemotePath(std::string(it, fullPath.end()));

    cfg.host = trimCpy(std::string(beforeLast(serverPort, ':', IfNotFoundReturn::all)));
    const std::string_view port   =                 afterLast(serverPort, ':', IfNotFoundReturn::none);

    if (cfg.host.empty())
        throw FileError(errorMsg, _("Server name must not be empty."));

    if (!port.empty())
    {
        if (!std::all_of(port.begin(), port.end(), &isDigit<char>) || stringTo<int>(port) < 1 || stringTo<int>(port) > 65535)
            throw FileError(errorMsg, _("Invalid port number:") + L' ' + utfTo<std::wstring>(port));
        cfg.portCfg = stringTo<int>(port);
    }

    split(options, '|', [&](std::string_view optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (!optPhrase.empty())
        {
            const std::string_view optValue = afterFirst(optPhrase, '=', IfNotFoundReturn::none);
            try
            {
                if (startsWith(optPhrase, "timeout="))
                {
                    cfg.timeoutSec = stringTo<int>(optValue);
                    if (cfg.timeoutSec <= 0)
                        throw FileError(errorMsg, _("Invalid timeout:") + L' ' + utfTo<std::wstring>(optPhrase));
                }
                else if (startsWith(optPhrase, "keyfile="))
                    cfg.privateKeyFilePath = std::string(optValue);
                else if (startsWith(optPhrase, "keypass64="))
                    cfg.keyPassphrase = decodePasswordBase64(optValue); //throw SysError
                else if (startsWith(optPhrase, "pass64="))
                    cfg.password = decodePasswordBase64(optValue); //throw SysError
                else
                    throw FileError(errorMsg, _("Unknown option:") + L' ' + utfTo<std::wstring>(optPhrase));
            }
            catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
        }
    });
    return cfg;
}


std::string rff::concatenateSftpPathPhrase(const ServerConfig& cfg) //noexcept
{
    std::string username;
    if (!cfg.username.empty())
        username = encodeFtpUsername(cfg.username) + '@';

    std::string port;
    if (cfg.portCfg > 0)
        port = ':' + numberTo<std::string>(cfg.portCfg);

    std::string relPath = sanitizeRemotePath(cfg.directory);
    if (relPath == "/")
        relPath.clear();

    std::string options;
    if (cfg.timeoutSec != ServerConfig().timeoutSec)
        options += "|timeout=" + numberTo<std::string>(cfg.timeoutSec);

    if (!cfg.privateKeyFilePath.empty())
    {
        options += "|keyfile=" + cfg.privateKeyFilePath;
        if (!cfg.keyPassphrase.empty())
            options += "|keypass64=" + encodePasswordBase64(cfg.keyPassphrase);
    }

    if (!cfg.password.empty()) //password always last => visually truncated by folder input field
        options += "|pass64=" + encodePasswordBase64(cfg.password);

    return std::string(sftpPrefix) + "//" + username + cfg.host + port + relPath + options;
}


std::unique_ptr<ServerConnection> rff::createSftpConnection(const ServerConfig& cfg)
{
    return std::make_unique<SftpConnection>(cfg);
}
