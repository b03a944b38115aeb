// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ABSTRACT_H_4418290573364101827
#define ABSTRACT_H_4418290573364101827

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <ferry/file_error.h>
#include <ferry/serialize.h> //IoCallback


namespace rff
{
//fatal for the side it occurs on: host unreachable, login rejected, TLS handshake failure
DEFINE_NEW_FILE_ERROR(ConnectionError)

//scoped to a single list/read/write/rename call => the caller decides whether to retry
DEFINE_NEW_FILE_ERROR(RemoteIOError)

struct ErrorMoveUnsupported : public RemoteIOError
{
    ErrorMoveUnsupported(const std::wstring& msg) : RemoteIOError(msg) {}
    ErrorMoveUnsupported(const std::wstring& msg, const std::wstring& descr) : RemoteIOError(msg, descr) {}
};

//----------------------------------------------------------------------------------------------------------------

enum class Protocol
{
    ftp,
    ftpsExplicit, //AUTH TLS after connect
    ftpsImplicit, //TLS from the first byte
    sftp,
};

const int DEFAULT_PORT_FTP           = 21; //also used by explicit FTPS
const int DEFAULT_PORT_FTPS_IMPLICIT = 990;
const int DEFAULT_PORT_SFTP          = 22;

const int DEFAULT_TIMEOUT_SEC = 30;


struct ServerConfig //immutable during a run
{
    Protocol protocol = Protocol::ftp;
    std::string host;
    int portCfg = 0; //use if > 0, protocol default otherwise
    std::string username;
    std::string password;
    std::string privateKeyFilePath; //SFTP only: key file authentication if non-empty
    std::string keyPassphrase;      //
    bool passiveMode = true;        //FTP(S) only
    std::string directory = "/";    //absolute server path
    std::string encoding = "utf-8"; //FTP(S) file name encoding, e.g. "gbk"
    int timeoutSec = DEFAULT_TIMEOUT_SEC; //per blocking call
    //source side only:
    std::string backupDir;
    bool archiveEnabled = false;

    bool operator==(const ServerConfig&) const = default;
};

int getEffectivePort(const ServerConfig& cfg);
std::string getProtocolPrefix(Protocol protocol); //"ftp", "ftps", "sftp"

//----------------------------------------------------------------------------------------------------------------

struct FileEntry //regular files only
{
    std::string name; //UTF-8
    std::string path; //absolute server path
    uint64_t fileSize = 0;
    time_t modTime = 0; //as reported by the server, no time zone conversion

    bool operator==(const FileEntry&) const = default;
};

//server paths: UTF-8, '/'-separated, leading slash
std::string getItemName(const std::string& itemPath);
std::optional<std::string> getParentPath(const std::string& itemPath);
std::string appendRemotePath(const std::string& dirPath, const std::string& itemName);
std::string sanitizeRemotePath(std::string path); //"upload/" -> "/upload"

//----------------------------------------------------------------------------------------------------------------

struct InputStream
{
    virtual ~InputStream() {}
    virtual size_t getBlockSize() = 0; //non-zero block size is a contract!
    virtual size_t tryRead(void* buffer, size_t bytesToRead, const ferry::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw RemoteIOError, ConnectionError, X
    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
};


//- call finalize() when done!
//- destroyed without successful finalize(): the partially written target is removed
struct OutputStream
{
    virtual ~OutputStream() {}
    virtual size_t getBlockSize() = 0;
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite, const ferry::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw RemoteIOError, ConnectionError, X; may return short! CONTRACT: bytesToWrite > 0
    virtual void finalize(const ferry::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw RemoteIOError, ConnectionError, X
};

//----------------------------------------------------------------------------------------------------------------

/*  one contract, one implementation per protocol: FTP/FTPS (libcurl), SFTP (libssh2)

    - connect() and close() are idempotent
    - close() is safe at any time, e.g. after a failed connect()
    - all other calls require connect() to have succeeded                          */
class ServerConnection
{
public:
    virtual ~ServerConnection() {}

    virtual void connect() = 0; //throw ConnectionError
    virtual void close() = 0;   //noexcept
    virtual bool isConnected() const = 0;

    virtual std::vector<FileEntry> list(const std::string& dirPath) = 0; //throw RemoteIOError, ConnectionError

    //return value always bound:
    virtual std::unique_ptr<InputStream>  openRead (const std::string& filePath) = 0; //throw RemoteIOError, ConnectionError
    //already existing: overwrite
    virtual std::unique_ptr<OutputStream> openWrite(const std::string& filePath) = 0; //throw RemoteIOError, ConnectionError

    virtual bool exists(const std::string& filePath) = 0; //throw RemoteIOError, ConnectionError

    //server-side move; already existing: undefined behavior! (e.g. fail/overwrite)
    virtual void rename(const std::string& pathFrom, const std::string& pathTo) = 0; //throw RemoteIOError, ErrorMoveUnsupported, ConnectionError

    virtual void removeFile(const std::string& filePath) = 0; //throw RemoteIOError, ConnectionError

    virtual std::wstring getDisplayPath(const std::string& itemPath) const = 0; //e.g. "sftp://user@host:22/dir/file.txt"

    const ServerConfig& getConfig() const { return cfg_; }

protected:
    explicit ServerConnection(const ServerConfig& cfg) : cfg_(cfg) {}

private:
    ServerConnection           (const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    const ServerConfig cfg_;
};


std::wstring generateDisplayPath(const ServerConfig& cfg, const std::string& itemPath);


struct FileCopyResult
{
    uint64_t fileSize = 0;
};

//streams source to target; removes the partial target on failure
FileCopyResult copyFileAsStream(ServerConnection& sourceConn, const std::string& sourcePath, //throw RemoteIOError, ConnectionError, X
                                ServerConnection& targetConn, const std::string& targetPath,
                                const ferry::IoCallback& notifyUnbufferedIO /*throw X*/);

//suffix of the upload while an existing target is being replaced
inline constexpr std::string_view TEMP_FILE_ENDING = ".rff_tmp";

/*  replace an existing target file: upload to "<name>-<4 hex>.rff_tmp" next to it, call onDeleteTargetFile(), then rename onto the target
    => a failed upload leaves the old target untouched
    onDeleteTargetFile not set: target does not exist => plain copyFileAsStream()          */
FileCopyResult copyFileTransactional(ServerConnection& sourceConn, const std::string& sourcePath, //throw RemoteIOError, ConnectionError, X
                                     ServerConnection& targetConn, const std::string& targetPath,
                                     const std::function<void()>& onDeleteTargetFile /*throw X*/,
                                     const ferry::IoCallback& notifyUnbufferedIO /*throw X*/);
}

#endif //ABSTRACT_H_4418290573364101827
