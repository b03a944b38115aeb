// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp.h"
#include <future>
#include <ferry/stream_buffer.h>
#include <ferry/thread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_common.h"
#include "ftp_listing.h"
#include <fcntl.h>

using namespace ferry;
using namespace rff;


namespace
{
const size_t FTP_BLOCK_SIZE_DOWNLOAD = 64 * 1024; //libcurl returns blocks of only 16 kB as returned by recv() even if we request larger blocks via CURLOPT_BUFFERSIZE
const size_t FTP_BLOCK_SIZE_UPLOAD   = 64 * 1024; //libcurl requests blocks of 64 kB. larger blocksizes set via CURLOPT_UPLOAD_BUFFERSIZE do not seem to make a difference
const size_t FTP_STREAM_BUFFER_SIZE = 1024 * 1024; //unit: [byte]
//stream buffer should be big enough to facilitate prefetching during alternating read/write operations => e.g. see serialize.h::unbufferedStreamCopy()

constexpr std::string_view ftpPrefix  = "ftp:";
constexpr std::string_view ftpsPrefix = "ftps:";


struct SysErrorFtpProtocol : public SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

//server not reachable, login rejected, TLS handshake failed
DEFINE_NEW_SYS_ERROR(SysErrorConnection)


bool isConnectionFailure(CURLcode rc)
{
    switch (rc)
    {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_WEIRD_SERVER_REPLY: //garbage instead of a "220" greeting
        case CURLE_FTP_WEIRD_PASS_REPLY:
        case CURLE_LOGIN_DENIED:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_USE_SSL_FAILED:
        case CURLE_PEER_FAILED_VERIFICATION:
            return true;
        default:
            return false;
    }
}


bool isAsciiString(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return static_cast<unsigned char>(c) < 128; });
}


bool isUtf8Encoding(const std::string& encoding)
{
    return encoding.empty() ||
           equalAsciiNoCase(encoding, "utf-8") ||
           equalAsciiNoCase(encoding, "utf8");
}


std::string convertEncoding(std::string_view str, const std::string& toCodeset, const std::string& fromCodeset) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    FERRY_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //fails for: 1. broken input 2. characters not encodable in the target codeset
    gchar* outStr = ::g_convert(str.data(),                     //const gchar* str
                                static_cast<gssize>(str.size()), //gssize len
                                toCodeset.c_str(),              //const gchar* to_codeset
                                fromCodeset.c_str(),            //const gchar* from_codeset
                                nullptr,                        //gsize* bytes_read
                                &bytesWritten,                  //gsize* bytes_written
                                &error);                        //GError** error
    if (!outStr)
        throw SysError(formatGlibError("g_convert(" + std::string(str) + ", " + fromCodeset + " -> " + toCodeset + ')', error));
    FERRY_ON_SCOPE_EXIT(::g_free(outStr));

    return {outStr, bytesWritten};
}


std::string utfToServerEncoding(const ServerConfig& cfg, const std::string& str) //throw SysError
{
    if (isAsciiString(str) || isUtf8Encoding(cfg.encoding)) //fast path
        return str;

    return convertEncoding(str, cfg.encoding, "UTF-8"); //throw SysError
}


std::string serverToUtfEncoding(const ServerConfig& cfg, std::string_view str) //throw SysError
{
    if (isAsciiString(str)) //fast path
        return std::string(str);

    if (isUtf8Encoding(cfg.encoding))
    {
        if (!isValidUtf8(str))
            throw SysError(_("Invalid character encoding:") + L' ' + utfTo<std::wstring>(str) + L' ' + _("Expected:") + L" [UTF-8]");
        return std::string(str);
    }
    return convertEncoding(str, "UTF-8", cfg.encoding); //throw SysError
}

//================================================================================================================
//================================================================================================================

class FtpSession
{
public:
    explicit FtpSession(const ServerConfig& cfg) : cfg_(cfg) {}

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    //returns server response (header data)
    std::string perform(const std::string& itemPath /*UTF-8*/, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions, bool requestUtf8) //throw SysError, SysErrorConnection, SysErrorFtpProtocol
    {
        if (requestUtf8) //avoid endless recursion
            initUtf8(); //throw SysError, SysErrorConnection, SysErrorFtpProtocol

        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        const std::string curlUrl = getCurlUrlPath(itemPath, isDir); //throw SysError

        char curlErrorBuf[CURL_ERROR_SIZE] = {};

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_ERRORBUFFER, curlErrorBuf},
            {CURLOPT_HEADERDATA, &headerData},
            {CURLOPT_HEADERFUNCTION, onHeaderReceived},
            {CURLOPT_URL, curlUrl.c_str()},
            {CURLOPT_FTP_FILEMETHOD, pathMethod},
            {CURLOPT_PORT, getEffectivePort(cfg_)},

            //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
            {CURLOPT_NOSIGNAL, 1L},

            {CURLOPT_CONNECTTIMEOUT, cfg_.timeoutSec},
            //CURLOPT_TIMEOUT would limit the total transfer time => use "low speed" detection instead:
            {CURLOPT_LOW_SPEED_TIME, cfg_.timeoutSec},
            {CURLOPT_LOW_SPEED_LIMIT, 1L /*[bytes]*/}, //can't use "0" which means "inactive", so use some low number
            {CURLOPT_SERVER_RESPONSE_TIMEOUT, cfg_.timeoutSec},

            //long-running file uploads require keep-alives for the TCP control connection
            {CURLOPT_TCP_KEEPALIVE, 1L},

            {CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper},
            {CURLOPT_SOCKOPTDATA, &onSocketCreate},

            //server certificates are not verified
            {CURLOPT_CAINFO, 0L},
            {CURLOPT_SSL_VERIFYPEER, 0L},
            {CURLOPT_SSL_VERIFYHOST, 0L},
        };

        if (!cfg_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            options.emplace_back(CURLOPT_USERNAME, cfg_.username.c_str());
            options.emplace_back(CURLOPT_PASSWORD, cfg_.password.c_str());
        }

        if (cfg_.passiveMode)
            options.emplace_back(CURLOPT_FTP_SKIP_PASV_IP, 0L); //allow PASV IP: some FTP servers really use IP different from control connection
        else
            options.emplace_back(CURLOPT_FTPPORT, "-"); //active mode: same address as the control connection

        switch (cfg_.protocol)
        {
            case Protocol::ftp:
            case Protocol::sftp:
                break;
            case Protocol::ftpsExplicit: //https://tools.ietf.org/html/rfc4217
                //require SSL for both control and data:
                options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
                //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
                options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
                break;
            case Protocol::ftpsImplicit: //"ftps://" URL: TLS handshake right after TCP connect
                options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
                break;
        }

        options.insert(options.end(), extraOptions.begin(), extraOptions.end());

        setCurlOptions(easyHandle_, options); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //note: curl_easy_perform() considers FTP response codes >= 400 as failure

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            const std::wstring errorDetails = formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg);

            if (isConnectionFailure(rcPerf))
                throw SysErrorConnection(errorDetails);

            long ftpStatusCode = 0; //optional
            if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode) != CURLE_OK || ftpStatusCode == 0)
                ftpStatusCode = getLastFtpStatusCode(headerData);
            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (ftpStatusCode != 0)
                throw SysErrorFtpProtocol(errorDetails + L'\n' + formatFtpStatus(ftpStatusCode), ftpStatusCode);

            throw SysError(errorDetails);
        }
        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd, bool requestUtf8) //throw SysError, SysErrorConnection, SysErrorFtpProtocol
    {
        curl_slist* quote = nullptr;
        FERRY_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform("/", true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }, requestUtf8); //throw SysError, SysErrorConnection, SysErrorFtpProtocol
    }

    void testConnection() //throw SysError, SysErrorConnection
    {
        //'*': as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!
        const std::string& featBuf = runSingleFtpCommand("*FEAT", false /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol

        for (const std::string_view& line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "502 ") ||
                startsWith(line, "550 "))
            {
                if (!featureCache_)
                    featureCache_ = parseFeatResponse(featBuf);
                return;
            }

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');
    }

    bool supportsMlsd() { return getFeatures().mlsd; } //throw SysError, SysErrorConnection

    //UTF-8 -> server path
    std::string getServerPath(const std::string& itemPath) const //throw SysError
    {
        return utfToServerEncoding(cfg_, sanitizeRemotePath(itemPath)); //throw SysError
    }

    std::string decodeServerName(std::string_view serverName) const //throw SysError
    {
        return serverToUtfEncoding(cfg_, serverName); //throw SysError
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    std::string getCurlUrlPath(const std::string& itemPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!) => bug: https://github.com/curl/curl/pull/4423

        split(getServerPath(itemPath), //throw SysError
              '/', [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', L"", L"Conversion failure"));
                FERRY_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(cfg_.host).empty())
            throw SysError(_("Server name must not be empty."));

        static_assert(LIBCURL_VERSION_MAJOR > 7 || (LIBCURL_VERSION_MAJOR == 7 && LIBCURL_VERSION_MINOR >= 67));
        /*  1. CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs: https://github.com/curl/curl/pull/4382
            2. CURLFTPMETHOD_SINGLECWD requires absolute paths to skip one needless "CWD entry path": https://github.com/curl/curl/pull/4332
              => use // because /%2f had bugs (but they should be fixed: https://github.com/curl/curl/pull/4348)             */
        std::string path = getProtocolPrefix(cfg_.protocol) + "://" + cfg_.host + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    void initUtf8() //throw SysError, SysErrorConnection, SysErrorFtpProtocol
    {
        /*  some RFC-2640-non-compliant servers require UTF8 to be explicitly enabled, e.g. Microsoft FTP Service
            "OPTS UTF8 ON" needs to be activated each time libcurl internally creates a new session          */
        if (!isUtf8Encoding(cfg_.encoding)) //server with legacy encoding: nothing to request
            return;

        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == utf8RequestedSocket_)
                return;

        //some (broken!?) servers require "CLNT" before accepting "OPTS UTF8 ON"
        if (getFeatures().clnt) //throw SysError, SysErrorConnection
            runSingleFtpCommand("CLNT RemoteFileFerry", false /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol

        //"prefix the command with an asterisk to make libcurl continue even if the command fails"
        runSingleFtpCommand("*OPTS UTF8 ON", false /*requestUtf8*/); //throw SysError, SysErrorConnection, (SysErrorFtpProtocol)

        //make sure our Unicode-enabled session is still there (== libcurl behaves as we expect)
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            utf8RequestedSocket_ = *currentSocket; //remember what we did
        else
            throw SysError(L"Curl failed to cache FTP session."); //why is libcurl not caching the session???
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

    const FtpFeatures& getFeatures() //throw SysError, SysErrorConnection
    {
        if (!featureCache_)
            //*: ignore error if server does not support/allow FEAT
            featureCache_ = parseFeatResponse(runSingleFtpCommand("*FEAT", false /*requestUtf8*/)); //throw SysError, SysErrorConnection, (SysErrorFtpProtocol)
        //used by initUtf8()! => requestUtf8 = false!!!
        return *featureCache_;
    }

    const ServerConfig cfg_;
    CURL* easyHandle_ = nullptr;

    curl_socket_t utf8RequestedSocket_ = 0;

    std::optional<FtpFeatures> featureCache_;
};

//================================================================================================================
//================================================================================================================

//reuse FTP sessions: a download and an upload may run at the same time, each on its own control connection
class FtpSessionPool
{
public:
    explicit FtpSessionPool(const ServerConfig& cfg) : cfg_(cfg) {}

    void access(const std::function<void(FtpSession& session)>& useFtpSession /*throw X*/) //throw X
    {
        std::unique_ptr<FtpSession> ftpSession = idleSessions_.access([](std::vector<std::unique_ptr<FtpSession>>& sessions)
        {
            std::unique_ptr<FtpSession> session;
            if (!sessions.empty())
            {
                session = std::move(sessions.back());
                /**/                sessions.pop_back();
            }
            return session;
        });

        if (!ftpSession)
            ftpSession = std::make_unique<FtpSession>(cfg_);

        //failed sessions are discarded: libcurl's connection state is unknown
        FERRY_ON_SCOPE_SUCCESS(idleSessions_.access([&](std::vector<std::unique_ptr<FtpSession>>& sessions) { sessions.push_back(std::move(ftpSession)); }));

        useFtpSession(*ftpSession); //throw X
    }

    const ServerConfig& getConfig() const { return cfg_; }

private:
    FtpSessionPool           (const FtpSessionPool&) = delete;
    FtpSessionPool& operator=(const FtpSessionPool&) = delete;

    const ServerConfig cfg_;
    Protected<std::vector<std::unique_ptr<FtpSession>>> idleSessions_;
};


template <class Function> inline
void accessFtpSession(FtpSessionPool& pool, const std::wstring& errorMsg, Function useFtpSession /*throw SysError, X*/) //throw RemoteIOError, ConnectionError, X
{
    try
    {
        pool.access(useFtpSession); //throw SysError, SysErrorConnection, SysErrorFtpProtocol, X
    }
    catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
    catch (const SysError&           e) { throw RemoteIOError  (errorMsg, e.toString()); }
}

//===========================================================================================================================

std::vector<FtpItem> readFolder(FtpSession& session, const std::string& folderPath) //throw SysError, SysErrorConnection, SysErrorFtpProtocol
{
    std::string rawListing; //get raw FTP directory listing

    curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        auto& listing = *static_cast<std::string*>(callbackData);
        listing.append(buffer, size * nitems);
        return size * nitems;
    };

    std::vector<CurlOption> options =
    {
        {CURLOPT_WRITEDATA, &rawListing},
        {CURLOPT_WRITEFUNCTION, onBytesReceived},
    };
    curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

    const bool useMlsd = session.supportsMlsd(); //throw SysError, SysErrorConnection
    if (useMlsd)
    {
        options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

        //some FTP servers process wildcard characters inside the MLSD "dirpath": http://www.proftpd.org/docs/howto/Globbing.html
        const bool pathHasWildcards =
            contains(afterFirst(folderPath, '[', IfNotFoundReturn::none), ']') ||
            contains(folderPath, '*') ||
            contains(folderPath, '?');

        if (!pathHasWildcards)
            pathMethod = CURLFTPMETHOD_NOCWD; //faster than CURLFTPMETHOD_SINGLECWD
    }
    //else: use "LIST" + CURLFTPMETHOD_SINGLECWD
    //caveat: let's better not use LIST parameters: https://cr.yp.to/ftp/list.html

    session.perform(folderPath, true /*isDir*/, pathMethod, options, true /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol

    const DecodeServerName decodeName = [&](std::string_view serverName) { return session.decodeServerName(serverName); }; //throw SysError

    if (useMlsd)
        return parseMlsdListing(rawListing, decodeName); //throw SysError
    else
        return parseListListing(rawListing, std::time(nullptr), decodeName); //throw SysError
}


void ftpFileDownload(FtpSessionPool& pool, const std::string& filePath, //throw RemoteIOError, ConnectionError, X
                     const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/)
{
    std::exception_ptr exception;

    auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
    {
        try
        {
            writeBlock(buffer, bytesToWrite); //throw X
            //[!] let's NOT use "incomplete write Posix semantics" for libcurl!
            //who knows if libcurl buffers properly, or if it sends incomplete packages!?
            return bytesToWrite;
        }
        catch (...)
        {
            exception = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(generateDisplayPath(pool.getConfig(), filePath)));
    try
    {
        pool.access([&](FtpSession& session) //throw SysError
        {
            session.perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_WRITEDATA, &onBytesReceived},
                {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
            }, true /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol
        });
    }
    catch (const SysErrorConnection& e)
    {
        if (exception)
            std::rethrow_exception(exception);

        throw ConnectionError(errorMsg, e.toString());
    }
    catch (const SysError& e)
    {
        if (exception)
            std::rethrow_exception(exception);

        throw RemoteIOError(errorMsg, e.toString());
    }
}


/* File already existing:
    vsftpd, ProFTPD:  overwrite
    FileZilla Server: overwrites
    Windows IIS:      overwrites (unless configured otherwise)             */
void ftpFileUpload(FtpSessionPool& pool, const std::string& filePath, //throw RemoteIOError, ConnectionError, X
                   const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) //return "bytesToRead" bytes unless end of stream
{
    std::exception_ptr exception;

    auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            /*  libcurl calls back until 0 bytes are returned (Posix read() semantics)

                [!] let's NOT use "incomplete read Posix semantics" for libcurl!
                who knows if libcurl buffers properly, or if it requests incomplete packages!?     */
            return readBlock(buffer, bytesToRead); //throw X; return "bytesToRead" bytes unless end of stream
        }
        catch (...)
        {
            exception = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(generateDisplayPath(pool.getConfig(), filePath)));
    try
    {
        pool.access([&](FtpSession& session) //throw SysError
        {
            session.perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READDATA, &getBytesToSend},
                {CURLOPT_READFUNCTION, getBytesToSendWrapper},
                //CURLOPT_INFILESIZE_LARGE does not issue a specific FTP command, but is used by libcurl only!
            }, true /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol
        });
    }
    catch (const SysErrorConnection& e)
    {
        if (exception)
            std::rethrow_exception(exception);

        throw ConnectionError(errorMsg, e.toString());
    }
    catch (const SysError& e)
    {
        if (exception)
            std::rethrow_exception(exception);

        throw RemoteIOError(errorMsg, e.toString());
    }
}

//===========================================================================================================================

struct InputStreamFtp : public InputStream
{
    InputStreamFtp(const std::shared_ptr<FtpSessionPool>& pool, const std::string& filePath)
    {
        worker_ = WorkerThread([asyncStreamOut = this->asyncStreamIn_, pool, filePath]
        {
            setCurrentThreadName("Istream[FTP]");
            try
            {
                auto writeBlock = [&](const void* buffer, size_t bytesToWrite)
                {
                    asyncStreamOut->write(buffer, bytesToWrite); //throw ThreadStopRequest
                };
                ftpFileDownload(*pool, filePath, writeBlock); //throw RemoteIOError, ConnectionError, ThreadStopRequest

                asyncStreamOut->closeStream();
            }
            catch (FileError&) { asyncStreamOut->setWriteError(std::current_exception()); } //let ThreadStopRequest pass through!
        });
    }

    ~InputStreamFtp()
    {
        asyncStreamIn_->setReadError(std::make_exception_ptr(ThreadStopRequest()));
    }

    size_t getBlockSize() override { return FTP_BLOCK_SIZE_DOWNLOAD; }

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X
    {
        const size_t bytesRead = asyncStreamIn_->tryRead(buffer, bytesToRead); //throw RemoteIOError, ConnectionError
        reportBytesProcessed(notifyUnbufferedIO); //throw X
        return bytesRead;
        //no need for asyncStreamIn_->checkWriteErrors(): once end of stream is reached, asyncStreamOut->closeStream() was called => no errors occured
    }

private:
    void reportBytesProcessed(const IoCallback& notifyUnbufferedIO /*throw X*/) //throw X
    {
        const int64_t bytesDelta = static_cast<int64_t>(asyncStreamIn_->getTotalBytesWritten()) - totalBytesReported_;
        totalBytesReported_ += bytesDelta;
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesDelta); //throw X
    }

    int64_t totalBytesReported_ = 0;
    std::shared_ptr<AsyncStreamBuffer> asyncStreamIn_ = std::make_shared<AsyncStreamBuffer>(FTP_STREAM_BUFFER_SIZE);
    WorkerThread worker_;
};

//===========================================================================================================================

//CAVEAT: if upload fails due to missing permissions, OutputStreamFtp constructor does not fail, but OutputStreamFtp::tryWrite() does!
struct OutputStreamFtp : public OutputStream
{
    OutputStreamFtp(const std::shared_ptr<FtpSessionPool>& pool, const std::string& filePath) :
        pool_(pool),
        filePath_(filePath)
    {
        std::promise<void> promUploadDone;
        futUploadDone_ = promUploadDone.get_future();

        worker_ = WorkerThread([pool, filePath,
                                      asyncStreamIn = this->asyncStreamOut_,
                                      pUploadDone   = std::move(promUploadDone)]() mutable
        {
            setCurrentThreadName("Ostream[FTP]");
            try
            {
                auto readBlock = [&](void* buffer, size_t bytesToRead)
                {
                    return asyncStreamIn->read(buffer, bytesToRead); //throw ThreadStopRequest
                };
                ftpFileUpload(*pool, filePath, readBlock); //throw RemoteIOError, ConnectionError, ThreadStopRequest

                pUploadDone.set_value();
            }
            catch (FileError&)
            {
                const std::exception_ptr exptr = std::current_exception();
                asyncStreamIn->setReadError(exptr); //set both!
                pUploadDone.set_exception(exptr);   //
            }
            //let ThreadStopRequest pass through!
        });
    }

    ~OutputStreamFtp()
    {
        if (asyncStreamOut_) //finalize() was not called (successfully)
        {
            asyncStreamOut_->setWriteError(std::make_exception_ptr(ThreadStopRequest()));
            worker_ = WorkerThread(); //wait until upload has ended

            //remove the incomplete upload: '*' => server might not even have created the file yet
            try
            {
                accessFtpSession(*pool_, replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(generateDisplayPath(pool_->getConfig(), filePath_))),
                                 [&](FtpSession& session) { session.runSingleFtpCommand("*DELE " + session.getServerPath(filePath_), true /*requestUtf8*/); }); //throw RemoteIOError, ConnectionError
            }
            catch (const FileError& e) { logExtraError(e.toString()); }
        }
    }

    size_t getBlockSize() override { return FTP_BLOCK_SIZE_UPLOAD; }

    size_t tryWrite(const void* buffer, size_t bytesToWrite, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X; may return short! CONTRACT: bytesToWrite > 0
    {
        const size_t bytesWritten = asyncStreamOut_->tryWrite(buffer, bytesToWrite); //throw RemoteIOError, ConnectionError
        reportBytesProcessed(notifyUnbufferedIO); //throw X
        return bytesWritten;
    }

    void finalize(const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw RemoteIOError, ConnectionError, X
    {
        if (!asyncStreamOut_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        asyncStreamOut_->closeStream();

        while (futUploadDone_.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout)
            reportBytesProcessed(notifyUnbufferedIO); //throw X
        reportBytesProcessed(notifyUnbufferedIO); //[!] once more, now that *all* bytes were written

        futUploadDone_.get(); //throw RemoteIOError, ConnectionError

        asyncStreamOut_.reset(); //do NOT reset on error, so that ~OutputStreamFtp() will request worker thread to stop
    }

private:
    void reportBytesProcessed(const IoCallback& notifyUnbufferedIO /*throw X*/) //throw X
    {
        const int64_t bytesDelta = static_cast<int64_t>(asyncStreamOut_->getTotalBytesRead()) - totalBytesReported_;
        totalBytesReported_ += bytesDelta;
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesDelta); //throw X
    }

    const std::shared_ptr<FtpSessionPool> pool_;
    const std::string filePath_;
    int64_t totalBytesReported_ = 0;
    std::shared_ptr<AsyncStreamBuffer> asyncStreamOut_ = std::make_shared<AsyncStreamBuffer>(FTP_STREAM_BUFFER_SIZE);
    WorkerThread worker_;
    std::future<void> futUploadDone_;
};

//===========================================================================================================================

class FtpConnection : public ServerConnection
{
public:
    explicit FtpConnection(const ServerConfig& cfg) : ServerConnection(cfg) {}

    void connect() override //throw ConnectionError
    {
        if (sessionPool_)
            return;

        auto pool = std::make_shared<FtpSessionPool>(getConfig());
        try
        {
            if (trimCpy(getConfig().host).empty())
                throw SysError(_("Server name must not be empty."));

            pool->access([](FtpSession& session) { session.testConnection(); }); //throw SysError, SysErrorConnection
        }
        catch (const SysError& e) //*any* failure while connecting is fatal
        {
            throw ConnectionError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayPath("/"))), e.toString());
        }
        sessionPool_ = pool;
    }

    void close() override { sessionPool_.reset(); } //open streams keep their sessions until done

    bool isConnected() const override { return static_cast<bool>(sessionPool_); }

    std::vector<FileEntry> list(const std::string& dirPath) override //throw RemoteIOError, ConnectionError
    {
        const std::string folderPath = sanitizeRemotePath(dirPath);
        std::vector<FtpItem> items;

        accessFtpSession(*getSessionPool(), replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(folderPath))),
        [&](FtpSession& session) { items = readFolder(session, folderPath); }); //throw RemoteIOError, ConnectionError

        return toFileEntries(folderPath, items);
    }

    std::unique_ptr<InputStream> openRead(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        return std::make_unique<InputStreamFtp>(getSessionPool(), sanitizeRemotePath(filePath));
    }

    std::unique_ptr<OutputStream> openWrite(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        return std::make_unique<OutputStreamFtp>(getSessionPool(), sanitizeRemotePath(filePath));
    }

    bool exists(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        const std::string itemPath = sanitizeRemotePath(filePath);
        const std::optional<std::string> parentPath = getParentPath(itemPath);
        if (!parentPath) //server root
            return true;

        const std::string itemName = getItemName(itemPath);
        const std::wstring errorMsg = replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath)));
        try
        {
            std::vector<FtpItem> items;
            getSessionPool()->access([&](FtpSession& session) { items = readFolder(session, *parentPath); }); //throw SysError, SysErrorConnection, SysErrorFtpProtocol

            //don't use MLST: broken for Pure-FTPd
            //case-sensitive comparison: we don't know the server's file system => a folder of the same name counts, too
            return std::any_of(items.begin(), items.end(), [&](const FtpItem& item) { return item.itemName == itemName; });
        }
        catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
        catch (const SysErrorFtpProtocol& e)
        {
            if (e.ftpErrorCode == 550) //FTP 550 No such file or directory => parent folder missing
                return false;
            throw RemoteIOError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw RemoteIOError(errorMsg, e.toString()); }
    }

    //already existing: undefined behavior! (e.g. fail/overwrite)
    //=> actual behavior: most linux-based FTP servers overwrite, Windows-based servers fail
    //      Windows IIS:      CURLE_QUOTE_ERROR: QUOT command failed with 550 Cannot create a file when that file already exists.
    //      FileZilla Server: CURLE_QUOTE_ERROR: QUOT command failed with 553 file exists
    void rename(const std::string& pathFrom, const std::string& pathTo) override //throw RemoteIOError, ErrorMoveUnsupported, ConnectionError
    {
        const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                            L"%x", L'\n' + fmtPath(getDisplayPath(pathFrom))),
                                                 L"%y", L'\n' + fmtPath(getDisplayPath(pathTo)));
        try
        {
            getSessionPool()->access([&](FtpSession& session) //throw SysError
            {
                curl_slist* quote = nullptr;
                FERRY_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
                quote = ::curl_slist_append(quote, ("RNFR " + session.getServerPath(pathFrom)).c_str()); //throw SysError
                quote = ::curl_slist_append(quote, ("RNTO " + session.getServerPath(pathTo  )).c_str()); //

                session.perform("/", true /*isDir*/, CURLFTPMETHOD_NOCWD, //avoid needless CWDs
                {
                    {CURLOPT_NOBODY, 1L},
                    {CURLOPT_QUOTE, quote},
                }, true /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol
            });
        }
        catch (const SysErrorConnection& e) { throw ConnectionError(errorMsg, e.toString()); }
        catch (const SysErrorFtpProtocol& e)
        {
            if (e.ftpErrorCode == 500 || //Syntax error, command unrecognized
                e.ftpErrorCode == 502 || //Command not implemented
                e.ftpErrorCode == 504)   //Command not implemented for that parameter
                throw ErrorMoveUnsupported(errorMsg, e.toString());
            throw RemoteIOError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw RemoteIOError(errorMsg, e.toString()); }
    }

    void removeFile(const std::string& filePath) override //throw RemoteIOError, ConnectionError
    {
        accessFtpSession(*getSessionPool(), replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(filePath))),
                         [&](FtpSession& session)
        {
            session.runSingleFtpCommand("DELE " + session.getServerPath(filePath), true /*requestUtf8*/); //throw SysError, SysErrorConnection, SysErrorFtpProtocol
        }); //throw RemoteIOError, ConnectionError
    }

    std::wstring getDisplayPath(const std::string& itemPath) const override { return generateDisplayPath(getConfig(), itemPath); }

private:
    const std::shared_ptr<FtpSessionPool>& getSessionPool() const
    {
        if (!sessionPool_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! FTP connection not established.");
        return sessionPool_;
    }

    std::shared_ptr<FtpSessionPool> sessionPool_;
};
}


bool rff::acceptsPathPhraseFtp(const std::string& pathPhrase) //noexcept
{
    const std::string path = trimCpy(pathPhrase);
    return startsWithAsciiNoCase(path, ftpPrefix) ||
           startsWithAsciiNoCase(path, ftpsPrefix);
}


ServerConfig rff::parsePathPhraseFtp(const std::string& pathPhrase) //throw FileError
{
    const std::wstring errorMsg = _("Invalid FTP server path.");

    std::string phrase = trimCpy(pathPhrase);

    ServerConfig cfg;
    if (startsWithAsciiNoCase(phrase, ftpsPrefix))
    {
        cfg.protocol = Protocol::ftpsImplicit;
        phrase = phrase.substr(ftpsPrefix.size());
    }
    else if (startsWithAsciiNoCase(phrase, ftpPrefix))
        phrase = phrase.substr(ftpPrefix.size());
    else
        throw FileError(errorMsg, replaceCpy<std::wstring>(L"Expected prefix: %x", L"%x", L"ftp://, ftps://"));

    std::string_view pathPhraseView = phrase;
    while (startsWith(pathPhraseView, '/') || startsWith(pathPhraseView, '\\'))
        pathPhraseView.remove_prefix(1);

    const std::string_view fullPathOpt = beforeFirst(pathPhraseView, '|', IfNotFoundReturn::all);
    const std::string_view options     =  afterFirst(pathPhraseView, '|', IfNotFoundReturn::none);

    //the password may contain '/' => search '@' before the path separator
    const std::string_view credentials = beforeLast(fullPathOpt, '@', IfNotFoundReturn::none);
    const std::string_view fullPath    =  afterLast(fullPathOpt, '@', IfNotFoundReturn::all);

    cfg.username = decodeFtpUsername(std::string(beforeFirst(credentials, ':', IfNotFoundReturn::all))); //support standard FTP syntax, even though
    cfg.password = decodeFtpUsername(std::string( afterFirst(credentials, ':', IfNotFoundReturn::none))); //concatenateFtpPathPhrase() uses "pass64" instead

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
            if (startsWith(optPhrase, "timeout="))
            {
                cfg.timeoutSec = stringTo<int>(afterFirst(optPhrase, '=', IfNotFoundReturn::none));
                if (cfg.timeoutSec <= 0)
                    throw FileError(errorMsg, _("Invalid timeout:") + L' ' + utfTo<std::wstring>(optPhrase));
            }
            else if (optPhrase == "ssl")
            {
                if (cfg.protocol == Protocol::ftp)
                    cfg.protocol = Protocol::ftpsExplicit;
            }
            else if (optPhrase == "active")
                cfg.passiveMode = false;
            else if (startsWith(optPhrase, "encoding="))
                cfg.encoding = std::string(afterFirst(optPhrase, '=', IfNotFoundReturn::none));
            else if (startsWith(optPhrase, "pass64="))
                try
                {
                    cfg.password = decodePasswordBase64(afterFirst(optPhrase, '=', IfNotFoundReturn::none)); //throw SysError
                }
                catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
            else
                throw FileError(errorMsg, _("Unknown option:") + L' ' + utfTo<std::wstring>(optPhrase));
        }
    });

    if (cfg.encoding.empty())
        throw FileError(errorMsg, _("Character encoding must not be empty."));

    return cfg;
}


//expects "clean" login data
std::string rff::concatenateFtpPathPhrase(const ServerConfig& cfg) //noexcept
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

    if (cfg.protocol == Protocol::ftpsExplicit)
        options += "|ssl";

    if (!cfg.passiveMode)
        options += "|active";

    if (!isUtf8Encoding(cfg.encoding))
        options += "|encoding=" + cfg.encoding;

    if (!cfg.password.empty()) //password always last => visually truncated by folder input field
        options += "|pass64=" + encodePasswordBase64(cfg.password);

    const std::string_view prefix = cfg.protocol == Protocol::ftpsImplicit ? ftpsPrefix : ftpPrefix;
    return std::string(prefix) + "//" + username + cfg.host + port + relPath + options;
}


std::unique_ptr<ServerConnection> rff::createFtpConnection(const ServerConfig& cfg)
{
    return std::make_unique<FtpConnection>(cfg);
}
