// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "curl_wrap.h"
#include <ferry/open_ssl.h>

using namespace ferry;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}


void ferry::libcurlInit() //call on main thread only
{
    if (++curlInitLevel != 1)
        return;

    openSslInit();

    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_NOTHING /*OpenSSL is initialized above*/);
        rc != CURLE_OK)
        logExtraError(_("Error during process initialization.") + L"\n\n" +
                      formatSystemError("curl_global_init", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


void ferry::libcurlTearDown()
{
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


void ferry::setCurlOptions(CURL* easyHandle, const std::vector<CurlOption>& options) //throw SysError
{
    for (const CurlOption& curlOpt : options)
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


std::wstring ferry::formatCurlStatusCode(CURLcode sc)
{
    switch (sc) //the codes an FTP client can run into
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ENGINE_NOTFOUND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ENGINE_SETFAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ENGINE_INITFAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CRL_BADFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ISSUER_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_PINNEDPUBKEYNOTMATCH);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_INVALIDCERTSTATUS);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
        default:
            break;
    }
    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
