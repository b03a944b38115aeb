// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "init_curl_libssh2.h"
#include <libcurl/curl_wrap.h>    //DON'T include <curl/curl.h> directly!
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace ferry;
using namespace rff;


namespace
{
int uniInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}


void rff::initCurlLibssh2()
{
    if (++uniInitLevel != 1) //non-atomic => require call from main thread
        return;

    libcurlInit(); //includes OpenSSL initialization also needed by libssh2

    if (const int rc = ::libssh2_init(0);
        rc != 0)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));
}


void rff::teardownCurlLibssh2()
{
    if (--uniInitLevel != 0)
        return;

    ::libssh2_exit();
    libcurlTearDown();
}
