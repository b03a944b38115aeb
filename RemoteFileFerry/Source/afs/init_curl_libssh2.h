// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_2870416693150248573
#define INIT_CURL_LIBSSH2_H_2870416693150248573


namespace rff
{
//(S)FTP initialization/shutdown: call on main thread, before the first and after the last ServerConnection
//calls may nest: only the outermost pair does the actual work
void initCurlLibssh2();
void teardownCurlLibssh2();


class CurlLibssh2Initializer
{
public:
    CurlLibssh2Initializer() { initCurlLibssh2(); }
    ~CurlLibssh2Initializer() { teardownCurlLibssh2(); }

private:
    CurlLibssh2Initializer           (const CurlLibssh2Initializer&) = delete;
    CurlLibssh2Initializer& operator=(const CurlLibssh2Initializer&) = delete;
};
}

#endif //INIT_CURL_LIBSSH2_H_2870416693150248573
