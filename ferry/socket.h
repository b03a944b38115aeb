// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SOCKET_H_1188460273395016472
#define SOCKET_H_1188460273395016472

#include <optional>
#include "sys_error.h"
#include <fcntl.h>
#include <unistd.h> //close
#include <sys/select.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h> //TCP_NODELAY
#include <netdb.h> //getaddrinfo


namespace ferry
{
std::wstring formatGaiErrorCode(int ec);


//TCP client connection, established with a time-out
class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec); //throw SysError
    ~Socket() { ::close(socket_); }

    int get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    static int connectAddress(const addrinfo& ai, int timeoutSec); //throw SysError

    int socket_ = -1;
};








//######################## implementation ##########################
inline
std::wstring formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}


inline
Socket::Socket(const std::string& server, const std::string& serviceName, int timeoutSec) //throw SysError
{
    if (trimCpy(server).empty())
        throw SysError(_("Server name must not be empty."));

    const addrinfo hints
    {
        .ai_flags = AI_ADDRCONFIG,
        .ai_socktype = SOCK_STREAM,
    };

    addrinfo* servinfo = nullptr;
    FERRY_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

    if (const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        rcGai != 0)
    {
        if (rcGai == EAI_SYSTEM) //"check errno for details"
            THROW_LAST_SYS_ERROR("getaddrinfo");
        throw SysError(formatSystemError("getaddrinfo", formatGaiErrorCode(rcGai), utfTo<std::wstring>(::gai_strerror(rcGai))));
    }
    if (!servinfo)
        throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

    //multiple addresses are possible, e.g. AF_INET6 + AF_INET: report the first error only if none connects
    std::optional<SysError> firstError;
    for (const addrinfo* si = servinfo; si; si = si->ai_next)
        try
        {
            socket_ = connectAddress(*si, timeoutSec); //throw SysError
            return;
        }
        catch (const SysError& e) { if (!firstError) firstError = e; }

    throw *firstError;
}


inline
int Socket::connectAddress(const addrinfo& ai, int timeoutSec) //throw SysError
{
    const int testSocket = ::socket(ai.ai_family, SOCK_CLOEXEC | SOCK_NONBLOCK | ai.ai_socktype, ai.ai_protocol);
    if (testSocket == -1)
        THROW_LAST_SYS_ERROR("socket");
    FERRY_ON_SCOPE_FAIL(::close(testSocket));

    if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
    {
        if (errno != EINPROGRESS)
            THROW_LAST_SYS_ERROR("connect");

        fd_set writefds{};
        fd_set exceptfds{};
        FD_SET(testSocket, &writefds);
        FD_SET(testSocket, &exceptfds);

        timeval tv{.tv_sec = timeoutSec};

        const int rv = ::select(testSocket + 1, nullptr, &writefds, &exceptfds, &tv);
        if (rv < 0)
            THROW_LAST_SYS_ERROR("select");

        if (rv == 0) //time-out!
            throw SysError(formatSystemError("select, " + numberTo<std::string>(timeoutSec) + " sec", ETIMEDOUT));

        int error = 0;
        socklen_t optLen = sizeof(error);
        if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
            THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

        if (error != 0)
            throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
    }

    //back to blocking: libssh2 applies its own time-out
    const int flags = ::fcntl(testSocket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");
    if (::fcntl(testSocket, F_SETFL, flags & ~O_NONBLOCK) != 0)
        THROW_LAST_SYS_ERROR("fcntl(F_SETFL)");

    int noDelay = 1; //disable Nagle algorithm
    if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

    return testSocket;
}
}

#endif //SOCKET_H_1188460273395016472
