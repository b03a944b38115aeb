// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYS_ERROR_H_8833109657240185462
#define SYS_ERROR_H_8833109657240185462

#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but every error site needs them
#include "utf.h"         //
#include "extra_log.h"   //

#include <glib.h>
#include <cerrno>


namespace ferry
{
using ErrorCode = int;

ErrorCode getLastError();

std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatGlibError(const std::string& functionName, GError* error);


//low-level exception: non-translated detail information only, same level as errno
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public ferry::SysError { X(const std::wstring& msg) : SysError(msg) {} };


#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw ferry::SysError(formatSystemError(functionName, ecInternal)); } while (false)




//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //errno is a macro: no "::" prefix
}


std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error
}

#endif //SYS_ERROR_H_8833109657240185462
