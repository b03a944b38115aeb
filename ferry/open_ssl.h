// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OPEN_SSL_H_6619203847756128304
#define OPEN_SSL_H_6619203847756128304

#include <memory>
#include "sys_error.h"


namespace ferry
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


//incremental SHA-256 for streamed content
class Sha256Hasher
{
public:
    Sha256Hasher(); //throw SysError
    ~Sha256Hasher();

    void update(const void* buffer, size_t bytes); //throw SysError
    std::string finalize(); //throw SysError; raw digest (32 bytes)

private:
    Sha256Hasher           (const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    struct Impl;
    const std::unique_ptr<Impl> pimpl_;
};

std::string formatAsHexString(std::string_view blob); //bytes -> lower-case hex


std::string stringEncodeBase64(std::string_view str);
std::string stringDecodeBase64(std::string_view str); //throw SysError

std::string generateRandomBytes(size_t count); //throw SysError; cryptographically strong
}

#endif //OPEN_SSL_H_6619203847756128304
