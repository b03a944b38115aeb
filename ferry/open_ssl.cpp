// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>

using namespace ferry;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL without thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x10100000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf));

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error();
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void ferry::openSslInit()
{
    //explicitly init OpenSSL on main thread before libcurl and libssh2 get to it
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void ferry::openSslTearDown() {} //OpenSSL 1.1.0+ cleans up by itself


//----------------------------------------------------------------------------------------

struct Sha256Hasher::Impl
{
    EVP_MD_CTX* mdctx = nullptr;
};


Sha256Hasher::Sha256Hasher() : pimpl_(std::make_unique<Impl>()) //throw SysError
{
    pimpl_->mdctx = ::EVP_MD_CTX_new();
    if (!pimpl_->mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details."));
    FERRY_ON_SCOPE_FAIL(::EVP_MD_CTX_free(pimpl_->mdctx));

    if (::EVP_DigestInit_ex(pimpl_->mdctx, EVP_sha256(), nullptr) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


Sha256Hasher::~Sha256Hasher() { ::EVP_MD_CTX_free(pimpl_->mdctx); }


void Sha256Hasher::update(const void* buffer, size_t bytes) //throw SysError
{
    if (::EVP_DigestUpdate(pimpl_->mdctx, buffer, bytes) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string Sha256Hasher::finalize() //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(pimpl_->mdctx, reinterpret_cast<unsigned char*>(output.data()), &bytesWritten) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return output;
}


std::string ferry::formatAsHexString(std::string_view blob)
{
    const char hexDigits[] = "0123456789abcdef";

    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        output += hexDigits[uc >> 4];
        output += hexDigits[uc & 0xf];
    }
    return output;
}


std::string ferry::stringEncodeBase64(std::string_view str)
{
    std::string output(4 * ((str.size() + 2) / 3) + 1 /*null-termination*/, '\0');

    const int charsWritten = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(str.data()),
                                               static_cast<int>(str.size()));
    output.resize(charsWritten);
    return output;
}


std::string ferry::stringDecodeBase64(std::string_view str) //throw SysError
{
    const std::string input = trimCpy(std::string(str));
    if (input.empty())
        return {};

    if (input.size() % 4 != 0)
        throw SysError(formatSystemError("EVP_DecodeBlock", L"", L"Invalid base64 length: " + numberTo<std::wstring>(input.size())));

    std::string output(3 * input.size() / 4, '\0');
    const int bytesWritten = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(input.data()),
                                               static_cast<int>(input.size()));
    if (bytesWritten < 0)
        throw SysError(formatLastOpenSSLError("EVP_DecodeBlock"));

    //EVP_DecodeBlock() does not strip the bytes represented by '=' padding
    size_t padding = 0;
    if (endsWith(input, "=="))
        padding = 2;
    else if (endsWith(input, '='))
        padding = 1;

    output.resize(bytesWritten - padding);
    return output;
}


std::string ferry::generateRandomBytes(size_t count) //throw SysError
{
    std::string output(count, '\0');
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(output.data()), static_cast<int>(count)) != 1)
        throw SysError(formatLastOpenSSLError("RAND_bytes"));
    return output;
}
