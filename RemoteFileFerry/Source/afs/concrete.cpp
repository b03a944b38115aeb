// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "concrete.h"
#include "ftp.h"
#include "sftp.h"

using namespace ferry;
using namespace rff;


ServerConfig rff::parseServerPathPhrase(const std::string& pathPhrase) //throw FileError
{
    if (acceptsPathPhraseSftp(pathPhrase)) //noexcept
        return parsePathPhraseSftp(pathPhrase); //throw FileError

    if (acceptsPathPhraseFtp(pathPhrase)) //noexcept
        return parsePathPhraseFtp(pathPhrase); //throw FileError

    throw FileError(_("Invalid server path."), //don't show the phrase: may contain a password
                    replaceCpy<std::wstring>(L"Expected prefix: %x", L"%x", L"ftp://, ftps://, sftp://"));
}


std::string rff::concatenateServerPathPhrase(const ServerConfig& cfg) //noexcept
{
    switch (cfg.protocol)
    {
        case Protocol::ftp:
        case Protocol::ftpsExplicit:
        case Protocol::ftpsImplicit:
            return concatenateFtpPathPhrase(cfg);
        case Protocol::sftp:
            return concatenateSftpPathPhrase(cfg);
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::unique_ptr<ServerConnection> rff::createServerConnection(const ServerConfig& cfg)
{
    switch (cfg.protocol)
    {
        case Protocol::ftp:
        case Protocol::ftpsExplicit:
        case Protocol::ftpsImplicit:
            return createFtpConnection(cfg);
        case Protocol::sftp:
            return createSftpConnection(cfg);
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
