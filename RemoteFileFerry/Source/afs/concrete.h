// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONCRETE_H_7741058236601938275
#define CONCRETE_H_7741058236601938275

#include "abstract.h"


namespace rff
{
//"ftp://...", "ftps://...", "sftp://..."
ServerConfig parseServerPathPhrase(const std::string& pathPhrase); //throw FileError
std::string concatenateServerPathPhrase(const ServerConfig& cfg); //noexcept

//protocol is chosen by configuration; the returned connection is not yet connected
std::unique_ptr<ServerConnection> createServerConnection(const ServerConfig& cfg);
}

#endif //CONCRETE_H_7741058236601938275
