// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_COMMON_H_8807126633140925587
#define FTP_COMMON_H_8807126633140925587

#include <ferry/open_ssl.h>
#include <ferry/string_tools.h>


namespace rff
{
//obfuscation, not encryption!
inline
std::string encodePasswordBase64(std::string_view pass)
{
    return ferry::stringEncodeBase64(pass); //nothrow
}


inline
std::string decodePasswordBase64(std::string_view pass) //throw SysError
{
    return ferry::stringDecodeBase64(pass); //throw SysError
}


//according to the (S)FTP path syntax, the username must not contain raw @ and :
//-> we don't need a full urlencode!
inline
std::string encodeFtpUsername(std::string name)
{
    using namespace ferry;
    replace(name, '%', "%25"); //first!
    replace(name, '@', "%40");
    replace(name, ':', "%3A");
    return name;
}


inline
std::string decodeFtpUsername(std::string name)
{
    using namespace ferry;
    replace(name, "%40", '@');
    replace(name, "%3A", ':');
    replace(name, "%3a", ':');
    replace(name, "%25", '%'); //last!
    return name;
}
}

#endif //FTP_COMMON_H_8807126633140925587
