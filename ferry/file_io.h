// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_IO_H_7742093318650427196
#define FILE_IO_H_7742093318650427196

#include "file_error.h"


//local file access: key files, log files
namespace ferry
{
std::string getFileContent(const std::string& filePath); //throw FileError

//write to temporary file first, then rename over the target
void setFileContent(const std::string& filePath, std::string_view bytes); //throw FileError

void removeFilePlain(const std::string& filePath); //throw FileError; ERROR if not existing

void createDirectoryIfMissingRecursion(const std::string& dirPath); //throw FileError

std::string appendPath(const std::string& basePath, const std::string& relPath);
}

#endif //FILE_IO_H_7742093318650427196
