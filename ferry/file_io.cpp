// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_io.h"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using namespace ferry;


namespace
{
const size_t FILE_BLOCK_SIZE = 128 * 1024;


class FileHandle
{
public:
    FileHandle(const std::string& filePath, int flags, mode_t mode) : //throw FileError
        filePath_(filePath)
    {
        fd_ = ::open(filePath.c_str(), flags | O_CLOEXEC, mode);
        if (fd_ == -1)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), "open");
    }

    ~FileHandle()
    {
        if (fd_ != -1)
            if (::close(fd_) != 0)
                logExtraError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)) + L"\n\n" + formatSystemError("close", getLastError()));
    }

    size_t tryRead(void* buffer, size_t bytesToRead) //throw FileError; may return short, only 0 means EOF!
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(fd_, buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath_)), "read");
        return static_cast<size_t>(bytesRead);
    }

    void write(const char* buffer, size_t bytesToWrite) //throw FileError
    {
        while (bytesToWrite > 0)
        {
            const ssize_t bytesWritten = ::write(fd_, buffer, bytesToWrite);
            if (bytesWritten < 0)
            {
                if (errno == EINTR)
                    continue;
                THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "write");
            }
            buffer       += bytesWritten;
            bytesToWrite -= bytesWritten;
        }
    }

    void close() //throw FileError
    {
        const int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "close");
    }

private:
    FileHandle           (const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    const std::string filePath_;
    int fd_ = -1;
};
}


std::string ferry::getFileContent(const std::string& filePath) //throw FileError
{
    FileHandle fileIn(filePath, O_RDONLY, 0); //throw FileError

    std::string output;
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + FILE_BLOCK_SIZE);

        const size_t bytesRead = fileIn.tryRead(output.data() + oldSize, FILE_BLOCK_SIZE); //throw FileError
        output.resize(oldSize + bytesRead);
        if (bytesRead == 0) //end of file
            return output;
    }
}


void ferry::setFileContent(const std::string& filePath, std::string_view bytes) //throw FileError
{
    const std::string tmpFilePath = filePath + ".tmp";
    {
        FileHandle tmpFile(tmpFilePath, O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH); //throw FileError
        tmpFile.write(bytes.data(), bytes.size()); //throw FileError
        tmpFile.close();                           //throw FileError
    }
    //take over ownership:
    FERRY_ON_SCOPE_FAIL(try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    if (::rename(tmpFilePath.c_str(), filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(replaceCpy(_("Cannot move file %x to %y."), L"%x", L'\n' + fmtPath(tmpFilePath)), L"%y", L'\n' + fmtPath(filePath)), "rename");
}


void ferry::removeFilePlain(const std::string& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void ferry::createDirectoryIfMissingRecursion(const std::string& dirPath) //throw FileError
{
    if (dirPath.empty())
        return;

    struct stat fileInfo = {};
    if (::stat(dirPath.c_str(), &fileInfo) == 0)
    {
        if (!S_ISDIR(fileInfo.st_mode))
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), _("The name is already used by another item."));
        return;
    }

    const std::string parentPath = beforeLast(dirPath, '/', IfNotFoundReturn::none);
    if (!parentPath.empty() && parentPath != dirPath)
        createDirectoryIfMissingRecursion(parentPath); //throw FileError

    if (::mkdir(dirPath.c_str(), 0755) != 0 && errno != EEXIST)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), "mkdir");
}


std::string ferry::appendPath(const std::string& basePath, const std::string& relPath)
{
    if (basePath.empty())
        return relPath;
    if (relPath.empty())
        return basePath;
    if (endsWith(basePath, '/'))
        return basePath + relPath;
    return basePath + '/' + relPath;
}
