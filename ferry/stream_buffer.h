// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STREAM_BUFFER_H_3309218475561092834
#define STREAM_BUFFER_H_3309218475561092834

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include "string_tools.h"


namespace ferry
{
/*  streaming API on top of libcurl's callback-based transfers:
        producer thread: write() + closeStream() or setWriteError()
        consumer thread: read()/tryRead()        or setReadError()

    bounded: a fast producer blocks until the consumer catches up                 */
class AsyncStreamBuffer
{
public:
    explicit AsyncStreamBuffer(size_t capacity) : capacity_(capacity) {}

    //context of input thread, blocking
    size_t read(void* buffer, size_t bytesToRead) //throw <write error>; return "bytesToRead" bytes unless end of stream!
    {
        std::unique_lock dummy(lockStream_);
        std::byte* it = static_cast<std::byte*>(buffer);

        while (bytesToRead > 0)
        {
            const size_t bytesRead = tryReadImpl(dummy, it, bytesToRead); //throw <write error>
            if (bytesRead == 0) //end of file
                break;
            conditionBytesRead_.notify_all();
            it += bytesRead;
            bytesToRead -= bytesRead;
        }
        return static_cast<size_t>(it - static_cast<std::byte*>(buffer));
    }

    //context of input thread, blocking
    size_t tryRead(void* buffer, size_t bytesToRead) //throw <write error>; may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    {
        size_t bytesRead = 0;
        {
            std::unique_lock dummy(lockStream_);
            bytesRead = tryReadImpl(dummy, static_cast<std::byte*>(buffer), bytesToRead);
        }
        if (bytesRead > 0)
            conditionBytesRead_.notify_all(); //...*outside* the lock
        return bytesRead;
    }

    //context of output thread, blocking
    void write(const void* buffer, size_t bytesToWrite) //throw <read error>
    {
        std::unique_lock dummy(lockStream_);
        const std::byte* it = static_cast<const std::byte*>(buffer);

        while (bytesToWrite > 0)
        {
            const size_t bytesWritten = tryWriteImpl(dummy, it, bytesToWrite); //throw <read error>
            conditionBytesWritten_.notify_all();
            it += bytesWritten;
            bytesToWrite -= bytesWritten;
        }
    }

    //context of output thread, blocking
    size_t tryWrite(const void* buffer, size_t bytesToWrite) //throw <read error>; may return short! CONTRACT: bytesToWrite > 0
    {
        size_t bytesWritten = 0;
        {
            std::unique_lock dummy(lockStream_);
            bytesWritten = tryWriteImpl(dummy, static_cast<const std::byte*>(buffer), bytesToWrite);
        }
        conditionBytesWritten_.notify_all();
        return bytesWritten;
    }

    //context of output thread
    void closeStream()
    {
        {
            std::lock_guard dummy(lockStream_);
            eof_ = true;
        }
        conditionBytesWritten_.notify_all();
    }

    //context of input thread
    void setReadError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            if (!errorRead_)
                errorRead_ = error;
        }
        conditionBytesRead_.notify_all();
    }

    //context of output thread
    void setWriteError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            if (!errorWrite_)
                errorWrite_ = error;
        }
        conditionBytesWritten_.notify_all();
    }

    uint64_t getTotalBytesWritten() const { std::lock_guard dummy(lockStream_); return totalBytesWritten_; }
    uint64_t getTotalBytesRead   () const { std::lock_guard dummy(lockStream_); return totalBytesRead_; }

private:
    AsyncStreamBuffer           (const AsyncStreamBuffer&) = delete;
    AsyncStreamBuffer& operator=(const AsyncStreamBuffer&) = delete;

    size_t tryReadImpl(std::unique_lock<std::mutex>& ul, std::byte* buffer, size_t bytesToRead) //throw <write error>
    {
        if (bytesToRead == 0) //indistinguishable from end of file!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        conditionBytesWritten_.wait(ul, [this] { return errorWrite_ || !buf_.empty() || eof_; });

        if (errorWrite_)
            std::rethrow_exception(errorWrite_); //throw <write error>

        const size_t junkSize = std::min(bytesToRead, buf_.size());
        std::copy(buf_.begin(), buf_.begin() + junkSize, buffer);
        buf_.erase(buf_.begin(), buf_.begin() + junkSize);
        totalBytesRead_ += junkSize;
        return junkSize;
    }

    size_t tryWriteImpl(std::unique_lock<std::mutex>& ul, const std::byte* buffer, size_t bytesToWrite) //throw <read error>
    {
        if (bytesToWrite == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        conditionBytesRead_.wait(ul, [this] { return errorRead_ || buf_.size() < capacity_; });

        if (errorRead_)
            std::rethrow_exception(errorRead_); //throw <read error>

        const size_t junkSize = std::min(bytesToWrite, capacity_ - buf_.size());
        buf_.insert(buf_.end(), buffer, buffer + junkSize);
        totalBytesWritten_ += junkSize;
        return junkSize;
    }

    mutable std::mutex lockStream_;
    const size_t capacity_;
    std::deque<std::byte> buf_; //prefetch/output buffer
    bool eof_ = false;
    std::exception_ptr errorWrite_;
    std::exception_ptr errorRead_;
    std::condition_variable conditionBytesWritten_;
    std::condition_variable conditionBytesRead_;

    uint64_t totalBytesWritten_ = 0;
    uint64_t totalBytesRead_ = 0;
};
}

#endif //STREAM_BUFFER_H_3309218475561092834
