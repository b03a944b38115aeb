// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SERIALIZE_H_2209381746503918276
#define SERIALIZE_H_2209381746503918276

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <functional>
#include <vector>
#include "string_tools.h"


namespace ferry
{
using IoCallback = std::function<void(int64_t bytesDelta)>; //throw X


template <class Function1, class Function2>
void unbufferedStreamCopy(Function1 tryRead /*(void* buffer, size_t bytesToRead) throw X; may return short; only 0 means EOF*/,  size_t blockSizeIn,
                          Function2 tryWrite /*(const void* buffer, size_t bytesToWrite) throw X; may return short*/,            size_t blockSizeOut); //throw X


//report the combined read + write progress as a single byte count
struct IOCallbackDivider
{
    IOCallbackDivider(const IoCallback& notifyUnbufferedIO, int64_t& totalBytesNotified) :
        totalBytesNotified_(totalBytesNotified),
        notifyUnbufferedIO_(notifyUnbufferedIO) {}

    void operator()(int64_t bytesDelta) //throw X!
    {
        if (notifyUnbufferedIO_) notifyUnbufferedIO_((totalBytesNotified_ + bytesDelta) / 2 - totalBytesNotified_ / 2); //throw X!
        totalBytesNotified_ += bytesDelta;
    }

private:
    int64_t& totalBytesNotified_;
    const IoCallback& notifyUnbufferedIO_;
};








//######################## implementation ##########################
template <class Function1, class Function2> inline
void unbufferedStreamCopy(Function1 tryRead, size_t blockSizeIn,
                          Function2 tryWrite, size_t blockSizeOut) //throw X
{
    if (blockSizeIn == 0 || blockSizeOut == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    std::vector<std::byte> buf(blockSizeOut - 1 + blockSizeIn);
    size_t bufPosEnd = 0;
    for (;;)
    {
        const size_t bytesRead = tryRead(buf.data() + bufPosEnd, blockSizeIn); //throw X; may return short; only 0 means EOF

        if (bytesRead == 0) //end of file
        {
            size_t bufPos = 0;
            while (bufPos < bufPosEnd)
                bufPos += tryWrite(buf.data() + bufPos, bufPosEnd - bufPos); //throw X; may return short
            return;
        }

        bufPosEnd += bytesRead;

        size_t bufPos = 0;
        while (bufPosEnd - bufPos >= blockSizeOut)
            bufPos += tryWrite(buf.data() + bufPos, blockSizeOut); //throw X; may return short

        if (bufPos > 0)
        {
            bufPosEnd -= bufPos;
            std::memmove(buf.data(), buf.data() + bufPos, bufPosEnd);
        }
    }
}
}

#endif //SERIALIZE_H_2209381746503918276
