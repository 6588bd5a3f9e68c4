// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STREAM_BUFFER_H_08492572089560298
#define STREAM_BUFFER_H_08492572089560298

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include "ring_buffer.h"
#include "string_tools.h"


namespace zen
{
/*  turn libcurl's push-style write callback into a pull-style stream:
        producer: worker thread running curl_easy_perform() => write() + closeStream() or setWriteError()
        consumer: request thread                            => tryRead() + setReadError() on cancel

    the bounded buffer applies back pressure: a slow HTTP client slows down the remote download     */
class AsyncStreamBuffer
{
public:
    explicit AsyncStreamBuffer(size_t capacity) { ringBuf_.reserve(capacity); }

    //context of consumer thread, blocking
    size_t tryRead(void* buffer, size_t bytesToRead) //throw <write error>; may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    {
        if (bytesToRead == 0) //indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

        size_t bytesRead = 0;
        {
            std::unique_lock dummy(lockStream_);
            conditionBytesWritten_.wait(dummy, [this] { return errorWrite_ || !ringBuf_.empty() || eof_; });

            if (errorWrite_)
                std::rethrow_exception(errorWrite_); //throw <write error>

            bytesRead = std::min(bytesToRead, ringBuf_.size());
            ringBuf_.extract_front(static_cast<std::byte*>(buffer),
                                   static_cast<std::byte*>(buffer) + bytesRead);
            totalBytesRead_ += bytesRead;
        }
        if (bytesRead > 0)
            conditionBytesRead_.notify_all(); //...*outside* the lock
        return bytesRead;
    }

    //context of producer thread, blocking
    void write(const void* buffer, size_t bytesToWrite) //throw <read error>
    {
        std::unique_lock dummy(lockStream_);
        assert(!eof_ && !errorWrite_);

        while (bytesToWrite > 0)
        {
            conditionBytesRead_.wait(dummy, [this] { return errorRead_ || ringBuf_.size() < ringBuf_.capacity(); });

            if (errorRead_)
                std::rethrow_exception(errorRead_); //throw <read error>

            const size_t blockSize = std::min(bytesToWrite, ringBuf_.capacity() - ringBuf_.size());
            ringBuf_.insert_back(static_cast<const std::byte*>(buffer),
                                 static_cast<const std::byte*>(buffer) + blockSize);
            totalBytesWritten_ += blockSize;

            buffer = static_cast<const std::byte*>(buffer) + blockSize;
            bytesToWrite -= blockSize;

            conditionBytesWritten_.notify_all();
        }
    }

    //context of producer thread
    void closeStream()
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(!eof_ && !errorWrite_);
            eof_ = true;
        }
        conditionBytesWritten_.notify_all();
    }

    //context of consumer thread: makes a blocked write() throw
    void setReadError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(error);
            if (!errorRead_)
                errorRead_ = error;
        }
        conditionBytesRead_.notify_all();
    }

    //context of producer thread: makes tryRead() throw once the error is reached
    void setWriteError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(error);
            if (!errorWrite_)
                errorWrite_ = error;
        }
        conditionBytesWritten_.notify_all();
    }

    uint64_t getTotalBytesWritten() const { return totalBytesWritten_; }
    uint64_t getTotalBytesRead   () const { return totalBytesRead_; }

private:
    AsyncStreamBuffer           (const AsyncStreamBuffer&) = delete;
    AsyncStreamBuffer& operator=(const AsyncStreamBuffer&) = delete;

    std::mutex lockStream_;
    RingBuffer<std::byte> ringBuf_; //prefetch buffer
    bool eof_ = false;
    std::exception_ptr errorWrite_;
    std::exception_ptr errorRead_;
    std::condition_variable conditionBytesWritten_;
    std::condition_variable conditionBytesRead_;

    std::atomic<uint64_t> totalBytesWritten_{0};
    std::atomic<uint64_t> totalBytesRead_   {0};
};
}

#endif //STREAM_BUFFER_H_08492572089560298
