// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RING_BUFFER_H_01238467085684139453534
#define RING_BUFFER_H_01238467085684139453534

#include <algorithm>
#include <cassert>
#include <memory>
#include "scope_guard.h"


namespace zen
{
//FIFO queue on a single circular allocation: used as task queue and as byte prefetch buffer
template <class T>
class RingBuffer
{
public:
    RingBuffer() {}

    RingBuffer(RingBuffer&& tmp) noexcept : mem_(std::move(tmp.mem_)), capacity_(tmp.capacity_), head_(tmp.head_), size_(tmp.size_)
    {
        tmp.capacity_ = tmp.head_ = tmp.size_ = 0;
    }
    RingBuffer& operator=(RingBuffer&& tmp) noexcept { swap(tmp); return *this; }

    ~RingBuffer() { clear(); }

    size_t size    () const { return size_; }
    size_t capacity() const { return capacity_; }
    bool   empty   () const { return size_ == 0; }

    T&       front()       { assert(!empty()); return data()[head_]; }
    const T& front() const { assert(!empty()); return data()[head_]; }

    template <class U>
    void push_back(U&& value) //throw ?
    {
        reserve(size_ + 1); //throw ?
        ::new (data() + wrap(size_)) T(std::forward<U>(value)); //throw ?
        ++size_;
    }

    void pop_front()
    {
        front().~T();
        --size_;
        head_ = size_ == 0 ? 0 : wrap(1);
    }

    void clear()
    {
        while (!empty())
            pop_front();
    }

    //strong exception-safety
    template <class Iterator>
    void insert_back(Iterator first, Iterator last) //throw ?
    {
        const size_t len = last - first;
        reserve(size_ + len); //throw ?

        const size_t tailPos  = wrap(size_);
        const size_t tailRoom = std::min(len, capacity_ - tailPos);

        std::uninitialized_copy(first, first + tailRoom, data() + tailPos); //throw ?
        ZEN_ON_SCOPE_FAIL(std::destroy(data() + tailPos, data() + tailPos + tailRoom));
        std::uninitialized_copy(first + tailRoom, last, data()); //throw ?

        size_ += len;
    }

    //contract: last - first <= size()
    template <class Iterator>
    void extract_front(Iterator first, Iterator last)
    {
        const size_t len = last - first;
        assert(len <= size_);

        const size_t headRoom = std::min(len, capacity_ - head_);

        Iterator itOut = std::copy(data() + head_, data() + head_ + headRoom, first);
        std::copy(data(), data() + len - headRoom, itOut);

        std::destroy(data() + head_, data() + head_ + headRoom);
        std::destroy(data(), data() + len - headRoom);

        size_ -= len;
        head_ = size_ == 0 ? 0 : wrap(len);
    }

    void swap(RingBuffer& other) noexcept
    {
        std::swap(mem_,      other.mem_);
        std::swap(capacity_, other.capacity_);
        std::swap(head_,     other.head_);
        std::swap(size_,     other.size_);
    }

    void reserve(size_t minCapacity) //throw ?
    {
        if (minCapacity <= capacity_)
            return;

        RingBuffer newBuf(minCapacity + minCapacity / 2); //throw std::bad_alloc

        //elements are relocated one by one: newBuf.size_ always reflects what it owns
        for (size_t i = 0; i < size_; ++i)
        {
            ::new (newBuf.data() + i) T(std::move_if_noexcept(data()[wrap(i)])); //throw ?
            ++newBuf.size_;
        }
        newBuf.swap(*this);
    }

private:
    RingBuffer           (const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    explicit RingBuffer(size_t capacity) :
        mem_(static_cast<std::byte*>(::operator new (capacity * sizeof(T)))), //throw std::bad_alloc
        capacity_(capacity) {}

    /**/  T* data()       { return reinterpret_cast<T*>(mem_.get()); }
    const T* data() const { return reinterpret_cast<const T*>(mem_.get()); }

    size_t wrap(size_t offset) const
    {
        size_t pos = head_ + offset;
        if (pos >= capacity_)
            pos -= capacity_;
        return pos;
    }

    struct FreeStoreDelete { void operator()(std::byte* p) const { ::operator delete (p); } };

    std::unique_ptr<std::byte, FreeStoreDelete> mem_;
    size_t capacity_ = 0; //as number of T
    size_t head_     = 0; //< capacity_
    size_t size_     = 0; //<= capacity_
};
}

#endif //RING_BUFFER_H_01238467085684139453534
