// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GLOBALS_H_8013740213748021573485
#define GLOBALS_H_8013740213748021573485

#include <atomic>
#include <cassert>
#include <memory>
#include <utility>
#include "scope_guard.h"


namespace zen
{
/*  namespace-scope globals with shared ownership and serialized access
    => worker threads still running during process shutdown get nullptr instead of a dead object
    => use trivially-destructible POD only: no "magic statics"                                      */
class PodSpinMutex
{
public:
    bool tryLock();
    void lock();
    void unlock();

private:
    std::atomic_flag flag_{}; //static storage duration => static initialization, clear state since C++20
};


#define GLOBAL_RUN_ONCE(X)                               \
    struct ZEN_CONCAT(GlobalInitializer, __LINE__)       \
    {                                                    \
        ZEN_CONCAT(GlobalInitializer, __LINE__)() { X; } \
    } ZEN_CONCAT(globalInitializer, __LINE__)


template <class T>
class Global //don't use for function-scope statics!
{
public:
    consteval Global() {}; //demand static zero-initialization!

    ~Global()
    {
        static_assert(std::is_trivially_destructible_v<Pod>, "this memory needs to live forever");

        pod_.spinLock.lock();
        std::shared_ptr<T>* oldInst = std::exchange(pod_.inst, nullptr);
        pod_.destroyed = true;
        pod_.spinLock.unlock();

        delete oldInst;
    }

    std::shared_ptr<T> get() //caller shares ownership while using the instance
    {
        pod_.spinLock.lock();
        ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (pod_.inst)
            return *pod_.inst;
        return nullptr;
    }

    void set(std::unique_ptr<T>&& newInst)
    {
        std::shared_ptr<T>* tmpInst = nullptr;
        if (newInst)
            tmpInst = new std::shared_ptr<T>(std::move(newInst));
        {
            pod_.spinLock.lock();
            ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

            if (!pod_.destroyed)
                std::swap(pod_.inst, tmpInst);

            pod_.initialized = true;
        }
        delete tmpInst; //old instance or rejected new one: outside the lock
    }

    //lazy init by whichever thread comes first
    template <class Function>
    void setOnce(Function getInitialValue /*-> std::unique_ptr<T>*/)
    {
        pod_.spinLock.lock();
        ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (!pod_.initialized)
        {
            if (!pod_.destroyed)
                if (std::unique_ptr<T> newInst = getInitialValue()) //throw ?
                    pod_.inst = new std::shared_ptr<T>(std::move(newInst));

            pod_.initialized = true;
        }
    }

private:
    struct Pod
    {
        PodSpinMutex spinLock; //can't use std::mutex: has non-trival destructor
        std::shared_ptr<T>* inst = nullptr;
        bool initialized = false;
        bool destroyed = false;
    } pod_;
};

//------------------------------------------------------------------------------------------

inline
bool PodSpinMutex::tryLock()
{
    return !flag_.test_and_set(std::memory_order_acquire);
}


inline
void PodSpinMutex::lock()
{
    while (!tryLock())
        flag_.wait(true, std::memory_order_relaxed);
}


inline
void PodSpinMutex::unlock()
{
    flag_.clear(std::memory_order_release);
    flag_.notify_one();
}
}

#endif //GLOBALS_H_8013740213748021573485
