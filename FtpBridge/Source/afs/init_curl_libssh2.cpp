// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "init_curl_libssh2.h"
#include <zen/extra_log.h>
#include <zen/thread.h>
#include <libcurl/curl_wrap.h>    //DON'T include <curl/curl.h> directly!
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace zen;


namespace
{
int uniInitLevel = 0; //FTP and SFTP backends both initialize => count nested calls
//zero-initialized POD => not subject to static initialization order fiasco

void libsshCurlUnifiedInit()
{
    assert(runningOnMainThread());
    assert(uniInitLevel >= 0);
    if (++uniInitLevel != 1) //non-atomic => require call from main thread
        return;

    libcurlInit(); //includes OpenSSL init shared with libssh2

    if (const int rc = ::libssh2_init(0);
        rc != 0)
        logExtraError("Error during process initialization.\n\n" + formatSystemError("libssh2_init", formatSshStatusCode(rc), ""));
}


void libsshCurlUnifiedTearDown()
{
    assert(runningOnMainThread());
    assert(uniInitLevel >= 1);
    if (--uniInitLevel != 0)
        return;

    ::libssh2_exit();
    libcurlTearDown();
}
}


class zen::UniSessionCounter::Impl
{
public:
    void inc() //throw SysError
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(sessionCount_ >= 0);

            if (!newSessionsAllowed_)
                throw SysError(formatSystemError("UniSessionCounter::inc", "", "Function call not allowed during init/shutdown."));

            ++sessionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    void dec() //noexcept
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(sessionCount_ >= 1);
            --sessionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    int getCount()
    {
        std::unique_lock dummy(lockCount_);
        return sessionCount_;
    }

    void onInitCompleted() //noexcept
    {
        std::unique_lock dummy(lockCount_);
        newSessionsAllowed_ = true;
    }

    void onBeforeTearDown() //noexcept
    {
        std::unique_lock dummy(lockCount_);
        newSessionsAllowed_ = false;
        conditionCountChanged_.wait(dummy, [this] { return sessionCount_ == 0; });
    }

    Impl() {}

private:
    Impl           (const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    std::mutex              lockCount_;
    int                     sessionCount_ = 0;
    std::condition_variable conditionCountChanged_;

    bool newSessionsAllowed_ = false;
};


UniSessionCounter::UniSessionCounter() : pimpl(std::make_unique<Impl>()) {}
UniSessionCounter::~UniSessionCounter() {}


std::unique_ptr<UniSessionCounter> zen::createUniSessionCounter()
{
    return std::make_unique<UniSessionCounter>();
}


class zen::UniCounterCookie
{
public:
    explicit UniCounterCookie(const std::shared_ptr<UniSessionCounter>& sessionCounter) :  sessionCounter_(sessionCounter) {}
    ~UniCounterCookie() { sessionCounter_->pimpl->dec(); }

private:
    UniCounterCookie           (const UniCounterCookie&) = delete;
    UniCounterCookie& operator=(const UniCounterCookie&) = delete;

    const std::shared_ptr<UniSessionCounter> sessionCounter_;
};


std::shared_ptr<UniCounterCookie> zen::getLibsshCurlUnifiedInitCookie(Global<UniSessionCounter>& globalSessionCount) //throw SysError
{
    std::shared_ptr<UniSessionCounter> sessionCounter = globalSessionCount.get();
    if (!sessionCounter)
        throw SysError(formatSystemError("getLibsshCurlUnifiedInitCookie", "", "Function call not allowed during init/shutdown.")); //=> ~UniCounterCookie() *not* called!
    sessionCounter->pimpl->inc(); //throw SysError

    //cookie now owns the obligation to call dec()
    return std::make_shared<UniCounterCookie>(sessionCounter);
}


int zen::getLiveSessionCount(Global<UniSessionCounter>& globalSessionCount)
{
    if (std::shared_ptr<UniSessionCounter> sessionCounter = globalSessionCount.get())
        return sessionCounter->pimpl->getCount();
    return 0;
}


UniInitializer::UniInitializer(UniSessionCounter& sessionCount) : sessionCount_(sessionCount)
{
    libsshCurlUnifiedInit();
    sessionCount_.pimpl->onInitCompleted();
}


UniInitializer::~UniInitializer()
{
    //request threads may still be draining a download: wait for them before pulling the libraries from under their feet
    sessionCount_.pimpl->onBeforeTearDown();
    libsshCurlUnifiedTearDown();
}
