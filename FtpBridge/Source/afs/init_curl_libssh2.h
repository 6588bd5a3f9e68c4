// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_4570285702375915765
#define INIT_CURL_LIBSSH2_H_4570285702375915765

#include <memory>
#include <zen/globals.h>


namespace zen
{
/*  libcurl + libssh2 + OpenSSL startup/shutdown for remote sessions:

    1. "constinit Global<UniSessionCounter> globalFtpSessionCount;" + GLOBAL_RUN_ONCE(globalFtpSessionCount.set(createUniSessionCounter()));
       => waitable counter of live sessions of one backend

    2. every session holds a cookie from getLibsshCurlUnifiedInitCookie() for its whole lifetime

    3. static "UniInitializer globalStartupInitFtp(*globalFtpSessionCount.get());" runs the library init
       => ~UniInitializer blocks until the last session on a request thread is gone, then tears down      */
struct UniSessionCounter
{
    UniSessionCounter();
    ~UniSessionCounter();

    class Impl;
    const std::unique_ptr<Impl> pimpl;
};
std::unique_ptr<UniSessionCounter> createUniSessionCounter();


class UniCounterCookie;
std::shared_ptr<UniCounterCookie> getLibsshCurlUnifiedInitCookie(Global<UniSessionCounter>& globalSessionCount); //throw SysError

int getLiveSessionCount(Global<UniSessionCounter>& globalSessionCount); //0 during shutdown


class UniInitializer
{
public:
    explicit UniInitializer(UniSessionCounter& sessionCount);
    ~UniInitializer();

private:
    UniInitializer           (const UniInitializer&) = delete;
    UniInitializer& operator=(const UniInitializer&) = delete;

    UniSessionCounter& sessionCount_;
};
}

#endif //INIT_CURL_LIBSSH2_H_4570285702375915765
