// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "thread.h"
#include "extra_log.h"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, "Error code " + numberTo(ec), errorBuf);
}


std::string formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //without modifying the thread's error queue, unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void zen::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    assert(runningOnMainThread());
    //libcurl's TLS backend initializes OpenSSL as well: do it explicitly and early on the main thread
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError("Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zen::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions

namespace
{
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


bool zen::equalConstantTime(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    if (lhs.empty())
        return true;
    return ::CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}


std::string zen::sha256Digest(std::string_view data) //throw SysError
{
    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int digestLen = 0;

    if (::EVP_Digest(data.data(), data.size(), digest, &digestLen, ::EVP_sha256(), nullptr) != 1)
        throw SysError(formatLastOpenSSLError("EVP_Digest"));

    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}


std::string zen::stringEncodeBase64(std::string_view data)
{
    std::string output(4 * ((data.size() + 2) / 3) + 1 /*null-termination*/, '\0');

    const int len = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                      reinterpret_cast<const unsigned char*>(data.data()),
                                      static_cast<int>(data.size()));
    output.resize(len);
    return output;
}


std::string zen::formatSshFingerprint(std::string_view sha256Digest)
{
    std::string b64 = stringEncodeBase64(sha256Digest);
    while (endsWith(b64, "="))
        b64.pop_back();
    return "SHA256:" + b64;
}
