// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_23498325972583947678456437
#define SOCKET_H_23498325972583947678456437

#include <optional>
#include "sys_error.h"
#include <unistd.h> //close
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h> //TCP_NODELAY
#include <arpa/inet.h>   //inet_ntop
#include <netdb.h>       //getaddrinfo


namespace zen
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw zen::SysError(zen::formatSystemError("getaddrinfo", zen::formatGaiErrorCode(rcGai), ::gai_strerror(rcGai))); \
    } while (false)

inline
std::string formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return "Error code " + numberTo(ec);
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


//outgoing TCP connection, e.g. SSH transport for libssh2
class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec) //throw SysError, SysErrorTimeOut
    {
        if (trimCpy(server).empty())
            throw SysError("Server name must not be empty.");

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        ZEN_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

        const auto getConnectedSocket = [timeoutSec](const addrinfo& ai)
        {
            SocketType testSocket = ::socket(ai.ai_family,
                                             SOCK_CLOEXEC | SOCK_NONBLOCK | ai.ai_socktype,
                                             ai.ai_protocol);
            if (testSocket == invalidSocket)
                THROW_LAST_SYS_ERROR("socket");
            ZEN_ON_SCOPE_FAIL(closeSocket(testSocket));

            if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                    THROW_LAST_SYS_ERROR("connect");

                pollfd pfd{.fd = testSocket, .events = POLLOUT};
                int rv = 0;
                do
                    rv = ::poll(&pfd, 1, timeoutSec * 1000);
                while (rv < 0 && errno == EINTR);

                if (rv < 0)
                    THROW_LAST_SYS_ERROR("poll");

                if (rv == 0) //time-out!
                    throw SysErrorTimeOut(formatSystemError("connect, " + numberTo(timeoutSec) + " sec", ETIMEDOUT));

                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError

            int noDelay = 1; //disable Nagle algorithm: SSH packets are small and latency-bound
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            return testSocket;
        };

        //try all addresses: report the first error
        std::optional<SysError> firstError;
        bool firstErrorTimeOut = false;
        for (const addrinfo* si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = getConnectedSocket(*si); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e)
            {
                if (!firstError)
                {
                    firstError = e;
                    firstErrorTimeOut = dynamic_cast<const SysErrorTimeOut*>(&e) != nullptr;
                }
            }

        //list was not empty, so there must have been an error!
        if (firstErrorTimeOut)
            throw SysErrorTimeOut(firstError->toString());
        throw* firstError;
    }

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


//incoming TCP connections: socket() + SO_REUSEADDR + bind() + listen()
class ServerSocket //throw SysError
{
public:
    ServerSocket(const std::string& bindAddress, int port, int backlog) //throw SysError
    {
        const addrinfo hints
        {
            .ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV,
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        ZEN_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const std::string portStr = numberTo(port);
        const int rcGai = ::getaddrinfo(bindAddress.empty() ? nullptr : bindAddress.c_str(), portStr.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

        socket_ = ::socket(servinfo->ai_family, SOCK_CLOEXEC | servinfo->ai_socktype, servinfo->ai_protocol);
        if (socket_ == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        ZEN_ON_SCOPE_FAIL(closeSocket(socket_));

        int reuseAddr = 1;
        if (::setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &reuseAddr, sizeof(reuseAddr)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(SO_REUSEADDR)");

        if (::bind(socket_, servinfo->ai_addr, servinfo->ai_addrlen) != 0)
            THROW_LAST_SYS_ERROR("bind(" + bindAddress + ':' + portStr + ')');

        if (::listen(socket_, backlog) != 0)
            THROW_LAST_SYS_ERROR("listen");
    }

    ~ServerSocket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

    //the port actually bound: differs from the requested one for port 0
    int getPort() const //throw SysError
    {
        sockaddr_storage addr{};
        socklen_t addrLen = sizeof(addr);
        if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
            THROW_LAST_SYS_ERROR("getsockname");

        if (addr.ss_family == AF_INET)
            return ntohs(reinterpret_cast<const sockaddr_in&>(addr).sin_port);
        if (addr.ss_family == AF_INET6)
            return ntohs(reinterpret_cast<const sockaddr_in6&>(addr).sin6_port);

        throw SysError(formatSystemError("getsockname", "", "Unexpected address family " + numberTo(addr.ss_family) + '.'));
    }

    //wait at most timeoutMs: returns invalidSocket on time-out so that callers can check for a stop request
    SocketType tryAccept(int timeoutMs, std::string& peerName) //throw SysError
    {
        pollfd pfd{.fd = socket_, .events = POLLIN};
        const int rv = ::poll(&pfd, 1, timeoutMs);
        if (rv < 0)
        {
            if (errno == EINTR)
                return invalidSocket;
            THROW_LAST_SYS_ERROR("poll");
        }
        if (rv == 0)
            return invalidSocket;

        sockaddr_storage clientAddr{};
        socklen_t clientAddrLen = sizeof(clientAddr);

        const SocketType clientSocket = ::accept4(socket_, reinterpret_cast<sockaddr*>(&clientAddr), &clientAddrLen, SOCK_CLOEXEC);
        if (clientSocket == invalidSocket)
        {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED)
                return invalidSocket;
            THROW_LAST_SYS_ERROR("accept");
        }

        peerName = formatPeerAddress(clientAddr);
        return clientSocket;
    }

private:
    ServerSocket           (const ServerSocket&) = delete;
    ServerSocket& operator=(const ServerSocket&) = delete;

    static std::string formatPeerAddress(const sockaddr_storage& addr)
    {
        char ipBuf[INET6_ADDRSTRLEN] = {};
        if (addr.ss_family == AF_INET)
        {
            const auto& addr4 = reinterpret_cast<const sockaddr_in&>(addr);
            if (::inet_ntop(AF_INET, &addr4.sin_addr, ipBuf, sizeof(ipBuf)))
                return std::string(ipBuf) + ':' + numberTo(ntohs(addr4.sin_port));
        }
        else if (addr.ss_family == AF_INET6)
        {
            const auto& addr6 = reinterpret_cast<const sockaddr_in6&>(addr);
            if (::inet_ntop(AF_INET6, &addr6.sin6_addr, ipBuf, sizeof(ipBuf)))
                return '[' + std::string(ipBuf) + "]:" + numberTo(ntohs(addr6.sin6_port));
        }
        return "<unknown peer>";
    }

    SocketType socket_ = invalidSocket;
};


//more socket helper functions:
inline
size_t tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    ssize_t bytesReceived = 0;
    for (;;)
    {
        bytesReceived = ::recv(socket, buffer, bytesToRead, 0);
        if (bytesReceived >= 0 || errno != EINTR)
            break;
    }
    if (bytesReceived < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK) //SO_RCVTIMEO elapsed
            throw SysErrorTimeOut(formatSystemError("recv", ETIMEDOUT));
        THROW_LAST_SYS_ERROR("recv");
    }

    ASSERT_SYSERROR(static_cast<size_t>(bytesReceived) <= bytesToRead); //better safe than sorry

    return bytesReceived; //"zero indicates end of file"
}


inline
size_t tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    for (;;)
    {
        bytesWritten = ::send(socket, buffer, bytesToWrite, MSG_NOSIGNAL); //client went away: EPIPE instead of SIGPIPE
        if (bytesWritten >= 0 || errno != EINTR)
            break;
    }
    if (bytesWritten < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK) //SO_SNDTIMEO elapsed
            throw SysErrorTimeOut(formatSystemError("send", ETIMEDOUT));
        THROW_LAST_SYS_ERROR("send");
    }

    if (bytesWritten == 0)
        throw SysError(formatSystemError("send", "", "Zero bytes processed."));

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry

    return bytesWritten;
}


inline
void writeSocketAll(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError
{
    while (bytesToWrite > 0)
    {
        const size_t bytesWritten = tryWriteSocket(socket, buffer, bytesToWrite); //throw SysError
        buffer = static_cast<const std::byte*>(buffer) + bytesWritten;
        bytesToWrite -= bytesWritten;
    }
}


inline
void setSocketTimeouts(SocketType socket, int timeoutSec) //throw SysError
{
    const timeval tv{.tv_sec = timeoutSec};
    if (::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(SO_RCVTIMEO)");
    if (::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(SO_SNDTIMEO)");
}


inline
void setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}
}

#endif //SOCKET_H_23498325972583947678456437
