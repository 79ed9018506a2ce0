// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_23498325972583947678456437
#define SOCKET_H_23498325972583947678456437

#include <chrono>
#include <optional>
#include "sys_error.h"
    #include <fcntl.h>
    #include <poll.h>
    #include <unistd.h> //close
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <netdb.h> //getaddrinfo


namespace zen
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw SysError(formatSystemError("getaddrinfo", formatGaiErrorCode(rcGai), utfTo<std::wstring>(::gai_strerror(rcGai)))); \
    } while (false)

inline
std::wstring formatGaiErrorCode(int ec)
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
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError

//block until socket is ready for the requested direction(s) or time out elapsed: false on time out
bool waitForSocket(SocketType socket, bool waitRead, bool waitWrite, std::chrono::milliseconds timeout); //throw SysError



//TCP connection to "server:port", trying all resolved addresses in turn
class Socket //throw SysError
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError(_("Server name must not be empty."));

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
            throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

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

                if (!waitForSocket(testSocket, false /*waitRead*/, true /*waitWrite*/, std::chrono::seconds(timeoutSec))) //throw SysError
                    throw SysError(formatSystemError("connect, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));

                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError
            //-----------------------------------------------------------

            int noDelay = 1; //disable Nagle algorithm: SSH packets are small and latency-bound
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            int keepAlive = 1; //detect dead peers on long idle transfers
            if (::setsockopt(testSocket, SOL_SOCKET, SO_KEEPALIVE, &keepAlive, sizeof(keepAlive)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(SO_KEEPALIVE)");

            return testSocket;
        };

        //getaddrinfo() may return multiple addresses (e.g. AF_INET6 + AF_INET): report first error if none connects
        std::optional<SysError> firstError;
        for (const addrinfo* si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = getConnectedSocket(*si); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e) { if (!firstError) firstError = e; }

        throw* firstError; //list was not empty, so there must have been an error!
    }

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};








//######################## implementation ########################
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


inline
bool waitForSocket(SocketType socket, bool waitRead, bool waitWrite, std::chrono::milliseconds timeout) //throw SysError
{
    pollfd fds
    {
        .fd = socket,
        .events = static_cast<short>((waitRead ? POLLIN : 0) | (waitWrite ? POLLOUT : 0)),
    };

    for (;;)
    {
        const int rv = ::poll(&fds, 1, static_cast<int>(timeout.count()));
        if (rv > 0)
            return true; //including POLLERR/POLLHUP: next socket operation reports the details
        if (rv == 0)
            return false;
        if (errno != EINTR)
            THROW_LAST_SYS_ERROR("poll");
    }
}
}

#endif //SOCKET_H_23498325972583947678456437
