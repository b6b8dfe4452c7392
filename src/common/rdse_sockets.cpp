/***************************************************************************
 *   Copyright © 2021 by Andrey Afletdinov <public.irkutsk@gmail.com>      *
 *                                                                         *
 *   Part of the RDSE: Remote Desktop Session Engine                       *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 3 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.             *
 ***************************************************************************/

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <cinttypes>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_sockets.h"

namespace RDSE
{
    /* NetworkStream */
    bool NetworkStream::hasInput(int fd, int timeoutMS)
    {
        if(0 > fd)
        {
            return false;
        }

        struct pollfd fds = {
            .fd = fd,
            .events = POLLIN,
            .revents = 0
        };

        int ret = poll(& fds, 1, timeoutMS);

        if(0 > ret)
        {
            // interrupted system call
            if(errno == EINTR)
            {
                return hasInput(fd, timeoutMS);
            }

            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "poll", strerror(errno), errno);
            throw network_error(NS_FuncName);
        }

        // timed out
        if(0 == ret)
        {
            return false;
        }

        return (fds.revents & POLLIN);
    }

    /* SocketStream */
    size_t SocketStream::recvSome(void* ptr, size_t len) const
    {
        while(true)
        {
            ssize_t real = recv(sock, ptr, len, 0);

            if(0 < real)
            {
                return real;
            }

            // eof
            if(0 == real)
            {
                Application::debug(DebugType::Sock, "%s: %s", __FUNCTION__, "end stream");
                throw network_error(NS_FuncName);
            }

            if(EAGAIN == errno || EINTR == errno)
            {
                continue;
            }

            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "recv", strerror(errno), errno);
            throw network_error(NS_FuncName);
        }
    }

    SocketStream::SocketStream(int fd) : sock(fd)
    {
    }

    SocketStream::~SocketStream()
    {
        reset();
    }

    void SocketStream::reset(void)
    {
        if(0 <= sock)
        {
            ::shutdown(sock, SHUT_RDWR);
            close(sock);
            sock = -1;
        }
    }

    void SocketStream::shutdown(void)
    {
        if(0 <= sock)
        {
            ::shutdown(sock, SHUT_RDWR);
        }
    }

    void SocketStream::sendRaw(const void* ptr, size_t len)
    {
        auto it = static_cast<const uint8_t*>(ptr);

        while(len)
        {
            ssize_t real = send(sock, it, len, MSG_NOSIGNAL);

            if(0 < real)
            {
                it += real;
                len -= real;
                continue;
            }

            if(0 > real && (EAGAIN == errno || EINTR == errno))
            {
                continue;
            }

            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "send", strerror(errno), errno);
            throw network_error(NS_FuncName);
        }
    }

    /* TCPSocket */
    int TCPSocket::listen(std::string_view ipaddr, uint16_t port, int conn)
    {
        const std::string addr(ipaddr);
        int fd = ::socket(PF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);

        if(0 > fd)
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "socket", strerror(errno), errno, addr.c_str(), port);
            return -1;
        }

        int reuse = 1;

        if(0 > setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, & reuse, sizeof(reuse)))
        {
            Application::warning("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "socket reuseaddr", strerror(errno), errno, addr.c_str(), port);
        }

        struct sockaddr_in sockaddr;
        memset(& sockaddr, 0, sizeof(struct sockaddr_in));

        sockaddr.sin_family = AF_INET;
        sockaddr.sin_port = htons(port);
        sockaddr.sin_addr.s_addr = addr == "any" ? htonl(INADDR_ANY) : inet_addr(addr.c_str());

        Application::debug(DebugType::Sock, "%s: bind addr: `%s', port: %" PRIu16, __FUNCTION__, addr.c_str(), port);

        if(0 != bind(fd, (struct sockaddr*) &sockaddr, sizeof(struct sockaddr_in)))
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "bind", strerror(errno), errno, addr.c_str(), port);
            close(fd);
            return -1;
        }

        if(0 != ::listen(fd, conn))
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "listen", strerror(errno), errno, addr.c_str(), port);
            close(fd);
            return -1;
        }

        return fd;
    }

    int TCPSocket::accept(int fd)
    {
        int sock = ::accept(fd, nullptr, nullptr);

        if(0 > sock)
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "accept", strerror(errno), errno);
        }
        else
        {
            Application::debug(DebugType::Sock, "%s: conected client, fd: %d", __FUNCTION__, sock);
        }

        return sock;
    }

    int TCPSocket::connect(std::string_view ipaddr, uint16_t port)
    {
        const std::string addr(ipaddr);
        int sock = ::socket(AF_INET, SOCK_STREAM, 0);

        if(0 > sock)
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "socket", strerror(errno), errno, addr.c_str(), port);
            return -1;
        }

        struct sockaddr_in sockaddr;
        memset(& sockaddr, 0, sizeof(struct sockaddr_in));

        sockaddr.sin_family = AF_INET;
        sockaddr.sin_addr.s_addr = inet_addr(addr.c_str());
        sockaddr.sin_port = htons(port);

        Application::debug(DebugType::Sock, "%s: ipaddr: `%s', port: %" PRIu16, __FUNCTION__, addr.c_str(), port);

        if(0 != ::connect(sock, (struct sockaddr*) &sockaddr, sizeof(struct sockaddr_in)))
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr `%s', port: %" PRIu16, __FUNCTION__, "connect", strerror(errno), errno, addr.c_str(), port);
            close(sock);
            return -1;
        }

        return sock;
    }

    /* UnixSocket */
    bool UnixSocket::pair(int & fd1, int & fd2)
    {
        int fds[2] = { -1, -1 };

        if(0 != socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds))
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "socketpair", strerror(errno), errno);
            return false;
        }

        fd1 = fds[0];
        fd2 = fds[1];
        return true;
    }
}
