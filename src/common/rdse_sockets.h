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

#ifndef _RDSE_SOCKETS_
#define _RDSE_SOCKETS_

#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>
#include <stdexcept>
#include <string_view>

namespace RDSE
{
    struct network_error : public std::runtime_error
    {
        explicit network_error(const std::string & what) : std::runtime_error(what){}
        explicit network_error(const char* what) : std::runtime_error(what){}
    };

    /// @brief: ordered reliable duplex transport
    class NetworkStream
    {
    public:
        NetworkStream() = default;
        virtual ~NetworkStream() = default;

        /// @brief: wait readable
        static bool             hasInput(int fd, int timeoutMS = 1);

        /// @brief: write all bytes
        /// @throw network_error
        virtual void            sendRaw(const void*, size_t) = 0;
        virtual void            sendFlush(void) {}

        /// @brief: read available bytes (at least one, blocking), return count
        /// @throw network_error on eof or error
        virtual size_t          recvSome(void*, size_t) const = 0;

        /// @brief: break blocking calls of other threads
        virtual void            shutdown(void) {}
    };

    /// @brief: socket stream, owns the descriptor
    class SocketStream : public NetworkStream
    {
    protected:
        int                     sock = -1;

    public:
        explicit SocketStream(int fd = -1);
        ~SocketStream();

        SocketStream(const SocketStream &) = delete;
        SocketStream & operator=(const SocketStream &) = delete;

        int                     socket(void) const { return sock; }
        void                    reset(void);

        void                    sendRaw(const void*, size_t) override;
        size_t                  recvSome(void*, size_t) const override;

        void                    shutdown(void) override;
    };

    namespace TCPSocket
    {
        int                     connect(std::string_view ipaddr, uint16_t port);
        int                     listen(std::string_view ipaddr, uint16_t port, int conn = 5);
        int                     accept(int fd);
    }

    namespace UnixSocket
    {
        /// @brief: connected pair of local stream sockets
        bool                    pair(int & fd1, int & fd2);
    }
} // RDSE

#endif // _RDSE_SOCKETS_
