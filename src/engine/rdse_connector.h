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

#ifndef _RDSE_CONNECTOR_
#define _RDSE_CONNECTOR_

#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

#include "rdse_sockets.h"
#include "rdse_engine.h"

namespace RDSE
{
    /// @brief: drives one engine over a network stream
    /// the writer thread ticks the engine while a transport is attached,
    /// the jobs thread ticks it while detached
    class Connector
    {
        Engine &        engine;
        std::unique_ptr<NetworkStream> stream;

        std::thread     reader;
        std::thread     writer;
        std::thread     jobs;

        std::atomic<bool> connected{false};
        std::atomic<bool> shutdown{false};

        std::mutex      lock;
        std::atomic<std::chrono::milliseconds> tickInterval{std::chrono::milliseconds(50)};

    protected:
        void            readerLoop(void);
        void            writerLoop(void);
        void            jobsLoop(void);
        void            transportLost(const char* from, const std::exception &);
        void            joinTransport(void);

    public:
        explicit Connector(Engine &);
        ~Connector();

        /// @brief: attach a new transport, start or resume the session
        /// @return false if the session is closed
        bool            attach(std::unique_ptr<NetworkStream>);

        /// @brief: close the transport, the session goes to reconnecting
        void            detach(void);

        /// @brief: stop every thread
        void            stop(void);

        bool            isConnected(void) const { return connected; }
        void            setTickInterval(const std::chrono::milliseconds &);
    };
}

#endif // _RDSE_CONNECTOR_
