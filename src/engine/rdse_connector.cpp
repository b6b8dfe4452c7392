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

#include <vector>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_connector.h"

using namespace std::chrono_literals;

namespace RDSE
{
    Connector::Connector(Engine & eng) : engine(eng)
    {
        jobs = std::thread([this]()
        {
            this->jobsLoop();
        });
    }

    Connector::~Connector()
    {
        stop();
    }

    void Connector::setTickInterval(const std::chrono::milliseconds & ms)
    {
        tickInterval = ms;
    }

    void Connector::joinTransport(void)
    {
        connected = false;

        if(stream)
        {
            stream->shutdown();
        }

        if(reader.joinable())
        {
            reader.join();
        }

        if(writer.joinable())
        {
            writer.join();
        }
    }

    bool Connector::attach(std::unique_ptr<NetworkStream> ns)
    {
        const std::scoped_lock guard{ lock };

        if(! ns)
        {
            Application::error("%s: %s", __FUNCTION__, "stream empty");
            return false;
        }

        joinTransport();
        stream = std::move(ns);

        if(! engine.attach(std::chrono::steady_clock::now()))
        {
            return false;
        }

        connected = true;

        reader = std::thread([this]()
        {
            this->readerLoop();
        });

        writer = std::thread([this]()
        {
            this->writerLoop();
        });

        return true;
    }

    void Connector::detach(void)
    {
        const std::scoped_lock guard{ lock };

        bool lost = connected;
        joinTransport();

        if(lost)
        {
            engine.transportLost(std::chrono::steady_clock::now());
        }
    }

    void Connector::stop(void)
    {
        shutdown = true;
        engine.shutdown();

        {
            const std::scoped_lock guard{ lock };
            joinTransport();
        }

        if(jobs.joinable())
        {
            jobs.join();
        }
    }

    void Connector::transportLost(const char* from, const std::exception & err)
    {
        // the other transport thread is woken up by the shutdown
        if(connected.exchange(false))
        {
            Application::warning("%s: %s, error: %s", __FUNCTION__, from, err.what());
            stream->shutdown();
            engine.transportLost(std::chrono::steady_clock::now());
        }
    }

    void Connector::readerLoop(void)
    {
        std::vector<uint8_t> buf(64 * 1024);

        try
        {
            while(connected && ! shutdown)
            {
                auto len = stream->recvSome(buf.data(), buf.size());

                if(! engine.recvBytes(buf.data(), len, std::chrono::steady_clock::now()))
                {
                    Application::debug(DebugType::Sock, "%s: %s", __FUNCTION__, "session closed");
                    break;
                }
            }
        }
        catch(const network_error & err)
        {
            transportLost("reader", err);
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            transportLost("reader", err);
        }
    }

    void Connector::writerLoop(void)
    {
        bool idle = false;

        try
        {
            while(connected && ! shutdown)
            {
                auto now = std::chrono::steady_clock::now();
                engine.tick(now);

                bool sent = false;

                while(auto buf = engine.popOutgoing(now))
                {
                    stream->sendRaw(buf->data(), buf->size());
                    sent = true;
                }

                if(sent)
                {
                    stream->sendFlush();
                }

                if(engine.isClosed())
                {
                    Application::info("%s: %s", __FUNCTION__, "session closed, stop transport");
                    connected = false;
                    stream->shutdown();
                    break;
                }

                if(sent)
                {
                    idle = false;
                    continue;
                }

                // queued but not sendable yet: throttled or waiting for the negotiation
                if(idle)
                {
                    std::this_thread::sleep_for(5ms);
                }

                idle = true;
                engine.waitOutgoing(tickInterval.load());
            }
        }
        catch(const network_error & err)
        {
            transportLost("writer", err);
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            transportLost("writer", err);
        }
    }

    void Connector::jobsLoop(void)
    {
        auto lastTick = std::chrono::steady_clock::now();

        while(! shutdown)
        {
            bool busy = false;

            if(connected)
            {
                busy = engine.fileStep();
                engine.inputFlush();
            }
            else if(auto now = std::chrono::steady_clock::now(); tickInterval.load() <= now - lastTick)
            {
                // the writer ticks while attached, the reconnect grace runs out here
                lastTick = now;
                engine.tick(now);
            }

            if(! busy)
            {
                std::this_thread::sleep_for(10ms);
            }
        }
    }
}
