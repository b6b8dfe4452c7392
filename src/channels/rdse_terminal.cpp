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

#include <cinttypes>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_terminal.h"

namespace RDSE
{
    TerminalMux::TerminalMux(const TerminalSettings & st, PacketSender* ptr, bool host)
        : settings(st), sender(ptr), idMask(host ? 0x80000000 : 0)
    {
    }

    void TerminalMux::setPeer(TerminalPeer* ptr)
    {
        peer = ptr;
    }

    void TerminalMux::send(uint32_t id, TerminalMsg && msg)
    {
        sender->sendPacket(Packet(ChannelId(ChannelKind::Terminal, id), std::move(msg)));
    }

    void TerminalMux::release(uint32_t id)
    {
        terminals.erase(id);
        closed.insert(id);
        // queued output still drains, the channel context goes with it
        sender->releaseChannel(ChannelId(ChannelKind::Terminal, id), false);
    }

    uint32_t TerminalMux::open(uint16_t rows, uint16_t cols, const std::string & command)
    {
        auto id = idMask | nextId++;

        auto & term = terminals[id];
        term.id = id;
        term.rows = rows;
        term.cols = cols;
        term.opened = true;

        Application::info("%s: terminal: 0x%08" PRIx32 ", size: [%" PRIu16 ", %" PRIu16 "], command: `%s'",
                          __FUNCTION__, id, rows, cols, command.c_str());

        send(id, Msg::TerminalOpen{ rows, cols, command });
        return id;
    }

    bool TerminalMux::write(uint32_t id, const BinaryBuf & data)
    {
        auto it = terminals.find(id);

        if(it == terminals.end())
        {
            Application::warning("%s: terminal not found: 0x%08" PRIx32, __FUNCTION__, id);
            return false;
        }

        if(settings.bufferLimit < sender->queuedBytes(ChannelId(ChannelKind::Terminal, id)) + data.size())
        {
            Application::debug(DebugType::Term, "%s: terminal: 0x%08" PRIx32 ", buffer limit", __FUNCTION__, id);
            return false;
        }

        send(id, Msg::TerminalData{ data });
        return true;
    }

    bool TerminalMux::resize(uint32_t id, uint16_t rows, uint16_t cols)
    {
        auto it = terminals.find(id);

        if(it == terminals.end())
        {
            return false;
        }

        it->second.rows = rows;
        it->second.cols = cols;

        send(id, Msg::TerminalResize{ rows, cols });
        return true;
    }

    bool TerminalMux::close(uint32_t id, int32_t status)
    {
        if(terminals.count(id) == 0)
        {
            return false;
        }

        Application::info("%s: terminal: 0x%08" PRIx32 ", status: %" PRId32, __FUNCTION__, id, status);

        send(id, Msg::TerminalClose{ status });
        release(id);

        return true;
    }

    void TerminalMux::apply(Terminal::Session & term, const TerminalMsg & msg)
    {
        auto id = term.id;

        if(auto data = std::get_if<Msg::TerminalData>(& msg))
        {
            if(peer)
            {
                peer->terminalData(id, data->data);
            }
        }
        else if(auto resize = std::get_if<Msg::TerminalResize>(& msg))
        {
            term.rows = resize->rows;
            term.cols = resize->cols;

            Application::debug(DebugType::Term, "%s: terminal: 0x%08" PRIx32 ", resize: [%" PRIu16 ", %" PRIu16 "]", __FUNCTION__, id, term.rows, term.cols);

            if(peer)
            {
                peer->terminalResize(id, term.rows, term.cols);
            }
        }
        else if(auto close = std::get_if<Msg::TerminalClose>(& msg))
        {
            Application::info("%s: terminal closed: 0x%08" PRIx32 ", status: %" PRId32, __FUNCTION__, id, close->status);
            release(id);

            if(peer)
            {
                peer->terminalClosed(id, close->status);
            }
        }
        else if(std::holds_alternative<Msg::TerminalOpen>(msg))
        {
            Application::warning("%s: repeated open, terminal: 0x%08" PRIx32, __FUNCTION__, id);
        }
    }

    void TerminalMux::recvMessage(uint32_t id, uint32_t seq, const TerminalMsg & msg)
    {
        if(closed.contains(id))
        {
            // data in flight for a closed terminal
            Application::debug(DebugType::Term, "%s: terminal closed: 0x%08" PRIx32 ", skip seq: %" PRIu32, __FUNCTION__, id, seq);
            return;
        }

        auto it = terminals.find(id);

        if(it == terminals.end())
        {
            auto open = std::get_if<Msg::TerminalOpen>(& msg);

            if(! open)
            {
                Application::debug(DebugType::Term, "%s: unknown terminal: 0x%08" PRIx32, __FUNCTION__, id);
                return;
            }

            bool accept = (id & 0x80000000) != idMask && id != 0;

            if(accept && peer)
            {
                accept = peer->terminalOpen(id, open->rows, open->cols, open->command);
            }

            if(! accept)
            {
                Application::warning("%s: open refused, terminal: 0x%08" PRIx32, __FUNCTION__, id);
                send(id, Msg::TerminalClose{ -1 });
                release(id);
                return;
            }

            auto & term = terminals[id];
            term.id = id;
            term.rows = open->rows;
            term.cols = open->cols;
            term.opened = true;
            term.expected = seq + 1;

            Application::info("%s: terminal: 0x%08" PRIx32 ", size: [%" PRIu16 ", %" PRIu16 "], command: `%s'",
                              __FUNCTION__, id, term.rows, term.cols, open->command.c_str());
            return;
        }

        auto & term = it->second;

        if(std::holds_alternative<Msg::TerminalOpen>(msg) && seq != term.expected)
        {
            // duplicate id from the requester
            Application::warning("%s: duplicate terminal: 0x%08" PRIx32, __FUNCTION__, id);
            close(id, -1);
            return;
        }

        if(Mux::SeqLess()(seq, term.expected))
        {
            Application::debug(DebugType::Term, "%s: terminal: 0x%08" PRIx32 ", stale seq: %" PRIu32, __FUNCTION__, id, seq);
            return;
        }

        if(Mux::SeqLess()(term.expected, seq))
        {
            if(settings.reorderLimit <= term.pending.size())
            {
                Application::error("%s: terminal: 0x%08" PRIx32 ", reorder limit", __FUNCTION__, id);
                throw channel_error(ChannelId(ChannelKind::Terminal, id), "terminal reorder limit");
            }

            term.pending.emplace(seq, msg);
            return;
        }

        apply(term, msg);

        // apply may release the terminal
        while(true)
        {
            auto cur = terminals.find(id);

            if(cur == terminals.end())
            {
                break;
            }

            auto & ctx = cur->second;
            ctx.expected++;

            auto next = ctx.pending.find(ctx.expected);

            if(next == ctx.pending.end())
            {
                break;
            }

            auto val = std::move(next->second);
            ctx.pending.erase(next);
            apply(ctx, val);
        }
    }

    void TerminalMux::resetSequences(void)
    {
        for(auto & pair : terminals)
        {
            pair.second.expected = 0;
            pair.second.pending.clear();
        }
    }

    void TerminalMux::closeAll(int32_t status)
    {
        while(! terminals.empty())
        {
            auto id = terminals.begin()->first;
            release(id);

            if(peer)
            {
                peer->terminalClosed(id, status);
            }
        }
    }

    void TerminalMux::transportLost(void)
    {
        if(settings.persistent)
        {
            return;
        }

        while(! terminals.empty())
        {
            auto id = terminals.begin()->first;
            Application::info("%s: terminal: 0x%08" PRIx32 ", not persistent", __FUNCTION__, id);

            send(id, Msg::TerminalClose{ -1 });
            release(id);

            if(peer)
            {
                peer->terminalClosed(id, -1);
            }
        }
    }

    bool TerminalMux::isOpen(uint32_t id) const
    {
        return terminals.count(id);
    }

    std::pair<uint16_t, uint16_t> TerminalMux::size(uint32_t id) const
    {
        auto it = terminals.find(id);
        return it != terminals.end() ? std::make_pair(it->second.rows, it->second.cols) : std::make_pair<uint16_t, uint16_t>(0, 0);
    }
}
