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

#ifndef _RDSE_TERMINAL_
#define _RDSE_TERMINAL_

#include <map>
#include <set>
#include <string>

#include "rdse_global.h"
#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    struct TerminalSettings
    {
        // outbound bytes pending per terminal
        size_t          bufferLimit = 1024 * 1024;
        // inbound out of order messages per terminal
        size_t          reorderLimit = 64;
        bool            persistent = true;
    };

    namespace Terminal
    {
        struct Session
        {
            uint32_t    id = 0;
            uint16_t    rows = 24;
            uint16_t    cols = 80;
            bool        opened = false;

            uint32_t    expected = 0;
            std::map<uint32_t, TerminalMsg, Mux::SeqLess> pending;
        };
    }

    /// @brief: terminal sessions over the terminal channels
    class TerminalMux
    {
        TerminalSettings settings;
        std::map<uint32_t, Terminal::Session> terminals;
        RecentIds<uint32_t, INTSET<uint32_t>> closed;

        PacketSender*   sender = nullptr;
        TerminalPeer*   peer = nullptr;

        uint32_t        idMask = 0;
        uint32_t        nextId = 1;

    protected:
        void            send(uint32_t id, TerminalMsg &&);
        void            apply(Terminal::Session &, const TerminalMsg &);
        void            release(uint32_t id);

    public:
        TerminalMux(const TerminalSettings &, PacketSender*, bool host);

        void            setPeer(TerminalPeer*);

        /// @brief: request a new terminal
        /// @return terminal id
        uint32_t        open(uint16_t rows, uint16_t cols, const std::string & command);

        /// @brief: outbound data
        /// @return false if refused by backpressure
        bool            write(uint32_t id, const BinaryBuf &);
        bool            resize(uint32_t id, uint16_t rows, uint16_t cols);
        bool            close(uint32_t id, int32_t status = 0);

        void            recvMessage(uint32_t id, uint32_t seq, const TerminalMsg &);

        /// @brief: inbound cursors restart with the channel sequences
        void            resetSequences(void);
        void            closeAll(int32_t status);

        /// @brief: non persistent terminals close, the close reaches the peer after resume
        void            transportLost(void);

        bool            isOpen(uint32_t id) const;
        std::pair<uint16_t, uint16_t> size(uint32_t id) const;
        size_t          count(void) const { return terminals.size(); }
        size_t          tombstones(void) const { return closed.size(); }
        bool            persistent(void) const { return settings.persistent; }
    };
}

#endif // _RDSE_TERMINAL_
