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

#ifndef _RDSE_CLIPBOARD_
#define _RDSE_CLIPBOARD_

#include <map>
#include <optional>

#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    struct ClipboardSettings
    {
        size_t          chunkSize = 64 * 1024;
        size_t          maxSize = 16 * 1024 * 1024;
        size_t          compressThreshold = 1024;
    };

    namespace Clipboard
    {
        struct Update
        {
            uint64_t    timestamp = 0;
            Msg::Role   origin = Msg::Role::Client;
            ClipboardContent content;
        };

        /// @brief: update to blob, uncompressed
        BinaryBuf       serialize(const Update &);
        /// @throw streambuf_error on malformed blob
        Update          parse(const BinaryBuf &);

        struct Incoming
        {
            uint32_t    transfer = 0;
            uint32_t    total = 0;
            bool        compressed = false;
            BinaryBuf   data;
        };
    }

    /// @brief: bidirectional clipboard with echo suppression
    class ClipboardSync
    {
        ClipboardSettings settings;
        Msg::Role       role;

        // sha256 per format
        std::map<ClipboardFormat, BinaryBuf> lastSent;
        std::map<ClipboardFormat, BinaryBuf> lastReceived;

        uint64_t        lastTimestamp = 0;
        Msg::Role       lastOrigin = Msg::Role::Client;

        std::optional<Clipboard::Incoming> incoming;
        uint32_t        nextTransfer = 1;

        PacketSender*   sender = nullptr;
        ClipboardSink*  sink = nullptr;

    protected:
        void            applyIncoming(void);
        bool            accepts(uint64_t timestamp, const Msg::Role & origin) const;

    public:
        ClipboardSync(const ClipboardSettings &, PacketSender*, const Msg::Role &);

        void            setSink(ClipboardSink*);

        /// @brief: local clipboard changed
        /// @return false if nothing was sent
        bool            localChanged(const ClipboardContent &, uint64_t timestamp);
        bool            localChanged(const ClipboardContent &);

        /// @brief: send the current local clipboard, session became active
        bool            syncInitial(void);

        void            recvChunk(const Msg::ClipboardChunk &);
        void            reset(void);

        static uint64_t timestampNow(void);
    };
}

#endif // _RDSE_CLIPBOARD_
