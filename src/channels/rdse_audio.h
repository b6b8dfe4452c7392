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

#ifndef _RDSE_AUDIO_
#define _RDSE_AUDIO_

#include <optional>

#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    /// @brief: audio pass-through
    class AudioChannel
    {
        std::optional<Msg::AudioFormat> format;

        PacketSender*   sender = nullptr;
        AudioSink*      sink = nullptr;

        size_t          framesSkipped = 0;

    public:
        explicit AudioChannel(PacketSender*);

        void            setSink(AudioSink*);

        void            sendFormat(const Msg::AudioFormat &);
        bool            sendFrame(uint64_t pts, const BinaryBuf &);

        void            recvMessage(const AudioMsg &);

        const std::optional<Msg::AudioFormat> & currentFormat(void) const { return format; }
        size_t          skipped(void) const { return framesSkipped; }
    };
}

#endif // _RDSE_AUDIO_
