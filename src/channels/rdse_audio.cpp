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

#include "rdse_application.h"
#include "rdse_audio.h"

namespace RDSE
{
    AudioChannel::AudioChannel(PacketSender* ptr) : sender(ptr)
    {
    }

    void AudioChannel::setSink(AudioSink* ptr)
    {
        sink = ptr;
    }

    void AudioChannel::sendFormat(const Msg::AudioFormat & fmt)
    {
        Application::info("%s: codec: %" PRIu8 ", rate: %" PRIu32 ", channels: %" PRIu8, __FUNCTION__, fmt.codec, fmt.sampleRate, fmt.channels);
        format = fmt;
        sender->sendPacket(Packet(ChannelKind::Audio, AudioMsg(fmt)));
    }

    bool AudioChannel::sendFrame(uint64_t pts, const BinaryBuf & data)
    {
        if(! format)
        {
            Application::warning("%s: %s", __FUNCTION__, "format not sent");
            return false;
        }

        return sender->sendPacket(Packet(ChannelKind::Audio, AudioMsg(Msg::AudioFrame{ pts, data })));
    }

    void AudioChannel::recvMessage(const AudioMsg & msg)
    {
        if(auto fmt = std::get_if<Msg::AudioFormat>(& msg))
        {
            Application::info("%s: codec: %" PRIu8 ", rate: %" PRIu32 ", channels: %" PRIu8, __FUNCTION__, fmt->codec, fmt->sampleRate, fmt->channels);
            format = *fmt;

            if(sink)
            {
                sink->audioFormat(*fmt);
            }

            return;
        }

        auto & frame = std::get<Msg::AudioFrame>(msg);

        // frames before the format are useless to the decoder
        if(! format)
        {
            framesSkipped++;
            return;
        }

        if(sink)
        {
            sink->audioFrame(frame);
        }
    }
}
