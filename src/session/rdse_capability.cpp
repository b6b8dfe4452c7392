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
#include <algorithm>

#include "rdse_tools.h"
#include "rdse_global.h"
#include "rdse_application.h"
#include "rdse_capability.h"

namespace RDSE
{
    bool Negotiator::isCodecSupported(const CapabilitySet & caps, const VideoCodec & codec)
    {
        return std::find(caps.codecs.begin(), caps.codecs.end(), codec) != caps.codecs.end();
    }

    Capabilities Negotiator::negotiate(const CapabilitySet & host, const CapabilitySet & client,
                                       std::optional<VideoCodec> prefer, uint32_t generation)
    {
        Capabilities res;
        res.generation = generation;

        for(auto & codec : host.codecs)
        {
            if(isCodecSupported(client, codec) &&
                std::find(res.codecs.begin(), res.codecs.end(), codec) == res.codecs.end())
            {
                res.codecs.push_back(codec);
            }
        }

        if(res.codecs.empty())
        {
            Application::error("%s: %s", __FUNCTION__, "no common video codec");
            throw session_error(ErrorCode::CapabilityMismatch, NS_FuncName);
        }

        if(prefer)
        {
            if(auto it = std::find(res.codecs.begin(), res.codecs.end(), *prefer); it != res.codecs.end())
            {
                std::rotate(res.codecs.begin(), it, std::next(it));
            }
            else
            {
                Application::warning("%s: preferred codec not shared: %s", __FUNCTION__, videoCodecName(*prefer));
            }
        }

        auto formats = host.colorFormats & client.colorFormats;

        for(auto format : { ColorFormat::I444, ColorFormat::I420, ColorFormat::RGB32 })
        {
            if(formats & format)
            {
                res.colorFormat = format;
                break;
            }
        }

        res.width = std::min(host.maxWidth, client.maxWidth);
        res.height = std::min(host.maxHeight, client.maxHeight);

        auto modes = host.keyboardModes & client.keyboardModes;

        for(auto mode : { KeyboardMode::Translate, KeyboardMode::Map, KeyboardMode::Legacy })
        {
            if(modes & keyboardModeMask(mode))
            {
                res.keyboard = mode;
                break;
            }
        }

        res.permissions = host.permissions & client.permissions;
        res.quality = std::min(host.quality, client.quality);
        res.fps = std::min(host.fps, client.fps);
        res.resumable = host.resumable && client.resumable;

        Application::debug(DebugType::Sess, "%s: generation: %" PRIu32 ", codec: %s, size: [%" PRIu16 ", %" PRIu16 "], keyboard: %s, permissions: 0x%04" PRIx32,
                           __FUNCTION__, res.generation, videoCodecName(res.codec()), res.width, res.height, keyboardModeName(res.keyboard), res.permissions);

        return res;
    }

    CapabilitySet Negotiator::lowerQuality(const CapabilitySet & declared, const Capabilities & current)
    {
        CapabilitySet res = declared;

        // drop the current codec while an alternative is shared
        if(1 < current.codecs.size())
        {
            auto codec = current.codec();
            res.codecs.erase(std::remove(res.codecs.begin(), res.codecs.end(), codec), res.codecs.end());
            Application::info("%s: drop codec: %s", __FUNCTION__, videoCodecName(codec));
            return res;
        }

        const uint16_t minWidth = 320;
        const uint16_t minHeight = 240;

        if(minWidth < current.width && minHeight < current.height)
        {
            res.maxWidth = std::max<uint16_t>(minWidth, current.width / 2);
            res.maxHeight = std::max<uint16_t>(minHeight, current.height / 2);
            Application::info("%s: resolution: [%" PRIu16 ", %" PRIu16 "]", __FUNCTION__, res.maxWidth, res.maxHeight);
            return res;
        }

        res.quality = std::max(10, current.quality / 2);
        res.maxWidth = current.width;
        res.maxHeight = current.height;
        Application::info("%s: image quality: %" PRIu8, __FUNCTION__, res.quality);

        return res;
    }
}
