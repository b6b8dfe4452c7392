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
#include "rdse_application.h"
#include "rdse_engine_config.h"

using namespace std::chrono_literals;

namespace RDSE
{
    uint32_t permissionFromName(std::string_view name)
    {
        auto lower = Tools::lower(name);

        if(lower == "keyboard") return PermKeyboard;
        if(lower == "clipboard") return PermClipboard;
        if(lower == "file-transfer") return PermFileTransfer;
        if(lower == "audio") return PermAudio;
        if(lower == "terminal") return PermTerminal;
        if(lower == "all") return PermAll;

        return 0;
    }

    std::optional<ColorFormat> colorFormatFromName(std::string_view name)
    {
        auto lower = Tools::lower(name);

        if(lower == "rgb32") return ColorFormat::RGB32;
        if(lower == "i420") return ColorFormat::I420;
        if(lower == "i444") return ColorFormat::I444;

        return std::nullopt;
    }

    std::optional<KeyboardMode> keyboardModeFromName(std::string_view name)
    {
        auto lower = Tools::lower(name);

        for(auto mode : { KeyboardMode::Legacy, KeyboardMode::Map, KeyboardMode::Translate })
        {
            if(lower == keyboardModeName(mode))
            {
                return mode;
            }
        }

        return std::nullopt;
    }

    CapabilitySet EngineConfig::defaultDeclaration(void)
    {
        CapabilitySet caps;
        caps.codecs = { VideoCodec::H264, VideoCodec::VP9, VideoCodec::VP8, VideoCodec::AV1, VideoCodec::H265, VideoCodec::Raw };
        caps.colorFormats = ColorFormat::RGB32 | ColorFormat::I420 | ColorFormat::I444;
        caps.maxWidth = 3840;
        caps.maxHeight = 2160;
        caps.keyboardModes = keyboardModeMask(KeyboardMode::Legacy) | keyboardModeMask(KeyboardMode::Map) | keyboardModeMask(KeyboardMode::Translate);
        caps.permissions = PermAll;
        caps.quality = 100;
        caps.fps = 30;
        caps.resumable = true;
        return caps;
    }

    template<typename Duration>
    Duration configDuration(const JsonObject & jo, std::string_view key, const Duration & def)
    {
        auto val = jo.getInteger(key, def.count());

        if(val < 0)
        {
            Application::warning("%s: invalid value, key: `%s', value: %d", __FUNCTION__, key.data(), val);
            return def;
        }

        return Duration(val);
    }

    size_t configSize(const JsonObject & jo, std::string_view key, size_t def)
    {
        auto val = jo.getInteger(key, def);

        if(val < 0)
        {
            Application::warning("%s: invalid value, key: `%s', value: %d", __FUNCTION__, key.data(), val);
            return def;
        }

        return val;
    }

    EngineConfig EngineConfig::fromJson(const JsonObject & jo, const Msg::Role & role)
    {
        EngineConfig conf;
        auto & caps = conf.session.declared;

        caps = defaultDeclaration();

        conf.session.role = role;
        conf.session.peerId = jo.getString("peer:id");
        conf.session.authRetries = std::max(1, jo.getInteger("auth:retries", conf.session.authRetries));
        conf.session.otpRequired = jo.getBoolean("auth:otp:required", conf.session.otpRequired);
        conf.session.handshakeTimeout = configDuration(jo, "session:handshake:timeout", conf.session.handshakeTimeout);
        conf.session.reconnectGrace = configDuration(jo, "session:reconnect:grace", conf.session.reconnectGrace);
        conf.session.heartbeatInterval = configDuration(jo, "session:heartbeat:interval", conf.session.heartbeatInterval);
        conf.session.readTimeout = configDuration(jo, "session:read:timeout", conf.session.readTimeout);

        if(auto codec = jo.getString("codec-preference"); ! codec.empty())
        {
            conf.session.codecPreference = videoCodecFromName(codec);

            if(! conf.session.codecPreference)
            {
                Application::warning("%s: unknown codec: `%s'", __FUNCTION__, codec.c_str());
            }
        }

        // local declaration
        if(jo.hasKey("caps:codecs"))
        {
            caps.codecs.clear();

            for(auto & name : jo.getStdList<std::string>("caps:codecs"))
            {
                if(auto codec = videoCodecFromName(name))
                {
                    caps.codecs.push_back(*codec);
                }
                else
                {
                    Application::warning("%s: unknown codec: `%s'", __FUNCTION__, name.c_str());
                }
            }
        }

        if(jo.hasKey("caps:color:formats"))
        {
            caps.colorFormats = 0;

            for(auto & name : jo.getStdList<std::string>("caps:color:formats"))
            {
                if(auto format = colorFormatFromName(name))
                {
                    caps.colorFormats |= *format;
                }
            }

            if(caps.colorFormats == 0)
            {
                caps.colorFormats = ColorFormat::RGB32;
            }
        }

        if(jo.hasKey("caps:keyboard:modes"))
        {
            caps.keyboardModes = keyboardModeMask(KeyboardMode::Legacy);

            for(auto & name : jo.getStdList<std::string>("caps:keyboard:modes"))
            {
                if(auto mode = keyboardModeFromName(name))
                {
                    caps.keyboardModes |= keyboardModeMask(*mode);
                }
            }
        }

        // one mode only, legacy stays as fallback
        if(auto name = jo.getString("keyboard-mode"); ! name.empty())
        {
            if(auto mode = keyboardModeFromName(name))
            {
                caps.keyboardModes = keyboardModeMask(KeyboardMode::Legacy) | keyboardModeMask(*mode);
            }
        }

        if(jo.hasKey("caps:permissions"))
        {
            caps.permissions = 0;

            for(auto & name : jo.getStdList<std::string>("caps:permissions"))
            {
                caps.permissions |= permissionFromName(name);
            }
        }

        if(jo.getBoolean("disable-audio"))
        {
            caps.permissions &= ~PermAudio;
        }

        if(jo.getBoolean("disable-clipboard"))
        {
            caps.permissions &= ~PermClipboard;
        }

        caps.maxWidth = std::clamp(jo.getInteger("caps:max:width", caps.maxWidth), 0, 0xFFFF);
        caps.maxHeight = std::clamp(jo.getInteger("caps:max:height", caps.maxHeight), 0, 0xFFFF);
        caps.fps = std::clamp(jo.getInteger("caps:fps", caps.fps), 1, 120);
        caps.resumable = jo.getBoolean("caps:resumable", caps.resumable);

        auto quality = Tools::lower(jo.getString("image-quality", "best"));

        if(quality == "balanced")
        {
            caps.quality = 70;
        }
        else if(quality == "low")
        {
            caps.quality = 50;
        }
        else if(quality == "custom")
        {
            caps.quality = std::clamp(jo.getInteger("custom-image-quality", 50), 10, 100);
        }

        // multiplexer
        conf.mux.videoDepth = std::max<size_t>(1, configSize(jo, "mux:video:depth", conf.mux.videoDepth));
        conf.mux.fileShare = std::clamp(jo.getDouble("mux:file:share", conf.mux.fileShare), 0.01, 1.0);
        conf.mux.bandwidth = configSize(jo, "mux:bandwidth", conf.mux.bandwidth);
        conf.mux.reorderWindow = std::max<size_t>(1, configSize(jo, "mux:reorder:window", conf.mux.reorderWindow));
        conf.frameMax = std::max<size_t>(Protocol::header_size, configSize(jo, "proto:frame:max", conf.frameMax));

        // video
        conf.video.chunkSize = std::max<size_t>(1024, configSize(jo, "video:chunk:size", conf.video.chunkSize));
        conf.video.keyframeTimeout = configDuration(jo, "video:keyframe:timeout", conf.video.keyframeTimeout);
        conf.video.decodeFailures = std::max(1, jo.getInteger("video:decode:failures", conf.video.decodeFailures));
        conf.video.frameMax = conf.frameMax;

        // file
        conf.file.chunkSize = std::max<size_t>(1024, configSize(jo, "file:chunk:size", conf.file.chunkSize));
        conf.file.window = std::max<size_t>(1, configSize(jo, "file:window", conf.file.window));
        conf.file.digestInterval = configSize(jo, "file:digest:interval", conf.file.digestInterval);
        conf.file.retransmitMax = std::max(0, jo.getInteger("file:retransmit:max", conf.file.retransmitMax));
        conf.fileRoot = jo.getString("file:root");

        // clipboard
        conf.clipboard.chunkSize = std::max<size_t>(1024, configSize(jo, "clipboard:chunk:size", conf.clipboard.chunkSize));
        conf.clipboard.maxSize = configSize(jo, "clipboard:max:size", conf.clipboard.maxSize);
        conf.syncInitClipboard = jo.getBoolean("sync-init-clipboard", conf.syncInitClipboard);

        // terminal
        conf.terminal.bufferLimit = configSize(jo, "terminal:buffer:limit", conf.terminal.bufferLimit);
        conf.terminal.persistent = jo.getBoolean("terminal-persistent", conf.terminal.persistent);

        // input
        conf.input.swapMouseButtons = jo.getBoolean("swap-left-right-mouse", conf.input.swapMouseButtons);
        conf.input.reverseMouseWheel = jo.getBoolean("reverse-mouse-wheel", conf.input.reverseMouseWheel);
        conf.input.viewOnly = jo.getBoolean("view-only", conf.input.viewOnly);

        Application::debug(DebugType::App, "%s: role: %s, codecs: %lu, permissions: 0x%04" PRIx32 ", quality: %" PRIu8,
                           __FUNCTION__, (role == Msg::Role::Host ? "host" : "client"), caps.codecs.size(), caps.permissions, caps.quality);

        return conf;
    }
}
