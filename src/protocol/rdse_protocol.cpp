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
#include <type_traits>

#include "rdse_tools.h"
#include "rdse_global.h"
#include "rdse_application.h"
#include "rdse_protocol.h"

namespace RDSE
{
    const char* channelKindName(const ChannelKind & kind)
    {
        switch(kind)
        {
            case ChannelKind::Control: return "control";
            case ChannelKind::Input: return "input";
            case ChannelKind::Video: return "video";
            case ChannelKind::Audio: return "audio";
            case ChannelKind::Clipboard: return "clipboard";
            case ChannelKind::Terminal: return "terminal";
            case ChannelKind::FileTransfer: return "file";
        }

        return "unknown";
    }

    const char* errorCodeName(const ErrorCode & code)
    {
        switch(code)
        {
            case ErrorCode::None: return "none";
            case ErrorCode::TransportError: return "transport error";
            case ErrorCode::AuthFailed: return "auth failed";
            case ErrorCode::AuthError: return "auth error";
            case ErrorCode::CapabilityMismatch: return "capability mismatch";
            case ErrorCode::ChannelProtocolError: return "channel protocol error";
            case ErrorCode::DigestMismatch: return "digest mismatch";
            case ErrorCode::DecodeFailure: return "decode failure";
            case ErrorCode::ReconnectExpired: return "reconnect expired";
        }

        return "unknown";
    }

    const char* videoCodecName(const VideoCodec & codec)
    {
        switch(codec)
        {
            case VideoCodec::Raw: return "raw";
            case VideoCodec::VP8: return "vp8";
            case VideoCodec::VP9: return "vp9";
            case VideoCodec::AV1: return "av1";
            case VideoCodec::H264: return "h264";
            case VideoCodec::H265: return "h265";
        }

        return "unknown";
    }

    std::optional<VideoCodec> videoCodecFromName(std::string_view name)
    {
        auto lower = Tools::lower(name);

        for(auto codec : { VideoCodec::Raw, VideoCodec::VP8, VideoCodec::VP9, VideoCodec::AV1, VideoCodec::H264, VideoCodec::H265 })
        {
            if(lower == videoCodecName(codec))
            {
                return codec;
            }
        }

        return std::nullopt;
    }

    const char* keyboardModeName(const KeyboardMode & mode)
    {
        switch(mode)
        {
            case KeyboardMode::Legacy: return "legacy";
            case KeyboardMode::Map: return "map";
            case KeyboardMode::Translate: return "translate";
        }

        return "unknown";
    }

    namespace Protocol
    {
        /* body writers */
        void writeString(StreamBuf & sb, std::string_view str)
        {
            if(str.size() > 0xFFFF)
            {
                Application::error("%s: string too long: %lu", __FUNCTION__, str.size());
                throw protocol_error(NS_FuncName);
            }

            sb.writeIntBE16(str.size());
            sb.write(str);
        }

        void writeBytes(StreamBuf & sb, const std::vector<uint8_t> & buf)
        {
            sb.writeIntBE32(buf.size());
            sb.write(buf);
        }

        std::string readString(const StreamBufRef & sb)
        {
            auto len = sb.readIntBE16();
            return len ? sb.readString(len) : std::string();
        }

        BinaryBuf readBytes(const StreamBufRef & sb)
        {
            auto len = sb.readIntBE32();

            if(len > sb.last())
            {
                throw streambuf_error(NS_FuncName);
            }

            return len ? sb.read(len) : BinaryBuf();
        }

        template<typename Enum>
        Enum readEnum(const StreamBufRef & sb, Enum maxval)
        {
            auto val = sb.readInt8();

            if(val > static_cast<uint8_t>(maxval))
            {
                throw streambuf_error(NS_FuncName);
            }

            return static_cast<Enum>(val);
        }

        void writeCodecs(StreamBuf & sb, const std::vector<VideoCodec> & codecs)
        {
            sb.writeInt8(codecs.size());

            for(auto & codec : codecs)
            {
                sb.writeInt8(static_cast<uint8_t>(codec));
            }
        }

        std::vector<VideoCodec> readCodecs(const StreamBufRef & sb)
        {
            std::vector<VideoCodec> codecs(sb.readInt8());

            for(auto & codec : codecs)
            {
                codec = readEnum(sb, VideoCodec::H265);
            }

            return codecs;
        }

        void writeCapabilitySet(StreamBuf & sb, const CapabilitySet & caps)
        {
            writeCodecs(sb, caps.codecs);
            sb.writeInt8(caps.colorFormats);
            sb.writeIntBE16(caps.maxWidth);
            sb.writeIntBE16(caps.maxHeight);
            sb.writeInt8(caps.keyboardModes);
            sb.writeIntBE32(caps.permissions);
            sb.writeInt8(caps.quality);
            sb.writeInt8(caps.fps);
            sb.writeInt8(caps.resumable ? 1 : 0);
        }

        CapabilitySet readCapabilitySet(const StreamBufRef & sb)
        {
            CapabilitySet caps;
            caps.codecs = readCodecs(sb);
            caps.colorFormats = sb.readInt8();
            caps.maxWidth = sb.readIntBE16();
            caps.maxHeight = sb.readIntBE16();
            caps.keyboardModes = sb.readInt8();
            caps.permissions = sb.readIntBE32();
            caps.quality = sb.readInt8();
            caps.fps = sb.readInt8();
            caps.resumable = sb.readInt8();
            return caps;
        }

        /* encode bodies */
        void encodeBody(StreamBuf & sb, const Msg::Hello & msg)
        {
            sb.writeInt8(msg.version);
            sb.writeInt8(static_cast<uint8_t>(msg.role));
            writeString(sb, msg.peerId);
            writeBytes(sb, msg.publicKey);
            writeBytes(sb, msg.resumeToken);
            sb.writeInt8(msg.resumed ? 1 : 0);
        }

        void encodeBody(StreamBuf & sb, const Msg::AuthChallenge & msg)
        {
            writeBytes(sb, msg.salt);
            writeBytes(sb, msg.challenge);
            sb.writeInt8(msg.attemptsLeft);
            sb.writeInt8(msg.otpRequired ? 1 : 0);
        }

        void encodeBody(StreamBuf & sb, const Msg::AuthResponse & msg)
        {
            writeString(sb, msg.username);
            writeBytes(sb, msg.response);
            writeString(sb, msg.otp);
        }

        void encodeBody(StreamBuf & sb, const Msg::AuthResult & msg)
        {
            sb.writeInt8(msg.success ? 1 : 0);
            writeString(sb, msg.reason);
        }

        void encodeBody(StreamBuf & sb, const Msg::CapabilityOffer & msg)
        {
            writeCapabilitySet(sb, msg.caps);
        }

        void encodeBody(StreamBuf & sb, const Msg::CapabilityAnswer & msg)
        {
            sb.writeIntBE32(msg.caps.generation);
            writeCodecs(sb, msg.caps.codecs);
            sb.writeInt8(msg.caps.colorFormat);
            sb.writeIntBE16(msg.caps.width);
            sb.writeIntBE16(msg.caps.height);
            sb.writeInt8(static_cast<uint8_t>(msg.caps.keyboard));
            sb.writeIntBE32(msg.caps.permissions);
            sb.writeInt8(msg.caps.quality);
            sb.writeInt8(msg.caps.fps);
            sb.writeInt8(msg.caps.resumable ? 1 : 0);
        }

        void encodeBody(StreamBuf & sb, const Msg::Renegotiate & msg)
        {
            writeCapabilitySet(sb, msg.caps);
        }

        void encodeBody(StreamBuf & sb, const Msg::KeyframeRequest & msg)
        {
            sb.writeIntBE32(msg.display);
        }

        void encodeBody(StreamBuf & sb, const Msg::DisplayInfo & msg)
        {
            sb.writeIntBE32(msg.display);
            sb.writeIntBE16(msg.width);
            sb.writeIntBE16(msg.height);
        }

        void encodeBody(StreamBuf & sb, const Msg::Notification & msg)
        {
            sb.writeInt8(msg.level);
            writeString(sb, msg.text);
        }

        void encodeBody(StreamBuf & sb, const Msg::SessionClose & msg)
        {
            sb.writeInt8(static_cast<uint8_t>(msg.code));
            writeString(sb, msg.reason);
        }

        void encodeBody(StreamBuf & sb, const Msg::Heartbeat & msg)
        {
            sb.writeIntBE64(msg.timestamp);
        }

        void encodeBody(StreamBuf & sb, const Msg::PluginMessage & msg)
        {
            if(msg.payload.size() > plugin_payload_max)
            {
                Application::error("%s: plugin payload too large: %lu", __FUNCTION__, msg.payload.size());
                throw protocol_error(NS_FuncName);
            }

            writeString(sb, msg.pluginId);
            writeBytes(sb, msg.payload);
        }

        void encodeBody(StreamBuf & sb, const Msg::VideoChunk & msg)
        {
            sb.writeIntBE32(msg.display);
            sb.writeIntBE32(msg.frame);
            sb.writeIntBE64(msg.pts);
            sb.writeInt8(msg.keyframe ? 1 : 0);
            sb.writeInt8(static_cast<uint8_t>(msg.codec));
            sb.writeIntBE16(msg.index);
            sb.writeIntBE16(msg.count);
            writeBytes(sb, msg.payload);
        }

        void encodeBody(StreamBuf & sb, const Msg::KeyEvent & msg)
        {
            sb.writeInt8(static_cast<uint8_t>(msg.mode));
            sb.writeInt8(msg.pressed ? 1 : 0);
            sb.writeIntBE32(msg.code);
            sb.writeIntBE32(msg.modifiers);
        }

        void encodeBody(StreamBuf & sb, const Msg::PointerEvent & msg)
        {
            sb.writeIntBE32(msg.display);
            sb.writeIntBE16(msg.posx);
            sb.writeIntBE16(msg.posy);
            sb.writeInt8(msg.buttons);
            sb.writeIntBE16(static_cast<uint16_t>(msg.wheelx));
            sb.writeIntBE16(static_cast<uint16_t>(msg.wheely));
        }

        void encodeBody(StreamBuf & sb, const Msg::TouchEvent & msg)
        {
            sb.writeIntBE32(msg.display);
            sb.writeIntBE32(msg.touchId);
            sb.writeInt8(static_cast<uint8_t>(msg.phase));
            sb.writeIntBE16(msg.posx);
            sb.writeIntBE16(msg.posy);
        }

        void encodeBody(StreamBuf & sb, const Msg::ClipboardChunk & msg)
        {
            sb.writeIntBE32(msg.transfer);
            sb.writeIntBE32(msg.total);
            sb.writeIntBE32(msg.offset);
            sb.writeInt8(msg.compressed ? 1 : 0);
            writeBytes(sb, msg.payload);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileRequest & msg)
        {
            sb.writeIntBE32(msg.job);
            sb.writeInt8(static_cast<uint8_t>(msg.direction));
            writeString(sb, msg.name);
            sb.writeIntBE64(msg.size);
            sb.writeIntBE32(msg.chunk);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileChunk & msg)
        {
            sb.writeIntBE32(msg.job);
            sb.writeIntBE64(msg.offset);
            writeBytes(sb, msg.payload);
            writeBytes(sb, msg.digest);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileAck & msg)
        {
            sb.writeIntBE32(msg.job);
            sb.writeIntBE64(msg.offset);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileComplete & msg)
        {
            sb.writeIntBE32(msg.job);
            writeBytes(sb, msg.digest);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileRetransmit & msg)
        {
            sb.writeIntBE32(msg.job);
            sb.writeIntBE64(msg.offset);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileResume & msg)
        {
            sb.writeIntBE32(msg.job);
            sb.writeIntBE64(msg.offset);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileCancel & msg)
        {
            sb.writeIntBE32(msg.job);
            writeString(sb, msg.reason);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileVerified & msg)
        {
            sb.writeIntBE32(msg.job);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileDirRequest & msg)
        {
            sb.writeIntBE32(msg.request);
            writeString(sb, msg.path);
        }

        void encodeBody(StreamBuf & sb, const Msg::FileDirReply & msg)
        {
            sb.writeIntBE32(msg.request);
            sb.writeInt8(msg.success ? 1 : 0);
            sb.writeIntBE32(msg.entries.size());

            for(auto & entry : msg.entries)
            {
                writeString(sb, entry.name);
                sb.writeIntBE64(entry.size);
                sb.writeIntBE64(entry.mtime);
                sb.writeInt8(entry.directory ? 1 : 0);
            }
        }

        void encodeBody(StreamBuf & sb, const Msg::TerminalOpen & msg)
        {
            sb.writeIntBE16(msg.rows);
            sb.writeIntBE16(msg.cols);
            writeString(sb, msg.command);
        }

        void encodeBody(StreamBuf & sb, const Msg::TerminalData & msg)
        {
            writeBytes(sb, msg.data);
        }

        void encodeBody(StreamBuf & sb, const Msg::TerminalResize & msg)
        {
            sb.writeIntBE16(msg.rows);
            sb.writeIntBE16(msg.cols);
        }

        void encodeBody(StreamBuf & sb, const Msg::TerminalClose & msg)
        {
            sb.writeIntBE32(static_cast<uint32_t>(msg.status));
        }

        void encodeBody(StreamBuf & sb, const Msg::AudioFormat & msg)
        {
            sb.writeInt8(msg.codec);
            sb.writeIntBE32(msg.sampleRate);
            sb.writeInt8(msg.channels);
        }

        void encodeBody(StreamBuf & sb, const Msg::AudioFrame & msg)
        {
            sb.writeIntBE64(msg.pts);
            writeBytes(sb, msg.data);
        }

        /* decode bodies */
        ControlMsg decodeControl(const MessageType & type, const StreamBufRef & sb)
        {
            switch(type)
            {
                case MessageType::Hello:
                {
                    Msg::Hello msg;
                    msg.version = sb.readInt8();
                    msg.role = readEnum(sb, Msg::Role::Host);
                    msg.peerId = readString(sb);
                    msg.publicKey = readBytes(sb);
                    msg.resumeToken = readBytes(sb);
                    msg.resumed = sb.readInt8();
                    return msg;
                }

                case MessageType::AuthChallenge:
                {
                    Msg::AuthChallenge msg;
                    msg.salt = readBytes(sb);
                    msg.challenge = readBytes(sb);
                    msg.attemptsLeft = sb.readInt8();
                    msg.otpRequired = sb.readInt8();
                    return msg;
                }

                case MessageType::AuthResponse:
                {
                    Msg::AuthResponse msg;
                    msg.username = readString(sb);
                    msg.response = readBytes(sb);
                    msg.otp = readString(sb);
                    return msg;
                }

                case MessageType::AuthResult:
                {
                    Msg::AuthResult msg;
                    msg.success = sb.readInt8();
                    msg.reason = readString(sb);
                    return msg;
                }

                case MessageType::CapabilityOffer:
                    return Msg::CapabilityOffer{ readCapabilitySet(sb) };

                case MessageType::CapabilityAnswer:
                {
                    Msg::CapabilityAnswer msg;
                    msg.caps.generation = sb.readIntBE32();
                    msg.caps.codecs = readCodecs(sb);
                    msg.caps.colorFormat = static_cast<ColorFormat>(sb.readInt8());
                    msg.caps.width = sb.readIntBE16();
                    msg.caps.height = sb.readIntBE16();
                    msg.caps.keyboard = readEnum(sb, KeyboardMode::Translate);
                    msg.caps.permissions = sb.readIntBE32();
                    msg.caps.quality = sb.readInt8();
                    msg.caps.fps = sb.readInt8();
                    msg.caps.resumable = sb.readInt8();
                    return msg;
                }

                case MessageType::Renegotiate:
                    return Msg::Renegotiate{ readCapabilitySet(sb) };

                case MessageType::KeyframeRequest:
                    return Msg::KeyframeRequest{ sb.readIntBE32() };

                case MessageType::DisplayInfo:
                {
                    Msg::DisplayInfo msg;
                    msg.display = sb.readIntBE32();
                    msg.width = sb.readIntBE16();
                    msg.height = sb.readIntBE16();
                    return msg;
                }

                case MessageType::Notification:
                {
                    Msg::Notification msg;
                    msg.level = sb.readInt8();
                    msg.text = readString(sb);
                    return msg;
                }

                case MessageType::SessionClose:
                {
                    Msg::SessionClose msg;
                    msg.code = readEnum(sb, ErrorCode::ReconnectExpired);
                    msg.reason = readString(sb);
                    return msg;
                }

                case MessageType::Heartbeat:
                    return Msg::Heartbeat{ sb.readIntBE64() };

                case MessageType::PluginMessage:
                {
                    Msg::PluginMessage msg;
                    msg.pluginId = readString(sb);
                    msg.payload = readBytes(sb);

                    if(msg.payload.size() > plugin_payload_max)
                    {
                        throw streambuf_error("plugin payload too large");
                    }

                    return msg;
                }

                default:
                    break;
            }

            throw streambuf_error("unknown control message");
        }

        InputMsg decodeInput(const MessageType & type, const StreamBufRef & sb)
        {
            switch(type)
            {
                case MessageType::KeyEvent:
                {
                    Msg::KeyEvent msg;
                    msg.mode = readEnum(sb, KeyboardMode::Translate);
                    msg.pressed = sb.readInt8();
                    msg.code = sb.readIntBE32();
                    msg.modifiers = sb.readIntBE32();
                    return msg;
                }

                case MessageType::PointerEvent:
                {
                    Msg::PointerEvent msg;
                    msg.display = sb.readIntBE32();
                    msg.posx = sb.readIntBE16();
                    msg.posy = sb.readIntBE16();
                    msg.buttons = sb.readInt8();
                    msg.wheelx = static_cast<int16_t>(sb.readIntBE16());
                    msg.wheely = static_cast<int16_t>(sb.readIntBE16());
                    return msg;
                }

                case MessageType::TouchEvent:
                {
                    Msg::TouchEvent msg;
                    msg.display = sb.readIntBE32();
                    msg.touchId = sb.readIntBE32();
                    msg.phase = readEnum(sb, Msg::TouchPhase::End);
                    msg.posx = sb.readIntBE16();
                    msg.posy = sb.readIntBE16();
                    return msg;
                }

                default:
                    break;
            }

            throw streambuf_error("unknown input message");
        }

        VideoMsg decodeVideo(const MessageType & type, const StreamBufRef & sb)
        {
            if(type != MessageType::VideoChunk)
            {
                throw streambuf_error("unknown video message");
            }

            Msg::VideoChunk msg;
            msg.display = sb.readIntBE32();
            msg.frame = sb.readIntBE32();
            msg.pts = sb.readIntBE64();
            msg.keyframe = sb.readInt8();
            msg.codec = readEnum(sb, VideoCodec::H265);
            msg.index = sb.readIntBE16();
            msg.count = sb.readIntBE16();
            msg.payload = readBytes(sb);

            if(msg.count == 0 || msg.index >= msg.count)
            {
                throw streambuf_error("invalid chunk index");
            }

            return msg;
        }

        AudioMsg decodeAudio(const MessageType & type, const StreamBufRef & sb)
        {
            if(type == MessageType::AudioFormat)
            {
                Msg::AudioFormat msg;
                msg.codec = sb.readInt8();
                msg.sampleRate = sb.readIntBE32();
                msg.channels = sb.readInt8();
                return msg;
            }

            if(type == MessageType::AudioFrame)
            {
                Msg::AudioFrame msg;
                msg.pts = sb.readIntBE64();
                msg.data = readBytes(sb);
                return msg;
            }

            throw streambuf_error("unknown audio message");
        }

        ClipboardMsg decodeClipboard(const MessageType & type, const StreamBufRef & sb)
        {
            if(type != MessageType::ClipboardChunk)
            {
                throw streambuf_error("unknown clipboard message");
            }

            Msg::ClipboardChunk msg;
            msg.transfer = sb.readIntBE32();
            msg.total = sb.readIntBE32();
            msg.offset = sb.readIntBE32();
            msg.compressed = sb.readInt8();
            msg.payload = readBytes(sb);
            return msg;
        }

        TerminalMsg decodeTerminal(const MessageType & type, const StreamBufRef & sb)
        {
            switch(type)
            {
                case MessageType::TerminalOpen:
                {
                    Msg::TerminalOpen msg;
                    msg.rows = sb.readIntBE16();
                    msg.cols = sb.readIntBE16();
                    msg.command = readString(sb);
                    return msg;
                }

                case MessageType::TerminalData:
                    return Msg::TerminalData{ readBytes(sb) };

                case MessageType::TerminalResize:
                {
                    Msg::TerminalResize msg;
                    msg.rows = sb.readIntBE16();
                    msg.cols = sb.readIntBE16();
                    return msg;
                }

                case MessageType::TerminalClose:
                    return Msg::TerminalClose{ static_cast<int32_t>(sb.readIntBE32()) };

                default:
                    break;
            }

            throw streambuf_error("unknown terminal message");
        }

        FileMsg decodeFile(const MessageType & type, const StreamBufRef & sb)
        {
            switch(type)
            {
                case MessageType::FileRequest:
                {
                    Msg::FileRequest msg;
                    msg.job = sb.readIntBE32();
                    msg.direction = readEnum(sb, Msg::FileDirection::Pull);
                    msg.name = readString(sb);
                    msg.size = sb.readIntBE64();
                    msg.chunk = sb.readIntBE32();
                    return msg;
                }

                case MessageType::FileChunk:
                {
                    Msg::FileChunk msg;
                    msg.job = sb.readIntBE32();
                    msg.offset = sb.readIntBE64();
                    msg.payload = readBytes(sb);
                    msg.digest = readBytes(sb);
                    return msg;
                }

                case MessageType::FileAck:
                {
                    Msg::FileAck msg;
                    msg.job = sb.readIntBE32();
                    msg.offset = sb.readIntBE64();
                    return msg;
                }

                case MessageType::FileComplete:
                {
                    Msg::FileComplete msg;
                    msg.job = sb.readIntBE32();
                    msg.digest = readBytes(sb);
                    return msg;
                }

                case MessageType::FileRetransmit:
                {
                    Msg::FileRetransmit msg;
                    msg.job = sb.readIntBE32();
                    msg.offset = sb.readIntBE64();
                    return msg;
                }

                case MessageType::FileResume:
                {
                    Msg::FileResume msg;
                    msg.job = sb.readIntBE32();
                    msg.offset = sb.readIntBE64();
                    return msg;
                }

                case MessageType::FileCancel:
                {
                    Msg::FileCancel msg;
                    msg.job = sb.readIntBE32();
                    msg.reason = readString(sb);
                    return msg;
                }

                case MessageType::FileVerified:
                    return Msg::FileVerified{ sb.readIntBE32() };

                case MessageType::FileDirRequest:
                {
                    Msg::FileDirRequest msg;
                    msg.request = sb.readIntBE32();
                    msg.path = readString(sb);
                    return msg;
                }

                case MessageType::FileDirReply:
                {
                    Msg::FileDirReply msg;
                    msg.request = sb.readIntBE32();
                    msg.success = sb.readInt8();
                    auto count = sb.readIntBE32();

                    // smallest entry: name length + size + mtime + flag
                    if(count > sb.last() / 19)
                    {
                        throw streambuf_error("invalid entries count");
                    }

                    msg.entries.resize(count);

                    for(auto & entry : msg.entries)
                    {
                        entry.name = readString(sb);
                        entry.size = sb.readIntBE64();
                        entry.mtime = sb.readIntBE64();
                        entry.directory = sb.readInt8();
                    }

                    return msg;
                }

                default:
                    break;
            }

            throw streambuf_error("unknown file message");
        }

        MessageType messageType(const Message & msg)
        {
            return std::visit([](auto & category)
            {
                return std::visit([](auto & body)
                {
                    return std::decay_t<decltype(body)>::type;
                }, category);
            }, msg);
        }

        const char* messageTypeName(const MessageType & type)
        {
            switch(type)
            {
                case MessageType::Hello: return "Hello";
                case MessageType::AuthChallenge: return "AuthChallenge";
                case MessageType::AuthResponse: return "AuthResponse";
                case MessageType::AuthResult: return "AuthResult";
                case MessageType::CapabilityOffer: return "CapabilityOffer";
                case MessageType::CapabilityAnswer: return "CapabilityAnswer";
                case MessageType::Renegotiate: return "Renegotiate";
                case MessageType::KeyframeRequest: return "KeyframeRequest";
                case MessageType::DisplayInfo: return "DisplayInfo";
                case MessageType::Notification: return "Notification";
                case MessageType::SessionClose: return "SessionClose";
                case MessageType::Heartbeat: return "Heartbeat";
                case MessageType::PluginMessage: return "PluginMessage";
                case MessageType::VideoChunk: return "VideoChunk";
                case MessageType::KeyEvent: return "KeyEvent";
                case MessageType::PointerEvent: return "PointerEvent";
                case MessageType::TouchEvent: return "TouchEvent";
                case MessageType::ClipboardChunk: return "ClipboardChunk";
                case MessageType::FileRequest: return "FileRequest";
                case MessageType::FileChunk: return "FileChunk";
                case MessageType::FileAck: return "FileAck";
                case MessageType::FileComplete: return "FileComplete";
                case MessageType::FileRetransmit: return "FileRetransmit";
                case MessageType::FileResume: return "FileResume";
                case MessageType::FileCancel: return "FileCancel";
                case MessageType::FileVerified: return "FileVerified";
                case MessageType::FileDirRequest: return "FileDirRequest";
                case MessageType::FileDirReply: return "FileDirReply";
                case MessageType::TerminalOpen: return "TerminalOpen";
                case MessageType::TerminalData: return "TerminalData";
                case MessageType::TerminalResize: return "TerminalResize";
                case MessageType::TerminalClose: return "TerminalClose";
                case MessageType::AudioFormat: return "AudioFormat";
                case MessageType::AudioFrame: return "AudioFrame";
            }

            return "Unknown";
        }

        BinaryBuf encode(const Packet & pkt)
        {
            if(pkt.msg.index() != static_cast<size_t>(pkt.channel.kind))
            {
                Application::error("%s: message category mismatch, channel: %s", __FUNCTION__, channelKindName(pkt.channel.kind));
                throw protocol_error(NS_FuncName);
            }

            StreamBuf sb(256);

            // length placeholder
            sb.writeIntBE32(0);
            sb.writeInt8(protocol_version);
            sb.writeInt8(static_cast<uint8_t>(messageType(pkt.msg)));
            sb.writeInt8(static_cast<uint8_t>(pkt.channel.kind));
            sb.writeIntBE32(pkt.channel.sub);
            sb.writeIntBE32(pkt.seq);

            std::visit([&](auto & category)
            {
                std::visit([&](auto & body)
                {
                    encodeBody(sb, body);
                }, category);
            }, pkt.msg);

            auto & raw = sb.rawbuf();
            uint32_t len = raw.size() - 4;

            raw[0] = len >> 24;
            raw[1] = len >> 16;
            raw[2] = len >> 8;
            raw[3] = len;

            return std::move(raw);
        }

        Packet decode(const uint8_t* ptr, size_t len)
        {
            StreamBufRef sb(ptr, len);

            if(sb.last() < header_size - 4)
            {
                Application::error("%s: short record: %lu", __FUNCTION__, len);
                throw protocol_error(NS_FuncName);
            }

            auto version = sb.readInt8();

            if(version != protocol_version)
            {
                Application::error("%s: unsupported version: 0x%02" PRIx8, __FUNCTION__, version);
                throw protocol_error(NS_FuncName);
            }

            auto type = static_cast<MessageType>(sb.readInt8());
            auto kind = sb.readInt8();

            if(kind > static_cast<uint8_t>(ChannelKind::FileTransfer))
            {
                Application::error("%s: unknown channel kind: 0x%02" PRIx8, __FUNCTION__, kind);
                throw protocol_error(NS_FuncName);
            }

            Packet pkt;
            pkt.channel = ChannelId(static_cast<ChannelKind>(kind), sb.readIntBE32());
            pkt.seq = sb.readIntBE32();

            try
            {
                switch(pkt.channel.kind)
                {
                    case ChannelKind::Control:
                        pkt.msg = decodeControl(type, sb);
                        break;

                    case ChannelKind::Input:
                        pkt.msg = decodeInput(type, sb);
                        break;

                    case ChannelKind::Video:
                        pkt.msg = decodeVideo(type, sb);
                        break;

                    case ChannelKind::Audio:
                        pkt.msg = decodeAudio(type, sb);
                        break;

                    case ChannelKind::Clipboard:
                        pkt.msg = decodeClipboard(type, sb);
                        break;

                    case ChannelKind::Terminal:
                        pkt.msg = decodeTerminal(type, sb);
                        break;

                    case ChannelKind::FileTransfer:
                        pkt.msg = decodeFile(type, sb);
                        break;
                }
            }
            catch(const streambuf_error & err)
            {
                Application::warning("%s: malformed body, type: 0x%02" PRIx8 ", channel: %s/%" PRIu32 ", error: %s",
                                     __FUNCTION__, static_cast<uint8_t>(type), channelKindName(pkt.channel.kind), pkt.channel.sub, err.what());
                throw channel_error(pkt.channel, err.what());
            }

            if(sb.last())
            {
                Application::warning("%s: trailing bytes: %lu, type: %s", __FUNCTION__, sb.last(), messageTypeName(type));
                throw channel_error(pkt.channel, "trailing bytes");
            }

            return pkt;
        }

        /* FrameReader */
        void FrameReader::push(const uint8_t* ptr, size_t len)
        {
            buf.shrink();
            buf.write(ptr, len);
        }

        void FrameReader::push(const std::vector<uint8_t> & v)
        {
            push(v.data(), v.size());
        }

        void FrameReader::reset(void)
        {
            buf.reset({});
        }

        std::optional<Packet> FrameReader::next(void)
        {
            if(buf.last() < 4)
            {
                return std::nullopt;
            }

            auto & raw = buf.rawbuf();
            auto pos = buf.tell();

            uint32_t len = (static_cast<uint32_t>(raw[pos]) << 24) | (static_cast<uint32_t>(raw[pos + 1]) << 16) |
                           (static_cast<uint32_t>(raw[pos + 2]) << 8) | raw[pos + 3];

            if(len < header_size - 4 || len > frameMax)
            {
                Application::error("%s: invalid frame length: %" PRIu32, __FUNCTION__, len);
                throw protocol_error(NS_FuncName);
            }

            if(buf.last() < 4 + len)
            {
                return std::nullopt;
            }

            buf.skip(4);
            auto record = raw.data() + buf.tell();

            // consume the frame before decoding, a malformed body skips only itself
            buf.skip(len);

            return decode(record, len);
        }
    }
}
