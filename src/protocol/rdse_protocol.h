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

#ifndef _RDSE_PROTOCOL_
#define _RDSE_PROTOCOL_

#include <chrono>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <stdexcept>

#include "rdse_streambuf.h"

namespace RDSE
{
    using TimePoint = std::chrono::steady_clock::time_point;

    struct protocol_error : public std::runtime_error
    {
        explicit protocol_error(const std::string & what) : std::runtime_error(what){}
        explicit protocol_error(const char* what) : std::runtime_error(what){}
    };

    enum class ChannelKind : uint8_t
    {
        Control = 0, Input = 1, Video = 2, Audio = 3, Clipboard = 4, Terminal = 5, FileTransfer = 6
    };

    const char* channelKindName(const ChannelKind &);

    struct ChannelId
    {
        ChannelKind kind = ChannelKind::Control;
        uint32_t sub = 0;

        ChannelId() = default;
        ChannelId(const ChannelKind & k, uint32_t s = 0) : kind(k), sub(s) {}

        bool operator==(const ChannelId & id) const { return kind == id.kind && sub == id.sub; }
        bool operator!=(const ChannelId & id) const { return kind != id.kind || sub != id.sub; }
        bool operator<(const ChannelId & id) const { return kind != id.kind ? kind < id.kind : sub < id.sub; }

        uint64_t key(void) const { return (static_cast<uint64_t>(kind) << 32) | sub; }
    };

    /// body malformed for a known channel
    struct channel_error : public std::runtime_error
    {
        ChannelId channel;

        channel_error(const ChannelId & id, const std::string & what) : std::runtime_error(what), channel(id) {}
    };

    enum class ErrorCode : uint8_t
    {
        None = 0,
        TransportError = 1,
        AuthFailed = 2,
        AuthError = 3,
        CapabilityMismatch = 4,
        ChannelProtocolError = 5,
        DigestMismatch = 6,
        DecodeFailure = 7,
        ReconnectExpired = 8
    };

    const char* errorCodeName(const ErrorCode &);

    enum class MessageType : uint8_t
    {
        Hello = 0x01,
        AuthChallenge = 0x02,
        AuthResponse = 0x03,
        AuthResult = 0x04,
        CapabilityOffer = 0x05,
        CapabilityAnswer = 0x06,
        Renegotiate = 0x07,
        KeyframeRequest = 0x08,
        DisplayInfo = 0x09,
        Notification = 0x0A,
        SessionClose = 0x0B,
        Heartbeat = 0x0E,
        PluginMessage = 0x0F,

        VideoChunk = 0x20,

        KeyEvent = 0x30,
        PointerEvent = 0x31,
        TouchEvent = 0x32,

        ClipboardChunk = 0x40,

        FileRequest = 0x50,
        FileChunk = 0x51,
        FileAck = 0x52,
        FileComplete = 0x53,
        FileRetransmit = 0x54,
        FileResume = 0x55,
        FileCancel = 0x56,
        FileVerified = 0x57,
        FileDirRequest = 0x58,
        FileDirReply = 0x59,

        TerminalOpen = 0x60,
        TerminalData = 0x61,
        TerminalResize = 0x62,
        TerminalClose = 0x63,

        AudioFormat = 0x70,
        AudioFrame = 0x71
    };

    enum class VideoCodec : uint8_t { Raw = 0, VP8 = 1, VP9 = 2, AV1 = 3, H264 = 4, H265 = 5 };
    const char* videoCodecName(const VideoCodec &);
    std::optional<VideoCodec> videoCodecFromName(std::string_view);

    enum ColorFormat : uint8_t { RGB32 = 0x01, I420 = 0x02, I444 = 0x04 };

    enum class KeyboardMode : uint8_t { Legacy = 0, Map = 1, Translate = 2 };
    const char* keyboardModeName(const KeyboardMode &);

    inline uint8_t keyboardModeMask(const KeyboardMode & mode) { return 1 << static_cast<uint8_t>(mode); }

    enum Permission : uint32_t
    {
        PermKeyboard = 0x0001,
        PermClipboard = 0x0002,
        PermFileTransfer = 0x0004,
        PermAudio = 0x0008,
        PermTerminal = 0x0010,
        PermAll = 0x001F
    };

    /// declared features of one peer
    struct CapabilitySet
    {
        std::vector<VideoCodec> codecs;
        uint8_t colorFormats = ColorFormat::RGB32;
        uint16_t maxWidth = 0;
        uint16_t maxHeight = 0;
        uint8_t keyboardModes = 0x01;
        uint32_t permissions = 0;
        uint8_t quality = 100;
        uint8_t fps = 30;
        bool resumable = false;
    };

    /// negotiated snapshot, never modified after creation
    struct Capabilities
    {
        uint32_t generation = 0;
        std::vector<VideoCodec> codecs;
        ColorFormat colorFormat = ColorFormat::RGB32;
        uint16_t width = 0;
        uint16_t height = 0;
        KeyboardMode keyboard = KeyboardMode::Legacy;
        uint32_t permissions = 0;
        uint8_t quality = 100;
        uint8_t fps = 30;
        bool resumable = false;

        VideoCodec codec(void) const { return codecs.empty() ? VideoCodec::Raw : codecs.front(); }
        bool allowed(uint32_t perm) const { return (permissions & perm) == perm; }
    };

    namespace Msg
    {
        enum class Role : uint8_t { Client = 0, Host = 1 };

        /* control */
        struct Hello
        {
            static constexpr MessageType type = MessageType::Hello;
            uint8_t version = 0;
            Role role = Role::Client;
            std::string peerId;
            BinaryBuf publicKey;
            BinaryBuf resumeToken;
            bool resumed = false;
        };

        struct AuthChallenge
        {
            static constexpr MessageType type = MessageType::AuthChallenge;
            BinaryBuf salt;
            BinaryBuf challenge;
            uint8_t attemptsLeft = 0;
            bool otpRequired = false;
        };

        struct AuthResponse
        {
            static constexpr MessageType type = MessageType::AuthResponse;
            std::string username;
            BinaryBuf response;
            std::string otp;
        };

        struct AuthResult
        {
            static constexpr MessageType type = MessageType::AuthResult;
            bool success = false;
            std::string reason;
        };

        struct CapabilityOffer
        {
            static constexpr MessageType type = MessageType::CapabilityOffer;
            CapabilitySet caps;
        };

        struct CapabilityAnswer
        {
            static constexpr MessageType type = MessageType::CapabilityAnswer;
            Capabilities caps;
        };

        struct Renegotiate
        {
            static constexpr MessageType type = MessageType::Renegotiate;
            CapabilitySet caps;
        };

        struct KeyframeRequest
        {
            static constexpr MessageType type = MessageType::KeyframeRequest;
            uint32_t display = 0;
        };

        struct DisplayInfo
        {
            static constexpr MessageType type = MessageType::DisplayInfo;
            uint32_t display = 0;
            uint16_t width = 0;
            uint16_t height = 0;
        };

        struct Notification
        {
            static constexpr MessageType type = MessageType::Notification;
            uint8_t level = 0;
            std::string text;
        };

        struct SessionClose
        {
            static constexpr MessageType type = MessageType::SessionClose;
            ErrorCode code = ErrorCode::None;
            std::string reason;
        };

        struct Heartbeat
        {
            static constexpr MessageType type = MessageType::Heartbeat;
            uint64_t timestamp = 0;
        };

        struct PluginMessage
        {
            static constexpr MessageType type = MessageType::PluginMessage;
            std::string pluginId;
            BinaryBuf payload;
        };

        /* video */
        struct VideoChunk
        {
            static constexpr MessageType type = MessageType::VideoChunk;
            uint32_t display = 0;
            uint32_t frame = 0;
            uint64_t pts = 0;
            bool keyframe = false;
            VideoCodec codec = VideoCodec::Raw;
            uint16_t index = 0;
            uint16_t count = 1;
            BinaryBuf payload;
        };

        /* input */
        struct KeyEvent
        {
            static constexpr MessageType type = MessageType::KeyEvent;
            KeyboardMode mode = KeyboardMode::Legacy;
            bool pressed = false;
            uint32_t code = 0;
            uint32_t modifiers = 0;
        };

        struct PointerEvent
        {
            static constexpr MessageType type = MessageType::PointerEvent;
            uint32_t display = 0;
            uint16_t posx = 0;
            uint16_t posy = 0;
            uint8_t buttons = 0;
            int16_t wheelx = 0;
            int16_t wheely = 0;
        };

        enum class TouchPhase : uint8_t { Begin = 0, Move = 1, End = 2 };

        struct TouchEvent
        {
            static constexpr MessageType type = MessageType::TouchEvent;
            uint32_t display = 0;
            uint32_t touchId = 0;
            TouchPhase phase = TouchPhase::Begin;
            uint16_t posx = 0;
            uint16_t posy = 0;
        };

        /* clipboard */
        struct ClipboardChunk
        {
            static constexpr MessageType type = MessageType::ClipboardChunk;
            uint32_t transfer = 0;
            uint32_t total = 0;
            uint32_t offset = 0;
            bool compressed = false;
            BinaryBuf payload;
        };

        /* file transfer */
        enum class FileDirection : uint8_t { Push = 0, Pull = 1 };

        struct FileRequest
        {
            static constexpr MessageType type = MessageType::FileRequest;
            uint32_t job = 0;
            FileDirection direction = FileDirection::Push;
            std::string name;
            uint64_t size = 0;
            uint32_t chunk = 0;
        };

        struct FileChunk
        {
            static constexpr MessageType type = MessageType::FileChunk;
            uint32_t job = 0;
            uint64_t offset = 0;
            BinaryBuf payload;
            BinaryBuf digest;
        };

        struct FileAck
        {
            static constexpr MessageType type = MessageType::FileAck;
            uint32_t job = 0;
            uint64_t offset = 0;
        };

        struct FileComplete
        {
            static constexpr MessageType type = MessageType::FileComplete;
            uint32_t job = 0;
            BinaryBuf digest;
        };

        struct FileRetransmit
        {
            static constexpr MessageType type = MessageType::FileRetransmit;
            uint32_t job = 0;
            uint64_t offset = 0;
        };

        struct FileResume
        {
            static constexpr MessageType type = MessageType::FileResume;
            uint32_t job = 0;
            uint64_t offset = 0;
        };

        struct FileCancel
        {
            static constexpr MessageType type = MessageType::FileCancel;
            uint32_t job = 0;
            std::string reason;
        };

        struct FileVerified
        {
            static constexpr MessageType type = MessageType::FileVerified;
            uint32_t job = 0;
        };

        struct FileDirRequest
        {
            static constexpr MessageType type = MessageType::FileDirRequest;
            uint32_t request = 0;
            std::string path;
        };

        struct FileEntry
        {
            std::string name;
            uint64_t size = 0;
            uint64_t mtime = 0;
            bool directory = false;
        };

        struct FileDirReply
        {
            static constexpr MessageType type = MessageType::FileDirReply;
            uint32_t request = 0;
            bool success = false;
            std::vector<FileEntry> entries;
        };

        /* terminal */
        struct TerminalOpen
        {
            static constexpr MessageType type = MessageType::TerminalOpen;
            uint16_t rows = 24;
            uint16_t cols = 80;
            std::string command;
        };

        struct TerminalData
        {
            static constexpr MessageType type = MessageType::TerminalData;
            BinaryBuf data;
        };

        struct TerminalResize
        {
            static constexpr MessageType type = MessageType::TerminalResize;
            uint16_t rows = 0;
            uint16_t cols = 0;
        };

        struct TerminalClose
        {
            static constexpr MessageType type = MessageType::TerminalClose;
            int32_t status = 0;
        };

        /* audio */
        struct AudioFormat
        {
            static constexpr MessageType type = MessageType::AudioFormat;
            uint8_t codec = 0;
            uint32_t sampleRate = 0;
            uint8_t channels = 0;
        };

        struct AudioFrame
        {
            static constexpr MessageType type = MessageType::AudioFrame;
            uint64_t pts = 0;
            BinaryBuf data;
        };
    }

    using ControlMsg = std::variant<Msg::Hello, Msg::AuthChallenge, Msg::AuthResponse, Msg::AuthResult,
                                    Msg::CapabilityOffer, Msg::CapabilityAnswer, Msg::Renegotiate, Msg::KeyframeRequest,
                                    Msg::DisplayInfo, Msg::Notification, Msg::SessionClose, Msg::Heartbeat, Msg::PluginMessage>;
    using VideoMsg = std::variant<Msg::VideoChunk>;
    using InputMsg = std::variant<Msg::KeyEvent, Msg::PointerEvent, Msg::TouchEvent>;
    using ClipboardMsg = std::variant<Msg::ClipboardChunk>;
    using FileMsg = std::variant<Msg::FileRequest, Msg::FileChunk, Msg::FileAck, Msg::FileComplete,
                                 Msg::FileRetransmit, Msg::FileResume, Msg::FileCancel, Msg::FileVerified,
                                 Msg::FileDirRequest, Msg::FileDirReply>;
    using TerminalMsg = std::variant<Msg::TerminalOpen, Msg::TerminalData, Msg::TerminalResize, Msg::TerminalClose>;
    using AudioMsg = std::variant<Msg::AudioFormat, Msg::AudioFrame>;

    /// one message per channel category, the alternative index follows ChannelKind
    using Message = std::variant<ControlMsg, InputMsg, VideoMsg, AudioMsg, ClipboardMsg, TerminalMsg, FileMsg>;

    struct Packet
    {
        ChannelId channel;
        uint32_t seq = 0;
        Message msg;

        Packet() = default;
        Packet(const ChannelId & id, Message && m) : channel(id), msg(std::move(m)) {}
    };

    namespace Protocol
    {
        /// length prefix + fixed record header
        inline static const size_t header_size = 4 + 1 + 1 + 1 + 4 + 4;
        inline static const size_t frame_max_default = 16 * 1024 * 1024;
        inline static const size_t plugin_payload_max = 64 * 1024;

        MessageType messageType(const Message &);
        const char* messageTypeName(const MessageType &);

        /// @brief: packet to framed bytes
        BinaryBuf encode(const Packet &);

        /// @brief: record (without length prefix) to packet
        /// @throw protocol_error on header, channel_error on body
        Packet decode(const uint8_t* ptr, size_t len);

        /// @brief: reassembly of frames from a byte stream
        class FrameReader
        {
            StreamBuf       buf;
            size_t          frameMax = frame_max_default;

        public:
            explicit FrameReader(size_t max = frame_max_default) : frameMax(max) {}

            /// @brief: append received bytes
            void            push(const uint8_t*, size_t);
            void            push(const std::vector<uint8_t> &);

            /// @brief: next complete packet
            std::optional<Packet> next(void);

            size_t          pending(void) const { return buf.last(); }
            void            reset(void);
        };
    }
}

#endif // _RDSE_PROTOCOL_
