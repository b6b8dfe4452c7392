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

#ifndef _RDSE_INTERFACES_
#define _RDSE_INTERFACES_

#include <list>
#include <vector>
#include <memory>
#include <string>
#include <optional>

#include "rdse_protocol.h"

namespace RDSE
{
    enum class SessionState
    {
        Disconnected,
        Handshaking,
        Authenticating,
        Negotiating,
        Active,
        Closing,
        Reconnecting,
        Closed
    };

    const char* sessionStateName(const SessionState &);

    enum class ClipboardFormat : uint8_t { Text = 1, Rtf = 2, Html = 3, Image = 4, FileList = 5 };

    const char* clipboardFormatName(const ClipboardFormat &);

    struct ClipboardEntry
    {
        ClipboardFormat format = ClipboardFormat::Text;
        BinaryBuf data;
    };

    using ClipboardContent = std::list<ClipboardEntry>;

    /// reassembled (or raw pass-through) video frame
    struct VideoFrame
    {
        uint32_t display = 0;
        uint32_t frame = 0;
        uint64_t pts = 0;
        bool keyframe = false;
        VideoCodec codec = VideoCodec::Raw;
        BinaryBuf data;
    };

    /* sender side video producer */
    class VideoSource
    {
    public:
        virtual ~VideoSource() = default;

        virtual void requestKeyframe(uint32_t display) = 0;
        virtual void capabilitiesChanged(const Capabilities &) {}
    };

    /* receiver side decoder and renderer */
    class VideoSink
    {
    public:
        virtual ~VideoSink() = default;

        virtual void videoFrame(const VideoFrame &) = 0;
        virtual void displayResized(uint32_t display, uint16_t width, uint16_t height) {}
    };

    /* host side input injection */
    class InputInjector
    {
    public:
        virtual ~InputInjector() = default;

        virtual void injectKey(const Msg::KeyEvent &) = 0;
        virtual void injectPointer(const Msg::PointerEvent &) = 0;
        virtual void injectTouch(const Msg::TouchEvent &) {}
    };

    class ClipboardSink
    {
    public:
        virtual ~ClipboardSink() = default;

        /// @brief: apply remote content, all formats at once
        virtual void clipboardApply(const ClipboardContent &) = 0;
        /// @brief: local content for the initial sync
        virtual std::optional<ClipboardContent> clipboardCurrent(void) { return std::nullopt; }
    };

    class FileReader
    {
    public:
        virtual ~FileReader() = default;

        virtual uint64_t size(void) const = 0;
        /// @brief: read up to len bytes at offset
        /// @throw std::runtime_error on io error
        virtual BinaryBuf read(uint64_t offset, size_t len) = 0;
    };

    class FileWriter
    {
    public:
        virtual ~FileWriter() = default;

        /// @brief: write bytes at offset
        /// @throw std::runtime_error on io error
        virtual void write(uint64_t offset, const BinaryBuf &) = 0;
        /// @brief: read back the stored part, used to rebuild the digest on resume
        virtual BinaryBuf read(uint64_t offset, size_t len) = 0;
        /// @brief: finish, keep the file on success or remove it
        virtual void finish(bool success) = 0;
    };

    class FileSystem
    {
    public:
        virtual ~FileSystem() = default;

        virtual std::unique_ptr<FileReader> openRead(const std::string & name) = 0;
        virtual std::unique_ptr<FileWriter> openWrite(const std::string & name, uint64_t size) = 0;
        virtual std::optional<std::vector<Msg::FileEntry>> listDirectory(const std::string & path) = 0;
    };

    /* pseudo terminal processes */
    class TerminalPeer
    {
    public:
        virtual ~TerminalPeer() = default;

        /// @brief: remote open request
        /// @return false to refuse
        virtual bool terminalOpen(uint32_t id, uint16_t rows, uint16_t cols, const std::string & command) = 0;
        /// @brief: remote data, in send order
        virtual void terminalData(uint32_t id, const BinaryBuf &) = 0;
        virtual void terminalResize(uint32_t id, uint16_t rows, uint16_t cols) = 0;
        virtual void terminalClosed(uint32_t id, int32_t status) = 0;
    };

    class AudioSink
    {
    public:
        virtual ~AudioSink() = default;

        virtual void audioFormat(const Msg::AudioFormat &) = 0;
        virtual void audioFrame(const Msg::AudioFrame &) = 0;
    };

    /* host side credentials store */
    class Authenticator
    {
    public:
        virtual ~Authenticator() = default;

        /// @brief: salt published in challenges
        virtual BinaryBuf salt(void) const = 0;
        /// @brief: sha256(password + salt) of user
        virtual std::optional<BinaryBuf> verifier(const std::string & username) const = 0;
        /// @brief: second factor check
        virtual bool checkOtp(const std::string & username, const std::string & code) const { return false; }
    };

    /* client side credentials */
    class CredentialsProvider
    {
    public:
        virtual ~CredentialsProvider() = default;

        virtual std::string username(void) const = 0;
        virtual std::string password(void) const = 0;
        virtual std::string otpCode(void) const { return ""; }
    };

    class PluginHandler
    {
    public:
        virtual ~PluginHandler() = default;

        virtual void pluginMessage(const std::string & pluginId, const BinaryBuf & payload) = 0;
    };

    class SessionEvents
    {
    public:
        virtual ~SessionEvents() = default;

        virtual void sessionStateChanged(const SessionState &) {}
        /// @brief: new capability snapshot, initial or renegotiated
        virtual void sessionActive(const Capabilities &) {}
        virtual void sessionResumed(const Capabilities &) {}
        virtual void sessionClosed(const ErrorCode &, const std::string & reason) {}
        virtual void sessionNotification(uint8_t level, const std::string & text) {}
        virtual void fileJobFinished(uint32_t job, bool success) {}
        virtual void fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> &) {}
    };
}

#endif // _RDSE_INTERFACES_
