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

#ifndef _RDSE_ENGINE_
#define _RDSE_ENGINE_

#include <list>
#include <mutex>
#include <memory>
#include <optional>

#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_session.h"
#include "rdse_channel_mux.h"
#include "rdse_video.h"
#include "rdse_input.h"
#include "rdse_audio.h"
#include "rdse_clipboard.h"
#include "rdse_terminal.h"
#include "rdse_file_transfer.h"
#include "rdse_engine_config.h"
#include "rdse_local_files.h"

namespace RDSE
{
    struct EngineStats
    {
        size_t          videoDelivered = 0;
        size_t          videoDropped = 0;
        size_t          muxVideoDropped = 0;
        size_t          audioSkipped = 0;
        size_t          channelErrors = 0;
        size_t          bytesRecv = 0;
        size_t          bytesSent = 0;
    };

    /// @brief: one session with all channels, transport independent
    class Engine : protected SessionEvents, protected VideoListener
    {
        EngineConfig    config;

        ChannelMux      mux;
        Session         session;
        Protocol::FrameReader reader;

        VideoPipeline   video;
        InputRouter     input;
        AudioChannel    audio;
        ClipboardSync   clipboard;
        TerminalMux     terminal;
        FileTransferManager files;
        std::unique_ptr<LocalFileSystem> localFiles;

        SessionEvents*  events = nullptr;
        VideoSource*    videoSource = nullptr;
        VideoSink*      videoSink = nullptr;
        PluginHandler*  plugin = nullptr;

        mutable std::recursive_mutex lock;

        size_t          channelErrors = 0;
        size_t          bytesRecv = 0;
        size_t          bytesSent = 0;

        // job id with a message, or a channel gap
        using FileTasks = std::list<std::pair<uint32_t, std::optional<FileMsg>>>;

    protected:
        // SessionEvents
        void            sessionStateChanged(const SessionState &) override;
        void            sessionActive(const Capabilities &) override;
        void            sessionResumed(const Capabilities &) override;
        void            sessionClosed(const ErrorCode &, const std::string & reason) override;
        void            sessionNotification(uint8_t level, const std::string & text) override;
        void            fileJobFinished(uint32_t job, bool success) override;
        void            fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> &) override;

        // VideoListener
        void            videoQualityFallback(uint32_t display) override;

        void            pumpSession(void);
        bool            isAllowed(uint32_t perm) const;
        bool            isPayloadAllowed(const ChannelKind &) const;
        void            resetChannel(const ChannelId &, const TimePoint &);

        void            dispatch(Packet &&, const TimePoint &, FileTasks &);
        void            recvControl(const ControlMsg &, const TimePoint &);

    public:
        explicit Engine(const EngineConfig &);
        ~Engine();

        void            setEvents(SessionEvents*);
        void            setAuthenticator(const Authenticator*);
        void            setCredentials(const CredentialsProvider*);
        void            setVideoSource(VideoSource*);
        void            setVideoSink(VideoSink*);
        void            setInputInjector(InputInjector*);
        void            setClipboardSink(ClipboardSink*);
        void            setFileSystem(FileSystem*);
        void            setTerminalPeer(TerminalPeer*);
        void            setAudioSink(AudioSink*);
        void            setPluginHandler(PluginHandler*);

        /// @brief: transport connected, start or resume the session
        /// @return false if the session is closed
        bool            attach(const TimePoint &);
        /// @brief: inbound transport bytes
        /// @return false on unrecoverable protocol error
        bool            recvBytes(const uint8_t*, size_t, const TimePoint &);
        /// @brief: next framed bytes to write
        std::optional<BinaryBuf> popOutgoing(const TimePoint &);
        /// @brief: block until outbound data is queued
        bool            waitOutgoing(const std::chrono::milliseconds &);

        void            transportLost(const TimePoint &);
        void            tick(const TimePoint &);

        /// @brief: file senders pump, out of the engine lock
        bool            fileStep(void);
        size_t          inputFlush(void);

        // session
        void            close(const std::string & reason = "");
        void            renegotiate(const CapabilitySet &);

        SessionState    state(void) const;
        std::shared_ptr<const Capabilities> capabilities(void) const;
        ErrorCode       errorCode(void) const;
        std::string     errorReason(void) const;
        bool            isActive(void) const;
        bool            isClosed(void) const;
        const Msg::Role & role(void) const { return config.session.role; }

        // control
        bool            sendDisplayInfo(uint32_t display, uint16_t width, uint16_t height);
        bool            sendNotification(uint8_t level, const std::string & text);
        bool            sendPluginMessage(const std::string & pluginId, const BinaryBuf & payload);

        // video
        std::optional<uint32_t> sendVideoFrame(const VideoFrame &);
        void            videoDecodeFailed(uint32_t display, const TimePoint &);

        // input
        void            setViewSize(uint16_t width, uint16_t height);
        void            selectDisplay(uint32_t display);
        bool            sendKey(const KeyInput &);
        bool            sendPointer(uint16_t posx, uint16_t posy, uint8_t buttons, int16_t wheelx = 0, int16_t wheely = 0);
        bool            sendTouch(uint32_t touchId, const Msg::TouchPhase &, uint16_t posx, uint16_t posy);

        // clipboard
        bool            clipboardChanged(const ClipboardContent &);

        // files
        uint32_t        sendFile(const std::string & local, const std::string & remote);
        uint32_t        receiveFile(const std::string & remote, const std::string & local);
        uint32_t        requestDirectory(const std::string & path);
        bool            cancelFile(uint32_t job);
        std::optional<FileJobInfo> fileJob(uint32_t job) const;
        size_t          fileJobsActive(void) const;

        // terminal
        uint32_t        terminalOpen(uint16_t rows, uint16_t cols, const std::string & command);
        bool            terminalWrite(uint32_t id, const BinaryBuf &);
        bool            terminalResize(uint32_t id, uint16_t rows, uint16_t cols);
        bool            terminalClose(uint32_t id, int32_t status = 0);
        bool            isTerminalOpen(uint32_t id) const;

        // audio
        bool            sendAudioFormat(const Msg::AudioFormat &);
        bool            sendAudioFrame(uint64_t pts, const BinaryBuf &);

        EngineStats     stats(void) const;
        void            shutdown(void);
    };
}

#endif // _RDSE_ENGINE_
