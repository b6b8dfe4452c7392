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

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_capability.h"
#include "rdse_engine.h"

namespace RDSE
{
    Engine::Engine(const EngineConfig & conf)
        : config(conf), mux(conf.mux), session(conf.session), reader(conf.frameMax),
          video(conf.video, & mux), input(conf.input, & mux), audio(& mux),
          clipboard(conf.clipboard, & mux, conf.session.role),
          terminal(conf.terminal, & mux, conf.session.role == Msg::Role::Host),
          files(conf.file, & mux, conf.session.role == Msg::Role::Host)
    {
        session.setEvents(this);
        files.setEvents(this);
        video.setListener(this);
        mux.setListener(& video);

        if(! config.fileRoot.empty())
        {
            localFiles = std::make_unique<LocalFileSystem>(config.fileRoot);
            files.setFileSystem(localFiles.get());
        }
    }

    Engine::~Engine()
    {
        mux.setListener(nullptr);
        mux.shutdown();
    }

    void Engine::setEvents(SessionEvents* ptr)
    {
        const std::scoped_lock guard{ lock };
        events = ptr;
    }

    void Engine::setAuthenticator(const Authenticator* ptr)
    {
        const std::scoped_lock guard{ lock };
        session.setAuthenticator(ptr);
    }

    void Engine::setCredentials(const CredentialsProvider* ptr)
    {
        const std::scoped_lock guard{ lock };
        session.setCredentials(ptr);
    }

    void Engine::setVideoSource(VideoSource* ptr)
    {
        const std::scoped_lock guard{ lock };
        videoSource = ptr;
        video.setSource(ptr);
    }

    void Engine::setVideoSink(VideoSink* ptr)
    {
        const std::scoped_lock guard{ lock };
        videoSink = ptr;
        video.setSink(ptr);
    }

    void Engine::setInputInjector(InputInjector* ptr)
    {
        const std::scoped_lock guard{ lock };
        input.setInjector(ptr);
    }

    void Engine::setClipboardSink(ClipboardSink* ptr)
    {
        const std::scoped_lock guard{ lock };
        clipboard.setSink(ptr);
    }

    void Engine::setFileSystem(FileSystem* ptr)
    {
        files.setFileSystem(ptr);
    }

    void Engine::setTerminalPeer(TerminalPeer* ptr)
    {
        const std::scoped_lock guard{ lock };
        terminal.setPeer(ptr);
    }

    void Engine::setAudioSink(AudioSink* ptr)
    {
        const std::scoped_lock guard{ lock };
        audio.setSink(ptr);
    }

    void Engine::setPluginHandler(PluginHandler* ptr)
    {
        const std::scoped_lock guard{ lock };
        plugin = ptr;
    }

    /* SessionEvents */
    void Engine::sessionStateChanged(const SessionState & state)
    {
        if(events)
        {
            events->sessionStateChanged(state);
        }
    }

    void Engine::sessionActive(const Capabilities & caps)
    {
        Application::info("%s: generation: %" PRIu32 ", codec: %s, size: [%" PRIu16 ", %" PRIu16 "], keyboard: %s, permissions: 0x%04" PRIx32,
                          __FUNCTION__, caps.generation, videoCodecName(caps.codec()), caps.width, caps.height,
                          keyboardModeName(caps.keyboard), caps.permissions);

        input.setKeyboardMode(caps.keyboard);

        if(videoSource)
        {
            videoSource->capabilitiesChanged(caps);
        }

        if(caps.generation == 1 && config.syncInitClipboard && caps.allowed(PermClipboard))
        {
            clipboard.syncInitial();
        }

        if(events)
        {
            events->sessionActive(caps);
        }
    }

    void Engine::sessionResumed(const Capabilities & caps)
    {
        // both sides restart numbering at the same point of the stream
        mux.resetSequences();
        terminal.resetSequences();
        video.reset();
        clipboard.reset();
        files.resumeAll();

        input.setKeyboardMode(caps.keyboard);

        if(videoSource)
        {
            videoSource->capabilitiesChanged(caps);
        }

        if(events)
        {
            events->sessionResumed(caps);
        }
    }

    void Engine::sessionClosed(const ErrorCode & code, const std::string & reason)
    {
        files.cancelAll(reason.empty() ? "session closed" : reason);
        terminal.closeAll(-1);
        clipboard.reset();

        for(auto kind : { ChannelKind::Input, ChannelKind::Video, ChannelKind::Audio,
                          ChannelKind::Clipboard, ChannelKind::Terminal, ChannelKind::FileTransfer })
        {
            mux.clearQueues(kind);
        }

        if(events)
        {
            events->sessionClosed(code, reason);
        }
    }

    void Engine::sessionNotification(uint8_t level, const std::string & text)
    {
        if(events)
        {
            events->sessionNotification(level, text);
        }
    }

    void Engine::fileJobFinished(uint32_t job, bool success)
    {
        if(events)
        {
            events->fileJobFinished(job, success);
        }
    }

    void Engine::fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> & entries)
    {
        if(events)
        {
            events->fileDirectoryListed(request, entries);
        }
    }

    /* VideoListener */
    void Engine::videoQualityFallback(uint32_t display)
    {
        auto caps = session.capabilities();

        if(! caps || ! session.isActive())
        {
            return;
        }

        Application::notice("%s: display: %" PRIu32 ", codec: %s, quality: %" PRIu8,
                            __FUNCTION__, display, videoCodecName(caps->codec()), caps->quality);

        session.requestRenegotiation(Negotiator::lowerQuality(session.declaration(), *caps));
        pumpSession();
    }

    void Engine::pumpSession(void)
    {
        for(auto & msg : session.takeOutgoing())
        {
            if(! mux.enqueue(Packet(ChannelId(ChannelKind::Control), std::move(msg))))
            {
                Application::warning("%s: %s", __FUNCTION__, "control channel closed");
            }
        }
    }

    bool Engine::isAllowed(uint32_t perm) const
    {
        const std::scoped_lock guard{ lock };
        auto caps = session.capabilities();

        return session.isActive() && caps && caps->allowed(perm);
    }

    bool Engine::isPayloadAllowed(const ChannelKind & kind) const
    {
        auto caps = session.capabilities();

        if(! caps)
        {
            return false;
        }

        switch(kind)
        {
            case ChannelKind::Control:
            case ChannelKind::Video:
                return true;

            case ChannelKind::Input:
                return caps->allowed(PermKeyboard);

            case ChannelKind::Audio:
                return caps->allowed(PermAudio);

            case ChannelKind::Clipboard:
                return caps->allowed(PermClipboard);

            case ChannelKind::Terminal:
                return caps->allowed(PermTerminal);

            case ChannelKind::FileTransfer:
                return caps->allowed(PermFileTransfer);
        }

        return false;
    }

    void Engine::resetChannel(const ChannelId & id, const TimePoint & now)
    {
        channelErrors++;

        if(! session.isActive())
        {
            return;
        }

        switch(id.kind)
        {
            case ChannelKind::Video:
                video.recvGap(id.sub, now);
                break;

            case ChannelKind::Clipboard:
                clipboard.reset();
                break;

            case ChannelKind::Terminal:
                terminal.close(id.sub, -1);
                break;

            case ChannelKind::FileTransfer:
                // sub 0: directory requests
                if(id.sub)
                {
                    files.cancel(id.sub, "channel protocol error");
                }
                break;

            default:
                break;
        }
    }

    bool Engine::attach(const TimePoint & now)
    {
        const std::scoped_lock guard{ lock };

        if(session.isClosed())
        {
            Application::error("%s: %s", __FUNCTION__, "session closed");
            return false;
        }

        reader.reset();
        session.start(now);
        pumpSession();

        return ! session.isClosed();
    }

    bool Engine::recvBytes(const uint8_t* ptr, size_t len, const TimePoint & now)
    {
        FileTasks tasks;

        {
            const std::scoped_lock guard{ lock };

            if(session.isClosed())
            {
                return false;
            }

            bytesRecv += len;
            reader.push(ptr, len);
            session.received(now);

            try
            {
                while(! session.isClosed())
                {
                    try
                    {
                        auto pkt = reader.next();

                        if(! pkt)
                        {
                            break;
                        }

                        Application::trace(DebugType::Proto, "%s: channel: %s/%" PRIu32 ", seq: %" PRIu32 ", type: %s", __FUNCTION__,
                                           channelKindName(pkt->channel.kind), pkt->channel.sub, pkt->seq,
                                           Protocol::messageTypeName(Protocol::messageType(pkt->msg)));

                        dispatch(std::move(*pkt), now, tasks);
                    }
                    catch(const channel_error & err)
                    {
                        Application::warning("%s: channel: %s/%" PRIu32 ", error: %s",
                                             __FUNCTION__, channelKindName(err.channel.kind), err.channel.sub, err.what());
                        resetChannel(err.channel, now);
                    }
                }
            }
            catch(const protocol_error & err)
            {
                Application::error("%s: protocol error: %s", __FUNCTION__, err.what());
                session.abort(ErrorCode::ChannelProtocolError, err.what());
                pumpSession();
                return false;
            }
        }

        // disk work runs out of the engine lock
        for(auto & [job, msg] : tasks)
        {
            if(msg)
            {
                files.recvMessage(*msg);
            }
            else
            {
                files.recvGap(job);
            }
        }

        return true;
    }

    void Engine::dispatch(Packet && pkt, const TimePoint & now, FileTasks & tasks)
    {
        auto kind = pkt.channel.kind;

        if(kind == ChannelKind::Control)
        {
            recvControl(std::get<ControlMsg>(pkt.msg), now);
            return;
        }

        if(! session.isActive() && session.getState() != SessionState::Closing)
        {
            Application::warning("%s: session state: %s, skip channel: %s/%" PRIu32,
                                 __FUNCTION__, sessionStateName(session.getState()), channelKindName(kind), pkt.channel.sub);
            return;
        }

        if(! isPayloadAllowed(kind))
        {
            Application::warning("%s: permission denied, skip channel: %s/%" PRIu32, __FUNCTION__, channelKindName(kind), pkt.channel.sub);
            return;
        }

        auto sub = pkt.channel.sub;
        auto res = mux.receive(std::move(pkt));

        if(res.gap)
        {
            if(kind == ChannelKind::Video)
            {
                video.recvGap(sub, now);
            }
            else if(kind == ChannelKind::FileTransfer)
            {
                tasks.emplace_back(sub, std::nullopt);
            }
        }

        for(auto & item : res.packets)
        {
            switch(item.channel.kind)
            {
                case ChannelKind::Input:
                    input.recvMessage(std::get<InputMsg>(item.msg));
                    break;

                case ChannelKind::Video:
                    video.recvChunk(std::get<Msg::VideoChunk>(std::get<VideoMsg>(item.msg)), now);
                    break;

                case ChannelKind::Audio:
                    audio.recvMessage(std::get<AudioMsg>(item.msg));
                    break;

                case ChannelKind::Clipboard:
                    clipboard.recvChunk(std::get<Msg::ClipboardChunk>(std::get<ClipboardMsg>(item.msg)));
                    break;

                case ChannelKind::Terminal:
                    terminal.recvMessage(item.channel.sub, item.seq, std::get<TerminalMsg>(item.msg));
                    break;

                case ChannelKind::FileTransfer:
                    tasks.emplace_back(item.channel.sub, std::move(std::get<FileMsg>(item.msg)));
                    break;

                default:
                    break;
            }
        }
    }

    void Engine::recvControl(const ControlMsg & msg, const TimePoint & now)
    {
        if(session.recvControl(msg, now))
        {
            pumpSession();
            return;
        }

        if(! session.isActive() && session.getState() != SessionState::Closing)
        {
            Application::warning("%s: session state: %s, skip message: %s", __FUNCTION__,
                                 sessionStateName(session.getState()), Protocol::messageTypeName(Protocol::messageType(msg)));
            return;
        }

        if(auto req = std::get_if<Msg::KeyframeRequest>(& msg))
        {
            video.recvKeyframeRequest(*req);
        }
        else if(auto info = std::get_if<Msg::DisplayInfo>(& msg))
        {
            Application::debug(DebugType::Video, "%s: display: %" PRIu32 ", size: [%" PRIu16 ", %" PRIu16 "]",
                               __FUNCTION__, info->display, info->width, info->height);

            input.setDisplaySize(info->display, info->width, info->height);

            if(videoSink)
            {
                videoSink->displayResized(info->display, info->width, info->height);
            }
        }
        else if(auto note = std::get_if<Msg::Notification>(& msg))
        {
            sessionNotification(note->level, note->text);
        }
        else if(auto plug = std::get_if<Msg::PluginMessage>(& msg))
        {
            if(plugin)
            {
                plugin->pluginMessage(plug->pluginId, plug->payload);
            }
            else
            {
                Application::debug(DebugType::App, "%s: no plugin handler, id: `%s'", __FUNCTION__, plug->pluginId.c_str());
            }
        }
    }

    std::optional<BinaryBuf> Engine::popOutgoing(const TimePoint & now)
    {
        const std::scoped_lock guard{ lock };

        pumpSession();

        auto state = session.getState();

        if(state == SessionState::Active)
        {
            input.flush();
        }

        // payload channels wait for the negotiation
        auto pkt = mux.dequeue(now, state == SessionState::Active || state == SessionState::Closing);

        if(! pkt && state == SessionState::Closing && 0 == mux.queuedBulk() && ! session.hasOutgoing())
        {
            session.closeFlushed();
            pumpSession();
            pkt = mux.dequeue(now, false);
        }

        if(! pkt)
        {
            return std::nullopt;
        }

        Application::trace(DebugType::Proto, "%s: channel: %s/%" PRIu32 ", seq: %" PRIu32 ", type: %s", __FUNCTION__,
                           channelKindName(pkt->channel.kind), pkt->channel.sub, pkt->seq,
                           Protocol::messageTypeName(Protocol::messageType(pkt->msg)));

        auto buf = Protocol::encode(*pkt);
        bytesSent += buf.size();

        return buf;
    }

    bool Engine::waitOutgoing(const std::chrono::milliseconds & ms)
    {
        return mux.wait(ms);
    }

    void Engine::transportLost(const TimePoint & now)
    {
        const std::scoped_lock guard{ lock };

        if(session.isClosed())
        {
            return;
        }

        reader.reset();

        // stale handshake and realtime data are useless on a new transport
        for(auto kind : { ChannelKind::Control, ChannelKind::Input, ChannelKind::Video, ChannelKind::Clipboard })
        {
            mux.clearQueues(kind);
        }

        session.transportLost(now);

        if(session.getState() == SessionState::Reconnecting)
        {
            files.pauseAll();
            terminal.transportLost();
            clipboard.reset();
        }
    }

    void Engine::tick(const TimePoint & now)
    {
        const std::scoped_lock guard{ lock };

        session.tick(now);

        if(session.isActive())
        {
            video.tick(now);
        }

        pumpSession();
    }

    bool Engine::fileStep(void)
    {
        if(! isAllowed(PermFileTransfer))
        {
            return false;
        }

        return files.step();
    }

    size_t Engine::inputFlush(void)
    {
        const std::scoped_lock guard{ lock };
        return session.isActive() ? input.flush() : 0;
    }

    void Engine::close(const std::string & reason)
    {
        const std::scoped_lock guard{ lock };
        session.close(reason);
        pumpSession();
    }

    void Engine::renegotiate(const CapabilitySet & declared)
    {
        const std::scoped_lock guard{ lock };
        session.requestRenegotiation(declared);
        pumpSession();
    }

    SessionState Engine::state(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.getState();
    }

    std::shared_ptr<const Capabilities> Engine::capabilities(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.capabilities();
    }

    ErrorCode Engine::errorCode(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.errorCode();
    }

    std::string Engine::errorReason(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.errorReason();
    }

    bool Engine::isActive(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.isActive();
    }

    bool Engine::isClosed(void) const
    {
        const std::scoped_lock guard{ lock };
        return session.isClosed();
    }

    /* control */
    bool Engine::sendDisplayInfo(uint32_t display, uint16_t width, uint16_t height)
    {
        const std::scoped_lock guard{ lock };

        if(! session.isActive())
        {
            return false;
        }

        return mux.enqueue(Packet(ChannelId(ChannelKind::Control), ControlMsg(Msg::DisplayInfo{ display, width, height })));
    }

    bool Engine::sendNotification(uint8_t level, const std::string & text)
    {
        const std::scoped_lock guard{ lock };

        if(! session.isActive())
        {
            return false;
        }

        return mux.enqueue(Packet(ChannelId(ChannelKind::Control), ControlMsg(Msg::Notification{ level, text })));
    }

    bool Engine::sendPluginMessage(const std::string & pluginId, const BinaryBuf & payload)
    {
        if(Protocol::plugin_payload_max < payload.size())
        {
            Application::error("%s: payload too large: %lu, id: `%s'", __FUNCTION__, payload.size(), pluginId.c_str());
            return false;
        }

        const std::scoped_lock guard{ lock };

        if(! session.isActive())
        {
            return false;
        }

        return mux.enqueue(Packet(ChannelId(ChannelKind::Control), ControlMsg(Msg::PluginMessage{ pluginId, payload })));
    }

    /* video */
    std::optional<uint32_t> Engine::sendVideoFrame(const VideoFrame & frame)
    {
        const std::scoped_lock guard{ lock };

        if(! session.isActive())
        {
            return std::nullopt;
        }

        return video.sendFrame(frame);
    }

    void Engine::videoDecodeFailed(uint32_t display, const TimePoint & now)
    {
        const std::scoped_lock guard{ lock };

        if(session.isActive())
        {
            video.decodeFailed(display, now);
        }
    }

    /* input */
    void Engine::setViewSize(uint16_t width, uint16_t height)
    {
        const std::scoped_lock guard{ lock };
        input.setViewSize(width, height);
    }

    void Engine::selectDisplay(uint32_t display)
    {
        const std::scoped_lock guard{ lock };
        input.selectDisplay(display);
    }

    bool Engine::sendKey(const KeyInput & key)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermKeyboard) && input.sendKey(key);
    }

    bool Engine::sendPointer(uint16_t posx, uint16_t posy, uint8_t buttons, int16_t wheelx, int16_t wheely)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermKeyboard) && input.sendPointer(posx, posy, buttons, wheelx, wheely);
    }

    bool Engine::sendTouch(uint32_t touchId, const Msg::TouchPhase & phase, uint16_t posx, uint16_t posy)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermKeyboard) && input.sendTouch(touchId, phase, posx, posy);
    }

    /* clipboard */
    bool Engine::clipboardChanged(const ClipboardContent & content)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermClipboard) && clipboard.localChanged(content);
    }

    /* files */
    uint32_t Engine::sendFile(const std::string & local, const std::string & remote)
    {
        return isAllowed(PermFileTransfer) ? files.sendFile(local, remote) : 0;
    }

    uint32_t Engine::receiveFile(const std::string & remote, const std::string & local)
    {
        return isAllowed(PermFileTransfer) ? files.receiveFile(remote, local) : 0;
    }

    uint32_t Engine::requestDirectory(const std::string & path)
    {
        return isAllowed(PermFileTransfer) ? files.requestDirectory(path) : 0;
    }

    bool Engine::cancelFile(uint32_t job)
    {
        return files.cancel(job);
    }

    std::optional<FileJobInfo> Engine::fileJob(uint32_t job) const
    {
        return files.jobInfo(job);
    }

    size_t Engine::fileJobsActive(void) const
    {
        return files.activeJobs();
    }

    /* terminal */
    uint32_t Engine::terminalOpen(uint16_t rows, uint16_t cols, const std::string & command)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermTerminal) ? terminal.open(rows, cols, command) : 0;
    }

    bool Engine::terminalWrite(uint32_t id, const BinaryBuf & buf)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermTerminal) && terminal.write(id, buf);
    }

    bool Engine::terminalResize(uint32_t id, uint16_t rows, uint16_t cols)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermTerminal) && terminal.resize(id, rows, cols);
    }

    bool Engine::terminalClose(uint32_t id, int32_t status)
    {
        const std::scoped_lock guard{ lock };
        return terminal.close(id, status);
    }

    bool Engine::isTerminalOpen(uint32_t id) const
    {
        const std::scoped_lock guard{ lock };
        return terminal.isOpen(id);
    }

    /* audio */
    bool Engine::sendAudioFormat(const Msg::AudioFormat & format)
    {
        const std::scoped_lock guard{ lock };

        if(! isAllowed(PermAudio))
        {
            return false;
        }

        audio.sendFormat(format);
        return true;
    }

    bool Engine::sendAudioFrame(uint64_t pts, const BinaryBuf & buf)
    {
        const std::scoped_lock guard{ lock };
        return isAllowed(PermAudio) && audio.sendFrame(pts, buf);
    }

    EngineStats Engine::stats(void) const
    {
        const std::scoped_lock guard{ lock };
        EngineStats res;

        res.videoDelivered = video.delivered();
        res.videoDropped = video.dropped();
        res.muxVideoDropped = mux.videoDropped();
        res.audioSkipped = audio.skipped();
        res.channelErrors = channelErrors;
        res.bytesRecv = bytesRecv;
        res.bytesSent = bytesSent;

        return res;
    }

    void Engine::shutdown(void)
    {
        mux.shutdown();
    }
}
