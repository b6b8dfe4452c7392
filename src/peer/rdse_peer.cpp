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

#include <unistd.h>

#include <thread>
#include <chrono>
#include <csignal>
#include <cstring>
#include <cinttypes>
#include <iostream>
#include <filesystem>

#include "rdse_tools.h"
#include "rdse_crypto.h"
#include "rdse_sockets.h"
#include "rdse_session.h"
#include "rdse_peer.h"

using namespace std::chrono_literals;

namespace RDSE
{
    std::atomic<bool> shutdownRequested{false};

    void signalHandler(int sig)
    {
        if(sig == SIGTERM || sig == SIGINT)
        {
            shutdownRequested = true;
        }
    }

    void peerHelp(const char* prog)
    {
        std::cout << "version: " << RDSE_PEER_VERSION << std::endl;
        std::cout << "usage: " << prog <<
                  " [--host | --client | --loopback] [--addr <127.0.0.1>] [--port <5910>] [--config <file>] " <<
                  "[--debug <types>] [--trace] [--send-file <path>] [--clipboard <text>] [--terminal <command>] [--close-after <sec>]" << std::endl << std::endl <<
                  "    --host (listen and serve one session)" << std::endl <<
                  "    --client (connect, reconnect on transport loss)" << std::endl <<
                  "    --loopback (host and client over a socket pair)" << std::endl <<
                  "    --debug <types> (allow types: [all],proto,sess,mux,video,file,clip,term,input,audio,sock,auth,app)" << std::endl <<
                  "    --send-file <path> (file below file:root)" << std::endl <<
                  "    --clipboard <text> (local clipboard text)" << std::endl <<
                  "    --terminal <command> (open remote terminal)" << std::endl <<
                  "    --close-after <sec> (graceful close)" << std::endl;
    }

    /* Peer::PasswordAuth */
    Peer::PasswordAuth::PasswordAuth(const std::string & username, const std::string & password)
        : user(username), saltBuf(Crypto::randomKey(16))
    {
        verifierBuf = Auth::verifier(password, saltBuf);
    }

    std::optional<BinaryBuf> Peer::PasswordAuth::verifier(const std::string & username) const
    {
        if(username == user)
        {
            return verifierBuf;
        }

        return std::nullopt;
    }

    /* Peer::LogSinks */
    void Peer::LogSinks::attach(Engine & eng)
    {
        engine = & eng;

        eng.setEvents(this);
        eng.setVideoSink(this);
        eng.setClipboardSink(this);
        eng.setTerminalPeer(this);
        eng.setAudioSink(this);
        eng.setPluginHandler(this);
    }

    void Peer::LogSinks::sessionStateChanged(const SessionState & state)
    {
        Application::info("%s: [%s] state: %s", __FUNCTION__, name.c_str(), sessionStateName(state));
    }

    void Peer::LogSinks::sessionActive(const Capabilities & caps)
    {
        Application::info("%s: [%s] generation: %" PRIu32 ", codec: %s", __FUNCTION__, name.c_str(), caps.generation, videoCodecName(caps.codec()));
        active = true;
    }

    void Peer::LogSinks::sessionResumed(const Capabilities & caps)
    {
        Application::info("%s: [%s] generation: %" PRIu32, __FUNCTION__, name.c_str(), caps.generation);
        active = true;
    }

    void Peer::LogSinks::sessionClosed(const ErrorCode & code, const std::string & reason)
    {
        Application::info("%s: [%s] code: %s, reason: %s", __FUNCTION__, name.c_str(), errorCodeName(code), reason.c_str());
        active = false;
        closed = true;
    }

    void Peer::LogSinks::sessionNotification(uint8_t level, const std::string & text)
    {
        Application::notice("%s: [%s] level: %" PRIu8 ", text: %s", __FUNCTION__, name.c_str(), level, text.c_str());
    }

    void Peer::LogSinks::fileJobFinished(uint32_t job, bool success)
    {
        Application::info("%s: [%s] job: 0x%08" PRIx32 ", success: %s", __FUNCTION__, name.c_str(), job, (success ? "true" : "false"));
    }

    void Peer::LogSinks::fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> & entries)
    {
        for(auto & entry : entries)
        {
            Application::info("%s: [%s] request: %" PRIu32 ", %s `%s', size: %" PRIu64, __FUNCTION__, name.c_str(),
                              request, (entry.directory ? "dir" : "file"), entry.name.c_str(), entry.size);
        }
    }

    void Peer::LogSinks::videoFrame(const VideoFrame & frame)
    {
        Application::debug(DebugType::Video, "%s: [%s] display: %" PRIu32 ", frame: %" PRIu32 ", codec: %s, size: %lu",
                           __FUNCTION__, name.c_str(), frame.display, frame.frame, videoCodecName(frame.codec), frame.data.size());
    }

    void Peer::LogSinks::displayResized(uint32_t display, uint16_t width, uint16_t height)
    {
        Application::info("%s: [%s] display: %" PRIu32 ", size: [%" PRIu16 ", %" PRIu16 "]", __FUNCTION__, name.c_str(), display, width, height);
    }

    void Peer::LogSinks::clipboardApply(const ClipboardContent & content)
    {
        for(auto & entry : content)
        {
            Application::info("%s: [%s] format: %s, size: %lu", __FUNCTION__, name.c_str(), clipboardFormatName(entry.format), entry.data.size());
        }
    }

    bool Peer::LogSinks::terminalOpen(uint32_t id, uint16_t rows, uint16_t cols, const std::string & command)
    {
        Application::info("%s: [%s] id: 0x%08" PRIx32 ", size: [%" PRIu16 ", %" PRIu16 "], command: `%s'",
                          __FUNCTION__, name.c_str(), id, cols, rows, command.c_str());
        terminals.emplace(id);
        return true;
    }

    void Peer::LogSinks::terminalData(uint32_t id, const BinaryBuf & buf)
    {
        Application::debug(DebugType::Term, "%s: [%s] id: 0x%08" PRIx32 ", data: `%.*s'",
                           __FUNCTION__, name.c_str(), id, static_cast<int>(buf.size()), reinterpret_cast<const char*>(buf.data()));

        if(engine && terminals.count(id) && ! engine->terminalWrite(id, buf))
        {
            Application::warning("%s: [%s] echo refused, id: 0x%08" PRIx32, __FUNCTION__, name.c_str(), id);
        }
    }

    void Peer::LogSinks::terminalResize(uint32_t id, uint16_t rows, uint16_t cols)
    {
        Application::debug(DebugType::Term, "%s: [%s] id: 0x%08" PRIx32 ", size: [%" PRIu16 ", %" PRIu16 "]", __FUNCTION__, name.c_str(), id, cols, rows);
    }

    void Peer::LogSinks::terminalClosed(uint32_t id, int32_t status)
    {
        Application::info("%s: [%s] id: 0x%08" PRIx32 ", status: %" PRId32, __FUNCTION__, name.c_str(), id, status);
        terminals.erase(id);
    }

    void Peer::LogSinks::audioFormat(const Msg::AudioFormat & format)
    {
        Application::info("%s: [%s] rate: %" PRIu32 ", channels: %" PRIu8, __FUNCTION__, name.c_str(), format.sampleRate, format.channels);
    }

    void Peer::LogSinks::audioFrame(const Msg::AudioFrame & frame)
    {
        Application::trace(DebugType::Audio, "%s: [%s] pts: %" PRIu64 ", size: %lu", __FUNCTION__, name.c_str(), frame.pts, frame.data.size());
    }

    void Peer::LogSinks::pluginMessage(const std::string & pluginId, const BinaryBuf & payload)
    {
        Application::info("%s: [%s] id: `%s', size: %lu", __FUNCTION__, name.c_str(), pluginId.c_str(), payload.size());
    }

    /* Peer::Service */
    Peer::Service::Service(int argc, const char** argv) : ApplicationJsonConfig("rdse_peer")
    {
        for(int it = 1; it < argc; ++it)
        {
            if(0 == std::strcmp(argv[it], "--host"))
            {
                mode = Mode::Host;
            }
            else if(0 == std::strcmp(argv[it], "--client"))
            {
                mode = Mode::Client;
            }
            else if(0 == std::strcmp(argv[it], "--loopback"))
            {
                mode = Mode::Loopback;
            }
            else if(0 == std::strcmp(argv[it], "--trace"))
            {
                Application::setDebugLevel(DebugLevel::Trace);
            }
            else if(0 == std::strcmp(argv[it], "--config") && it + 1 < argc)
            {
                if(! readConfig(argv[it + 1]))
                {
                    throw std::invalid_argument(argv[it + 1]);
                }

                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--debug") && it + 1 < argc)
            {
                Application::setDebugLevel(DebugLevel::Debug);
                Application::setDebugTypes(Tools::split(argv[it + 1], ','));
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--addr") && it + 1 < argc)
            {
                address.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--port") && it + 1 < argc)
            {
                port = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--send-file") && it + 1 < argc)
            {
                sendFile.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--clipboard") && it + 1 < argc)
            {
                clipboardText.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--terminal") && it + 1 < argc)
            {
                terminalCommand.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--close-after") && it + 1 < argc)
            {
                closeAfter = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else
            {
                peerHelp(argv[0]);
                throw 0;
            }
        }

        if(mode == Mode::Loopback && closeAfter <= 0)
        {
            closeAfter = 3;
        }
    }

    std::unique_ptr<Engine> Peer::Service::createEngine(const Msg::Role & role, LogSinks & sinks) const
    {
        auto conf = EngineConfig::fromJson(config(), role);

        if(conf.session.peerId.empty())
        {
            conf.session.peerId = role == Msg::Role::Host ? "rdse-host" : "rdse-client";
        }

        if(conf.fileRoot.empty())
        {
            conf.fileRoot = std::filesystem::current_path().native();
        }

        auto engine = std::make_unique<Engine>(conf);
        sinks.attach(*engine);

        return engine;
    }

    void Peer::Service::clientActions(Engine & engine)
    {
        if(! clipboardText.empty())
        {
            ClipboardContent content;
            content.emplace_back(ClipboardEntry{ ClipboardFormat::Text, BinaryBuf(reinterpret_cast<const uint8_t*>(clipboardText.data()), clipboardText.size()) });

            if(! engine.clipboardChanged(content))
            {
                Application::warning("%s: %s", __FUNCTION__, "clipboard not sent");
            }
        }

        if(! sendFile.empty())
        {
            auto remote = Tools::joinToString("received-", std::filesystem::path(sendFile).filename().native());

            if(auto job = engine.sendFile(sendFile, remote))
            {
                Application::info("%s: send file: `%s', job: 0x%08" PRIx32, __FUNCTION__, sendFile.c_str(), job);
            }
            else
            {
                Application::error("%s: send file failed: `%s'", __FUNCTION__, sendFile.c_str());
            }
        }

        if(! terminalCommand.empty())
        {
            auto id = engine.terminalOpen(24, 80, terminalCommand);

            if(! id || ! engine.terminalWrite(id, BinaryBuf(reinterpret_cast<const uint8_t*>("hello\n"), 6)))
            {
                Application::error("%s: terminal failed: `%s'", __FUNCTION__, terminalCommand.c_str());
            }
        }
    }

    int Peer::Service::runHost(void)
    {
        int srvfd = TCPSocket::listen(address, port);

        if(0 > srvfd)
        {
            return EXIT_FAILURE;
        }

        LogSinks sinks("host");
        PasswordAuth auth(configGetString("auth:username", "rdse"), configGetString("auth:password"));

        auto engine = createEngine(Msg::Role::Host, sinks);

        if(configHasKey("auth:password"))
        {
            engine->setAuthenticator(& auth);
        }

        Connector connector(*engine);
        Application::info("%s: listen: %s:%" PRIu16, __FUNCTION__, address.c_str(), port);

        while(! engine->isClosed() && ! shutdownRequested)
        {
            if(connector.isConnected())
            {
                std::this_thread::sleep_for(200ms);
                continue;
            }

            // reconnect grace runs without a transport
            engine->tick(std::chrono::steady_clock::now());

            if(! NetworkStream::hasInput(srvfd, 200))
            {
                continue;
            }

            if(int sock = TCPSocket::accept(srvfd); 0 <= sock)
            {
                if(! connector.attach(std::make_unique<SocketStream>(sock)))
                {
                    break;
                }
            }
        }

        if(shutdownRequested && ! engine->isClosed())
        {
            engine->close("host shutdown");
            std::this_thread::sleep_for(500ms);
        }

        connector.stop();
        ::close(srvfd);

        return engine->errorCode() == ErrorCode::None ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int Peer::Service::runClient(void)
    {
        LogSinks sinks("client");
        PasswordCredentials creds(configGetString("auth:username", "rdse"), configGetString("auth:password"));

        auto engine = createEngine(Msg::Role::Client, sinks);
        engine->setCredentials(& creds);

        Connector connector(*engine);
        std::chrono::steady_clock::time_point lastAttempt, activeTime;
        bool actionsDone = false;
        bool closing = false;

        while(! engine->isClosed() && ! shutdownRequested)
        {
            auto now = std::chrono::steady_clock::now();

            if(! connector.isConnected())
            {
                engine->tick(now);
                auto state = engine->state();

                if((state == SessionState::Disconnected || state == SessionState::Reconnecting) && 1s < now - lastAttempt)
                {
                    lastAttempt = now;
                    int sock = TCPSocket::connect(address, port);

                    if(0 > sock && state == SessionState::Disconnected)
                    {
                        return EXIT_FAILURE;
                    }

                    if(0 <= sock && ! connector.attach(std::make_unique<SocketStream>(sock)))
                    {
                        break;
                    }
                }
            }

            if(sinks.active && ! actionsDone)
            {
                clientActions(*engine);
                activeTime = now;
                actionsDone = true;
            }

            if(actionsDone && ! closing && 0 < closeAfter && std::chrono::seconds(closeAfter) < now - activeTime && 0 == engine->fileJobsActive())
            {
                engine->close("client exit");
                closing = true;
            }

            std::this_thread::sleep_for(100ms);
        }

        if(shutdownRequested && ! engine->isClosed())
        {
            engine->close("client shutdown");
            std::this_thread::sleep_for(500ms);
        }

        connector.stop();

        return engine->errorCode() == ErrorCode::None ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int Peer::Service::runLoopback(void)
    {
        int fd1, fd2;

        if(! UnixSocket::pair(fd1, fd2))
        {
            return EXIT_FAILURE;
        }

        LogSinks hostSinks("host");
        LogSinks clientSinks("client");

        PasswordAuth auth("rdse", "loopback");
        PasswordCredentials creds("rdse", "loopback");

        auto host = createEngine(Msg::Role::Host, hostSinks);
        auto client = createEngine(Msg::Role::Client, clientSinks);

        host->setAuthenticator(& auth);
        client->setCredentials(& creds);

        Connector hostConn(*host);
        Connector clientConn(*client);

        if(! hostConn.attach(std::make_unique<SocketStream>(fd1)) ||
           ! clientConn.attach(std::make_unique<SocketStream>(fd2)))
        {
            return EXIT_FAILURE;
        }

        Tools::Timeout<std::chrono::milliseconds> handshake(5s);

        while(! (hostSinks.active && clientSinks.active))
        {
            if(handshake.check() || host->isClosed() || client->isClosed())
            {
                Application::error("%s: %s", __FUNCTION__, "handshake failed");
                return EXIT_FAILURE;
            }

            std::this_thread::sleep_for(10ms);
        }

        // one raw frame from the host
        const uint16_t width = 64;
        const uint16_t height = 48;

        VideoFrame frame;
        frame.keyframe = true;
        frame.data.assign(width * height * 4, 0x80);

        if(! host->sendDisplayInfo(0, width, height) || ! host->sendVideoFrame(frame))
        {
            Application::warning("%s: %s", __FUNCTION__, "video frame not sent");
        }

        clientActions(*client);

        auto started = std::chrono::steady_clock::now();

        while(! shutdownRequested && std::chrono::steady_clock::now() - started < std::chrono::seconds(closeAfter))
        {
            std::this_thread::sleep_for(50ms);
        }

        client->close("loopback done");

        Tools::Timeout<std::chrono::milliseconds> closing(2s);

        while(! (host->isClosed() && client->isClosed()) && ! closing.check())
        {
            std::this_thread::sleep_for(10ms);
        }

        hostConn.stop();
        clientConn.stop();

        auto stats = client->stats();
        Application::info("%s: client recv: %lu, sent: %lu, frames: %lu", __FUNCTION__, stats.bytesRecv, stats.bytesSent, stats.videoDelivered);

        return host->isClosed() && client->isClosed() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int Peer::Service::start(void)
    {
        signal(SIGTERM, signalHandler);
        signal(SIGINT, signalHandler);

        switch(mode)
        {
            case Mode::Host:
                return runHost();

            case Mode::Client:
                return runClient();

            default:
                break;
        }

        return runLoopback();
    }
}

using namespace RDSE;

int main(int argc, const char** argv)
{
    int res = 0;
    Application::setDebug(DebugTarget::Console, DebugLevel::Info);

    try
    {
        Peer::Service app(argc, argv);
        res = app.start();
    }
    catch(const std::invalid_argument & err)
    {
        std::cerr << "invalid argument: " << err.what() << std::endl;
        res = EXIT_FAILURE;
    }
    catch(const std::exception & err)
    {
        Application::error("%s: exception: %s", NS_FuncName.c_str(), err.what());
        res = EXIT_FAILURE;
    }
    catch(int val)
    {
        res = val;
    }

    return res;
}
