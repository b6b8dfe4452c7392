#include <map>
#include <set>
#include <list>
#include <atomic>
#include <thread>
#include <fstream>
#include <iostream>
#include <exception>
#include <filesystem>
#include <functional>
#include <cassert>

#include "rdse_application.h"
#include "rdse_sockets.h"
#include "rdse_engine.h"
#include "rdse_connector.h"

using namespace RDSE;
using namespace std::chrono_literals;

class TestAuth : public Authenticator
{
    BinaryBuf salt_{ BinaryBuf(16, 0x22) };

public:
    BinaryBuf salt(void) const override { return salt_; }

    std::optional<BinaryBuf> verifier(const std::string & username) const override
    {
        return username == "user" ? std::optional<BinaryBuf>(Auth::verifier("secret", salt_)) : std::nullopt;
    }
};

class TestCredentials : public CredentialsProvider
{
public:
    std::string username(void) const override { return "user"; }
    std::string password(void) const override { return "secret"; }
};

/// every callback the engine offers
struct Peer : SessionEvents, VideoSink, InputInjector, ClipboardSink, TerminalPeer, AudioSink, PluginHandler
{
    std::atomic<int> active{0};
    std::atomic<int> resumed{0};
    std::atomic<int> closed{0};
    ErrorCode code = ErrorCode::None;

    std::list<VideoFrame> frames;
    std::pair<uint16_t, uint16_t> display;
    int keys = 0;
    ClipboardContent clipboard;
    std::map<uint32_t, std::string> terminal;
    std::map<uint32_t, bool> jobs;
    std::list<std::string> notes;
    std::list<std::string> plugins;
    int audioFrames = 0;

    void sessionActive(const Capabilities &) override { active++; }
    void sessionResumed(const Capabilities &) override { resumed++; }
    void sessionClosed(const ErrorCode & err, const std::string &) override { code = err; closed++; }
    void sessionNotification(uint8_t, const std::string & text) override { notes.push_back(text); }
    void fileJobFinished(uint32_t job, bool success) override { jobs[job] = success; }

    void videoFrame(const VideoFrame & frame) override { frames.push_back(frame); }
    void displayResized(uint32_t, uint16_t width, uint16_t height) override { display = std::make_pair(width, height); }

    void injectKey(const Msg::KeyEvent &) override { keys++; }
    void injectPointer(const Msg::PointerEvent &) override {}

    void clipboardApply(const ClipboardContent & content) override { clipboard = content; }

    bool terminalOpen(uint32_t id, uint16_t, uint16_t, const std::string &) override { terminal[id]; return true; }
    void terminalData(uint32_t id, const BinaryBuf & data) override { terminal[id].append(data.begin(), data.end()); }
    void terminalResize(uint32_t, uint16_t, uint16_t) override {}
    void terminalClosed(uint32_t, int32_t) override {}

    void audioFormat(const Msg::AudioFormat &) override {}
    void audioFrame(const Msg::AudioFrame &) override { audioFrames++; }

    void pluginMessage(const std::string & id, const BinaryBuf &) override { plugins.push_back(id); }

    void attach(Engine & engine)
    {
        engine.setEvents(this);
        engine.setVideoSink(this);
        engine.setInputInjector(this);
        engine.setClipboardSink(this);
        engine.setTerminalPeer(this);
        engine.setAudioSink(this);
        engine.setPluginHandler(this);
    }
};

std::filesystem::path testDir(const std::string & name)
{
    auto dir = std::filesystem::temp_directory_path() / "rdse_engine_test" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

EngineConfig config(const Msg::Role & role, const std::filesystem::path & root)
{
    EngineConfig conf;
    conf.session.role = role;
    conf.session.peerId = role == Msg::Role::Host ? "test-host" : "test-client";
    conf.session.declared = EngineConfig::defaultDeclaration();
    conf.file.chunkSize = 16 * 1024;
    conf.fileRoot = root.string();
    return conf;
}

/// move bytes both ways until quiet or the predicate holds
void pump(Engine & a, Engine & b, const TimePoint & now, const std::function<bool(void)> & stop = nullptr)
{
    for(int loop = 0; loop < 100000; ++loop)
    {
        bool busy = false;

        a.fileStep();
        b.fileStep();

        while(auto buf = a.popOutgoing(now))
        {
            b.recvBytes(buf->data(), buf->size(), now);
            busy = true;
        }

        while(auto buf = b.popOutgoing(now))
        {
            a.recvBytes(buf->data(), buf->size(), now);
            busy = true;
        }

        if(! busy || (stop && stop()))
        {
            return;
        }
    }

    assert(false);
}

struct Pair
{
    TestAuth auth;
    TestCredentials creds;
    Peer hostPeer;
    Peer clientPeer;
    Engine host;
    Engine client;

    Pair(const EngineConfig & hconf, const EngineConfig & cconf) : host(hconf), client(cconf)
    {
        host.setAuthenticator(& auth);
        client.setCredentials(& creds);
        hostPeer.attach(host);
        clientPeer.attach(client);
    }

    void connect(const TimePoint & now)
    {
        assert(host.attach(now));
        assert(client.attach(now));
        pump(host, client, now);
    }
};

void writeFile(const std::filesystem::path & path, size_t len)
{
    std::ofstream ofs(path, std::ios::binary);

    for(size_t it = 0; it < len; ++it)
    {
        ofs.put(static_cast<char>((it * 31) % 251));
    }
}

BinaryBuf readFile(const std::filesystem::path & path)
{
    std::ifstream ifs(path, std::ios::binary);
    return BinaryBuf(std::vector<uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()));
}

void testSession(void)
{
    std::cout << "test engine handshake: ";

    auto now = std::chrono::steady_clock::now();
    auto hostDir = testDir("host1");
    auto clientDir = testDir("client1");

    Pair pair(config(Msg::Role::Host, hostDir), config(Msg::Role::Client, clientDir));

    // payload before the session is active
    assert(pair.host.attach(now));
    auto early = Protocol::encode(Packet(ChannelId(ChannelKind::Terminal, 1), TerminalMsg(Msg::TerminalOpen{ 24, 80, "sh" })));
    assert(pair.host.recvBytes(early.data(), early.size(), now));
    assert(pair.hostPeer.terminal.empty());
    assert(! pair.host.isTerminalOpen(1));

    assert(pair.client.attach(now));
    pump(pair.host, pair.client, now);

    assert(pair.host.isActive() && pair.client.isActive());
    assert(pair.hostPeer.active == 1 && pair.clientPeer.active == 1);
    assert(pair.client.capabilities()->codec() == VideoCodec::H264);
    assert(pair.client.capabilities()->allowed(PermAll));

    std::cout << "passed" << std::endl;

    std::cout << "test engine channels: ";

    // control
    assert(pair.host.sendDisplayInfo(0, 64, 48));
    assert(pair.host.sendNotification(0, "welcome"));
    assert(pair.client.sendPluginMessage("ext.ping", BinaryBuf(4, 1)));
    assert(! pair.client.sendPluginMessage("ext.big", BinaryBuf(Protocol::plugin_payload_max + 1, 0)));

    // video
    VideoFrame frame;
    frame.codec = VideoCodec::H264;
    frame.keyframe = true;
    frame.data = BinaryBuf(200000, 0x10);
    assert(pair.host.sendVideoFrame(frame));

    // input
    KeyInput key;
    key.virtualKey = 0x20;
    key.pressed = true;
    assert(pair.client.sendKey(key));

    // clipboard
    assert(pair.client.clipboardChanged(ClipboardContent{ ClipboardEntry{ ClipboardFormat::Text, BinaryBuf(3, 'c') } }));

    // audio
    assert(pair.host.sendAudioFormat(Msg::AudioFormat{ 1, 48000, 2 }));
    assert(pair.host.sendAudioFrame(0, BinaryBuf(960, 0)));

    // terminal
    auto term = pair.client.terminalOpen(24, 80, "sh");
    assert(term);
    assert(pair.client.terminalWrite(term, BinaryBuf(2, 'l')));

    pump(pair.host, pair.client, now);

    assert(pair.clientPeer.display == std::pair<uint16_t, uint16_t>(64, 48));
    assert(pair.clientPeer.notes.size() == 1);
    assert(pair.hostPeer.plugins.size() == 1);
    assert(pair.clientPeer.frames.size() == 1);
    assert(pair.clientPeer.frames.front().data.size() == 200000);
    assert(pair.hostPeer.keys == 1);
    assert(pair.hostPeer.clipboard.size() == 1);
    assert(pair.clientPeer.audioFrames == 1);
    assert(pair.hostPeer.terminal[term] == "ll");
    assert(pair.host.isTerminalOpen(term));

    assert(pair.host.terminalWrite(term, BinaryBuf(3, 'o')));
    pump(pair.host, pair.client, now);
    assert(pair.clientPeer.terminal[term] == "ooo");

    std::cout << "passed" << std::endl;

    std::cout << "test engine directory: ";

    writeFile(hostDir / "a.txt", 10);
    std::filesystem::create_directory(hostDir / "sub");

    std::vector<Msg::FileEntry> listing;

    struct Listing : Peer
    {
        std::vector<Msg::FileEntry>* res = nullptr;
        void fileDirectoryListed(uint32_t, const std::vector<Msg::FileEntry> & entries) override { *res = entries; }
    } listener;

    listener.res = & listing;
    pair.client.setEvents(& listener);

    assert(pair.client.requestDirectory("/"));
    pump(pair.host, pair.client, now);
    assert(listing.size() == 2);

    pair.client.setEvents(& pair.clientPeer);

    std::cout << "passed" << std::endl;

    std::cout << "test engine graceful close: ";

    pair.client.close("done");
    pump(pair.host, pair.client, now);

    assert(pair.client.isClosed());
    assert(pair.host.isClosed());
    assert(pair.host.errorCode() == ErrorCode::None);
    assert(pair.host.errorReason() == "done");
    assert(! pair.host.isTerminalOpen(term));
    assert(! pair.client.attach(now));

    std::cout << "passed" << std::endl;
}

void testFileResume(void)
{
    std::cout << "test engine file resume: ";

    auto now = std::chrono::steady_clock::now();
    auto hostDir = testDir("host2");
    auto clientDir = testDir("client2");

    Pair pair(config(Msg::Role::Host, hostDir), config(Msg::Role::Client, clientDir));
    pair.connect(now);

    writeFile(clientDir / "source.bin", 1024 * 1024 + 123);

    auto job = pair.client.sendFile("source.bin", "target.bin");
    assert(job);

    pump(pair.host, pair.client, now, [&]()
    {
        auto info = pair.host.fileJob(job);
        return info && 256 * 1024 <= info->offset;
    });

    assert(pair.client.fileJobsActive() == 1);

    pair.host.transportLost(now);
    pair.client.transportLost(now);
    assert(pair.host.state() == SessionState::Reconnecting);
    assert(pair.client.state() == SessionState::Reconnecting);
    assert(pair.host.fileJob(job)->state == FileJobState::Paused);

    now += 2s;
    pair.host.tick(now);
    pair.client.tick(now);

    pair.connect(now);
    pump(pair.host, pair.client, now);

    assert(pair.hostPeer.resumed == 1);
    assert(pair.clientPeer.resumed == 1);
    assert(pair.hostPeer.active == 1);
    assert(pair.clientPeer.jobs[job]);
    assert(pair.hostPeer.jobs[job]);
    assert(readFile(hostDir / "target.bin") == readFile(clientDir / "source.bin"));
    assert(! std::filesystem::exists(hostDir / "target.bin.part"));

    std::cout << "passed" << std::endl;

    std::cout << "test engine terminals across reconnect: ";

    auto kept = pair.client.terminalOpen(24, 80, "sh");
    pump(pair.host, pair.client, now);
    assert(pair.host.isTerminalOpen(kept));

    pair.host.transportLost(now);
    pair.client.transportLost(now);
    pair.connect(now);
    pump(pair.host, pair.client, now);

    assert(pair.host.isTerminalOpen(kept) && pair.client.isTerminalOpen(kept));

    auto cconf = config(Msg::Role::Client, testDir("client6"));
    cconf.terminal.persistent = false;

    Pair pair2(config(Msg::Role::Host, testDir("host6")), cconf);
    pair2.connect(now);

    auto dropped = pair2.client.terminalOpen(24, 80, "sh");
    pump(pair2.host, pair2.client, now);
    assert(pair2.host.isTerminalOpen(dropped));

    pair2.host.transportLost(now);
    pair2.client.transportLost(now);
    assert(! pair2.client.isTerminalOpen(dropped));

    pair2.connect(now);
    pump(pair2.host, pair2.client, now);

    assert(pair2.clientPeer.resumed == 1);
    assert(! pair2.host.isTerminalOpen(dropped));

    std::cout << "passed" << std::endl;

    std::cout << "test engine reconnect expired: ";

    pair.host.transportLost(now);
    pair.host.tick(now + 31s);
    assert(pair.host.isClosed());
    assert(pair.host.errorCode() == ErrorCode::ReconnectExpired);

    std::cout << "passed" << std::endl;
}

void testErrors(void)
{
    std::cout << "test engine permissions: ";

    auto now = std::chrono::steady_clock::now();
    auto hconf = config(Msg::Role::Host, testDir("host3"));
    hconf.session.declared.permissions = PermKeyboard;

    Pair pair(hconf, config(Msg::Role::Client, testDir("client3")));
    pair.connect(now);

    assert(pair.client.isActive());
    assert(! pair.client.clipboardChanged(ClipboardContent{ ClipboardEntry{ ClipboardFormat::Text, BinaryBuf(1, 'x') } }));
    assert(! pair.client.terminalOpen(24, 80, ""));
    assert(! pair.client.sendFile("none", "none"));
    assert(pair.client.sendKey(KeyInput()));

    // denied payload from a misbehaving peer
    auto bad = Protocol::encode(Packet(ChannelId(ChannelKind::Terminal, 9), TerminalMsg(Msg::TerminalOpen{ 24, 80, "sh" })));
    assert(pair.host.recvBytes(bad.data(), bad.size(), now));
    assert(pair.hostPeer.terminal.empty());

    std::cout << "passed" << std::endl;

    std::cout << "test engine channel error: ";

    // truncated terminal resize
    auto resize = Protocol::encode(Packet(ChannelId(ChannelKind::Terminal, 9), TerminalMsg(Msg::TerminalResize{ 1, 1 })));
    resize.resize(resize.size() - 1);
    resize[3] -= 1;

    assert(pair.host.recvBytes(resize.data(), resize.size(), now));
    assert(pair.host.isActive());
    assert(pair.host.stats().channelErrors == 1);

    std::cout << "passed" << std::endl;

    std::cout << "test engine protocol error: ";

    const uint8_t garbage[] = { 0, 0, 0, 11, 0x7F, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0 };
    assert(! pair.host.recvBytes(garbage, sizeof(garbage), now));
    assert(pair.host.isClosed());
    assert(pair.host.errorCode() == ErrorCode::ChannelProtocolError);

    pump(pair.host, pair.client, now);
    assert(pair.client.isClosed());
    assert(pair.clientPeer.code == ErrorCode::ChannelProtocolError);

    std::cout << "passed" << std::endl;
}

void testConnector(void)
{
    std::cout << "test connector over socket pair: ";

    int fd1, fd2;
    assert(UnixSocket::pair(fd1, fd2));

    auto hostDir = testDir("host4");
    auto clientDir = testDir("client4");
    writeFile(clientDir / "upload.bin", 300000);

    Pair pair(config(Msg::Role::Host, hostDir), config(Msg::Role::Client, clientDir));

    Connector hostConn(pair.host);
    Connector clientConn(pair.client);

    assert(hostConn.attach(std::make_unique<SocketStream>(fd1)));
    assert(clientConn.attach(std::make_unique<SocketStream>(fd2)));

    for(int wait = 0; wait < 500 && ! (pair.host.isActive() && pair.client.isActive()); ++wait)
    {
        std::this_thread::sleep_for(10ms);
    }

    assert(pair.client.isActive());

    auto job = pair.client.sendFile("upload.bin", "upload.bin");
    assert(job);

    for(int wait = 0; wait < 1000 && pair.client.fileJobsActive(); ++wait)
    {
        std::this_thread::sleep_for(10ms);
    }

    assert(pair.client.fileJob(job)->state == FileJobState::Completed);
    assert(readFile(hostDir / "upload.bin") == readFile(clientDir / "upload.bin"));

    pair.client.close("bye");

    for(int wait = 0; wait < 500 && ! (pair.host.isClosed() && pair.client.isClosed()); ++wait)
    {
        std::this_thread::sleep_for(10ms);
    }

    assert(pair.host.isClosed());
    assert(pair.host.errorReason() == "bye");

    clientConn.stop();
    hostConn.stop();

    std::cout << "passed" << std::endl;

    std::cout << "test connector reconnect grace while detached: ";

    assert(UnixSocket::pair(fd1, fd2));

    auto hconf = config(Msg::Role::Host, testDir("host7"));
    hconf.session.reconnectGrace = 200ms;

    Pair pair2(hconf, config(Msg::Role::Client, testDir("client7")));
    Connector hostConn2(pair2.host);
    Connector clientConn2(pair2.client);

    assert(hostConn2.attach(std::make_unique<SocketStream>(fd1)));
    assert(clientConn2.attach(std::make_unique<SocketStream>(fd2)));

    for(int wait = 0; wait < 500 && ! pair2.host.isActive(); ++wait)
    {
        std::this_thread::sleep_for(10ms);
    }

    assert(pair2.host.isActive());

    hostConn2.detach();
    assert(pair2.host.state() == SessionState::Reconnecting);

    for(int wait = 0; wait < 500 && ! pair2.host.isClosed(); ++wait)
    {
        std::this_thread::sleep_for(10ms);
    }

    assert(pair2.host.isClosed());
    assert(pair2.host.errorCode() == ErrorCode::ReconnectExpired);

    clientConn2.stop();
    hostConn2.stop();

    std::cout << "passed" << std::endl;
}

/// handshake relayed one packet at a time
struct Handshake
{
    Protocol::FrameReader hostReader;
    Protocol::FrameReader clientReader;
    std::list<Packet> toHost;
    std::list<Packet> toClient;
    std::set<MessageType> hostSeen;
    std::set<MessageType> clientSeen;

    void collect(Engine & host, Engine & client, const TimePoint & now)
    {
        while(auto buf = host.popOutgoing(now))
        {
            clientReader.push(buf->data(), buf->size());
        }

        while(auto buf = client.popOutgoing(now))
        {
            hostReader.push(buf->data(), buf->size());
        }

        while(auto pkt = clientReader.next())
        {
            toClient.emplace_back(std::move(*pkt));
        }

        while(auto pkt = hostReader.next())
        {
            toHost.emplace_back(std::move(*pkt));
        }
    }

    bool deliverOne(Engine & host, Engine & client, const TimePoint & now)
    {
        bool hostBound = ! toHost.empty();
        auto & queue = hostBound ? toHost : toClient;

        if(queue.empty())
        {
            return false;
        }

        auto buf = Protocol::encode(queue.front());
        (hostBound ? hostSeen : clientSeen).insert(Protocol::messageType(queue.front().msg));
        queue.pop_front();

        auto & engine = hostBound ? host : client;
        assert(engine.recvBytes(buf.data(), buf.size(), now));
        return true;
    }
};

struct HandshakeStage
{
    const char* name;
    bool hostTarget;
    std::function<bool(const Handshake &)> reached;
};

std::list<Packet> payloadPackets(void)
{
    std::list<Packet> res;

    Msg::KeyEvent key;
    key.pressed = true;
    key.code = 0x20;
    res.emplace_back(ChannelId(ChannelKind::Input), InputMsg(key));

    Msg::ClipboardChunk chunk;
    chunk.transfer = 1;
    chunk.total = 3;
    chunk.payload = BinaryBuf(3, 'x');
    res.emplace_back(ChannelId(ChannelKind::Clipboard), ClipboardMsg(chunk));

    res.emplace_back(ChannelId(ChannelKind::FileTransfer, 0x42), FileMsg(Msg::FileRequest{ 0x42, Msg::FileDirection::Push, "early.bin", 10, 1024 }));
    res.emplace_back(ChannelId(ChannelKind::Terminal, 0x43), TerminalMsg(Msg::TerminalOpen{ 24, 80, "sh" }));

    return res;
}

void testHandshakeGate(void)
{
    const HandshakeStage stages[] = {
        { "host after hello", true, [](auto & hs){ return hs.hostSeen.count(MessageType::Hello); } },
        { "client after hello", false, [](auto & hs){ return hs.clientSeen.count(MessageType::Hello); } },
        { "host after auth result", true, [](auto & hs){ return hs.hostSeen.count(MessageType::AuthResponse); } },
        { "client after auth result", false, [](auto & hs){ return hs.clientSeen.count(MessageType::AuthResult); } },
        { "client before capability answer", false, [](auto & hs)
            {
                return ! hs.toClient.empty() && Protocol::messageType(hs.toClient.front().msg) == MessageType::CapabilityAnswer;
            }
        }
    };

    for(auto & stage : stages)
    {
        std::cout << "test payload gated " << stage.name << ": ";

        auto now = std::chrono::steady_clock::now();
        Pair pair(config(Msg::Role::Host, testDir("host5")), config(Msg::Role::Client, testDir("client5")));
        Handshake hs;

        assert(pair.host.attach(now));
        assert(pair.client.attach(now));

        while(true)
        {
            hs.collect(pair.host, pair.client, now);

            if(stage.reached(hs))
            {
                break;
            }

            assert(hs.deliverOne(pair.host, pair.client, now));
        }

        auto & target = stage.hostTarget ? pair.host : pair.client;
        auto & peer = stage.hostTarget ? pair.hostPeer : pair.clientPeer;
        assert(! target.isActive());

        for(auto & pkt : payloadPackets())
        {
            auto buf = Protocol::encode(pkt);
            assert(target.recvBytes(buf.data(), buf.size(), now));
        }

        assert(peer.keys == 0);
        assert(peer.clipboard.empty());
        assert(peer.terminal.empty());
        assert(target.fileJobsActive() == 0);

        // finish the handshake, nothing was held for later
        while(hs.deliverOne(pair.host, pair.client, now))
        {
            hs.collect(pair.host, pair.client, now);
        }

        pump(pair.host, pair.client, now);

        assert(pair.host.isActive() && pair.client.isActive());
        assert(peer.keys == 0);
        assert(peer.clipboard.empty());
        assert(peer.terminal.empty());
        assert(target.fileJobsActive() == 0);
        assert(! target.isTerminalOpen(0x43));

        std::cout << "passed" << std::endl;
    }
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testSession();
    testFileResume();
    testErrors();
    testHandshakeGate();
    testConnector();

    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "rdse_engine_test");

    return 0;
}
