#include <list>
#include <iostream>
#include <exception>
#include <cassert>

#include "rdse_application.h"
#include "rdse_clipboard.h"

using namespace RDSE;

struct Capture : PacketSender
{
    std::list<Packet> packets;

    bool sendPacket(Packet && pkt) override
    {
        packets.emplace_back(std::move(pkt));
        return true;
    }
};

struct Board : ClipboardSink
{
    ClipboardContent content;
    int applied = 0;

    void clipboardApply(const ClipboardContent & val) override
    {
        content = val;
        applied++;
    }

    std::optional<ClipboardContent> clipboardCurrent(void) override
    {
        return content;
    }
};

struct Side
{
    Capture out;
    Board board;
    ClipboardSync sync;

    Side(const ClipboardSettings & settings, const Msg::Role & role) : sync(settings, & out, role)
    {
        sync.setSink(& board);
    }
};

ClipboardContent text(const std::string & str)
{
    return ClipboardContent{ ClipboardEntry{ ClipboardFormat::Text, BinaryBuf(reinterpret_cast<const uint8_t*>(str.data()), str.size()) } };
}

std::string text(const ClipboardContent & content)
{
    auto & data = content.front().data;
    return std::string(data.begin(), data.end());
}

void deliver(Side & from, Side & to)
{
    for(auto & pkt : from.out.packets)
    {
        to.sync.recvChunk(std::get<Msg::ClipboardChunk>(std::get<ClipboardMsg>(pkt.msg)));
    }

    from.out.packets.clear();
}

void testSync(void)
{
    std::cout << "test multi format update: ";

    ClipboardSettings settings;
    Side host(settings, Msg::Role::Host);
    Side client(settings, Msg::Role::Client);

    auto content = text("hello");
    content.push_back(ClipboardEntry{ ClipboardFormat::Html, BinaryBuf(5000, 'h') });

    assert(client.sync.localChanged(content, 1000));
    deliver(client, host);

    assert(host.board.applied == 1);
    assert(host.board.content.size() == 2);
    assert(text(host.board.content) == "hello");
    assert(host.board.content.back().data.size() == 5000);

    std::cout << "passed" << std::endl;

    std::cout << "test echo suppression: ";

    // the host platform reports the applied content as a local change
    assert(! host.sync.localChanged(host.board.content, 1001));
    assert(host.out.packets.empty());

    // repeated local notification
    assert(! client.sync.localChanged(content, 1002));

    assert(client.sync.localChanged(text("world"), 1003));
    deliver(client, host);
    assert(text(host.board.content) == "world");

    std::cout << "passed" << std::endl;

    std::cout << "test local copy of earlier remote content: ";

    // remote "world" was replaced locally, copying "world" again must be sent
    assert(host.sync.localChanged(text("other"), 2000));
    deliver(host, client);
    assert(text(client.board.content) == "other");

    assert(host.sync.localChanged(text("world"), 3000));
    deliver(host, client);
    assert(text(client.board.content) == "world");

    std::cout << "passed" << std::endl;
}

void testLastWriterWins(void)
{
    std::cout << "test last writer wins: ";

    ClipboardSettings settings;
    Side host(settings, Msg::Role::Host);
    Side client(settings, Msg::Role::Client);

    assert(host.sync.localChanged(text("newer"), 2000));
    assert(client.sync.localChanged(text("older"), 1500));

    deliver(client, host);
    deliver(host, client);

    assert(host.board.applied == 0);
    assert(client.board.applied == 1);
    assert(text(client.board.content) == "newer");

    std::cout << "passed" << std::endl;

    std::cout << "test tie goes to host: ";

    Side host2(settings, Msg::Role::Host);
    Side client2(settings, Msg::Role::Client);

    assert(host2.sync.localChanged(text("host"), 3000));
    assert(client2.sync.localChanged(text("client"), 3000));

    deliver(client2, host2);
    deliver(host2, client2);

    assert(host2.board.applied == 0);
    assert(client2.board.applied == 1);
    assert(text(client2.board.content) == "host");

    std::cout << "passed" << std::endl;
}

void testChunking(void)
{
    std::cout << "test chunked compressed transfer: ";

    ClipboardSettings settings;
    settings.chunkSize = 1000;

    Side host(settings, Msg::Role::Host);
    Side client(settings, Msg::Role::Client);

    BinaryBuf image(100000);

    for(size_t it = 0; it < image.size(); ++it)
    {
        image[it] = it % 7;
    }

    assert(host.sync.localChanged(ClipboardContent{ ClipboardEntry{ ClipboardFormat::Image, image } }, 10));

    auto & first = std::get<Msg::ClipboardChunk>(std::get<ClipboardMsg>(host.out.packets.front().msg));
    assert(first.compressed);
    assert(first.total < image.size());

    deliver(host, client);
    assert(client.board.applied == 1);
    assert(client.board.content.front().format == ClipboardFormat::Image);
    assert(client.board.content.front().data == image);

    std::cout << "passed" << std::endl;

    std::cout << "test interrupted transfer: ";

    ClipboardSettings plain;
    plain.chunkSize = 1000;
    plain.compressThreshold = plain.maxSize;
    Side sender(plain, Msg::Role::Host);

    assert(sender.sync.localChanged(text(std::string(5000, 'x')), 20));
    assert(sender.out.packets.size() == 6);

    // lose the middle
    sender.out.packets.erase(std::next(sender.out.packets.begin(), 2));
    deliver(sender, client);
    assert(client.board.applied == 1);

    assert(sender.sync.localChanged(text("after"), 30));
    deliver(sender, client);
    assert(client.board.applied == 2);
    assert(text(client.board.content) == "after");

    std::cout << "passed" << std::endl;

    std::cout << "test size limit: ";

    ClipboardSettings small;
    small.maxSize = 100;
    Side limited(small, Msg::Role::Client);
    assert(! limited.sync.localChanged(text(std::string(200, 'y')), 1));
    assert(limited.out.packets.empty());

    std::cout << "passed" << std::endl;

    std::cout << "test serialize parse: ";

    Clipboard::Update update;
    update.timestamp = 77;
    update.origin = Msg::Role::Host;
    update.content = text("abc");

    auto blob = Clipboard::serialize(update);
    auto parsed = Clipboard::parse(blob);
    assert(parsed.timestamp == 77);
    assert(parsed.origin == Msg::Role::Host);
    assert(text(parsed.content) == "abc");

    blob.push_back(0);

    try
    {
        Clipboard::parse(blob);
        assert(false);
    }
    catch(const streambuf_error &)
    {
    }

    std::cout << "passed" << std::endl;
}

void testInitialSync(void)
{
    std::cout << "test initial sync: ";

    ClipboardSettings settings;
    Side client(settings, Msg::Role::Client);
    Side host(settings, Msg::Role::Host);

    assert(! client.sync.syncInitial());

    client.board.content = text("boot");
    assert(client.sync.syncInitial());
    deliver(client, host);
    assert(text(host.board.content) == "boot");

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testSync();
    testLastWriterWins();
    testChunking();
    testInitialSync();

    return 0;
}
