#include <vector>
#include <iostream>
#include <exception>
#include <cassert>

#include "rdse_application.h"
#include "rdse_channel_mux.h"

using namespace RDSE;
using namespace std::chrono_literals;

struct DropCounter : MuxListener
{
    int dropped = 0;

    void muxVideoDropped(uint32_t display) override { dropped++; }
};

Packet videoPacket(uint32_t display, uint32_t frame, bool keyframe)
{
    Msg::VideoChunk chunk;
    chunk.display = display;
    chunk.frame = frame;
    chunk.keyframe = keyframe;
    chunk.payload = BinaryBuf(100, 0);
    return Packet(ChannelId(ChannelKind::Video, display), VideoMsg(chunk));
}

Packet filePacket(uint32_t job, uint64_t offset, size_t len)
{
    Msg::FileChunk chunk;
    chunk.job = job;
    chunk.offset = offset;
    chunk.payload = BinaryBuf(len, 0);
    return Packet(ChannelId(ChannelKind::FileTransfer, job), FileMsg(chunk));
}

Packet controlPacket(uint64_t stamp)
{
    return Packet(ChannelId(ChannelKind::Control), ControlMsg(Msg::Heartbeat{ stamp }));
}

Packet keyPacket(uint32_t code)
{
    Msg::KeyEvent key;
    key.pressed = true;
    key.code = code;
    return Packet(ChannelId(ChannelKind::Input), InputMsg(key));
}

Packet terminalPacket(uint32_t id, const std::string & str)
{
    return Packet(ChannelId(ChannelKind::Terminal, id), TerminalMsg(Msg::TerminalData{ BinaryBuf(reinterpret_cast<const uint8_t*>(str.data()), str.size()) }));
}

void testPriority(void)
{
    std::cout << "test priority order: ";

    auto now = std::chrono::steady_clock::now();
    ChannelMux mux;

    assert(mux.enqueue(filePacket(1, 0, 1000)));
    assert(mux.enqueue(terminalPacket(2, "ls")));
    assert(mux.enqueue(videoPacket(0, 1, true)));
    assert(mux.enqueue(keyPacket(65)));
    assert(mux.enqueue(controlPacket(1)));

    // control and input fifo, then video, terminal, file
    auto pkt = mux.dequeue(now);
    assert(pkt && pkt->channel.kind == ChannelKind::Input);
    pkt = mux.dequeue(now);
    assert(pkt && pkt->channel.kind == ChannelKind::Control);
    pkt = mux.dequeue(now);
    assert(pkt && pkt->channel.kind == ChannelKind::Video);
    pkt = mux.dequeue(now);
    assert(pkt && pkt->channel.kind == ChannelKind::Terminal);
    pkt = mux.dequeue(now);
    assert(pkt && pkt->channel.kind == ChannelKind::FileTransfer);
    assert(! mux.dequeue(now));

    std::cout << "passed" << std::endl;

    std::cout << "test control only: ";

    mux.enqueue(videoPacket(0, 2, false));
    mux.enqueue(keyPacket(66));
    mux.enqueue(controlPacket(2));

    pkt = mux.dequeue(now, false);
    assert(pkt && pkt->channel.kind == ChannelKind::Control);
    assert(! mux.dequeue(now, false));
    assert(mux.queued(ChannelId(ChannelKind::Input)) == 1);
    assert(mux.queued(ChannelId(ChannelKind::Video, 0)) == 1);

    std::cout << "passed" << std::endl;
}

void testSequence(void)
{
    std::cout << "test sequence per channel: ";

    auto now = std::chrono::steady_clock::now();
    ChannelMux mux;

    mux.enqueue(filePacket(1, 0, 10));
    mux.enqueue(filePacket(2, 0, 10));
    mux.enqueue(filePacket(1, 10, 10));
    mux.enqueue(filePacket(2, 10, 10));

    std::map<uint32_t, uint32_t> seqs;

    while(auto pkt = mux.dequeue(now))
    {
        // round robin between jobs, seq counts per job
        assert(pkt->seq == seqs[pkt->channel.sub]);
        seqs[pkt->channel.sub]++;
    }

    assert(seqs[1] == 2 && seqs[2] == 2);

    mux.resetSequences();
    mux.enqueue(filePacket(1, 20, 10));
    auto pkt = mux.dequeue(now);
    assert(pkt && pkt->seq == 0);

    std::cout << "passed" << std::endl;
}

void testVideoOverflow(void)
{
    std::cout << "test video overflow: ";

    auto now = std::chrono::steady_clock::now();
    MuxSettings settings;
    settings.videoDepth = 4;

    ChannelMux mux(settings);
    DropCounter counter;
    mux.setListener(& counter);

    mux.enqueue(videoPacket(0, 0, true));

    for(uint32_t frame = 1; frame < 8; ++frame)
    {
        mux.enqueue(videoPacket(0, frame, false));
    }

    assert(mux.queued(ChannelId(ChannelKind::Video, 0)) == 4);
    assert(mux.videoDropped() == 4);
    assert(counter.dropped == 4);

    // the keyframe survives, the oldest deltas go
    auto pkt = mux.dequeue(now);
    auto & chunk = std::get<Msg::VideoChunk>(std::get<VideoMsg>(pkt->msg));
    assert(chunk.keyframe);
    assert(chunk.frame == 0);

    pkt = mux.dequeue(now);
    assert(std::get<Msg::VideoChunk>(std::get<VideoMsg>(pkt->msg)).frame == 5);

    std::cout << "passed" << std::endl;
}

void testReorder(void)
{
    std::cout << "test reorder window: ";

    MuxSettings settings;
    settings.reorderWindow = 4;
    ChannelMux mux(settings);

    auto make = [](uint32_t seq)
    {
        auto pkt = filePacket(7, seq * 10, 10);
        pkt.seq = seq;
        return pkt;
    };

    auto res = mux.receive(make(1));
    assert(res.packets.empty() && ! res.gap);
    res = mux.receive(make(2));
    assert(res.packets.empty());

    res = mux.receive(make(0));
    assert(res.packets.size() == 3);
    assert(res.packets.front().seq == 0);
    assert(res.packets.back().seq == 2);

    // duplicate and stale
    res = mux.receive(make(1));
    assert(res.packets.empty());

    std::cout << "passed" << std::endl;

    std::cout << "test reorder gap: ";

    // seq 3 lost
    for(uint32_t seq = 4; seq < 8; ++seq)
    {
        res = mux.receive(make(seq));
        assert(res.packets.empty() && ! res.gap);
    }

    res = mux.receive(make(8));
    assert(res.gap);
    assert(res.packets.size() == 5);
    assert(res.packets.front().seq == 4);

    res = mux.receive(make(9));
    assert(res.packets.size() == 1 && ! res.gap);

    std::cout << "passed" << std::endl;

    std::cout << "test sequence wrap: ";

    ChannelMux sender, receiver(settings);
    sender.resetSequences(0xFFFFFFFE);
    receiver.resetSequences(0xFFFFFFFE);

    for(uint32_t it = 0; it < 4; ++it)
    {
        sender.enqueue(filePacket(9, it * 10, 10));
    }

    std::vector<Packet> wire;

    while(auto pkt = sender.dequeue(std::chrono::steady_clock::now()))
    {
        wire.emplace_back(std::move(*pkt));
    }

    assert(wire.size() == 4);
    assert(wire[1].seq == 0xFFFFFFFF && wire[2].seq == 0);

    // past the wrap first
    res = receiver.receive(std::move(wire[3]));
    assert(res.packets.empty());
    res = receiver.receive(std::move(wire[2]));
    assert(res.packets.empty());
    res = receiver.receive(std::move(wire[0]));
    assert(res.packets.size() == 1);
    res = receiver.receive(std::move(wire[1]));
    assert(res.packets.size() == 3 && ! res.gap);
    assert(res.packets.back().seq == 1);

    auto old = filePacket(9, 0, 10);
    old.seq = 0xFFFFFFFF;
    assert(receiver.receive(std::move(old)).packets.empty());

    std::cout << "passed" << std::endl;

    std::cout << "test unordered kinds: ";

    auto term = terminalPacket(3, "x");
    term.seq = 100;
    res = mux.receive(std::move(term));
    assert(res.packets.size() == 1);

    std::cout << "passed" << std::endl;
}

Packet cancelPacket(uint32_t job)
{
    return Packet(ChannelId(ChannelKind::FileTransfer, job), FileMsg(Msg::FileCancel{ job, "cancelled" }));
}

void testRelease(void)
{
    std::cout << "test release drops queued data: ";

    auto now = std::chrono::steady_clock::now();
    ChannelMux mux;
    ChannelId id(ChannelKind::FileTransfer, 5);

    mux.enqueue(filePacket(5, 0, 10));
    assert(mux.queuedBytes(id) == Protocol::header_size + 10);

    mux.enqueue(filePacket(5, 10, 10));
    mux.enqueue(cancelPacket(5));
    mux.releaseChannel(id, true);
    mux.releaseChannel(id, true);
    assert(mux.isReleased(id));
    assert(mux.queued(id) == 1);

    // only the cancel leaves the queue
    auto pkt = mux.dequeue(now);
    assert(pkt && std::holds_alternative<Msg::FileCancel>(std::get<FileMsg>(pkt->msg)));
    assert(! mux.dequeue(now));
    assert(mux.contexts() == 0);

    std::cout << "passed" << std::endl;

    std::cout << "test release keeps queued data: ";

    ChannelId id2(ChannelKind::FileTransfer, 6);
    mux.enqueue(filePacket(6, 0, 10));
    mux.releaseChannel(id2, false);
    assert(mux.contexts() == 1);

    pkt = mux.dequeue(now);
    assert(pkt && pkt->channel == id2);
    assert(mux.contexts() == 0);

    // a late message gets a short lived context
    mux.enqueue(cancelPacket(6));
    assert(mux.contexts() == 1);
    assert(mux.dequeue(now));
    assert(mux.contexts() == 0);

    std::cout << "passed" << std::endl;

    std::cout << "test release inbound: ";

    auto in1 = filePacket(7, 10, 10);
    in1.seq = 1;
    assert(mux.receive(std::move(in1)).packets.empty());
    assert(mux.contexts() == 1);

    mux.releaseChannel(ChannelId(ChannelKind::FileTransfer, 7), false);
    assert(mux.contexts() == 0);

    // delivered without a reorder context
    auto in2 = filePacket(7, 20, 10);
    in2.seq = 2;
    assert(mux.receive(std::move(in2)).packets.size() == 1);
    assert(mux.contexts() == 0);

    std::cout << "passed" << std::endl;

    std::cout << "test release history bound: ";

    RecentIds<uint32_t> recent(4);

    for(uint32_t it = 0; it < 10; ++it)
    {
        recent.insert(it);
    }

    recent.insert(9);
    assert(recent.size() == 4);
    assert(! recent.contains(5));
    assert(recent.contains(6) && recent.contains(9));

    std::cout << "passed" << std::endl;

    std::cout << "test clear queues: ";

    mux.enqueue(videoPacket(1, 0, true));
    mux.enqueue(keyPacket(1));
    mux.enqueue(controlPacket(3));

    mux.clearQueues(ChannelKind::Video);
    mux.clearQueues(ChannelKind::Input);
    assert(mux.queued(ChannelId(ChannelKind::Video, 1)) == 0);
    assert(mux.queued(ChannelId(ChannelKind::Input)) == 0);
    assert(mux.queued(ChannelId(ChannelKind::Control)) == 1);
    assert(mux.queuedBulk() == 1);

    std::cout << "passed" << std::endl;
}

void testBandwidth(void)
{
    std::cout << "test file bandwidth share: ";

    MuxSettings settings;
    settings.bandwidth = 10000;
    settings.fileShare = 0.5;

    ChannelMux mux(settings);
    auto now = std::chrono::steady_clock::now() + 2s;

    for(int it = 0; it < 10; ++it)
    {
        mux.enqueue(filePacket(1, it * 2000, 2000));
    }

    // one second burst of 5000 bytes
    size_t sent = 0;

    while(auto pkt = mux.dequeue(now))
    {
        sent++;
    }

    assert(0 < sent && sent < 10);

    // video bypasses the file budget
    mux.enqueue(videoPacket(0, 0, true));
    assert(mux.dequeue(now));

    now += 1s;
    assert(mux.dequeue(now));

    std::cout << "passed" << std::endl;

    std::cout << "test shutdown wakes: ";

    mux.shutdown();
    assert(! mux.wait(10ms));
    assert(! mux.enqueue(controlPacket(4)));

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testPriority();
    testSequence();
    testVideoOverflow();
    testReorder();
    testRelease();
    testBandwidth();

    return 0;
}
