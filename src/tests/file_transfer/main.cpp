#include <map>
#include <list>
#include <random>
#include <functional>
#include <iostream>
#include <exception>
#include <algorithm>
#include <cassert>

#include "rdse_application.h"
#include "rdse_file_transfer.h"

using namespace RDSE;

/* in memory storage */
struct MemoryFiles : FileSystem
{
    std::map<std::string, BinaryBuf> files;
    std::map<std::string, BinaryBuf> partial;

    struct Reader : FileReader
    {
        const BinaryBuf & buf;

        explicit Reader(const BinaryBuf & b) : buf(b) {}

        uint64_t size(void) const override { return buf.size(); }

        BinaryBuf read(uint64_t offset, size_t len) override
        {
            if(offset >= buf.size())
            {
                return BinaryBuf();
            }

            len = std::min<size_t>(len, buf.size() - offset);
            return BinaryBuf(buf.begin() + offset, buf.begin() + offset + len);
        }
    };

    struct Writer : FileWriter
    {
        MemoryFiles & owner;
        std::string name;

        Writer(MemoryFiles & own, const std::string & str) : owner(own), name(str) {}

        void write(uint64_t offset, const BinaryBuf & data) override
        {
            auto & buf = owner.partial[name];

            if(buf.size() < offset + data.size())
            {
                buf.resize(offset + data.size());
            }

            std::copy(data.begin(), data.end(), buf.begin() + offset);
        }

        BinaryBuf read(uint64_t offset, size_t len) override
        {
            auto & buf = owner.partial[name];
            return BinaryBuf(buf.begin() + offset, buf.begin() + offset + len);
        }

        void finish(bool success) override
        {
            if(success)
            {
                owner.files[name] = owner.partial[name];
            }

            owner.partial.erase(name);
        }
    };

    std::unique_ptr<FileReader> openRead(const std::string & name) override
    {
        auto it = files.find(name);

        if(it == files.end())
        {
            throw std::runtime_error("not found");
        }

        return std::make_unique<Reader>(it->second);
    }

    std::unique_ptr<FileWriter> openWrite(const std::string & name, uint64_t size) override
    {
        partial[name].clear();
        return std::make_unique<Writer>(*this, name);
    }

    std::optional<std::vector<Msg::FileEntry>> listDirectory(const std::string & path) override
    {
        if(path != "/")
        {
            return std::nullopt;
        }

        std::vector<Msg::FileEntry> res;

        for(auto & [name, buf] : files)
        {
            res.push_back(Msg::FileEntry{ name, buf.size(), 0, false });
        }

        return res;
    }
};

struct Capture : PacketSender
{
    std::list<Packet> packets;

    bool sendPacket(Packet && pkt) override
    {
        packets.emplace_back(std::move(pkt));
        return true;
    }
};

struct Results : SessionEvents
{
    std::map<uint32_t, bool> jobs;
    std::map<uint32_t, size_t> listings;

    void fileJobFinished(uint32_t job, bool success) override { jobs[job] = success; }
    void fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> & entries) override { listings[request] = entries.size(); }
};

struct Side
{
    MemoryFiles fs;
    Capture out;
    Results results;
    FileTransferManager manager;

    Side(const FileSettings & settings, bool host) : manager(settings, & out, host)
    {
        manager.setFileSystem(& fs);
        manager.setEvents(& results);
    }
};

BinaryBuf randomFile(size_t len)
{
    std::mt19937 gen(4242);
    std::uniform_int_distribution<int> dist(0, 255);

    BinaryBuf res(len);
    std::generate(res.begin(), res.end(), [&](){ return static_cast<uint8_t>(dist(gen)); });
    return res;
}

/// deliver queued messages both ways, return chunk payload bytes moved
size_t exchange(Side & a, Side & b, const std::function<bool(Msg::FileChunk &)> & filter = nullptr)
{
    size_t bytes = 0;

    a.manager.step();
    b.manager.step();

    auto packets = std::move(a.out.packets);
    a.out.packets.clear();

    for(auto & pkt : packets)
    {
        auto & msg = std::get<FileMsg>(pkt.msg);

        if(auto chunk = std::get_if<Msg::FileChunk>(& msg))
        {
            if(filter && ! filter(*chunk))
            {
                continue;
            }

            bytes += chunk->payload.size();
        }

        b.manager.recvMessage(msg);
    }

    packets = std::move(b.out.packets);
    b.out.packets.clear();

    for(auto & pkt : packets)
    {
        a.manager.recvMessage(std::get<FileMsg>(pkt.msg));
    }

    return bytes;
}

void testPushWithResume(void)
{
    std::cout << "test push with resume: ";

    FileSettings settings;
    settings.chunkSize = 64 * 1024;

    Side client(settings, false);
    Side host(settings, true);

    const size_t size = 10 * 1024 * 1024;
    client.fs.files["video.bin"] = randomFile(size);

    auto id = client.manager.sendFile("video.bin", "copy.bin");
    assert(id != 0 && ! (id & 0x80000000));

    size_t loops = 0;

    while(client.manager.jobInfo(id)->acked < 3 * 1024 * 1024)
    {
        exchange(client, host);
        assert(++loops < 10000);
    }

    // transport lost with data in flight
    client.manager.step();
    client.out.packets.clear();
    host.out.packets.clear();

    client.manager.pauseAll();
    host.manager.pauseAll();

    auto received = host.manager.jobInfo(id);
    assert(received);
    assert(received->state == FileJobState::Paused);
    assert(3 * 1024 * 1024 <= received->offset);
    assert(received->offset < size);

    auto resumeOffset = received->offset;

    host.manager.resumeAll();
    client.manager.resumeAll();

    size_t bytes = 0;

    while(client.manager.activeJobs() || host.manager.activeJobs())
    {
        bytes += exchange(client, host);
        assert(++loops < 10000);
    }

    // only the remainder was sent again
    assert(bytes == size - resumeOffset);
    assert(client.results.jobs[id]);
    assert(host.results.jobs[id]);
    assert(host.fs.files["copy.bin"] == client.fs.files["video.bin"]);
    assert(host.fs.partial.empty());

    std::cout << "passed" << std::endl;
}

void testCorruption(void)
{
    std::cout << "test digest retransmit: ";

    FileSettings settings;
    settings.chunkSize = 4096;
    settings.digestInterval = 4;

    Side client(settings, false);
    Side host(settings, true);

    client.fs.files["data"] = randomFile(100 * 1024);
    auto id = client.manager.sendFile("data", "data");

    bool corrupted = false;
    size_t loops = 0;

    while(client.manager.activeJobs() || host.manager.activeJobs())
    {
        exchange(client, host, [&](Msg::FileChunk & chunk)
        {
            if(! corrupted && chunk.offset == 5 * 4096)
            {
                chunk.payload[10] ^= 0xFF;
                corrupted = true;
            }

            return true;
        });

        assert(++loops < 10000);
    }

    assert(corrupted);
    assert(host.results.jobs[id]);
    assert(host.fs.files["data"] == client.fs.files["data"]);

    std::cout << "passed" << std::endl;

    std::cout << "test retransmit limit: ";

    Side sender(settings, false);
    Side receiver(settings, true);
    sender.fs.files["data"] = randomFile(100 * 1024);
    id = sender.manager.sendFile("data", "data");
    loops = 0;

    while(sender.manager.activeJobs() || receiver.manager.activeJobs())
    {
        exchange(sender, receiver, [&](Msg::FileChunk & chunk)
        {
            if(chunk.offset == 2 * 4096)
            {
                chunk.payload[0] ^= 0x01;
            }

            return true;
        });

        assert(++loops < 10000);
    }

    assert(! receiver.results.jobs[id]);
    assert(! sender.results.jobs[id]);
    assert(receiver.manager.jobInfo(id)->state == FileJobState::Failed);
    assert(receiver.fs.files.count("data") == 0);

    std::cout << "passed" << std::endl;
}

void testPullAndList(void)
{
    std::cout << "test pull: ";

    FileSettings settings;
    settings.chunkSize = 1024;

    Side client(settings, false);
    Side host(settings, true);
    host.fs.files["report.txt"] = randomFile(5000);

    auto id = client.manager.receiveFile("report.txt", "local.txt");
    size_t loops = 0;

    do
    {
        exchange(client, host);
        assert(++loops < 1000);
    }
    while(client.manager.activeJobs() || host.manager.activeJobs());

    assert(client.results.jobs[id]);
    assert(client.fs.files["local.txt"] == host.fs.files["report.txt"]);

    auto missing = client.manager.receiveFile("none.txt", "none.txt");
    exchange(client, host);
    exchange(client, host);
    assert(client.manager.jobInfo(missing)->state == FileJobState::Cancelled);
    assert(! client.results.jobs[missing]);

    std::cout << "passed" << std::endl;

    std::cout << "test directory listing: ";

    auto req = client.manager.requestDirectory("/");
    exchange(client, host);
    assert(client.results.listings[req] == 1);

    std::cout << "passed" << std::endl;

    std::cout << "test cancel: ";

    client.fs.files["big"] = randomFile(50000);
    id = client.manager.sendFile("big", "big");
    exchange(client, host);
    exchange(client, host);

    assert(client.manager.cancel(id));
    assert(! client.manager.cancel(id));
    exchange(client, host);

    assert(host.manager.jobInfo(id)->state == FileJobState::Cancelled);
    assert(host.fs.files.count("big") == 0);
    assert(! client.manager.activeJobs());
    assert(! host.manager.activeJobs());

    std::cout << "passed" << std::endl;
}

void testLostVerification(void)
{
    std::cout << "test verification lost with the transport: ";

    FileSettings settings;
    settings.chunkSize = 1024;

    Side client(settings, false);
    Side host(settings, true);
    client.fs.files["notes"] = randomFile(20000);

    auto id = client.manager.sendFile("notes", "notes");
    size_t loops = 0;

    // the receiver finishes, its confirmation never arrives
    while(host.manager.activeJobs() || client.manager.jobInfo(id)->state == FileJobState::Requested)
    {
        client.manager.step();

        auto packets = std::move(client.out.packets);
        client.out.packets.clear();

        for(auto & pkt : packets)
        {
            host.manager.recvMessage(std::get<FileMsg>(pkt.msg));
        }

        packets = std::move(host.out.packets);
        host.out.packets.clear();

        for(auto & pkt : packets)
        {
            auto & msg = std::get<FileMsg>(pkt.msg);

            if(! std::holds_alternative<Msg::FileVerified>(msg))
            {
                client.manager.recvMessage(msg);
            }
        }

        assert(++loops < 1000);
    }

    assert(host.results.jobs[id]);
    assert(client.manager.activeJobs() == 1);

    client.manager.pauseAll();
    host.manager.pauseAll();
    assert(client.manager.jobInfo(id)->state == FileJobState::Paused);

    host.manager.resumeAll();
    client.manager.resumeAll();

    while(client.manager.activeJobs())
    {
        exchange(client, host);
        assert(++loops < 1000);
    }

    assert(client.results.jobs[id]);
    assert(client.manager.jobInfo(id)->state == FileJobState::Completed);
    assert(host.fs.files["notes"] == client.fs.files["notes"]);

    // announced once
    host.manager.resumeAll();
    assert(host.out.packets.empty());

    std::cout << "passed" << std::endl;
}

void testFinishedJobs(void)
{
    std::cout << "test cancel drops queued chunks: ";

    FileSettings settings;
    settings.chunkSize = 1024;
    settings.history = 4;

    MemoryFiles fs;
    fs.files["blob"] = randomFile(16 * 1024);

    ChannelMux mux;
    FileTransferManager manager(settings, & mux, false);
    manager.setFileSystem(& fs);

    auto id = manager.sendFile("blob", "blob");
    manager.recvMessage(Msg::FileAck{ id, 0 });
    assert(manager.step());
    assert(mux.queued(ChannelId(ChannelKind::FileTransfer, id)) == 1 + settings.window);

    assert(manager.cancel(id));
    assert(mux.isReleased(ChannelId(ChannelKind::FileTransfer, id)));

    std::list<FileMsg> sent;

    while(auto pkt = mux.dequeue(std::chrono::steady_clock::now()))
    {
        sent.push_back(std::get<FileMsg>(pkt->msg));
    }

    assert(sent.size() == 2);
    assert(std::holds_alternative<Msg::FileRequest>(sent.front()));
    assert(std::holds_alternative<Msg::FileCancel>(sent.back()));
    assert(mux.contexts() == 0);

    std::cout << "passed" << std::endl;

    std::cout << "test finished jobs history: ";

    std::list<uint32_t> ids;

    for(int it = 0; it < 10; ++it)
    {
        ids.push_back(manager.sendFile("blob", "blob"));
        manager.cancel(ids.back());
    }

    assert(manager.activeJobs() == 0);
    assert(manager.historySize() == 4);
    assert(! manager.jobInfo(ids.front()));
    assert(manager.jobInfo(ids.back())->state == FileJobState::Cancelled);

    // late messages for a finished job are ignored
    manager.recvMessage(Msg::FileAck{ ids.back(), 0 });
    assert(! manager.step());
    assert(manager.activeJobs() == 0);

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testPushWithResume();
    testCorruption();
    testPullAndList();
    testLostVerification();
    testFinishedJobs();

    return 0;
}
