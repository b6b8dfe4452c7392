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
#include <algorithm>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_file_transfer.h"

namespace RDSE
{
    const char* fileJobStateName(const FileJobState & state)
    {
        switch(state)
        {
            case FileJobState::Requested: return "requested";
            case FileJobState::Transferring: return "transferring";
            case FileJobState::Paused: return "paused";
            case FileJobState::Completed: return "completed";
            case FileJobState::Failed: return "failed";
            case FileJobState::Cancelled: return "cancelled";
        }

        return "unknown";
    }

    bool FileTransfer::Job::isFinished(void) const
    {
        return state == FileJobState::Completed || state == FileJobState::Failed || state == FileJobState::Cancelled;
    }

    /* FileTransferManager */
    FileTransferManager::FileTransferManager(const FileSettings & st, PacketSender* ptr, bool host)
        : settings(st), sender(ptr), jobMask(host ? 0x80000000 : 0)
    {
        if(settings.chunkSize == 0)
        {
            settings.chunkSize = 64 * 1024;
        }

        settings.window = std::max<size_t>(1, settings.window);
    }

    void FileTransferManager::setFileSystem(FileSystem* ptr)
    {
        const std::scoped_lock guard{ lock };
        filesystem = ptr;
    }

    void FileTransferManager::setEvents(SessionEvents* ptr)
    {
        const std::scoped_lock guard{ lock };
        events = ptr;
    }

    uint32_t FileTransferManager::allocateJob(void)
    {
        auto id = jobMask | nextJob++;

        if(nextJob & 0x80000000)
        {
            nextJob = 1;
        }

        return id;
    }

    FileTransfer::Job* FileTransferManager::findJob(uint32_t id)
    {
        auto it = jobs.find(id);
        return it != jobs.end() ? it->second.get() : nullptr;
    }

    void FileTransferManager::send(uint32_t job, FileMsg && msg)
    {
        if(! sender->sendPacket(Packet(ChannelId(ChannelKind::FileTransfer, job), std::move(msg))))
        {
            Application::warning("%s: mux stopped, job: 0x%08" PRIx32, __FUNCTION__, job);
        }
    }

    void FileTransferManager::finishJob(FileTransfer::Job & job, const FileJobState & state, const std::string & reason, bool notify)
    {
        if(job.isFinished())
        {
            return;
        }

        Application::info("%s: job: 0x%08" PRIx32 ", name: `%s', state: %s, offset: %" PRIu64 "/%" PRIu64 ", reason: %s",
                          __FUNCTION__, job.id, job.name.c_str(), fileJobStateName(state), job.offset, job.size, reason.c_str());

        job.state = state;
        job.reason = reason;

        if(notify)
        {
            send(job.id, Msg::FileCancel{ job.id, reason });
        }

        if(job.writer)
        {
            try
            {
                job.writer->finish(state == FileJobState::Completed);
            }
            catch(const std::exception & err)
            {
                Application::error("%s: exception: %s", __FUNCTION__, err.what());
                job.state = FileJobState::Failed;
            }

            job.writer.reset();
        }

        job.reader.reset();
        job.snapshots.clear();
        finished.insert(job.id);

        // a receiver confirms the digest, a cancel tells the peer to stop
        job.announce = job.state == FileJobState::Completed ? job.direction == FileJobDirection::Receive : notify;

        // control messages still go out, queued chunks of a failed job do not
        sender->releaseChannel(ChannelId(ChannelKind::FileTransfer, job.id), job.state != FileJobState::Completed);

        if(events)
        {
            events->fileJobFinished(job.id, job.state == FileJobState::Completed);
        }
    }

    void FileTransferManager::purgeFinished(void)
    {
        for(auto it = jobs.begin(); it != jobs.end();)
        {
            if(it->second->isFinished())
            {
                history.emplace_back(static_cast<const FileTransfer::Record &>(*it->second));
                it = jobs.erase(it);
            }
            else
            {
                ++it;
            }
        }

        while(settings.history < history.size())
        {
            history.pop_front();
        }
    }

    void FileTransferManager::announceFinished(void)
    {
        for(auto & rec : history)
        {
            if(! rec.announce)
            {
                continue;
            }

            Application::debug(DebugType::File, "%s: job: 0x%08" PRIx32 ", state: %s", __FUNCTION__, rec.id, fileJobStateName(rec.state));

            if(rec.state == FileJobState::Completed)
            {
                send(rec.id, Msg::FileVerified{ rec.id });
            }
            else
            {
                send(rec.id, Msg::FileCancel{ rec.id, rec.reason });
            }

            rec.announce = false;
        }
    }

    uint32_t FileTransferManager::sendFile(const std::string & local, const std::string & remote)
    {
        const std::scoped_lock guard{ lock };

        if(! filesystem)
        {
            Application::error("%s: %s", __FUNCTION__, "filesystem not set");
            return 0;
        }

        auto job = std::make_unique<FileTransfer::Job>();

        try
        {
            job->reader = filesystem->openRead(local);
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
        }

        if(! job->reader)
        {
            Application::error("%s: open failed, file: `%s'", __FUNCTION__, local.c_str());
            return 0;
        }

        job->id = allocateJob();
        job->direction = FileJobDirection::Send;
        job->name = remote;
        job->localName = local;
        job->size = job->reader->size();
        job->chunk = settings.chunkSize;
        job->state = FileJobState::Requested;

        Application::info("%s: job: 0x%08" PRIx32 ", file: `%s', size: %" PRIu64, __FUNCTION__, job->id, local.c_str(), job->size);

        auto id = job->id;
        send(id, Msg::FileRequest{ id, Msg::FileDirection::Push, remote, job->size, job->chunk });
        jobs.emplace(id, std::move(job));

        return id;
    }

    uint32_t FileTransferManager::receiveFile(const std::string & remote, const std::string & local)
    {
        const std::scoped_lock guard{ lock };

        auto job = std::make_unique<FileTransfer::Job>();

        job->id = allocateJob();
        job->direction = FileJobDirection::Receive;
        job->name = remote;
        job->localName = local;
        job->chunk = settings.chunkSize;
        job->state = FileJobState::Requested;

        Application::info("%s: job: 0x%08" PRIx32 ", remote: `%s', local: `%s'", __FUNCTION__, job->id, remote.c_str(), local.c_str());

        auto id = job->id;
        send(id, Msg::FileRequest{ id, Msg::FileDirection::Pull, remote, 0, job->chunk });
        jobs.emplace(id, std::move(job));

        return id;
    }

    uint32_t FileTransferManager::requestDirectory(const std::string & path)
    {
        const std::scoped_lock guard{ lock };
        auto id = nextRequest++;

        send(0, Msg::FileDirRequest{ id, path });
        return id;
    }

    bool FileTransferManager::cancel(uint32_t id, const std::string & reason)
    {
        const std::scoped_lock guard{ lock };

        if(auto job = findJob(id); job && ! job->isFinished())
        {
            finishJob(*job, FileJobState::Cancelled, reason, true);
            purgeFinished();
            return true;
        }

        return false;
    }

    void FileTransferManager::recvMessage(const FileMsg & msg)
    {
        const std::scoped_lock guard{ lock };

        std::visit([this](auto & body)
        {
            using T = std::decay_t<decltype(body)>;

            if constexpr(std::is_same_v<T, Msg::FileRequest>) recvRequest(body);
            else if constexpr(std::is_same_v<T, Msg::FileChunk>) recvChunk(body);
            else if constexpr(std::is_same_v<T, Msg::FileAck>) recvAck(body);
            else if constexpr(std::is_same_v<T, Msg::FileComplete>) recvComplete(body);
            else if constexpr(std::is_same_v<T, Msg::FileRetransmit>) recvRetransmit(body);
            else if constexpr(std::is_same_v<T, Msg::FileResume>) recvResume(body);
            else if constexpr(std::is_same_v<T, Msg::FileCancel>) recvCancel(body);
            else if constexpr(std::is_same_v<T, Msg::FileVerified>) recvVerified(body);
            else if constexpr(std::is_same_v<T, Msg::FileDirRequest>) recvDirRequest(body);
            else if constexpr(std::is_same_v<T, Msg::FileDirReply>) recvDirReply(body);
        }, msg);

        purgeFinished();
    }

    void FileTransferManager::recvRequest(const Msg::FileRequest & msg)
    {
        if(msg.job == 0 || finished.contains(msg.job))
        {
            Application::warning("%s: job not allowed: 0x%08" PRIx32, __FUNCTION__, msg.job);
            return;
        }

        auto job = findJob(msg.job);

        if(msg.direction == Msg::FileDirection::Pull)
        {
            // repeated after resume
            if(job && job->direction == FileJobDirection::Send)
            {
                send(job->id, Msg::FileRequest{ job->id, Msg::FileDirection::Push, job->name, job->size, job->chunk });
                return;
            }

            if(job || (msg.job & 0x80000000) == jobMask)
            {
                Application::warning("%s: job id conflict: 0x%08" PRIx32, __FUNCTION__, msg.job);
                send(msg.job, Msg::FileCancel{ msg.job, "job id conflict" });
                return;
            }

            std::unique_ptr<FileReader> reader;

            try
            {
                if(filesystem)
                {
                    reader = filesystem->openRead(msg.name);
                }
            }
            catch(const std::exception & err)
            {
                Application::error("%s: exception: %s", __FUNCTION__, err.what());
            }

            if(! reader)
            {
                Application::error("%s: open failed, file: `%s'", __FUNCTION__, msg.name.c_str());
                send(msg.job, Msg::FileCancel{ msg.job, "file not found" });
                finished.insert(msg.job);
                return;
            }

            auto ptr = std::make_unique<FileTransfer::Job>();
            ptr->id = msg.job;
            ptr->direction = FileJobDirection::Send;
            ptr->name = msg.name;
            ptr->localName = msg.name;
            ptr->reader = std::move(reader);
            ptr->size = ptr->reader->size();
            ptr->chunk = msg.chunk ? std::min<uint32_t>(msg.chunk, settings.chunkSize) : settings.chunkSize;
            ptr->state = FileJobState::Requested;

            Application::info("%s: pull, job: 0x%08" PRIx32 ", file: `%s', size: %" PRIu64, __FUNCTION__, ptr->id, ptr->name.c_str(), ptr->size);

            send(ptr->id, Msg::FileRequest{ ptr->id, Msg::FileDirection::Push, ptr->name, ptr->size, ptr->chunk });
            jobs.emplace(ptr->id, std::move(ptr));
            return;
        }

        // push
        if(job && job->direction == FileJobDirection::Receive && job->writer)
        {
            // repeated after resume
            send(job->id, Msg::FileAck{ job->id, job->offset });
            return;
        }

        if(job && (job->direction != FileJobDirection::Receive || job->state != FileJobState::Requested))
        {
            Application::warning("%s: job id conflict: 0x%08" PRIx32, __FUNCTION__, msg.job);
            return;
        }

        if(msg.chunk == 0)
        {
            send(msg.job, Msg::FileCancel{ msg.job, "invalid chunk size" });
            return;
        }

        auto localName = job ? job->localName : msg.name;
        std::unique_ptr<FileWriter> writer;

        try
        {
            if(filesystem)
            {
                writer = filesystem->openWrite(localName, msg.size);
            }
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
        }

        if(! writer)
        {
            Application::error("%s: create failed, file: `%s'", __FUNCTION__, localName.c_str());

            if(job)
            {
                finishJob(*job, FileJobState::Failed, "create failed", true);
            }
            else
            {
                send(msg.job, Msg::FileCancel{ msg.job, "create failed" });
                finished.insert(msg.job);
            }

            return;
        }

        if(! job)
        {
            auto ptr = std::make_unique<FileTransfer::Job>();
            ptr->id = msg.job;
            ptr->direction = FileJobDirection::Receive;
            ptr->name = msg.name;
            ptr->localName = localName;
            job = ptr.get();
            jobs.emplace(ptr->id, std::move(ptr));
        }

        job->writer = std::move(writer);
        job->size = msg.size;
        job->chunk = msg.chunk;
        job->state = FileJobState::Transferring;

        Application::info("%s: push, job: 0x%08" PRIx32 ", file: `%s', size: %" PRIu64, __FUNCTION__, job->id, localName.c_str(), job->size);

        // accept
        send(job->id, Msg::FileAck{ job->id, 0 });
    }

    void FileTransferManager::requestRetransmit(FileTransfer::Job & job, const std::string & reason)
    {
        job.retransmits++;

        if(settings.retransmitMax < job.retransmits)
        {
            finishJob(job, FileJobState::Failed, Tools::joinToString("retransmit limit, ", reason), true);
            return;
        }

        Application::warning("%s: job: 0x%08" PRIx32 ", %s, retransmit from: %" PRIu64 ", attempt: %d",
                             __FUNCTION__, job.id, reason.c_str(), job.verified, job.retransmits);

        job.offset = job.verified;
        job.acked = job.verified;
        job.digest = job.verifiedDigest;
        job.chunksUnacked = 0;
        job.rewinding = true;

        send(job.id, Msg::FileRetransmit{ job.id, job.verified });
    }

    void FileTransferManager::recvChunk(const Msg::FileChunk & msg)
    {
        auto job = findJob(msg.job);

        if(! job || job->isFinished() || job->direction != FileJobDirection::Receive)
        {
            Application::debug(DebugType::File, "%s: unknown job: 0x%08" PRIx32, __FUNCTION__, msg.job);
            return;
        }

        if(job->state != FileJobState::Transferring)
        {
            Application::debug(DebugType::File, "%s: job: 0x%08" PRIx32 ", skip chunk, state: %s", __FUNCTION__, msg.job, fileJobStateName(job->state));
            return;
        }

        if(msg.offset < job->offset)
        {
            // retransmitted data before the rewind point
            Application::debug(DebugType::File, "%s: job: 0x%08" PRIx32 ", duplicate offset: %" PRIu64, __FUNCTION__, msg.job, msg.offset);
            return;
        }

        if(msg.offset > job->offset)
        {
            if(! job->rewinding)
            {
                requestRetransmit(*job, "offset gap");
            }

            return;
        }

        job->rewinding = false;

        if(job->size < job->offset + msg.payload.size())
        {
            finishJob(*job, FileJobState::Failed, "size overflow", true);
            return;
        }

        try
        {
            job->writer->write(job->offset, msg.payload);
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            finishJob(*job, FileJobState::Failed, "write failed", true);
            return;
        }

        job->digest.update(msg.payload);
        job->offset += msg.payload.size();
        job->chunksUnacked++;

        if(msg.digest.size())
        {
            if(! Crypto::equal(job->digest.value(), msg.digest))
            {
                requestRetransmit(*job, "digest mismatch");
                return;
            }

            job->verified = job->offset;
            job->verifiedDigest = job->digest;
            job->retransmits = 0;
        }

        if(msg.digest.size() || settings.window / 2 <= job->chunksUnacked || job->offset == job->size)
        {
            job->acked = job->offset;
            job->chunksUnacked = 0;
            send(job->id, Msg::FileAck{ job->id, job->offset });
        }
    }

    void FileTransferManager::recvComplete(const Msg::FileComplete & msg)
    {
        auto job = findJob(msg.job);

        if(! job || job->isFinished() || job->direction != FileJobDirection::Receive)
        {
            return;
        }

        if(job->offset != job->size)
        {
            requestRetransmit(*job, "incomplete");
            return;
        }

        if(! Crypto::equal(job->digest.value(), msg.digest))
        {
            // every checkpoint passed, restart from the beginning
            if(job->verified == job->size)
            {
                job->verified = 0;
                job->verifiedDigest = Crypto::Digest();
            }

            requestRetransmit(*job, "final digest mismatch");
            return;
        }

        send(job->id, Msg::FileVerified{ job->id });
        job->acked = job->offset;
        finishJob(*job, FileJobState::Completed, "verified", false);
    }

    void FileTransferManager::recvAck(const Msg::FileAck & msg)
    {
        auto job = findJob(msg.job);

        if(! job || job->isFinished() || job->direction != FileJobDirection::Send)
        {
            return;
        }

        if(job->state == FileJobState::Requested)
        {
            Application::debug(DebugType::File, "%s: job accepted: 0x%08" PRIx32, __FUNCTION__, job->id);
            job->state = FileJobState::Transferring;
            return;
        }

        if(msg.offset > job->offset)
        {
            Application::warning("%s: job: 0x%08" PRIx32 ", invalid ack: %" PRIu64 ", sent: %" PRIu64, __FUNCTION__, job->id, msg.offset, job->offset);
            return;
        }

        if(job->acked < msg.offset)
        {
            job->acked = msg.offset;

            // keep the last snapshot at or below the acked offset
            auto it = job->snapshots.upper_bound(job->acked);

            if(it != job->snapshots.begin())
            {
                job->snapshots.erase(job->snapshots.begin(), std::prev(it));
            }
        }
    }

    void FileTransferManager::rewindSender(FileTransfer::Job & job, uint64_t offset)
    {
        Crypto::Digest digest;
        uint64_t pos = 0;

        if(auto it = job.snapshots.upper_bound(offset); it != job.snapshots.begin())
        {
            it = std::prev(it);
            pos = it->first;
            digest = it->second;
        }

        // rebuild the digest by re-reading
        while(pos < offset)
        {
            auto len = std::min<uint64_t>(job.chunk, offset - pos);
            auto buf = job.reader->read(pos, len);

            if(buf.empty())
            {
                throw std::runtime_error("read failed");
            }

            digest.update(buf);
            pos += buf.size();
        }

        job.snapshots.erase(job.snapshots.upper_bound(offset), job.snapshots.end());
        job.digest = std::move(digest);
        job.offset = offset;
        job.acked = offset;
        job.completeSent = false;
    }

    void FileTransferManager::recvRetransmit(const Msg::FileRetransmit & msg)
    {
        auto job = findJob(msg.job);

        if(! job || job->isFinished() || job->direction != FileJobDirection::Send)
        {
            return;
        }

        if(msg.offset > job->offset)
        {
            finishJob(*job, FileJobState::Failed, "invalid retransmit offset", true);
            return;
        }

        Application::warning("%s: job: 0x%08" PRIx32 ", offset: %" PRIu64, __FUNCTION__, job->id, msg.offset);

        try
        {
            rewindSender(*job, msg.offset);
            job->state = FileJobState::Transferring;
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            finishJob(*job, FileJobState::Failed, "read failed", true);
        }
    }

    void FileTransferManager::recvResume(const Msg::FileResume & msg)
    {
        auto job = findJob(msg.job);

        if(! job || job->isFinished() || job->direction != FileJobDirection::Send)
        {
            return;
        }

        if(msg.offset > job->offset || msg.offset > job->size)
        {
            finishJob(*job, FileJobState::Failed, "invalid resume offset", true);
            return;
        }

        Application::info("%s: job: 0x%08" PRIx32 ", offset: %" PRIu64, __FUNCTION__, job->id, msg.offset);

        try
        {
            rewindSender(*job, msg.offset);
            job->state = FileJobState::Transferring;
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            finishJob(*job, FileJobState::Failed, "read failed", true);
        }
    }

    void FileTransferManager::recvCancel(const Msg::FileCancel & msg)
    {
        if(auto job = findJob(msg.job))
        {
            finishJob(*job, FileJobState::Cancelled, msg.reason, false);
        }
        else
        {
            finished.insert(msg.job);
        }
    }

    void FileTransferManager::recvVerified(const Msg::FileVerified & msg)
    {
        auto job = findJob(msg.job);

        if(job && job->direction == FileJobDirection::Send && job->completeSent)
        {
            job->acked = job->size;
            finishJob(*job, FileJobState::Completed, "verified", false);
        }
    }

    void FileTransferManager::recvDirRequest(const Msg::FileDirRequest & msg)
    {
        Msg::FileDirReply reply;
        reply.request = msg.request;

        try
        {
            if(filesystem)
            {
                if(auto entries = filesystem->listDirectory(msg.path))
                {
                    reply.entries = std::move(*entries);
                    reply.success = true;
                }
            }
        }
        catch(const std::exception & err)
        {
            Application::error("%s: exception: %s", __FUNCTION__, err.what());
            reply.entries.clear();
        }

        Application::debug(DebugType::File, "%s: path: `%s', entries: %lu", __FUNCTION__, msg.path.c_str(), reply.entries.size());
        send(0, std::move(reply));
    }

    void FileTransferManager::recvDirReply(const Msg::FileDirReply & msg)
    {
        if(! msg.success)
        {
            Application::warning("%s: request failed: %" PRIu32, __FUNCTION__, msg.request);
        }

        if(events)
        {
            events->fileDirectoryListed(msg.request, msg.entries);
        }
    }

    void FileTransferManager::recvGap(uint32_t id)
    {
        const std::scoped_lock guard{ lock };

        if(auto job = findJob(id); job && ! job->isFinished() && job->direction == FileJobDirection::Receive)
        {
            requestRetransmit(*job, "channel gap");
            purgeFinished();
        }
    }

    bool FileTransferManager::stepJob(FileTransfer::Job & job)
    {
        bool res = false;
        auto windowBytes = static_cast<uint64_t>(settings.window) * job.chunk;

        while(job.offset < job.size && job.offset - job.acked < windowBytes)
        {
            auto len = std::min<uint64_t>(job.chunk, job.size - job.offset);
            BinaryBuf buf;

            try
            {
                buf = job.reader->read(job.offset, len);
            }
            catch(const std::exception & err)
            {
                Application::error("%s: exception: %s", __FUNCTION__, err.what());
            }

            if(buf.empty() || buf.size() > len)
            {
                finishJob(job, FileJobState::Failed, "read failed", true);
                return res;
            }

            Msg::FileChunk chunk;
            chunk.job = job.id;
            chunk.offset = job.offset;

            job.digest.update(buf);
            job.offset += buf.size();
            job.chunksSent++;

            if(settings.digestInterval && job.chunksSent % settings.digestInterval == 0)
            {
                chunk.digest = job.digest.value();
                job.snapshots.emplace(job.offset, job.digest);
            }

            chunk.payload = std::move(buf);
            send(job.id, std::move(chunk));
            res = true;
        }

        if(job.offset == job.size && ! job.completeSent)
        {
            job.completeSent = true;
            send(job.id, Msg::FileComplete{ job.id, job.digest.value() });
            res = true;
        }

        return res;
    }

    bool FileTransferManager::step(void)
    {
        const std::scoped_lock guard{ lock };
        bool res = false;

        for(auto & pair : jobs)
        {
            auto & job = *pair.second;

            if(job.direction == FileJobDirection::Send && job.state == FileJobState::Transferring)
            {
                if(stepJob(job))
                {
                    res = true;
                }
            }
        }

        purgeFinished();
        return res;
    }

    void FileTransferManager::pauseAll(void)
    {
        const std::scoped_lock guard{ lock };

        for(auto & pair : jobs)
        {
            auto & job = *pair.second;

            if(job.state == FileJobState::Transferring)
            {
                Application::debug(DebugType::File, "%s: job: 0x%08" PRIx32 ", offset: %" PRIu64, __FUNCTION__, job.id, job.offset);
                job.state = FileJobState::Paused;
            }
        }
    }

    void FileTransferManager::resumeAll(void)
    {
        const std::scoped_lock guard{ lock };

        for(auto & pair : jobs)
        {
            auto & job = *pair.second;

            if(job.isFinished())
            {
                continue;
            }

            if(job.state == FileJobState::Requested)
            {
                if(job.direction == FileJobDirection::Send)
                {
                    send(job.id, Msg::FileRequest{ job.id, Msg::FileDirection::Push, job.name, job.size, job.chunk });
                }
                else
                {
                    send(job.id, Msg::FileRequest{ job.id, Msg::FileDirection::Pull, job.name, 0, job.chunk });
                }
            }
            else if(job.state == FileJobState::Paused && job.direction == FileJobDirection::Receive)
            {
                // bytes in flight were lost with the transport
                job.acked = job.offset;
                job.chunksUnacked = 0;
                job.state = FileJobState::Transferring;

                Application::info("%s: job: 0x%08" PRIx32 ", offset: %" PRIu64, __FUNCTION__, job.id, job.offset);
                send(job.id, Msg::FileResume{ job.id, job.offset });
            }
        }

        announceFinished();
    }

    void FileTransferManager::cancelAll(const std::string & reason)
    {
        const std::scoped_lock guard{ lock };

        for(auto & pair : jobs)
        {
            finishJob(*pair.second, FileJobState::Cancelled, reason, false);
        }

        purgeFinished();
    }

    std::optional<FileJobInfo> FileTransferManager::jobInfo(uint32_t id) const
    {
        const std::scoped_lock guard{ lock };

        if(auto it = jobs.find(id); it != jobs.end())
        {
            return FileJobInfo(*it->second);
        }

        auto it = std::find_if(history.rbegin(), history.rend(), [=](auto & rec)
        {
            return rec.id == id;
        });

        if(it != history.rend())
        {
            return FileJobInfo(*it);
        }

        return std::nullopt;
    }

    size_t FileTransferManager::activeJobs(void) const
    {
        const std::scoped_lock guard{ lock };

        return std::count_if(jobs.begin(), jobs.end(), [](auto & pair)
        {
            return ! pair.second->isFinished();
        });
    }

    size_t FileTransferManager::historySize(void) const
    {
        const std::scoped_lock guard{ lock };
        return history.size();
    }
}
