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

#ifndef _RDSE_FILE_TRANSFER_
#define _RDSE_FILE_TRANSFER_

#include <map>
#include <list>
#include <set>
#include <mutex>
#include <memory>
#include <string>
#include <optional>

#include "rdse_crypto.h"
#include "rdse_global.h"
#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    struct FileSettings
    {
        size_t          chunkSize = 64 * 1024;
        // unacknowledged chunks in flight
        size_t          window = 8;
        // running digest every N chunks
        size_t          digestInterval = 16;
        int             retransmitMax = 3;
        // finished jobs kept for status queries
        size_t          history = 256;
    };

    enum class FileJobState { Requested, Transferring, Paused, Completed, Failed, Cancelled };
    enum class FileJobDirection { Send, Receive };

    const char* fileJobStateName(const FileJobState &);

    struct FileJobInfo
    {
        uint32_t        id = 0;
        FileJobDirection direction = FileJobDirection::Send;
        std::string     name;
        uint64_t        size = 0;
        uint64_t        offset = 0;
        uint64_t        acked = 0;
        FileJobState    state = FileJobState::Requested;
    };

    namespace FileTransfer
    {
        struct Record : FileJobInfo
        {
            std::string reason;
            // the peer may have missed the outcome
            bool        announce = false;
        };

        struct Job : Record
        {
            std::string localName;
            uint32_t    chunk = 0;
            Crypto::Digest digest;

            // sender
            std::unique_ptr<FileReader> reader;
            std::map<uint64_t, Crypto::Digest> snapshots;
            size_t      chunksSent = 0;
            bool        completeSent = false;

            // receiver
            std::unique_ptr<FileWriter> writer;
            uint64_t    verified = 0;
            Crypto::Digest verifiedDigest;
            size_t      chunksUnacked = 0;
            int         retransmits = 0;
            // chunks past the rewind point are still in flight
            bool        rewinding = false;

            bool        isFinished(void) const;
        };
    }

    /// @brief: concurrent resumable file jobs, one channel per job
    class FileTransferManager
    {
        FileSettings    settings;
        std::map<uint32_t, std::unique_ptr<FileTransfer::Job>> jobs;
        std::list<FileTransfer::Record> history;
        RecentIds<uint32_t, INTSET<uint32_t>> finished;

        PacketSender*   sender = nullptr;
        FileSystem*     filesystem = nullptr;
        SessionEvents*  events = nullptr;

        uint32_t        jobMask = 0;
        uint32_t        nextJob = 1;
        uint32_t        nextRequest = 1;

        mutable std::recursive_mutex lock;

    protected:
        uint32_t        allocateJob(void);
        FileTransfer::Job* findJob(uint32_t);

        void            send(uint32_t job, FileMsg &&);
        void            finishJob(FileTransfer::Job &, const FileJobState &, const std::string & reason, bool notify);
        void            purgeFinished(void);
        void            announceFinished(void);
        void            rewindSender(FileTransfer::Job &, uint64_t offset);
        void            requestRetransmit(FileTransfer::Job &, const std::string & reason);
        bool            stepJob(FileTransfer::Job &);

        void            recvRequest(const Msg::FileRequest &);
        void            recvChunk(const Msg::FileChunk &);
        void            recvAck(const Msg::FileAck &);
        void            recvComplete(const Msg::FileComplete &);
        void            recvRetransmit(const Msg::FileRetransmit &);
        void            recvResume(const Msg::FileResume &);
        void            recvCancel(const Msg::FileCancel &);
        void            recvVerified(const Msg::FileVerified &);
        void            recvDirRequest(const Msg::FileDirRequest &);
        void            recvDirReply(const Msg::FileDirReply &);

    public:
        /// @param host: host side job ids use the high bit
        FileTransferManager(const FileSettings &, PacketSender*, bool host);

        void            setFileSystem(FileSystem*);
        void            setEvents(SessionEvents*);

        /// @brief: push local file
        /// @return job id, 0 on error
        uint32_t        sendFile(const std::string & local, const std::string & remote);
        /// @brief: pull remote file
        uint32_t        receiveFile(const std::string & remote, const std::string & local);
        /// @brief: remote directory listing, result in SessionEvents
        uint32_t        requestDirectory(const std::string & path);

        /// @brief: cooperative cancel, idempotent
        bool            cancel(uint32_t job, const std::string & reason = "cancelled");

        void            recvMessage(const FileMsg &);
        /// @brief: channel gap reported by the multiplexer
        void            recvGap(uint32_t job);

        /// @brief: sender pump
        /// @return true if something was sent
        bool            step(void);

        void            pauseAll(void);
        /// @brief: after session resume, receivers announce their offsets
        /// and outcomes the peer may have missed are repeated
        void            resumeAll(void);
        void            cancelAll(const std::string & reason);

        std::optional<FileJobInfo> jobInfo(uint32_t) const;
        size_t          activeJobs(void) const;
        size_t          historySize(void) const;
    };
}

#endif // _RDSE_FILE_TRANSFER_
