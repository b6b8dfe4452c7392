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

#ifndef _RDSE_CHANNEL_MUX_
#define _RDSE_CHANNEL_MUX_

#include <map>
#include <set>
#include <list>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <algorithm>
#include <condition_variable>

#include "rdse_protocol.h"

namespace RDSE
{
    struct MuxSettings
    {
        size_t          videoDepth = 64;
        double          fileShare = 0.5;
        // bytes per second, 0: unlimited
        size_t          bandwidth = 0;
        size_t          reorderWindow = 16;
    };

    class PacketSender
    {
    public:
        virtual ~PacketSender() = default;

        /// @return false if the multiplexer is stopped
        virtual bool    sendPacket(Packet &&) = 0;
        /// @brief: payload bytes waiting in the channel queue
        virtual size_t  queuedBytes(const ChannelId &) const { return 0; }
        /// @brief: the owner is done with the channel
        virtual void    releaseChannel(const ChannelId &, bool dropData) {}
    };

    /// @brief: ids of finished channels, the oldest are forgotten past the limit
    template<typename Id, typename Set = std::set<Id>>
    class RecentIds
    {
        Set             ids;
        std::deque<Id>  order;
        size_t          limit;

    public:
        explicit RecentIds(size_t lim = 1024) : limit(std::max<size_t>(1, lim)) {}

        void insert(const Id & id)
        {
            if(! ids.insert(id).second)
            {
                return;
            }

            order.push_back(id);

            while(limit < order.size())
            {
                ids.erase(order.front());
                order.pop_front();
            }
        }

        bool contains(const Id & id) const { return ids.count(id); }
        size_t size(void) const { return ids.size(); }

        void clear(void)
        {
            ids.clear();
            order.clear();
        }
    };

    class MuxListener
    {
    public:
        virtual ~MuxListener() = default;

        /// @brief: video chunk dropped on overflow, ask the local source for a keyframe
        virtual void    muxVideoDropped(uint32_t display) = 0;
    };

    namespace Mux
    {
        /// @brief: serial number order, sequences wrap at 2^32
        struct SeqLess
        {
            bool operator()(uint32_t seq1, uint32_t seq2) const
            {
                return static_cast<int32_t>(seq1 - seq2) < 0;
            }
        };

        struct Outbound
        {
            std::deque<Packet> queue;
            size_t      bytes = 0;
            uint32_t    seq = 0;
            // erase when drained
            bool        released = false;
        };

        struct Inbound
        {
            uint32_t    expected = 0;
            // keys stay within the reorder window of expected
            std::map<uint32_t, Packet, SeqLess> pending;
        };

        struct Delivery
        {
            std::list<Packet> packets;
            bool        gap = false;
        };

        size_t          packetWeight(const Packet &);
        bool            isOrdered(const ChannelKind &);
        bool            isData(const Packet &);
        bool            isKeyframe(const Packet &);
    }

    /// @brief: priority scheduler for outbound, demultiplexer for inbound
    class ChannelMux : public PacketSender
    {
        MuxSettings     settings;

        // control and input share one fifo
        std::deque<Packet> urgent;
        std::map<ChannelId, Mux::Outbound> outbound;
        std::map<ChannelId, Mux::Inbound> inbound;
        RecentIds<ChannelId> released;

        std::optional<ChannelId> lastVideo;
        std::optional<ChannelId> lastMiddle;
        std::optional<ChannelId> lastFile;

        TimePoint       bucketTime;
        double          bucketTokens = 0;

        MuxListener*    listener = nullptr;

        mutable std::mutex lock;
        std::condition_variable cv;

        size_t          droppedVideo = 0;
        uint32_t        sequenceStart = 0;
        bool            stopped = false;

    protected:
        Mux::Outbound & outboundContext(const ChannelId &);
        Mux::Inbound &  inboundContext(const ChannelId &);
        uint32_t        nextSeq(const ChannelId &);
        std::optional<Packet> takeRoundRobin(std::optional<ChannelId> & last, std::initializer_list<ChannelKind> kinds, bool throttled);
        bool            refillBucket(const TimePoint &);
        bool            hasQueued(void) const;

    public:
        explicit ChannelMux(const MuxSettings & = MuxSettings());

        void            setListener(MuxListener*);
        void            setBandwidth(size_t);

        /// @brief: add outbound message
        /// @return false if the multiplexer is stopped
        bool            enqueue(Packet &&);
        bool            sendPacket(Packet && pkt) override { return enqueue(std::move(pkt)); }

        /// @brief: next packet to transmit, the channel sequence is assigned here
        /// @param all: false for control only, used before the session is active
        std::optional<Packet> dequeue(const TimePoint &, bool all = true);

        /// @brief: block until something is queued
        bool            wait(const std::chrono::milliseconds &);

        /// @brief: route inbound packet, apply reorder window
        Mux::Delivery   receive(Packet &&);

        /// @brief: forget the channel sequence contexts, the outbound one once its queue drains
        /// @param dropData: discard queued data packets, control packets still go out
        void            releaseChannel(const ChannelId &, bool dropData) override;
        bool            isReleased(const ChannelId &) const;
        /// @brief: outbound and inbound channel contexts
        size_t          contexts(void) const;

        /// @brief: drop queued packets of one kind
        void            clearQueues(const ChannelKind &);
        /// @brief: restart sequence numbering, used on session resume
        void            resetSequences(uint32_t start = 0);

        size_t          queued(const ChannelId &) const;
        size_t          queuedBytes(const ChannelId &) const override;
        size_t          queuedBulk(void) const;
        size_t          videoDropped(void) const;

        void            shutdown(void);
    };
}

#endif // _RDSE_CHANNEL_MUX_
