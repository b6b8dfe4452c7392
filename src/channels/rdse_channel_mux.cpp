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
#include "rdse_channel_mux.h"

namespace RDSE
{
    size_t Mux::packetWeight(const Packet & pkt)
    {
        size_t res = Protocol::header_size;

        if(auto file = std::get_if<FileMsg>(& pkt.msg))
        {
            if(auto chunk = std::get_if<Msg::FileChunk>(file))
            {
                res += chunk->payload.size() + chunk->digest.size();
            }
        }
        else if(auto term = std::get_if<TerminalMsg>(& pkt.msg))
        {
            if(auto data = std::get_if<Msg::TerminalData>(term))
            {
                res += data->data.size();
            }
        }
        else if(auto video = std::get_if<VideoMsg>(& pkt.msg))
        {
            res += std::get<Msg::VideoChunk>(*video).payload.size();
        }

        return res;
    }

    bool Mux::isOrdered(const ChannelKind & kind)
    {
        return kind == ChannelKind::Video || kind == ChannelKind::FileTransfer;
    }

    bool Mux::isData(const Packet & pkt)
    {
        if(auto file = std::get_if<FileMsg>(& pkt.msg))
        {
            return std::holds_alternative<Msg::FileChunk>(*file);
        }

        if(auto term = std::get_if<TerminalMsg>(& pkt.msg))
        {
            return std::holds_alternative<Msg::TerminalData>(*term);
        }

        return std::holds_alternative<VideoMsg>(pkt.msg);
    }

    bool Mux::isKeyframe(const Packet & pkt)
    {
        auto video = std::get_if<VideoMsg>(& pkt.msg);
        return video && std::get<Msg::VideoChunk>(*video).keyframe;
    }

    /* ChannelMux */
    ChannelMux::ChannelMux(const MuxSettings & st) : settings(st)
    {
        bucketTime = std::chrono::steady_clock::now();

        if(settings.videoDepth == 0)
        {
            settings.videoDepth = 1;
        }
    }

    void ChannelMux::setListener(MuxListener* ptr)
    {
        const std::scoped_lock guard{ lock };
        listener = ptr;
    }

    void ChannelMux::setBandwidth(size_t val)
    {
        const std::scoped_lock guard{ lock };
        settings.bandwidth = val;
        bucketTokens = 0;
    }

    bool ChannelMux::enqueue(Packet && pkt)
    {
        std::optional<uint32_t> overflow;

        {
            const std::scoped_lock guard{ lock };

            if(stopped)
            {
                Application::debug(DebugType::Mux, "%s: stopped, channel: %s/%" PRIu32, __FUNCTION__, channelKindName(pkt.channel.kind), pkt.channel.sub);
                return false;
            }

            switch(pkt.channel.kind)
            {
                case ChannelKind::Control:
                case ChannelKind::Input:
                    urgent.emplace_back(std::move(pkt));
                    break;

                case ChannelKind::Video:
                {
                    auto & ctx = outboundContext(pkt.channel);
                    auto & queue = ctx.queue;

                    if(settings.videoDepth <= queue.size())
                    {
                        auto it = std::find_if(queue.begin(), queue.end(), [](auto & val)
                        {
                            return ! Mux::isKeyframe(val);
                        });

                        if(it == queue.end())
                        {
                            it = queue.begin();
                        }

                        ctx.bytes -= Mux::packetWeight(*it);
                        queue.erase(it);
                        droppedVideo++;
                        overflow = pkt.channel.sub;
                    }

                    ctx.bytes += Mux::packetWeight(pkt);
                    queue.emplace_back(std::move(pkt));
                    break;
                }

                default:
                {
                    auto & ctx = outboundContext(pkt.channel);

                    // late message on a finished channel
                    if(ctx.queue.empty() && released.contains(pkt.channel))
                    {
                        ctx.released = true;
                    }

                    ctx.bytes += Mux::packetWeight(pkt);
                    ctx.queue.emplace_back(std::move(pkt));
                    break;
                }
            }
        }

        cv.notify_one();

        if(overflow)
        {
            Application::debug(DebugType::Mux, "%s: video overflow, display: %" PRIu32, __FUNCTION__, *overflow);

            if(listener)
            {
                listener->muxVideoDropped(*overflow);
            }
        }

        return true;
    }

    Mux::Outbound & ChannelMux::outboundContext(const ChannelId & id)
    {
        auto it = outbound.find(id);

        if(it == outbound.end())
        {
            it = outbound.emplace(id, Mux::Outbound()).first;
            it->second.seq = sequenceStart;
        }

        return it->second;
    }

    Mux::Inbound & ChannelMux::inboundContext(const ChannelId & id)
    {
        auto it = inbound.find(id);

        if(it == inbound.end())
        {
            it = inbound.emplace(id, Mux::Inbound()).first;
            it->second.expected = sequenceStart;
        }

        return it->second;
    }

    uint32_t ChannelMux::nextSeq(const ChannelId & id)
    {
        return outboundContext(id).seq++;
    }

    bool ChannelMux::refillBucket(const TimePoint & now)
    {
        if(settings.bandwidth == 0)
        {
            return true;
        }

        double rate = settings.bandwidth * std::clamp(settings.fileShare, 0.01, 1.0);
        double elapsed = std::chrono::duration<double>(now - bucketTime).count();

        bucketTime = now;
        // one second burst
        bucketTokens = std::min(rate, bucketTokens + rate * std::max(elapsed, 0.0));

        return 0 < bucketTokens;
    }

    std::optional<Packet> ChannelMux::takeRoundRobin(std::optional<ChannelId> & last, std::initializer_list<ChannelKind> kinds, bool throttled)
    {
        auto match = [&](auto & pair)
        {
            return ! pair.second.queue.empty() &&
                   std::find(kinds.begin(), kinds.end(), pair.first.kind) != kinds.end();
        };

        auto start = last ? outbound.upper_bound(*last) : outbound.begin();
        auto it = std::find_if(start, outbound.end(), match);

        if(it == outbound.end())
        {
            it = std::find_if(outbound.begin(), start, match);

            if(it == start)
            {
                return std::nullopt;
            }
        }

        auto & queue = it->second.queue;
        auto weight = Mux::packetWeight(queue.front());

        if(throttled)
        {
            bucketTokens -= weight;
        }

        it->second.bytes -= weight;

        Packet pkt = std::move(queue.front());
        queue.pop_front();

        pkt.seq = it->second.seq++;
        last = it->first;

        if(it->second.released && queue.empty())
        {
            outbound.erase(it);
        }

        return pkt;
    }

    std::optional<Packet> ChannelMux::dequeue(const TimePoint & now, bool all)
    {
        const std::scoped_lock guard{ lock };

        if(! all)
        {
            auto it = std::find_if(urgent.begin(), urgent.end(), [](auto & pkt)
            {
                return pkt.channel.kind == ChannelKind::Control;
            });

            if(it == urgent.end())
            {
                return std::nullopt;
            }

            Packet pkt = std::move(*it);
            urgent.erase(it);
            pkt.seq = nextSeq(pkt.channel);
            return pkt;
        }

        if(! urgent.empty())
        {
            Packet pkt = std::move(urgent.front());
            urgent.pop_front();
            pkt.seq = nextSeq(pkt.channel);
            return pkt;
        }

        if(auto pkt = takeRoundRobin(lastVideo, { ChannelKind::Video }, false))
        {
            return pkt;
        }

        if(auto pkt = takeRoundRobin(lastMiddle, { ChannelKind::Terminal, ChannelKind::Clipboard, ChannelKind::Audio }, false))
        {
            return pkt;
        }

        if(refillBucket(now))
        {
            return takeRoundRobin(lastFile, { ChannelKind::FileTransfer }, 0 < settings.bandwidth);
        }

        return std::nullopt;
    }

    bool ChannelMux::hasQueued(void) const
    {
        return ! urgent.empty() || std::any_of(outbound.begin(), outbound.end(), [](auto & pair)
        {
            return ! pair.second.queue.empty();
        });
    }

    bool ChannelMux::wait(const std::chrono::milliseconds & ms)
    {
        std::unique_lock<std::mutex> guard{ lock };

        return cv.wait_for(guard, ms, [this]()
        {
            return stopped || hasQueued();
        }) && ! stopped;
    }

    Mux::Delivery ChannelMux::receive(Packet && pkt)
    {
        Mux::Delivery res;
        const std::scoped_lock guard{ lock };

        // a released channel keeps no reorder context, the owner drops what it does not expect
        if(! Mux::isOrdered(pkt.channel.kind) || released.contains(pkt.channel))
        {
            res.packets.emplace_back(std::move(pkt));
            return res;
        }

        auto & ctx = inboundContext(pkt.channel);

        if(Mux::SeqLess()(pkt.seq, ctx.expected) || ctx.pending.count(pkt.seq))
        {
            Application::debug(DebugType::Mux, "%s: stale duplicate, channel: %s/%" PRIu32 ", seq: %" PRIu32,
                               __FUNCTION__, channelKindName(pkt.channel.kind), pkt.channel.sub, pkt.seq);
            return res;
        }

        auto id = pkt.channel;
        ctx.pending.emplace(pkt.seq, std::move(pkt));

        // window exhausted, give up on the missing packets
        if(settings.reorderWindow < ctx.pending.size())
        {
            auto first = ctx.pending.begin()->first;
            Application::warning("%s: channel gap, channel: %s/%" PRIu32 ", expected: %" PRIu32 ", resume: %" PRIu32,
                                 __FUNCTION__, channelKindName(id.kind), id.sub, ctx.expected, first);
            ctx.expected = first;
            res.gap = true;
        }

        while(! ctx.pending.empty() && ctx.pending.begin()->first == ctx.expected)
        {
            res.packets.emplace_back(std::move(ctx.pending.begin()->second));
            ctx.pending.erase(ctx.pending.begin());
            ctx.expected++;
        }

        return res;
    }

    void ChannelMux::releaseChannel(const ChannelId & id, bool dropData)
    {
        const std::scoped_lock guard{ lock };

        released.insert(id);
        inbound.erase(id);

        auto it = outbound.find(id);

        if(it == outbound.end())
        {
            return;
        }

        auto & ctx = it->second;

        if(dropData)
        {
            auto first = std::stable_partition(ctx.queue.begin(), ctx.queue.end(), [](auto & pkt)
            {
                return ! Mux::isData(pkt);
            });

            for(auto pos = first; pos != ctx.queue.end(); ++pos)
            {
                ctx.bytes -= Mux::packetWeight(*pos);
            }

            Application::debug(DebugType::Mux, "%s: channel: %s/%" PRIu32 ", dropped: %lu",
                               __FUNCTION__, channelKindName(id.kind), id.sub, static_cast<size_t>(std::distance(first, ctx.queue.end())));
            ctx.queue.erase(first, ctx.queue.end());
        }

        if(ctx.queue.empty())
        {
            outbound.erase(it);
        }
        else
        {
            ctx.released = true;
        }
    }

    bool ChannelMux::isReleased(const ChannelId & id) const
    {
        const std::scoped_lock guard{ lock };
        return released.contains(id);
    }

    size_t ChannelMux::contexts(void) const
    {
        const std::scoped_lock guard{ lock };
        return outbound.size() + inbound.size();
    }

    void ChannelMux::clearQueues(const ChannelKind & kind)
    {
        const std::scoped_lock guard{ lock };

        if(kind == ChannelKind::Control || kind == ChannelKind::Input)
        {
            urgent.erase(std::remove_if(urgent.begin(), urgent.end(), [&](auto & pkt)
            {
                return pkt.channel.kind == kind;
            }), urgent.end());
            return;
        }

        for(auto it = outbound.begin(); it != outbound.end();)
        {
            if(it->first.kind != kind)
            {
                ++it;
            }
            else if(it->second.released)
            {
                it = outbound.erase(it);
            }
            else
            {
                it->second.queue.clear();
                it->second.bytes = 0;
                ++it;
            }
        }
    }

    void ChannelMux::resetSequences(uint32_t start)
    {
        const std::scoped_lock guard{ lock };

        for(auto & pair : outbound)
        {
            pair.second.seq = start;
        }

        inbound.clear();
        sequenceStart = start;
        Application::debug(DebugType::Mux, "%s: %s", __FUNCTION__, "sequences restarted");
    }

    size_t ChannelMux::queued(const ChannelId & id) const
    {
        const std::scoped_lock guard{ lock };

        if(id.kind == ChannelKind::Control || id.kind == ChannelKind::Input)
        {
            return std::count_if(urgent.begin(), urgent.end(), [&](auto & pkt)
            {
                return pkt.channel == id;
            });
        }

        auto it = outbound.find(id);
        return it != outbound.end() ? it->second.queue.size() : 0;
    }

    size_t ChannelMux::queuedBytes(const ChannelId & id) const
    {
        const std::scoped_lock guard{ lock };
        auto it = outbound.find(id);
        return it != outbound.end() ? it->second.bytes : 0;
    }

    size_t ChannelMux::queuedBulk(void) const
    {
        const std::scoped_lock guard{ lock };
        size_t res = 0;

        for(auto & pair : outbound)
        {
            res += pair.second.queue.size();
        }

        return res;
    }

    size_t ChannelMux::videoDropped(void) const
    {
        const std::scoped_lock guard{ lock };
        return droppedVideo;
    }

    void ChannelMux::shutdown(void)
    {
        {
            const std::scoped_lock guard{ lock };
            stopped = true;
        }

        cv.notify_all();
    }
}
