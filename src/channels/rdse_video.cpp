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
#include "rdse_video.h"

namespace RDSE
{
    BinaryBuf Video::Assembly::join(void) const
    {
        size_t total = 0;

        for(auto & pair : chunks)
        {
            total += pair.second.size();
        }

        BinaryBuf res;
        res.reserve(total);

        for(auto & pair : chunks)
        {
            res.append(pair.second);
        }

        return res;
    }

    /* VideoPipeline */
    VideoPipeline::VideoPipeline(const VideoSettings & st, PacketSender* ptr) : settings(st), sender(ptr)
    {
        if(settings.chunkSize == 0)
        {
            settings.chunkSize = 64 * 1024;
        }
    }

    void VideoPipeline::setSource(VideoSource* ptr)
    {
        source = ptr;
    }

    void VideoPipeline::setSink(VideoSink* ptr)
    {
        sink = ptr;
    }

    void VideoPipeline::setListener(VideoListener* ptr)
    {
        listener = ptr;
    }

    uint32_t VideoPipeline::sendFrame(const VideoFrame & frame)
    {
        auto & disp = displays[frame.display];
        auto seq = disp.sendFrame++;

        if(frame.keyframe)
        {
            disp.keyframePending = false;
        }

        // raw color updates bypass reassembly, one chunk per frame
        size_t chunkSize = frame.codec == VideoCodec::Raw ? std::max<size_t>(frame.data.size(), 1) : settings.chunkSize;
        size_t count = frame.data.empty() ? 1 : (frame.data.size() + chunkSize - 1) / chunkSize;

        if(frame.codec == VideoCodec::Raw && settings.frameMax < frame.data.size() + 64)
        {
            Application::error("%s: raw frame too large: %lu", __FUNCTION__, frame.data.size());
            throw channel_error(ChannelId(ChannelKind::Video, frame.display), "raw frame too large");
        }

        if(0xFFFF < count)
        {
            Application::error("%s: frame too large: %lu", __FUNCTION__, frame.data.size());
            throw channel_error(ChannelId(ChannelKind::Video, frame.display), "frame too large");
        }

        Application::trace(DebugType::Video, "%s: display: %" PRIu32 ", frame: %" PRIu32 ", keyframe: %s, size: %lu, chunks: %lu",
                           __FUNCTION__, frame.display, seq, (frame.keyframe ? "true" : "false"), frame.data.size(), count);

        for(size_t index = 0; index < count; ++index)
        {
            auto it1 = frame.data.begin() + std::min(frame.data.size(), index * chunkSize);
            auto it2 = frame.data.begin() + std::min(frame.data.size(), (index + 1) * chunkSize);

            Msg::VideoChunk chunk;
            chunk.display = frame.display;
            chunk.frame = seq;
            chunk.pts = frame.pts;
            chunk.keyframe = frame.keyframe;
            chunk.codec = frame.codec;
            chunk.index = index;
            chunk.count = count;
            chunk.payload = BinaryBuf(it1, it2);

            sender->sendPacket(Packet(ChannelId(ChannelKind::Video, frame.display), VideoMsg(std::move(chunk))));
        }

        return seq;
    }

    void VideoPipeline::askSourceKeyframe(uint32_t display)
    {
        if(source)
        {
            source->requestKeyframe(display);
        }
        else
        {
            Application::warning("%s: video source not set, display: %" PRIu32, __FUNCTION__, display);
        }
    }

    void VideoPipeline::recvKeyframeRequest(const Msg::KeyframeRequest & msg)
    {
        Application::debug(DebugType::Video, "%s: display: %" PRIu32, __FUNCTION__, msg.display);
        displays[msg.display].keyframePending = true;
        askSourceKeyframe(msg.display);
    }

    void VideoPipeline::muxVideoDropped(uint32_t display)
    {
        auto & disp = displays[display];

        // one request until the keyframe is sent
        if(! disp.keyframePending)
        {
            disp.keyframePending = true;
            askSourceKeyframe(display);
        }
    }

    void VideoPipeline::requestKeyframe(uint32_t display, Video::Display & disp, const TimePoint & now)
    {
        if(disp.awaitingKeyframe)
        {
            return;
        }

        Application::info("%s: display: %" PRIu32, __FUNCTION__, display);

        disp.awaitingKeyframe = true;
        disp.keyframeRequested = now;

        sender->sendPacket(Packet(ChannelKind::Control, ControlMsg(Msg::KeyframeRequest{ display })));
    }

    void VideoPipeline::recvGap(uint32_t display, const TimePoint & now)
    {
        auto & disp = displays[display];
        framesDropped += disp.pending.size();
        disp.pending.clear();
        requestKeyframe(display, disp, now);
    }

    void VideoPipeline::recvChunk(const Msg::VideoChunk & chunk, const TimePoint & now)
    {
        // raw color frames pass through
        if(chunk.codec == VideoCodec::Raw)
        {
            if(sink)
            {
                sink->videoFrame(VideoFrame{ chunk.display, chunk.frame, chunk.pts, chunk.keyframe, chunk.codec, chunk.payload });
            }

            framesDelivered++;
            return;
        }

        auto & disp = displays[chunk.display];

        if(disp.lastFrame && ! Mux::SeqLess()(*disp.lastFrame, chunk.frame))
        {
            Application::debug(DebugType::Video, "%s: stale frame: %" PRIu32 ", last: %" PRIu32, __FUNCTION__, chunk.frame, *disp.lastFrame);
            return;
        }

        if(disp.awaitingKeyframe && ! chunk.keyframe)
        {
            if(chunk.index == 0)
            {
                framesDropped++;
            }

            return;
        }

        auto & assembly = disp.pending[chunk.frame];

        if(assembly.count == 0)
        {
            assembly.count = chunk.count;
            assembly.pts = chunk.pts;
            assembly.codec = chunk.codec;
            assembly.keyframe = chunk.keyframe;
        }
        else if(assembly.count != chunk.count || assembly.keyframe != chunk.keyframe)
        {
            Application::warning("%s: inconsistent chunk, display: %" PRIu32 ", frame: %" PRIu32, __FUNCTION__, chunk.display, chunk.frame);
            disp.pending.erase(chunk.frame);
            framesDropped++;
            return;
        }

        assembly.chunks.emplace(chunk.index, chunk.payload);

        if(assembly.complete())
        {
            frameComplete(chunk.display, disp, chunk.frame, now);
        }
        else if(settings.pendingFrames < disp.pending.size())
        {
            disp.pending.erase(disp.pending.begin());
            framesDropped++;
        }
    }

    void VideoPipeline::frameComplete(uint32_t display, Video::Display & disp, uint32_t frame, const TimePoint & now)
    {
        auto it = disp.pending.find(frame);
        Video::Assembly assembly = std::move(it->second);

        // older incomplete frames are superseded
        framesDropped += std::distance(disp.pending.begin(), it);
        disp.pending.erase(disp.pending.begin(), std::next(it));

        if(! assembly.keyframe)
        {
            if(disp.awaitingKeyframe)
            {
                framesDropped++;
                return;
            }

            if(! disp.lastFrame || *disp.lastFrame + 1 != frame)
            {
                Application::warning("%s: frame gap, display: %" PRIu32 ", frame: %" PRIu32, __FUNCTION__, display, frame);
                framesDropped++;
                requestKeyframe(display, disp, now);
                return;
            }
        }
        else if(disp.awaitingKeyframe)
        {
            Application::debug(DebugType::Video, "%s: keyframe received, display: %" PRIu32, __FUNCTION__, display);
            disp.awaitingKeyframe = false;
        }

        disp.lastFrame = frame;
        disp.lastPts = assembly.pts;
        disp.lastKeyframe = assembly.keyframe;
        framesDelivered++;

        if(sink)
        {
            sink->videoFrame(VideoFrame{ display, frame, assembly.pts, assembly.keyframe, assembly.codec, assembly.join() });
        }
    }

    void VideoPipeline::decodeFailed(uint32_t display, const TimePoint & now)
    {
        auto & disp = displays[display];
        disp.decodeFailures++;

        Application::warning("%s: display: %" PRIu32 ", failures: %d", __FUNCTION__, display, disp.decodeFailures);

        if(settings.decodeFailures <= disp.decodeFailures)
        {
            disp.decodeFailures = 0;

            if(listener)
            {
                listener->videoQualityFallback(display);
            }

            disp.awaitingKeyframe = false;
            requestKeyframe(display, disp, now);
        }
    }

    void VideoPipeline::tick(const TimePoint & now)
    {
        for(auto & [display, disp] : displays)
        {
            if(disp.awaitingKeyframe && settings.keyframeTimeout < now - disp.keyframeRequested)
            {
                Application::warning("%s: keyframe timeout, display: %" PRIu32, __FUNCTION__, display);

                if(listener)
                {
                    listener->videoQualityFallback(display);
                }

                disp.keyframeRequested = now;
                sender->sendPacket(Packet(ChannelKind::Control, ControlMsg(Msg::KeyframeRequest{ display })));
            }
        }
    }

    void VideoPipeline::reset(void)
    {
        for(auto & pair : displays)
        {
            auto & disp = pair.second;
            disp.pending.clear();
            disp.lastFrame.reset();
            disp.awaitingKeyframe = false;
            disp.keyframePending = false;
        }
    }

    bool VideoPipeline::isAwaitingKeyframe(uint32_t display) const
    {
        auto it = displays.find(display);
        return it != displays.end() && it->second.awaitingKeyframe;
    }
}
