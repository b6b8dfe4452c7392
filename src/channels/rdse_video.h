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

#ifndef _RDSE_VIDEO_
#define _RDSE_VIDEO_

#include <map>
#include <chrono>
#include <optional>

#include "rdse_global.h"
#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    struct VideoSettings
    {
        size_t          chunkSize = 64 * 1024;
        std::chrono::milliseconds keyframeTimeout{1000};
        int             decodeFailures = 3;
        size_t          pendingFrames = 8;
        // wire frame limit, raw updates must fit one frame
        size_t          frameMax = Protocol::frame_max_default;
    };

    class VideoListener
    {
    public:
        virtual ~VideoListener() = default;

        /// @brief: lower the negotiated quality
        virtual void    videoQualityFallback(uint32_t display) = 0;
    };

    namespace Video
    {
        struct Assembly
        {
            uint64_t    pts = 0;
            VideoCodec  codec = VideoCodec::Raw;
            uint16_t    count = 0;
            bool        keyframe = false;
            std::map<uint16_t, BinaryBuf> chunks;

            bool        complete(void) const { return chunks.size() == count; }
            BinaryBuf   join(void) const;
        };

        struct Display
        {
            std::map<uint32_t, Assembly, Mux::SeqLess> pending;
            std::optional<uint32_t> lastFrame;
            uint64_t    lastPts = 0;
            bool        lastKeyframe = false;

            bool        awaitingKeyframe = false;
            TimePoint   keyframeRequested;
            int         decodeFailures = 0;

            // sender side
            uint32_t    sendFrame = 0;
            bool        keyframePending = false;
        };
    }

    /// @brief: chunking on send, reassembly and keyframe recovery on receive
    class VideoPipeline : public MuxListener
    {
        VideoSettings   settings;
        INTMAP<uint32_t, Video::Display> displays;

        PacketSender*   sender = nullptr;
        VideoSource*    source = nullptr;
        VideoSink*      sink = nullptr;
        VideoListener*  listener = nullptr;

        size_t          framesDelivered = 0;
        size_t          framesDropped = 0;

    protected:
        void            requestKeyframe(uint32_t display, Video::Display &, const TimePoint &);
        void            frameComplete(uint32_t display, Video::Display &, uint32_t frame, const TimePoint &);
        void            askSourceKeyframe(uint32_t display);

    public:
        VideoPipeline(const VideoSettings &, PacketSender*);

        void            setSource(VideoSource*);
        void            setSink(VideoSink*);
        void            setListener(VideoListener*);

        /// @brief: split encoded frame, return frame sequence
        uint32_t        sendFrame(const VideoFrame &);

        /// @brief: inbound chunk after the multiplexer
        void            recvChunk(const Msg::VideoChunk &, const TimePoint &);
        /// @brief: channel gap reported by the multiplexer
        void            recvGap(uint32_t display, const TimePoint &);
        /// @brief: remote decoder asks for a keyframe
        void            recvKeyframeRequest(const Msg::KeyframeRequest &);

        /// @brief: consumer decode error
        void            decodeFailed(uint32_t display, const TimePoint &);

        void            muxVideoDropped(uint32_t display) override;

        void            tick(const TimePoint &);
        /// @brief: forget receive state, used on reconnect
        void            reset(void);

        bool            isAwaitingKeyframe(uint32_t display) const;
        size_t          delivered(void) const { return framesDelivered; }
        size_t          dropped(void) const { return framesDropped; }
    };
}

#endif // _RDSE_VIDEO_
