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

#include <chrono>
#include <cinttypes>
#include <algorithm>

#include "rdse_tools.h"
#include "rdse_crypto.h"
#include "rdse_application.h"
#include "rdse_clipboard.h"

namespace RDSE
{
    const char* clipboardFormatName(const ClipboardFormat & format)
    {
        switch(format)
        {
            case ClipboardFormat::Text: return "text";
            case ClipboardFormat::Rtf: return "rtf";
            case ClipboardFormat::Html: return "html";
            case ClipboardFormat::Image: return "image";
            case ClipboardFormat::FileList: return "filelist";
        }

        return "unknown";
    }

    BinaryBuf Clipboard::serialize(const Update & update)
    {
        StreamBuf sb(256);

        sb.writeIntBE64(update.timestamp);
        sb.writeInt8(static_cast<uint8_t>(update.origin));
        sb.writeInt8(update.content.size());

        for(auto & entry : update.content)
        {
            sb.writeInt8(static_cast<uint8_t>(entry.format));
            sb.writeIntBE32(entry.data.size());
            sb.write(entry.data);
        }

        return std::move(sb.rawbuf());
    }

    Clipboard::Update Clipboard::parse(const BinaryBuf & blob)
    {
        StreamBufRef sb(blob);
        Update res;

        res.timestamp = sb.readIntBE64();
        res.origin = sb.readInt8() ? Msg::Role::Host : Msg::Role::Client;

        size_t count = sb.readInt8();

        while(count--)
        {
            ClipboardEntry entry;
            auto format = sb.readInt8();

            if(format < static_cast<uint8_t>(ClipboardFormat::Text) || format > static_cast<uint8_t>(ClipboardFormat::FileList))
            {
                throw streambuf_error("unknown clipboard format");
            }

            entry.format = static_cast<ClipboardFormat>(format);
            auto len = sb.readIntBE32();

            if(len > sb.last())
            {
                throw streambuf_error("clipboard entry size");
            }

            if(len)
            {
                entry.data = sb.read(len);
            }

            res.content.emplace_back(std::move(entry));
        }

        if(sb.last())
        {
            throw streambuf_error("clipboard trailing bytes");
        }

        return res;
    }

    /* ClipboardSync */
    ClipboardSync::ClipboardSync(const ClipboardSettings & st, PacketSender* ptr, const Msg::Role & rl)
        : settings(st), role(rl), sender(ptr)
    {
        if(settings.chunkSize == 0)
        {
            settings.chunkSize = 64 * 1024;
        }
    }

    void ClipboardSync::setSink(ClipboardSink* ptr)
    {
        sink = ptr;
    }

    uint64_t ClipboardSync::timestampNow(void)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
        return ms.count();
    }

    bool ClipboardSync::localChanged(const ClipboardContent & content)
    {
        return localChanged(content, timestampNow());
    }

    bool ClipboardSync::localChanged(const ClipboardContent & content, uint64_t timestamp)
    {
        Clipboard::Update update;
        update.timestamp = timestamp;
        update.origin = role;

        std::map<ClipboardFormat, BinaryBuf> hashes;

        for(auto & entry : content)
        {
            auto hash = Crypto::sha256(entry.data);

            // echo of the remote content
            if(auto it = lastReceived.find(entry.format); it != lastReceived.end() && it->second == hash)
            {
                Application::debug(DebugType::Clip, "%s: suppress echo, format: %s", __FUNCTION__, clipboardFormatName(entry.format));
                continue;
            }

            // repeated notification of our own current content
            if(auto it = lastSent.find(entry.format); lastOrigin == role && it != lastSent.end() && it->second == hash)
            {
                continue;
            }

            hashes.emplace(entry.format, std::move(hash));
            update.content.push_back(entry);
        }

        if(update.content.empty())
        {
            return false;
        }

        auto blob = Clipboard::serialize(update);

        if(settings.maxSize < blob.size())
        {
            Application::warning("%s: update too large: %lu, limit: %lu", __FUNCTION__, blob.size(), settings.maxSize);
            return false;
        }

        bool compressed = settings.compressThreshold < blob.size();

        if(compressed)
        {
            auto zip = Tools::zlibCompress(blob);

            if(zip.empty())
            {
                compressed = false;
            }
            else
            {
                StreamBuf sb(zip.size() + 4);
                sb.writeIntBE32(blob.size());
                sb.write(zip);
                blob = std::move(sb.rawbuf());
            }
        }

        auto transfer = nextTransfer++;
        size_t total = blob.size();

        Application::debug(DebugType::Clip, "%s: transfer: %" PRIu32 ", formats: %lu, size: %lu, compressed: %s",
                           __FUNCTION__, transfer, update.content.size(), total, (compressed ? "true" : "false"));

        for(size_t offset = 0; offset < total; offset += settings.chunkSize)
        {
            auto len = std::min(settings.chunkSize, total - offset);

            Msg::ClipboardChunk chunk;
            chunk.transfer = transfer;
            chunk.total = total;
            chunk.offset = offset;
            chunk.compressed = compressed;
            chunk.payload = BinaryBuf(blob.data() + offset, len);

            sender->sendPacket(Packet(ChannelKind::Clipboard, ClipboardMsg(std::move(chunk))));
        }

        for(auto & pair : hashes)
        {
            // the remote board now holds our content
            lastReceived.erase(pair.first);
            lastSent[pair.first] = std::move(pair.second);
        }

        lastTimestamp = timestamp;
        lastOrigin = role;

        return true;
    }

    bool ClipboardSync::syncInitial(void)
    {
        if(sink)
        {
            if(auto content = sink->clipboardCurrent(); content && ! content->empty())
            {
                return localChanged(*content);
            }
        }

        return false;
    }

    bool ClipboardSync::accepts(uint64_t timestamp, const Msg::Role & origin) const
    {
        if(timestamp != lastTimestamp)
        {
            return lastTimestamp < timestamp;
        }

        // tie goes to the host
        return origin == Msg::Role::Host || lastOrigin != Msg::Role::Host;
    }

    void ClipboardSync::recvChunk(const Msg::ClipboardChunk & chunk)
    {
        if(chunk.offset == 0)
        {
            if(settings.maxSize < chunk.total)
            {
                Application::warning("%s: update refused, size: %" PRIu32 ", limit: %lu", __FUNCTION__, chunk.total, settings.maxSize);
                incoming.reset();
                return;
            }

            incoming = Clipboard::Incoming{ chunk.transfer, chunk.total, chunk.compressed, {} };
            incoming->data.reserve(chunk.total);
        }
        else if(! incoming || incoming->transfer != chunk.transfer)
        {
            Application::debug(DebugType::Clip, "%s: skip transfer: %" PRIu32, __FUNCTION__, chunk.transfer);
            return;
        }

        if(incoming->data.size() != chunk.offset || incoming->total != chunk.total ||
            incoming->total < chunk.offset + chunk.payload.size())
        {
            Application::warning("%s: malformed transfer: %" PRIu32 ", offset: %" PRIu32, __FUNCTION__, chunk.transfer, chunk.offset);
            incoming.reset();
            return;
        }

        incoming->data.append(chunk.payload);

        if(incoming->data.size() == incoming->total)
        {
            applyIncoming();
        }
    }

    void ClipboardSync::applyIncoming(void)
    {
        auto transfer = std::move(*incoming);
        incoming.reset();

        Clipboard::Update update;

        try
        {
            BinaryBuf blob;

            if(transfer.compressed)
            {
                StreamBufRef sb(transfer.data);
                size_t real = sb.readIntBE32();

                if(real == 0 || settings.maxSize < real)
                {
                    throw streambuf_error("invalid uncompressed size");
                }

                blob = Tools::zlibUncompress(RawPtr<const uint8_t>(sb.data(), sb.last()), real);

                if(blob.size() != real)
                {
                    throw streambuf_error("uncompress failed");
                }
            }
            else
            {
                blob = std::move(transfer.data);
            }

            update = Clipboard::parse(blob);
        }
        catch(const streambuf_error & err)
        {
            // nothing applied
            Application::warning("%s: malformed update: %" PRIu32 ", error: %s", __FUNCTION__, transfer.transfer, err.what());
            return;
        }

        if(! accepts(update.timestamp, update.origin))
        {
            Application::debug(DebugType::Clip, "%s: older than local, timestamp: %" PRIu64, __FUNCTION__, update.timestamp);
            return;
        }

        for(auto & entry : update.content)
        {
            lastReceived[entry.format] = Crypto::sha256(entry.data);
        }

        lastTimestamp = update.timestamp;
        lastOrigin = update.origin;

        Application::debug(DebugType::Clip, "%s: transfer: %" PRIu32 ", formats: %lu", __FUNCTION__, transfer.transfer, update.content.size());

        if(sink)
        {
            sink->clipboardApply(update.content);
        }
    }

    void ClipboardSync::reset(void)
    {
        incoming.reset();
    }
}
