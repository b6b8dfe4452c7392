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

#include <algorithm>

#include "rdse_tools.h"
#include "rdse_streambuf.h"
#include "rdse_application.h"

namespace RDSE
{
    uint32_t ByteArray::crc32b(void) const
    {
        return Tools::crc32b(data(), size());
    }

    /* BinaryBuf */
    BinaryBuf & BinaryBuf::append(std::string_view s)
    {
        insert(end(), s.begin(), s.end());
        return *this;
    }

    BinaryBuf & BinaryBuf::append(const uint8_t* ptr, size_t len)
    {
        insert(end(), ptr, ptr + len);
        return *this;
    }

    BinaryBuf & BinaryBuf::append(const std::vector<uint8_t> & b)
    {
        insert(end(), b.begin(), b.end());
        return *this;
    }

    /* MemoryStream */
    std::string MemoryStream::readString(size_t len) const
    {
        auto buf = read(len);
        return std::string(buf.begin(), buf.end());
    }

    MemoryStream & MemoryStream::write(const uint8_t* ptr, size_t len)
    {
        putRaw(ptr, len);
        return *this;
    }

    MemoryStream & MemoryStream::write(std::string_view v)
    {
        putRaw(v.data(), v.size());
        return *this;
    }

    MemoryStream & MemoryStream::write(const std::vector<uint8_t> & v)
    {
        putRaw(v.data(), v.size());
        return *this;
    }

    void shortRead(const char* func, size_t last, size_t len)
    {
        Application::debug(DebugType::Proto, "%s: short read, last: %lu, len: %lu", func, last, len);
        throw streambuf_error(func);
    }

    /* StreamBufRef */
    StreamBufRef::StreamBufRef(const void* ptr, size_t len)
    {
        reset(ptr, len);
    }

    StreamBufRef::StreamBufRef(const std::vector<uint8_t> & v)
    {
        reset(v.data(), v.size());
    }

    void StreamBufRef::reset(const void* ptr, size_t len)
    {
        it1 = static_cast<const uint8_t*>(ptr);
        it2 = ptr ? it1 + len : nullptr;
    }

    void StreamBufRef::getRaw(void* ptr, size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        std::copy_n(it1, len, static_cast<uint8_t*>(ptr));
        it1 += len;
    }

    void StreamBufRef::putRaw(const void* ptr, size_t len)
    {
        Application::error("%s: %s", __FUNCTION__, "read only stream");
        throw streambuf_error(NS_FuncName);
    }

    BinaryBuf StreamBufRef::read(size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        if(len == 0)
        {
            len = last();
        }

        auto it0 = it1;
        it1 += len;
        return BinaryBuf(it0, len);
    }

    void StreamBufRef::skip(size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        it1 += len;
    }

    size_t StreamBufRef::last(void) const
    {
        return it2 - it1;
    }

    uint8_t StreamBufRef::peek(void) const
    {
        if(it1 == it2)
        {
            shortRead(__FUNCTION__, 0, 1);
        }

        return *it1;
    }

    /* StreamBuf */
    StreamBuf::StreamBuf(size_t reserve)
    {
        vec.reserve(reserve);
    }

    void StreamBuf::reset(const std::vector<uint8_t> & v)
    {
        vec.assign(v.begin(), v.end());
        pos = 0;
    }

    void StreamBuf::getRaw(void* ptr, size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        std::copy_n(vec.begin() + pos, len, static_cast<uint8_t*>(ptr));
        pos += len;
    }

    void StreamBuf::putRaw(const void* ptr, size_t len)
    {
        auto src = static_cast<const uint8_t*>(ptr);
        vec.insert(vec.end(), src, src + len);
    }

    BinaryBuf StreamBuf::read(size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        if(len == 0)
        {
            len = last();
        }

        auto it0 = vec.begin() + pos;
        pos += len;
        return BinaryBuf(it0, it0 + len);
    }

    void StreamBuf::skip(size_t len) const
    {
        if(last() < len)
        {
            shortRead(__FUNCTION__, last(), len);
        }

        pos += len;
    }

    size_t StreamBuf::last(void) const
    {
        return vec.size() - pos;
    }

    uint8_t StreamBuf::peek(void) const
    {
        if(pos >= vec.size())
        {
            shortRead(__FUNCTION__, 0, 1);
        }

        return vec[pos];
    }

    void StreamBuf::shrink(void)
    {
        if(pos)
        {
            vec.erase(vec.begin(), vec.begin() + pos);
            pos = 0;
        }
    }
}
