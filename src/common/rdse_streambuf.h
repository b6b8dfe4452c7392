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

#ifndef _RDSE_STREAMBUF_
#define _RDSE_STREAMBUF_

#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>
#include <cstdint>

namespace RDSE
{
    /// @brief: byte array interface
    class ByteArray
    {
    public:
        virtual ~ByteArray() = default;

        virtual size_t  size(void) const = 0;
        virtual const uint8_t* data(void) const = 0;

        uint32_t        crc32b(void) const;
    };

    /// @brief: raw array wrapper
    template<typename T>
    struct RawPtr : ByteArray
    {
        const T*        ptr = nullptr;
        size_t          len = 0;

        RawPtr(const T* p, size_t l) : ptr(p), len(l) {}

        size_t size(void) const override { return len * sizeof(T); }
        const uint8_t* data(void) const override { return reinterpret_cast<const uint8_t*>(ptr); }
    };

    /// @brief: extend binary vector
    struct BinaryBuf : ByteArray, std::vector<uint8_t>
    {
        BinaryBuf() = default;

        BinaryBuf(size_t len, uint8_t val = 0) : std::vector<uint8_t>(len, val) {}
        BinaryBuf(const_iterator it1, const_iterator it2) : std::vector<uint8_t>(it1, it2) {}
        BinaryBuf(const uint8_t* ptr, size_t len) : std::vector<uint8_t>(ptr, ptr + len) {}
        BinaryBuf(const std::vector<uint8_t> & v) : std::vector<uint8_t>(v) {}
        BinaryBuf(std::vector<uint8_t> && v) noexcept : std::vector<uint8_t>(std::move(v)) {}

        BinaryBuf &     operator= (const std::vector<uint8_t> & v) { assign(v.begin(), v.end()); return *this; }

        BinaryBuf &     append(const uint8_t*, size_t);
        BinaryBuf &     append(const std::vector<uint8_t> &);
        BinaryBuf &     append(std::string_view);

        size_t          size(void) const override { return std::vector<uint8_t>::size(); }
        const uint8_t*  data(void) const override { return std::vector<uint8_t>::data(); }
        uint8_t*        data(void) { return std::vector<uint8_t>::data(); }
    };

    struct streambuf_error : public std::runtime_error
    {
        explicit streambuf_error(const std::string & what) : std::runtime_error(what){}
        explicit streambuf_error(const char* what) : std::runtime_error(what){}
    };

    /// @brief: network order stream
    class MemoryStream
    {
    protected:
        virtual void    getRaw(void* ptr, size_t len) const = 0;
        virtual void    putRaw(const void* ptr, size_t len) = 0;

        template<typename Int>
        Int getIntBE(void) const
        {
            uint8_t raw[sizeof(Int)];
            getRaw(raw, sizeof(raw));
            Int res = 0;

            for(auto & val : raw)
            {
                res = (res << 8) | val;
            }

            return res;
        }

        template<typename Int>
        void putIntBE(Int val)
        {
            uint8_t raw[sizeof(Int)];

            for(size_t it = sizeof(Int); it; --it)
            {
                raw[it - 1] = static_cast<uint8_t>(val);
                val >>= 8;
            }

            putRaw(raw, sizeof(raw));
        }

    public:
        virtual ~MemoryStream() = default;

        /// @brief: bytes left to read
        virtual size_t  last(void) const = 0;
        virtual uint8_t peek(void) const = 0;
        virtual void    skip(size_t) const = 0;
        /// @brief: read len bytes, all if len is 0
        virtual BinaryBuf read(size_t len = 0) const = 0;

        std::string     readString(size_t len = 0) const;

        uint8_t         readInt8(void) const { return getIntBE<uint8_t>(); }
        uint16_t        readIntBE16(void) const { return getIntBE<uint16_t>(); }
        uint32_t        readIntBE32(void) const { return getIntBE<uint32_t>(); }
        uint64_t        readIntBE64(void) const { return getIntBE<uint64_t>(); }

        void            writeInt8(uint8_t v) { putIntBE(v); }
        void            writeIntBE16(uint16_t v) { putIntBE(v); }
        void            writeIntBE32(uint32_t v) { putIntBE(v); }
        void            writeIntBE64(uint64_t v) { putIntBE(v); }

        MemoryStream &  write(const uint8_t*, size_t);
        MemoryStream &  write(std::string_view);
        MemoryStream &  write(const std::vector<uint8_t> &);
    };

    /// @brief: read only view
    class StreamBufRef : public MemoryStream
    {
        mutable const uint8_t* it1 = nullptr;
        const uint8_t* it2 = nullptr;

    protected:
        void            getRaw(void* ptr, size_t len) const override;
        void            putRaw(const void* ptr, size_t len) override;

    public:
        StreamBufRef() = default;
        StreamBufRef(const void* ptr, size_t len);
        explicit StreamBufRef(const std::vector<uint8_t> &);

        StreamBufRef(const StreamBufRef &) = delete;
        StreamBufRef &  operator=(const StreamBufRef &) = delete;

        void            reset(const void* ptr, size_t len);

        BinaryBuf       read(size_t = 0) const override;
        size_t          last(void) const override;
        uint8_t         peek(void) const override;
        void            skip(size_t) const override;

        const uint8_t*  data(void) const { return it1; }
    };

    /// @brief: growing buffer, written at the tail and read from the head
    class StreamBuf : public MemoryStream
    {
        mutable size_t  pos = 0;
        BinaryBuf       vec;

    protected:
        void            getRaw(void* ptr, size_t len) const override;
        void            putRaw(const void* ptr, size_t len) override;

    public:
        explicit StreamBuf(size_t reserve = 256);

        void            reset(const std::vector<uint8_t> &);

        BinaryBuf       read(size_t = 0) const override;
        size_t          last(void) const override;
        uint8_t         peek(void) const override;
        void            skip(size_t) const override;

        size_t          tell(void) const { return pos; }

        const BinaryBuf & rawbuf(void) const { return vec; }
        BinaryBuf &     rawbuf(void) { return vec; }

        /// @brief: drop the consumed head
        void            shrink(void);
    };

} // RDSE

#endif // _RDSE_STREAMBUF_
