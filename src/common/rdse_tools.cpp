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

#include <zlib.h>
#include <unistd.h>

#include <cctype>
#include <fstream>

#include "rdse_tools.h"
#include "rdse_crypto.h"
#include "rdse_streambuf.h"
#include "rdse_application.h"

namespace RDSE
{
    std::vector<uint8_t> Tools::zlibCompress(const ByteArray & arr)
    {
        std::vector<uint8_t> res;

        if(arr.data() && arr.size())
        {
            res.resize(::compressBound(arr.size()));
            uLong dstsz = res.size();
            int ret = ::compress(reinterpret_cast<Bytef*>(res.data()), & dstsz,
                                 reinterpret_cast<const Bytef*>(arr.data()), arr.size());

            if(ret == Z_OK)
            {
                res.resize(dstsz);
            }
            else
            {
                res.clear();
                Application::error("%s: %s failed, error: %d", __FUNCTION__, "compress", ret);
            }
        }

        return res;
    }

    std::vector<uint8_t> Tools::zlibUncompress(const ByteArray & arr, size_t limit)
    {
        std::vector<uint8_t> res;

        if(! arr.data() || ! arr.size() || ! limit)
        {
            return res;
        }

        z_stream zs = {};

        if(int ret = ::inflateInit(& zs); ret != Z_OK)
        {
            Application::error("%s: %s failed, error: %d", __FUNCTION__, "inflateInit", ret);
            return res;
        }

        // one spare byte detects an overflow
        res.resize(limit + 1);

        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(arr.data()));
        zs.avail_in = arr.size();
        zs.next_out = reinterpret_cast<Bytef*>(res.data());
        zs.avail_out = res.size();

        int ret = ::inflate(& zs, Z_FINISH);
        size_t total = zs.total_out;
        ::inflateEnd(& zs);

        if(ret != Z_STREAM_END || limit < total)
        {
            Application::error("%s: %s failed, error: %d, size: %lu, limit: %lu", __FUNCTION__, "inflate", ret, total, limit);
            res.clear();
            return res;
        }

        res.resize(total);
        return res;
    }

    uint32_t Tools::crc32b(const uint8_t* ptr, size_t size)
    {
        return ::crc32(::crc32(0, Z_NULL, 0), ptr, size);
    }

    std::string Tools::randomHexString(size_t len)
    {
        const char* digits = "0123456789abcdef";
        auto buf = Crypto::randomNonce(len);
        std::string res;
        res.reserve(buf.size() * 2);

        for(auto & val : buf)
        {
            res.push_back(digits[val >> 4]);
            res.push_back(digits[val & 0x0F]);
        }

        return res;
    }

    std::string Tools::prettyFuncName(const std::string & name)
    {
        size_t end = name.find('(');

        if(end == std::string::npos) { end = name.size(); }

        auto begin = name.rfind(0x20, end);
        return begin == std::string::npos ? name.substr(0, end) : name.substr(begin + 1, end - begin - 1);
    }

    std::string Tools::fileToString(const std::filesystem::path & file)
    {
        std::ifstream ifs(file, std::ios::binary);

        if(! ifs.is_open())
        {
            Application::error("%s: %s failed, path: `%s', uid: %d", __FUNCTION__, "open", file.c_str(), getuid());
            return "";
        }

        return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }

    std::string Tools::lower(std::string_view val)
    {
        std::string str;
        str.reserve(val.size());
        std::transform(val.begin(), val.end(), std::back_inserter(str), ::tolower);
        return str;
    }

    std::list<std::string> Tools::split(std::string_view str, int sep)
    {
        std::list<std::string> list;

        for(;;)
        {
            auto pos = str.find(static_cast<char>(sep));
            list.emplace_back(str.substr(0, pos));

            if(pos == std::string_view::npos)
            {
                break;
            }

            str.remove_prefix(pos + 1);
        }

        return list;
    }

    std::string Tools::unescaped(std::string_view val)
    {
        std::string str;
        str.reserve(val.size());

        for(auto it = val.begin(); it != val.end(); ++it)
        {
            auto itn = std::next(it);

            if(*it != '\\' || itn == val.end())
            {
                str.push_back(*it);
                continue;
            }

            switch(*itn)
            {
                case 't': str.push_back('\t'); break;
                case 'n': str.push_back('\n'); break;
                case 'r': str.push_back('\r'); break;
                case 'f': str.push_back('\f'); break;
                case 'b': str.push_back('\b'); break;

                // \\, \", \/
                default:
                    str.push_back(*itn);
                    break;
            }

            it = itn;
        }

        return str;
    }
}
