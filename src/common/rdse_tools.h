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

#ifndef _RDSE_TOOLS_
#define _RDSE_TOOLS_

#include <list>
#include <chrono>
#include <vector>
#include <string>
#include <sstream>
#include <iterator>
#include <algorithm>
#include <string_view>
#include <filesystem>
#include <cinttypes>

namespace RDSE
{
    class ByteArray;

    namespace Tools
    {
        std::string prettyFuncName(const std::string &);
        /// @brief: hex string from len random bytes
        std::string randomHexString(size_t len);

        std::string fileToString(const std::filesystem::path &);

        /// @return empty on error
        std::vector<uint8_t> zlibCompress(const ByteArray &);
        /// @brief: inflate, output is never larger than limit
        /// @return empty on error or overflow
        std::vector<uint8_t> zlibUncompress(const ByteArray &, size_t limit);

        uint32_t crc32b(const uint8_t* ptr, size_t size);

        template<typename... Args>
        std::string joinToString( Args... args )
        {
            std::ostringstream os;
            ( os << ... << args );
            return os.str();
        }

        std::list<std::string> split(std::string_view str, int sep);
        std::string lower(std::string_view);
        std::string unescaped(std::string_view);

        /// @brief: periodic deadline
        template<typename TimeType = std::chrono::milliseconds>
        struct Timeout
        {
            std::chrono::steady_clock::time_point tp;
            TimeType dt;

            explicit Timeout(TimeType val) : tp(std::chrono::steady_clock::now()), dt(val)
            {
            }

            /// @return true once per period
            bool check(void)
            {
                auto now = std::chrono::steady_clock::now();

                if(dt < now - tp)
                {
                    tp = now;
                    return true;
                }

                return false;
            }
        };
    }
}

#define NS_FuncName RDSE::Tools::prettyFuncName(__PRETTY_FUNCTION__)

#endif // _RDSE_TOOLS_
