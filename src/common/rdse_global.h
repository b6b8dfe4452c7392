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

#ifndef _RDSE_GLOBALS_
#define _RDSE_GLOBALS_

#include <cstdint>

namespace RDSE
{
    inline static const char* engine_ident = "rdse";
    inline static const int engine_version = 20261018;

    /// wire protocol version
    inline static const uint8_t protocol_version = 0x01;
}

#if defined(RDSE_WITH_STD_MAP)
#include <unordered_map>
#include <unordered_set>
#define INTMAP std::unordered_map
#define INTSET std::unordered_set
#else
#include "flat_hash_map/unordered_map.hpp"
#define INTMAP ska::unordered_map
#define INTSET ska::unordered_set
#endif

#endif // _RDSE_GLOBALS_
