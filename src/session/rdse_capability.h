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

#ifndef _RDSE_CAPABILITY_
#define _RDSE_CAPABILITY_

#include <string>
#include <optional>
#include <stdexcept>

#include "rdse_protocol.h"

namespace RDSE
{
    struct session_error : public std::runtime_error
    {
        ErrorCode code;

        session_error(const ErrorCode & err, const std::string & what) : std::runtime_error(what), code(err) {}
    };

    namespace Negotiator
    {
        /// @brief: intersect two declarations
        /// @param host: local declaration of the host, its codec order wins
        /// @param client: remote declaration
        /// @param prefer: codec moved first when both sides support it
        /// @throw session_error(CapabilityMismatch) when no codec is shared
        Capabilities negotiate(const CapabilitySet & host, const CapabilitySet & client,
                               std::optional<VideoCodec> prefer = std::nullopt, uint32_t generation = 1);

        /// @brief: declaration one step below the current snapshot
        CapabilitySet lowerQuality(const CapabilitySet & declared, const Capabilities & current);

        bool        isCodecSupported(const CapabilitySet &, const VideoCodec &);
    }
}

#endif // _RDSE_CAPABILITY_
