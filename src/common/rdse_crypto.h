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

#ifndef _RDSE_CRYPTO_
#define _RDSE_CRYPTO_

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "gnutls/gnutls.h"
#include "gnutls/crypto.h"

namespace RDSE
{
    struct gnutls_error : public std::runtime_error
    {
        explicit gnutls_error(const std::string & what) : std::runtime_error(what){}
        explicit gnutls_error(const char* what) : std::runtime_error(what){}
    };

    namespace Crypto
    {
        inline static const size_t sha256_size = 32;

        /// @brief: running sha256 digest, snapshot capable
        class Digest
        {
            std::unique_ptr<struct hash_hd_st, void(*)(gnutls_hash_hd_t)> ctx;
            uint64_t            bytes = 0;

        public:
            Digest();
            Digest(const Digest &);
            Digest & operator=(const Digest &);

            Digest(Digest &&) noexcept = default;
            Digest & operator=(Digest &&) noexcept = default;

            void                update(const void*, size_t);
            void                update(const std::vector<uint8_t> &);
            void                update(std::string_view);

            /// @brief: current value, the context continues
            std::vector<uint8_t> value(void) const;
            uint64_t            counts(void) const { return bytes; }
        };

        std::vector<uint8_t>    sha256(const void*, size_t);
        std::vector<uint8_t>    sha256(const std::vector<uint8_t> &);
        std::vector<uint8_t>    sha256(std::string_view);

        /// @brief: constant time compare
        bool                    equal(const std::vector<uint8_t> &, const std::vector<uint8_t> &);

        std::vector<uint8_t>    randomKey(size_t);
        std::vector<uint8_t>    randomNonce(size_t);
    }
}

#endif // _RDSE_CRYPTO_
