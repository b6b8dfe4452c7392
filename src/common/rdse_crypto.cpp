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

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_crypto.h"

namespace RDSE
{
    void hashDeinitNoOutput(gnutls_hash_hd_t hd)
    {
        gnutls_hash_deinit(hd, nullptr);
    }

    gnutls_hash_hd_t hashInitSha256(void)
    {
        gnutls_hash_hd_t hd = nullptr;

        if(int ret = gnutls_hash_init(& hd, GNUTLS_DIG_SHA256); ret < 0)
        {
            Application::error("%s: %s failed, error: %s", __FUNCTION__, "gnutls_hash_init", gnutls_strerror(ret));
            throw gnutls_error(NS_FuncName);
        }

        return hd;
    }

    /* Crypto::Digest */
    Crypto::Digest::Digest() : ctx(hashInitSha256(), hashDeinitNoOutput)
    {
    }

    Crypto::Digest::Digest(const Digest & dg) : ctx(nullptr, hashDeinitNoOutput), bytes(dg.bytes)
    {
        auto hd = gnutls_hash_copy(dg.ctx.get());

        if(! hd)
        {
            Application::error("%s: %s failed", __FUNCTION__, "gnutls_hash_copy");
            throw gnutls_error(NS_FuncName);
        }

        ctx.reset(hd);
    }

    Crypto::Digest & Crypto::Digest::operator=(const Digest & dg)
    {
        if(this != & dg)
        {
            Digest tmp(dg);
            std::swap(ctx, tmp.ctx);
            bytes = tmp.bytes;
        }

        return *this;
    }

    void Crypto::Digest::update(const void* ptr, size_t len)
    {
        if(ptr && len)
        {
            if(int ret = gnutls_hash(ctx.get(), ptr, len); ret < 0)
            {
                Application::error("%s: %s failed, error: %s", __FUNCTION__, "gnutls_hash", gnutls_strerror(ret));
                throw gnutls_error(NS_FuncName);
            }

            bytes += len;
        }
    }

    void Crypto::Digest::update(const std::vector<uint8_t> & v)
    {
        update(v.data(), v.size());
    }

    void Crypto::Digest::update(std::string_view v)
    {
        update(v.data(), v.size());
    }

    std::vector<uint8_t> Crypto::Digest::value(void) const
    {
        // output from a copy, the running context stays open
        auto hd = gnutls_hash_copy(ctx.get());

        if(! hd)
        {
            Application::error("%s: %s failed", __FUNCTION__, "gnutls_hash_copy");
            throw gnutls_error(NS_FuncName);
        }

        std::vector<uint8_t> res(gnutls_hash_get_len(GNUTLS_DIG_SHA256), 0);
        gnutls_hash_deinit(hd, res.data());
        return res;
    }

    std::vector<uint8_t> Crypto::sha256(const void* ptr, size_t len)
    {
        std::vector<uint8_t> res(gnutls_hash_get_len(GNUTLS_DIG_SHA256), 0);

        if(int ret = gnutls_hash_fast(GNUTLS_DIG_SHA256, ptr, len, res.data()); ret < 0)
        {
            Application::error("%s: %s failed, error: %s", __FUNCTION__, "gnutls_hash_fast", gnutls_strerror(ret));
            throw gnutls_error(NS_FuncName);
        }

        return res;
    }

    std::vector<uint8_t> Crypto::sha256(const std::vector<uint8_t> & v)
    {
        return sha256(v.data(), v.size());
    }

    std::vector<uint8_t> Crypto::sha256(std::string_view v)
    {
        return sha256(v.data(), v.size());
    }

    bool Crypto::equal(const std::vector<uint8_t> & v1, const std::vector<uint8_t> & v2)
    {
        if(v1.size() != v2.size())
        {
            return false;
        }

        uint8_t diff = 0;

        for(size_t it = 0; it < v1.size(); ++it)
        {
            diff |= v1[it] ^ v2[it];
        }

        return diff == 0;
    }

    std::vector<uint8_t> Crypto::randomKey(size_t keysz)
    {
        std::vector<uint8_t> res(keysz, 0);

        if(int ret = gnutls_rnd(GNUTLS_RND_KEY, res.data(), res.size()))
        {
            Application::error("%s: %s failed, error: %s", __FUNCTION__, "gnutls_rnd", gnutls_strerror(ret));
            throw gnutls_error(NS_FuncName);
        }

        return res;
    }

    std::vector<uint8_t> Crypto::randomNonce(size_t len)
    {
        std::vector<uint8_t> res(len, 0);

        if(int ret = gnutls_rnd(GNUTLS_RND_NONCE, res.data(), res.size()))
        {
            Application::error("%s: %s failed, error: %s", __FUNCTION__, "gnutls_rnd", gnutls_strerror(ret));
            throw gnutls_error(NS_FuncName);
        }

        return res;
    }
}
