//--------------------------------------------------------------------------
// Copyright (C) 2026-2026 Cisco and/or its affiliates. All rights reserved.
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License Version 2 as published
// by the Free Software Foundation.  You may not use, modify or distribute
// this program under any other version of the GNU General Public License.
//
// This program is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// General Public License for more details.
//
// You should have received a copy of the GNU General Public License along
// with this program; if not, write to the Free Software Foundation, Inc.,
// 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
//--------------------------------------------------------------------------

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "hmac.h"

#include <cstring>

#define HMAC_IPAD 0x36
#define HMAC_OPAD 0x5c

namespace smbwire
{
size_t hash_size(HashType t)
{
    switch ( t )
    {
    case HashType::SHA256: return SHA256_HASH_SIZE;
    case HashType::SHA384: return SHA384_HASH_SIZE;
    case HashType::SHA512: return SHA512_HASH_SIZE;
    }
    return 0;
}

size_t hash_block_size(HashType t)
{
    return t == HashType::SHA256 ? SHA256_BLOCK_SIZE : SHA512_BLOCK_SIZE;
}

void hash_digest(HashType t, const uint8_t* data, size_t size, uint8_t* digest)
{
    switch ( t )
    {
    case HashType::SHA256: sha256(data, size, digest); break;
    case HashType::SHA384: sha384(data, size, digest); break;
    case HashType::SHA512: sha512(data, size, digest); break;
    }
}

void hmac(HashType t, const uint8_t* key, size_t key_len,
    const uint8_t* msg, size_t msg_len, uint8_t* mac)
{
    const size_t bs = hash_block_size(t);
    const size_t hs = hash_size(t);

    uint8_t k0[MAX_BLOCK_SIZE];
    memset(k0, 0, sizeof(k0));

    if ( key_len > bs )
        hash_digest(t, key, key_len, k0);
    else if ( key_len )
        memcpy(k0, key, key_len);

    Buffer inner(bs + msg_len);

    for ( size_t i = 0; i < bs; ++i )
        inner[i] = k0[i] ^ HMAC_IPAD;

    if ( msg_len )
        memcpy(&inner[bs], msg, msg_len);

    uint8_t outer[MAX_BLOCK_SIZE + MAX_HASH_SIZE];

    for ( size_t i = 0; i < bs; ++i )
        outer[i] = k0[i] ^ HMAC_OPAD;

    hash_digest(t, inner.data(), inner.size(), outer + bs);
    hash_digest(t, outer, bs + hs, mac);
}
}

