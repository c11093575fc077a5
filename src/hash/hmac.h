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

#ifndef HMAC_H
#define HMAC_H

// keyed message authentication over the SHA-2 digests

#include "hash/sha2.h"

namespace smbwire
{
enum class HashType : uint8_t
{
    SHA256,
    SHA384,
    SHA512
};

SO_PUBLIC size_t hash_size(HashType);
SO_PUBLIC size_t hash_block_size(HashType);

// digest must hold hash_size(type) bytes
SO_PUBLIC void hash_digest(HashType, const uint8_t* data, size_t size, uint8_t* digest);

// mac must hold hash_size(type) bytes; keys longer than the block size are
// hashed first, shorter keys are zero padded
SO_PUBLIC void hmac(HashType, const uint8_t* key, size_t key_len,
    const uint8_t* msg, size_t msg_len, uint8_t* mac);

inline void hmac_sha256(const uint8_t* key, size_t key_len,
    const uint8_t* msg, size_t msg_len, uint8_t* mac)
{ hmac(HashType::SHA256, key, key_len, msg, msg_len, mac); }

inline void hmac_sha512(const uint8_t* key, size_t key_len,
    const uint8_t* msg, size_t msg_len, uint8_t* mac)
{ hmac(HashType::SHA512, key, key_len, msg, msg_len, mac); }
}

#endif

