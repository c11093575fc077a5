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

#ifndef SHA2_H
#define SHA2_H

// SHA-2 message digests.  sha256 runs the 32-bit word compression; sha384
// and sha512 run the 64-bit word compression and differ only in their
// initial values and in the truncation of the result.

#include "main/smbwire_types.h"

#define SHA256_HASH_SIZE 32
#define SHA384_HASH_SIZE 48
#define SHA512_HASH_SIZE 64
#define MAX_HASH_SIZE    64

#define SHA256_BLOCK_SIZE 64
#define SHA512_BLOCK_SIZE 128
#define MAX_BLOCK_SIZE    128

namespace smbwire
{
// digest must be buffer of size given above
SO_PUBLIC void sha256(const uint8_t* data, size_t size, uint8_t* digest);
SO_PUBLIC void sha384(const uint8_t* data, size_t size, uint8_t* digest);
SO_PUBLIC void sha512(const uint8_t* data, size_t size, uint8_t* digest);
}

#endif

