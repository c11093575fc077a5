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

// Byte order helpers for unaligned data outside the wire fields: UTF-16LE
// code units and the big-endian words of the SHA-2 digests.  Wire fields
// go through load_le/store_le in wire_codec.h.

#ifndef SMBWIRE_ENDIAN_H
#define SMBWIRE_ENDIAN_H

#include <cstdint>

#define LETOHS_UNALIGNED(p) \
    ((uint16_t)(*((const uint8_t*)(p) + 1) << 8) | \
     (uint16_t)(*((const uint8_t*)(p))))

#define BETOHL_UNALIGNED(p) \
    ((uint32_t)(*((const uint8_t*)(p)) << 24) | \
     (uint32_t)(*((const uint8_t*)(p) + 1) << 16) | \
     (uint32_t)(*((const uint8_t*)(p) + 2) <<  8) | \
     (uint32_t)(*((const uint8_t*)(p) + 3)))

#define BETOHLL_UNALIGNED(p) \
    (((uint64_t)(BETOHL_UNALIGNED(p)) << 32) | \
     ((uint64_t)(BETOHL_UNALIGNED((const uint8_t*)(p) + 4))))

#define HTOBELL_UNALIGNED(p, v) \
    do { \
        for ( int i_ = 0; i_ < 8; ++i_ ) \
            *((uint8_t*)(p) + i_) = (uint8_t)(((uint64_t)(v) >> (56 - 8 * i_)) & 0xff); \
    } while (0)

#define HTOBEL_UNALIGNED(p, v) \
    do { \
        for ( int i_ = 0; i_ < 4; ++i_ ) \
            *((uint8_t*)(p) + i_) = (uint8_t)(((uint32_t)(v) >> (24 - 8 * i_)) & 0xff); \
    } while (0)

#endif

