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

#ifndef BIT_FLAGS_H
#define BIT_FLAGS_H

// A named set of single bit (or small mask) constants over an unsigned
// integer of fixed width.  Each wire field gets its own tag so that flags
// of one field can't be mixed with flags of another by accident.
//
//     struct ShareAccessTag;
//     using ShareAccess = BitFlags<uint32_t, ShareAccessTag>;
//     constexpr ShareAccess SHARE_READ { 0x1 };
//
// Bits that have no constant are carried through untouched; decoders never
// reject them.

#include <cstdint>
#include <type_traits>

namespace smbwire
{
template<typename T, typename Tag>
class BitFlags
{
    static_assert(std::is_unsigned<T>::value, "flag storage must be unsigned");

public:
    using raw_type = T;

    constexpr BitFlags() : bits(0) { }
    constexpr explicit BitFlags(T v) : bits(v) { }

    constexpr T raw() const
    { return bits; }

    constexpr bool empty() const
    { return bits == 0; }

    // true if every bit of f is set here
    constexpr bool contains(BitFlags f) const
    { return (bits & f.bits) == f.bits; }

    constexpr bool intersects(BitFlags f) const
    { return (bits & f.bits) != 0; }

    BitFlags& insert(BitFlags f)
    { bits |= f.bits; return *this; }

    BitFlags& remove(BitFlags f)
    { bits &= (T)~f.bits; return *this; }

    BitFlags& operator|=(BitFlags f)
    { return insert(f); }

    BitFlags& operator&=(BitFlags f)
    { bits &= f.bits; return *this; }

    constexpr BitFlags operator|(BitFlags f) const
    { return BitFlags((T)(bits | f.bits)); }

    constexpr BitFlags operator&(BitFlags f) const
    { return BitFlags((T)(bits & f.bits)); }

    constexpr BitFlags operator~() const
    { return BitFlags((T)~bits); }

    constexpr bool operator==(BitFlags f) const
    { return bits == f.bits; }

    constexpr bool operator!=(BitFlags f) const
    { return bits != f.bits; }

private:
    T bits;
};

template<typename Tag> using Flags8 = BitFlags<uint8_t, Tag>;
template<typename Tag> using Flags16 = BitFlags<uint16_t, Tag>;
template<typename Tag> using Flags32 = BitFlags<uint32_t, Tag>;
}

#endif

