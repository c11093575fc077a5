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

#ifndef WIRE_CODEC_H
#define WIRE_CODEC_H

// Fixed width little-endian field access at arbitrary offsets plus a
// sequential reader and writer built on top of it.  All wire structures
// are read and written field by field through these; nothing relies on
// the in-memory layout of a C++ struct.

#include <array>
#include <cstring>
#include <string>
#include <type_traits>

#include "main/smbwire_types.h"

namespace smbwire
{
template<typename T>
inline T load_le(const uint8_t* p)
{
    static_assert(std::is_integral<T>::value, "integer fields only");
    uint64_t v = 0;
    for ( size_t i = 0; i < sizeof(T); ++i )
        v |= (uint64_t)p[i] << (8 * i);
    return (T)v;
}

template<typename T>
inline void store_le(uint8_t* p, T value)
{
    static_assert(std::is_integral<T>::value, "integer fields only");
    uint64_t v = (uint64_t)value;
    for ( size_t i = 0; i < sizeof(T); ++i )
        p[i] = (uint8_t)(v >> (8 * i));
}

// false if the field does not fit, value is unchanged in that case
template<typename T>
inline bool read_integer(const uint8_t* buf, uint32_t len, uint32_t offset, T& value)
{
    if ( (uint64_t)offset + sizeof(T) > len )
        return false;

    value = load_le<T>(buf + offset);
    return true;
}

template<typename T>
inline void write_value(Buffer& out, T value)
{
    uint8_t tmp[sizeof(T)];
    store_le<T>(tmp, value);
    out.insert(out.end(), tmp, tmp + sizeof(T));
}

// decode byte_len bytes of UTF-16LE at offset; false when the span is out
// of range or the code units are malformed
SO_PUBLIC bool read_fixed_string(const uint8_t* buf, uint32_t len, uint32_t offset,
    uint32_t byte_len, std::string& out);

inline uint32_t align_up(uint32_t v, uint32_t a)
{ return (v + a - 1) & ~(a - 1); }

//-------------------------------------------------------------------------
// sequential reader; the first out of range access latches an error and
// every later access returns zero, so a decoder checks good() once
//-------------------------------------------------------------------------

class SO_PUBLIC WireReader
{
public:
    WireReader(const uint8_t* b, uint32_t n) : buf(b), len(n) { }

    bool good() const
    { return ok; }

    uint32_t offset() const
    { return pos; }

    uint32_t length() const
    { return len; }

    uint32_t remaining() const
    { return ok ? len - pos : 0; }

    const uint8_t* data() const
    { return buf; }

    const uint8_t* cursor() const
    { return buf + pos; }

    bool seek(uint32_t off);
    void skip(uint32_t n);

    uint8_t u8()
    { return get<uint8_t>(); }

    uint16_t u16()
    { return get<uint16_t>(); }

    uint32_t u32()
    { return get<uint32_t>(); }

    uint64_t u64()
    { return get<uint64_t>(); }

    void bytes(uint8_t* dst, uint32_t n);
    void bytes(Buffer& dst, uint32_t n);

    template<size_t N>
    void bytes(std::array<uint8_t, N>& dst)
    { bytes(dst.data(), (uint32_t)N); }

    std::string utf16(uint32_t byte_len);

private:
    template<typename T>
    T get()
    {
        T v = 0;
        if ( ok and read_integer<T>(buf, len, pos, v) )
            pos += sizeof(T);
        else
            ok = false;
        return v;
    }

    const uint8_t* buf;
    uint32_t len;
    uint32_t pos = 0;
    bool ok = true;
};

//-------------------------------------------------------------------------
// appending writer; origin is the envelope offset of out[0] so that
// wire_offset() gives the value offset fields must carry
//-------------------------------------------------------------------------

class SO_PUBLIC WireWriter
{
public:
    WireWriter(Buffer& b, uint32_t org = 0) : out(b), origin(org) { }

    uint32_t position() const
    { return (uint32_t)out.size(); }

    uint32_t wire_offset() const
    { return origin + (uint32_t)out.size(); }

    void u8(uint8_t v)
    { out.push_back(v); }

    void u16(uint16_t v)
    { write_value<uint16_t>(out, v); }

    void u32(uint32_t v)
    { write_value<uint32_t>(out, v); }

    void u64(uint64_t v)
    { write_value<uint64_t>(out, v); }

    void bytes(const uint8_t* p, size_t n)
    { if ( n ) out.insert(out.end(), p, p + n); }

    void bytes(const Buffer& b)
    { out.insert(out.end(), b.begin(), b.end()); }

    template<size_t N>
    void bytes(const std::array<uint8_t, N>& a)
    { out.insert(out.end(), a.begin(), a.end()); }

    void zero(size_t n)
    { out.insert(out.end(), n, 0); }

    // pad with zeros until the envelope offset is a multiple of a
    void align(uint32_t a);

    // returns the number of bytes written
    uint32_t utf16(const std::string&);

    void patch16(uint32_t at, uint16_t v)
    { store_le<uint16_t>(&out[at], v); }

    void patch32(uint32_t at, uint32_t v)
    { store_le<uint32_t>(&out[at], v); }

    Buffer& buffer()
    { return out; }

private:
    Buffer& out;
    uint32_t origin;
};
}

#endif

