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

#include "wire_codec.h"

#include "trace/trace.h"
#include "utils/util_utf.h"

namespace smbwire
{
bool read_fixed_string(const uint8_t* buf, uint32_t len, uint32_t offset,
    uint32_t byte_len, std::string& out)
{
    if ( (uint64_t)offset + byte_len > len )
        return false;

    return utf16le_to_utf8(buf + offset, byte_len, out);
}

bool WireReader::seek(uint32_t off)
{
    if ( !ok or off > len )
    {
        ok = false;
        return false;
    }
    pos = off;
    return true;
}

void WireReader::skip(uint32_t n)
{
    if ( !ok or (uint64_t)pos + n > len )
        ok = false;
    else
        pos += n;
}

void WireReader::bytes(uint8_t* dst, uint32_t n)
{
    if ( !ok or (uint64_t)pos + n > len )
    {
        ok = false;
        memset(dst, 0, n);
        return;
    }
    memcpy(dst, buf + pos, n);
    pos += n;
}

void WireReader::bytes(Buffer& dst, uint32_t n)
{
    if ( !ok or (uint64_t)pos + n > len )
    {
        ok = false;
        dst.clear();
        return;
    }
    dst.assign(buf + pos, buf + pos + n);
    pos += n;
}

std::string WireReader::utf16(uint32_t byte_len)
{
    std::string s;

    if ( !ok or !read_fixed_string(buf, len, pos, byte_len, s) )
    {
        ok = false;
        return std::string();
    }
    pos += byte_len;
    return s;
}

void WireWriter::align(uint32_t a)
{
    uint32_t off = wire_offset();
    zero(align_up(off, a) - off);
}

uint32_t WireWriter::utf16(const std::string& s)
{
    size_t before = out.size();

    if ( !utf8_to_utf16le(s, out) )
        SMB2_TRACE(TRACE_WARNING_LEVEL, "malformed UTF-8 name encoded with replacements");

    return (uint32_t)(out.size() - before);
}
}

