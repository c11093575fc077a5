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

#include "util_utf.h"

#include "utils/endian.h"

#define UTF_REPLACEMENT 0xFFFD

static void append_utf8(uint32_t cp, std::string& out)
{
    if ( cp < 0x80 )
        out += (char)cp;

    else if ( cp < 0x800 )
    {
        out += (char)(0xC0 | (cp >> 6));
        out += (char)(0x80 | (cp & 0x3F));
    }
    else if ( cp < 0x10000 )
    {
        out += (char)(0xE0 | (cp >> 12));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
    else
    {
        out += (char)(0xF0 | (cp >> 18));
        out += (char)(0x80 | ((cp >> 12) & 0x3F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
}

static void append_utf16le(uint32_t cp, smbwire::Buffer& out)
{
    if ( cp >= 0x10000 )
    {
        cp -= 0x10000;
        uint16_t hi = 0xD800 | (uint16_t)(cp >> 10);
        uint16_t lo = 0xDC00 | (uint16_t)(cp & 0x3FF);
        out.push_back(hi & 0xff);
        out.push_back(hi >> 8);
        out.push_back(lo & 0xff);
        out.push_back(lo >> 8);
        return;
    }
    out.push_back(cp & 0xff);
    out.push_back((cp >> 8) & 0xff);
}

// returns the number of bytes consumed; cp is UTF_REPLACEMENT and valid
// is false when the sequence at s is not valid UTF-8
static unsigned next_code_point(const uint8_t* s, size_t avail, uint32_t& cp, bool& valid)
{
    uint8_t c = s[0];
    valid = false;
    unsigned n;
    uint32_t min;

    if ( c < 0x80 )
    {
        cp = c;
        valid = true;
        return 1;
    }
    else if ( (c & 0xE0) == 0xC0 )
    {
        n = 2; cp = c & 0x1F; min = 0x80;
    }
    else if ( (c & 0xF0) == 0xE0 )
    {
        n = 3; cp = c & 0x0F; min = 0x800;
    }
    else if ( (c & 0xF8) == 0xF0 )
    {
        n = 4; cp = c & 0x07; min = 0x10000;
    }
    else
    {
        cp = UTF_REPLACEMENT;
        return 1;
    }

    if ( avail < n )
    {
        cp = UTF_REPLACEMENT;
        return 1;
    }

    for ( unsigned i = 1; i < n; ++i )
    {
        if ( (s[i] & 0xC0) != 0x80 )
        {
            cp = UTF_REPLACEMENT;
            return i;
        }
        cp = (cp << 6) | (s[i] & 0x3F);
    }

    if ( cp < min or cp > 0x10FFFF or (cp >= 0xD800 and cp <= 0xDFFF) )
        cp = UTF_REPLACEMENT;
    else
        valid = true;

    return n;
}

namespace smbwire
{
bool utf16le_to_utf8(const uint8_t* src, uint32_t len, std::string& out)
{
    if ( len % 2 )
        return false;

    std::string tmp;
    tmp.reserve(len / 2);

    uint32_t i = 0;
    while ( i < len )
    {
        uint32_t cu = LETOHS_UNALIGNED(src + i);
        i += 2;

        if ( cu >= 0xD800 and cu <= 0xDBFF )
        {
            if ( i + 2 > len )
                return false;

            uint32_t lo = LETOHS_UNALIGNED(src + i);

            if ( lo < 0xDC00 or lo > 0xDFFF )
                return false;

            i += 2;
            cu = 0x10000 + ((cu - 0xD800) << 10) + (lo - 0xDC00);
        }
        else if ( cu >= 0xDC00 and cu <= 0xDFFF )
            return false;

        append_utf8(cu, tmp);
    }

    out.swap(tmp);
    return true;
}

bool utf8_to_utf16le(const std::string& src, Buffer& out)
{
    const uint8_t* s = (const uint8_t*)src.data();
    size_t len = src.size();
    bool clean = true;

    for ( size_t i = 0; i < len; )
    {
        uint32_t cp;
        bool valid;
        i += next_code_point(s + i, len - i, cp, valid);

        if ( !valid )
            clean = false;

        append_utf16le(cp, out);
    }
    return clean;
}

uint32_t utf16le_length(const std::string& src)
{
    const uint8_t* s = (const uint8_t*)src.data();
    size_t len = src.size();
    uint32_t bytes = 0;

    for ( size_t i = 0; i < len; )
    {
        uint32_t cp;
        bool valid;
        i += next_code_point(s + i, len - i, cp, valid);
        bytes += (cp >= 0x10000) ? 4 : 2;
    }
    return bytes;
}
}

