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

#ifndef UTIL_UTF_H
#define UTIL_UTF_H

// UTF-16LE <-> UTF-8 conversion for names carried on the wire.  Names are
// held as UTF-8 std::string everywhere else in the library.

#include <string>

#include "main/smbwire_types.h"

namespace smbwire
{
// decode exactly len bytes of little-endian code units; fails on an odd
// byte count or an unpaired surrogate and leaves out untouched
SO_PUBLIC bool utf16le_to_utf8(const uint8_t* src, uint32_t len, std::string& out);

// append the UTF-16LE form of src to out; malformed UTF-8 sequences are
// replaced with U+FFFD and reported by a false return
SO_PUBLIC bool utf8_to_utf16le(const std::string& src, Buffer& out);

// byte length of the UTF-16LE form of src
SO_PUBLIC uint32_t utf16le_length(const std::string& src);
}

#endif

