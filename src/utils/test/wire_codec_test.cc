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

#include "catch/smbwire_catch.h"

#include "utils/bit_flags.h"
#include "utils/util_utf.h"
#include "utils/wire_codec.h"

using namespace smbwire;

namespace
{
struct TestFlagsTag;
using TestFlags = Flags16<TestFlagsTag>;

constexpr TestFlags TF_A { 0x0001 };
constexpr TestFlags TF_B { 0x0002 };
constexpr TestFlags TF_C { 0x0100 };
}

TEST_CASE( "load and store little endian", "[wire_codec]" )
{
    uint8_t buf[8] = { };

    store_le<uint32_t>(buf, 0x11223344);
    CHECK( (buf[0] == 0x44) );
    CHECK( (buf[3] == 0x11) );
    CHECK( (load_le<uint32_t>(buf) == 0x11223344) );

    store_le<uint64_t>(buf, 0x0102030405060708ULL);
    CHECK( (buf[0] == 0x08) );
    CHECK( (buf[7] == 0x01) );
    CHECK( (load_le<uint16_t>(buf + 6) == 0x0102) );
}

TEST_CASE( "read_integer bounds", "[wire_codec]" )
{
    const uint8_t buf[6] = { 1, 2, 3, 4, 5, 6 };
    uint32_t v = 0xdead;

    CHECK( read_integer<uint32_t>(buf, sizeof(buf), 2, v) );
    CHECK( (v == 0x06050403) );

    v = 0xdead;
    CHECK_FALSE( read_integer<uint32_t>(buf, sizeof(buf), 3, v) );
    CHECK( (v == 0xdead) );

    CHECK_FALSE( read_integer<uint32_t>(buf, sizeof(buf), 0xfffffffe, v) );
}

TEST_CASE( "align_up", "[wire_codec]" )
{
    CHECK( (align_up(0, 8) == 0) );
    CHECK( (align_up(1, 8) == 8) );
    CHECK( (align_up(8, 8) == 8) );
    CHECK( (align_up(13, 4) == 16) );
}

TEST_CASE( "reader latches the first overrun", "[wire_codec]" )
{
    const uint8_t buf[5] = { 0x01, 0x02, 0x03, 0x04, 0x05 };
    WireReader r(buf, sizeof(buf));

    CHECK( (r.u16() == 0x0201) );
    CHECK( (r.remaining() == 3) );
    CHECK( (r.u32() == 0) );
    CHECK_FALSE( r.good() );

    // still failed even though a byte is left
    CHECK( (r.u8() == 0) );
    CHECK_FALSE( r.good() );
    CHECK( (r.remaining() == 0) );
}

TEST_CASE( "reader seek and skip", "[wire_codec]" )
{
    const uint8_t buf[4] = { 0xaa, 0xbb, 0xcc, 0xdd };

    SECTION( "seek to end is allowed" )
    {
        WireReader r(buf, sizeof(buf));
        CHECK( r.seek(4) );
        CHECK( r.good() );
        CHECK( (r.remaining() == 0) );
    }
    SECTION( "seek past end fails" )
    {
        WireReader r(buf, sizeof(buf));
        CHECK_FALSE( r.seek(5) );
        CHECK_FALSE( r.good() );
    }
    SECTION( "skip then read" )
    {
        WireReader r(buf, sizeof(buf));
        r.skip(3);
        CHECK( (r.u8() == 0xdd) );
        r.skip(1);
        CHECK_FALSE( r.good() );
    }
}

TEST_CASE( "writer offsets and patches", "[wire_codec]" )
{
    Buffer out;
    WireWriter w(out, 64);

    w.u16(9);
    uint32_t at = w.position();
    w.u16(0);
    w.u8(0xff);

    CHECK( (w.position() == 5) );
    CHECK( (w.wire_offset() == 69) );

    w.align(8);
    CHECK( (w.wire_offset() == 72) );
    CHECK( (out.size() == 8) );

    w.patch16(at, 0x1234);
    CHECK( (out[2] == 0x34) );
    CHECK( (out[3] == 0x12) );
}

TEST_CASE( "writer utf16", "[wire_codec]" )
{
    Buffer out;
    WireWriter w(out);

    CHECK( (w.utf16("ab") == 4) );
    CHECK( (w.utf16("") == 0) );

    const Buffer expect = { 'a', 0, 'b', 0 };
    CHECK( (out == expect) );

    WireReader r(out.data(), (uint32_t)out.size());
    CHECK( (r.utf16(4) == "ab") );
    CHECK( r.good() );
}

TEST_CASE( "utf16 conversion", "[utf]" )
{
    SECTION( "bmp and supplementary" )
    {
        // e acute, euro sign, G clef
        const std::string s = "\xc3\xa9\xe2\x82\xac\xf0\x9d\x84\x9e";
        Buffer wire;

        CHECK( utf8_to_utf16le(s, wire) );
        CHECK( (wire.size() == 8) );
        CHECK( (utf16le_length(s) == 8) );
        CHECK( (wire[4] == 0x34) );
        CHECK( (wire[5] == 0xd8) );

        std::string back;
        CHECK( utf16le_to_utf8(wire.data(), (uint32_t)wire.size(), back) );
        CHECK( (back == s) );
    }
    SECTION( "odd byte count" )
    {
        const uint8_t odd[3] = { 'a', 0, 'b' };
        std::string out = "unchanged";

        CHECK_FALSE( utf16le_to_utf8(odd, sizeof(odd), out) );
        CHECK( (out == "unchanged") );
    }
    SECTION( "unpaired surrogate" )
    {
        const uint8_t lone[4] = { 0x3d, 0xd8, 'a', 0 };
        std::string out;

        CHECK_FALSE( utf16le_to_utf8(lone, sizeof(lone), out) );
    }
    SECTION( "malformed utf8 is replaced" )
    {
        Buffer wire;

        CHECK_FALSE( utf8_to_utf16le("a\xff", wire) );
        REQUIRE( (wire.size() == 4) );
        CHECK( (wire[2] == 0xfd) );
        CHECK( (wire[3] == 0xff) );
    }
    SECTION( "read_fixed_string out of range" )
    {
        const uint8_t buf[4] = { 'x', 0, 'y', 0 };
        std::string out;

        CHECK( read_fixed_string(buf, sizeof(buf), 2, 2, out) );
        CHECK( (out == "y") );
        CHECK_FALSE( read_fixed_string(buf, sizeof(buf), 2, 4, out) );
    }
}

TEST_CASE( "bit flags", "[bit_flags]" )
{
    TestFlags f = TF_A | TF_C;

    CHECK( (f.raw() == 0x0101) );
    CHECK( f.contains(TF_A) );
    CHECK_FALSE( f.contains(TF_A | TF_B) );
    CHECK( f.intersects(TF_A | TF_B) );

    f.remove(TF_A);
    CHECK( (f == TF_C) );

    f |= TF_B;
    CHECK( ((f & TF_B) == TF_B) );
    CHECK( ((~f).raw() == 0xfefd) );

    TestFlags unknown(0x8000);
    CHECK_FALSE( unknown.empty() );
    CHECK( (unknown.raw() == 0x8000) );
    CHECK( TestFlags().empty() );
}

