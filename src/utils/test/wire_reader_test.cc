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

// wire_reader_test.cc
// unit tests for the bounded little endian reader and writer

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "utils/wire_codec.h"

#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/TestHarness.h>

using namespace smbwire;

static const uint8_t sample[] =
{
    0x01,
    0x02, 0x03,
    0x04, 0x05, 0x06, 0x07,
    0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f,
    'h', 0, 'i', 0
};

TEST_GROUP(wire_reader)
{
};

TEST(wire_reader, sequential_fields)
{
    WireReader r(sample, sizeof(sample));

    UNSIGNED_LONGS_EQUAL(0x01, r.u8());
    UNSIGNED_LONGS_EQUAL(0x0302, r.u16());
    UNSIGNED_LONGS_EQUAL(0x07060504, r.u32());
    CHECK(0x0f0e0d0c0b0a0908ULL == r.u64());
    STRCMP_EQUAL("hi", r.utf16(4).c_str());

    CHECK(r.good());
    UNSIGNED_LONGS_EQUAL(0, r.remaining());
}

TEST(wire_reader, overrun_latches)
{
    WireReader r(sample, 3);

    r.u8();
    r.u16();
    CHECK(r.good());

    UNSIGNED_LONGS_EQUAL(0, r.u32());
    CHECK(!r.good());

    // later reads stay failed even when they would fit
    UNSIGNED_LONGS_EQUAL(0, r.u8());
    CHECK(!r.good());
}

TEST(wire_reader, seek_bounds)
{
    WireReader r(sample, sizeof(sample));

    CHECK(r.seek(15));
    UNSIGNED_LONGS_EQUAL('h', r.u8());
    CHECK(r.seek(sizeof(sample)));
    CHECK(!r.seek(sizeof(sample) + 1));
    CHECK(!r.good());
}

TEST(wire_reader, odd_utf16_length)
{
    WireReader r(sample + 15, 4);
    r.utf16(3);
    CHECK(!r.good());
}

TEST_GROUP(wire_writer)
{
};

TEST(wire_writer, origin_and_patching)
{
    Buffer out;
    WireWriter w(out, 64);

    w.u16(9);
    uint32_t field = w.position();
    w.u16(0);
    w.u32(0x11223344);
    UNSIGNED_LONGS_EQUAL(72, w.wire_offset());

    w.align(8);
    UNSIGNED_LONGS_EQUAL(8, w.position());

    w.patch16(field, (uint16_t)w.wire_offset());
    UNSIGNED_LONGS_EQUAL(4, w.utf16("ok"));

    UNSIGNED_LONGS_EQUAL(12, out.size());
    UNSIGNED_LONGS_EQUAL(72, load_le<uint16_t>(&out[2]));
    UNSIGNED_LONGS_EQUAL(0x44, out[4]);
    UNSIGNED_LONGS_EQUAL('o', out[8]);
}

int main(int argc, char** argv)
{
    return CommandLineTestRunner::RunAllTests(argc, argv);
}
