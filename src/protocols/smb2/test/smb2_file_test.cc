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

#include "protocols/smb2/smb2_create.h"
#include "protocols/smb2/smb2_file_io.h"

using namespace smbwire;
using namespace smbwire::smb2;

template<typename T>
static bool decode_body(const Buffer& b, T& out)
{ return out.decode(b.data(), (uint32_t)b.size()); }

//-------------------------------------------------------------------------
// create
//-------------------------------------------------------------------------

TEST_CASE( "create request", "[smb2][create]" )
{
    CreateRequest req;
    req.desired_access = GENERIC_READ;
    req.share_access = FILE_SHARE_READ | FILE_SHARE_WRITE;
    req.create_disposition = FILE_OPEN;
    req.create_options = FILE_NON_DIRECTORY_FILE;
    req.name = "dir\\file.txt";

    SECTION( "name only" )
    {
        Buffer b = encode_body(req);
        REQUIRE( (b.size() == 56 + 24) );
        CHECK( (load_le<uint16_t>(&b[44]) == 120) );
        CHECK( (load_le<uint16_t>(&b[46]) == 24) );
        CHECK( (load_le<uint32_t>(&b[48]) == 0) );

        CreateRequest back;
        REQUIRE( decode_body(b, back) );
        CHECK( (back.name == req.name) );
        CHECK( (back.desired_access == GENERIC_READ) );
        CHECK( (back.create_disposition == FILE_OPEN) );
        CHECK( back.share_access.contains(FILE_SHARE_WRITE) );
        CHECK( back.contexts.empty() );
    }
    SECTION( "root of the share" )
    {
        req.name.clear();
        Buffer b = encode_body(req);

        CHECK( (b.size() == 57) );
        CHECK( (load_le<uint16_t>(&b[44]) == 120) );
        CHECK( (load_le<uint16_t>(&b[46]) == 0) );

        CreateRequest back;
        REQUIRE( decode_body(b, back) );
        CHECK( back.name.empty() );
    }
    SECTION( "with contexts" )
    {
        Lease lease;
        lease.key[0] = 0x11;
        lease.state = SMB2_LEASE_READ_CACHING | SMB2_LEASE_HANDLE_CACHING;

        req.requested_oplock_level = SMB2_OPLOCK_LEVEL_LEASE;
        req.contexts.push_back(maximal_access_context());
        req.contexts.push_back(lease.context());
        req.contexts.push_back(query_on_disk_id_context());

        Buffer b = encode_body(req);

        // name ends at 144, already 8 aligned
        CHECK( (load_le<uint32_t>(&b[48]) == 144) );
        CHECK( (load_le<uint32_t>(&b[52]) == b.size() - 80) );

        CreateRequest back;
        REQUIRE( decode_body(b, back) );
        REQUIRE( (back.contexts.size() == 3) );
        CHECK( back.contexts[0].is(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST) );
        CHECK( back.contexts[1].is(SMB2_CREATE_REQUEST_LEASE) );
        CHECK( back.contexts[2].is(SMB2_CREATE_QUERY_ON_DISK_ID) );

        Lease got;
        REQUIRE( got.decode(back.contexts[1].data) );
        CHECK( (got.key == lease.key) );
        CHECK( (got.state == lease.state) );
    }
}

TEST_CASE( "create context chain", "[smb2][create]" )
{
    std::vector<CreateContext> in;
    in.push_back(durable_handle_context());
    in.push_back(allocation_size_context(4096));
    in.push_back(timewarp_context(FileTime(0x01d9000000000000ULL)));

    Buffer b;
    WireWriter w(b);
    encode_create_contexts(w, in);

    // 16 byte header, 4 byte name, data at 24
    CHECK( (load_le<uint16_t>(&b[4]) == 16) );
    CHECK( (load_le<uint16_t>(&b[10]) == 24) );
    CHECK( (load_le<uint32_t>(&b[0]) == 40) );

    std::vector<CreateContext> out;
    REQUIRE( (decode_create_contexts(b.data(), (uint32_t)b.size(), out) == 3) );
    CHECK( (out[1].data.size() == 8) );
    CHECK( (load_le<uint64_t>(out[1].data.data()) == 4096) );

    SECTION( "name running past the record stops the walk" )
    {
        store_le<uint16_t>(&b[40 + 6], 200);
        std::vector<CreateContext> partial;
        CHECK( (decode_create_contexts(b.data(), (uint32_t)b.size(), partial) == 1) );
    }
}

TEST_CASE( "create response", "[smb2][create]" )
{
    CreateResponse rsp;
    rsp.oplock_level = SMB2_OPLOCK_LEVEL_BATCH;
    rsp.create_action = FILE_CREATED;
    rsp.times.creation = FileTime::from_unix_seconds(1600000000);
    rsp.end_of_file = 3;
    rsp.file_attributes = FILE_ATTRIBUTE_ARCHIVE;
    rsp.file_id = FileId(7, 3);

    Buffer data;
    WireWriter dw(data);
    dw.u32(0);
    dw.u32(0x001f01ff);

    CreateContext mxac;
    mxac.name = SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST;
    mxac.data = data;
    rsp.contexts.push_back(mxac);

    Buffer b = encode_body(rsp);
    CHECK( (load_le<uint32_t>(&b[80]) == 152) );

    CreateResponse back;
    REQUIRE( decode_body(b, back) );
    CHECK( (back.file_id == FileId(7, 3)) );
    CHECK( (back.create_action == FILE_CREATED) );
    CHECK( (back.times.creation == rsp.times.creation) );
    CHECK( (back.end_of_file == 3) );

    const CreateContext* ctx = back.find_context(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST);
    REQUIRE( ctx );
    CHECK_FALSE( back.find_context(SMB2_CREATE_REQUEST_LEASE) );

    MaximalAccess ma;
    REQUIRE( ma.decode(ctx->data) );
    CHECK( (ma.query_status == 0) );
    CHECK( (ma.access.raw() == 0x001f01ff) );

    SECTION( "truncated fixed part" )
    {
        b.resize(80);
        CreateResponse bad;
        CHECK_FALSE( decode_body(b, bad) );
    }
}

TEST_CASE( "close and flush", "[smb2][create]" )
{
    CloseRequest req(FileId(1, 2), SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB);
    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 24) );

    CloseRequest back;
    REQUIRE( decode_body(b, back) );
    CHECK( (back.file_id == FileId(1, 2)) );
    CHECK( (back.flags == SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB) );

    CloseResponse rsp;
    rsp.flags = SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB;
    rsp.allocation_size = 4096;
    rsp.end_of_file = 100;
    b = encode_body(rsp);
    REQUIRE( (b.size() == 60) );

    CloseResponse rback;
    REQUIRE( decode_body(b, rback) );
    CHECK( (rback.allocation_size == 4096) );
    CHECK( (rback.end_of_file == 100) );

    FlushRequest flush(FileId(5, 6));
    b = encode_body(flush);
    REQUIRE( (b.size() == 24) );

    FlushRequest fback;
    REQUIRE( decode_body(b, fback) );
    CHECK( (fback.file_id == FileId(5, 6)) );

    FlushResponse fr;
    CHECK( decode_body(encode_body(FlushResponse()), fr) );
}

//-------------------------------------------------------------------------
// read and write
//-------------------------------------------------------------------------

TEST_CASE( "write request layout", "[smb2][write]" )
{
    WriteRequest req(FileId(7, 3), 1024, Buffer({ 'A', 'B', 'C' }));

    Header h = Header::sync(SMB2_COM_WRITE, 10, 1, 1);
    Buffer msg = encode_message(h, req);
    const uint8_t* body = msg.data() + SMB2_HEADER_LENGTH;

    CHECK( (load_le<uint16_t>(body) == 49) );
    CHECK( (load_le<uint16_t>(body + 2) == 112) );
    CHECK( (load_le<uint32_t>(body + 4) == 3) );
    CHECK( (load_le<uint64_t>(body + 8) == 1024) );
    CHECK( (load_le<uint64_t>(body + 16) == 7) );
    CHECK( (load_le<uint64_t>(body + 24) == 3) );
    CHECK( (load_le<uint16_t>(body + 40) == 0) );
    REQUIRE( (msg.size() == 115) );
    CHECK( (msg[112] == 'A') );
    CHECK( (msg[114] == 'C') );

    Header hb;
    WriteRequest back;
    REQUIRE( decode_message(msg.data(), (uint32_t)msg.size(), hb, back) );
    CHECK( (back.offset == 1024) );
    CHECK( (back.file_id == FileId(7, 3)) );
    CHECK( (back.data == req.data) );
}

TEST_CASE( "write request with channel", "[smb2][write]" )
{
    WriteRequest req(FileId(1, 1), 0, Buffer(5, 0x77));
    req.channel_info.channel = SMB2_CHANNEL_RDMA_V1;
    ChannelDescriptor d;
    d.offset = 0x1000;
    d.token = 9;
    d.length = 5;
    req.channel_info.descriptors.push_back(d);

    Buffer b = encode_body(req);
    CHECK( (load_le<uint16_t>(&b[2]) == 128) );
    CHECK( (load_le<uint16_t>(&b[40]) == 112) );
    CHECK( (load_le<uint16_t>(&b[42]) == 16) );

    WriteRequest back;
    REQUIRE( decode_body(b, back) );
    CHECK( (back.channel_info.channel == SMB2_CHANNEL_RDMA_V1) );
    REQUIRE( (back.channel_info.descriptors.size() == 1) );
    CHECK( (back.channel_info.descriptors[0].token == 9) );
    CHECK( (back.data == req.data) );
}

TEST_CASE( "write response", "[smb2][write]" )
{
    WriteResponse rsp;
    rsp.count = 65536;

    WriteResponse back;
    REQUIRE( decode_body(encode_body(rsp), back) );
    CHECK( (back.count == 65536) );
}

TEST_CASE( "read", "[smb2][read]" )
{
    ReadRequest req(FileId(2, 4), 8192, 4096);
    req.minimum_count = 1;

    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 49) );
    CHECK( (b[2] == 0x50) );
    CHECK( (load_le<uint32_t>(&b[4]) == 4096) );
    CHECK( (load_le<uint64_t>(&b[8]) == 8192) );

    ReadRequest back;
    REQUIRE( decode_body(b, back) );
    CHECK( (back.length == 4096) );
    CHECK( (back.file_id == FileId(2, 4)) );
    CHECK( (back.minimum_count == 1) );

    ReadResponse rsp;
    rsp.data = Buffer(100, 0x33);
    b = encode_body(rsp);
    CHECK( (b[2] == 80) );

    ReadResponse rback;
    REQUIRE( decode_body(b, rback) );
    CHECK( (rback.data == rsp.data) );

    SECTION( "data past the end" )
    {
        store_le<uint32_t>(&b[4], 101);
        ReadResponse bad;
        CHECK_FALSE( decode_body(b, bad) );
    }
}

//-------------------------------------------------------------------------
// lock and cancel
//-------------------------------------------------------------------------

TEST_CASE( "lock request", "[smb2][lock]" )
{
    CHECK( (pack_lock_sequence(3, 5) == 0x30000005) );
    CHECK( (pack_lock_sequence(0x1f, 0x1fffffff) == 0xffffffff) );

    LockRequest req;
    req.lock_sequence_number = 2;
    req.lock_sequence_index = 17;
    req.file_id = FileId(9, 9);

    LockElement l;
    l.offset = 0;
    l.length = 100;
    l.flags = SMB2_LOCKFLAG_EXCLUSIVE_LOCK | SMB2_LOCKFLAG_FAIL_IMMEDIATELY;
    req.locks.push_back(l);
    l.offset = 200;
    l.flags = SMB2_LOCKFLAG_UNLOCK;
    req.locks.push_back(l);

    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 24 + 48) );
    CHECK( (load_le<uint16_t>(&b[2]) == 2) );
    CHECK( (load_le<uint32_t>(&b[4]) == 0x20000011) );

    LockRequest back;
    REQUIRE( decode_body(b, back) );
    CHECK( (back.lock_sequence_number == 2) );
    CHECK( (back.lock_sequence_index == 17) );
    REQUIRE( (back.locks.size() == 2) );
    CHECK( (back.locks[1].offset == 200) );
    CHECK( (back.locks[1].flags == SMB2_LOCKFLAG_UNLOCK) );

    SECTION( "count larger than the body" )
    {
        store_le<uint16_t>(&b[2], 3);
        LockRequest bad;
        CHECK_FALSE( decode_body(b, bad) );
    }
}

TEST_CASE( "cancel", "[smb2][lock]" )
{
    Header h = Header::async(SMB2_COM_CANCEL, 0, 44, 1);
    Buffer msg = encode_message(h, CancelRequest());
    CHECK( (msg.size() == 68) );

    Header back;
    CancelRequest cancel;
    REQUIRE( decode_message(msg.data(), (uint32_t)msg.size(), back, cancel) );
    CHECK( (back.get_async_id() == 44) );

    LockResponse lr;
    CHECK( decode_body(encode_body(LockResponse()), lr) );
}

