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

#include "protocols/smb2/smb2_ioctl.h"

using namespace smbwire;
using namespace smbwire::smb2;

static IoctlResponse respond(uint32_t code, const Buffer& output)
{
    IoctlResponse rsp;
    rsp.ctl_code = code;
    rsp.file_id = FileId(0xffffffffffffffffULL, 0xffffffffffffffffULL);
    rsp.output = output;

    Buffer b = encode_body(rsp);
    IoctlResponse back;
    CHECK( back.decode(b.data(), (uint32_t)b.size()) );
    return back;
}

TEST_CASE( "ioctl request buffers", "[smb2][ioctl]" )
{
    IoctlRequest req(FSCTL_PIPE_TRANSCEIVE, FileId(3, 4), Buffer(10, 0x05));
    req.max_output_response = 1024;

    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 56 + 10) );
    CHECK( (load_le<uint32_t>(&b[4]) == FSCTL_PIPE_TRANSCEIVE) );
    CHECK( (load_le<uint32_t>(&b[24]) == 120) );
    CHECK( (load_le<uint32_t>(&b[28]) == 10) );
    CHECK( (load_le<uint32_t>(&b[36]) == 0) );
    CHECK( (load_le<uint32_t>(&b[44]) == 1024) );
    CHECK( (load_le<uint32_t>(&b[48]) == SMB2_0_IOCTL_IS_FSCTL) );

    IoctlRequest back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (back.ctl_code == FSCTL_PIPE_TRANSCEIVE) );
    CHECK( (back.file_id == FileId(3, 4)) );
    CHECK( (back.input == req.input) );
    CHECK( back.output.empty() );

    SECTION( "input past the body" )
    {
        store_le<uint32_t>(&b[28], 11);
        IoctlRequest bad;
        CHECK_FALSE( bad.decode(b.data(), (uint32_t)b.size()) );
    }
    SECTION( "no buffers" )
    {
        IoctlRequest empty(FSCTL_LMR_REQUEST_RESILIENCY, FileId(1, 1), Buffer());
        Buffer e = encode_body(empty);
        CHECK( (e.size() == 57) );
        CHECK( (load_le<uint32_t>(&e[24]) == 0) );
    }
}

TEST_CASE( "copychunk", "[smb2][ioctl]" )
{
    CopyChunkRequest req;
    req.source_key[0] = 0xaa;
    req.source_key[23] = 0xbb;

    CopyChunk c;
    c.source_offset = 0;
    c.target_offset = 4096;
    c.length = 1048576;
    req.chunks.push_back(c);
    c.source_offset = 1048576;
    c.target_offset = 1052672;
    req.chunks.push_back(c);

    Buffer b = req.encode();
    REQUIRE( (b.size() == 32 + 2 * SMB2_COPYCHUNK_LENGTH) );
    CHECK( (load_le<uint32_t>(&b[24]) == 2) );

    CopyChunkRequest back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (back.source_key == req.source_key) );
    REQUIRE( (back.chunks.size() == 2) );
    CHECK( (back.chunks[1].target_offset == 1052672) );

    store_le<uint32_t>(&b[24], 3);
    CHECK_FALSE( back.decode(b.data(), (uint32_t)b.size()) );

    CopyChunkResult res;
    res.chunks_written = 2;
    res.chunk_bytes_written = 0;
    res.total_bytes_written = 2097152;

    IoctlResponse rsp = respond(FSCTL_SRV_COPYCHUNK_WRITE, res.encode());
    CHECK( (rsp.payload == IOCTL_PAYLOAD_COPYCHUNK) );
    CHECK( (rsp.copychunk.chunks_written == 2) );
    CHECK( (rsp.copychunk.total_bytes_written == 2097152) );

    Buffer short_res = res.encode();
    CopyChunkResult cut;
    CHECK_FALSE( cut.decode(short_res.data(), (uint32_t)short_res.size() - 1) );
    CHECK( (cut.total_bytes_written == 0) );
}

TEST_CASE( "resume key", "[smb2][ioctl]" )
{
    ResumeKeyResult key;
    key.key.fill(0x42);

    IoctlResponse rsp = respond(FSCTL_SRV_REQUEST_RESUME_KEY, key.encode());
    CHECK( (rsp.payload == IOCTL_PAYLOAD_RESUME_KEY) );
    CHECK( (rsp.resume_key.key == key.key) );
}

TEST_CASE( "snapshot tokens", "[smb2][ioctl]" )
{
    FileTime t;
    REQUIRE( parse_snapshot_token("@GMT-2024.01.15-10.30.00", t) );
    CHECK( (t == FileTime::from_unix_seconds(1705314600)) );
    CHECK( (snapshot_token(t) == "@GMT-2024.01.15-10.30.00") );

    CHECK_FALSE( parse_snapshot_token("@GMT-2024.01.15-10.30", t) );
    CHECK_FALSE( parse_snapshot_token("@GMT-2024.13.15-10.30.00", t) );
    CHECK_FALSE( parse_snapshot_token("GMT-2024.01.15-10.30.00x", t) );
}

TEST_CASE( "snapshot list", "[smb2][ioctl]" )
{
    SnapshotList list;
    list.number_of_snapshots = 3;
    list.tokens.push_back("@GMT-2024.01.15-10.30.00");
    list.tokens.push_back("@GMT-2023.12.31-23.59.59");

    Buffer b = list.encode();
    CHECK( (load_le<uint32_t>(&b[4]) == 2) );
    CHECK( (load_le<uint32_t>(&b[8]) == 2 * 50 + 2) );

    IoctlResponse rsp = respond(FSCTL_SRV_ENUMERATE_SNAPSHOTS, b);
    REQUIRE( (rsp.payload == IOCTL_PAYLOAD_SNAPSHOTS) );
    CHECK( (rsp.snapshots.number_of_snapshots == 3) );
    REQUIRE( (rsp.snapshots.tokens.size() == 2) );
    CHECK( (rsp.snapshots.tokens[1] == "@GMT-2023.12.31-23.59.59") );
    REQUIRE( (rsp.snapshots.times.size() == 2) );
    CHECK( (rsp.snapshots.times[1] < rsp.snapshots.times[0]) );

    SECTION( "size query" )
    {
        SnapshotList none;
        none.number_of_snapshots = 7;
        Buffer n = none.encode();

        SnapshotList back;
        REQUIRE( back.decode(n.data(), (uint32_t)n.size()) );
        CHECK( (back.number_of_snapshots == 7) );
        CHECK( back.tokens.empty() );
    }
    SECTION( "unparseable token is kept without a time" )
    {
        SnapshotList odd;
        odd.tokens.push_back("not-a-snapshot");
        odd.tokens.push_back("@GMT-2024.01.15-10.30.00");
        Buffer o = odd.encode();

        SnapshotList back;
        REQUIRE( back.decode(o.data(), (uint32_t)o.size()) );
        CHECK( (back.tokens.size() == 2) );
        CHECK( (back.times.size() == 1) );
    }
    SECTION( "array larger than the buffer" )
    {
        store_le<uint32_t>(&b[8], 1000);
        SnapshotList bad;
        CHECK_FALSE( bad.decode(b.data(), (uint32_t)b.size()) );

        IoctlResponse raw = respond(FSCTL_SRV_ENUMERATE_SNAPSHOTS, b);
        CHECK( (raw.payload == IOCTL_PAYLOAD_NONE) );
        CHECK( (raw.output == b) );
    }
}

TEST_CASE( "network interfaces", "[smb2][ioctl]" )
{
    std::vector<NetworkInterface> in(2);
    in[0].if_index = 2;
    in[0].capability = SMB2_INTERFACE_RSS_CAPABLE;
    in[0].link_speed = 10000000000ULL;
    in[0].family = SMB2_AF_INET;
    in[0].port = 445;
    in[0].address = Buffer({ 192, 168, 1, 10 });

    in[1].if_index = 3;
    in[1].capability = SMB2_INTERFACE_RDMA_CAPABLE;
    in[1].family = SMB2_AF_INET6;
    in[1].address = Buffer(16, 0);
    in[1].address[0] = 0xfe;
    in[1].address[1] = 0x80;
    in[1].address[15] = 1;

    Buffer b = encode_network_interfaces(in);
    REQUIRE( (b.size() == 2 * SMB2_NETWORK_INTERFACE_INFO_LENGTH) );
    CHECK( (load_le<uint32_t>(&b[0]) == SMB2_NETWORK_INTERFACE_INFO_LENGTH) );
    CHECK( (b[26] == 0x01) );
    CHECK( (b[27] == 0xbd) );

    IoctlResponse rsp = respond(FSCTL_QUERY_NETWORK_INTERFACE_INFO, b);
    REQUIRE( (rsp.payload == IOCTL_PAYLOAD_NETWORK_INTERFACES) );
    REQUIRE( (rsp.interfaces.size() == 2) );
    CHECK( (rsp.interfaces[0].link_speed == 10000000000ULL) );
    CHECK( (rsp.interfaces[0].port == 445) );
    CHECK( (rsp.interfaces[0].address_string() == "192.168.1.10") );
    CHECK( (rsp.interfaces[1].address_string() == "fe80::1") );

    NetworkInterface other;
    other.family = 0x1234;
    CHECK( other.address_string().empty() );
}

TEST_CASE( "validate negotiate", "[smb2][ioctl]" )
{
    ValidateNegotiateRequest req;
    req.capabilities = 0x7f;
    req.client_guid[0] = 9;
    req.security_mode = 1;
    req.dialects = { SMB2_DIALECT_202, SMB2_DIALECT_210, SMB2_DIALECT_300, SMB2_DIALECT_302 };

    Buffer b = req.encode();
    CHECK( (b.size() == 24 + 8) );

    ValidateNegotiateRequest back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (back.dialects == req.dialects) );
    CHECK( (back.client_guid == req.client_guid) );

    b.pop_back();
    CHECK_FALSE( back.decode(b.data(), (uint32_t)b.size()) );

    ValidateNegotiateResult res;
    res.capabilities = 0x2f;
    res.security_mode = 1;
    res.dialect = SMB2_DIALECT_302;

    IoctlResponse rsp = respond(FSCTL_VALIDATE_NEGOTIATE_INFO, res.encode());
    REQUIRE( (rsp.payload == IOCTL_PAYLOAD_VALIDATE_NEGOTIATE) );
    CHECK( (rsp.validate_negotiate.dialect == SMB2_DIALECT_302) );
}

TEST_CASE( "other ioctl payloads", "[smb2][ioctl]" )
{
    ReadHashRequest rh;
    rh.length = 65536;
    rh.offset = 4096;
    Buffer b = rh.encode();

    ReadHashRequest rback;
    REQUIRE( rback.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (rback.offset == 4096) );
    CHECK( (rback.retrieval_type == SRV_HASH_RETRIEVE_FILE_BASED) );

    ResiliencyRequest res;
    res.timeout = 60000;
    b = res.encode();

    ResiliencyRequest sback;
    REQUIRE( sback.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (sback.timeout == 60000) );

    ResiliencyRequest cut;
    CHECK_FALSE( cut.decode(b.data(), (uint32_t)b.size() - 1) );
    CHECK( (cut.timeout == 0) );

    IoctlResponse pipe = respond(FSCTL_PIPE_TRANSCEIVE, Buffer(7, 1));
    CHECK( (pipe.payload == IOCTL_PAYLOAD_NONE) );
    CHECK( (pipe.output.size() == 7) );
}

