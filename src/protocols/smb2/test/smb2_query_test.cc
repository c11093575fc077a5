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

#include "protocols/smb2/smb2_notify.h"
#include "protocols/smb2/smb2_query.h"

using namespace smbwire;
using namespace smbwire::smb2;

static std::vector<DirectoryEntry> sample_entries()
{
    std::vector<DirectoryEntry> v(3);

    v[0].name = ".";
    v[0].file_attributes = FILE_ATTRIBUTE_DIRECTORY;
    v[0].file_id = 5;

    v[1].name = "report.docx";
    v[1].file_index = 7;
    v[1].end_of_file = 12345;
    v[1].allocation_size = 16384;
    v[1].file_attributes = FILE_ATTRIBUTE_ARCHIVE;
    v[1].times.last_write = FileTime::from_unix_seconds(1700000000);
    v[1].ea_size = 12;
    v[1].short_name = "REPORT~1.DOC";
    v[1].file_id = 0x0001000000001234ULL;

    v[2].name = "\xe6\x97\xa5\xe6\x9c\xac";   // two CJK characters
    v[2].file_id = 77;
    return v;
}

//-------------------------------------------------------------------------
// query directory
//-------------------------------------------------------------------------

TEST_CASE( "query directory request", "[smb2][query]" )
{
    QueryDirectoryRequest req(FileId(4, 8), FILE_ID_BOTH_DIRECTORY_INFORMATION, "*.txt",
        SMB2_RESTART_SCANS);
    req.output_buffer_length = 65536;

    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 32 + 10) );
    CHECK( (b[2] == FILE_ID_BOTH_DIRECTORY_INFORMATION) );
    CHECK( (b[3] == 0x01) );
    CHECK( (load_le<uint16_t>(&b[24]) == 96) );
    CHECK( (load_le<uint16_t>(&b[26]) == 10) );
    CHECK( (load_le<uint32_t>(&b[28]) == 65536) );

    QueryDirectoryRequest back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    CHECK( (back.pattern == "*.txt") );
    CHECK( back.flags.contains(SMB2_RESTART_SCANS) );
    CHECK( (back.file_id == FileId(4, 8)) );

    SECTION( "default output length comes from the configuration" )
    {
        QueryDirectoryRequest dflt;
        CHECK( (dflt.output_buffer_length == CodecConfig::get_conf()->default_output_length) );
        CHECK( (dflt.info_class == FILE_DIRECTORY_INFORMATION) );
    }
    SECTION( "pattern outside the body" )
    {
        store_le<uint16_t>(&b[24], 200);
        QueryDirectoryRequest bad;
        CHECK_FALSE( bad.decode(b.data(), (uint32_t)b.size()) );
    }
}

TEST_CASE( "directory entry classes", "[smb2][query]" )
{
    const uint8_t classes[] =
    {
        FILE_DIRECTORY_INFORMATION, FILE_FULL_DIRECTORY_INFORMATION,
        FILE_ID_FULL_DIRECTORY_INFORMATION, FILE_BOTH_DIRECTORY_INFORMATION,
        FILE_ID_BOTH_DIRECTORY_INFORMATION, FILE_NAMES_INFORMATION
    };
    const std::vector<DirectoryEntry> in = sample_entries();

    for ( auto cls : classes )
    {
        INFO( file_info_class_name(cls) );
        CHECK( is_directory_info_class(cls) );

        Buffer b = encode_directory_entries(cls, in);
        uint32_t first = load_le<uint32_t>(&b[0]);
        CHECK( (first % 8 == 0) );
        CHECK( (first >= directory_entry_length(cls) + 2) );

        std::vector<DirectoryEntry> out;
        REQUIRE( (decode_directory_entries(cls, b.data(), (uint32_t)b.size(), out) == 3) );
        CHECK( (out[1].name == "report.docx") );
        CHECK( (out[2].name == in[2].name) );
        CHECK( (out[1].file_index == 7) );

        bool has_times = cls != FILE_NAMES_INFORMATION;
        CHECK( (out[1].end_of_file == (has_times ? 12345 : 0)) );
        CHECK( (out[0].is_directory() == has_times) );

        bool has_id = cls == FILE_ID_FULL_DIRECTORY_INFORMATION or
            cls == FILE_ID_BOTH_DIRECTORY_INFORMATION;
        CHECK( (out[1].file_id == (has_id ? 0x0001000000001234ULL : 0)) );

        bool has_short = cls == FILE_BOTH_DIRECTORY_INFORMATION or
            cls == FILE_ID_BOTH_DIRECTORY_INFORMATION;
        CHECK( (out[1].short_name == (has_short ? "REPORT~1.DOC" : "")) );
    }

    CHECK_FALSE( is_directory_info_class(FILE_BASIC_INFORMATION) );
    CHECK( encode_directory_entries(FILE_BASIC_INFORMATION, in).empty() );
}

TEST_CASE( "directory entry layout", "[smb2][query]" )
{
    std::vector<DirectoryEntry> one(1);
    one[0].name = "a";
    one[0].end_of_file = 0x11;
    one[0].file_id = 0x99;

    Buffer b = encode_directory_entries(FILE_ID_BOTH_DIRECTORY_INFORMATION, one);
    REQUIRE( (b.size() == 104 + 2) );
    CHECK( (load_le<uint32_t>(&b[0]) == 0) );
    CHECK( (load_le<uint64_t>(&b[40]) == 0x11) );
    CHECK( (load_le<uint32_t>(&b[60]) == 2) );
    CHECK( (load_le<uint64_t>(&b[96]) == 0x99) );
    CHECK( (b[104] == 'a') );

    SECTION( "name longer than the record" )
    {
        store_le<uint32_t>(&b[60], 4);
        std::vector<DirectoryEntry> out;
        CHECK( (decode_directory_entries(FILE_ID_BOTH_DIRECTORY_INFORMATION,
            b.data(), (uint32_t)b.size(), out) == 0) );
    }
    SECTION( "short name length past its field" )
    {
        b[68] = 26;
        std::vector<DirectoryEntry> out;
        CHECK( (decode_directory_entries(FILE_ID_BOTH_DIRECTORY_INFORMATION,
            b.data(), (uint32_t)b.size(), out) == 0) );
    }
}

TEST_CASE( "query directory response", "[smb2][query]" )
{
    QueryDirectoryResponse rsp;
    rsp.output = encode_directory_entries(FILE_FULL_DIRECTORY_INFORMATION, sample_entries());

    Buffer b = encode_body(rsp);
    CHECK( (load_le<uint16_t>(&b[2]) == 72) );
    CHECK( (load_le<uint32_t>(&b[4]) == rsp.output.size()) );

    QueryDirectoryResponse back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );

    std::vector<DirectoryEntry> v;
    CHECK( (back.entries(FILE_FULL_DIRECTORY_INFORMATION, v) == 3) );
    CHECK( (v[1].ea_size == 12) );

    SECTION( "empty output" )
    {
        QueryDirectoryResponse none;
        Buffer e = encode_body(none);
        CHECK( (e.size() == 9) );

        QueryDirectoryResponse eback;
        REQUIRE( eback.decode(e.data(), (uint32_t)e.size()) );
        CHECK( eback.output.empty() );
    }
}

//-------------------------------------------------------------------------
// query info
//-------------------------------------------------------------------------

TEST_CASE( "query info request", "[smb2][query]" )
{
    QueryInfoRequest req = QueryInfoRequest::file_info(FileId(1, 2), FILE_ALL_INFORMATION);
    Buffer b = encode_body(req);

    REQUIRE( (b.size() == 41) );
    CHECK( (b[2] == SMB2_0_INFO_FILE) );
    CHECK( (b[3] == FILE_ALL_INFORMATION) );
    CHECK( (load_le<uint16_t>(&b[8]) == 0) );

    QueryInfoRequest sec = QueryInfoRequest::security_info(FileId(1, 2),
        OWNER_SECURITY_INFORMATION | DACL_SECURITY_INFORMATION);
    b = encode_body(sec);
    CHECK( (b[2] == SMB2_0_INFO_SECURITY) );
    CHECK( (load_le<uint32_t>(&b[16]) == 0x5) );

    QueryInfoRequest fs = QueryInfoRequest::fs_info(FileId(1, 2), FILE_FS_SIZE_INFORMATION);
    CHECK( (fs.info_type == SMB2_0_INFO_FILESYSTEM) );
    CHECK( (fs.info_class == 3) );

    SECTION( "EA names as input" )
    {
        std::vector<std::string> names = { "user.comment", "x" };
        QueryInfoRequest ea = QueryInfoRequest::ea_info(FileId(1, 2), names, SL_RESTART_SCAN);
        b = encode_body(ea);

        CHECK( (load_le<uint16_t>(&b[8]) == 104) );
        CHECK( (load_le<uint32_t>(&b[12]) == ea.input.size()) );

        QueryInfoRequest back;
        REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
        CHECK( (back.info_class == FILE_FULL_EA_INFORMATION) );
        CHECK( back.flags.contains(SL_RESTART_SCAN) );

        std::vector<std::string> got;
        CHECK( (decode_ea_name_list(back.input.data(), (uint32_t)back.input.size(), got) == 2) );
        CHECK( (got == names) );
    }
}

TEST_CASE( "ea name list", "[smb2][query]" )
{
    Buffer b = encode_ea_name_list({ "abc", "defgh" });

    // 4 + 1 + 3 + 1 = 9, aligned to 12
    CHECK( (load_le<uint32_t>(&b[0]) == 12) );
    CHECK( (b[4] == 3) );
    CHECK( (b.size() == 12 + 4 + 1 + 5 + 1) );

    b[16] = 40;
    std::vector<std::string> names;
    CHECK( (decode_ea_name_list(b.data(), (uint32_t)b.size(), names) == 1) );
    CHECK( (names[0] == "abc") );
}

template<typename Rec>
static QueryInfoResponse answer(const Rec& rec)
{
    QueryInfoResponse rsp;
    rsp.output = encode_record(rec);

    Buffer b = encode_body(rsp);
    CHECK( (load_le<uint16_t>(&b[2]) == 72) );

    QueryInfoResponse back;
    CHECK( back.decode(b.data(), (uint32_t)b.size()) );
    return back;
}

TEST_CASE( "file information records", "[smb2][query]" )
{
    SECTION( "basic" )
    {
        FileBasicInfo in;
        in.times.creation = FileTime::from_unix_seconds(1000000000);
        in.times.change = FileTime::from_unix_seconds(1000000001);
        in.file_attributes = FILE_ATTRIBUTE_READONLY | FILE_ATTRIBUTE_HIDDEN;

        CHECK( (encode_record(in).size() == 40) );

        FileBasicInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.times.creation == in.times.creation) );
        CHECK( (out.times.change == in.times.change) );
        CHECK( out.file_attributes.contains(FILE_ATTRIBUTE_HIDDEN) );

        // too short for this class
        FileAllInfo all;
        CHECK_FALSE( answer(in).get(all) );
    }
    SECTION( "standard" )
    {
        FileStandardInfo in;
        in.allocation_size = 8192;
        in.end_of_file = 5000;
        in.number_of_links = 1;
        in.delete_pending = true;

        Buffer b = encode_record(in);
        REQUIRE( (b.size() == 24) );
        CHECK( (b[20] == 1) );
        CHECK( (b[21] == 0) );

        FileStandardInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( out.delete_pending );
        CHECK_FALSE( out.directory );
        CHECK( (out.end_of_file == 5000) );
    }
    SECTION( "all" )
    {
        FileAllInfo in;
        in.basic.file_attributes = FILE_ATTRIBUTE_NORMAL;
        in.standard.end_of_file = 99;
        in.internal.index_number = 0xabcdef;
        in.access.access_flags = FILE_READ_DATA;
        in.position.current_byte_offset = 10;
        in.alignment.alignment_requirement = 511;
        in.name = "\\dir\\file.txt";

        Buffer b = encode_record(in);
        REQUIRE( (b.size() == 100 + 26) );
        CHECK( (load_le<uint32_t>(&b[96]) == 26) );

        FileAllInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.standard.end_of_file == 99) );
        CHECK( (out.internal.index_number == 0xabcdef) );
        CHECK( (out.alignment.alignment_requirement == 511) );
        CHECK( (out.name == in.name) );

        store_le<uint32_t>(&b[96], 27);
        CHECK_FALSE( decode_record(b.data(), (uint32_t)b.size(), out) );
        CHECK( (out.name == in.name) );
    }
    SECTION( "network open" )
    {
        FileNetworkOpenInfo in;
        in.allocation_size = 4096;
        in.end_of_file = 1;
        CHECK( (encode_record(in).size() == 56) );

        FileNetworkOpenInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.allocation_size == 4096) );
    }
    SECTION( "pipe local" )
    {
        FilePipeLocalInfo in;
        in.maximum_instances = 0xffffffff;
        in.named_pipe_end = FILE_PIPE_SERVER_END;
        CHECK( (encode_record(in).size() == 40) );

        FilePipeLocalInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.named_pipe_end == FILE_PIPE_SERVER_END) );
    }
    SECTION( "compression" )
    {
        FileCompressionInfo in;
        in.compressed_file_size = 777;
        in.compression_format = COMPRESSION_FORMAT_LZNT1;
        in.compression_unit_shift = 16;
        CHECK( (encode_record(in).size() == 16) );

        FileCompressionInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.compression_format == COMPRESSION_FORMAT_LZNT1) );
        CHECK( (out.compression_unit_shift == 16) );
    }
}

TEST_CASE( "stream information", "[smb2][query]" )
{
    std::vector<FileStreamInfo> in(2);
    in[0].name = "::$DATA";
    in[0].stream_size = 100;
    in[1].name = ":Zone.Identifier:$DATA";
    in[1].stream_size = 26;
    in[1].stream_allocation_size = 4096;

    QueryInfoResponse rsp;
    rsp.output = encode_stream_info(in);

    // 24 fixed + 14 name = 38, aligned to 40
    CHECK( (load_le<uint32_t>(&rsp.output[0]) == 40) );

    std::vector<FileStreamInfo> out;
    REQUIRE( (rsp.streams(out) == 2) );
    CHECK( (out[0].name == "::$DATA") );
    CHECK( (out[1].name == in[1].name) );
    CHECK( (out[1].stream_allocation_size == 4096) );
}

TEST_CASE( "file system information records", "[smb2][query]" )
{
    SECTION( "attribute" )
    {
        FsAttributeInfo in;
        in.attributes = FILE_CASE_PRESERVED_NAMES | FILE_UNICODE_ON_DISK | FILE_PERSISTENT_ACLS;
        in.maximum_component_name_length = 255;
        in.file_system_name = "NTFS";

        Buffer b = encode_record(in);
        REQUIRE( (b.size() == 12 + 8) );
        CHECK( (load_le<uint32_t>(&b[8]) == 8) );

        FsAttributeInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.file_system_name == "NTFS") );
        CHECK( (out.maximum_component_name_length == 255) );
        CHECK( out.attributes.contains(FILE_PERSISTENT_ACLS) );
        CHECK_FALSE( out.attributes.contains(FILE_CASE_SENSITIVE_SEARCH) );
    }
    SECTION( "volume" )
    {
        FsVolumeInfo in;
        in.creation_time = FileTime::from_unix_seconds(1500000000);
        in.serial_number = 0xdeadbeef;
        in.label = "DATA";

        Buffer b = encode_record(in);
        REQUIRE( (b.size() == 18 + 8) );

        FsVolumeInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.serial_number == 0xdeadbeef) );
        CHECK( (out.label == "DATA") );

        store_le<uint32_t>(&b[12], 10);
        CHECK_FALSE( decode_record(b.data(), (uint32_t)b.size(), out) );
    }
    SECTION( "full size" )
    {
        FsFullSizeInfo in;
        in.total_allocation_units = 1000000;
        in.caller_available_allocation_units = 500000;
        in.actual_available_allocation_units = 600000;
        in.sectors_per_allocation_unit = 8;
        in.bytes_per_sector = 512;
        CHECK( (encode_record(in).size() == 32) );

        FsFullSizeInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.actual_available_allocation_units == 600000) );
        CHECK( (out.bytes_per_sector == 512) );
    }
    SECTION( "sector size" )
    {
        FsSectorSizeInfo in;
        in.logical_bytes_per_sector = 512;
        in.physical_bytes_per_sector_for_performance = 4096;
        in.flags = SSINFO_FLAGS_ALIGNED_DEVICE | SSINFO_FLAGS_NO_SEEK_PENALTY;
        CHECK( (encode_record(in).size() == 28) );

        FsSectorSizeInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.flags == 5) );
    }
    SECTION( "device" )
    {
        FsDeviceInfo in;
        in.device_type = FILE_DEVICE_DISK;
        in.characteristics = FILE_REMOTE_DEVICE | FILE_DEVICE_IS_MOUNTED;

        FsDeviceInfo out;
        REQUIRE( answer(in).get(out) );
        CHECK( (out.characteristics == 0x30) );
    }
}

TEST_CASE( "information class names", "[smb2][query]" )
{
    CHECK( (std::string(file_info_class_name(FILE_BASIC_INFORMATION)) ==
        "FileBasicInformation") );
    CHECK( (std::string(fs_info_class_name(FILE_FS_ATTRIBUTE_INFORMATION)) ==
        "FileFsAttributeInformation") );
    CHECK( (std::string(file_info_class_name(0xEE)) == "unknown") );
}

//-------------------------------------------------------------------------
// set info
//-------------------------------------------------------------------------

TEST_CASE( "set info builders", "[smb2][set]" )
{
    SECTION( "end of file" )
    {
        SetInfoRequest req = SetInfoRequest::end_of_file(FileId(3, 3), 1 << 20);
        Buffer b = encode_body(req);

        REQUIRE( (b.size() == 32 + 8) );
        CHECK( (b[2] == SMB2_0_INFO_FILE) );
        CHECK( (b[3] == FILE_END_OF_FILE_INFORMATION) );
        CHECK( (load_le<uint32_t>(&b[4]) == 8) );
        CHECK( (load_le<uint16_t>(&b[8]) == 96) );
        CHECK( (load_le<uint64_t>(&b[32]) == 1 << 20) );

        SetInfoRequest back;
        REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
        FileEndOfFileInfo eof;
        REQUIRE( decode_record(back.buffer.data(), (uint32_t)back.buffer.size(), eof) );
        CHECK( (eof.end_of_file == 1 << 20) );
    }
    SECTION( "rename" )
    {
        SetInfoRequest req = SetInfoRequest::rename(FileId(3, 3), "new\\name.txt", true);
        CHECK( (req.info_class == FILE_RENAME_INFORMATION) );
        CHECK( (req.buffer.size() == 20 + 24) );
        CHECK( (req.buffer[0] == 1) );

        FileRenameInfo info;
        REQUIRE( decode_record(req.buffer.data(), (uint32_t)req.buffer.size(), info) );
        CHECK( info.replace_if_exists );
        CHECK( (info.root_directory == 0) );
        CHECK( (info.name == "new\\name.txt") );
    }
    SECTION( "disposition" )
    {
        SetInfoRequest req = SetInfoRequest::disposition(FileId(3, 3), true);
        REQUIRE( (req.buffer.size() == 1) );
        CHECK( (req.buffer[0] == 1) );
    }
    SECTION( "basic" )
    {
        FileBasicInfo info;
        info.times.last_write = FileTime::from_unix_seconds(1);
        SetInfoRequest req = SetInfoRequest::basic(FileId(3, 3), info);
        CHECK( (req.info_class == FILE_BASIC_INFORMATION) );
        CHECK( (req.buffer.size() == 40) );
    }
    SECTION( "allocation and position" )
    {
        CHECK( (SetInfoRequest::allocation(FileId(), 4096).info_class ==
            FILE_ALLOCATION_INFORMATION) );
        CHECK( (SetInfoRequest::position(FileId(), 10).buffer.size() == 8) );
    }
    SECTION( "buffer length past the body" )
    {
        Buffer b = encode_body(SetInfoRequest::position(FileId(), 10));
        store_le<uint32_t>(&b[4], 9);
        SetInfoRequest bad;
        CHECK_FALSE( bad.decode(b.data(), (uint32_t)b.size()) );
    }

    SetInfoResponse rsp;
    Buffer r = encode_body(rsp);
    CHECK( (r.size() == 2) );
    CHECK( rsp.decode(r.data(), (uint32_t)r.size()) );
}

//-------------------------------------------------------------------------
// change notify
//-------------------------------------------------------------------------

TEST_CASE( "change notify request", "[smb2][notify]" )
{
    ChangeNotifyRequest req(FileId(6, 6), FILE_NOTIFY_CHANGE_LISTING, SMB2_WATCH_TREE);
    req.output_buffer_length = 4096;

    Buffer b = encode_body(req);
    REQUIRE( (b.size() == 32) );
    CHECK( (load_le<uint16_t>(&b[2]) == 1) );
    CHECK( (load_le<uint32_t>(&b[4]) == 4096) );
    CHECK( (load_le<uint32_t>(&b[24]) == 3) );

    ChangeNotifyRequest back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    CHECK( back.flags.contains(SMB2_WATCH_TREE) );
    CHECK( back.completion_filter.contains(FILE_NOTIFY_CHANGE_DIR_NAME) );
    CHECK( (back.file_id == FileId(6, 6)) );
}

TEST_CASE( "change notify response", "[smb2][notify]" )
{
    ChangeNotifyResponse rsp;
    FileNotification n;
    n.action = FILE_ACTION_RENAMED_OLD_NAME;
    n.name = "old.txt";
    rsp.notifications.push_back(n);
    n.action = FILE_ACTION_RENAMED_NEW_NAME;
    n.name = "new.txt";
    rsp.notifications.push_back(n);

    Buffer b = encode_body(rsp);
    CHECK( (load_le<uint16_t>(&b[2]) == 72) );

    // 12 fixed + 14 name = 26, aligned to 28
    CHECK( (load_le<uint32_t>(&b[8]) == 28) );
    CHECK( (load_le<uint32_t>(&b[12]) == FILE_ACTION_RENAMED_OLD_NAME) );

    ChangeNotifyResponse back;
    REQUIRE( back.decode(b.data(), (uint32_t)b.size()) );
    REQUIRE( (back.notifications.size() == 2) );
    CHECK( (back.notifications[1].action == FILE_ACTION_RENAMED_NEW_NAME) );
    CHECK( (back.notifications[1].name == "new.txt") );

    CHECK( (std::string(notify_action_name(FILE_ACTION_ADDED)) == "added") );

    SECTION( "empty buffer after overflow" )
    {
        ChangeNotifyResponse none;
        Buffer e = encode_body(none);
        ChangeNotifyResponse eback;
        REQUIRE( eback.decode(e.data(), (uint32_t)e.size()) );
        CHECK( eback.notifications.empty() );
    }
}

