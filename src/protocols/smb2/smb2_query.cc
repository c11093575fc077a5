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

#include "smb2_query.h"

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

// write an offset/length pair followed later by its buffer; the pair is
// left zero when the buffer is empty
static void put_buffer(WireWriter& w, uint32_t offset_field, uint32_t length_field,
    const Buffer& buf)
{
    if ( buf.empty() )
        return;

    w.patch16(offset_field, (uint16_t)w.wire_offset());
    w.patch32(length_field, (uint32_t)buf.size());
    w.bytes(buf);
}

static bool get_buffer(const uint8_t* body, uint32_t len, uint16_t offset, uint32_t length,
    Buffer& out)
{
    const uint8_t* p = nullptr;

    if ( !body_span(body, len, offset, length, p) )
        return false;

    if ( p )
        out.assign(p, p + length);

    return true;
}

//-------------------------------------------------------------------------
// query directory
//-------------------------------------------------------------------------

QueryDirectoryRequest::QueryDirectoryRequest() :
    output_buffer_length(CodecConfig::get_conf()->default_output_length)
{ }

QueryDirectoryRequest::QueryDirectoryRequest(const FileId& id, uint8_t cls,
    const std::string& pat, QueryDirectoryFlags f) :
    info_class(cls), flags(f), file_id(id), pattern(pat),
    output_buffer_length(CodecConfig::get_conf()->default_output_length)
{ }

void QueryDirectoryRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_QUERY_DIRECTORY_REQUEST_STRUC_SIZE);
    w.u8(info_class);
    w.u8(flags.raw());
    w.u32(file_index);
    put_file_id(w, file_id);

    uint32_t fields = w.position();
    w.u16(0);
    w.u16(0);
    w.u32(output_buffer_length);

    uint32_t at = w.wire_offset();
    uint32_t n = w.utf16(pattern);

    if ( n )
    {
        w.patch16(fields, (uint16_t)at);
        w.patch16(fields + 2, (uint16_t)n);
    }
    pad_empty_buffer(w, n);
}

bool QueryDirectoryRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_QUERY_DIRECTORY_REQUEST_STRUC_SIZE,
        "query directory request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    QueryDirectoryRequest req;
    req.info_class = r.u8();
    req.flags = QueryDirectoryFlags(r.u8());
    req.file_index = r.u32();
    req.file_id = get_file_id(r);
    uint16_t name_offset = r.u16();
    uint16_t name_len = r.u16();
    req.output_buffer_length = r.u32();

    const uint8_t* p = nullptr;

    if ( !r.good() or !body_span(body, len, name_offset, name_len, p) )
        return false;

    if ( name_len and !read_fixed_string(p, name_len, 0, name_len, req.pattern) )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "query directory request: bad pattern encoding");
        return false;
    }

    *this = std::move(req);
    return true;
}

void QueryDirectoryResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_QUERY_DIRECTORY_RESPONSE_STRUC_SIZE);

    uint32_t fields = w.position();
    w.u16(0);
    w.u32(0);

    put_buffer(w, fields, fields + 2, output);
    pad_empty_buffer(w, (uint32_t)output.size());
}

bool QueryDirectoryResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_QUERY_DIRECTORY_RESPONSE_STRUC_SIZE,
        "query directory response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    QueryDirectoryResponse rsp;
    uint16_t offset = r.u16();
    uint32_t length = r.u32();

    if ( !r.good() or !get_buffer(body, len, offset, length, rsp.output) )
        return false;

    *this = std::move(rsp);
    return true;
}

//-------------------------------------------------------------------------
// query info
//-------------------------------------------------------------------------

#define EA_NAME_ENTRY_LENGTH 5

Buffer smbwire::smb2::encode_ea_name_list(const std::vector<std::string>& names)
{
    Buffer out;
    WireWriter w(out);

    for ( size_t i = 0; i < names.size(); ++i )
    {
        uint32_t start = w.position();
        size_t n = names[i].size() > 255 ? 255 : names[i].size();

        w.u32(0);
        w.u8((uint8_t)n);
        w.bytes((const uint8_t*)names[i].data(), n);
        w.u8(0);

        if ( i + 1 < names.size() )
        {
            w.align(4);
            w.patch32(start, w.position() - start);
        }
    }
    return out;
}

unsigned smbwire::smb2::decode_ea_name_list(const uint8_t* buf, uint32_t len,
    std::vector<std::string>& names)
{
    return walk_chain(buf, len, [&names](const uint8_t* rec, uint32_t avail)
    {
        if ( avail < EA_NAME_ENTRY_LENGTH )
            return false;

        uint8_t n = rec[4];

        if ( (uint32_t)EA_NAME_ENTRY_LENGTH + n > avail )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "EA name length %u exceeds %u byte record", n, avail);
            return false;
        }

        names.emplace_back((const char*)rec + EA_NAME_ENTRY_LENGTH, n);
        return true;
    });
}

QueryInfoRequest::QueryInfoRequest() :
    output_buffer_length(CodecConfig::get_conf()->default_output_length)
{ }

QueryInfoRequest QueryInfoRequest::file_info(const FileId& id, uint8_t cls)
{
    QueryInfoRequest req;
    req.info_type = SMB2_0_INFO_FILE;
    req.info_class = cls;
    req.file_id = id;
    return req;
}

QueryInfoRequest QueryInfoRequest::fs_info(const FileId& id, uint8_t cls)
{
    QueryInfoRequest req;
    req.info_type = SMB2_0_INFO_FILESYSTEM;
    req.info_class = cls;
    req.file_id = id;
    return req;
}

QueryInfoRequest QueryInfoRequest::security_info(const FileId& id, SecurityInformation what)
{
    QueryInfoRequest req;
    req.info_type = SMB2_0_INFO_SECURITY;
    req.additional_information = what.raw();
    req.file_id = id;
    return req;
}

QueryInfoRequest QueryInfoRequest::ea_info(const FileId& id,
    const std::vector<std::string>& names, QueryInfoFlags f)
{
    QueryInfoRequest req;
    req.info_type = SMB2_0_INFO_FILE;
    req.info_class = FILE_FULL_EA_INFORMATION;
    req.input = encode_ea_name_list(names);
    req.flags = f;
    req.file_id = id;
    return req;
}

void QueryInfoRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_QUERY_INFO_REQUEST_STRUC_SIZE);
    w.u8(info_type);
    w.u8(info_class);
    w.u32(output_buffer_length);

    uint32_t fields = w.position();
    w.u16(0);
    w.u16(0);
    w.u32(0);
    w.u32(additional_information);
    w.u32(flags.raw());
    put_file_id(w, file_id);

    put_buffer(w, fields, fields + 4, input);
    pad_empty_buffer(w, (uint32_t)input.size());
}

bool QueryInfoRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_QUERY_INFO_REQUEST_STRUC_SIZE, "query info request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    QueryInfoRequest req;
    req.info_type = r.u8();
    req.info_class = r.u8();
    req.output_buffer_length = r.u32();
    uint16_t input_offset = r.u16();
    r.skip(2);
    uint32_t input_len = r.u32();
    req.additional_information = r.u32();
    req.flags = QueryInfoFlags(r.u32());
    req.file_id = get_file_id(r);

    if ( !r.good() or !get_buffer(body, len, input_offset, input_len, req.input) )
        return false;

    *this = std::move(req);
    return true;
}

void QueryInfoResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_QUERY_INFO_RESPONSE_STRUC_SIZE);

    uint32_t fields = w.position();
    w.u16(0);
    w.u32(0);

    put_buffer(w, fields, fields + 2, output);
    pad_empty_buffer(w, (uint32_t)output.size());
}

bool QueryInfoResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_QUERY_INFO_RESPONSE_STRUC_SIZE, "query info response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    QueryInfoResponse rsp;
    uint16_t offset = r.u16();
    uint32_t length = r.u32();

    if ( !r.good() or !get_buffer(body, len, offset, length, rsp.output) )
        return false;

    *this = std::move(rsp);
    return true;
}

//-------------------------------------------------------------------------
// set info
//-------------------------------------------------------------------------

template<typename Rec>
static SetInfoRequest make_set(const FileId& id, uint8_t cls, const Rec& rec)
{
    SetInfoRequest req;
    req.info_type = SMB2_0_INFO_FILE;
    req.info_class = cls;
    req.file_id = id;
    req.buffer = encode_record(rec);
    return req;
}

SetInfoRequest SetInfoRequest::basic(const FileId& id, const FileBasicInfo& info)
{ return make_set(id, FILE_BASIC_INFORMATION, info); }

SetInfoRequest SetInfoRequest::end_of_file(const FileId& id, int64_t eof)
{
    FileEndOfFileInfo info;
    info.end_of_file = eof;
    return make_set(id, FILE_END_OF_FILE_INFORMATION, info);
}

SetInfoRequest SetInfoRequest::allocation(const FileId& id, int64_t size)
{
    FileAllocationInfo info;
    info.allocation_size = size;
    return make_set(id, FILE_ALLOCATION_INFORMATION, info);
}

SetInfoRequest SetInfoRequest::disposition(const FileId& id, bool delete_pending)
{
    FileDispositionInfo info;
    info.delete_pending = delete_pending;
    return make_set(id, FILE_DISPOSITION_INFORMATION, info);
}

SetInfoRequest SetInfoRequest::position(const FileId& id, int64_t offset)
{
    FilePositionInfo info;
    info.current_byte_offset = offset;
    return make_set(id, FILE_POSITION_INFORMATION, info);
}

SetInfoRequest SetInfoRequest::rename(const FileId& id, const std::string& target, bool replace)
{
    FileRenameInfo info;
    info.replace_if_exists = replace;
    info.name = target;
    return make_set(id, FILE_RENAME_INFORMATION, info);
}

void SetInfoRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_SET_INFO_REQUEST_STRUC_SIZE);
    w.u8(info_type);
    w.u8(info_class);

    uint32_t fields = w.position();
    w.u32(0);
    w.u16(0);
    w.u16(0);
    w.u32(additional_information);
    put_file_id(w, file_id);

    put_buffer(w, fields + 4, fields, buffer);
    pad_empty_buffer(w, (uint32_t)buffer.size());
}

bool SetInfoRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_SET_INFO_REQUEST_STRUC_SIZE, "set info request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    SetInfoRequest req;
    req.info_type = r.u8();
    req.info_class = r.u8();
    uint32_t buffer_len = r.u32();
    uint16_t buffer_offset = r.u16();
    r.skip(2);
    req.additional_information = r.u32();
    req.file_id = get_file_id(r);

    if ( !r.good() or !get_buffer(body, len, buffer_offset, buffer_len, req.buffer) )
        return false;

    *this = std::move(req);
    return true;
}

void SetInfoResponse::encode(WireWriter& w) const
{ w.u16(SMB2_SET_INFO_RESPONSE_STRUC_SIZE); }

bool SetInfoResponse::decode(const uint8_t* body, uint32_t len)
{ return check_structure(body, len, SMB2_SET_INFO_RESPONSE_STRUC_SIZE, "set info response"); }

