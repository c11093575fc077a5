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

#include "smb2_file_io.h"

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

//-------------------------------------------------------------------------
// channel info
//-------------------------------------------------------------------------

void ChannelInfo::encode(WireWriter& w) const
{
    if ( !in_use() )
        return;

    for ( const auto& d : descriptors )
    {
        w.u64(d.offset);
        w.u32(d.token);
        w.u32(d.length);
    }
}

bool ChannelInfo::decode(const uint8_t* buf, uint32_t len)
{
    if ( len % SMB2_CHANNEL_DESCRIPTOR_LENGTH )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "channel info length %u", len);
        return false;
    }

    WireReader r(buf, len);
    std::vector<ChannelDescriptor> v;

    while ( r.remaining() )
    {
        ChannelDescriptor d;
        d.offset = r.u64();
        d.token = r.u32();
        d.length = r.u32();
        v.emplace_back(d);
    }

    descriptors.swap(v);
    return true;
}

// fields common to the read and write requests
static bool decode_channel(const uint8_t* body, uint32_t len, uint32_t channel,
    uint16_t info_offset, uint16_t info_len, ChannelInfo& info)
{
    const uint8_t* p = nullptr;

    if ( !body_span(body, len, info_offset, info_len, p) )
        return false;

    info.channel = (Channel)channel;

    if ( info_len and !info.decode(p, info_len) )
        return false;

    return true;
}

//-------------------------------------------------------------------------
// read
//-------------------------------------------------------------------------

void ReadRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_READ_REQUEST_STRUC_SIZE);
    w.u8(padding);
    w.u8(flags);
    w.u32(length);
    w.u64(offset);
    put_file_id(w, file_id);
    w.u32(minimum_count);
    w.u32(channel_info.channel);
    w.u32(remaining_bytes);

    uint16_t info_len = channel_info.length();
    w.u16(info_len ? (uint16_t)(w.wire_offset() + 4) : 0);
    w.u16(info_len);

    channel_info.encode(w);
    pad_empty_buffer(w, info_len);
}

bool ReadRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_READ_REQUEST_STRUC_SIZE, "read request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    ReadRequest req;
    req.padding = r.u8();
    req.flags = r.u8();
    req.length = r.u32();
    req.offset = r.u64();
    req.file_id = get_file_id(r);
    req.minimum_count = r.u32();
    uint32_t channel = r.u32();
    req.remaining_bytes = r.u32();
    uint16_t info_offset = r.u16();
    uint16_t info_len = r.u16();

    if ( !r.good() or
        !decode_channel(body, len, channel, info_offset, info_len, req.channel_info) )
        return false;

    *this = std::move(req);
    return true;
}

void ReadResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_READ_RESPONSE_STRUC_SIZE);
    w.u8(data.empty() ? 0 : (uint8_t)(w.wire_offset() + 14));
    w.u8(0);
    w.u32((uint32_t)data.size());
    w.u32(data_remaining);
    w.u32(flags);

    w.bytes(data);
    pad_empty_buffer(w, (uint32_t)data.size());
}

bool ReadResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_READ_RESPONSE_STRUC_SIZE, "read response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    ReadResponse rsp;
    uint8_t data_offset = r.u8();
    r.skip(1);
    uint32_t data_len = r.u32();
    rsp.data_remaining = r.u32();
    rsp.flags = r.u32();

    const uint8_t* p = nullptr;

    if ( !r.good() or !body_span(body, len, data_offset, data_len, p) )
        return false;

    rsp.data.assign(p, p + data_len);

    *this = std::move(rsp);
    return true;
}

//-------------------------------------------------------------------------
// write
//-------------------------------------------------------------------------

void WriteRequest::encode(WireWriter& w) const
{
    uint16_t info_len = channel_info.length();
    uint32_t fixed_end = w.wire_offset() + (SMB2_WRITE_REQUEST_STRUC_SIZE - 1);

    w.u16(SMB2_WRITE_REQUEST_STRUC_SIZE);
    w.u16((uint16_t)(fixed_end + info_len));
    w.u32((uint32_t)data.size());
    w.u64(offset);
    put_file_id(w, file_id);
    w.u32(channel_info.channel);
    w.u32(remaining_bytes);
    w.u16(info_len ? (uint16_t)fixed_end : 0);
    w.u16(info_len);
    w.u32(flags.raw());

    channel_info.encode(w);
    w.bytes(data);
    pad_empty_buffer(w, info_len + (uint32_t)data.size());
}

bool WriteRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_WRITE_REQUEST_STRUC_SIZE, "write request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    WriteRequest req;
    uint16_t data_offset = r.u16();
    uint32_t data_len = r.u32();
    req.offset = r.u64();
    req.file_id = get_file_id(r);
    uint32_t channel = r.u32();
    req.remaining_bytes = r.u32();
    uint16_t info_offset = r.u16();
    uint16_t info_len = r.u16();
    req.flags = WriteFlags(r.u32());

    const uint8_t* p = nullptr;

    if ( !r.good() or !body_span(body, len, data_offset, data_len, p) or
        !decode_channel(body, len, channel, info_offset, info_len, req.channel_info) )
        return false;

    req.data.assign(p, p + data_len);

    *this = std::move(req);
    return true;
}

void WriteResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_WRITE_RESPONSE_STRUC_SIZE);
    w.u16(0);
    w.u32(count);
    w.u32(0);   // remaining
    w.u16(0);   // channel info offset
    w.u16(0);   // channel info length
    pad_empty_buffer(w, 0);
}

bool WriteResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_WRITE_RESPONSE_STRUC_SIZE, "write response") )
        return false;

    uint32_t n;

    if ( !read_integer<uint32_t>(body, len, 4, n) )
        return false;

    count = n;
    return true;
}

//-------------------------------------------------------------------------
// lock
//-------------------------------------------------------------------------

void LockRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_LOCK_REQUEST_STRUC_SIZE);
    w.u16((uint16_t)locks.size());
    w.u32(pack_lock_sequence(lock_sequence_number, lock_sequence_index));
    put_file_id(w, file_id);

    for ( const auto& l : locks )
    {
        w.u64(l.offset);
        w.u64(l.length);
        w.u32(l.flags.raw());
        w.u32(0);
    }

    // the structure size counts one element
    if ( locks.empty() )
        w.zero(SMB2_LOCK_ELEMENT_LENGTH);
}

bool LockRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_LOCK_REQUEST_STRUC_SIZE, "lock request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    LockRequest req;
    uint16_t count = r.u16();
    uint32_t seq = r.u32();
    req.lock_sequence_number = (uint8_t)(seq >> 28);
    req.lock_sequence_index = seq & 0x0FFFFFFF;
    req.file_id = get_file_id(r);

    if ( r.remaining() < (uint32_t)count * SMB2_LOCK_ELEMENT_LENGTH )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "lock request: %u locks truncated", count);
        return false;
    }

    for ( unsigned i = 0; i < count; ++i )
    {
        LockElement l;
        l.offset = r.u64();
        l.length = r.u64();
        l.flags = LockFlags(r.u32());
        r.skip(4);
        req.locks.emplace_back(l);
    }

    if ( !r.good() )
        return false;

    *this = std::move(req);
    return true;
}

