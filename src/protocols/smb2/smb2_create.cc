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

#include "smb2_create.h"

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

//-------------------------------------------------------------------------
// create contexts
//-------------------------------------------------------------------------

void smbwire::smb2::encode_create_contexts(WireWriter& w, const std::vector<CreateContext>& contexts)
{
    for ( size_t i = 0; i < contexts.size(); ++i )
    {
        const CreateContext& ctx = contexts[i];
        uint32_t start = w.position();

        w.u32(0);
        w.u16(SMB2_CREATE_CONTEXT_HEADER_LENGTH);
        w.u16((uint16_t)ctx.name.size());
        w.u16(0);
        w.u16(0);
        w.u32((uint32_t)ctx.data.size());
        w.bytes((const uint8_t*)ctx.name.data(), ctx.name.size());

        if ( !ctx.data.empty() )
        {
            w.align(8);
            w.patch16(start + 10, (uint16_t)(w.position() - start));
            w.bytes(ctx.data);
        }

        if ( i + 1 < contexts.size() )
        {
            w.align(8);
            w.patch32(start, w.position() - start);
        }
    }
}

unsigned smbwire::smb2::decode_create_contexts(const uint8_t* buf, uint32_t len,
    std::vector<CreateContext>& contexts)
{
    return walk_chain(buf, len, [&contexts](const uint8_t* rec, uint32_t avail)
    {
        if ( avail < SMB2_CREATE_CONTEXT_HEADER_LENGTH )
            return false;

        WireReader r(rec, SMB2_CREATE_CONTEXT_HEADER_LENGTH);
        r.skip(4);
        uint16_t name_offset = r.u16();
        uint16_t name_len = r.u16();
        r.skip(2);
        uint16_t data_offset = r.u16();
        uint32_t data_len = r.u32();

        if ( (uint32_t)name_offset + name_len > avail or
            (data_len and (uint64_t)data_offset + data_len > avail) )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "create context outside %u byte record", avail);
            return false;
        }

        CreateContext ctx;
        ctx.name.assign((const char*)rec + name_offset, name_len);

        if ( data_len )
            ctx.data.assign(rec + data_offset, rec + data_offset + data_len);

        contexts.emplace_back(std::move(ctx));
        return true;
    });
}

static CreateContext make_context(const char* name, Buffer&& data)
{
    CreateContext ctx;
    ctx.name = name;
    ctx.data = std::move(data);
    return ctx;
}

CreateContext smbwire::smb2::durable_handle_context()
{ return make_context(SMB2_CREATE_DURABLE_HANDLE_REQUEST, Buffer(16, 0)); }

CreateContext smbwire::smb2::durable_reconnect_context(const FileId& id)
{
    Buffer data;
    WireWriter w(data);
    put_file_id(w, id);
    return make_context(SMB2_CREATE_DURABLE_HANDLE_RECONNECT, std::move(data));
}

CreateContext smbwire::smb2::allocation_size_context(uint64_t size)
{
    Buffer data;
    write_value<uint64_t>(data, size);
    return make_context(SMB2_CREATE_ALLOCATION_SIZE, std::move(data));
}

CreateContext smbwire::smb2::maximal_access_context(FileTime timestamp)
{
    Buffer data;

    if ( !timestamp.is_zero() )
        write_value<uint64_t>(data, timestamp.get_ticks());

    return make_context(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST, std::move(data));
}

CreateContext smbwire::smb2::timewarp_context(FileTime snapshot)
{
    Buffer data;
    write_value<uint64_t>(data, snapshot.get_ticks());
    return make_context(SMB2_CREATE_TIMEWARP_TOKEN, std::move(data));
}

CreateContext smbwire::smb2::query_on_disk_id_context()
{ return make_context(SMB2_CREATE_QUERY_ON_DISK_ID, Buffer()); }

bool MaximalAccess::decode(const Buffer& data)
{
    WireReader r(data.data(), (uint32_t)data.size());
    uint32_t status = r.u32();
    uint32_t access_bits = r.u32();

    if ( !r.good() )
        return false;

    query_status = status;
    access = AccessMask(access_bits);
    return true;
}

bool OnDiskId::decode(const Buffer& data)
{
    WireReader r(data.data(), (uint32_t)data.size());
    uint64_t file = r.u64();
    uint64_t volume = r.u64();
    r.skip(16);

    if ( !r.good() )
        return false;

    disk_file_id = file;
    volume_id = volume;
    return true;
}

CreateContext Lease::context() const
{
    Buffer data;
    WireWriter w(data);
    w.bytes(key);
    w.u32(state.raw());
    w.u32(flags);
    w.u64(duration);
    return make_context(SMB2_CREATE_REQUEST_LEASE, std::move(data));
}

bool Lease::decode(const Buffer& data)
{
    WireReader r(data.data(), (uint32_t)data.size());
    Lease l;
    r.bytes(l.key);
    l.state = LeaseState(r.u32());
    l.flags = r.u32();
    l.duration = r.u64();

    if ( !r.good() )
        return false;

    *this = l;
    return true;
}

//-------------------------------------------------------------------------
// create
//-------------------------------------------------------------------------

void CreateRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_CREATE_REQUEST_STRUC_SIZE);
    w.u8(0);    // security flags
    w.u8(requested_oplock_level);
    w.u32(impersonation_level);
    w.u64(0);   // smb create flags
    w.u64(0);
    w.u32(desired_access.raw());
    w.u32(file_attributes.raw());
    w.u32(share_access.raw());
    w.u32(create_disposition);
    w.u32(create_options.raw());

    uint32_t fields = w.position();
    w.u16(0);
    w.u16(0);
    w.u32(0);
    w.u32(0);

    w.patch16(fields, (uint16_t)w.wire_offset());
    uint32_t n = w.utf16(name);
    w.patch16(fields + 2, (uint16_t)n);

    if ( contexts.empty() )
    {
        pad_empty_buffer(w, n);
        return;
    }

    w.align(8);
    uint32_t start = w.position();
    w.patch32(fields + 4, w.wire_offset());
    encode_create_contexts(w, contexts);
    w.patch32(fields + 8, w.position() - start);
}

bool CreateRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CREATE_REQUEST_STRUC_SIZE, "create request") )
        return false;

    WireReader r(body, len);
    r.skip(3);

    CreateRequest req;
    req.requested_oplock_level = r.u8();
    req.impersonation_level = (ImpersonationLevel)r.u32();
    r.skip(16);
    req.desired_access = AccessMask(r.u32());
    req.file_attributes = FileAttributes(r.u32());
    req.share_access = ShareAccess(r.u32());
    req.create_disposition = (CreateDisposition)r.u32();
    req.create_options = CreateOptions(r.u32());
    uint16_t name_offset = r.u16();
    uint16_t name_len = r.u16();
    uint32_t ctx_offset = r.u32();
    uint32_t ctx_len = r.u32();

    const uint8_t* name = nullptr;
    const uint8_t* ctx = nullptr;

    if ( !r.good() or !body_span(body, len, name_offset, name_len, name) or
        !body_span(body, len, ctx_offset, ctx_len, ctx) )
        return false;

    if ( name_len and !read_fixed_string(name, name_len, 0, name_len, req.name) )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "create request: bad name encoding");
        return false;
    }

    if ( ctx_len )
        decode_create_contexts(ctx, ctx_len, req.contexts);

    *this = std::move(req);
    return true;
}

void CreateResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_CREATE_RESPONSE_STRUC_SIZE);
    w.u8(oplock_level);
    w.u8(flags);
    w.u32(create_action);
    put_file_times(w, times);
    w.u64(allocation_size);
    w.u64(end_of_file);
    w.u32(file_attributes.raw());
    w.u32(0);
    put_file_id(w, file_id);

    uint32_t fields = w.position();
    w.u32(0);
    w.u32(0);

    if ( contexts.empty() )
    {
        w.u8(0);
        return;
    }

    w.align(8);
    uint32_t start = w.position();
    w.patch32(fields, w.wire_offset());
    encode_create_contexts(w, contexts);
    w.patch32(fields + 4, w.position() - start);
}

bool CreateResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CREATE_RESPONSE_STRUC_SIZE, "create response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    CreateResponse rsp;
    rsp.oplock_level = r.u8();
    rsp.flags = r.u8();
    rsp.create_action = (CreateAction)r.u32();
    rsp.times = get_file_times(r);
    rsp.allocation_size = r.u64();
    rsp.end_of_file = r.u64();
    rsp.file_attributes = FileAttributes(r.u32());
    r.skip(4);
    rsp.file_id = get_file_id(r);
    uint32_t ctx_offset = r.u32();
    uint32_t ctx_len = r.u32();

    const uint8_t* ctx = nullptr;

    if ( !r.good() or !body_span(body, len, ctx_offset, ctx_len, ctx) )
        return false;

    if ( ctx_len )
        decode_create_contexts(ctx, ctx_len, rsp.contexts);

    *this = std::move(rsp);
    return true;
}

const CreateContext* CreateResponse::find_context(const char* n) const
{
    for ( const auto& ctx : contexts )
    {
        if ( ctx.is(n) )
            return &ctx;
    }
    return nullptr;
}

//-------------------------------------------------------------------------
// close and flush
//-------------------------------------------------------------------------

void CloseRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_CLOSE_REQUEST_STRUC_SIZE);
    w.u16(flags);
    w.u32(0);
    put_file_id(w, file_id);
}

bool CloseRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CLOSE_REQUEST_STRUC_SIZE, "close request") )
        return false;

    WireReader r(body, len);
    r.skip(2);
    uint16_t f = r.u16();
    r.skip(4);
    FileId id = get_file_id(r);

    if ( !r.good() )
        return false;

    flags = f;
    file_id = id;
    return true;
}

void CloseResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_CLOSE_RESPONSE_STRUC_SIZE);
    w.u16(flags);
    w.u32(0);
    put_file_times(w, times);
    w.u64(allocation_size);
    w.u64(end_of_file);
    w.u32(file_attributes.raw());
}

bool CloseResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CLOSE_RESPONSE_STRUC_SIZE, "close response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    CloseResponse rsp;
    rsp.flags = r.u16();
    r.skip(4);
    rsp.times = get_file_times(r);
    rsp.allocation_size = r.u64();
    rsp.end_of_file = r.u64();
    rsp.file_attributes = FileAttributes(r.u32());

    if ( !r.good() )
        return false;

    *this = rsp;
    return true;
}

void FlushRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_FLUSH_REQUEST_STRUC_SIZE);
    w.u16(0);
    w.u32(0);
    put_file_id(w, file_id);
}

bool FlushRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_FLUSH_REQUEST_STRUC_SIZE, "flush request") )
        return false;

    WireReader r(body, len);
    r.skip(8);
    FileId id = get_file_id(r);

    if ( !r.good() )
        return false;

    file_id = id;
    return true;
}

