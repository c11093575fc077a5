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

#include "smb2_negotiate.h"

#include <algorithm>

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

//-------------------------------------------------------------------------
// negotiate contexts
//-------------------------------------------------------------------------

NegotiateContext smbwire::smb2::preauth_integrity_context(const Buffer& salt)
{
    NegotiateContext ctx;
    ctx.type = SMB2_PREAUTH_INTEGRITY_CAPABILITIES;

    WireWriter w(ctx.data);
    w.u16(1);
    w.u16((uint16_t)salt.size());
    w.u16(SMB2_PREAUTH_HASH_SHA512);
    w.bytes(salt);
    return ctx;
}

NegotiateContext smbwire::smb2::encryption_context(const std::vector<uint16_t>& ciphers)
{
    NegotiateContext ctx;
    ctx.type = SMB2_ENCRYPTION_CAPABILITIES;

    WireWriter w(ctx.data);
    w.u16((uint16_t)ciphers.size());

    for ( auto c : ciphers )
        w.u16(c);

    return ctx;
}

bool PreauthIntegrity::decode(const Buffer& data)
{
    WireReader r(data.data(), (uint32_t)data.size());
    PreauthIntegrity p;

    uint16_t count = r.u16();
    uint16_t salt_len = r.u16();

    for ( unsigned i = 0; i < count and r.good(); ++i )
        p.hash_algorithms.push_back(r.u16());

    r.bytes(p.salt, salt_len);

    if ( !r.good() )
        return false;

    *this = std::move(p);
    return true;
}

bool EncryptionCapabilities::decode(const Buffer& data)
{
    WireReader r(data.data(), (uint32_t)data.size());
    EncryptionCapabilities e;

    uint16_t count = r.u16();

    for ( unsigned i = 0; i < count and r.good(); ++i )
        e.ciphers.push_back(r.u16());

    if ( !r.good() )
        return false;

    *this = std::move(e);
    return true;
}

void smbwire::smb2::encode_negotiate_contexts(WireWriter& w,
    const std::vector<NegotiateContext>& contexts)
{
    for ( const auto& ctx : contexts )
    {
        w.align(8);
        w.u16(ctx.type);
        w.u16((uint16_t)ctx.data.size());
        w.u32(0);
        w.bytes(ctx.data);
    }
}

unsigned smbwire::smb2::decode_negotiate_contexts(const uint8_t* buf, uint32_t len,
    unsigned count, std::vector<NegotiateContext>& contexts)
{
    const unsigned cap = CodecConfig::get_conf()->max_chain_entries;
    WireReader r(buf, len);
    unsigned n = 0;

    while ( n < count and n < cap )
    {
        if ( n and !r.seek(align_up(r.offset(), 8)) )
            break;

        NegotiateContext ctx;
        ctx.type = r.u16();
        uint16_t data_len = r.u16();
        r.skip(4);
        r.bytes(ctx.data, data_len);

        if ( !r.good() )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "negotiate context %u truncated", n);
            break;
        }

        contexts.emplace_back(std::move(ctx));
        ++n;
    }
    return n;
}

//-------------------------------------------------------------------------
// negotiate request
//-------------------------------------------------------------------------

bool NegotiateRequest::has_contexts() const
{
    return !contexts.empty() or
        std::find(dialects.begin(), dialects.end(), SMB2_DIALECT_311) != dialects.end();
}

void NegotiateRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_NEGOTIATE_REQUEST_STRUC_SIZE);
    w.u16((uint16_t)dialects.size());
    w.u16(security_mode.raw());
    w.u16(0);
    w.u32(capabilities.raw());
    w.bytes(client_guid);

    uint32_t slot = w.position();

    if ( has_contexts() )
    {
        w.u32(0);
        w.u16((uint16_t)contexts.size());
        w.u16(0);
    }
    else
        w.u64(client_start_time.get_ticks());

    for ( auto d : dialects )
        w.u16(d);

    if ( !contexts.empty() )
    {
        w.align(8);
        w.patch32(slot, w.wire_offset());
        encode_negotiate_contexts(w, contexts);
    }
}

bool NegotiateRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_NEGOTIATE_REQUEST_STRUC_SIZE, "negotiate request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    NegotiateRequest req;
    uint16_t dialect_count = r.u16();
    req.security_mode = NegotiateSigning(r.u16());
    r.skip(2);
    req.capabilities = GlobalCapabilities(r.u32());
    r.bytes(req.client_guid);

    uint64_t slot = r.u64();

    req.dialects.clear();

    for ( unsigned i = 0; i < dialect_count and r.good(); ++i )
        req.dialects.push_back(r.u16());

    if ( !r.good() )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "negotiate request: %u dialects truncated", dialect_count);
        return false;
    }

    if ( std::find(req.dialects.begin(), req.dialects.end(), SMB2_DIALECT_311)
        != req.dialects.end() )
    {
        uint32_t ctx_offset = (uint32_t)slot;
        uint16_t ctx_count = (uint16_t)(slot >> 32);

        if ( ctx_count )
        {
            if ( ctx_offset < SMB2_HEADER_LENGTH or ctx_offset - SMB2_HEADER_LENGTH > len )
            {
                SMB2_TRACE(TRACE_DEBUG_LEVEL, "negotiate request: context offset %u", ctx_offset);
                return false;
            }
            uint32_t at = ctx_offset - SMB2_HEADER_LENGTH;
            decode_negotiate_contexts(body + at, len - at, ctx_count, req.contexts);
        }
    }
    else
        req.client_start_time = FileTime(slot);

    *this = std::move(req);
    return true;
}

//-------------------------------------------------------------------------
// negotiate response
//-------------------------------------------------------------------------

void NegotiateResponse::encode(WireWriter& w) const
{
    bool with_contexts = dialect_revision == SMB2_DIALECT_311 and !contexts.empty();

    w.u16(SMB2_NEGOTIATE_RESPONSE_STRUC_SIZE);
    w.u16(security_mode.raw());
    w.u16(dialect_revision);
    w.u16(with_contexts ? (uint16_t)contexts.size() : 0);
    w.bytes(server_guid);
    w.u32(capabilities.raw());
    w.u32(max_transact_size);
    w.u32(max_read_size);
    w.u32(max_write_size);
    w.u64(system_time.get_ticks());
    w.u64(server_start_time.get_ticks());

    uint32_t fields = w.position();
    w.u16(0);
    w.u16((uint16_t)security_buffer.size());
    w.u32(0);

    if ( !security_buffer.empty() )
    {
        w.patch16(fields, (uint16_t)w.wire_offset());
        w.bytes(security_buffer);
    }
    else
        w.u8(0);

    if ( with_contexts )
    {
        w.align(8);
        w.patch32(fields + 4, w.wire_offset());
        encode_negotiate_contexts(w, contexts);
    }
}

bool NegotiateResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_NEGOTIATE_RESPONSE_STRUC_SIZE, "negotiate response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    NegotiateResponse rsp;
    rsp.security_mode = NegotiateSigning(r.u16());
    rsp.dialect_revision = r.u16();
    uint16_t ctx_count = r.u16();
    r.bytes(rsp.server_guid);
    rsp.capabilities = GlobalCapabilities(r.u32());
    rsp.max_transact_size = r.u32();
    rsp.max_read_size = r.u32();
    rsp.max_write_size = r.u32();
    rsp.system_time = FileTime(r.u64());
    rsp.server_start_time = FileTime(r.u64());
    uint16_t buf_offset = r.u16();
    uint16_t buf_len = r.u16();
    uint32_t ctx_offset = r.u32();

    const uint8_t* sec = nullptr;

    if ( !r.good() or !body_span(body, len, buf_offset, buf_len, sec) )
        return false;

    rsp.security_buffer.assign(sec, sec + buf_len);

    if ( rsp.dialect_revision == SMB2_DIALECT_311 and ctx_count )
    {
        if ( ctx_offset < SMB2_HEADER_LENGTH or ctx_offset - SMB2_HEADER_LENGTH > len )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "negotiate response: context offset %u", ctx_offset);
            return false;
        }
        uint32_t at = ctx_offset - SMB2_HEADER_LENGTH;
        decode_negotiate_contexts(body + at, len - at, ctx_count, rsp.contexts);
    }

    *this = std::move(rsp);
    return true;
}

//-------------------------------------------------------------------------
// session setup
//-------------------------------------------------------------------------

void SessionSetupRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_SETUP_REQUEST_STRUC_SIZE);
    w.u8(flags.raw());
    w.u8(security_mode.raw());
    w.u32(capabilities.raw());
    w.u32(0);   // channel

    uint16_t buf_offset = security_buffer.empty() ? 0 :
        (uint16_t)(w.wire_offset() + 12);

    w.u16(buf_offset);
    w.u16((uint16_t)security_buffer.size());
    w.u64(previous_session_id);

    w.bytes(security_buffer);
    pad_empty_buffer(w, (uint32_t)security_buffer.size());
}

bool SessionSetupRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_SETUP_REQUEST_STRUC_SIZE, "session setup request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    SessionSetupRequest req;
    req.flags = SessionSetupFlags(r.u8());
    req.security_mode = SessionSigning(r.u8());
    req.capabilities = GlobalCapabilities(r.u32());
    r.skip(4);
    uint16_t buf_offset = r.u16();
    uint16_t buf_len = r.u16();
    req.previous_session_id = r.u64();

    const uint8_t* sec = nullptr;

    if ( !r.good() or !body_span(body, len, buf_offset, buf_len, sec) )
        return false;

    req.security_buffer.assign(sec, sec + buf_len);

    *this = std::move(req);
    return true;
}

void SessionSetupResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_SETUP_RESPONSE_STRUC_SIZE);
    w.u16(session_flags.raw());

    uint16_t buf_offset = security_buffer.empty() ? 0 :
        (uint16_t)(w.wire_offset() + 4);

    w.u16(buf_offset);
    w.u16((uint16_t)security_buffer.size());

    w.bytes(security_buffer);
    pad_empty_buffer(w, (uint32_t)security_buffer.size());
}

bool SessionSetupResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_SETUP_RESPONSE_STRUC_SIZE, "session setup response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    SessionSetupResponse rsp;
    rsp.session_flags = SessionFlags(r.u16());
    uint16_t buf_offset = r.u16();
    uint16_t buf_len = r.u16();

    const uint8_t* sec = nullptr;

    if ( !r.good() or !body_span(body, len, buf_offset, buf_len, sec) )
        return false;

    rsp.security_buffer.assign(sec, sec + buf_len);

    *this = std::move(rsp);
    return true;
}

