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

#include "smb2_ioctl.h"

#include <arpa/inet.h>

#include <cstdio>

#include "trace/trace.h"
#include "utils/util_utf.h"

using namespace smbwire;
using namespace smbwire::smb2;

//-------------------------------------------------------------------------
// request payloads
//-------------------------------------------------------------------------

Buffer CopyChunkRequest::encode() const
{
    Buffer out;
    WireWriter w(out);

    w.bytes(source_key);
    w.u32((uint32_t)chunks.size());
    w.u32(0);

    for ( const auto& c : chunks )
    {
        w.u64(c.source_offset);
        w.u64(c.target_offset);
        w.u32(c.length);
        w.u32(0);
    }
    return out;
}

bool CopyChunkRequest::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    CopyChunkRequest req;

    r.bytes(req.source_key);
    uint32_t count = r.u32();
    r.skip(4);

    if ( !r.good() or r.remaining() / SMB2_COPYCHUNK_LENGTH < count )
        return false;

    for ( unsigned i = 0; i < count; ++i )
    {
        CopyChunk c;
        c.source_offset = r.u64();
        c.target_offset = r.u64();
        c.length = r.u32();
        r.skip(4);
        req.chunks.emplace_back(c);
    }

    *this = std::move(req);
    return true;
}

Buffer ReadHashRequest::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.u32(hash_type);
    w.u32(hash_version);
    w.u32(retrieval_type);
    w.u32(length);
    w.u64(offset);
    return out;
}

bool ReadHashRequest::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    ReadHashRequest req;
    req.hash_type = r.u32();
    req.hash_version = r.u32();
    req.retrieval_type = r.u32();
    req.length = r.u32();
    req.offset = r.u64();

    if ( !r.good() )
        return false;

    *this = req;
    return true;
}

Buffer ResiliencyRequest::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.u32(timeout);
    w.u32(0);
    return out;
}

bool ResiliencyRequest::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    uint32_t t = r.u32();
    r.skip(4);

    if ( !r.good() )
        return false;

    timeout = t;
    return true;
}

Buffer ValidateNegotiateRequest::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.u32(capabilities);
    w.bytes(client_guid);
    w.u16(security_mode);
    w.u16((uint16_t)dialects.size());

    for ( auto d : dialects )
        w.u16(d);

    return out;
}

bool ValidateNegotiateRequest::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    ValidateNegotiateRequest req;
    req.capabilities = r.u32();
    r.bytes(req.client_guid);
    req.security_mode = r.u16();
    uint16_t count = r.u16();

    for ( unsigned i = 0; i < count and r.good(); ++i )
        req.dialects.push_back(r.u16());

    if ( !r.good() )
        return false;

    *this = std::move(req);
    return true;
}

//-------------------------------------------------------------------------
// response payloads
//-------------------------------------------------------------------------

Buffer CopyChunkResult::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.u32(chunks_written);
    w.u32(chunk_bytes_written);
    w.u32(total_bytes_written);
    return out;
}

bool CopyChunkResult::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    CopyChunkResult res;
    res.chunks_written = r.u32();
    res.chunk_bytes_written = r.u32();
    res.total_bytes_written = r.u32();

    if ( !r.good() )
        return false;

    *this = res;
    return true;
}

bool smbwire::smb2::parse_snapshot_token(const std::string& s, FileTime& t)
{
    if ( s.size() != SMB2_SNAPSHOT_TOKEN_LENGTH )
        return false;

    unsigned year, month, day, hour, minute, second;
    int end = 0;

    if ( sscanf(s.c_str(), "@GMT-%4u.%2u.%2u-%2u.%2u.%2u%n",
        &year, &month, &day, &hour, &minute, &second, &end) != 6 or
        end != SMB2_SNAPSHOT_TOKEN_LENGTH )
        return false;

    if ( !month or month > 12 or !day or day > 31 or hour > 23 or minute > 59 or second > 60 )
        return false;

    CalendarTime c { year, month, day, hour, minute, second, 0 };
    t = FileTime::from_calendar(c);
    return true;
}

std::string smbwire::smb2::snapshot_token(FileTime t)
{
    CalendarTime c = t.to_calendar();
    char buf[64];

    snprintf(buf, sizeof(buf), "@GMT-%04lld.%02u.%02u-%02u.%02u.%02u",
        (long long)c.year, c.month, c.day, c.hour, c.minute, c.second);

    return buf;
}

Buffer SnapshotList::encode() const
{
    Buffer strings;
    WireWriter s(strings);

    for ( const auto& tok : tokens )
    {
        s.utf16(tok);
        s.u16(0);
    }
    s.u16(0);

    Buffer out;
    WireWriter w(out);
    w.u32(number_of_snapshots);
    w.u32((uint32_t)tokens.size());
    w.u32((uint32_t)strings.size());
    w.bytes(strings);
    return out;
}

bool SnapshotList::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    uint32_t total = r.u32();
    uint32_t returned = r.u32();
    uint32_t array_size = r.u32();

    if ( !r.good() )
        return false;

    if ( array_size > r.remaining() or array_size % 2 )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "snapshot array of %u bytes in %u", array_size, len);
        return false;
    }

    const unsigned cap = CodecConfig::get_conf()->max_chain_entries;
    const uint8_t* p = r.cursor();
    SnapshotList list;
    list.number_of_snapshots = total;

    uint32_t start = 0;

    for ( uint32_t at = 0; at + 2 <= array_size; at += 2 )
    {
        if ( p[at] or p[at + 1] )
            continue;

        if ( at > start )
        {
            if ( list.tokens.size() >= returned or list.tokens.size() >= cap )
                break;

            std::string tok;

            if ( utf16le_to_utf8(p + start, at - start, tok) )
            {
                FileTime t;

                if ( parse_snapshot_token(tok, t) )
                    list.times.emplace_back(t);

                list.tokens.emplace_back(std::move(tok));
            }
        }
        start = at + 2;
    }

    *this = std::move(list);
    return true;
}

Buffer ResumeKeyResult::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.bytes(key);
    w.u32(0);   // context length
    w.u32(0);
    return out;
}

bool ResumeKeyResult::decode(const uint8_t* buf, uint32_t len)
{
    if ( len < SMB2_RESUME_KEY_LENGTH + 4 )
        return false;

    std::copy(buf, buf + SMB2_RESUME_KEY_LENGTH, key.begin());
    return true;
}

std::string NetworkInterface::address_string() const
{
    char buf[INET6_ADDRSTRLEN];

    if ( family == SMB2_AF_INET and address.size() == 4 )
        return inet_ntop(AF_INET, address.data(), buf, sizeof(buf)) ? buf : "";

    if ( family == SMB2_AF_INET6 and address.size() == 16 )
        return inet_ntop(AF_INET6, address.data(), buf, sizeof(buf)) ? buf : "";

    return "";
}

Buffer smbwire::smb2::encode_network_interfaces(const std::vector<NetworkInterface>& v)
{
    Buffer out;
    WireWriter w(out);

    for ( size_t i = 0; i < v.size(); ++i )
    {
        const NetworkInterface& ni = v[i];
        uint32_t start = w.position();

        w.u32(i + 1 < v.size() ? SMB2_NETWORK_INTERFACE_INFO_LENGTH : 0);
        w.u32(ni.if_index);
        w.u32(ni.capability);
        w.u32(0);
        w.u64(ni.link_speed);

        // sockaddr_storage, port in network order
        w.u16(ni.family);
        w.u8((uint8_t)(ni.port >> 8));
        w.u8((uint8_t)ni.port);

        if ( ni.family == SMB2_AF_INET6 )
            w.u32(0);   // flow info

        w.bytes(ni.address);
        w.zero(start + SMB2_NETWORK_INTERFACE_INFO_LENGTH - w.position());
    }
    return out;
}

unsigned smbwire::smb2::decode_network_interfaces(const uint8_t* buf, uint32_t len,
    std::vector<NetworkInterface>& v)
{
    return walk_chain(buf, len, [&v](const uint8_t* rec, uint32_t avail)
    {
        if ( avail < SMB2_NETWORK_INTERFACE_INFO_LENGTH )
            return false;

        WireReader r(rec, SMB2_NETWORK_INTERFACE_INFO_LENGTH);
        r.skip(4);

        NetworkInterface ni;
        ni.if_index = r.u32();
        ni.capability = r.u32();
        r.skip(4);
        ni.link_speed = r.u64();

        // sockaddr_storage, port in network order
        ni.family = r.u16();
        ni.port = (uint16_t)(r.u8() << 8);
        ni.port |= r.u8();

        if ( ni.family == SMB2_AF_INET )
            r.bytes(ni.address, 4);

        else if ( ni.family == SMB2_AF_INET6 )
        {
            r.skip(4);  // flow info
            r.bytes(ni.address, 16);
        }

        v.emplace_back(std::move(ni));
        return true;
    });
}

Buffer ValidateNegotiateResult::encode() const
{
    Buffer out;
    WireWriter w(out);
    w.u32(capabilities);
    w.bytes(server_guid);
    w.u16(security_mode);
    w.u16(dialect);
    return out;
}

bool ValidateNegotiateResult::decode(const uint8_t* buf, uint32_t len)
{
    WireReader r(buf, len);
    ValidateNegotiateResult v;
    v.capabilities = r.u32();
    r.bytes(v.server_guid);
    v.security_mode = r.u16();
    v.dialect = r.u16();

    if ( !r.good() )
        return false;

    *this = v;
    return true;
}

IoctlPayloadKind smbwire::smb2::ioctl_payload_kind(uint32_t ctl_code)
{
    switch ( ctl_code )
    {
    case FSCTL_SRV_COPYCHUNK:
    case FSCTL_SRV_COPYCHUNK_WRITE:
        return IOCTL_PAYLOAD_COPYCHUNK;

    case FSCTL_SRV_ENUMERATE_SNAPSHOTS:
        return IOCTL_PAYLOAD_SNAPSHOTS;

    case FSCTL_SRV_REQUEST_RESUME_KEY:
        return IOCTL_PAYLOAD_RESUME_KEY;

    case FSCTL_QUERY_NETWORK_INTERFACE_INFO:
        return IOCTL_PAYLOAD_NETWORK_INTERFACES;

    case FSCTL_VALIDATE_NEGOTIATE_INFO:
        return IOCTL_PAYLOAD_VALIDATE_NEGOTIATE;

    default:
        break;
    }
    return IOCTL_PAYLOAD_NONE;
}

//-------------------------------------------------------------------------
// request
//-------------------------------------------------------------------------

IoctlRequest::IoctlRequest() :
    max_output_response(CodecConfig::get_conf()->max_ioctl_output)
{ }

IoctlRequest::IoctlRequest(uint32_t code, const FileId& id, const Buffer& payload) :
    ctl_code(code), file_id(id), max_output_response(CodecConfig::get_conf()->max_ioctl_output),
    input(payload)
{ }

// input then output aligned to 8, offsets stay zero when empty
static void encode_ioctl_buffers(WireWriter& w, uint32_t in_field, uint32_t out_field,
    const Buffer& in, const Buffer& out)
{
    if ( !in.empty() )
    {
        w.patch32(in_field, w.wire_offset());
        w.bytes(in);
    }

    if ( !out.empty() )
    {
        w.align(8);
        w.patch32(out_field, w.wire_offset());
        w.bytes(out);
    }

    pad_empty_buffer(w, (uint32_t)(in.size() + out.size()));
}

void IoctlRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_IOCTL_REQUEST_STRUC_SIZE);
    w.u16(0);
    w.u32(ctl_code);
    put_file_id(w, file_id);

    uint32_t fields = w.position();
    w.u32(0);
    w.u32((uint32_t)input.size());
    w.u32(max_input_response);

    w.u32(0);
    w.u32((uint32_t)output.size());
    w.u32(max_output_response);
    w.u32(flags);
    w.u32(0);

    encode_ioctl_buffers(w, fields, fields + 12, input, output);
}

bool IoctlRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_IOCTL_REQUEST_STRUC_SIZE, "ioctl request") )
        return false;

    WireReader r(body, len);
    r.skip(4);

    IoctlRequest req;
    req.ctl_code = r.u32();
    req.file_id = get_file_id(r);
    uint32_t in_offset = r.u32();
    uint32_t in_len = r.u32();
    req.max_input_response = r.u32();
    uint32_t out_offset = r.u32();
    uint32_t out_len = r.u32();
    req.max_output_response = r.u32();
    req.flags = r.u32();

    const uint8_t* in = nullptr;
    const uint8_t* out = nullptr;

    if ( !r.good() or !body_span(body, len, in_offset, in_len, in) or
        !body_span(body, len, out_offset, out_len, out) )
        return false;

    req.input.assign(in, in + in_len);
    req.output.assign(out, out + out_len);

    *this = std::move(req);
    return true;
}

//-------------------------------------------------------------------------
// response
//-------------------------------------------------------------------------

void IoctlResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_IOCTL_RESPONSE_STRUC_SIZE);
    w.u16(0);
    w.u32(ctl_code);
    put_file_id(w, file_id);

    uint32_t fields = w.position();
    w.u32(0);
    w.u32((uint32_t)input.size());
    w.u32(0);
    w.u32((uint32_t)output.size());
    w.u32(flags);
    w.u32(0);

    encode_ioctl_buffers(w, fields, fields + 8, input, output);
}

bool IoctlResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_IOCTL_RESPONSE_STRUC_SIZE, "ioctl response") )
        return false;

    WireReader r(body, len);
    r.skip(4);

    IoctlResponse rsp;
    rsp.ctl_code = r.u32();
    rsp.file_id = get_file_id(r);
    uint32_t in_offset = r.u32();
    uint32_t in_len = r.u32();
    uint32_t out_offset = r.u32();
    uint32_t out_len = r.u32();
    rsp.flags = r.u32();

    const uint8_t* in = nullptr;
    const uint8_t* out = nullptr;

    if ( !r.good() or !body_span(body, len, in_offset, in_len, in) or
        !body_span(body, len, out_offset, out_len, out) )
        return false;

    rsp.input.assign(in, in + in_len);
    rsp.output.assign(out, out + out_len);

    if ( !rsp.parse_payload() )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "ioctl 0x%08x: output not understood", rsp.ctl_code);
        rsp.payload = IOCTL_PAYLOAD_NONE;
    }

    *this = std::move(rsp);
    return true;
}

bool IoctlResponse::parse_payload()
{
    const uint8_t* p = output.data();
    uint32_t n = (uint32_t)output.size();

    payload = ioctl_payload_kind(ctl_code);

    switch ( payload )
    {
    case IOCTL_PAYLOAD_COPYCHUNK:
        return copychunk.decode(p, n);

    case IOCTL_PAYLOAD_SNAPSHOTS:
        return snapshots.decode(p, n);

    case IOCTL_PAYLOAD_RESUME_KEY:
        return resume_key.decode(p, n);

    case IOCTL_PAYLOAD_NETWORK_INTERFACES:
        decode_network_interfaces(p, n, interfaces);
        return true;

    case IOCTL_PAYLOAD_VALIDATE_NEGOTIATE:
        return validate_negotiate.decode(p, n);

    case IOCTL_PAYLOAD_NONE:
        break;
    }
    return true;
}

