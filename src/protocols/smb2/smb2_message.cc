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

#include "smb2_message.h"

#include "protocols/smb2/nt_status.h"
#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

bool smbwire::smb2::check_structure(const uint8_t* body, uint32_t len, uint16_t struc_size,
    const char* what)
{
    // an odd size counts the first byte of the variable buffer, which is
    // present even when the buffer is empty
    if ( len < struc_size or len < 2 )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "%s truncated, %u of %u bytes", what, len,
            (unsigned)struc_size);
        return false;
    }

    uint16_t size = load_le<uint16_t>(body);

    if ( size != struc_size )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "%s structure size %u, expected %u", what, size, struc_size);
        return false;
    }
    return true;
}

bool smbwire::smb2::body_span(const uint8_t* body, uint32_t len, uint32_t wire_offset,
    uint32_t length, const uint8_t*& out)
{
    if ( !length )
    {
        out = nullptr;
        return true;
    }

    if ( wire_offset < SMB2_HEADER_LENGTH or
        (uint64_t)(wire_offset - SMB2_HEADER_LENGTH) + length > len )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "buffer at %u+%u outside %u byte body",
            wire_offset, length, len);
        return false;
    }

    out = body + (wire_offset - SMB2_HEADER_LENGTH);
    return true;
}

//-------------------------------------------------------------------------
// error response
//-------------------------------------------------------------------------

void ErrorResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_ERROR_RESPONSE_STRUC_SIZE);
    w.u8(error_context_count);
    w.u8(0);
    w.u32((uint32_t)error_data.size());

    w.bytes(error_data);
    pad_empty_buffer(w, (uint32_t)error_data.size());
}

bool ErrorResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_ERROR_RESPONSE_STRUC_SIZE, "error response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    ErrorResponse e(for_command);
    e.error_context_count = r.u8();
    r.skip(1);
    uint32_t count = r.u32();
    r.bytes(e.error_data, count);

    if ( !r.good() )
        return false;

    *this = std::move(e);
    return true;
}

//-------------------------------------------------------------------------
// envelope
//-------------------------------------------------------------------------

Buffer smbwire::smb2::encode_body(const Body& b)
{
    Buffer out;
    WireWriter w(out, SMB2_HEADER_LENGTH);
    b.encode(w);
    return out;
}

Buffer smbwire::smb2::encode_message(const Header& hdr, const Body& b)
{
    Header h = hdr;
    h.command = b.command();

    if ( b.is_response() )
        h.flags.insert(SMB2_FLAGS_SERVER_TO_REDIR);
    else
        h.flags.remove(SMB2_FLAGS_SERVER_TO_REDIR);

    Buffer out;
    out.reserve(SMB2_HEADER_LENGTH + 64);
    h.encode(out);

    WireWriter w(out);
    b.encode(w);
    return out;
}

// a compound member ends at its next_command link
static uint32_t body_end(const Header& h, uint32_t len)
{
    if ( h.next_command >= SMB2_HEADER_LENGTH and h.next_command <= len )
        return h.next_command;

    return len;
}

bool smbwire::smb2::decode_message(const uint8_t* buf, uint32_t len, Header& hdr, Body& b)
{
    Header h;

    if ( !h.decode(buf, len) )
        return false;

    if ( h.command != b.command() )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "%s where %s expected",
            command_name(h.command), command_name(b.command()));
        return false;
    }

    uint32_t end = body_end(h, len);

    if ( !b.decode(buf + SMB2_HEADER_LENGTH, end - SMB2_HEADER_LENGTH) )
        return false;

    hdr = h;
    return true;
}

static bool is_error_reply(uint32_t status)
{
    if ( status == STATUS_PENDING )
        return true;

    if ( status == STATUS_MORE_PROCESSING_REQUIRED )
        return false;

    return decompose_status(status).severity == STATUS_SEVERITY_ERROR;
}

DecodeResult smbwire::smb2::decode_response(const uint8_t* buf, uint32_t len,
    Header& hdr, Response& rsp, ErrorResponse& err)
{
    Header h;

    if ( !h.decode(buf, len) )
        return DECODE_FAILED;

    if ( !is_error_reply(h.status) )
        return decode_message(buf, len, hdr, rsp) ? DECODE_BODY : DECODE_FAILED;

    uint32_t end = body_end(h, len);
    ErrorResponse e(h.command);

    if ( !e.decode(buf + SMB2_HEADER_LENGTH, end - SMB2_HEADER_LENGTH) )
        return DECODE_FAILED;

    hdr = h;
    err = std::move(e);
    return DECODE_ERROR_BODY;
}

unsigned smbwire::smb2::split_compound(const uint8_t* buf, uint32_t len,
    std::vector<MessageSpan>& spans)
{
    const unsigned cap = CodecConfig::get_conf()->max_chain_entries;
    uint32_t off = 0;
    unsigned n = 0;

    while ( n < cap )
    {
        Header h;

        if ( !h.decode(buf + off, len - off) )
            break;

        uint32_t next = h.next_command;

        if ( !next )
        {
            spans.push_back({ buf + off, len - off });
            ++n;
            break;
        }

        if ( next % 8 or next < SMB2_HEADER_LENGTH or (uint64_t)off + next > len )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "bad compound link %u at %u", next, off);
            break;
        }

        spans.push_back({ buf + off, next });
        ++n;
        off += next;
    }
    return n;
}

