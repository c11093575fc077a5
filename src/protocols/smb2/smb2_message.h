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

#ifndef SMB2_MESSAGE_H
#define SMB2_MESSAGE_H

// Message bodies and the envelope around them.
//
// A body encodes after the envelope: the writer handed to encode() must
// report SMB2_HEADER_LENGTH as the wire offset of the first body byte so
// that offset fields come out relative to the envelope start.  decode()
// receives only the bytes that follow the envelope and rebases offsets by
// subtracting SMB2_HEADER_LENGTH.  A failed decode leaves the object as it
// was; nothing half parsed is ever visible.

#include <type_traits>
#include <vector>

#include "main/smbwire_config.h"
#include "protocols/smb2/smb2_header.h"
#include "utils/wire_codec.h"

#define SMB2_EMPTY_STRUC_SIZE 4

namespace smbwire
{
namespace smb2
{
class SO_PUBLIC Body
{
public:
    virtual ~Body() = default;

    virtual uint16_t command() const = 0;
    virtual bool is_response() const = 0;

    virtual void encode(WireWriter&) const = 0;
    virtual bool decode(const uint8_t* body, uint32_t len) = 0;
};

class SO_PUBLIC Request : public Body
{
public:
    bool is_response() const override
    { return false; }
};

class SO_PUBLIC Response : public Body
{
public:
    bool is_response() const override
    { return true; }
};

// returned by a server in place of the expected body
class SO_PUBLIC ErrorResponse : public Response
{
public:
    ErrorResponse() = default;
    explicit ErrorResponse(uint16_t cmd) : for_command(cmd) { }

    uint16_t command() const override
    { return for_command; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint16_t for_command = SMB2_COM_INVALID;
    uint8_t error_context_count = 0;
    Buffer error_data;
};

//-------------------------------------------------------------------------
// envelope
//-------------------------------------------------------------------------

// the body alone, with offsets computed for a following envelope
SO_PUBLIC Buffer encode_body(const Body&);

// envelope followed by body; the command and the response flag of the
// header are taken from the body
SO_PUBLIC Buffer encode_message(const Header&, const Body&);

// false if the envelope is invalid, carries a different command, or the
// body does not decode
SO_PUBLIC bool decode_message(const uint8_t* buf, uint32_t len, Header&, Body&);

enum DecodeResult
{
    DECODE_FAILED,
    DECODE_BODY,
    DECODE_ERROR_BODY
};

// like decode_message for a response, except that a failure status (other
// than STATUS_MORE_PROCESSING_REQUIRED) or an interim STATUS_PENDING reply
// is decoded into err instead of rsp
SO_PUBLIC DecodeResult decode_response(const uint8_t* buf, uint32_t len,
    Header&, Response& rsp, ErrorResponse& err);

struct MessageSpan
{
    const uint8_t* data;
    uint32_t length;
};

// split a compound buffer along the envelope next_command links; returns
// the number of messages found, stopping at the first malformed link
SO_PUBLIC unsigned split_compound(const uint8_t* buf, uint32_t len, std::vector<MessageSpan>&);

//-------------------------------------------------------------------------
// helpers for body codecs
//-------------------------------------------------------------------------

// true if the span holds the fixed part of a body and its StructureSize
// matches; odd sizes count one byte of variable buffer that may be absent
SO_PUBLIC bool check_structure(const uint8_t* body, uint32_t len, uint16_t struc_size,
    const char* what);

// locate length bytes found at envelope offset wire_offset; a zero length
// always succeeds with out set to nullptr
SO_PUBLIC bool body_span(const uint8_t* body, uint32_t len, uint32_t wire_offset,
    uint32_t length, const uint8_t*& out);

inline void put_file_id(WireWriter& w, const FileId& id)
{
    w.u64(id.persistent);
    w.u64(id.volatile_id);
}

inline FileId get_file_id(WireReader& r)
{
    FileId id;
    id.persistent = r.u64();
    id.volatile_id = r.u64();
    return id;
}

inline void put_file_times(WireWriter& w, const FileTimes& t)
{
    w.u64(t.creation.get_ticks());
    w.u64(t.last_access.get_ticks());
    w.u64(t.last_write.get_ticks());
    w.u64(t.change.get_ticks());
}

inline FileTimes get_file_times(WireReader& r)
{
    FileTimes t;
    t.creation = FileTime(r.u64());
    t.last_access = FileTime(r.u64());
    t.last_write = FileTime(r.u64());
    t.change = FileTime(r.u64());
    return t;
}

// MS-SMB2 wants at least one buffer byte after an odd sized fixed part
inline void pad_empty_buffer(WireWriter& w, uint32_t written)
{
    if ( !written )
        w.u8(0);
}

// Visit each record of a chain whose first 4 bytes give the distance from
// the record to the next one.  The walk ends at a zero link, at a link
// leaving the buffer, after max_chain_entries records, or when visit
// returns false for a record it can't parse.  Links only move forward.
// Returns the number of records visited successfully.
template<typename Visit>
unsigned walk_chain(const uint8_t* buf, uint32_t len, Visit visit)
{
    const unsigned cap = CodecConfig::get_conf()->max_chain_entries;
    uint32_t off = 0;
    unsigned n = 0;

    while ( n < cap )
    {
        if ( (uint64_t)off + 4 > len )
            break;

        uint32_t next = load_le<uint32_t>(buf + off);

        if ( !visit(buf + off, len - off) )
            break;

        ++n;

        if ( !next or (uint64_t)off + next >= len )
            break;

        off += next;
    }
    return n;
}

//-------------------------------------------------------------------------
// bodies holding nothing but the structure size and a reserved field
//-------------------------------------------------------------------------

template<uint16_t Command, bool IsResponse>
class SO_PUBLIC EmptyBody : public std::conditional<IsResponse, Response, Request>::type
{
public:
    uint16_t command() const override
    { return Command; }

    void encode(WireWriter& w) const override
    {
        w.u16(SMB2_EMPTY_STRUC_SIZE);
        w.u16(0);
    }

    bool decode(const uint8_t* body, uint32_t len) override
    { return check_structure(body, len, SMB2_EMPTY_STRUC_SIZE, command_name(Command)); }
};
}
}

#endif

