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

#ifndef SMB2_HEADER_H
#define SMB2_HEADER_H

// The 64 byte envelope in front of every SMB2 message.  Bytes 32..39 hold
// either the process id (reserved) and tree id of a synchronous message or
// the 64-bit async id of an asynchronous one; SMB2_FLAGS_ASYNC_COMMAND
// selects the reading.

#include "protocols/smb2/smb2_defs.h"

namespace smbwire
{
namespace smb2
{
struct HeaderFlagsTag;
using HeaderFlags = Flags32<HeaderFlagsTag>;

constexpr HeaderFlags SMB2_FLAGS_SERVER_TO_REDIR { 0x00000001 };
constexpr HeaderFlags SMB2_FLAGS_ASYNC_COMMAND { 0x00000002 };
constexpr HeaderFlags SMB2_FLAGS_RELATED_OPERATIONS { 0x00000004 };
constexpr HeaderFlags SMB2_FLAGS_SIGNED { 0x00000008 };
constexpr HeaderFlags SMB2_FLAGS_PRIORITY_MASK { 0x00000070 };
constexpr HeaderFlags SMB2_FLAGS_DFS_OPERATIONS { 0x10000000 };
constexpr HeaderFlags SMB2_FLAGS_REPLAY_OPERATION { 0x20000000 };

enum StatusSeverity : uint8_t
{
    STATUS_SEVERITY_SUCCESS = 0,
    STATUS_SEVERITY_INFORMATIONAL = 1,
    STATUS_SEVERITY_WARNING = 2,
    STATUS_SEVERITY_ERROR = 3
};

struct StatusDetails
{
    StatusSeverity severity;
    bool customer;
    uint16_t facility;   // 12 bits
    uint16_t code;
};

SO_PUBLIC StatusDetails decompose_status(uint32_t status);

class SO_PUBLIC Header
{
public:
    Header() = default;

    static Header sync(uint16_t command, uint64_t message_id,
        uint32_t tree_id, uint64_t session_id);

    static Header async(uint16_t command, uint64_t message_id,
        uint64_t async_id, uint64_t session_id);

    // reads the first SMB2_HEADER_LENGTH bytes; fails on a short buffer,
    // a wrong protocol id or a structure size other than 64
    bool decode(const uint8_t* buf, uint32_t len);

    // appends exactly SMB2_HEADER_LENGTH bytes
    void encode(Buffer&) const;

    bool is_async() const
    { return flags.contains(SMB2_FLAGS_ASYNC_COMMAND); }

    bool is_response() const
    { return flags.contains(SMB2_FLAGS_SERVER_TO_REDIR); }

    bool is_related() const
    { return flags.contains(SMB2_FLAGS_RELATED_OPERATIONS); }

    bool is_signed() const
    { return flags.contains(SMB2_FLAGS_SIGNED); }

    // zero when the message is asynchronous
    uint32_t get_tree_id() const
    { return is_async() ? 0 : slot_hi; }

    // zero when the message is synchronous
    uint64_t get_async_id() const
    { return is_async() ? ((uint64_t)slot_hi << 32) | slot_lo : 0; }

    void set_tree_id(uint32_t);
    void set_async_id(uint64_t);

    uint8_t get_priority() const
    { return (uint8_t)((flags.raw() & SMB2_FLAGS_PRIORITY_MASK.raw()) >> 4); }

    // values above 7 are truncated to the 3-bit field
    void set_priority(uint8_t);

    StatusDetails status_details() const
    { return decompose_status(status); }

    uint16_t credit_charge = 0;
    uint32_t status = 0;
    uint16_t command = SMB2_COM_INVALID;
    uint16_t credit = 0;
    HeaderFlags flags;
    uint32_t next_command = 0;
    uint64_t message_id = 0;
    uint64_t session_id = 0;
    Signature signature { };

private:
    uint32_t slot_lo = 0;   // reserved, or async id bits 0..31
    uint32_t slot_hi = 0;   // tree id, or async id bits 32..63
};
}
}

#endif

