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

#include "smb2_header.h"

#include "trace/trace.h"
#include "utils/wire_codec.h"

using namespace smbwire;
using namespace smbwire::smb2;

static const char* const smb2_command_string[SMB2_COM_MAX] = {
    "SMB2_COM_NEGOTIATE",
    "SMB2_COM_SESSION_SETUP",
    "SMB2_COM_LOGOFF",
    "SMB2_COM_TREE_CONNECT",
    "SMB2_COM_TREE_DISCONNECT",
    "SMB2_COM_CREATE",
    "SMB2_COM_CLOSE",
    "SMB2_COM_FLUSH",
    "SMB2_COM_READ",
    "SMB2_COM_WRITE",
    "SMB2_COM_LOCK",
    "SMB2_COM_IOCTL",
    "SMB2_COM_CANCEL",
    "SMB2_COM_ECHO",
    "SMB2_COM_QUERY_DIRECTORY",
    "SMB2_COM_CHANGE_NOTIFY",
    "SMB2_COM_QUERY_INFO",
    "SMB2_COM_SET_INFO",
    "SMB2_COM_OPLOCK_BREAK" };

const char* smbwire::smb2::command_name(uint16_t command)
{
    return command < SMB2_COM_MAX ? smb2_command_string[command] : "unknown";
}

StatusDetails smbwire::smb2::decompose_status(uint32_t status)
{
    StatusDetails d;
    d.severity = (StatusSeverity)(status >> 30);
    d.customer = (status & 0x20000000) != 0;
    d.facility = (uint16_t)((status & 0x0FFF0000) >> 16);
    d.code = (uint16_t)(status & 0xFFFF);
    return d;
}

Header Header::sync(uint16_t command, uint64_t message_id,
    uint32_t tree_id, uint64_t session_id)
{
    Header h;
    h.command = command;
    h.message_id = message_id;
    h.session_id = session_id;
    h.set_tree_id(tree_id);
    return h;
}

Header Header::async(uint16_t command, uint64_t message_id,
    uint64_t async_id, uint64_t session_id)
{
    Header h;
    h.command = command;
    h.message_id = message_id;
    h.session_id = session_id;
    h.set_async_id(async_id);
    return h;
}

void Header::set_tree_id(uint32_t tid)
{
    flags.remove(SMB2_FLAGS_ASYNC_COMMAND);
    slot_lo = 0;
    slot_hi = tid;
}

void Header::set_async_id(uint64_t aid)
{
    flags.insert(SMB2_FLAGS_ASYNC_COMMAND);
    slot_lo = (uint32_t)(aid & 0xffffffff);
    slot_hi = (uint32_t)(aid >> 32);
}

void Header::set_priority(uint8_t p)
{
    flags.remove(SMB2_FLAGS_PRIORITY_MASK);
    flags.insert(HeaderFlags(((uint32_t)p << 4) & SMB2_FLAGS_PRIORITY_MASK.raw()));
}

bool Header::decode(const uint8_t* buf, uint32_t len)
{
    if ( len < SMB2_HEADER_LENGTH )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "header truncated at %u bytes", len);
        return false;
    }

    WireReader r(buf, len);

    if ( r.u32() != SMB2_PROTOCOL_ID )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "bad protocol id");
        return false;
    }

    uint16_t size = r.u16();

    if ( size != SMB2_HEADER_LENGTH )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "header structure size %u", size);
        return false;
    }

    Header h;
    h.credit_charge = r.u16();
    h.status = r.u32();
    h.command = r.u16();
    h.credit = r.u16();
    h.flags = HeaderFlags(r.u32());
    h.next_command = r.u32();
    h.message_id = r.u64();
    h.slot_lo = r.u32();
    h.slot_hi = r.u32();
    h.session_id = r.u64();
    r.bytes(h.signature);

    if ( !r.good() )
        return false;

    if ( h.command >= SMB2_COM_MAX )
        h.command = SMB2_COM_INVALID;

    *this = h;
    return true;
}

void Header::encode(Buffer& out) const
{
    WireWriter w(out);
    w.u32(SMB2_PROTOCOL_ID);
    w.u16(SMB2_HEADER_LENGTH);
    w.u16(credit_charge);
    w.u32(status);
    w.u16(command);
    w.u16(credit);
    w.u32(flags.raw());
    w.u32(next_command);
    w.u64(message_id);
    w.u32(slot_lo);
    w.u32(slot_hi);
    w.u64(session_id);
    w.bytes(signature);
}

