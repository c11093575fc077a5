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

#include "smb2_notify.h"

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

#define FILE_NOTIFY_INFORMATION_LENGTH 12

const char* smbwire::smb2::notify_action_name(FileNotifyAction action)
{
    switch ( action )
    {
    case FILE_ACTION_ADDED:
        return "added";
    case FILE_ACTION_REMOVED:
        return "removed";
    case FILE_ACTION_MODIFIED:
        return "modified";
    case FILE_ACTION_RENAMED_OLD_NAME:
        return "renamed from";
    case FILE_ACTION_RENAMED_NEW_NAME:
        return "renamed to";
    case FILE_ACTION_ADDED_STREAM:
        return "stream added";
    case FILE_ACTION_REMOVED_STREAM:
        return "stream removed";
    case FILE_ACTION_MODIFIED_STREAM:
        return "stream modified";
    case FILE_ACTION_REMOVED_BY_DELETE:
        return "object id removed";
    case FILE_ACTION_ID_NOT_TUNNELLED:
        return "object id not tunnelled";
    case FILE_ACTION_TUNNELLED_ID_COLLISION:
        return "object id collision";
    default:
        break;
    }
    return "unknown";
}

ChangeNotifyRequest::ChangeNotifyRequest() :
    output_buffer_length(CodecConfig::get_conf()->default_output_length)
{ }

ChangeNotifyRequest::ChangeNotifyRequest(const FileId& id, CompletionFilter filter,
    ChangeNotifyFlags f) :
    flags(f), output_buffer_length(CodecConfig::get_conf()->default_output_length),
    file_id(id), completion_filter(filter)
{ }

void ChangeNotifyRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_CHANGE_NOTIFY_REQUEST_STRUC_SIZE);
    w.u16(flags.raw());
    w.u32(output_buffer_length);
    put_file_id(w, file_id);
    w.u32(completion_filter.raw());
    w.u32(0);
}

bool ChangeNotifyRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CHANGE_NOTIFY_REQUEST_STRUC_SIZE,
        "change notify request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    ChangeNotifyRequest req;
    req.flags = ChangeNotifyFlags(r.u16());
    req.output_buffer_length = r.u32();
    req.file_id = get_file_id(r);
    req.completion_filter = CompletionFilter(r.u32());

    if ( !r.good() )
        return false;

    *this = req;
    return true;
}

void ChangeNotifyResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_CHANGE_NOTIFY_RESPONSE_STRUC_SIZE);

    uint32_t fields = w.position();
    w.u16(0);
    w.u32(0);

    if ( notifications.empty() )
    {
        pad_empty_buffer(w, 0);
        return;
    }

    w.patch16(fields, (uint16_t)w.wire_offset());
    uint32_t buf_start = w.position();

    for ( size_t i = 0; i < notifications.size(); ++i )
    {
        uint32_t start = w.position();

        w.u32(0);
        w.u32(notifications[i].action);
        w.u32(0);
        w.patch32(start + 8, w.utf16(notifications[i].name));

        if ( i + 1 < notifications.size() )
        {
            w.align(4);
            w.patch32(start, w.position() - start);
        }
    }
    w.patch32(fields + 2, w.position() - buf_start);
}

bool ChangeNotifyResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_CHANGE_NOTIFY_RESPONSE_STRUC_SIZE,
        "change notify response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    uint16_t offset = r.u16();
    uint32_t length = r.u32();
    const uint8_t* p = nullptr;

    if ( !r.good() or !body_span(body, len, offset, length, p) )
        return false;

    ChangeNotifyResponse rsp;

    if ( p )
    {
        walk_chain(p, length, [&rsp](const uint8_t* rec, uint32_t avail)
        {
            if ( avail < FILE_NOTIFY_INFORMATION_LENGTH )
                return false;

            WireReader fields(rec, FILE_NOTIFY_INFORMATION_LENGTH);
            fields.skip(4);
            uint32_t action = fields.u32();
            uint32_t name_len = fields.u32();

            if ( (uint64_t)FILE_NOTIFY_INFORMATION_LENGTH + name_len > avail )
            {
                SMB2_TRACE(TRACE_DEBUG_LEVEL, "notify name length %u exceeds %u byte record",
                    name_len, avail);
                return false;
            }

            FileNotification n;
            n.action = (FileNotifyAction)action;

            if ( !read_fixed_string(rec, avail, FILE_NOTIFY_INFORMATION_LENGTH, name_len, n.name) )
                return false;

            rsp.notifications.emplace_back(std::move(n));
            return true;
        });
    }

    *this = std::move(rsp);
    return true;
}

