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

#include "smb2_tree.h"

#include "trace/trace.h"

using namespace smbwire;
using namespace smbwire::smb2;

bool TreeConnectRequest::for_share(const std::string& host, const std::string& share,
    TreeConnectRequest& req)
{
    static const char* const separators = "/\\";

    if ( host.empty() or host.find_first_of(separators) != std::string::npos or
        share.find_first_of(separators) != std::string::npos )
        return false;

    req.path = "\\\\" + host + "\\" + share;
    return true;
}

std::string TreeConnectRequest::share() const
{
    size_t sep = path.find_last_of('\\');
    return sep == std::string::npos ? path : path.substr(sep + 1);
}

void TreeConnectRequest::encode(WireWriter& w) const
{
    w.u16(SMB2_TREE_CONNECT_REQUEST_STRUC_SIZE);
    w.u16(flags.raw());

    uint32_t fields = w.position();
    w.u16(0);
    w.u16(0);

    uint32_t at = w.wire_offset();
    uint32_t n = w.utf16(path);

    if ( n )
    {
        w.patch16(fields, (uint16_t)at);
        w.patch16(fields + 2, (uint16_t)n);
    }
    pad_empty_buffer(w, n);
}

bool TreeConnectRequest::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_TREE_CONNECT_REQUEST_STRUC_SIZE, "tree connect request") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    TreeConnectRequest req;
    req.flags = TreeConnectFlags(r.u16());
    uint16_t path_offset = r.u16();
    uint16_t path_len = r.u16();

    const uint8_t* p = nullptr;

    if ( !r.good() or !body_span(body, len, path_offset, path_len, p) )
        return false;

    if ( path_len and !read_fixed_string(p, path_len, 0, path_len, req.path) )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "tree connect request: bad path encoding");
        return false;
    }

    *this = std::move(req);
    return true;
}

void TreeConnectResponse::encode(WireWriter& w) const
{
    w.u16(SMB2_TREE_CONNECT_RESPONSE_STRUC_SIZE);
    w.u8(share_type);
    w.u8(0);
    w.u32(share_flags.raw());
    w.u32(capabilities.raw());
    w.u32(maximal_access.raw());
}

bool TreeConnectResponse::decode(const uint8_t* body, uint32_t len)
{
    if ( !check_structure(body, len, SMB2_TREE_CONNECT_RESPONSE_STRUC_SIZE, "tree connect response") )
        return false;

    WireReader r(body, len);
    r.skip(2);

    TreeConnectResponse rsp;
    uint8_t type = r.u8();
    rsp.share_type = type <= SMB2_SHARE_TYPE_PRINT ? (ShareType)type : SMB2_SHARE_TYPE_UNKNOWN;
    r.skip(1);
    rsp.share_flags = ShareFlags(r.u32());
    rsp.capabilities = ShareCapabilities(r.u32());
    rsp.maximal_access = AccessMask(r.u32());

    if ( !r.good() )
        return false;

    *this = rsp;
    return true;
}

