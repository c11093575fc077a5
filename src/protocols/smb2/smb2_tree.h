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

#ifndef SMB2_TREE_H
#define SMB2_TREE_H

// tree connect and disconnect

#include <string>

#include "protocols/smb2/smb2_message.h"

namespace smbwire
{
namespace smb2
{
struct TreeConnectFlagsTag;
using TreeConnectFlags = Flags16<TreeConnectFlagsTag>;

constexpr TreeConnectFlags SMB2_TREE_CONNECT_FLAG_CLUSTER_RECONNECT { 0x0001 };
constexpr TreeConnectFlags SMB2_TREE_CONNECT_FLAG_REDIRECT_TO_OWNER { 0x0002 };
constexpr TreeConnectFlags SMB2_TREE_CONNECT_FLAG_EXTENSION_PRESENT { 0x0004 };

enum ShareType : uint8_t
{
    SMB2_SHARE_TYPE_UNKNOWN = 0x00,
    SMB2_SHARE_TYPE_DISK = 0x01,
    SMB2_SHARE_TYPE_PIPE = 0x02,
    SMB2_SHARE_TYPE_PRINT = 0x03
};

struct ShareFlagsTag;
using ShareFlags = Flags32<ShareFlagsTag>;

constexpr ShareFlags SMB2_SHAREFLAG_DFS { 0x00000001 };
constexpr ShareFlags SMB2_SHAREFLAG_DFS_ROOT { 0x00000002 };
constexpr ShareFlags SMB2_SHAREFLAG_CACHING_MASK { 0x00000030 };
constexpr ShareFlags SMB2_SHAREFLAG_MANUAL_CACHING { 0x00000000 };
constexpr ShareFlags SMB2_SHAREFLAG_AUTO_CACHING { 0x00000010 };
constexpr ShareFlags SMB2_SHAREFLAG_VDO_CACHING { 0x00000020 };
constexpr ShareFlags SMB2_SHAREFLAG_NO_CACHING { 0x00000030 };
constexpr ShareFlags SMB2_SHAREFLAG_RESTRICT_EXCLUSIVE_OPENS { 0x00000100 };
constexpr ShareFlags SMB2_SHAREFLAG_FORCE_SHARED_DELETE { 0x00000200 };
constexpr ShareFlags SMB2_SHAREFLAG_ALLOW_NAMESPACE_CACHING { 0x00000400 };
constexpr ShareFlags SMB2_SHAREFLAG_ACCESS_BASED_DIRECTORY_ENUM { 0x00000800 };
constexpr ShareFlags SMB2_SHAREFLAG_FORCE_LEVELII_OPLOCK { 0x00001000 };
constexpr ShareFlags SMB2_SHAREFLAG_ENABLE_HASH_V1 { 0x00002000 };
constexpr ShareFlags SMB2_SHAREFLAG_ENABLE_HASH_V2 { 0x00004000 };
constexpr ShareFlags SMB2_SHAREFLAG_ENCRYPT_DATA { 0x00008000 };

struct ShareCapabilitiesTag;
using ShareCapabilities = Flags32<ShareCapabilitiesTag>;

constexpr ShareCapabilities SMB2_SHARE_CAP_DFS { 0x00000008 };
constexpr ShareCapabilities SMB2_SHARE_CAP_CONTINUOUS_AVAILABILITY { 0x00000010 };
constexpr ShareCapabilities SMB2_SHARE_CAP_SCALEOUT { 0x00000020 };
constexpr ShareCapabilities SMB2_SHARE_CAP_CLUSTER { 0x00000040 };
constexpr ShareCapabilities SMB2_SHARE_CAP_ASYMMETRIC { 0x00000080 };

class SO_PUBLIC TreeConnectRequest : public Request
{
public:
    TreeConnectRequest() = default;

    // path becomes \\host\share; false if either part holds a separator
    static bool for_share(const std::string& host, const std::string& share,
        TreeConnectRequest&);

    uint16_t command() const override
    { return SMB2_COM_TREE_CONNECT; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    // the last path component
    std::string share() const;

    TreeConnectFlags flags;
    std::string path;
};

class SO_PUBLIC TreeConnectResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_TREE_CONNECT; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    ShareFlags caching() const
    { return share_flags & SMB2_SHAREFLAG_CACHING_MASK; }

    ShareType share_type = SMB2_SHARE_TYPE_UNKNOWN;
    ShareFlags share_flags;
    ShareCapabilities capabilities;
    AccessMask maximal_access;
};

using TreeDisconnectRequest = EmptyBody<SMB2_COM_TREE_DISCONNECT, false>;
using TreeDisconnectResponse = EmptyBody<SMB2_COM_TREE_DISCONNECT, true>;
}
}

#endif

