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

#ifndef SMB2_DEFS_H
#define SMB2_DEFS_H

// constants and small value types shared by every SMB2 message

#include <array>

#include "main/smbwire_types.h"
#include "time/filetime.h"
#include "utils/bit_flags.h"

#define SMB2_HEADER_LENGTH 64
#define SMB2_PROTOCOL_ID   0x424d53fe   /* \xfeSMB read little-endian */

#define SMB2_COM_NEGOTIATE        0x00
#define SMB2_COM_SESSION_SETUP    0x01
#define SMB2_COM_LOGOFF           0x02
#define SMB2_COM_TREE_CONNECT     0x03
#define SMB2_COM_TREE_DISCONNECT  0x04
#define SMB2_COM_CREATE           0x05
#define SMB2_COM_CLOSE            0x06
#define SMB2_COM_FLUSH            0x07
#define SMB2_COM_READ             0x08
#define SMB2_COM_WRITE            0x09
#define SMB2_COM_LOCK             0x0A
#define SMB2_COM_IOCTL            0x0B
#define SMB2_COM_CANCEL           0x0C
#define SMB2_COM_ECHO             0x0D
#define SMB2_COM_QUERY_DIRECTORY  0x0E
#define SMB2_COM_CHANGE_NOTIFY    0x0F
#define SMB2_COM_QUERY_INFO       0x10
#define SMB2_COM_SET_INFO         0x11
#define SMB2_COM_OPLOCK_BREAK     0x12
#define SMB2_COM_MAX              0x13
#define SMB2_COM_INVALID          0xFFFF

// StructureSize of each body; odd values count one byte of the variable
// buffer that follows the fixed part
#define SMB2_ERROR_RESPONSE_STRUC_SIZE 9

#define SMB2_NEGOTIATE_REQUEST_STRUC_SIZE 36
#define SMB2_NEGOTIATE_RESPONSE_STRUC_SIZE 65

#define SMB2_SETUP_REQUEST_STRUC_SIZE 25
#define SMB2_SETUP_RESPONSE_STRUC_SIZE 9

#define SMB2_LOGOFF_REQUEST_STRUC_SIZE 4
#define SMB2_LOGOFF_RESPONSE_STRUC_SIZE 4

#define SMB2_TREE_CONNECT_REQUEST_STRUC_SIZE 9
#define SMB2_TREE_CONNECT_RESPONSE_STRUC_SIZE 16
#define SMB2_TREE_DISCONNECT_REQUEST_STRUC_SIZE 4
#define SMB2_TREE_DISCONNECT_RESPONSE_STRUC_SIZE 4

#define SMB2_CREATE_REQUEST_STRUC_SIZE 57
#define SMB2_CREATE_RESPONSE_STRUC_SIZE 89

#define SMB2_CLOSE_REQUEST_STRUC_SIZE 24
#define SMB2_CLOSE_RESPONSE_STRUC_SIZE 60

#define SMB2_FLUSH_REQUEST_STRUC_SIZE 24
#define SMB2_FLUSH_RESPONSE_STRUC_SIZE 4

#define SMB2_READ_REQUEST_STRUC_SIZE 49
#define SMB2_READ_RESPONSE_STRUC_SIZE 17

#define SMB2_WRITE_REQUEST_STRUC_SIZE 49
#define SMB2_WRITE_RESPONSE_STRUC_SIZE 17

#define SMB2_LOCK_REQUEST_STRUC_SIZE 48
#define SMB2_LOCK_RESPONSE_STRUC_SIZE 4

#define SMB2_IOCTL_REQUEST_STRUC_SIZE 57
#define SMB2_IOCTL_RESPONSE_STRUC_SIZE 49

#define SMB2_CANCEL_REQUEST_STRUC_SIZE 4

#define SMB2_ECHO_REQUEST_STRUC_SIZE 4
#define SMB2_ECHO_RESPONSE_STRUC_SIZE 4

#define SMB2_QUERY_DIRECTORY_REQUEST_STRUC_SIZE 33
#define SMB2_QUERY_DIRECTORY_RESPONSE_STRUC_SIZE 9

#define SMB2_CHANGE_NOTIFY_REQUEST_STRUC_SIZE 32
#define SMB2_CHANGE_NOTIFY_RESPONSE_STRUC_SIZE 9

#define SMB2_QUERY_INFO_REQUEST_STRUC_SIZE 41
#define SMB2_QUERY_INFO_RESPONSE_STRUC_SIZE 9

#define SMB2_SET_INFO_REQUEST_STRUC_SIZE 33
#define SMB2_SET_INFO_RESPONSE_STRUC_SIZE 2

namespace smbwire
{
namespace smb2
{
using Guid = std::array<uint8_t, 16>;
using Signature = std::array<uint8_t, 16>;

// persistent and volatile halves as handed out by the server on create
struct FileId
{
    uint64_t persistent = 0;
    uint64_t volatile_id = 0;

    FileId() = default;
    FileId(uint64_t p, uint64_t v) : persistent(p), volatile_id(v) { }

    bool operator==(const FileId& rhs) const
    { return persistent == rhs.persistent and volatile_id == rhs.volatile_id; }

    bool operator!=(const FileId& rhs) const
    { return !(*this == rhs); }
};

#define SMB2_FILE_ID_LENGTH 16

// the four timestamps reported for a file, in wire order
struct FileTimes
{
    FileTime creation;
    FileTime last_access;
    FileTime last_write;
    FileTime change;
};

// dialect revisions
constexpr uint16_t SMB2_DIALECT_202 = 0x0202;
constexpr uint16_t SMB2_DIALECT_210 = 0x0210;
constexpr uint16_t SMB2_DIALECT_300 = 0x0300;
constexpr uint16_t SMB2_DIALECT_302 = 0x0302;
constexpr uint16_t SMB2_DIALECT_311 = 0x0311;
constexpr uint16_t SMB2_DIALECT_WILDCARD = 0x02FF;

struct FileAttributesTag;
using FileAttributes = Flags32<FileAttributesTag>;

constexpr FileAttributes FILE_ATTRIBUTE_READONLY { 0x00000001 };
constexpr FileAttributes FILE_ATTRIBUTE_HIDDEN { 0x00000002 };
constexpr FileAttributes FILE_ATTRIBUTE_SYSTEM { 0x00000004 };
constexpr FileAttributes FILE_ATTRIBUTE_DIRECTORY { 0x00000010 };
constexpr FileAttributes FILE_ATTRIBUTE_ARCHIVE { 0x00000020 };
constexpr FileAttributes FILE_ATTRIBUTE_NORMAL { 0x00000080 };
constexpr FileAttributes FILE_ATTRIBUTE_TEMPORARY { 0x00000100 };
constexpr FileAttributes FILE_ATTRIBUTE_SPARSE_FILE { 0x00000200 };
constexpr FileAttributes FILE_ATTRIBUTE_REPARSE_POINT { 0x00000400 };
constexpr FileAttributes FILE_ATTRIBUTE_COMPRESSED { 0x00000800 };
constexpr FileAttributes FILE_ATTRIBUTE_OFFLINE { 0x00001000 };
constexpr FileAttributes FILE_ATTRIBUTE_NOT_CONTENT_INDEXED { 0x00002000 };
constexpr FileAttributes FILE_ATTRIBUTE_ENCRYPTED { 0x00004000 };
constexpr FileAttributes FILE_ATTRIBUTE_INTEGRITY_STREAM { 0x00008000 };
constexpr FileAttributes FILE_ATTRIBUTE_NO_SCRUB_DATA { 0x00020000 };

struct AccessMaskTag;
using AccessMask = Flags32<AccessMaskTag>;

constexpr AccessMask FILE_READ_DATA { 0x00000001 };
constexpr AccessMask FILE_LIST_DIRECTORY { 0x00000001 };
constexpr AccessMask FILE_WRITE_DATA { 0x00000002 };
constexpr AccessMask FILE_ADD_FILE { 0x00000002 };
constexpr AccessMask FILE_APPEND_DATA { 0x00000004 };
constexpr AccessMask FILE_ADD_SUBDIRECTORY { 0x00000004 };
constexpr AccessMask FILE_READ_EA { 0x00000008 };
constexpr AccessMask FILE_WRITE_EA { 0x00000010 };
constexpr AccessMask FILE_EXECUTE { 0x00000020 };
constexpr AccessMask FILE_TRAVERSE { 0x00000020 };
constexpr AccessMask FILE_DELETE_CHILD { 0x00000040 };
constexpr AccessMask FILE_READ_ATTRIBUTES { 0x00000080 };
constexpr AccessMask FILE_WRITE_ATTRIBUTES { 0x00000100 };
constexpr AccessMask DELETE { 0x00010000 };
constexpr AccessMask READ_CONTROL { 0x00020000 };
constexpr AccessMask WRITE_DAC { 0x00040000 };
constexpr AccessMask WRITE_OWNER { 0x00080000 };
constexpr AccessMask SYNCHRONIZE { 0x00100000 };
constexpr AccessMask ACCESS_SYSTEM_SECURITY { 0x01000000 };
constexpr AccessMask MAXIMUM_ALLOWED { 0x02000000 };
constexpr AccessMask GENERIC_ALL { 0x10000000 };
constexpr AccessMask GENERIC_EXECUTE { 0x20000000 };
constexpr AccessMask GENERIC_WRITE { 0x40000000 };
constexpr AccessMask GENERIC_READ { 0x80000000 };

// "SMB2_COM_CREATE" or "unknown"
SO_PUBLIC const char* command_name(uint16_t command);
}
}

#endif

