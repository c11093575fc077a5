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

#ifndef SMB2_CREATE_H
#define SMB2_CREATE_H

// create, close and flush plus the create context chain

#include <string>
#include <vector>

#include "protocols/smb2/smb2_message.h"

// create context names, 4 ASCII bytes on the wire
#define SMB2_CREATE_EA_BUFFER                    "ExtA"
#define SMB2_CREATE_SD_BUFFER                    "SecD"
#define SMB2_CREATE_DURABLE_HANDLE_REQUEST       "DHnQ"
#define SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2    "DH2Q"
#define SMB2_CREATE_DURABLE_HANDLE_RECONNECT     "DHnC"
#define SMB2_CREATE_DURABLE_HANDLE_RECONNECT_V2  "DH2C"
#define SMB2_CREATE_ALLOCATION_SIZE              "AISi"
#define SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST "MxAc"
#define SMB2_CREATE_TIMEWARP_TOKEN               "TWrp"
#define SMB2_CREATE_QUERY_ON_DISK_ID             "QFid"
#define SMB2_CREATE_REQUEST_LEASE                "RqLs"

#define SMB2_CREATE_CONTEXT_HEADER_LENGTH 16
#define SMB2_LEASE_LENGTH 32

#define SMB2_OPLOCK_LEVEL_NONE      0x00
#define SMB2_OPLOCK_LEVEL_II        0x01
#define SMB2_OPLOCK_LEVEL_EXCLUSIVE 0x08
#define SMB2_OPLOCK_LEVEL_BATCH     0x09
#define SMB2_OPLOCK_LEVEL_LEASE     0xFF

namespace smbwire
{
namespace smb2
{
enum ImpersonationLevel : uint32_t
{
    SMB2_IMPERSONATION_ANONYMOUS = 0,
    SMB2_IMPERSONATION_IDENTIFICATION = 1,
    SMB2_IMPERSONATION_IMPERSONATION = 2,
    SMB2_IMPERSONATION_DELEGATE = 3
};

enum CreateDisposition : uint32_t
{
    FILE_SUPERSEDE = 0,     // replace if present, else create
    FILE_OPEN = 1,          // fail if absent
    FILE_CREATE = 2,        // fail if present
    FILE_OPEN_IF = 3,
    FILE_OVERWRITE = 4,     // fail if absent
    FILE_OVERWRITE_IF = 5
};

enum CreateAction : uint32_t
{
    FILE_SUPERSEDED = 0,
    FILE_OPENED = 1,
    FILE_CREATED = 2,
    FILE_OVERWRITTEN = 3
};

struct ShareAccessTag;
using ShareAccess = Flags32<ShareAccessTag>;

constexpr ShareAccess FILE_SHARE_READ { 0x00000001 };
constexpr ShareAccess FILE_SHARE_WRITE { 0x00000002 };
constexpr ShareAccess FILE_SHARE_DELETE { 0x00000004 };

struct CreateOptionsTag;
using CreateOptions = Flags32<CreateOptionsTag>;

constexpr CreateOptions FILE_DIRECTORY_FILE { 0x00000001 };
constexpr CreateOptions FILE_WRITE_THROUGH { 0x00000002 };
constexpr CreateOptions FILE_SEQUENTIAL_ONLY { 0x00000004 };
constexpr CreateOptions FILE_NO_INTERMEDIATE_BUFFERING { 0x00000008 };
constexpr CreateOptions FILE_SYNCHRONOUS_IO_ALERT { 0x00000010 };
constexpr CreateOptions FILE_SYNCHRONOUS_IO_NONALERT { 0x00000020 };
constexpr CreateOptions FILE_NON_DIRECTORY_FILE { 0x00000040 };
constexpr CreateOptions FILE_COMPLETE_IF_OPLOCKED { 0x00000100 };
constexpr CreateOptions FILE_NO_EA_KNOWLEDGE { 0x00000200 };
constexpr CreateOptions FILE_RANDOM_ACCESS { 0x00000800 };
constexpr CreateOptions FILE_DELETE_ON_CLOSE { 0x00001000 };
constexpr CreateOptions FILE_OPEN_BY_FILE_ID { 0x00002000 };
constexpr CreateOptions FILE_OPEN_FOR_BACKUP_INTENT { 0x00004000 };
constexpr CreateOptions FILE_NO_COMPRESSION { 0x00008000 };
constexpr CreateOptions FILE_OPEN_REPARSE_POINT { 0x00200000 };
constexpr CreateOptions FILE_OPEN_NO_RECALL { 0x00400000 };

struct CreateContext
{
    std::string name;
    Buffer data;

    bool is(const char* n) const
    { return name == n; }
};

// every context starts on an 8 byte boundary; the caller aligns the first
SO_PUBLIC void encode_create_contexts(WireWriter&, const std::vector<CreateContext>&);

// walk the next links of a context chain; returns the number parsed
SO_PUBLIC unsigned decode_create_contexts(const uint8_t* buf, uint32_t len,
    std::vector<CreateContext>&);

SO_PUBLIC CreateContext durable_handle_context();
SO_PUBLIC CreateContext durable_reconnect_context(const FileId&);
SO_PUBLIC CreateContext allocation_size_context(uint64_t size);
SO_PUBLIC CreateContext maximal_access_context(FileTime timestamp = FileTime());
SO_PUBLIC CreateContext timewarp_context(FileTime snapshot);
SO_PUBLIC CreateContext query_on_disk_id_context();

// response data of SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST
struct SO_PUBLIC MaximalAccess
{
    uint32_t query_status = 0;
    AccessMask access;

    bool decode(const Buffer&);
};

// response data of SMB2_CREATE_QUERY_ON_DISK_ID
struct SO_PUBLIC OnDiskId
{
    uint64_t disk_file_id = 0;
    uint64_t volume_id = 0;

    bool decode(const Buffer&);
};

struct LeaseStateTag;
using LeaseState = Flags32<LeaseStateTag>;

constexpr LeaseState SMB2_LEASE_READ_CACHING { 0x01 };
constexpr LeaseState SMB2_LEASE_HANDLE_CACHING { 0x02 };
constexpr LeaseState SMB2_LEASE_WRITE_CACHING { 0x04 };

// SMB2_CREATE_REQUEST_LEASE data in either direction
struct SO_PUBLIC Lease
{
    Guid key { };
    LeaseState state;
    uint32_t flags = 0;
    uint64_t duration = 0;

    CreateContext context() const;
    bool decode(const Buffer&);
};

class SO_PUBLIC CreateRequest : public Request
{
public:
    uint16_t command() const override
    { return SMB2_COM_CREATE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t requested_oplock_level = SMB2_OPLOCK_LEVEL_NONE;
    ImpersonationLevel impersonation_level = SMB2_IMPERSONATION_IMPERSONATION;
    AccessMask desired_access = GENERIC_ALL;
    FileAttributes file_attributes;
    ShareAccess share_access = FILE_SHARE_READ;
    CreateDisposition create_disposition = FILE_OPEN_IF;
    CreateOptions create_options;
    std::string name;    // share relative, no leading separator
    std::vector<CreateContext> contexts;
};

class SO_PUBLIC CreateResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_CREATE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    // nullptr when the server did not return the named context
    const CreateContext* find_context(const char* name) const;

    uint8_t oplock_level = SMB2_OPLOCK_LEVEL_NONE;
    uint8_t flags = 0;   // SMB2_CREATE_FLAG_REPARSEPOINT
    CreateAction create_action = FILE_OPENED;
    FileTimes times;
    uint64_t allocation_size = 0;
    uint64_t end_of_file = 0;
    FileAttributes file_attributes;
    FileId file_id;
    std::vector<CreateContext> contexts;
};

#define SMB2_CREATE_FLAG_REPARSEPOINT 0x01

//-------------------------------------------------------------------------
// close and flush
//-------------------------------------------------------------------------

#define SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB 0x0001

class SO_PUBLIC CloseRequest : public Request
{
public:
    CloseRequest() = default;
    explicit CloseRequest(const FileId& id, uint16_t f = 0) : flags(f), file_id(id) { }

    uint16_t command() const override
    { return SMB2_COM_CLOSE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint16_t flags = 0;
    FileId file_id;
};

// attributes are only valid with SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB set
class SO_PUBLIC CloseResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_CLOSE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint16_t flags = 0;
    FileTimes times;
    uint64_t allocation_size = 0;
    uint64_t end_of_file = 0;
    FileAttributes file_attributes;
};

class SO_PUBLIC FlushRequest : public Request
{
public:
    FlushRequest() = default;
    explicit FlushRequest(const FileId& id) : file_id(id) { }

    uint16_t command() const override
    { return SMB2_COM_FLUSH; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    FileId file_id;
};

using FlushResponse = EmptyBody<SMB2_COM_FLUSH, true>;
}
}

#endif

