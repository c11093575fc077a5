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

#ifndef SMB2_FILE_IO_H
#define SMB2_FILE_IO_H

// read, write, lock and cancel

#include <vector>

#include "protocols/smb2/smb2_message.h"

#define SMB2_CHANNEL_DESCRIPTOR_LENGTH 16
#define SMB2_LOCK_ELEMENT_LENGTH 24

namespace smbwire
{
namespace smb2
{
enum Channel : uint32_t
{
    SMB2_CHANNEL_NONE = 0,
    SMB2_CHANNEL_RDMA_V1 = 1,
    SMB2_CHANNEL_RDMA_V1_INVALIDATE = 2,
    SMB2_CHANNEL_RDMA_TRANSFORM = 3
};

// SMB_DIRECT_BUFFER_DESCRIPTOR_V1, one per registered memory region
struct ChannelDescriptor
{
    uint64_t offset = 0;
    uint32_t token = 0;
    uint32_t length = 0;
};

// descriptors travel only when a channel is selected
class SO_PUBLIC ChannelInfo
{
public:
    bool in_use() const
    { return channel != SMB2_CHANNEL_NONE and !descriptors.empty(); }

    uint16_t length() const
    { return in_use() ? (uint16_t)(descriptors.size() * SMB2_CHANNEL_DESCRIPTOR_LENGTH) : 0; }

    void encode(WireWriter&) const;
    bool decode(const uint8_t* buf, uint32_t len);

    Channel channel = SMB2_CHANNEL_NONE;
    std::vector<ChannelDescriptor> descriptors;
};

#define SMB2_READFLAG_READ_UNBUFFERED    0x01
#define SMB2_READFLAG_REQUEST_COMPRESSED 0x02

class SO_PUBLIC ReadRequest : public Request
{
public:
    ReadRequest() = default;
    ReadRequest(const FileId& id, uint64_t off, uint32_t len) :
        length(len), offset(off), file_id(id) { }

    uint16_t command() const override
    { return SMB2_COM_READ; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t padding = 0x50;   // preferred response data offset
    uint8_t flags = 0;
    uint32_t length = 0;
    uint64_t offset = 0;
    FileId file_id;
    uint32_t minimum_count = 0;
    uint32_t remaining_bytes = 0;
    ChannelInfo channel_info;
};

class SO_PUBLIC ReadResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_READ; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint32_t data_remaining = 0;
    uint32_t flags = 0;
    Buffer data;
};

struct WriteFlagsTag;
using WriteFlags = Flags32<WriteFlagsTag>;

constexpr WriteFlags SMB2_WRITEFLAG_WRITE_THROUGH { 0x00000001 };
constexpr WriteFlags SMB2_WRITEFLAG_WRITE_UNBUFFERED { 0x00000002 };

// the channel block, if any, sits between the fixed part and the data;
// the data offset is worked out on encode
class SO_PUBLIC WriteRequest : public Request
{
public:
    WriteRequest() = default;
    WriteRequest(const FileId& id, uint64_t off, const Buffer& payload) :
        offset(off), file_id(id), data(payload) { }

    uint16_t command() const override
    { return SMB2_COM_WRITE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint64_t offset = 0;
    FileId file_id;
    uint32_t remaining_bytes = 0;
    WriteFlags flags;
    ChannelInfo channel_info;
    Buffer data;
};

class SO_PUBLIC WriteResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_WRITE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint32_t count = 0;
};

//-------------------------------------------------------------------------
// lock
//-------------------------------------------------------------------------

struct LockFlagsTag;
using LockFlags = Flags32<LockFlagsTag>;

constexpr LockFlags SMB2_LOCKFLAG_SHARED_LOCK { 0x00000001 };
constexpr LockFlags SMB2_LOCKFLAG_EXCLUSIVE_LOCK { 0x00000002 };
constexpr LockFlags SMB2_LOCKFLAG_UNLOCK { 0x00000004 };
constexpr LockFlags SMB2_LOCKFLAG_FAIL_IMMEDIATELY { 0x00000010 };

struct LockElement
{
    uint64_t offset = 0;
    uint64_t length = 0;
    LockFlags flags;
};

// 4-bit sequence number in the top nibble, 28-bit index below it
inline uint32_t pack_lock_sequence(uint8_t number, uint32_t index)
{ return ((uint32_t)(number & 0x0F) << 28) | (index & 0x0FFFFFFF); }

class SO_PUBLIC LockRequest : public Request
{
public:
    uint16_t command() const override
    { return SMB2_COM_LOCK; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t lock_sequence_number = 0;
    uint32_t lock_sequence_index = 0;
    FileId file_id;
    std::vector<LockElement> locks;
};

using LockResponse = EmptyBody<SMB2_COM_LOCK, true>;

// sent with the message id or async id of the operation to cancel
using CancelRequest = EmptyBody<SMB2_COM_CANCEL, false>;
}
}

#endif

