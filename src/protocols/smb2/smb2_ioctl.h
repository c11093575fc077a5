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

#ifndef SMB2_IOCTL_H
#define SMB2_IOCTL_H

// IOCTL and FSCTL requests with the payloads this codec understands.  The
// response output is always kept raw; it is also parsed into a typed
// payload when the control code is one of the known ones.

#include <string>
#include <vector>

#include "protocols/smb2/smb2_message.h"

#define FSCTL_DFS_GET_REFERRALS            0x00060194
#define FSCTL_DFS_GET_REFERRALS_EX         0x000601B0
#define FSCTL_SET_REPARSE_POINT            0x000900A4
#define FSCTL_FILE_LEVEL_TRIM              0x00098208
#define FSCTL_PIPE_PEEK                    0x0011400C
#define FSCTL_PIPE_WAIT                    0x00110018
#define FSCTL_PIPE_TRANSCEIVE              0x0011C017
#define FSCTL_SRV_REQUEST_RESUME_KEY       0x00140078
#define FSCTL_SRV_ENUMERATE_SNAPSHOTS      0x00144064
#define FSCTL_SRV_COPYCHUNK                0x001440F2
#define FSCTL_SRV_READ_HASH                0x001441BB
#define FSCTL_SRV_COPYCHUNK_WRITE          0x001480F2
#define FSCTL_LMR_REQUEST_RESILIENCY       0x001401D4
#define FSCTL_QUERY_NETWORK_INTERFACE_INFO 0x001401FC
#define FSCTL_VALIDATE_NEGOTIATE_INFO      0x00140204

#define SMB2_0_IOCTL_IS_FSCTL 0x00000001

#define SMB2_RESUME_KEY_LENGTH 24
#define SMB2_COPYCHUNK_LENGTH 24
#define SMB2_NETWORK_INTERFACE_INFO_LENGTH 152
#define SMB2_SOCKADDR_STORAGE_LENGTH 128

// length of "@GMT-YYYY.MM.DD-HH.MM.SS"
#define SMB2_SNAPSHOT_TOKEN_LENGTH 24

namespace smbwire
{
namespace smb2
{
using ResumeKey = std::array<uint8_t, SMB2_RESUME_KEY_LENGTH>;

//-------------------------------------------------------------------------
// request payloads
//-------------------------------------------------------------------------

struct CopyChunk
{
    uint64_t source_offset = 0;
    uint64_t target_offset = 0;
    uint32_t length = 0;
};

// FSCTL_SRV_COPYCHUNK and FSCTL_SRV_COPYCHUNK_WRITE
struct SO_PUBLIC CopyChunkRequest
{
    ResumeKey source_key { };
    std::vector<CopyChunk> chunks;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

#define SRV_HASH_TYPE_PEER_DIST      0x00000001
#define SRV_HASH_VER_1               0x00000001
#define SRV_HASH_VER_2               0x00000002
#define SRV_HASH_RETRIEVE_HASH_BASED 0x00000001
#define SRV_HASH_RETRIEVE_FILE_BASED 0x00000002

// FSCTL_SRV_READ_HASH; the response stays raw
struct SO_PUBLIC ReadHashRequest
{
    uint32_t hash_type = SRV_HASH_TYPE_PEER_DIST;
    uint32_t hash_version = SRV_HASH_VER_1;
    uint32_t retrieval_type = SRV_HASH_RETRIEVE_FILE_BASED;
    uint32_t length = 0;
    uint64_t offset = 0;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

// FSCTL_LMR_REQUEST_RESILIENCY, timeout in milliseconds
struct SO_PUBLIC ResiliencyRequest
{
    uint32_t timeout = 0;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

// FSCTL_VALIDATE_NEGOTIATE_INFO as sent by the client
struct SO_PUBLIC ValidateNegotiateRequest
{
    uint32_t capabilities = 0;
    Guid client_guid { };
    uint16_t security_mode = 0;
    std::vector<uint16_t> dialects;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

//-------------------------------------------------------------------------
// response payloads
//-------------------------------------------------------------------------

struct SO_PUBLIC CopyChunkResult
{
    uint32_t chunks_written = 0;
    uint32_t chunk_bytes_written = 0;
    uint32_t total_bytes_written = 0;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

struct SO_PUBLIC SnapshotList
{
    uint32_t number_of_snapshots = 0;
    std::vector<std::string> tokens;
    std::vector<FileTime> times;   // tokens that parsed, in order

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

// "@GMT-2016.04.12-09.30.00" and back; false on any other shape
SO_PUBLIC bool parse_snapshot_token(const std::string&, FileTime&);
SO_PUBLIC std::string snapshot_token(FileTime);

struct SO_PUBLIC ResumeKeyResult
{
    ResumeKey key { };

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

#define SMB2_AF_INET  0x0002
#define SMB2_AF_INET6 0x0017

#define SMB2_INTERFACE_RSS_CAPABLE  0x00000001
#define SMB2_INTERFACE_RDMA_CAPABLE 0x00000002

struct SO_PUBLIC NetworkInterface
{
    uint32_t if_index = 0;
    uint32_t capability = 0;
    uint64_t link_speed = 0;   // bits per second
    uint16_t family = 0;
    uint16_t port = 0;
    Buffer address;            // 4 or 16 bytes in network order

    // dotted or colon form, "" for other families
    std::string address_string() const;
};

SO_PUBLIC Buffer encode_network_interfaces(const std::vector<NetworkInterface>&);

// chain walk, returns the number of records parsed
SO_PUBLIC unsigned decode_network_interfaces(const uint8_t* buf, uint32_t len,
    std::vector<NetworkInterface>&);

struct SO_PUBLIC ValidateNegotiateResult
{
    uint32_t capabilities = 0;
    Guid server_guid { };
    uint16_t security_mode = 0;
    uint16_t dialect = 0;

    Buffer encode() const;
    bool decode(const uint8_t* buf, uint32_t len);
};

enum IoctlPayloadKind
{
    IOCTL_PAYLOAD_NONE,
    IOCTL_PAYLOAD_COPYCHUNK,
    IOCTL_PAYLOAD_SNAPSHOTS,
    IOCTL_PAYLOAD_RESUME_KEY,
    IOCTL_PAYLOAD_NETWORK_INTERFACES,
    IOCTL_PAYLOAD_VALIDATE_NEGOTIATE
};

// the payload parser used for a control code's output
SO_PUBLIC IoctlPayloadKind ioctl_payload_kind(uint32_t ctl_code);

//-------------------------------------------------------------------------
// messages
//-------------------------------------------------------------------------

class SO_PUBLIC IoctlRequest : public Request
{
public:
    IoctlRequest();
    IoctlRequest(uint32_t code, const FileId& id, const Buffer& payload);

    uint16_t command() const override
    { return SMB2_COM_IOCTL; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint32_t ctl_code = 0;
    FileId file_id;
    uint32_t max_input_response = 0;
    uint32_t max_output_response;
    uint32_t flags = SMB2_0_IOCTL_IS_FSCTL;
    Buffer input;
    Buffer output;
};

class SO_PUBLIC IoctlResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_IOCTL; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint32_t ctl_code = 0;
    FileId file_id;
    uint32_t flags = 0;
    Buffer input;
    Buffer output;

    // set on decode from ctl_code; NONE also when the output didn't parse
    IoctlPayloadKind payload = IOCTL_PAYLOAD_NONE;
    CopyChunkResult copychunk;
    SnapshotList snapshots;
    ResumeKeyResult resume_key;
    std::vector<NetworkInterface> interfaces;
    ValidateNegotiateResult validate_negotiate;

private:
    bool parse_payload();
};
}
}

#endif

