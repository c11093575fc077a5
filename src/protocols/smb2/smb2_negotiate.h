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

#ifndef SMB2_NEGOTIATE_H
#define SMB2_NEGOTIATE_H

// negotiate, session setup, logoff and echo

#include <vector>

#include "protocols/smb2/smb2_message.h"
#include "time/filetime.h"

namespace smbwire
{
namespace smb2
{
struct NegotiateSigningTag;
using NegotiateSigning = Flags16<NegotiateSigningTag>;

constexpr NegotiateSigning SMB2_NEGOTIATE_SIGNING_ENABLED { 0x0001 };
constexpr NegotiateSigning SMB2_NEGOTIATE_SIGNING_REQUIRED { 0x0002 };

struct GlobalCapabilitiesTag;
using GlobalCapabilities = Flags32<GlobalCapabilitiesTag>;

constexpr GlobalCapabilities SMB2_GLOBAL_CAP_DFS { 0x00000001 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_LEASING { 0x00000002 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_LARGE_MTU { 0x00000004 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_MULTI_CHANNEL { 0x00000008 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_PERSISTENT_HANDLES { 0x00000010 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_DIRECTORY_LEASING { 0x00000020 };
constexpr GlobalCapabilities SMB2_GLOBAL_CAP_ENCRYPTION { 0x00000040 };

#define SMB2_PREAUTH_INTEGRITY_CAPABILITIES 0x0001
#define SMB2_ENCRYPTION_CAPABILITIES        0x0002

#define SMB2_PREAUTH_HASH_SHA512   0x0001
#define SMB2_ENCRYPTION_AES128_CCM 0x0001
#define SMB2_ENCRYPTION_AES128_GCM 0x0002

#define SMB2_NEGOTIATE_CONTEXT_HEADER_LENGTH 8

struct NegotiateContext
{
    uint16_t type = 0;
    Buffer data;
};

SO_PUBLIC NegotiateContext preauth_integrity_context(const Buffer& salt);
SO_PUBLIC NegotiateContext encryption_context(const std::vector<uint16_t>& ciphers);

// parsed data of a SMB2_PREAUTH_INTEGRITY_CAPABILITIES context
struct SO_PUBLIC PreauthIntegrity
{
    std::vector<uint16_t> hash_algorithms;
    Buffer salt;

    bool decode(const Buffer&);
};

// parsed data of a SMB2_ENCRYPTION_CAPABILITIES context
struct SO_PUBLIC EncryptionCapabilities
{
    std::vector<uint16_t> ciphers;

    bool decode(const Buffer&);
};

// each context starts at an 8 byte boundary of the envelope
SO_PUBLIC void encode_negotiate_contexts(WireWriter&, const std::vector<NegotiateContext>&);

// parse up to count contexts from buf, which must start at a boundary;
// returns the number parsed before the end or a truncated context
SO_PUBLIC unsigned decode_negotiate_contexts(const uint8_t* buf, uint32_t len, unsigned count,
    std::vector<NegotiateContext>&);

class SO_PUBLIC NegotiateRequest : public Request
{
public:
    uint16_t command() const override
    { return SMB2_COM_NEGOTIATE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    // 3.1.1 reuses the start time slot for the context offset and count
    bool has_contexts() const;

    NegotiateSigning security_mode = SMB2_NEGOTIATE_SIGNING_ENABLED;
    GlobalCapabilities capabilities;
    Guid client_guid { };
    FileTime client_start_time;
    std::vector<uint16_t> dialects { SMB2_DIALECT_202 };
    std::vector<NegotiateContext> contexts;
};

class SO_PUBLIC NegotiateResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_NEGOTIATE; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    NegotiateSigning security_mode;
    uint16_t dialect_revision = SMB2_DIALECT_202;
    Guid server_guid { };
    GlobalCapabilities capabilities;
    uint32_t max_transact_size = 0;
    uint32_t max_read_size = 0;
    uint32_t max_write_size = 0;
    FileTime system_time;
    FileTime server_start_time;
    Buffer security_buffer;
    std::vector<NegotiateContext> contexts;   // 3.1.1 only
};

//-------------------------------------------------------------------------
// session setup
//-------------------------------------------------------------------------

struct SessionSetupFlagsTag;
using SessionSetupFlags = Flags8<SessionSetupFlagsTag>;

constexpr SessionSetupFlags SMB2_SESSION_FLAG_BINDING { 0x01 };

struct SessionSigningTag;
using SessionSigning = Flags8<SessionSigningTag>;

constexpr SessionSigning SMB2_SESSION_SIGNING_ENABLED { 0x01 };
constexpr SessionSigning SMB2_SESSION_SIGNING_REQUIRED { 0x02 };

struct SessionFlagsTag;
using SessionFlags = Flags16<SessionFlagsTag>;

constexpr SessionFlags SMB2_SESSION_FLAG_IS_GUEST { 0x0001 };
constexpr SessionFlags SMB2_SESSION_FLAG_IS_NULL { 0x0002 };
constexpr SessionFlags SMB2_SESSION_FLAG_ENCRYPT_DATA { 0x0004 };

class SO_PUBLIC SessionSetupRequest : public Request
{
public:
    uint16_t command() const override
    { return SMB2_COM_SESSION_SETUP; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    SessionSetupFlags flags;
    SessionSigning security_mode = SMB2_SESSION_SIGNING_ENABLED;
    GlobalCapabilities capabilities;
    uint64_t previous_session_id = 0;
    Buffer security_buffer;   // authentication token
};

class SO_PUBLIC SessionSetupResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_SESSION_SETUP; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    bool is_guest() const
    { return session_flags.contains(SMB2_SESSION_FLAG_IS_GUEST); }

    bool is_null() const
    { return session_flags.contains(SMB2_SESSION_FLAG_IS_NULL); }

    bool encrypt_data() const
    { return session_flags.contains(SMB2_SESSION_FLAG_ENCRYPT_DATA); }

    SessionFlags session_flags;
    Buffer security_buffer;
};

using LogoffRequest = EmptyBody<SMB2_COM_LOGOFF, false>;
using LogoffResponse = EmptyBody<SMB2_COM_LOGOFF, true>;
using EchoRequest = EmptyBody<SMB2_COM_ECHO, false>;
using EchoResponse = EmptyBody<SMB2_COM_ECHO, true>;
}
}

#endif

