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

#include "catch/smbwire_catch.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstring>
#include <string>

#include "hash/hmac.h"
#include "hash/sha2.h"

using namespace smbwire;

static const EVP_MD* evp_for(HashType type)
{
    switch ( type )
    {
    case HashType::SHA256:
        return EVP_sha256();
    case HashType::SHA384:
        return EVP_sha384();
    case HashType::SHA512:
        return EVP_sha512();
    }
    return nullptr;
}

static Buffer openssl_digest(HashType type, const Buffer& msg)
{
    Buffer out(EVP_MAX_MD_SIZE);
    unsigned n = 0;

    REQUIRE( EVP_Digest(msg.data(), msg.size(), out.data(), &n, evp_for(type), nullptr) == 1 );
    out.resize(n);
    return out;
}

static Buffer openssl_hmac(HashType type, const Buffer& key, const Buffer& msg)
{
    Buffer out(EVP_MAX_MD_SIZE);
    unsigned n = 0;

    REQUIRE( HMAC(evp_for(type), key.data(), (int)key.size(), msg.data(), msg.size(),
        out.data(), &n) != nullptr );
    out.resize(n);
    return out;
}

static Buffer our_digest(HashType type, const Buffer& msg)
{
    Buffer out(hash_size(type));
    hash_digest(type, msg.data(), msg.size(), out.data());
    return out;
}

static Buffer our_hmac(HashType type, const Buffer& key, const Buffer& msg)
{
    Buffer out(hash_size(type));
    hmac(type, key.data(), key.size(), msg.data(), msg.size(), out.data());
    return out;
}

static Buffer pattern(size_t n)
{
    Buffer b(n);
    for ( size_t i = 0; i < n; ++i )
        b[i] = (uint8_t)(i * 31 + 7);
    return b;
}

TEST_CASE( "sha256 known answer", "[sha2]" )
{
    static const uint8_t abc_256[SHA256_HASH_SIZE] =
    {
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad
    };
    uint8_t digest[SHA256_HASH_SIZE];

    sha256((const uint8_t*)"abc", 3, digest);
    CHECK( memcmp(digest, abc_256, sizeof(digest)) == 0 );
}

TEST_CASE( "sha512 known answer", "[sha2]" )
{
    // first and last bytes of SHA-512("abc")
    uint8_t digest[SHA512_HASH_SIZE];

    sha512((const uint8_t*)"abc", 3, digest);
    CHECK( (digest[0] == 0xdd) );
    CHECK( (digest[1] == 0xaf) );
    CHECK( (digest[62] == 0xa4) );
    CHECK( (digest[63] == 0x9f) );
}

TEST_CASE( "sha2 digests match openssl", "[sha2]" )
{
    // lengths around the padding boundaries of both block sizes
    const size_t sizes[] = { 0, 1, 55, 56, 63, 64, 65, 111, 112, 127, 128, 129, 1000, 4097 };
    const HashType types[] = { HashType::SHA256, HashType::SHA384, HashType::SHA512 };

    for ( auto type : types )
    {
        for ( auto n : sizes )
        {
            Buffer msg = pattern(n);
            INFO( "size " << n << " hash " << hash_size(type) );
            CHECK( (our_digest(type, msg) == openssl_digest(type, msg)) );
        }
    }
}

TEST_CASE( "hmac matches openssl", "[hmac]" )
{
    const size_t key_sizes[] = { 0, 16, 64, 127, 128, 129, 200 };
    const HashType types[] = { HashType::SHA256, HashType::SHA384, HashType::SHA512 };
    Buffer msg = pattern(300);

    for ( auto type : types )
    {
        for ( auto k : key_sizes )
        {
            Buffer key = pattern(k + 3);
            key.resize(k);
            INFO( "key " << k << " hash " << hash_size(type) );
            CHECK( (our_hmac(type, key, msg) == openssl_hmac(type, key, msg)) );
        }
    }
}

TEST_CASE( "hmac rfc 4231 case 2", "[hmac]" )
{
    const std::string key = "Jefe";
    const std::string data = "what do ya want for nothing?";
    static const uint8_t expect[SHA256_HASH_SIZE] =
    {
        0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24, 0x26, 0x08, 0x95, 0x75, 0xc7,
        0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83, 0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43
    };
    uint8_t mac[SHA256_HASH_SIZE];

    hmac_sha256((const uint8_t*)key.data(), key.size(),
        (const uint8_t*)data.data(), data.size(), mac);

    CHECK( memcmp(mac, expect, sizeof(mac)) == 0 );
}

TEST_CASE( "hash sizes", "[sha2]" )
{
    CHECK( (hash_size(HashType::SHA256) == SHA256_HASH_SIZE) );
    CHECK( (hash_size(HashType::SHA384) == SHA384_HASH_SIZE) );
    CHECK( (hash_size(HashType::SHA512) == SHA512_HASH_SIZE) );
    CHECK( (hash_block_size(HashType::SHA256) == SHA256_BLOCK_SIZE) );
    CHECK( (hash_block_size(HashType::SHA512) == SHA512_BLOCK_SIZE) );
}

