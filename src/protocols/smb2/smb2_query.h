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

#ifndef SMB2_QUERY_H
#define SMB2_QUERY_H

// query directory, query info and set info

#include <string>
#include <vector>

#include "protocols/smb2/smb2_info.h"

namespace smbwire
{
namespace smb2
{
//-------------------------------------------------------------------------
// query directory
//-------------------------------------------------------------------------

struct QueryDirectoryFlagsTag;
using QueryDirectoryFlags = Flags8<QueryDirectoryFlagsTag>;

constexpr QueryDirectoryFlags SMB2_RESTART_SCANS { 0x01 };
constexpr QueryDirectoryFlags SMB2_RETURN_SINGLE_ENTRY { 0x02 };
constexpr QueryDirectoryFlags SMB2_INDEX_SPECIFIED { 0x04 };
constexpr QueryDirectoryFlags SMB2_REOPEN { 0x10 };

class SO_PUBLIC QueryDirectoryRequest : public Request
{
public:
    QueryDirectoryRequest();
    QueryDirectoryRequest(const FileId&, uint8_t info_class, const std::string& pattern = "*",
        QueryDirectoryFlags = QueryDirectoryFlags());

    uint16_t command() const override
    { return SMB2_COM_QUERY_DIRECTORY; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t info_class = FILE_DIRECTORY_INFORMATION;
    QueryDirectoryFlags flags;
    uint32_t file_index = 0;
    FileId file_id;
    std::string pattern;
    uint32_t output_buffer_length;
};

class SO_PUBLIC QueryDirectoryResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_QUERY_DIRECTORY; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    // interpret output as records of the class the request asked for
    unsigned entries(uint8_t info_class, std::vector<DirectoryEntry>& out) const
    { return decode_directory_entries(info_class, output.data(), (uint32_t)output.size(), out); }

    Buffer output;
};

//-------------------------------------------------------------------------
// query info
//-------------------------------------------------------------------------

struct SecurityInformationTag;
using SecurityInformation = Flags32<SecurityInformationTag>;

constexpr SecurityInformation OWNER_SECURITY_INFORMATION { 0x00000001 };
constexpr SecurityInformation GROUP_SECURITY_INFORMATION { 0x00000002 };
constexpr SecurityInformation DACL_SECURITY_INFORMATION { 0x00000004 };
constexpr SecurityInformation SACL_SECURITY_INFORMATION { 0x00000008 };
constexpr SecurityInformation LABEL_SECURITY_INFORMATION { 0x00000010 };
constexpr SecurityInformation ATTRIBUTE_SECURITY_INFORMATION { 0x00000020 };
constexpr SecurityInformation SCOPE_SECURITY_INFORMATION { 0x00000040 };
constexpr SecurityInformation BACKUP_SECURITY_INFORMATION { 0x00010000 };

struct QueryInfoFlagsTag;
using QueryInfoFlags = Flags32<QueryInfoFlagsTag>;

constexpr QueryInfoFlags SL_RESTART_SCAN { 0x00000001 };
constexpr QueryInfoFlags SL_RETURN_SINGLE_ENTRY { 0x00000002 };
constexpr QueryInfoFlags SL_INDEX_SPECIFIED { 0x00000004 };

// FILE_GET_EA_INFORMATION list, each entry 4 byte aligned
SO_PUBLIC Buffer encode_ea_name_list(const std::vector<std::string>& names);
SO_PUBLIC unsigned decode_ea_name_list(const uint8_t* buf, uint32_t len,
    std::vector<std::string>& names);

class SO_PUBLIC QueryInfoRequest : public Request
{
public:
    QueryInfoRequest();

    static QueryInfoRequest file_info(const FileId&, uint8_t info_class);
    static QueryInfoRequest fs_info(const FileId&, uint8_t info_class);
    static QueryInfoRequest security_info(const FileId&, SecurityInformation);

    // FileFullEaInformation restricted to the named attributes
    static QueryInfoRequest ea_info(const FileId&, const std::vector<std::string>& names,
        QueryInfoFlags = QueryInfoFlags());

    uint16_t command() const override
    { return SMB2_COM_QUERY_INFO; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t info_type = SMB2_0_INFO_FILE;
    uint8_t info_class = 0;
    uint32_t output_buffer_length;
    Buffer input;
    uint32_t additional_information = 0;
    QueryInfoFlags flags;
    FileId file_id;
};

class SO_PUBLIC QueryInfoResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_QUERY_INFO; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    // typed view of output, e.g. get(FileBasicInfo&); false when output
    // is shorter than the record
    template<typename Rec>
    bool get(Rec& rec) const
    { return decode_record(output.data(), (uint32_t)output.size(), rec); }

    unsigned streams(std::vector<FileStreamInfo>& out) const
    { return decode_stream_info(output.data(), (uint32_t)output.size(), out); }

    // security descriptors and full EA lists stay raw
    Buffer output;
};

//-------------------------------------------------------------------------
// set info
//-------------------------------------------------------------------------

class SO_PUBLIC SetInfoRequest : public Request
{
public:
    SetInfoRequest() = default;

    static SetInfoRequest basic(const FileId&, const FileBasicInfo&);
    static SetInfoRequest end_of_file(const FileId&, int64_t);
    static SetInfoRequest allocation(const FileId&, int64_t);
    static SetInfoRequest disposition(const FileId&, bool delete_pending);
    static SetInfoRequest position(const FileId&, int64_t);
    static SetInfoRequest rename(const FileId&, const std::string& target, bool replace);

    uint16_t command() const override
    { return SMB2_COM_SET_INFO; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    uint8_t info_type = SMB2_0_INFO_FILE;
    uint8_t info_class = 0;
    uint32_t additional_information = 0;
    FileId file_id;
    Buffer buffer;
};

class SO_PUBLIC SetInfoResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_SET_INFO; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;
};
}
}

#endif

