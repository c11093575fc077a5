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

#ifndef SMB2_INFO_H
#define SMB2_INFO_H

// File, file system and directory information records (MS-FSCC).  Every
// record reads and writes itself field by field; decode_record() and
// encode_record() wrap that for a whole buffer.

#include <string>
#include <vector>

#include "protocols/smb2/smb2_message.h"

#define SMB2_0_INFO_FILE       0x01
#define SMB2_0_INFO_FILESYSTEM 0x02
#define SMB2_0_INFO_SECURITY   0x03
#define SMB2_0_INFO_QUOTA      0x04

namespace smbwire
{
namespace smb2
{
// file information classes, SMB2_0_INFO_FILE
enum FileInfoClass : uint8_t
{
    FILE_DIRECTORY_INFORMATION = 0x01,
    FILE_FULL_DIRECTORY_INFORMATION = 0x02,
    FILE_BOTH_DIRECTORY_INFORMATION = 0x03,
    FILE_BASIC_INFORMATION = 0x04,
    FILE_STANDARD_INFORMATION = 0x05,
    FILE_INTERNAL_INFORMATION = 0x06,
    FILE_EA_INFORMATION = 0x07,
    FILE_ACCESS_INFORMATION = 0x08,
    FILE_NAME_INFORMATION = 0x09,
    FILE_RENAME_INFORMATION = 0x0A,
    FILE_LINK_INFORMATION = 0x0B,
    FILE_NAMES_INFORMATION = 0x0C,
    FILE_DISPOSITION_INFORMATION = 0x0D,
    FILE_POSITION_INFORMATION = 0x0E,
    FILE_FULL_EA_INFORMATION = 0x0F,
    FILE_MODE_INFORMATION = 0x10,
    FILE_ALIGNMENT_INFORMATION = 0x11,
    FILE_ALL_INFORMATION = 0x12,
    FILE_ALLOCATION_INFORMATION = 0x13,
    FILE_END_OF_FILE_INFORMATION = 0x14,
    FILE_ALTERNATE_NAME_INFORMATION = 0x15,
    FILE_STREAM_INFORMATION = 0x16,
    FILE_PIPE_INFORMATION = 0x17,
    FILE_PIPE_LOCAL_INFORMATION = 0x18,
    FILE_PIPE_REMOTE_INFORMATION = 0x19,
    FILE_COMPRESSION_INFORMATION = 0x1C,
    FILE_OBJECT_ID_INFORMATION = 0x1D,
    FILE_QUOTA_INFORMATION = 0x20,
    FILE_REPARSE_POINT_INFORMATION = 0x21,
    FILE_NETWORK_OPEN_INFORMATION = 0x22,
    FILE_ATTRIBUTE_TAG_INFORMATION = 0x23,
    FILE_ID_BOTH_DIRECTORY_INFORMATION = 0x25,
    FILE_ID_FULL_DIRECTORY_INFORMATION = 0x26,
    FILE_VALID_DATA_LENGTH_INFORMATION = 0x27,
    FILE_SHORT_NAME_INFORMATION = 0x28,
    FILE_NORMALIZED_NAME_INFORMATION = 0x30,
    FILE_ID_INFORMATION = 0x3B,
    FILE_ID_EXTD_DIRECTORY_INFORMATION = 0x3C
};

// file system information classes, SMB2_0_INFO_FILESYSTEM
enum FsInfoClass : uint8_t
{
    FILE_FS_VOLUME_INFORMATION = 0x01,
    FILE_FS_LABEL_INFORMATION = 0x02,
    FILE_FS_SIZE_INFORMATION = 0x03,
    FILE_FS_DEVICE_INFORMATION = 0x04,
    FILE_FS_ATTRIBUTE_INFORMATION = 0x05,
    FILE_FS_CONTROL_INFORMATION = 0x06,
    FILE_FS_FULL_SIZE_INFORMATION = 0x07,
    FILE_FS_OBJECT_ID_INFORMATION = 0x08,
    FILE_FS_DRIVER_PATH_INFORMATION = 0x09,
    FILE_FS_VOLUME_FLAGS_INFORMATION = 0x0A,
    FILE_FS_SECTOR_SIZE_INFORMATION = 0x0B
};

// "FileBasicInformation" or "unknown"
SO_PUBLIC const char* file_info_class_name(uint8_t info_class);
SO_PUBLIC const char* fs_info_class_name(uint8_t info_class);

// classes that query directory accepts
SO_PUBLIC bool is_directory_info_class(uint8_t info_class);

template<typename Rec>
bool decode_record(const uint8_t* buf, uint32_t len, Rec& out)
{
    WireReader r(buf, len);
    Rec tmp;

    if ( !tmp.read(r) or !r.good() )
        return false;

    out = std::move(tmp);
    return true;
}

template<typename Rec>
Buffer encode_record(const Rec& rec)
{
    Buffer out;
    WireWriter w(out);
    rec.write(w);
    return out;
}

//-------------------------------------------------------------------------
// file information
//-------------------------------------------------------------------------

struct SO_PUBLIC FileAccessInfo
{
    AccessMask access_flags;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileAlignmentInfo
{
    uint32_t alignment_requirement = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileAttributeTagInfo
{
    FileAttributes file_attributes;
    uint32_t reparse_tag = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

// FileBasicInformation, also used to set times and attributes; a zero
// time leaves that time unchanged on set
struct SO_PUBLIC FileBasicInfo
{
    FileTimes times;
    FileAttributes file_attributes;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define COMPRESSION_FORMAT_NONE  0x0000
#define COMPRESSION_FORMAT_LZNT1 0x0002

struct SO_PUBLIC FileCompressionInfo
{
    int64_t compressed_file_size = 0;
    uint16_t compression_format = COMPRESSION_FORMAT_NONE;
    uint8_t compression_unit_shift = 0;
    uint8_t chunk_shift = 0;
    uint8_t cluster_shift = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileEaInfo
{
    uint32_t ea_size = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileInternalInfo
{
    uint64_t index_number = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileModeInfo
{
    uint32_t mode = 0;   // FILE_WRITE_THROUGH and friends from CreateOptions

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileNetworkOpenInfo
{
    FileTimes times;
    int64_t allocation_size = 0;
    int64_t end_of_file = 0;
    FileAttributes file_attributes;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define FILE_PIPE_BYTE_STREAM_MODE     0x00000000
#define FILE_PIPE_MESSAGE_MODE         0x00000001
#define FILE_PIPE_QUEUE_OPERATION      0x00000000
#define FILE_PIPE_COMPLETE_OPERATION   0x00000001

struct SO_PUBLIC FilePipeInfo
{
    uint32_t read_mode = FILE_PIPE_BYTE_STREAM_MODE;
    uint32_t completion_mode = FILE_PIPE_QUEUE_OPERATION;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define FILE_PIPE_INBOUND     0x00000000
#define FILE_PIPE_OUTBOUND    0x00000001
#define FILE_PIPE_FULL_DUPLEX 0x00000002

#define FILE_PIPE_DISCONNECTED_STATE 0x00000001
#define FILE_PIPE_LISTENING_STATE    0x00000002
#define FILE_PIPE_CONNECTED_STATE    0x00000003
#define FILE_PIPE_CLOSING_STATE      0x00000004

#define FILE_PIPE_CLIENT_END 0x00000000
#define FILE_PIPE_SERVER_END 0x00000001

struct SO_PUBLIC FilePipeLocalInfo
{
    uint32_t named_pipe_type = 0;
    uint32_t named_pipe_configuration = FILE_PIPE_INBOUND;
    uint32_t maximum_instances = 0;
    uint32_t current_instances = 0;
    uint32_t inbound_quota = 0;
    uint32_t read_data_available = 0;
    uint32_t outbound_quota = 0;
    uint32_t write_quota_available = 0;
    uint32_t named_pipe_state = 0;
    uint32_t named_pipe_end = FILE_PIPE_CLIENT_END;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FilePipeRemoteInfo
{
    FileTime collect_data_time;
    uint32_t maximum_collection_count = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FilePositionInfo
{
    int64_t current_byte_offset = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileStandardInfo
{
    int64_t allocation_size = 0;
    int64_t end_of_file = 0;
    uint32_t number_of_links = 0;
    bool delete_pending = false;
    bool directory = false;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileAllInfo
{
    FileBasicInfo basic;
    FileStandardInfo standard;
    FileInternalInfo internal;
    FileEaInfo ea;
    FileAccessInfo access;
    FilePositionInfo position;
    FileModeInfo mode;
    FileAlignmentInfo alignment;
    std::string name;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

// FileAlternateNameInformation and FileNameInformation
struct SO_PUBLIC FileNameInfo
{
    std::string name;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

// one entry of FileStreamInformation
struct SO_PUBLIC FileStreamInfo
{
    int64_t stream_size = 0;
    int64_t stream_allocation_size = 0;
    std::string name;   // "::$DATA" for the unnamed stream
};

SO_PUBLIC unsigned decode_stream_info(const uint8_t* buf, uint32_t len,
    std::vector<FileStreamInfo>&);
SO_PUBLIC Buffer encode_stream_info(const std::vector<FileStreamInfo>&);

//-------------------------------------------------------------------------
// file information that is only set
//-------------------------------------------------------------------------

struct SO_PUBLIC FileEndOfFileInfo
{
    int64_t end_of_file = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileAllocationInfo
{
    int64_t allocation_size = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FileDispositionInfo
{
    bool delete_pending = false;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

// SMB2 flavor with a 64-bit root directory that must be zero
struct SO_PUBLIC FileRenameInfo
{
    bool replace_if_exists = false;
    uint64_t root_directory = 0;
    std::string name;   // share relative target

    bool read(WireReader&);
    void write(WireWriter&) const;
};

//-------------------------------------------------------------------------
// file system information
//-------------------------------------------------------------------------

struct SO_PUBLIC FsVolumeInfo
{
    FileTime creation_time;
    uint32_t serial_number = 0;
    bool supports_objects = false;
    std::string label;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FsSizeInfo
{
    int64_t total_allocation_units = 0;
    int64_t available_allocation_units = 0;
    uint32_t sectors_per_allocation_unit = 0;
    uint32_t bytes_per_sector = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define FILE_DEVICE_CD_ROM 0x00000002
#define FILE_DEVICE_DISK   0x00000007

#define FILE_REMOVABLE_MEDIA    0x00000001
#define FILE_READ_ONLY_DEVICE   0x00000002
#define FILE_FLOPPY_DISKETTE    0x00000004
#define FILE_WRITE_ONCE_MEDIA   0x00000008
#define FILE_REMOTE_DEVICE      0x00000010
#define FILE_DEVICE_IS_MOUNTED  0x00000020
#define FILE_VIRTUAL_VOLUME     0x00000040
#define FILE_DEVICE_SECURE_OPEN 0x00000100

struct SO_PUBLIC FsDeviceInfo
{
    uint32_t device_type = 0;
    uint32_t characteristics = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct FsAttributesTag;
using FsAttributes = Flags32<FsAttributesTag>;

constexpr FsAttributes FILE_CASE_SENSITIVE_SEARCH { 0x00000001 };
constexpr FsAttributes FILE_CASE_PRESERVED_NAMES { 0x00000002 };
constexpr FsAttributes FILE_UNICODE_ON_DISK { 0x00000004 };
constexpr FsAttributes FILE_PERSISTENT_ACLS { 0x00000008 };
constexpr FsAttributes FILE_FILE_COMPRESSION { 0x00000010 };
constexpr FsAttributes FILE_VOLUME_QUOTAS { 0x00000020 };
constexpr FsAttributes FILE_SUPPORTS_SPARSE_FILES { 0x00000040 };
constexpr FsAttributes FILE_SUPPORTS_REPARSE_POINTS { 0x00000080 };
constexpr FsAttributes FILE_SUPPORTS_REMOTE_STORAGE { 0x00000100 };
constexpr FsAttributes FILE_VOLUME_IS_COMPRESSED { 0x00008000 };
constexpr FsAttributes FILE_SUPPORTS_OBJECT_IDS { 0x00010000 };
constexpr FsAttributes FILE_SUPPORTS_ENCRYPTION { 0x00020000 };
constexpr FsAttributes FILE_NAMED_STREAMS { 0x00040000 };
constexpr FsAttributes FILE_READ_ONLY_VOLUME { 0x00080000 };
constexpr FsAttributes FILE_SEQUENTIAL_WRITE_ONCE { 0x00100000 };
constexpr FsAttributes FILE_SUPPORTS_TRANSACTIONS { 0x00200000 };
constexpr FsAttributes FILE_SUPPORTS_HARD_LINKS { 0x00400000 };
constexpr FsAttributes FILE_SUPPORTS_EXTENDED_ATTRIBUTES { 0x00800000 };
constexpr FsAttributes FILE_SUPPORTS_OPEN_BY_FILE_ID { 0x01000000 };
constexpr FsAttributes FILE_SUPPORTS_USN_JOURNAL { 0x02000000 };
constexpr FsAttributes FILE_SUPPORT_INTEGRITY_STREAMS { 0x04000000 };
constexpr FsAttributes FILE_SUPPORTS_BLOCK_REFCOUNTING { 0x08000000 };
constexpr FsAttributes FILE_SUPPORTS_SPARSE_VDL { 0x10000000 };

struct SO_PUBLIC FsAttributeInfo
{
    FsAttributes attributes;
    int32_t maximum_component_name_length = 0;
    std::string file_system_name;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define FILE_VC_QUOTA_TRACK            0x00000001
#define FILE_VC_QUOTA_ENFORCE          0x00000002
#define FILE_VC_CONTENT_INDEX_DISABLED 0x00000008
#define FILE_VC_LOG_QUOTA_THRESHOLD    0x00000010
#define FILE_VC_LOG_QUOTA_LIMIT        0x00000020
#define FILE_VC_LOG_VOLUME_THRESHOLD   0x00000040
#define FILE_VC_LOG_VOLUME_LIMIT       0x00000080
#define FILE_VC_QUOTAS_INCOMPLETE      0x00000100
#define FILE_VC_QUOTAS_REBUILDING      0x00000200

struct SO_PUBLIC FsControlInfo
{
    int64_t free_space_start_filtering = 0;
    int64_t free_space_threshold = 0;
    int64_t free_space_stop_filtering = 0;
    uint64_t default_quota_threshold = 0;
    uint64_t default_quota_limit = 0;
    uint32_t file_system_control_flags = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FsFullSizeInfo
{
    int64_t total_allocation_units = 0;
    int64_t caller_available_allocation_units = 0;
    int64_t actual_available_allocation_units = 0;
    uint32_t sectors_per_allocation_unit = 0;
    uint32_t bytes_per_sector = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

struct SO_PUBLIC FsObjectIdInfo
{
    Guid object_id { };
    std::array<uint8_t, 48> extended_info { };

    bool read(WireReader&);
    void write(WireWriter&) const;
};

#define SSINFO_FLAGS_ALIGNED_DEVICE              0x00000001
#define SSINFO_FLAGS_PARTITION_ALIGNED_ON_DEVICE 0x00000002
#define SSINFO_FLAGS_NO_SEEK_PENALTY             0x00000004
#define SSINFO_FLAGS_TRIM_ENABLED                0x00000008

struct SO_PUBLIC FsSectorSizeInfo
{
    uint32_t logical_bytes_per_sector = 0;
    uint32_t physical_bytes_per_sector_for_atomicity = 0;
    uint32_t physical_bytes_per_sector_for_performance = 0;
    uint32_t effective_physical_bytes_per_sector_for_atomicity = 0;
    uint32_t flags = 0;
    uint32_t byte_offset_for_sector_alignment = 0;
    uint32_t byte_offset_for_partition_alignment = 0;

    bool read(WireReader&);
    void write(WireWriter&) const;
};

//-------------------------------------------------------------------------
// directory entries
//-------------------------------------------------------------------------

// union of the fields of the six directory classes; fields a class does
// not carry stay zero
struct SO_PUBLIC DirectoryEntry
{
    uint32_t file_index = 0;
    FileTimes times;
    int64_t end_of_file = 0;
    int64_t allocation_size = 0;
    FileAttributes file_attributes;
    uint32_t ea_size = 0;
    std::string short_name;
    uint64_t file_id = 0;
    std::string name;

    bool is_directory() const
    { return file_attributes.contains(FILE_ATTRIBUTE_DIRECTORY); }
};

// fixed part of each record for a directory class, 0 for other classes
SO_PUBLIC uint32_t directory_entry_length(uint8_t info_class);

// walk a query directory output buffer; returns the number of entries
// parsed, 0 for classes that are not directory classes
SO_PUBLIC unsigned decode_directory_entries(uint8_t info_class, const uint8_t* buf,
    uint32_t len, std::vector<DirectoryEntry>&);

// entries are 8 byte aligned; empty for classes that are not directory classes
SO_PUBLIC Buffer encode_directory_entries(uint8_t info_class,
    const std::vector<DirectoryEntry>&);
}
}

#endif

