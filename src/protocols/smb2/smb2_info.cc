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

#include "smb2_info.h"

#include "trace/trace.h"
#include "utils/util_utf.h"

using namespace smbwire;
using namespace smbwire::smb2;

//-------------------------------------------------------------------------
// class names
//-------------------------------------------------------------------------

struct ClassName
{
    uint8_t info_class;
    const char* name;
};

static const ClassName file_classes[] =
{
    { FILE_DIRECTORY_INFORMATION, "FileDirectoryInformation" },
    { FILE_FULL_DIRECTORY_INFORMATION, "FileFullDirectoryInformation" },
    { FILE_BOTH_DIRECTORY_INFORMATION, "FileBothDirectoryInformation" },
    { FILE_BASIC_INFORMATION, "FileBasicInformation" },
    { FILE_STANDARD_INFORMATION, "FileStandardInformation" },
    { FILE_INTERNAL_INFORMATION, "FileInternalInformation" },
    { FILE_EA_INFORMATION, "FileEaInformation" },
    { FILE_ACCESS_INFORMATION, "FileAccessInformation" },
    { FILE_NAME_INFORMATION, "FileNameInformation" },
    { FILE_RENAME_INFORMATION, "FileRenameInformation" },
    { FILE_LINK_INFORMATION, "FileLinkInformation" },
    { FILE_NAMES_INFORMATION, "FileNamesInformation" },
    { FILE_DISPOSITION_INFORMATION, "FileDispositionInformation" },
    { FILE_POSITION_INFORMATION, "FilePositionInformation" },
    { FILE_FULL_EA_INFORMATION, "FileFullEaInformation" },
    { FILE_MODE_INFORMATION, "FileModeInformation" },
    { FILE_ALIGNMENT_INFORMATION, "FileAlignmentInformation" },
    { FILE_ALL_INFORMATION, "FileAllInformation" },
    { FILE_ALLOCATION_INFORMATION, "FileAllocationInformation" },
    { FILE_END_OF_FILE_INFORMATION, "FileEndOfFileInformation" },
    { FILE_ALTERNATE_NAME_INFORMATION, "FileAlternateNameInformation" },
    { FILE_STREAM_INFORMATION, "FileStreamInformation" },
    { FILE_PIPE_INFORMATION, "FilePipeInformation" },
    { FILE_PIPE_LOCAL_INFORMATION, "FilePipeLocalInformation" },
    { FILE_PIPE_REMOTE_INFORMATION, "FilePipeRemoteInformation" },
    { FILE_COMPRESSION_INFORMATION, "FileCompressionInformation" },
    { FILE_OBJECT_ID_INFORMATION, "FileObjectIdInformation" },
    { FILE_QUOTA_INFORMATION, "FileQuotaInformation" },
    { FILE_REPARSE_POINT_INFORMATION, "FileReparsePointInformation" },
    { FILE_NETWORK_OPEN_INFORMATION, "FileNetworkOpenInformation" },
    { FILE_ATTRIBUTE_TAG_INFORMATION, "FileAttributeTagInformation" },
    { FILE_ID_BOTH_DIRECTORY_INFORMATION, "FileIdBothDirectoryInformation" },
    { FILE_ID_FULL_DIRECTORY_INFORMATION, "FileIdFullDirectoryInformation" },
    { FILE_VALID_DATA_LENGTH_INFORMATION, "FileValidDataLengthInformation" },
    { FILE_SHORT_NAME_INFORMATION, "FileShortNameInformation" },
    { FILE_NORMALIZED_NAME_INFORMATION, "FileNormalizedNameInformation" },
    { FILE_ID_INFORMATION, "FileIdInformation" },
    { FILE_ID_EXTD_DIRECTORY_INFORMATION, "FileIdExtdDirectoryInformation" },
    { 0, nullptr }
};

static const ClassName fs_classes[] =
{
    { FILE_FS_VOLUME_INFORMATION, "FileFsVolumeInformation" },
    { FILE_FS_LABEL_INFORMATION, "FileFsLabelInformation" },
    { FILE_FS_SIZE_INFORMATION, "FileFsSizeInformation" },
    { FILE_FS_DEVICE_INFORMATION, "FileFsDeviceInformation" },
    { FILE_FS_ATTRIBUTE_INFORMATION, "FileFsAttributeInformation" },
    { FILE_FS_CONTROL_INFORMATION, "FileFsControlInformation" },
    { FILE_FS_FULL_SIZE_INFORMATION, "FileFsFullSizeInformation" },
    { FILE_FS_OBJECT_ID_INFORMATION, "FileFsObjectIdInformation" },
    { FILE_FS_DRIVER_PATH_INFORMATION, "FileFsDriverPathInformation" },
    { FILE_FS_VOLUME_FLAGS_INFORMATION, "FileFsVolumeFlagsInformation" },
    { FILE_FS_SECTOR_SIZE_INFORMATION, "FileFsSectorSizeInformation" },
    { 0, nullptr }
};

static const char* find_class(const ClassName* table, uint8_t info_class)
{
    for ( const ClassName* p = table; p->name; ++p )
        if ( p->info_class == info_class )
            return p->name;

    return "unknown";
}

const char* smbwire::smb2::file_info_class_name(uint8_t info_class)
{ return find_class(file_classes, info_class); }

const char* smbwire::smb2::fs_info_class_name(uint8_t info_class)
{ return find_class(fs_classes, info_class); }

bool smbwire::smb2::is_directory_info_class(uint8_t info_class)
{ return directory_entry_length(info_class) != 0; }

//-------------------------------------------------------------------------
// file information
//-------------------------------------------------------------------------

// length prefixed UTF-16 name running to the end of the record
static std::string read_name(WireReader& r)
{
    uint32_t name_len = r.u32();

    if ( r.good() and name_len > r.remaining() )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "name length %u exceeds %u remaining bytes",
            name_len, r.remaining());
        r.skip(r.remaining() + 1);
        return std::string();
    }
    return r.utf16(name_len);
}

static void write_name(WireWriter& w, const std::string& name)
{
    uint32_t at = w.position();
    w.u32(0);
    w.patch32(at, w.utf16(name));
}

bool FileAccessInfo::read(WireReader& r)
{
    access_flags = AccessMask(r.u32());
    return r.good();
}

void FileAccessInfo::write(WireWriter& w) const
{ w.u32(access_flags.raw()); }

bool FileAlignmentInfo::read(WireReader& r)
{
    alignment_requirement = r.u32();
    return r.good();
}

void FileAlignmentInfo::write(WireWriter& w) const
{ w.u32(alignment_requirement); }

bool FileAttributeTagInfo::read(WireReader& r)
{
    file_attributes = FileAttributes(r.u32());
    reparse_tag = r.u32();
    return r.good();
}

void FileAttributeTagInfo::write(WireWriter& w) const
{
    w.u32(file_attributes.raw());
    w.u32(reparse_tag);
}

bool FileBasicInfo::read(WireReader& r)
{
    times = get_file_times(r);
    file_attributes = FileAttributes(r.u32());
    r.skip(4);
    return r.good();
}

void FileBasicInfo::write(WireWriter& w) const
{
    put_file_times(w, times);
    w.u32(file_attributes.raw());
    w.u32(0);
}

bool FileCompressionInfo::read(WireReader& r)
{
    compressed_file_size = (int64_t)r.u64();
    compression_format = r.u16();
    compression_unit_shift = r.u8();
    chunk_shift = r.u8();
    cluster_shift = r.u8();
    r.skip(3);
    return r.good();
}

void FileCompressionInfo::write(WireWriter& w) const
{
    w.u64((uint64_t)compressed_file_size);
    w.u16(compression_format);
    w.u8(compression_unit_shift);
    w.u8(chunk_shift);
    w.u8(cluster_shift);
    w.zero(3);
}

bool FileEaInfo::read(WireReader& r)
{
    ea_size = r.u32();
    return r.good();
}

void FileEaInfo::write(WireWriter& w) const
{ w.u32(ea_size); }

bool FileInternalInfo::read(WireReader& r)
{
    index_number = r.u64();
    return r.good();
}

void FileInternalInfo::write(WireWriter& w) const
{ w.u64(index_number); }

bool FileModeInfo::read(WireReader& r)
{
    mode = r.u32();
    return r.good();
}

void FileModeInfo::write(WireWriter& w) const
{ w.u32(mode); }

bool FileNetworkOpenInfo::read(WireReader& r)
{
    times = get_file_times(r);
    allocation_size = (int64_t)r.u64();
    end_of_file = (int64_t)r.u64();
    file_attributes = FileAttributes(r.u32());
    r.skip(4);
    return r.good();
}

void FileNetworkOpenInfo::write(WireWriter& w) const
{
    put_file_times(w, times);
    w.u64((uint64_t)allocation_size);
    w.u64((uint64_t)end_of_file);
    w.u32(file_attributes.raw());
    w.u32(0);
}

bool FilePipeInfo::read(WireReader& r)
{
    read_mode = r.u32();
    completion_mode = r.u32();
    return r.good();
}

void FilePipeInfo::write(WireWriter& w) const
{
    w.u32(read_mode);
    w.u32(completion_mode);
}

bool FilePipeLocalInfo::read(WireReader& r)
{
    named_pipe_type = r.u32();
    named_pipe_configuration = r.u32();
    maximum_instances = r.u32();
    current_instances = r.u32();
    inbound_quota = r.u32();
    read_data_available = r.u32();
    outbound_quota = r.u32();
    write_quota_available = r.u32();
    named_pipe_state = r.u32();
    named_pipe_end = r.u32();
    return r.good();
}

void FilePipeLocalInfo::write(WireWriter& w) const
{
    w.u32(named_pipe_type);
    w.u32(named_pipe_configuration);
    w.u32(maximum_instances);
    w.u32(current_instances);
    w.u32(inbound_quota);
    w.u32(read_data_available);
    w.u32(outbound_quota);
    w.u32(write_quota_available);
    w.u32(named_pipe_state);
    w.u32(named_pipe_end);
}

bool FilePipeRemoteInfo::read(WireReader& r)
{
    collect_data_time = FileTime(r.u64());
    maximum_collection_count = r.u32();
    return r.good();
}

void FilePipeRemoteInfo::write(WireWriter& w) const
{
    w.u64(collect_data_time.get_ticks());
    w.u32(maximum_collection_count);
}

bool FilePositionInfo::read(WireReader& r)
{
    current_byte_offset = (int64_t)r.u64();
    return r.good();
}

void FilePositionInfo::write(WireWriter& w) const
{ w.u64((uint64_t)current_byte_offset); }

bool FileStandardInfo::read(WireReader& r)
{
    allocation_size = (int64_t)r.u64();
    end_of_file = (int64_t)r.u64();
    number_of_links = r.u32();
    delete_pending = r.u8() != 0;
    directory = r.u8() != 0;
    r.skip(2);
    return r.good();
}

void FileStandardInfo::write(WireWriter& w) const
{
    w.u64((uint64_t)allocation_size);
    w.u64((uint64_t)end_of_file);
    w.u32(number_of_links);
    w.u8(delete_pending ? 1 : 0);
    w.u8(directory ? 1 : 0);
    w.u16(0);
}

bool FileAllInfo::read(WireReader& r)
{
    if ( !basic.read(r) or !standard.read(r) or !internal.read(r) or !ea.read(r) or
        !access.read(r) or !position.read(r) or !mode.read(r) or !alignment.read(r) )
        return false;

    name = read_name(r);
    return r.good();
}

void FileAllInfo::write(WireWriter& w) const
{
    basic.write(w);
    standard.write(w);
    internal.write(w);
    ea.write(w);
    access.write(w);
    position.write(w);
    mode.write(w);
    alignment.write(w);
    write_name(w, name);
}

bool FileNameInfo::read(WireReader& r)
{
    name = read_name(r);
    return r.good();
}

void FileNameInfo::write(WireWriter& w) const
{ write_name(w, name); }

#define STREAM_INFO_LENGTH 24

unsigned smbwire::smb2::decode_stream_info(const uint8_t* buf, uint32_t len,
    std::vector<FileStreamInfo>& streams)
{
    return walk_chain(buf, len, [&streams](const uint8_t* rec, uint32_t avail)
    {
        WireReader r(rec, avail);
        r.skip(4);
        uint32_t name_len = r.u32();

        if ( !r.good() or avail < STREAM_INFO_LENGTH or
            (uint64_t)STREAM_INFO_LENGTH + name_len > avail )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "stream entry truncated at %u bytes", avail);
            return false;
        }

        FileStreamInfo si;
        si.stream_size = (int64_t)r.u64();
        si.stream_allocation_size = (int64_t)r.u64();
        si.name = r.utf16(name_len);

        if ( !r.good() )
            return false;

        streams.emplace_back(std::move(si));
        return true;
    });
}

Buffer smbwire::smb2::encode_stream_info(const std::vector<FileStreamInfo>& streams)
{
    Buffer out;
    WireWriter w(out);

    for ( size_t i = 0; i < streams.size(); ++i )
    {
        uint32_t start = w.position();

        w.u32(0);
        w.u32(0);
        w.u64((uint64_t)streams[i].stream_size);
        w.u64((uint64_t)streams[i].stream_allocation_size);
        w.patch32(start + 4, w.utf16(streams[i].name));

        if ( i + 1 < streams.size() )
        {
            w.align(8);
            w.patch32(start, w.position() - start);
        }
    }
    return out;
}

//-------------------------------------------------------------------------
// set only file information
//-------------------------------------------------------------------------

bool FileEndOfFileInfo::read(WireReader& r)
{
    end_of_file = (int64_t)r.u64();
    return r.good();
}

void FileEndOfFileInfo::write(WireWriter& w) const
{ w.u64((uint64_t)end_of_file); }

bool FileAllocationInfo::read(WireReader& r)
{
    allocation_size = (int64_t)r.u64();
    return r.good();
}

void FileAllocationInfo::write(WireWriter& w) const
{ w.u64((uint64_t)allocation_size); }

bool FileDispositionInfo::read(WireReader& r)
{
    delete_pending = r.u8() != 0;
    return r.good();
}

void FileDispositionInfo::write(WireWriter& w) const
{ w.u8(delete_pending ? 1 : 0); }

bool FileRenameInfo::read(WireReader& r)
{
    replace_if_exists = r.u8() != 0;
    r.skip(7);
    root_directory = r.u64();
    name = read_name(r);
    return r.good();
}

void FileRenameInfo::write(WireWriter& w) const
{
    w.u8(replace_if_exists ? 1 : 0);
    w.zero(7);
    w.u64(root_directory);
    write_name(w, name);
}

//-------------------------------------------------------------------------
// file system information
//-------------------------------------------------------------------------

bool FsVolumeInfo::read(WireReader& r)
{
    creation_time = FileTime(r.u64());
    serial_number = r.u32();
    uint32_t label_len = r.u32();
    supports_objects = r.u8() != 0;
    r.skip(1);

    if ( r.good() and label_len > r.remaining() )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "volume label length %u exceeds record", label_len);
        return false;
    }
    label = r.utf16(label_len);
    return r.good();
}

void FsVolumeInfo::write(WireWriter& w) const
{
    w.u64(creation_time.get_ticks());
    w.u32(serial_number);
    uint32_t at = w.position();
    w.u32(0);
    w.u8(supports_objects ? 1 : 0);
    w.u8(0);
    w.patch32(at, w.utf16(label));
}

bool FsSizeInfo::read(WireReader& r)
{
    total_allocation_units = (int64_t)r.u64();
    available_allocation_units = (int64_t)r.u64();
    sectors_per_allocation_unit = r.u32();
    bytes_per_sector = r.u32();
    return r.good();
}

void FsSizeInfo::write(WireWriter& w) const
{
    w.u64((uint64_t)total_allocation_units);
    w.u64((uint64_t)available_allocation_units);
    w.u32(sectors_per_allocation_unit);
    w.u32(bytes_per_sector);
}

bool FsDeviceInfo::read(WireReader& r)
{
    device_type = r.u32();
    characteristics = r.u32();
    return r.good();
}

void FsDeviceInfo::write(WireWriter& w) const
{
    w.u32(device_type);
    w.u32(characteristics);
}

bool FsAttributeInfo::read(WireReader& r)
{
    attributes = FsAttributes(r.u32());
    maximum_component_name_length = (int32_t)r.u32();
    file_system_name = read_name(r);
    return r.good();
}

void FsAttributeInfo::write(WireWriter& w) const
{
    w.u32(attributes.raw());
    w.u32((uint32_t)maximum_component_name_length);
    write_name(w, file_system_name);
}

bool FsControlInfo::read(WireReader& r)
{
    free_space_start_filtering = (int64_t)r.u64();
    free_space_threshold = (int64_t)r.u64();
    free_space_stop_filtering = (int64_t)r.u64();
    default_quota_threshold = r.u64();
    default_quota_limit = r.u64();
    file_system_control_flags = r.u32();
    r.skip(4);
    return r.good();
}

void FsControlInfo::write(WireWriter& w) const
{
    w.u64((uint64_t)free_space_start_filtering);
    w.u64((uint64_t)free_space_threshold);
    w.u64((uint64_t)free_space_stop_filtering);
    w.u64(default_quota_threshold);
    w.u64(default_quota_limit);
    w.u32(file_system_control_flags);
    w.u32(0);
}

bool FsFullSizeInfo::read(WireReader& r)
{
    total_allocation_units = (int64_t)r.u64();
    caller_available_allocation_units = (int64_t)r.u64();
    actual_available_allocation_units = (int64_t)r.u64();
    sectors_per_allocation_unit = r.u32();
    bytes_per_sector = r.u32();
    return r.good();
}

void FsFullSizeInfo::write(WireWriter& w) const
{
    w.u64((uint64_t)total_allocation_units);
    w.u64((uint64_t)caller_available_allocation_units);
    w.u64((uint64_t)actual_available_allocation_units);
    w.u32(sectors_per_allocation_unit);
    w.u32(bytes_per_sector);
}

bool FsObjectIdInfo::read(WireReader& r)
{
    r.bytes(object_id);
    r.bytes(extended_info);
    return r.good();
}

void FsObjectIdInfo::write(WireWriter& w) const
{
    w.bytes(object_id);
    w.bytes(extended_info);
}

bool FsSectorSizeInfo::read(WireReader& r)
{
    logical_bytes_per_sector = r.u32();
    physical_bytes_per_sector_for_atomicity = r.u32();
    physical_bytes_per_sector_for_performance = r.u32();
    effective_physical_bytes_per_sector_for_atomicity = r.u32();
    flags = r.u32();
    byte_offset_for_sector_alignment = r.u32();
    byte_offset_for_partition_alignment = r.u32();
    return r.good();
}

void FsSectorSizeInfo::write(WireWriter& w) const
{
    w.u32(logical_bytes_per_sector);
    w.u32(physical_bytes_per_sector_for_atomicity);
    w.u32(physical_bytes_per_sector_for_performance);
    w.u32(effective_physical_bytes_per_sector_for_atomicity);
    w.u32(flags);
    w.u32(byte_offset_for_sector_alignment);
    w.u32(byte_offset_for_partition_alignment);
}

//-------------------------------------------------------------------------
// directory entries
//
// common prefix:  next(4) index(4)
// all but names:  times(32) eof(8) alloc(8) attributes(4)
// then:           name_len(4) [ea_size(4)] [short_len(1) pad(1) short(24)]
//                 [pad(2) or pad(4)] [file_id(8)] name
//-------------------------------------------------------------------------

#define SHORT_NAME_BYTES 24

uint32_t smbwire::smb2::directory_entry_length(uint8_t info_class)
{
    switch ( info_class )
    {
    case FILE_DIRECTORY_INFORMATION:
        return 64;
    case FILE_FULL_DIRECTORY_INFORMATION:
        return 68;
    case FILE_ID_FULL_DIRECTORY_INFORMATION:
        return 80;
    case FILE_BOTH_DIRECTORY_INFORMATION:
        return 94;
    case FILE_ID_BOTH_DIRECTORY_INFORMATION:
        return 104;
    case FILE_NAMES_INFORMATION:
        return 12;
    default:
        break;
    }
    return 0;
}

static bool has_ea_size(uint8_t info_class)
{
    return info_class != FILE_DIRECTORY_INFORMATION and info_class != FILE_NAMES_INFORMATION;
}

static bool has_short_name(uint8_t info_class)
{
    return info_class == FILE_BOTH_DIRECTORY_INFORMATION or
        info_class == FILE_ID_BOTH_DIRECTORY_INFORMATION;
}

static bool read_entry(uint8_t info_class, const uint8_t* rec, uint32_t avail,
    DirectoryEntry& e)
{
    const uint32_t fixed = directory_entry_length(info_class);

    if ( avail < fixed )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "%s entry truncated at %u bytes",
            file_info_class_name(info_class), avail);
        return false;
    }

    WireReader r(rec, avail);
    r.skip(4);
    e.file_index = r.u32();

    if ( info_class != FILE_NAMES_INFORMATION )
    {
        e.times = get_file_times(r);
        e.end_of_file = (int64_t)r.u64();
        e.allocation_size = (int64_t)r.u64();
        e.file_attributes = FileAttributes(r.u32());
    }

    uint32_t name_len = r.u32();

    if ( has_ea_size(info_class) )
        e.ea_size = r.u32();

    if ( has_short_name(info_class) )
    {
        uint8_t short_len = r.u8();
        r.skip(1);

        if ( short_len > SHORT_NAME_BYTES )
        {
            SMB2_TRACE(TRACE_DEBUG_LEVEL, "short name length %u", short_len);
            return false;
        }

        uint32_t at = r.offset();
        e.short_name = r.utf16(short_len);
        r.seek(at + SHORT_NAME_BYTES);
    }

    if ( info_class == FILE_ID_BOTH_DIRECTORY_INFORMATION )
        r.skip(2);
    else if ( info_class == FILE_ID_FULL_DIRECTORY_INFORMATION )
        r.skip(4);

    if ( info_class == FILE_ID_BOTH_DIRECTORY_INFORMATION or
        info_class == FILE_ID_FULL_DIRECTORY_INFORMATION )
        e.file_id = r.u64();

    if ( (uint64_t)fixed + name_len > avail )
    {
        SMB2_TRACE(TRACE_DEBUG_LEVEL, "entry name length %u exceeds %u byte record",
            name_len, avail);
        return false;
    }

    e.name = r.utf16(name_len);
    return r.good();
}

unsigned smbwire::smb2::decode_directory_entries(uint8_t info_class, const uint8_t* buf,
    uint32_t len, std::vector<DirectoryEntry>& entries)
{
    if ( !is_directory_info_class(info_class) )
        return 0;

    return walk_chain(buf, len, [info_class, &entries](const uint8_t* rec, uint32_t avail)
    {
        DirectoryEntry e;

        if ( !read_entry(info_class, rec, avail, e) )
            return false;

        entries.emplace_back(std::move(e));
        return true;
    });
}

static void write_entry(uint8_t info_class, WireWriter& w, const DirectoryEntry& e)
{
    w.u32(0);
    w.u32(e.file_index);

    if ( info_class != FILE_NAMES_INFORMATION )
    {
        put_file_times(w, e.times);
        w.u64((uint64_t)e.end_of_file);
        w.u64((uint64_t)e.allocation_size);
        w.u32(e.file_attributes.raw());
    }

    uint32_t name_len_at = w.position();
    w.u32(0);

    if ( has_ea_size(info_class) )
        w.u32(e.ea_size);

    if ( has_short_name(info_class) )
    {
        Buffer short_name;
        if ( !utf8_to_utf16le(e.short_name, short_name) )
            SMB2_TRACE(TRACE_WARNING_LEVEL, "malformed UTF-8 short name encoded with replacements");

        if ( short_name.size() > SHORT_NAME_BYTES )
            short_name.resize(SHORT_NAME_BYTES);

        w.u8((uint8_t)short_name.size());
        w.u8(0);
        w.bytes(short_name);
        w.zero(SHORT_NAME_BYTES - short_name.size());
    }

    if ( info_class == FILE_ID_BOTH_DIRECTORY_INFORMATION )
        w.u16(0);
    else if ( info_class == FILE_ID_FULL_DIRECTORY_INFORMATION )
        w.u32(0);

    if ( info_class == FILE_ID_BOTH_DIRECTORY_INFORMATION or
        info_class == FILE_ID_FULL_DIRECTORY_INFORMATION )
        w.u64(e.file_id);

    w.patch32(name_len_at, w.utf16(e.name));
}

Buffer smbwire::smb2::encode_directory_entries(uint8_t info_class,
    const std::vector<DirectoryEntry>& entries)
{
    Buffer out;

    if ( !is_directory_info_class(info_class) )
        return out;

    WireWriter w(out);

    for ( size_t i = 0; i < entries.size(); ++i )
    {
        uint32_t start = w.position();
        write_entry(info_class, w, entries[i]);

        if ( i + 1 < entries.size() )
        {
            w.align(8);
            w.patch32(start, w.position() - start);
        }
    }
    return out;
}

