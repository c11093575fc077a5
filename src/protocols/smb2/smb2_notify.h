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

#ifndef SMB2_NOTIFY_H
#define SMB2_NOTIFY_H

// change notify

#include <string>
#include <vector>

#include "protocols/smb2/smb2_message.h"

namespace smbwire
{
namespace smb2
{
struct ChangeNotifyFlagsTag;
using ChangeNotifyFlags = Flags16<ChangeNotifyFlagsTag>;

constexpr ChangeNotifyFlags SMB2_WATCH_TREE { 0x0001 };

struct CompletionFilterTag;
using CompletionFilter = Flags32<CompletionFilterTag>;

constexpr CompletionFilter FILE_NOTIFY_CHANGE_FILE_NAME { 0x00000001 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_DIR_NAME { 0x00000002 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_ATTRIBUTES { 0x00000004 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_SIZE { 0x00000008 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_LAST_WRITE { 0x00000010 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_LAST_ACCESS { 0x00000020 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_CREATION { 0x00000040 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_EA { 0x00000080 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_SECURITY { 0x00000100 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_STREAM_NAME { 0x00000200 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_STREAM_SIZE { 0x00000400 };
constexpr CompletionFilter FILE_NOTIFY_CHANGE_STREAM_WRITE { 0x00000800 };

constexpr CompletionFilter FILE_NOTIFY_CHANGE_ALL { 0x00000FFF };

// what a directory listing cache needs to hear about
constexpr CompletionFilter FILE_NOTIFY_CHANGE_LISTING { 0x00000003 };

enum FileNotifyAction : uint32_t
{
    FILE_ACTION_UNKNOWN = 0x00000000,
    FILE_ACTION_ADDED = 0x00000001,
    FILE_ACTION_REMOVED = 0x00000002,
    FILE_ACTION_MODIFIED = 0x00000003,
    FILE_ACTION_RENAMED_OLD_NAME = 0x00000004,
    FILE_ACTION_RENAMED_NEW_NAME = 0x00000005,
    FILE_ACTION_ADDED_STREAM = 0x00000006,
    FILE_ACTION_REMOVED_STREAM = 0x00000007,
    FILE_ACTION_MODIFIED_STREAM = 0x00000008,
    FILE_ACTION_REMOVED_BY_DELETE = 0x00000009,
    FILE_ACTION_ID_NOT_TUNNELLED = 0x0000000A,
    FILE_ACTION_TUNNELLED_ID_COLLISION = 0x0000000B
};

SO_PUBLIC const char* notify_action_name(FileNotifyAction);

// FILE_NOTIFY_INFORMATION
struct SO_PUBLIC FileNotification
{
    FileNotifyAction action = FILE_ACTION_UNKNOWN;
    std::string name;
};

class SO_PUBLIC ChangeNotifyRequest : public Request
{
public:
    ChangeNotifyRequest();
    ChangeNotifyRequest(const FileId&, CompletionFilter,
        ChangeNotifyFlags = ChangeNotifyFlags());

    uint16_t command() const override
    { return SMB2_COM_CHANGE_NOTIFY; }

    void encode(WireWriter&) const override;
    bool decode(const uint8_t* body, uint32_t len) override;

    ChangeNotifyFlags flags;
    uint32_t output_buffer_length;
    FileId file_id;
    CompletionFilter completion_filter;
};

class SO_PUBLIC ChangeNotifyResponse : public Response
{
public:
    uint16_t command() const override
    { return SMB2_COM_CHANGE_NOTIFY; }

    void encode(WireWriter&) const override;

    // an empty buffer is a valid answer; it means the server dropped
    // changes and the client must rescan
    bool decode(const uint8_t* body, uint32_t len) override;

    std::vector<FileNotification> notifications;
};
}
}

#endif

