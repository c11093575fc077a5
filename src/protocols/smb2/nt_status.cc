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

#include "nt_status.h"

#include <algorithm>

#include "log/messages.h"

using namespace smbwire;

namespace
{
const char* const DESC_FUNC = "Invalid function.";
const char* const DESC_NOFILE = "File not found.";
const char* const DESC_PATH = "A component in the path prefix is not a directory.";
const char* const DESC_ACCESS = "Access denied.";
const char* const DESC_FID = "Invalid file handle.";
const char* const DESC_MEM = "Insufficient server memory to perform the requested operation.";
const char* const DESC_PIPEBUSY = "All instances of the designated named pipe are busy.";
const char* const DESC_PIPECLOSE = "The designated named pipe is in the process of being closed.";
const char* const DESC_MORE = "More data is available than fits in the response.";
const char* const DESC_EA = "Either there are no extended attributes, or the available extended attributes did not fit into the response.";
const char* const DESC_LOGON = "The user name or password is incorrect, or the account can't log on now.";
const char* const DESC_SHARE = "The network name or share can't be used.";
const char* const DESC_SESSION = "The session is no longer valid.";
const char* const DESC_MEDIA = "The storage device can't complete the request.";
const char* const DESC_PRINT = "The print queue can't accept the request.";
const char* const DESC_SMB = "The server rejected a malformed or unsupported request.";
const char* const DESC_NET = "An unexpected network error occurred.";

struct StatusEntry
{
    uint32_t code;
    const char* name;
    const char* description;
};

// sorted by code
const StatusEntry status_table[] =
{
    { STATUS_SUCCESS, "STATUS_SUCCESS", "The operation completed successfully." },
    { STATUS_PENDING, "STATUS_PENDING", "The operation is still in progress." },
    { STATUS_NOTIFY_ENUM_DIR, "STATUS_NOTIFY_ENUM_DIR",
      "Too many changes occurred to report; enumerate the directory again." },
    { STATUS_INVALID_SMB, "STATUS_INVALID_SMB", DESC_SMB },
    { STATUS_SMB_BAD_TID, "STATUS_SMB_BAD_TID", DESC_SHARE },
    { STATUS_SMB_BAD_FID, "STATUS_SMB_BAD_FID", DESC_FID },
    { STATUS_OS2_INVALID_ACCESS, "STATUS_OS2_INVALID_ACCESS", "Invalid open mode." },
    { STATUS_SMB_BAD_COMMAND, "STATUS_SMB_BAD_COMMAND", DESC_SMB },
    { STATUS_SMB_BAD_UID, "STATUS_SMB_BAD_UID", DESC_SESSION },
    { STATUS_OS2_NO_MORE_SIDS, "STATUS_OS2_NO_MORE_SIDS",
      "Maximum number of searches has been exhausted." },
    { STATUS_OS2_INVALID_LEVEL, "STATUS_OS2_INVALID_LEVEL", "Invalid information level." },
    { STATUS_OS2_NEGATIVE_SEEK, "STATUS_OS2_NEGATIVE_SEEK",
      "An attempt was made to seek to a negative absolute offset within a file." },
    { STATUS_OS2_CANCEL_VIOLATION, "STATUS_OS2_CANCEL_VIOLATION",
      "No lock request was outstanding for the supplied cancel region." },
    { STATUS_OS2_ATOMIC_LOCKS_NOT_SUPPORTED, "STATUS_OS2_ATOMIC_LOCKS_NOT_SUPPORTED",
      "The file system does not support atomic changes to the lock type." },
    { STATUS_SMB_USE_MPX, "STATUS_SMB_USE_MPX", DESC_SMB },
    { STATUS_SMB_USE_STANDARD, "STATUS_SMB_USE_STANDARD", DESC_SMB },
    { STATUS_SMB_CONTINUE_MPX, "STATUS_SMB_CONTINUE_MPX", DESC_SMB },
    { STATUS_OS2_CANNOT_COPY, "STATUS_OS2_CANNOT_COPY", "The copy functions cannot be used." },
    { STATUS_OS2_EAS_DIDNT_FIT, "STATUS_OS2_EAS_DIDNT_FIT", DESC_EA },
    { STATUS_OS2_EA_ACCESS_DENIED, "STATUS_OS2_EA_ACCESS_DENIED",
      "Access to the extended attribute was denied." },
    { STATUS_BUFFER_OVERFLOW, "STATUS_BUFFER_OVERFLOW", DESC_MORE },
    { STATUS_NO_MORE_FILES, "STATUS_NO_MORE_FILES",
      "No (more) files found following a file search command." },
    { STATUS_DEVICE_PAPER_EMPTY, "STATUS_DEVICE_PAPER_EMPTY", DESC_PRINT },
    { STATUS_EA_LIST_INCONSISTENT, "STATUS_EA_LIST_INCONSISTENT",
      "The extended attribute list is inconsistent." },
    { STATUS_NO_MORE_ENTRIES, "STATUS_NO_MORE_ENTRIES",
      "No more entries are available from an enumeration operation." },
    { STATUS_STOPPED_ON_SYMLINK, "STATUS_STOPPED_ON_SYMLINK",
      "The create operation stopped after reaching a symbolic link." },
    { STATUS_UNSUCCESSFUL, "STATUS_UNSUCCESSFUL", "General error." },
    { STATUS_NOT_IMPLEMENTED, "STATUS_NOT_IMPLEMENTED", DESC_FUNC },
    { STATUS_INVALID_INFO_CLASS, "STATUS_INVALID_INFO_CLASS", "Invalid information class." },
    { STATUS_INVALID_HANDLE, "STATUS_INVALID_HANDLE", DESC_FID },
    { STATUS_INVALID_PARAMETER, "STATUS_INVALID_PARAMETER",
      "A parameter supplied with the message is invalid." },
    { STATUS_NO_SUCH_DEVICE, "STATUS_NO_SUCH_DEVICE", DESC_NOFILE },
    { STATUS_NO_SUCH_FILE, "STATUS_NO_SUCH_FILE", DESC_NOFILE },
    { STATUS_INVALID_DEVICE_REQUEST, "STATUS_INVALID_DEVICE_REQUEST", DESC_FUNC },
    { STATUS_END_OF_FILE, "STATUS_END_OF_FILE", "Attempted to read beyond the end of the file." },
    { STATUS_WRONG_VOLUME, "STATUS_WRONG_VOLUME", DESC_MEDIA },
    { STATUS_NO_MEDIA_IN_DEVICE, "STATUS_NO_MEDIA_IN_DEVICE", DESC_MEDIA },
    { STATUS_NONEXISTENT_SECTOR, "STATUS_NONEXISTENT_SECTOR", DESC_MEDIA },
    { STATUS_MORE_PROCESSING_REQUIRED, "STATUS_MORE_PROCESSING_REQUIRED",
      "The authentication exchange needs another round trip." },
    { STATUS_INVALID_LOCK_SEQUENCE, "STATUS_INVALID_LOCK_SEQUENCE", DESC_ACCESS },
    { STATUS_INVALID_VIEW_SIZE, "STATUS_INVALID_VIEW_SIZE", DESC_ACCESS },
    { STATUS_ALREADY_COMMITTED, "STATUS_ALREADY_COMMITTED", DESC_ACCESS },
    { STATUS_ACCESS_DENIED, "STATUS_ACCESS_DENIED", DESC_ACCESS },
    { STATUS_BUFFER_TOO_SMALL, "STATUS_BUFFER_TOO_SMALL",
      "The buffer is too small to contain the entry." },
    { STATUS_OBJECT_TYPE_MISMATCH, "STATUS_OBJECT_TYPE_MISMATCH", DESC_FID },
    { STATUS_DISK_CORRUPT_ERROR, "STATUS_DISK_CORRUPT_ERROR", DESC_MEDIA },
    { STATUS_OBJECT_NAME_NOT_FOUND, "STATUS_OBJECT_NAME_NOT_FOUND", DESC_NOFILE },
    { STATUS_OBJECT_NAME_COLLISION, "STATUS_OBJECT_NAME_COLLISION",
      "An attempt to create a file or directory failed because an object with the same pathname already exists." },
    { STATUS_PORT_DISCONNECTED, "STATUS_PORT_DISCONNECTED", DESC_FID },
    { STATUS_OBJECT_PATH_INVALID, "STATUS_OBJECT_PATH_INVALID", DESC_PATH },
    { STATUS_OBJECT_PATH_NOT_FOUND, "STATUS_OBJECT_PATH_NOT_FOUND", DESC_PATH },
    { STATUS_OBJECT_PATH_SYNTAX_BAD, "STATUS_OBJECT_PATH_SYNTAX_BAD", DESC_PATH },
    { STATUS_DATA_ERROR, "STATUS_DATA_ERROR", DESC_MEDIA },
    { STATUS_CRC_ERROR, "STATUS_CRC_ERROR", DESC_MEDIA },
    { STATUS_SECTION_TOO_BIG, "STATUS_SECTION_TOO_BIG", DESC_MEM },
    { STATUS_PORT_CONNECTION_REFUSED, "STATUS_PORT_CONNECTION_REFUSED", DESC_ACCESS },
    { STATUS_INVALID_PORT_HANDLE, "STATUS_INVALID_PORT_HANDLE", DESC_FID },
    { STATUS_SHARING_VIOLATION, "STATUS_SHARING_VIOLATION",
      "Sharing violation. A requested open mode conflicts with the sharing mode of an existing file handle." },
    { STATUS_THREAD_IS_TERMINATING, "STATUS_THREAD_IS_TERMINATING", DESC_ACCESS },
    { STATUS_EAS_NOT_SUPPORTED, "STATUS_EAS_NOT_SUPPORTED",
      "The server file system does not support extended attributes." },
    { STATUS_EA_TOO_LARGE, "STATUS_EA_TOO_LARGE", DESC_EA },
    { STATUS_FILE_LOCK_CONFLICT, "STATUS_FILE_LOCK_CONFLICT",
      "A lock request specified an invalid locking mode, or conflicted with an existing file lock." },
    { STATUS_LOCK_NOT_GRANTED, "STATUS_LOCK_NOT_GRANTED",
      "A lock request specified an invalid locking mode, or conflicted with an existing file lock." },
    { STATUS_DELETE_PENDING, "STATUS_DELETE_PENDING", DESC_ACCESS },
    { STATUS_PRIVILEGE_NOT_HELD, "STATUS_PRIVILEGE_NOT_HELD", DESC_ACCESS },
    { STATUS_WRONG_PASSWORD, "STATUS_WRONG_PASSWORD", DESC_LOGON },
    { STATUS_LOGON_FAILURE, "STATUS_LOGON_FAILURE", DESC_LOGON },
    { STATUS_INVALID_LOGON_HOURS, "STATUS_INVALID_LOGON_HOURS", DESC_LOGON },
    { STATUS_INVALID_WORKSTATION, "STATUS_INVALID_WORKSTATION", DESC_LOGON },
    { STATUS_PASSWORD_EXPIRED, "STATUS_PASSWORD_EXPIRED", DESC_LOGON },
    { STATUS_ACCOUNT_DISABLED, "STATUS_ACCOUNT_DISABLED", DESC_LOGON },
    { STATUS_RANGE_NOT_LOCKED, "STATUS_RANGE_NOT_LOCKED",
      "The byte range specified in an unlock request was not locked." },
    { STATUS_DISK_FULL, "STATUS_DISK_FULL", "There is not enough space on the disk." },
    { STATUS_TOO_MANY_PAGING_FILES, "STATUS_TOO_MANY_PAGING_FILES", DESC_MEM },
    { STATUS_DFS_EXIT_PATH_FOUND, "STATUS_DFS_EXIT_PATH_FOUND", DESC_PATH },
    { STATUS_DEVICE_DATA_ERROR, "STATUS_DEVICE_DATA_ERROR",
      "Bad data. (May be generated by IOCTL calls on the server.)" },
    { STATUS_MEDIA_WRITE_PROTECTED, "STATUS_MEDIA_WRITE_PROTECTED",
      "The media is write protected." },
    { STATUS_BAD_IMPERSONATION_LEVEL, "STATUS_BAD_IMPERSONATION_LEVEL",
      "The requested impersonation level is not allowed." },
    { STATUS_INSTANCE_NOT_AVAILABLE, "STATUS_INSTANCE_NOT_AVAILABLE", DESC_PIPEBUSY },
    { STATUS_PIPE_NOT_AVAILABLE, "STATUS_PIPE_NOT_AVAILABLE", DESC_PIPEBUSY },
    { STATUS_INVALID_PIPE_STATE, "STATUS_INVALID_PIPE_STATE", "Invalid named pipe." },
    { STATUS_PIPE_BUSY, "STATUS_PIPE_BUSY", DESC_PIPEBUSY },
    { STATUS_ILLEGAL_FUNCTION, "STATUS_ILLEGAL_FUNCTION", DESC_FUNC },
    { STATUS_PIPE_DISCONNECTED, "STATUS_PIPE_DISCONNECTED",
      "The designated named pipe exists, but there is no server process listening on the server side." },
    { STATUS_PIPE_CLOSING, "STATUS_PIPE_CLOSING", DESC_PIPECLOSE },
    { STATUS_INVALID_READ_MODE, "STATUS_INVALID_READ_MODE", "Invalid named pipe." },
    { STATUS_IO_TIMEOUT, "STATUS_IO_TIMEOUT", "The operation timed out." },
    { STATUS_FILE_IS_A_DIRECTORY, "STATUS_FILE_IS_A_DIRECTORY", DESC_ACCESS },
    { STATUS_NOT_SUPPORTED, "STATUS_NOT_SUPPORTED",
      "This command is not supported by the server." },
    { STATUS_UNEXPECTED_NETWORK_ERROR, "STATUS_UNEXPECTED_NETWORK_ERROR", DESC_NET },
    { STATUS_PRINT_QUEUE_FULL, "STATUS_PRINT_QUEUE_FULL", DESC_PRINT },
    { STATUS_NO_SPOOL_SPACE, "STATUS_NO_SPOOL_SPACE", DESC_PRINT },
    { STATUS_PRINT_CANCELLED, "STATUS_PRINT_CANCELLED", DESC_PRINT },
    { STATUS_NETWORK_NAME_DELETED, "STATUS_NETWORK_NAME_DELETED", DESC_SHARE },
    { STATUS_NETWORK_ACCESS_DENIED, "STATUS_NETWORK_ACCESS_DENIED", DESC_ACCESS },
    { STATUS_BAD_DEVICE_TYPE, "STATUS_BAD_DEVICE_TYPE", DESC_SHARE },
    { STATUS_BAD_NETWORK_NAME, "STATUS_BAD_NETWORK_NAME", DESC_SHARE },
    { STATUS_TOO_MANY_SESSIONS, "STATUS_TOO_MANY_SESSIONS",
      "The server has no room for another session." },
    { STATUS_REQUEST_NOT_ACCEPTED, "STATUS_REQUEST_NOT_ACCEPTED",
      "The server can't accept any more connections." },
    { STATUS_NOT_SAME_DEVICE, "STATUS_NOT_SAME_DEVICE",
      "A file system operation (such as a rename) across two devices was attempted." },
    { STATUS_FILE_RENAMED, "STATUS_FILE_RENAMED", DESC_ACCESS },
    { STATUS_PIPE_EMPTY, "STATUS_PIPE_EMPTY", DESC_PIPECLOSE },
    { STATUS_REDIRECTOR_NOT_STARTED, "STATUS_REDIRECTOR_NOT_STARTED", DESC_PATH },
    { STATUS_DIRECTORY_NOT_EMPTY, "STATUS_DIRECTORY_NOT_EMPTY",
      "Remove of directory failed because it was not empty." },
    { STATUS_PROCESS_IS_TERMINATING, "STATUS_PROCESS_IS_TERMINATING", DESC_ACCESS },
    { STATUS_TOO_MANY_OPENED_FILES, "STATUS_TOO_MANY_OPENED_FILES",
      "Too many open files. No FIDs are available." },
    { STATUS_CANNOT_DELETE, "STATUS_CANNOT_DELETE", DESC_ACCESS },
    { STATUS_FILE_DELETED, "STATUS_FILE_DELETED", DESC_ACCESS },
    { STATUS_FILE_CLOSED, "STATUS_FILE_CLOSED", DESC_FID },
    { STATUS_INVALID_DEVICE_STATE, "STATUS_INVALID_DEVICE_STATE", DESC_MEDIA },
    { STATUS_ACCOUNT_EXPIRED, "STATUS_ACCOUNT_EXPIRED", DESC_LOGON },
    { STATUS_USER_SESSION_DELETED, "STATUS_USER_SESSION_DELETED", DESC_SESSION },
    { STATUS_INSUFF_SERVER_RESOURCES, "STATUS_INSUFF_SERVER_RESOURCES", DESC_MEM },
    { STATUS_PASSWORD_MUST_CHANGE, "STATUS_PASSWORD_MUST_CHANGE", DESC_LOGON },
    { STATUS_HANDLE_NOT_CLOSABLE, "STATUS_HANDLE_NOT_CLOSABLE", DESC_FID },
    { STATUS_PATH_NOT_COVERED, "STATUS_PATH_NOT_COVERED",
      "The path is served by another DFS target." },
    { STATUS_NETWORK_SESSION_EXPIRED, "STATUS_NETWORK_SESSION_EXPIRED", DESC_SESSION },
    { STATUS_FILE_NOT_AVAILABLE, "STATUS_FILE_NOT_AVAILABLE",
      "The file is temporarily unavailable." },
    { STATUS_SMB_TOO_MANY_UIDS, "STATUS_SMB_TOO_MANY_UIDS", DESC_SESSION },
    { STATUS_SMB_NO_SUPPORT, "STATUS_SMB_NO_SUPPORT", DESC_SMB },
};

const unsigned status_count = sizeof(status_table) / sizeof(status_table[0]);

const StatusEntry* find_status(uint32_t code)
{
    const StatusEntry* end = status_table + status_count;
    const StatusEntry* e = std::lower_bound(status_table, end, code,
        [](const StatusEntry& s, uint32_t c) { return s.code < c; });

    return (e != end and e->code == code) ? e : nullptr;
}
}

const char* smb2::nt_status_name(uint32_t status)
{
    const StatusEntry* e = find_status(status);
    return e ? e->name : "";
}

const char* smb2::nt_status_description(uint32_t status)
{
    const StatusEntry* e = find_status(status);
    return e ? e->description : "";
}

unsigned smb2::nt_status_count()
{ return status_count; }

uint32_t smb2::nt_status_code(unsigned index)
{ return index < status_count ? status_table[index].code : 0; }

void smb2::nt_status_verify()
{
    for ( unsigned i = 1; i < status_count; ++i )
    {
        if ( status_table[i - 1].code >= status_table[i].code )
            FatalError("status table out of order at %s\n", status_table[i].name);
    }
}
