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

#ifndef NT_STATUS_H
#define NT_STATUS_H

// 32-bit status codes carried in every response envelope.  The table maps
// each known code to its symbolic name and a description; related codes
// share a description.

#include "main/smbwire_types.h"

#define STATUS_SUCCESS                        0x00000000
#define STATUS_PENDING                        0x00000103
#define STATUS_NOTIFY_ENUM_DIR                0x0000010C
#define STATUS_SMB_BAD_FID                    0x00060001
#define STATUS_OS2_INVALID_ACCESS             0x000C0001
#define STATUS_OS2_NO_MORE_SIDS               0x00710001
#define STATUS_OS2_INVALID_LEVEL              0x007C0001
#define STATUS_OS2_NEGATIVE_SEEK              0x00830001
#define STATUS_OS2_CANCEL_VIOLATION           0x00AD0001
#define STATUS_OS2_ATOMIC_LOCKS_NOT_SUPPORTED 0x00AE0001
#define STATUS_OS2_CANNOT_COPY                0x010A0001
#define STATUS_OS2_EAS_DIDNT_FIT              0x01130001
#define STATUS_OS2_EA_ACCESS_DENIED           0x03E20001
#define STATUS_INVALID_SMB                    0x00010002
#define STATUS_SMB_BAD_TID                    0x00050002
#define STATUS_SMB_BAD_COMMAND                0x00160002
#define STATUS_SMB_BAD_UID                    0x005B0002
#define STATUS_SMB_USE_MPX                    0x00FA0002
#define STATUS_SMB_USE_STANDARD               0x00FB0002
#define STATUS_SMB_CONTINUE_MPX               0x00FC0002
#define STATUS_SMB_NO_SUPPORT                 0xFFFF0002
#define STATUS_BUFFER_OVERFLOW                0x80000005
#define STATUS_NO_MORE_FILES                  0x80000006
#define STATUS_DEVICE_PAPER_EMPTY             0x8000000E
#define STATUS_EA_LIST_INCONSISTENT           0x80000014
#define STATUS_NO_MORE_ENTRIES                0x8000001A
#define STATUS_STOPPED_ON_SYMLINK             0x8000002D
#define STATUS_UNSUCCESSFUL                   0xC0000001
#define STATUS_NOT_IMPLEMENTED                0xC0000002
#define STATUS_INVALID_INFO_CLASS             0xC0000003
#define STATUS_INVALID_HANDLE                 0xC0000008
#define STATUS_INVALID_PARAMETER              0xC000000D
#define STATUS_NO_SUCH_DEVICE                 0xC000000E
#define STATUS_NO_SUCH_FILE                   0xC000000F
#define STATUS_INVALID_DEVICE_REQUEST         0xC0000010
#define STATUS_END_OF_FILE                    0xC0000011
#define STATUS_WRONG_VOLUME                   0xC0000012
#define STATUS_NO_MEDIA_IN_DEVICE             0xC0000013
#define STATUS_NONEXISTENT_SECTOR             0xC0000015
#define STATUS_MORE_PROCESSING_REQUIRED       0xC0000016
#define STATUS_INVALID_LOCK_SEQUENCE          0xC000001E
#define STATUS_INVALID_VIEW_SIZE              0xC000001F
#define STATUS_ALREADY_COMMITTED              0xC0000021
#define STATUS_ACCESS_DENIED                  0xC0000022
#define STATUS_BUFFER_TOO_SMALL               0xC0000023
#define STATUS_OBJECT_TYPE_MISMATCH           0xC0000024
#define STATUS_DISK_CORRUPT_ERROR             0xC0000032
#define STATUS_OBJECT_NAME_NOT_FOUND          0xC0000034
#define STATUS_OBJECT_NAME_COLLISION          0xC0000035
#define STATUS_PORT_DISCONNECTED              0xC0000037
#define STATUS_OBJECT_PATH_INVALID            0xC0000039
#define STATUS_OBJECT_PATH_NOT_FOUND          0xC000003A
#define STATUS_OBJECT_PATH_SYNTAX_BAD         0xC000003B
#define STATUS_DATA_ERROR                     0xC000003E
#define STATUS_CRC_ERROR                      0xC000003F
#define STATUS_SECTION_TOO_BIG                0xC0000040
#define STATUS_PORT_CONNECTION_REFUSED        0xC0000041
#define STATUS_INVALID_PORT_HANDLE            0xC0000042
#define STATUS_SHARING_VIOLATION              0xC0000043
#define STATUS_THREAD_IS_TERMINATING          0xC000004B
#define STATUS_EAS_NOT_SUPPORTED              0xC000004F
#define STATUS_EA_TOO_LARGE                   0xC0000050
#define STATUS_FILE_LOCK_CONFLICT             0xC0000054
#define STATUS_LOCK_NOT_GRANTED               0xC0000055
#define STATUS_DELETE_PENDING                 0xC0000056
#define STATUS_PRIVILEGE_NOT_HELD             0xC0000061
#define STATUS_WRONG_PASSWORD                 0xC000006A
#define STATUS_LOGON_FAILURE                  0xC000006D
#define STATUS_INVALID_LOGON_HOURS            0xC000006F
#define STATUS_INVALID_WORKSTATION            0xC0000070
#define STATUS_PASSWORD_EXPIRED               0xC0000071
#define STATUS_ACCOUNT_DISABLED               0xC0000072
#define STATUS_RANGE_NOT_LOCKED               0xC000007E
#define STATUS_DISK_FULL                      0xC000007F
#define STATUS_TOO_MANY_PAGING_FILES          0xC0000097
#define STATUS_DFS_EXIT_PATH_FOUND            0xC000009B
#define STATUS_DEVICE_DATA_ERROR              0xC000009C
#define STATUS_MEDIA_WRITE_PROTECTED          0xC00000A2
#define STATUS_BAD_IMPERSONATION_LEVEL        0xC00000A5
#define STATUS_INSTANCE_NOT_AVAILABLE         0xC00000AB
#define STATUS_PIPE_NOT_AVAILABLE             0xC00000AC
#define STATUS_INVALID_PIPE_STATE             0xC00000AD
#define STATUS_PIPE_BUSY                      0xC00000AE
#define STATUS_ILLEGAL_FUNCTION               0xC00000AF
#define STATUS_PIPE_DISCONNECTED              0xC00000B0
#define STATUS_PIPE_CLOSING                   0xC00000B1
#define STATUS_INVALID_READ_MODE              0xC00000B4
#define STATUS_IO_TIMEOUT                     0xC00000B5
#define STATUS_FILE_IS_A_DIRECTORY            0xC00000BA
#define STATUS_NOT_SUPPORTED                  0xC00000BB
#define STATUS_UNEXPECTED_NETWORK_ERROR       0xC00000C4
#define STATUS_PRINT_QUEUE_FULL               0xC00000C6
#define STATUS_NO_SPOOL_SPACE                 0xC00000C7
#define STATUS_PRINT_CANCELLED                0xC00000C8
#define STATUS_NETWORK_NAME_DELETED           0xC00000C9
#define STATUS_NETWORK_ACCESS_DENIED          0xC00000CA
#define STATUS_BAD_DEVICE_TYPE                0xC00000CB
#define STATUS_BAD_NETWORK_NAME               0xC00000CC
#define STATUS_TOO_MANY_SESSIONS              0xC00000CE
#define STATUS_REQUEST_NOT_ACCEPTED           0xC00000D0
#define STATUS_NOT_SAME_DEVICE                0xC00000D4
#define STATUS_FILE_RENAMED                   0xC00000D5
#define STATUS_PIPE_EMPTY                     0xC00000D9
#define STATUS_REDIRECTOR_NOT_STARTED         0xC00000FB
#define STATUS_DIRECTORY_NOT_EMPTY            0xC0000101
#define STATUS_PROCESS_IS_TERMINATING         0xC000010A
#define STATUS_TOO_MANY_OPENED_FILES          0xC000011F
#define STATUS_CANNOT_DELETE                  0xC0000121
#define STATUS_FILE_DELETED                   0xC0000123
#define STATUS_FILE_CLOSED                    0xC0000128
#define STATUS_INVALID_DEVICE_STATE           0xC0000184
#define STATUS_ACCOUNT_EXPIRED                0xC0000193
#define STATUS_USER_SESSION_DELETED           0xC0000203
#define STATUS_INSUFF_SERVER_RESOURCES        0xC0000205
#define STATUS_PASSWORD_MUST_CHANGE           0xC0000224
#define STATUS_HANDLE_NOT_CLOSABLE            0xC0000235
#define STATUS_PATH_NOT_COVERED               0xC0000257
#define STATUS_NETWORK_SESSION_EXPIRED        0xC000035C
#define STATUS_FILE_NOT_AVAILABLE             0xC0000467
#define STATUS_SMB_TOO_MANY_UIDS              0xC000205A

namespace smbwire
{
namespace smb2
{
// "STATUS_ACCESS_DENIED" or "" if unlisted
SO_PUBLIC const char* nt_status_name(uint32_t status);

// "Access denied." or "" if unlisted
SO_PUBLIC const char* nt_status_description(uint32_t status);

// table enumeration
SO_PUBLIC unsigned nt_status_count();
SO_PUBLIC uint32_t nt_status_code(unsigned index);

// lookups depend on the table being sorted; fatal if it is not
SO_PUBLIC void nt_status_verify();
}
}

#endif

