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

#ifndef TRACE_H
#define TRACE_H

#include <cstdarg>
#include <cstdint>

#include "main/smbwire_types.h"

#define DEFAULT_TRACE_LOG_LEVEL 1
#define TRACE_CRITICAL_LEVEL 2
#define TRACE_ERROR_LEVEL 3
#define TRACE_WARNING_LEVEL 4
#define TRACE_INFO_LEVEL 6
#define TRACE_DEBUG_LEVEL 7

using TraceLevel = uint8_t;

namespace smbwire
{
SO_PUBLIC bool trace_enabled(TraceLevel);

SO_PUBLIC void trace_logf(TraceLevel, const char* module, const char* fmt, ...)
    __attribute__((format (printf, 3, 4)));
}

#define SMB2_TRACE(log_level, ...) \
    do { \
        if ( smbwire::trace_enabled(log_level) ) \
            smbwire::trace_logf(log_level, "smb2", __VA_ARGS__); \
    } while (0)

#endif

