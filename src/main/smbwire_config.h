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

#ifndef SMBWIRE_CONFIG_H
#define SMBWIRE_CONFIG_H

// Process-wide codec settings.  A configuration is never modified while
// installed; set_conf() swaps the whole record atomically, so codec calls
// on other threads see either the old or the new one.

#include "main/smbwire_types.h"

enum LoggingFlag
{
    LOGGING_FLAG__VERBOSE         = 0x00000001,
    LOGGING_FLAG__QUIET           = 0x00000002,
    LOGGING_FLAG__SYSLOG          = 0x00000004,
};

namespace smbwire
{
struct SO_PUBLIC CodecConfig
{
    // upper bound on records visited by any chain walk
    unsigned max_chain_entries = 1000;

    // output buffer length requested when a builder is not given one
    uint32_t default_output_length = 65535;

    // MaxOutputResponse of ioctl requests
    uint32_t max_ioctl_output = 0x7fffffff;

    // SMB2_TRACE threshold, 0 disables tracing
    uint8_t trace_level = 0;

    void show() const;

    static const CodecConfig* get_conf();

    // the caller keeps ownership and keeps c alive while any thread may
    // still be decoding with it; nullptr restores the defaults
    static void set_conf(const CodecConfig* c);

    // logging stuff
    static void enable_log_syslog()
    { logging_flags |= LOGGING_FLAG__SYSLOG; }

    static bool log_syslog()
    { return logging_flags & LOGGING_FLAG__SYSLOG; }

    static void set_log_quiet(bool enabled)
    {
        if (enabled)
            logging_flags |= LOGGING_FLAG__QUIET;
        else
            logging_flags &= ~LOGGING_FLAG__QUIET;
    }

    static bool log_quiet()
    { return logging_flags & LOGGING_FLAG__QUIET; }

    static void enable_log_verbose()
    { logging_flags |= LOGGING_FLAG__VERBOSE; }

    static bool log_verbose()
    { return logging_flags & LOGGING_FLAG__VERBOSE; }

private:
    static uint32_t logging_flags;
};
}

#endif

