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

#ifndef FILETIME_H
#define FILETIME_H

// Wire timestamps count 100 ns ticks since 1601-01-01 00:00:00 UTC.

#include <sys/time.h>

#include "main/smbwire_types.h"

// seconds from 1601-01-01 to 1970-01-01
#define FILETIME_EPOCH_DELTA  11644473600LL
#define FILETIME_TICKS_PER_SEC 10000000LL
#define FILETIME_NSEC_PER_TICK 100

namespace smbwire
{
// broken down UTC time; month and day count from 1
struct CalendarTime
{
    int64_t year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
    uint32_t nanosecond;
};

class SO_PUBLIC FileTime
{
public:
    FileTime() = default;
    constexpr explicit FileTime(uint64_t t) : ticks(t) { }

    static FileTime from_ticks(int64_t t)
    { return FileTime((uint64_t)t); }

    static FileTime from_unix_seconds(int64_t secs, uint32_t nsec = 0);
    static FileTime from_unix_interval(double secs);
    static FileTime from_timeval(const struct timeval&);
    static FileTime from_calendar(const CalendarTime&);

    uint64_t get_ticks() const
    { return ticks; }

    bool is_zero() const
    { return ticks == 0; }

    // floor of the seconds since 1970, negative before it
    int64_t to_unix_seconds() const;

    // sub-second part of to_unix_seconds()
    uint32_t nanoseconds() const
    { return (uint32_t)(ticks % FILETIME_TICKS_PER_SEC) * FILETIME_NSEC_PER_TICK; }

    double to_unix_interval() const;
    void to_timeval(struct timeval&) const;
    CalendarTime to_calendar() const;

    bool operator==(const FileTime& rhs) const
    { return ticks == rhs.ticks; }

    bool operator!=(const FileTime& rhs) const
    { return ticks != rhs.ticks; }

    bool operator<(const FileTime& rhs) const
    { return ticks < rhs.ticks; }

private:
    uint64_t ticks = 0;
};
}

#endif

